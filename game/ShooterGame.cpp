#include "ShooterGame.h"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>
#include <vector>

#include "../engine/core/Application.h"
#include "../engine/core/Logger.h"
#include "../engine/ecs/components/Health.h"
#include "../engine/ecs/components/Transform.h"
#include "../engine/ecs/components/Velocity.h"
#include "Spawn.h"
#include "systems/ActorQueries.h"

namespace Shooter {

namespace {
constexpr int kEnemyHealth = 3;
constexpr int kEnemiesPerWave = 4;
constexpr float kPlayerFireInterval = 0.25f;
constexpr float kEnemyFireInterval = 1.5f;
constexpr float kPlayerBulletSpeed = 480.0f;
constexpr float kEnemyBulletSpeed = 260.0f;
constexpr float kEnemySpeed = 60.0f;
}  // namespace

ShooterGame::ShooterGame(GameConfig config) : config_(std::move(config)), world_(config_) {}

bool ShooterGame::onInitialize(Starfall::Application& /*app*/) {
    Starfall::Logger::setMinLevel(config_.logLevel);

    sfx_.setVolume(config_.sfxVolume);
    if (sfx_.initialize()) {
        if (!sfx_.preload(config_.hitSound)) {
            Starfall::logWarn("Hit sound unavailable: " + config_.hitSound);
        }
    }
    world_.setHitCue([this]() {
        if (sfx_.isInitialized()) {
            (void)sfx_.play(config_.hitSound);
        }
    });

    const auto& window = world_.window();
    player_ = spawnPlayer(world_.registry(), {0.0f, -window.height / 3.0f}, config_.playerHealth,
                          config_.invulnSeconds);
    spawnStarfield();

    Starfall::logInfo("Viewport " + std::to_string(static_cast<int>(window.width)) + "x" +
                      std::to_string(static_cast<int>(window.height)) + ", " +
                      std::to_string(world_.registry().size()) + " entities spawned.");
    return true;
}

void ShooterGame::spawnStarfield() {
    const auto& window = world_.window();
    std::uniform_real_distribution<float> xDist(-window.width / 2.0f, window.width / 2.0f);
    std::uniform_real_distribution<float> yDist(-window.height / 2.0f, window.height / 2.0f);
    std::uniform_real_distribution<float> scaleDist(1.0f, 3.0f);
    std::uniform_real_distribution<float> speedDist(40.0f, 120.0f);
    for (int i = 0; i < config_.starCount; ++i) {
        spawnStar(world_.registry(), {xDist(rng_), yDist(rng_)}, scaleDist(rng_), speedDist(rng_));
    }
}

void ShooterGame::steerPlayer(const Starfall::TimeStep& step) {
    // Scripted input: a slow Lissajous sweep that leans on the viewport edges.
    auto* vel = world_.registry().get<Starfall::ECS::Velocity>(player_);
    if (!vel) return;
    const float t = static_cast<float>(step.elapsedSeconds);
    vel->value = {320.0f * std::sin(t * 1.3f), 160.0f * std::cos(t * 0.7f)};
}

void ShooterGame::firePlayer(float dt) {
    playerFireTimer_ -= dt;
    if (playerFireTimer_ > 0.0f) return;
    playerFireTimer_ += kPlayerFireInterval;

    const auto* tf = world_.registry().get<Starfall::ECS::Transform>(player_);
    if (!tf) return;
    spawnBullet(world_.registry(), Side::Player, tf->position + Starfall::Vec2{0.0f, 24.0f},
                {0.0f, kPlayerBulletSpeed}, 1);
    ++bulletsFired_;
}

void ShooterGame::fireEnemies(float dt) {
    enemyFireTimer_ -= dt;
    if (enemyFireTimer_ > 0.0f) return;
    enemyFireTimer_ += kEnemyFireInterval;

    auto& registry = world_.registry();
    std::vector<Starfall::Vec2> muzzles;
    registry.view<Starfall::ECS::Health, Starfall::ECS::Transform>(
        [&](Starfall::ECS::Entity e, Starfall::ECS::Health& health, Starfall::ECS::Transform& tf) {
            if (health.alive() && isActor(registry, e, Side::Enemy)) {
                muzzles.push_back(tf.position + Starfall::Vec2{0.0f, -20.0f});
            }
        });
    for (const auto& pos : muzzles) {
        spawnBullet(registry, Side::Enemy, pos, {0.0f, -kEnemyBulletSpeed}, 1);
        ++bulletsFired_;
    }
}

void ShooterGame::spawnWave(float dt) {
    waveTimer_ -= dt;
    if (waveTimer_ > 0.0f) return;
    waveTimer_ += std::max(config_.enemyWaveSeconds, kMinEnemyWaveSeconds);
    ++wavesSpawned_;

    const auto& window = world_.window();
    std::uniform_real_distribution<float> drift(-30.0f, 30.0f);
    const float spacing = window.width / static_cast<float>(kEnemiesPerWave + 1);
    const float top = window.height / 2.0f + 20.0f;
    for (int i = 0; i < kEnemiesPerWave; ++i) {
        const float x = -window.width / 2.0f + spacing * static_cast<float>(i + 1);
        spawnEnemy(world_.registry(), {x, top}, {drift(rng_), -kEnemySpeed}, kEnemyHealth);
    }
}

void ShooterGame::onUpdate(Starfall::Application& app, const Starfall::TimeStep& step) {
    const float dt = static_cast<float>(step.deltaSeconds);
    if (world_.state().is(GameState::Playing)) {
        steerPlayer(step);
        spawnWave(dt);
        firePlayer(dt);
        fireEnemies(dt);
    }

    const FrameReport report = world_.update(step);
    hitsTaken_ += report.player.hitsApplied;
    enemyHits_ += report.enemies.hitsApplied;
    enemiesKilled_ += report.killed;
    reaped_ += report.reaped;

    if (report.player.hitsApplied > 0) {
        if (const auto* health = world_.registry().get<Starfall::ECS::Health>(player_)) {
            Starfall::logInfo("Player hit, health " + std::to_string(health->current) + "/" +
                              std::to_string(health->max));
        }
    }
    if (world_.state().is(GameState::GameOver)) {
        app.requestQuit("player destroyed");
    }
}

void ShooterGame::onShutdown() {
    Starfall::logInfo("Session summary: " + std::to_string(hitsTaken_) + " hits taken, " +
                      std::to_string(enemyHits_) + " hits dealt, " + std::to_string(enemiesKilled_) +
                      " enemies destroyed, " + std::to_string(reaped_) + " entities reaped.");
    sfx_.shutdown();
}

}  // namespace Shooter

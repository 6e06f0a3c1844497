// Headless shooter session: scripted spawning and firing around the World frame loop.
#pragma once

#include <cstddef>
#include <random>

#include "../engine/audio/SfxPlayer.h"
#include "../engine/core/ApplicationListener.h"
#include "../engine/ecs/Entity.h"
#include "GameConfig.h"
#include "World.h"

namespace Shooter {

class ShooterGame final : public Starfall::ApplicationListener {
public:
    explicit ShooterGame(GameConfig config);

    bool onInitialize(Starfall::Application& app) override;
    void onUpdate(Starfall::Application& app, const Starfall::TimeStep& step) override;
    void onShutdown() override;

    World& world() { return world_; }
    const World& world() const { return world_; }
    Starfall::ECS::Entity player() const { return player_; }
    const Starfall::Audio::SfxPlayer& sfx() const { return sfx_; }

    int wavesSpawned() const { return wavesSpawned_; }
    int bulletsFired() const { return bulletsFired_; }

private:
    void steerPlayer(const Starfall::TimeStep& step);
    void firePlayer(float dt);
    void fireEnemies(float dt);
    void spawnWave(float dt);
    void spawnStarfield();

    GameConfig config_;
    World world_;
    Starfall::Audio::SfxPlayer sfx_{};
    std::mt19937 rng_{1337u};
    Starfall::ECS::Entity player_{Starfall::ECS::kInvalidEntity};

    float playerFireTimer_{0.0f};
    float enemyFireTimer_{0.0f};
    float waveTimer_{0.0f};

    int wavesSpawned_{0};
    int bulletsFired_{0};
    int hitsTaken_{0};
    int enemyHits_{0};
    std::size_t enemiesKilled_{0};
    std::size_t reaped_{0};
};

}  // namespace Shooter

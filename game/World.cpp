#include "World.h"

namespace Shooter {

World::World(const GameConfig& config, GameState initial) : window_(config.window), state_(initial) {
    despawn_.setMargin(config.despawnMargin);
}

FrameReport World::update(const Starfall::TimeStep& step) {
    FrameReport report{};
    if (state_.is(GameState::Playing)) {
        movement_.update(registry_, step);
        confinement_.update(registry_, window_);
        report.player = collision_.collideEnemyBullets(registry_, step, state_);
        report.enemies = collision_.collidePlayerBullets(registry_);
        report.killed = death_.update(registry_);
    }
    report.reaped = despawn_.update(registry_, window_);
    starWrap_.update(registry_, window_);
    return report;
}

}  // namespace Shooter

// Data-driven tuning for the shooter core, loaded from JSON.
#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "../engine/core/Logger.h"
#include "../engine/geometry/WindowSize.h"

namespace Shooter {

constexpr float kMinEnemyWaveSeconds = 0.1f;

struct GameConfig {
    Starfall::WindowSize window{};
    float invulnSeconds{1.0f};
    float despawnMargin{12.0f};
    std::string hitSound{"sounds/player_hit.wav"};
    float sfxVolume{0.75f};  // 0..1
    int playerHealth{10};
    Starfall::LogLevel logLevel{Starfall::LogLevel::Info};
    int maxFrames{1800};
    float enemyWaveSeconds{2.0f};
    int starCount{40};
};

class GameConfigLoader {
public:
    // Missing keys keep their defaults; keys of the wrong type are ignored.
    static std::optional<GameConfig> load(const std::string& path);
    static std::optional<GameConfig> parse(std::string_view text);
};

}  // namespace Shooter

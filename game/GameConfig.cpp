#include "GameConfig.h"

#include <algorithm>
#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

namespace Shooter {

namespace {
void readFloat(const nlohmann::json& j, const char* key, float& dst) {
    if (j.contains(key) && j[key].is_number()) {
        dst = j[key].get<float>();
    }
}

void readInt(const nlohmann::json& j, const char* key, int& dst) {
    if (j.contains(key) && j[key].is_number_integer()) {
        dst = j[key].get<int>();
    }
}

std::optional<GameConfig> fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        return std::nullopt;
    }

    GameConfig cfg{};
    if (j.contains("window") && j["window"].is_object()) {
        const auto& w = j["window"];
        readFloat(w, "width", cfg.window.width);
        readFloat(w, "height", cfg.window.height);
    }
    readFloat(j, "invulnSeconds", cfg.invulnSeconds);
    readFloat(j, "despawnMargin", cfg.despawnMargin);
    readFloat(j, "enemyWaveSeconds", cfg.enemyWaveSeconds);
    readFloat(j, "sfxVolume", cfg.sfxVolume);
    readInt(j, "playerHealth", cfg.playerHealth);
    readInt(j, "maxFrames", cfg.maxFrames);
    readInt(j, "starCount", cfg.starCount);
    if (j.contains("hitSound") && j["hitSound"].is_string()) {
        cfg.hitSound = j["hitSound"].get<std::string>();
    }
    if (j.contains("logLevel") && j["logLevel"].is_string()) {
        const auto name = j["logLevel"].get<std::string>();
        if (auto level = Starfall::parseLogLevel(name)) {
            cfg.logLevel = *level;
        } else {
            Starfall::logWarn("Unknown logLevel '" + name + "' in config; keeping default.");
        }
    }

    if (cfg.window.width < 0.0f || cfg.window.height < 0.0f) {
        Starfall::logWarn("Negative window size in config; using defaults.");
        cfg.window = Starfall::WindowSize{};
    }
    if (cfg.despawnMargin < 0.0f) cfg.despawnMargin = 0.0f;
    if (cfg.invulnSeconds < 0.0f) cfg.invulnSeconds = 0.0f;
    if (cfg.enemyWaveSeconds < kMinEnemyWaveSeconds) {
        Starfall::logWarn("enemyWaveSeconds below " + std::to_string(kMinEnemyWaveSeconds) + "; clamping.");
        cfg.enemyWaveSeconds = kMinEnemyWaveSeconds;
    }
    if (cfg.playerHealth < 1) cfg.playerHealth = 1;
    cfg.sfxVolume = std::clamp(cfg.sfxVolume, 0.0f, 1.0f);
    return cfg;
}
}  // namespace

std::optional<GameConfig> GameConfigLoader::load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return std::nullopt;
    }

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::exception& e) {
        Starfall::logWarn("Failed to parse " + path + ": " + e.what());
        return std::nullopt;
    }
    return fromJson(j);
}

std::optional<GameConfig> GameConfigLoader::parse(std::string_view text) {
    const auto j = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
    if (j.is_discarded()) {
        return std::nullopt;
    }
    return fromJson(j);
}

}  // namespace Shooter

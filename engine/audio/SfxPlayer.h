// Sound effect player with cached audio chunks. Playback failures are logged, never thrown.
#pragma once

#include <string>
#include <unordered_map>

namespace Starfall::Audio {

class SfxPlayer {
public:
    SfxPlayer() = default;
    ~SfxPlayer();

    SfxPlayer(const SfxPlayer&) = delete;
    SfxPlayer& operator=(const SfxPlayer&) = delete;

    bool initialize();
    void shutdown();

    bool preload(const std::string& path);
    bool play(const std::string& path, float volumeMul01 = 1.0f);

    void setVolume(float volume01);
    float volume() const { return volume01_; }

    bool isInitialized() const { return initialized_; }

private:
    struct ChunkSlot {
        std::string path;
        void* handle{nullptr};
    };

    ChunkSlot* getOrLoad(const std::string& path);
    void freeAll();

    bool initialized_{false};
    float volume01_{0.75f};
    std::unordered_map<std::string, ChunkSlot> chunks_{};
};

}  // namespace Starfall::Audio

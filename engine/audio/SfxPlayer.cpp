#include "SfxPlayer.h"

#include "AudioBackend.h"
#include "../core/Logger.h"

#include <algorithm>

#if defined(STARFALL_HAS_SDL_MIXER) && (STARFALL_HAS_SDL_MIXER == 1)
#    include <SDL_mixer.h>
#endif

namespace Starfall::Audio {

SfxPlayer::~SfxPlayer() { shutdown(); }

bool SfxPlayer::initialize() {
    if (initialized_) return true;
    initialized_ = acquireBackend();
    return initialized_;
}

void SfxPlayer::freeAll() {
#if defined(STARFALL_HAS_SDL_MIXER) && (STARFALL_HAS_SDL_MIXER == 1)
    for (auto& kv : chunks_) {
        if (kv.second.handle) {
            Mix_FreeChunk(static_cast<Mix_Chunk*>(kv.second.handle));
        }
    }
#endif
    chunks_.clear();
}

void SfxPlayer::shutdown() {
    freeAll();
    if (!initialized_) {
        return;
    }
    releaseBackend();
    initialized_ = false;
}

void SfxPlayer::setVolume(float volume01) { volume01_ = std::clamp(volume01, 0.0f, 1.0f); }

SfxPlayer::ChunkSlot* SfxPlayer::getOrLoad(const std::string& path) {
    auto it = chunks_.find(path);
    if (it != chunks_.end()) return &it->second;

    // Failed loads are cached too so a missing file is reported once.
    ChunkSlot slot{};
    slot.path = path;
#if defined(STARFALL_HAS_SDL_MIXER) && (STARFALL_HAS_SDL_MIXER == 1)
    if (!initialized_) return nullptr;
    Mix_Chunk* chunk = Mix_LoadWAV(path.c_str());
    if (!chunk) {
        logWarn(std::string("Mix_LoadWAV failed for ") + path + ": " + Mix_GetError());
        auto [insIt, _] = chunks_.insert({path, slot});
        return &insIt->second;
    }
    slot.handle = chunk;
#endif
    auto [insIt, _] = chunks_.insert({path, slot});
    return &insIt->second;
}

bool SfxPlayer::preload(const std::string& path) {
    const auto* slot = getOrLoad(path);
    return slot && slot->handle;
}

bool SfxPlayer::play(const std::string& path, float volumeMul01) {
#if defined(STARFALL_HAS_SDL_MIXER) && (STARFALL_HAS_SDL_MIXER == 1)
    auto* slot = getOrLoad(path);
    if (!slot || !slot->handle) return false;
    auto* chunk = static_cast<Mix_Chunk*>(slot->handle);
    const float v = std::clamp(volume01_ * std::clamp(volumeMul01, 0.0f, 1.0f), 0.0f, 1.0f);
    Mix_VolumeChunk(chunk, static_cast<int>(v * MIX_MAX_VOLUME));
    return Mix_PlayChannel(-1, chunk, 0) != -1;
#else
    (void)path;
    (void)volumeMul01;
    return false;
#endif
}

}  // namespace Starfall::Audio

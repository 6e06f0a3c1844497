#include "AudioBackend.h"

#include <string>

#include "../core/Logger.h"

#if defined(STARFALL_HAS_SDL_MIXER) && (STARFALL_HAS_SDL_MIXER == 1)
#    include <SDL.h>
#    include <SDL_mixer.h>
#endif

namespace Starfall::Audio {

namespace {
int gRefCount = 0;
#if !defined(STARFALL_HAS_SDL_MIXER) || (STARFALL_HAS_SDL_MIXER != 1)
bool gWarnedNoBackend = false;
#endif
}  // namespace

bool backendAvailable() {
#if defined(STARFALL_HAS_SDL_MIXER) && (STARFALL_HAS_SDL_MIXER == 1)
    return true;
#else
    return false;
#endif
}

bool acquireBackend() {
#if defined(STARFALL_HAS_SDL_MIXER) && (STARFALL_HAS_SDL_MIXER == 1)
    if (gRefCount++ > 0) {
        return true;
    }

    if (SDL_InitSubSystem(SDL_INIT_AUDIO) != 0) {
        logError(std::string("SDL audio init failed: ") + SDL_GetError());
        gRefCount = 0;
        return false;
    }

    const int flags = Mix_Init(MIX_INIT_OGG);
    if ((flags & MIX_INIT_OGG) != MIX_INIT_OGG) {
        logWarn(std::string("Mix_Init(OGG) incomplete: ") + Mix_GetError());
    }

    if (Mix_OpenAudio(44100, MIX_DEFAULT_FORMAT, 2, 1024) != 0) {
        logError(std::string("Mix_OpenAudio failed: ") + Mix_GetError());
        Mix_Quit();
        SDL_QuitSubSystem(SDL_INIT_AUDIO);
        gRefCount = 0;
        return false;
    }
    return true;
#else
    if (!gWarnedNoBackend) {
        logWarn("Audio disabled: SDL2_mixer not found at build time.");
        gWarnedNoBackend = true;
    }
    return false;
#endif
}

void releaseBackend() {
#if defined(STARFALL_HAS_SDL_MIXER) && (STARFALL_HAS_SDL_MIXER == 1)
    if (gRefCount <= 0) {
        gRefCount = 0;
        return;
    }
    gRefCount -= 1;
    if (gRefCount == 0) {
        Mix_CloseAudio();
        Mix_Quit();
        SDL_QuitSubSystem(SDL_INIT_AUDIO);
    }
#else
    // no-op
#endif
}

}  // namespace Starfall::Audio

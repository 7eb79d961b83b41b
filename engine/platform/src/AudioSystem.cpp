#include "pairs/platform/AudioSystem.hpp"

#include <SDL2/SDL.h>

#include "pairs/app/AssetFS.hpp"

namespace pairs::platform {

AudioSystem::~AudioSystem() {
    Shutdown();
}

bool AudioSystem::Initialize() {
    if (initialized_) {
        return true;
    }
    // Cues are plain WAV, which SDL_mixer decodes without Mix_Init.
    if (Mix_OpenAudio(44100, MIX_DEFAULT_FORMAT, 2, 1024) != 0) {
        return false;
    }
    Mix_AllocateChannels(8);
    Mix_Volume(-1, static_cast<int>(MIX_MAX_VOLUME * 0.8f));

    flip_ = LoadChunk("flip.wav");
    match_ = LoadChunk("match.wav");
    mismatch_ = LoadChunk("mismatch.wav");
    win_ = LoadChunk("win.wav");

    initialized_ = true;
    return true;
}

void AudioSystem::Shutdown() {
    if (!initialized_) {
        return;
    }
    FreeChunk(flip_);
    FreeChunk(match_);
    FreeChunk(mismatch_);
    FreeChunk(win_);
    Mix_CloseAudio();
    initialized_ = false;
}

void AudioSystem::PlayFlip() const {
    Play(flip_);
}

void AudioSystem::PlayMatch() const {
    Play(match_);
}

void AudioSystem::PlayMismatch() const {
    Play(mismatch_);
}

void AudioSystem::PlayWin() const {
    Play(win_);
}

void AudioSystem::FreeChunk(Mix_Chunk*& chunk) {
    if (chunk) {
        Mix_FreeChunk(chunk);
        chunk = nullptr;
    }
}

void AudioSystem::Play(Mix_Chunk* chunk) {
    if (!chunk) {
        return;
    }
    if (Mix_PlayChannel(-1, chunk, 0) < 0) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Mix_PlayChannel failed: %s", Mix_GetError());
    }
}

Mix_Chunk* AudioSystem::LoadChunk(const std::string& filename) {
    std::filesystem::path path = pairs::app::AssetPath("sounds/" + filename);
    if (!pairs::app::FileExists(path)) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Sound %s not found", filename.c_str());
        return nullptr;
    }
    Mix_Chunk* chunk = Mix_LoadWAV(path.string().c_str());
    if (!chunk) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Failed to load %s: %s", path.string().c_str(),
                    Mix_GetError());
    }
    return chunk;
}

}  // namespace pairs::platform

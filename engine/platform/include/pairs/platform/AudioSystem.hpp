#pragma once

#include <SDL2/SDL_mixer.h>

#include <string>

namespace pairs::platform {

// Feedback cues for a round. Every Play* call is a no-op while audio is
// unavailable or the matching sample is missing.
class AudioSystem {
public:
    AudioSystem() = default;
    ~AudioSystem();

    AudioSystem(const AudioSystem&) = delete;
    AudioSystem& operator=(const AudioSystem&) = delete;

    bool Initialize();
    void Shutdown();

    void PlayFlip() const;
    void PlayMatch() const;
    void PlayMismatch() const;
    void PlayWin() const;

private:
    static void FreeChunk(Mix_Chunk*& chunk);
    static void Play(Mix_Chunk* chunk);

    Mix_Chunk* LoadChunk(const std::string& filename);

    bool initialized_ = false;
    Mix_Chunk* flip_ = nullptr;
    Mix_Chunk* match_ = nullptr;
    Mix_Chunk* mismatch_ = nullptr;
    Mix_Chunk* win_ = nullptr;
};

}  // namespace pairs::platform

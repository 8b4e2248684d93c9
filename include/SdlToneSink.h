/**
 * @file SdlToneSink.h
 * @brief ToneSink that plays tones on an SDL2 audio device through a fixed pool of voices.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "ToneSink.h"
#include "VoicePool.h"

#include <SDL2/SDL.h>

#include <cstdint>

/**
 * @class SdlToneSink
 * @brief Opens a stereo signed-16 device and plays each accepted tone once on a free voice of a VoicePool.
 *
 * play() takes the device lock only to check for or fill a voice; synthesis happens outside it. When every
 * voice is busy the request is dropped and counted. The callback mixes the pool under SDL's own lock.
 */
class SdlToneSink : public ToneSink {
public:
    /** @brief Initialise SDL audio and open the default device; throws std::runtime_error on failure. */
    SdlToneSink(int sampleRate, double toneSeconds, int voices);
    ~SdlToneSink() override;

    SdlToneSink(const SdlToneSink&) = delete;
    SdlToneSink& operator=(const SdlToneSink&) = delete;

    void play(const ToneRequest& tone) override;

    uint64_t accepted() const { return pool.accepted(); }
    uint64_t dropped() const { return pool.dropped(); }
    int sampleRate() const { return rate; }

private:
    static void audioCallback(void* userdata, Uint8* stream, int len);

    SDL_AudioDeviceID dev{0};
    int rate;
    double seconds;
    VoicePool pool;
};

/**
 * @file SdlToneSink.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "SdlToneSink.h"
#include "Logger.h"

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

SdlToneSink::SdlToneSink(int sampleRate, double toneSeconds, int voices)
    : rate(sampleRate), seconds(toneSeconds), pool(voices) {
    if (SDL_InitSubSystem(SDL_INIT_AUDIO) != 0) {
        throw std::runtime_error(std::string("SDL audio init failed: ") + SDL_GetError());
    }
    SDL_AudioSpec want, have;
    SDL_zero(want);
    SDL_zero(have);
    want.freq = sampleRate;
    want.format = AUDIO_S16SYS;
    want.channels = 2;
    want.samples = 512;
    want.callback = &SdlToneSink::audioCallback;
    want.userdata = this;
    dev = SDL_OpenAudioDevice(nullptr, 0, &want, &have, 0);
    if (dev == 0) {
        std::string err = SDL_GetError();
        SDL_QuitSubSystem(SDL_INIT_AUDIO);
        throw std::runtime_error("SDL_OpenAudioDevice failed: " + err);
    }
    SDL_PauseAudioDevice(dev, 0);
    Logger::info("SdlToneSink: opened device rate=" + std::to_string(have.freq) +
                 " voices=" + std::to_string(pool.voices()) +
                 " tone_ms=" + std::to_string(static_cast<int>(seconds * 1000.0)));
}

SdlToneSink::~SdlToneSink() {
    if (dev != 0) {
        SDL_CloseAudioDevice(dev);
        dev = 0;
    }
    SDL_QuitSubSystem(SDL_INIT_AUDIO);
    Logger::info("SdlToneSink: closed accepted=" + std::to_string(accepted()) +
                 " dropped=" + std::to_string(dropped()));
}

void SdlToneSink::play(const ToneRequest& tone) {
    // Only this thread starts voices, so a voice seen free stays free until tryStart.
    SDL_LockAudioDevice(dev);
    bool room = pool.hasFreeVoice();
    SDL_UnlockAudioDevice(dev);
    if (!room) {
        pool.recordDrop();
        return;
    }
    std::vector<int16_t> samples = synthesizeTone(tone, seconds, rate);
    SDL_LockAudioDevice(dev);
    pool.tryStart(std::move(samples));
    SDL_UnlockAudioDevice(dev);
}

void SdlToneSink::audioCallback(void* userdata, Uint8* stream, int len) {
    auto* self = static_cast<SdlToneSink*>(userdata);
    self->pool.mix(reinterpret_cast<int16_t*>(stream), static_cast<size_t>(len) / sizeof(int16_t));
}

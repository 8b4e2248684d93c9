/**
 * @file ToneSink.h
 * @brief Injectable, non-blocking playback target for tone requests.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "ToneMapper.h"

#include <cstdint>

/**
 * @class ToneSink
 * @brief Receives fire-and-forget tone requests from the simulation.
 *
 * play() must return promptly and must not throw; a sink that cannot take a request drops it.
 */
class ToneSink {
public:
    virtual ~ToneSink() = default;
    virtual void play(const ToneRequest& tone) = 0;
};

/** @brief Discards every request; used when audio is muted. */
class NullToneSink : public ToneSink {
public:
    void play(const ToneRequest&) override { ++count; }
    uint64_t requests() const { return count; }

private:
    uint64_t count{0};
};

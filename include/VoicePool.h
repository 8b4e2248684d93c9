/**
 * @file VoicePool.h
 * @brief Fixed set of one-shot PCM voices mixed into a saturating int16 stream.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <vector>

/**
 * @class VoicePool
 * @brief Each voice plays one interleaved buffer once and then frees itself.
 *
 * Not synchronised: the owner serialises tryStart()/mix()/hasFreeVoice() (SdlToneSink holds the device lock).
 * The counters are atomic so they can be read from any thread.
 */
class VoicePool {
public:
    /** @brief Pool of @p voices slots (at least one). */
    explicit VoicePool(int voices);

    VoicePool(const VoicePool&) = delete;
    VoicePool& operator=(const VoicePool&) = delete;

    /** @brief True when a request made now would be accepted. */
    bool hasFreeVoice() const;

    /**
     * @brief Start @p samples on a free voice.
     * @return false, counting a drop, when every voice is busy or @p samples is empty.
     */
    bool tryStart(std::vector<int16_t> samples);

    /** @brief Count a request turned away before it reached the pool. */
    void recordDrop() { droppedCount.fetch_add(1); }

    /** @brief Overwrite @p out with the sum of @p n samples from every active voice, clamped to int16. */
    void mix(int16_t* out, size_t n);

    size_t voices() const { return slots.size(); }
    size_t activeVoices() const;
    uint64_t accepted() const { return acceptedCount.load(); }
    uint64_t dropped() const { return droppedCount.load(); }

private:
    struct Voice {
        std::vector<int16_t> samples;
        size_t cursor{0};
        bool active{false};
    };

    std::vector<Voice> slots;
    std::atomic<uint64_t> acceptedCount{0};
    std::atomic<uint64_t> droppedCount{0};
};

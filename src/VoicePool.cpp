/**
 * @file VoicePool.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "VoicePool.h"

#include <algorithm>
#include <cstring>
#include <utility>

VoicePool::VoicePool(int voices) : slots(static_cast<size_t>(std::max(1, voices))) {}

bool VoicePool::hasFreeVoice() const {
    for (const auto& v : slots) {
        if (!v.active) return true;
    }
    return false;
}

size_t VoicePool::activeVoices() const {
    size_t n = 0;
    for (const auto& v : slots) {
        if (v.active) ++n;
    }
    return n;
}

bool VoicePool::tryStart(std::vector<int16_t> samples) {
    if (samples.empty()) {
        droppedCount.fetch_add(1);
        return false;
    }
    for (auto& v : slots) {
        if (v.active) continue;
        v.samples = std::move(samples);
        v.cursor = 0;
        v.active = true;
        acceptedCount.fetch_add(1);
        return true;
    }
    droppedCount.fetch_add(1);
    return false;
}

void VoicePool::mix(int16_t* out, size_t n) {
    std::memset(out, 0, n * sizeof(int16_t));
    for (auto& v : slots) {
        if (!v.active) continue;
        size_t take = std::min(n, v.samples.size() - v.cursor);
        for (size_t i = 0; i < take; ++i) {
            int32_t s = static_cast<int32_t>(out[i]) + v.samples[v.cursor + i];
            out[i] = static_cast<int16_t>(std::max<int32_t>(-32768, std::min<int32_t>(32767, s)));
        }
        v.cursor += take;
        if (v.cursor >= v.samples.size()) v.active = false;
    }
}

/**
 * @file ToneMapper.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "ToneMapper.h"

#include <algorithm>
#include <cmath>

namespace {
constexpr double kTwoPi = 6.283185307179586476925286766559;

inline int16_t toPcm16(double v) {
    double s = std::trunc(v * 32767.0);
    s = std::max(-32768.0, std::min(32767.0, s));
    return static_cast<int16_t>(s);
}
}

ToneRequest mapEnergyToTone(double energy, double baseFrequency, double pan) {
    ToneRequest t;
    t.frequency = baseFrequency + energy * ToneHzPerEnergy;
    t.volume = std::min(1.0, energy * ToneVolumePerEnergy);
    double p = std::max(0.0, std::min(1.0, pan));
    t.leftGain = 1.0 - p;
    t.rightGain = p;
    return t;
}

size_t toneFrameCount(double seconds, int sampleRate) {
    if (!(seconds > 0.0) || sampleRate <= 0) return 0;
    return static_cast<size_t>(static_cast<double>(sampleRate) * seconds);
}

std::vector<int16_t> synthesizeTone(const ToneRequest& tone, double seconds, int sampleRate) {
    size_t frames = toneFrameCount(seconds, sampleRate);
    std::vector<int16_t> out(frames * 2);
    if (frames == 0) return out;
    double step = seconds / static_cast<double>(frames);
    for (size_t i = 0; i < frames; ++i) {
        double s = std::sin(kTwoPi * tone.frequency * (static_cast<double>(i) * step)) * tone.volume;
        out[2 * i] = toPcm16(s * tone.leftGain);
        out[2 * i + 1] = toPcm16(s * tone.rightGain);
    }
    return out;
}

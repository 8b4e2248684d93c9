/**
 * @file ToneMapper.h
 * @brief Pure mapping from particle kinetic energy to tone parameters, and stereo sine synthesis.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

/** @brief Hz added per unit of kinetic energy. */
constexpr double ToneHzPerEnergy = 300.0;
/** @brief Volume gained per unit of kinetic energy before clamping at 1. */
constexpr double ToneVolumePerEnergy = 8.0;
constexpr int DefaultSampleRate = 44100;
constexpr double DefaultToneSeconds = 0.05;

/** @brief One fire-and-forget tone: sine frequency, overall volume, and per-channel gains. */
struct ToneRequest {
    double frequency{0.0};
    double volume{0.0};
    double leftGain{0.5};
    double rightGain{0.5};
};

/**
 * @brief Map kinetic energy @p energy on a lobe tuned to @p baseFrequency and panned to @p pan.
 *
 * frequency = f0 + E*300, volume = min(1, E*8), gains = (1-pan, pan) with pan clamped to [0,1].
 */
ToneRequest mapEnergyToTone(double energy, double baseFrequency, double pan);

/** @brief Number of stereo frames in a tone of @p seconds at @p sampleRate (truncated). */
size_t toneFrameCount(double seconds, int sampleRate);

/**
 * @brief Render @p tone as interleaved signed 16-bit stereo (L,R,L,R,...).
 *
 * Sample i is sin(2*pi*f*t_i)*volume*gain with t_i = i*seconds/frames, scaled by 32767 and truncated.
 */
std::vector<int16_t> synthesizeTone(const ToneRequest& tone, double seconds, int sampleRate);

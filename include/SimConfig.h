/**
 * @file SimConfig.h
 * @brief Startup parameters for the spinner tools, read from SPINNERS_* env vars and then command-line flags.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "SpinnerNode.h"
#include "ToneMapper.h"

#include <array>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

/**
 * @struct SimConfig
 * @brief Every tunable of a run; defaults reproduce the audio-enabled reference program.
 */
struct SimConfig {
    int width{1200};                  /**< world width in pixels */
    int height{800};                  /**< world height in pixels */
    int fps{60};                      /**< target frame rate */
    int systems{3};                   /**< independent top-level trees */
    double lobeRadius{110.0};
    double armLength{170.0};
    int particlesPerLobe{6};
    int maxLevel{2};
    std::array<double, 3> baseFrequencies{{220.0, 330.0, 440.0}};
    int sampleRate{DefaultSampleRate};
    int toneMs{50};
    int voices{8};                    /**< simultaneous tones the audio sink can hold */
    bool hasSeed{false};
    uint32_t seed{0};
    double timeScale{1.0};            /**< dt = elapsed milliseconds * timeScale */
    double demonThreshold{DemonThreshold};
    bool mute{false};                 /**< demon-only variant: no tone requests reach the device */

    /** @brief Tree tunables derived from this config. */
    SpinnerParams spinnerParams() const;
    /** @brief Tone duration in seconds. */
    double toneSeconds() const { return toneMs / 1000.0; }
};

/** @brief Outcome of parsing: the config plus one human-readable note per ignored or clamped value. */
struct ConfigResult {
    SimConfig config;
    std::vector<std::string> warnings;
    bool helpRequested{false};
};

/** @brief Which tool is parsing: the tone chamber reads only the audio, rate, particle and seed keys. */
enum class ConfigScope { Spinners, ToneChamber };

/** @brief Environment lookup; returns nullptr for unset variables. */
using EnvLookup = std::function<const char*(const char*)>;

/** @brief Lookup backed by std::getenv. */
const char* processEnv(const char* name);

/**
 * @brief Build a config from @p defaults, then env (via @p env), then argv flags, then validate/clamp.
 *
 * Flags take `--key value` or `--key=value`; `--mute` and `--help`/`-h` take no value. Bad values never
 * abort parsing: they are skipped or clamped and reported in ConfigResult::warnings. Under
 * ConfigScope::ToneChamber, flags the chamber does not use are skipped with a warning and their env vars are
 * not read.
 */
ConfigResult parseSimConfig(int argc, const char* const* argv, const EnvLookup& env = processEnv,
                            const SimConfig& defaults = SimConfig(),
                            ConfigScope scope = ConfigScope::Spinners);

/** @brief Usage text listing every flag of @p scope and its env var. */
std::string simConfigUsage(const std::string& prog, ConfigScope scope = ConfigScope::Spinners);

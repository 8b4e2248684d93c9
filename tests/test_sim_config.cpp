/**
 * @file test_sim_config.cpp
 * @brief Env and flag parsing, precedence, and validation of SimConfig.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include <catch2/catch.hpp>

#include <algorithm>
#include <map>
#include <string>
#include <vector>

#include "SimConfig.h"

namespace {
struct FakeEnv {
    std::map<std::string, std::string> vars;
    EnvLookup lookup() const {
        return [this](const char* name) -> const char* {
            auto it = vars.find(name);
            return it == vars.end() ? nullptr : it->second.c_str();
        };
    }
};

ConfigResult parse(std::vector<const char*> args, const FakeEnv& env = FakeEnv()) {
    args.insert(args.begin(), "spinners");
    return parseSimConfig(static_cast<int>(args.size()), args.data(), env.lookup());
}

bool hasWarningContaining(const ConfigResult& r, const std::string& needle) {
    return std::any_of(r.warnings.begin(), r.warnings.end(),
                       [&](const std::string& w) { return w.find(needle) != std::string::npos; });
}
}

TEST_CASE("SimConfig defaults reproduce the reference program", "[config]") {
    ConfigResult r = parse({});
    REQUIRE(r.warnings.empty());
    REQUIRE_FALSE(r.helpRequested);
    const SimConfig& c = r.config;
    CHECK(c.width == 1200);
    CHECK(c.height == 800);
    CHECK(c.fps == 60);
    CHECK(c.systems == 3);
    CHECK(c.lobeRadius == 110.0);
    CHECK(c.armLength == 170.0);
    CHECK(c.particlesPerLobe == 6);
    CHECK(c.maxLevel == 2);
    CHECK(c.baseFrequencies[0] == 220.0);
    CHECK(c.baseFrequencies[2] == 440.0);
    CHECK(c.sampleRate == 44100);
    CHECK(c.toneSeconds() == Approx(0.05));
    CHECK_FALSE(c.hasSeed);
    CHECK_FALSE(c.mute);
    CHECK(c.timeScale == 1.0);
}

TEST_CASE("SimConfig flags take separate or inline values", "[config]") {
    ConfigResult r = parse({"--systems", "5", "--max-level=1", "--lobe-radius", "80.5", "--seed=42"});
    REQUIRE(r.warnings.empty());
    CHECK(r.config.systems == 5);
    CHECK(r.config.maxLevel == 1);
    CHECK(r.config.lobeRadius == Approx(80.5));
    CHECK(r.config.hasSeed);
    CHECK(r.config.seed == 42u);
}

TEST_CASE("SimConfig flags override the environment", "[config]") {
    FakeEnv env;
    env.vars["SPINNERS_PARTICLES"] = "10";
    env.vars["SPINNERS_FPS"] = "30";
    ConfigResult r = parse({"--particles", "4"}, env);
    CHECK(r.config.particlesPerLobe == 4);
    CHECK(r.config.fps == 30);
}

TEST_CASE("SimConfig mute comes from a flag or the environment", "[config]") {
    CHECK(parse({"--mute"}).config.mute);
    CHECK_FALSE(parse({"--mute=off"}).config.mute);
    FakeEnv env;
    env.vars["SPINNERS_MUTE"] = "yes";
    CHECK(parse({}, env).config.mute);
}

TEST_CASE("SimConfig frequency list needs exactly three values", "[config]") {
    ConfigResult ok = parse({"--freqs", "100,200,300"});
    CHECK(ok.config.baseFrequencies[1] == 200.0);
    ConfigResult bad = parse({"--freqs", "100,200"});
    CHECK(bad.config.baseFrequencies[1] == 330.0);
    CHECK(hasWarningContaining(bad, "--freqs"));
}

TEST_CASE("SimConfig ignores invalid values with a warning", "[config]") {
    FakeEnv env;
    env.vars["SPINNERS_WIDTH"] = "wide";
    ConfigResult r = parse({"--fps", "fast", "--seed", "-3"}, env);
    CHECK(r.config.width == 1200);
    CHECK(r.config.fps == 60);
    CHECK_FALSE(r.config.hasSeed);
    CHECK(hasWarningContaining(r, "SPINNERS_WIDTH"));
    CHECK(hasWarningContaining(r, "--fps"));
    CHECK(hasWarningContaining(r, "--seed"));
}

TEST_CASE("SimConfig clamps out-of-range values", "[config]") {
    ConfigResult r = parse({"--max-level", "9", "--particles", "0", "--voices", "1000", "--lobe-radius", "-5"});
    CHECK(r.config.maxLevel == 4);
    CHECK(r.config.particlesPerLobe == 1);
    CHECK(r.config.voices == 64);
    CHECK(r.config.lobeRadius == 110.0);
    CHECK(hasWarningContaining(r, "max level"));
    CHECK(hasWarningContaining(r, "lobe radius"));
}

TEST_CASE("SimConfig warns on unknown and incomplete options", "[config]") {
    ConfigResult r = parse({"--bogus", "--width"});
    CHECK(hasWarningContaining(r, "--bogus"));
    CHECK(hasWarningContaining(r, "missing value for --width"));
    CHECK(r.config.width == 1200);
}

TEST_CASE("SimConfig reports help and lists every option", "[config]") {
    CHECK(parse({"--help"}).helpRequested);
    CHECK(parse({"-h"}).helpRequested);
    std::string usage = simConfigUsage("spinners");
    CHECK(usage.find("--max-level") != std::string::npos);
    CHECK(usage.find("SPINNERS_MAX_LEVEL") != std::string::npos);
}

TEST_CASE("SimConfig starts from caller-supplied defaults", "[config]") {
    SimConfig d;
    d.fps = 30;
    const char* argv[] = {"tones"};
    ConfigResult r = parseSimConfig(1, argv, nullptr, d);
    CHECK(r.config.fps == 30);
}

TEST_CASE("SimConfig spinnerParams carries the tree tunables", "[config]") {
    ConfigResult r = parse({"--particles", "9", "--demon-threshold", "0.2", "--freqs=110,220,330"});
    SpinnerParams p = r.config.spinnerParams();
    CHECK(p.particlesPerLobe == 9);
    CHECK(p.demonThreshold == Approx(0.2));
    CHECK(p.baseFrequencies[0] == 110.0);
    CHECK(p.shrink == Approx(0.4));
}

TEST_CASE("SimConfig in chamber scope skips spinner-only settings", "[config]") {
    FakeEnv env;
    env.vars["SPINNERS_MAX_LEVEL"] = "4";
    env.vars["SPINNERS_VOICES"] = "12";
    const char* argv[] = {"tones", "--systems", "5", "--fps", "20", "--arm-length=90"};
    ConfigResult r = parseSimConfig(6, argv, env.lookup(), SimConfig(), ConfigScope::ToneChamber);

    SECTION("chamber options still apply") {
        CHECK(r.config.fps == 20);
        CHECK(r.config.voices == 12);
    }
    SECTION("spinner-only flags are warned about and left at their defaults") {
        CHECK(r.config.systems == 3);
        CHECK(r.config.armLength == 170.0);
        CHECK(hasWarningContaining(r, "--systems"));
        CHECK(hasWarningContaining(r, "--arm-length"));
        CHECK(r.warnings.size() == 2u);
    }
    SECTION("spinner-only env vars are not read") {
        CHECK(r.config.maxLevel == 2);
        CHECK_FALSE(hasWarningContaining(r, "SPINNERS_MAX_LEVEL"));
    }
}

TEST_CASE("SimConfig chamber usage lists only chamber options", "[config]") {
    std::string usage = simConfigUsage("tones", ConfigScope::ToneChamber);
    CHECK(usage.find("--max-level") == std::string::npos);
    CHECK(usage.find("--systems") == std::string::npos);
    CHECK(usage.find("--voices") != std::string::npos);
    CHECK(usage.find("--fps") != std::string::npos);
}

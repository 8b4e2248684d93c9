/**
 * @file SimConfig.cpp
 * @brief Env/flag parsing and validation for SimConfig.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "SimConfig.h"

#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <sstream>

namespace {

bool parseFloat(const char* s, double& out) {
    if (!s) return false;
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(s, &end);
    if (end == s || errno != 0) return false;
    while (*end && std::isspace(static_cast<unsigned char>(*end))) ++end;
    if (*end) return false;
    out = v;
    return true;
}

bool parseInt(const char* s, int& out) {
    if (!s) return false;
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(s, &end, 10);
    if (end == s || errno != 0 || *end || v < INT_MIN || v > INT_MAX) return false;
    out = static_cast<int>(v);
    return true;
}

bool parseSeed(const char* s, uint32_t& out) {
    if (!s || *s == '-') return false;
    char* end = nullptr;
    errno = 0;
    unsigned long long v = std::strtoull(s, &end, 10);
    if (end == s || errno != 0 || *end || v > 0xFFFFFFFFULL) return false;
    out = static_cast<uint32_t>(v);
    return true;
}

bool parseBool(const char* s, bool& out) {
    if (!s) return false;
    std::string v(s);
    for (auto& c : v) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (v == "1" || v == "true" || v == "yes" || v == "on") { out = true; return true; }
    if (v == "0" || v == "false" || v == "no" || v == "off") { out = false; return true; }
    return false;
}

// Three comma-separated frequencies, one per lobe.
bool parseFreqs(const char* s, std::array<double, 3>& out) {
    if (!s) return false;
    std::array<double, 3> tmp{};
    std::stringstream ss(s);
    std::string item;
    size_t n = 0;
    while (std::getline(ss, item, ',')) {
        if (n >= tmp.size()) return false;
        if (!parseFloat(item.c_str(), tmp[n])) return false;
        ++n;
    }
    if (n != tmp.size()) return false;
    out = tmp;
    return true;
}

struct Option {
    const char* flag;
    const char* env;
    bool takesValue;
    bool chamber; /**< also read by the tone chamber */
    const char* help;
    std::function<bool(SimConfig&, const char*)> apply;
};

const std::vector<Option>& options() {
    static const std::vector<Option> opts = {
        {"--width", "SPINNERS_WIDTH", true, false, "world width in pixels",
         [](SimConfig& c, const char* v) { return parseInt(v, c.width); }},
        {"--height", "SPINNERS_HEIGHT", true, false, "world height in pixels",
         [](SimConfig& c, const char* v) { return parseInt(v, c.height); }},
        {"--fps", "SPINNERS_FPS", true, true, "target frame rate",
         [](SimConfig& c, const char* v) { return parseInt(v, c.fps); }},
        {"--systems", "SPINNERS_SYSTEMS", true, false, "independent top-level spinner trees",
         [](SimConfig& c, const char* v) { return parseInt(v, c.systems); }},
        {"--lobe-radius", "SPINNERS_LOBE_RADIUS", true, false, "root lobe radius",
         [](SimConfig& c, const char* v) { return parseFloat(v, c.lobeRadius); }},
        {"--arm-length", "SPINNERS_ARM_LENGTH", true, false, "root arm length",
         [](SimConfig& c, const char* v) { return parseFloat(v, c.armLength); }},
        {"--particles", "SPINNERS_PARTICLES", true, true, "particles per lobe",
         [](SimConfig& c, const char* v) { return parseInt(v, c.particlesPerLobe); }},
        {"--max-level", "SPINNERS_MAX_LEVEL", true, false, "maximum recursion depth (0 = no children)",
         [](SimConfig& c, const char* v) { return parseInt(v, c.maxLevel); }},
        {"--freqs", "SPINNERS_FREQS", true, true, "three comma-separated lobe base frequencies (Hz)",
         [](SimConfig& c, const char* v) { return parseFreqs(v, c.baseFrequencies); }},
        {"--sample-rate", "SPINNERS_SAMPLE_RATE", true, true, "audio sample rate (Hz)",
         [](SimConfig& c, const char* v) { return parseInt(v, c.sampleRate); }},
        {"--tone-ms", "SPINNERS_TONE_MS", true, true, "tone duration (ms)",
         [](SimConfig& c, const char* v) { return parseInt(v, c.toneMs); }},
        {"--voices", "SPINNERS_VOICES", true, true, "simultaneous tones before requests are dropped",
         [](SimConfig& c, const char* v) { return parseInt(v, c.voices); }},
        {"--seed", "SPINNERS_SEED", true, true, "random seed (default: random)",
         [](SimConfig& c, const char* v) {
             if (!parseSeed(v, c.seed)) return false;
             c.hasSeed = true;
             return true;
         }},
        {"--time-scale", "SPINNERS_TIME_SCALE", true, false, "dt = elapsed milliseconds * scale",
         [](SimConfig& c, const char* v) { return parseFloat(v, c.timeScale); }},
        {"--demon-threshold", "SPINNERS_DEMON_THRESHOLD", true, false, "energy above which a particle is hot",
         [](SimConfig& c, const char* v) { return parseFloat(v, c.demonThreshold); }},
        {"--mute", "SPINNERS_MUTE", false, true, "run without audio (demon-only variant)",
         [](SimConfig& c, const char* v) { return parseBool(v, c.mute); }},
    };
    return opts;
}

bool inScope(const Option& o, ConfigScope scope) {
    return scope == ConfigScope::Spinners || o.chamber;
}

const Option* findOption(const std::string& flag) {
    for (const auto& o : options()) {
        if (flag == o.flag) return &o;
    }
    return nullptr;
}

template <class T>
void clampValue(T& v, T lo, T hi, const char* what, std::vector<std::string>& warnings) {
    if (v < lo || v > hi) {
        T fixed = v < lo ? lo : hi;
        std::ostringstream oss;
        oss << what << " " << v << " out of range [" << lo << ", " << hi << "], using " << fixed;
        warnings.push_back(oss.str());
        v = fixed;
    }
}

// Positive real with an upper bound; non-finite or non-positive values fall back to the default.
void clampPositive(double& v, double hi, double fallback, const char* what, std::vector<std::string>& warnings) {
    if (!(v > 0.0) || !(v <= hi)) {
        double fixed = (v > hi) ? hi : fallback;
        std::ostringstream oss;
        oss << what << " " << v << " out of range (0, " << hi << "], using " << fixed;
        warnings.push_back(oss.str());
        v = fixed;
    }
}

void validate(SimConfig& c, const SimConfig& defaults, std::vector<std::string>& warnings) {
    clampValue(c.width, 100, 10000, "width", warnings);
    clampValue(c.height, 100, 10000, "height", warnings);
    clampValue(c.fps, 1, 240, "fps", warnings);
    clampValue(c.systems, 1, 16, "systems", warnings);
    clampPositive(c.lobeRadius, 10000.0, defaults.lobeRadius, "lobe radius", warnings);
    if (!(c.armLength >= 0.0 && c.armLength <= 10000.0)) {
        warnings.push_back("arm length out of range [0, 10000], using default");
        c.armLength = defaults.armLength;
    }
    clampValue(c.particlesPerLobe, 1, 64, "particles per lobe", warnings);
    clampValue(c.maxLevel, 0, 4, "max level", warnings);
    for (auto& f : c.baseFrequencies) clampPositive(f, 20000.0, 220.0, "base frequency", warnings);
    clampValue(c.sampleRate, 8000, 192000, "sample rate", warnings);
    clampValue(c.toneMs, 5, 1000, "tone ms", warnings);
    clampValue(c.voices, 1, 64, "voices", warnings);
    clampPositive(c.timeScale, 100.0, defaults.timeScale, "time scale", warnings);
    if (!(c.demonThreshold >= 0.0)) {
        warnings.push_back("demon threshold must be >= 0, using default");
        c.demonThreshold = defaults.demonThreshold;
    }
}

}

const char* processEnv(const char* name) { return std::getenv(name); }

SpinnerParams SimConfig::spinnerParams() const {
    SpinnerParams p;
    p.particlesPerLobe = particlesPerLobe;
    p.demonThreshold = demonThreshold;
    p.baseFrequencies = baseFrequencies;
    return p;
}

ConfigResult parseSimConfig(int argc, const char* const* argv, const EnvLookup& env, const SimConfig& defaults,
                            ConfigScope scope) {
    ConfigResult res;
    res.config = defaults;
    SimConfig& c = res.config;

    if (env) {
        for (const auto& o : options()) {
            if (!inScope(o, scope)) continue;
            const char* v = env(o.env);
            if (!v) continue;
            if (!o.apply(c, v)) res.warnings.push_back(std::string("ignoring invalid ") + o.env + "='" + v + "'");
        }
    }

    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i] ? argv[i] : "");
        if (a == "-h" || a == "--help") {
            res.helpRequested = true;
            continue;
        }
        std::string flag = a;
        const char* value = nullptr;
        std::string inlineValue;
        size_t eq = a.find('=');
        if (a.rfind("--", 0) == 0 && eq != std::string::npos) {
            flag = a.substr(0, eq);
            inlineValue = a.substr(eq + 1);
            value = inlineValue.c_str();
        }
        const Option* o = findOption(flag);
        if (!o) {
            res.warnings.push_back("ignoring unknown option '" + a + "'");
            continue;
        }
        if (!inScope(*o, scope)) {
            res.warnings.push_back(std::string("ignoring option ") + o->flag + " (not used by the tone chamber)");
            if (!value && o->takesValue && i + 1 < argc) ++i;
            continue;
        }
        if (!value) {
            if (!o->takesValue) {
                value = "1";
            } else if (i + 1 < argc) {
                value = argv[++i];
            } else {
                res.warnings.push_back(std::string("missing value for ") + o->flag);
                continue;
            }
        }
        if (!o->apply(c, value)) res.warnings.push_back(std::string("ignoring invalid value '") + value + "' for " + o->flag);
    }

    validate(c, defaults, res.warnings);
    return res;
}

std::string simConfigUsage(const std::string& prog, ConfigScope scope) {
    std::ostringstream oss;
    oss << "usage: " << prog << " [options]\n\noptions (env var in brackets):\n";
    for (const auto& o : options()) {
        if (!inScope(o, scope)) continue;
        std::string left = std::string("  ") + o.flag + (o.takesValue ? " <v>" : "");
        oss << left;
        if (left.size() < 24) oss << std::string(24 - left.size(), ' ');
        oss << o.help << " [" << o.env << "]\n";
    }
    oss << "  -h, --help              show this text\n";
    return oss.str();
}

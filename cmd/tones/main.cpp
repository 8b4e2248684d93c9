/**
 * @file main.cpp
 * @brief Tone chamber entry: three velocity-only lobes sonified every step, with a small ncurses readout.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include <ncurses.h>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include "Logger.h"
#include "RandomSource.h"
#include "SdlToneSink.h"
#include "SimConfig.h"
#include "ToneChamber.h"
#include "ToneMapper.h"
#include "ToneSink.h"

static volatile sig_atomic_t g_stop = 0;
static void handle_signal(int) { g_stop = 1; }

static bool g_curses_inited = false;
static void atexit_cleanup() {
    if (g_curses_inited) {
        endwin();
        g_curses_inited = false;
    }
}

static void draw_readout(const ToneChamber& chamber, uint64_t steps, const SdlToneSink* audio) {
    erase();
    mvprintw(0, 0, "Tone chamber  | step %llu | [q]uit", static_cast<unsigned long long>(steps));
    for (int i = 0; i < ToneChamber::Lobes; ++i) {
        const auto& l = chamber.lobe(i);
        double e = chamber.averageEnergy(i);
        ToneRequest t = mapEnergyToTone(e, l.baseFrequency, l.pan);
        if (has_colors()) attron(COLOR_PAIR(i + 1));
        mvprintw(2 + i, 0, "lobe %d  base %6.1f Hz  pan %.1f  avg energy %8.5f  ~%7.1f Hz  vol %.2f",
                 i, l.baseFrequency, l.pan, e, t.frequency, t.volume);
        if (has_colors()) attroff(COLOR_PAIR(i + 1));
    }
    if (audio) {
        mvprintw(6, 0, "tones played %llu  dropped %llu",
                 static_cast<unsigned long long>(audio->accepted()),
                 static_cast<unsigned long long>(audio->dropped()));
    } else {
        mvprintw(6, 0, "audio muted");
    }
    refresh();
}

int main(int argc, char** argv) {
    Logger::initFromArgv0((argc > 0) ? argv[0] : "tones");
    Logger::info("tones starting");
    std::set_terminate([]{
        try {
            auto ep = std::current_exception();
            if (ep) {
                try { std::rethrow_exception(ep); }
                catch (const std::exception& e) { Logger::logException("std::terminate (tones)", e); }
                catch (...) { Logger::logUnknownException("std::terminate (tones)"); }
            } else {
                Logger::error("std::terminate (tones): no active exception");
            }
        } catch (...) {}
        if (g_curses_inited) { endwin(); }
        Logger::shutdown();
        std::_Exit(1);
    });
    try {
    SimConfig defaults;
    defaults.fps = 30;
    ConfigResult parsed = parseSimConfig(argc, argv, processEnv, defaults, ConfigScope::ToneChamber);
    if (parsed.helpRequested) {
        std::cout << simConfigUsage(argc > 0 ? argv[0] : "tones", ConfigScope::ToneChamber);
        Logger::shutdown();
        return 0;
    }
    for (const auto& w : parsed.warnings) {
        Logger::warn("config: " + w);
        std::cerr << "tones: " << w << '\n';
    }
    const SimConfig& cfg = parsed.config;
    RandomSource rng = cfg.hasSeed ? RandomSource(cfg.seed) : RandomSource();
    Logger::info("tones: seed=" + std::to_string(rng.seed()) + " fps=" + std::to_string(cfg.fps));

    std::unique_ptr<SdlToneSink> audio;
    if (!cfg.mute) audio = std::make_unique<SdlToneSink>(cfg.sampleRate, cfg.toneSeconds(), cfg.voices);
    NullToneSink silent;
    ToneSink& sink = audio ? static_cast<ToneSink&>(*audio) : static_cast<ToneSink&>(silent);

    struct sigaction sa{};
    sa.sa_handler = handle_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    if (!initscr()) throw std::runtime_error("unable to initialise the terminal");
    g_curses_inited = true;
    std::atexit(atexit_cleanup);
    cbreak();
    noecho();
    curs_set(0);
    nodelay(stdscr, TRUE);
    if (has_colors()) {
        start_color();
        use_default_colors();
        init_pair(1, COLOR_RED, -1);
        init_pair(2, COLOR_YELLOW, -1);
        init_pair(3, COLOR_GREEN, -1);
    }

    ToneChamber chamber(cfg.particlesPerLobe, cfg.baseFrequencies, rng);
    uint64_t steps = 0;
    const auto period = std::chrono::duration<double, std::milli>(1000.0 / cfg.fps);
    bool done = false;
    while (!done) {
        auto start = std::chrono::steady_clock::now();
        if (g_stop) done = true;
        chamber.step(rng);
        chamber.emit(sink);
        ++steps;
        draw_readout(chamber, steps, audio.get());
        int ch = getch();
        if (ch == 'q' || ch == 'Q') { Logger::info("quit requested"); done = true; }
        auto spent = std::chrono::steady_clock::now() - start;
        if (spent < period) std::this_thread::sleep_for(period - spent);
    }

    endwin();
    g_curses_inited = false;
    audio.reset();
    Logger::info("tones terminating steps=" + std::to_string(steps));
    Logger::shutdown();
    return 0;
    } catch (const std::exception& e) {
        if (g_curses_inited) { endwin(); g_curses_inited = false; }
        Logger::logException("fatal (tones)", e);
        std::cerr << "tones: " << e.what() << '\n';
        Logger::shutdown();
        return 1;
    } catch (...) {
        if (g_curses_inited) { endwin(); g_curses_inited = false; }
        Logger::logUnknownException("fatal (tones)");
        std::cerr << "tones: unknown error\n";
        Logger::shutdown();
        return 1;
    }
}

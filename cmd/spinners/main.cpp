/**
 * @file main.cpp
 * @brief Nested spinner entry: parses config, opens audio and ncurses, runs the frame loop and shuts down.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include <ncurses.h>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include "CursesSurface.h"
#include "Logger.h"
#include "RandomSource.h"
#include "SdlToneSink.h"
#include "SimConfig.h"
#include "Simulation.h"
#include "ToneSink.h"

static volatile sig_atomic_t g_stop = 0;
static void handle_signal(int) { g_stop = 1; }

// Forward decl for use in signal handler
static void init_colors();

static bool g_curses_inited = false;
static volatile sig_atomic_t g_needs_full_redraw = 0;
static void atexit_cleanup() {
    if (g_curses_inited) {
        endwin();
        g_curses_inited = false;
    }
}

// Suspend: restore tty, then stop process with default action
static void handle_sigtstp(int) {
    if (g_curses_inited) {
        def_prog_mode();
        endwin();
        g_curses_inited = false;
    }
    struct sigaction sa{}; sa.sa_handler = SIG_DFL; sigemptyset(&sa.sa_mask); sa.sa_flags = 0; sigaction(SIGTSTP, &sa, nullptr);
    raise(SIGTSTP);
}

// Resume: restore curses state and redraw
static void handle_sigcont(int) {
    struct sigaction st{}; st.sa_handler = handle_sigtstp; sigemptyset(&st.sa_mask); st.sa_flags = 0; sigaction(SIGTSTP, &st, nullptr);
    reset_prog_mode();
    refresh();
    cbreak();
    noecho();
    curs_set(0);
    keypad(stdscr, TRUE);
    nodelay(stdscr, TRUE);
    timeout(0);
    init_colors();
    clearok(stdscr, TRUE);
    refresh();
    g_curses_inited = true;
    g_needs_full_redraw = 1;
}

// Pairs 1..8 follow curses color order; CursesSurface picks the nearest one per RGB color.
static void init_colors() {
    if (!has_colors()) return;
    start_color();
    use_default_colors();
    init_pair(1, COLOR_BLACK, -1);
    init_pair(2, COLOR_RED, -1);
    init_pair(3, COLOR_GREEN, -1);
    init_pair(4, COLOR_YELLOW, -1);
    init_pair(5, COLOR_BLUE, -1);
    init_pair(6, COLOR_MAGENTA, -1);
    init_pair(7, COLOR_CYAN, -1);
    init_pair(8, COLOR_WHITE, -1);
}

static void restore_terminal() {
    if (g_curses_inited) { endwin(); g_curses_inited = false; }
}

static std::string status_text(const Simulation& sim, bool running, bool muted, const SdlToneSink* audio) {
    char buf[256];
    std::string audioState;
    if (!audio) audioState = "off";
    else if (muted) audioState = "muted";
    else audioState = "on (dropped " + std::to_string(audio->dropped()) + ")";
    std::snprintf(buf, sizeof(buf),
                  " [s]tart/[p]ause  [r]ebuild  [m]ute  [q]uit  | %s | frame %llu | seed %u | audio %s",
                  running ? "RUNNING" : "PAUSED", static_cast<unsigned long long>(sim.frames()),
                  static_cast<unsigned>(sim.seed()), audioState.c_str());
    return buf;
}

int main(int argc, char** argv) {
    Logger::initFromArgv0((argc > 0) ? argv[0] : "spinners");
    Logger::info("spinners starting");
    std::set_terminate([]{
        try {
            auto ep = std::current_exception();
            if (ep) {
                try { std::rethrow_exception(ep); }
                catch (const std::exception& e) { Logger::logException("std::terminate (spinners)", e); }
                catch (...) { Logger::logUnknownException("std::terminate (spinners)"); }
            } else {
                Logger::error("std::terminate (spinners): no active exception");
            }
        } catch (...) {}
        if (g_curses_inited) { endwin(); }
        Logger::shutdown();
        std::_Exit(1);
    });
    try {
    ConfigResult parsed = parseSimConfig(argc, argv);
    if (parsed.helpRequested) {
        std::cout << simConfigUsage(argc > 0 ? argv[0] : "spinners");
        Logger::shutdown();
        return 0;
    }
    for (const auto& w : parsed.warnings) {
        Logger::warn("config: " + w);
        std::cerr << "spinners: " << w << '\n';
    }
    SimConfig cfg = parsed.config;
    if (!cfg.hasSeed) {
        cfg.seed = RandomSource::entropySeed();
        cfg.hasSeed = true;
    }
    Logger::info("config: systems=" + std::to_string(cfg.systems) + " maxLevel=" + std::to_string(cfg.maxLevel) +
                 " particles=" + std::to_string(cfg.particlesPerLobe) + " fps=" + std::to_string(cfg.fps) +
                 " seed=" + std::to_string(cfg.seed) + (cfg.mute ? " muted" : ""));

    // Audio device first so a failure is reported on a clean terminal.
    std::unique_ptr<SdlToneSink> audio;
    if (!cfg.mute) audio = std::make_unique<SdlToneSink>(cfg.sampleRate, cfg.toneSeconds(), cfg.voices);
    NullToneSink silent;
    bool muted = cfg.mute;

    struct sigaction sa{};
    sa.sa_handler = handle_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    struct sigaction st{}; st.sa_handler = handle_sigtstp; sigemptyset(&st.sa_mask); st.sa_flags = 0; sigaction(SIGTSTP, &st, nullptr);
    struct sigaction sc{}; sc.sa_handler = handle_sigcont; sigemptyset(&sc.sa_mask); sc.sa_flags = 0; sigaction(SIGCONT, &sc, nullptr);

    if (!initscr()) throw std::runtime_error("unable to initialise the terminal");
    g_curses_inited = true;
    std::atexit(atexit_cleanup);
    cbreak();
    noecho();
    curs_set(0);
    keypad(stdscr, TRUE);
    nodelay(stdscr, TRUE);
    timeout(0);
    init_colors();

    CursesSurface surface(stdscr, cfg.width, cfg.height);
    Simulation sim(cfg);
    RandomSource seeds(cfg.seed ^ 0x9E3779B9u);

    using namespace std::chrono;
    const auto framePeriod = duration<double, std::milli>(1000.0 / cfg.fps);
    bool running = true;
    bool done = false;
    auto last = steady_clock::now();
    auto lastDropLog = last;
    uint64_t droppedAtLastLog = 0;
    while (!done) {
        auto frameStart = steady_clock::now();
        if (g_stop) done = true;
        if (g_needs_full_redraw) {
            surface.resize();
            g_needs_full_redraw = 0;
        }
        double elapsedMs = duration<double, std::milli>(frameStart - last).count();
        last = frameStart;
        if (running) {
            ToneSink* sink = nullptr;
            if (audio) sink = muted ? static_cast<ToneSink*>(&silent) : static_cast<ToneSink*>(audio.get());
            sim.step(elapsedMs * cfg.timeScale, sink);
        }

        surface.clear();
        sim.render(surface);
        surface.drawStatusLine(status_text(sim, running, muted, audio.get()));
        surface.present();

        if (audio && frameStart - lastDropLog >= seconds(1) && Logger::enabled(Logger::Level::Debug)) {
            uint64_t d = audio->dropped();
            Logger::debug("audio: dropped " + std::to_string(d - droppedAtLastLog) + " tone(s) in the last second" +
                          " energy=" + std::to_string(sim.totalEnergy()));
            droppedAtLastLog = d;
            lastDropLog = frameStart;
        }

        int ch = getch();
        switch (ch) {
            case 'q': case 'Q':
                Logger::info("quit requested"); done = true; break;
            case 's': case 'S':
                running = !running; Logger::info(std::string("running = ") + (running ? "true" : "false")); break;
            case 'p': case 'P':
                running = false; Logger::info("paused"); break;
            case 'r': case 'R': {
                uint32_t s = static_cast<uint32_t>(seeds.engine()());
                sim.rebuild(s);
                Logger::info("rebuild requested seed=" + std::to_string(s));
                break;
            }
            case 'm': case 'M':
                if (audio) { muted = !muted; Logger::info(std::string("muted = ") + (muted ? "true" : "false")); }
                break;
            case KEY_RESIZE:
                surface.resize(); break;
            default:
                break;
        }

        auto spent = steady_clock::now() - frameStart;
        if (spent < framePeriod) std::this_thread::sleep_for(framePeriod - spent);
    }

    restore_terminal();
    audio.reset();
    Logger::info("spinners terminating frames=" + std::to_string(sim.frames()));
    Logger::shutdown();
    return 0;
    } catch (const std::exception& e) {
        restore_terminal();
        Logger::logException("fatal (spinners)", e);
        std::cerr << "spinners: " << e.what() << '\n';
        Logger::shutdown();
        return 1;
    } catch (...) {
        restore_terminal();
        Logger::logUnknownException("fatal (spinners)");
        std::cerr << "spinners: unknown error\n";
        Logger::shutdown();
        return 1;
    }
}

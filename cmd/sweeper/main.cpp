/**
 * @file main.cpp
 * @brief Terminal entry: initializes ncurses, installs signal handlers, and lets the agent play step by step.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <memory>
#include <string>
#include <thread>
#include "Config.h"
#include "Errors.h"
#include "Game.h"
#include "Logger.h"
#include <ncurses.h>

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

// Handle terminal suspension (Ctrl+Z): restore tty before stopping.
static void handle_sigtstp(int) {
    if (g_curses_inited) {
        def_prog_mode(); // save current curses state
        endwin();        // restore tty modes for the shell
        g_curses_inited = false;
    }
    // Revert to default action and re-raise to actually stop the process
    struct sigaction sa{};
    sa.sa_handler = SIG_DFL;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGTSTP, &sa, nullptr);
    raise(SIGTSTP);
}

// Resume after suspension: restore curses program mode and redraw UI
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

/** @brief Initialize color pairs: 1..8 for neighbor counts, then flags/mines and deduced-safe cells. */
static void init_colors() {
    if (!has_colors()) return;
    start_color();
    use_default_colors();
    init_pair(1, COLOR_BLUE, -1);
    init_pair(2, COLOR_GREEN, -1);
    init_pair(3, COLOR_RED, -1);
    init_pair(4, COLOR_MAGENTA, -1);
    init_pair(5, COLOR_YELLOW, -1);
    init_pair(6, COLOR_CYAN, -1);
    init_pair(7, COLOR_CYAN, -1);
    init_pair(8, COLOR_WHITE, -1);
    init_pair(Board::FlagPair, COLOR_RED, -1);
    init_pair(Board::SafePair, COLOR_GREEN, -1);
}

/** @brief Advance one move and report the outcome in the status note; false once the game is over. */
static bool advance(Game& game) {
    Cell moved;
    if (!game.step(moved)) {
        game.board().setStatusNote(std::string("game ") + Game::stateName(game.state()));
        return false;
    }
    std::string note = (game.lastMoveWasSafe() ? "safe " : "guess ") + toString(moved);
    if (game.state() != Game::State::Active) note += std::string(" -> ") + Game::stateName(game.state());
    game.board().setStatusNote(note);
    return true;
}

/** @brief Program entry: sets up the terminal UI, starts a game, handles input, and exits cleanly on signals. */
int main(int argc, char** argv) {
    Logger::initFromArgv0((argc > 0) ? argv[0] : "sweeper");
    Logger::info("sweeper starting");
    std::set_terminate([]{
        try {
            auto ep = std::current_exception();
            if (ep) {
                try { std::rethrow_exception(ep); }
                catch (const std::exception& e) { Logger::logException("std::terminate (sweeper)", e); }
                catch (...) { Logger::logUnknownException("std::terminate (sweeper)"); }
            } else {
                Logger::error("std::terminate (sweeper): no active exception");
            }
        } catch (...) {}
        if (g_curses_inited) { endwin(); }
        Logger::shutdown();
        std::_Exit(1);
    });
    try {
    GameConfig cfg = GameConfig::load(argc, argv);
    Logger::setLevel(cfg.logLevel);
    Logger::info("config: " + cfg.describe());

    struct sigaction sa{};
    sa.sa_handler = handle_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    struct sigaction st{}; st.sa_handler = handle_sigtstp; sigemptyset(&st.sa_mask); st.sa_flags = 0; sigaction(SIGTSTP, &st, nullptr);
    struct sigaction sc{}; sc.sa_handler = handle_sigcont; sigemptyset(&sc.sa_mask); sc.sa_flags = 0; sigaction(SIGCONT, &sc, nullptr);

    initscr();
    g_curses_inited = true;
    std::atexit(atexit_cleanup);
    cbreak();
    noecho();
    curs_set(0);
    keypad(stdscr, TRUE);
    nodelay(stdscr, TRUE); // non-blocking getch
    timeout(0);
    init_colors();

    int rows, cols;
    getmaxyx(stdscr, rows, cols);
    if (rows - 1 < cfg.height || cols < 2 * cfg.width) {
        Logger::error("terminal too small for " + std::to_string(cfg.height) + "x" + std::to_string(cfg.width));
        endwin();
        g_curses_inited = false;
        Logger::shutdown();
        return 1;
    }

    unsigned gameNo = 0;
    auto newGame = [&]() {
        GameConfig g = cfg;
        if (cfg.seed != 0) g.seed = cfg.seed + gameNo;
        ++gameNo;
        return std::unique_ptr<Game>(new Game(g));
    };
    std::unique_ptr<Game> game = newGame();
    game->board().draw(stdscr, game->knowledge().safes());

    bool running = false;
    int delayMs = cfg.stepDelayMs;
    auto lastStep = std::chrono::steady_clock::now();
    bool done = false;
    while (!done) {
        if (g_stop) done = true;
        bool dirty = false;
        if (g_needs_full_redraw) {
            dirty = true;
            g_needs_full_redraw = 0;
        }

        int ch = getch();
        switch (ch) {
            case 'q':
            case 'Q':
                Logger::info("quit requested");
                done = true; break;
            case 'n': case 'N':
                running = false;
                advance(*game);
                dirty = true;
                break;
            case 's': case 'S':
                running = !running;
                Logger::info(std::string("running = ") + (running ? "true" : "false"));
                break;
            case 'p': case 'P':
                running = false;
                Logger::info("paused");
                break;
            case 'r': case 'R':
                game = newGame();
                Logger::info("new game #" + std::to_string(gameNo));
                dirty = true;
                break;
            case '+':
                delayMs = delayMs - 10 < 5 ? 5 : delayMs - 10;
                Logger::info("delay set(ms): " + std::to_string(delayMs));
                break;
            case '-':
                delayMs = delayMs + 10 > 2000 ? 2000 : delayMs + 10;
                Logger::info("delay set(ms): " + std::to_string(delayMs));
                break;
            default:
                break;
        }

        if (running) {
            auto now = std::chrono::steady_clock::now();
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - lastStep).count();
            if (elapsed >= delayMs) {
                if (!advance(*game)) running = false;
                lastStep = now;
                dirty = true;
            }
        }

        if (dirty) game->board().draw(stdscr, game->knowledge().safes());
        game->board().drawStatusLine(stdscr);
        std::this_thread::sleep_for(std::chrono::milliseconds(16)); // ~60 FPS UI
    }

    endwin();
    g_curses_inited = false;
    Logger::info("sweeper terminating");
    Logger::shutdown();
    return 0;
    } catch (const ContradictionError& e) {
        if (g_curses_inited) { endwin(); g_curses_inited = false; }
        Logger::logException("contradiction (sweeper)", e);
        Logger::shutdown();
        return 2;
    } catch (const std::exception& e) {
        if (g_curses_inited) { endwin(); g_curses_inited = false; }
        Logger::logException("unhandled exception (sweeper)", e);
        Logger::shutdown();
        return 2;
    } catch (...) {
        if (g_curses_inited) { endwin(); g_curses_inited = false; }
        Logger::logUnknownException("unhandled exception (sweeper)");
        Logger::shutdown();
        return 2;
    }
}

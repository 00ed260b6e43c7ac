/**
 * @file main.cpp
 * @brief Headless entry: plays many seeded games with independent agents and prints totals.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include <cstdlib>
#include <exception>
#include <iomanip>
#include <iostream>
#include <string>
#include "Config.h"
#include "Errors.h"
#include "Game.h"
#include "Logger.h"

int main(int argc, char** argv) {
    Logger::initFromArgv0((argc > 0) ? argv[0] : "sweeper_bench");
    Logger::info("sweeper_bench starting");
    std::set_terminate([]{
        try {
            auto ep = std::current_exception();
            if (ep) {
                try { std::rethrow_exception(ep); }
                catch (const std::exception& e) { Logger::logException("std::terminate (sweeper_bench)", e); }
                catch (...) { Logger::logUnknownException("std::terminate (sweeper_bench)"); }
            } else {
                Logger::error("std::terminate (sweeper_bench): no active exception");
            }
        } catch (...) {}
        Logger::shutdown();
        std::_Exit(1);
    });
    try {
    GameConfig cfg = GameConfig::load(argc, argv);
    Logger::setLevel(cfg.logLevel);
    Logger::info("config: " + cfg.describe());

    int won = 0, lost = 0, stuck = 0, contradictions = 0;
    long safeMoves = 0, randomMoves = 0;
    for (int i = 0; i < cfg.games; ++i) {
        GameConfig g = cfg;
        if (cfg.seed != 0) g.seed = cfg.seed + static_cast<unsigned>(i);
        Game game(g);
        try {
            switch (game.play()) {
                case Game::State::Won: ++won; break;
                case Game::State::Lost: ++lost; break;
                case Game::State::Active: ++stuck; break;
            }
        } catch (const ContradictionError& e) {
            // Counted; the remaining games still run.
            Logger::logException("game " + std::to_string(i), e);
            ++contradictions;
        }
        safeMoves += game.safeMoves();
        randomMoves += game.randomMoves();
    }

    long moves = safeMoves + randomMoves;
    double deduced = moves > 0 ? 100.0 * static_cast<double>(safeMoves) / static_cast<double>(moves) : 0.0;
    std::cout << "games:          " << cfg.games << " (" << cfg.height << "x" << cfg.width
              << ", " << cfg.mines << " mines)\n"
              << "won:            " << won << "\n"
              << "lost:           " << lost << "\n"
              << "unfinished:     " << stuck << "\n"
              << "contradictions: " << contradictions << "\n"
              << "deduced moves:  " << std::fixed << std::setprecision(1) << deduced << "%\n";
    Logger::info("sweeper_bench done: won=" + std::to_string(won) + " lost=" + std::to_string(lost) +
                 " contradictions=" + std::to_string(contradictions));
    Logger::shutdown();
    return contradictions == 0 ? 0 : 3;
    } catch (const std::exception& e) {
        Logger::logException("unhandled exception (sweeper_bench)", e);
        std::cerr << "sweeper_bench: " << e.what() << "\n";
        Logger::shutdown();
        return 2;
    } catch (...) {
        Logger::logUnknownException("unhandled exception (sweeper_bench)");
        Logger::shutdown();
        return 2;
    }
}

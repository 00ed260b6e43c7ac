/**
 * @file Game.cpp
 * @brief Game implementation: the reveal / observe / flag cycle.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Game.h"
#include "Logger.h"

#include <string>
#include <utility>

namespace {
/** @brief Derive the agent seed from the board seed so a seeded run is reproducible. */
unsigned agentSeedFor(unsigned seed) { return seed == 0 ? 0u : seed * 2654435761u + 1u; }
}

/** @copydoc Game::Game(const GameConfig&) */
Game::Game(const GameConfig& cfg)
    : field(new Board(cfg.height, cfg.width, cfg.mines, cfg.seed)),
      agent(cfg.height, cfg.width, agentSeedFor(cfg.seed)) {}

/** @copydoc Game::Game(std::unique_ptr<Board>,unsigned) */
Game::Game(std::unique_ptr<Board> board, unsigned agentSeed)
    : field(std::move(board)),
      agent(field->height(), field->width(), agentSeed) {}

/** @copydoc Game::step */
bool Game::step(Cell& moved) {
    if (current != State::Active) return false;

    Cell next;
    if (agent.safeMove(next)) {
        lastSafe = true;
        ++safeMoveCount;
    } else if (agent.randomMove(next)) {
        lastSafe = false;
        ++randomMoveCount;
        Logger::debug("Game::step: no deduced-safe cell, guessing " + toString(next));
    } else {
        Logger::info("Game::step: no moves left");
        syncBoard();
        return false;
    }

    moved = next;
    int count = field->reveal(next);
    if (count < 0) {
        current = State::Lost;
        Logger::info("Game::step: hit mine at " + toString(next) + (lastSafe ? " (deduced safe)" : ""));
        return true;
    }
    agent.addKnowledge(next, count);
    syncBoard();
    return true;
}

/** @copydoc Game::play */
Game::State Game::play() {
    Cell moved;
    while (step(moved)) {
    }
    Logger::info(std::string("Game::play: ") + stateName(current) + " after " +
                 std::to_string(safeMoveCount) + " safe / " + std::to_string(randomMoveCount) + " random moves");
    return current;
}

/** @copydoc Game::syncBoard */
void Game::syncBoard() {
    for (const auto& c : agent.mines()) {
        if (field->flagged().count(c) == 0) field->flag(c);
    }
    if (field->lost()) current = State::Lost;
    else if (field->won()) current = State::Won;
}

const char* Game::stateName(State s) {
    switch (s) {
        case State::Active: return "active";
        case State::Won: return "won";
        case State::Lost: return "lost";
    }
    return "active";
}

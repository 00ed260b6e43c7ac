/**
 * @file Game.h
 * @brief Declares Game: one board, one agent, and the move loop that connects them.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <memory>

#include "Board.h"
#include "Cell.h"
#include "Config.h"
#include "KnowledgeBase.h"

/**
 * @class Game
 * @brief Drives a KnowledgeBase against a Board until the game is won, lost, or out of moves.
 *
 * Each step prefers a deduced-safe cell and falls back to a random unknown one. The revealed
 * count goes back into the agent, and every mine the agent has proven is flagged on the board.
 */
class Game {
public:
    enum class State { Active, Won, Lost };

    /** @brief New random board and fresh agent from @p cfg (seed 0 means random). */
    explicit Game(const GameConfig& cfg);
    /** @brief Play on a prepared @p board; @p agentSeed seeds the agent's random moves. */
    Game(std::unique_ptr<Board> board, unsigned agentSeed);

    /**
     * @brief Make one move.
     * @param moved receives the revealed cell.
     * @return false if the game was already over or no move exists.
     * @throws ContradictionError from the agent.
     */
    bool step(Cell& moved);
    /** @brief Step until the game ends; returns the final state. */
    State play();

    State state() const { return current; }
    /** @brief Whether the most recent step used a deduced-safe cell. */
    bool lastMoveWasSafe() const { return lastSafe; }
    int safeMoves() const { return safeMoveCount; }
    int randomMoves() const { return randomMoveCount; }

    const Board& board() const { return *field; }
    Board& board() { return *field; }
    const KnowledgeBase& knowledge() const { return agent; }

    static const char* stateName(State s);

private:
    /** @brief Flag every proven mine and recompute state(). */
    void syncBoard();

    std::unique_ptr<Board> field; /**< ground truth and player state */
    KnowledgeBase agent;          /**< inference engine */
    State current{State::Active};
    bool lastSafe{false};
    int safeMoveCount{0};
    int randomMoveCount{0};
};

/**
 * @file Board.h
 * @brief Declares the Board class which owns the minefield, the player's reveals and flags, and rendering.
 *
 * The Board is ground truth: it knows where every mine is. The inference engine never reads it;
 * the driver reveals cells here and forwards each neighbor count to the KnowledgeBase.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <iosfwd>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "Cell.h"

#include <ncurses.h>

/**
 * @class Board
 * @brief A height x width minefield with reveal/flag state and an ncurses renderer.
 *
 * Responsibilities:
 * - Mine placement (seeded random, or an explicit set for tests)
 * - Ground-truth queries (isMine, neighborCount)
 * - Player state (revealed cells, flags, win/loss)
 * - Text dump of mine locations and ncurses drawing
 */
class Board {
public:
    /** @brief Place @p mineCount mines uniformly at random; @p seed 0 seeds from std::random_device. */
    Board(int height, int width, int mineCount, unsigned seed = 0);
    /** @brief Place exactly the given @p mines. */
    Board(int height, int width, const CellSet& mines);

    // Grid helpers
    /** @brief Number of rows. */
    int height() const { return h; }
    /** @brief Number of columns. */
    int width() const { return w; }
    /** @brief (height, width). */
    std::pair<int,int> dimensions() const { return {h, w}; }
    /** @brief Check if @p c is within the grid. */
    bool inBounds(const Cell& c) const { return cellInBounds(c, h, w); }
    /** @brief Number of mines placed. */
    int mineCount() const { return static_cast<int>(mineSet.size()); }
    /** @brief Every mine location. */
    const CellSet& mines() const { return mineSet; }

    // Ground truth
    /** @brief Whether @p c holds a mine. */
    bool isMine(const Cell& c) const;
    /** @brief Mines among the up-to-8 in-bound neighbors of @p c. */
    int neighborCount(const Cell& c) const;
    /** @brief In-bound neighbors of @p c (8-neighborhood). */
    CellSet neighbors(const Cell& c) const;

    // Player state
    /** @brief Reveal @p c; returns its neighbor count, or -1 if it was a mine (the game is lost). */
    int reveal(const Cell& c);
    /** @brief Whether @p c has been revealed. */
    bool isRevealed(const Cell& c) const { return revealedSet.count(c) != 0; }
    const CellSet& revealed() const { return revealedSet; }
    /** @brief Mark @p c as a found mine. */
    void flag(const Cell& c);
    const CellSet& flagged() const { return flaggedSet; }
    /** @brief All mines (at least one) flagged exactly, or every safe cell revealed. */
    bool won() const;
    /** @brief A mine was revealed. */
    bool lost() const { return detonated; }

    /** @brief Text grid of mine locations ("|X" for a mine, "| " otherwise). */
    void print(std::ostream& os) const;

    // Rendering
    /** @brief Full draw of the grid: counts, flags, deduced-safe cells, and hidden cells. */
    void draw(WINDOW* win, const CellSet& knownSafes) const;
    /** @brief Update the bottom status line (controls, progress, game state, note). */
    void drawStatusLine(WINDOW* win) const;
    /** @brief Map a neighbor count to a color pair id for ncurses rendering. */
    int colorPairForCount(int n) const;
    /** @brief Set a short note appended to the status line. */
    void setStatusNote(const std::string& note) { statusNote = note; }
    /** @brief Remove the status note. */
    void clearStatusNote() { statusNote.clear(); }

    static constexpr short FlagPair = 9;  /**< color pair for flags and mines */
    static constexpr short SafePair = 10; /**< color pair for deduced-safe hidden cells */

private:
    /** @brief Throw OutOfBoundsCell unless @p c is on the grid. */
    void requireInBounds(const Cell& c) const;
    /** @brief Shuffle all positions and mine the first @p count. */
    void placeRandom(int count);
    /** @brief Record a mine at @p c in both the grid and the set. */
    void placeAt(const Cell& c);

    int h, w; /**< grid dimensions */
    std::vector<char> grid; /**< flattened mine flags of size h*w */
    CellSet mineSet;        /**< mine locations */
    CellSet revealedSet;    /**< cells the player opened */
    CellSet flaggedSet;     /**< cells the player marked as mines */
    bool detonated{false};  /**< a mine was revealed */
    std::string statusNote; /**< free-form status suffix */

    std::mt19937 prng;      /**< placement PRNG */
};

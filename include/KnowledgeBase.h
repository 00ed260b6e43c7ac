/**
 * @file KnowledgeBase.h
 * @brief Declares KnowledgeBase: the agent state and the forward-chaining inference engine.
 *
 * The driver reports each revealed cell with its nearby-mine count through addKnowledge().
 * The knowledge base turns every observation into a Sentence, then closes its sentence list
 * under trivial resolution and subset reduction until no new fact appears. Derived safe cells
 * and mines are read back through safeMove(), randomMove() and the const accessors.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <cstddef>
#include <random>
#include <utility>
#include <vector>

#include "Cell.h"
#include "Sentence.h"

/**
 * @class KnowledgeBase
 * @brief One Minesweeper agent: known safes, known mines, moves made, and live sentences.
 *
 * Responsibilities:
 * - Validate observations at the boundary (bounds, count range)
 * - Keep safes and mines disjoint and every live sentence free of known cells
 * - Run the closure procedure to a fixed point after every observation
 * - Answer move queries without changing what it knows
 *
 * Not reentrant; each agent owns all of its state.
 */
class KnowledgeBase {
public:
    /**
     * @brief Construct an empty knowledge base for a height x width board.
     * @param seed PRNG seed for randomMove(); 0 seeds from std::random_device.
     */
    KnowledgeBase(int height, int width, unsigned seed = 0);

    /** @brief Board height in rows. */
    int height() const { return h; }
    /** @brief Board width in columns. */
    int width() const { return w; }

    /**
     * @brief Record that @p cell was revealed safely and has @p count mines around it.
     * @throws OutOfBoundsCell if @p cell is not on the board.
     * @throws ContradictionError if the observation conflicts with what is already known.
     */
    void addKnowledge(const Cell& cell, int count);

    /** @brief Record a known-safe cell from outside, propagate it, and re-run the closure. */
    void markSafe(const Cell& cell);
    /** @brief Record a known mine from outside, propagate it, and re-run the closure. */
    void markMine(const Cell& cell);

    /**
     * @brief Run the closure procedure to its fixed point.
     * @return true if any fact or sentence changed.
     */
    bool infer();

    /** @brief A proven-safe cell not yet revealed (lowest row, col first); false if none. */
    bool safeMove(Cell& out) const;
    /** @brief A uniformly chosen cell that is neither revealed nor a known mine; false if none. */
    bool randomMove(Cell& out) const;

    const CellSet& safes() const { return safeCells; }
    const CellSet& mines() const { return mineCells; }
    const CellSet& movesMade() const { return moves; }
    const std::vector<Sentence>& sentences() const { return knowledge; }

    /** @brief Closure passes run by the most recent infer(). */
    size_t lastPassCount() const { return lastPasses; }

private:
    /** @brief Target index and replacement sentence computed from a snapshot. */
    using Reduction = std::pair<size_t, Sentence>;

    /** @brief Throw OutOfBoundsCell unless @p c is on the board. */
    void requireInBounds(const Cell& c) const;
    /** @brief Add to safes (contradiction if a known mine) and propagate into every sentence. */
    void recordSafe(const Cell& c);
    /** @brief Add to mines (contradiction if a known safe) and propagate into every sentence. */
    void recordMine(const Cell& c);
    /** @brief Apply every known safe and mine to @p s. */
    void applyKnown(Sentence& s) const;
    /** @brief Copy everything @p s has derived into the global sets. */
    void absorb(const Sentence& s);
    /** @brief Subset reductions over a snapshot of the sentence list; at most one per target. */
    std::vector<Reduction> proposeReductions() const;
    /** @brief Drop empty sentences and return how many; an empty sentence with a non-zero count is a contradiction. */
    size_t pruneResolved();
    /** @brief Write the current sentences and facts at debug level. */
    void logState() const;

    int h, w;                       /**< board dimensions */
    CellSet moves;                  /**< revealed cells */
    CellSet safeCells;              /**< proven safe */
    CellSet mineCells;              /**< proven mines */
    std::vector<Sentence> knowledge; /**< live sentences */
    size_t lastPasses{0};           /**< passes run by the last closure */

    mutable std::mt19937 prng;      /**< randomMove source */
};

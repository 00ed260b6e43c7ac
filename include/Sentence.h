/**
 * @file Sentence.h
 * @brief Declares Sentence: "exactly count of these cells are mines".
 *
 * A sentence only ever shrinks. Cells leave it once they are proven safe or proven to be mines,
 * and subset reduction replaces it with the smaller constraint on its remainder.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <string>

#include "Cell.h"

/**
 * @class Sentence
 * @brief A logical constraint over a set of still-undetermined cells and a mine count.
 *
 * Responsibilities:
 * - Absorb facts about single cells (markSafe / markMine)
 * - Resolve itself once the count makes every remaining cell certain (resolveTrivial)
 * - Rewrite a superset sentence into the constraint on the difference (reduceWith)
 * - Remember which cells it has seen resolved (derived safes / mines)
 */
class Sentence {
public:
    Sentence() = default;
    /** @brief Construct "exactly @p count of @p cells are mines". */
    Sentence(CellSet cells, int count);

    /** @brief Cells whose state this sentence still constrains. */
    const CellSet& cells() const { return cellSet; }
    /** @brief Number of mines among cells(). */
    int count() const { return mineCount; }
    /** @brief Fully resolved: no cells left. */
    bool empty() const { return cellSet.empty(); }
    /** @brief Whether @p c is still constrained by this sentence. */
    bool contains(const Cell& c) const { return cellSet.count(c) != 0; }

    /** @brief count == 0: every remaining cell is safe. */
    bool isSafeTrivial() const { return mineCount == 0 && !cellSet.empty(); }
    /** @brief count == |cells| > 0: every remaining cell is a mine. */
    bool isMineTrivial() const { return mineCount > 0 && mineCount == static_cast<int>(cellSet.size()); }

    /** @brief Cells known safe: recorded ones plus all remaining cells when safe-trivial. */
    CellSet knownSafes() const;
    /** @brief Cells known to be mines: recorded ones plus all remaining cells when mine-trivial. */
    CellSet knownMines() const;

    /**
     * @brief Record that @p c is a mine; if constrained here, drop it and decrement count.
     *
     * No underflow check: a negative count afterwards is a contradiction reported by checkConsistent().
     */
    void markMine(const Cell& c);
    /** @brief Record that @p c is safe and drop it from cells(); count is unchanged. */
    void markSafe(const Cell& c);

    /**
     * @brief Certainty by exhaustion: resolve every remaining cell if the count allows it.
     * @return true if cells were resolved (the sentence is empty afterwards).
     */
    bool resolveTrivial();

    /** @brief Non-empty and cells() is a subset of @p other.cells(). */
    bool isSubsetOf(const Sentence& other) const;
    /**
     * @brief Subset inference between this sentence and @p other.
     *
     * If cells() is a subset of other.cells(), @p other is rewritten to (other - this) with
     * count other.count - count. Symmetrically this is rewritten when other is the subset.
     * An empty sentence never reduces anything.
     * @return true if either sentence was rewritten.
     */
    bool reduceWith(Sentence& other);
    /** @brief The constraint on cells() minus @p subset's cells (caller checks the subset relation). */
    Sentence without(const Sentence& subset) const;

    /** @brief 0 <= count <= |cells|. */
    bool consistent() const;
    /** @brief Throw ContradictionError unless consistent(). */
    void checkConsistent() const;

    /** @brief Same cells and same count; derived bookkeeping is not compared. */
    bool operator==(const Sentence& other) const;
    bool operator!=(const Sentence& other) const { return !(*this == other); }

    /** @brief "{(r,c), ...} = count" */
    std::string toString() const;

private:
    CellSet cellSet;        /**< undetermined cells */
    int mineCount{0};       /**< mines among cellSet */
    CellSet derivedSafes;   /**< cells this sentence was told or proved are safe */
    CellSet derivedMines;   /**< cells this sentence was told or proved are mines */
};

/**
 * @file Sentence.cpp
 * @brief Sentence implementation: single-cell updates, trivial resolution, and subset reduction.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Sentence.h"
#include "Errors.h"

#include <algorithm>
#include <iterator>
#include <utility>

/** @copydoc Sentence::Sentence */
Sentence::Sentence(CellSet cells, int count)
    : cellSet(std::move(cells)), mineCount(count) {}

/** @copydoc Sentence::knownSafes */
CellSet Sentence::knownSafes() const {
    CellSet out = derivedSafes;
    if (isSafeTrivial()) out.insert(cellSet.begin(), cellSet.end());
    return out;
}

/** @copydoc Sentence::knownMines */
CellSet Sentence::knownMines() const {
    CellSet out = derivedMines;
    if (isMineTrivial()) out.insert(cellSet.begin(), cellSet.end());
    return out;
}

/** @copydoc Sentence::markMine */
void Sentence::markMine(const Cell& c) {
    if (cellSet.erase(c) != 0) --mineCount;
    derivedMines.insert(c);
}

/** @copydoc Sentence::markSafe */
void Sentence::markSafe(const Cell& c) {
    cellSet.erase(c);
    derivedSafes.insert(c);
}

/** @copydoc Sentence::resolveTrivial */
bool Sentence::resolveTrivial() {
    if (cellSet.empty()) return false;
    // Iterate a copy: marking erases from cellSet.
    const CellSet remaining = cellSet;
    if (mineCount == 0) {
        for (const auto& c : remaining) markSafe(c);
        return true;
    }
    if (mineCount == static_cast<int>(remaining.size())) {
        for (const auto& c : remaining) markMine(c);
        return true;
    }
    return false;
}

/** @copydoc Sentence::isSubsetOf */
bool Sentence::isSubsetOf(const Sentence& other) const {
    if (cellSet.empty()) return false;
    if (cellSet.size() > other.cellSet.size()) return false;
    return std::includes(other.cellSet.begin(), other.cellSet.end(),
                         cellSet.begin(), cellSet.end());
}

/** @copydoc Sentence::without */
Sentence Sentence::without(const Sentence& subset) const {
    CellSet rest;
    std::set_difference(cellSet.begin(), cellSet.end(),
                        subset.cellSet.begin(), subset.cellSet.end(),
                        std::inserter(rest, rest.end()));
    return Sentence(std::move(rest), mineCount - subset.mineCount);
}

/** @copydoc Sentence::reduceWith */
bool Sentence::reduceWith(Sentence& other) {
    if (isSubsetOf(other)) {
        Sentence reduced = other.without(*this);
        other.cellSet = std::move(reduced.cellSet);
        other.mineCount = reduced.mineCount;
        return true;
    }
    if (other.isSubsetOf(*this)) {
        Sentence reduced = without(other);
        cellSet = std::move(reduced.cellSet);
        mineCount = reduced.mineCount;
        return true;
    }
    return false;
}

/** @copydoc Sentence::consistent */
bool Sentence::consistent() const {
    return mineCount >= 0 && mineCount <= static_cast<int>(cellSet.size());
}

/** @copydoc Sentence::checkConsistent */
void Sentence::checkConsistent() const {
    if (consistent()) return;
    throw ContradictionError("sentence " + toString() + " has a count outside [0," +
                             std::to_string(cellSet.size()) + "]");
}

bool Sentence::operator==(const Sentence& other) const {
    return mineCount == other.mineCount && cellSet == other.cellSet;
}

/** @copydoc Sentence::toString */
std::string Sentence::toString() const {
    return ::toString(cellSet) + " = " + std::to_string(mineCount);
}

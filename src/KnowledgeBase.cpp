/**
 * @file KnowledgeBase.cpp
 * @brief KnowledgeBase implementation: observation intake, fact propagation, and the closure loop.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "KnowledgeBase.h"
#include "Errors.h"
#include "Logger.h"

#include <stdexcept>
#include <string>

/** @copydoc KnowledgeBase::KnowledgeBase */
KnowledgeBase::KnowledgeBase(int height, int width, unsigned seed)
    : h(height), w(width) {
    if (height < 1 || width < 1) {
        throw std::invalid_argument("knowledge base needs a non-empty board, got " +
                                    std::to_string(height) + "x" + std::to_string(width));
    }
    if (seed == 0) {
        std::random_device rd;
        seed = rd();
    }
    prng.seed(seed);
}

/** @copydoc KnowledgeBase::addKnowledge */
void KnowledgeBase::addKnowledge(const Cell& cell, int count) {
    requireInBounds(cell);
    Logger::info("observe " + toString(cell) + " count=" + std::to_string(count));

    moves.insert(cell);
    recordSafe(cell);

    // Start the new sentence in reduced form.
    Sentence s(neighborsOf(cell, h, w), count);
    applyKnown(s);
    s.checkConsistent();
    if (s.resolveTrivial()) {
        absorb(s);
    } else if (!s.empty()) {
        knowledge.push_back(std::move(s));
    }

    infer();
    logState();
}

/** @copydoc KnowledgeBase::markSafe */
void KnowledgeBase::markSafe(const Cell& cell) {
    requireInBounds(cell);
    recordSafe(cell);
    infer();
}

/** @copydoc KnowledgeBase::markMine */
void KnowledgeBase::markMine(const Cell& cell) {
    requireInBounds(cell);
    recordMine(cell);
    infer();
}

/**
 * @copydoc KnowledgeBase::infer
 *
 * Each pass: push known facts into every sentence, apply one batch of subset reductions computed
 * from a snapshot, resolve trivial sentences into new facts, and drop empty sentences. Every
 * reduction removes at least one cell from a sentence and every other change is a new fact,
 * so the loop is bounded by the total number of cells held in sentences.
 */
bool KnowledgeBase::infer() {
    bool any = false;
    bool changed = true;
    lastPasses = 0;
    while (changed) {
        changed = false;
        ++lastPasses;
        const size_t factsBefore = safeCells.size() + mineCells.size();

        for (auto& s : knowledge) applyKnown(s);
        for (const auto& s : knowledge) s.checkConsistent();

        std::vector<Reduction> batch = proposeReductions();
        for (auto& r : batch) {
            Logger::debug("reduce " + knowledge[r.first].toString() + " -> " + r.second.toString());
            knowledge[r.first] = std::move(r.second);
            changed = true;
        }

        for (size_t i = 0; i < knowledge.size(); ++i) {
            knowledge[i].checkConsistent();
            if (knowledge[i].resolveTrivial()) absorb(knowledge[i]);
        }
        if (pruneResolved() > 0) any = true;

        if (safeCells.size() + mineCells.size() != factsBefore) changed = true;
        if (changed) any = true;
    }
    return any;
}

/** @copydoc KnowledgeBase::safeMove */
bool KnowledgeBase::safeMove(Cell& out) const {
    for (const auto& c : safeCells) {
        if (moves.count(c) != 0) continue;
        out = c;
        return true;
    }
    return false;
}

/** @copydoc KnowledgeBase::randomMove */
bool KnowledgeBase::randomMove(Cell& out) const {
    std::vector<Cell> candidates;
    for (int r = 0; r < h; ++r) {
        for (int c = 0; c < w; ++c) {
            Cell cell{r, c};
            if (moves.count(cell) != 0 || mineCells.count(cell) != 0) continue;
            candidates.push_back(cell);
        }
    }
    if (candidates.empty()) return false;
    std::uniform_int_distribution<size_t> dist(0, candidates.size() - 1);
    out = candidates[dist(prng)];
    return true;
}

void KnowledgeBase::requireInBounds(const Cell& c) const {
    if (!cellInBounds(c, h, w)) throw OutOfBoundsCell(c, h, w);
}

/** @copydoc KnowledgeBase::recordSafe */
void KnowledgeBase::recordSafe(const Cell& c) {
    if (mineCells.count(c) != 0) throw ContradictionError("cell proven both safe and a mine", c);
    if (!safeCells.insert(c).second) return;
    Logger::debug("safe " + toString(c));
    for (auto& s : knowledge) s.markSafe(c);
}

/** @copydoc KnowledgeBase::recordMine */
void KnowledgeBase::recordMine(const Cell& c) {
    if (safeCells.count(c) != 0) throw ContradictionError("cell proven both safe and a mine", c);
    if (!mineCells.insert(c).second) return;
    Logger::debug("mine " + toString(c));
    for (auto& s : knowledge) s.markMine(c);
}

/** @copydoc KnowledgeBase::applyKnown */
void KnowledgeBase::applyKnown(Sentence& s) const {
    const CellSet cells = s.cells();
    for (const auto& c : cells) {
        if (safeCells.count(c) != 0) s.markSafe(c);
        else if (mineCells.count(c) != 0) s.markMine(c);
    }
}

/** @copydoc KnowledgeBase::absorb */
void KnowledgeBase::absorb(const Sentence& s) {
    for (const auto& c : s.knownSafes()) recordSafe(c);
    for (const auto& c : s.knownMines()) recordMine(c);
}

/**
 * @copydoc KnowledgeBase::proposeReductions
 *
 * Sentence j is rewritten to (j - i) when i is a subset of j. Two sentences over the same cells
 * only let the earlier one rewrite the later one, so the sources of a batch never form a cycle
 * and every replaced sentence can be rebuilt from the ones that remain.
 */
std::vector<KnowledgeBase::Reduction> KnowledgeBase::proposeReductions() const {
    std::vector<Reduction> batch;
    for (size_t j = 0; j < knowledge.size(); ++j) {
        const Sentence& target = knowledge[j];
        for (size_t i = 0; i < knowledge.size(); ++i) {
            if (i == j) continue;
            const Sentence& subset = knowledge[i];
            if (!subset.isSubsetOf(target)) continue;
            if (subset.cells().size() == target.cells().size() && i > j) continue;
            batch.emplace_back(j, target.without(subset));
            break;
        }
    }
    return batch;
}

/** @copydoc KnowledgeBase::pruneResolved */
size_t KnowledgeBase::pruneResolved() {
    size_t removed = 0;
    for (auto it = knowledge.begin(); it != knowledge.end();) {
        if (!it->empty()) {
            ++it;
            continue;
        }
        if (it->count() != 0) {
            throw ContradictionError("resolved sentence still expects " + std::to_string(it->count()) + " mines");
        }
        it = knowledge.erase(it);
        ++removed;
    }
    return removed;
}

/** @copydoc KnowledgeBase::logState */
void KnowledgeBase::logState() const {
    if (Logger::level() > Logger::Level::Debug) return;
    for (size_t i = 0; i < knowledge.size(); ++i) {
        Logger::debug("S#" + std::to_string(i) + ": " + knowledge[i].toString());
    }
    Logger::debug("safes=" + toString(safeCells) + " mines=" + toString(mineCells));
}

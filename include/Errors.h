/**
 * @file Errors.h
 * @brief Exceptions raised by the inference engine and the board model.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <stdexcept>
#include <string>

#include "Cell.h"

/**
 * @class ContradictionError
 * @brief The observations imply a cell is both safe and a mine, or a sentence count left [0,|cells|].
 *
 * Raised out of KnowledgeBase::addKnowledge; knowledge held after this point is unreliable.
 */
class ContradictionError : public std::runtime_error {
public:
    explicit ContradictionError(const std::string& what)
        : std::runtime_error(what) {}
    ContradictionError(const std::string& what, const Cell& c)
        : std::runtime_error(what + " at " + toString(c)), at(c), known(true) {}

    /** @brief Whether a specific cell is attached to the contradiction. */
    bool hasCell() const { return known; }
    /** @brief The offending cell (only meaningful if hasCell()). */
    const Cell& cell() const { return at; }

private:
    Cell at{};
    bool known{false};
};

/**
 * @class OutOfBoundsCell
 * @brief A cell outside [0,height) x [0,width) was passed to the board or the engine.
 */
class OutOfBoundsCell : public std::out_of_range {
public:
    OutOfBoundsCell(const Cell& c, int height, int width)
        : std::out_of_range("cell " + toString(c) + " outside " + std::to_string(height) + "x" +
                            std::to_string(width) + " board"),
          at(c) {}

    const Cell& cell() const { return at; }

private:
    Cell at;
};

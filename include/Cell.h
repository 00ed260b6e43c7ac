/**
 * @file Cell.h
 * @brief Board coordinates, ordered cell sets, and the 8-neighborhood adjacency rule.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <set>
#include <string>

/**
 * @struct Cell
 * @brief A 0-indexed (row, col) board position; value-equal and ordered row-major.
 */
struct Cell {
    int row{0}; /**< 0 <= row < height */
    int col{0}; /**< 0 <= col < width */
};

inline bool operator==(const Cell& a, const Cell& b) { return a.row == b.row && a.col == b.col; }
inline bool operator!=(const Cell& a, const Cell& b) { return !(a == b); }
inline bool operator<(const Cell& a, const Cell& b) {
    return a.row < b.row || (a.row == b.row && a.col < b.col);
}

/** @brief Ordered cell set; iteration visits the lowest (row,col) first. */
using CellSet = std::set<Cell>;

/** @brief Check that @p c lies in [0,height) x [0,width). */
inline bool cellInBounds(const Cell& c, int height, int width) {
    return c.row >= 0 && c.col >= 0 && c.row < height && c.col < width;
}

/** @brief The up-to-8 grid-adjacent cells of @p c, clipped to the board bounds. */
CellSet neighborsOf(const Cell& c, int height, int width);

/** @brief Format as "(r,c)". */
std::string toString(const Cell& c);
/** @brief Format as "{(r,c), (r,c)}". */
std::string toString(const CellSet& cells);

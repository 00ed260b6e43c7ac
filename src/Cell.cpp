/**
 * @file Cell.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Cell.h"

/** @copydoc neighborsOf */
CellSet neighborsOf(const Cell& c, int height, int width) {
    CellSet out;
    for (int dr = -1; dr <= 1; ++dr) {
        for (int dc = -1; dc <= 1; ++dc) {
            if (dr == 0 && dc == 0) continue;
            Cell n{c.row + dr, c.col + dc};
            if (!cellInBounds(n, height, width)) continue;
            out.insert(n);
        }
    }
    return out;
}

std::string toString(const Cell& c) {
    return "(" + std::to_string(c.row) + "," + std::to_string(c.col) + ")";
}

std::string toString(const CellSet& cells) {
    std::string s = "{";
    bool first = true;
    for (const auto& c : cells) {
        if (!first) s += ", ";
        s += toString(c);
        first = false;
    }
    s += "}";
    return s;
}

/**
 * @file Board.cpp
 * @brief Board implementation: mine placement, ground-truth queries, player state, and ncurses rendering.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Board.h"
#include "Errors.h"
#include "Logger.h"

#include <algorithm>
#include <ostream>
#include <stdexcept>

namespace {
/** @brief Compute flattened index into grid vector for (row,col) in a width w grid. */
inline size_t idx(int row, int col, int w) { return static_cast<size_t>(row * w + col); }

void requireDimensions(int height, int width) {
    if (height < 1 || width < 1) {
        throw std::invalid_argument("board dimensions must be positive, got " +
                                    std::to_string(height) + "x" + std::to_string(width));
    }
}
}

/** @copydoc Board::Board(int,int,int,unsigned) */
Board::Board(int height, int width, int mineCount, unsigned seed)
    : h(height), w(width) {
    requireDimensions(height, width);
    if (mineCount < 0 || mineCount > height * width) {
        throw std::invalid_argument("cannot place " + std::to_string(mineCount) + " mines on " +
                                    std::to_string(height * width) + " cells");
    }
    grid.assign(static_cast<size_t>(height * width), 0);
    if (seed == 0) {
        std::random_device rd;
        seed = rd();
    }
    prng.seed(seed);
    placeRandom(mineCount);
    Logger::info("Board: " + std::to_string(h) + "x" + std::to_string(w) + " mines=" +
                 std::to_string(mineCount) + " seed=" + std::to_string(seed));
}

/** @copydoc Board::Board(int,int,const CellSet&) */
Board::Board(int height, int width, const CellSet& mines)
    : h(height), w(width) {
    requireDimensions(height, width);
    grid.assign(static_cast<size_t>(height * width), 0);
    for (const auto& c : mines) {
        if (!inBounds(c)) throw std::invalid_argument("mine " + toString(c) + " is off the board");
        placeAt(c);
    }
}

/** @copydoc Board::placeRandom */
void Board::placeRandom(int count) {
    int total = w * h;
    std::vector<int> posIdx(static_cast<size_t>(total));
    for (int i = 0; i < total; ++i) posIdx[static_cast<size_t>(i)] = i;
    std::shuffle(posIdx.begin(), posIdx.end(), prng);
    for (int i = 0; i < count; ++i) {
        int p = posIdx[static_cast<size_t>(i)];
        placeAt(Cell{p / w, p % w});
    }
}

void Board::placeAt(const Cell& c) {
    grid[idx(c.row, c.col, w)] = 1;
    mineSet.insert(c);
}

void Board::requireInBounds(const Cell& c) const {
    if (!inBounds(c)) throw OutOfBoundsCell(c, h, w);
}

/** @copydoc Board::isMine */
bool Board::isMine(const Cell& c) const {
    requireInBounds(c);
    return grid[idx(c.row, c.col, w)] != 0;
}

/** @copydoc Board::neighborCount */
int Board::neighborCount(const Cell& c) const {
    requireInBounds(c);
    int count = 0;
    for (const auto& n : neighborsOf(c, h, w)) {
        if (grid[idx(n.row, n.col, w)] != 0) ++count;
    }
    return count;
}

/** @copydoc Board::neighbors */
CellSet Board::neighbors(const Cell& c) const {
    requireInBounds(c);
    return neighborsOf(c, h, w);
}

/** @copydoc Board::reveal */
int Board::reveal(const Cell& c) {
    requireInBounds(c);
    revealedSet.insert(c);
    if (grid[idx(c.row, c.col, w)] != 0) {
        detonated = true;
        Logger::info("Board::reveal: mine at " + toString(c));
        return -1;
    }
    return neighborCount(c);
}

/** @copydoc Board::flag */
void Board::flag(const Cell& c) {
    requireInBounds(c);
    flaggedSet.insert(c);
}

/** @copydoc Board::won */
bool Board::won() const {
    if (detonated) return false;
    if (!mineSet.empty() && flaggedSet == mineSet) return true;
    return static_cast<int>(revealedSet.size()) == h * w - mineCount();
}

/** @copydoc Board::print */
void Board::print(std::ostream& os) const {
    const std::string rule(static_cast<size_t>(2 * w + 1), '-');
    for (int r = 0; r < h; ++r) {
        os << rule << '\n';
        for (int c = 0; c < w; ++c) {
            os << (grid[idx(r, c, w)] != 0 ? "|X" : "| ");
        }
        os << "|\n";
    }
    os << rule << '\n';
}

/** @copydoc Board::draw */
void Board::draw(WINDOW* win, const CellSet& knownSafes) const {
    if (!win) return;
    werase(win);
    for (int r = 0; r < h; ++r) {
        for (int c = 0; c < w; ++c) {
            Cell cell{r, c};
            int x = 2 * c;
            bool mine = grid[idx(r, c, w)] != 0;
            if (revealedSet.count(cell) != 0 && mine) {
                wattron(win, A_BOLD | COLOR_PAIR(FlagPair));
                mvwaddch(win, r, x, '*');
                wattroff(win, A_BOLD | COLOR_PAIR(FlagPair));
            } else if (revealedSet.count(cell) != 0) {
                int n = neighborCount(cell);
                if (n == 0) {
                    mvwaddch(win, r, x, '.');
                } else {
                    int pair = colorPairForCount(n);
                    wattron(win, COLOR_PAIR(pair));
                    mvwaddch(win, r, x, static_cast<chtype>('0' + n));
                    wattroff(win, COLOR_PAIR(pair));
                }
            } else if (flaggedSet.count(cell) != 0) {
                wattron(win, COLOR_PAIR(FlagPair));
                mvwaddch(win, r, x, 'F');
                wattroff(win, COLOR_PAIR(FlagPair));
            } else if (detonated && mine) {
                // Show the rest of the field once the game is lost.
                mvwaddch(win, r, x, '*');
            } else if (knownSafes.count(cell) != 0) {
                wattron(win, COLOR_PAIR(SafePair));
                mvwaddch(win, r, x, '+');
                wattroff(win, COLOR_PAIR(SafePair));
            } else {
                mvwaddch(win, r, x, '#');
            }
        }
    }
    wrefresh(win);
}

/** @copydoc Board::drawStatusLine */
void Board::drawStatusLine(WINDOW* win) const {
    if (!win) return;
    int rows, cols; getmaxyx(win, rows, cols);
    wmove(win, rows - 1, 0);
    wclrtoeol(win);
    std::string status = "[n]ext [s]tart/[p]ause [r]estart speed[-/+] [q]uit | open ";
    status += std::to_string(revealedSet.size());
    status += "/";
    status += std::to_string(h * w - mineCount());
    status += " flags ";
    status += std::to_string(flaggedSet.size());
    status += "/";
    status += std::to_string(mineCount());
    status += lost() ? " | LOST" : (won() ? " | WON" : " | PLAYING");
    if (!statusNote.empty()) { status += " | "; status += statusNote; }
    if (static_cast<int>(status.size()) > cols) status.resize(static_cast<size_t>(cols > 0 ? cols : 0));
    mvwprintw(win, rows - 1, 0, "%s", status.c_str());
    wrefresh(win);
}

int Board::colorPairForCount(int n) const {
    if (n <= 1) return 1;  // blue
    if (n >= 8) return 8;  // white
    return n;              // 2 green .. 7 cyan
}

/**
 * @file Config.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Config.h"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>

namespace {
bool parseInt(const char* s, long& out) {
    if (!s || !*s) return false;
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(s, &end, 10);
    if (end == s || *end != '\0' || errno != 0) return false;
    out = v;
    return true;
}

void setInt(const char* s, int& field) {
    long v;
    if (parseInt(s, v) && v >= INT_MIN && v <= INT_MAX) field = static_cast<int>(v);
}

void setSeed(const char* s, unsigned& field) {
    long v;
    if (parseInt(s, v) && v >= 0 && static_cast<unsigned long>(v) <= UINT_MAX) field = static_cast<unsigned>(v);
}

void setLevel(const char* s, Logger::Level& field) {
    Logger::Level lvl;
    if (s && Logger::parseLevel(s, lvl)) field = lvl;
}
}

void GameConfig::applyEnv() {
    setInt(std::getenv("SWEEPER_HEIGHT"), height);
    setInt(std::getenv("SWEEPER_WIDTH"), width);
    setInt(std::getenv("SWEEPER_MINES"), mines);
    setSeed(std::getenv("SWEEPER_SEED"), seed);
    setInt(std::getenv("SWEEPER_GAMES"), games);
    setLevel(std::getenv("LOG_LEVEL"), logLevel);
}

void GameConfig::applyArgs(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        auto read_next = [&](int& idx) -> const char* {
            if (idx + 1 < argc) return argv[++idx];
            return nullptr;
        };
        auto inline_value = [&](const char* prefix) -> const char* {
            return a.c_str() + std::strlen(prefix);
        };
        if (a == "-H" || a == "--height") {
            setInt(read_next(i), height);
        } else if (a.rfind("--height=", 0) == 0) {
            setInt(inline_value("--height="), height);
        } else if (a == "-W" || a == "--width") {
            setInt(read_next(i), width);
        } else if (a.rfind("--width=", 0) == 0) {
            setInt(inline_value("--width="), width);
        } else if (a == "-m" || a == "--mines") {
            setInt(read_next(i), mines);
        } else if (a.rfind("--mines=", 0) == 0) {
            setInt(inline_value("--mines="), mines);
        } else if (a == "-s" || a == "--seed") {
            setSeed(read_next(i), seed);
        } else if (a.rfind("--seed=", 0) == 0) {
            setSeed(inline_value("--seed="), seed);
        } else if (a == "-n" || a == "--games") {
            setInt(read_next(i), games);
        } else if (a.rfind("--games=", 0) == 0) {
            setInt(inline_value("--games="), games);
        } else if (a == "-d" || a == "--delay") {
            setInt(read_next(i), stepDelayMs);
        } else if (a.rfind("--delay=", 0) == 0) {
            setInt(inline_value("--delay="), stepDelayMs);
        } else if (a == "-l" || a == "--log-level") {
            setLevel(read_next(i), logLevel);
        } else if (a.rfind("--log-level=", 0) == 0) {
            setLevel(inline_value("--log-level="), logLevel);
        } else {
            Logger::warn("ignoring unknown argument: " + a);
        }
    }
}

void GameConfig::validate() {
    if (height < 1 || height > MaxDimension) height = DefaultHeight;
    if (width < 1 || width > MaxDimension) width = DefaultWidth;
    if (mines < 0) mines = DefaultMines;
    // At least one safe cell to start on.
    if (mines > height * width - 1) mines = height * width - 1;
    if (games < 1) games = DefaultGames;
    if (stepDelayMs < 5) stepDelayMs = 5;
    if (stepDelayMs > 2000) stepDelayMs = 2000;
}

GameConfig GameConfig::load(int argc, char** argv) {
    GameConfig cfg;
    cfg.applyEnv();
    cfg.applyArgs(argc, argv);
    cfg.validate();
    return cfg;
}

std::string GameConfig::describe() const {
    return std::to_string(height) + "x" + std::to_string(width) + " mines=" + std::to_string(mines) +
           " seed=" + std::to_string(seed) + " games=" + std::to_string(games) +
           " delay(ms)=" + std::to_string(stepDelayMs) + " log=" + Logger::levelName(logLevel);
}

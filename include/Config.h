/**
 * @file Config.h
 * @brief Declares GameConfig: board size, mine count, seeds and pacing, from environment and arguments.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <string>

#include "Logger.h"

/**
 * @struct GameConfig
 * @brief Run settings shared by the terminal UI and the benchmark.
 *
 * Sources, lowest precedence first: defaults, SWEEPER_* / LOG_LEVEL environment, command-line.
 * Invalid values fall back to the default rather than failing the run.
 */
struct GameConfig {
    static constexpr int DefaultHeight = 8;
    static constexpr int DefaultWidth = 8;
    static constexpr int DefaultMines = 8;
    static constexpr int DefaultGames = 100;
    static constexpr int DefaultStepDelayMs = 150;
    static constexpr int MaxDimension = 100;

    int height{DefaultHeight};         /**< board rows, [1,100] */
    int width{DefaultWidth};           /**< board columns, [1,100] */
    int mines{DefaultMines};           /**< mines placed, < height*width */
    unsigned seed{0};                  /**< 0 = seed from std::random_device */
    int games{DefaultGames};           /**< benchmark game count */
    int stepDelayMs{DefaultStepDelayMs}; /**< autoplay cadence, [5,2000] */
    Logger::Level logLevel{Logger::Level::Info};

    /** @brief Apply SWEEPER_HEIGHT, SWEEPER_WIDTH, SWEEPER_MINES, SWEEPER_SEED, SWEEPER_GAMES and LOG_LEVEL. */
    void applyEnv();
    /**
     * @brief Apply -H/--height, -W/--width, -m/--mines, -s/--seed, -n/--games, -d/--delay, -l/--log-level.
     *
     * Each long option also accepts --name=value. Unknown arguments are logged and skipped.
     */
    void applyArgs(int argc, char** argv);
    /** @brief Replace out-of-range values with defaults and clamp mines below the cell count. */
    void validate();

    /** @brief Defaults, then environment, then @p argv, then validate(). */
    static GameConfig load(int argc, char** argv);

    /** @brief One-line summary for logs and status lines. */
    std::string describe() const;
};

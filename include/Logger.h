/**
 * @file Logger.h
 * @brief Minimal process-wide file logger writing to ./<command>.log
 *
 * Every call is a no-op until init() or initFromArgv0() opens the file, so library code and tests
 * can log unconditionally.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <exception>
#include <string>

class Logger {
public:
    enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, None = 4 };

    // Initialize using argv[0] to derive <command>.log path.
    static void initFromArgv0(const char* argv0);
    // Initialize explicitly with a filename (relative or absolute).
    static void init(const std::string& filename);
    // Flush and close the log file; safe to call multiple times.
    static void shutdown();

    static void info(const std::string& msg);
    static void warn(const std::string& msg);
    static void error(const std::string& msg);
    static void debug(const std::string& msg);

    // Convenience helpers for exception logging
    static void logException(const std::string& where, const std::exception& e);
    static void logUnknownException(const std::string& where);

    // Control log level (default: Info). init() also honors LOG_LEVEL env.
    static void setLevel(Level lvl);
    static Level level();

    // Parse "debug", "info", "warn"/"warning", "error", "none"/"off" (case-insensitive).
    static bool parseLevel(const std::string& text, Level& out);
    static const char* levelName(Level lvl);

private:
    static void logImpl(Level lvl, const std::string& msg);
};

/**
 * @file Logger.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Logger.h"

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace {
std::mutex g_logMtx;
std::ofstream g_log;
bool g_inited = false;
std::atomic<int> g_level{static_cast<int>(Logger::Level::Info)};

static std::string basenameFromPath(const std::string& p) {
    if (p.empty()) return std::string("sweeper");
    size_t pos = p.find_last_of("/\\");
    if (pos == std::string::npos) return p;
    if (pos + 1 >= p.size()) return std::string("sweeper");
    return p.substr(pos + 1);
}

static std::string nowTs() {
    using namespace std::chrono;
    auto tp = system_clock::now();
    auto t = system_clock::to_time_t(tp);
    auto ms = duration_cast<milliseconds>(tp.time_since_epoch()) % 1000;
    std::tm tmv;
#if defined(_WIN32)
    localtime_s(&tmv, &t);
#else
    localtime_r(&t, &tmv);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tmv, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << ms.count();
    return oss.str();
}

static void setLevelFromEnv() {
    const char* s = std::getenv("LOG_LEVEL");
    if (!s) return;
    Logger::Level lvl;
    if (Logger::parseLevel(s, lvl)) g_level.store(static_cast<int>(lvl));
}
}

void Logger::initFromArgv0(const char* argv0) {
    std::string base = basenameFromPath(argv0 ? std::string(argv0) : std::string("sweeper"));
    init(std::string("./") + base + ".log");
}

void Logger::init(const std::string& filename) {
    std::lock_guard<std::mutex> lock(g_logMtx);
    if (g_inited) return;
    // Append to preserve prior runs; each run starts with a session header.
    g_log.open(filename, std::ios::out | std::ios::app);
    if (g_log.is_open()) {
        g_inited = true;
        setLevelFromEnv();
        g_log << "===== session start " << nowTs() << " level=" << levelName(level()) << " =====" << '\n';
        g_log.flush();
    }
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(g_logMtx);
    if (!g_inited) return;
    g_log << "===== session end   " << nowTs() << " =====" << std::endl;
    g_log.close();
    g_inited = false;
}

void Logger::logImpl(Level lvl, const std::string& msg) {
    if (static_cast<int>(lvl) < g_level.load()) return;
    std::lock_guard<std::mutex> lock(g_logMtx);
    if (!g_inited || !g_log.is_open()) return;
    g_log << nowTs() << " [" << levelName(lvl) << "] " << msg << '\n';
    if (lvl >= Level::Warn) g_log.flush();
}

void Logger::info(const std::string& msg) { logImpl(Level::Info, msg); }
void Logger::warn(const std::string& msg) { logImpl(Level::Warn, msg); }
void Logger::error(const std::string& msg) { logImpl(Level::Error, msg); }
void Logger::debug(const std::string& msg) { logImpl(Level::Debug, msg); }

void Logger::logException(const std::string& where, const std::exception& e) {
    logImpl(Level::Error, where + ": " + e.what());
}

void Logger::logUnknownException(const std::string& where) {
    logImpl(Level::Error, where + ": unknown exception");
}

void Logger::setLevel(Level lvl) { g_level.store(static_cast<int>(lvl)); }
Logger::Level Logger::level() { return static_cast<Level>(g_level.load()); }

bool Logger::parseLevel(const std::string& text, Level& out) {
    std::string v(text);
    for (auto& c : v) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (v == "debug") out = Level::Debug;
    else if (v == "info") out = Level::Info;
    else if (v == "warn" || v == "warning") out = Level::Warn;
    else if (v == "error") out = Level::Error;
    else if (v == "none" || v == "off") out = Level::None;
    else return false;
    return true;
}

const char* Logger::levelName(Level lvl) {
    switch (lvl) {
        case Level::Debug: return "DEBUG";
        case Level::Info: return "INFO";
        case Level::Warn: return "WARN";
        case Level::Error: return "ERROR";
        case Level::None: return "NONE";
    }
    return "NONE";
}

#include "debug_log.hpp"
#include <atomic>
#include <fstream>
#include <mutex>

namespace pcoll {
namespace debuglog {

namespace {

// Debug logging to file, guarded by one mutex
std::ofstream debug_log;
std::mutex debug_mutex;
std::once_flag debug_initialized;

// Lowest level that gets written; -1 while the log is closed
std::atomic<int> threshold{-1};

void open(const Config& config) {
    std::lock_guard<std::mutex> lock(debug_mutex);
    if (debug_log.is_open()) {
        debug_log.close();
    }
    threshold.store(-1, std::memory_order_release);

    if (config.logFile.empty()) {
        return;
    }

    debug_log.open(config.logFile, std::ios::out | std::ios::app);
    if (!debug_log.is_open()) {
        return;
    }
    debug_log << "=== pcoll debug log (level " << logLevelName(config.logLevel) << ") ===" << std::endl;
    threshold.store(static_cast<int>(config.logLevel), std::memory_order_release);
}

void init_debug_log() {
    std::call_once(debug_initialized, [] { open(Config::current()); });
}

}  // namespace

bool enabled(LogLevel level) {
    init_debug_log();
    int current = threshold.load(std::memory_order_acquire);
    return current >= 0 && static_cast<int>(level) >= current;
}

void write(LogLevel level, const char* component, const std::string& message) {
    std::lock_guard<std::mutex> lock(debug_mutex);
    if (!debug_log.is_open()) return;
    debug_log << "[" << logLevelName(level) << "] [" << component << "] " << message << std::endl;
}

void reconfigure(const Config& config) {
    // Make sure the lazy first-use initialization cannot overwrite this later
    std::call_once(debug_initialized, [] {});
    open(config);
}

}  // namespace debuglog
}  // namespace pcoll

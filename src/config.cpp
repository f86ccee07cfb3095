#include "config.hpp"
#include "debug_log.hpp"
#include <atomic>
#include <cstdlib>
#include <mutex>
#include <stdexcept>

namespace pcoll {

namespace {

std::mutex config_mutex;
bool config_loaded = false;
Config active_config;

// Mirror of active_config.countLimit for lock-free readers
std::atomic<size_t> active_count_limit{0};
std::atomic<bool> count_limit_published{false};

// Caller holds config_mutex
void publishCountLimit(size_t limit) {
    active_count_limit.store(limit, std::memory_order_relaxed);
    count_limit_published.store(true, std::memory_order_release);
}

}  // namespace

LogLevel parseLogLevel(const std::string& text) {
    if (text == "trace") return LogLevel::TRACE;
    if (text == "debug") return LogLevel::DEBUG;
    if (text == "info") return LogLevel::INFO;
    if (text == "warn") return LogLevel::WARN;
    throw std::invalid_argument("Unknown log level: " + text);
}

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "trace";
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO: return "info";
        case LogLevel::WARN: return "warn";
    }
    return "info";
}

Config Config::fromEnvironment() {
    Config config;

    if (const char* path = std::getenv("PCOLL_LOG_FILE")) {
        config.logFile = path;
    }

    if (const char* level = std::getenv("PCOLL_LOG_LEVEL")) {
        config.logLevel = parseLogLevel(level);
    }

    if (const char* limit = std::getenv("PCOLL_COUNT_LIMIT")) {
        try {
            config.countLimit = static_cast<size_t>(std::stoull(limit));
        } catch (const std::logic_error&) {
            throw std::invalid_argument(std::string("PCOLL_COUNT_LIMIT is not a number: ") + limit);
        }
    }

    return config;
}

Config Config::current() {
    std::lock_guard<std::mutex> lock(config_mutex);
    if (!config_loaded) {
        active_config = fromEnvironment();
        config_loaded = true;
        publishCountLimit(active_config.countLimit);
    }
    return active_config;
}

size_t Config::activeCountLimit() {
    if (!count_limit_published.load(std::memory_order_acquire)) {
        current();
    }
    return active_count_limit.load(std::memory_order_relaxed);
}

void Config::install(const Config& config) {
    {
        std::lock_guard<std::mutex> lock(config_mutex);
        active_config = config;
        config_loaded = true;
        publishCountLimit(config.countLimit);
    }
    debuglog::reconfigure(config);
}

}  // namespace pcoll

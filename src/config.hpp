#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace pcoll {

// Constants for the 32-way trie shared by the vector and the hash map
constexpr uint32_t BITS = 5;
constexpr uint32_t NODE_SIZE = 1 << BITS;  // 32
constexpr uint32_t MASK = NODE_SIZE - 1;   // 0x1F

// Array maps above this many entries are promoted to hash maps
constexpr size_t ARRAY_MAP_THRESHOLD = 8;

enum class LogLevel { TRACE = 0, DEBUG = 1, INFO = 2, WARN = 3 };

/**
 * Config - Process-wide runtime settings
 *
 * Resolved once from the environment the first time it is needed:
 *   PCOLL_LOG_FILE     path of the debug trace (unset = logging disabled)
 *   PCOLL_LOG_LEVEL    trace | debug | info | warn (default info)
 *   PCOLL_COUNT_LIMIT  max elements count() walks in a lazy sequence
 *                      before giving up (0 = unbounded)
 *
 * Tests may install a replacement with Config::install().
 */
struct Config {
    std::string logFile;
    LogLevel logLevel = LogLevel::INFO;
    size_t countLimit = 0;

    static Config fromEnvironment();

    // Snapshot of the active configuration
    static Config current();

    // countLimit of the active configuration, read without locking
    static size_t activeCountLimit();

    // Replace the active configuration (also reconfigures the debug log)
    static void install(const Config& config);
};

LogLevel parseLogLevel(const std::string& text);
const char* logLevelName(LogLevel level);

}  // namespace pcoll

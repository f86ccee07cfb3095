#pragma once

#include <sstream>
#include <string>
#include "config.hpp"

namespace pcoll {
namespace debuglog {

// Debug trace to a file, one line per message:
//   [level] [component] message
// Disabled unless Config::logFile is set.
bool enabled(LogLevel level);
void write(LogLevel level, const char* component, const std::string& message);
void reconfigure(const Config& config);

}  // namespace debuglog
}  // namespace pcoll

#define PCOLL_LOG(level, component, expr)                                   \
    do {                                                                    \
        if (::pcoll::debuglog::enabled(level)) {                            \
            std::ostringstream pcoll_log_stream_;                           \
            pcoll_log_stream_ << expr;                                      \
            ::pcoll::debuglog::write(level, component, pcoll_log_stream_.str()); \
        }                                                                   \
    } while (0)

#define PCOLL_TRACE(component, expr) PCOLL_LOG(::pcoll::LogLevel::TRACE, component, expr)
#define PCOLL_DEBUG(component, expr) PCOLL_LOG(::pcoll::LogLevel::DEBUG, component, expr)
#define PCOLL_INFO(component, expr) PCOLL_LOG(::pcoll::LogLevel::INFO, component, expr)
#define PCOLL_WARN(component, expr) PCOLL_LOG(::pcoll::LogLevel::WARN, component, expr)

/**
 * @file logger.cpp
 * @brief Logger level-name helpers.
 *
 * @copyright Copyright (c) 2024 UBNT Discovery Contributors
 * @license MIT License
 */

#include "ubnt/utils/logger.hpp"

#include <algorithm>
#include <cctype>

namespace ubnt {
namespace utils {

LogLevel parseLogLevel(const std::string& name) {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "TRACE") return LogLevel::TRACE;
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "FATAL") return LogLevel::FATAL;
    if (upper == "OFF") return LogLevel::OFF;
    return LogLevel::INFO;
}

std::string Logger::levelName(LogLevel level) {
    std::string name(logLevelToString(level));
    while (!name.empty() && name.back() == ' ') {
        name.pop_back();
    }
    return name;
}

}  // namespace utils
}  // namespace ubnt

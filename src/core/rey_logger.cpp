#include "rey/core/rey_logger.h"

#include <algorithm>
#include <cctype>

namespace rey {

bool parse_log_level(const std::string& name, LogLevel& out) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") {
        out = LogLevel::Trace;
    } else if (lower == "debug") {
        out = LogLevel::Debug;
    } else if (lower == "info") {
        out = LogLevel::Info;
    } else if (lower == "warn" || lower == "warning") {
        out = LogLevel::Warning;
    } else if (lower == "error") {
        out = LogLevel::Error;
    } else if (lower == "fatal") {
        out = LogLevel::Fatal;
    } else {
        return false;
    }
    return true;
}

}  // namespace rey

/**
 * @file clock.cpp
 * @brief ISO-8601 timestamps
 */

#include "opentreasury/common.hpp"

#include <format>

namespace opentreasury::common {

std::string format_iso8601(std::chrono::system_clock::time_point when)
{
    // %S on a millisecond time point prints "SS.mmm".
    return std::format("{:%Y-%m-%dT%H:%M:%S}Z", std::chrono::floor<std::chrono::milliseconds>(when));
}

std::string current_time_iso8601()
{
    return format_iso8601(std::chrono::system_clock::now());
}

}  // namespace opentreasury::common

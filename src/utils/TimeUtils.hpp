#pragma once

#include <chrono>
#include <string>

namespace checkend::utils
{

/// UTC instant as ISO-8601 with millisecond precision, e.g. "2024-05-01T12:30:45.123Z".
std::string formatIso8601(std::chrono::system_clock::time_point tp);

} // namespace checkend::utils

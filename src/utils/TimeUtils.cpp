#include "TimeUtils.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace checkend::utils
{

std::string formatIso8601(std::chrono::system_clock::time_point tp)
{
    const auto ms_since_epoch = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch());
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(ms_since_epoch);
    auto millis = (ms_since_epoch - secs).count();
    if (millis < 0)
    {
        millis += 1000;
        secs -= std::chrono::seconds(1);
    }
    const std::time_t tt = static_cast<std::time_t>(secs.count());

    std::tm tm_buf{};
#ifdef _WIN32
    gmtime_s(&tm_buf, &tt);
#else
    gmtime_r(&tt, &tm_buf);
#endif

    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return ss.str();
}

} // namespace checkend::utils

#include "infrastructure/TimeUtils.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace scoreshelf::infrastructure {

std::string TimeUtils::FormatIsoUtc(std::chrono::system_clock::time_point tp) {
    const auto seconds = std::chrono::system_clock::to_time_t(tp);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count() % 1000;

    std::tm utc{};
    gmtime_r(&seconds, &utc); // handlers run concurrently; std::gmtime is not reentrant

    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setw(3) << std::setfill('0') << (millis < 0 ? millis + 1000 : millis) << 'Z';
    return ss.str();
}

std::string TimeUtils::NowIsoUtc() {
    return FormatIsoUtc(std::chrono::system_clock::now());
}

} // namespace scoreshelf::infrastructure

// TimeUtils Header
#pragma once
#include <chrono>
#include <string>

namespace scoreshelf::infrastructure {

class TimeUtils {
public:
    /** @brief "YYYY-MM-DDTHH:MM:SS.mmmZ" for the given instant. */
    static std::string FormatIsoUtc(std::chrono::system_clock::time_point tp);
    static std::string NowIsoUtc();
};

} // namespace scoreshelf::infrastructure

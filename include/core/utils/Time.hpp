//
// Created by redeg on 03/05/2025.
//

#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace utils {

    inline std::string formatLocalTime(std::chrono::system_clock::time_point tp, const char *pattern) {
        auto in_time_t = std::chrono::system_clock::to_time_t(tp);
        std::tm local{};
        localtime_r(&in_time_t, &local);

        std::ostringstream ss;
        ss << std::put_time(&local, pattern);
        return ss.str();
    }

    /**
     * @brief Local time as 2025-05-03T14:07:09.123456, the format stored in the job database
     */
    inline std::string isoTimestamp(std::chrono::system_clock::time_point tp = std::chrono::system_clock::now()) {
        auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count() % 1000000;
        std::ostringstream ss;
        ss << formatLocalTime(tp, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(6) << std::setfill('0') << micros;
        return ss.str();
    }

    /**
     * @brief Local time as 2025-05-03 14:07:09, the format shown to operators
     */
    inline std::string displayTimestamp(std::chrono::system_clock::time_point tp = std::chrono::system_clock::now()) {
        return formatLocalTime(tp, "%Y-%m-%d %H:%M:%S");
    }

}

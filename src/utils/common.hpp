#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace snipguard::utils {

inline std::string Join(const std::vector<std::string>& items, const std::string& delimiter) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            oss << delimiter;
        }
        oss << items[i];
    }
    return oss.str();
}

inline std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

// Seconds since the epoch with sub-second precision, as progress lines carry it.
inline double EpochSeconds(std::chrono::system_clock::time_point point) {
    return std::chrono::duration<double>(point.time_since_epoch()).count();
}

// Local time as YYYY-MM-DDTHH:MM:SS.ffffff.
inline std::string IsoTimestamp(std::chrono::system_clock::time_point point) {
    const auto seconds = std::chrono::system_clock::to_time_t(point);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        point.time_since_epoch()).count() % 1000000;
    std::tm local{};
    localtime_r(&seconds, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%dT%H:%M:%S")
        << "." << std::setw(6) << std::setfill('0') << micros;
    return oss.str();
}

inline std::int64_t ElapsedMs(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
}

}  // namespace snipguard::utils

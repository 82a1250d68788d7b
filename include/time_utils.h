#pragma once
#ifndef TIME_UTILS_H
#define TIME_UTILS_H

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

/**
 * Cross platform safe localtime wrapper.
 * windows -> localtime_s
 * Linux/Unix -> localtime_r
 */
inline std::tm safe_localtime(std::time_t time){
    std::tm tm_buf{};
#if defined(_WIN32) || defined(_WIN64)
    localtime_s(&tm_buf, &time);
#else
    localtime_r(&time, &tm_buf);
#endif
    return tm_buf;
}

/**
 * Wall clock timestamp used as the log line prefix, e.g. "2024-05-01 12:00:00.042".
 */
inline std::string format_log_timestamp(std::chrono::system_clock::time_point tp){
    auto secs = std::chrono::system_clock::to_time_t(tp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count() % 1000;
    std::tm tm_buf = safe_localtime(secs);

    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%F %T") << '.'
       << std::setw(3) << std::setfill('0') << millis;
    return ss.str();
}

#endif // TIME_UTILS_H

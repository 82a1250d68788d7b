#include "logger.h"
#include "cache_error.h"
#include "time_utils.h"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <iostream>
#include <mutex>
#include <sstream>

namespace {
std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
std::mutex g_write_mutex; // keeps lines from interleaving across threads
}

void set_log_level(LogLevel level){
    g_level.store(static_cast<int>(level));
}

LogLevel log_level(){
    return static_cast<LogLevel>(g_level.load());
}

LogLevel parse_log_level(const std::string& name){
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    if(lower == "debug") return LogLevel::Debug;
    if(lower == "info") return LogLevel::Info;
    if(lower == "warn" || lower == "warning") return LogLevel::Warn;
    if(lower == "error") return LogLevel::Error;
    throw CacheConfigError("unknown log level '" + name + "'");
}

const char* log_level_name(LogLevel level){
    switch(level){
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

void log_line(LogLevel level, const std::string& component, const std::string& message){
    if(static_cast<int>(level) < g_level.load()){
        return;
    }

    std::ostringstream line;
    line << "[" << format_log_timestamp(std::chrono::system_clock::now()) << "] "
         << log_level_name(level) << " " << component << ": " << message << '\n';

    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::cerr << line.str() << std::flush;
}

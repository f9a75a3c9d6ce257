// include/debug_utils.h
#pragma once

#include <string>
#include <sstream>
#include <iomanip>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iostream>
#include <mutex>
#include <thread>
#include <utility>

// Helper to safely print potentially non-printable key data
inline std::string format_key_for_print(const std::string& key) {
    std::ostringstream oss;
    for (unsigned char c : key) {
        if (std::isprint(c)) {
            oss << c;
        } else {
            oss << "\\x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return oss.str();
}

// --- Logging Macros ---

inline std::mutex& log_output_mutex() {
    static std::mutex m;
    return m;
}

// "2026-10-17 09:30:12.345Z" in UTC.
inline std::string log_timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm_val{};
    gmtime_r(&seconds, &tm_val);
    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

// Writes all args as one line, prefixed with time, level and thread id.
template<typename... Args>
void print_log_line(std::ostream& os, const char* level, Args&&... args) {
    std::ostringstream line;
    line << log_timestamp() << ' ' << level << "[tid " << std::this_thread::get_id() << "] ";
    (line << ... << std::forward<Args>(args));
    line << '\n';
    std::lock_guard<std::mutex> lock(log_output_mutex());
    os << line.str();
    os.flush();
}

// Define MAPSTORE_TRACE_LOG to compile in per-operation trace output.
#ifdef MAPSTORE_TRACE_LOG
    #define LOG_TRACE(...) do { print_log_line(std::cout, "[TRACE] ", __VA_ARGS__); } while(0)
#else
    #define LOG_TRACE(...) do { } while(0)
#endif

#define LOG_INFO(...) do { print_log_line(std::cout, "[INFO] ", __VA_ARGS__); } while(0)
#define LOG_WARN(...) do { print_log_line(std::cerr, "[WARN] ", __VA_ARGS__); } while(0)
#define LOG_ERROR(...) do { print_log_line(std::cerr, "[ERROR] ", __VA_ARGS__); } while(0)

#pragma once
#include <cstdint>
#include <iostream>
#include <mutex>
#include <string>

// One line per call, "[Tag] message". Several threads log at once
// (feed, timer, render), so lines are serialized on one mutex.
inline std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

inline void log_info(const char* tag, const std::string& msg) {
    std::lock_guard<std::mutex> lk(log_mutex());
    std::cout << "[" << tag << "] " << msg << "\n";
}

inline void log_warn(const char* tag, const std::string& msg) {
    std::lock_guard<std::mutex> lk(log_mutex());
    std::cerr << "[" << tag << "] WARN " << msg << "\n";
}

inline void log_error(const char* tag, const std::string& msg) {
    std::lock_guard<std::mutex> lk(log_mutex());
    std::cerr << "[" << tag << "] ERROR " << msg << std::endl;
}

// Per-event warnings: first few occurrences, then every 1000th.
inline bool should_log_occurrence(std::uint64_t n) {
    return n <= 5 || n % 1000 == 0;
}

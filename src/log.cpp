#include "log.hpp"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>

static LogLevel g_level = LogLevel::Info;
static std::ofstream g_file;
static std::mutex g_mu;

static const char* level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
    }
    return "?";
}

void log_set_level(LogLevel level) { g_level = level; }

LogLevel log_level() { return g_level; }

bool log_open_file(const std::string& path) {
    std::lock_guard<std::mutex> lk(g_mu);
    g_file.open(path, std::ios::app);
    return static_cast<bool>(g_file);
}

void log_write(LogLevel level, const std::string& line) {
    std::lock_guard<std::mutex> lk(g_mu);

    std::time_t tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf{};
    localtime_r(&tt, &tm_buf);

    std::ostream& out = (level >= LogLevel::Warn) ? std::cerr : std::cout;
    out << std::put_time(&tm_buf, "%F %T") << " | " << level_name(level) << " | " << line << std::endl;

    if (g_file.is_open()) {
        g_file << std::put_time(&tm_buf, "%F %T") << " | " << level_name(level) << " | " << line << "\n";
        g_file.flush();
    }
}

#pragma once

#include <sstream>
#include <string>

enum class LogLevel { Debug = 0, Info, Warn, Error };

/// Minimum level written (default Info)
void log_set_level(LogLevel level);
LogLevel log_level();

/// Mirror every line to `path` (append). Returns false if it cannot be opened.
bool log_open_file(const std::string& path);

/// Timestamp + level + line; Debug/Info to stdout, Warn/Error to stderr
void log_write(LogLevel level, const std::string& line);

#define RFID_LOG(level, expr)                                   \
    do {                                                        \
        if ((level) >= log_level()) {                           \
            std::ostringstream rfid_log_oss_;                   \
            rfid_log_oss_ << expr;                              \
            log_write((level), rfid_log_oss_.str());            \
        }                                                       \
    } while (0)

#define RFID_LOG_DEBUG(expr)  RFID_LOG(LogLevel::Debug, expr)
#define RFID_LOG_INFO(expr)   RFID_LOG(LogLevel::Info, expr)
#define RFID_LOG_WARN(expr)   RFID_LOG(LogLevel::Warn, expr)
#define RFID_LOG_ERROR(expr)  RFID_LOG(LogLevel::Error, expr)

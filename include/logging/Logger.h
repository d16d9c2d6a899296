//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.h
// Purpose: Process-wide logger with level filtering, optional log file and {}-style format strings.
//==========================================================================================================
#pragma once

#include <fstream>
#include <mutex>
#include <string>

#include <fmt/format.h>

enum class LogLevel {
    LOG_DEBUG_LEVEL,
    LOG_INFO_LEVEL,
    LOG_WARN_LEVEL,
    LOG_ERROR_LEVEL,
    LOG_FATAL_LEVEL
};

//==========================================================================================================
// Logger
// Purpose: Static sink used through the LOG_* macros.
// Notes:
//   - Console output goes to stdout unless MCP_STDIO_MODE is truthy, in which case it goes to stderr
//     so the stdio transport owns stdout.
//   - MCP_LOG_COLOR=0 disables the ANSI label colours.
//   - The initial threshold comes from MCP_LOG_LEVEL; configuration may override it later.
//==========================================================================================================
class Logger {
public:
    enum class Level { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3, FATAL = 4 };

    // Case-insensitive; "warning" is accepted for WARN and anything unknown maps to INFO.
    static Level levelFromString(const std::string& lvl);

    static void setLogLevel(LogLevel level) { sLogLevel = level; }
    static void setLogLevel(Level level) { sLogLevel = static_cast<LogLevel>(static_cast<int>(level)); }
    static void setLogLevelFromString(const std::string& lvl) { setLogLevel(levelFromString(lvl)); }

    // Appends to filePath; failure to open is reported on stderr and leaves file output off.
    static void setLogFile(const std::string& filePath);

    static void log(const char* level, const std::string& msg, const char* file, unsigned int line);

    template <typename... Args>
    static void logf(const char* level, const char* format, const char* file, unsigned int line, Args&&... args) {
        try {
            log(level, fmt::vformat(format, fmt::make_format_args(args...)), file, line);
        } catch (const fmt::format_error& e) {
            log(level, fmt::format("Format error: {}", e.what()), file, line);
        }
    }

    // Re-reads MCP_STDIO_MODE; called after the stdio transport is selected.
    static void refreshConsoleTarget();

    static LogLevel sLogLevel;

private:
    static bool sUseStderr;
    static std::ofstream sLogFile;
    static std::mutex sLogMutex;
};

#define LOG_DEBUG(fmt, ...) if (Logger::sLogLevel <= LogLevel::LOG_DEBUG_LEVEL) Logger::logf("DEBUG", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...)  if (Logger::sLogLevel <= LogLevel::LOG_INFO_LEVEL)  Logger::logf("INFO", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)  if (Logger::sLogLevel <= LogLevel::LOG_WARN_LEVEL)  Logger::logf("WARN", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) if (Logger::sLogLevel <= LogLevel::LOG_ERROR_LEVEL) Logger::logf("ERROR", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_FATAL(fmt, ...) Logger::logf("FATAL", fmt, __FILE__, __LINE__, ##__VA_ARGS__)

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Logger sinks and static state; the initial level honours MCP_LOG_LEVEL.
//==========================================================================================================

#include "logging/Logger.h"

#include <cctype>
#include <cerrno>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "env/EnvVars.h"

namespace {

bool stdioModeEnabled() {
    return IsTruthyEnvValue(GetEnvOrDefault("MCP_STDIO_MODE", "0"));
}

const char* labelColor(const char* level) {
    if (std::strncmp(level, "ERROR", 5) == 0 || std::strncmp(level, "FATAL", 5) == 0) return "\033[38;5;88m";
    if (std::strncmp(level, "WARN", 4) == 0) return "\033[33m";
    return "\033[35m";
}

} // namespace

LogLevel Logger::sLogLevel = static_cast<LogLevel>(
    static_cast<int>(Logger::levelFromString(GetEnvOrDefault("MCP_LOG_LEVEL", "INFO"))));
bool Logger::sUseStderr = stdioModeEnabled();
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;

Logger::Level Logger::levelFromString(const std::string& lvl) {
    std::string s;
    s.reserve(lvl.size());
    for (char c : lvl) s.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    if (s == "DEBUG") return Level::DEBUG;
    if (s == "WARN" || s == "WARNING") return Level::WARN;
    if (s == "ERROR") return Level::ERROR;
    if (s == "FATAL") return Level::FATAL;
    return Level::INFO;
}

void Logger::setLogFile(const std::string& filePath) {
    std::lock_guard<std::mutex> lock(sLogMutex);
    if (sLogFile.is_open()) sLogFile.close();
    sLogFile.open(filePath, std::ios::out | std::ios::app);
    if (!sLogFile.is_open()) {
        std::cerr << "[ERROR] cannot open log file " << filePath << " (errno=" << errno << ")" << std::endl;
        return;
    }
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    ::localtime_r(&now, &local);
    sLogFile << "\n=== toolhost log opened " << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << " ===\n";
    sLogFile.flush();
}

void Logger::log(const char* level, const std::string& msg, const char* file, unsigned int line) {
    static const bool colorEnabled = IsTruthyEnvValue(GetEnvOrDefault("MCP_LOG_COLOR", "1"));

    std::lock_guard<std::mutex> lock(sLogMutex);
    std::ostringstream console;
    if (colorEnabled) {
        console << '[' << labelColor(level) << level << "\033[0m] ";
    } else {
        console << '[' << level << "] ";
    }
    console << file << ':' << line << ": " << msg << '\n';

    std::ostream& out = sUseStderr ? std::cerr : std::cout;
    out << console.str() << std::flush;

    if (sLogFile.is_open()) {
        sLogFile << '[' << level << "] " << file << ':' << line << ": " << msg << '\n';
        sLogFile.flush();
    }
}

void Logger::refreshConsoleTarget() {
    std::lock_guard<std::mutex> lock(sLogMutex);
    sUseStderr = stdioModeEnabled();
}

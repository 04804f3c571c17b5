//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.h
// Purpose: Process-wide leveled logger with console/file sinks, configured from MEMGATE_LOG_* variables.
//==========================================================================================================
#pragma once

#include <mutex>
#include <iostream>
#include <sstream>
#include <fstream>
#include <string>
#include <cstring>
#include <cerrno>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <format>
#include <cstdlib>
#include <cctype>
#include "env/EnvVars.h"

// Log level enum
enum class LogLevel {
    LOG_DEBUG_LEVEL,
    LOG_INFO_LEVEL,
    LOG_WARN_LEVEL,
    LOG_ERROR_LEVEL,
    LOG_FATAL_LEVEL
};

class Logger {
public:
    // Severity level scoped to Logger
    enum class Level {
        DEBUG = 0,
        INFO  = 1,
        WARN  = 2,
        ERROR = 3,
        FATAL = 4
    };

    // Convert common level strings to Logger::Level (case-insensitive). Defaults to INFO.
    static Level levelFromString(const std::string& lvl) {
        std::string s; s.reserve(lvl.size());
        for (char c : lvl) s.push_back(static_cast<char>(::toupper(static_cast<unsigned char>(c))));
        if (s == "DEBUG") return Level::DEBUG;
        if (s == "INFO")  return Level::INFO;
        if (s == "WARN" || s == "WARNING")  return Level::WARN;
        if (s == "ERROR") return Level::ERROR;
        if (s == "FATAL") return Level::FATAL;
        return Level::INFO;
    }

    static LogLevel toLogLevel(Level level) {
        switch (level) {
            case Level::DEBUG: return LogLevel::LOG_DEBUG_LEVEL;
            case Level::INFO:  return LogLevel::LOG_INFO_LEVEL;
            case Level::WARN:  return LogLevel::LOG_WARN_LEVEL;
            case Level::ERROR: return LogLevel::LOG_ERROR_LEVEL;
            case Level::FATAL: return LogLevel::LOG_FATAL_LEVEL;
        }
        return LogLevel::LOG_INFO_LEVEL;
    }

    // Variadic logging using C++20 std::vformat with runtime format strings
    template <typename... Args>
    static void logf(const char* level, const char* fmt, const char* file, unsigned int line, Args&&... args) {
        std::string buffer;
        try {
            buffer = std::vformat(fmt, std::make_format_args(args...));
        } catch (const std::format_error& e) {
            buffer = std::format("Format error: {}", e.what());
        }
        log(level, buffer, file, line);
    }

public:
    // Configure logging
    static void setLogLevel(LogLevel level) {
        sLogLevel = level;
    }

    static void setLogLevel(const std::string& level) {
        sLogLevel = toLogLevel(levelFromString(level));
    }

    // Route console output to stderr. Required while stdout carries JSON-RPC frames.
    static void setUseStderr(bool useStderr) {
        std::lock_guard<std::mutex> lock(sLogMutex);
        sUseStderr = useStderr;
    }

    static void setUseColor(bool useColor) {
        std::lock_guard<std::mutex> lock(sLogMutex);
        sUseColor = useColor;
    }

    //==========================================================================================================
    // initFromEnvironment
    // Purpose: Applies MEMGATE_LOG_LEVEL, MEMGATE_LOG_COLOR, MEMGATE_STDIO_MODE and MEMGATE_LOG_FILE.
    //          Unset variables leave the current setting untouched.
    //==========================================================================================================
    static void initFromEnvironment() {
        const std::string lvl = GetEnvOrDefault("MEMGATE_LOG_LEVEL", "");
        if (!lvl.empty()) {
            setLogLevel(lvl);
        }
        {
            std::lock_guard<std::mutex> lock(sLogMutex);
            sUseColor = GetEnvBoolOrDefault("MEMGATE_LOG_COLOR", sUseColor);
            sUseStderr = GetEnvBoolOrDefault("MEMGATE_STDIO_MODE", sUseStderr);
        }
        const std::string file = GetEnvOrDefault("MEMGATE_LOG_FILE", "");
        if (!file.empty()) {
            setLogFile(file);
        }
    }

    static void setLogFile(const std::string& filePath) {
        std::lock_guard<std::mutex> lock(sLogMutex);
        if (sLogFile.is_open()) {
            sLogFile.close();
        }
        sLogFile.open(filePath, std::ios::out | std::ios::app);
        if (!sLogFile.is_open()) {
            std::cerr << "[ERROR] Failed to open log file: " << filePath << " (errno=" << errno << ")" << std::endl;
        } else {
            // Write a newline and timestamp as the first entry
            auto now = std::chrono::system_clock::now();
            std::time_t now_time = std::chrono::system_clock::to_time_t(now);
            std::tm buf{};
            ::localtime_r(&now_time, &buf);
            sLogFile << "\n=== Log opened at " << std::put_time(&buf, "%Y-%m-%d %H:%M:%S") << " ===\n";
            sLogFile.flush();
        }
    }

    static void log(const char* level, const std::string& msg, const char* file, unsigned int line) {
        std::lock_guard<std::mutex> lock(sLogMutex);
        std::ostringstream oss;
        const char* reset = sUseColor ? "\033[0m" : "";
        const char* labelColor = "";
        if (sUseColor) {
            labelColor = (::strncmp(level, "ERROR", 5) == 0) ? "\033[38;5;88m" /* burgundy */ : "\033[35m" /* purple */;
        }
        if (*labelColor) {
            oss << "[" << labelColor << level << reset << "] " << file << ":" << line << ": " << msg << std::endl;
        } else {
            oss << "[" << level << "] " << file << ":" << line << ": " << msg << std::endl;
        }

        std::string logMessage = oss.str();

        if (sUseStderr) {
            std::cerr << logMessage;
        } else {
            std::cout << logMessage;
        }

        // Write to file if configured
        if (sLogFile.is_open()) {
            sLogFile << logMessage;
            sLogFile.flush();
        }
    }

    static LogLevel sLogLevel;

private:
    static std::ofstream sLogFile;
    static std::mutex sLogMutex;
    static bool sUseStderr;
    static bool sUseColor;
};

// Static members declared but not defined here
// Definitions are in Logger.cpp

// Logging macros with log level filtering
#define LOG_DEBUG(fmt, ...) do { if (Logger::sLogLevel <= LogLevel::LOG_DEBUG_LEVEL) Logger::logf("DEBUG", fmt, __FILE__, __LINE__, ##__VA_ARGS__); } while(0)
#define LOG_INFO(fmt, ...)  do { if (Logger::sLogLevel <= LogLevel::LOG_INFO_LEVEL)  Logger::logf("INFO", fmt, __FILE__, __LINE__, ##__VA_ARGS__); } while(0)
#define LOG_WARN(fmt, ...)  do { if (Logger::sLogLevel <= LogLevel::LOG_WARN_LEVEL)  Logger::logf("WARN", fmt, __FILE__, __LINE__, ##__VA_ARGS__); } while(0)
#define LOG_ERROR(fmt, ...) do { if (Logger::sLogLevel <= LogLevel::LOG_ERROR_LEVEL) Logger::logf("ERROR", fmt, __FILE__, __LINE__, ##__VA_ARGS__); } while(0)
#define LOG_FATAL(fmt, ...) do { Logger::logf("FATAL", fmt, __FILE__, __LINE__, ##__VA_ARGS__); ::_Exit(EXIT_FAILURE); } while(0)

// Function entry/exit macros for logging
#ifdef _DEBUG
#define FUNC_ENTRY() LOG_DEBUG("ENTER: {}", __FUNCTION__)
#define FUNC_EXIT()  LOG_DEBUG("EXIT:  {}", __FUNCTION__)

// Scope-based entry/exit guard to avoid manual pairs and ensure correct function on exit
namespace {
struct FuncScopeGuard {
    const char* func;
    explicit FuncScopeGuard(const char* f) : func(f) { LOG_DEBUG("ENTER: {}", func); }
    ~FuncScopeGuard() { LOG_DEBUG("EXIT:  {}", func); }
};
}
#define FUNC_SCOPE() [[maybe_unused]] FuncScopeGuard funcScope(__FUNCTION__)
#else
#define FUNC_ENTRY() ((void)0)
#define FUNC_EXIT()  ((void)0)
#define FUNC_SCOPE() ((void)0)
#endif

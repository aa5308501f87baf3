/*
 * Copyright (c) 2025 Li Chaoyu
 * 
 * This file is part of Lumen.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 *
 * For commercial licensing, please contact: 2052046346@qq.com
 */
#include "lumen/logger.h"
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <vector>

namespace Lumen {

namespace {

std::tm LocalTime(std::time_t time) {
    std::tm result{};
#ifdef _WIN32
    localtime_s(&result, &time);
#else
    localtime_r(&time, &result);
#endif
    return result;
}

// 2025-01-01 12:00:00.123
std::string Timestamp() {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm local = LocalTime(std::chrono::system_clock::to_time_t(now));
    
    char buffer[32];
    size_t length = std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local);
    std::snprintf(buffer + length, sizeof(buffer) - length, ".%03d", static_cast<int>(ms));
    return buffer;
}

const char* ColorCode(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "\033[36m";
        case LogLevel::Info:    return "\033[32m";
        case LogLevel::Warning: return "\033[33m";
        case LogLevel::Error:   return "\033[31m";
    }
    return "";
}

std::string FormatArgs(const char* format, va_list args) {
    va_list sizing;
    va_copy(sizing, args);
    int size = std::vsnprintf(nullptr, 0, format, sizing);
    va_end(sizing);
    
    if (size < 0) {
        return std::string("[format error] ") + format;
    }
    
    std::vector<char> buffer(static_cast<size_t>(size) + 1);
    std::vsnprintf(buffer.data(), buffer.size(), format, args);
    return std::string(buffer.data(), static_cast<size_t>(size));
}

} // namespace

Logger& Logger::GetInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger()
    : m_logLevel(LogLevel::Info)
    , m_logToConsole(true) {
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_file.is_open()) {
        m_file.close();
    }
}

const char* Logger::LevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error:   return "ERROR";
    }
    return "UNKNOWN";
}

void Logger::SetLogToFile(bool enable, const std::string& filename) {
    std::lock_guard<std::mutex> lock(m_mutex);
    
    if (m_file.is_open()) {
        m_file.close();
    }
    if (!enable) {
        return;
    }
    
    std::filesystem::path path = filename;
    if (path.empty()) {
        std::tm local = LocalTime(std::time(nullptr));
        char name[64];
        std::strftime(name, sizeof(name), "lumen_%Y%m%d_%H%M%S.log", &local);
        path = std::filesystem::path("logs") / name;
    }
    
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }
    if (ec) {
        std::cerr << "[Logger] Cannot create " << path.parent_path().string() << ": " << ec.message() << std::endl;
        return;
    }
    
    m_file.open(path, std::ios::out | std::ios::trunc);
    if (!m_file.is_open()) {
        std::cerr << "[Logger] Cannot open " << path.string() << std::endl;
        return;
    }
    m_file << "# Lumen log, started " << Timestamp() << std::endl;
}

void Logger::SetLogCallback(LogCallback callback) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_callback = std::move(callback);
}

void Logger::Log(LogLevel level, const std::string& message) {
    if (level < m_logLevel.load()) {
        return;
    }
    Write(level, message);
}

void Logger::LogVarArgs(LogLevel level, const char* format, va_list args) {
    if (level < m_logLevel.load()) {
        return;
    }
    Write(level, FormatArgs(format, args));
}

void Logger::DebugFormat(const char* format, ...) {
    va_list args;
    va_start(args, format);
    LogVarArgs(LogLevel::Debug, format, args);
    va_end(args);
}

void Logger::InfoFormat(const char* format, ...) {
    va_list args;
    va_start(args, format);
    LogVarArgs(LogLevel::Info, format, args);
    va_end(args);
}

void Logger::WarningFormat(const char* format, ...) {
    va_list args;
    va_start(args, format);
    LogVarArgs(LogLevel::Warning, format, args);
    va_end(args);
}

void Logger::ErrorFormat(const char* format, ...) {
    va_list args;
    va_start(args, format);
    LogVarArgs(LogLevel::Error, format, args);
    va_end(args);
}

void Logger::Write(LogLevel level, const std::string& message) {
    std::string line = "[" + Timestamp() + "] [" + LevelToString(level) + "] " + message;
    
    std::lock_guard<std::mutex> lock(m_mutex);
    
    if (m_logToConsole.load()) {
        std::ostream& out = (level == LogLevel::Error) ? std::cerr : std::cout;
        out << ColorCode(level) << line << "\033[0m" << std::endl;
    }
    
    if (m_file.is_open()) {
        m_file << line << std::endl;
    }
    
    if (m_callback) {
        m_callback(level, line);
    }
}

} // namespace Lumen

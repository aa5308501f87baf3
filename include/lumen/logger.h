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
#pragma once

#include <atomic>
#include <cstdarg>
#include <fstream>
#include <functional>
#include <mutex>
#include <string>

namespace Lumen {

/**
 * @brief 日志级别
 */
enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

/**
 * @brief 日志回调
 * @param level 日志级别
 * @param line 带时间戳和级别前缀的整行文本
 */
using LogCallback = std::function<void(LogLevel level, const std::string& line)>;

/**
 * @brief 线程安全的日志单例
 * 
 * 输出目标可以同时开启：控制台（按级别着色，Error 写到 stderr）、
 * 日志文件、以及一个回调。
 */
class Logger {
public:
    static Logger& GetInstance();
    
    void SetLogLevel(LogLevel level) { m_logLevel.store(level); }
    LogLevel GetLogLevel() const { return m_logLevel.load(); }
    
    void SetLogToConsole(bool enable) { m_logToConsole.store(enable); }
    
    /**
     * @brief 开启或关闭文件输出
     * @param filename 为空时在 logs/ 下按启动时间生成文件名
     */
    void SetLogToFile(bool enable, const std::string& filename = "");
    
    /**
     * @brief 设置回调，传入 nullptr 取消
     * 
     * 回调在日志锁内执行，不能在回调中再写日志。
     */
    void SetLogCallback(LogCallback callback);
    
    void Log(LogLevel level, const std::string& message);
    void Debug(const std::string& message) { Log(LogLevel::Debug, message); }
    void Info(const std::string& message) { Log(LogLevel::Info, message); }
    void Warning(const std::string& message) { Log(LogLevel::Warning, message); }
    void Error(const std::string& message) { Log(LogLevel::Error, message); }
    
    // printf 风格
    void DebugFormat(const char* format, ...);
    void InfoFormat(const char* format, ...);
    void WarningFormat(const char* format, ...);
    void ErrorFormat(const char* format, ...);
    
    static const char* LevelToString(LogLevel level);
    
private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    
    void LogVarArgs(LogLevel level, const char* format, va_list args);
    void Write(LogLevel level, const std::string& message);
    
    std::atomic<LogLevel> m_logLevel;
    std::atomic<bool> m_logToConsole;
    
    // 以下由 m_mutex 保护
    std::ofstream m_file;
    LogCallback m_callback;
    mutable std::mutex m_mutex;
};

#define LOG_DEBUG(msg) Lumen::Logger::GetInstance().Debug(msg)
#define LOG_INFO(msg) Lumen::Logger::GetInstance().Info(msg)
#define LOG_WARNING(msg) Lumen::Logger::GetInstance().Warning(msg)
#define LOG_ERROR(msg) Lumen::Logger::GetInstance().Error(msg)

#define LOG_DEBUG_F(fmt, ...) Lumen::Logger::GetInstance().DebugFormat(fmt, ##__VA_ARGS__)
#define LOG_INFO_F(fmt, ...) Lumen::Logger::GetInstance().InfoFormat(fmt, ##__VA_ARGS__)
#define LOG_WARNING_F(fmt, ...) Lumen::Logger::GetInstance().WarningFormat(fmt, ##__VA_ARGS__)
#define LOG_ERROR_F(fmt, ...) Lumen::Logger::GetInstance().ErrorFormat(fmt, ##__VA_ARGS__)

} // namespace Lumen

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
#include <exception>
#include <functional>
#include <mutex>
#include <source_location>
#include <string>
#include <vector>

namespace Lumen {

/**
 * @brief 错误严重程度
 */
enum class ErrorSeverity {
    Info,
    Warning,    // 已回退到可用的值，继续执行
    Error,      // 当前操作失败
    Critical    // 继续执行的结果不可信
};

/**
 * @brief 错误类别，由错误码的千位决定
 */
enum class ErrorCategory {
    OpenGL = 1000,
    Threading = 3000,
    Rendering = 4000,
    IO = 5000,
    Initialization = 6000,
    Generic = 9000
};

enum class ErrorCode {
    Success = 0,
    
    // OpenGL (1xxx)
    GLInvalidEnum = 1000,
    GLInvalidValue,
    GLInvalidOperation,
    GLOutOfMemory,
    GLInvalidFramebufferOperation,
    GLContextCreationFailed,
    
    // 线程 (3xxx)
    WrongThread = 3000,
    ThreadSynchronizationFailed,
    
    // 渲染 (4xxx)
    RenderTargetInvalid = 4000,
    SurfaceCreationFailed,
    
    // IO (5xxx)
    FileNotFound = 5000,
    FileWriteFailed,
    
    // 初始化与配置 (6xxx)
    InitializationFailed = 6000,
    AlreadyInitialized,
    ConfigurationInvalid,
    
    // 通用 (9xxx)
    InvalidArgument = 9000,
    OutOfRange,
    Unknown = 9999
};

/**
 * @brief 渲染错误
 * 
 * 既可以作为异常抛出，也可以直接交给 ErrorHandler 记录。
 * 构造时自动捕获源位置。
 */
class RenderError : public std::exception {
public:
    RenderError(ErrorCode code,
                const std::string& message,
                ErrorSeverity severity = ErrorSeverity::Error,
                std::source_location location = std::source_location::current());
    
    const char* what() const noexcept override { return m_fullMessage.c_str(); }
    
    ErrorCode GetCode() const { return m_code; }
    ErrorCategory GetCategory() const { return m_category; }
    ErrorSeverity GetSeverity() const { return m_severity; }
    const std::string& GetMessage() const { return m_message; }
    
    /**
     * @brief 形如 "[Error] [Rendering] RenderTargetInvalid: 消息 (file.cpp:42)"
     */
    const std::string& GetFullMessage() const { return m_fullMessage; }
    
private:
    ErrorCode m_code;
    ErrorCategory m_category;
    ErrorSeverity m_severity;
    std::string m_message;
    std::string m_fullMessage;
};

using ErrorCallback = std::function<void(const RenderError&)>;

/**
 * @brief 全局错误处理器
 * 
 * Handle 更新统计并依次调用回调。默认注册一个回调，按严重程度写入 Logger。
 */
class ErrorHandler {
public:
    static ErrorHandler& GetInstance();
    
    ErrorHandler(const ErrorHandler&) = delete;
    ErrorHandler& operator=(const ErrorHandler&) = delete;
    
    void Handle(const RenderError& error);
    
    /**
     * @brief 读取 glGetError，有错误时交给 Handle
     * @return 是否检测到错误
     */
    bool CheckGLError(const std::source_location& location = std::source_location::current());
    
    /**
     * @return 回调 ID，用于 RemoveCallback
     */
    size_t AddCallback(ErrorCallback callback);
    void RemoveCallback(size_t id);
    
    struct ErrorStats {
        size_t warningCount = 0;
        size_t errorCount = 0;      ///< Error 与 Critical 合计
        size_t totalCount = 0;
    };
    
    ErrorStats GetStats() const;
    void ResetStats();
    
private:
    ErrorHandler();
    ~ErrorHandler() = default;
    
    struct CallbackEntry {
        size_t id;
        ErrorCallback callback;
    };
    std::vector<CallbackEntry> m_callbacks;
    size_t m_nextCallbackId = 1;
    mutable std::mutex m_callbackMutex;
    
    std::atomic<size_t> m_warningCount{0};
    std::atomic<size_t> m_errorCount{0};
    std::atomic<size_t> m_totalCount{0};
};

const char* ErrorCodeToString(ErrorCode code);
const char* ErrorSeverityToString(ErrorSeverity severity);
const char* ErrorCategoryToString(ErrorCategory category);

} // namespace Lumen

// ============================================================================
// 便捷宏
// ============================================================================

/**
 * @brief 创建错误对象
 * 
 * throw LUMEN_ERROR(ErrorCode::RenderTargetInvalid, "帧缓冲不完整");
 * HANDLE_ERROR(LUMEN_WARNING(ErrorCode::OutOfRange, "参数已被限制"));
 */
#define LUMEN_ERROR(code, msg) \
    Lumen::RenderError(code, msg, Lumen::ErrorSeverity::Error)

#define LUMEN_WARNING(code, msg) \
    Lumen::RenderError(code, msg, Lumen::ErrorSeverity::Warning)

#define LUMEN_CRITICAL(code, msg) \
    Lumen::RenderError(code, msg, Lumen::ErrorSeverity::Critical)

/**
 * @brief 只记录，不抛出
 */
#define HANDLE_ERROR(error) \
    Lumen::ErrorHandler::GetInstance().Handle(error)

#define CHECK_GL_ERROR() \
    Lumen::ErrorHandler::GetInstance().CheckGLError()

/**
 * @brief 捕获 RenderError 并交给 ErrorHandler
 * 
 * try 块以 return 结束时，紧跟的语句块只在捕获到错误后执行。
 * 
 * LUMEN_TRY {
 *     ...
 * } LUMEN_CATCH {
 *     return false;
 * }
 */
#define LUMEN_TRY try

#define LUMEN_CATCH \
    catch (const Lumen::RenderError& e) { \
        Lumen::ErrorHandler::GetInstance().Handle(e); \
    }

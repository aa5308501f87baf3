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
#include "lumen/error.h"
#include "lumen/logger.h"
#include <glad/glad.h>
#include <algorithm>

namespace Lumen {

namespace {

ErrorCategory CategoryOf(ErrorCode code) {
    switch (static_cast<int>(code) / 1000) {
        case 1: return ErrorCategory::OpenGL;
        case 3: return ErrorCategory::Threading;
        case 4: return ErrorCategory::Rendering;
        case 5: return ErrorCategory::IO;
        case 6: return ErrorCategory::Initialization;
        default: return ErrorCategory::Generic;
    }
}

std::string FileName(const char* path) {
    std::string file(path);
    size_t slash = file.find_last_of("/\\");
    return slash == std::string::npos ? file : file.substr(slash + 1);
}

ErrorCode FromGLError(GLenum error) {
    switch (error) {
        case GL_INVALID_ENUM: return ErrorCode::GLInvalidEnum;
        case GL_INVALID_VALUE: return ErrorCode::GLInvalidValue;
        case GL_INVALID_OPERATION: return ErrorCode::GLInvalidOperation;
        case GL_OUT_OF_MEMORY: return ErrorCode::GLOutOfMemory;
        case GL_INVALID_FRAMEBUFFER_OPERATION: return ErrorCode::GLInvalidFramebufferOperation;
        default: return ErrorCode::Unknown;
    }
}

} // namespace

// ============================================================================
// RenderError
// ============================================================================

RenderError::RenderError(ErrorCode code,
                         const std::string& message,
                         ErrorSeverity severity,
                         std::source_location location)
    : m_code(code)
    , m_category(CategoryOf(code))
    , m_severity(severity)
    , m_message(message) {
    m_fullMessage = std::string("[") + ErrorSeverityToString(severity) + "] [" +
                    ErrorCategoryToString(m_category) + "] " + ErrorCodeToString(code) + ": " +
                    message + " (" + FileName(location.file_name()) + ":" +
                    std::to_string(location.line()) + ")";
}

// ============================================================================
// ErrorHandler
// ============================================================================

ErrorHandler& ErrorHandler::GetInstance() {
    static ErrorHandler instance;
    return instance;
}

ErrorHandler::ErrorHandler() {
    AddCallback([](const RenderError& error) {
        auto& logger = Logger::GetInstance();
        switch (error.GetSeverity()) {
            case ErrorSeverity::Info:
                logger.Info(error.GetFullMessage());
                break;
            case ErrorSeverity::Warning:
                logger.Warning(error.GetFullMessage());
                break;
            case ErrorSeverity::Error:
            case ErrorSeverity::Critical:
                logger.Error(error.GetFullMessage());
                break;
        }
    });
}

void ErrorHandler::Handle(const RenderError& error) {
    m_totalCount.fetch_add(1);
    if (error.GetSeverity() == ErrorSeverity::Warning) {
        m_warningCount.fetch_add(1);
    } else if (error.GetSeverity() != ErrorSeverity::Info) {
        m_errorCount.fetch_add(1);
    }
    
    // 回调中可以再次调用 Handle
    std::vector<CallbackEntry> callbacks;
    {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        callbacks = m_callbacks;
    }
    for (const auto& entry : callbacks) {
        entry.callback(error);
    }
}

bool ErrorHandler::CheckGLError(const std::source_location& location) {
    GLenum error = glGetError();
    if (error == GL_NO_ERROR) {
        return false;
    }
    
    // 驱动可能积累多个错误标志；没有当前上下文时部分驱动会一直返回错误
    for (int i = 0; i < 8 && error != GL_NO_ERROR; ++i) {
        ErrorCode code = FromGLError(error);
        Handle(RenderError(code, "glGetError returned " + std::to_string(error), ErrorSeverity::Error, location));
        error = glGetError();
    }
    return true;
}

size_t ErrorHandler::AddCallback(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    size_t id = m_nextCallbackId++;
    m_callbacks.push_back({id, std::move(callback)});
    return id;
}

void ErrorHandler::RemoveCallback(size_t id) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_callbacks.erase(
        std::remove_if(m_callbacks.begin(), m_callbacks.end(),
            [id](const CallbackEntry& entry) { return entry.id == id; }),
        m_callbacks.end());
}

ErrorHandler::ErrorStats ErrorHandler::GetStats() const {
    ErrorStats stats;
    stats.warningCount = m_warningCount.load();
    stats.errorCount = m_errorCount.load();
    stats.totalCount = m_totalCount.load();
    return stats;
}

void ErrorHandler::ResetStats() {
    m_warningCount.store(0);
    m_errorCount.store(0);
    m_totalCount.store(0);
}

// ============================================================================
// 字符串转换
// ============================================================================

const char* ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::GLInvalidEnum: return "GLInvalidEnum";
        case ErrorCode::GLInvalidValue: return "GLInvalidValue";
        case ErrorCode::GLInvalidOperation: return "GLInvalidOperation";
        case ErrorCode::GLOutOfMemory: return "GLOutOfMemory";
        case ErrorCode::GLInvalidFramebufferOperation: return "GLInvalidFramebufferOperation";
        case ErrorCode::GLContextCreationFailed: return "GLContextCreationFailed";
        case ErrorCode::WrongThread: return "WrongThread";
        case ErrorCode::ThreadSynchronizationFailed: return "ThreadSynchronizationFailed";
        case ErrorCode::RenderTargetInvalid: return "RenderTargetInvalid";
        case ErrorCode::SurfaceCreationFailed: return "SurfaceCreationFailed";
        case ErrorCode::FileNotFound: return "FileNotFound";
        case ErrorCode::FileWriteFailed: return "FileWriteFailed";
        case ErrorCode::InitializationFailed: return "InitializationFailed";
        case ErrorCode::AlreadyInitialized: return "AlreadyInitialized";
        case ErrorCode::ConfigurationInvalid: return "ConfigurationInvalid";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::OutOfRange: return "OutOfRange";
        case ErrorCode::Unknown: return "Unknown";
    }
    return "Unknown";
}

const char* ErrorSeverityToString(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::Info: return "Info";
        case ErrorSeverity::Warning: return "Warning";
        case ErrorSeverity::Error: return "Error";
        case ErrorSeverity::Critical: return "Critical";
    }
    return "Unknown";
}

const char* ErrorCategoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::OpenGL: return "OpenGL";
        case ErrorCategory::Threading: return "Threading";
        case ErrorCategory::Rendering: return "Rendering";
        case ErrorCategory::IO: return "IO";
        case ErrorCategory::Initialization: return "Initialization";
        case ErrorCategory::Generic: return "Generic";
    }
    return "Unknown";
}

} // namespace Lumen

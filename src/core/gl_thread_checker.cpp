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
#include "lumen/gl_thread_checker.h"
#include "lumen/logger.h"
#include "lumen/error.h"
#include <sstream>

namespace Lumen {

GLThreadChecker::GLThreadChecker()
    : m_glThreadId()
    , m_registered(false)
    , m_registrations(0) {
}

GLThreadChecker& GLThreadChecker::GetInstance() {
    static GLThreadChecker instance;
    return instance;
}

bool GLThreadChecker::RegisterGLThread() {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::thread::id currentThreadId = std::this_thread::get_id();
    
    if (m_registered.load() && m_glThreadId != currentThreadId) {
        std::ostringstream oss;
        oss << "GLThreadChecker: 尝试从不同线程注册 OpenGL 线程! "
            << "已注册线程 ID: " << m_glThreadId 
            << ", 当前线程 ID: " << currentThreadId;
        HANDLE_ERROR(LUMEN_CRITICAL(ErrorCode::ThreadSynchronizationFailed, oss.str()));
        return false;
    }
    
    m_glThreadId = currentThreadId;
    m_registrations++;
    
    if (!m_registered.exchange(true)) {
        std::ostringstream oss;
        oss << "OpenGL thread registered. Thread ID: " << currentThreadId;
        LOG_INFO(oss.str());
    }
    return true;
}

void GLThreadChecker::UnregisterGLThread() {
    std::lock_guard<std::mutex> lock(m_mutex);
    
    if (!m_registered.load()) {
        LOG_WARNING("Attempting to unregister OpenGL thread, but no thread is registered");
        return;
    }
    
    if (--m_registrations > 0) {
        return;
    }
    
    m_registered.store(false);
    LOG_INFO("OpenGL thread unregistered");
}

bool GLThreadChecker::IsGLThread() const {
    if (!m_registered.load()) {
        return false;
    }
    
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_glThreadId == std::this_thread::get_id();
}

bool GLThreadChecker::ValidateGLThread(const char* file, int line, const char* function) const {
    if (!m_registered.load()) {
        return true;
    }
    
    std::thread::id expected;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        expected = m_glThreadId;
    }
    
    std::thread::id currentThreadId = std::this_thread::get_id();
    if (expected == currentThreadId) {
        return true;
    }
    
    std::ostringstream oss;
    oss << "GLThreadChecker: OpenGL 调用来自错误线程!\n"
        << "  期望线程 ID: " << expected << "\n"
        << "  当前线程 ID: " << currentThreadId << "\n"
        << "  位置: " << file << ":" << line;
    
    if (function) {
        oss << " in " << function << "()";
    }
    
    HANDLE_ERROR(LUMEN_CRITICAL(ErrorCode::WrongThread, oss.str()));
    return false;
}

} // namespace Lumen

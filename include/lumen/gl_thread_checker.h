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

#include <thread>
#include <atomic>
#include <mutex>

namespace Lumen {

/**
 * @brief OpenGL 线程检查器
 * 
 * 确保所有 OpenGL 调用都在创建上下文的线程中执行。
 * 
 * 使用方法：
 * 1. 在创建 OpenGL 上下文后调用 RegisterGLThread()
 * 2. 在任何 OpenGL 调用前使用 GL_THREAD_CHECK() 宏
 * 3. 在销毁上下文时调用 UnregisterGLThread()
 * 
 * 同一线程可以注册多个上下文（每个 WindowSurface 一个），按引用计数注销。
 */
class GLThreadChecker {
public:
    static GLThreadChecker& GetInstance();
    
    /**
     * @brief 注册当前线程为 OpenGL 线程
     * 
     * 已被其他线程注册时报告错误并返回 false。
     */
    bool RegisterGLThread();
    
    void UnregisterGLThread();
    
    bool IsGLThread() const;
    
    /**
     * @brief 验证当前线程是否是 OpenGL 线程
     * 
     * 尚未注册时不做检查；不匹配时通过 ErrorHandler 报告 WrongThread。
     * 
     * @param file 调用文件名 (__FILE__)
     * @param line 调用行号 (__LINE__)
     * @param function 调用函数名 (可选)
     */
    bool ValidateGLThread(const char* file, int line, const char* function = nullptr) const;
    
    bool IsRegistered() const { return m_registered.load(); }
    
private:
    GLThreadChecker();
    ~GLThreadChecker() = default;
    
    GLThreadChecker(const GLThreadChecker&) = delete;
    GLThreadChecker& operator=(const GLThreadChecker&) = delete;
    
    std::thread::id m_glThreadId;
    std::atomic<bool> m_registered;
    int m_registrations;
    mutable std::mutex m_mutex;
};

} // namespace Lumen

/**
 * @brief OpenGL 线程检查宏
 * 
 * 定义 GL_DISABLE_THREAD_CHECK 可在发布构建中关闭检查。
 */
#if defined(_DEBUG) || !defined(GL_DISABLE_THREAD_CHECK)
    #define GL_THREAD_CHECK() \
        do { \
            Lumen::GLThreadChecker::GetInstance().ValidateGLThread(__FILE__, __LINE__, __FUNCTION__); \
        } while(0)
#else
    #define GL_THREAD_CHECK() ((void)0)
#endif

#define GL_THREAD_REGISTER() \
    Lumen::GLThreadChecker::GetInstance().RegisterGLThread()

#define GL_THREAD_UNREGISTER() \
    Lumen::GLThreadChecker::GetInstance().UnregisterGLThread()

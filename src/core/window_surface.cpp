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
#include "lumen/window_surface.h"
#include "lumen/gl_device.h"
#include "lumen/gl_thread_checker.h"
#include "lumen/logger.h"
#include "lumen/error.h"
#include "lumen/renderer_options.h"
#include <glad/glad.h>

namespace Lumen {

WindowSurface::WindowSurface(const std::string& title)
    : m_title(title)
    , m_window(nullptr)
    , m_glContext(nullptr)
    , m_sdlInitialized(false)
    , m_threadRegistered(false)
    , m_backingWidth(300)
    , m_backingHeight(150)
    , m_displayWidth(300)
    , m_displayHeight(150) {
}

WindowSurface::~WindowSurface() {
    Shutdown();
}

void WindowSurface::SetBackingSize(int width, int height) {
    m_backingWidth = width;
    m_backingHeight = height;
}

void WindowSurface::SetDisplaySize(int width, int height) {
    m_displayWidth = width;
    m_displayHeight = height;
    
    if (m_window && !SDL_SetWindowSize(m_window, width, height)) {
        LOG_WARNING(std::string("[WindowSurface] Failed to resize window: ") + SDL_GetError());
    }
}

Ref<GpuDevice> WindowSurface::CreateContext(const ContextAttributes& attributes) {
    if (m_glContext) {
        HANDLE_ERROR(LUMEN_WARNING(ErrorCode::AlreadyInitialized,
                                   "WindowSurface: 上下文已经创建"));
        return nullptr;
    }
    
    LUMEN_TRY {
        if (!SDL_Init(SDL_INIT_VIDEO)) {
            throw LUMEN_ERROR(ErrorCode::SurfaceCreationFailed,
                              "WindowSurface: SDL 初始化失败: " + std::string(SDL_GetError()));
        }
        m_sdlInitialized = true;
        
        ApplyContextAttributes(attributes);
        
        m_window = SDL_CreateWindow(m_title.c_str(), m_displayWidth, m_displayHeight,
                                    SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE | SDL_WINDOW_HIGH_PIXEL_DENSITY);
        if (!m_window) {
            throw LUMEN_ERROR(ErrorCode::SurfaceCreationFailed,
                              "WindowSurface: 窗口创建失败: " + std::string(SDL_GetError()));
        }
        
        m_glContext = SDL_GL_CreateContext(m_window);
        if (!m_glContext) {
            throw LUMEN_ERROR(ErrorCode::GLContextCreationFailed,
                              "WindowSurface: OpenGL 上下文创建失败: " + std::string(SDL_GetError()));
        }
        
        if (!SDL_GL_MakeCurrent(m_window, m_glContext)) {
            throw LUMEN_ERROR(ErrorCode::GLContextCreationFailed,
                              "WindowSurface: 无法激活 OpenGL 上下文: " + std::string(SDL_GetError()));
        }
        
        if (!gladLoadGLLoader((GLADloadproc)SDL_GL_GetProcAddress)) {
            throw LUMEN_ERROR(ErrorCode::InitializationFailed,
                              "WindowSurface: GLAD 初始化失败");
        }
        
        LOG_INFO("OpenGL Information:");
        LOG_INFO("  Version: " + std::string(reinterpret_cast<const char*>(glGetString(GL_VERSION))));
        LOG_INFO("  Renderer: " + std::string(reinterpret_cast<const char*>(glGetString(GL_RENDERER))));
        
        // 注册 OpenGL 线程 - 必须在所有 OpenGL 调用之前
        m_threadRegistered = GL_THREAD_REGISTER();
        
        LOG_INFO_F("[WindowSurface] Window created: %dx%d", m_displayWidth, m_displayHeight);
        return CreateRef<GLDevice>();
    }
    LUMEN_CATCH {
        Shutdown();
        return nullptr;
    }
}

void WindowSurface::ApplyContextAttributes(const ContextAttributes& attributes) {
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 4);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 5);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
    
    #ifdef _DEBUG
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_FLAGS, SDL_GL_CONTEXT_DEBUG_FLAG);
    #endif
    
    SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);
    SDL_GL_SetAttribute(SDL_GL_ALPHA_SIZE, attributes.alpha ? 8 : 0);
    SDL_GL_SetAttribute(SDL_GL_DEPTH_SIZE, attributes.depth ? 24 : 0);
    SDL_GL_SetAttribute(SDL_GL_STENCIL_SIZE, attributes.stencil ? 8 : 0);
    SDL_GL_SetAttribute(SDL_GL_MULTISAMPLEBUFFERS, attributes.antialias ? 1 : 0);
    SDL_GL_SetAttribute(SDL_GL_MULTISAMPLESAMPLES, attributes.antialias ? 4 : 0);
    
    // OpenGL 没有对应的上下文属性，只记录
    LOG_DEBUG_F("[WindowSurface] premultipliedAlpha=%d preserveDrawingBuffer=%d powerPreference=%s",
                attributes.premultipliedAlpha ? 1 : 0,
                attributes.preserveDrawingBuffer ? 1 : 0,
                PowerPreferenceToString(attributes.powerPreference));
}

void WindowSurface::SwapBuffers() {
    GL_THREAD_CHECK();
    if (m_window) {
        SDL_GL_SwapWindow(m_window);
    }
}

void WindowSurface::Shutdown() {
    if (m_threadRegistered) {
        GL_THREAD_UNREGISTER();
        m_threadRegistered = false;
    }
    
    if (m_glContext) {
        SDL_GL_DestroyContext(m_glContext);
        m_glContext = nullptr;
    }
    
    if (m_window) {
        SDL_DestroyWindow(m_window);
        m_window = nullptr;
    }
    
    if (m_sdlInitialized) {
        SDL_Quit();
        m_sdlInitialized = false;
        LOG_INFO("[WindowSurface] Shut down");
    }
}

} // namespace Lumen

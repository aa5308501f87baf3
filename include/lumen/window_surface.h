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

#include "lumen/render_surface.h"
#include <SDL3/SDL.h>
#include <string>

namespace Lumen {

/**
 * @brief 基于 SDL3 窗口的渲染表面
 * 
 * 未显式提供表面时渲染器使用它：在主显示器上打开一个可调整大小的窗口，
 * 并在其上创建 OpenGL 上下文。
 * 
 * 窗口在 CreateContext 时才创建，之前设置的尺寸只做记录。
 */
class WindowSurface : public RenderSurface {
public:
    explicit WindowSurface(const std::string& title = "Lumen");
    ~WindowSurface() override;
    
    WindowSurface(const WindowSurface&) = delete;
    WindowSurface& operator=(const WindowSurface&) = delete;
    
    void SetBackingSize(int width, int height) override;
    void SetDisplaySize(int width, int height) override;
    
    int GetBackingWidth() const override { return m_backingWidth; }
    int GetBackingHeight() const override { return m_backingHeight; }
    int GetDisplayWidth() const override { return m_displayWidth; }
    int GetDisplayHeight() const override { return m_displayHeight; }
    
    Ref<GpuDevice> CreateContext(const ContextAttributes& attributes) override;
    
    /**
     * @brief 交换前后缓冲
     */
    void SwapBuffers();
    
    SDL_Window* GetWindow() const { return m_window; }
    bool IsInitialized() const { return m_glContext != nullptr; }
    
    void Shutdown();
    
private:
    void ApplyContextAttributes(const ContextAttributes& attributes);
    
    std::string m_title;
    SDL_Window* m_window;
    SDL_GLContext m_glContext;
    bool m_sdlInitialized;
    bool m_threadRegistered;
    
    int m_backingWidth;
    int m_backingHeight;
    int m_displayWidth;
    int m_displayHeight;
};

} // namespace Lumen

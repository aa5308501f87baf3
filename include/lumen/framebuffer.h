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

#include "lumen/render_target.h"
#include <string>

namespace Lumen {

/**
 * @brief 帧缓冲配置
 */
struct FramebufferConfig {
    int width = 0;
    int height = 0;
    bool depth = true;          ///< 创建深度渲染缓冲
    bool stencil = false;       ///< 与深度合并为 depth-stencil 渲染缓冲
    bool floatColor = false;    ///< 使用 RGBA16F 颜色纹理（需要浮点颜色缓冲扩展）
    std::string name = "Framebuffer";
};

class Renderer;

/**
 * @brief OpenGL 帧缓冲对象
 * 
 * 一个颜色纹理附件，加可选的深度（或深度模板）渲染缓冲。
 * 帧缓冲和纹理的绑定都经由 Renderer 发出，创建完成后恢复原有绑定。
 * 
 * @note 创建和释放都必须在 OpenGL 线程上进行，Renderer 的生命周期必须长于帧缓冲
 */
class Framebuffer : public RenderTarget {
public:
    Framebuffer();
    ~Framebuffer() override;
    
    Framebuffer(const Framebuffer&) = delete;
    Framebuffer& operator=(const Framebuffer&) = delete;
    
    /**
     * @brief 按配置创建帧缓冲，已有资源会先释放
     * @return 帧缓冲完整时返回 true
     */
    bool Create(Renderer& renderer, const FramebufferConfig& config);
    
    /**
     * @brief 以新尺寸重建（保持其他配置）
     */
    bool Resize(Renderer& renderer, int width, int height);
    
    void Release();
    
    uint32_t GetHandle() const override { return m_fboID; }
    bool HasDepth() const override { return m_depthRenderbuffer != 0; }
    int GetWidth() const override { return m_width; }
    int GetHeight() const override { return m_height; }
    
    uint32_t GetColorTexture() const { return m_colorTexture; }
    bool IsValid() const { return m_fboID != 0; }
    const std::string& GetName() const { return m_config.name; }
    
private:
    bool CheckFramebufferStatus();
    
    FramebufferConfig m_config;
    Renderer* m_renderer;
    uint32_t m_fboID;
    uint32_t m_colorTexture;
    uint32_t m_depthRenderbuffer;
    int m_width;
    int m_height;
};

} // namespace Lumen

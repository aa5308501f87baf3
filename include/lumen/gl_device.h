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

#include "lumen/gpu_device.h"
#include <unordered_map>

namespace Lumen {

/**
 * @brief GpuDevice 的 OpenGL 实现（通过 glad 调用）
 * 
 * 必须在 GLAD 加载完成、上下文为当前上下文的线程上使用。
 */
class GLDevice : public GpuDevice {
public:
    GLDevice() = default;
    ~GLDevice() override = default;
    
    void Viewport(int x, int y, int width, int height) override;
    void Enable(Capability capability) override;
    void Disable(Capability capability) override;
    
    void BlendFunc(BlendFactor source, BlendFactor destination) override;
    void BlendFuncSeparate(BlendFactor source, BlendFactor destination,
                           BlendFactor sourceAlpha, BlendFactor destinationAlpha) override;
    void BlendEquation(BlendEquationMode mode) override;
    void BlendEquationSeparate(BlendEquationMode modeRGB, BlendEquationMode modeAlpha) override;
    
    void CullFace(Lumen::CullFace face) override;
    void FrontFace(Lumen::FrontFace winding) override;
    void DepthMask(bool enable) override;
    void DepthFunc(Lumen::DepthFunc func) override;
    
    void ActiveTexture(uint32_t unit) override;
    uint32_t GetTextureUnitBase() const override;
    void BindTexture(TextureTarget target, uint32_t texture) override;
    void BindFramebuffer(FramebufferTarget target, uint32_t framebuffer) override;
    void Clear(uint32_t mask) override;
    
    int GetInteger(GpuParameter parameter) override;
    float GetFloat(GpuParameter parameter) override;
    bool HasExtension(const std::string& name) override;
    
private:
    void LoadExtensionList();
    
    std::unordered_map<std::string, bool> m_extensions;
    bool m_extensionsLoaded = false;
};

} // namespace Lumen

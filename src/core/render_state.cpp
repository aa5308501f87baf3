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
#include "lumen/render_state.h"
#include "lumen/logger.h"
#include <string>

namespace Lumen {

RenderState::RenderState(GpuDevice& device, uint32_t maxTextureUnits)
    : m_device(device) {
    m_state.textureUnits.assign(maxTextureUnits, 0);
    m_state.enabled[static_cast<size_t>(Capability::Dither)] = true;
}

// ============================================================================
// 视口
// ============================================================================

void RenderState::SetViewport(int width, int height) {
    if (m_state.viewport.Equals(width, height)) {
        return;
    }
    
    m_state.viewport.width = width;
    m_state.viewport.height = height;
    m_device.Viewport(0, 0, width, height);
}

void RenderState::InvalidateViewport() {
    m_state.viewport = Extent{};
}

// ============================================================================
// 管线开关与固定功能状态
// ============================================================================

void RenderState::SetEnabled(Capability capability, bool enable) {
    if (enable) {
        m_device.Enable(capability);
    } else {
        m_device.Disable(capability);
    }
    m_state.enabled[static_cast<size_t>(capability)] = enable;
}

bool RenderState::IsEnabled(Capability capability) const {
    return m_state.enabled[static_cast<size_t>(capability)];
}

void RenderState::SetBlendFunction(BlendFactor source, BlendFactor destination,
                                   std::optional<BlendFactor> sourceAlpha,
                                   std::optional<BlendFactor> destinationAlpha) {
    if (sourceAlpha) {
        m_device.BlendFuncSeparate(source, destination, *sourceAlpha,
                                   destinationAlpha.value_or(destination));
    } else {
        m_device.BlendFunc(source, destination);
    }
    
    m_state.blendFunction.source = source;
    m_state.blendFunction.destination = destination;
    m_state.blendFunction.sourceAlpha = sourceAlpha;
    m_state.blendFunction.destinationAlpha = destinationAlpha;
}

void RenderState::SetBlendEquation(BlendEquationMode modeRGB,
                                   std::optional<BlendEquationMode> modeAlpha) {
    if (modeAlpha) {
        m_device.BlendEquationSeparate(modeRGB, *modeAlpha);
    } else {
        m_device.BlendEquation(modeRGB);
    }
    
    m_state.blendEquation.modeRGB = modeRGB;
    m_state.blendEquation.modeAlpha = modeAlpha;
}

void RenderState::SetCullFace(CullFace face) {
    m_state.cullFace = face;
    m_device.CullFace(face);
}

void RenderState::SetFrontFace(FrontFace winding) {
    m_state.frontFace = winding;
    m_device.FrontFace(winding);
}

void RenderState::SetDepthMask(bool enable) {
    m_state.depthMask = enable;
    m_device.DepthMask(enable);
}

void RenderState::SetDepthFunction(DepthFunc func) {
    m_state.depthFunction = func;
    m_device.DepthFunc(func);
}

// ============================================================================
// 纹理与帧缓冲绑定
// ============================================================================

void RenderState::ActiveTexture(uint32_t unit) {
    m_state.activeTextureUnit = unit;
    m_device.ActiveTexture(m_device.GetTextureUnitBase() + unit);
}

void RenderState::BindTexture(uint32_t unit, TextureTarget target, uint32_t texture) {
    if (unit >= m_state.textureUnits.size()) {
        Logger::GetInstance().Error("Texture unit " + std::to_string(unit) +
                                    " exceeds maximum " + std::to_string(m_state.textureUnits.size()));
        return;
    }
    
    if (m_state.textureUnits[unit] == texture) {
        return;
    }
    
    if (m_state.activeTextureUnit != unit) {
        ActiveTexture(unit);
    }
    
    m_device.BindTexture(target, texture);
    m_state.textureUnits[unit] = texture;
}

void RenderState::BindFramebuffer(FramebufferTarget target, std::optional<uint32_t> framebuffer) {
    m_state.framebuffer = framebuffer;
    m_device.BindFramebuffer(target, framebuffer.value_or(0));
}

void RenderState::ForgetTexture(uint32_t texture) {
    if (texture == 0) {
        return;
    }
    for (uint32_t& bound : m_state.textureUnits) {
        if (bound == texture) {
            bound = 0;
        }
    }
}

void RenderState::ForgetFramebuffer(uint32_t framebuffer) {
    if (framebuffer != 0 && m_state.framebuffer == framebuffer) {
        m_state.framebuffer.reset();
    }
}

} // namespace Lumen

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

#include <cstdint>
#include <string>

namespace Lumen {

/**
 * @brief 可开关的管线能力（glEnable / glDisable）
 */
enum class Capability {
    DepthTest,
    Blend,
    CullFace,
    StencilTest,
    ScissorTest,
    PolygonOffsetFill,
    SampleAlphaToCoverage,
    Dither
};

/**
 * @brief 混合因子
 */
enum class BlendFactor {
    Zero,
    One,
    SrcColor,
    OneMinusSrcColor,
    DstColor,
    OneMinusDstColor,
    SrcAlpha,
    OneMinusSrcAlpha,
    DstAlpha,
    OneMinusDstAlpha,
    ConstantColor,
    OneMinusConstantColor,
    ConstantAlpha,
    OneMinusConstantAlpha,
    SrcAlphaSaturate
};

/**
 * @brief 混合方程
 */
enum class BlendEquationMode {
    Add,
    Subtract,
    ReverseSubtract,
    Min,
    Max
};

/**
 * @brief 面剔除模式
 */
enum class CullFace {
    Front,
    Back,
    FrontAndBack
};

/**
 * @brief 正面绕序
 */
enum class FrontFace {
    CounterClockwise,
    Clockwise
};

/**
 * @brief 深度测试函数
 */
enum class DepthFunc {
    Never,
    Less,
    Equal,
    LessEqual,
    Greater,
    NotEqual,
    GreaterEqual,
    Always
};

/**
 * @brief 帧缓冲绑定目标
 */
enum class FramebufferTarget {
    Framebuffer,        // 读写合并目标
    DrawFramebuffer,
    ReadFramebuffer
};

/**
 * @brief 纹理绑定目标
 */
enum class TextureTarget {
    Texture2D,
    Texture3D,
    Texture2DArray,
    TextureCubeMap
};

/**
 * @brief 可查询的硬件参数
 */
enum class GpuParameter {
    MaxCombinedTextureImageUnits,
    MaxTextureMaxAnisotropy,
    MaxTextureSize,
    MaxSamples
};

/**
 * @brief 清屏掩码位
 */
enum ClearMask : uint32_t {
    ClearMask_None    = 0,
    ClearMask_Color   = 1u << 0,
    ClearMask_Depth   = 1u << 1,
    ClearMask_Stencil = 1u << 2
};

/**
 * @brief GPU 驱动接口
 * 
 * 每个方法对应一次驱动调用，不做任何缓存；缓存与去重由 RenderState 负责。
 * OpenGL 实现见 GLDevice。
 * 
 * 帧缓冲和纹理句柄为驱动对象名，0 表示默认对象（默认帧缓冲 / 无纹理）。
 */
class GpuDevice {
public:
    virtual ~GpuDevice() = default;
    
    virtual void Viewport(int x, int y, int width, int height) = 0;
    virtual void Enable(Capability capability) = 0;
    virtual void Disable(Capability capability) = 0;
    
    virtual void BlendFunc(BlendFactor source, BlendFactor destination) = 0;
    virtual void BlendFuncSeparate(BlendFactor source, BlendFactor destination,
                                   BlendFactor sourceAlpha, BlendFactor destinationAlpha) = 0;
    virtual void BlendEquation(BlendEquationMode mode) = 0;
    virtual void BlendEquationSeparate(BlendEquationMode modeRGB, BlendEquationMode modeAlpha) = 0;
    
    virtual void CullFace(Lumen::CullFace face) = 0;
    virtual void FrontFace(Lumen::FrontFace winding) = 0;
    virtual void DepthMask(bool enable) = 0;
    virtual void DepthFunc(Lumen::DepthFunc func) = 0;
    
    /**
     * @brief 激活纹理单元
     * @param unit 驱动层纹理单元值（已加上纹理单元基值）
     */
    virtual void ActiveTexture(uint32_t unit) = 0;
    
    /**
     * @brief 纹理单元基值（GL_TEXTURE0）
     */
    virtual uint32_t GetTextureUnitBase() const = 0;
    
    virtual void BindTexture(TextureTarget target, uint32_t texture) = 0;
    virtual void BindFramebuffer(FramebufferTarget target, uint32_t framebuffer) = 0;
    virtual void Clear(uint32_t mask) = 0;
    
    virtual int GetInteger(GpuParameter parameter) = 0;
    virtual float GetFloat(GpuParameter parameter) = 0;
    
    /**
     * @brief 查询扩展是否可用
     */
    virtual bool HasExtension(const std::string& name) = 0;
};

} // namespace Lumen

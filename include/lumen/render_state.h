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
#include "lumen/types.h"
#include <array>
#include <optional>
#include <vector>

namespace Lumen {

/**
 * @brief 混合函数缓存
 * 
 * sourceAlpha 存在时表示使用分离的 alpha 通道混合因子
 */
struct BlendFunctionState {
    BlendFactor source = BlendFactor::One;
    BlendFactor destination = BlendFactor::Zero;
    std::optional<BlendFactor> sourceAlpha;
    std::optional<BlendFactor> destinationAlpha;
};

/**
 * @brief 混合方程缓存
 */
struct BlendEquationState {
    BlendEquationMode modeRGB = BlendEquationMode::Add;
    std::optional<BlendEquationMode> modeAlpha;
};

/**
 * @brief 最后一次提交给驱动的管线状态
 * 
 * 初始值与 OpenGL 上下文的默认值一致，构造时不发出任何调用。
 */
struct PipelineState {
    BlendFunctionState blendFunction;
    BlendEquationState blendEquation;
    std::optional<CullFace> cullFace;       // 未设置前为空
    FrontFace frontFace = FrontFace::CounterClockwise;
    bool depthMask = true;
    DepthFunc depthFunction = DepthFunc::Less;
    Extent viewport;
    uint32_t activeTextureUnit = 0;
    std::vector<uint32_t> textureUnits;     // 每个纹理单元绑定的纹理，0 表示未绑定
    std::optional<uint32_t> framebuffer;    // 空表示默认表面
    
    static constexpr size_t CAPABILITY_COUNT = static_cast<size_t>(Capability::Dither) + 1;
    std::array<bool, CAPABILITY_COUNT> enabled{};
};

/**
 * @brief GPU 状态跟踪器
 * 
 * 缓存最后一次设置的管线状态。只有视口设置会根据缓存跳过重复调用，
 * 其他设置每次都会更新缓存并直接发出驱动调用。
 * 
 * 每个渲染器实例拥有一个 RenderState，不在上下文之间共享。
 * 
 * @note 非线程安全，只能在上下文所在线程使用
 */
class RenderState {
public:
    /**
     * @brief 构造状态跟踪器
     * @param device 驱动调用的目标设备（生命周期必须长于 RenderState）
     * @param maxTextureUnits 纹理单元数量
     */
    RenderState(GpuDevice& device, uint32_t maxTextureUnits);
    
    // ========================================================================
    // 视口
    // ========================================================================
    
    /**
     * @brief 设置视口（原点固定为 0,0）
     * 
     * 宽高与缓存相同时不发出调用。
     */
    void SetViewport(int width, int height);
    
    /**
     * @brief 清除视口缓存
     * 
     * 外部代码直接修改视口后调用，下次 SetViewport 会强制发出调用
     */
    void InvalidateViewport();
    
    // ========================================================================
    // 管线开关与固定功能状态
    // ========================================================================
    
    void SetEnabled(Capability capability, bool enable);
    bool IsEnabled(Capability capability) const;
    
    /**
     * @brief 设置混合函数
     * 
     * 提供 sourceAlpha 时使用分离混合调用，destinationAlpha 缺省为 destination；
     * 否则使用统一的混合调用。
     */
    void SetBlendFunction(BlendFactor source, BlendFactor destination,
                          std::optional<BlendFactor> sourceAlpha = std::nullopt,
                          std::optional<BlendFactor> destinationAlpha = std::nullopt);
    
    /**
     * @brief 设置混合方程，提供 modeAlpha 时使用分离调用
     */
    void SetBlendEquation(BlendEquationMode modeRGB,
                          std::optional<BlendEquationMode> modeAlpha = std::nullopt);
    
    void SetCullFace(CullFace face);
    void SetFrontFace(FrontFace winding);
    void SetDepthMask(bool enable);
    void SetDepthFunction(DepthFunc func);
    
    // ========================================================================
    // 纹理与帧缓冲绑定
    // ========================================================================
    
    /**
     * @brief 激活纹理单元
     * @param unit 纹理单元索引（从 0 开始）
     */
    void ActiveTexture(uint32_t unit);
    
    /**
     * @brief 绑定纹理到指定纹理单元
     * 
     * 该单元已绑定同一纹理时不发出调用；单元越界时记录错误并忽略
     */
    void BindTexture(uint32_t unit, TextureTarget target, uint32_t texture);
    
    /**
     * @brief 绑定帧缓冲
     * @param framebuffer 帧缓冲句柄，空表示默认表面
     */
    void BindFramebuffer(FramebufferTarget target = FramebufferTarget::Framebuffer,
                         std::optional<uint32_t> framebuffer = std::nullopt);
    
    /**
     * @brief 纹理被删除后同步缓存
     * 
     * 驱动删除纹理时会把绑定了它的纹理单元重置为 0，这里做同样的处理
     */
    void ForgetTexture(uint32_t texture);
    
    /**
     * @brief 帧缓冲被删除后同步缓存，当前绑定的就是它时回到默认表面
     */
    void ForgetFramebuffer(uint32_t framebuffer);
    
    const PipelineState& GetState() const { return m_state; }
    uint32_t GetMaxTextureUnits() const { return static_cast<uint32_t>(m_state.textureUnits.size()); }
    
private:
    GpuDevice& m_device;
    PipelineState m_state;
};

} // namespace Lumen

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

#include "lumen/types.h"
#include "lumen/gpu_device.h"
#include "lumen/render_state.h"
#include "lumen/render_surface.h"
#include "lumen/render_target.h"
#include "lumen/renderer_options.h"
#include "lumen/scene_node.h"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Lumen {

class Camera;

/**
 * @brief 最近一帧的统计信息
 */
struct RenderStats {
    uint32_t traversedNodes = 0;    ///< 遍历到的节点数
    uint32_t culledNodes = 0;       ///< 被视锥体裁剪掉的节点数
    uint32_t opaqueCount = 0;
    uint32_t transparentCount = 0;
    uint32_t uiCount = 0;
    uint32_t drawCalls = 0;         ///< 调用 Draw 的节点数
    
    void Reset() {
        traversedNodes = 0;
        culledNodes = 0;
        opaqueCount = 0;
        transparentCount = 0;
        uiCount = 0;
        drawCalls = 0;
    }
};

/**
 * @brief 单次 Render 调用的参数
 */
struct RenderOptions {
    bool frustumCull = true;
    bool sort = true;
    RenderTarget* target = nullptr;     ///< 为空时渲染到默认表面
    bool update = true;                 ///< 是否先更新场景的世界矩阵
    std::optional<bool> clear;          ///< 为空时使用渲染器的 autoClear
};

/**
 * @brief 构造时查询到的硬件参数
 */
struct RendererParameters {
    int maxTextureUnits = 0;
    float maxAnisotropy = 1.0f;
};

/**
 * @brief 渲染器
 * 
 * 持有渲染表面、GPU 设备与状态跟踪器，负责：
 * - 尺寸管理（逻辑尺寸与设备像素比）
 * - 转发状态设置到状态跟踪器
 * - 构建渲染列表（裁剪、分桶、排序）并逐个绘制
 * 
 * 每个实例拥有独立的状态缓存，多个渲染器可以同时存在。
 * 
 * @note 非线程安全，所有调用必须在上下文所在线程进行
 */
class Renderer {
public:
    /**
     * @brief 创建渲染器
     * 
     * 未提供 surface 时创建默认窗口表面。
     * 
     * @throws RenderError 无法创建 GPU 上下文时抛出 GLContextCreationFailed
     */
    explicit Renderer(const RendererOptions& options = RendererOptions());
    ~Renderer();
    
    Renderer(const Renderer&) = delete;
    Renderer& operator=(const Renderer&) = delete;
    
    // ========================================================================
    // 尺寸
    // ========================================================================
    
    /**
     * @brief 设置逻辑尺寸
     * 
     * 表面的像素尺寸为逻辑尺寸乘以设备像素比，显示尺寸为逻辑尺寸。
     */
    void SetSize(int width, int height);
    
    int GetWidth() const { return m_width; }
    int GetHeight() const { return m_height; }
    float GetDevicePixelRatio() const { return m_devicePixelRatio; }
    
    // ========================================================================
    // 状态设置（转发到状态跟踪器）
    // ========================================================================
    
    void SetViewport(int width, int height);
    void InvalidateViewport();
    
    void Enable(Capability capability);
    void Disable(Capability capability);
    
    void SetBlendFunction(BlendFactor source, BlendFactor destination,
                          std::optional<BlendFactor> sourceAlpha = std::nullopt,
                          std::optional<BlendFactor> destinationAlpha = std::nullopt);
    void SetBlendEquation(BlendEquationMode modeRGB,
                          std::optional<BlendEquationMode> modeAlpha = std::nullopt);
    
    void SetCullFace(CullFace face);
    void SetFrontFace(FrontFace winding);
    void SetDepthMask(bool enable);
    void SetDepthFunction(DepthFunc func);
    
    void ActiveTexture(uint32_t unit);
    void BindTexture(uint32_t unit, TextureTarget target, uint32_t texture);
    void BindFramebuffer(FramebufferTarget target = FramebufferTarget::Framebuffer,
                         std::optional<uint32_t> framebuffer = std::nullopt);
    
    /**
     * @brief 通知状态跟踪器 GPU 对象已被删除
     */
    void ForgetTexture(uint32_t texture);
    void ForgetFramebuffer(uint32_t framebuffer);
    
    // ========================================================================
    // 渲染
    // ========================================================================
    
    /**
     * @brief 构建渲染列表
     * 
     * 不可见或不可绘制的节点被排除（其子节点仍会访问）。裁剪开启且有相机时，
     * 参与裁剪且不与视锥体相交的节点被排除。
     * 
     * sort 为 false 时按遍历顺序返回；否则分为不透明、透明、UI 三组分别排序后拼接：
     * - 不透明：renderOrder 升序，program id 升序，zDepth 升序，节点 id 降序
     * - 透明：renderOrder 升序，zDepth 降序，节点 id 降序
     * - UI：renderOrder 升序，program id 升序，节点 id 降序
     * 
     * @param camera 可为空，为空时不裁剪且 zDepth 全为 0
     */
    std::vector<SceneNode*> GetRenderList(SceneNode& scene, Camera* camera,
                                          bool frustumCull = true, bool sort = true);
    
    /**
     * @brief 渲染一帧
     * 
     * 绑定目标并设置视口，按需清屏，更新世界矩阵，构建渲染列表后依次调用 Draw。
     */
    void Render(SceneNode& scene, Camera* camera = nullptr, const RenderOptions& options = RenderOptions());
    
    // ========================================================================
    // 查询
    // ========================================================================
    
    uint32_t GetId() const { return m_id; }
    const RendererParameters& GetParameters() const { return m_parameters; }
    
    /**
     * @brief 构造时探测过的扩展是否可用
     */
    bool HasExtension(const std::string& name) const;
    const std::unordered_map<std::string, bool>& GetExtensions() const { return m_extensions; }
    
    void SetAutoClear(bool autoClear) { m_autoClear = autoClear; }
    bool IsAutoClear() const { return m_autoClear; }
    
    /**
     * @brief 清屏时使用的缓冲掩码（颜色总是包含在内）
     */
    uint32_t GetClearMask() const { return m_clearMask; }
    
    const RenderStats& GetStats() const { return m_stats; }
    const RenderState& GetRenderState() const { return *m_state; }
    GpuDevice& GetDevice() const { return *m_device; }
    const Ref<RenderSurface>& GetSurface() const { return m_surface; }
    
    static constexpr const char* EXT_COLOR_BUFFER_FLOAT = "GL_EXT_color_buffer_float";
    static constexpr const char* EXT_TEXTURE_FLOAT_LINEAR = "GL_OES_texture_float_linear";
    
private:
    static float ComputeZDepth(const SceneNode& node, const Camera* camera);
    
    uint32_t m_id;
    Ref<RenderSurface> m_surface;
    Ref<GpuDevice> m_device;
    Scope<RenderState> m_state;
    
    int m_width;
    int m_height;
    float m_devicePixelRatio;
    bool m_depth;
    bool m_autoClear;
    uint32_t m_clearMask;
    
    RendererParameters m_parameters;
    std::unordered_map<std::string, bool> m_extensions;
    RenderStats m_stats;
};

} // namespace Lumen

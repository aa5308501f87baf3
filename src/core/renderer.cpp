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
#include "lumen/renderer.h"
#include "lumen/camera.h"
#include "lumen/window_surface.h"
#include "lumen/math_utils.h"
#include "lumen/logger.h"
#include "lumen/error.h"
#include <algorithm>
#include <atomic>

namespace Lumen {

namespace {
std::atomic<uint32_t> s_nextRendererId{1};
}

Renderer::Renderer(const RendererOptions& options)
    : m_id(0)
    , m_width(options.width)
    , m_height(options.height)
    , m_devicePixelRatio(options.devicePixelRatio)
    , m_depth(options.depth)
    , m_autoClear(options.autoClear)
    , m_clearMask(ClearMask_Color) {
    LOG_INFO("========================================");
    LOG_INFO("Initializing Lumen Renderer...");
    LOG_INFO("========================================");
    
    m_surface = options.surface ? options.surface : CreateRef<WindowSurface>();
    
    ContextAttributes attributes = options.GetContextAttributes();
    LOG_INFO_F("Context attributes: alpha=%d depth=%d stencil=%d antialias=%d power=%s",
               attributes.alpha ? 1 : 0, attributes.depth ? 1 : 0, attributes.stencil ? 1 : 0,
               attributes.antialias ? 1 : 0, PowerPreferenceToString(attributes.powerPreference));
    
    m_device = m_surface->CreateContext(attributes);
    if (!m_device) {
        throw LUMEN_ERROR(ErrorCode::GLContextCreationFailed,
                          "Renderer: GPU 上下文创建失败");
    }
    
    if (options.depth) m_clearMask |= ClearMask_Depth;
    if (options.stencil) m_clearMask |= ClearMask_Stencil;
    
    // 硬件参数
    m_parameters.maxTextureUnits = m_device->GetInteger(GpuParameter::MaxCombinedTextureImageUnits);
    m_parameters.maxAnisotropy = m_device->GetFloat(GpuParameter::MaxTextureMaxAnisotropy);
    LOG_INFO_F("  Max texture units: %d", m_parameters.maxTextureUnits);
    LOG_INFO_F("  Max anisotropy: %.1f", m_parameters.maxAnisotropy);
    
    m_state = CreateScope<RenderState>(*m_device,
        static_cast<uint32_t>(std::max(m_parameters.maxTextureUnits, 0)));
    
    // 扩展
    for (const char* name : {EXT_COLOR_BUFFER_FLOAT, EXT_TEXTURE_FLOAT_LINEAR}) {
        bool supported = m_device->HasExtension(name);
        m_extensions[name] = supported;
        LOG_INFO_F("  %s: %s", name, supported ? "yes" : "no");
    }
    
    m_id = s_nextRendererId.fetch_add(1);
    
    SetSize(options.width, options.height);
    
    LOG_INFO_F("Renderer #%u ready (%dx%d, dpr %.2f)", m_id, m_width, m_height, m_devicePixelRatio);
}

Renderer::~Renderer() = default;

// ============================================================================
// 尺寸
// ============================================================================

void Renderer::SetSize(int width, int height) {
    m_width = width;
    m_height = height;
    
    m_surface->SetBackingSize(static_cast<int>(width * m_devicePixelRatio),
                              static_cast<int>(height * m_devicePixelRatio));
    m_surface->SetDisplaySize(width, height);
    
    LOG_DEBUG_F("[Renderer] Size %dx%d (backing %dx%d)", width, height,
                m_surface->GetBackingWidth(), m_surface->GetBackingHeight());
}

// ============================================================================
// 状态设置
// ============================================================================

void Renderer::SetViewport(int width, int height) {
    m_state->SetViewport(width, height);
}

void Renderer::InvalidateViewport() {
    m_state->InvalidateViewport();
}

void Renderer::Enable(Capability capability) {
    m_state->SetEnabled(capability, true);
}

void Renderer::Disable(Capability capability) {
    m_state->SetEnabled(capability, false);
}

void Renderer::SetBlendFunction(BlendFactor source, BlendFactor destination,
                                std::optional<BlendFactor> sourceAlpha,
                                std::optional<BlendFactor> destinationAlpha) {
    m_state->SetBlendFunction(source, destination, sourceAlpha, destinationAlpha);
}

void Renderer::SetBlendEquation(BlendEquationMode modeRGB, std::optional<BlendEquationMode> modeAlpha) {
    m_state->SetBlendEquation(modeRGB, modeAlpha);
}

void Renderer::SetCullFace(CullFace face) {
    m_state->SetCullFace(face);
}

void Renderer::SetFrontFace(FrontFace winding) {
    m_state->SetFrontFace(winding);
}

void Renderer::SetDepthMask(bool enable) {
    m_state->SetDepthMask(enable);
}

void Renderer::SetDepthFunction(DepthFunc func) {
    m_state->SetDepthFunction(func);
}

void Renderer::ActiveTexture(uint32_t unit) {
    m_state->ActiveTexture(unit);
}

void Renderer::BindTexture(uint32_t unit, TextureTarget target, uint32_t texture) {
    m_state->BindTexture(unit, target, texture);
}

void Renderer::BindFramebuffer(FramebufferTarget target, std::optional<uint32_t> framebuffer) {
    m_state->BindFramebuffer(target, framebuffer);
}

void Renderer::ForgetTexture(uint32_t texture) {
    m_state->ForgetTexture(texture);
}

void Renderer::ForgetFramebuffer(uint32_t framebuffer) {
    m_state->ForgetFramebuffer(framebuffer);
}

// ============================================================================
// 渲染列表
// ============================================================================

float Renderer::ComputeZDepth(const SceneNode& node, const Camera* camera) {
    if (node.GetRenderOrder() != 0 || !node.GetProgram()->IsDepthTestEnabled() || !camera) {
        return 0.0f;
    }
    
    Vector3 projected = MathUtils::TransformPoint(camera->GetProjectionViewMatrix(), node.GetWorldPosition());
    return projected.z();
}

std::vector<SceneNode*> Renderer::GetRenderList(SceneNode& scene, Camera* camera, bool frustumCull, bool sort) {
    m_stats.Reset();
    
    const bool cull = frustumCull && camera != nullptr;
    if (cull) {
        camera->UpdateFrustum();
    }
    
    std::vector<SceneNode*> renderList;
    scene.Traverse([&](SceneNode& node) {
        ++m_stats.traversedNodes;
        
        if (!node.IsVisible()) {
            return TraverseAction::SkipNode;
        }
        if (!node.IsDrawable() || !node.GetProgram()) {
            return TraverseAction::SkipNode;
        }
        if (cull && node.IsFrustumCulled() && !camera->FrustumIntersectsMesh(node)) {
            ++m_stats.culledNodes;
            return TraverseAction::SkipNode;
        }
        
        renderList.push_back(&node);
        return TraverseAction::Continue;
    });
    
    if (!sort) {
        return renderList;
    }
    
    std::vector<SceneNode*> opaque;
    std::vector<SceneNode*> transparent;
    std::vector<SceneNode*> ui;
    
    for (SceneNode* node : renderList) {
        const Program& program = *node->GetProgram();
        if (!program.IsTransparent()) {
            opaque.push_back(node);
        } else if (program.IsDepthTestEnabled()) {
            transparent.push_back(node);
        } else {
            ui.push_back(node);
        }
        
        node->SetZDepth(ComputeZDepth(*node, camera));
    }
    
    // 不透明：按程序分组减少状态切换，组内从前到后
    std::stable_sort(opaque.begin(), opaque.end(), [](const SceneNode* a, const SceneNode* b) {
        if (a->GetRenderOrder() != b->GetRenderOrder()) {
            return a->GetRenderOrder() < b->GetRenderOrder();
        }
        if (a->GetProgram()->GetId() != b->GetProgram()->GetId()) {
            return a->GetProgram()->GetId() < b->GetProgram()->GetId();
        }
        if (a->GetZDepth() != b->GetZDepth()) {
            return a->GetZDepth() < b->GetZDepth();
        }
        return b->GetId() < a->GetId();
    });
    
    // 透明：从后到前，与程序无关
    std::stable_sort(transparent.begin(), transparent.end(), [](const SceneNode* a, const SceneNode* b) {
        if (a->GetRenderOrder() != b->GetRenderOrder()) {
            return a->GetRenderOrder() < b->GetRenderOrder();
        }
        if (a->GetZDepth() != b->GetZDepth()) {
            return b->GetZDepth() < a->GetZDepth();
        }
        return b->GetId() < a->GetId();
    });
    
    std::stable_sort(ui.begin(), ui.end(), [](const SceneNode* a, const SceneNode* b) {
        if (a->GetRenderOrder() != b->GetRenderOrder()) {
            return a->GetRenderOrder() < b->GetRenderOrder();
        }
        if (a->GetProgram()->GetId() != b->GetProgram()->GetId()) {
            return a->GetProgram()->GetId() < b->GetProgram()->GetId();
        }
        return b->GetId() < a->GetId();
    });
    
    m_stats.opaqueCount = static_cast<uint32_t>(opaque.size());
    m_stats.transparentCount = static_cast<uint32_t>(transparent.size());
    m_stats.uiCount = static_cast<uint32_t>(ui.size());
    
    std::vector<SceneNode*> sorted;
    sorted.reserve(renderList.size());
    sorted.insert(sorted.end(), opaque.begin(), opaque.end());
    sorted.insert(sorted.end(), transparent.begin(), transparent.end());
    sorted.insert(sorted.end(), ui.begin(), ui.end());
    return sorted;
}

// ============================================================================
// 帧渲染
// ============================================================================

void Renderer::Render(SceneNode& scene, Camera* camera, const RenderOptions& options) {
    RenderTarget* target = options.target;
    
    if (target) {
        m_state->BindFramebuffer(FramebufferTarget::Framebuffer, target->GetHandle());
        m_state->SetViewport(target->GetWidth(), target->GetHeight());
    } else {
        m_state->BindFramebuffer(FramebufferTarget::Framebuffer, std::nullopt);
        m_state->SetViewport(static_cast<int>(m_width * m_devicePixelRatio),
                             static_cast<int>(m_height * m_devicePixelRatio));
    }
    
    if (options.clear.value_or(m_autoClear)) {
        // 深度写入关闭时深度缓冲无法被清除
        if (m_depth && (!target || target->HasDepth())) {
            m_state->SetEnabled(Capability::DepthTest, true);
            m_state->SetDepthMask(true);
        }
        m_device->Clear(m_clearMask);
    }
    
    if (options.update) {
        scene.UpdateMatrixWorld();
    }
    
    // 相机不一定挂在场景里
    if (camera) {
        camera->UpdateMatrixWorld();
    }
    
    std::vector<SceneNode*> renderList = GetRenderList(scene, camera, options.frustumCull, options.sort);
    
    DrawContext context;
    context.camera = camera;
    context.renderer = this;
    
    for (SceneNode* node : renderList) {
        node->Draw(context);
        ++m_stats.drawCalls;
    }
    
    LOG_DEBUG_F("[Renderer] Frame: %u traversed, %u culled, %u drawn",
                m_stats.traversedNodes, m_stats.culledNodes, m_stats.drawCalls);
}

bool Renderer::HasExtension(const std::string& name) const {
    auto it = m_extensions.find(name);
    return it != m_extensions.end() && it->second;
}

} // namespace Lumen

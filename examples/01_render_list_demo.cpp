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
/**
 * @file 01_render_list_demo.cpp
 * @brief 渲染列表演示 - 分桶、排序与离屏渲染
 * 
 * 每个节点用裁剪矩形 + 清屏画出一个色块，后绘制的覆盖先绘制的，
 * 因此屏幕上的遮挡关系直接反映渲染列表的顺序：
 * 不透明组按程序分组、由近到远；透明组由远到近；UI 最后。
 * 左上角是同一场景渲染到帧缓冲后再 blit 到屏幕的结果。
 */

#include "lumen/renderer.h"
#include "lumen/window_surface.h"
#include "lumen/framebuffer.h"
#include "lumen/camera.h"
#include "lumen/math_utils.h"
#include "lumen/error.h"
#include "lumen/logger.h"
#include <glad/glad.h>
#include <SDL3/SDL.h>
#include <algorithm>
#include <cmath>
#include <filesystem>

using namespace Lumen;

/**
 * @brief 以世界位置为中心的屏幕空间色块
 */
class RectNode : public RenderNode {
public:
    RectNode(const Ref<Program>& program, const Vector4& color, float halfSize)
        : RenderNode(program), m_color(color), m_halfSize(halfSize) {
        SetBoundingSphere(BoundingSphere(Vector3::Zero(), halfSize * 1.5f));
    }
    
    void Draw(const DrawContext& context) override {
        const PipelineState& state = context.renderer->GetRenderState().GetState();
        int viewportWidth = state.viewport.width.value_or(0);
        int viewportHeight = state.viewport.height.value_or(0);
        
        Vector3 center = GetWorldPosition();
        Vector3 minNdc(-m_halfSize, -m_halfSize, 0.0f);
        Vector3 maxNdc(m_halfSize, m_halfSize, 0.0f);
        if (context.camera) {
            const Matrix4& pv = context.camera->GetProjectionViewMatrix();
            minNdc = MathUtils::TransformPoint(pv, center - Vector3(m_halfSize, m_halfSize, 0.0f));
            maxNdc = MathUtils::TransformPoint(pv, center + Vector3(m_halfSize, m_halfSize, 0.0f));
        } else {
            minNdc += center;
            maxNdc += center;
        }
        
        int x0 = static_cast<int>((minNdc.x() * 0.5f + 0.5f) * viewportWidth);
        int y0 = static_cast<int>((minNdc.y() * 0.5f + 0.5f) * viewportHeight);
        int x1 = static_cast<int>((maxNdc.x() * 0.5f + 0.5f) * viewportWidth);
        int y1 = static_cast<int>((maxNdc.y() * 0.5f + 0.5f) * viewportHeight);
        if (x1 <= x0 || y1 <= y0) {
            return;
        }
        
        context.renderer->Enable(Capability::ScissorTest);
        glScissor(x0, y0, x1 - x0, y1 - y0);
        glClearColor(m_color.x(), m_color.y(), m_color.z(), m_color.w());
        glClear(GL_COLOR_BUFFER_BIT);
        context.renderer->Disable(Capability::ScissorTest);
    }
    
private:
    Vector4 m_color;
    float m_halfSize;
};

static Ref<RectNode> AddRect(SceneNode& parent, const Ref<Program>& program, const Vector3& position,
                             const Vector4& color, float halfSize = 0.6f) {
    auto node = CreateRef<RectNode>(program, color, halfSize);
    node->SetPosition(position);
    parent.AddChild(node);
    return node;
}

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;
    
    Logger::GetInstance().SetLogToConsole(true);
    Logger::GetInstance().SetLogToFile(true);
    Logger::GetInstance().SetLogLevel(LogLevel::Info);
    
    LOG_INFO("========================================");
    LOG_INFO("Render List Demo");
    LOG_INFO("========================================");
    
    auto surface = CreateRef<WindowSurface>("01 - Render List Demo");
    
    RendererOptions options;
    options.width = 1280;
    options.height = 720;
    const std::string configPath = "config/renderer.json";
    if (std::filesystem::exists(configPath) && !LoadRendererOptions(configPath, options)) {
        LOG_WARNING("Invalid renderer config, using defaults");
    }
    options.surface = surface;
    
    Scope<Renderer> renderer;
    try {
        renderer = CreateScope<Renderer>(options);
    } catch (const RenderError& e) {
        LOG_ERROR("Failed to create renderer: " + e.GetFullMessage());
        return -1;
    }
    
    // 程序
    auto solidA = CreateRef<Program>("solid_a");
    auto solidB = CreateRef<Program>("solid_b");
    auto glass = CreateRef<Program>("glass", true, true);
    auto overlay = CreateRef<Program>("overlay", true, false);
    
    // 场景
    SceneNode scene;
    auto orbit = CreateRef<SceneNode>();
    scene.AddChild(orbit);
    
    for (int i = 0; i < 5; ++i) {
        float x = -4.0f + 2.0f * static_cast<float>(i);
        const Ref<Program>& program = (i % 2 == 0) ? solidA : solidB;
        Vector4 color = (i % 2 == 0) ? Vector4(0.85f, 0.35f, 0.25f, 1.0f) : Vector4(0.25f, 0.65f, 0.35f, 1.0f);
        AddRect(*orbit, program, Vector3(x, 0.0f, -static_cast<float>(i)), color, 1.0f);
    }
    
    AddRect(scene, glass, Vector3(-1.0f, 0.5f, 1.0f), Vector4(0.3f, 0.5f, 0.9f, 1.0f));
    AddRect(scene, glass, Vector3(-0.5f, 0.2f, -2.0f), Vector4(0.6f, 0.4f, 0.9f, 1.0f), 1.2f);
    
    auto badge = AddRect(scene, overlay, Vector3(0.0f, 2.5f, 0.0f), Vector4(1.0f, 0.85f, 0.2f, 1.0f), 0.4f);
    auto topBadge = AddRect(scene, overlay, Vector3(0.3f, 2.7f, 0.0f), Vector4(1.0f, 1.0f, 1.0f, 1.0f), 0.3f);
    topBadge->SetRenderOrder(1);
    
    // 相机
    Camera camera;
    camera.SetPerspective(60.0f, static_cast<float>(options.width) / static_cast<float>(options.height), 0.1f, 100.0f);
    
    // 离屏目标
    Framebuffer offscreen;
    FramebufferConfig fbConfig;
    fbConfig.width = std::max(1, options.width / 4);
    fbConfig.height = std::max(1, options.height / 4);
    fbConfig.name = "Preview";
    fbConfig.floatColor = renderer->HasExtension(Renderer::EXT_COLOR_BUFFER_FLOAT);
    if (!offscreen.Create(*renderer, fbConfig)) {
        LOG_WARNING("Preview framebuffer unavailable, skipping offscreen pass");
    }
    
    LOG_INFO("Press ESC to exit, SPACE to toggle sorting, C to toggle culling");
    
    bool running = true;
    bool sortEnabled = true;
    bool cullEnabled = true;
    uint32_t frameCount = 0;
    uint64_t startTicks = SDL_GetTicks();
    
    while (running) {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            if (event.type == SDL_EVENT_QUIT) {
                running = false;
            }
            
            if (event.type == SDL_EVENT_KEY_DOWN) {
                if (event.key.key == SDLK_ESCAPE) {
                    running = false;
                } else if (event.key.key == SDLK_SPACE) {
                    sortEnabled = !sortEnabled;
                    LOG_INFO_F("Sorting %s", sortEnabled ? "enabled" : "disabled");
                } else if (event.key.key == SDLK_C) {
                    cullEnabled = !cullEnabled;
                    LOG_INFO_F("Frustum culling %s", cullEnabled ? "enabled" : "disabled");
                }
            }
            
            if (event.type == SDL_EVENT_WINDOW_RESIZED) {
                int width = std::max(1, static_cast<int>(event.window.data1));
                int height = std::max(1, static_cast<int>(event.window.data2));
                renderer->SetSize(width, height);
                camera.SetAspectRatio(static_cast<float>(width) / static_cast<float>(height));
                
                // 预览保持窗口的四分之一大小
                if (offscreen.IsValid() &&
                    !offscreen.Resize(*renderer, std::max(1, width / 4), std::max(1, height / 4))) {
                    LOG_WARNING("Preview framebuffer resize failed, skipping offscreen pass");
                }
            }
        }
        
        float time = static_cast<float>(SDL_GetTicks() - startTicks) / 1000.0f;
        
        // 场景整体左右摆动，部分色块会移出视锥体
        orbit->SetPosition(Vector3(std::sin(time * 0.7f) * 6.0f, 0.0f, 0.0f));
        badge->SetPosition(Vector3(std::cos(time) * 0.5f, 2.5f, 0.0f));
        
        camera.SetPosition(Vector3(std::sin(time * 0.3f) * 2.0f, 1.0f, 10.0f));
        camera.LookAt(Vector3::Zero());
        
        RenderOptions renderOptions;
        renderOptions.sort = sortEnabled;
        renderOptions.frustumCull = cullEnabled;
        
        // 离屏预览
        if (offscreen.IsValid()) {
            glClearColor(0.05f, 0.05f, 0.08f, 1.0f);
            RenderOptions previewOptions = renderOptions;
            previewOptions.target = &offscreen;
            renderer->Render(scene, &camera, previewOptions);
        }
        
        // 主画面
        glClearColor(0.1f, 0.12f, 0.16f, 1.0f);
        renderer->Render(scene, &camera, renderOptions);
        
        if (offscreen.IsValid()) {
            int backingHeight = surface->GetBackingHeight();
            renderer->BindFramebuffer(FramebufferTarget::ReadFramebuffer, offscreen.GetHandle());
            renderer->BindFramebuffer(FramebufferTarget::DrawFramebuffer);
            glBlitFramebuffer(0, 0, offscreen.GetWidth(), offscreen.GetHeight(),
                              16, backingHeight - 16 - offscreen.GetHeight(),
                              16 + offscreen.GetWidth(), backingHeight - 16,
                              GL_COLOR_BUFFER_BIT, GL_NEAREST);
        }
        
        surface->SwapBuffers();
        
        ++frameCount;
        if (frameCount % 300 == 0) {
            const RenderStats& stats = renderer->GetStats();
            LOG_INFO_F("Frame %u: traversed %u, culled %u, opaque %u, transparent %u, ui %u, draws %u",
                       frameCount, stats.traversedNodes, stats.culledNodes, stats.opaqueCount,
                       stats.transparentCount, stats.uiCount, stats.drawCalls);
        }
    }
    
    offscreen.Release();
    renderer.reset();
    
    LOG_INFO("Demo finished");
    return 0;
}

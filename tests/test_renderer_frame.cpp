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
 * @file test_renderer_frame.cpp
 * @brief 渲染器构造、尺寸与单帧执行测试
 */

#include "lumen/renderer.h"
#include "lumen/camera.h"
#include "lumen/error.h"
#include "lumen/logger.h"
#include "support/fake_surface.h"
#include "support/test_nodes.h"
#include <iostream>

using namespace Lumen;
using namespace Lumen::Testing;

static int g_testCount = 0;
static int g_passedCount = 0;
static int g_failedCount = 0;

#define TEST_ASSERT(condition, message) \
    do { \
        g_testCount++; \
        if (!(condition)) { \
            std::cerr << "❌ 测试失败: " << message << std::endl; \
            std::cerr << "   位置: " << __FILE__ << ":" << __LINE__ << std::endl; \
            g_failedCount++; \
            return false; \
        } \
        g_passedCount++; \
    } while(0)

#define RUN_TEST(test_func) \
    do { \
        std::cout << "运行测试: " << #test_func << "..." << std::endl; \
        if (test_func()) { \
            std::cout << "✓ " << #test_func << " 通过" << std::endl; \
        } else { \
            std::cout << "✗ " << #test_func << " 失败" << std::endl; \
        } \
    } while(0)

static Scope<Renderer> CreateTestRenderer(const Ref<FakeSurface>& surface, RendererOptions options = RendererOptions()) {
    options.surface = surface;
    return CreateScope<Renderer>(options);
}

// ============================================================================
// 构造
// ============================================================================

bool Test_Construct_QueriesContextAndParameters() {
    auto surface = CreateRef<FakeSurface>();
    surface->device->maxTextureUnits = 24;
    surface->device->maxAnisotropy = 8.0f;
    surface->device->extensions.insert(Renderer::EXT_COLOR_BUFFER_FLOAT);
    
    RendererOptions options;
    options.alpha = true;
    options.stencil = true;
    options.antialias = true;
    options.powerPreference = PowerPreference::HighPerformance;
    auto renderer = CreateTestRenderer(surface, options);
    
    TEST_ASSERT(surface->contextCount == 1, "应只创建一次上下文");
    TEST_ASSERT(surface->lastAttributes.alpha && surface->lastAttributes.stencil, "上下文属性应被转发");
    TEST_ASSERT(surface->lastAttributes.antialias, "抗锯齿属性应被转发");
    TEST_ASSERT(surface->lastAttributes.depth, "深度缓冲默认开启");
    TEST_ASSERT(surface->lastAttributes.powerPreference == PowerPreference::HighPerformance, "功耗偏好应被转发");
    
    TEST_ASSERT(renderer->GetParameters().maxTextureUnits == 24, "应查询最大纹理单元数");
    TEST_ASSERT(renderer->GetParameters().maxAnisotropy == 8.0f, "应查询最大各向异性");
    TEST_ASSERT(renderer->GetRenderState().GetMaxTextureUnits() == 24, "状态跟踪器的纹理单元数应等于查询值");
    
    TEST_ASSERT(renderer->HasExtension(Renderer::EXT_COLOR_BUFFER_FLOAT), "浮点颜色缓冲扩展应可用");
    TEST_ASSERT(!renderer->HasExtension(Renderer::EXT_TEXTURE_FLOAT_LINEAR), "浮点线性过滤扩展不可用");
    TEST_ASSERT(renderer->GetExtensions().size() == 2, "应探测两个扩展");
    
    return true;
}

bool Test_Construct_IdsAreMonotonic() {
    auto first = CreateTestRenderer(CreateRef<FakeSurface>());
    auto second = CreateTestRenderer(CreateRef<FakeSurface>());
    
    TEST_ASSERT(first->GetId() > 0, "渲染器 ID 从 1 开始");
    TEST_ASSERT(second->GetId() > first->GetId(), "渲染器 ID 应单调递增");
    
    return true;
}

bool Test_Construct_ContextFailureThrows() {
    auto surface = CreateRef<FakeSurface>();
    surface->failContext = true;
    
    bool thrown = false;
    try {
        auto renderer = CreateTestRenderer(surface);
    } catch (const RenderError& e) {
        thrown = e.GetCode() == ErrorCode::GLContextCreationFailed;
    }
    
    TEST_ASSERT(thrown, "上下文创建失败时应抛出 GLContextCreationFailed");
    
    return true;
}

bool Test_Construct_IndependentStateCaches() {
    auto surfaceA = CreateRef<FakeSurface>();
    auto surfaceB = CreateRef<FakeSurface>();
    auto a = CreateTestRenderer(surfaceA);
    auto b = CreateTestRenderer(surfaceB);
    
    a->SetViewport(640, 480);
    b->SetViewport(640, 480);
    
    TEST_ASSERT(surfaceA->device->Count("Viewport 0 0 640 480") == 1, "渲染器 A 应发出视口调用");
    TEST_ASSERT(surfaceB->device->Count("Viewport 0 0 640 480") == 1, "渲染器 B 的缓存与 A 无关");
    
    return true;
}

// ============================================================================
// 尺寸
// ============================================================================

bool Test_SetSize_ScalesBackingByPixelRatio() {
    auto surface = CreateRef<FakeSurface>();
    RendererOptions options;
    options.devicePixelRatio = 2.0f;
    auto renderer = CreateTestRenderer(surface, options);
    
    TEST_ASSERT(surface->backingWidth == 600 && surface->backingHeight == 300, "构造时应使用默认尺寸 300x150");
    
    renderer->SetSize(800, 600);
    TEST_ASSERT(surface->backingWidth == 1600 && surface->backingHeight == 1200, "像素尺寸应为 1600x1200");
    TEST_ASSERT(surface->displayWidth == 800 && surface->displayHeight == 600, "显示尺寸应为 800x600");
    TEST_ASSERT(renderer->GetWidth() == 800 && renderer->GetHeight() == 600, "逻辑尺寸应为 800x600");
    
    return true;
}

// ============================================================================
// 帧执行
// ============================================================================

bool Test_Render_DefaultSurfaceSequence() {
    auto surface = CreateRef<FakeSurface>();
    RendererOptions options;
    options.width = 800;
    options.height = 600;
    options.devicePixelRatio = 2.0f;
    auto renderer = CreateTestRenderer(surface, options);
    RecordingDevice& device = *surface->device;
    device.Reset();
    
    std::vector<std::string> drawLog;
    SceneNode scene;
    auto program = CreateRef<Program>("opaque");
    AddTestNode(scene, "a", program, Vector3::Zero(), &drawLog);
    
    renderer->Render(scene);
    
    TEST_ASSERT(device.calls.size() == 5, "默认表面一帧应发出 5 个驱动调用");
    TEST_ASSERT(device.calls[0] == "BindFramebuffer 0 0", "首先绑定默认表面");
    TEST_ASSERT(device.calls[1] == "Viewport 0 0 1600 1200", "视口为逻辑尺寸乘以像素比");
    TEST_ASSERT(device.calls[2] == "Enable DepthTest", "清屏前开启深度测试");
    TEST_ASSERT(device.calls[3] == "DepthMask 1", "清屏前开启深度写入");
    TEST_ASSERT(device.calls[4] == "Clear " + std::to_string(ClearMask_Color | ClearMask_Depth), "清除颜色和深度");
    TEST_ASSERT(drawLog.size() == 1 && drawLog[0] == "a", "节点应被绘制一次");
    TEST_ASSERT(renderer->GetStats().drawCalls == 1, "绘制统计应为 1");
    
    return true;
}

bool Test_GetRenderList_ResetsPreviousFrameStats() {
    auto surface = CreateRef<FakeSurface>();
    auto renderer = CreateTestRenderer(surface);
    
    SceneNode scene;
    auto program = CreateRef<Program>("opaque");
    AddTestNode(scene, "a", program);
    AddTestNode(scene, "b", program);
    
    renderer->Render(scene);
    TEST_ASSERT(renderer->GetStats().drawCalls == 2, "上一帧绘制了 2 个节点");
    
    SceneNode empty;
    renderer->GetRenderList(empty, nullptr);
    const RenderStats& stats = renderer->GetStats();
    TEST_ASSERT(stats.drawCalls == 0, "单独构建列表不应保留上一帧的绘制数");
    TEST_ASSERT(stats.opaqueCount == 0 && stats.traversedNodes == 1, "统计应只反映本次构建");
    
    return true;
}

bool Test_Render_ViewportIssuedOnceAcrossFrames() {
    auto surface = CreateRef<FakeSurface>();
    auto renderer = CreateTestRenderer(surface);
    SceneNode scene;
    
    renderer->Render(scene);
    renderer->Render(scene);
    renderer->Render(scene);
    
    TEST_ASSERT(surface->device->CountPrefix("Viewport") == 1, "尺寸不变时视口只设置一次");
    TEST_ASSERT(surface->device->CountPrefix("Clear") == 3, "每帧都应清屏");
    
    return true;
}

bool Test_Render_TargetWithoutDepth() {
    auto surface = CreateRef<FakeSurface>();
    RendererOptions options;
    options.devicePixelRatio = 3.0f;
    auto renderer = CreateTestRenderer(surface, options);
    RecordingDevice& device = *surface->device;
    device.Reset();
    
    FakeTarget target(7, 256, 128, false);
    SceneNode scene;
    RenderOptions renderOptions;
    renderOptions.target = &target;
    renderer->Render(scene, nullptr, renderOptions);
    
    TEST_ASSERT(device.calls[0] == "BindFramebuffer 0 7", "应绑定渲染目标");
    TEST_ASSERT(device.calls[1] == "Viewport 0 0 256 128", "目标视口不乘像素比");
    TEST_ASSERT(device.CountPrefix("Enable") == 0, "目标没有深度时不开启深度测试");
    TEST_ASSERT(device.CountPrefix("DepthMask") == 0, "目标没有深度时不修改深度写入");
    TEST_ASSERT(device.Last() == "Clear " + std::to_string(ClearMask_Color | ClearMask_Depth), "清屏掩码由渲染器配置决定");
    TEST_ASSERT(renderer->GetRenderState().GetState().framebuffer == 7u, "缓存应记录目标句柄");
    
    return true;
}

bool Test_Render_TargetWithDepth() {
    auto surface = CreateRef<FakeSurface>();
    auto renderer = CreateTestRenderer(surface);
    RecordingDevice& device = *surface->device;
    device.Reset();
    
    FakeTarget target(3, 64, 64, true);
    SceneNode scene;
    RenderOptions renderOptions;
    renderOptions.target = &target;
    renderer->Render(scene, nullptr, renderOptions);
    
    TEST_ASSERT(device.Count("Enable DepthTest") == 1, "目标带深度时应开启深度测试");
    TEST_ASSERT(device.Count("DepthMask 1") == 1, "目标带深度时应开启深度写入");
    
    return true;
}

bool Test_Render_ClearFlagAndAutoClear() {
    auto surface = CreateRef<FakeSurface>();
    RendererOptions options;
    options.autoClear = false;
    auto renderer = CreateTestRenderer(surface, options);
    RecordingDevice& device = *surface->device;
    SceneNode scene;
    
    renderer->Render(scene);
    TEST_ASSERT(device.CountPrefix("Clear") == 0, "autoClear 关闭时不清屏");
    
    RenderOptions renderOptions;
    renderOptions.clear = true;
    renderer->Render(scene, nullptr, renderOptions);
    TEST_ASSERT(device.CountPrefix("Clear") == 1, "显式 clear 覆盖 autoClear");
    
    renderer->SetAutoClear(true);
    renderOptions.clear = false;
    renderer->Render(scene, nullptr, renderOptions);
    TEST_ASSERT(device.CountPrefix("Clear") == 1, "显式 clear=false 时不清屏");
    
    return true;
}

bool Test_Render_ClearMaskFollowsBufferOptions() {
    auto surface = CreateRef<FakeSurface>();
    RendererOptions options;
    options.depth = false;
    options.stencil = true;
    auto renderer = CreateTestRenderer(surface, options);
    RecordingDevice& device = *surface->device;
    device.Reset();
    
    SceneNode scene;
    renderer->Render(scene);
    
    TEST_ASSERT(renderer->GetClearMask() == (ClearMask_Color | ClearMask_Stencil), "清屏掩码应为颜色加模板");
    TEST_ASSERT(device.Last() == "Clear " + std::to_string(ClearMask_Color | ClearMask_Stencil), "应清除颜色和模板");
    TEST_ASSERT(device.CountPrefix("Enable") == 0, "没有深度缓冲时不开启深度测试");
    
    return true;
}

bool Test_Render_UpdateFlagControlsWorldMatrices() {
    auto surface = CreateRef<FakeSurface>();
    auto renderer = CreateTestRenderer(surface);
    
    SceneNode scene;
    auto program = CreateRef<Program>("opaque");
    auto node = AddTestNode(scene, "a", program, Vector3(1, 2, 3));
    
    RenderOptions noUpdate;
    noUpdate.update = false;
    renderer->Render(scene, nullptr, noUpdate);
    TEST_ASSERT(node->GetWorldPosition().isZero(), "update=false 时不更新世界矩阵");
    
    renderer->Render(scene);
    TEST_ASSERT(node->GetWorldPosition().isApprox(Vector3(1, 2, 3)), "update=true 时更新世界矩阵");
    
    return true;
}

bool Test_Render_CameraOutsideSceneIsUpdated() {
    auto surface = CreateRef<FakeSurface>();
    auto renderer = CreateTestRenderer(surface);
    
    SceneNode scene;
    auto program = CreateRef<Program>("opaque");
    auto node = AddTestNode(scene, "a", program, Vector3(0, 0, -5));
    
    Camera camera;
    camera.SetPosition(Vector3(0, 0, 5));
    renderer->Render(scene, &camera);
    
    TEST_ASSERT(camera.GetWorldPosition().isApprox(Vector3(0, 0, 5)), "相机世界矩阵应被更新");
    TEST_ASSERT(camera.GetViewMatrix().isApprox(camera.GetWorldMatrix().inverse()), "视图矩阵为世界矩阵的逆");
    TEST_ASSERT(node->drawCount == 1, "视锥体内的节点应被绘制");
    TEST_ASSERT(node->lastContext.camera == &camera, "绘制上下文应携带相机");
    TEST_ASSERT(node->lastContext.renderer == renderer.get(), "绘制上下文应携带渲染器");
    
    return true;
}

bool Test_Render_DrawsInSortedOrder() {
    auto surface = CreateRef<FakeSurface>();
    auto renderer = CreateTestRenderer(surface);
    
    std::vector<std::string> drawLog;
    SceneNode scene;
    auto opaque = CreateRef<Program>("opaque");
    auto ui = CreateRef<Program>("ui", true, false);
    AddTestNode(scene, "ui", ui, Vector3::Zero(), &drawLog);
    AddTestNode(scene, "opaque", opaque, Vector3::Zero(), &drawLog);
    
    renderer->Render(scene);
    std::vector<std::string> expected = {"opaque", "ui"};
    TEST_ASSERT(drawLog == expected, "排序开启时按渲染列表顺序绘制");
    
    drawLog.clear();
    RenderOptions unsorted;
    unsorted.sort = false;
    renderer->Render(scene, nullptr, unsorted);
    std::vector<std::string> traversal = {"ui", "opaque"};
    TEST_ASSERT(drawLog == traversal, "sort=false 时按遍历顺序绘制");
    
    return true;
}

// ============================================================================
// 状态转发
// ============================================================================

bool Test_Forwarders_ReachStateTracker() {
    auto surface = CreateRef<FakeSurface>();
    auto renderer = CreateTestRenderer(surface);
    RecordingDevice& device = *surface->device;
    device.Reset();
    
    renderer->Enable(Capability::Blend);
    renderer->SetBlendFunction(BlendFactor::SrcAlpha, BlendFactor::OneMinusSrcAlpha);
    renderer->SetBlendEquation(BlendEquationMode::Add);
    renderer->SetCullFace(CullFace::Front);
    renderer->SetFrontFace(FrontFace::Clockwise);
    renderer->SetDepthMask(false);
    renderer->SetDepthFunction(DepthFunc::Always);
    renderer->ActiveTexture(1);
    renderer->BindTexture(1, TextureTarget::Texture2D, 11);
    renderer->BindFramebuffer(FramebufferTarget::Framebuffer, 4u);
    renderer->Disable(Capability::Blend);
    
    TEST_ASSERT(device.calls.size() == 11, "每个转发方法发出一次调用");
    TEST_ASSERT(device.calls[0] == "Enable Blend", "Enable 应转发");
    TEST_ASSERT(device.calls[8] == "BindTexture 0 11", "BindTexture 应转发");
    TEST_ASSERT(device.Last() == "Disable Blend", "Disable 应转发");
    
    const PipelineState& state = renderer->GetRenderState().GetState();
    TEST_ASSERT(state.cullFace == CullFace::Front, "剔除面应记录");
    TEST_ASSERT(state.activeTextureUnit == 1, "活动纹理单元应记录");
    TEST_ASSERT(state.framebuffer == 4u, "帧缓冲句柄应记录");
    
    renderer->ForgetTexture(11);
    renderer->ForgetFramebuffer(4);
    TEST_ASSERT(state.textureUnits[1] == 0, "删除纹理应同步到缓存");
    TEST_ASSERT(!state.framebuffer.has_value(), "删除帧缓冲应同步到缓存");
    TEST_ASSERT(device.calls.size() == 11, "同步缓存不发出调用");
    
    return true;
}

int main() {
    Logger::GetInstance().SetLogToConsole(false);
    Logger::GetInstance().SetLogToFile(false);
    
    std::cout << "========================================" << std::endl;
    std::cout << "Renderer 帧执行测试" << std::endl;
    std::cout << "========================================" << std::endl;
    
    std::cout << "\n--- 构造与尺寸 ---" << std::endl;
    RUN_TEST(Test_Construct_QueriesContextAndParameters);
    RUN_TEST(Test_Construct_IdsAreMonotonic);
    RUN_TEST(Test_Construct_ContextFailureThrows);
    RUN_TEST(Test_Construct_IndependentStateCaches);
    RUN_TEST(Test_SetSize_ScalesBackingByPixelRatio);
    
    std::cout << "\n--- 帧执行 ---" << std::endl;
    RUN_TEST(Test_Render_DefaultSurfaceSequence);
    RUN_TEST(Test_GetRenderList_ResetsPreviousFrameStats);
    RUN_TEST(Test_Render_ViewportIssuedOnceAcrossFrames);
    RUN_TEST(Test_Render_TargetWithoutDepth);
    RUN_TEST(Test_Render_TargetWithDepth);
    RUN_TEST(Test_Render_ClearFlagAndAutoClear);
    RUN_TEST(Test_Render_ClearMaskFollowsBufferOptions);
    RUN_TEST(Test_Render_UpdateFlagControlsWorldMatrices);
    RUN_TEST(Test_Render_CameraOutsideSceneIsUpdated);
    RUN_TEST(Test_Render_DrawsInSortedOrder);
    
    std::cout << "\n--- 状态转发 ---" << std::endl;
    RUN_TEST(Test_Forwarders_ReachStateTracker);
    
    std::cout << "\n========================================" << std::endl;
    std::cout << "测试完成" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "总测试数: " << g_testCount << std::endl;
    std::cout << "通过: " << g_passedCount << " ✓" << std::endl;
    std::cout << "失败: " << g_failedCount << " ✗" << std::endl;
    
    if (g_failedCount == 0) {
        std::cout << "\n🎉 所有测试通过！" << std::endl;
        return 0;
    } else {
        std::cout << "\n❌ 有测试失败！" << std::endl;
        return 1;
    }
}

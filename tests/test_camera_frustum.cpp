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
 * @file test_camera_frustum.cpp
 * @brief 相机投影、视图矩阵与视锥体测试
 */

#include "lumen/camera.h"
#include "lumen/error.h"
#include "lumen/logger.h"
#include "lumen/math_utils.h"
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

/**
 * @brief 正交相机：x, y ∈ [-1, 1]，可见深度 0.1 ~ 10
 */
static void SetupOrthoCamera(Camera& camera) {
    camera.SetOrthographic(-1.0f, 1.0f, -1.0f, 1.0f, 0.1f, 10.0f);
    camera.UpdateMatrixWorld();
    camera.UpdateFrustum();
}

// ============================================================================
// 投影
// ============================================================================

bool Test_Camera_Defaults() {
    Camera camera;
    
    TEST_ASSERT(camera.GetProjectionType() == ProjectionType::Perspective, "默认透视投影");
    TEST_ASSERT(camera.GetFieldOfView() == 45.0f, "默认视场角 45 度");
    TEST_ASSERT(camera.GetAspectRatio() == 1.0f, "默认宽高比 1");
    TEST_ASSERT(camera.GetNearPlane() == 0.1f && camera.GetFarPlane() == 100.0f, "默认裁剪面 0.1 ~ 100");
    TEST_ASSERT(!camera.IsFrustumCulled(), "相机自身不参与裁剪");
    TEST_ASSERT(!camera.IsDrawable(), "相机不可绘制");
    TEST_ASSERT(camera.GetProjectionMatrix().isApprox(MathUtils::PerspectiveDegrees(45.0f, 1.0f, 0.1f, 100.0f)),
                "默认投影矩阵");
    
    return true;
}

bool Test_Camera_SetAspectRatio() {
    Camera camera;
    camera.SetAspectRatio(2.0f);
    
    TEST_ASSERT(camera.GetProjectionMatrix().isApprox(MathUtils::PerspectiveDegrees(45.0f, 2.0f, 0.1f, 100.0f)),
                "透视投影应随宽高比更新");
    
    Matrix4 custom = Matrix4::Identity();
    custom(0, 0) = 0.5f;
    camera.SetProjectionMatrix(custom);
    camera.SetAspectRatio(4.0f);
    
    TEST_ASSERT(camera.GetProjectionType() == ProjectionType::Custom, "应切换为自定义投影");
    TEST_ASSERT(camera.GetProjectionMatrix().isApprox(custom), "自定义投影不随宽高比变化");
    
    return true;
}

bool Test_Camera_SetPerspectiveClampsInvalidInput() {
    auto& handler = ErrorHandler::GetInstance();
    int warnings = 0;
    size_t callbackId = handler.AddCallback([&warnings](const RenderError& error) {
        if (error.GetSeverity() == ErrorSeverity::Warning) {
            ++warnings;
        }
    });
    
    Camera camera;
    camera.SetPerspective(200.0f, -1.0f, 0.0f, 10.0f);
    
    handler.RemoveCallback(callbackId);
    
    TEST_ASSERT(warnings == 3, "三个无效参数各报告一次警告");
    TEST_ASSERT(camera.GetFieldOfView() == 179.0f, "视场角应被限制到 179");
    TEST_ASSERT(camera.GetAspectRatio() == 1.0f, "无效宽高比回退为 1");
    TEST_ASSERT(camera.GetNearPlane() == 0.01f, "近裁剪面至少 0.01");
    TEST_ASSERT(camera.GetFarPlane() == 10.0f, "有效远裁剪面保持不变");
    
    camera.SetPerspective(60.0f, 1.5f, 5.0f, 1.0f);
    TEST_ASSERT(camera.GetNearPlane() == 5.0f && camera.GetFarPlane() == 6.0f, "远裁剪面至少比近裁剪面大 1");
    
    return true;
}

// ============================================================================
// 视图矩阵
// ============================================================================

bool Test_Camera_ViewIsInverseOfWorld() {
    Camera camera;
    camera.SetPosition(Vector3(1, 2, 3));
    camera.UpdateMatrixWorld();
    
    TEST_ASSERT(camera.GetViewMatrix().isApprox(camera.GetWorldMatrix().inverse()), "视图矩阵为世界矩阵的逆");
    TEST_ASSERT(MathUtils::TransformPoint(camera.GetViewMatrix(), Vector3(1, 2, 3)).isZero(1e-5f),
                "相机位置在视图空间中为原点");
    TEST_ASSERT(camera.GetProjectionViewMatrix().isApprox(camera.GetProjectionMatrix() * camera.GetViewMatrix()),
                "投影视图矩阵为投影乘视图");
    
    return true;
}

bool Test_Camera_FollowsParent() {
    SceneNode rig;
    auto camera = CreateRef<Camera>();
    rig.AddChild(camera);
    rig.SetPosition(Vector3(0, 10, 0));
    camera->SetPosition(Vector3(0, 0, 5));
    
    rig.UpdateMatrixWorld();
    
    TEST_ASSERT(camera->GetWorldPosition().isApprox(Vector3(0, 10, 5)), "相机世界位置应包含父节点偏移");
    TEST_ASSERT(MathUtils::TransformPoint(camera->GetViewMatrix(), Vector3(0, 10, 0)).isApprox(Vector3(0, 0, -5), 1e-5f),
                "通过场景更新时视图矩阵也应刷新");
    
    return true;
}

bool Test_Camera_LookAt() {
    Camera camera;
    camera.SetPosition(Vector3(5, 0, 0));
    camera.LookAt(Vector3::Zero());
    camera.UpdateMatrixWorld();
    
    Vector3 forward = camera.GetRotation() * Vector3(0, 0, -1);
    TEST_ASSERT(forward.isApprox(Vector3(-1, 0, 0), 1e-5f), "相机应朝向原点（-Z 为前方）");
    TEST_ASSERT(MathUtils::TransformPoint(camera.GetViewMatrix(), Vector3::Zero()).isApprox(Vector3(0, 0, -5), 1e-5f),
                "原点在视图空间中位于 -Z 方向 5 个单位");
    
    Quaternion before = camera.GetRotation();
    camera.LookAt(Vector3(5, 0, 0));
    TEST_ASSERT(camera.GetRotation().coeffs().isApprox(before.coeffs()), "目标与位置重合时保持原朝向");
    
    return true;
}

// ============================================================================
// 视锥体
// ============================================================================

bool Test_Frustum_Orthographic() {
    Camera camera;
    SetupOrthoCamera(camera);
    const Frustum& frustum = camera.GetFrustum();
    
    TEST_ASSERT(frustum.ContainsPoint(Vector3(0, 0, -5)), "视锥体中心点");
    TEST_ASSERT(frustum.ContainsPoint(Vector3(0.9f, -0.9f, -9.5f)), "靠近边角的点");
    TEST_ASSERT(!frustum.ContainsPoint(Vector3(2, 0, -5)), "右侧之外");
    TEST_ASSERT(!frustum.ContainsPoint(Vector3(0, -2, -5)), "下方之外");
    TEST_ASSERT(!frustum.ContainsPoint(Vector3(0, 0, -20)), "远裁剪面之外");
    TEST_ASSERT(!frustum.ContainsPoint(Vector3(0, 0, 1)), "相机后方");
    
    return true;
}

bool Test_Frustum_SphereIntersection() {
    Camera camera;
    SetupOrthoCamera(camera);
    const Frustum& frustum = camera.GetFrustum();
    
    TEST_ASSERT(frustum.IntersectsSphere(Vector3(1.5f, 0, -5), 0.6f), "跨越右平面的球体相交");
    TEST_ASSERT(!frustum.IntersectsSphere(Vector3(1.5f, 0, -5), 0.4f), "完全在右平面外的球体不相交");
    TEST_ASSERT(frustum.IntersectsSphere(Vector3(0, 0, -5), 0.0f), "内部的点球相交");
    
    return true;
}

bool Test_Frustum_Perspective() {
    Camera camera;
    camera.SetPerspective(90.0f, 1.0f, 1.0f, 100.0f);
    camera.SetPosition(Vector3(0, 0, 5));
    camera.UpdateMatrixWorld();
    camera.UpdateFrustum();
    const Frustum& frustum = camera.GetFrustum();
    
    TEST_ASSERT(frustum.ContainsPoint(Vector3(0, 0, 0)), "正前方 5 个单位");
    TEST_ASSERT(frustum.ContainsPoint(Vector3(4, 0, 0)), "90 度视场内的点");
    TEST_ASSERT(!frustum.ContainsPoint(Vector3(6, 0, 0)), "90 度视场外的点");
    TEST_ASSERT(!frustum.ContainsPoint(Vector3(0, 0, 4.5f)), "近裁剪面之前");
    TEST_ASSERT(!frustum.ContainsPoint(Vector3(0, 0, 6)), "相机后方");
    
    return true;
}

bool Test_Frustum_RefreshedOnlyOnUpdate() {
    Camera camera;
    SetupOrthoCamera(camera);
    
    camera.SetPosition(Vector3(10, 0, 0));
    camera.UpdateMatrixWorld();
    TEST_ASSERT(camera.GetFrustum().ContainsPoint(Vector3(0, 0, -5)), "UpdateFrustum 之前视锥体不变");
    
    camera.UpdateFrustum();
    TEST_ASSERT(!camera.GetFrustum().ContainsPoint(Vector3(0, 0, -5)), "UpdateFrustum 之后使用新位置");
    TEST_ASSERT(camera.GetFrustum().ContainsPoint(Vector3(10, 0, -5)), "新位置正前方的点");
    
    return true;
}

bool Test_FrustumIntersectsMesh_UsesWorldSphere() {
    Camera camera;
    SetupOrthoCamera(camera);
    
    auto program = CreateRef<Program>();
    SceneNode scene;
    auto node = AddTestNode(scene, "offset", program, Vector3(0, 0, -5));
    node->SetBoundingSphere(BoundingSphere(Vector3(3, 0, 0), 0.5f));
    scene.UpdateMatrixWorld();
    
    TEST_ASSERT(!camera.FrustumIntersectsMesh(*node), "包围球中心偏移到视锥体外");
    
    node->SetBoundingSphere(BoundingSphere(Vector3(1.2f, 0, 0), 0.5f));
    TEST_ASSERT(camera.FrustumIntersectsMesh(*node), "包围球跨越右平面");
    
    node->SetPosition(Vector3(-3, 0, -5));
    scene.UpdateMatrixWorld();
    TEST_ASSERT(!camera.FrustumIntersectsMesh(*node), "包围球随节点平移");
    
    return true;
}

int main() {
    Logger::GetInstance().SetLogToConsole(false);
    Logger::GetInstance().SetLogToFile(false);
    
    std::cout << "========================================" << std::endl;
    std::cout << "Camera 视锥体测试" << std::endl;
    std::cout << "========================================" << std::endl;
    
    std::cout << "\n--- 投影 ---" << std::endl;
    RUN_TEST(Test_Camera_Defaults);
    RUN_TEST(Test_Camera_SetAspectRatio);
    RUN_TEST(Test_Camera_SetPerspectiveClampsInvalidInput);
    
    std::cout << "\n--- 视图矩阵 ---" << std::endl;
    RUN_TEST(Test_Camera_ViewIsInverseOfWorld);
    RUN_TEST(Test_Camera_FollowsParent);
    RUN_TEST(Test_Camera_LookAt);
    
    std::cout << "\n--- 视锥体 ---" << std::endl;
    RUN_TEST(Test_Frustum_Orthographic);
    RUN_TEST(Test_Frustum_SphereIntersection);
    RUN_TEST(Test_Frustum_Perspective);
    RUN_TEST(Test_Frustum_RefreshedOnlyOnUpdate);
    RUN_TEST(Test_FrustumIntersectsMesh_UsesWorldSphere);
    
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

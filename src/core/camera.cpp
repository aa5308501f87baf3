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
#include "lumen/camera.h"
#include "lumen/error.h"
#include <algorithm>
#include <string>

namespace Lumen {

// ============================================================================
// Frustum 实现
// ============================================================================

void Frustum::ExtractFromMatrix(const Matrix4& projectionView) {
    const Matrix4& m = projectionView;
    
    // 左、右：第4行 ± 第1行
    planes[0] = Plane(Vector3(m(3, 0) + m(0, 0), m(3, 1) + m(0, 1), m(3, 2) + m(0, 2)), m(3, 3) + m(0, 3));
    planes[1] = Plane(Vector3(m(3, 0) - m(0, 0), m(3, 1) - m(0, 1), m(3, 2) - m(0, 2)), m(3, 3) - m(0, 3));
    
    // 下、上：第4行 ± 第2行
    planes[2] = Plane(Vector3(m(3, 0) + m(1, 0), m(3, 1) + m(1, 1), m(3, 2) + m(1, 2)), m(3, 3) + m(1, 3));
    planes[3] = Plane(Vector3(m(3, 0) - m(1, 0), m(3, 1) - m(1, 1), m(3, 2) - m(1, 2)), m(3, 3) - m(1, 3));
    
    // 近、远：第4行 ± 第3行
    planes[4] = Plane(Vector3(m(3, 0) + m(2, 0), m(3, 1) + m(2, 1), m(3, 2) + m(2, 2)), m(3, 3) + m(2, 3));
    planes[5] = Plane(Vector3(m(3, 0) - m(2, 0), m(3, 1) - m(2, 1), m(3, 2) - m(2, 2)), m(3, 3) - m(2, 3));
    
    for (int i = 0; i < 6; ++i) {
        float length = planes[i].normal.norm();
        if (length > MathUtils::EPSILON) {
            planes[i].normal /= length;
            planes[i].distance /= length;
        }
    }
}

bool Frustum::ContainsPoint(const Vector3& point) const {
    for (int i = 0; i < 6; ++i) {
        if (planes[i].GetDistance(point) < 0.0f) {
            return false;
        }
    }
    return true;
}

bool Frustum::IntersectsSphere(const Vector3& center, float radius) const {
    for (int i = 0; i < 6; ++i) {
        if (planes[i].GetDistance(center) < -radius) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// Camera 实现
// ============================================================================

Camera::Camera()
    : m_projectionType(ProjectionType::Perspective)
    , m_fovYDegrees(45.0f)
    , m_aspectRatio(1.0f)
    , m_nearPlane(0.1f)
    , m_farPlane(100.0f)
    , m_orthoLeft(-1.0f)
    , m_orthoRight(1.0f)
    , m_orthoBottom(-1.0f)
    , m_orthoTop(1.0f)
    , m_projectionMatrix(Matrix4::Identity())
    , m_viewMatrix(Matrix4::Identity())
    , m_projectionViewMatrix(Matrix4::Identity()) {
    SetFrustumCulled(false);
    UpdateProjectionMatrix();
    m_frustum.ExtractFromMatrix(m_projectionViewMatrix);
}

// ============================================================================
// 投影设置
// ============================================================================

void Camera::SetPerspective(float fovYDegrees, float aspect, float nearPlane, float farPlane) {
    if (fovYDegrees <= 0.0f || fovYDegrees >= 180.0f) {
        HANDLE_ERROR(LUMEN_WARNING(ErrorCode::OutOfRange,
                                   "Camera::SetPerspective: FOV 超出有效范围 (0, 180): " +
                                   std::to_string(fovYDegrees)));
        fovYDegrees = std::clamp(fovYDegrees, 1.0f, 179.0f);
    }
    
    if (aspect <= 0.0f) {
        HANDLE_ERROR(LUMEN_WARNING(ErrorCode::InvalidArgument,
                                   "Camera::SetPerspective: 宽高比必须大于 0: " +
                                   std::to_string(aspect)));
        aspect = 1.0f;
    }
    
    if (nearPlane <= 0.0f || farPlane <= nearPlane) {
        HANDLE_ERROR(LUMEN_WARNING(ErrorCode::InvalidArgument,
                                   "Camera::SetPerspective: 裁剪面参数无效 (near: " +
                                   std::to_string(nearPlane) + ", far: " + std::to_string(farPlane) + ")"));
        nearPlane = std::max(0.01f, nearPlane);
        farPlane = std::max(nearPlane + 1.0f, farPlane);
    }
    
    m_projectionType = ProjectionType::Perspective;
    m_fovYDegrees = fovYDegrees;
    m_aspectRatio = aspect;
    m_nearPlane = nearPlane;
    m_farPlane = farPlane;
    
    UpdateProjectionMatrix();
}

void Camera::SetOrthographic(float left, float right, float bottom, float top,
                             float nearPlane, float farPlane) {
    m_projectionType = ProjectionType::Orthographic;
    m_orthoLeft = left;
    m_orthoRight = right;
    m_orthoBottom = bottom;
    m_orthoTop = top;
    m_nearPlane = nearPlane;
    m_farPlane = farPlane;
    
    UpdateProjectionMatrix();
}

void Camera::SetProjectionMatrix(const Matrix4& projection) {
    m_projectionType = ProjectionType::Custom;
    m_projectionMatrix = projection;
    m_projectionViewMatrix = m_projectionMatrix * m_viewMatrix;
}

void Camera::SetAspectRatio(float aspect) {
    m_aspectRatio = aspect;
    
    if (m_projectionType == ProjectionType::Perspective) {
        UpdateProjectionMatrix();
    }
}

void Camera::UpdateProjectionMatrix() {
    if (m_projectionType == ProjectionType::Perspective) {
        m_projectionMatrix = MathUtils::PerspectiveDegrees(
            m_fovYDegrees, m_aspectRatio, m_nearPlane, m_farPlane
        );
    } else if (m_projectionType == ProjectionType::Orthographic) {
        m_projectionMatrix = MathUtils::Orthographic(
            m_orthoLeft, m_orthoRight, m_orthoBottom, m_orthoTop,
            m_nearPlane, m_farPlane
        );
    }
    
    m_projectionViewMatrix = m_projectionMatrix * m_viewMatrix;
}

// ============================================================================
// 变换与矩阵
// ============================================================================

void Camera::LookAt(const Vector3& target, const Vector3& up) {
    Vector3 zAxis = GetPosition() - target;
    if (zAxis.squaredNorm() < MathUtils::EPSILON) {
        return; // 目标点与当前位置重合
    }
    zAxis.normalize();
    
    Vector3 xAxis = up.cross(zAxis);
    if (xAxis.squaredNorm() < MathUtils::EPSILON) {
        return; // up 与视线平行
    }
    xAxis.normalize();
    Vector3 yAxis = zAxis.cross(xAxis);
    
    Matrix3 rotation;
    rotation.col(0) = xAxis;
    rotation.col(1) = yAxis;
    rotation.col(2) = zAxis;
    SetRotation(Quaternion(rotation));
}

void Camera::UpdateMatrixWorld() {
    SceneNode::UpdateMatrixWorld();
    
    m_viewMatrix = m_worldMatrix.inverse();
    m_projectionViewMatrix = m_projectionMatrix * m_viewMatrix;
}

// ============================================================================
// 视锥体裁剪
// ============================================================================

void Camera::UpdateFrustum() {
    m_frustum.ExtractFromMatrix(m_projectionViewMatrix);
}

bool Camera::FrustumIntersectsMesh(const SceneNode& node) const {
    const BoundingSphere& sphere = node.GetBoundingSphere();
    const Matrix4& world = node.GetWorldMatrix();
    
    Vector3 center = MathUtils::TransformPoint(world, sphere.center);
    Vector3 scale = MathUtils::GetScale(world);
    float radius = sphere.radius * scale.maxCoeff();
    
    return m_frustum.IntersectsSphere(center, radius);
}

} // namespace Lumen

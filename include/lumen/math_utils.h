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
#include <cmath>

namespace Lumen {
namespace MathUtils {

// ============================================================================
// 常量
// ============================================================================

constexpr float HALF_PI = 1.57079632679489661923f;
constexpr float DEG2RAD = 0.01745329251994329577f;
constexpr float EPSILON = 1e-6f;

inline float DegreesToRadians(float degrees) {
    return degrees * DEG2RAD;
}

// ============================================================================
// 矩阵变换工具
// ============================================================================

// 创建 TRS（平移-旋转-缩放）矩阵
inline Matrix4 TRS(const Vector3& position, const Quaternion& rotation, const Vector3& scale) {
    Eigen::Affine3f transform =
        Eigen::Translation3f(position) *
        rotation *
        Eigen::Scaling(scale);
    return transform.matrix();
}

// 从矩阵中提取位置
inline Vector3 GetPosition(const Matrix4& matrix) {
    return Vector3(matrix(0, 3), matrix(1, 3), matrix(2, 3));
}

// 从矩阵中提取缩放
inline Vector3 GetScale(const Matrix4& matrix) {
    Matrix3 rotMatrix = matrix.block<3, 3>(0, 0);
    return Vector3(
        rotMatrix.col(0).norm(),
        rotMatrix.col(1).norm(),
        rotMatrix.col(2).norm()
    );
}

/**
 * @brief 用 4x4 矩阵变换点，并做透视除法
 *
 * w 为 0 时按 1 处理（仿射矩阵或退化投影）
 */
inline Vector3 TransformPoint(const Matrix4& matrix, const Vector3& point) {
    Vector4 result = matrix * Vector4(point.x(), point.y(), point.z(), 1.0f);
    float w = result.w();
    if (w == 0.0f) {
        w = 1.0f;
    }
    return result.head<3>() / w;
}

// ============================================================================
// 投影矩阵
// ============================================================================

// 创建透视投影矩阵
inline Matrix4 Perspective(float fovY, float aspect, float near, float far) {
    float tanHalfFovy = std::tan(fovY / 2.0f);

    Matrix4 mat = Matrix4::Zero();
    mat(0, 0) = 1.0f / (aspect * tanHalfFovy);
    mat(1, 1) = 1.0f / tanHalfFovy;
    mat(2, 2) = -(far + near) / (far - near);
    mat(2, 3) = -(2.0f * far * near) / (far - near);
    mat(3, 2) = -1.0f;

    return mat;
}

// 创建透视投影矩阵（使用视场角度数）
inline Matrix4 PerspectiveDegrees(float fovYDegrees, float aspect, float near, float far) {
    return Perspective(DegreesToRadians(fovYDegrees), aspect, near, far);
}

// 创建正交投影矩阵
inline Matrix4 Orthographic(float left, float right, float bottom, float top, float near, float far) {
    Matrix4 mat = Matrix4::Identity();
    mat(0, 0) = 2.0f / (right - left);
    mat(1, 1) = 2.0f / (top - bottom);
    mat(2, 2) = -2.0f / (far - near);
    mat(0, 3) = -(right + left) / (right - left);
    mat(1, 3) = -(top + bottom) / (top - bottom);
    mat(2, 3) = -(far + near) / (far - near);

    return mat;
}

} // namespace MathUtils
} // namespace Lumen

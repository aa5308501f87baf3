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
#include <memory>
#include <optional>
#include <Eigen/Core>
#include <Eigen/Geometry>

namespace Lumen {

// ============================================================================
// 数学类型定义（使用 Eigen）
// ============================================================================

using Vector3 = Eigen::Vector3f;
using Vector4 = Eigen::Vector4f;

using Matrix3 = Eigen::Matrix3f;
using Matrix4 = Eigen::Matrix4f;

using Quaternion = Eigen::Quaternionf;

// ============================================================================
// 平面
// ============================================================================

struct Plane {
    Vector3 normal;  // 平面法向量（单位向量）
    float distance;  // 平面方程常数项

    Plane() : normal(Vector3::UnitY()), distance(0.0f) {}
    Plane(const Vector3& normal, float distance) : normal(normal), distance(distance) {}

    // 带符号距离，法向量一侧为正
    float GetDistance(const Vector3& point) const {
        return normal.dot(point) + distance;
    }
};

// ============================================================================
// 包围球
// ============================================================================

struct BoundingSphere {
    Vector3 center;
    float radius;

    BoundingSphere() : center(Vector3::Zero()), radius(0.0f) {}
    BoundingSphere(const Vector3& center, float radius) : center(center), radius(radius) {}
};

// ============================================================================
// 尺寸
// ============================================================================

/**
 * @brief 可选宽高，未设置时两个分量都为空
 */
struct Extent {
    std::optional<int> width;
    std::optional<int> height;

    bool Equals(int w, int h) const {
        return width.has_value() && height.has_value() &&
               *width == w && *height == h;
    }
};

// ============================================================================
// 智能指针类型别名
// ============================================================================

template<typename T>
using Ref = std::shared_ptr<T>;

template<typename T>
using Scope = std::unique_ptr<T>;

template<typename T, typename... Args>
Ref<T> CreateRef(Args&&... args) {
    return std::make_shared<T>(std::forward<Args>(args)...);
}

template<typename T, typename... Args>
Scope<T> CreateScope(Args&&... args) {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

} // namespace Lumen

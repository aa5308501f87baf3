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

#include "lumen/scene_node.h"
#include "lumen/math_utils.h"

namespace Lumen {

/**
 * @brief 投影类型
 */
enum class ProjectionType {
    Perspective,    // 透视投影
    Orthographic,   // 正交投影
    Custom          // 外部提供的投影矩阵
};

/**
 * @brief 视锥体
 */
struct Frustum {
    Plane planes[6];  // 6个裁剪平面：左、右、下、上、近、远
    
    /**
     * @brief 从投影视图矩阵提取平面（Gribb-Hartmann）
     */
    void ExtractFromMatrix(const Matrix4& projectionView);
    
    bool ContainsPoint(const Vector3& point) const;
    
    /**
     * @brief 球体是否与视锥体相交（完全在某个平面外侧时返回 false）
     */
    bool IntersectsSphere(const Vector3& center, float radius) const;
};

/**
 * @brief 相机
 * 
 * 相机本身是场景节点，可以挂在场景图中，也可以独立存在。
 * 视图矩阵为世界矩阵的逆，投影视图矩阵在 UpdateMatrixWorld 时刷新。
 * 视锥体只在 UpdateFrustum 时刷新。
 */
class Camera : public SceneNode {
public:
    Camera();
    ~Camera() override = default;
    
    // ========================================================================
    // 投影设置
    // ========================================================================
    
    /**
     * @brief 设置透视投影
     * @param fovYDegrees 垂直视场角（度），范围 (0, 180)
     * @param aspect 宽高比
     * @param nearPlane 近裁剪面
     * @param farPlane 远裁剪面
     */
    void SetPerspective(float fovYDegrees, float aspect, float nearPlane, float farPlane);
    
    void SetOrthographic(float left, float right, float bottom, float top,
                         float nearPlane, float farPlane);
    
    /**
     * @brief 直接指定投影矩阵
     */
    void SetProjectionMatrix(const Matrix4& projection);
    
    /**
     * @brief 修改透视投影的宽高比，非透视模式下只记录
     */
    void SetAspectRatio(float aspect);
    
    [[nodiscard]] ProjectionType GetProjectionType() const { return m_projectionType; }
    [[nodiscard]] float GetFieldOfView() const { return m_fovYDegrees; }
    [[nodiscard]] float GetAspectRatio() const { return m_aspectRatio; }
    [[nodiscard]] float GetNearPlane() const { return m_nearPlane; }
    [[nodiscard]] float GetFarPlane() const { return m_farPlane; }
    
    // ========================================================================
    // 变换与矩阵
    // ========================================================================
    
    /**
     * @brief 让相机朝向目标点（使用局部位置，-Z 为前方）
     */
    void LookAt(const Vector3& target, const Vector3& up = Vector3::UnitY());
    
    void UpdateMatrixWorld() override;
    
    [[nodiscard]] const Matrix4& GetProjectionMatrix() const { return m_projectionMatrix; }
    [[nodiscard]] const Matrix4& GetViewMatrix() const { return m_viewMatrix; }
    [[nodiscard]] const Matrix4& GetProjectionViewMatrix() const { return m_projectionViewMatrix; }
    
    // ========================================================================
    // 视锥体裁剪
    // ========================================================================
    
    /**
     * @brief 用当前投影视图矩阵刷新视锥体
     */
    void UpdateFrustum();
    
    [[nodiscard]] const Frustum& GetFrustum() const { return m_frustum; }
    
    /**
     * @brief 节点的世界空间包围球是否与视锥体相交
     * 
     * 半径按节点世界矩阵的最大缩放轴放大。
     */
    [[nodiscard]] bool FrustumIntersectsMesh(const SceneNode& node) const;
    
private:
    void UpdateProjectionMatrix();
    
    ProjectionType m_projectionType;
    
    float m_fovYDegrees;
    float m_aspectRatio;
    float m_nearPlane;
    float m_farPlane;
    
    float m_orthoLeft;
    float m_orthoRight;
    float m_orthoBottom;
    float m_orthoTop;
    
    Matrix4 m_projectionMatrix;
    Matrix4 m_viewMatrix;
    Matrix4 m_projectionViewMatrix;
    Frustum m_frustum;
};

} // namespace Lumen

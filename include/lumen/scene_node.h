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
#include "lumen/program.h"
#include <functional>
#include <vector>

namespace Lumen {

class Camera;
class Renderer;

/**
 * @brief 节点绘制时收到的上下文
 */
struct DrawContext {
    const Camera* camera = nullptr;   ///< 本帧使用的相机（可能为空）
    Renderer* renderer = nullptr;     ///< 发起绘制的渲染器
};

/**
 * @brief 遍历访问器的返回值
 */
enum class TraverseAction {
    Continue,       ///< 正常继续，访问子节点
    SkipNode,       ///< 排除当前节点，但仍访问子节点
    SkipSubtree     ///< 不再访问当前节点的子树
};

/**
 * @brief 场景图节点
 * 
 * 持有局部变换、世界矩阵、可见性与排序属性。子节点由 shared_ptr 持有，
 * 父节点为裸指针（父节点析构时会清空子节点的父指针）。
 * 
 * 普通节点不可绘制；可绘制节点继承 RenderNode。
 */
class SceneNode {
    EIGEN_MAKE_ALIGNED_OPERATOR_NEW
    
public:
    using Visitor = std::function<TraverseAction(SceneNode&)>;
    
    SceneNode();
    virtual ~SceneNode();
    
    SceneNode(const SceneNode&) = delete;
    SceneNode& operator=(const SceneNode&) = delete;
    
    // ==================== 标识与排序属性 ====================
    
    /**
     * @brief 进程内单调递增的节点 ID（越新越大）
     */
    [[nodiscard]] uint32_t GetId() const { return m_id; }
    
    void SetVisible(bool visible) { m_visible = visible; }
    [[nodiscard]] bool IsVisible() const { return m_visible; }
    
    /**
     * @brief 是否参与视锥体裁剪（默认 true）
     */
    void SetFrustumCulled(bool frustumCulled) { m_frustumCulled = frustumCulled; }
    [[nodiscard]] bool IsFrustumCulled() const { return m_frustumCulled; }
    
    /**
     * @brief 显式绘制顺序，小的先画（默认 0）
     */
    void SetRenderOrder(int renderOrder) { m_renderOrder = renderOrder; }
    [[nodiscard]] int GetRenderOrder() const { return m_renderOrder; }
    
    /**
     * @brief 排序用的投影深度，由渲染器在构建渲染列表时写入
     */
    void SetZDepth(float zDepth) { m_zDepth = zDepth; }
    [[nodiscard]] float GetZDepth() const { return m_zDepth; }
    
    void SetProgram(const Ref<Program>& program) { m_program = program; }
    [[nodiscard]] const Ref<Program>& GetProgram() const { return m_program; }
    
    // ==================== 绘制 ====================
    
    /**
     * @brief 是否可以被渲染器绘制
     */
    [[nodiscard]] virtual bool IsDrawable() const { return false; }
    
    /**
     * @brief 发出本节点的绘制调用，普通节点什么也不做
     */
    virtual void Draw(const DrawContext& context);
    
    // ==================== 变换 ====================
    
    void SetPosition(const Vector3& position) { m_position = position; }
    [[nodiscard]] const Vector3& GetPosition() const { return m_position; }
    
    void SetRotation(const Quaternion& rotation) { m_rotation = rotation; }
    [[nodiscard]] const Quaternion& GetRotation() const { return m_rotation; }
    
    void SetScale(const Vector3& scale) { m_scale = scale; }
    void SetScale(float scale) { m_scale = Vector3(scale, scale, scale); }
    [[nodiscard]] const Vector3& GetScale() const { return m_scale; }
    
    [[nodiscard]] Matrix4 GetLocalMatrix() const;
    [[nodiscard]] const Matrix4& GetWorldMatrix() const { return m_worldMatrix; }
    [[nodiscard]] Vector3 GetWorldPosition() const;
    
    /**
     * @brief 重新计算本节点及整个子树的世界矩阵
     * 
     * 有父节点时以父节点当前的世界矩阵为基准。
     */
    virtual void UpdateMatrixWorld();
    
    // ==================== 包围体 ====================
    
    /**
     * @brief 设置局部空间包围球（默认半径 0，位于原点）
     */
    void SetBoundingSphere(const BoundingSphere& sphere) { m_boundingSphere = sphere; }
    [[nodiscard]] const BoundingSphere& GetBoundingSphere() const { return m_boundingSphere; }
    
    // ==================== 层级 ====================
    
    /**
     * @brief 添加子节点，子节点会先从原父节点移除
     */
    void AddChild(const Ref<SceneNode>& child);
    
    /**
     * @brief 移除子节点
     * @return 是否找到并移除
     */
    bool RemoveChild(SceneNode* child);
    
    [[nodiscard]] SceneNode* GetParent() const { return m_parent; }
    [[nodiscard]] const std::vector<Ref<SceneNode>>& GetChildren() const { return m_children; }
    
    /**
     * @brief 深度优先先序遍历
     * 
     * 访问器返回 SkipNode 时仍然访问子节点，返回 SkipSubtree 时跳过整个子树。
     * 如何解释 SkipNode 由访问器自己决定。
     */
    void Traverse(const Visitor& visitor);
    
protected:
    Matrix4 m_worldMatrix;
    
private:
    uint32_t m_id;
    bool m_visible = true;
    bool m_frustumCulled = true;
    int m_renderOrder = 0;
    float m_zDepth = 0.0f;
    Ref<Program> m_program;
    
    Vector3 m_position;
    Quaternion m_rotation;
    Vector3 m_scale;
    BoundingSphere m_boundingSphere;
    
    SceneNode* m_parent = nullptr;
    std::vector<Ref<SceneNode>> m_children;
};

/**
 * @brief 可绘制节点
 * 
 * 子类实现 Draw。只有设置了程序的节点才会进入渲染列表。
 */
class RenderNode : public SceneNode {
public:
    explicit RenderNode(const Ref<Program>& program);
    ~RenderNode() override = default;
    
    [[nodiscard]] bool IsDrawable() const override { return GetProgram() != nullptr; }
    
    void Draw(const DrawContext& context) override = 0;
};

} // namespace Lumen

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
#include "lumen/scene_node.h"
#include "lumen/math_utils.h"
#include "lumen/logger.h"
#include <algorithm>
#include <atomic>

namespace Lumen {

namespace {
std::atomic<uint32_t> s_nextNodeId{1};
}

SceneNode::SceneNode()
    : m_worldMatrix(Matrix4::Identity())
    , m_id(s_nextNodeId.fetch_add(1))
    , m_position(Vector3::Zero())
    , m_rotation(Quaternion::Identity())
    , m_scale(Vector3::Ones()) {
}

SceneNode::~SceneNode() {
    for (auto& child : m_children) {
        child->m_parent = nullptr;
    }
}

void SceneNode::Draw(const DrawContext& /*context*/) {
}

// ============================================================================
// 变换
// ============================================================================

Matrix4 SceneNode::GetLocalMatrix() const {
    return MathUtils::TRS(m_position, m_rotation, m_scale);
}

Vector3 SceneNode::GetWorldPosition() const {
    return MathUtils::GetPosition(m_worldMatrix);
}

void SceneNode::UpdateMatrixWorld() {
    if (m_parent) {
        m_worldMatrix = m_parent->m_worldMatrix * GetLocalMatrix();
    } else {
        m_worldMatrix = GetLocalMatrix();
    }
    
    for (auto& child : m_children) {
        child->UpdateMatrixWorld();
    }
}

// ============================================================================
// 层级
// ============================================================================

void SceneNode::AddChild(const Ref<SceneNode>& child) {
    if (!child) {
        return;
    }
    
    for (const SceneNode* node = this; node != nullptr; node = node->m_parent) {
        if (node == child.get()) {
            LOG_WARNING_F("[SceneNode] Node %u cannot be added under its own subtree", child->m_id);
            return;
        }
    }
    
    Ref<SceneNode> node = child;
    if (node->m_parent) {
        node->m_parent->RemoveChild(node.get());
    }
    
    node->m_parent = this;
    m_children.push_back(node);
}

bool SceneNode::RemoveChild(SceneNode* child) {
    auto it = std::find_if(m_children.begin(), m_children.end(),
        [child](const Ref<SceneNode>& node) { return node.get() == child; });
    if (it == m_children.end()) {
        return false;
    }
    
    (*it)->m_parent = nullptr;
    m_children.erase(it);
    return true;
}

void SceneNode::Traverse(const Visitor& visitor) {
    if (visitor(*this) == TraverseAction::SkipSubtree) {
        return;
    }
    
    for (auto& child : m_children) {
        child->Traverse(visitor);
    }
}

// ============================================================================
// RenderNode
// ============================================================================

RenderNode::RenderNode(const Ref<Program>& program) {
    SetProgram(program);
}

} // namespace Lumen

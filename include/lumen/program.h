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

#include <atomic>
#include <cstdint>
#include <string>

namespace Lumen {

/**
 * @brief 着色器程序的排序属性
 * 
 * 渲染列表只关心程序的标识和两个开关：是否透明、是否参与深度测试。
 * 着色器的编译与 uniform 管理不在此处。
 */
class Program {
public:
    explicit Program(const std::string& name = "", bool transparent = false, bool depthTest = true)
        : m_id(s_nextId.fetch_add(1))
        , m_name(name)
        , m_transparent(transparent)
        , m_depthTest(depthTest) {}
    
    /**
     * @brief 进程内单调递增的程序 ID（按创建顺序）
     */
    [[nodiscard]] uint32_t GetId() const { return m_id; }
    [[nodiscard]] const std::string& GetName() const { return m_name; }
    
    void SetTransparent(bool transparent) { m_transparent = transparent; }
    [[nodiscard]] bool IsTransparent() const { return m_transparent; }
    
    void SetDepthTest(bool depthTest) { m_depthTest = depthTest; }
    [[nodiscard]] bool IsDepthTestEnabled() const { return m_depthTest; }
    
private:
    inline static std::atomic<uint32_t> s_nextId{1};
    
    uint32_t m_id;
    std::string m_name;
    bool m_transparent;
    bool m_depthTest;
};

} // namespace Lumen

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

namespace Lumen {

/**
 * @brief 离屏渲染目标
 * 
 * 渲染器只需要可绑定的句柄、是否带深度缓冲以及尺寸（像素，不做缩放）。
 */
class RenderTarget {
public:
    virtual ~RenderTarget() = default;
    
    /**
     * @brief 可绑定的帧缓冲句柄
     */
    virtual uint32_t GetHandle() const = 0;
    
    /**
     * @brief 是否带深度附件
     */
    virtual bool HasDepth() const = 0;
    
    virtual int GetWidth() const = 0;
    virtual int GetHeight() const = 0;
};

} // namespace Lumen

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

#include "lumen/gpu_device.h"
#include "lumen/types.h"

namespace Lumen {

/**
 * @brief GPU 功耗偏好
 */
enum class PowerPreference {
    Default,
    LowPower,
    HighPerformance
};

/**
 * @brief 创建 GPU 上下文时使用的属性
 */
struct ContextAttributes {
    bool alpha = false;
    bool depth = true;
    bool stencil = false;
    bool antialias = false;
    bool premultipliedAlpha = false;
    bool preserveDrawingBuffer = false;
    PowerPreference powerPreference = PowerPreference::Default;
};

/**
 * @brief 渲染表面
 * 
 * 区分两种尺寸：
 * - backing size：实际像素分辨率（逻辑尺寸 × 设备像素比）
 * - display size：逻辑布局尺寸
 * 
 * 表面负责创建绑定到自身的 GPU 上下文。
 */
class RenderSurface {
public:
    virtual ~RenderSurface() = default;
    
    virtual void SetBackingSize(int width, int height) = 0;
    virtual void SetDisplaySize(int width, int height) = 0;
    
    virtual int GetBackingWidth() const = 0;
    virtual int GetBackingHeight() const = 0;
    virtual int GetDisplayWidth() const = 0;
    virtual int GetDisplayHeight() const = 0;
    
    /**
     * @brief 创建 GPU 上下文
     * @return 失败时返回空指针
     */
    virtual Ref<GpuDevice> CreateContext(const ContextAttributes& attributes) = 0;
};

} // namespace Lumen

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

#include "recording_device.h"
#include "lumen/render_surface.h"
#include "lumen/render_target.h"

namespace Lumen {
namespace Testing {

/**
 * @brief 不打开窗口的渲染表面，上下文为 RecordingDevice
 */
class FakeSurface : public RenderSurface {
public:
    Ref<RecordingDevice> device = CreateRef<RecordingDevice>();
    bool failContext = false;
    int contextCount = 0;
    ContextAttributes lastAttributes;
    
    int backingWidth = 0;
    int backingHeight = 0;
    int displayWidth = 0;
    int displayHeight = 0;
    
    void SetBackingSize(int width, int height) override {
        backingWidth = width;
        backingHeight = height;
    }
    
    void SetDisplaySize(int width, int height) override {
        displayWidth = width;
        displayHeight = height;
    }
    
    int GetBackingWidth() const override { return backingWidth; }
    int GetBackingHeight() const override { return backingHeight; }
    int GetDisplayWidth() const override { return displayWidth; }
    int GetDisplayHeight() const override { return displayHeight; }
    
    Ref<GpuDevice> CreateContext(const ContextAttributes& attributes) override {
        ++contextCount;
        lastAttributes = attributes;
        if (failContext) {
            return nullptr;
        }
        return device;
    }
};

/**
 * @brief 只有句柄和尺寸的渲染目标
 */
class FakeTarget : public RenderTarget {
public:
    FakeTarget(uint32_t handle, int width, int height, bool depth)
        : m_handle(handle), m_width(width), m_height(height), m_depth(depth) {}
    
    uint32_t GetHandle() const override { return m_handle; }
    bool HasDepth() const override { return m_depth; }
    int GetWidth() const override { return m_width; }
    int GetHeight() const override { return m_height; }
    
private:
    uint32_t m_handle;
    int m_width;
    int m_height;
    bool m_depth;
};

} // namespace Testing
} // namespace Lumen

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

#include "lumen/render_surface.h"
#include "lumen/types.h"
#include <nlohmann/json.hpp>
#include <string>

namespace Lumen {

/**
 * @brief 渲染器构造选项
 * 
 * JSON 键与字段同名，powerPreference 取 "default" / "low-power" / "high-performance"。
 * surface 不参与序列化。
 */
struct RendererOptions {
    Ref<RenderSurface> surface;         ///< 为空时使用默认窗口表面
    int width = 300;                    ///< 逻辑宽度
    int height = 150;                   ///< 逻辑高度
    float devicePixelRatio = 1.0f;
    bool alpha = false;
    bool depth = true;
    bool stencil = false;
    bool antialias = false;
    bool premultipliedAlpha = false;
    bool preserveDrawingBuffer = false;
    PowerPreference powerPreference = PowerPreference::Default;
    bool autoClear = true;              ///< Render 未指定 clear 时是否清屏
    
    /**
     * @brief 转发给表面的上下文属性
     */
    ContextAttributes GetContextAttributes() const;
    
    /**
     * @brief 从 JSON 对象读取选项
     * 
     * 缺失的键保持 out 中原有的值，未知键忽略。
     * 任何键类型错误时整个读取失败，out 不被修改。
     */
    static bool FromJson(const nlohmann::json& json, RendererOptions& out);
    
    nlohmann::json ToJson() const;
};

/**
 * @brief 从 JSON 字符串读取渲染器选项
 */
bool ParseRendererOptions(const std::string& jsonStr, RendererOptions& out);

/**
 * @brief 从 JSON 文件读取渲染器选项
 * @return 文件无法打开、解析失败或字段无效时返回 false
 */
bool LoadRendererOptions(const std::string& filepath, RendererOptions& out);

bool SaveRendererOptions(const std::string& filepath, const RendererOptions& options, int indent = 4);

const char* PowerPreferenceToString(PowerPreference preference);

} // namespace Lumen

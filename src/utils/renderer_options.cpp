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
#include "lumen/renderer_options.h"
#include "lumen/logger.h"
#include "lumen/error.h"
#include <cstdint>
#include <fstream>
#include <limits>

namespace Lumen {

namespace {

void ReadBool(const nlohmann::json& json, const char* key, bool& value) {
    auto it = json.find(key);
    if (it == json.end()) {
        return;
    }
    if (!it->is_boolean()) {
        throw LUMEN_ERROR(ErrorCode::ConfigurationInvalid,
                          std::string("RendererOptions: '") + key + "' 必须是布尔值");
    }
    value = it->get<bool>();
}

void ReadInt(const nlohmann::json& json, const char* key, int& value) {
    auto it = json.find(key);
    if (it == json.end()) {
        return;
    }
    if (!it->is_number_integer()) {
        throw LUMEN_ERROR(ErrorCode::ConfigurationInvalid,
                          std::string("RendererOptions: '") + key + "' 必须是整数");
    }
    // 无符号大整数也是 number_integer，get<int>() 会回绕
    bool inRange = it->is_number_unsigned()
        ? it->get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int>::max())
        : (it->get<int64_t>() >= std::numeric_limits<int>::min() &&
           it->get<int64_t>() <= std::numeric_limits<int>::max());
    if (!inRange) {
        throw LUMEN_ERROR(ErrorCode::ConfigurationInvalid,
                          std::string("RendererOptions: '") + key + "' 超出 int 范围");
    }
    value = it->get<int>();
}

void ReadFloat(const nlohmann::json& json, const char* key, float& value) {
    auto it = json.find(key);
    if (it == json.end()) {
        return;
    }
    if (!it->is_number()) {
        throw LUMEN_ERROR(ErrorCode::ConfigurationInvalid,
                          std::string("RendererOptions: '") + key + "' 必须是数值");
    }
    value = it->get<float>();
}

PowerPreference PowerPreferenceFromString(const std::string& value) {
    if (value == "default") return PowerPreference::Default;
    if (value == "low-power") return PowerPreference::LowPower;
    if (value == "high-performance") return PowerPreference::HighPerformance;
    
    throw LUMEN_ERROR(ErrorCode::ConfigurationInvalid,
                      "RendererOptions: 未知的 powerPreference: " + value);
}

} // namespace

const char* PowerPreferenceToString(PowerPreference preference) {
    switch (preference) {
    case PowerPreference::Default: return "default";
    case PowerPreference::LowPower: return "low-power";
    case PowerPreference::HighPerformance: return "high-performance";
    }
    return "default";
}

ContextAttributes RendererOptions::GetContextAttributes() const {
    ContextAttributes attributes;
    attributes.alpha = alpha;
    attributes.depth = depth;
    attributes.stencil = stencil;
    attributes.antialias = antialias;
    attributes.premultipliedAlpha = premultipliedAlpha;
    attributes.preserveDrawingBuffer = preserveDrawingBuffer;
    attributes.powerPreference = powerPreference;
    return attributes;
}

bool RendererOptions::FromJson(const nlohmann::json& json, RendererOptions& out) {
    LUMEN_TRY {
        if (!json.is_object()) {
            throw LUMEN_ERROR(ErrorCode::ConfigurationInvalid,
                              "RendererOptions: 顶层必须是 JSON 对象");
        }
        
        RendererOptions options = out;
        ReadInt(json, "width", options.width);
        ReadInt(json, "height", options.height);
        ReadFloat(json, "devicePixelRatio", options.devicePixelRatio);
        ReadBool(json, "alpha", options.alpha);
        ReadBool(json, "depth", options.depth);
        ReadBool(json, "stencil", options.stencil);
        ReadBool(json, "antialias", options.antialias);
        ReadBool(json, "premultipliedAlpha", options.premultipliedAlpha);
        ReadBool(json, "preserveDrawingBuffer", options.preserveDrawingBuffer);
        ReadBool(json, "autoClear", options.autoClear);
        
        auto it = json.find("powerPreference");
        if (it != json.end()) {
            if (!it->is_string()) {
                throw LUMEN_ERROR(ErrorCode::ConfigurationInvalid,
                                  "RendererOptions: 'powerPreference' 必须是字符串");
            }
            options.powerPreference = PowerPreferenceFromString(it->get<std::string>());
        }
        
        out = options;
        return true;
    }
    LUMEN_CATCH {
        return false;
    }
}

nlohmann::json RendererOptions::ToJson() const {
    nlohmann::json json;
    json["width"] = width;
    json["height"] = height;
    json["devicePixelRatio"] = devicePixelRatio;
    json["alpha"] = alpha;
    json["depth"] = depth;
    json["stencil"] = stencil;
    json["antialias"] = antialias;
    json["premultipliedAlpha"] = premultipliedAlpha;
    json["preserveDrawingBuffer"] = preserveDrawingBuffer;
    json["powerPreference"] = PowerPreferenceToString(powerPreference);
    json["autoClear"] = autoClear;
    return json;
}

bool ParseRendererOptions(const std::string& jsonStr, RendererOptions& out) {
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(jsonStr);
    } catch (const nlohmann::json::parse_error& e) {
        HANDLE_ERROR(LUMEN_ERROR(ErrorCode::ConfigurationInvalid,
                                 std::string("RendererOptions: JSON parse error: ") + e.what()));
        return false;
    }
    
    return RendererOptions::FromJson(json, out);
}

bool LoadRendererOptions(const std::string& filepath, RendererOptions& out) {
    nlohmann::json json;
    try {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            HANDLE_ERROR(LUMEN_ERROR(ErrorCode::FileNotFound,
                                     "RendererOptions: Failed to open file: " + filepath));
            return false;
        }
        
        file >> json;
    } catch (const nlohmann::json::parse_error& e) {
        HANDLE_ERROR(LUMEN_ERROR(ErrorCode::ConfigurationInvalid,
                                 "RendererOptions: JSON parse error in file " + filepath + ": " + e.what()));
        return false;
    }
    
    if (!RendererOptions::FromJson(json, out)) {
        return false;
    }
    
    Logger::GetInstance().InfoFormat("[RendererOptions] Loaded options from: %s", filepath.c_str());
    return true;
}

bool SaveRendererOptions(const std::string& filepath, const RendererOptions& options, int indent) {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        HANDLE_ERROR(LUMEN_ERROR(ErrorCode::FileWriteFailed,
                                 "RendererOptions: Failed to create file: " + filepath));
        return false;
    }
    
    file << options.ToJson().dump(indent);
    if (!file) {
        HANDLE_ERROR(LUMEN_ERROR(ErrorCode::FileWriteFailed,
                                 "RendererOptions: Failed to write file: " + filepath));
        return false;
    }
    
    Logger::GetInstance().InfoFormat("[RendererOptions] Saved options to: %s", filepath.c_str());
    return true;
}

} // namespace Lumen

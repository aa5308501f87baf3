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
#include "lumen/gl_device.h"
#include "lumen/gl_thread_checker.h"
#include "lumen/logger.h"
#include <glad/glad.h>

#ifndef GL_MAX_TEXTURE_MAX_ANISOTROPY
#define GL_MAX_TEXTURE_MAX_ANISOTROPY 0x84FF
#endif

namespace Lumen {

namespace {

GLenum ToGL(Capability capability) {
    switch (capability) {
    case Capability::DepthTest: return GL_DEPTH_TEST;
    case Capability::Blend: return GL_BLEND;
    case Capability::CullFace: return GL_CULL_FACE;
    case Capability::StencilTest: return GL_STENCIL_TEST;
    case Capability::ScissorTest: return GL_SCISSOR_TEST;
    case Capability::PolygonOffsetFill: return GL_POLYGON_OFFSET_FILL;
    case Capability::SampleAlphaToCoverage: return GL_SAMPLE_ALPHA_TO_COVERAGE;
    case Capability::Dither: return GL_DITHER;
    }
    return GL_DEPTH_TEST;
}

GLenum ToGL(BlendFactor factor) {
    switch (factor) {
    case BlendFactor::Zero: return GL_ZERO;
    case BlendFactor::One: return GL_ONE;
    case BlendFactor::SrcColor: return GL_SRC_COLOR;
    case BlendFactor::OneMinusSrcColor: return GL_ONE_MINUS_SRC_COLOR;
    case BlendFactor::DstColor: return GL_DST_COLOR;
    case BlendFactor::OneMinusDstColor: return GL_ONE_MINUS_DST_COLOR;
    case BlendFactor::SrcAlpha: return GL_SRC_ALPHA;
    case BlendFactor::OneMinusSrcAlpha: return GL_ONE_MINUS_SRC_ALPHA;
    case BlendFactor::DstAlpha: return GL_DST_ALPHA;
    case BlendFactor::OneMinusDstAlpha: return GL_ONE_MINUS_DST_ALPHA;
    case BlendFactor::ConstantColor: return GL_CONSTANT_COLOR;
    case BlendFactor::OneMinusConstantColor: return GL_ONE_MINUS_CONSTANT_COLOR;
    case BlendFactor::ConstantAlpha: return GL_CONSTANT_ALPHA;
    case BlendFactor::OneMinusConstantAlpha: return GL_ONE_MINUS_CONSTANT_ALPHA;
    case BlendFactor::SrcAlphaSaturate: return GL_SRC_ALPHA_SATURATE;
    }
    return GL_ONE;
}

GLenum ToGL(BlendEquationMode mode) {
    switch (mode) {
    case BlendEquationMode::Add: return GL_FUNC_ADD;
    case BlendEquationMode::Subtract: return GL_FUNC_SUBTRACT;
    case BlendEquationMode::ReverseSubtract: return GL_FUNC_REVERSE_SUBTRACT;
    case BlendEquationMode::Min: return GL_MIN;
    case BlendEquationMode::Max: return GL_MAX;
    }
    return GL_FUNC_ADD;
}

GLenum ToGL(CullFace face) {
    switch (face) {
    case CullFace::Front: return GL_FRONT;
    case CullFace::Back: return GL_BACK;
    case CullFace::FrontAndBack: return GL_FRONT_AND_BACK;
    }
    return GL_BACK;
}

GLenum ToGL(DepthFunc func) {
    switch (func) {
    case DepthFunc::Never: return GL_NEVER;
    case DepthFunc::Less: return GL_LESS;
    case DepthFunc::Equal: return GL_EQUAL;
    case DepthFunc::LessEqual: return GL_LEQUAL;
    case DepthFunc::Greater: return GL_GREATER;
    case DepthFunc::NotEqual: return GL_NOTEQUAL;
    case DepthFunc::GreaterEqual: return GL_GEQUAL;
    case DepthFunc::Always: return GL_ALWAYS;
    }
    return GL_LESS;
}

GLenum ToGL(FramebufferTarget target) {
    switch (target) {
    case FramebufferTarget::Framebuffer: return GL_FRAMEBUFFER;
    case FramebufferTarget::DrawFramebuffer: return GL_DRAW_FRAMEBUFFER;
    case FramebufferTarget::ReadFramebuffer: return GL_READ_FRAMEBUFFER;
    }
    return GL_FRAMEBUFFER;
}

GLenum ToGL(TextureTarget target) {
    switch (target) {
    case TextureTarget::Texture2D: return GL_TEXTURE_2D;
    case TextureTarget::Texture3D: return GL_TEXTURE_3D;
    case TextureTarget::Texture2DArray: return GL_TEXTURE_2D_ARRAY;
    case TextureTarget::TextureCubeMap: return GL_TEXTURE_CUBE_MAP;
    }
    return GL_TEXTURE_2D;
}

GLenum ToGL(GpuParameter parameter) {
    switch (parameter) {
    case GpuParameter::MaxCombinedTextureImageUnits: return GL_MAX_COMBINED_TEXTURE_IMAGE_UNITS;
    case GpuParameter::MaxTextureMaxAnisotropy: return GL_MAX_TEXTURE_MAX_ANISOTROPY;
    case GpuParameter::MaxTextureSize: return GL_MAX_TEXTURE_SIZE;
    case GpuParameter::MaxSamples: return GL_MAX_SAMPLES;
    }
    return GL_MAX_TEXTURE_SIZE;
}

} // namespace

void GLDevice::Viewport(int x, int y, int width, int height) {
    GL_THREAD_CHECK();
    glViewport(x, y, width, height);
}

void GLDevice::Enable(Capability capability) {
    GL_THREAD_CHECK();
    glEnable(ToGL(capability));
}

void GLDevice::Disable(Capability capability) {
    GL_THREAD_CHECK();
    glDisable(ToGL(capability));
}

void GLDevice::BlendFunc(BlendFactor source, BlendFactor destination) {
    GL_THREAD_CHECK();
    glBlendFunc(ToGL(source), ToGL(destination));
}

void GLDevice::BlendFuncSeparate(BlendFactor source, BlendFactor destination,
                                 BlendFactor sourceAlpha, BlendFactor destinationAlpha) {
    GL_THREAD_CHECK();
    glBlendFuncSeparate(ToGL(source), ToGL(destination), ToGL(sourceAlpha), ToGL(destinationAlpha));
}

void GLDevice::BlendEquation(BlendEquationMode mode) {
    GL_THREAD_CHECK();
    glBlendEquation(ToGL(mode));
}

void GLDevice::BlendEquationSeparate(BlendEquationMode modeRGB, BlendEquationMode modeAlpha) {
    GL_THREAD_CHECK();
    glBlendEquationSeparate(ToGL(modeRGB), ToGL(modeAlpha));
}

void GLDevice::CullFace(Lumen::CullFace face) {
    GL_THREAD_CHECK();
    glCullFace(ToGL(face));
}

void GLDevice::FrontFace(Lumen::FrontFace winding) {
    GL_THREAD_CHECK();
    glFrontFace(winding == Lumen::FrontFace::Clockwise ? GL_CW : GL_CCW);
}

void GLDevice::DepthMask(bool enable) {
    GL_THREAD_CHECK();
    glDepthMask(enable ? GL_TRUE : GL_FALSE);
}

void GLDevice::DepthFunc(Lumen::DepthFunc func) {
    GL_THREAD_CHECK();
    glDepthFunc(ToGL(func));
}

void GLDevice::ActiveTexture(uint32_t unit) {
    GL_THREAD_CHECK();
    glActiveTexture(static_cast<GLenum>(unit));
}

uint32_t GLDevice::GetTextureUnitBase() const {
    return GL_TEXTURE0;
}

void GLDevice::BindTexture(TextureTarget target, uint32_t texture) {
    GL_THREAD_CHECK();
    glBindTexture(ToGL(target), texture);
}

void GLDevice::BindFramebuffer(FramebufferTarget target, uint32_t framebuffer) {
    GL_THREAD_CHECK();
    glBindFramebuffer(ToGL(target), framebuffer);
}

void GLDevice::Clear(uint32_t mask) {
    GLbitfield bits = 0;
    if (mask & ClearMask_Color) bits |= GL_COLOR_BUFFER_BIT;
    if (mask & ClearMask_Depth) bits |= GL_DEPTH_BUFFER_BIT;
    if (mask & ClearMask_Stencil) bits |= GL_STENCIL_BUFFER_BIT;
    
    GL_THREAD_CHECK();
    glClear(bits);
}

int GLDevice::GetInteger(GpuParameter parameter) {
    GLint value = 0;
    GL_THREAD_CHECK();
    glGetIntegerv(ToGL(parameter), &value);
    return static_cast<int>(value);
}

float GLDevice::GetFloat(GpuParameter parameter) {
    // 各向异性过滤需要扩展支持，不支持时按 1.0 处理
    if (parameter == GpuParameter::MaxTextureMaxAnisotropy &&
        !HasExtension("GL_EXT_texture_filter_anisotropic") &&
        !HasExtension("GL_ARB_texture_filter_anisotropic")) {
        return 1.0f;
    }
    
    GLfloat value = 0.0f;
    GL_THREAD_CHECK();
    glGetFloatv(ToGL(parameter), &value);
    return static_cast<float>(value);
}

bool GLDevice::HasExtension(const std::string& name) {
    if (!m_extensionsLoaded) {
        LoadExtensionList();
    }
    return m_extensions.find(name) != m_extensions.end();
}

void GLDevice::LoadExtensionList() {
    GL_THREAD_CHECK();
    
    GLint count = 0;
    glGetIntegerv(GL_NUM_EXTENSIONS, &count);
    for (GLint i = 0; i < count; ++i) {
        const GLubyte* extension = glGetStringi(GL_EXTENSIONS, static_cast<GLuint>(i));
        if (extension) {
            m_extensions.emplace(reinterpret_cast<const char*>(extension), true);
        }
    }
    
    m_extensionsLoaded = true;
    LOG_DEBUG_F("[GLDevice] %d extensions available", static_cast<int>(count));
}

} // namespace Lumen

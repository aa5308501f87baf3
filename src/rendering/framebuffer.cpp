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
#include "lumen/framebuffer.h"
#include "lumen/renderer.h"
#include "lumen/logger.h"
#include "lumen/gl_thread_checker.h"
#include "lumen/error.h"
#include <glad/glad.h>

namespace Lumen {

Framebuffer::Framebuffer()
    : m_renderer(nullptr)
    , m_fboID(0)
    , m_colorTexture(0)
    , m_depthRenderbuffer(0)
    , m_width(0)
    , m_height(0) {
}

Framebuffer::~Framebuffer() {
    Release();
}

bool Framebuffer::Create(Renderer& renderer, const FramebufferConfig& config) {
    GL_THREAD_CHECK();
    
    if (m_fboID != 0) {
        Release();
    }
    
    if (config.width <= 0 || config.height <= 0) {
        HANDLE_ERROR(LUMEN_ERROR(ErrorCode::InvalidArgument,
                                 "Framebuffer '" + config.name + "': 尺寸无效 (" +
                                 std::to_string(config.width) + "x" + std::to_string(config.height) + ")"));
        return false;
    }
    
    m_renderer = &renderer;
    m_config = config;
    m_width = config.width;
    m_height = config.height;
    
    // 创建期间占用纹理单元 0 和帧缓冲绑定，结束后恢复
    const PipelineState& state = renderer.GetRenderState().GetState();
    std::optional<uint32_t> previousFramebuffer = state.framebuffer;
    uint32_t previousTexture = state.textureUnits.empty() ? 0 : state.textureUnits[0];
    
    GLuint fbo = 0;
    glGenFramebuffers(1, &fbo);
    m_fboID = fbo;
    renderer.BindFramebuffer(FramebufferTarget::Framebuffer, m_fboID);
    
    // 颜色附件
    GLuint texture = 0;
    glGenTextures(1, &texture);
    m_colorTexture = texture;
    renderer.BindTexture(0, TextureTarget::Texture2D, m_colorTexture);
    if (config.floatColor) {
        glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA16F, m_width, m_height, 0, GL_RGBA, GL_FLOAT, nullptr);
    } else {
        glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA8, m_width, m_height, 0, GL_RGBA, GL_UNSIGNED_BYTE, nullptr);
    }
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
    glFramebufferTexture2D(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, GL_TEXTURE_2D, m_colorTexture, 0);
    renderer.BindTexture(0, TextureTarget::Texture2D, previousTexture);
    
    // 深度（模板）附件，渲染缓冲绑定不在状态跟踪范围内
    if (config.depth) {
        GLuint rbo = 0;
        glGenRenderbuffers(1, &rbo);
        m_depthRenderbuffer = rbo;
        glBindRenderbuffer(GL_RENDERBUFFER, m_depthRenderbuffer);
        if (config.stencil) {
            glRenderbufferStorage(GL_RENDERBUFFER, GL_DEPTH24_STENCIL8, m_width, m_height);
            glFramebufferRenderbuffer(GL_FRAMEBUFFER, GL_DEPTH_STENCIL_ATTACHMENT, GL_RENDERBUFFER, m_depthRenderbuffer);
        } else {
            glRenderbufferStorage(GL_RENDERBUFFER, GL_DEPTH_COMPONENT24, m_width, m_height);
            glFramebufferRenderbuffer(GL_FRAMEBUFFER, GL_DEPTH_ATTACHMENT, GL_RENDERBUFFER, m_depthRenderbuffer);
        }
        glBindRenderbuffer(GL_RENDERBUFFER, 0);
    }
    
    bool complete = CheckFramebufferStatus() && !CHECK_GL_ERROR();
    
    renderer.BindFramebuffer(FramebufferTarget::Framebuffer, previousFramebuffer);
    
    if (!complete) {
        Release();
        return false;
    }
    
    Logger::GetInstance().Info("Created framebuffer '" + m_config.name + "' (" +
                               std::to_string(m_width) + "x" + std::to_string(m_height) +
                               (config.floatColor ? ", float" : "") +
                               (config.depth ? ", depth" : "") + ")");
    return true;
}

bool Framebuffer::Resize(Renderer& renderer, int width, int height) {
    if (width == m_width && height == m_height && m_fboID != 0) {
        return true;
    }
    
    FramebufferConfig config = m_config;
    config.width = width;
    config.height = height;
    return Create(renderer, config);
}

void Framebuffer::Release() {
    // 析构可能发生在任意线程，这里不做线程检查
    // 驱动删除对象时会解除它们的绑定，缓存要跟着同步
    if (m_fboID != 0) {
        GLuint fbo = m_fboID;
        glDeleteFramebuffers(1, &fbo);
        if (m_renderer) {
            m_renderer->ForgetFramebuffer(m_fboID);
        }
        m_fboID = 0;
    }
    
    if (m_colorTexture != 0) {
        GLuint texture = m_colorTexture;
        glDeleteTextures(1, &texture);
        if (m_renderer) {
            m_renderer->ForgetTexture(m_colorTexture);
        }
        m_colorTexture = 0;
    }
    
    if (m_depthRenderbuffer != 0) {
        GLuint rbo = m_depthRenderbuffer;
        glDeleteRenderbuffers(1, &rbo);
        m_depthRenderbuffer = 0;
    }
    
    m_width = 0;
    m_height = 0;
}

bool Framebuffer::CheckFramebufferStatus() {
    GLenum status = glCheckFramebufferStatus(GL_FRAMEBUFFER);
    
    if (status != GL_FRAMEBUFFER_COMPLETE) {
        std::string statusStr;
        switch (status) {
            case GL_FRAMEBUFFER_INCOMPLETE_ATTACHMENT:
                statusStr = "Incomplete Attachment";
                break;
            case GL_FRAMEBUFFER_INCOMPLETE_MISSING_ATTACHMENT:
                statusStr = "Missing Attachment";
                break;
            case GL_FRAMEBUFFER_UNSUPPORTED:
                statusStr = "Unsupported";
                break;
            case GL_FRAMEBUFFER_INCOMPLETE_MULTISAMPLE:
                statusStr = "Incomplete Multisample";
                break;
            default:
                statusStr = "Unknown (" + std::to_string(status) + ")";
                break;
        }
        
        HANDLE_ERROR(LUMEN_ERROR(ErrorCode::RenderTargetInvalid,
                                 "Framebuffer '" + m_config.name + "' is not complete: " + statusStr));
        return false;
    }
    
    return true;
}

} // namespace Lumen

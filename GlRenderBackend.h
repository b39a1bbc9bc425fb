/**
 * GlRenderBackend.h - OpenGL 3.3 渲染后端
 *
 * 实现 RenderBackend（清屏、按模板状态绘制场景）和 ClipShading（裁剪材质变体）。
 * 需要有效的 GL 上下文并已调用 glewInit()，且默认帧缓冲带 8 位模板。
 */

#pragma once

#include "Camera.h"
#include "PortalTransform.h"
#include "RenderBackend.h"
#include "Scene.h"

#include <GL/glew.h>
#include <glm/glm.hpp>
#include <glm/gtc/type_ptr.hpp>

#include <iostream>
#include <memory>

namespace Seamless {

// ============================================================================
//                          网格上传
// ============================================================================

struct GpuMesh {
    GLuint vao = 0;
    GLuint vbo = 0;
    GLuint ebo = 0;
    GLsizei indexCount = 0;
};

/**
 * 创建网格的VAO/VBO/EBO，句柄随返回的 shared_ptr 一起释放
 */
inline std::shared_ptr<void> CreateGpuMesh(const Mesh& mesh) {
    std::shared_ptr<GpuMesh> gpu(new GpuMesh(), [](GpuMesh* m) {
        if (m->vao) {
            glDeleteVertexArrays(1, &m->vao);
            glDeleteBuffers(1, &m->vbo);
            glDeleteBuffers(1, &m->ebo);
        }
        delete m;
    });

    gpu->indexCount = static_cast<GLsizei>(mesh.indices.size());

    glGenVertexArrays(1, &gpu->vao);
    glGenBuffers(1, &gpu->vbo);
    glGenBuffers(1, &gpu->ebo);

    glBindVertexArray(gpu->vao);

    glBindBuffer(GL_ARRAY_BUFFER, gpu->vbo);
    glBufferData(GL_ARRAY_BUFFER, mesh.vertices.size() * sizeof(float), mesh.vertices.data(), GL_STATIC_DRAW);

    glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, gpu->ebo);
    glBufferData(GL_ELEMENT_ARRAY_BUFFER, mesh.indices.size() * sizeof(unsigned int), mesh.indices.data(), GL_STATIC_DRAW);

    const GLsizei stride = Mesh::FloatsPerVertex * sizeof(float);
    // Position attribute
    glVertexAttribPointer(0, 3, GL_FLOAT, GL_FALSE, stride, (void*)0);
    glEnableVertexAttribArray(0);
    // Normal attribute
    glVertexAttribPointer(1, 3, GL_FLOAT, GL_FALSE, stride, (void*)(3 * sizeof(float)));
    glEnableVertexAttribArray(1);
    // UV attribute
    glVertexAttribPointer(2, 2, GL_FLOAT, GL_FALSE, stride, (void*)(6 * sizeof(float)));
    glEnableVertexAttribArray(2);

    glBindVertexArray(0);

    return gpu;
}

// ============================================================================
//                          场景着色器
// ============================================================================

inline const char* GetSceneVertexShaderSource() {
    return R"(
#version 330 core
layout(location = 0) in vec3 aPos;
layout(location = 1) in vec3 aNormal;
layout(location = 2) in vec2 aTexCoord;

out vec3 vWorldPos;
out vec3 vNormal;

uniform mat4 uModel;
uniform mat4 uView;
uniform mat4 uProjection;

void main() {
    vec4 worldPos = uModel * vec4(aPos, 1.0);
    vWorldPos = worldPos.xyz;
    vNormal = mat3(transpose(inverse(uModel))) * aNormal;
    gl_Position = uProjection * uView * worldPos;
}
)";
}

inline const char* GetSceneFragmentShaderSource() {
    return R"(
#version 330 core
in vec3 vWorldPos;
in vec3 vNormal;

out vec4 FragColor;

uniform vec3 uColor;
uniform float uEmissive;
uniform bool uUnlit;
uniform vec3 uLightDir;

// 裁剪平面在 uClipFrame 变换后的坐标系中求值
uniform bool uClipEnabled;
uniform vec4 uClipPlane;
uniform mat4 uClipFrame;

void main() {
    if (uClipEnabled) {
        vec3 p = (uClipFrame * vec4(vWorldPos, 1.0)).xyz;
        if (dot(uClipPlane.xyz, p) + uClipPlane.w < 0.0) {
            discard;
        }
    }

    if (uUnlit) {
        FragColor = vec4(uColor, 1.0);
        return;
    }

    vec3 n = normalize(vNormal);
    if (!gl_FrontFacing) n = -n;
    float diffuse = max(dot(n, -normalize(uLightDir)), 0.0);
    vec3 color = uColor * (0.35 + 0.65 * diffuse) + uColor * uEmissive;
    FragColor = vec4(color, 1.0);
}
)";
}

/**
 * 编译并链接着色器程序，失败时返回 0
 */
inline GLuint CompileSceneShader() {
    auto compileShader = [](GLenum type, const char* source) -> GLuint {
        GLuint shader = glCreateShader(type);
        glShaderSource(shader, 1, &source, nullptr);
        glCompileShader(shader);

        GLint success;
        glGetShaderiv(shader, GL_COMPILE_STATUS, &success);
        if (!success) {
            char infoLog[512];
            glGetShaderInfoLog(shader, 512, nullptr, infoLog);
            std::cerr << (type == GL_VERTEX_SHADER ? "Scene VS" : "Scene FS")
                      << " compile error: " << infoLog << std::endl;
            glDeleteShader(shader);
            return 0;
        }
        return shader;
    };

    GLuint vertShader = compileShader(GL_VERTEX_SHADER, GetSceneVertexShaderSource());
    GLuint fragShader = compileShader(GL_FRAGMENT_SHADER, GetSceneFragmentShaderSource());
    if (!vertShader || !fragShader) {
        if (vertShader) glDeleteShader(vertShader);
        if (fragShader) glDeleteShader(fragShader);
        return 0;
    }

    GLuint program = glCreateProgram();
    glAttachShader(program, vertShader);
    glAttachShader(program, fragShader);
    glLinkProgram(program);

    glDeleteShader(vertShader);
    glDeleteShader(fragShader);

    GLint success;
    glGetProgramiv(program, GL_LINK_STATUS, &success);
    if (!success) {
        char infoLog[512];
        glGetProgramInfoLog(program, 512, nullptr, infoLog);
        std::cerr << "Scene shader link error: " << infoLog << std::endl;
        glDeleteProgram(program);
        return 0;
    }

    return program;
}

inline GLenum ToGlStencilFunc(StencilFunc func) {
    switch (func) {
        case StencilFunc::Equal:    return GL_EQUAL;
        case StencilFunc::NotEqual: return GL_NOTEQUAL;
        case StencilFunc::Always:   break;
    }
    return GL_ALWAYS;
}

inline GLenum ToGlStencilOp(StencilOp op) {
    switch (op) {
        case StencilOp::Replace:   return GL_REPLACE;
        case StencilOp::Increment: return GL_INCR;
        case StencilOp::Decrement: return GL_DECR;
        case StencilOp::Keep:      break;
    }
    return GL_KEEP;
}

// ============================================================================
//                          GlRenderBackend
// ============================================================================

class GlRenderBackend : public RenderBackend, public ClipShading {
public:
    GlRenderBackend() = default;

    ~GlRenderBackend() override {
        Dispose();
    }

    GlRenderBackend(const GlRenderBackend&) = delete;
    GlRenderBackend& operator=(const GlRenderBackend&) = delete;

    bool Init() {
        m_program = CompileSceneShader();
        if (!m_program) return false;

        m_uModel = glGetUniformLocation(m_program, "uModel");
        m_uView = glGetUniformLocation(m_program, "uView");
        m_uProjection = glGetUniformLocation(m_program, "uProjection");
        m_uColor = glGetUniformLocation(m_program, "uColor");
        m_uEmissive = glGetUniformLocation(m_program, "uEmissive");
        m_uUnlit = glGetUniformLocation(m_program, "uUnlit");
        m_uLightDir = glGetUniformLocation(m_program, "uLightDir");
        m_uClipEnabled = glGetUniformLocation(m_program, "uClipEnabled");
        m_uClipPlane = glGetUniformLocation(m_program, "uClipPlane");
        m_uClipFrame = glGetUniformLocation(m_program, "uClipFrame");
        return true;
    }

    void SetClearColor(const glm::vec3& color) { m_clearColor = color; }
    void SetLightDirection(const glm::vec3& direction) { m_lightDir = direction; }

    void Clear(bool color, bool depth, bool stencil) override {
        GLbitfield bits = 0;
        if (color) {
            glColorMask(GL_TRUE, GL_TRUE, GL_TRUE, GL_TRUE);
            glClearColor(m_clearColor.r, m_clearColor.g, m_clearColor.b, 1.0f);
            bits |= GL_COLOR_BUFFER_BIT;
        }
        if (depth) {
            glDepthMask(GL_TRUE);
            bits |= GL_DEPTH_BUFFER_BIT;
        }
        if (stencil) {
            glStencilMask(0xFF);  // 确保模板可写
            glClearStencil(0);
            bits |= GL_STENCIL_BUFFER_BIT;
        }
        if (bits) glClear(bits);
    }

    void Render(const Scene& scene, const Camera& camera, const DrawState& state) override {
        if (!m_program) return;
        if (m_autoClear) Clear(true, true, true);

        glUseProgram(m_program);

        glm::mat4 view = camera.GetViewMatrix();
        glUniformMatrix4fv(m_uView, 1, GL_FALSE, glm::value_ptr(view));
        glUniformMatrix4fv(m_uProjection, 1, GL_FALSE, glm::value_ptr(camera.projection));
        glUniform3fv(m_uLightDir, 1, glm::value_ptr(m_lightDir));

        glEnable(GL_DEPTH_TEST);
        glDepthFunc(state.depthTest ? GL_LESS : GL_ALWAYS);

        // 配置模板测试
        glEnable(GL_STENCIL_TEST);
        glStencilFunc(ToGlStencilFunc(state.stencilFunc), state.stencilRef, 0xFF);
        glStencilOp(GL_KEEP, GL_KEEP, ToGlStencilOp(state.stencilPassOp));

        for (const DrawablePtr& drawable : scene.GetDrawables()) {
            if (!PassesFilter(*drawable, state.filter)) continue;
            DrawOne(*drawable, state);
        }

        // 恢复状态
        glDepthFunc(GL_LESS);
        glColorMask(GL_TRUE, GL_TRUE, GL_TRUE, GL_TRUE);
        glDepthMask(GL_TRUE);
        glStencilMask(0xFF);
        glDisable(GL_STENCIL_TEST);
        glEnable(GL_CULL_FACE);
        glBindVertexArray(0);
    }

    bool GetAutoClear() const override { return m_autoClear; }
    void SetAutoClear(bool autoClear) override { m_autoClear = autoClear; }

    // 用于在 RenderDoc 中显示渲染事件层级
    void PushDebugGroup(const char* name) override {
        if (glPushDebugGroup) {
            glPushDebugGroup(GL_DEBUG_SOURCE_APPLICATION, 0, -1, name);
        }
    }

    void PopDebugGroup() override {
        if (glPopDebugGroup) {
            glPopDebugGroup();
        }
    }

    /**
     * 裁剪变体只是带平面 uniform 的材质副本，所有变体共用同一着色器程序
     */
    std::shared_ptr<Material> CreateClippedVariant(const Material& base, const Plane& keepPlane) override {
        auto variant = std::make_shared<Material>(base);
        variant->clipEnabled = true;
        variant->clipPlane = keepPlane.AsVec4();
        variant->doubleSided = true;
        ++m_liveVariants;
        return variant;
    }

    void DisposeVariant(const std::shared_ptr<Material>& variant) override {
        if (variant && m_liveVariants > 0) --m_liveVariants;
    }

    int GetLiveVariantCount() const { return m_liveVariants; }

    void Dispose() {
        if (m_program) {
            glDeleteProgram(m_program);
            m_program = 0;
        }
        if (m_liveVariants > 0) {
            std::cerr << "GlRenderBackend: " << m_liveVariants << " clip variants still alive at dispose" << std::endl;
        }
    }

private:
    void DrawOne(Drawable& drawable, const DrawState& state) {
        const Material& material = *drawable.material;

        GLboolean colorWrite = (material.colorWrite && !state.depthOnly) ? GL_TRUE : GL_FALSE;
        glColorMask(colorWrite, colorWrite, colorWrite, colorWrite);
        glDepthMask((material.depthWrite || state.depthOnly) ? GL_TRUE : GL_FALSE);
        glStencilMask(WritesStencil(material, state) ? 0xFF : 0x00);
        if (material.doubleSided) {
            glDisable(GL_CULL_FACE);
        } else {
            glEnable(GL_CULL_FACE);
        }

        Mesh& mesh = *drawable.mesh;
        if (!mesh.gpuHandle) {
            mesh.gpuHandle = CreateGpuMesh(mesh);
        }
        const GpuMesh* gpu = static_cast<const GpuMesh*>(mesh.gpuHandle.get());

        glm::mat4 model = drawable.GetModelMatrix();
        glUniformMatrix4fv(m_uModel, 1, GL_FALSE, glm::value_ptr(model));
        glUniform3fv(m_uColor, 1, glm::value_ptr(material.color));
        glUniform1f(m_uEmissive, material.emissive);
        glUniform1i(m_uUnlit, material.unlit ? 1 : 0);
        glUniform1i(m_uClipEnabled, material.clipEnabled ? 1 : 0);
        glUniform4fv(m_uClipPlane, 1, glm::value_ptr(material.clipPlane));
        glUniformMatrix4fv(m_uClipFrame, 1, GL_FALSE, glm::value_ptr(drawable.clipFrame));

        glBindVertexArray(gpu->vao);
        glDrawElements(GL_TRIANGLES, gpu->indexCount, GL_UNSIGNED_INT, 0);
    }

    GLuint m_program = 0;
    GLint m_uModel = -1;
    GLint m_uView = -1;
    GLint m_uProjection = -1;
    GLint m_uColor = -1;
    GLint m_uEmissive = -1;
    GLint m_uUnlit = -1;
    GLint m_uLightDir = -1;
    GLint m_uClipEnabled = -1;
    GLint m_uClipPlane = -1;
    GLint m_uClipFrame = -1;

    glm::vec3 m_clearColor = glm::vec3(0.05f, 0.05f, 0.1f);
    glm::vec3 m_lightDir = glm::vec3(-0.4f, -1.0f, -0.3f);
    bool m_autoClear = true;
    int m_liveVariants = 0;
};

} // namespace Seamless

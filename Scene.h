/**
 * Scene.h - 可绘制对象集合
 *
 * Mesh     : CPU 端几何数据（position(3) normal(3) uv(2)），GPU 句柄由后端懒创建
 * Material : 外观（颜色、写入掩码、裁剪平面、模板写入值）
 * Drawable : 网格 + 材质 + 变换
 * Scene    : 一个世界中所有可绘制对象
 */

#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/quaternion.hpp>

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

namespace Seamless {

struct Mesh {
    // 顶点数据: position (3), normal (3), uv (2)
    std::vector<float> vertices;
    std::vector<unsigned int> indices;

    // 后端上传后的 GPU 资源，析构器负责释放
    std::shared_ptr<void> gpuHandle;

    static constexpr int FloatsPerVertex = 8;

    size_t GetVertexCount() const {
        return vertices.size() / FloatsPerVertex;
    }

    void ReleaseGpu() {
        gpuHandle.reset();
    }
};

struct Material {
    glm::vec3 color = glm::vec3(1.0f);
    float emissive = 0.0f;
    bool unlit = false;
    bool doubleSided = false;

    bool colorWrite = true;
    bool depthWrite = true;

    // 模板遮罩材质写入的标记值
    bool stencilWrite = false;
    int stencilRef = 1;

    // 裁剪：丢弃 dot(clipPlane, clipFrame * worldPos) < 0 的片元
    bool clipEnabled = false;
    glm::vec4 clipPlane = glm::vec4(0.0f, 0.0f, 1.0f, 0.0f);
};

struct Drawable {
    std::string name;
    std::shared_ptr<Mesh> mesh;
    std::shared_ptr<Material> material;

    glm::vec3 position = glm::vec3(0.0f);
    glm::quat orientation = glm::quat(1.0f, 0.0f, 0.0f, 0.0f);
    glm::vec3 scale = glm::vec3(1.0f);

    // 裁剪平面所在的坐标系（世界 -> 平面定义处）。
    // 另一侧的克隆体需要把片元映射回源世界再做裁剪测试。
    glm::mat4 clipFrame = glm::mat4(1.0f);

    bool visible = true;
    bool stencilMask = false;

    glm::mat4 GetModelMatrix() const {
        return glm::translate(glm::mat4(1.0f), position)
             * glm::mat4_cast(orientation)
             * glm::scale(glm::mat4(1.0f), scale);
    }
};

using DrawablePtr = std::shared_ptr<Drawable>;

// ============================================================================
//                          每次绘制调用的模板状态
// ============================================================================

enum class StencilFunc {
    Always,
    Equal,
    NotEqual
};

enum class StencilOp {
    Keep,
    Replace,
    Increment,
    Decrement
};

enum class DrawFilter {
    SceneOnly,   // 排除门户遮罩
    MasksOnly    // 只绘制门户遮罩
};

/**
 * 模板测试模式和参考值作为绘制调用参数传入，材质本身不被修改
 */
struct DrawState {
    StencilFunc stencilFunc = StencilFunc::Always;
    int stencilRef = 0;
    StencilOp stencilPassOp = StencilOp::Keep;
    DrawFilter filter = DrawFilter::SceneOnly;

    // 关闭时片元不做深度测试（遮罩按整个四边形写模板）
    bool depthTest = true;
    // 只写深度：忽略材质的颜色/深度写入设置
    bool depthOnly = false;

    static DrawState ForScene(StencilFunc func, int ref) {
        DrawState state;
        state.stencilFunc = func;
        state.stencilRef = ref;
        return state;
    }

    static DrawState ForMask(StencilFunc func, int ref, StencilOp op) {
        DrawState state;
        state.stencilFunc = func;
        state.stencilRef = ref;
        state.stencilPassOp = op;
        state.filter = DrawFilter::MasksOnly;
        state.depthTest = false;
        return state;
    }

    // 门户平面写入深度，平面后方的几何体不会覆盖门户中的画面
    static DrawState ForPortalDepth(StencilFunc func, int ref) {
        DrawState state;
        state.stencilFunc = func;
        state.stencilRef = ref;
        state.filter = DrawFilter::MasksOnly;
        state.depthOnly = true;
        return state;
    }
};

// 只有 stencilWrite 材质在非 Keep 操作下修改模板缓冲
inline bool WritesStencil(const Material& material, const DrawState& state) {
    return material.stencilWrite && state.stencilPassOp != StencilOp::Keep;
}

inline bool PassesFilter(const Drawable& drawable, DrawFilter filter) {
    if (!drawable.visible || !drawable.mesh || !drawable.material) return false;
    return filter == DrawFilter::MasksOnly ? drawable.stencilMask : !drawable.stencilMask;
}

// ============================================================================
//                          Scene
// ============================================================================

class Scene {
public:
    void Add(const DrawablePtr& drawable) {
        if (!drawable || Contains(drawable.get())) return;
        m_drawables.push_back(drawable);
    }

    bool Remove(const Drawable* drawable) {
        auto it = std::find_if(m_drawables.begin(), m_drawables.end(),
            [drawable](const DrawablePtr& d) { return d.get() == drawable; });
        if (it == m_drawables.end()) return false;
        m_drawables.erase(it);
        return true;
    }

    bool Contains(const Drawable* drawable) const {
        return std::any_of(m_drawables.begin(), m_drawables.end(),
            [drawable](const DrawablePtr& d) { return d.get() == drawable; });
    }

    const std::vector<DrawablePtr>& GetDrawables() const {
        return m_drawables;
    }

    size_t Size() const {
        return m_drawables.size();
    }

private:
    std::vector<DrawablePtr> m_drawables;
};

/**
 * 将门户遮罩临时挂到场景上，作用域结束时摘除（仅单线程渲染安全）
 * 遮罩原本就在场景中时不做任何事
 */
class ScopedAttachment {
public:
    ScopedAttachment(Scene& scene, const DrawablePtr& drawable)
        : m_scene(scene), m_drawable(drawable), m_attached(false) {
        if (!m_scene.Contains(m_drawable.get())) {
            m_scene.Add(m_drawable);
            m_attached = true;
        }
    }

    ~ScopedAttachment() {
        if (m_attached) {
            m_scene.Remove(m_drawable.get());
        }
    }

    ScopedAttachment(const ScopedAttachment&) = delete;
    ScopedAttachment& operator=(const ScopedAttachment&) = delete;

private:
    Scene& m_scene;
    DrawablePtr m_drawable;
    bool m_attached;
};

} // namespace Seamless

/**
 * RenderBackend.h - 渲染后端接口
 *
 * PortalRenderer 只通过这里的接口访问 GPU：清屏、按 DrawState 绘制场景、
 * 自动清屏开关、调试分组。ClipShading 负责生成按平面裁剪的材质变体。
 */

#pragma once

#include "Camera.h"
#include "PortalTransform.h"
#include "Scene.h"

#include <memory>

namespace Seamless {

class RenderBackend {
public:
    virtual ~RenderBackend() = default;

    virtual void Clear(bool color, bool depth, bool stencil) = 0;

    // 按 state 的模板测试绘制 scene 中通过过滤的对象
    virtual void Render(const Scene& scene, const Camera& camera, const DrawState& state) = 0;

    // 开启时 Render() 在绘制前自动清除全部缓冲
    virtual bool GetAutoClear() const = 0;
    virtual void SetAutoClear(bool autoClear) = 0;

    // RenderDoc 调试标记，默认不做任何事
    virtual void PushDebugGroup(const char* name) { (void)name; }
    virtual void PopDebugGroup() {}
};

class ClipShading {
public:
    virtual ~ClipShading() = default;

    // 复制 base 并丢弃 keepPlane 负侧的片元
    virtual std::shared_ptr<Material> CreateClippedVariant(const Material& base, const Plane& keepPlane) = 0;

    virtual void DisposeVariant(const std::shared_ptr<Material>& variant) = 0;
};

/**
 * 在作用域内关闭后端自动清屏，无论中途是否抛出异常都会恢复原值
 */
class AutoClearGuard {
public:
    explicit AutoClearGuard(RenderBackend& backend)
        : m_backend(backend), m_previous(backend.GetAutoClear()) {
        m_backend.SetAutoClear(false);
    }

    ~AutoClearGuard() {
        m_backend.SetAutoClear(m_previous);
    }

    AutoClearGuard(const AutoClearGuard&) = delete;
    AutoClearGuard& operator=(const AutoClearGuard&) = delete;

private:
    RenderBackend& m_backend;
    bool m_previous;
};

class DebugGroupScope {
public:
    DebugGroupScope(RenderBackend& backend, const char* name) : m_backend(backend) {
        m_backend.PushDebugGroup(name);
    }

    ~DebugGroupScope() {
        m_backend.PopDebugGroup();
    }

    DebugGroupScope(const DebugGroupScope&) = delete;
    DebugGroupScope& operator=(const DebugGroupScope&) = delete;

private:
    RenderBackend& m_backend;
};

} // namespace Seamless

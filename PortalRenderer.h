/**
 * PortalRenderer.h - 门户渲染器
 *
 * 基于模板缓冲的多遍门户渲染：
 * 1. 清除颜色/深度/模板缓冲
 * 2. 对当前世界中每个可见门户（由远到近）：
 *    a. 只把门户四边形写入模板缓冲（标记值 = 递归深度 + 1）
 *    b. 计算目标门户一侧的虚拟相机，使用斜裁剪投影
 *    c. 递归渲染目标世界中的门户
 *    d. 清除深度，只在模板等于标记值的区域绘制目标世界
 *    e. 门户区域的模板递减回递归深度
 * 3. 清除深度，写入门户平面的深度，再在模板为 0 的区域绘制当前世界。
 *    门户前方的几何体照常画出，后方的被门户平面挡住
 *
 * 渲染是单线程、严格顺序执行的：每次绘制都依赖上一次留下的模板/深度状态。
 */

#pragma once

#include "Camera.h"
#include "Portal.h"
#include "PortalTransform.h"
#include "RenderBackend.h"
#include "Scene.h"
#include "World.h"

#include <algorithm>
#include <cstdio>
#include <iostream>
#include <string>
#include <vector>

namespace Seamless {

// ============================================================================
//                          常量定义
// ============================================================================
constexpr int MAX_STENCIL_MARKER = 255;

struct PortalRenderOptions {
    // 最大递归深度（0 = 不渲染任何门户）
    int maxRecursion = 1;
    // 打印每一遍绘制的调试信息
    bool debug = false;
};

struct PortalFrameStats {
    int maskPasses = 0;
    int destinationPasses = 0;
    int deepestLevel = 0;
    int skippedPortals = 0;
};

class PortalRenderer {
public:
    explicit PortalRenderer(RenderBackend& backend, const PortalRenderOptions& options = PortalRenderOptions())
        : m_backend(backend), m_options(options)
    {
        if (m_options.maxRecursion < 0) {
            std::cerr << "PortalRenderer: maxRecursion " << m_options.maxRecursion << " is negative, using 0" << std::endl;
            m_options.maxRecursion = 0;
        }
        // 8 位模板缓冲最多能区分 255 层
        if (m_options.maxRecursion > MAX_STENCIL_MARKER) {
            std::cerr << "PortalRenderer: maxRecursion " << m_options.maxRecursion
                      << " exceeds the stencil range, using " << MAX_STENCIL_MARKER << std::endl;
            m_options.maxRecursion = MAX_STENCIL_MARKER;
        }
    }

    PortalRenderer(const PortalRenderer&) = delete;
    PortalRenderer& operator=(const PortalRenderer&) = delete;

    int GetMaxRecursion() const { return m_options.maxRecursion; }

    bool IsDebug() const { return m_options.debug; }
    void SetDebug(bool debug) { m_options.debug = debug; }

    // 最近一次顶层门户使用的虚拟相机
    const Camera& GetPortalCamera() const { return m_portalCamera; }

    const PortalFrameStats& GetLastFrameStats() const { return m_stats; }

    /**
     * 渲染一帧
     *
     * @param camera       观察者相机
     * @param currentWorld 观察者所在的世界
     * @param allWorlds    所有世界（用于查找目标世界）
     */
    void Render(const Camera& camera, World& currentWorld, const WorldRegistry& allWorlds) {
        if (m_disposed) {
            std::cerr << "PortalRenderer: Render() called after Dispose()" << std::endl;
            return;
        }

        m_stats = PortalFrameStats();

        AutoClearGuard autoClear(m_backend);
        DebugGroupScope frameGroup(m_backend, "Portal Frame");

        m_backend.Clear(true, true, true);

        // 最后一步在模板为 0 的区域绘制当前世界
        RenderLevel(camera, currentWorld, allWorlds, 0);

        if (m_options.debug) {
            std::cout << "[Portal Debug] Frame in '" << currentWorld.GetId() << "': "
                      << m_stats.destinationPasses << " destination passes, deepest level "
                      << m_stats.deepestLevel << ", skipped " << m_stats.skippedPortals << std::endl;
        }
    }

    /**
     * 单门户对的简化渲染（最常见情况），等价于通用算法的第一层，
     * 不需要查找目标世界
     */
    void RenderSimple(const Camera& camera, Scene& currentScene, Scene& destinationScene, Portal& portal) {
        if (m_disposed) {
            std::cerr << "PortalRenderer: RenderSimple() called after Dispose()" << std::endl;
            return;
        }

        m_stats = PortalFrameStats();

        AutoClearGuard autoClear(m_backend);
        DebugGroupScope frameGroup(m_backend, "Portal Frame (simple)");

        m_backend.Clear(true, true, true);

        bool rendered = false;
        if (m_options.maxRecursion > 0 && portal.IsLinked() && portal.IsPointInFront(camera.position)) {
            DebugGroupScope group(m_backend, "Portal L0");

            if (RenderPortalStencil(portal, currentScene, camera, 0)) {
                Camera portalCamera = MakeDestinationCamera(camera, portal);
                m_portalCamera = portalCamera;

                m_backend.Clear(false, true, false);
                m_backend.Render(destinationScene, portalCamera, DrawState::ForScene(StencilFunc::Equal, 1));
                ++m_stats.destinationPasses;
                m_stats.deepestLevel = 1;

                ClosePortalStencil(portal, currentScene, camera, 0);
                rendered = true;
            }
        }

        if (rendered) {
            m_backend.Clear(false, true, false);
            Scene portalPlane;
            portalPlane.Add(portal.GetMask());
            m_backend.Render(portalPlane, camera, DrawState::ForPortalDepth(StencilFunc::NotEqual, 1));
        }
        m_backend.Render(currentScene, camera, DrawState::ForScene(StencilFunc::NotEqual, 1));
    }

    void Dispose() {
        m_disposed = true;
    }

    bool IsDisposed() const { return m_disposed; }

private:
    struct VisiblePortal {
        Portal* portal;
        World* destination;
        float distance;
    };

    // 可以看穿的门户，由远到近排列：重叠时近处门户的画面覆盖远处
    std::vector<VisiblePortal> CollectVisiblePortals(const Camera& camera, World& world,
                                                     const WorldRegistry& allWorlds, int depth) {
        std::vector<VisiblePortal> visible;
        for (const auto& entry : world.GetPortals()) {
            Portal& portal = *entry;
            Portal* destPortal = portal.GetLinkedPortal();
            if (!destPortal) continue;

            // 只有相机在门户正面时才能看穿
            if (!portal.IsPointInFront(camera.position)) continue;

            World* destWorld = allWorlds.FindOwner(destPortal);
            if (!destWorld) {
                ++m_stats.skippedPortals;
                if (m_options.debug) {
                    std::cout << "[Portal Debug L" << depth << "] Portal '" << portal.GetId()
                              << "' has no destination world this frame" << std::endl;
                }
                continue;
            }

            visible.push_back({ &portal, destWorld, glm::distance(camera.position, portal.GetCenter()) });
        }

        std::stable_sort(visible.begin(), visible.end(), [](const VisiblePortal& a, const VisiblePortal& b) {
            return a.distance > b.distance;
        });
        return visible;
    }

    /**
     * 在模板等于 depth 的区域绘制 world：
     * 先逐个处理可见门户（写模板 -> 递归 -> 恢复模板），再画世界本身
     */
    void RenderLevel(const Camera& camera, World& world, const WorldRegistry& allWorlds, int depth) {
        std::vector<Portal*> rendered;

        if (depth < m_options.maxRecursion) {
            for (const VisiblePortal& entry : CollectVisiblePortals(camera, world, allWorlds, depth)) {
                Portal& portal = *entry.portal;
                World& destWorld = *entry.destination;

                char debugName[128];
                std::snprintf(debugName, sizeof(debugName), "Portal L%d %s -> %s Stencil=%d",
                              depth, portal.GetId().c_str(), destWorld.GetId().c_str(), depth + 1);
                DebugGroupScope group(m_backend, debugName);

                Scene& maskScene = portal.GetScene() ? *portal.GetScene() : world.GetScene();
                if (!RenderPortalStencil(portal, maskScene, camera, depth)) {
                    ++m_stats.skippedPortals;
                    continue;
                }

                Camera portalCamera = MakeDestinationCamera(camera, portal);
                if (depth == 0) {
                    m_portalCamera = portalCamera;
                }

                if (m_options.debug) {
                    const glm::vec3& p = portal.GetPosition();
                    const glm::vec3& v = portalCamera.position;
                    std::cout << "[Portal Debug L" << depth << "] Rendering portal '" << portal.GetId()
                              << "' at (" << p.x << ", " << p.y << ", " << p.z << ")" << std::endl;
                    std::cout << "  -> Destination: '" << portal.GetLinkedPortal()->GetId()
                              << "' in world '" << destWorld.GetId() << "'" << std::endl;
                    std::cout << "  -> Virtual camera pos: (" << v.x << ", " << v.y << ", " << v.z << ")" << std::endl;
                    std::cout << "  -> Stencil value: " << depth + 1 << std::endl;
                }

                // 目标世界（以及其中的门户）画进标记为 depth + 1 的区域
                RenderLevel(portalCamera, destWorld, allWorlds, depth + 1);
                ++m_stats.destinationPasses;
                m_stats.deepestLevel = std::max(m_stats.deepestLevel, depth + 1);

                // 区域恢复为 depth，下一个同层门户不会覆盖它
                ClosePortalStencil(portal, maskScene, camera, depth);
                rendered.push_back(&portal);
            }
        }

        DebugGroupScope group(m_backend, depth == 0 ? "Current World" : "Destination World");

        // 只清深度（保留模板），这一层的遮挡关系不受其它层影响
        if (depth > 0 || !rendered.empty()) {
            m_backend.Clear(false, true, false);
        }

        if (!rendered.empty()) {
            Scene portalPlanes;
            for (Portal* portal : rendered) {
                portalPlanes.Add(portal->GetMask());
            }
            m_backend.Render(portalPlanes, camera, DrawState::ForPortalDepth(StencilFunc::Equal, depth));
        }

        m_backend.Render(world.GetScene(), camera, DrawState::ForScene(StencilFunc::Equal, depth));
    }

    /**
     * 只把门户四边形写入模板缓冲
     *
     * 只在父层区域（模板 == depth）内递增，得到标记值 depth + 1。
     * 遮罩仅在这一次绘制期间挂在场景上。
     */
    bool RenderPortalStencil(Portal& portal, Scene& scene, const Camera& camera, int depth) {
        const DrawablePtr& mask = portal.GetMask();
        if (!mask) return false;

        portal.SetStencilRef(depth + 1);

        ScopedAttachment attachment(scene, mask);
        m_backend.Render(scene, camera, DrawState::ForMask(StencilFunc::Equal, depth, StencilOp::Increment));

        ++m_stats.maskPasses;
        return true;
    }

    // 把门户区域从 depth + 1 递减回 depth
    void ClosePortalStencil(Portal& portal, Scene& scene, const Camera& camera, int depth) {
        ScopedAttachment attachment(scene, portal.GetMask());
        m_backend.Render(scene, camera, DrawState::ForMask(StencilFunc::Equal, depth + 1, StencilOp::Decrement));
    }

    /**
     * 目标门户一侧的虚拟相机：位姿经门户变换，投影近平面与目标门户平面重合
     */
    Camera MakeDestinationCamera(const Camera& camera, const Portal& portal) const {
        Camera portalCamera = camera;

        PortalPose pose = portal.GetDestinationCameraTransform(camera.position, camera.orientation);
        portalCamera.position = pose.position;
        portalCamera.orientation = pose.orientation;

        // 从标准透视投影出发，避免叠加上一层的斜裁剪
        portalCamera.UpdateProjection();

        // 翻转法线，使其朝向虚拟相机
        Plane clipPlane = portal.GetLinkedPortal()->GetPlane().Negated();
        portalCamera.SetProjection(PortalTransform::ObliqueProjection(portalCamera, clipPlane));

        return portalCamera;
    }

    RenderBackend& m_backend;
    PortalRenderOptions m_options;
    Camera m_portalCamera;
    PortalFrameStats m_stats;
    bool m_disposed = false;
};

} // namespace Seamless

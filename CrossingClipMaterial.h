/**
 * CrossingClipMaterial.h - 横跨门户平面物体的裁剪材质
 *
 * 物体包围球与门户平面相交时，它同时出现在两个世界中：
 * - 源世界中的本体使用"保留平面正面"的材质
 * - 目标世界中的另一侧实例使用"保留平面背面"的材质
 * 两个裁剪变体只在平面参数变化时重建（非线程安全）。
 */

#pragma once

#include "PortalTransform.h"
#include "RenderBackend.h"
#include "Scene.h"

#include <glm/glm.hpp>
#include <glm/gtc/epsilon.hpp>

#include <cmath>
#include <memory>

namespace Seamless {

class CrossingClipMaterial {
public:
    // 平面参数变化小于该值时不重建变体
    static constexpr float PlaneEpsilon = 1e-4f;

    /**
     * @param primary   源世界中的物体
     * @param otherSide 已经放在目标世界中的另一侧实例（初始隐藏）
     * @param shading   裁剪变体的生成者
     */
    CrossingClipMaterial(const DrawablePtr& primary, const DrawablePtr& otherSide, ClipShading& shading)
        : m_primary(primary), m_otherSide(otherSide), m_shading(shading)
    {
        if (m_primary) {
            m_naturalMaterial = m_primary->material;
        }
        if (m_otherSide) {
            m_otherSide->visible = false;
            if (!m_otherSide->material) {
                m_otherSide->material = m_naturalMaterial;
            }
        }
    }

    ~CrossingClipMaterial() {
        Dispose();
    }

    CrossingClipMaterial(const CrossingClipMaterial&) = delete;
    CrossingClipMaterial& operator=(const CrossingClipMaterial&) = delete;

    /**
     * 根据物体到平面的有符号距离更新穿越状态
     *
     * @return 物体当前是否横跨平面
     */
    bool UpdateCrossing(const glm::vec3& planeNormal, const glm::vec3& planePoint, float objectRadius) {
        if (!m_primary || !m_naturalMaterial) return false;

        float signedDistance = glm::dot(m_primary->position - planePoint, planeNormal);
        m_crossing = std::abs(signedDistance) < objectRadius;

        if (!m_crossing) {
            m_primary->material = m_naturalMaterial;
            m_primary->clipFrame = glm::mat4(1.0f);
            if (m_otherSide) m_otherSide->visible = false;
            return false;
        }

        if (!m_hasPlane || PlaneChanged(planeNormal, planePoint)) {
            m_planeNormal = planeNormal;
            m_planePoint = planePoint;
            m_hasPlane = true;
            RebuildVariants();
        }

        m_primary->material = m_sourceVariant;
        m_primary->clipFrame = glm::mat4(1.0f);
        if (m_otherSide) {
            m_otherSide->material = m_destinationVariant;
            m_otherSide->visible = true;
        }
        return true;
    }

    /**
     * 将本体位姿经门户变换同步到另一侧实例
     *
     * 另一侧实例的裁剪帧设为"目标世界 -> 源世界"，使目标变体的平面在定义它的世界中求值。
     */
    void SyncOtherSidePosition(const PortalPose& sourcePortal, const PortalPose& destinationPortal) {
        if (!m_primary || !m_otherSide) return;

        m_otherSide->position = PortalTransform::TransformPointThroughPortal(
            m_primary->position, sourcePortal, destinationPortal);
        m_otherSide->orientation = PortalTransform::TransformOrientationThroughPortal(
            m_primary->orientation, sourcePortal, destinationPortal);
        m_otherSide->scale = m_primary->scale;
        m_otherSide->clipFrame = PortalTransform::TeleportMatrix(destinationPortal, sourcePortal);
    }

    bool IsCrossing() const { return m_crossing; }

    const std::shared_ptr<Material>& GetNaturalMaterial() const { return m_naturalMaterial; }
    const std::shared_ptr<Material>& GetSourceVariant() const { return m_sourceVariant; }
    const std::shared_ptr<Material>& GetDestinationVariant() const { return m_destinationVariant; }

    const DrawablePtr& GetPrimary() const { return m_primary; }
    const DrawablePtr& GetOtherSide() const { return m_otherSide; }

    void Dispose() {
        if (m_primary && m_naturalMaterial) {
            m_primary->material = m_naturalMaterial;
            m_primary->clipFrame = glm::mat4(1.0f);
        }
        if (m_otherSide) {
            m_otherSide->visible = false;
        }
        ReleaseVariants();
        m_hasPlane = false;
        m_crossing = false;
    }

private:
    bool PlaneChanged(const glm::vec3& normal, const glm::vec3& point) const {
        const float epsilon = PlaneEpsilon;
        return !glm::all(glm::epsilonEqual(normal, m_planeNormal, epsilon)) ||
               !glm::all(glm::epsilonEqual(point, m_planePoint, epsilon));
    }

    void RebuildVariants() {
        ReleaseVariants();

        Plane keepSource = PortalTransform::MakeClipPlane(m_planeNormal, m_planePoint);
        m_sourceVariant = m_shading.CreateClippedVariant(*m_naturalMaterial, keepSource);
        m_destinationVariant = m_shading.CreateClippedVariant(*m_naturalMaterial, keepSource.Negated());
    }

    void ReleaseVariants() {
        if (m_sourceVariant) {
            m_shading.DisposeVariant(m_sourceVariant);
            m_sourceVariant.reset();
        }
        if (m_destinationVariant) {
            m_shading.DisposeVariant(m_destinationVariant);
            m_destinationVariant.reset();
        }
    }

    DrawablePtr m_primary;
    DrawablePtr m_otherSide;
    ClipShading& m_shading;

    std::shared_ptr<Material> m_naturalMaterial;
    std::shared_ptr<Material> m_sourceVariant;
    std::shared_ptr<Material> m_destinationVariant;

    bool m_hasPlane = false;
    bool m_crossing = false;
    glm::vec3 m_planeNormal = glm::vec3(0.0f);
    glm::vec3 m_planePoint = glm::vec3(0.0f);
};

} // namespace Seamless

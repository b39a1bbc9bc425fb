/**
 * Portal.h - 门户实体
 *
 * 一个矩形开口：尺寸、位姿、指向另一门户的双向链接，以及只写模板的遮罩网格。
 * 门户成对出现，A.Link(B) 之后 A 和 B 互相指向对方。
 */

#pragma once

#include "PortalTransform.h"
#include "Scene.h"

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

#include <cmath>
#include <memory>
#include <stdexcept>
#include <string>

namespace Seamless {

/**
 * 创建门户四边形网格（以底边中点为锚点，向 +Y 延伸，法线 +Z）
 */
inline std::shared_ptr<Mesh> CreatePortalQuad(float width, float height) {
    float hw = width * 0.5f;

    auto mesh = std::make_shared<Mesh>();
    mesh->vertices = {
        // pos                 // normal     // uv
        -hw, 0.0f,   0.0f,     0, 0, 1,      0, 0,
         hw, 0.0f,   0.0f,     0, 0, 1,      1, 0,
         hw, height, 0.0f,     0, 0, 1,      1, 1,
        -hw, height, 0.0f,     0, 0, 1,      0, 1
    };
    mesh->indices = {
        0, 1, 2,
        2, 3, 0
    };
    return mesh;
}

class Portal {
public:
    Portal(const std::string& id,
           float width,
           float height,
           const glm::vec3& position,
           const glm::quat& orientation = glm::quat(1.0f, 0.0f, 0.0f, 0.0f))
        : m_id(id), m_width(width), m_height(height),
          m_position(position), m_orientation(glm::normalize(orientation))
    {
        if (!(width > 0.0f) || !(height > 0.0f)) {
            throw std::invalid_argument("Portal '" + id + "' must have a positive width and height");
        }

        // 只写模板的材质：不写颜色和深度
        m_stencilMaterial = std::make_shared<Material>();
        m_stencilMaterial->colorWrite = false;
        m_stencilMaterial->depthWrite = false;
        m_stencilMaterial->stencilWrite = true;
        m_stencilMaterial->stencilRef = 1;
        m_stencilMaterial->unlit = true;
        m_stencilMaterial->doubleSided = true;

        m_mask = std::make_shared<Drawable>();
        m_mask->name = "portal-mask:" + id;
        m_mask->mesh = CreatePortalQuad(width, height);
        m_mask->material = m_stencilMaterial;
        m_mask->stencilMask = true;

        UpdateTransform();
    }

    ~Portal() {
        Dispose();
    }

    Portal(const Portal&) = delete;
    Portal& operator=(const Portal&) = delete;

    const std::string& GetId() const { return m_id; }
    float GetWidth() const { return m_width; }
    float GetHeight() const { return m_height; }

    const glm::vec3& GetPosition() const { return m_position; }
    const glm::quat& GetOrientation() const { return m_orientation; }
    const glm::vec3& GetNormal() const { return m_normal; }

    PortalPose GetPose() const {
        PortalPose pose;
        pose.position = m_position;
        pose.orientation = m_orientation;
        return pose;
    }

    // 位姿修改后立即刷新遮罩变换和法线，二者不会不一致
    void SetPosition(const glm::vec3& position) {
        m_position = position;
        UpdateTransform();
    }

    void SetOrientation(const glm::quat& orientation) {
        m_orientation = glm::normalize(orientation);
        UpdateTransform();
    }

    void SetPose(const glm::vec3& position, const glm::quat& orientation) {
        m_position = position;
        m_orientation = glm::normalize(orientation);
        UpdateTransform();
    }

    /**
     * 刷新遮罩网格变换和法线（局部 +Z 经朝向旋转）
     */
    void UpdateTransform() {
        m_normal = glm::normalize(m_orientation * glm::vec3(0.0f, 0.0f, 1.0f));
        if (m_mask) {
            m_mask->position = m_position;
            m_mask->orientation = m_orientation;
        }
    }

    glm::mat4 GetTransform() const {
        return glm::translate(glm::mat4(1.0f), m_position) * glm::mat4_cast(m_orientation);
    }

    // ========================================================================
    //                          链接
    // ========================================================================

    /**
     * 双向链接。重复调用无副作用；重新链接会清除旧伙伴的反向引用。
     */
    void Link(Portal& other) {
        if (&other == this || m_linkedPortal == &other) return;

        Unlink();
        other.Unlink();

        m_linkedPortal = &other;
        other.m_linkedPortal = this;
    }

    void Unlink() {
        if (!m_linkedPortal) return;
        Portal* partner = m_linkedPortal;
        m_linkedPortal = nullptr;
        if (partner->m_linkedPortal == this) {
            partner->m_linkedPortal = nullptr;
        }
    }

    Portal* GetLinkedPortal() const { return m_linkedPortal; }

    bool IsLinked() const { return m_linkedPortal != nullptr; }

    // ========================================================================
    //                          几何查询
    // ========================================================================

    Plane GetPlane() const {
        return Plane::FromNormalAndPoint(m_normal, m_position);
    }

    glm::vec3 GetCenter() const {
        return m_position + m_orientation * glm::vec3(0.0f, m_height * 0.5f, 0.0f);
    }

    /**
     * 计算通过此门户观看时，目标门户一侧虚拟相机的位姿
     *
     * 观察者相对本门户的位姿，绕局部 Y 轴转 180 度后，重新表达在目标门户上。
     * 没有链接时原样返回。
     */
    PortalPose GetDestinationCameraTransform(
        const glm::vec3& viewerPosition,
        const glm::quat& viewerOrientation) const
    {
        PortalPose result;
        if (!m_linkedPortal) {
            result.position = viewerPosition;
            result.orientation = viewerOrientation;
            return result;
        }

        PortalPose source = GetPose();
        PortalPose destination = m_linkedPortal->GetPose();
        result.position = PortalTransform::TransformPointThroughPortal(viewerPosition, source, destination);
        result.orientation = PortalTransform::TransformOrientationThroughPortal(viewerOrientation, source, destination);
        return result;
    }

    // 点是否在门户正面（可以看穿的一侧）
    bool IsPointInFront(const glm::vec3& point) const {
        return GetSignedDistance(point) > 0.0f;
    }

    float GetSignedDistance(const glm::vec3& point) const {
        return glm::dot(point - m_position, m_normal);
    }

    /**
     * 点是否在门户矩形范围内（门户局部 XY 平面）
     */
    bool IsPointInBounds(const glm::vec3& point, float margin = 0.0f) const {
        glm::vec3 local = glm::inverse(m_orientation) * (point - m_position);
        float halfWidth = m_width * 0.5f + margin;
        return std::abs(local.x) <= halfWidth &&
               local.y >= -margin &&
               local.y <= m_height + margin;
    }

    // ========================================================================
    //                          渲染资源
    // ========================================================================

    void SetStencilRef(int value) {
        if (m_stencilMaterial) m_stencilMaterial->stencilRef = value;
    }

    int GetStencilRef() const {
        return m_stencilMaterial ? m_stencilMaterial->stencilRef : 0;
    }

    const DrawablePtr& GetMask() const { return m_mask; }

    // 遮罩网格所属的场景
    void SetScene(Scene* scene) { m_scene = scene; }
    Scene* GetScene() const { return m_scene; }

    bool IsDisposed() const { return m_mask == nullptr; }

    /**
     * 先断开链接，再释放遮罩网格和模板材质
     */
    void Dispose() {
        Unlink();
        if (m_mask) {
            if (m_scene) {
                m_scene->Remove(m_mask.get());
            }
            if (m_mask->mesh) {
                m_mask->mesh->ReleaseGpu();
            }
            m_mask.reset();
        }
        m_stencilMaterial.reset();
        m_scene = nullptr;
    }

private:
    std::string m_id;
    float m_width;
    float m_height;

    glm::vec3 m_position;
    glm::quat m_orientation;
    glm::vec3 m_normal = glm::vec3(0.0f, 0.0f, 1.0f);

    Portal* m_linkedPortal = nullptr;
    Scene* m_scene = nullptr;

    std::shared_ptr<Material> m_stencilMaterial;
    DrawablePtr m_mask;
};

} // namespace Seamless

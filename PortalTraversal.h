/**
 * PortalTraversal.h - Portal穿越/传送逻辑
 *
 * 观察者从门户正面走到背面、并且穿越点落在门户矩形内时，
 * 被传送到链接门户的另一侧，当前世界切换为目标门户所在的世界。
 */

#pragma once

#include "Portal.h"
#include "PortalTransform.h"
#include "World.h"

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

#include <iostream>
#include <string>

namespace Seamless {

struct Traveler {
    glm::vec3 position = glm::vec3(0.0f);
    glm::vec3 previousPosition = glm::vec3(0.0f);
    glm::quat orientation = glm::quat(1.0f, 0.0f, 0.0f, 0.0f);
    glm::vec3 velocity = glm::vec3(0.0f);
};

/**
 * 上一帧在正面、这一帧在背面（或平面上），且交点在门户范围内
 */
inline bool HasCrossed(const Portal& portal,
                       const glm::vec3& previousPosition,
                       const glm::vec3& currentPosition,
                       float margin = 0.0f)
{
    float prevDist = portal.GetSignedDistance(previousPosition);
    float currDist = portal.GetSignedDistance(currentPosition);

    bool crossedFromFront = prevDist > 0.0f && currDist <= 0.0f;
    if (!crossedFromFront) return false;

    // Calculate the intersection point
    float t = prevDist / (prevDist - currDist);
    glm::vec3 crossPoint = glm::mix(previousPosition, currentPosition, t);

    return portal.IsPointInBounds(crossPoint, margin);
}

inline void TeleportTraveler(Traveler& traveler, const Portal& sourcePortal, const Portal& targetPortal) {
    PortalPose source = sourcePortal.GetPose();
    PortalPose target = targetPortal.GetPose();

    traveler.position = PortalTransform::TransformPointThroughPortal(traveler.position, source, target);
    traveler.previousPosition = PortalTransform::TransformPointThroughPortal(traveler.previousPosition, source, target);
    traveler.orientation = PortalTransform::TransformOrientationThroughPortal(traveler.orientation, source, target);
    traveler.velocity = PortalTransform::TransformDirectionThroughPortal(traveler.velocity, source, target);
}

/**
 * 记录观察者所在的世界，每帧检测是否穿过了当前世界中的某个门户
 */
class TraversalTracker {
public:
    explicit TraversalTracker(const std::string& currentWorldId, float boundsMargin = 0.0f)
        : m_currentWorldId(currentWorldId), m_boundsMargin(boundsMargin) {}

    const std::string& GetCurrentWorldId() const { return m_currentWorldId; }

    void SetCurrentWorldId(const std::string& id) { m_currentWorldId = id; }

    /**
     * @return 本帧是否发生了传送
     */
    bool Update(Traveler& traveler, const WorldRegistry& worlds) {
        World* world = worlds.Find(m_currentWorldId);
        if (!world) return false;

        for (const auto& entry : world->GetPortals()) {
            const Portal& portal = *entry;
            const Portal* target = portal.GetLinkedPortal();
            if (!target) continue;

            if (!HasCrossed(portal, traveler.previousPosition, traveler.position, m_boundsMargin)) continue;

            World* targetWorld = worlds.FindOwner(target);
            if (!targetWorld) continue;

            TeleportTraveler(traveler, portal, *target);
            m_currentWorldId = targetWorld->GetId();

            std::cout << "Teleported through '" << portal.GetId() << "' into '" << m_currentWorldId
                      << "'. New position: (" << traveler.position.x << ", " << traveler.position.y
                      << ", " << traveler.position.z << ")" << std::endl;
            return true;
        }
        return false;
    }

private:
    std::string m_currentWorldId;
    float m_boundsMargin;
};

} // namespace Seamless

/**
 * PortalTransform.h
 *
 * 非欧几里得空间传送门核心数学库（无状态）
 *
 * 数学约定：
 * - 使用列主序矩阵（OpenGL标准），glm 默认 RH / [-1, 1] 深度
 * - 右手坐标系：X右，Y上，Z朝向观察者
 * - Portal的正面朝向其局部 +Z 方向，矩形以底边中点为锚点向 +Y 延伸
 * - 穿过门户等价于绕局部 Y 轴旋转 180 度后从目标门户走出
 */

#pragma once

#include "Camera.h"

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/quaternion.hpp>

#include <algorithm>
#include <array>
#include <cmath>

namespace Seamless {

/**
 * 平面：normal · P + constant = 0
 * normal 指向的一侧为正面（保留侧）
 */
struct Plane {
    glm::vec3 normal = glm::vec3(0.0f, 0.0f, 1.0f);
    float constant = 0.0f;

    Plane() = default;
    Plane(const glm::vec3& n, float c) : normal(n), constant(c) {}

    static Plane FromNormalAndPoint(const glm::vec3& n, const glm::vec3& point) {
        return Plane(n, -glm::dot(n, point));
    }

    float DistanceToPoint(const glm::vec3& point) const {
        return glm::dot(normal, point) + constant;
    }

    Plane Negated() const {
        return Plane(-normal, -constant);
    }

    glm::vec4 AsVec4() const {
        return glm::vec4(normal, constant);
    }
};

// 门户的刚体位姿（位置 + 朝向）
struct PortalPose {
    glm::vec3 position = glm::vec3(0.0f);
    glm::quat orientation = glm::quat(1.0f, 0.0f, 0.0f, 0.0f);
};

// 物体相对门户平面的穿越状态
struct CrossingInfo {
    bool crossing = false;
    float signedDistance = 0.0f;
    float inFront = 0.0f;
    float behind = 0.0f;
};

// 屏幕空间包围盒（像素，左上角为原点）
struct ScreenRect {
    float minX = 0.0f;
    float minY = 0.0f;
    float maxX = 0.0f;
    float maxY = 0.0f;
};

namespace PortalTransform {

// 180度Y轴旋转（Portal A 和 Portal B 是"对视"的关系）
inline glm::quat FlipY() {
    return glm::angleAxis(glm::pi<float>(), glm::vec3(0.0f, 1.0f, 0.0f));
}

/**
 * 计算斜裁剪投影矩阵（Eric Lengyel算法）
 *
 * clipPlane 为世界空间平面，法线指向需要保留的几何体。
 * 返回的投影矩阵近平面与 clipPlane 重合，位于相机与门户之间的几何体被裁掉。
 */
inline glm::mat4 ObliqueProjection(const Camera& camera, const Plane& clipPlane)
{
    const glm::mat4& projectionMatrix = camera.projection;
    glm::mat4 obliqueProjMatrix = projectionMatrix;

    // 世界空间平面 -> 相机空间平面：P_view = transpose(cameraWorld) * P_world
    glm::vec4 plane = glm::transpose(camera.GetWorldMatrix()) * clipPlane.AsVec4();

    // 相机原点必须位于平面负侧，否则两种法线朝向会得到不同的远平面
    if (plane.w > 0.0f) {
        plane = -plane;
    }

    glm::vec4 q;
    q.x = (glm::sign(plane.x) + projectionMatrix[2][0]) / projectionMatrix[0][0];
    q.y = (glm::sign(plane.y) + projectionMatrix[2][1]) / projectionMatrix[1][1];
    q.z = -1.0f;
    q.w = (1.0f + projectionMatrix[2][2]) / projectionMatrix[3][2];

    glm::vec4 c = plane * (2.0f / glm::dot(plane, q));

    // 替换第三行
    obliqueProjMatrix[0][2] = c.x - obliqueProjMatrix[0][3];
    obliqueProjMatrix[1][2] = c.y - obliqueProjMatrix[1][3];
    obliqueProjMatrix[2][2] = c.z - obliqueProjMatrix[2][3];
    obliqueProjMatrix[3][2] = c.w - obliqueProjMatrix[3][3];

    return obliqueProjMatrix;
}

/**
 * 传送位置
 */
inline glm::vec3 TransformPointThroughPortal(
    const glm::vec3& point,
    const PortalPose& source,
    const PortalPose& destination)
{
    glm::vec3 local = glm::inverse(source.orientation) * (point - source.position);

    // 穿过门户会掉头
    local.x = -local.x;
    local.z = -local.z;

    return destination.orientation * local + destination.position;
}

/**
 * 传送方向向量（不归一化，保留长度）
 */
inline glm::vec3 TransformDirectionThroughPortal(
    const glm::vec3& direction,
    const PortalPose& source,
    const PortalPose& destination)
{
    glm::vec3 local = glm::inverse(source.orientation) * direction;
    local.x = -local.x;
    local.z = -local.z;
    return destination.orientation * local;
}

/**
 * 传送朝向：dest * flipY * inverse(source) * q
 */
inline glm::quat TransformOrientationThroughPortal(
    const glm::quat& orientation,
    const PortalPose& source,
    const PortalPose& destination)
{
    return destination.orientation * FlipY() * glm::inverse(source.orientation) * orientation;
}

/**
 * 传送完整变换矩阵
 * 用于将世界空间中的位置/方向从入口门户变换到出口门户
 */
inline glm::mat4 TeleportMatrix(const PortalPose& source, const PortalPose& destination)
{
    glm::mat4 sourceMatrix = glm::translate(glm::mat4(1.0f), source.position) * glm::mat4_cast(source.orientation);
    glm::mat4 destinationMatrix = glm::translate(glm::mat4(1.0f), destination.position) * glm::mat4_cast(destination.orientation);
    return destinationMatrix * glm::mat4_cast(FlipY()) * glm::inverse(sourceMatrix);
}

/**
 * 检测物体（包围球）是否横跨门户平面
 */
inline CrossingInfo CrossingState(
    const glm::vec3& objectPosition,
    float objectRadius,
    const Plane& plane)
{
    CrossingInfo info;
    info.signedDistance = plane.DistanceToPoint(objectPosition);
    info.inFront = std::max(0.0f, info.signedDistance + objectRadius);
    info.behind = std::max(0.0f, -info.signedDistance + objectRadius);
    info.crossing = std::abs(info.signedDistance) < objectRadius;
    return info;
}

/**
 * 门户四个角点（世界空间）：左下、右下、右上、左上
 */
inline std::array<glm::vec3, 4> PortalCorners(
    const glm::vec3& position,
    const glm::quat& orientation,
    float width,
    float height)
{
    float hw = width * 0.5f;
    std::array<glm::vec3, 4> corners = {{
        glm::vec3(-hw, 0.0f, 0.0f),
        glm::vec3( hw, 0.0f, 0.0f),
        glm::vec3( hw, height, 0.0f),
        glm::vec3(-hw, height, 0.0f)
    }};
    for (glm::vec3& corner : corners) {
        corner = orientation * corner + position;
    }
    return corners;
}

/**
 * 估算门户在屏幕上的包围盒（用于剪裁测试优化，非正确性所必需）
 *
 * 所有角点都在相机后方时返回 false，部分角点在后方时返回整个屏幕。
 */
inline bool ScreenBounds(
    const std::array<glm::vec3, 4>& corners,
    const Camera& camera,
    float screenWidth,
    float screenHeight,
    ScreenRect& bounds)
{
    glm::mat4 viewProjection = camera.projection * camera.GetViewMatrix();

    float minX = screenWidth;
    float minY = screenHeight;
    float maxX = 0.0f;
    float maxY = 0.0f;
    int behind = 0;

    for (const glm::vec3& corner : corners) {
        glm::vec4 clip = viewProjection * glm::vec4(corner, 1.0f);
        if (clip.w <= 0.0f) {
            ++behind;
            continue;
        }

        glm::vec3 ndc = glm::vec3(clip) / clip.w;
        float screenX = (ndc.x * 0.5f + 0.5f) * screenWidth;
        float screenY = (1.0f - (ndc.y * 0.5f + 0.5f)) * screenHeight;

        minX = std::min(minX, screenX);
        minY = std::min(minY, screenY);
        maxX = std::max(maxX, screenX);
        maxY = std::max(maxY, screenY);
    }

    if (behind == static_cast<int>(corners.size())) return false;

    // 相机跨在门户上时投影不可靠，使用整个屏幕
    if (behind > 0) {
        bounds.minX = 0.0f;
        bounds.minY = 0.0f;
        bounds.maxX = screenWidth;
        bounds.maxY = screenHeight;
        return true;
    }

    bounds.minX = glm::clamp(minX, 0.0f, screenWidth);
    bounds.minY = glm::clamp(minY, 0.0f, screenHeight);
    bounds.maxX = glm::clamp(maxX, 0.0f, screenWidth);
    bounds.maxY = glm::clamp(maxY, 0.0f, screenHeight);
    return true;
}

/**
 * 裁剪平面：normal 指向保留的几何体
 */
inline Plane MakeClipPlane(const glm::vec3& normal, const glm::vec3& point) {
    return Plane::FromNormalAndPoint(glm::normalize(normal), point);
}

} // namespace PortalTransform

} // namespace Seamless

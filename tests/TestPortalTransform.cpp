//
// TestPortalTransform.cpp
//

#include <gtest/gtest.h>
#include "TestUtils.hpp"
#include "PortalTransform.h"

#include <glm/gtc/constants.hpp>


using namespace Seamless;
using namespace SeamlessTest;


namespace {

PortalPose MakePose(const glm::vec3& position, const glm::quat& orientation) {
    PortalPose pose;
    pose.position = position;
    pose.orientation = orientation;
    return pose;
}

glm::quat YawDegrees(float degrees) {
    return glm::angleAxis(glm::radians(degrees), glm::vec3(0.0f, 1.0f, 0.0f));
}

} // namespace


TEST(TestPortalTransform, ObliqueProjectionOfNaturalNearPlaneIsUnchanged)
{
    Camera camera(glm::radians(60.0f), 16.0f / 9.0f, 0.1f, 1000.0f);

    // 相机空间的默认近平面，法线指向视线方向（保留远处）
    Plane nearPlane(glm::vec3(0.0f, 0.0f, -1.0f), -camera.nearPlane);
    glm::mat4 oblique = PortalTransform::ObliqueProjection(camera, nearPlane);

    ExpectMat4Near(oblique, camera.projection, 1e-5f);
}

TEST(TestPortalTransform, ObliqueProjectionIgnoresPlaneNormalSign)
{
    Camera camera;
    camera.position = glm::vec3(2.0f, 1.0f, 3.0f);
    camera.orientation = YawDegrees(20.0f);

    Plane plane = Plane::FromNormalAndPoint(glm::normalize(glm::vec3(0.2f, 0.1f, 1.0f)), glm::vec3(0.0f, 0.0f, -4.0f));
    glm::mat4 a = PortalTransform::ObliqueProjection(camera, plane);
    glm::mat4 b = PortalTransform::ObliqueProjection(camera, plane.Negated());

    ExpectMat4Near(a, b, 1e-5f);
}

TEST(TestPortalTransform, ObliqueProjectionPutsClipPlaneOnNearPlane)
{
    Camera camera;
    camera.position = glm::vec3(2.0f, 1.0f, 3.0f);
    camera.orientation = YawDegrees(20.0f);

    glm::vec3 forward = camera.GetForward();
    glm::vec3 planePoint = camera.position + forward * 5.0f;
    glm::vec3 normal = glm::normalize(-forward + glm::vec3(0.15f, 0.1f, 0.0f));
    Plane plane = Plane::FromNormalAndPoint(normal, planePoint);

    camera.SetProjection(PortalTransform::ObliqueProjection(camera, plane));

    glm::vec3 t1 = glm::normalize(glm::cross(normal, glm::vec3(0.0f, 1.0f, 0.0f)));
    glm::vec3 t2 = glm::cross(normal, t1);
    glm::mat4 viewProjection = camera.projection * camera.GetViewMatrix();

    const glm::vec2 offsets[] = {{0.0f, 0.0f}, {0.5f, 0.3f}, {-0.7f, 0.2f}, {0.4f, -0.6f}};
    for (const glm::vec2& offset : offsets) {
        glm::vec3 onPlane = planePoint + t1 * offset.x + t2 * offset.y;
        glm::vec4 clip = viewProjection * glm::vec4(onPlane, 1.0f);
        ASSERT_GT(clip.w, 0.0f);
        EXPECT_NEAR(clip.z / clip.w, -1.0f, 1e-4f);
    }

    // 平面前方（相机一侧）的点被近平面裁掉
    glm::vec4 nearer = viewProjection * glm::vec4(planePoint - forward * 1.0f, 1.0f);
    EXPECT_LT(nearer.z / nearer.w, -1.0f);

    glm::vec4 farther = viewProjection * glm::vec4(planePoint + forward * 1.0f, 1.0f);
    EXPECT_GT(farther.z / farther.w, -1.0f);
}

TEST(TestPortalTransform, CrossingStateBoundaryIsStrict)
{
    Plane plane = Plane::FromNormalAndPoint(glm::vec3(0.0f, 0.0f, 1.0f), glm::vec3(0.0f));

    CrossingInfo touching = PortalTransform::CrossingState(glm::vec3(0.0f, 0.0f, 1.0f), 1.0f, plane);
    EXPECT_FALSE(touching.crossing);
    EXPECT_FLOAT_EQ(touching.signedDistance, 1.0f);
    EXPECT_FLOAT_EQ(touching.inFront, 2.0f);
    EXPECT_FLOAT_EQ(touching.behind, 0.0f);

    CrossingInfo straddling = PortalTransform::CrossingState(glm::vec3(0.0f, 0.0f, -0.25f), 1.0f, plane);
    EXPECT_TRUE(straddling.crossing);
    EXPECT_FLOAT_EQ(straddling.signedDistance, -0.25f);
    EXPECT_FLOAT_EQ(straddling.inFront, 0.75f);
    EXPECT_FLOAT_EQ(straddling.behind, 1.25f);

    CrossingInfo behind = PortalTransform::CrossingState(glm::vec3(0.0f, 0.0f, -1.0f), 1.0f, plane);
    EXPECT_FALSE(behind.crossing);
}

TEST(TestPortalTransform, CrossingStateCenteredOnPlane)
{
    Plane plane = Plane::FromNormalAndPoint(glm::vec3(0.0f, 0.0f, 1.0f), glm::vec3(0.0f, 0.0f, 3.0f));

    // 物体中心恰好在平面点上
    CrossingInfo centered = PortalTransform::CrossingState(glm::vec3(0.0f, 0.0f, 3.0f), 0.5f, plane);
    EXPECT_TRUE(centered.crossing);
    EXPECT_FLOAT_EQ(centered.signedDistance, 0.0f);
    EXPECT_FLOAT_EQ(centered.inFront, 0.5f);
    EXPECT_FLOAT_EQ(centered.behind, 0.5f);
    EXPECT_FLOAT_EQ(centered.inFront, centered.behind);
}

TEST(TestPortalTransform, PointRoundTripThroughPair)
{
    PortalPose a = MakePose(glm::vec3(1.0f, 0.0f, -2.0f), YawDegrees(30.0f));
    PortalPose b = MakePose(glm::vec3(-5.0f, 2.0f, 40.0f), YawDegrees(-75.0f));

    glm::vec3 point(0.3f, 1.2f, 0.7f);
    glm::vec3 there = PortalTransform::TransformPointThroughPortal(point, a, b);
    glm::vec3 back = PortalTransform::TransformPointThroughPortal(there, b, a);

    ExpectVec3Near(back, point, 1e-4f);
}

TEST(TestPortalTransform, TeleportMatrixMatchesPointAndDirectionTransforms)
{
    PortalPose a = MakePose(glm::vec3(1.0f, 0.0f, -2.0f), YawDegrees(30.0f));
    PortalPose b = MakePose(glm::vec3(-5.0f, 2.0f, 40.0f), YawDegrees(-75.0f));
    glm::mat4 teleport = PortalTransform::TeleportMatrix(a, b);

    glm::vec3 point(0.3f, 1.2f, 0.7f);
    ExpectVec3Near(glm::vec3(teleport * glm::vec4(point, 1.0f)),
                   PortalTransform::TransformPointThroughPortal(point, a, b), 1e-4f);

    glm::vec3 direction(0.0f, 0.5f, -2.0f);
    ExpectVec3Near(glm::vec3(teleport * glm::vec4(direction, 0.0f)),
                   PortalTransform::TransformDirectionThroughPortal(direction, a, b), 1e-4f);

    // 朝向变换与方向变换一致
    glm::quat q = YawDegrees(12.0f) * glm::angleAxis(0.4f, glm::vec3(1.0f, 0.0f, 0.0f));
    glm::quat mapped = PortalTransform::TransformOrientationThroughPortal(q, a, b);
    glm::vec3 forward = q * glm::vec3(0.0f, 0.0f, -1.0f);
    ExpectVec3Near(mapped * glm::vec3(0.0f, 0.0f, -1.0f),
                   PortalTransform::TransformDirectionThroughPortal(forward, a, b), 1e-4f);
}

TEST(TestPortalTransform, DirectionKeepsLength)
{
    PortalPose a = MakePose(glm::vec3(0.0f), glm::quat(1.0f, 0.0f, 0.0f, 0.0f));
    PortalPose b = MakePose(glm::vec3(3.0f, 0.0f, 0.0f), YawDegrees(90.0f));

    glm::vec3 velocity(0.0f, 0.0f, -3.0f);
    glm::vec3 mapped = PortalTransform::TransformDirectionThroughPortal(velocity, a, b);

    EXPECT_NEAR(glm::length(mapped), 3.0f, 1e-5f);
    // 从 A 背面穿出 = 从 B 正面出来
    ExpectVec3Near(mapped, glm::vec3(3.0f, 0.0f, 0.0f), 1e-5f);
}

TEST(TestPortalTransform, PortalCornersAreBottomAnchored)
{
    auto corners = PortalTransform::PortalCorners(glm::vec3(0.0f, 0.0f, 5.0f), YawDegrees(180.0f), 2.0f, 3.0f);

    // 旋转 180 度后局部 -X 指向世界 +X
    ExpectVec3Near(corners[0], glm::vec3( 1.0f, 0.0f, 5.0f));
    ExpectVec3Near(corners[1], glm::vec3(-1.0f, 0.0f, 5.0f));
    ExpectVec3Near(corners[2], glm::vec3(-1.0f, 3.0f, 5.0f));
    ExpectVec3Near(corners[3], glm::vec3( 1.0f, 3.0f, 5.0f));
}

TEST(TestPortalTransform, ScreenBoundsOfVisiblePortal)
{
    Camera camera(glm::radians(60.0f), 1.0f, 0.1f, 100.0f);
    camera.position = glm::vec3(0.0f, 1.0f, 5.0f);

    auto corners = PortalTransform::PortalCorners(glm::vec3(0.0f), glm::quat(1.0f, 0.0f, 0.0f, 0.0f), 2.0f, 2.0f);

    ScreenRect rect;
    ASSERT_TRUE(PortalTransform::ScreenBounds(corners, camera, 800.0f, 800.0f, rect));

    EXPECT_LT(rect.minX, 400.0f);
    EXPECT_GT(rect.maxX, 400.0f);
    EXPECT_LT(rect.minY, 400.0f);
    EXPECT_GT(rect.maxY, 400.0f);
    EXPECT_NEAR(rect.minX + rect.maxX, 800.0f, 1e-2f);
    EXPECT_GE(rect.minX, 0.0f);
    EXPECT_LE(rect.maxY, 800.0f);
}

TEST(TestPortalTransform, ScreenBoundsBehindCamera)
{
    Camera camera(glm::radians(60.0f), 1.0f, 0.1f, 100.0f);
    camera.position = glm::vec3(0.0f, 1.0f, -5.0f);

    auto corners = PortalTransform::PortalCorners(glm::vec3(0.0f), glm::quat(1.0f, 0.0f, 0.0f, 0.0f), 2.0f, 2.0f);

    ScreenRect rect;
    EXPECT_FALSE(PortalTransform::ScreenBounds(corners, camera, 800.0f, 800.0f, rect));
}

TEST(TestPortalTransform, ScreenBoundsAreClamped)
{
    Camera camera(glm::radians(60.0f), 1.0f, 0.1f, 100.0f);
    camera.position = glm::vec3(0.0f, 1.0f, 0.5f);

    auto corners = PortalTransform::PortalCorners(glm::vec3(0.0f), glm::quat(1.0f, 0.0f, 0.0f, 0.0f), 20.0f, 20.0f);

    ScreenRect rect;
    ASSERT_TRUE(PortalTransform::ScreenBounds(corners, camera, 640.0f, 480.0f, rect));
    EXPECT_FLOAT_EQ(rect.minX, 0.0f);
    EXPECT_FLOAT_EQ(rect.maxX, 640.0f);
    EXPECT_FLOAT_EQ(rect.minY, 0.0f);
}

TEST(TestPortalTransform, ScreenBoundsWhenCameraStraddlesPortal)
{
    Camera camera(glm::radians(60.0f), 1.0f, 0.1f, 100.0f);
    camera.position = glm::vec3(0.5f, 1.0f, 0.0f);

    // 门户沿 z 轴展开，一半角点在相机后方
    auto corners = PortalTransform::PortalCorners(glm::vec3(0.0f), YawDegrees(90.0f), 20.0f, 2.0f);

    ScreenRect rect;
    ASSERT_TRUE(PortalTransform::ScreenBounds(corners, camera, 640.0f, 480.0f, rect));
    EXPECT_FLOAT_EQ(rect.minX, 0.0f);
    EXPECT_FLOAT_EQ(rect.minY, 0.0f);
    EXPECT_FLOAT_EQ(rect.maxX, 640.0f);
    EXPECT_FLOAT_EQ(rect.maxY, 480.0f);
}

TEST(TestPortalTransform, MakeClipPlaneNormalizes)
{
    Plane plane = PortalTransform::MakeClipPlane(glm::vec3(0.0f, 0.0f, 4.0f), glm::vec3(0.0f, 0.0f, 2.0f));

    ExpectVec3Near(plane.normal, glm::vec3(0.0f, 0.0f, 1.0f));
    EXPECT_FLOAT_EQ(plane.constant, -2.0f);
    EXPECT_GT(plane.DistanceToPoint(glm::vec3(0.0f, 0.0f, 3.0f)), 0.0f);
    EXPECT_LT(plane.Negated().DistanceToPoint(glm::vec3(0.0f, 0.0f, 3.0f)), 0.0f);
}

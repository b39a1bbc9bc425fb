//
// TestPortalTraversal.cpp
//

#include <gtest/gtest.h>
#include "TestUtils.hpp"
#include "PortalTraversal.h"

#include <glm/gtc/constants.hpp>


using namespace Seamless;
using namespace SeamlessTest;


namespace {

const glm::quat Identity(1.0f, 0.0f, 0.0f, 0.0f);

Traveler MakeTraveler(const glm::vec3& previous, const glm::vec3& current) {
    Traveler traveler;
    traveler.previousPosition = previous;
    traveler.position = current;
    return traveler;
}

} // namespace


TEST(TestPortalTraversal, HasCrossedRequiresFrontToBackInsideBounds)
{
    Portal portal("a", 1.0f, 2.0f, glm::vec3(0.0f));

    EXPECT_TRUE(HasCrossed(portal, glm::vec3(0.0f, 1.0f, 0.1f), glm::vec3(0.0f, 1.0f, -0.1f)));
    // 恰好停在平面上也算穿过
    EXPECT_TRUE(HasCrossed(portal, glm::vec3(0.0f, 1.0f, 0.5f), glm::vec3(0.0f, 1.0f, 0.0f)));

    // 背面走向正面
    EXPECT_FALSE(HasCrossed(portal, glm::vec3(0.0f, 1.0f, -0.1f), glm::vec3(0.0f, 1.0f, 0.1f)));
    // 从门户旁边绕过
    EXPECT_FALSE(HasCrossed(portal, glm::vec3(2.0f, 1.0f, 0.1f), glm::vec3(2.0f, 1.0f, -0.1f)));
    EXPECT_TRUE(HasCrossed(portal, glm::vec3(0.55f, 1.0f, 0.1f), glm::vec3(0.55f, 1.0f, -0.1f), 0.1f));
    // 没有到达平面
    EXPECT_FALSE(HasCrossed(portal, glm::vec3(0.0f, 1.0f, 0.3f), glm::vec3(0.0f, 1.0f, 0.1f)));
}

TEST(TestPortalTraversal, TeleportMapsAllTravelerState)
{
    Portal a("a", 1.0f, 2.0f, glm::vec3(0.0f));
    Portal b("b", 1.0f, 2.0f, glm::vec3(0.0f, 0.0f, 100.0f),
             glm::angleAxis(glm::pi<float>(), glm::vec3(0.0f, 1.0f, 0.0f)));

    Traveler traveler = MakeTraveler(glm::vec3(0.0f, 1.0f, 0.1f), glm::vec3(0.0f, 1.0f, -0.1f));
    traveler.velocity = glm::vec3(0.0f, 0.0f, -2.0f);

    TeleportTraveler(traveler, a, b);

    ExpectVec3Near(traveler.position, glm::vec3(0.0f, 1.0f, 99.9f), 1e-4f);
    ExpectVec3Near(traveler.previousPosition, glm::vec3(0.0f, 1.0f, 100.1f), 1e-4f);
    ExpectVec3Near(traveler.velocity, glm::vec3(0.0f, 0.0f, -2.0f), 1e-4f);
    EXPECT_TRUE(SameRotation(traveler.orientation, Identity));

    // 出现在目标门户正面
    EXPECT_TRUE(b.IsPointInFront(traveler.position));
}

TEST(TestPortalTraversal, TrackerSwitchesWorldsBothWays)
{
    World outer("outer");
    World inner("inner");
    Portal& a = outer.CreatePortal("a", 1.0f, 2.0f, glm::vec3(0.0f));
    Portal& b = inner.CreatePortal("b", 1.0f, 2.0f, glm::vec3(0.0f, 0.0f, 100.0f),
                                   glm::angleAxis(glm::pi<float>(), glm::vec3(0.0f, 1.0f, 0.0f)));
    a.Link(b);

    WorldRegistry worlds;
    worlds.Add(outer);
    worlds.Add(inner);

    TraversalTracker tracker("outer");

    Traveler traveler = MakeTraveler(glm::vec3(0.0f, 1.0f, 3.0f), glm::vec3(0.0f, 1.0f, 2.0f));
    EXPECT_FALSE(tracker.Update(traveler, worlds));
    EXPECT_EQ(tracker.GetCurrentWorldId(), "outer");

    traveler = MakeTraveler(glm::vec3(0.0f, 1.0f, 0.1f), glm::vec3(0.0f, 1.0f, -0.1f));
    EXPECT_TRUE(tracker.Update(traveler, worlds));
    EXPECT_EQ(tracker.GetCurrentWorldId(), "inner");
    ExpectVec3Near(traveler.position, glm::vec3(0.0f, 1.0f, 99.9f), 1e-4f);

    // 同一帧内不会立刻被传送回去
    EXPECT_FALSE(tracker.Update(traveler, worlds));
    EXPECT_EQ(tracker.GetCurrentWorldId(), "inner");

    // 向房间外走，穿过 B 回到外部世界
    traveler.previousPosition = traveler.position;
    traveler.position = glm::vec3(0.0f, 1.0f, 100.1f);
    EXPECT_TRUE(tracker.Update(traveler, worlds));
    EXPECT_EQ(tracker.GetCurrentWorldId(), "outer");
    ExpectVec3Near(traveler.position, glm::vec3(0.0f, 1.0f, 0.1f), 1e-4f);
}

TEST(TestPortalTraversal, TrackerIgnoresUnreachableDestinations)
{
    World outer("outer");
    World inner("inner");
    Portal& a = outer.CreatePortal("a", 1.0f, 2.0f, glm::vec3(0.0f));
    Portal& b = inner.CreatePortal("b", 1.0f, 2.0f, glm::vec3(0.0f, 0.0f, 100.0f));

    WorldRegistry worlds;
    worlds.Add(outer);

    TraversalTracker tracker("outer");
    Traveler traveler = MakeTraveler(glm::vec3(0.0f, 1.0f, 0.1f), glm::vec3(0.0f, 1.0f, -0.1f));

    // 未链接
    EXPECT_FALSE(tracker.Update(traveler, worlds));

    // 已链接但目标世界不在注册表中
    a.Link(b);
    EXPECT_FALSE(tracker.Update(traveler, worlds));
    EXPECT_EQ(tracker.GetCurrentWorldId(), "outer");
    ExpectVec3Near(traveler.position, glm::vec3(0.0f, 1.0f, -0.1f));

    // 当前世界未注册
    tracker.SetCurrentWorldId("nowhere");
    EXPECT_FALSE(tracker.Update(traveler, worlds));
}

//
// TestWorld.cpp
//

#include <gtest/gtest.h>
#include "World.h"

#include <memory>


using namespace Seamless;


TEST(TestWorld, CreatePortalBindsScene)
{
    World world("outer");
    Portal& portal = world.CreatePortal("door", 1.0f, 2.0f, glm::vec3(0.0f));

    EXPECT_EQ(portal.GetScene(), &world.GetScene());
    EXPECT_EQ(world.FindPortal("door"), &portal);
    EXPECT_EQ(world.FindPortal("missing"), nullptr);
    EXPECT_TRUE(world.Contains(&portal));
    // 遮罩只在渲染时才挂到场景上
    EXPECT_EQ(world.GetScene().Size(), 0u);
}

TEST(TestWorld, RemovePortalUnlinksPartner)
{
    World outer("outer");
    World inner("inner");
    Portal& a = outer.CreatePortal("a", 1.0f, 2.0f, glm::vec3(0.0f));
    Portal& b = inner.CreatePortal("b", 1.0f, 2.0f, glm::vec3(0.0f, 0.0f, 100.0f));
    a.Link(b);

    EXPECT_TRUE(outer.RemovePortal("a"));
    EXPECT_FALSE(b.IsLinked());
    EXPECT_FALSE(outer.RemovePortal("a"));
    EXPECT_TRUE(outer.GetPortals().empty());
}

TEST(TestWorld, RegistryFindsOwnerOfPortal)
{
    World outer("outer");
    World inner("inner");
    Portal& a = outer.CreatePortal("a", 1.0f, 2.0f, glm::vec3(0.0f));
    Portal& b = inner.CreatePortal("b", 1.0f, 2.0f, glm::vec3(0.0f, 0.0f, 100.0f));
    a.Link(b);

    WorldRegistry worlds;
    worlds.Add(outer);
    worlds.Add(inner);

    EXPECT_EQ(worlds.Size(), 2u);
    EXPECT_EQ(worlds.Find("inner"), &inner);
    EXPECT_EQ(worlds.Find("nowhere"), nullptr);
    EXPECT_EQ(worlds.FindOwner(a.GetLinkedPortal()), &inner);
    EXPECT_EQ(worlds.FindOwner(b.GetLinkedPortal()), &outer);
    EXPECT_EQ(worlds.FindOwner(nullptr), nullptr);

    EXPECT_TRUE(worlds.Remove("inner"));
    EXPECT_EQ(worlds.FindOwner(&b), nullptr);
    EXPECT_FALSE(worlds.Remove("inner"));
}

TEST(TestWorld, DestroyingWorldUnlinksPortalsInOtherWorlds)
{
    World outer("outer");
    Portal& a = outer.CreatePortal("a", 1.0f, 2.0f, glm::vec3(0.0f));
    {
        World inner("inner");
        Portal& b = inner.CreatePortal("b", 1.0f, 2.0f, glm::vec3(0.0f, 0.0f, 100.0f));
        a.Link(b);
    }
    EXPECT_FALSE(a.IsLinked());
}

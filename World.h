/**
 * World.h - 世界 = 可绘制场景 + 嵌在其中的门户
 *
 * World 拥有自己的门户。WorldRegistry 以 id 索引所有世界（不持有所有权），
 * 门户的目标世界通过成员关系查找：包含其链接门户的那个世界。
 */

#pragma once

#include "Portal.h"
#include "Scene.h"

#include <algorithm>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace Seamless {

class World {
public:
    explicit World(const std::string& id) : m_id(id) {}

    ~World() {
        // 先释放门户（断开链接并从场景摘除遮罩）
        m_portals.clear();
    }

    World(const World&) = delete;
    World& operator=(const World&) = delete;

    const std::string& GetId() const { return m_id; }

    Scene& GetScene() { return m_scene; }
    const Scene& GetScene() const { return m_scene; }

    Portal& CreatePortal(const std::string& id,
                         float width,
                         float height,
                         const glm::vec3& position,
                         const glm::quat& orientation = glm::quat(1.0f, 0.0f, 0.0f, 0.0f))
    {
        m_portals.push_back(std::unique_ptr<Portal>(new Portal(id, width, height, position, orientation)));
        Portal& portal = *m_portals.back();
        portal.SetScene(&m_scene);
        return portal;
    }

    Portal* FindPortal(const std::string& id) const {
        for (const auto& portal : m_portals) {
            if (portal->GetId() == id) return portal.get();
        }
        return nullptr;
    }

    bool Contains(const Portal* portal) const {
        return std::any_of(m_portals.begin(), m_portals.end(),
            [portal](const std::unique_ptr<Portal>& p) { return p.get() == portal; });
    }

    bool RemovePortal(const std::string& id) {
        auto it = std::find_if(m_portals.begin(), m_portals.end(),
            [&id](const std::unique_ptr<Portal>& p) { return p->GetId() == id; });
        if (it == m_portals.end()) return false;
        m_portals.erase(it);
        return true;
    }

    const std::vector<std::unique_ptr<Portal>>& GetPortals() const {
        return m_portals;
    }

private:
    std::string m_id;
    Scene m_scene;
    std::vector<std::unique_ptr<Portal>> m_portals;
};

class WorldRegistry {
public:
    void Add(World& world) {
        m_worlds[world.GetId()] = &world;
    }

    bool Remove(const std::string& id) {
        return m_worlds.erase(id) > 0;
    }

    World* Find(const std::string& id) const {
        auto it = m_worlds.find(id);
        return it == m_worlds.end() ? nullptr : it->second;
    }

    /**
     * 查找包含 portal 的世界（线性扫描所有世界的门户列表）
     */
    World* FindOwner(const Portal* portal) const {
        if (!portal) return nullptr;
        for (const auto& entry : m_worlds) {
            if (entry.second->Contains(portal)) return entry.second;
        }
        return nullptr;
    }

    size_t Size() const { return m_worlds.size(); }

    std::map<std::string, World*>::const_iterator begin() const { return m_worlds.begin(); }
    std::map<std::string, World*>::const_iterator end() const { return m_worlds.end(); }

private:
    std::map<std::string, World*> m_worlds;
};

} // namespace Seamless

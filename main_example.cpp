/**
 * main_example.cpp - 无缝门户渲染示例
 *
 * 外部世界：地面 + 一个独立的门框（门户 "outer" 朝向 +Z）
 * 内部世界：Z 方向偏移 100 的大房间（门户 "inner" 在前墙上，朝向房间内部）
 * 一个球体来回穿过门框，横跨门户平面时两个世界中各显示一半。
 *
 * 用法: seamless_demo [--recursion N] [--debug]
 */

#include "Camera.h"
#include "CrossingClipMaterial.h"
#include "GlRenderBackend.h"
#include "Portal.h"
#include "PortalRenderer.h"
#include "PortalTraversal.h"
#include "Scene.h"
#include "SurfaceResizer.h"
#include "World.h"

#include <GL/glew.h>
#include <GLFW/glfw3.h>
#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>
#include <glm/gtc/quaternion.hpp>

#include <cmath>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>

using namespace Seamless;

const int WINDOW_WIDTH = 1280;
const int WINDOW_HEIGHT = 720;

const float DOOR_WIDTH = 1.2f;
const float DOOR_HEIGHT = 2.2f;
const float DOOR_Z = 0.6f;

// 内部房间：比门框大得多
const float ROOM_WIDTH = 12.0f;
const float ROOM_DEPTH = 16.0f;
const float ROOM_HEIGHT = 5.0f;
const float INNER_OFFSET = 100.0f;

const float SPHERE_RADIUS = 0.4f;
const float EYE_HEIGHT = 1.6f;
const float MOVE_SPEED = 4.0f;

float g_CameraYaw = -90.0f;
float g_CameraPitch = 0.0f;

// ============================================================================
//                          几何体构建
// ============================================================================

void AddQuad(Mesh& mesh, glm::vec3 p0, glm::vec3 p1, glm::vec3 p2, glm::vec3 p3) {
    glm::vec3 n = glm::normalize(glm::cross(p1 - p0, p3 - p0));
    unsigned int base = static_cast<unsigned int>(mesh.GetVertexCount());

    const glm::vec3 points[4] = {p0, p1, p2, p3};
    const float uvs[4][2] = {{0, 0}, {1, 0}, {1, 1}, {0, 1}};
    for (int i = 0; i < 4; ++i) {
        mesh.vertices.insert(mesh.vertices.end(), {
            points[i].x, points[i].y, points[i].z,
            n.x, n.y, n.z,
            uvs[i][0], uvs[i][1]
        });
    }
    mesh.indices.insert(mesh.indices.end(), {base, base + 1, base + 2, base + 2, base + 3, base});
}

void AddBox(Mesh& mesh, glm::vec3 center, glm::vec3 size) {
    float hx = size.x * 0.5f, hy = size.y * 0.5f, hz = size.z * 0.5f;
    glm::vec3 c = center;

    // Front face
    AddQuad(mesh,
        c + glm::vec3(-hx, -hy, hz), c + glm::vec3(hx, -hy, hz),
        c + glm::vec3(hx, hy, hz), c + glm::vec3(-hx, hy, hz));
    // Back face
    AddQuad(mesh,
        c + glm::vec3(hx, -hy, -hz), c + glm::vec3(-hx, -hy, -hz),
        c + glm::vec3(-hx, hy, -hz), c + glm::vec3(hx, hy, -hz));
    // Left face
    AddQuad(mesh,
        c + glm::vec3(-hx, -hy, -hz), c + glm::vec3(-hx, -hy, hz),
        c + glm::vec3(-hx, hy, hz), c + glm::vec3(-hx, hy, -hz));
    // Right face
    AddQuad(mesh,
        c + glm::vec3(hx, -hy, hz), c + glm::vec3(hx, -hy, -hz),
        c + glm::vec3(hx, hy, -hz), c + glm::vec3(hx, hy, hz));
    // Top face
    AddQuad(mesh,
        c + glm::vec3(-hx, hy, hz), c + glm::vec3(hx, hy, hz),
        c + glm::vec3(hx, hy, -hz), c + glm::vec3(-hx, hy, -hz));
    // Bottom face
    AddQuad(mesh,
        c + glm::vec3(-hx, -hy, -hz), c + glm::vec3(hx, -hy, -hz),
        c + glm::vec3(hx, -hy, hz), c + glm::vec3(-hx, -hy, hz));
}

std::shared_ptr<Mesh> CreateSphereMesh(float radius, int segments, int rings) {
    auto mesh = std::make_shared<Mesh>();
    for (int r = 0; r <= rings; ++r) {
        float v = static_cast<float>(r) / rings;
        float phi = v * glm::pi<float>();
        for (int s = 0; s <= segments; ++s) {
            float u = static_cast<float>(s) / segments;
            float theta = u * glm::two_pi<float>();
            glm::vec3 n(std::sin(phi) * std::cos(theta), std::cos(phi), std::sin(phi) * std::sin(theta));
            mesh->vertices.insert(mesh->vertices.end(), {
                n.x * radius, n.y * radius, n.z * radius,
                n.x, n.y, n.z,
                u, v
            });
        }
    }
    for (int r = 0; r < rings; ++r) {
        for (int s = 0; s < segments; ++s) {
            unsigned int a = r * (segments + 1) + s;
            unsigned int b = a + segments + 1;
            mesh->indices.insert(mesh->indices.end(), {a, a + 1, b, b, a + 1, b + 1});
        }
    }
    return mesh;
}

DrawablePtr MakeDrawable(const std::string& name, const std::shared_ptr<Mesh>& mesh, glm::vec3 color, bool doubleSided = false) {
    auto material = std::make_shared<Material>();
    material->color = color;
    material->doubleSided = doubleSided;

    auto drawable = std::make_shared<Drawable>();
    drawable->name = name;
    drawable->mesh = mesh;
    drawable->material = material;
    return drawable;
}

void BuildOuterWorld(World& world) {
    Scene& scene = world.GetScene();

    // 地面
    auto ground = std::make_shared<Mesh>();
    AddQuad(*ground,
        glm::vec3(-50, 0, 50), glm::vec3(50, 0, 50),
        glm::vec3(50, 0, -50), glm::vec3(-50, 0, -50));
    scene.Add(MakeDrawable("ground", ground, glm::vec3(0.35f, 0.55f, 0.3f)));

    // 门框：两根立柱 + 横梁，门户开口留空
    auto frame = std::make_shared<Mesh>();
    float postX = DOOR_WIDTH * 0.5f + 0.1f;
    float postHeight = DOOR_HEIGHT + 0.2f;
    AddBox(*frame, glm::vec3(-postX, postHeight * 0.5f, DOOR_Z), glm::vec3(0.2f, postHeight, 0.3f));
    AddBox(*frame, glm::vec3( postX, postHeight * 0.5f, DOOR_Z), glm::vec3(0.2f, postHeight, 0.3f));
    AddBox(*frame, glm::vec3(0.0f, DOOR_HEIGHT + 0.1f, DOOR_Z), glm::vec3(DOOR_WIDTH + 0.4f, 0.2f, 0.3f));
    scene.Add(MakeDrawable("door-frame", frame, glm::vec3(0.15f, 0.25f, 0.6f)));

    // 参照物
    auto pillars = std::make_shared<Mesh>();
    AddBox(*pillars, glm::vec3(-6.0f, 1.0f, -4.0f), glm::vec3(1.0f, 2.0f, 1.0f));
    AddBox(*pillars, glm::vec3( 5.0f, 1.5f, -8.0f), glm::vec3(1.0f, 3.0f, 1.0f));
    AddBox(*pillars, glm::vec3( 4.0f, 0.5f,  6.0f), glm::vec3(1.0f, 1.0f, 1.0f));
    scene.Add(MakeDrawable("pillars", pillars, glm::vec3(0.8f, 0.75f, 0.65f)));
}

void BuildInnerWorld(World& world) {
    Scene& scene = world.GetScene();

    float hw = ROOM_WIDTH * 0.5f;
    float h = ROOM_HEIGHT;
    float front = INNER_OFFSET + ROOM_DEPTH * 0.5f;
    float back = INNER_OFFSET - ROOM_DEPTH * 0.5f;
    float doorHalf = DOOR_WIDTH * 0.5f;

    auto floor = std::make_shared<Mesh>();
    AddQuad(*floor,
        glm::vec3(-hw, 0, front), glm::vec3(hw, 0, front),
        glm::vec3(hw, 0, back), glm::vec3(-hw, 0, back));
    scene.Add(MakeDrawable("room-floor", floor, glm::vec3(0.6f, 0.45f, 0.3f), true));

    auto walls = std::make_shared<Mesh>();
    // 天花板
    AddQuad(*walls,
        glm::vec3(-hw, h, back), glm::vec3(hw, h, back),
        glm::vec3(hw, h, front), glm::vec3(-hw, h, front));
    // 左右墙
    AddQuad(*walls,
        glm::vec3(-hw, 0, back), glm::vec3(-hw, 0, front),
        glm::vec3(-hw, h, front), glm::vec3(-hw, h, back));
    AddQuad(*walls,
        glm::vec3(hw, 0, front), glm::vec3(hw, 0, back),
        glm::vec3(hw, h, back), glm::vec3(hw, h, front));
    // 后墙
    AddQuad(*walls,
        glm::vec3(-hw, 0, back), glm::vec3(hw, 0, back),
        glm::vec3(hw, h, back), glm::vec3(-hw, h, back));
    // 前墙，中间留出门洞
    AddQuad(*walls,
        glm::vec3(-hw, 0, front), glm::vec3(-doorHalf, 0, front),
        glm::vec3(-doorHalf, h, front), glm::vec3(-hw, h, front));
    AddQuad(*walls,
        glm::vec3(doorHalf, 0, front), glm::vec3(hw, 0, front),
        glm::vec3(hw, h, front), glm::vec3(doorHalf, h, front));
    AddQuad(*walls,
        glm::vec3(-doorHalf, DOOR_HEIGHT, front), glm::vec3(doorHalf, DOOR_HEIGHT, front),
        glm::vec3(doorHalf, h, front), glm::vec3(-doorHalf, h, front));
    scene.Add(MakeDrawable("room-walls", walls, glm::vec3(0.85f, 0.85f, 0.9f), true));

    auto furniture = std::make_shared<Mesh>();
    AddBox(*furniture, glm::vec3(-3.0f, 0.5f, INNER_OFFSET - 2.0f), glm::vec3(2.0f, 1.0f, 1.0f));
    AddBox(*furniture, glm::vec3( 3.5f, 1.0f, INNER_OFFSET - 5.0f), glm::vec3(1.0f, 2.0f, 1.0f));
    AddBox(*furniture, glm::vec3( 0.0f, 0.25f, INNER_OFFSET - 6.5f), glm::vec3(4.0f, 0.5f, 1.5f));
    scene.Add(MakeDrawable("furniture", furniture, glm::vec3(0.7f, 0.3f, 0.25f)));
}

// ============================================================================
//                          输入
// ============================================================================

double lastX = WINDOW_WIDTH / 2.0, lastY = WINDOW_HEIGHT / 2.0;
bool firstMouse = true;

void mouse_callback(GLFWwindow* window, double xpos, double ypos) {
    if (firstMouse) { lastX = xpos; lastY = ypos; firstMouse = false; }
    float xoffset = (float)(xpos - lastX);
    float yoffset = (float)(lastY - ypos);
    lastX = xpos; lastY = ypos;
    g_CameraYaw += xoffset * 0.1f;
    g_CameraPitch += yoffset * 0.1f;
    if (g_CameraPitch > 89.0f) g_CameraPitch = 89.0f;
    if (g_CameraPitch < -89.0f) g_CameraPitch = -89.0f;
}

// yaw = -90, pitch = 0 时看向 -Z（单位四元数）
glm::quat OrientationFromYawPitch(float yaw, float pitch) {
    return glm::angleAxis(-glm::radians(yaw + 90.0f), glm::vec3(0.0f, 1.0f, 0.0f))
         * glm::angleAxis(glm::radians(pitch), glm::vec3(1.0f, 0.0f, 0.0f));
}

// 传送后根据新朝向重新计算 yaw/pitch
void SyncYawPitch(const glm::quat& orientation) {
    glm::vec3 front = orientation * glm::vec3(0.0f, 0.0f, -1.0f);
    g_CameraYaw = glm::degrees(std::atan2(front.z, front.x));
    g_CameraPitch = glm::degrees(std::asin(glm::clamp(front.y, -1.0f, 1.0f)));
}

void processInput(GLFWwindow* window, float deltaTime, Traveler& player) {
    float speed = MOVE_SPEED * deltaTime;
    glm::vec3 front;
    front.x = cos(glm::radians(g_CameraYaw));
    front.y = 0.0f;
    front.z = sin(glm::radians(g_CameraYaw));
    front = glm::normalize(front);
    glm::vec3 right = glm::normalize(glm::cross(front, glm::vec3(0, 1, 0)));

    glm::vec3 move(0.0f);
    if (glfwGetKey(window, GLFW_KEY_W) == GLFW_PRESS) move += front;
    if (glfwGetKey(window, GLFW_KEY_S) == GLFW_PRESS) move -= front;
    if (glfwGetKey(window, GLFW_KEY_A) == GLFW_PRESS) move -= right;
    if (glfwGetKey(window, GLFW_KEY_D) == GLFW_PRESS) move += right;
    if (glfwGetKey(window, GLFW_KEY_ESCAPE) == GLFW_PRESS) glfwSetWindowShouldClose(window, true);

    player.previousPosition = player.position;
    player.velocity = move * MOVE_SPEED;
    player.position += move * speed;
    player.orientation = OrientationFromYawPitch(g_CameraYaw, g_CameraPitch);
}

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [--recursion N] [--debug]" << std::endl;
}

int main(int argc, char** argv) {
    PortalRenderOptions options;
    options.maxRecursion = 1;
    bool debugEnabled = false;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--recursion") == 0 && i + 1 < argc) {
            char* end = nullptr;
            long value = std::strtol(argv[++i], &end, 10);
            if (end == argv[i] || *end != '\0') {
                std::cerr << "Invalid recursion depth: " << argv[i] << std::endl;
                return 1;
            }
            options.maxRecursion = static_cast<int>(value);
        } else if (std::strcmp(argv[i], "--debug") == 0) {
            debugEnabled = true;
        } else if (std::strcmp(argv[i], "--help") == 0) {
            PrintUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << argv[i] << std::endl;
            PrintUsage(argv[0]);
            return 1;
        }
    }

    if (!glfwInit()) { std::cerr << "GLFW init failed!" << std::endl; return -1; }

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
    glfwWindowHint(GLFW_STENCIL_BITS, 8);

    GLFWwindow* window = glfwCreateWindow(WINDOW_WIDTH, WINDOW_HEIGHT, "Seamless Portal Demo", nullptr, nullptr);
    if (!window) { std::cerr << "Window creation failed!" << std::endl; glfwTerminate(); return -1; }

    glfwMakeContextCurrent(window);
    glfwSetCursorPosCallback(window, mouse_callback);
    glfwSetInputMode(window, GLFW_CURSOR, GLFW_CURSOR_DISABLED);

    glewExperimental = GL_TRUE;
    if (glewInit() != GLEW_OK) {
        std::cerr << "GLEW init failed!" << std::endl;
        glfwDestroyWindow(window);
        glfwTerminate();
        return -1;
    }

    // GL 资源必须在 glfwTerminate 之前释放
    {
        GlRenderBackend backend;
        if (!backend.Init()) {
            std::cerr << "Scene shader creation failed!" << std::endl;
            glfwDestroyWindow(window);
            glfwTerminate();
            return -1;
        }
        backend.SetClearColor(glm::vec3(0.55f, 0.75f, 0.95f));

        World outer("outer");
        World inner("inner");
        BuildOuterWorld(outer);
        BuildInnerWorld(inner);

        Portal& outerPortal = outer.CreatePortal("outer", DOOR_WIDTH, DOOR_HEIGHT, glm::vec3(0.0f, 0.0f, DOOR_Z));
        Portal& innerPortal = inner.CreatePortal("inner", DOOR_WIDTH, DOOR_HEIGHT,
            glm::vec3(0.0f, 0.0f, INNER_OFFSET + ROOM_DEPTH * 0.5f),
            glm::angleAxis(glm::pi<float>(), glm::vec3(0.0f, 1.0f, 0.0f)));
        outerPortal.Link(innerPortal);

        WorldRegistry worlds;
        worlds.Add(outer);
        worlds.Add(inner);

        // 穿门的球体：本体在外部世界，另一侧实例在内部世界
        std::shared_ptr<Mesh> sphereMesh = CreateSphereMesh(SPHERE_RADIUS, 32, 16);
        DrawablePtr sphere = MakeDrawable("sphere", sphereMesh, glm::vec3(0.9f, 0.6f, 0.1f));
        sphere->material->emissive = 0.2f;
        DrawablePtr sphereOtherSide = std::make_shared<Drawable>();
        sphereOtherSide->name = "sphere-other-side";
        sphereOtherSide->mesh = sphereMesh;
        outer.GetScene().Add(sphere);
        inner.GetScene().Add(sphereOtherSide);

        CrossingClipMaterial sphereClip(sphere, sphereOtherSide, backend);

        PortalRenderer renderer(backend, options);
        std::cout << "Portal recursion depth: " << renderer.GetMaxRecursion() << std::endl;

        Camera camera(glm::radians(60.0f), (float)WINDOW_WIDTH / (float)WINDOW_HEIGHT, 0.05f, 1000.0f);
        SurfaceResizer resizer;

        Traveler player;
        player.position = glm::vec3(0.0f, EYE_HEIGHT, 5.0f);
        player.previousPosition = player.position;
        TraversalTracker tracker(outer.GetId());

        float lastTime = (float)glfwGetTime();
        float lastDebugTime = 0.0f;

        std::cout << "Controls: WASD to move, Mouse to look, ESC to exit" << std::endl;

        while (!glfwWindowShouldClose(window)) {
            float currentTime = (float)glfwGetTime();
            float deltaTime = currentTime - lastTime;
            lastTime = currentTime;

            glfwPollEvents();

            int width = 0, height = 0, fbWidth = 0, fbHeight = 0;
            glfwGetWindowSize(window, &width, &height);
            glfwGetFramebufferSize(window, &fbWidth, &fbHeight);
            float pixelRatio = width > 0 ? (float)fbWidth / (float)width : 1.0f;
            if (resizer.Update(width, height, pixelRatio, camera)) {
                glViewport(0, 0, resizer.GetFramebufferWidth(), resizer.GetFramebufferHeight());
            }

            processInput(window, deltaTime, player);
            if (tracker.Update(player, worlds)) {
                SyncYawPitch(player.orientation);
            }

            camera.position = player.position;
            camera.orientation = player.orientation;

            // 球体沿 Z 来回运动，始终有一部分在门户正面
            sphere->position = glm::vec3(0.0f, 1.0f, DOOR_Z + 1.2f + std::sin(currentTime * 0.6f) * 1.5f);
            sphereClip.UpdateCrossing(outerPortal.GetNormal(), outerPortal.GetPosition(), SPHERE_RADIUS);
            sphereClip.SyncOtherSidePosition(outerPortal.GetPose(), innerPortal.GetPose());

            // 每2秒输出一次调试信息
            bool debugThisFrame = debugEnabled && (currentTime - lastDebugTime > 2.0f);
            if (debugThisFrame) {
                lastDebugTime = currentTime;
                std::cout << "\n=== Frame Debug @ " << currentTime << "s ===" << std::endl;
                std::cout << "Camera: (" << camera.position.x << ", " << camera.position.y << ", " << camera.position.z
                          << ") in '" << tracker.GetCurrentWorldId() << "'" << std::endl;
            }
            renderer.SetDebug(debugThisFrame);

            World* currentWorld = worlds.Find(tracker.GetCurrentWorldId());
            if (currentWorld) {
                renderer.Render(camera, *currentWorld, worlds);
            }

            glfwSwapBuffers(window);
        }

        renderer.Dispose();
    }

    glfwDestroyWindow(window);
    glfwTerminate();
    return 0;
}

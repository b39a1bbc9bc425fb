/**
 * Camera.h - 透视相机
 *
 * 世界空间位置 + 朝向（四元数），以及可被覆盖的投影矩阵。
 * 门户渲染器会为虚拟相机覆盖投影矩阵（斜裁剪）。
 */

#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/quaternion.hpp>

namespace Seamless {

struct Camera {
    glm::vec3 position = glm::vec3(0.0f);
    glm::quat orientation = glm::quat(1.0f, 0.0f, 0.0f, 0.0f);

    float fovY = glm::radians(60.0f);
    float aspect = 16.0f / 9.0f;
    float nearPlane = 0.1f;
    float farPlane = 1000.0f;

    glm::mat4 projection = glm::mat4(1.0f);
    glm::mat4 projectionInverse = glm::mat4(1.0f);

    Camera() {
        UpdateProjection();
    }

    Camera(float fovYRadians, float aspectRatio, float zNear, float zFar)
        : fovY(fovYRadians), aspect(aspectRatio), nearPlane(zNear), farPlane(zFar) {
        UpdateProjection();
    }

    // 根据 fov/aspect/near/far 重建标准透视投影
    void UpdateProjection() {
        SetProjection(glm::perspective(fovY, aspect, nearPlane, farPlane));
    }

    void SetProjection(const glm::mat4& matrix) {
        projection = matrix;
        projectionInverse = glm::inverse(matrix);
    }

    glm::mat4 GetWorldMatrix() const {
        return glm::translate(glm::mat4(1.0f), position) * glm::mat4_cast(orientation);
    }

    glm::mat4 GetViewMatrix() const {
        return glm::inverse(GetWorldMatrix());
    }

    // 相机看向局部 -Z
    glm::vec3 GetForward() const {
        return orientation * glm::vec3(0.0f, 0.0f, -1.0f);
    }
};

} // namespace Seamless

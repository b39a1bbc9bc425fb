/**
 * SurfaceResizer.h - 渲染表面尺寸跟踪
 *
 * 每个渲染表面持有自己的 SurfaceResizer，记住上一次的尺寸；
 * 尺寸变化时更新相机宽高比和投影。
 */

#pragma once

#include "Camera.h"

#include <cmath>

namespace Seamless {

class SurfaceResizer {
public:
    /**
     * @param width, height 表面的逻辑尺寸
     * @param pixelRatio    逻辑像素到帧缓冲像素的比例
     * @return 尺寸是否发生变化
     */
    bool Update(int width, int height, float pixelRatio, Camera& camera) {
        // 窗口最小化时尺寸为 0，保持原状态
        if (width <= 0 || height <= 0) return false;
        if (width == m_width && height == m_height) return false;

        m_width = width;
        m_height = height;
        m_framebufferWidth = static_cast<int>(std::lround(width * pixelRatio));
        m_framebufferHeight = static_cast<int>(std::lround(height * pixelRatio));

        camera.aspect = static_cast<float>(width) / static_cast<float>(height);
        camera.UpdateProjection();
        return true;
    }

    int GetWidth() const { return m_width; }
    int GetHeight() const { return m_height; }
    int GetFramebufferWidth() const { return m_framebufferWidth; }
    int GetFramebufferHeight() const { return m_framebufferHeight; }

private:
    int m_width = 0;
    int m_height = 0;
    int m_framebufferWidth = 0;
    int m_framebufferHeight = 0;
};

} // namespace Seamless

#pragma once

#define GLFW_INCLUDE_VULKAN
#include <GLFW/glfw3.h>
#include <string>
#include <vector>

namespace postfx {

struct WindowSpecs {
    uint32_t width = 1280;
    uint32_t height = 720;
    std::string title = "PostFX Sandbox";
};

class Window {
public:
    Window(const WindowSpecs& specs);
    ~Window();

    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;

    bool shouldClose() const;
    void pollEvents();
    void waitEvents();

    void setTitle(const std::string& title);

    GLFWwindow* getNativeWindow() const { return m_window; }
    // Framebuffer size in pixels; 0x0 while minimized.
    uint32_t getWidth() const { return m_framebufferWidth; }
    uint32_t getHeight() const { return m_framebufferHeight; }
    bool isMinimized() const { return m_framebufferWidth == 0 || m_framebufferHeight == 0; }

    // Returns true once after every framebuffer resize.
    bool consumeResized();

    std::vector<const char*> getRequiredExtensions() const;

private:
    GLFWwindow* m_window;
    WindowSpecs m_specs;
    uint32_t m_framebufferWidth = 0;
    uint32_t m_framebufferHeight = 0;
    bool m_resized = false;

    static void framebufferResizeCallback(GLFWwindow* window, int width, int height);
};

} // namespace postfx

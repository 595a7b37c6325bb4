#include "postfx/platform/window.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace postfx {

namespace {

void glfwErrorCallback(int code, const char* description) {
    spdlog::error("GLFW error {}: {}", code, description);
}

} // namespace

Window::Window(const WindowSpecs& specs) : m_specs(specs) {
    glfwSetErrorCallback(glfwErrorCallback);
    if (!glfwInit()) {
        throw std::runtime_error("Failed to initialize GLFW");
    }
    if (!glfwVulkanSupported()) {
        glfwTerminate();
        throw std::runtime_error("GLFW found no Vulkan loader");
    }

    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);

    m_window = glfwCreateWindow(static_cast<int>(m_specs.width), static_cast<int>(m_specs.height), m_specs.title.c_str(), nullptr, nullptr);
    if (!m_window) {
        glfwTerminate();
        throw std::runtime_error("Failed to create GLFW window");
    }

    // HiDPI framebuffers can differ from the requested window size.
    int width = 0, height = 0;
    glfwGetFramebufferSize(m_window, &width, &height);
    m_framebufferWidth = static_cast<uint32_t>(width);
    m_framebufferHeight = static_cast<uint32_t>(height);

    glfwSetWindowUserPointer(m_window, this);
    glfwSetFramebufferSizeCallback(m_window, framebufferResizeCallback);

    spdlog::info("Window created: {} ({}x{}, framebuffer {}x{})", m_specs.title, m_specs.width, m_specs.height, m_framebufferWidth, m_framebufferHeight);
}

Window::~Window() {
    glfwDestroyWindow(m_window);
    glfwTerminate();
}

bool Window::shouldClose() const {
    return glfwWindowShouldClose(m_window);
}

void Window::pollEvents() {
    glfwPollEvents();
}

void Window::waitEvents() {
    glfwWaitEvents();
}

void Window::setTitle(const std::string& title) {
    glfwSetWindowTitle(m_window, title.c_str());
}

bool Window::consumeResized() {
    bool resized = m_resized;
    m_resized = false;
    return resized;
}

std::vector<const char*> Window::getRequiredExtensions() const {
    uint32_t count = 0;
    const char** names = glfwGetRequiredInstanceExtensions(&count);
    if (!names) {
        throw std::runtime_error("GLFW reports no Vulkan surface extensions");
    }
    return std::vector<const char*>(names, names + count);
}

void Window::framebufferResizeCallback(GLFWwindow* window, int width, int height) {
    auto self = static_cast<Window*>(glfwGetWindowUserPointer(window));
    self->m_framebufferWidth = static_cast<uint32_t>(width);
    self->m_framebufferHeight = static_cast<uint32_t>(height);
    self->m_resized = true;
    spdlog::debug("Framebuffer resized to {}x{}", width, height);
}

} // namespace postfx

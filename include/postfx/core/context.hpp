#pragma once

#include <vulkan/vulkan.h>
#include <vk_mem_alloc.h>
#include <vector>
#include <optional>

namespace postfx {

class Window;

struct QueueFamilyIndices {
    // Must also support compute: post-process dispatches are recorded into the frame's
    // graphics command buffer.
    std::optional<uint32_t> graphicsFamily;
    std::optional<uint32_t> presentFamily;

    bool isComplete() const {
        return graphicsFamily.has_value() && presentFamily.has_value();
    }
};

class Context {
public:
    Context(Window* window);
    ~Context();

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    VkInstance getInstance() const { return m_instance; }
    VkDevice getDevice() const { return m_device; }
    VkPhysicalDevice getPhysicalDevice() const { return m_physicalDevice; }
    VkSurfaceKHR getSurface() const { return m_surface; }
    VmaAllocator getAllocator() const { return m_allocator; }

    QueueFamilyIndices getQueueFamilyIndices() const { return m_indices; }
    VkQueue getGraphicsQueue() const { return m_graphicsQueue; }
    VkQueue getPresentQueue() const { return m_presentQueue; }

    Window& getWindow() { return *m_window; }

    void waitIdle() const;

private:
    void createInstance(const std::vector<const char*>& requiredExtensions);
    void setupDebugMessenger();
    void createSurface(Window* window);
    void pickPhysicalDevice();
    void createLogicalDevice();
    void createAllocator();

    bool checkValidationLayerSupport() const;
    // 0 means the device cannot run the sandbox.
    uint32_t rateDevice(VkPhysicalDevice device);
    QueueFamilyIndices findQueueFamilies(VkPhysicalDevice device);

    Window* m_window;
    VkInstance m_instance = VK_NULL_HANDLE;
    VkDebugUtilsMessengerEXT m_debugMessenger = VK_NULL_HANDLE;
    VkSurfaceKHR m_surface = VK_NULL_HANDLE;
    VkPhysicalDevice m_physicalDevice = VK_NULL_HANDLE;
    VkDevice m_device = VK_NULL_HANDLE;
    VmaAllocator m_allocator = VK_NULL_HANDLE;

    VkQueue m_graphicsQueue = VK_NULL_HANDLE;
    VkQueue m_presentQueue = VK_NULL_HANDLE;

    QueueFamilyIndices m_indices;

    const std::vector<const char*> m_validationLayers = {
        "VK_LAYER_KHRONOS_validation"
    };

#ifdef NDEBUG
    bool m_enableValidationLayers = false;
#else
    bool m_enableValidationLayers = true;
#endif
};

} // namespace postfx

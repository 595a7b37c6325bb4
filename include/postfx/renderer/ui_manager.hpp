#pragma once

#include "postfx/core/context.hpp"
#include "postfx/effect/custom_compute_effect.hpp"
#include <vulkan/vulkan.h>
#include <imgui.h>
#include <imgui_impl_glfw.h>
#include <imgui_impl_vulkan.h>
#include <string>
#include <vector>

namespace postfx {

struct FrameStats {
    uint32_t renderWidth = 0;
    uint32_t renderHeight = 0;
    uint32_t viewCount = 0;
    float frameMs = 0.0f;
};

class UIManager {
public:
    static constexpr size_t EDITOR_CAPACITY = 16 * 1024;

    UIManager(Context* context, VkFormat colorFormat, uint32_t imageCount);
    ~UIManager();

    UIManager(const UIManager&) = delete;
    UIManager& operator=(const UIManager&) = delete;

    void beginFrame();
    void endFrame();
    void render(VkCommandBuffer cmd);

    // Body editor bound to the effect. "Apply" hands the text over with setBody().
    void drawEffectPanel(CustomComputeEffect& effect, const FrameStats& stats);

private:
    void loadEditor(const std::string& text);

    Context* m_context;
    VkDescriptorPool m_imguiPool;
    VkFormat m_colorFormat;

    std::vector<char> m_editor;
    std::string m_editorSource;
    bool m_showMergedSource = false;
};

} // namespace postfx

#include "postfx/renderer/ui_manager.hpp"
#include "postfx/effect/template_compiler.hpp"
#include "postfx/platform/window.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstring>
#include <iterator>
#include <stdexcept>

namespace postfx {

UIManager::UIManager(Context* context, VkFormat colorFormat, uint32_t imageCount)
    : m_context(context), m_colorFormat(colorFormat), m_editor(EDITOR_CAPACITY, '\0') {

    VkDescriptorPoolSize pool_sizes[] = {
        { VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER, 100 },
    };

    VkDescriptorPoolCreateInfo pool_info = {VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO};
    pool_info.flags = VK_DESCRIPTOR_POOL_CREATE_FREE_DESCRIPTOR_SET_BIT;
    pool_info.maxSets = 100;
    pool_info.poolSizeCount = static_cast<uint32_t>(std::size(pool_sizes));
    pool_info.pPoolSizes = pool_sizes;

    if (vkCreateDescriptorPool(m_context->getDevice(), &pool_info, nullptr, &m_imguiPool) != VK_SUCCESS) {
        throw std::runtime_error("failed to create imgui descriptor pool");
    }

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    io.IniFilename = nullptr;

    ImGui::StyleColorsDark();

    ImGui_ImplGlfw_InitForVulkan(m_context->getWindow().getNativeWindow(), true);

    ImGui_ImplVulkan_InitInfo init_info = {};
    init_info.Instance = m_context->getInstance();
    init_info.PhysicalDevice = m_context->getPhysicalDevice();
    init_info.Device = m_context->getDevice();
    init_info.QueueFamily = m_context->getQueueFamilyIndices().graphicsFamily.value();
    init_info.Queue = m_context->getGraphicsQueue();
    init_info.DescriptorPool = m_imguiPool;
    init_info.MinImageCount = std::max(2u, imageCount);
    init_info.ImageCount = std::max(2u, imageCount);
    init_info.MSAASamples = VK_SAMPLE_COUNT_1_BIT;
    init_info.UseDynamicRendering = true;

    VkPipelineRenderingCreateInfo renderingCreateInfo = {VK_STRUCTURE_TYPE_PIPELINE_RENDERING_CREATE_INFO};
    renderingCreateInfo.colorAttachmentCount = 1;
    renderingCreateInfo.pColorAttachmentFormats = &m_colorFormat;
    init_info.PipelineRenderingCreateInfo = renderingCreateInfo;

    if (!ImGui_ImplVulkan_Init(&init_info)) {
        throw std::runtime_error("failed to initialize imgui vulkan backend");
    }
}

UIManager::~UIManager() {
    ImGui_ImplVulkan_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();
    vkDestroyDescriptorPool(m_context->getDevice(), m_imguiPool, nullptr);
}

void UIManager::beginFrame() {
    ImGui_ImplVulkan_NewFrame();
    ImGui_ImplGlfw_NewFrame();
    ImGui::NewFrame();
}

void UIManager::endFrame() {
    ImGui::Render();
}

void UIManager::render(VkCommandBuffer cmd) {
    ImGui_ImplVulkan_RenderDrawData(ImGui::GetDrawData(), cmd);
}

void UIManager::loadEditor(const std::string& text) {
    std::fill(m_editor.begin(), m_editor.end(), '\0');
    size_t count = std::min(text.size(), m_editor.size() - 1);
    std::memcpy(m_editor.data(), text.data(), count);
    if (count < text.size()) {
        spdlog::warn("Shader body truncated to {} bytes in the editor", count);
    }
    m_editorSource = text;
}

void UIManager::drawEffectPanel(CustomComputeEffect& effect, const FrameStats& stats) {
    // Follow external edits (file watcher) unless the user has unsaved changes.
    std::string body = effect.getBody();
    if (body != m_editorSource && std::strcmp(m_editor.data(), m_editorSource.c_str()) == 0) {
        loadEditor(body);
    }

    ImGui::SetNextWindowSize(ImVec2(520, 440), ImGuiCond_FirstUseEver);
    ImGui::Begin(effect.getName().c_str());

    EffectState state = effect.getState();
    ImVec4 stateColor = state == EffectState::Valid ? ImVec4(0.4f, 0.9f, 0.4f, 1.0f)
                      : state == EffectState::Invalid ? ImVec4(0.95f, 0.35f, 0.35f, 1.0f)
                      : ImVec4(0.9f, 0.8f, 0.3f, 1.0f);
    ImGui::TextColored(stateColor, "State: %s", toString(state));
    ImGui::SameLine();
    ImGui::Text("| compiles: %llu", static_cast<unsigned long long>(effect.getCompileCount()));
    ImGui::Text("Render %ux%u, %u view(s), %.2f ms", stats.renderWidth, stats.renderHeight, stats.viewCount, stats.frameMs);

    ImGui::Separator();
    ImGui::InputTextMultiline("##body", m_editor.data(), m_editor.size(), ImVec2(-1.0f, 220.0f), ImGuiInputTextFlags_AllowTabInput);

    if (ImGui::Button("Apply")) {
        std::string text(m_editor.data());
        m_editorSource = text;
        effect.setBody(text);
    }
    ImGui::SameLine();
    if (ImGui::Button("Revert")) {
        loadEditor(body);
    }
    ImGui::SameLine();
    ImGui::Checkbox("Show merged source", &m_showMergedSource);

    const std::string& diagnostics = effect.getLastDiagnostics();
    if (!diagnostics.empty()) {
        ImGui::Separator();
        ImGui::PushStyleColor(ImGuiCol_Text, ImVec4(0.95f, 0.35f, 0.35f, 1.0f));
        ImGui::TextWrapped("%s", diagnostics.c_str());
        ImGui::PopStyleColor();
    }

    if (m_showMergedSource) {
        ImGui::Separator();
        std::string merged = TemplateCompiler::merge(m_editor.data());
        ImGui::BeginChild("merged", ImVec2(0, 0), true);
        ImGui::TextUnformatted(merged.c_str());
        ImGui::EndChild();
    }

    ImGui::End();
}

} // namespace postfx

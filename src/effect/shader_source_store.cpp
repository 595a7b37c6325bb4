#include "postfx/effect/shader_source_store.hpp"

namespace postfx {

void ShaderSourceStore::setBody(std::string text) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_slot.text = std::move(text);
    m_slot.dirty = true;
}

std::optional<std::string> ShaderSourceStore::takeIfDirty() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_slot.dirty) {
        return std::nullopt;
    }
    m_slot.dirty = false;
    return m_slot.text;
}

bool ShaderSourceStore::isDirty() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_slot.dirty;
}

std::string ShaderSourceStore::getBody() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_slot.text;
}

} // namespace postfx

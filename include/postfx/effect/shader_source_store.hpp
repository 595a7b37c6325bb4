#pragma once

#include <mutex>
#include <optional>
#include <string>

namespace postfx {

// The body text shared between the thread that edits it and the render thread.
// Every access holds m_mutex for a copy only; nothing expensive runs under it.
class ShaderSourceStore {
public:
    ShaderSourceStore() = default;

    ShaderSourceStore(const ShaderSourceStore&) = delete;
    ShaderSourceStore& operator=(const ShaderSourceStore&) = delete;

    void setBody(std::string text);

    // Returns the pending body and clears the dirty flag, or nullopt if nothing changed
    // since the last take. Intermediate writes are never observed.
    std::optional<std::string> takeIfDirty();

    bool isDirty() const;
    std::string getBody() const;

private:
    struct Slot {
        std::string text;
        bool dirty = false;
    };

    mutable std::mutex m_mutex;
    Slot m_slot;
};

} // namespace postfx

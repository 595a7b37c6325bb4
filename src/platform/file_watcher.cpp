#include "postfx/platform/file_watcher.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>

namespace postfx {

FileWatcher::FileWatcher(const std::string& path, std::chrono::milliseconds interval, ChangeCallback onChange)
    : m_path(path), m_interval(interval), m_onChange(std::move(onChange)) {}

FileWatcher::~FileWatcher() {
    stop();
}

void FileWatcher::start() {
    if (m_running.exchange(true)) {
        return;
    }
    m_thread = std::thread(&FileWatcher::run, this);
    spdlog::info("Watching {} every {} ms", m_path, m_interval.count());
}

void FileWatcher::stop() {
    {
        std::lock_guard<std::mutex> lock(m_wakeMutex);
        if (!m_running.exchange(false)) {
            return;
        }
    }
    m_wake.notify_all();
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

bool FileWatcher::poll() {
    std::error_code ec;
    auto writeTime = std::filesystem::last_write_time(m_path, ec);
    if (ec) {
        if (m_lastWriteTime) {
            spdlog::warn("Lost track of {}: {}", m_path, ec.message());
            m_lastWriteTime.reset();
        }
        return false;
    }

    if (m_lastWriteTime && *m_lastWriteTime == writeTime) {
        return false;
    }
    m_lastWriteTime = writeTime;

    std::ifstream file(m_path);
    if (!file.is_open()) {
        spdlog::warn("Failed to open watched file: {}", m_path);
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string contents = buffer.str();

    // Editors often touch a file without changing it.
    if (m_reported && contents == m_lastContents) {
        return false;
    }

    m_lastContents = contents;
    m_reported = true;
    spdlog::debug("{} changed ({} bytes)", m_path, contents.size());
    m_onChange(contents);
    return true;
}

void FileWatcher::run() {
    while (m_running.load()) {
        poll();

        std::unique_lock<std::mutex> lock(m_wakeMutex);
        m_wake.wait_for(lock, m_interval, [this] { return !m_running.load(); });
    }
}

} // namespace postfx

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace postfx {

// Polls one file from a background thread and reports its contents whenever the file
// changes. The first successful poll always reports. Callbacks run on the watcher thread.
class FileWatcher {
public:
    using ChangeCallback = std::function<void(const std::string& contents)>;

    FileWatcher(const std::string& path, std::chrono::milliseconds interval, ChangeCallback onChange);
    ~FileWatcher();

    FileWatcher(const FileWatcher&) = delete;
    FileWatcher& operator=(const FileWatcher&) = delete;

    void start();
    void stop();
    bool isRunning() const { return m_running.load(); }

    // One synchronous check. Returns true if the callback fired.
    bool poll();

private:
    void run();

    std::string m_path;
    std::chrono::milliseconds m_interval;
    ChangeCallback m_onChange;

    std::optional<std::filesystem::file_time_type> m_lastWriteTime;
    std::string m_lastContents;
    bool m_reported = false;

    std::thread m_thread;
    std::atomic<bool> m_running{false};
    std::mutex m_wakeMutex;
    std::condition_variable m_wake;
};

} // namespace postfx

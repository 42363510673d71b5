/**
 * codeact Filesystem Watcher
 *
 * Watches the workspace tree with inotify (one watch per directory) and
 * reports every file whose content changed, re-read through the store.
 * Hidden entries (leading '.') are ignored, deletions are not reported.
 */
#pragma once
#include <atomic>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include "workspace/workspace_store.hpp"

struct inotify_event;

namespace codeact::workspace {

class FsWatcher {
public:
    // Receives the workspace-relative path and the full new content
    using ChangeCallback = std::function<void(const std::string& path, const std::string& content)>;

    FsWatcher(const WorkspaceStore& store, ChangeCallback callback);
    ~FsWatcher();

    FsWatcher(const FsWatcher&) = delete;
    FsWatcher& operator=(const FsWatcher&) = delete;

    bool start();
    void stop();

    bool is_running() const { return running_; }
    size_t watch_count() const;

private:
    const WorkspaceStore& store_;
    ChangeCallback callback_;

    int fd_ = -1;
    std::thread thread_;
    std::atomic<bool> running_{false};

    mutable std::mutex watches_mutex_;
    std::unordered_map<int, std::filesystem::path> watches_;

    void run();
    void handle_event(const struct inotify_event* event);
    void add_watch_recursive(const std::filesystem::path& dir, bool announce_files);
    void remove_watches_under(const std::filesystem::path& dir);
    void announce(const std::filesystem::path& file);
};

} // namespace codeact::workspace

#include "workspace/fs_watcher.hpp"
#include <spdlog/spdlog.h>

#include <sys/inotify.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <vector>

namespace fs = std::filesystem;

namespace codeact::workspace {

constexpr uint32_t WATCH_MASK = IN_CLOSE_WRITE | IN_MOVED_TO | IN_MOVED_FROM |
                                IN_CREATE | IN_DELETE_SELF | IN_ONLYDIR;

namespace {

bool is_hidden(const std::string& name) {
    return !name.empty() && name[0] == '.';
}

bool is_under(const fs::path& path, const fs::path& dir) {
    auto rel = path.lexically_relative(dir);
    return !rel.empty() && *rel.begin() != "..";
}

} // namespace

FsWatcher::FsWatcher(const WorkspaceStore& store, ChangeCallback callback)
    : store_(store)
    , callback_(std::move(callback)) {}

FsWatcher::~FsWatcher() {
    stop();
}

bool FsWatcher::start() {
    if (running_) {
        return true;
    }

    fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd_ < 0) {
        spdlog::error("inotify_init1 failed: {}", strerror(errno));
        return false;
    }

    add_watch_recursive(store_.root(), false);
    if (watch_count() == 0) {
        spdlog::error("Cannot watch workspace root {}", store_.root().string());
        close(fd_);
        fd_ = -1;
        return false;
    }

    running_ = true;
    thread_ = std::thread(&FsWatcher::run, this);
    spdlog::info("Watching {} ({} directories)", store_.root().string(), watch_count());
    return true;
}

void FsWatcher::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    close(fd_);
    fd_ = -1;

    std::lock_guard<std::mutex> lock(watches_mutex_);
    watches_.clear();
    spdlog::info("Filesystem watcher stopped");
}

size_t FsWatcher::watch_count() const {
    std::lock_guard<std::mutex> lock(watches_mutex_);
    return watches_.size();
}

void FsWatcher::add_watch_recursive(const fs::path& dir, bool announce_files) {
    int wd = inotify_add_watch(fd_, dir.c_str(), WATCH_MASK);
    if (wd < 0) {
        spdlog::warn("Cannot watch {}: {}", dir.string(), strerror(errno));
        return;
    }
    {
        std::lock_guard<std::mutex> lock(watches_mutex_);
        watches_[wd] = dir;
    }

    // Entries created before the watch existed produced no events
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::string name = it->path().filename().string();
        if (is_hidden(name)) {
            continue;
        }
        std::error_code type_ec;
        if (it->is_directory(type_ec)) {
            add_watch_recursive(it->path(), announce_files);
        } else if (announce_files && it->is_regular_file(type_ec)) {
            announce(it->path());
        }
    }
}

void FsWatcher::remove_watches_under(const fs::path& dir) {
    std::lock_guard<std::mutex> lock(watches_mutex_);
    for (auto it = watches_.begin(); it != watches_.end();) {
        if (it->second == dir || is_under(it->second, dir)) {
            inotify_rm_watch(fd_, it->first);
            it = watches_.erase(it);
        } else {
            ++it;
        }
    }
}

void FsWatcher::announce(const fs::path& file) {
    std::string rel = store_.relative(file);
    StoreResult result = store_.read(rel);
    if (!result.ok()) {
        // Gone again before we could read it
        spdlog::debug("Skipping change of {}: {}", rel, result.message);
        return;
    }

    spdlog::debug("File changed: {} ({} bytes)", rel, result.content.size());
    callback_(rel, result.content);
}

void FsWatcher::handle_event(const struct inotify_event* event) {
    if (event->mask & IN_Q_OVERFLOW) {
        spdlog::warn("inotify queue overflow, some changes were not broadcast");
        return;
    }

    if (event->mask & IN_IGNORED) {
        std::lock_guard<std::mutex> lock(watches_mutex_);
        watches_.erase(event->wd);
        return;
    }

    if (event->len == 0) {
        return;
    }

    std::string name = event->name;
    if (is_hidden(name)) {
        return;
    }

    fs::path dir;
    {
        std::lock_guard<std::mutex> lock(watches_mutex_);
        auto it = watches_.find(event->wd);
        if (it == watches_.end()) {
            return;
        }
        dir = it->second;
    }
    fs::path path = dir / name;

    if (event->mask & IN_ISDIR) {
        if (event->mask & (IN_CREATE | IN_MOVED_TO)) {
            add_watch_recursive(path, true);
        } else if (event->mask & IN_MOVED_FROM) {
            remove_watches_under(path);
        }
        return;
    }

    if (event->mask & (IN_CLOSE_WRITE | IN_MOVED_TO)) {
        announce(path);
    }
}

void FsWatcher::run() {
    alignas(struct inotify_event) char buffer[16 * 1024];

    while (running_) {
        struct pollfd pfd = {fd_, POLLIN, 0};
        int ret = poll(&pfd, 1, 100);
        if (ret < 0) {
            if (errno == EINTR) continue;
            spdlog::error("Watcher poll failed: {}", strerror(errno));
            break;
        }
        if (ret == 0) {
            continue;
        }

        ssize_t len = read(fd_, buffer, sizeof(buffer));
        if (len < 0) {
            if (errno == EAGAIN || errno == EINTR) continue;
            spdlog::error("Watcher read failed: {}", strerror(errno));
            break;
        }

        for (char* ptr = buffer; ptr < buffer + len;) {
            auto* event = reinterpret_cast<struct inotify_event*>(ptr);
            try {
                handle_event(event);
            } catch (const std::exception& e) {
                spdlog::error("Change handler failed: {}", e.what());
            }
            ptr += sizeof(struct inotify_event) + event->len;
        }
    }
}

} // namespace codeact::workspace

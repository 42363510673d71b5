#include "workspace/workspace_store.hpp"
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <functional>
#include <iterator>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace codeact::workspace {

namespace {

constexpr const char* PATH_NOT_ALLOWED = "path not allowed";

bool is_subpath(const fs::path& path, const fs::path& root) {
    auto path_it = path.begin();
    auto root_it = root.begin();
    for (; root_it != root.end(); ++root_it, ++path_it) {
        if (root_it->empty()) {
            continue;   // trailing separator on the root
        }
        if (path_it == path.end() || *path_it != *root_it) {
            return false;
        }
    }
    return true;
}

StoreResult failure(StoreStatus status, const char* op, const std::string& reason) {
    StoreResult result;
    result.status = status;
    result.message = std::string("Failed to ") + op + " file: " + reason;
    return result;
}

StoreResult not_allowed(const char* op) {
    return failure(StoreStatus::PATH_NOT_ALLOWED, op, PATH_NOT_ALLOWED);
}

StoreResult from_error(const char* op, const std::error_code& ec) {
    StoreStatus status = (ec == std::errc::no_such_file_or_directory)
        ? StoreStatus::NOT_FOUND : StoreStatus::IO_ERROR;
    return failure(status, op, ec.message());
}

bool is_root(const fs::path& resolved, const fs::path& root) {
    return resolved == (root / ".").lexically_normal();
}

constexpr const char* TEMP_SUFFIX = ".codeact-tmp";

bool is_temp_name(const std::string& name) {
    const std::string suffix = TEMP_SUFFIX;
    return name.size() > suffix.size() && name[0] == '.' &&
           name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

nlohmann::json FileEntry::to_json() const {
    return {
        {"name", name},
        {"type", is_directory ? "directory" : "file"},
        {"path", path},
    };
}

// ============================================================================
// WorkspaceStore Implementation
// ============================================================================

WorkspaceStore::WorkspaceStore(const fs::path& root) {
    std::error_code ec;
    fs::create_directories(root, ec);
    if (ec) {
        spdlog::error("Cannot create workspace root {}: {}", root.string(), ec.message());
    }

    root_ = fs::weakly_canonical(fs::absolute(root), ec);
    if (ec) {
        root_ = fs::absolute(root).lexically_normal();
    }
    spdlog::info("Workspace root: {}", root_.string());
}

std::optional<fs::path> WorkspaceStore::resolve(const std::string& raw) const {
    std::string trimmed = raw;
    trimmed.erase(0, trimmed.find_first_not_of('/'));

    fs::path rel = fs::path(trimmed).lexically_normal();
    if (rel.empty()) {
        rel = ".";
    }
    if (rel.has_root_name() || rel.has_root_directory()) {
        return std::nullopt;
    }
    for (const auto& part : rel) {
        if (part == "..") {
            return std::nullopt;
        }
    }

    fs::path candidate = (root_ / rel).lexically_normal();

    // Lexically fine; make sure no symlink on the way leads outside
    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(candidate, ec);
    if (!ec && !is_subpath(canonical, root_)) {
        return std::nullopt;
    }
    return candidate;
}

std::string WorkspaceStore::relative(const fs::path& absolute) const {
    return absolute.lexically_relative(root_).generic_string();
}

size_t WorkspaceStore::stripe_for(const fs::path& resolved) const {
    return std::hash<std::string>{}(resolved.lexically_normal().string()) % LOCK_STRIPES;
}

StoreResult WorkspaceStore::read(const std::string& path) const {
    auto resolved = resolve(path);
    if (!resolved) {
        return not_allowed("read");
    }

    std::lock_guard<std::mutex> lock(stripes_[stripe_for(*resolved)]);

    std::error_code ec;
    auto st = fs::status(*resolved, ec);
    if (ec) {
        return from_error("read", ec);
    }
    if (fs::is_directory(st)) {
        return failure(StoreStatus::IO_ERROR, "read",
                       std::make_error_code(std::errc::is_a_directory).message());
    }

    std::ifstream file(*resolved, std::ios::binary);
    if (!file.is_open()) {
        return failure(StoreStatus::IO_ERROR, "read",
                       std::make_error_code(std::errc::permission_denied).message());
    }

    StoreResult result;
    result.content.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return failure(StoreStatus::IO_ERROR, "read", "I/O error");
    }
    spdlog::debug("read {} ({} bytes)", path, result.content.size());
    return result;
}

StoreResult WorkspaceStore::write(const std::string& path, const std::string& content) {
    auto resolved = resolve(path);
    if (!resolved || is_root(*resolved, root_)) {
        return not_allowed("write");
    }

    std::lock_guard<std::mutex> lock(stripes_[stripe_for(*resolved)]);

    std::error_code ec;
    fs::create_directories(resolved->parent_path(), ec);
    if (ec) {
        return from_error("write", ec);
    }
    if (fs::is_directory(*resolved, ec)) {
        return failure(StoreStatus::IO_ERROR, "write",
                       std::make_error_code(std::errc::is_a_directory).message());
    }

    fs::path temp = resolved->parent_path() / ("." + resolved->filename().string() + TEMP_SUFFIX);
    {
        std::ofstream file(temp, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            return failure(StoreStatus::IO_ERROR, "write",
                           std::make_error_code(std::errc::permission_denied).message());
        }
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        file.close();
        if (!file) {
            fs::remove(temp, ec);
            return failure(StoreStatus::IO_ERROR, "write", "I/O error");
        }
    }

    fs::rename(temp, *resolved, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        return from_error("write", ec);
    }

    spdlog::debug("wrote {} ({} bytes)", path, content.size());
    return {};
}

StoreResult WorkspaceStore::create(const std::string& path, const std::string& content) {
    StoreResult result = write(path, content);
    if (!result.ok()) {
        result.message.replace(0, std::string("Failed to write").size(), "Failed to create");
    }
    return result;
}

StoreResult WorkspaceStore::remove(const std::string& path) {
    auto resolved = resolve(path);
    if (!resolved || is_root(*resolved, root_)) {
        return not_allowed("delete");
    }

    std::lock_guard<std::mutex> lock(stripes_[stripe_for(*resolved)]);

    std::error_code ec;
    fs::symlink_status(*resolved, ec);
    if (ec) {
        return from_error("delete", ec);
    }

    fs::remove_all(*resolved, ec);
    if (ec) {
        return from_error("delete", ec);
    }

    spdlog::debug("deleted {}", path);
    return {};
}

StoreResult WorkspaceStore::rename(const std::string& old_path, const std::string& new_path) {
    auto from = resolve(old_path);
    auto to = resolve(new_path);
    if (!from || !to || is_root(*from, root_) || is_root(*to, root_)) {
        return not_allowed("rename");
    }

    size_t a = stripe_for(*from);
    size_t b = stripe_for(*to);
    std::unique_lock<std::mutex> first(stripes_[std::min(a, b)]);
    std::unique_lock<std::mutex> second;
    if (a != b) {
        second = std::unique_lock<std::mutex>(stripes_[std::max(a, b)]);
    }

    std::error_code ec;
    fs::symlink_status(*from, ec);
    if (ec) {
        return from_error("rename", ec);
    }

    std::error_code exists_ec;
    if (fs::exists(fs::symlink_status(*to, exists_ec))) {
        return failure(StoreStatus::ALREADY_EXISTS, "rename", "destination already exists");
    }

    fs::create_directories(to->parent_path(), ec);
    if (ec) {
        return from_error("rename", ec);
    }

    fs::rename(*from, *to, ec);
    if (ec) {
        return from_error("rename", ec);
    }

    spdlog::debug("renamed {} -> {}", old_path, new_path);
    return {};
}

StoreResult WorkspaceStore::list(const std::string& directory) const {
    auto resolved = resolve(directory);
    if (!resolved) {
        return not_allowed("list");
    }

    std::error_code ec;
    fs::directory_iterator it(*resolved, ec);
    if (ec) {
        return failure(ec == std::errc::no_such_file_or_directory ? StoreStatus::NOT_FOUND
                                                                  : StoreStatus::IO_ERROR,
                       "list", ec.message());
    }

    std::string prefix = relative(*resolved);
    while (!prefix.empty() && prefix.back() == '/') {
        prefix.pop_back();
    }
    if (prefix == ".") {
        prefix.clear();
    }

    StoreResult result;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            return failure(StoreStatus::IO_ERROR, "list", ec.message());
        }
        FileEntry entry;
        entry.name = it->path().filename().string();
        if (is_temp_name(entry.name)) {
            continue;
        }
        std::error_code type_ec;
        entry.is_directory = it->is_directory(type_ec);
        entry.path = prefix.empty() ? entry.name : prefix + "/" + entry.name;
        result.entries.push_back(std::move(entry));
    }
    if (ec) {
        return failure(StoreStatus::IO_ERROR, "list", ec.message());
    }

    std::sort(result.entries.begin(), result.entries.end(),
              [](const FileEntry& a, const FileEntry& b) { return a.name < b.name; });
    return result;
}

StoreResult WorkspaceStore::list_root() const {
    return list(".");
}

} // namespace codeact::workspace

/**
 * codeact Workspace Store
 *
 * The single directory tree every file operation is confined to.
 * Paths are workspace-relative; anything that would resolve outside the
 * root is rejected before the filesystem is touched.
 *
 * Operations on the same path are serialized through a fixed set of lock
 * stripes. Writes go to a hidden temporary file that is renamed over the
 * target, so readers see either the old or the new content in full.
 */
#pragma once
#include <array>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace codeact::workspace {

enum class StoreStatus {
    OK,
    NOT_FOUND,
    PATH_NOT_ALLOWED,
    ALREADY_EXISTS,     // rename destination is taken
    IO_ERROR
};

struct FileEntry {
    std::string name;
    bool is_directory = false;
    std::string path;           // workspace-relative

    nlohmann::json to_json() const;
};

struct StoreResult {
    StoreStatus status = StoreStatus::OK;
    std::string message;                // "Failed to <op> file: <reason>" unless OK
    std::string content;                // read()
    std::vector<FileEntry> entries;     // list()

    bool ok() const { return status == StoreStatus::OK; }
};

class WorkspaceStore {
public:
    static constexpr size_t LOCK_STRIPES = 64;

    // Creates the root directory if it does not exist
    explicit WorkspaceStore(const std::filesystem::path& root);

    StoreResult read(const std::string& path) const;
    StoreResult write(const std::string& path, const std::string& content);

    // Same as write(); an existing file is overwritten
    StoreResult create(const std::string& path, const std::string& content = "");

    // Files or whole directory trees; a missing path is an error
    StoreResult remove(const std::string& path);

    StoreResult rename(const std::string& old_path, const std::string& new_path);

    // One level, sorted by name
    StoreResult list(const std::string& directory = ".") const;

    // Top level of the workspace
    StoreResult list_root() const;

    /**
     * Resolve a workspace-relative path to an absolute one under the root.
     * Leading '/' is treated as the workspace root. Returns nullopt for
     * paths that climb out of the root, directly or through a symlink.
     */
    std::optional<std::filesystem::path> resolve(const std::string& path) const;

    // Inverse of resolve() for paths under the root, '/'-separated
    std::string relative(const std::filesystem::path& absolute) const;

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
    mutable std::array<std::mutex, LOCK_STRIPES> stripes_;

    size_t stripe_for(const std::filesystem::path& resolved) const;
};

} // namespace codeact::workspace

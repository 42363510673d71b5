#include "runtime/execution_log.hpp"
#include "util/time_format.hpp"
#include <spdlog/spdlog.h>

namespace codeact::runtime {

using json = nlohmann::json;

// ============================================================================
// ExecutionRecord Implementation
// ============================================================================

json ExecutionRecord::to_json() const {
    json j;
    j["id"] = id;
    j["connection_id"] = connection_id;
    j["language"] = language;
    j["status"] = execution_status_to_string(status);
    j["result"] = result ? json(*result) : json(nullptr);
    j["error"] = error ? json(*error) : json(nullptr);
    j["duration_ms"] = duration_ms;
    j["output_lines"] = output_lines;
    j["started_at"] = util::format_iso8601(started_at);
    return j;
}

// ============================================================================
// ExecutionLog Implementation
// ============================================================================

ExecutionLog::ExecutionLog(size_t max_entries)
    : max_entries_(max_entries == 0 ? 1 : max_entries) {
    spdlog::debug("ExecutionLog initialized (max_entries={})", max_entries_);
}

uint64_t ExecutionLog::record(ExecutionRecord entry) {
    std::lock_guard<std::mutex> lock(mutex_);

    entry.id = next_id_++;
    uint64_t id = entry.id;
    entries_.push_back(std::move(entry));

    while (entries_.size() > max_entries_) {
        entries_.pop_front();
    }
    return id;
}

std::vector<ExecutionRecord> ExecutionLog::recent(size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<ExecutionRecord> result;
    for (auto it = entries_.rbegin(); it != entries_.rend() && result.size() < limit; ++it) {
        result.push_back(*it);
    }
    return result;
}

std::optional<ExecutionRecord> ExecutionLog::find(uint64_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    // Ids are monotonic, so the deque is sorted by id
    if (entries_.empty() || id < entries_.front().id || id > entries_.back().id) {
        return std::nullopt;
    }
    for (const auto& entry : entries_) {
        if (entry.id == id) {
            return entry;
        }
    }
    return std::nullopt;
}

size_t ExecutionLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace codeact::runtime

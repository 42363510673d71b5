/**
 * codeact Execution Log
 *
 * Bounded in-memory history of code executions, newest last.
 * Backs the read-only /api/executions endpoints.
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "runtime/code_executor.hpp"

namespace codeact::runtime {

struct ExecutionRecord {
    uint64_t id = 0;
    std::string connection_id;
    std::string language;
    ExecutionStatus status = ExecutionStatus::COMPLETED;
    std::optional<std::string> result;
    std::optional<std::string> error;
    uint64_t duration_ms = 0;
    size_t output_lines = 0;
    std::chrono::system_clock::time_point started_at;

    nlohmann::json to_json() const;
};

class ExecutionLog {
public:
    explicit ExecutionLog(size_t max_entries = 200);

    // Assigns and returns the record id; evicts the oldest entry when full
    uint64_t record(ExecutionRecord entry);

    // Newest first
    std::vector<ExecutionRecord> recent(size_t limit = 50) const;

    std::optional<ExecutionRecord> find(uint64_t id) const;

    size_t size() const;
    size_t capacity() const { return max_entries_; }

private:
    size_t max_entries_;
    std::deque<ExecutionRecord> entries_;
    uint64_t next_id_ = 1;
    mutable std::mutex mutex_;
};

} // namespace codeact::runtime

#pragma once

#include "sky_cutout/core/types.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace sky_cutout::task {

using json = nlohmann::json;

// What a client submits
struct TaskRequest {
    fs::path catalog_path;
    std::vector<std::string> instruments;
    std::vector<std::string> bands;          // empty = every band of the instruments
    std::vector<std::string> product_types;
    int size = 128;
    int workers = 4;

    // Column overrides; unset uses the configured preferred name and aliases
    std::optional<std::string> ra_column;
    std::optional<std::string> dec_column;
    std::optional<std::string> id_column;
};

// All counters are in artifacts: one per (catalog row, band, product type)
struct TaskCounters {
    size_t total = 0;
    size_t cached_hits = 0;
    size_t newly_produced = 0;
    size_t errors = 0;

    size_t done() const { return cached_hits + newly_produced + errors; }
};

struct FailedArtifact {
    std::string target_key;
    std::string band;
    std::string product_type;
    std::string reason;
};

struct Task {
    std::string id;
    TaskStatus status = TaskStatus::QUEUED;
    int progress = 0;
    TaskCounters counters;
    size_t targets = 0;
    TaskRequest request;

    std::string created_at;
    std::string started_at;
    std::string finished_at;

    std::optional<fs::path> bundle_path;
    std::string message;
    std::optional<std::string> error;
    std::vector<FailedArtifact> failed;
};

json to_json(const TaskRequest& request);
json to_json(const TaskCounters& counters);
json to_json(const FailedArtifact& failure);
json to_json(const Task& task);

// Mutable view of one stored task. Every method takes the task's own lock,
// so concurrent workers never interleave partial updates and snapshots are
// never torn.
class TaskHandle {
public:
    explicit TaskHandle(Task task) : task_(std::move(task)) {}

    TaskHandle(const TaskHandle&) = delete;
    TaskHandle& operator=(const TaskHandle&) = delete;

    // Immutable after creation
    const std::string& id() const { return task_.id; }

    Task snapshot() const;
    TaskStatus status() const;

    // Fixed once, before any work (queued only)
    void set_total(size_t targets, size_t total);
    void record_hits(size_t n);

    void begin_processing();

    // Return the progress after the update
    int record_produced(size_t n);
    int record_error(size_t n, FailedArtifact failure);

    void complete(const fs::path& bundle_path, const std::string& message);
    void fail(const std::string& error);

private:
    void require_status(TaskStatus expected, const char* operation) const;
    void add_done(size_t n, const char* operation);
    int update_progress();

    mutable std::mutex mutex_;
    Task task_;
};

// Registry of every task of the process. Tasks stay registered after they
// finish; the registry lives as long as the process.
class TaskStore {
public:
    TaskStore() = default;

    TaskStore(const TaskStore&) = delete;
    TaskStore& operator=(const TaskStore&) = delete;

    TaskHandle& create(TaskRequest request);
    TaskHandle& create(const std::string& id, TaskRequest request);

    std::optional<Task> get(const std::string& id) const;

    // Throws TaskStateError for an unknown id
    TaskHandle& handle(const std::string& id);

    std::vector<Task> list() const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<TaskHandle>> tasks_;
};

} // namespace sky_cutout::task

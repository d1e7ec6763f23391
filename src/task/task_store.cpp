#include "sky_cutout/task/task_store.hpp"
#include "sky_cutout/core/errors.hpp"
#include "sky_cutout/core/utils.hpp"

#include <algorithm>
#include <cmath>

namespace sky_cutout::task {

json to_json(const TaskRequest& request) {
    json j;
    j["catalog_path"] = request.catalog_path.string();
    j["instruments"] = request.instruments;
    j["bands"] = request.bands;
    j["product_types"] = request.product_types;
    j["size"] = request.size;
    j["workers"] = request.workers;
    if (request.ra_column) j["ra_column"] = *request.ra_column;
    if (request.dec_column) j["dec_column"] = *request.dec_column;
    if (request.id_column) j["id_column"] = *request.id_column;
    return j;
}

json to_json(const TaskCounters& counters) {
    return {
        {"total", counters.total},
        {"cached_hits", counters.cached_hits},
        {"newly_produced", counters.newly_produced},
        {"errors", counters.errors}
    };
}

json to_json(const FailedArtifact& failure) {
    return {
        {"target_key", failure.target_key},
        {"band", failure.band},
        {"product_type", failure.product_type},
        {"reason", failure.reason}
    };
}

json to_json(const Task& task) {
    json j;
    j["task_id"] = task.id;
    j["status"] = task_status_to_string(task.status);
    j["progress"] = task.progress;
    j["stats"] = to_json(task.counters);
    j["targets"] = task.targets;
    j["request"] = to_json(task.request);
    j["created_at"] = task.created_at;
    j["started_at"] = task.started_at.empty() ? json(nullptr) : json(task.started_at);
    j["finished_at"] = task.finished_at.empty() ? json(nullptr) : json(task.finished_at);
    j["bundle_path"] = task.bundle_path ? json(task.bundle_path->string()) : json(nullptr);
    j["message"] = task.message;
    j["error"] = task.error ? json(*task.error) : json(nullptr);

    json failed = json::array();
    for (const auto& f : task.failed) {
        failed.push_back(to_json(f));
    }
    j["failed_targets"] = failed;
    return j;
}

// --- TaskHandle ---

Task TaskHandle::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return task_;
}

TaskStatus TaskHandle::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return task_.status;
}

void TaskHandle::require_status(TaskStatus expected, const char* operation) const {
    if (task_.status != expected) {
        throw TaskStateError(std::string(operation) + " on task " + task_.id +
                             " in state " + task_status_to_string(task_.status));
    }
}

void TaskHandle::add_done(size_t n, const char* operation) {
    if (task_.counters.done() + n > task_.counters.total) {
        throw TaskStateError(std::string(operation) + " on task " + task_.id +
                             " exceeds total " + std::to_string(task_.counters.total));
    }
}

int TaskHandle::update_progress() {
    const auto& c = task_.counters;
    if (c.total > 0) {
        int p = static_cast<int>(std::lround(100.0 * static_cast<double>(c.done()) /
                                             static_cast<double>(c.total)));
        task_.progress = std::max(task_.progress, std::min(p, 100));
    }
    return task_.progress;
}

void TaskHandle::set_total(size_t targets, size_t total) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_status(TaskStatus::QUEUED, "set_total");
    task_.targets = targets;
    task_.counters.total = total;
}

void TaskHandle::record_hits(size_t n) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (is_terminal(task_.status)) {
        throw TaskStateError("record_hits on task " + task_.id + " in state " +
                             task_status_to_string(task_.status));
    }
    add_done(n, "record_hits");
    task_.counters.cached_hits += n;
    update_progress();
}

void TaskHandle::begin_processing() {
    std::lock_guard<std::mutex> lock(mutex_);
    require_status(TaskStatus::QUEUED, "begin_processing");
    task_.status = TaskStatus::PROCESSING;
    task_.started_at = core::get_iso_timestamp();
    task_.message = "processing";
}

int TaskHandle::record_produced(size_t n) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_status(TaskStatus::PROCESSING, "record_produced");
    add_done(n, "record_produced");
    task_.counters.newly_produced += n;
    return update_progress();
}

int TaskHandle::record_error(size_t n, FailedArtifact failure) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_status(TaskStatus::PROCESSING, "record_error");
    add_done(n, "record_error");
    task_.counters.errors += n;
    task_.failed.push_back(std::move(failure));
    return update_progress();
}

void TaskHandle::complete(const fs::path& bundle_path, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_status(TaskStatus::PROCESSING, "complete");
    task_.status = TaskStatus::COMPLETED;
    task_.progress = 100;
    task_.bundle_path = bundle_path;
    task_.message = message;
    task_.finished_at = core::get_iso_timestamp();
}

void TaskHandle::fail(const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (is_terminal(task_.status)) {
        throw TaskStateError("fail on task " + task_.id + " in state " +
                             task_status_to_string(task_.status));
    }
    task_.status = TaskStatus::FAILED;
    task_.error = error;
    task_.message = "failed";
    task_.finished_at = core::get_iso_timestamp();
}

// --- TaskStore ---

TaskHandle& TaskStore::create(TaskRequest request) {
    return create(core::new_task_id(), std::move(request));
}

TaskHandle& TaskStore::create(const std::string& id, TaskRequest request) {
    Task task;
    task.id = id;
    task.status = TaskStatus::QUEUED;
    task.request = std::move(request);
    task.created_at = core::get_iso_timestamp();
    task.message = "queued";

    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = tasks_.emplace(id, std::make_unique<TaskHandle>(std::move(task)));
    if (!inserted) {
        throw TaskStateError("duplicate task id " + id);
    }
    return *it->second;
}

std::optional<Task> TaskStore::get(const std::string& id) const {
    const TaskHandle* h = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(id);
        if (it == tasks_.end()) return std::nullopt;
        h = it->second.get();
    }
    return h->snapshot();
}

TaskHandle& TaskStore::handle(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        throw TaskStateError("unknown task " + id);
    }
    return *it->second;
}

std::vector<Task> TaskStore::list() const {
    std::vector<const TaskHandle*> handles;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handles.reserve(tasks_.size());
        for (const auto& [id, h] : tasks_) handles.push_back(h.get());
    }
    std::vector<Task> out;
    out.reserve(handles.size());
    for (const auto* h : handles) out.push_back(h->snapshot());
    return out;
}

size_t TaskStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

} // namespace sky_cutout::task

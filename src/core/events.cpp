#include "sky_cutout/core/events.hpp"
#include "sky_cutout/core/utils.hpp"

namespace sky_cutout::core {

json EventEmitter::base_event(const std::string& type, const std::string& task_id) {
    return {
        {"type", type},
        {"task_id", task_id},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::write(const json& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    (*out_) << event.dump() << "\n";
    out_->flush();
}

void EventEmitter::task_submitted(const std::string& task_id, const json& request) {
    json event = base_event("task_submitted", task_id);
    event["request"] = request;
    write(event);
}

void EventEmitter::task_start(const std::string& task_id, size_t targets, size_t total) {
    json event = base_event("task_start", task_id);
    event["targets"] = targets;
    event["total"] = total;
    write(event);
}

void EventEmitter::cache_resolved(const std::string& task_id, size_t hits, size_t misses,
                                  size_t work_items) {
    json event = base_event("cache_resolved", task_id);
    event["hits"] = hits;
    event["misses"] = misses;
    event["work_items"] = work_items;
    write(event);
}

void EventEmitter::task_progress(const std::string& task_id, int progress,
                                 size_t done, size_t total) {
    json event = base_event("task_progress", task_id);
    event["progress"] = progress;
    event["current"] = done;
    event["total"] = total;
    write(event);
}

void EventEmitter::artifact_failed(const std::string& task_id, const std::string& target_key,
                                   const std::string& band, const std::string& product_type,
                                   const std::string& reason) {
    json event = base_event("artifact_failed", task_id);
    event["target_key"] = target_key;
    event["band"] = band;
    event["product_type"] = product_type;
    event["reason"] = reason;
    write(event);
}

void EventEmitter::cache_write_failed(const std::string& task_id, const std::string& path,
                                      const std::string& reason, bool disk_full) {
    json event = base_event("cache_write_failed", task_id);
    event["path"] = path;
    event["reason"] = reason;
    event["disk_full"] = disk_full;
    write(event);
}

void EventEmitter::bundle_written(const std::string& task_id, const std::string& path,
                                  size_t files, uint64_t bytes) {
    json event = base_event("bundle_written", task_id);
    event["path"] = path;
    event["files"] = files;
    event["bytes"] = bytes;
    write(event);
}

void EventEmitter::task_end(const std::string& task_id, const std::string& status,
                            const json& extra) {
    json event = base_event("task_end", task_id);
    event["status"] = status;
    event["success"] = (status == "completed");
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    write(event);
}

void EventEmitter::warning(const std::string& task_id, const std::string& message) {
    json event = base_event("warning", task_id);
    event["message"] = message;
    write(event);
}

void EventEmitter::error(const std::string& task_id, const std::string& message) {
    json event = base_event("error", task_id);
    event["message"] = message;
    write(event);
}

void EventEmitter::emit(const std::string& type, const std::string& task_id,
                        const json& data) {
    json event = base_event(type, task_id);
    for (auto& [key, value] : data.items()) {
        event[key] = value;
    }
    write(event);
}

} // namespace sky_cutout::core

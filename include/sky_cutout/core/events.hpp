#pragma once

#include "types.hpp"
#include <mutex>
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace sky_cutout::core {

using json = nlohmann::json;

// JSON-lines event stream. One object per line; emission is serialized so
// worker threads of several tasks can report into the same stream.
class EventEmitter {
public:
    explicit EventEmitter(std::ostream& out) : out_(&out) {}

    EventEmitter(const EventEmitter&) = delete;
    EventEmitter& operator=(const EventEmitter&) = delete;

    void task_submitted(const std::string& task_id, const json& request);
    void task_start(const std::string& task_id, size_t targets, size_t total);
    void cache_resolved(const std::string& task_id, size_t hits, size_t misses,
                        size_t work_items);
    void task_progress(const std::string& task_id, int progress, size_t done, size_t total);
    void artifact_failed(const std::string& task_id, const std::string& target_key,
                         const std::string& band, const std::string& product_type,
                         const std::string& reason);
    void cache_write_failed(const std::string& task_id, const std::string& path,
                            const std::string& reason, bool disk_full);
    void bundle_written(const std::string& task_id, const std::string& path,
                        size_t files, uint64_t bytes);
    void task_end(const std::string& task_id, const std::string& status, const json& extra);

    void warning(const std::string& task_id, const std::string& message);
    void error(const std::string& task_id, const std::string& message);

    void emit(const std::string& type, const std::string& task_id, const json& data);

private:
    void write(const json& event);
    json base_event(const std::string& type, const std::string& task_id);

    std::ostream* out_;
    std::mutex mutex_;
};

} // namespace sky_cutout::core

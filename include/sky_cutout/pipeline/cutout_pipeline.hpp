#pragma once

#include "sky_cutout/cache/artifact_cache.hpp"
#include "sky_cutout/cache/cache_resolver.hpp"
#include "sky_cutout/catalog/catalog_reader.hpp"
#include "sky_cutout/config/configuration.hpp"
#include "sky_cutout/core/events.hpp"
#include "sky_cutout/packaging/result_packager.hpp"
#include "sky_cutout/scheduler/artifact_producer.hpp"
#include "sky_cutout/task/task_store.hpp"

#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace sky_cutout::pipeline {

// Validated form of a TaskRequest
struct PreparedRequest {
    catalog::Catalog catalog;
    std::vector<Target> targets;
    std::vector<BandSelection> bands;
    std::vector<std::string> product_types;
    int size = 0;
    int workers = 0;
};

struct ProbeResult {
    size_t targets = 0;
    size_t unique_targets = 0;
    size_t total = 0;
    size_t hits = 0;
    size_t misses = 0;
    size_t work_items = 0;
    catalog::CatalogStats stats;
};

nlohmann::json to_json(const ProbeResult& probe);

// Applies configured defaults and limits, reads the catalog and derives the
// target keys. Throws ValidationError.
PreparedRequest prepare_request(const config::Config& cfg, const task::TaskRequest& request);

// Hit/miss summary of a request without producing anything
ProbeResult probe_cache(const config::Config& cfg, const task::TaskRequest& request);

// Request for `catalog_path` with the configured defaults
task::TaskRequest default_request(const config::Config& cfg, const fs::path& catalog_path);

// Catalog -> identities -> cache resolution -> scheduled production ->
// bundle, with every step recorded on the task.
//
// Tasks run in background threads. The destructor waits for them.
class CutoutPipeline {
public:
    CutoutPipeline(config::Config cfg, scheduler::ArtifactProducer& producer,
                   core::EventEmitter* events = nullptr);
    ~CutoutPipeline();

    CutoutPipeline(const CutoutPipeline&) = delete;
    CutoutPipeline& operator=(const CutoutPipeline&) = delete;

    // Registers the task and starts it in the background; returns its id
    std::string submit(task::TaskRequest request);

    // Registers the task and runs it on the calling thread
    task::Task run(task::TaskRequest request);

    std::optional<task::Task> status(const std::string& task_id) const;
    std::vector<task::Task> tasks() const;

    void wait_all();

    const config::Config& config() const { return cfg_; }
    const cache::ArtifactCache& cache() const { return cache_; }

private:
    void execute(task::TaskHandle& handle);
    void execute_guarded(task::TaskHandle& handle);
    void finish_failed(task::TaskHandle& handle, const std::string& error);

    config::Config cfg_;
    scheduler::ArtifactProducer& producer_;
    core::EventEmitter* events_;
    cache::ArtifactCache cache_;
    packaging::ResultPackager packager_;
    task::TaskStore store_;

    std::mutex threads_mutex_;
    std::vector<std::thread> threads_;
};

} // namespace sky_cutout::pipeline

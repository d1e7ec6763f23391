#pragma once

#include "sky_cutout/cache/artifact_cache.hpp"
#include "sky_cutout/core/events.hpp"
#include "sky_cutout/core/types.hpp"
#include "sky_cutout/scheduler/artifact_producer.hpp"
#include "sky_cutout/task/task_store.hpp"
#include <vector>

namespace sky_cutout::scheduler {

constexpr int kMaxWorkers = 16;
constexpr int kDefaultWorkers = 4;

// One unique artifact to produce, with the number of misses it satisfies
struct WorkItem {
    ArtifactRequest request;
    size_t multiplicity = 1;
};

struct ScheduleReport {
    std::vector<ProducedArtifact> produced;   // cached or in-memory
    std::vector<task::FailedArtifact> failures;
    size_t work_items = 0;
    int workers = 0;
    size_t produced_count = 0;                // artifacts, multiplicity included
    size_t error_count = 0;
};

// Coalesces duplicate misses; order of first appearance is kept.
std::vector<WorkItem> coalesce(const std::vector<ArtifactRequest>& misses);

// Clamps to [1, max_workers] (max_workers itself capped at kMaxWorkers) and
// to the number of items.
int compute_worker_count(int requested, int max_workers, size_t item_count);

class WorkScheduler {
public:
    WorkScheduler(ArtifactProducer& producer, const cache::ArtifactCache& cache,
                  core::EventEmitter* events = nullptr, int max_workers = kMaxWorkers);

    // Produces every miss with at most `workers` producer calls in flight.
    // Blocks until all work items were attempted. The task must be processing.
    ScheduleReport run(task::TaskHandle& task, const std::vector<ArtifactRequest>& misses,
                       int workers);

private:
    ArtifactProducer& producer_;
    const cache::ArtifactCache& cache_;
    core::EventEmitter* events_;
    int max_workers_;
};

} // namespace sky_cutout::scheduler

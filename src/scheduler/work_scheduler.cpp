#include "sky_cutout/scheduler/work_scheduler.hpp"
#include "sky_cutout/core/errors.hpp"
#include "sky_cutout/core/utils.hpp"
#include "sky_cutout/scheduler/bounded_work_queue.hpp"

#include <algorithm>
#include <iostream>
#include <map>
#include <mutex>
#include <system_error>
#include <thread>
#include <tuple>

namespace sky_cutout::scheduler {

std::vector<WorkItem> coalesce(const std::vector<ArtifactRequest>& misses) {
    using Key = std::tuple<std::string, std::string, std::string, int>;
    std::map<Key, size_t> index;
    std::vector<WorkItem> items;

    for (const auto& req : misses) {
        Key key{req.target_key, req.band, req.product_type, req.size};
        auto it = index.find(key);
        if (it != index.end()) {
            items[it->second].multiplicity += 1;
        } else {
            index.emplace(key, items.size());
            items.push_back(WorkItem{req, 1});
        }
    }
    return items;
}

int compute_worker_count(int requested, int max_workers, size_t item_count) {
    int ceiling = std::clamp(max_workers, 1, kMaxWorkers);
    int workers = std::clamp(requested, 1, ceiling);
    if (item_count > 0) {
        workers = std::min(workers, static_cast<int>(std::min<size_t>(item_count, kMaxWorkers)));
    }
    return std::max(1, workers);
}

WorkScheduler::WorkScheduler(ArtifactProducer& producer, const cache::ArtifactCache& cache,
                             core::EventEmitter* events, int max_workers)
    : producer_(producer), cache_(cache), events_(events), max_workers_(max_workers) {}

ScheduleReport WorkScheduler::run(task::TaskHandle& task,
                                  const std::vector<ArtifactRequest>& misses,
                                  int requested_workers) {
    ScheduleReport report;
    if (task.status() != TaskStatus::PROCESSING) {
        throw TaskStateError("scheduler started on task " + task.id() +
                             " in state " + task_status_to_string(task.status()));
    }

    std::vector<WorkItem> items = coalesce(misses);
    report.work_items = items.size();
    if (items.empty()) {
        return report;
    }

    const int workers = compute_worker_count(requested_workers, max_workers_, items.size());
    report.workers = workers;

    BoundedWorkQueue<WorkItem> queue(static_cast<size_t>(workers) * 2);
    std::mutex report_mutex;
    std::mutex progress_mutex;

    // Snapshots taken in sequence keep the emitted progress non-decreasing
    auto progress_event = [&]() {
        if (!events_) return;
        std::lock_guard<std::mutex> lock(progress_mutex);
        auto snap = task.snapshot();
        events_->task_progress(task.id(), snap.progress, snap.counters.done(),
                               snap.counters.total);
    };

    auto record_failure = [&](const WorkItem& item, const std::string& reason) {
        task::FailedArtifact failure{item.request.target_key, item.request.band,
                                     item.request.product_type, reason};
        task.record_error(item.multiplicity, failure);
        {
            std::lock_guard<std::mutex> lock(report_mutex);
            report.error_count += item.multiplicity;
            report.failures.push_back(failure);
        }
        if (events_) {
            events_->artifact_failed(task.id(), failure.target_key, failure.band,
                                     failure.product_type, reason);
        }
        progress_event();
    };

    auto process = [&](const WorkItem& item) {
        std::vector<uint8_t> bytes;
        try {
            bytes = producer_.produce(item.request);
        } catch (const std::exception& e) {
            record_failure(item, e.what());
            return;
        } catch (...) {
            record_failure(item, "unknown error");
            return;
        }

        ProducedArtifact produced;
        produced.request = item.request;
        produced.multiplicity = item.multiplicity;
        try {
            produced.cache_path = cache_.store(item.request, bytes);
        } catch (const CacheWriteError& e) {
            const std::string reason = e.what();
            const bool disk_full = core::message_indicates_disk_full(reason);
            if (events_) {
                events_->cache_write_failed(task.id(), cache_.path_for(item.request).string(),
                                            reason, disk_full);
            }
            produced.bytes = std::move(bytes);
            {
                std::lock_guard<std::mutex> lock(report_mutex);
                report.produced.push_back(std::move(produced));
            }
            record_failure(item, reason);
            return;
        }

        task.record_produced(item.multiplicity);
        {
            std::lock_guard<std::mutex> lock(report_mutex);
            report.produced_count += item.multiplicity;
            report.produced.push_back(std::move(produced));
        }
        progress_event();
    };

    auto worker = [&]() {
        while (auto item = queue.pop()) {
            process(*item);
        }
    };

    std::vector<std::thread> pool;
    pool.reserve(static_cast<size_t>(workers));
    try {
        for (int i = 0; i < workers; ++i) {
            pool.emplace_back(worker);
        }
    } catch (const std::system_error& e) {
        std::cerr << "[scheduler] task " << task.id() << ": cannot start worker "
                  << pool.size() + 1 << ": " << e.what() << std::endl;
        queue.close();
        for (auto& t : pool) {
            t.join();
        }
        throw;
    }

    for (auto& item : items) {
        queue.push(std::move(item));
    }
    queue.close();

    for (auto& t : pool) {
        t.join();
    }

    std::cerr << "[scheduler] task " << task.id() << ": " << report.work_items
              << " work items, " << workers << " workers, "
              << report.produced_count << " produced, " << report.error_count
              << " errors" << std::endl;

    return report;
}

} // namespace sky_cutout::scheduler

#include "sky_cutout/pipeline/cutout_pipeline.hpp"
#include "sky_cutout/core/errors.hpp"
#include "sky_cutout/identity/target_key.hpp"
#include "sky_cutout/scheduler/work_scheduler.hpp"

#include <algorithm>
#include <iostream>
#include <set>
#include <sstream>
#include <system_error>

namespace sky_cutout::pipeline {

namespace {

catalog::ColumnSpecs column_specs(const config::ColumnsConfig& columns) {
    catalog::ColumnSpecs specs;
    specs.ra = catalog::ColumnSpec{columns.ra.preferred, columns.ra.aliases};
    specs.dec = catalog::ColumnSpec{columns.dec.preferred, columns.dec.aliases};
    specs.id = catalog::ColumnSpec{columns.id.preferred, columns.id.aliases};
    return specs;
}

packaging::PackagingOptions packaging_options(const config::Config& cfg) {
    packaging::PackagingOptions opts;
    opts.tmp_dir = cfg.workspace.tmp_dir;
    opts.output_dir = cfg.workspace.output_dir;
    opts.compression_level = cfg.packaging.compression_level;
    opts.keep_staging = cfg.packaging.keep_staging;
    return opts;
}

} // namespace

nlohmann::json to_json(const ProbeResult& probe) {
    return {
        {"targets", probe.targets},
        {"unique_targets", probe.unique_targets},
        {"total", probe.total},
        {"cached_hits", probe.hits},
        {"misses", probe.misses},
        {"work_items", probe.work_items},
        {"catalog", catalog::to_json(probe.stats)}
    };
}

task::TaskRequest default_request(const config::Config& cfg, const fs::path& catalog_path) {
    task::TaskRequest req;
    req.catalog_path = catalog_path;
    req.instruments = cfg.defaults.instruments;
    req.product_types = cfg.defaults.product_types;
    req.size = cfg.defaults.size;
    req.workers = cfg.defaults.workers;
    return req;
}

PreparedRequest prepare_request(const config::Config& cfg, const task::TaskRequest& request) {
    if (request.size < 1 || request.size > 4096) {
        throw ValidationError("size must be in [1, 4096], got " + std::to_string(request.size));
    }
    if (request.workers < 1 || request.workers > scheduler::kMaxWorkers) {
        throw ValidationError("workers must be in [1, " + std::to_string(scheduler::kMaxWorkers) +
                              "], got " + std::to_string(request.workers));
    }

    PreparedRequest prep;
    prep.size = request.size;
    prep.workers = std::min(request.workers, cfg.limits.max_workers);

    prep.product_types =
        request.product_types.empty() ? cfg.defaults.product_types : request.product_types;
    for (const auto& p : prep.product_types) {
        if (std::find(cfg.product_types.begin(), cfg.product_types.end(), p) ==
            cfg.product_types.end()) {
            throw ValidationError("unsupported product type " + p);
        }
    }

    const auto& instruments =
        request.instruments.empty() ? cfg.defaults.instruments : request.instruments;
    prep.bands = cache::expand_bands(instruments, request.bands, cfg.instruments);

    auto specs = catalog::with_overrides(column_specs(cfg.columns), request.ra_column,
                                         request.dec_column, request.id_column);
    prep.catalog = catalog::read_catalog(request.catalog_path, specs,
                                         static_cast<size_t>(cfg.limits.max_catalog_rows));
    prep.targets = identity::derive_targets(prep.catalog.rows);
    return prep;
}

ProbeResult probe_cache(const config::Config& cfg, const task::TaskRequest& request) {
    PreparedRequest prep = prepare_request(cfg, request);
    cache::ArtifactCache cache(cfg.workspace.cache_dir);
    cache::Resolution res =
        cache::resolve(cache, prep.targets, prep.bands, prep.product_types, prep.size);

    ProbeResult out;
    out.targets = prep.targets.size();
    std::set<std::string> keys;
    for (const auto& t : prep.targets) keys.insert(t.key);
    out.unique_targets = keys.size();
    out.total = res.total();
    out.hits = res.hits.size();
    out.misses = res.misses.size();
    out.work_items = scheduler::coalesce(res.misses).size();
    out.stats = catalog::summarize(prep.catalog);
    return out;
}

CutoutPipeline::CutoutPipeline(config::Config cfg, scheduler::ArtifactProducer& producer,
                               core::EventEmitter* events)
    : cfg_(std::move(cfg)),
      producer_(producer),
      events_(events),
      cache_(cfg_.workspace.cache_dir),
      packager_(packaging_options(cfg_), events) {}

CutoutPipeline::~CutoutPipeline() {
    wait_all();
}

std::string CutoutPipeline::submit(task::TaskRequest request) {
    task::TaskHandle& handle = store_.create(std::move(request));
    if (events_) {
        events_->task_submitted(handle.id(), task::to_json(handle.snapshot().request));
    }

    std::lock_guard<std::mutex> lock(threads_mutex_);
    try {
        threads_.emplace_back([this, &handle]() { execute_guarded(handle); });
    } catch (const std::system_error& e) {
        finish_failed(handle, std::string("cannot start task thread: ") + e.what());
        throw;
    }
    return handle.id();
}

task::Task CutoutPipeline::run(task::TaskRequest request) {
    task::TaskHandle& handle = store_.create(std::move(request));
    if (events_) {
        events_->task_submitted(handle.id(), task::to_json(handle.snapshot().request));
    }
    execute_guarded(handle);
    return handle.snapshot();
}

std::optional<task::Task> CutoutPipeline::status(const std::string& task_id) const {
    return store_.get(task_id);
}

std::vector<task::Task> CutoutPipeline::tasks() const {
    return store_.list();
}

void CutoutPipeline::wait_all() {
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(threads_mutex_);
        threads.swap(threads_);
    }
    for (auto& t : threads) {
        if (t.joinable()) t.join();
    }
}

void CutoutPipeline::finish_failed(task::TaskHandle& handle, const std::string& error) {
    std::cerr << "[pipeline] task " << handle.id() << " failed: " << error << std::endl;
    if (!is_terminal(handle.status())) {
        handle.fail(error);
    }
    if (events_) {
        events_->error(handle.id(), error);
        events_->task_end(handle.id(), "failed", {{"error", error}});
    }
}

void CutoutPipeline::execute_guarded(task::TaskHandle& handle) {
    try {
        execute(handle);
    } catch (const std::exception& e) {
        finish_failed(handle, e.what());
    }
}

void CutoutPipeline::execute(task::TaskHandle& handle) {
    const std::string task_id = handle.id();
    const task::TaskRequest request = handle.snapshot().request;

    PreparedRequest prep;
    cache::Resolution resolution;
    try {
        prep = prepare_request(cfg_, request);
        resolution = cache::resolve(cache_, prep.targets, prep.bands, prep.product_types,
                                    prep.size);
        handle.set_total(prep.targets.size(), resolution.total());
        handle.record_hits(resolution.hits.size());
    } catch (const ValidationError& e) {
        finish_failed(handle, e.what());
        return;
    } catch (const IOError& e) {
        finish_failed(handle, e.what());
        return;
    }

    const size_t work_items = scheduler::coalesce(resolution.misses).size();
    if (events_) {
        events_->task_start(task_id, prep.targets.size(), resolution.total());
        events_->cache_resolved(task_id, resolution.hits.size(), resolution.misses.size(),
                                work_items);
    }
    std::cerr << "[pipeline] task " << task_id << ": " << prep.targets.size() << " targets, "
              << resolution.total() << " artifacts, " << resolution.hits.size()
              << " cached" << std::endl;

    handle.begin_processing();

    scheduler::WorkScheduler sched(producer_, cache_, events_, cfg_.limits.max_workers);
    scheduler::ScheduleReport report = sched.run(handle, resolution.misses, prep.workers);

    packaging::BundleInfo bundle;
    try {
        bundle = packager_.package(handle, resolution.hits, report.produced);
    } catch (const PackagingError& e) {
        finish_failed(handle, e.what());
        return;
    }

    task::Task snap = handle.snapshot();
    std::ostringstream msg;
    msg << "Processed " << snap.targets << " targets: " << snap.counters.cached_hits
        << " cached, " << snap.counters.newly_produced << " produced, "
        << snap.counters.errors << " failed";
    handle.complete(bundle.path, msg.str());

    if (events_) {
        snap = handle.snapshot();
        events_->task_end(task_id, "completed",
                          {{"bundle_path", bundle.path.string()},
                           {"stats", task::to_json(snap.counters)}});
    }
}

} // namespace sky_cutout::pipeline

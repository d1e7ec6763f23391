#include "sky_cutout/core/errors.hpp"
#include "sky_cutout/pipeline/cutout_pipeline.hpp"

#include "test_support.hpp"

#include <atomic>
#include <mutex>
#include <set>
#include <sstream>

#include <catch2/catch_test_macros.hpp>

using namespace sky_cutout;

namespace {

class ScriptedProducer : public scheduler::ArtifactProducer {
public:
    std::vector<uint8_t> produce(const ArtifactRequest& request) override {
        ++calls_;
        if (request.target_key.rfind("BAD", 0) == 0) {
            throw ProductionError("outside archive coverage");
        }
        std::string body = "FITS " + request.target_key + " " + request.band + " " +
                           request.product_type;
        return std::vector<uint8_t>(body.begin(), body.end());
    }

    int calls() const { return calls_.load(); }

private:
    std::atomic<int> calls_{0};
};

config::Config workspace_config(const sky_cutout_test::TempDir& tmp) {
    config::Config cfg;
    cfg.workspace.cache_dir = (tmp / "cache").string();
    cfg.workspace.output_dir = (tmp / "output").string();
    cfg.workspace.tmp_dir = (tmp / "tmp").string();
    return cfg;
}

task::TaskRequest nisp_request(const fs::path& catalog) {
    task::TaskRequest req;
    req.catalog_path = catalog;
    req.instruments = {"NISP"};
    req.bands = {"NIR-Y"};
    req.product_types = {"BGSUB"};
    req.size = 32;
    req.workers = 2;
    return req;
}

} // namespace

TEST_CASE("second_submission_is_served_from_cache") {
    sky_cutout_test::TempDir tmp("pipeline_cache");
    sky_cutout_test::write_file(tmp / "cat.csv", "ID,RA,DEC\nT1,150.0,2.0\nT2,150.1,2.1\n");

    ScriptedProducer producer;
    pipeline::CutoutPipeline pipe(workspace_config(tmp), producer);

    auto first = pipe.run(nisp_request(tmp / "cat.csv"));
    REQUIRE(first.status == TaskStatus::COMPLETED);
    REQUIRE(first.counters.total == 2);
    REQUIRE(first.counters.newly_produced == 2);
    REQUIRE(first.counters.cached_hits == 0);
    REQUIRE(first.progress == 100);
    REQUIRE(first.bundle_path.has_value());
    REQUIRE(fs::exists(*first.bundle_path));
    REQUIRE(producer.calls() == 2);

    auto second = pipe.run(nisp_request(tmp / "cat.csv"));
    REQUIRE(second.status == TaskStatus::COMPLETED);
    REQUIRE(second.counters.cached_hits == 2);
    REQUIRE(second.counters.newly_produced == 0);
    REQUIRE(producer.calls() == 2);
    REQUIRE(*second.bundle_path != *first.bundle_path);
    REQUIRE(second.message == "Processed 2 targets: 2 cached, 0 produced, 0 failed");
}

TEST_CASE("rows_without_id_share_a_coordinate_key_across_submissions") {
    sky_cutout_test::TempDir tmp("pipeline_coord_keys");
    sky_cutout_test::write_file(tmp / "all.csv",
                                "ID,RA,DEC\nT1,10.0,-5.0\n,150.0000000,2.0000000\n"
                                ",150.0000000,2.0000000\n");
    sky_cutout_test::write_file(tmp / "a_b.csv",
                                "ID,RA,DEC\nT1,10.0,-5.0\n,150.0000000,2.0000000\n");
    sky_cutout_test::write_file(tmp / "b_c.csv",
                                "ID,RA,DEC\n,150.0000000,2.0000000\n,150.0000000,2.0000000\n");
    auto cfg = workspace_config(tmp);

    auto prep = pipeline::prepare_request(cfg, nisp_request(tmp / "all.csv"));
    REQUIRE(prep.targets.size() == 3);
    REQUIRE(prep.targets[0].key == "T1");
    REQUIRE(prep.targets[1].key == "1500000000020000000");
    REQUIRE(prep.targets[2].key == prep.targets[1].key);

    ScriptedProducer producer;
    pipeline::CutoutPipeline pipe(cfg, producer);

    auto first = pipe.run(nisp_request(tmp / "a_b.csv"));
    REQUIRE(first.status == TaskStatus::COMPLETED);
    REQUIRE(first.counters.newly_produced == 2);
    REQUIRE(producer.calls() == 2);

    auto second = pipe.run(nisp_request(tmp / "b_c.csv"));
    REQUIRE(second.status == TaskStatus::COMPLETED);
    REQUIRE(second.counters.cached_hits == 2);
    REQUIRE(second.counters.newly_produced == 0);
    REQUIRE(second.counters.errors == 0);
    REQUIRE(producer.calls() == 2);
}

TEST_CASE("packaging_failure_fails_the_task_after_production") {
    sky_cutout_test::TempDir tmp("pipeline_pack_fail");
    sky_cutout_test::write_file(tmp / "cat.csv", "ID,RA,DEC\nT1,150.0,2.0\nT2,150.1,2.1\n");
    sky_cutout_test::write_file(tmp / "output", "a regular file, not a directory");

    std::ostringstream events_out;
    core::EventEmitter events(events_out);
    ScriptedProducer producer;
    pipeline::CutoutPipeline pipe(workspace_config(tmp), producer, &events);
    auto t = pipe.run(nisp_request(tmp / "cat.csv"));

    REQUIRE(t.status == TaskStatus::FAILED);
    REQUIRE(t.error.has_value());
    REQUIRE_FALSE(t.bundle_path.has_value());
    REQUIRE(t.counters.total == 2);
    REQUIRE(t.counters.newly_produced == 2);
    REQUIRE(t.counters.errors == 0);
    REQUIRE(producer.calls() == 2);
    REQUIRE(events_out.str().find("\"failed\"") != std::string::npos);
}

TEST_CASE("duplicates_and_failures_in_one_submission") {
    sky_cutout_test::TempDir tmp("pipeline_mixed");
    sky_cutout_test::write_file(tmp / "cat.csv",
                                "ID,RA,DEC\nT1,150.0,2.0\nT2,150.1,2.1\nT1,150.0,2.0\nBAD1,10.0,-80.0\n");

    ScriptedProducer producer;
    pipeline::CutoutPipeline pipe(workspace_config(tmp), producer);
    auto t = pipe.run(nisp_request(tmp / "cat.csv"));

    REQUIRE(t.status == TaskStatus::COMPLETED);
    REQUIRE(t.targets == 4);
    REQUIRE(t.counters.total == 4);
    REQUIRE(t.counters.newly_produced == 3);
    REQUIRE(t.counters.errors == 1);
    REQUIRE(producer.calls() == 3);
    REQUIRE(t.failed.size() == 1);
    REQUIRE(t.failed[0].target_key == "BAD1");
}

TEST_CASE("invalid_submission_fails_the_task") {
    sky_cutout_test::TempDir tmp("pipeline_invalid");
    sky_cutout_test::write_file(tmp / "cat.csv", "ID,RA,DEC\nT1,150.0,2.0\n");

    std::ostringstream events_out;
    core::EventEmitter events(events_out);
    ScriptedProducer producer;
    pipeline::CutoutPipeline pipe(workspace_config(tmp), producer, &events);

    auto missing = pipe.run(nisp_request(tmp / "absent.csv"));
    REQUIRE(missing.status == TaskStatus::FAILED);
    REQUIRE(missing.error.has_value());

    auto req = nisp_request(tmp / "cat.csv");
    req.instruments = {"WFC3"};
    auto unknown = pipe.run(req);
    REQUIRE(unknown.status == TaskStatus::FAILED);

    req = nisp_request(tmp / "cat.csv");
    req.size = 0;
    REQUIRE(pipe.run(req).status == TaskStatus::FAILED);

    REQUIRE(producer.calls() == 0);
    REQUIRE(pipe.tasks().size() == 3);
    REQUIRE(events_out.str().find("\"task_end\"") != std::string::npos);
}

TEST_CASE("concurrent_submissions_share_the_cache") {
    sky_cutout_test::TempDir tmp("pipeline_concurrent");
    std::string csv = "ID,RA,DEC\n";
    for (int i = 0; i < 20; ++i) {
        csv += "S" + std::to_string(i) + "," + std::to_string(150.0 + i * 0.01) + ",2.0\n";
    }
    sky_cutout_test::write_file(tmp / "cat.csv", csv);

    std::ostringstream events_out;
    core::EventEmitter events(events_out);
    ScriptedProducer producer;
    pipeline::CutoutPipeline pipe(workspace_config(tmp), producer, &events);

    std::vector<std::string> ids;
    for (int i = 0; i < 3; ++i) {
        ids.push_back(pipe.submit(nisp_request(tmp / "cat.csv")));
    }
    pipe.wait_all();

    std::set<std::string> bundles;
    for (const auto& id : ids) {
        auto t = pipe.status(id);
        REQUIRE(t.has_value());
        REQUIRE(t->status == TaskStatus::COMPLETED);
        REQUIRE(t->counters.errors == 0);
        REQUIRE(t->counters.done() == 20);
        bundles.insert(t->bundle_path->string());
    }
    REQUIRE(bundles.size() == 3);
    REQUIRE(producer.calls() >= 20);
    REQUIRE(producer.calls() <= 60);
}

TEST_CASE("probe_reports_hits_without_producing") {
    sky_cutout_test::TempDir tmp("pipeline_probe");
    sky_cutout_test::write_file(tmp / "cat.csv", "ID,RA,DEC\nT1,150.0,2.0\nT1,150.0,2.0\nT2,150.1,2.1\n");
    auto cfg = workspace_config(tmp);

    auto cold = pipeline::probe_cache(cfg, nisp_request(tmp / "cat.csv"));
    REQUIRE(cold.targets == 3);
    REQUIRE(cold.unique_targets == 2);
    REQUIRE(cold.total == 3);
    REQUIRE(cold.misses == 3);
    REQUIRE(cold.work_items == 2);

    ScriptedProducer producer;
    {
        pipeline::CutoutPipeline pipe(cfg, producer);
        pipe.run(nisp_request(tmp / "cat.csv"));
    }

    auto warm = pipeline::probe_cache(cfg, nisp_request(tmp / "cat.csv"));
    REQUIRE(warm.hits == 3);
    REQUIRE(warm.misses == 0);
    REQUIRE(pipeline::to_json(warm)["catalog"]["rows"] == 3);
}

TEST_CASE("default_request_uses_configured_defaults") {
    config::Config cfg;
    cfg.defaults.size = 64;
    auto req = pipeline::default_request(cfg, "cat.csv");
    REQUIRE(req.size == 64);
    REQUIRE(req.instruments == cfg.defaults.instruments);
    REQUIRE(req.bands.empty());
}

#include "cli_shared.hpp"

#include "sky_cutout/archive/fits_cutout_producer.hpp"
#include "sky_cutout/archive/tile_index.hpp"
#include "sky_cutout/config/configuration.hpp"
#include "sky_cutout/core/errors.hpp"
#include "sky_cutout/core/events.hpp"
#include "sky_cutout/core/utils.hpp"
#include "sky_cutout/identity/target_key.hpp"
#include "sky_cutout/pipeline/cutout_pipeline.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

using namespace sky_cutout;

static void print_json(const json& j) {
    std::cout << j.dump(2) << std::endl;
}

static void print_usage() {
    std::cerr << "Usage: sky_cutout_cli <command> [options]\n\n"
              << "Commands:\n"
              << "  derive-key --ra R --dec D [--id I]      Print the target key of a position\n"
              << "  run <catalog>... [options]              Produce cutout bundles\n"
              << "  probe-cache <catalog> [options]         Cache hit/miss summary, no production\n"
              << "  validate-config (--path P | --stdin) [--strict-exit-codes]\n"
              << "  print-config [--config P]               Effective configuration\n"
              << "  get-schema                              JSON schema of the configuration\n\n"
              << "Options of run and probe-cache:\n"
              << "  --config P          YAML configuration (default: $SKY_CUTOUT_CONFIG, ./sky_cutout.yaml)\n"
              << "  --instrument I      Instrument, repeatable or comma separated\n"
              << "  --band B            Band, repeatable or comma separated (default: all bands)\n"
              << "  --product P         BGSUB, BGMOD, FLAG or RMS, repeatable\n"
              << "  --size N            Cutout edge length in pixels\n"
              << "  --workers N         Parallel producers per task (1-16)\n"
              << "  --ra-col C --dec-col C --id-col C   Catalog column names\n"
              << "  --events-file P     Also write events to P\n"
              << "  --quiet-events      Do not write events to stdout\n";
}

// ============================================================================
// derive-key --ra R --dec D [--id I]
// ============================================================================
static int cmd_derive_key(const std::string& ra_str, const std::string& dec_str,
                          const std::string& id) {
    auto ra_val = core::parse_double(ra_str);
    auto dec_val = core::parse_double(dec_str);
    if (!ra_val || !dec_val) {
        throw ValidationError("--ra and --dec must be decimal degrees");
    }
    const double ra = *ra_val;
    const double dec = *dec_val;
    std::optional<std::string> explicit_id;
    if (!id.empty()) explicit_id = id;

    json result;
    result["ra"] = ra;
    result["dec"] = dec;
    result["id"] = id.empty() ? json(nullptr) : json(id);
    result["key"] = identity::derive(explicit_id, ra, dec);
    print_json(result);
    return 0;
}

// ============================================================================
// validate-config (--path P | --stdin) [--strict-exit-codes]
// ============================================================================
static int cmd_validate_config(const std::string& path, bool use_stdin, bool strict_exit) {
    json result;
    result["valid"] = false;
    result["errors"] = json::array();
    if (!path.empty()) result["path"] = path;

    try {
        config::Config cfg;
        if (!path.empty()) {
            cfg = config::Config::load(path);
        } else if (use_stdin) {
            cfg = config::Config::from_yaml(YAML::Load(sky_cutout_cli::read_stdin()));
        }
        cfg.validate();
        result["valid"] = true;
    } catch (const SkyCutoutError& e) {
        result["errors"].push_back(e.what());
    } catch (const YAML::Exception& e) {
        result["errors"].push_back(std::string("YAML: ") + e.what());
    }

    print_json(result);
    if (strict_exit) {
        return result["valid"].get<bool>() ? 0 : 1;
    }
    return 0;
}

// ============================================================================
// print-config [--config P]
// ============================================================================
static int cmd_print_config(const std::string& config_path) {
    std::optional<fs::path> explicit_path;
    if (!config_path.empty()) explicit_path = config_path;

    auto located = config::Config::locate(explicit_path);
    config::Config cfg = config::Config::load_or_default(explicit_path);

    YAML::Emitter emitter;
    emitter << cfg.to_yaml();

    json result;
    result["source"] = located ? json(located->string()) : json("defaults");
    result["yaml"] = emitter.c_str();
    print_json(result);
    return 0;
}

static int cmd_get_schema() {
    std::cout << config::get_schema_json() << std::endl;
    return 0;
}

// ============================================================================
// run / probe-cache
// ============================================================================
struct RequestArgs {
    std::string config_path;
    std::vector<std::string> instruments;
    std::vector<std::string> bands;
    std::vector<std::string> products;
    std::string size;
    std::string workers;
    std::string ra_col;
    std::string dec_col;
    std::string id_col;
};

static task::TaskRequest build_request(const config::Config& cfg, const fs::path& catalog,
                                       const RequestArgs& args) {
    task::TaskRequest req = pipeline::default_request(cfg, catalog);
    if (!args.instruments.empty()) req.instruments = args.instruments;
    if (!args.bands.empty()) req.bands = args.bands;
    if (!args.products.empty()) req.product_types = args.products;
    if (!args.size.empty()) req.size = std::stoi(args.size);
    if (!args.workers.empty()) req.workers = std::stoi(args.workers);
    if (!args.ra_col.empty()) req.ra_column = args.ra_col;
    if (!args.dec_col.empty()) req.dec_column = args.dec_col;
    if (!args.id_col.empty()) req.id_column = args.id_col;
    return req;
}

static config::Config load_config(const std::string& config_path) {
    std::optional<fs::path> explicit_path;
    if (!config_path.empty()) explicit_path = config_path;
    return config::Config::load_or_default(explicit_path);
}

static int cmd_probe_cache(const std::string& catalog, const RequestArgs& args) {
    config::Config cfg = load_config(args.config_path);
    task::TaskRequest req = build_request(cfg, catalog, args);
    pipeline::ProbeResult probe = pipeline::probe_cache(cfg, req);

    json result = pipeline::to_json(probe);
    result["catalog_path"] = catalog;
    result["cache_dir"] = cfg.workspace.cache_dir;
    print_json(result);
    return 0;
}

static int cmd_run(const std::vector<std::string>& catalogs, const RequestArgs& args,
                   const std::string& events_file_arg, bool quiet_events) {
    config::Config cfg = load_config(args.config_path);

    if (cfg.archive.root.empty() || cfg.archive.tile_index.empty()) {
        throw ConfigError("archive.root and archive.tile_index must be set to run cutouts");
    }

    const std::string events_file =
        events_file_arg.empty() ? cfg.logging.events_file : events_file_arg;
    std::ofstream events_log;
    if (!events_file.empty()) {
        fs::path p(events_file);
        if (p.has_parent_path()) fs::create_directories(p.parent_path());
        events_log.open(p, std::ios::out | std::ios::app);
        if (!events_log) {
            throw IOError("Cannot open events file: " + events_file);
        }
    }

    sky_cutout_cli::TeeBuf tee(quiet_events ? nullptr : std::cout.rdbuf(),
                               events_log.is_open() ? events_log.rdbuf() : nullptr);
    std::ostream events_out(&tee);
    std::unique_ptr<core::EventEmitter> emitter;
    if (!quiet_events || events_log.is_open()) {
        emitter = std::make_unique<core::EventEmitter>(events_out);
    }

    auto tiles = std::make_shared<const archive::TileIndex>(
        archive::TileIndex::load(cfg.archive.tile_index, cfg.archive.tile_tolerance_deg));

    archive::ProducerOptions popts;
    popts.archive_root = cfg.archive.root;
    popts.fill_value = cfg.producer.fill_value;
    popts.reject_nan = cfg.producer.reject_nan;
    archive::FitsCutoutProducer producer(tiles, popts);

    json results = json::array();
    bool all_completed = true;
    {
        pipeline::CutoutPipeline pipe(cfg, producer, emitter.get());

        std::vector<std::string> ids;
        for (const auto& catalog : catalogs) {
            ids.push_back(pipe.submit(build_request(cfg, catalog, args)));
        }
        pipe.wait_all();

        for (const auto& id : ids) {
            auto task = pipe.status(id);
            if (!task) continue;
            all_completed = all_completed && task->status == TaskStatus::COMPLETED;
            json j = task::to_json(*task);
            if (task->bundle_path) {
                std::error_code ec;
                auto bytes = fs::file_size(*task->bundle_path, ec);
                if (!ec) j["bundle_size"] = sky_cutout_cli::format_bytes(bytes);
            }
            results.push_back(j);
        }
    }

    events_out.flush();
    print_json(results.size() == 1 ? results[0] : results);
    return all_completed ? 0 : 1;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string command = argv[1];

    // Helper to find argument value
    auto get_arg = [&](const char* name) -> std::string {
        for (int i = 2; i < argc - 1; ++i) {
            if (std::strcmp(argv[i], name) == 0) {
                return argv[i + 1];
            }
        }
        return "";
    };

    auto has_flag = [&](const char* name) -> bool {
        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], name) == 0) return true;
        }
        return false;
    };

    auto is_bool_flag = [](const char* arg) {
        return std::strcmp(arg, "--stdin") == 0 || std::strcmp(arg, "--quiet-events") == 0 ||
               std::strcmp(arg, "--strict-exit-codes") == 0;
    };

    auto get_positionals = [&]() -> std::vector<std::string> {
        std::vector<std::string> out;
        for (int i = 2; i < argc; ++i) {
            if (argv[i][0] != '-') {
                out.push_back(argv[i]);
            } else if (!is_bool_flag(argv[i]) && i + 1 < argc) {
                ++i; // Skip argument value
            }
        }
        return out;
    };

    auto request_args = [&]() {
        RequestArgs a;
        a.config_path = get_arg("--config");
        a.instruments = sky_cutout_cli::collect_list_args(argc, argv, "--instrument");
        a.bands = sky_cutout_cli::collect_list_args(argc, argv, "--band");
        a.products = sky_cutout_cli::collect_list_args(argc, argv, "--product");
        a.size = get_arg("--size");
        a.workers = get_arg("--workers");
        a.ra_col = get_arg("--ra-col");
        a.dec_col = get_arg("--dec-col");
        a.id_col = get_arg("--id-col");
        return a;
    };

    try {
        if (command == "get-schema") {
            return cmd_get_schema();
        }

        if (command == "derive-key") {
            std::string ra = get_arg("--ra");
            std::string dec = get_arg("--dec");
            if (ra.empty() || dec.empty()) {
                std::cerr << "derive-key requires --ra and --dec\n";
                return 1;
            }
            return cmd_derive_key(ra, dec, get_arg("--id"));
        }

        if (command == "validate-config") {
            std::string path = get_arg("--path");
            bool use_stdin = has_flag("--stdin");
            if (path.empty() && !use_stdin) {
                std::cerr << "validate-config requires --path or --stdin\n";
                return 1;
            }
            return cmd_validate_config(path, use_stdin, has_flag("--strict-exit-codes"));
        }

        if (command == "print-config") {
            return cmd_print_config(get_arg("--config"));
        }

        if (command == "probe-cache") {
            auto positionals = get_positionals();
            if (positionals.empty()) {
                std::cerr << "probe-cache requires a catalog argument\n";
                return 1;
            }
            return cmd_probe_cache(positionals[0], request_args());
        }

        if (command == "run") {
            auto catalogs = get_positionals();
            if (catalogs.empty()) {
                std::cerr << "run requires at least one catalog argument\n";
                return 1;
            }
            return cmd_run(catalogs, request_args(), get_arg("--events-file"),
                           has_flag("--quiet-events"));
        }
    } catch (const std::exception& e) {
        json err;
        err["error"] = e.what();
        print_json(err);
        return 1;
    }

    if (command == "--help" || command == "-h" || command == "help") {
        print_usage();
        return 0;
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage();
    return 1;
}

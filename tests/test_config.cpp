#include "sky_cutout/config/configuration.hpp"
#include "sky_cutout/core/errors.hpp"

#include "test_support.hpp"

#include <nlohmann/json.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace sky_cutout;

TEST_CASE("default_config_is_valid") {
    config::Config cfg;
    REQUIRE_NOTHROW(cfg.validate());
    REQUIRE(cfg.defaults.size == 128);
    REQUIRE(cfg.instruments.at("NISP").size() == 3);
    REQUIRE(cfg.columns.ra.preferred == "RA");
}

TEST_CASE("from_yaml_overrides_sections") {
    auto node = YAML::Load(R"(
workspace:
  cache_dir: /var/cache/cutouts
archive:
  root: /archive
  tile_index: /archive/tiles.csv
limits:
  max_workers: 8
defaults:
  size: 256
  workers: 2
  instruments: [NISP]
columns:
  ra: ALPHA
  dec:
    preferred: DELTA
    aliases: [DEC_J2000]
packaging:
  compression_level: 9
)");
    auto cfg = config::Config::from_yaml(node);
    REQUIRE(cfg.workspace.cache_dir == "/var/cache/cutouts");
    REQUIRE(cfg.workspace.output_dir == "output");
    REQUIRE(cfg.archive.root == "/archive");
    REQUIRE(cfg.limits.max_workers == 8);
    REQUIRE(cfg.defaults.size == 256);
    REQUIRE(cfg.defaults.instruments == std::vector<std::string>{"NISP"});
    REQUIRE(cfg.columns.ra.preferred == "ALPHA");
    REQUIRE(cfg.columns.dec.aliases == std::vector<std::string>{"DEC_J2000"});
    REQUIRE(cfg.packaging.compression_level == 9);
    REQUIRE_NOTHROW(cfg.validate());
}

TEST_CASE("validate_rejects_bad_values") {
    config::Config cfg;
    cfg.limits.max_workers = 32;
    REQUIRE_THROWS_AS(cfg.validate(), ValidationError);

    cfg = config::Config{};
    cfg.instruments["EXTRA"] = {"VIS"};
    REQUIRE_THROWS_AS(cfg.validate(), ValidationError);

    cfg = config::Config{};
    cfg.product_types.push_back("CATALOG");
    REQUIRE_THROWS_AS(cfg.validate(), ValidationError);

    cfg = config::Config{};
    cfg.defaults.instruments = {"WFC3"};
    REQUIRE_THROWS_AS(cfg.validate(), ValidationError);

    cfg = config::Config{};
    cfg.defaults.size = 0;
    REQUIRE_THROWS_AS(cfg.validate(), ValidationError);
}

TEST_CASE("load_and_save") {
    sky_cutout_test::TempDir tmp("config");
    REQUIRE_THROWS_AS(config::Config::load(tmp / "missing.yaml"), ConfigError);

    sky_cutout_test::write_file(tmp / "broken.yaml", "workspace: [unclosed\n");
    REQUIRE_THROWS_AS(config::Config::load(tmp / "broken.yaml"), ConfigError);

    config::Config cfg;
    cfg.defaults.size = 64;
    cfg.instruments = {{"VIS", {"VIS"}}, {"NISP", {"NIR-H"}}};
    cfg.save(tmp / "saved.yaml");

    auto back = config::Config::load(tmp / "saved.yaml");
    REQUIRE(back.defaults.size == 64);
    REQUIRE(back.instruments.size() == 2);
    REQUIRE(back.instruments.at("NISP") == std::vector<std::string>{"NIR-H"});
    REQUIRE(back.columns.id.aliases == cfg.columns.id.aliases);
}

TEST_CASE("locate_prefers_explicit_path") {
    auto p = config::Config::locate(fs::path("/etc/sky_cutout.yaml"));
    REQUIRE(p.has_value());
    REQUIRE(*p == fs::path("/etc/sky_cutout.yaml"));
}

TEST_CASE("schema_is_json") {
    auto schema = nlohmann::json::parse(config::get_schema_json());
    REQUIRE(schema["type"] == "object");
    REQUIRE(schema["properties"].contains("workspace"));
}

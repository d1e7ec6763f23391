#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace sky_cutout::config {

namespace fs = std::filesystem;

constexpr const char *kConfigEnvVar = "SKY_CUTOUT_CONFIG";
constexpr const char *kDefaultConfigFile = "sky_cutout.yaml";

struct WorkspaceConfig {
  std::string cache_dir = "cache";
  std::string output_dir = "output";
  std::string tmp_dir = "tmp";
};

struct ArchiveConfig {
  std::string root;        // <root>/<tile_id>/<instrument>/*.fits
  std::string tile_index;  // FITS table or CSV
  double tile_tolerance_deg = 0.01;
};

struct LimitsConfig {
  int max_catalog_rows = 10000;
  int max_workers = 16;
};

struct DefaultsConfig {
  int size = 128;
  int workers = 4;
  std::vector<std::string> instruments = {"VIS"};
  std::vector<std::string> product_types = {"BGSUB"};
};

struct ColumnConfig {
  std::string preferred;
  std::vector<std::string> aliases;
};

struct ColumnsConfig {
  ColumnConfig ra{"RA",
                  {"TARGET_RA", "RA_1", "RA_2", "ra", "Ra", "RA_DEG", "ALPHA_J2000",
                   "RightAscension", "RIGHT_ASCENSION"}};
  ColumnConfig dec{"DEC",
                   {"TARGET_DEC", "DEC_1", "DEC_2", "dec", "Dec", "DEC_DEG", "DELTA_J2000",
                    "Declination", "DECLINATION"}};
  ColumnConfig id{"TARGETID", {"TARGET_ID", "ID", "OBJECT_ID", "SOURCE_ID", "NUMBER"}};
};

struct ProducerConfig {
  float fill_value = 0.0f;
  bool reject_nan = true;
};

struct PackagingConfig {
  int compression_level = 6;  // zlib level, -1 = library default
  bool keep_staging = false;
};

struct LoggingConfig {
  std::string events_file;  // empty = stdout only
};

// Product types the archive producer can cut
const std::vector<std::string> &known_product_types();

std::map<std::string, std::vector<std::string>> default_instrument_bands();

struct Config {
  WorkspaceConfig workspace;
  ArchiveConfig archive;
  LimitsConfig limits;
  DefaultsConfig defaults;
  ColumnsConfig columns;
  std::map<std::string, std::vector<std::string>> instruments = default_instrument_bands();
  std::vector<std::string> product_types = {"BGSUB", "BGMOD", "FLAG", "RMS"};
  ProducerConfig producer;
  PackagingConfig packaging;
  LoggingConfig logging;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  // Explicit path, then $SKY_CUTOUT_CONFIG, then ./sky_cutout.yaml.
  // nullopt when none applies; built-in defaults are used then.
  static std::optional<fs::path> locate(const std::optional<fs::path> &explicit_path);
  static Config load_or_default(const std::optional<fs::path> &explicit_path);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

std::string get_schema_json();

} // namespace sky_cutout::config

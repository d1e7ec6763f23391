#include "sky_cutout/config/configuration.hpp"
#include "sky_cutout/core/errors.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>

namespace sky_cutout::config {

const std::vector<std::string>& known_product_types() {
    static const std::vector<std::string> types = {"BGSUB", "BGMOD", "FLAG", "RMS"};
    return types;
}

std::map<std::string, std::vector<std::string>> default_instrument_bands() {
    return {
        {"VIS", {"VIS"}},
        {"NISP", {"NIR-Y", "NIR-J", "NIR-H"}},
        {"DECAM", {"DES-G", "DES-R", "DES-I", "DES-Z"}},
        {"HSC", {"WISHES-G", "WISHES-Z"}},
        {"GPC", {"PANSTARRS-I"}},
        {"MEGACAM", {"CFIS-U", "CFIS-R"}},
    };
}

static std::vector<std::string> read_string_list(const YAML::Node& n, const std::string& key) {
    if (!n.IsSequence()) {
        throw ConfigError(key + " must be a list");
    }
    std::vector<std::string> out;
    for (const auto& item : n) {
        out.push_back(item.as<std::string>());
    }
    return out;
}

static void read_column(const YAML::Node& n, const std::string& key, ColumnConfig& out) {
    if (!n) return;
    if (n.IsScalar()) {
        out.preferred = n.as<std::string>();
        return;
    }
    if (n["preferred"]) out.preferred = n["preferred"].as<std::string>();
    if (n["aliases"]) out.aliases = read_string_list(n["aliases"], key + ".aliases");
}

static bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    try {
        YAML::Node node = YAML::LoadFile(path.string());
        return from_yaml(node);
    } catch (const YAML::Exception& e) {
        throw ConfigError(path.string() + ": " + e.what());
    }
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;
    if (!node || node.IsNull()) {
        return cfg;
    }
    if (!node.IsMap()) {
        throw ConfigError("top level must be a mapping");
    }

    if (node["workspace"]) {
        auto w = node["workspace"];
        if (w["cache_dir"]) cfg.workspace.cache_dir = w["cache_dir"].as<std::string>();
        if (w["output_dir"]) cfg.workspace.output_dir = w["output_dir"].as<std::string>();
        if (w["tmp_dir"]) cfg.workspace.tmp_dir = w["tmp_dir"].as<std::string>();
    }

    if (node["archive"]) {
        auto a = node["archive"];
        if (a["root"]) cfg.archive.root = a["root"].as<std::string>();
        if (a["tile_index"]) cfg.archive.tile_index = a["tile_index"].as<std::string>();
        if (a["tile_tolerance_deg"]) {
            cfg.archive.tile_tolerance_deg = a["tile_tolerance_deg"].as<double>();
        }
    }

    if (node["limits"]) {
        auto l = node["limits"];
        if (l["max_catalog_rows"]) cfg.limits.max_catalog_rows = l["max_catalog_rows"].as<int>();
        if (l["max_workers"]) cfg.limits.max_workers = l["max_workers"].as<int>();
    }

    if (node["defaults"]) {
        auto d = node["defaults"];
        if (d["size"]) cfg.defaults.size = d["size"].as<int>();
        if (d["workers"]) cfg.defaults.workers = d["workers"].as<int>();
        if (d["instruments"]) {
            cfg.defaults.instruments = read_string_list(d["instruments"], "defaults.instruments");
        }
        if (d["product_types"]) {
            cfg.defaults.product_types =
                read_string_list(d["product_types"], "defaults.product_types");
        }
    }

    if (node["columns"]) {
        auto c = node["columns"];
        read_column(c["ra"], "columns.ra", cfg.columns.ra);
        read_column(c["dec"], "columns.dec", cfg.columns.dec);
        read_column(c["id"], "columns.id", cfg.columns.id);
    }

    if (node["instruments"]) {
        auto i = node["instruments"];
        if (!i.IsMap()) {
            throw ConfigError("instruments must map instrument names to band lists");
        }
        cfg.instruments.clear();
        for (const auto& kv : i) {
            const std::string name = kv.first.as<std::string>();
            cfg.instruments[name] = read_string_list(kv.second, "instruments." + name);
        }
    }

    if (node["product_types"]) {
        cfg.product_types = read_string_list(node["product_types"], "product_types");
    }

    if (node["producer"]) {
        auto p = node["producer"];
        if (p["fill_value"]) cfg.producer.fill_value = p["fill_value"].as<float>();
        if (p["reject_nan"]) cfg.producer.reject_nan = p["reject_nan"].as<bool>();
    }

    if (node["packaging"]) {
        auto p = node["packaging"];
        if (p["compression_level"]) {
            cfg.packaging.compression_level = p["compression_level"].as<int>();
        }
        if (p["keep_staging"]) cfg.packaging.keep_staging = p["keep_staging"].as<bool>();
    }

    if (node["logging"]) {
        auto l = node["logging"];
        if (l["events_file"]) cfg.logging.events_file = l["events_file"].as<std::string>();
    }

    return cfg;
}

std::optional<fs::path> Config::locate(const std::optional<fs::path>& explicit_path) {
    if (explicit_path && !explicit_path->empty()) {
        return *explicit_path;
    }
    if (const char* env = std::getenv(kConfigEnvVar)) {
        if (*env != '\0') {
            return fs::path(env);
        }
    }
    if (fs::exists(kDefaultConfigFile)) {
        return fs::path(kDefaultConfigFile);
    }
    return std::nullopt;
}

Config Config::load_or_default(const std::optional<fs::path>& explicit_path) {
    auto path = locate(explicit_path);
    Config cfg = path ? load(*path) : Config{};
    cfg.validate();
    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["workspace"]["cache_dir"] = workspace.cache_dir;
    node["workspace"]["output_dir"] = workspace.output_dir;
    node["workspace"]["tmp_dir"] = workspace.tmp_dir;

    node["archive"]["root"] = archive.root;
    node["archive"]["tile_index"] = archive.tile_index;
    node["archive"]["tile_tolerance_deg"] = archive.tile_tolerance_deg;

    node["limits"]["max_catalog_rows"] = limits.max_catalog_rows;
    node["limits"]["max_workers"] = limits.max_workers;

    node["defaults"]["size"] = defaults.size;
    node["defaults"]["workers"] = defaults.workers;
    node["defaults"]["instruments"] = defaults.instruments;
    node["defaults"]["product_types"] = defaults.product_types;

    auto column_node = [](const ColumnConfig& c) {
        YAML::Node n;
        n["preferred"] = c.preferred;
        n["aliases"] = c.aliases;
        return n;
    };
    node["columns"]["ra"] = column_node(columns.ra);
    node["columns"]["dec"] = column_node(columns.dec);
    node["columns"]["id"] = column_node(columns.id);

    for (const auto& [name, bands] : instruments) {
        node["instruments"][name] = bands;
    }
    node["product_types"] = product_types;

    node["producer"]["fill_value"] = producer.fill_value;
    node["producer"]["reject_nan"] = producer.reject_nan;

    node["packaging"]["compression_level"] = packaging.compression_level;
    node["packaging"]["keep_staging"] = packaging.keep_staging;

    node["logging"]["events_file"] = logging.events_file;

    return node;
}

void Config::validate() const {
    if (workspace.cache_dir.empty() || workspace.output_dir.empty() ||
        workspace.tmp_dir.empty()) {
        throw ValidationError("workspace.cache_dir, output_dir and tmp_dir must be set");
    }

    if (archive.tile_tolerance_deg < 0.0) {
        throw ValidationError("archive.tile_tolerance_deg must be >= 0");
    }

    if (limits.max_catalog_rows < 1) {
        throw ValidationError("limits.max_catalog_rows must be >= 1");
    }
    if (limits.max_workers < 1 || limits.max_workers > 16) {
        throw ValidationError("limits.max_workers must be in [1, 16]");
    }

    if (defaults.size < 1 || defaults.size > 4096) {
        throw ValidationError("defaults.size must be in [1, 4096]");
    }
    if (defaults.workers < 1 || defaults.workers > limits.max_workers) {
        throw ValidationError("defaults.workers must be in [1, limits.max_workers]");
    }

    if (columns.ra.preferred.empty() || columns.dec.preferred.empty()) {
        throw ValidationError("columns.ra.preferred and columns.dec.preferred must be set");
    }

    if (instruments.empty()) {
        throw ValidationError("instruments must list at least one instrument");
    }
    std::set<std::string> seen_bands;
    for (const auto& [name, bands] : instruments) {
        if (bands.empty()) {
            throw ValidationError("instruments." + name + " has no band");
        }
        for (const auto& band : bands) {
            if (!seen_bands.insert(band).second) {
                throw ValidationError("band " + band + " listed under more than one instrument");
            }
        }
    }
    for (const auto& inst : defaults.instruments) {
        if (instruments.find(inst) == instruments.end()) {
            throw ValidationError("defaults.instruments: unknown instrument " + inst);
        }
    }

    if (product_types.empty()) {
        throw ValidationError("product_types must not be empty");
    }
    for (const auto& p : product_types) {
        if (!contains(known_product_types(), p)) {
            throw ValidationError("product_types: unsupported product type " + p);
        }
    }
    for (const auto& p : defaults.product_types) {
        if (!contains(product_types, p)) {
            throw ValidationError("defaults.product_types: " + p + " not in product_types");
        }
    }

    if (packaging.compression_level < -1 || packaging.compression_level > 9) {
        throw ValidationError("packaging.compression_level must be in [-1, 9]");
    }
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "properties": {
    "workspace": {
      "type": "object",
      "properties": {
        "cache_dir": {"type": "string", "minLength": 1},
        "output_dir": {"type": "string", "minLength": 1},
        "tmp_dir": {"type": "string", "minLength": 1}
      }
    },
    "archive": {
      "type": "object",
      "properties": {
        "root": {"type": "string"},
        "tile_index": {"type": "string"},
        "tile_tolerance_deg": {"type": "number", "minimum": 0}
      }
    },
    "limits": {
      "type": "object",
      "properties": {
        "max_catalog_rows": {"type": "integer", "minimum": 1},
        "max_workers": {"type": "integer", "minimum": 1, "maximum": 16}
      }
    },
    "defaults": {
      "type": "object",
      "properties": {
        "size": {"type": "integer", "minimum": 1, "maximum": 4096},
        "workers": {"type": "integer", "minimum": 1, "maximum": 16},
        "instruments": {"type": "array", "items": {"type": "string"}},
        "product_types": {"type": "array", "items": {"type": "string"}}
      }
    },
    "columns": {
      "type": "object",
      "properties": {
        "ra": {"$ref": "#/definitions/column"},
        "dec": {"$ref": "#/definitions/column"},
        "id": {"$ref": "#/definitions/column"}
      }
    },
    "instruments": {
      "type": "object",
      "additionalProperties": {"type": "array", "items": {"type": "string"}, "minItems": 1}
    },
    "product_types": {
      "type": "array",
      "items": {"type": "string", "enum": ["BGSUB", "BGMOD", "FLAG", "RMS"]},
      "minItems": 1
    },
    "producer": {
      "type": "object",
      "properties": {
        "fill_value": {"type": "number"},
        "reject_nan": {"type": "boolean"}
      }
    },
    "packaging": {
      "type": "object",
      "properties": {
        "compression_level": {"type": "integer", "minimum": -1, "maximum": 9},
        "keep_staging": {"type": "boolean"}
      }
    },
    "logging": {
      "type": "object",
      "properties": {
        "events_file": {"type": "string"}
      }
    }
  },
  "definitions": {
    "column": {
      "oneOf": [
        {"type": "string"},
        {
          "type": "object",
          "properties": {
            "preferred": {"type": "string"},
            "aliases": {"type": "array", "items": {"type": "string"}}
          }
        }
      ]
    }
  }
})";
}

} // namespace sky_cutout::config

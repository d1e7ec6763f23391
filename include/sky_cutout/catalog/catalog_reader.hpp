#pragma once

#include "sky_cutout/core/types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace sky_cutout::catalog {

constexpr size_t kDefaultMaxCatalogRows = 10000;

// Preferred column name followed by ordered aliases
struct ColumnSpec {
    std::string preferred;
    std::vector<std::string> aliases;

    std::vector<std::string> candidates() const;
};

struct ColumnSpecs {
    ColumnSpec ra;
    ColumnSpec dec;
    ColumnSpec id;
};

ColumnSpecs default_column_specs();

// An explicit override replaces the candidate list of that column
ColumnSpecs with_overrides(ColumnSpecs specs,
                           const std::optional<std::string>& ra_column,
                           const std::optional<std::string>& dec_column,
                           const std::optional<std::string>& id_column);

// Resolved column names of one catalog
struct ColumnBinding {
    std::string ra;
    std::string dec;
    std::optional<std::string> id;
};

// Exact match over all candidates first, then case-insensitive
std::optional<std::string> find_column(const std::vector<std::string>& available,
                                       const ColumnSpec& spec);

// Throws ValidationError when RA or Dec cannot be bound
ColumnBinding bind_columns(const std::vector<std::string>& available, const ColumnSpecs& specs);

struct Catalog {
    fs::path path;
    std::vector<std::string> columns;
    ColumnBinding binding;
    std::vector<CatalogRow> rows;
};

struct CatalogStats {
    size_t rows = 0;
    size_t with_id = 0;
    double ra_min = 0.0;
    double ra_max = 0.0;
    double dec_min = 0.0;
    double dec_max = 0.0;
    double ra_mean = 0.0;
    double dec_mean = 0.0;
};

bool is_csv_path(const fs::path& path);

// Reads a CSV (.csv, .txt) or FITS table (.fits, .fit) catalog.
// Any invalid row, an empty catalog or more than max_rows rows is a
// ValidationError for the whole catalog.
Catalog read_catalog(const fs::path& path, const ColumnSpecs& specs,
                     size_t max_rows = kDefaultMaxCatalogRows);

void validate_row(const CatalogRow& row);

CatalogStats summarize(const Catalog& catalog);
nlohmann::json to_json(const CatalogStats& stats);

} // namespace sky_cutout::catalog

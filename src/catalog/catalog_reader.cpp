#include "sky_cutout/catalog/catalog_reader.hpp"
#include "sky_cutout/core/errors.hpp"
#include "sky_cutout/core/utils.hpp"
#include "sky_cutout/io/csv_table.hpp"
#include "sky_cutout/io/fits_io.hpp"
#include "sky_cutout/io/fits_table.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace sky_cutout::catalog {

std::vector<std::string> ColumnSpec::candidates() const {
    std::vector<std::string> out;
    if (!preferred.empty()) out.push_back(preferred);
    for (const auto& a : aliases) {
        if (std::find(out.begin(), out.end(), a) == out.end()) out.push_back(a);
    }
    return out;
}

ColumnSpecs default_column_specs() {
    ColumnSpecs specs;
    specs.ra.preferred = "RA";
    specs.ra.aliases = {"TARGET_RA", "RA_1", "RA_2", "ra", "Ra", "RA_DEG",
                        "ALPHA_J2000", "RightAscension", "RIGHT_ASCENSION"};
    specs.dec.preferred = "DEC";
    specs.dec.aliases = {"TARGET_DEC", "DEC_1", "DEC_2", "dec", "Dec", "DEC_DEG",
                         "DELTA_J2000", "Declination", "DECLINATION"};
    specs.id.preferred = "TARGETID";
    specs.id.aliases = {"TARGET_ID", "ID", "OBJECT_ID", "SOURCE_ID", "NUMBER"};
    return specs;
}

ColumnSpecs with_overrides(ColumnSpecs specs,
                           const std::optional<std::string>& ra_column,
                           const std::optional<std::string>& dec_column,
                           const std::optional<std::string>& id_column) {
    if (ra_column) specs.ra = ColumnSpec{*ra_column, {}};
    if (dec_column) specs.dec = ColumnSpec{*dec_column, {}};
    if (id_column) specs.id = ColumnSpec{*id_column, {}};
    return specs;
}

std::optional<std::string> find_column(const std::vector<std::string>& available,
                                       const ColumnSpec& spec) {
    const auto candidates = spec.candidates();
    for (const auto& c : candidates) {
        if (std::find(available.begin(), available.end(), c) != available.end()) {
            return c;
        }
    }
    for (const auto& c : candidates) {
        const std::string lc = core::to_lower(c);
        for (const auto& a : available) {
            if (core::to_lower(a) == lc) return a;
        }
    }
    return std::nullopt;
}

ColumnBinding bind_columns(const std::vector<std::string>& available, const ColumnSpecs& specs) {
    ColumnBinding binding;

    auto ra = find_column(available, specs.ra);
    if (!ra) {
        throw ValidationError("no RA column (tried " + core::join(specs.ra.candidates(), ", ") +
                              "; available " + core::join(available, ", ") + ")");
    }
    auto dec = find_column(available, specs.dec);
    if (!dec) {
        throw ValidationError("no Dec column (tried " + core::join(specs.dec.candidates(), ", ") +
                              "; available " + core::join(available, ", ") + ")");
    }
    binding.ra = *ra;
    binding.dec = *dec;
    binding.id = find_column(available, specs.id);
    return binding;
}

bool is_csv_path(const fs::path& path) {
    std::string ext = core::to_lower(path.extension().string());
    return ext == ".csv" || ext == ".txt";
}

void validate_row(const CatalogRow& row) {
    std::ostringstream oss;
    if (!std::isfinite(row.ra) || !std::isfinite(row.dec)) {
        oss << "row " << row.index << ": non-finite coordinate";
        throw ValidationError(oss.str());
    }
    if (row.ra < 0.0 || row.ra > 360.0) {
        oss << "row " << row.index << ": RA " << row.ra << " outside [0, 360]";
        throw ValidationError(oss.str());
    }
    if (row.dec < -90.0 || row.dec > 90.0) {
        oss << "row " << row.index << ": Dec " << row.dec << " outside [-90, 90]";
        throw ValidationError(oss.str());
    }
}

namespace {

double parse_coordinate(const std::string& text, size_t row, const std::string& column) {
    const std::string s = core::trim(text);
    if (s.empty()) {
        throw ValidationError("row " + std::to_string(row) + ": empty " + column);
    }
    auto v = core::parse_double(s);
    if (!v) {
        throw ValidationError("row " + std::to_string(row) + ": cannot parse " + column +
                              " value '" + s + "'");
    }
    return *v;
}

void check_row_count(size_t rows, size_t max_rows, const fs::path& path) {
    if (rows == 0) {
        throw ValidationError("catalog " + path.string() + " has no rows");
    }
    if (rows > max_rows) {
        throw ValidationError("catalog " + path.string() + " has " + std::to_string(rows) +
                              " rows, limit is " + std::to_string(max_rows));
    }
}

size_t column_index(const std::vector<std::string>& header, const std::string& name) {
    return static_cast<size_t>(std::find(header.begin(), header.end(), name) - header.begin());
}

Catalog read_csv_catalog(const fs::path& path, const ColumnSpecs& specs, size_t max_rows) {
    io::CsvTable table = io::read_csv(path);

    Catalog cat;
    cat.path = path;
    cat.columns = table.header;
    cat.binding = bind_columns(table.header, specs);
    check_row_count(table.rows.size(), max_rows, path);

    const size_t ra_idx = column_index(table.header, cat.binding.ra);
    const size_t dec_idx = column_index(table.header, cat.binding.dec);
    const size_t id_idx = cat.binding.id ? column_index(table.header, *cat.binding.id)
                                         : table.header.size();

    cat.rows.reserve(table.rows.size());
    for (size_t i = 0; i < table.rows.size(); ++i) {
        const auto& fields = table.rows[i];
        CatalogRow row;
        row.index = i + 1;
        row.ra = parse_coordinate(fields[ra_idx], row.index, cat.binding.ra);
        row.dec = parse_coordinate(fields[dec_idx], row.index, cat.binding.dec);
        if (id_idx < fields.size() && !core::trim(fields[id_idx]).empty()) {
            row.explicit_id = core::trim(fields[id_idx]);
        }
        validate_row(row);
        cat.rows.push_back(std::move(row));
    }
    return cat;
}

Catalog read_fits_catalog(const fs::path& path, const ColumnSpecs& specs, size_t max_rows) {
    io::FitsTableReader table(path);

    Catalog cat;
    cat.path = path;
    cat.columns = table.column_names();
    cat.binding = bind_columns(cat.columns, specs);
    check_row_count(table.row_count(), max_rows, path);

    std::vector<double> ra = table.read_double_column(cat.binding.ra);
    std::vector<double> dec = table.read_double_column(cat.binding.dec);
    std::vector<std::string> ids;
    if (cat.binding.id) {
        ids = table.read_string_column(*cat.binding.id);
    }

    cat.rows.reserve(ra.size());
    for (size_t i = 0; i < ra.size(); ++i) {
        CatalogRow row;
        row.index = i + 1;
        row.ra = ra[i];
        row.dec = dec[i];
        if (i < ids.size() && !ids[i].empty()) {
            row.explicit_id = ids[i];
        }
        validate_row(row);
        cat.rows.push_back(std::move(row));
    }
    return cat;
}

} // namespace

Catalog read_catalog(const fs::path& path, const ColumnSpecs& specs, size_t max_rows) {
    if (!fs::exists(path)) {
        throw ValidationError("catalog not found: " + path.string());
    }
    if (is_csv_path(path)) {
        return read_csv_catalog(path, specs, max_rows);
    }
    if (io::is_fits_path(path)) {
        try {
            return read_fits_catalog(path, specs, max_rows);
        } catch (const FitsError& e) {
            throw ValidationError(std::string("unreadable FITS catalog: ") + e.what());
        }
    }
    throw ValidationError("unsupported catalog format: " + path.extension().string());
}

CatalogStats summarize(const Catalog& catalog) {
    CatalogStats s;
    s.rows = catalog.rows.size();
    if (catalog.rows.empty()) return s;

    s.ra_min = s.ra_max = catalog.rows.front().ra;
    s.dec_min = s.dec_max = catalog.rows.front().dec;
    double ra_sum = 0.0;
    double dec_sum = 0.0;
    for (const auto& r : catalog.rows) {
        s.ra_min = std::min(s.ra_min, r.ra);
        s.ra_max = std::max(s.ra_max, r.ra);
        s.dec_min = std::min(s.dec_min, r.dec);
        s.dec_max = std::max(s.dec_max, r.dec);
        ra_sum += r.ra;
        dec_sum += r.dec;
        if (r.explicit_id) ++s.with_id;
    }
    s.ra_mean = ra_sum / static_cast<double>(s.rows);
    s.dec_mean = dec_sum / static_cast<double>(s.rows);
    return s;
}

nlohmann::json to_json(const CatalogStats& stats) {
    return {
        {"rows", stats.rows},
        {"rows_with_id", stats.with_id},
        {"ra_range", {stats.ra_min, stats.ra_max}},
        {"dec_range", {stats.dec_min, stats.dec_max}},
        {"ra_mean", stats.ra_mean},
        {"dec_mean", stats.dec_mean}
    };
}

} // namespace sky_cutout::catalog

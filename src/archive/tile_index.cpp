#include "sky_cutout/archive/tile_index.hpp"
#include "sky_cutout/core/errors.hpp"
#include "sky_cutout/core/utils.hpp"
#include "sky_cutout/io/csv_table.hpp"
#include "sky_cutout/io/fits_io.hpp"
#include "sky_cutout/io/fits_table.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace sky_cutout::archive {

namespace {

const std::vector<std::string> kNumericColumns = {
    "RA_MIN", "RA_MAX", "DEC_MIN", "DEC_MAX", "RA_CENTER", "DEC_CENTER"};

void require_columns(const std::vector<std::string>& available, const fs::path& path) {
    std::vector<std::string> needed = kNumericColumns;
    needed.insert(needed.begin(), "TILE_ID");
    for (const auto& col : needed) {
        if (std::find(available.begin(), available.end(), col) == available.end()) {
            throw ConfigError("tile index " + path.string() + " lacks column " + col);
        }
    }
}

std::vector<TileRecord> load_fits(const fs::path& path) {
    io::FitsTableReader table(path);
    require_columns(table.column_names(), path);

    std::vector<std::string> ids = table.read_string_column("TILE_ID");
    std::vector<std::vector<double>> cols;
    for (const auto& name : kNumericColumns) {
        cols.push_back(table.read_double_column(name));
    }

    std::vector<TileRecord> tiles(ids.size());
    for (size_t i = 0; i < ids.size(); ++i) {
        tiles[i] = TileRecord{ids[i], cols[0][i], cols[1][i], cols[2][i],
                              cols[3][i], cols[4][i], cols[5][i]};
    }
    return tiles;
}

std::vector<TileRecord> load_csv(const fs::path& path) {
    io::CsvTable table = io::read_csv(path);
    require_columns(table.header, path);

    auto index_of = [&](const std::string& name) {
        return static_cast<size_t>(std::find(table.header.begin(), table.header.end(), name) -
                                   table.header.begin());
    };
    const size_t id_idx = index_of("TILE_ID");
    std::vector<size_t> num_idx;
    for (const auto& name : kNumericColumns) num_idx.push_back(index_of(name));

    std::vector<TileRecord> tiles;
    tiles.reserve(table.rows.size());
    for (size_t r = 0; r < table.rows.size(); ++r) {
        const auto& fields = table.rows[r];
        double v[6];
        for (size_t k = 0; k < 6; ++k) {
            const std::string& s = fields[num_idx[k]];
            auto parsed = core::parse_double(s);
            if (!parsed) {
                throw ConfigError("tile index " + path.string() + " line " +
                                  std::to_string(table.line_numbers[r]) + ": bad " +
                                  kNumericColumns[k] + " '" + s + "'");
            }
            v[k] = *parsed;
        }
        tiles.push_back(TileRecord{fields[id_idx], v[0], v[1], v[2], v[3], v[4], v[5]});
    }
    return tiles;
}

} // namespace

double angular_separation_deg(double ra1, double dec1, double ra2, double dec2) {
    constexpr double D2R = M_PI / 180.0;
    double dra = (ra2 - ra1) * D2R;
    double ddec = (dec2 - dec1) * D2R;
    double a = std::sin(ddec / 2) * std::sin(ddec / 2) +
               std::cos(dec1 * D2R) * std::cos(dec2 * D2R) *
               std::sin(dra / 2) * std::sin(dra / 2);
    return 2.0 * std::asin(std::min(1.0, std::sqrt(a))) / D2R;
}

TileIndex::TileIndex(std::vector<TileRecord> tiles, double tolerance_deg)
    : tiles_(std::move(tiles)), tolerance_deg_(tolerance_deg) {}

TileIndex TileIndex::load(const fs::path& path, double tolerance_deg) {
    if (!fs::exists(path)) {
        throw ConfigError("tile index not found: " + path.string());
    }

    std::vector<TileRecord> tiles;
    if (io::is_fits_path(path)) {
        try {
            tiles = load_fits(path);
        } catch (const FitsError& e) {
            throw ConfigError(std::string("unreadable tile index: ") + e.what());
        }
    } else {
        try {
            tiles = load_csv(path);
        } catch (const ValidationError& e) {
            throw ConfigError(std::string("unreadable tile index: ") + e.what());
        }
    }

    std::cerr << "[tile_index] loaded " << tiles.size() << " tiles from " << path.string()
              << std::endl;
    return TileIndex(std::move(tiles), tolerance_deg);
}

std::optional<std::string> TileIndex::query(double ra, double dec) const {
    const double tol = tolerance_deg_;
    const TileRecord* best = nullptr;
    double best_sep = 0.0;

    for (const auto& t : tiles_) {
        if (t.ra_min - tol <= ra && ra <= t.ra_max + tol &&
            t.dec_min - tol <= dec && dec <= t.dec_max + tol) {
            double sep = angular_separation_deg(ra, dec, t.ra_center, t.dec_center);
            if (!best || sep < best_sep) {
                best = &t;
                best_sep = sep;
            }
        }
    }

    if (!best) return std::nullopt;
    return best->tile_id;
}

} // namespace sky_cutout::archive

#pragma once

#include "sky_cutout/core/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace sky_cutout::archive {

constexpr double kDefaultTileToleranceDeg = 0.01;

struct TileRecord {
    std::string tile_id;
    double ra_min = 0.0;
    double ra_max = 0.0;
    double dec_min = 0.0;
    double dec_max = 0.0;
    double ra_center = 0.0;
    double dec_center = 0.0;
};

// Footprints of the archive tiles. Immutable after construction and safe to
// query from any number of threads.
class TileIndex {
public:
    explicit TileIndex(std::vector<TileRecord> tiles,
                       double tolerance_deg = kDefaultTileToleranceDeg);

    // FITS table or CSV with TILE_ID, RA_MIN, RA_MAX, DEC_MIN, DEC_MAX,
    // RA_CENTER, DEC_CENTER
    static TileIndex load(const fs::path& path, double tolerance_deg = kDefaultTileToleranceDeg);

    // Tile whose widened box contains the position; the nearest centre wins
    // when several do. nullopt outside the coverage.
    std::optional<std::string> query(double ra, double dec) const;

    size_t size() const { return tiles_.size(); }
    double tolerance_deg() const { return tolerance_deg_; }

private:
    std::vector<TileRecord> tiles_;
    double tolerance_deg_;
};

// Great-circle distance in degrees
double angular_separation_deg(double ra1, double dec1, double ra2, double dec2);

} // namespace sky_cutout::archive

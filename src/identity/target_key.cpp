#include "sky_cutout/identity/target_key.hpp"
#include "sky_cutout/core/errors.hpp"
#include "sky_cutout/core/utils.hpp"

#include <cmath>
#include <cstdio>
#include <sstream>

namespace sky_cutout::identity {

namespace {

void check_coordinates(double ra, double dec) {
    if (!std::isfinite(ra) || !std::isfinite(dec)) {
        throw ValidationError("non-finite coordinate");
    }
    if (ra < 0.0 || ra > 360.0) {
        std::ostringstream oss;
        oss << "RA out of range [0, 360]: " << ra;
        throw ValidationError(oss.str());
    }
    if (dec < -90.0 || dec > 90.0) {
        std::ostringstream oss;
        oss << "Dec out of range [-90, 90]: " << dec;
        throw ValidationError(oss.str());
    }
}

} // namespace

TargetKey derive_from_coordinates(double ra, double dec) {
    check_coordinates(ra, dec);

    double lon = std::fmod(ra, 360.0);
    if (lon < 0.0) lon += 360.0;

    // llround rounds half away from zero
    long long lon_units = std::llround(lon * static_cast<double>(kKeyScale));
    if (lon_units >= kFullCircleUnits) {
        lon_units -= kFullCircleUnits;
    }
    long long lat_units = std::llround(std::fabs(dec) * static_cast<double>(kKeyScale));

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%s%010lld%09lld",
                  (dec < 0.0 && lat_units != 0) ? "-" : "",
                  lon_units, lat_units);
    return TargetKey(buf);
}

TargetKey derive(const std::optional<std::string>& explicit_id, double ra, double dec) {
    if (explicit_id) {
        std::string id = core::trim(*explicit_id);
        if (!id.empty()) {
            return id;
        }
    }
    return derive_from_coordinates(ra, dec);
}

std::vector<Target> derive_targets(const std::vector<CatalogRow>& rows) {
    std::vector<Target> targets;
    targets.reserve(rows.size());
    for (const auto& row : rows) {
        Target t;
        t.key = derive(row.explicit_id, row.ra, row.dec);
        t.ra = row.ra;
        t.dec = row.dec;
        t.row_index = row.index;
        targets.push_back(std::move(t));
    }
    return targets;
}

} // namespace sky_cutout::identity

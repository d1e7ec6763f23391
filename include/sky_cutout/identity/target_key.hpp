#pragma once

#include "sky_cutout/core/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace sky_cutout::identity {

// Fixed-point grid of the coordinate-derived key (7 decimals)
constexpr long long kKeyScale = 10000000LL;
constexpr long long kFullCircleUnits = 360LL * kKeyScale;

// Canonical target identity.
//
// A non-empty explicit id (whitespace trimmed) is returned as is. Otherwise the
// key is built from the coordinates: RA normalised into [0, 360) and rounded
// to 7 decimals (10 digits, no point), then |Dec| rounded to 7 decimals
// (9 digits, no point). A leading '-' marks southern positions.
//
// Example: (150.1234567, -2.5) -> "-1501234567025000000"
//
// Throws ValidationError for non-finite or out-of-range coordinates.
TargetKey derive(const std::optional<std::string>& explicit_id, double ra, double dec);

TargetKey derive_from_coordinates(double ra, double dec);

// Keys for every catalog row, in row order. Duplicate keys are kept.
std::vector<Target> derive_targets(const std::vector<CatalogRow>& rows);

} // namespace sky_cutout::identity

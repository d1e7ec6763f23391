#pragma once

#include "sky_cutout/cache/artifact_cache.hpp"
#include "sky_cutout/core/types.hpp"
#include <map>
#include <string>
#include <vector>

namespace sky_cutout::cache {

struct Resolution {
    std::vector<CacheEntry> hits;
    std::vector<ArtifactRequest> misses;

    size_t total() const { return hits.size() + misses.size(); }
};

// One result per (target, band, product type), in that nesting order.
// Duplicate targets give duplicate hits or misses.
Resolution resolve(const ArtifactCache& cache,
                   const std::vector<Target>& targets,
                   const std::vector<BandSelection>& bands,
                   const std::vector<std::string>& product_types,
                   int size);

// Turns a submission's instrument and band choice into (instrument, band)
// selections. An empty band list selects every band of each instrument.
// Throws ValidationError for unknown instruments and for bands that belong to
// none of the selected instruments.
std::vector<BandSelection> expand_bands(
    const std::vector<std::string>& instruments,
    const std::vector<std::string>& bands,
    const std::map<std::string, std::vector<std::string>>& instrument_bands);

} // namespace sky_cutout::cache

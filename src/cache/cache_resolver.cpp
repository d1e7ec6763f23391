#include "sky_cutout/cache/cache_resolver.hpp"
#include "sky_cutout/core/errors.hpp"
#include "sky_cutout/core/utils.hpp"

#include <algorithm>

namespace sky_cutout::cache {

Resolution resolve(const ArtifactCache& cache,
                   const std::vector<Target>& targets,
                   const std::vector<BandSelection>& bands,
                   const std::vector<std::string>& product_types,
                   int size) {
    Resolution res;
    for (const auto& target : targets) {
        for (const auto& sel : bands) {
            for (const auto& product : product_types) {
                ArtifactRequest req;
                req.target_key = target.key;
                req.ra = target.ra;
                req.dec = target.dec;
                req.instrument = sel.instrument;
                req.band = sel.band;
                req.product_type = product;
                req.size = size;

                if (auto entry = cache.lookup(req)) {
                    res.hits.push_back(std::move(*entry));
                } else {
                    res.misses.push_back(std::move(req));
                }
            }
        }
    }
    return res;
}

std::vector<BandSelection> expand_bands(
    const std::vector<std::string>& instruments,
    const std::vector<std::string>& bands,
    const std::map<std::string, std::vector<std::string>>& instrument_bands) {
    if (instruments.empty()) {
        throw ValidationError("no instrument selected");
    }

    std::vector<BandSelection> out;
    auto add = [&out](const std::string& instrument, const std::string& band) {
        BandSelection sel{instrument, band};
        if (std::find(out.begin(), out.end(), sel) == out.end()) {
            out.push_back(sel);
        }
    };

    for (const auto& instrument : instruments) {
        auto it = instrument_bands.find(instrument);
        if (it == instrument_bands.end()) {
            std::vector<std::string> known;
            for (const auto& [name, _] : instrument_bands) known.push_back(name);
            throw ValidationError("unknown instrument '" + instrument +
                                  "' (known: " + core::join(known, ", ") + ")");
        }
        for (const auto& band : it->second) {
            if (bands.empty() ||
                std::find(bands.begin(), bands.end(), band) != bands.end()) {
                add(instrument, band);
            }
        }
    }

    for (const auto& band : bands) {
        bool found = std::any_of(out.begin(), out.end(),
                                 [&band](const BandSelection& s) { return s.band == band; });
        if (!found) {
            throw ValidationError("band '" + band +
                                  "' does not belong to the selected instruments (" +
                                  core::join(instruments, ", ") + ")");
        }
    }

    if (out.empty()) {
        throw ValidationError("selection yields no band");
    }
    return out;
}

} // namespace sky_cutout::cache

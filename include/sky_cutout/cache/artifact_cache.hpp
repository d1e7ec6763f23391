#pragma once

#include "sky_cutout/core/types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sky_cutout::cache {

// On-disk cache shared by every task.
//
// Layout: <root>/<band>/<TargetKey>_<PRODUCT>_<size>.fits
//
// Entries are written once with an atomic rename and never modified. Lookups
// stat a single derived path; the directory is never listed.
class ArtifactCache {
public:
    explicit ArtifactCache(fs::path root);

    const fs::path& root() const { return root_; }

    static std::string file_name_for(const ArtifactRequest& request);
    fs::path path_for(const ArtifactRequest& request) const;

    std::optional<CacheEntry> lookup(const ArtifactRequest& request) const;

    // Throws CacheWriteError when the entry cannot be written.
    fs::path store(const ArtifactRequest& request, const std::vector<uint8_t>& bytes) const;

private:
    fs::path root_;
};

// Percent-encodes characters that cannot appear in a single path component.
// Distinct inputs always give distinct components.
std::string sanitize_path_component(const std::string& text);

} // namespace sky_cutout::cache

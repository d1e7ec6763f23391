#pragma once

#include "sky_cutout/core/events.hpp"
#include "sky_cutout/core/types.hpp"
#include "sky_cutout/task/task_store.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace sky_cutout::packaging {

constexpr const char* kManifestName = "manifest.json";

struct PackagingOptions {
    fs::path tmp_dir;
    fs::path output_dir;
    int compression_level = 6;
    bool keep_staging = false;
};

struct BundleInfo {
    fs::path path;
    size_t files = 0;       // artifact files, manifest excluded
    uint64_t bytes = 0;
};

// Stages cache hits and produced artifacts under
// <tmp_dir>/<task_id>/<PRODUCT>/<band>/ and zips them to
// <output_dir>/<task_id>/<task_id>.zip together with a manifest.
//
// Missing inputs only cost coverage; PackagingError is thrown when the
// bundle itself cannot be created.
class ResultPackager {
public:
    explicit ResultPackager(PackagingOptions options, core::EventEmitter* events = nullptr);

    BundleInfo package(const task::TaskHandle& task,
                       const std::vector<CacheEntry>& hits,
                       const std::vector<ProducedArtifact>& produced) const;

    fs::path staging_dir(const std::string& task_id) const;
    fs::path bundle_path(const std::string& task_id) const;

private:
    PackagingOptions options_;
    core::EventEmitter* events_;
};

} // namespace sky_cutout::packaging

#include "sky_cutout/packaging/result_packager.hpp"
#include "sky_cutout/cache/artifact_cache.hpp"
#include "sky_cutout/core/errors.hpp"
#include "sky_cutout/core/utils.hpp"
#include "sky_cutout/packaging/zip_writer.hpp"

#include <iostream>
#include <map>
#include <system_error>

namespace sky_cutout::packaging {

namespace {

struct StagedFile {
    std::string name;       // path inside the bundle, '/' separated
    fs::path staged;
    std::string origin;     // "cache" or "produced"
    size_t requests = 0;
};

std::string bundle_entry_name(const ArtifactRequest& request, const std::string& file_name) {
    return cache::sanitize_path_component(request.product_type) + "/" +
           cache::sanitize_path_component(request.band) + "/" + file_name;
}

} // namespace

ResultPackager::ResultPackager(PackagingOptions options, core::EventEmitter* events)
    : options_(std::move(options)), events_(events) {}

fs::path ResultPackager::staging_dir(const std::string& task_id) const {
    return options_.tmp_dir / task_id;
}

fs::path ResultPackager::bundle_path(const std::string& task_id) const {
    return options_.output_dir / task_id / (task_id + ".zip");
}

BundleInfo ResultPackager::package(const task::TaskHandle& task,
                                   const std::vector<CacheEntry>& hits,
                                   const std::vector<ProducedArtifact>& produced) const {
    const std::string& task_id = task.id();
    const fs::path staging = staging_dir(task_id);

    std::error_code ec;
    fs::remove_all(staging, ec);
    fs::create_directories(staging, ec);
    if (ec) {
        throw PackagingError("cannot create staging directory " + staging.string() + ": " +
                             ec.message());
    }

    std::vector<StagedFile> files;
    std::map<std::string, size_t> by_name;

    auto warn = [&](const std::string& message) {
        std::cerr << "[packager] " << message << std::endl;
        if (events_) events_->warning(task_id, message);
    };

    // Identical names collapse into one staged file
    auto stage = [&](const std::string& name, const std::string& origin, size_t requests,
                     const fs::path* source, const std::vector<uint8_t>* bytes) {
        auto it = by_name.find(name);
        if (it != by_name.end()) {
            files[it->second].requests += requests;
            return;
        }

        fs::path dst = staging / fs::path(name);
        try {
            fs::create_directories(dst.parent_path());
            if (source) {
                core::safe_hardlink_or_copy(*source, dst);
            } else {
                core::write_bytes_atomic(dst, *bytes);
            }
        } catch (const std::exception& e) {
            warn("cannot stage " + name + ": " + e.what());
            return;
        }

        by_name.emplace(name, files.size());
        files.push_back(StagedFile{name, dst, origin, requests});
    };

    for (const auto& hit : hits) {
        stage(bundle_entry_name(hit.request, hit.path.filename().string()), "cache", 1,
              &hit.path, nullptr);
    }
    for (const auto& art : produced) {
        const std::string name =
            bundle_entry_name(art.request, cache::ArtifactCache::file_name_for(art.request));
        if (art.cache_path) {
            stage(name, "produced", art.multiplicity, &*art.cache_path, nullptr);
        } else {
            stage(name, "produced", art.multiplicity, nullptr, &art.bytes);
        }
    }

    task::Task snap = task.snapshot();
    core::json manifest;
    manifest["task_id"] = task_id;
    manifest["created_at"] = core::get_iso_timestamp();
    manifest["request"] = task::to_json(snap.request);
    manifest["stats"] = task::to_json(snap.counters);

    core::json file_list = core::json::array();
    for (const auto& f : files) {
        core::json entry;
        entry["name"] = f.name;
        entry["origin"] = f.origin;
        entry["requests"] = f.requests;
        try {
            entry["sha256"] = core::sha256_file(f.staged);
            entry["bytes"] = static_cast<uint64_t>(fs::file_size(f.staged));
        } catch (const std::exception& e) {
            throw PackagingError("cannot read staged file " + f.staged.string() + ": " +
                                 e.what());
        }
        file_list.push_back(entry);
    }
    manifest["files"] = file_list;

    core::json failed = core::json::array();
    for (const auto& f : snap.failed) {
        failed.push_back(task::to_json(f));
    }
    manifest["failed_targets"] = failed;

    const std::string manifest_text = manifest.dump(2);
    try {
        core::write_text(staging / kManifestName, manifest_text);
    } catch (const IOError& e) {
        throw PackagingError(e.what());
    }

    const fs::path bundle = bundle_path(task_id);
    fs::create_directories(bundle.parent_path(), ec);
    if (ec) {
        throw PackagingError("cannot create output directory " +
                             bundle.parent_path().string() + ": " + ec.message());
    }

    fs::path partial = bundle;
    partial += ".partial";
    BundleInfo info;
    try {
        ZipWriter zip(partial, options_.compression_level);
        zip.add(kManifestName,
                std::vector<uint8_t>(manifest_text.begin(), manifest_text.end()));
        for (const auto& f : files) {
            zip.add_file(f.name, f.staged);
        }
        info.bytes = zip.finish();
    } catch (const PackagingError&) {
        fs::remove(partial, ec);
        throw;
    }

    fs::rename(partial, bundle, ec);
    if (ec) {
        std::error_code rm_ec;
        fs::remove(partial, rm_ec);
        throw PackagingError("cannot move bundle into place at " + bundle.string() + ": " +
                             ec.message());
    }

    info.path = bundle;
    info.files = files.size();

    if (!options_.keep_staging) {
        fs::remove_all(staging, ec);
        if (ec) {
            warn("cannot remove staging directory " + staging.string() + ": " + ec.message());
        }
    }

    if (events_) {
        events_->bundle_written(task_id, bundle.string(), info.files, info.bytes);
    }
    return info;
}

} // namespace sky_cutout::packaging

#pragma once

#include <Eigen/Dense>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sky_cutout {

namespace fs = std::filesystem;

// Pixel buffer for cutouts
using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// Canonical identity of a sky position (explicit id or coordinate-derived)
using TargetKey = std::string;

// One catalog entry after column binding
struct CatalogRow {
    size_t index = 0;       // 1-based row number in the source catalog
    double ra = 0.0;        // degrees [0, 360]
    double dec = 0.0;       // degrees [-90, 90]
    std::optional<std::string> explicit_id;
};

// A catalog position with its derived key
struct Target {
    TargetKey key;
    double ra = 0.0;
    double dec = 0.0;
    size_t row_index = 0;
};

// Instrument + band pair requested by a submission
struct BandSelection {
    std::string instrument;  // archive directory name, e.g. "NISP"
    std::string band;        // full band identifier, e.g. "NIR-Y"
};

inline bool operator==(const BandSelection& a, const BandSelection& b) {
    return a.instrument == b.instrument && a.band == b.band;
}

struct ArtifactRequest {
    TargetKey target_key;
    double ra = 0.0;
    double dec = 0.0;
    std::string instrument;
    std::string band;
    std::string product_type;  // BGSUB, BGMOD, FLAG, RMS
    int size = 0;              // cutout edge length in pixels
};

// Materialized artifact in the shared cache
struct CacheEntry {
    ArtifactRequest request;
    fs::path path;
};

// Result of a successful production
struct ProducedArtifact {
    ArtifactRequest request;
    size_t multiplicity = 1;          // catalog rows satisfied by this artifact
    std::optional<fs::path> cache_path;
    std::vector<uint8_t> bytes;       // kept only when the cache write failed
};

enum class TaskStatus {
    QUEUED,
    PROCESSING,
    COMPLETED,
    FAILED
};

inline std::string task_status_to_string(TaskStatus status) {
    switch (status) {
        case TaskStatus::QUEUED: return "queued";
        case TaskStatus::PROCESSING: return "processing";
        case TaskStatus::COMPLETED: return "completed";
        case TaskStatus::FAILED: return "failed";
        default: return "unknown";
    }
}

inline bool is_terminal(TaskStatus status) {
    return status == TaskStatus::COMPLETED || status == TaskStatus::FAILED;
}

} // namespace sky_cutout

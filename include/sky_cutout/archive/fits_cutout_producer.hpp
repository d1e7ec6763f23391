#pragma once

#include "sky_cutout/archive/tile_index.hpp"
#include "sky_cutout/scheduler/artifact_producer.hpp"
#include <memory>
#include <optional>
#include <string>

namespace sky_cutout::archive {

struct ProducerOptions {
    fs::path archive_root;
    float fill_value = 0.0f;
    bool reject_nan = true;
};

// File name prefix of a mosaic product:
//   BGSUB       EUC_MER_BGSUB-MOSAIC-<band>
//   BGMOD       EUC_MER_BGMOD-<band>
//   FLAG / RMS  EUC_MER_MOSAIC-<band>-<PRODUCT>
// Throws ProductionError for other product types.
std::string mosaic_prefix(const std::string& product_type, const std::string& band);

// Cutouts from the tile mosaics of a MER style archive:
//   <archive_root>/<tile_id>/<instrument>/<mosaic>.fits
class FitsCutoutProducer : public scheduler::ArtifactProducer {
public:
    FitsCutoutProducer(std::shared_ptr<const TileIndex> tiles, ProducerOptions options);

    std::vector<uint8_t> produce(const ArtifactRequest& request) override;

    std::optional<fs::path> find_mosaic(const std::string& tile_id,
                                        const std::string& instrument,
                                        const std::string& band,
                                        const std::string& product_type) const;

private:
    std::shared_ptr<const TileIndex> tiles_;
    ProducerOptions options_;
};

} // namespace sky_cutout::archive

#include "sky_cutout/archive/fits_cutout_producer.hpp"
#include "sky_cutout/astrometry/wcs.hpp"
#include "sky_cutout/core/errors.hpp"
#include "sky_cutout/core/utils.hpp"
#include "sky_cutout/io/fits_io.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace sky_cutout::archive {

std::string mosaic_prefix(const std::string& product_type, const std::string& band) {
    if (product_type == "BGSUB") return "EUC_MER_BGSUB-MOSAIC-" + band;
    if (product_type == "BGMOD") return "EUC_MER_BGMOD-" + band;
    if (product_type == "FLAG" || product_type == "RMS") {
        return "EUC_MER_MOSAIC-" + band + "-" + product_type;
    }
    throw ProductionError("unsupported product type " + product_type);
}

FitsCutoutProducer::FitsCutoutProducer(std::shared_ptr<const TileIndex> tiles,
                                       ProducerOptions options)
    : tiles_(std::move(tiles)), options_(std::move(options)) {}

std::optional<fs::path> FitsCutoutProducer::find_mosaic(const std::string& tile_id,
                                                        const std::string& instrument,
                                                        const std::string& band,
                                                        const std::string& product_type) const {
    const fs::path dir = options_.archive_root / tile_id / instrument;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return std::nullopt;
    }

    const std::string prefix = mosaic_prefix(product_type, band);
    std::vector<fs::path> matches;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        const std::string name = entry.path().filename().string();
        if (!core::starts_with(name, prefix) || !core::ends_with(name, ".fits")) continue;
        if (name.find("FINAL-CAT") != std::string::npos) continue;
        // NIR-Y must not match NIR-YJ
        const char next = name.size() > prefix.size() ? name[prefix.size()] : '\0';
        if (next != '_' && next != '.') continue;
        matches.push_back(entry.path());
    }
    if (ec) {
        throw ProductionError("cannot list " + dir.string() + ": " + ec.message());
    }
    if (matches.empty()) {
        return std::nullopt;
    }
    std::sort(matches.begin(), matches.end());
    return matches.front();
}

std::vector<uint8_t> FitsCutoutProducer::produce(const ArtifactRequest& request) {
    if (request.size <= 0) {
        throw ProductionError("invalid cutout size " + std::to_string(request.size));
    }

    auto tile_id = tiles_->query(request.ra, request.dec);
    if (!tile_id) {
        std::ostringstream oss;
        oss << "position (" << request.ra << ", " << request.dec << ") outside archive coverage";
        throw ProductionError(oss.str());
    }

    auto mosaic = find_mosaic(*tile_id, request.instrument, request.band, request.product_type);
    if (!mosaic) {
        throw ProductionError("no " + request.product_type + " mosaic for band " +
                              request.band + " in tile " + *tile_id);
    }

    try {
        io::FitsImageInfo info = io::read_fits_image_info(*mosaic);
        astrometry::WCS wcs = astrometry::wcs_from_header(info.header, info.width, info.height);

        if (!wcs.contains(request.ra, request.dec)) {
            throw ProductionError("position outside mosaic " + mosaic->filename().string());
        }
        double px = 0.0;
        double py = 0.0;
        wcs.sky_to_pixel(request.ra, request.dec, px, py);

        // Window placement of a centred cutout, partial overlap filled
        const int size = request.size;
        const int x0 = static_cast<int>(std::ceil(px - size / 2.0));
        const int y0 = static_cast<int>(std::ceil(py - size / 2.0));

        const int ox0 = std::max(x0, 0);
        const int oy0 = std::max(y0, 0);
        const int ox1 = std::min(x0 + size, info.width);
        const int oy1 = std::min(y0 + size, info.height);

        Matrix2Df cutout = Matrix2Df::Constant(size, size, options_.fill_value);
        if (ox1 > ox0 && oy1 > oy0) {
            Matrix2Df region = io::read_fits_region(*mosaic, ox0, oy0, ox1 - ox0, oy1 - oy0);
            cutout.block(oy0 - y0, ox0 - x0, region.rows(), region.cols()) = region;
        }

        if (options_.reject_nan && cutout.hasNaN()) {
            throw ProductionError("cutout of " + request.target_key + " contains NaN");
        }

        io::FitsHeader header;
        astrometry::apply_wcs(wcs.shifted(x0, y0, size, size), header);
        header.set("OBJID", request.target_key);
        header.set("OBJ_RA", request.ra);
        header.set("OBJ_DEC", request.dec);
        header.set("INSTRUME", request.instrument);
        header.set("BAND", request.band);
        header.set("PRODTYPE", request.product_type);
        header.set("TILEID", *tile_id);
        header.set("SRCFILE", mosaic->filename().string().substr(0, 68));
        if (auto bunit = info.header.get_string("BUNIT")) header.set("BUNIT", *bunit);
        if (auto mag = info.header.get_double("MAGZERO")) header.set("MAGZERO", *mag);

        return io::encode_fits_float(cutout, header);
    } catch (const FitsError& e) {
        throw ProductionError(std::string(e.what()));
    }
}

} // namespace sky_cutout::archive

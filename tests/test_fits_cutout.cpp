#include "sky_cutout/archive/fits_cutout_producer.hpp"
#include "sky_cutout/archive/tile_index.hpp"
#include "sky_cutout/astrometry/wcs.hpp"
#include "sky_cutout/core/errors.hpp"
#include "sky_cutout/core/utils.hpp"
#include "sky_cutout/io/fits_io.hpp"

#include "test_support.hpp"

#include <memory>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace sky_cutout;

namespace {

constexpr int kMosaicSize = 100;
const std::string kTile = "102018211";

astrometry::WCS mosaic_wcs() {
    astrometry::WCS w;
    w.crval1 = 150.0;
    w.crval2 = 2.0;
    w.crpix1 = 50.5;
    w.crpix2 = 50.5;
    w.cd1_1 = -1e-4;
    w.cd2_2 = 1e-4;
    w.naxis1 = kMosaicSize;
    w.naxis2 = kMosaicSize;
    return w;
}

// Pixel (x, y) holds y * 100 + x + 1
fs::path write_mosaic(const fs::path& archive_root, const std::string& name) {
    Matrix2Df data(kMosaicSize, kMosaicSize);
    for (int y = 0; y < kMosaicSize; ++y) {
        for (int x = 0; x < kMosaicSize; ++x) {
            data(y, x) = static_cast<float>(y * 100 + x + 1);
        }
    }
    io::FitsHeader header;
    astrometry::apply_wcs(mosaic_wcs(), header);
    header.set("BUNIT", "MJy/sr");
    header.set("MAGZERO", 23.9);

    fs::path path = archive_root / kTile / "NISP" / name;
    fs::create_directories(path.parent_path());
    io::write_fits_float(path, data, header);
    return path;
}

std::shared_ptr<const archive::TileIndex> single_tile() {
    archive::TileRecord t;
    t.tile_id = kTile;
    t.ra_min = 149.995;
    t.ra_max = 150.005;
    t.dec_min = 1.995;
    t.dec_max = 2.005;
    t.ra_center = 150.0;
    t.dec_center = 2.0;
    return std::make_shared<const archive::TileIndex>(std::vector<archive::TileRecord>{t});
}

ArtifactRequest request_at(double ra, double dec, int size) {
    ArtifactRequest r;
    r.target_key = "T1";
    r.ra = ra;
    r.dec = dec;
    r.instrument = "NISP";
    r.band = "NIR-Y";
    r.product_type = "BGSUB";
    r.size = size;
    return r;
}

std::pair<Matrix2Df, io::FitsHeader> decode(const sky_cutout_test::TempDir& tmp,
                                            const std::vector<uint8_t>& bytes) {
    fs::path p = tmp / "decoded.fits";
    core::write_bytes_atomic(p, bytes);
    return io::read_fits_float(p);
}

} // namespace

TEST_CASE("wcs_pixel_sky_round_trip") {
    auto w = mosaic_wcs();
    double ra = 0.0, dec = 0.0;
    w.pixel_to_sky(49.5, 49.5, ra, dec);
    REQUIRE(ra == Catch::Approx(150.0).margin(1e-9));
    REQUIRE(dec == Catch::Approx(2.0).margin(1e-9));

    double px = 0.0, py = 0.0;
    w.pixel_to_sky(10.0, 80.0, ra, dec);
    REQUIRE(w.sky_to_pixel(ra, dec, px, py));
    REQUIRE(px == Catch::Approx(10.0).margin(1e-6));
    REQUIRE(py == Catch::Approx(80.0).margin(1e-6));

    REQUIRE(w.pixel_scale_arcsec() == Catch::Approx(0.36));
    REQUIRE(w.contains(150.0, 2.0));
    REQUIRE_FALSE(w.contains(150.1, 2.0));
}

TEST_CASE("wcs_header_round_trip_and_projection_check") {
    io::FitsHeader header;
    astrometry::apply_wcs(mosaic_wcs(), header);
    auto w = astrometry::wcs_from_header(header, kMosaicSize, kMosaicSize);
    REQUIRE(w.crpix1 == Catch::Approx(50.5));
    REQUIRE(w.cd2_2 == Catch::Approx(1e-4));

    header.set("CTYPE1", "RA---SIN");
    REQUIRE_THROWS_AS(astrometry::wcs_from_header(header, kMosaicSize, kMosaicSize), FitsError);

    io::FitsHeader cdelt;
    cdelt.set("CRVAL1", 150.0);
    cdelt.set("CRVAL2", 2.0);
    cdelt.set("CRPIX1", 50.5);
    cdelt.set("CRPIX2", 50.5);
    cdelt.set("CDELT1", -1e-4);
    cdelt.set("CDELT2", 1e-4);
    auto wc = astrometry::wcs_from_header(cdelt, kMosaicSize, kMosaicSize);
    REQUIRE(wc.cd1_1 == Catch::Approx(-1e-4));
    REQUIRE(wc.cd1_2 == Catch::Approx(0.0).margin(1e-12));
}

TEST_CASE("fits_encode_is_block_aligned_and_readable") {
    sky_cutout_test::TempDir tmp("fits_encode");
    Matrix2Df data(3, 4);
    data << 1, 2, 3, 4,
            5, 6, 7, 8,
            9, 10, 11, 12;
    io::FitsHeader header;
    header.set("OBJID", "T9");

    auto bytes = io::encode_fits_float(data, header);
    REQUIRE(bytes.size() % 2880 == 0);
    REQUIRE(std::string(bytes.begin(), bytes.begin() + 6) == "SIMPLE");

    auto [back, hdr] = decode(tmp, bytes);
    REQUIRE(back.rows() == 3);
    REQUIRE(back.cols() == 4);
    REQUIRE(back(2, 1) == 10.0f);
    REQUIRE(*hdr.get_string("OBJID") == "T9");

    core::write_bytes_atomic(tmp / "image.fits", bytes);
    auto region = io::read_fits_region(tmp / "image.fits", 1, 1, 2, 2);
    REQUIRE(region(0, 0) == 6.0f);
    REQUIRE(region(1, 1) == 11.0f);
}

TEST_CASE("tile_index_picks_nearest_centre") {
    archive::TileRecord a{"A", 9.9, 10.1, -0.1, 0.1, 10.0, 0.0};
    archive::TileRecord b{"B", 10.05, 10.3, -0.1, 0.1, 10.2, 0.0};
    archive::TileIndex index({a, b});

    REQUIRE(*index.query(10.0, 0.0) == "A");
    // Inside both widened boxes: nearest centre
    REQUIRE(*index.query(10.09, 0.0) == "A");
    REQUIRE(*index.query(10.105, 0.0) == "B");
    REQUIRE(*index.query(10.12, 0.0) == "B");
    REQUIRE(*index.query(9.895, 0.0) == "A");
    REQUIRE_FALSE(index.query(20.0, 0.0).has_value());
}

TEST_CASE("tile_index_loads_csv") {
    sky_cutout_test::TempDir tmp("tiles");
    sky_cutout_test::write_file(tmp / "tiles.csv",
                                "TILE_ID,RA_MIN,RA_MAX,DEC_MIN,DEC_MAX,RA_CENTER,DEC_CENTER\n"
                                "102018211,149.9,150.1,1.9,2.1,150.0,2.0\n");
    auto index = archive::TileIndex::load(tmp / "tiles.csv");
    REQUIRE(index.size() == 1);
    REQUIRE(*index.query(150.0, 2.0) == "102018211");
    REQUIRE_THROWS_AS(archive::TileIndex::load(tmp / "absent.csv"), ConfigError);
}

TEST_CASE("mosaic_lookup_matches_band_exactly") {
    sky_cutout_test::TempDir tmp("mosaic_find");
    write_mosaic(tmp.path(), "EUC_MER_BGSUB-MOSAIC-NIR-YJ_TILE102018211.fits");
    write_mosaic(tmp.path(), "EUC_MER_BGSUB-MOSAIC-NIR-Y_FINAL-CAT.fits");
    auto wanted = write_mosaic(tmp.path(), "EUC_MER_BGSUB-MOSAIC-NIR-Y_TILE102018211.fits");

    archive::ProducerOptions opts;
    opts.archive_root = tmp.path();
    archive::FitsCutoutProducer producer(single_tile(), opts);

    REQUIRE(*producer.find_mosaic(kTile, "NISP", "NIR-Y", "BGSUB") == wanted);
    REQUIRE_FALSE(producer.find_mosaic(kTile, "NISP", "NIR-H", "BGSUB").has_value());
    REQUIRE_FALSE(producer.find_mosaic(kTile, "VIS", "VIS", "BGSUB").has_value());
    REQUIRE(archive::mosaic_prefix("RMS", "VIS") == "EUC_MER_MOSAIC-VIS-RMS");
    REQUIRE_THROWS_AS(archive::mosaic_prefix("CATALOG", "VIS"), ProductionError);
}

TEST_CASE("cutout_is_centred_and_carries_header") {
    sky_cutout_test::TempDir tmp("cutout");
    write_mosaic(tmp.path(), "EUC_MER_BGSUB-MOSAIC-NIR-Y_TILE102018211.fits");

    archive::ProducerOptions opts;
    opts.archive_root = tmp.path();
    archive::FitsCutoutProducer producer(single_tile(), opts);

    auto bytes = producer.produce(request_at(150.0, 2.0, 10));
    auto [img, hdr] = decode(tmp, bytes);

    // Target at pixel 49.5 -> window starts at 45
    REQUIRE(img.rows() == 10);
    REQUIRE(img.cols() == 10);
    REQUIRE(img(0, 0) == 45 * 100 + 45 + 1);
    REQUIRE(*hdr.get_string("OBJID") == "T1");
    REQUIRE(*hdr.get_string("TILEID") == kTile);
    REQUIRE(*hdr.get_string("BUNIT") == "MJy/sr");
    REQUIRE(*hdr.get_double("MAGZERO") == Catch::Approx(23.9));

    auto w = astrometry::wcs_from_header(hdr, 10, 10);
    REQUIRE(w.crpix1 == Catch::Approx(50.5 - 45));
}

TEST_CASE("cutout_near_edge_is_filled") {
    sky_cutout_test::TempDir tmp("cutout_edge");
    write_mosaic(tmp.path(), "EUC_MER_BGSUB-MOSAIC-NIR-Y_TILE102018211.fits");

    archive::ProducerOptions opts;
    opts.archive_root = tmp.path();
    opts.fill_value = -1.0f;
    archive::FitsCutoutProducer producer(single_tile(), opts);

    double ra = 0.0, dec = 0.0;
    mosaic_wcs().pixel_to_sky(2.5, 2.5, ra, dec);
    auto [img, hdr] = decode(tmp, producer.produce(request_at(ra, dec, 10)));

    // Window starts at -2 on both axes
    REQUIRE(img(1, 1) == -1.0f);
    REQUIRE(img(0, 5) == -1.0f);
    REQUIRE(img(2, 2) == 1.0f);
    REQUIRE(img(3, 2) == 101.0f);
}

TEST_CASE("cutout_outside_coverage_fails") {
    sky_cutout_test::TempDir tmp("cutout_outside");
    write_mosaic(tmp.path(), "EUC_MER_BGSUB-MOSAIC-NIR-Y_TILE102018211.fits");

    archive::ProducerOptions opts;
    opts.archive_root = tmp.path();
    archive::FitsCutoutProducer producer(single_tile(), opts);

    REQUIRE_THROWS_AS(producer.produce(request_at(40.0, -30.0, 10)), ProductionError);

    auto rms = request_at(150.0, 2.0, 10);
    rms.product_type = "RMS";
    REQUIRE_THROWS_AS(producer.produce(rms), ProductionError);
}

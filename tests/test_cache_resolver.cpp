#include "sky_cutout/cache/artifact_cache.hpp"
#include "sky_cutout/cache/cache_resolver.hpp"
#include "sky_cutout/config/configuration.hpp"
#include "sky_cutout/core/errors.hpp"

#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace sky_cutout;

namespace {

ArtifactRequest make_request(const std::string& key, const std::string& band,
                             const std::string& product, int size) {
    ArtifactRequest r;
    r.target_key = key;
    r.instrument = "NISP";
    r.band = band;
    r.product_type = product;
    r.size = size;
    return r;
}

} // namespace

TEST_CASE("cache_path_layout") {
    cache::ArtifactCache cache("/data/cache");
    auto req = make_request("T1", "NIR-Y", "BGSUB", 64);
    REQUIRE(cache::ArtifactCache::file_name_for(req) == "T1_BGSUB_64.fits");
    REQUIRE(cache.path_for(req) == fs::path("/data/cache/NIR-Y/T1_BGSUB_64.fits"));
}

TEST_CASE("sanitize_path_component_encodes_separators") {
    REQUIRE(cache::sanitize_path_component("a/b\\c") == "a%2Fb%5Cc");
    REQUIRE(cache::sanitize_path_component("NGC 1300") == "NGC%201300");
    REQUIRE(cache::sanitize_path_component("100%") == "100%25");
    REQUIRE(cache::sanitize_path_component("J1234+56_A") == "J1234+56_A");
    REQUIRE(cache::sanitize_path_component("..") == "%2E%2E");
    REQUIRE(cache::sanitize_path_component("") == "%");
}

TEST_CASE("distinct_keys_never_share_a_cache_path") {
    sky_cutout_test::TempDir tmp("cache_collide");
    cache::ArtifactCache cache(tmp.path());

    auto slash = make_request("J1234+56/A", "VIS", "BGSUB", 128);
    auto underscore = make_request("J1234+56_A", "VIS", "BGSUB", 128);
    REQUIRE(cache.path_for(slash) != cache.path_for(underscore));
    REQUIRE(cache.path_for(make_request("NGC 1300", "VIS", "BGSUB", 128)) !=
            cache.path_for(make_request("NGC_1300", "VIS", "BGSUB", 128)));
    REQUIRE(cache.path_for(make_request("A%2FB", "VIS", "BGSUB", 128)) !=
            cache.path_for(make_request("A/B", "VIS", "BGSUB", 128)));

    cache.store(slash, {7});
    REQUIRE(cache.lookup(slash).has_value());
    REQUIRE_FALSE(cache.lookup(underscore).has_value());
    REQUIRE(cache.path_for(slash).parent_path() == tmp.path() / "VIS");
}

TEST_CASE("store_then_lookup_hits") {
    sky_cutout_test::TempDir tmp("cache");
    cache::ArtifactCache cache(tmp.path());
    auto req = make_request("T1", "NIR-Y", "BGSUB", 32);

    REQUIRE_FALSE(cache.lookup(req).has_value());
    auto path = cache.store(req, {1, 2, 3});
    auto hit = cache.lookup(req);
    REQUIRE(hit.has_value());
    REQUIRE(hit->path == path);
    REQUIRE(fs::file_size(path) == 3);

    // Another size is another artifact
    REQUIRE_FALSE(cache.lookup(make_request("T1", "NIR-Y", "BGSUB", 64)).has_value());
}

TEST_CASE("store_into_unwritable_root_throws_cache_write_error") {
    sky_cutout_test::TempDir tmp("cache_blocked");
    sky_cutout_test::write_file(tmp / "blocker", "not a directory");
    cache::ArtifactCache cache(tmp / "blocker");
    REQUIRE_THROWS_AS(cache.store(make_request("T1", "VIS", "BGSUB", 8), {0}),
                      CacheWriteError);
}

TEST_CASE("resolve_splits_hits_and_misses_in_nesting_order") {
    sky_cutout_test::TempDir tmp("resolve");
    cache::ArtifactCache cache(tmp.path());

    std::vector<Target> targets = {{"T1", 10.0, 1.0, 1}, {"T2", 11.0, 1.0, 2}};
    std::vector<BandSelection> bands = {{"NISP", "NIR-Y"}, {"NISP", "NIR-J"}};

    auto cold = cache::resolve(cache, targets, bands, {"BGSUB"}, 16);
    REQUIRE(cold.total() == 4);
    REQUIRE(cold.hits.empty());
    REQUIRE(cold.misses[0].target_key == "T1");
    REQUIRE(cold.misses[1].band == "NIR-J");
    REQUIRE(cold.misses[2].target_key == "T2");

    cache.store(cold.misses[1], {42});
    auto warm = cache::resolve(cache, targets, bands, {"BGSUB"}, 16);
    REQUIRE(warm.hits.size() == 1);
    REQUIRE(warm.misses.size() == 3);
    REQUIRE(warm.hits[0].request.band == "NIR-J");
}

TEST_CASE("resolve_repeats_duplicate_targets") {
    sky_cutout_test::TempDir tmp("resolve_dup");
    cache::ArtifactCache cache(tmp.path());
    std::vector<Target> targets = {{"T1", 10.0, 1.0, 1}, {"T1", 10.0, 1.0, 2}};
    auto res = cache::resolve(cache, targets, {{"VIS", "VIS"}}, {"BGSUB", "RMS"}, 16);
    REQUIRE(res.misses.size() == 4);
}

TEST_CASE("expand_bands_selects_instrument_bands") {
    auto table = config::default_instrument_bands();

    auto all = cache::expand_bands({"NISP"}, {}, table);
    REQUIRE(all.size() == 3);
    const BandSelection first{"NISP", "NIR-Y"};
    REQUIRE(all[0] == first);

    auto one = cache::expand_bands({"NISP", "VIS"}, {"NIR-J", "VIS"}, table);
    REQUIRE(one.size() == 2);

    auto dedup = cache::expand_bands({"VIS", "VIS"}, {}, table);
    REQUIRE(dedup.size() == 1);
}

TEST_CASE("expand_bands_rejects_bad_selection") {
    auto table = config::default_instrument_bands();
    REQUIRE_THROWS_AS(cache::expand_bands({}, {}, table), ValidationError);
    REQUIRE_THROWS_AS(cache::expand_bands({"WFC3"}, {}, table), ValidationError);
    REQUIRE_THROWS_AS(cache::expand_bands({"NISP"}, {"VIS"}, table), ValidationError);
}

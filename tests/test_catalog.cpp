#include "sky_cutout/catalog/catalog_reader.hpp"
#include "sky_cutout/core/errors.hpp"
#include "sky_cutout/io/csv_table.hpp"

#include "test_support.hpp"

#include <fitsio.h>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace sky_cutout;

TEST_CASE("csv_line_splitting_handles_quotes") {
    auto f = io::split_csv_line(R"(a, "b,c" ,"say ""hi""",)");
    REQUIRE(f.size() == 4);
    REQUIRE(f[0] == "a");
    REQUIRE(f[1] == "b,c");
    REQUIRE(f[2] == "say \"hi\"");
    REQUIRE(f[3].empty());
}

TEST_CASE("csv_parse_skips_comments_blank_lines_and_bom") {
    auto t = io::parse_csv("\xEF\xBB\xBFID,RA,DEC\r\n# comment\n\nA,1.0,2.0\r\nB,3.0,4.0\n", "mem");
    REQUIRE(t.header == std::vector<std::string>{"ID", "RA", "DEC"});
    REQUIRE(t.rows.size() == 2);
    REQUIRE(t.line_numbers[0] == 4);
    REQUIRE(t.rows[1][0] == "B");
}

TEST_CASE("csv_parse_rejects_ragged_rows") {
    REQUIRE_THROWS_AS(io::parse_csv("ID,RA,DEC\nA,1.0\n", "mem"), ValidationError);
    REQUIRE_THROWS_AS(io::parse_csv("# only a comment\n", "mem"), ValidationError);
}

TEST_CASE("column_binding_prefers_exact_then_case_insensitive") {
    auto specs = catalog::default_column_specs();

    auto exact = catalog::bind_columns({"TARGET_RA", "TARGET_DEC", "OBJECT_ID"}, specs);
    REQUIRE(exact.ra == "TARGET_RA");
    REQUIRE(exact.dec == "TARGET_DEC");
    REQUIRE(*exact.id == "OBJECT_ID");

    auto folded = catalog::bind_columns({"ra_deg", "dec_deg"}, specs);
    REQUIRE(folded.ra == "ra_deg");
    REQUIRE(folded.dec == "dec_deg");
    REQUIRE_FALSE(folded.id.has_value());

    REQUIRE_THROWS_AS(catalog::bind_columns({"X", "DEC"}, specs), ValidationError);
}

TEST_CASE("column_override_is_used_alone") {
    auto specs = catalog::with_overrides(catalog::default_column_specs(),
                                         std::string("MY_RA"), std::nullopt, std::nullopt);
    auto b = catalog::bind_columns({"RA", "MY_RA", "DEC"}, specs);
    REQUIRE(b.ra == "MY_RA");
    REQUIRE(b.dec == "DEC");
    REQUIRE_THROWS_AS(catalog::bind_columns({"RA", "DEC"}, specs), ValidationError);
}

TEST_CASE("read_csv_catalog_rows_and_stats") {
    sky_cutout_test::TempDir tmp("catalog");
    const fs::path path = tmp / "targets.csv";
    sky_cutout_test::write_file(path,
                                "TARGETID,RA,DEC,MAG\n"
                                "T1,150.0,2.0,20.1\n"
                                ",152.0,-2.0,21.0\n"
                                "T3,151.0,0.0,19.5\n");

    auto cat = catalog::read_catalog(path, catalog::default_column_specs());
    REQUIRE(cat.rows.size() == 3);
    REQUIRE(*cat.rows[0].explicit_id == "T1");
    REQUIRE_FALSE(cat.rows[1].explicit_id.has_value());
    REQUIRE(cat.rows[2].index == 3);

    auto stats = catalog::summarize(cat);
    REQUIRE(stats.rows == 3);
    REQUIRE(stats.with_id == 2);
    REQUIRE(stats.ra_min == Catch::Approx(150.0));
    REQUIRE(stats.ra_max == Catch::Approx(152.0));
    REQUIRE(stats.dec_mean == Catch::Approx(0.0).margin(1e-12));

    auto j = catalog::to_json(stats);
    REQUIRE(j["rows"] == 3);
    REQUIRE(j["dec_range"][0] == -2.0);
}

TEST_CASE("csv_catalog_parses_under_comma_decimal_locale") {
    sky_cutout_test::TempDir tmp("catalog_locale");
    const fs::path path = tmp / "targets.csv";
    sky_cutout_test::write_file(path, "ID,RA,DEC\nT1,150.125,-2.5\n");

    sky_cutout_test::CommaDecimalLocale comma;
    auto cat = catalog::read_catalog(path, catalog::default_column_specs());
    REQUIRE(cat.rows.size() == 1);
    REQUIRE(cat.rows[0].ra == 150.125);
    REQUIRE(cat.rows[0].dec == -2.5);
}

TEST_CASE("invalid_catalogs_are_rejected_whole") {
    sky_cutout_test::TempDir tmp("catalog_bad");
    auto specs = catalog::default_column_specs();

    sky_cutout_test::write_file(tmp / "range.csv", "RA,DEC\n10,5\n10,95\n");
    REQUIRE_THROWS_AS(catalog::read_catalog(tmp / "range.csv", specs), ValidationError);

    sky_cutout_test::write_file(tmp / "text.csv", "RA,DEC\n10,abc\n");
    REQUIRE_THROWS_AS(catalog::read_catalog(tmp / "text.csv", specs), ValidationError);

    sky_cutout_test::write_file(tmp / "empty.csv", "RA,DEC\n");
    REQUIRE_THROWS_AS(catalog::read_catalog(tmp / "empty.csv", specs), ValidationError);

    sky_cutout_test::write_file(tmp / "many.csv", "RA,DEC\n1,1\n2,2\n3,3\n");
    REQUIRE_THROWS_AS(catalog::read_catalog(tmp / "many.csv", specs, 2), ValidationError);
    REQUIRE(catalog::read_catalog(tmp / "many.csv", specs, 3).rows.size() == 3);

    sky_cutout_test::write_file(tmp / "table.parquet", "x");
    REQUIRE_THROWS_AS(catalog::read_catalog(tmp / "table.parquet", specs), ValidationError);

    REQUIRE_THROWS_AS(catalog::read_catalog(tmp / "absent.csv", specs), ValidationError);
}

TEST_CASE("read_fits_table_catalog") {
    sky_cutout_test::TempDir tmp("catalog_fits");
    const fs::path path = tmp / "targets.fits";

    fitsfile* fptr = nullptr;
    int status = 0;
    fits_create_file(&fptr, path.string().c_str(), &status);

    char c_id[] = "TARGETID", c_ra[] = "RA", c_dec[] = "DEC";
    char f_k[] = "1K", f_d1[] = "1D", f_d2[] = "1D";
    char* ttype[] = {c_id, c_ra, c_dec};
    char* tform[] = {f_k, f_d1, f_d2};
    char extname[] = "CATALOG";
    fits_create_tbl(fptr, BINARY_TBL, 0, 3, ttype, tform, nullptr, extname, &status);

    LONGLONG ids[] = {1001, 1002};
    double ra[] = {150.0, 150.1};
    double dec[] = {2.0, -2.1};
    fits_write_col(fptr, TLONGLONG, 1, 1, 1, 2, ids, &status);
    fits_write_col(fptr, TDOUBLE, 2, 1, 1, 2, ra, &status);
    fits_write_col(fptr, TDOUBLE, 3, 1, 1, 2, dec, &status);
    fits_close_file(fptr, &status);
    REQUIRE(status == 0);

    auto cat = catalog::read_catalog(path, catalog::default_column_specs());
    REQUIRE(cat.rows.size() == 2);
    REQUIRE(*cat.binding.id == "TARGETID");
    REQUIRE(*cat.rows[0].explicit_id == "1001");
    REQUIRE(cat.rows[1].dec == Catch::Approx(-2.1));
}

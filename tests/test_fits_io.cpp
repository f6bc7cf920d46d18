#include "mono_cbp/core/errors.hpp"
#include "mono_cbp/io/fits_io.hpp"
#include "mono_cbp/io/light_curve_store.hpp"
#include "mono_cbp/masking/eclipse_masker.hpp"

#include <fitsio.h>

#include <cmath>
#include <filesystem>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

namespace fs = std::filesystem;

namespace {

struct TempDir {
    fs::path path;
    explicit TempDir(const std::string& name)
        : path(fs::temp_directory_path() / name) {
        fs::remove_all(path);
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

mono_cbp::LightCurve make_light_curve(const std::string& tic, int sector, int n) {
    mono_cbp::LightCurve lc;
    lc.tic_id = tic;
    lc.sector = sector;
    lc.time.resize(n);
    lc.flux.resize(n);
    lc.flux_err.resize(n);
    for (int i = 0; i < n; ++i) {
        lc.time[i] = 1500.0 + 0.02 * i;
        lc.flux[i] = 1.0 + 0.001 * std::sin(0.1 * i);
        lc.flux_err[i] = 5e-4;
    }
    return lc;
}

// Mission-style file: PDCSAP columns, float flux, an extra QUALITY column
// and a key in the table header.
void write_mission_light_curve(const fs::path& path, int n) {
    fitsfile* fptr = nullptr;
    int status = 0;
    const std::string create_path = "!" + path.string();
    fits_create_file(&fptr, create_path.c_str(), &status);
    fits_create_img(fptr, BYTE_IMG, 0, nullptr, &status);
    char tic[] = "555";
    fits_update_key(fptr, TSTRING, "TICID", tic, nullptr, &status);
    int sector = 9;
    fits_update_key(fptr, TINT, "SECTOR", &sector, nullptr, &status);

    char c_time[] = "TIME", c_flux[] = "PDCSAP_FLUX", c_err[] = "PDCSAP_FLUX_ERR", c_q[] = "QUALITY";
    char f_d[] = "1D", f_e[] = "1E", f_j[] = "1J";
    char extname[] = "LIGHTCURVE";
    char* ttype[] = {c_time, c_flux, c_err, c_q};
    char* tform[] = {f_d, f_e, f_e, f_j};
    fits_create_tbl(fptr, BINARY_TBL, 0, 4, ttype, tform, nullptr, extname, &status);
    int bjdref = 2457000;
    fits_update_key(fptr, TINT, "BJDREFI", &bjdref, nullptr, &status);

    std::vector<double> time(n);
    std::vector<float> flux(n, 1.0f), err(n, 1e-3f);
    std::vector<int> quality(n);
    for (int i = 0; i < n; ++i) {
        time[i] = 2000.0 + 0.5 * i;
        quality[i] = 10 * i;
    }
    fits_write_col(fptr, TDOUBLE, 1, 1, 1, n, time.data(), &status);
    fits_write_col(fptr, TFLOAT, 2, 1, 1, n, flux.data(), &status);
    fits_write_col(fptr, TFLOAT, 3, 1, 1, n, err.data(), &status);
    fits_write_col(fptr, TINT, 4, 1, 1, n, quality.data(), &status);
    fits_close_file(fptr, &status);
    REQUIRE(status == 0);
}

} // namespace

TEST_CASE("parse_light_curve_name_recovers_tic_and_sector") {
    auto parsed = mono_cbp::io::parse_light_curve_name("data/TIC_260128333_S14.fits");
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->first == "260128333");
    REQUIRE(parsed->second == 14);

    auto padded = mono_cbp::io::parse_light_curve_name("tic0000123-s0007.fits");
    REQUIRE(padded.has_value());
    REQUIRE(padded->first == "123");
    REQUIRE(padded->second == 7);

    REQUIRE_FALSE(mono_cbp::io::parse_light_curve_name("lightcurve.fits").has_value());
}

TEST_CASE("light_curve_roundtrip_preserves_samples_and_flags") {
    TempDir dir("mono_cbp_test_fits_lc");
    const fs::path path = dir.path / "TIC_42_S3.fits";

    auto lc = make_light_curve("42", 3, 64);
    lc.flux[10] = std::nan("");
    lc.flux_err[10] = std::nan("");
    lc.eclipses_masked = true;

    mono_cbp::io::FitsHeader extra;
    extra.set("OBJECT", std::string("KOI-126"));
    mono_cbp::io::write_light_curve(path, lc, extra);

    auto [back, header] = mono_cbp::io::read_light_curve(path);
    REQUIRE(back.tic_id == "42");
    REQUIRE(back.sector == 3);
    REQUIRE(back.eclipses_masked);
    REQUIRE(back.size() == 64);
    REQUIRE(back.time[63] == Catch::Approx(lc.time[63]));
    REQUIRE(back.flux[5] == Catch::Approx(lc.flux[5]));
    REQUIRE(std::isnan(back.flux[10]));
    REQUIRE(std::isnan(back.flux_err[10]));
    REQUIRE(header.get_string("OBJECT").value_or("") == "KOI-126");
}

TEST_CASE("empty_light_curve_roundtrip") {
    TempDir dir("mono_cbp_test_fits_empty");
    const fs::path path = dir.path / "TIC_7_S1.fits";

    auto lc = make_light_curve("7", 1, 0);
    mono_cbp::io::write_light_curve(path, lc);

    auto back = mono_cbp::io::read_light_curve(path).first;
    REQUIRE(back.size() == 0);
    REQUIRE_FALSE(back.eclipses_masked);
}

TEST_CASE("fits_store_save_keeps_existing_header_keys") {
    TempDir dir("mono_cbp_test_fits_store");
    const fs::path path = dir.path / "TIC_99_S2.fits";

    mono_cbp::io::FitsHeader extra;
    extra.set("TELESCOP", std::string("TESS"));
    mono_cbp::io::write_light_curve(path, make_light_curve("99", 2, 16), extra);

    mono_cbp::io::FitsLightCurveStore store(dir.path);
    auto files = store.list();
    REQUIRE(files.size() == 1);

    auto lc = store.load(files[0]);
    lc.eclipses_masked = true;
    store.save(files[0], lc, {});

    auto header = mono_cbp::io::read_fits_header(path);
    REQUIRE(header.get_string("TELESCOP").value_or("") == "TESS");
    REQUIRE(header.get_bool("ECLMASK").value_or(false));
}

TEST_CASE("fits_store_missing_directory_is_io_error") {
    mono_cbp::io::FitsLightCurveStore store("/nonexistent/mono_cbp_data");
    REQUIRE_THROWS_AS(store.list(), mono_cbp::IOError);
}

TEST_CASE("event_snippets_load_sorted_from_directory") {
    TempDir dir("mono_cbp_test_fits_snippets");

    for (int k = 0; k < 3; ++k) {
        mono_cbp::EventSnippet s;
        s.tic_id = "1001";
        s.sector = 5;
        s.event_time = 1600.0 + k;
        s.event_width = 0.25;
        auto lc = make_light_curve("1001", 5, 20);
        s.time = lc.time;
        s.flux = lc.flux;
        s.flux_err = lc.flux_err;
        mono_cbp::io::write_event_snippet(dir.path / ("TIC_1001_S5_event" + std::to_string(2 - k) + ".fits"), s);
    }

    auto snippets = mono_cbp::io::load_event_snippets(dir.path);
    REQUIRE(snippets.size() == 3);
    // event0 was written last, with the latest event time
    REQUIRE(snippets[0].event_time == Catch::Approx(1602.0));
    REQUIRE(snippets[2].event_time == Catch::Approx(1600.0));
    REQUIRE(snippets[1].tic_id == "1001");
    REQUIRE(snippets[1].sector == 5);
    REQUIRE(snippets[1].event_width == Catch::Approx(0.25));
    REQUIRE(snippets[1].time.size() == 20);
}

TEST_CASE("event_snippets_missing_directory_yields_none") {
    REQUIRE(mono_cbp::io::load_event_snippets("/nonexistent/mono_cbp_snippets").empty());
}

TEST_CASE("read_light_curve_missing_file_is_fits_error") {
    REQUIRE_THROWS_AS(mono_cbp::io::read_light_curve("/nonexistent/TIC_1_S1.fits"),
                      mono_cbp::FitsError);
}

TEST_CASE("fits_store_save_updates_mission_file_in_place") {
    TempDir dir("mono_cbp_test_fits_mission");
    const fs::path path = dir.path / "TIC_555_S9.fits";
    write_mission_light_curve(path, 10);

    mono_cbp::io::FitsLightCurveStore store(dir.path);
    auto lc = store.load(path);
    REQUIRE(lc.tic_id == "555");
    REQUIRE(lc.size() == 10);

    mono_cbp::MaskXb mask = mono_cbp::MaskXb::Constant(10, false);
    mask[2] = true;
    mask[3] = true;
    lc.flux[5] = std::nan("");
    REQUIRE(mono_cbp::masking::apply_eclipse_mask(lc, mask, "remove") == 2);
    store.save(path, lc, {2, 3});

    auto [back, header] = mono_cbp::io::read_light_curve(path);
    REQUIRE(back.size() == 8);
    REQUIRE(back.eclipses_masked);
    REQUIRE(back.time[2] == Catch::Approx(2002.0));
    REQUIRE(std::isnan(back.flux[3]));
    REQUIRE(header.get_int("SECTOR").value_or(0) == 9);

    fitsfile* fptr = nullptr;
    int status = 0;
    fits_open_file(&fptr, path.string().c_str(), READONLY, &status);
    int hdutype = 0;
    fits_movabs_hdu(fptr, 2, &hdutype, &status);

    int ncols = 0;
    long nrows = 0;
    fits_get_num_cols(fptr, &ncols, &status);
    fits_get_num_rows(fptr, &nrows, &status);
    REQUIRE(ncols == 4);
    REQUIRE(nrows == 8);

    int colnum = 0;
    char flux_name[] = "PDCSAP_FLUX";
    fits_get_colnum(fptr, CASESEN, flux_name, &colnum, &status);
    REQUIRE(colnum == 2);

    // Rows 2 and 3 are gone from every column.
    std::vector<int> quality(8);
    int anynul = 0;
    fits_read_col(fptr, TINT, 4, 1, 1, 8, nullptr, quality.data(), &anynul, &status);
    REQUIRE(quality[1] == 10);
    REQUIRE(quality[2] == 40);

    int bjdref = 0;
    fits_read_key(fptr, TINT, "BJDREFI", &bjdref, nullptr, &status);
    REQUIRE(bjdref == 2457000);
    fits_close_file(fptr, &status);
    REQUIRE(status == 0);

    for (const auto& entry : fs::directory_iterator(dir.path)) {
        REQUIRE(entry.path().extension() != ".tmp");
    }
}

TEST_CASE("failed_update_leaves_original_file") {
    TempDir dir("mono_cbp_test_fits_failed_update");
    const fs::path path = dir.path / "TIC_555_S9.fits";
    write_mission_light_curve(path, 10);

    mono_cbp::io::FitsLightCurveStore store(dir.path);
    auto lc = store.load(path);
    lc.eclipses_masked = true;
    // Rows on disk no longer match the light curve after this removal list.
    REQUIRE_THROWS_AS(store.save(path, lc, {4}), mono_cbp::FitsError);

    auto back = mono_cbp::io::read_light_curve(path).first;
    REQUIRE(back.size() == 10);
    REQUIRE_FALSE(back.eclipses_masked);
    for (const auto& entry : fs::directory_iterator(dir.path)) {
        REQUIRE(entry.path().extension() != ".tmp");
    }
}

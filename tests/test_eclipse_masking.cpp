#include "mono_cbp/core/errors.hpp"
#include "mono_cbp/core/events.hpp"
#include "mono_cbp/core/phase.hpp"
#include "mono_cbp/masking/eclipse_masker.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <mutex>
#include <sstream>

#include <catch2/catch_test_macros.hpp>

namespace {

// Light curves kept in memory, keyed by path.
class MemoryLightCurveStore : public mono_cbp::io::LightCurveStore {
public:
    mono_cbp::fs::path root() const override { return "/memory"; }

    std::vector<mono_cbp::fs::path> list() const override {
        std::vector<mono_cbp::fs::path> out;
        for (const auto& [path, lc] : curves) {
            out.push_back(path);
        }
        return out;
    }

    mono_cbp::LightCurve load(const mono_cbp::fs::path& path) const override {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = curves.find(path);
        if (it == curves.end()) {
            throw mono_cbp::IOError("no such light curve: " + path.string());
        }
        return it->second;
    }

    void save(const mono_cbp::fs::path& path, const mono_cbp::LightCurve& lc,
              const std::vector<Eigen::Index>& removed_rows) override {
        std::lock_guard<std::mutex> lock(mutex);
        curves[path] = lc;
        removed[path] = removed_rows;
        ++saves;
    }

    std::map<mono_cbp::fs::path, mono_cbp::LightCurve> curves;
    std::map<mono_cbp::fs::path, std::vector<Eigen::Index>> removed;
    int saves = 0;
    mutable std::mutex mutex;
};

// Period 10 d, epoch 0, one sample per 0.1 d -> phase step 0.01.
mono_cbp::LightCurve make_light_curve(const std::string& tic, int n = 100) {
    mono_cbp::LightCurve lc;
    lc.tic_id = tic;
    lc.sector = 1;
    lc.time.resize(n);
    lc.flux = mono_cbp::VectorXd::Ones(n);
    lc.flux_err = mono_cbp::VectorXd::Constant(n, 1e-3);
    for (int i = 0; i < n; ++i) {
        lc.time[i] = 0.1 * i + 0.005;
    }
    return lc;
}

mono_cbp::CatalogueEntry make_entry(const std::string& tic) {
    mono_cbp::CatalogueEntry e;
    e.tic_id = tic;
    e.period = 10.0;
    e.epoch = 0.0;
    e.primary = {0.0, 0.04};   // wraps: [0.98, 1) and [0, 0.02]
    e.secondary = {0.5, 0.04}; // [0.48, 0.52]
    return e;
}

std::shared_ptr<mono_cbp::Catalogue> make_catalogue(std::vector<mono_cbp::CatalogueEntry> entries) {
    auto cat = std::make_shared<mono_cbp::Catalogue>();
    cat->entries = std::move(entries);
    return cat;
}

} // namespace

TEST_CASE("combined_mask_is_union_of_primary_and_secondary") {
    auto lc = make_light_curve("1");
    auto entry = make_entry("1");
    auto phases = mono_cbp::core::to_phase(lc.time, entry.period, entry.epoch);
    auto mask = mono_cbp::masking::combined_eclipse_mask(phases, entry);

    // phases 0.0005 + 0.01 i: primary {0,1,98,99}, secondary {48..51}
    REQUIRE(mask.count() == 8);
    REQUIRE(mask[0]);
    REQUIRE(mask[99]);
    REQUIRE(mask[50]);
    REQUIRE_FALSE(mask[25]);
}

TEST_CASE("combined_mask_absent_secondary_masks_primary_only") {
    auto lc = make_light_curve("1");
    auto entry = make_entry("1");
    entry.secondary = mono_cbp::EclipseGeometry{};
    auto phases = mono_cbp::core::to_phase(lc.time, entry.period, entry.epoch);

    REQUIRE(mono_cbp::masking::combined_eclipse_mask(phases, entry).count() == 4);
}

TEST_CASE("combined_mask_includes_alternative_fits") {
    auto lc = make_light_curve("1");
    auto entry = make_entry("1");
    entry.primary_alt = mono_cbp::EclipseGeometry{0.25, 0.02};
    entry.secondary_alt = mono_cbp::EclipseGeometry{std::nan(""), 0.02};
    auto phases = mono_cbp::core::to_phase(lc.time, entry.period, entry.epoch);

    auto mask = mono_cbp::masking::combined_eclipse_mask(phases, entry);
    REQUIRE(mask.count() == 10);
    REQUIRE(mask[24]);
    REQUIRE(mask[25]);
}

TEST_CASE("apply_mask_nan_mode_keeps_length") {
    auto lc = make_light_curve("1", 10);
    mono_cbp::MaskXb mask = mono_cbp::MaskXb::Constant(10, false);
    mask[2] = true;
    mask[3] = true;

    REQUIRE(mono_cbp::masking::apply_eclipse_mask(lc, mask, "nan") == 2);
    REQUIRE(lc.size() == 10);
    REQUIRE(std::isnan(lc.flux[2]));
    REQUIRE(std::isnan(lc.flux_err[3]));
    REQUIRE_FALSE(std::isnan(lc.flux[4]));
    REQUIRE_FALSE(std::isnan(lc.time[2]));
    REQUIRE(lc.eclipses_masked);
}

TEST_CASE("apply_mask_remove_mode_drops_samples") {
    auto lc = make_light_curve("1", 10);
    const double t4 = lc.time[4];
    mono_cbp::MaskXb mask = mono_cbp::MaskXb::Constant(10, false);
    mask[0] = true;
    mask[1] = true;
    mask[2] = true;

    REQUIRE(mono_cbp::masking::apply_eclipse_mask(lc, mask, "remove") == 3);
    REQUIRE(lc.size() == 7);
    REQUIRE(lc.flux.size() == 7);
    REQUIRE(lc.time[1] == t4);
}

TEST_CASE("apply_mask_rejects_length_mismatch") {
    auto lc = make_light_curve("1", 10);
    mono_cbp::MaskXb mask = mono_cbp::MaskXb::Constant(5, false);
    REQUIRE_THROWS_AS(mono_cbp::masking::apply_eclipse_mask(lc, mask, "nan"),
                      mono_cbp::ValidationError);
}

TEST_CASE("masker_masks_matched_and_warns_on_unmatched") {
    auto store = std::make_shared<MemoryLightCurveStore>();
    store->curves["/memory/a.fits"] = make_light_curve("111");
    store->curves["/memory/b.fits"] = make_light_curve("222");

    std::ostringstream out;
    mono_cbp::core::EventEmitter events(out);
    mono_cbp::masking::CatalogueEclipseMasker masker(
        make_catalogue({make_entry("111")}), store, {}, events, "run");

    auto summary = masker.mask_all({});

    REQUIRE(summary.files == 2);
    REQUIRE(summary.masked == 1);
    REQUIRE(summary.unmatched == 1);
    REQUIRE(summary.masked_samples == 8);
    REQUIRE(store->saves == 1);
    REQUIRE(store->curves["/memory/a.fits"].eclipses_masked);
    REQUIRE_FALSE(store->curves["/memory/b.fits"].eclipses_masked);
    REQUIRE(store->removed["/memory/a.fits"].empty());
    REQUIRE(out.str().find("\"warning\"") != std::string::npos);
    REQUIRE(out.str().find("222") != std::string::npos);
}

TEST_CASE("masker_skips_flagged_files_unless_forced") {
    auto store = std::make_shared<MemoryLightCurveStore>();
    auto lc = make_light_curve("111");
    lc.eclipses_masked = true;
    store->curves["/memory/a.fits"] = lc;

    std::ostringstream out;
    mono_cbp::core::EventEmitter events(out);
    mono_cbp::masking::CatalogueEclipseMasker masker(
        make_catalogue({make_entry("111")}), store, {}, events, "run");

    auto skipped = masker.mask_all({});
    REQUIRE(skipped.skipped == 1);
    REQUIRE(skipped.masked == 0);
    REQUIRE(store->saves == 0);

    mono_cbp::masking::MaskOptions force;
    force.force = true;
    auto forced = masker.mask_all(force);
    REQUIRE(forced.masked == 1);
    REQUIRE(store->saves == 1);
}

TEST_CASE("masker_remove_mode_with_parallel_workers") {
    auto store = std::make_shared<MemoryLightCurveStore>();
    std::vector<mono_cbp::CatalogueEntry> entries;
    for (int k = 0; k < 12; ++k) {
        const std::string tic = std::to_string(1000 + k);
        store->curves["/memory/" + tic + ".fits"] = make_light_curve(tic);
        entries.push_back(make_entry(tic));
    }

    mono_cbp::config::EclipseMaskingConfig cfg;
    cfg.mask_mode = "remove";
    cfg.parallel_workers = 4;

    std::ostringstream out;
    mono_cbp::core::EventEmitter events(out);
    mono_cbp::masking::CatalogueEclipseMasker masker(
        make_catalogue(entries), store, cfg, events, "run");

    auto summary = masker.mask_all({});
    REQUIRE(summary.masked == 12);
    REQUIRE(summary.masked_samples == 12 * 8);
    for (const auto& [path, lc] : store->curves) {
        REQUIRE(lc.size() == 92);
        REQUIRE(lc.eclipses_masked);

        // The store is told which stored rows were dropped.
        const auto& rows = store->removed.at(path);
        REQUIRE(rows.size() == 8);
        REQUIRE(std::is_sorted(rows.begin(), rows.end()));
        REQUIRE(rows.front() == 0);
        REQUIRE(std::find(rows.begin(), rows.end(), 50) != rows.end());
    }
}

TEST_CASE("masker_worker_failure_is_reraised") {
    auto store = std::make_shared<MemoryLightCurveStore>();
    auto bad = make_light_curve("111");
    bad.flux.resize(3); // length mismatch with time
    store->curves["/memory/a.fits"] = bad;

    std::ostringstream out;
    mono_cbp::core::EventEmitter events(out);
    mono_cbp::masking::CatalogueEclipseMasker masker(
        make_catalogue({make_entry("111")}), store, {}, events, "run");

    REQUIRE_THROWS_AS(masker.mask_all({}), mono_cbp::PipelineError);
}

#include "mono_cbp/masking/eclipse_masker.hpp"
#include "mono_cbp/core/eclipses.hpp"
#include "mono_cbp/core/errors.hpp"
#include "mono_cbp/core/phase.hpp"

#include <algorithm>
#include <atomic>
#include <limits>
#include <mutex>
#include <thread>
#include <vector>

namespace mono_cbp::masking {

MaskXb combined_eclipse_mask(const VectorXd& phases, const CatalogueEntry& entry) {
    MaskXb mask = core::eclipse_mask(phases, entry.primary) ||
                  core::eclipse_mask(phases, entry.secondary);
    if (entry.primary_alt) {
        mask = mask || core::eclipse_mask(phases, *entry.primary_alt);
    }
    if (entry.secondary_alt) {
        mask = mask || core::eclipse_mask(phases, *entry.secondary_alt);
    }
    return mask;
}

size_t apply_eclipse_mask(LightCurve& lc, const MaskXb& mask, const std::string& mode) {
    if (lc.flux.size() != lc.size() || lc.flux_err.size() != lc.size()) {
        throw ValidationError("TIME/FLUX/FLUX_ERR length mismatch in light curve " + lc.tic_id);
    }
    if (mask.size() != lc.size()) {
        throw ValidationError("Eclipse mask length does not match light curve " + lc.tic_id);
    }
    const size_t n_masked = static_cast<size_t>(mask.count());

    if (mode == "nan") {
        const double nan = std::numeric_limits<double>::quiet_NaN();
        for (Eigen::Index i = 0; i < mask.size(); ++i) {
            if (mask[i]) {
                lc.flux[i] = nan;
                lc.flux_err[i] = nan;
            }
        }
    } else if (mode == "remove") {
        const Eigen::Index keep = lc.size() - static_cast<Eigen::Index>(n_masked);
        VectorXd time(keep), flux(keep), flux_err(keep);
        Eigen::Index j = 0;
        for (Eigen::Index i = 0; i < mask.size(); ++i) {
            if (!mask[i]) {
                time[j] = lc.time[i];
                flux[j] = lc.flux[i];
                flux_err[j] = lc.flux_err[i];
                ++j;
            }
        }
        lc.time = std::move(time);
        lc.flux = std::move(flux);
        lc.flux_err = std::move(flux_err);
    } else {
        throw ValidationError("Unknown mask mode: " + mode);
    }

    lc.eclipses_masked = true;
    return n_masked;
}

CatalogueEclipseMasker::CatalogueEclipseMasker(std::shared_ptr<const Catalogue> catalogue,
                                               std::shared_ptr<io::LightCurveStore> store,
                                               config::EclipseMaskingConfig cfg,
                                               core::EventEmitter& events,
                                               std::string run_id)
    : catalogue_(std::move(catalogue)),
      store_(std::move(store)),
      cfg_(std::move(cfg)),
      events_(events),
      run_id_(std::move(run_id)) {
    if (!catalogue_) {
        throw ConfigError("Eclipse masker requires a catalogue");
    }
    if (!store_) {
        throw ConfigError("Eclipse masker requires a light-curve store");
    }
}

CatalogueEclipseMasker::Outcome CatalogueEclipseMasker::mask_file(const fs::path& path,
                                                                  bool force,
                                                                  size_t& masked_samples) {
    LightCurve lc = store_->load(path);

    const CatalogueEntry* entry = catalogue_->find(lc.tic_id);
    if (!entry) {
        events_.warning(run_id_, "TIC " + lc.tic_id + " not in catalogue, leaving " +
                                     path.filename().string() + " unmasked");
        return Outcome::UNMATCHED;
    }

    if (lc.eclipses_masked && !force) {
        return Outcome::SKIPPED;
    }

    const VectorXd phases = core::to_phase(lc.time, entry->period, entry->epoch);
    const MaskXb mask = combined_eclipse_mask(phases, *entry);
    std::vector<Eigen::Index> removed_rows;
    if (cfg_.mask_mode == "remove") {
        for (Eigen::Index i = 0; i < mask.size(); ++i) {
            if (mask[i]) removed_rows.push_back(i);
        }
    }
    masked_samples = apply_eclipse_mask(lc, mask, cfg_.mask_mode);

    store_->save(path, lc, removed_rows);
    return Outcome::MASKED;
}

MaskingSummary CatalogueEclipseMasker::mask_all(const MaskOptions& options) {
    const bool force = options.force.value_or(cfg_.force);
    const std::vector<fs::path> files = store_->list();

    MaskingSummary summary;
    summary.files = files.size();
    if (files.empty()) {
        events_.warning(run_id_, "No light curves matching '" + cfg_.file_pattern + "' in " +
                                     store_->root().string());
        return summary;
    }

    const int n_workers = std::max(
        1, std::min(cfg_.parallel_workers, static_cast<int>(files.size())));

    std::atomic<size_t> next{0};
    std::atomic<size_t> done{0};
    std::atomic<size_t> n_masked{0};
    std::atomic<size_t> n_skipped{0};
    std::atomic<size_t> n_unmatched{0};
    std::atomic<size_t> n_samples{0};
    std::atomic<bool> failed{false};
    std::mutex error_mutex;
    std::string first_error;

    auto worker = [&]() {
        while (true) {
            const size_t fi = next.fetch_add(1);
            if (fi >= files.size() || failed.load(std::memory_order_relaxed)) {
                break;
            }
            try {
                size_t samples = 0;
                switch (mask_file(files[fi], force, samples)) {
                    case Outcome::MASKED:
                        n_masked.fetch_add(1);
                        n_samples.fetch_add(samples);
                        break;
                    case Outcome::SKIPPED:
                        n_skipped.fetch_add(1);
                        break;
                    case Outcome::UNMATCHED:
                        n_unmatched.fetch_add(1);
                        break;
                }
            } catch (const std::exception& e) {
                failed.store(true, std::memory_order_relaxed);
                std::lock_guard<std::mutex> lock(error_mutex);
                if (first_error.empty()) {
                    first_error = files[fi].filename().string() + ": " + e.what();
                }
            } catch (...) {
                failed.store(true, std::memory_order_relaxed);
                std::lock_guard<std::mutex> lock(error_mutex);
                if (first_error.empty()) {
                    first_error = files[fi].filename().string() + ": unknown_error";
                }
            }

            const size_t d = done.fetch_add(1) + 1;
            events_.stage_progress(run_id_, Stage::ECLIPSE_MASKING, static_cast<int>(d),
                                   static_cast<int>(files.size()),
                                   "mask " + files[fi].filename().string());
        }
    };

    if (n_workers > 1) {
        std::vector<std::thread> workers;
        workers.reserve(static_cast<size_t>(n_workers));
        for (int w = 0; w < n_workers; ++w) {
            workers.emplace_back(worker);
        }
        for (auto& t : workers) {
            if (t.joinable()) {
                t.join();
            }
        }
    } else {
        worker();
    }

    if (failed.load(std::memory_order_relaxed)) {
        throw PipelineError("Eclipse masking failed: " +
                            (first_error.empty() ? std::string("unknown_error") : first_error));
    }

    summary.masked = n_masked.load();
    summary.skipped = n_skipped.load();
    summary.unmatched = n_unmatched.load();
    summary.masked_samples = n_samples.load();
    return summary;
}

} // namespace mono_cbp::masking

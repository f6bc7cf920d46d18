#pragma once

#include "mono_cbp/config/configuration.hpp"
#include "mono_cbp/core/events.hpp"
#include "mono_cbp/core/types.hpp"
#include "mono_cbp/io/light_curve_store.hpp"

#include <memory>
#include <optional>
#include <string>

namespace mono_cbp::masking {

struct MaskOptions {
    std::optional<bool> force; // unset: eclipse_masking.force
};

struct MaskingSummary {
    size_t files = 0;
    size_t masked = 0;
    size_t skipped = 0;   // already flagged as masked
    size_t unmatched = 0; // no catalogue entry
    size_t masked_samples = 0;
};

class EclipseMasker {
public:
    virtual ~EclipseMasker() = default;

    // Masks every light curve in the data location, rewriting files in place.
    virtual MaskingSummary mask_all(const MaskOptions& options) = 0;
};

// Union of the primary and secondary windows, plus the alternative fits when present.
MaskXb combined_eclipse_mask(const VectorXd& phases, const CatalogueEntry& entry);

/**
 * Applies mask to lc according to mode ("nan" or "remove") and flags it as
 * masked. Returns the number of masked samples.
 */
size_t apply_eclipse_mask(LightCurve& lc, const MaskXb& mask, const std::string& mode);

class CatalogueEclipseMasker : public EclipseMasker {
public:
    CatalogueEclipseMasker(std::shared_ptr<const Catalogue> catalogue,
                           std::shared_ptr<io::LightCurveStore> store,
                           config::EclipseMaskingConfig cfg,
                           core::EventEmitter& events,
                           std::string run_id);

    MaskingSummary mask_all(const MaskOptions& options) override;

private:
    enum class Outcome { MASKED, SKIPPED, UNMATCHED };

    Outcome mask_file(const fs::path& path, bool force, size_t& masked_samples);

    std::shared_ptr<const Catalogue> catalogue_;
    std::shared_ptr<io::LightCurveStore> store_;
    config::EclipseMaskingConfig cfg_;
    core::EventEmitter& events_;
    std::string run_id_;
};

} // namespace mono_cbp::masking

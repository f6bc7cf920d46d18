#pragma once

#include "mono_cbp/config/configuration.hpp"
#include "mono_cbp/core/events.hpp"
#include "mono_cbp/core/types.hpp"
#include "mono_cbp/masking/eclipse_masker.hpp"
#include "mono_cbp/pipeline/options.hpp"
#include "mono_cbp/pipeline/snippet_resolution.hpp"

#include <memory>
#include <optional>
#include <string>
#include <yaml-cpp/yaml.h>

namespace mono_cbp::pipeline {

// Searches masked light curves for transit-like dips.
class TransitFinder {
public:
    virtual ~TransitFinder() = default;

    virtual TransitSearchResult process_directory(const fs::path& data_dir,
                                                  const fs::path& output_file,
                                                  const std::optional<fs::path>& plot_dir) = 0;

    // Result of the most recent search, nullptr before the first one.
    virtual const TransitSearchResult* last_result() const = 0;
};

// Classifies candidate events against competing astrophysical models.
class ModelComparator {
public:
    virtual ~ModelComparator() = default;

    virtual VettingResult compare_events(const SnippetSource& source,
                                         const fs::path& output_file) = 0;
};

// Injects synthetic transits and measures how many are recovered.
class TransitInjector {
public:
    virtual ~TransitInjector() = default;

    virtual InjectionResult run_injection_retrieval(const fs::path& data_dir, int n_injections,
                                                    const fs::path& output_file) = 0;
};

// Everything a collaborator may need at construction time. Valid only during the factory call.
struct StageContext {
    std::shared_ptr<const Catalogue> catalogue;
    const config::Config& config;
    const YAML::Node& document; // merged configuration, including keys collaborators own
    const PipelineOptions& options;
    core::EventEmitter& events;
    std::string run_id;
};

/**
 * Builds the stage collaborators for a pipeline. The transit search,
 * vetting and injection implementations are supplied by subclasses; the
 * masker defaults to CatalogueEclipseMasker over the FITS files in the
 * data directory.
 */
class StageFactory {
public:
    virtual ~StageFactory() = default;

    virtual std::unique_ptr<masking::EclipseMasker> make_eclipse_masker(const StageContext& ctx);
    virtual std::unique_ptr<TransitFinder> make_transit_finder(const StageContext& ctx) = 0;
    virtual std::unique_ptr<ModelComparator> make_model_comparator(const StageContext& ctx) = 0;

    // Only called when a transit-models path is configured.
    virtual std::unique_ptr<TransitInjector> make_transit_injector(const StageContext& ctx,
                                                                   const fs::path& transit_models_path) = 0;
};

} // namespace mono_cbp::pipeline

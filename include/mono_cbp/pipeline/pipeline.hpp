#pragma once

#include "mono_cbp/config/configuration.hpp"
#include "mono_cbp/core/events.hpp"
#include "mono_cbp/core/types.hpp"
#include "mono_cbp/io/catalogue.hpp"
#include "mono_cbp/masking/eclipse_masker.hpp"
#include "mono_cbp/pipeline/options.hpp"
#include "mono_cbp/pipeline/stages.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace mono_cbp::pipeline {

// Stage outputs of one pipeline instance. Masking produces no table.
struct ResultsRegistry {
    std::optional<TransitSearchResult> transit_finding;
    std::optional<VettingResult> vetting;
    std::optional<InjectionResult> injection_retrieval;

    bool contains(Stage stage) const;
    std::vector<std::string> keys() const; // stage_registry_key order
    size_t size() const;
};

/**
 * Circumbinary transit pipeline: eclipse masking, transit search, vetting
 * and optional injection-retrieval over one data directory.
 *
 * Each stage operation can be invoked on its own and re-invoked; results
 * accumulate in the registry until the pipeline is destroyed. Not thread safe.
 */
class Pipeline {
public:
    Pipeline(std::shared_ptr<const Catalogue> catalogue,
             PipelineOptions options,
             std::shared_ptr<StageFactory> factory,
             core::EventEmitter& events,
             const YAML::Node& user_config = YAML::Node());

    static Pipeline from_source(const io::CatalogueLoader& loader,
                                const fs::path& catalogue_path,
                                CatalogueFormat format,
                                PipelineOptions options,
                                std::shared_ptr<StageFactory> factory,
                                core::EventEmitter& events,
                                const YAML::Node& user_config = YAML::Node());

    // Precondition for find_transits; run() always masks first.
    masking::MaskingSummary mask_eclipses(const masking::MaskOptions& options = {});

    const TransitSearchResult& find_transits(const FindTransitsOptions& options = {});
    // Without snippets or a snippet dir, reads <output_dir>/<model_comparison.event_snippets_dir>.
    const VettingResult& vet_candidates(const VetOptions& options = {});

    // Throws ConfigError if no transit models were supplied at construction.
    const InjectionResult& run_injection_retrieval(const InjectionOptions& options = {});

    /**
     * Masks, then searches if find_transits, vets if vet_candidates and
     * find_transits, and runs injection-retrieval if requested and
     * available. Unavailable injection-retrieval is a warning, not an error.
     */
    const ResultsRegistry& run(const RunOptions& options = {});

    bool injection_available() const { return transit_injector_ != nullptr; }

    PipelineState state() const { return state_; }
    const ResultsRegistry& results() const { return results_; }
    const std::optional<masking::MaskingSummary>& last_masking_summary() const {
        return masking_summary_;
    }
    const config::Config& config() const { return cfg_; }
    const YAML::Node& merged_config() const { return document_; }
    const PipelineOptions& options() const { return options_; }
    const std::string& run_id() const { return run_id_; }
    const Catalogue& catalogue() const { return *catalogue_; }

private:
    template <typename Fn>
    auto run_stage(Stage stage, Fn&& fn) -> decltype(fn());

    fs::path resolve_output_dir(const std::optional<fs::path>& dir, const fs::path& fallback);

    std::shared_ptr<const Catalogue> catalogue_;
    PipelineOptions options_;
    std::shared_ptr<StageFactory> factory_;
    core::EventEmitter& events_;
    std::string run_id_;

    YAML::Node document_;
    config::Config cfg_;

    std::unique_ptr<masking::EclipseMasker> eclipse_masker_;
    std::unique_ptr<TransitFinder> transit_finder_;
    std::unique_ptr<ModelComparator> model_comparator_;
    std::unique_ptr<TransitInjector> transit_injector_;

    PipelineState state_ = PipelineState::INITIALIZED;
    ResultsRegistry results_;
    std::optional<masking::MaskingSummary> masking_summary_;
};

} // namespace mono_cbp::pipeline

#include "mono_cbp/pipeline/pipeline.hpp"
#include "mono_cbp/core/errors.hpp"
#include "mono_cbp/core/utils.hpp"

namespace mono_cbp::pipeline {

bool ResultsRegistry::contains(Stage stage) const {
    switch (stage) {
        case Stage::TRANSIT_FINDING: return transit_finding.has_value();
        case Stage::VETTING: return vetting.has_value();
        case Stage::INJECTION_RETRIEVAL: return injection_retrieval.has_value();
        default: return false;
    }
}

std::vector<std::string> ResultsRegistry::keys() const {
    std::vector<std::string> out;
    for (Stage s : {Stage::TRANSIT_FINDING, Stage::VETTING, Stage::INJECTION_RETRIEVAL}) {
        if (contains(s)) {
            out.push_back(stage_registry_key(s));
        }
    }
    return out;
}

size_t ResultsRegistry::size() const {
    return keys().size();
}

Pipeline::Pipeline(std::shared_ptr<const Catalogue> catalogue,
                   PipelineOptions options,
                   std::shared_ptr<StageFactory> factory,
                   core::EventEmitter& events,
                   const YAML::Node& user_config)
    : catalogue_(std::move(catalogue)),
      options_(std::move(options)),
      factory_(std::move(factory)),
      events_(events),
      run_id_(options_.run_id.empty() ? core::get_run_id() : options_.run_id) {
    if (!catalogue_) {
        throw ConfigError("Pipeline requires a catalogue");
    }
    if (!factory_) {
        throw ConfigError("Pipeline requires a stage factory");
    }

    document_ = config::merge_config(user_config, config::default_config_node());
    cfg_ = config::Config::from_yaml(document_);
    cfg_.validate();

    if (core::ensure_directory(options_.output_dir)) {
        events_.info(run_id_, "Created output directory: " + options_.output_dir.string());
    }
    events_.info(run_id_, "Initialized pipeline with " + std::to_string(catalogue_->size()) + " targets",
                 {{"catalogue_format", catalogue_format_to_string(catalogue_->format)}});

    const StageContext ctx{catalogue_, cfg_, document_, options_, events_, run_id_};
    eclipse_masker_ = factory_->make_eclipse_masker(ctx);
    transit_finder_ = factory_->make_transit_finder(ctx);
    model_comparator_ = factory_->make_model_comparator(ctx);
    if (!eclipse_masker_ || !transit_finder_ || !model_comparator_) {
        throw ConfigError("Stage factory returned no collaborator for a required stage");
    }

    if (!options_.transit_models_path.empty()) {
        transit_injector_ = factory_->make_transit_injector(ctx, options_.transit_models_path);
    } else {
        events_.info(run_id_, "Transit models not provided - injection-retrieval will not be available");
    }
}

Pipeline Pipeline::from_source(const io::CatalogueLoader& loader,
                               const fs::path& catalogue_path,
                               CatalogueFormat format,
                               PipelineOptions options,
                               std::shared_ptr<StageFactory> factory,
                               core::EventEmitter& events,
                               const YAML::Node& user_config) {
    auto catalogue = std::make_shared<const Catalogue>(loader.load(catalogue_path, format));
    return Pipeline(std::move(catalogue), std::move(options), std::move(factory), events, user_config);
}

template <typename Fn>
auto Pipeline::run_stage(Stage stage, Fn&& fn) -> decltype(fn()) {
    events_.stage_start(run_id_, stage);
    try {
        auto result = fn();
        events_.stage_end(run_id_, stage, "ok");
        return result;
    } catch (const std::exception& e) {
        events_.stage_end(run_id_, stage, "error", {{"error", e.what()}});
        events_.error(run_id_, stage_to_string(stage) + ": " + e.what());
        throw;
    }
}

fs::path Pipeline::resolve_output_dir(const std::optional<fs::path>& dir, const fs::path& fallback) {
    fs::path out = dir.value_or(fallback);
    if (core::ensure_directory(out)) {
        events_.info(run_id_, "Created output directory: " + out.string());
    }
    return out;
}

masking::MaskingSummary Pipeline::mask_eclipses(const masking::MaskOptions& options) {
    masking::MaskingSummary summary = run_stage(Stage::ECLIPSE_MASKING, [&]() {
        auto s = eclipse_masker_->mask_all(options);
        events_.info(run_id_, "Eclipse masking complete",
                     {{"files", s.files},
                      {"masked", s.masked},
                      {"skipped", s.skipped},
                      {"unmatched", s.unmatched},
                      {"masked_samples", s.masked_samples}});
        return s;
    });

    masking_summary_ = summary;
    state_ = PipelineState::MASKED;
    return summary;
}

const TransitSearchResult& Pipeline::find_transits(const FindTransitsOptions& options) {
    TransitSearchResult result = run_stage(Stage::TRANSIT_FINDING, [&]() {
        const fs::path out_dir = resolve_output_dir(options.output_dir, options_.output_dir);
        const fs::path out_file =
            out_dir / options.output_file.value_or(cfg_.transit_finding.output_file);

        auto r = transit_finder_->process_directory(options_.data_dir, out_file, options.plot_dir);
        events_.info(run_id_, "Transit finding complete: " + std::to_string(r.size()) + " events detected",
                     {{"output_file", out_file.string()}, {"event_snippets", r.event_snippets.size()}});
        return r;
    });

    results_.transit_finding = std::move(result);
    state_ = PipelineState::TRANSIT_SEARCHED;
    return *results_.transit_finding;
}

const VettingResult& Pipeline::vet_candidates(const VetOptions& options) {
    VettingResult result = run_stage(Stage::VETTING, [&]() {
        const fs::path out_dir = resolve_output_dir(options.output_dir, options_.output_dir);
        const fs::path out_file =
            out_dir / options.output_file.value_or(cfg_.model_comparison.output_file);

        const SnippetSource source = resolve_snippet_source(
            options.event_snippets, transit_finder_->last_result(), options.event_snippets_dir,
            options_.output_dir, cfg_.model_comparison.event_snippets_dir);
        events_.info(run_id_, "Vetting " + describe_snippet_source(source));

        auto r = model_comparator_->compare_events(source, out_file);
        events_.info(run_id_, "Model comparison complete: " + std::to_string(r.size()) + " events vetted",
                     {{"output_file", out_file.string()}, {"candidates", r.candidate_count()}});
        return r;
    });

    results_.vetting = std::move(result);
    state_ = PipelineState::VETTED;
    return *results_.vetting;
}

const InjectionResult& Pipeline::run_injection_retrieval(const InjectionOptions& options) {
    if (!transit_injector_) {
        events_.error(run_id_, "Transit injector not initialized - provide transit_models_path");
        throw ConfigError("Transit injector not initialized - provide transit_models_path");
    }

    InjectionResult result = run_stage(Stage::INJECTION_RETRIEVAL, [&]() {
        const int n_injections = options.n_injections.value_or(cfg_.injection_retrieval.n_injections);
        if (n_injections < 1) {
            throw ValidationError("n_injections must be >= 1");
        }

        const fs::path out_dir = resolve_output_dir(options.output_dir, options_.data_dir);
        const fs::path out_file =
            out_dir / options.output_file.value_or(cfg_.injection_retrieval.output_file);

        auto r = transit_injector_->run_injection_retrieval(options_.data_dir, n_injections, out_file);
        events_.info(run_id_, "Injection-retrieval complete",
                     {{"output_file", out_file.string()},
                      {"tests", r.size()},
                      {"recovery_rate", r.recovery_rate()}});
        return r;
    });

    results_.injection_retrieval = std::move(result);
    state_ = PipelineState::INJECTION_TESTED;
    return *results_.injection_retrieval;
}

const ResultsRegistry& Pipeline::run(const RunOptions& options) {
    events_.run_start(run_id_, {{"data_dir", options_.data_dir.string()},
                                {"output_dir", options_.output_dir.string()},
                                {"targets", catalogue_->size()},
                                {"find_transits", options.find_transits},
                                {"vet_candidates", options.vet_candidates},
                                {"injection_retrieval", options.injection_retrieval}});

    try {
        mask_eclipses(options.mask);

        if (options.find_transits) {
            find_transits(options.transits);
        }

        if (options.vet_candidates && options.find_transits) {
            vet_candidates(options.vetting);
        } else if (options.vet_candidates) {
            events_.info(run_id_, "Vetting skipped: transit finding disabled");
        }

        if (options.injection_retrieval) {
            if (!transit_injector_) {
                events_.warning(run_id_,
                                "Injection-retrieval requested but transit models not provided - skipping");
            } else {
                run_injection_retrieval(options.injection);
            }
        }
    } catch (const std::exception& e) {
        events_.run_end(run_id_, false, "error",
                        {{"error", e.what()}, {"state", pipeline_state_to_string(state_)}});
        throw;
    }

    state_ = PipelineState::COMPLETE;
    events_.run_end(run_id_, true, "ok",
                    {{"results", results_.keys()}, {"state", pipeline_state_to_string(state_)}});
    return results_;
}

} // namespace mono_cbp::pipeline

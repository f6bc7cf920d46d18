#pragma once

#include "mono_cbp/core/types.hpp"
#include "mono_cbp/masking/eclipse_masker.hpp"

#include <optional>
#include <string>
#include <vector>

namespace mono_cbp::pipeline {

struct PipelineOptions {
    fs::path data_dir = "./data";
    fs::path output_dir = "./results";
    fs::path transit_models_path; // empty: injection-retrieval unavailable
    fs::path sector_times_path;
    std::string run_id;           // empty: generated
};

// Unset fields resolve against the merged configuration or the pipeline paths.
struct FindTransitsOptions {
    std::optional<std::string> output_file;
    std::optional<fs::path> output_dir;
    std::optional<fs::path> plot_dir;
};

struct VetOptions {
    std::optional<std::vector<EventSnippet>> event_snippets;
    std::optional<fs::path> event_snippets_dir; // unset: pipeline output dir
    std::optional<std::string> output_file;
    std::optional<fs::path> output_dir;
};

struct InjectionOptions {
    std::optional<int> n_injections;
    std::optional<std::string> output_file;
    std::optional<fs::path> output_dir; // unset: data dir
};

struct RunOptions {
    bool find_transits = true;
    bool vet_candidates = true;
    bool injection_retrieval = false;

    masking::MaskOptions mask;
    FindTransitsOptions transits;
    VetOptions vetting;
    InjectionOptions injection;
};

} // namespace mono_cbp::pipeline

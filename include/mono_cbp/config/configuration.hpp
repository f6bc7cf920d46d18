#pragma once

#include <filesystem>
#include <string>
#include <yaml-cpp/yaml.h>

namespace mono_cbp::config {

namespace fs = std::filesystem;

struct EclipseMaskingConfig {
  std::string file_pattern = "*.fits";
  std::string mask_mode = "nan"; // nan | remove
  int parallel_workers = 1;
  bool force = false;            // re-mask files already flagged as masked
};

struct TransitFindingConfig {
  double mad_threshold = 3.0;
  std::string detrending_method = "cb"; // cb (binary-aware) | cp (common pattern)
  bool generate_event_snippets = true;
  std::string output_file = "transit_events.txt";
};

struct ModelComparisonConfig {
  std::string output_file = "vetting_results.csv";
  std::string event_snippets_dir = "event_snippets"; // relative to the output dir
};

struct InjectionRetrievalConfig {
  int n_injections = 100; // per transit model
  std::string output_file = "injection_results.csv";
};

struct Config {
  EclipseMaskingConfig eclipse_masking;
  TransitFindingConfig transit_finding;
  ModelComparisonConfig model_comparison;
  InjectionRetrievalConfig injection_retrieval;

  // Reads a YAML file and merges it over the defaults.
  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

// Default configuration as a nested mapping keyed by stage name.
YAML::Node default_config_node();

/**
 * Recursive structural merge of user over defaults.
 *
 * Every key of defaults is present in the result. Where both sides hold a
 * mapping the merge recurses; otherwise the user value wins. Keys only in
 * user pass through. Neither argument is mutated.
 */
YAML::Node merge_config(const YAML::Node &user, const YAML::Node &defaults);

// User YAML file merged over default_config_node().
YAML::Node load_config_document(const fs::path &path);

} // namespace mono_cbp::config

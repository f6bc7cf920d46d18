#include "mono_cbp/config/configuration.hpp"
#include "mono_cbp/core/errors.hpp"

#include <fstream>

namespace mono_cbp::config {

YAML::Node merge_config(const YAML::Node& user, const YAML::Node& defaults) {
    if (!user || user.IsNull()) {
        return YAML::Clone(defaults);
    }
    if (!defaults || !defaults.IsMap() || !user.IsMap()) {
        return YAML::Clone(user);
    }

    YAML::Node merged = YAML::Clone(defaults);
    for (const auto& kv : user) {
        const std::string key = kv.first.as<std::string>();
        const YAML::Node default_value = defaults[key];
        if (default_value && default_value.IsMap() && kv.second.IsMap()) {
            merged[key] = merge_config(kv.second, default_value);
        } else {
            merged[key] = YAML::Clone(kv.second);
        }
    }
    return merged;
}

YAML::Node default_config_node() {
    return Config{}.to_yaml();
}

YAML::Node load_config_document(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node user;
    try {
        user = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse config file " + path.string() + ": " + e.what());
    }
    return merge_config(user, default_config_node());
}

Config Config::load(const fs::path& path) {
    return from_yaml(load_config_document(path));
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    try {
        if (node["eclipse_masking"]) {
            auto m = node["eclipse_masking"];
            if (m["file_pattern"]) cfg.eclipse_masking.file_pattern = m["file_pattern"].as<std::string>();
            if (m["mask_mode"]) cfg.eclipse_masking.mask_mode = m["mask_mode"].as<std::string>();
            if (m["parallel_workers"]) cfg.eclipse_masking.parallel_workers = m["parallel_workers"].as<int>();
            if (m["force"]) cfg.eclipse_masking.force = m["force"].as<bool>();
        }

        if (node["transit_finding"]) {
            auto t = node["transit_finding"];
            if (t["mad_threshold"]) cfg.transit_finding.mad_threshold = t["mad_threshold"].as<double>();
            if (t["detrending_method"]) {
                cfg.transit_finding.detrending_method = t["detrending_method"].as<std::string>();
            }
            if (t["generate_event_snippets"]) {
                cfg.transit_finding.generate_event_snippets = t["generate_event_snippets"].as<bool>();
            }
            if (t["output_file"]) cfg.transit_finding.output_file = t["output_file"].as<std::string>();
        }

        if (node["model_comparison"]) {
            auto mc = node["model_comparison"];
            if (mc["output_file"]) cfg.model_comparison.output_file = mc["output_file"].as<std::string>();
            if (mc["event_snippets_dir"]) {
                cfg.model_comparison.event_snippets_dir = mc["event_snippets_dir"].as<std::string>();
            }
        }

        if (node["injection_retrieval"]) {
            auto ir = node["injection_retrieval"];
            if (ir["n_injections"]) cfg.injection_retrieval.n_injections = ir["n_injections"].as<int>();
            if (ir["output_file"]) cfg.injection_retrieval.output_file = ir["output_file"].as<std::string>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Malformed configuration value: ") + e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["eclipse_masking"]["file_pattern"] = eclipse_masking.file_pattern;
    node["eclipse_masking"]["mask_mode"] = eclipse_masking.mask_mode;
    node["eclipse_masking"]["parallel_workers"] = eclipse_masking.parallel_workers;
    node["eclipse_masking"]["force"] = eclipse_masking.force;

    node["transit_finding"]["mad_threshold"] = transit_finding.mad_threshold;
    node["transit_finding"]["detrending_method"] = transit_finding.detrending_method;
    node["transit_finding"]["generate_event_snippets"] = transit_finding.generate_event_snippets;
    node["transit_finding"]["output_file"] = transit_finding.output_file;

    node["model_comparison"]["output_file"] = model_comparison.output_file;
    node["model_comparison"]["event_snippets_dir"] = model_comparison.event_snippets_dir;

    node["injection_retrieval"]["n_injections"] = injection_retrieval.n_injections;
    node["injection_retrieval"]["output_file"] = injection_retrieval.output_file;

    return node;
}

void Config::validate() const {
    if (eclipse_masking.file_pattern.empty()) {
        throw ValidationError("eclipse_masking.file_pattern must not be empty");
    }
    if (eclipse_masking.mask_mode != "nan" && eclipse_masking.mask_mode != "remove") {
        throw ValidationError("eclipse_masking.mask_mode must be 'nan' or 'remove'");
    }
    if (eclipse_masking.parallel_workers < 1 || eclipse_masking.parallel_workers > 64) {
        throw ValidationError("eclipse_masking.parallel_workers must be in [1,64]");
    }

    if (!(transit_finding.mad_threshold > 0.0)) {
        throw ValidationError("transit_finding.mad_threshold must be > 0");
    }
    if (transit_finding.detrending_method != "cb" && transit_finding.detrending_method != "cp") {
        throw ValidationError("transit_finding.detrending_method must be 'cb' or 'cp'");
    }
    if (transit_finding.output_file.empty()) {
        throw ValidationError("transit_finding.output_file must not be empty");
    }

    if (model_comparison.output_file.empty()) {
        throw ValidationError("model_comparison.output_file must not be empty");
    }
    if (model_comparison.event_snippets_dir.empty()) {
        throw ValidationError("model_comparison.event_snippets_dir must not be empty");
    }

    if (injection_retrieval.n_injections < 1) {
        throw ValidationError("injection_retrieval.n_injections must be >= 1");
    }
    if (injection_retrieval.output_file.empty()) {
        throw ValidationError("injection_retrieval.output_file must not be empty");
    }
}

} // namespace mono_cbp::config

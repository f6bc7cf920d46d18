#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mono_cbp {

namespace fs = std::filesystem;

// Sequence types (NumPy equivalents)
using VectorXd = Eigen::VectorXd;
using MaskXb = Eigen::Array<bool, Eigen::Dynamic, 1>;

// Eclipse position and width, both in phase units.
// NaN position, NaN width or zero width encode "no eclipse".
struct EclipseGeometry {
    double pos = std::nan("");
    double width = std::nan("");

    bool present() const {
        return !std::isnan(pos) && !std::isnan(width) && width > 0.0;
    }
};

enum class CatalogueFormat {
    STANDARD,
    TEBC  // twin columns per eclipse (two alternative model fits)
};

inline std::string catalogue_format_to_string(CatalogueFormat format) {
    switch (format) {
        case CatalogueFormat::STANDARD: return "STANDARD";
        case CatalogueFormat::TEBC: return "TEBC";
        default: return "UNKNOWN";
    }
}

struct CatalogueEntry {
    std::string tic_id;
    double period = 0.0;      // days
    double epoch = 0.0;       // reference time of primary mid-eclipse
    std::vector<int> sectors;
    EclipseGeometry primary;
    EclipseGeometry secondary;
    // TEBC only: geometry from the alternative model fit
    std::optional<EclipseGeometry> primary_alt;
    std::optional<EclipseGeometry> secondary_alt;
};

struct Catalogue {
    CatalogueFormat format = CatalogueFormat::STANDARD;
    std::vector<CatalogueEntry> entries;

    const CatalogueEntry* find(const std::string& tic_id) const {
        auto it = std::find_if(entries.begin(), entries.end(),
                               [&](const CatalogueEntry& e) { return e.tic_id == tic_id; });
        return it != entries.end() ? &(*it) : nullptr;
    }

    size_t size() const { return entries.size(); }
};

// One target, one observation segment
struct LightCurve {
    std::string tic_id;
    int sector = 0;
    VectorXd time;
    VectorXd flux;
    VectorXd flux_err;
    bool eclipses_masked = false;

    Eigen::Index size() const { return time.size(); }
};

struct EventSnippet {
    std::string tic_id;
    int sector = 0;
    double event_time = 0.0;
    double event_width = 0.0;
    VectorXd time;
    VectorXd flux;
    VectorXd flux_err;
};

// Transit search output
struct TransitEvent {
    std::string tic_id;
    int sector = 0;
    double time = 0.0;
    double depth = 0.0;
    double duration = 0.0;
    double snr = 0.0;
    double phase = 0.0;
};

struct TransitSearchResult {
    std::vector<TransitEvent> events;
    std::vector<EventSnippet> event_snippets;  // empty when snippets are not generated
    fs::path output_file;

    size_t size() const { return events.size(); }
};

// Vetting output. best_fit is the winning model label, e.g. "T", "AT", "E".
struct VettingRecord {
    std::string tic_id;
    int sector = 0;
    double event_time = 0.0;
    std::string best_fit;
    std::map<std::string, double> scores;
};

struct VettingResult {
    std::vector<VettingRecord> records;
    fs::path output_file;

    size_t size() const { return records.size(); }

    size_t candidate_count() const {
        return static_cast<size_t>(std::count_if(
            records.begin(), records.end(),
            [](const VettingRecord& r) { return r.best_fit == "T" || r.best_fit == "AT"; }));
    }
};

// Injection-retrieval output, one row per injection test
struct InjectionRecord {
    int model_index = 0;
    std::string tic_id;
    int sector = 0;
    double injected_time = 0.0;
    bool recovered = false;
};

struct InjectionResult {
    std::vector<InjectionRecord> records;
    fs::path output_file;

    size_t size() const { return records.size(); }

    double recovery_rate() const {
        if (records.empty()) return 0.0;
        auto n = std::count_if(records.begin(), records.end(),
                               [](const InjectionRecord& r) { return r.recovered; });
        return static_cast<double>(n) / static_cast<double>(records.size());
    }
};

// Pipeline stage enumeration
enum class Stage {
    ECLIPSE_MASKING = 0,
    TRANSIT_FINDING = 1,
    VETTING = 2,
    INJECTION_RETRIEVAL = 3
};

inline std::string stage_to_string(Stage stage) {
    switch (stage) {
        case Stage::ECLIPSE_MASKING: return "ECLIPSE_MASKING";
        case Stage::TRANSIT_FINDING: return "TRANSIT_FINDING";
        case Stage::VETTING: return "VETTING";
        case Stage::INJECTION_RETRIEVAL: return "INJECTION_RETRIEVAL";
        default: return "UNKNOWN";
    }
}

inline std::string stage_registry_key(Stage stage) {
    switch (stage) {
        case Stage::ECLIPSE_MASKING: return "eclipse_masking";
        case Stage::TRANSIT_FINDING: return "transit_finding";
        case Stage::VETTING: return "vetting";
        case Stage::INJECTION_RETRIEVAL: return "injection_retrieval";
        default: return "unknown";
    }
}

inline int stage_to_int(Stage stage) {
    return static_cast<int>(stage);
}

enum class PipelineState {
    INITIALIZED,
    MASKED,
    TRANSIT_SEARCHED,
    VETTED,
    INJECTION_TESTED,
    COMPLETE
};

inline std::string pipeline_state_to_string(PipelineState state) {
    switch (state) {
        case PipelineState::INITIALIZED: return "INITIALIZED";
        case PipelineState::MASKED: return "MASKED";
        case PipelineState::TRANSIT_SEARCHED: return "TRANSIT_SEARCHED";
        case PipelineState::VETTED: return "VETTED";
        case PipelineState::INJECTION_TESTED: return "INJECTION_TESTED";
        case PipelineState::COMPLETE: return "COMPLETE";
        default: return "UNKNOWN";
    }
}

} // namespace mono_cbp

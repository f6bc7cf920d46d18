#pragma once

#include "mono_cbp/core/types.hpp"
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mono_cbp::io {

struct FitsHeader {
    std::map<std::string, std::string> string_values;
    std::map<std::string, double> numeric_values;
    std::map<std::string, int> int_values;
    std::map<std::string, bool> bool_values;

    std::optional<std::string> get_string(const std::string& key) const;
    std::optional<double> get_double(const std::string& key) const;
    std::optional<int> get_int(const std::string& key) const;
    std::optional<bool> get_bool(const std::string& key) const;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, double value);
    void set(const std::string& key, int value);
    void set(const std::string& key, bool value);
};

bool is_fits_path(const fs::path& path);

// Recovers (tic_id, sector) from names like "TIC_260128333_S14.fits".
std::optional<std::pair<std::string, int>> parse_light_curve_name(const fs::path& path);

// Primary header only.
FitsHeader read_fits_header(const fs::path& path);

/**
 * Light-curve files: primary HDU carries TICID, SECTOR and ECLMASK, the
 * first extension is a binary table with TIME, FLUX and FLUX_ERR columns
 * (PDCSAP_FLUX / PDCSAP_FLUX_ERR are accepted on read).
 */
std::pair<LightCurve, FitsHeader> read_light_curve(const fs::path& path);

// Overwrites path. Keys in header are carried over to the primary HDU.
void write_light_curve(const fs::path& path, const LightCurve& lc,
                       const FitsHeader& header = FitsHeader());

/**
 * Updates an existing light-curve file in place: sets ECLMASK, deletes
 * removed_rows (0-based, ascending) from the table and rewrites the flux
 * columns. Every other HDU, column and key is kept. The edit is made on a
 * copy that replaces path only on success.
 */
void update_light_curve(const fs::path& path, const LightCurve& lc,
                        const std::vector<Eigen::Index>& removed_rows);

// Event snippets use the same layout plus EVTTIME and EVTWIDTH keys.
EventSnippet read_event_snippet(const fs::path& path);
void write_event_snippet(const fs::path& path, const EventSnippet& snippet);

// All snippet files in dir, sorted by file name. Missing dir yields none.
std::vector<EventSnippet> load_event_snippets(const fs::path& dir);

} // namespace mono_cbp::io

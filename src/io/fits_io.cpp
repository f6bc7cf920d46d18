#include "mono_cbp/io/fits_io.hpp"
#include "mono_cbp/core/errors.hpp"
#include "mono_cbp/core/utils.hpp"

#include <fitsio.h>
#include <algorithm>
#include <regex>
#include <set>

namespace mono_cbp::io {

std::optional<std::string> FitsHeader::get_string(const std::string& key) const {
    auto it = string_values.find(key);
    if (it != string_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<double> FitsHeader::get_double(const std::string& key) const {
    auto it = numeric_values.find(key);
    if (it != numeric_values.end()) {
        return it->second;
    }
    auto it_int = int_values.find(key);
    if (it_int != int_values.end()) {
        return static_cast<double>(it_int->second);
    }
    return std::nullopt;
}

std::optional<int> FitsHeader::get_int(const std::string& key) const {
    auto it = int_values.find(key);
    if (it != int_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<bool> FitsHeader::get_bool(const std::string& key) const {
    auto it = bool_values.find(key);
    if (it != bool_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

void FitsHeader::set(const std::string& key, const std::string& value) {
    string_values[key] = value;
}

void FitsHeader::set(const std::string& key, double value) {
    numeric_values[key] = value;
}

void FitsHeader::set(const std::string& key, int value) {
    int_values[key] = value;
}

void FitsHeader::set(const std::string& key, bool value) {
    bool_values[key] = value;
}

namespace {

// Structural keywords cfitsio writes itself; never copied between files.
const std::set<std::string> kStructuralKeys = {
    "SIMPLE", "BITPIX", "NAXIS", "NAXIS1", "NAXIS2", "EXTEND",
    "PCOUNT", "GCOUNT", "XTENSION", "TFIELDS", "CHECKSUM", "DATASUM"};

// Keys owned by the light-curve / snippet layout.
const char* kTicKey = "TICID";
const char* kSectorKey = "SECTOR";
const char* kMaskedKey = "ECLMASK";
const char* kEventTimeKey = "EVTTIME";
const char* kEventWidthKey = "EVTWIDTH";

struct Series {
    VectorXd time;
    VectorXd flux;
    VectorXd flux_err;
};

FitsHeader read_header_records(fitsfile* fptr) {
    FitsHeader header;
    int status = 0;

    char card[FLEN_CARD];
    int nkeys = 0;
    fits_get_hdrspace(fptr, &nkeys, nullptr, &status);

    for (int i = 1; i <= nkeys; ++i) {
        fits_read_record(fptr, i, card, &status);
        if (status) {
            status = 0;
            continue;
        }

        char keyname[FLEN_KEYWORD];
        char value[FLEN_VALUE];
        char comment[FLEN_COMMENT];
        int keylen = 0;

        fits_get_keyname(card, keyname, &keylen, &status);
        if (status) {
            status = 0;
            continue;
        }

        std::string key(keyname);
        if (key.empty() || key == "COMMENT" || key == "HISTORY" || key == "END") {
            continue;
        }

        fits_parse_value(card, value, comment, &status);
        if (status) {
            status = 0;
            continue;
        }

        char dtype = 'C';
        fits_get_keytype(value, &dtype, &status);
        if (status) {
            status = 0;
            continue;
        }

        std::string val_str(value);
        val_str.erase(0, val_str.find_first_not_of(" '"));
        val_str.erase(val_str.find_last_not_of(" '") + 1);

        switch (dtype) {
            case 'L':
                header.set(key, val_str == "T" || val_str == "1");
                break;
            case 'I':
                try {
                    header.set(key, std::stoi(val_str));
                } catch (const std::exception&) {
                    header.set(key, val_str);
                }
                break;
            case 'F':
                try {
                    header.set(key, std::stod(val_str));
                } catch (const std::exception&) {
                    header.set(key, val_str);
                }
                break;
            default:
                header.set(key, val_str);
                break;
        }
    }

    return header;
}

void write_header_records(fitsfile* fptr, const FitsHeader& header, int* status) {
    for (const auto& [key, value] : header.string_values) {
        if (key.size() <= 8 && !kStructuralKeys.count(key)) {
            fits_update_key(fptr, TSTRING, key.c_str(),
                            const_cast<char*>(value.c_str()), nullptr, status);
        }
    }

    for (const auto& [key, value] : header.numeric_values) {
        if (key.size() <= 8 && !kStructuralKeys.count(key)) {
            double val = value;
            fits_update_key(fptr, TDOUBLE, key.c_str(), &val, nullptr, status);
        }
    }

    for (const auto& [key, value] : header.int_values) {
        if (key.size() <= 8 && !kStructuralKeys.count(key)) {
            int val = value;
            fits_update_key(fptr, TINT, key.c_str(), &val, nullptr, status);
        }
    }

    for (const auto& [key, value] : header.bool_values) {
        if (key.size() <= 8 && !kStructuralKeys.count(key)) {
            int val = value ? 1 : 0;
            fits_update_key(fptr, TLOGICAL, key.c_str(), &val, nullptr, status);
        }
    }
}

int find_column(fitsfile* fptr, const std::vector<std::string>& names) {
    for (const auto& name : names) {
        int status = 0;
        int colnum = 0;
        std::string templ = name;
        fits_get_colnum(fptr, CASEINSEN, templ.data(), &colnum, &status);
        if (status == 0) {
            return colnum;
        }
    }
    return 0;
}

VectorXd read_double_column(fitsfile* fptr, int colnum, long nrows, const fs::path& path) {
    VectorXd out(nrows);
    if (nrows == 0) {
        return out;
    }
    int status = 0;
    int anynul = 0;
    fits_read_col(fptr, TDOUBLE, colnum, 1, 1, nrows, nullptr, out.data(), &anynul, &status);
    if (status) {
        throw FitsError("Cannot read table column " + std::to_string(colnum) + ": " + path.string());
    }
    return out;
}

// Reads the first extension as a (time, flux, flux_err) series.
Series read_series_table(fitsfile* fptr, const fs::path& path) {
    int status = 0;
    int hdutype = 0;
    fits_movabs_hdu(fptr, 2, &hdutype, &status);
    if (status || hdutype != BINARY_TBL) {
        throw FitsError("No binary table extension: " + path.string());
    }

    long nrows = 0;
    fits_get_num_rows(fptr, &nrows, &status);
    if (status) {
        throw FitsError("Cannot read table size: " + path.string());
    }

    const int time_col = find_column(fptr, {"TIME"});
    const int flux_col = find_column(fptr, {"FLUX", "PDCSAP_FLUX"});
    const int err_col = find_column(fptr, {"FLUX_ERR", "PDCSAP_FLUX_ERR"});
    if (time_col == 0 || flux_col == 0 || err_col == 0) {
        throw FitsError("Missing TIME/FLUX/FLUX_ERR columns: " + path.string());
    }

    Series s;
    s.time = read_double_column(fptr, time_col, nrows, path);
    s.flux = read_double_column(fptr, flux_col, nrows, path);
    s.flux_err = read_double_column(fptr, err_col, nrows, path);
    return s;
}

void write_series_table(fitsfile* fptr, const char* extname, const VectorXd& time,
                        const VectorXd& flux, const VectorXd& flux_err, int* status) {
    char ttype_time[] = "TIME";
    char ttype_flux[] = "FLUX";
    char ttype_err[] = "FLUX_ERR";
    char tform[] = "1D";
    char* ttype[] = {ttype_time, ttype_flux, ttype_err};
    char* tforms[] = {tform, tform, tform};

    fits_create_tbl(fptr, BINARY_TBL, 0, 3, ttype, tforms, nullptr, extname, status);
    if (*status) return;

    const LONGLONG n = static_cast<LONGLONG>(time.size());
    if (n == 0) return;
    fits_write_col(fptr, TDOUBLE, 1, 1, 1, n, const_cast<double*>(time.data()), status);
    fits_write_col(fptr, TDOUBLE, 2, 1, 1, n, const_cast<double*>(flux.data()), status);
    fits_write_col(fptr, TDOUBLE, 3, 1, 1, n, const_cast<double*>(flux_err.data()), status);
}

fitsfile* open_readonly(const fs::path& path) {
    fitsfile* fptr = nullptr;
    int status = 0;
    if (fits_open_file(&fptr, path.string().c_str(), READONLY, &status)) {
        throw FitsError("Cannot open FITS file: " + path.string());
    }
    return fptr;
}

fitsfile* create_with_primary(const fs::path& path) {
    fitsfile* fptr = nullptr;
    int status = 0;

    std::string filepath = "!" + path.string();
    if (fits_create_file(&fptr, filepath.c_str(), &status)) {
        throw FitsError("Cannot create FITS file: " + path.string());
    }

    fits_create_img(fptr, BYTE_IMG, 0, nullptr, &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot create primary HDU: " + path.string());
    }
    return fptr;
}

void check_lengths(const VectorXd& time, const VectorXd& flux, const VectorXd& flux_err,
                   const fs::path& path) {
    if (flux.size() != time.size() || flux_err.size() != time.size()) {
        throw FitsError("TIME/FLUX/FLUX_ERR length mismatch: " + path.string());
    }
}

std::string tic_from_header(const FitsHeader& header) {
    if (auto s = header.get_string(kTicKey)) return *s;
    if (auto i = header.get_int(kTicKey)) return std::to_string(*i);
    if (auto d = header.get_double(kTicKey)) return std::to_string(static_cast<long long>(*d));
    return std::string();
}

// Writes go to a hidden sibling that replaces the target only once complete.
fs::path staging_path(const fs::path& path) {
    return path.parent_path() / ("." + path.filename().string() + ".tmp");
}

void discard_staging(const fs::path& tmp) {
    std::error_code ec;
    fs::remove(tmp, ec);
}

void commit_staging(const fs::path& tmp, const fs::path& path) {
    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        discard_staging(tmp);
        throw FitsError("Cannot replace " + path.string() + ": " + ec.message());
    }
}

void close_after_error(fitsfile* fptr, const fs::path& tmp) {
    int status = 0;
    fits_close_file(fptr, &status);
    discard_staging(tmp);
}

// ECLMASK in the primary HDU, masked rows dropped and flux columns rewritten in the table.
void apply_update(fitsfile* fptr, const LightCurve& lc,
                  const std::vector<Eigen::Index>& removed_rows, const fs::path& path) {
    int status = 0;
    int masked = lc.eclipses_masked ? 1 : 0;
    fits_update_key(fptr, TLOGICAL, kMaskedKey, &masked, nullptr, &status);
    if (status) {
        throw FitsError("Cannot update ECLMASK: " + path.string());
    }

    int hdutype = 0;
    fits_movabs_hdu(fptr, 2, &hdutype, &status);
    if (status || hdutype != BINARY_TBL) {
        throw FitsError("No binary table extension: " + path.string());
    }

    if (!removed_rows.empty()) {
        std::vector<long> rows;
        rows.reserve(removed_rows.size());
        for (Eigen::Index i : removed_rows) {
            rows.push_back(static_cast<long>(i) + 1);
        }
        fits_delete_rowlist(fptr, rows.data(), static_cast<long>(rows.size()), &status);
        if (status) {
            throw FitsError("Cannot delete masked rows: " + path.string());
        }
    }

    long nrows = 0;
    fits_get_num_rows(fptr, &nrows, &status);
    if (status || nrows != static_cast<long>(lc.size())) {
        throw FitsError("Table rows do not match the updated light curve: " + path.string());
    }

    const int flux_col = find_column(fptr, {"FLUX", "PDCSAP_FLUX"});
    const int err_col = find_column(fptr, {"FLUX_ERR", "PDCSAP_FLUX_ERR"});
    if (flux_col == 0 || err_col == 0) {
        throw FitsError("Missing FLUX/FLUX_ERR columns: " + path.string());
    }
    if (nrows == 0) {
        return;
    }

    fits_write_col(fptr, TDOUBLE, flux_col, 1, 1, nrows, const_cast<double*>(lc.flux.data()), &status);
    fits_write_col(fptr, TDOUBLE, err_col, 1, 1, nrows, const_cast<double*>(lc.flux_err.data()), &status);
    if (status) {
        throw FitsError("Cannot write flux columns: " + path.string());
    }
}

} // namespace

bool is_fits_path(const fs::path& path) {
    std::string ext = core::to_lower(path.extension().string());
    return ext == ".fit" || ext == ".fits" || ext == ".fts";
}

std::optional<std::pair<std::string, int>> parse_light_curve_name(const fs::path& path) {
    static const std::regex re(R"(tic_?0*(\d+)[_-]s(?:ector)?_?0*(\d+))", std::regex::icase);
    const std::string stem = path.stem().string();
    std::smatch m;
    if (std::regex_search(stem, m, re)) {
        return std::make_pair(m[1].str(), std::stoi(m[2].str()));
    }
    return std::nullopt;
}

FitsHeader read_fits_header(const fs::path& path) {
    fitsfile* fptr = open_readonly(path);
    FitsHeader header = read_header_records(fptr);
    int status = 0;
    fits_close_file(fptr, &status);
    return header;
}

std::pair<LightCurve, FitsHeader> read_light_curve(const fs::path& path) {
    fitsfile* fptr = open_readonly(path);

    FitsHeader header = read_header_records(fptr);
    Series series;
    try {
        series = read_series_table(fptr, path);
    } catch (const FitsError&) {
        int status = 0;
        fits_close_file(fptr, &status);
        throw;
    }
    int status = 0;
    fits_close_file(fptr, &status);

    LightCurve lc;
    lc.tic_id = tic_from_header(header);
    lc.sector = header.get_int(kSectorKey).value_or(0);
    if (lc.tic_id.empty() || !header.get_int(kSectorKey)) {
        if (auto parsed = parse_light_curve_name(path)) {
            if (lc.tic_id.empty()) lc.tic_id = parsed->first;
            if (!header.get_int(kSectorKey)) lc.sector = parsed->second;
        }
    }
    if (lc.tic_id.empty()) {
        throw FitsError("Cannot determine TIC id for light curve: " + path.string());
    }
    lc.eclipses_masked = header.get_bool(kMaskedKey).value_or(false);
    lc.time = std::move(series.time);
    lc.flux = std::move(series.flux);
    lc.flux_err = std::move(series.flux_err);

    return {std::move(lc), std::move(header)};
}

void write_light_curve(const fs::path& path, const LightCurve& lc, const FitsHeader& header) {
    check_lengths(lc.time, lc.flux, lc.flux_err, path);

    FitsHeader out_header = header;
    out_header.string_values.erase(kTicKey);
    out_header.int_values.erase(kTicKey);
    out_header.numeric_values.erase(kTicKey);
    out_header.set(kTicKey, lc.tic_id);
    out_header.set(kSectorKey, lc.sector);
    out_header.set(kMaskedKey, lc.eclipses_masked);

    const fs::path tmp = staging_path(path);
    fitsfile* fptr = create_with_primary(tmp);
    int status = 0;
    write_header_records(fptr, out_header, &status);
    if (status) {
        close_after_error(fptr, tmp);
        throw FitsError("Cannot write FITS header: " + path.string());
    }

    write_series_table(fptr, "LIGHTCURVE", lc.time, lc.flux, lc.flux_err, &status);
    if (status) {
        close_after_error(fptr, tmp);
        throw FitsError("Cannot write light-curve table: " + path.string());
    }

    fits_close_file(fptr, &status);
    if (status) {
        discard_staging(tmp);
        throw FitsError("Cannot finalize FITS file: " + path.string());
    }
    commit_staging(tmp, path);
}

void update_light_curve(const fs::path& path, const LightCurve& lc,
                        const std::vector<Eigen::Index>& removed_rows) {
    check_lengths(lc.time, lc.flux, lc.flux_err, path);

    const fs::path tmp = staging_path(path);
    std::error_code ec;
    fs::copy_file(path, tmp, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        throw FitsError("Cannot stage update of " + path.string() + ": " + ec.message());
    }

    fitsfile* fptr = nullptr;
    int status = 0;
    if (fits_open_file(&fptr, tmp.string().c_str(), READWRITE, &status)) {
        discard_staging(tmp);
        throw FitsError("Cannot open FITS file for update: " + path.string());
    }

    try {
        apply_update(fptr, lc, removed_rows, path);
    } catch (const FitsError&) {
        close_after_error(fptr, tmp);
        throw;
    }

    fits_close_file(fptr, &status);
    if (status) {
        discard_staging(tmp);
        throw FitsError("Cannot finalize FITS file: " + path.string());
    }
    commit_staging(tmp, path);
}

EventSnippet read_event_snippet(const fs::path& path) {
    fitsfile* fptr = open_readonly(path);

    FitsHeader header = read_header_records(fptr);
    Series series;
    try {
        series = read_series_table(fptr, path);
    } catch (const FitsError&) {
        int status = 0;
        fits_close_file(fptr, &status);
        throw;
    }
    int status = 0;
    fits_close_file(fptr, &status);

    auto event_time = header.get_double(kEventTimeKey);
    auto event_width = header.get_double(kEventWidthKey);
    if (!event_time || !event_width) {
        throw FitsError("Snippet is missing EVTTIME/EVTWIDTH: " + path.string());
    }

    EventSnippet snippet;
    snippet.tic_id = tic_from_header(header);
    snippet.sector = header.get_int(kSectorKey).value_or(0);
    snippet.event_time = *event_time;
    snippet.event_width = *event_width;
    snippet.time = std::move(series.time);
    snippet.flux = std::move(series.flux);
    snippet.flux_err = std::move(series.flux_err);
    return snippet;
}

void write_event_snippet(const fs::path& path, const EventSnippet& snippet) {
    check_lengths(snippet.time, snippet.flux, snippet.flux_err, path);

    FitsHeader header;
    header.set(kTicKey, snippet.tic_id);
    header.set(kSectorKey, snippet.sector);
    header.set(kEventTimeKey, snippet.event_time);
    header.set(kEventWidthKey, snippet.event_width);

    const fs::path tmp = staging_path(path);
    fitsfile* fptr = create_with_primary(tmp);
    int status = 0;
    write_header_records(fptr, header, &status);
    write_series_table(fptr, "SNIPPET", snippet.time, snippet.flux, snippet.flux_err, &status);
    if (status) {
        close_after_error(fptr, tmp);
        throw FitsError("Cannot write event snippet: " + path.string());
    }

    fits_close_file(fptr, &status);
    if (status) {
        discard_staging(tmp);
        throw FitsError("Cannot finalize FITS file: " + path.string());
    }
    commit_staging(tmp, path);
}

std::vector<EventSnippet> load_event_snippets(const fs::path& dir) {
    std::vector<EventSnippet> snippets;
    if (!fs::exists(dir) || !fs::is_directory(dir)) {
        return snippets;
    }

    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.is_regular_file() && is_fits_path(entry.path())) {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());

    snippets.reserve(files.size());
    for (const auto& f : files) {
        snippets.push_back(read_event_snippet(f));
    }
    return snippets;
}

} // namespace mono_cbp::io

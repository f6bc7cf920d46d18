#include "mono_cbp/io/light_curve_store.hpp"
#include "mono_cbp/core/errors.hpp"
#include "mono_cbp/core/utils.hpp"

namespace mono_cbp::io {

FitsLightCurveStore::FitsLightCurveStore(fs::path dir, std::string pattern)
    : dir_(std::move(dir)), pattern_(std::move(pattern)) {}

std::vector<fs::path> FitsLightCurveStore::list() const {
    if (!fs::exists(dir_)) {
        throw IOError("Data directory not found: " + dir_.string());
    }
    return core::discover_files(dir_, pattern_);
}

LightCurve FitsLightCurveStore::load(const fs::path& path) const {
    return read_light_curve(path).first;
}

void FitsLightCurveStore::save(const fs::path& path, const LightCurve& lc,
                               const std::vector<Eigen::Index>& removed_rows) {
    if (fs::exists(path)) {
        update_light_curve(path, lc, removed_rows);
    } else {
        write_light_curve(path, lc);
    }
}

} // namespace mono_cbp::io

#pragma once

#include "mono_cbp/core/types.hpp"
#include "mono_cbp/io/fits_io.hpp"

#include <string>
#include <vector>

namespace mono_cbp::io {

// A directory of per-target light-curve files.
class LightCurveStore {
public:
    virtual ~LightCurveStore() = default;

    virtual fs::path root() const = 0;

    // Stored light-curve paths, sorted.
    virtual std::vector<fs::path> list() const = 0;

    virtual LightCurve load(const fs::path& path) const = 0;

    // Rewrites path in place. removed_rows are the stored rows lc no longer holds.
    virtual void save(const fs::path& path, const LightCurve& lc,
                      const std::vector<Eigen::Index>& removed_rows) = 0;
};

class FitsLightCurveStore : public LightCurveStore {
public:
    explicit FitsLightCurveStore(fs::path dir, std::string pattern = "*.fits");

    fs::path root() const override { return dir_; }
    std::vector<fs::path> list() const override;
    LightCurve load(const fs::path& path) const override;

    // Existing files are updated, keeping columns and keys this library does not read.
    void save(const fs::path& path, const LightCurve& lc,
              const std::vector<Eigen::Index>& removed_rows) override;

private:
    fs::path dir_;
    std::string pattern_;
};

} // namespace mono_cbp::io

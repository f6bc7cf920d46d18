#pragma once

#include "mono_cbp/core/types.hpp"

namespace mono_cbp::io {

/**
 * Reads an eclipsing-binary catalogue. The TEBC format carries twin columns
 * per eclipse and fills the primary_alt / secondary_alt geometries.
 */
class CatalogueLoader {
public:
    virtual ~CatalogueLoader() = default;

    virtual Catalogue load(const fs::path& path, CatalogueFormat format) const = 0;
};

} // namespace mono_cbp::io

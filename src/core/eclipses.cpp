#include "mono_cbp/core/eclipses.hpp"

#include <cmath>

namespace mono_cbp::core {

namespace {

bool in_window(double phase, double pos, double half_width) {
    if (pos > kWrapHighThreshold) {
        return phase >= pos - half_width || phase <= pos + half_width - 1.0;
    }
    if (pos < kWrapLowThreshold) {
        return phase >= pos - half_width + 1.0 || phase <= pos + half_width;
    }
    return phase >= pos - half_width && phase <= pos + half_width;
}

} // namespace

std::vector<Eigen::Index> eclipse_indices(const VectorXd& phases, double pos, double width) {
    std::vector<Eigen::Index> idx;
    // pos == 0 is a valid eclipse position
    if (std::isnan(pos) || std::isnan(width) || !(width > 0.0)) {
        return idx;
    }

    if (width >= 1.0) {
        idx.reserve(static_cast<size_t>(phases.size()));
        for (Eigen::Index i = 0; i < phases.size(); ++i) {
            idx.push_back(i);
        }
        return idx;
    }

    const double half_width = 0.5 * width;
    for (Eigen::Index i = 0; i < phases.size(); ++i) {
        if (in_window(phases[i], pos, half_width)) {
            idx.push_back(i);
        }
    }
    return idx;
}

std::vector<Eigen::Index> eclipse_indices(const VectorXd& phases, const EclipseGeometry& eclipse) {
    return eclipse_indices(phases, eclipse.pos, eclipse.width);
}

MaskXb eclipse_mask(const VectorXd& phases, double pos, double width) {
    MaskXb mask = MaskXb::Constant(phases.size(), false);
    for (Eigen::Index i : eclipse_indices(phases, pos, width)) {
        mask[i] = true;
    }
    return mask;
}

MaskXb eclipse_mask(const VectorXd& phases, const EclipseGeometry& eclipse) {
    return eclipse_mask(phases, eclipse.pos, eclipse.width);
}

} // namespace mono_cbp::core

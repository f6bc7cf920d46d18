#pragma once

#include "mono_cbp/core/types.hpp"

#include <vector>

namespace mono_cbp::core {

// Eclipses centred above/below these positions may wrap across phase 1 -> 0.
constexpr double kWrapHighThreshold = 0.95;
constexpr double kWrapLowThreshold = 0.05;

/**
 * Indices of phase samples inside [pos - width/2, pos + width/2] on the
 * phase circle, in ascending order.
 *
 * NaN pos, NaN width, zero width or negative width mean "no eclipse" and
 * yield an empty set. width >= 1 covers the whole circle and selects every
 * sample. Phases are expected in [0, 1).
 */
std::vector<Eigen::Index> eclipse_indices(const VectorXd& phases, double pos, double width);
std::vector<Eigen::Index> eclipse_indices(const VectorXd& phases, const EclipseGeometry& eclipse);

// eclipse_indices materialized as a mask of the same length as phases.
MaskXb eclipse_mask(const VectorXd& phases, double pos, double width);
MaskXb eclipse_mask(const VectorXd& phases, const EclipseGeometry& eclipse);

} // namespace mono_cbp::core

#pragma once

#include "mono_cbp/core/types.hpp"

namespace mono_cbp::core {

/**
 * Fold absolute times onto the orbital phase circle.
 *
 * phase = ((t - epoch') / period) mod 1 + (center - 0.5),
 * with epoch' = epoch + (center - 0.5) * period.
 * Output lies in [center - 0.5, center + 0.5).
 *
 * Precondition: period is finite and non-zero (not checked).
 */
VectorXd to_phase(const VectorXd& times, double period, double epoch, double center = 0.5);

double to_phase(double time, double period, double epoch, double center = 0.5);

} // namespace mono_cbp::core

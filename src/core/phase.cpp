#include "mono_cbp/core/phase.hpp"

#include <cmath>

namespace mono_cbp::core {

double to_phase(double time, double period, double epoch, double center) {
    const double start_phase = center - 0.5;
    const double shifted_epoch = epoch + start_phase * period;
    const double cycles = (time - shifted_epoch) / period;
    double frac = cycles - std::floor(cycles);
    // tiny negative cycles round up to exactly 1.0
    if (frac >= 1.0) frac = 0.0;
    const double phase = frac + start_phase;
    return phase < start_phase + 1.0 ? phase : start_phase;
}

VectorXd to_phase(const VectorXd& times, double period, double epoch, double center) {
    VectorXd phases(times.size());
    for (Eigen::Index i = 0; i < times.size(); ++i) {
        phases[i] = to_phase(times[i], period, epoch, center);
    }
    return phases;
}

} // namespace mono_cbp::core

#include "readout_mitigation.hpp"

#include "phase_model.hpp"

#include <cmath>
#include <stdexcept>

namespace ramsey_lab {

namespace {

constexpr double kSingularTolerance = 1e-12;

}  // namespace

double readout_contrast(const MeasurementNoiseConfig& readout) {
    return std::fabs(1.0 - readout.p_flip0_to_1 - readout.p_flip1_to_0);
}

MitigatedProbability mitigate_readout(
    const OutcomeTally& tally,
    const MeasurementNoiseConfig& readout
) {
    validate_tally(tally);

    const double a = 1.0 - readout.p_flip0_to_1;
    const double b = readout.p_flip1_to_0;
    const double c = readout.p_flip0_to_1;
    const double d = 1.0 - readout.p_flip1_to_0;
    const double det = a * d - b * c;
    if (std::fabs(det) < kSingularTolerance) {
        throw std::invalid_argument(
            "readout confusion matrix is singular (p01 + p10 == 1)");
    }

    const double shots = static_cast<double>(tally.shots());
    const double x0 = static_cast<double>(tally.count_zero) / shots;
    const double x1 = static_cast<double>(tally.count_one) / shots;

    double p0 = (d * x0 - b * x1) / det;
    double p1 = (-c * x0 + a * x1) / det;

    MitigatedProbability out;
    if (p0 < 0.0) {
        p0 = 0.0;
        out.clipped = true;
    }
    if (p1 < 0.0) {
        p1 = 0.0;
        out.clipped = true;
    }
    const double sum = p0 + p1;
    out.probability_of_one = sum > 0.0 ? p1 / sum : 0.0;
    return out;
}

}  // namespace ramsey_lab

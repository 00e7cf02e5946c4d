#pragma once

#include "experiment/records.types.hpp"
#include "noise.hpp"

namespace ramsey_lab {

struct MitigatedProbability {
    double probability_of_one = 0.0;
    // Set when inverting the confusion matrix produced a negative component
    // that had to be clipped before renormalizing.
    bool clipped = false;
};

// Applies M^{-1} to the empirical distribution of a single-qubit tally, where
// M = [[1 - p01, p10], [p01, 1 - p10]] maps true to observed populations.
// Throws std::invalid_argument for an invalid tally or a singular M
// (p01 + p10 == 1).
MitigatedProbability mitigate_readout(
    const OutcomeTally& tally,
    const MeasurementNoiseConfig& readout
);

// |det M| of the readout confusion matrix.
double readout_contrast(const MeasurementNoiseConfig& readout);

}  // namespace ramsey_lab

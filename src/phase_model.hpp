#pragma once

#include "experiment/records.types.hpp"

#include <optional>

// Closed-form Ramsey fringe model and its inversion.
//
// A Ramsey sequence maps the relative phase theta onto the population of
// the "1" outcome as p(theta) = (1 - cos theta) / 2 = sin^2(theta / 2).
// The model is exact for ideal gates and is analytically invertible over
// [0, pi]. Because p(theta) == p(2 pi - theta), a single measurement basis
// cannot tell theta from 2 pi - theta: every estimate is a principal value
// in [0, pi] and callers that know the quadrant must disambiguate
// themselves.

namespace ramsey_lab {

inline constexpr double kPi = 3.14159265358979323846;

struct EstimationResult {
    int shots = 0;
    double probability_of_one = 0.0;
    double estimated_phase = 0.0;
    std::optional<double> actual_phase;
    std::optional<double> absolute_error;
    std::optional<double> standard_error;
};

// p(theta) in [0, 1]. Total and periodic in theta.
double predicted_probability_of_one(double theta);

// arccos(1 - 2 * count_one / shots), in [0, pi].
// Throws std::invalid_argument when shots <= 0, count_one < 0 or
// count_one > shots. Malformed tallies are never clamped.
double estimate_phase(int count_one, int shots);

// Inverts an already computed probability of "1".
// Throws std::invalid_argument unless 0 <= probability <= 1.
double estimate_phase_from_probability(double probability);

double estimation_error(double estimated, double actual);

// Delta-method standard error of the phase estimate: the spread of the
// probability divided by |dp/dtheta| = |sin theta| / 2 at the estimate.
// Empty where the derivative vanishes (probability 0 or 1).
std::optional<double> propagate_phase_error(double probability, double probability_std);

// Binomial standard error of count_one / shots propagated to the phase.
// Same argument checks as estimate_phase.
std::optional<double> phase_standard_error(int count_one, int shots);

// True unless the estimate sits on 0 or pi, the only points where the
// reflected phase 2 pi - theta coincides with theta modulo 2 pi.
bool is_quadrant_ambiguous(double estimated_phase);

// Throws std::invalid_argument for negative counts or an empty tally.
void validate_tally(const OutcomeTally& tally);

EstimationResult estimate(
    const OutcomeTally& tally,
    std::optional<double> actual_phase = std::nullopt
);

}  // namespace ramsey_lab

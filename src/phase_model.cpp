#include "phase_model.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace ramsey_lab {

namespace {

constexpr double kBoundaryTolerance = 1e-12;

void check_counts(int count_one, int shots) {
    if (shots <= 0) {
        throw std::invalid_argument(
            "shots must be positive (got " + std::to_string(shots) + ")");
    }
    if (count_one < 0) {
        throw std::invalid_argument(
            "count_one must be non-negative (got " + std::to_string(count_one) + ")");
    }
    if (count_one > shots) {
        throw std::invalid_argument(
            "count_one " + std::to_string(count_one) +
            " exceeds shots " + std::to_string(shots));
    }
}

}  // namespace

double predicted_probability_of_one(double theta) {
    return 0.5 * (1.0 - std::cos(theta));
}

double estimate_phase(int count_one, int shots) {
    check_counts(count_one, shots);
    const double p_hat = static_cast<double>(count_one) / static_cast<double>(shots);
    return std::acos(1.0 - 2.0 * p_hat);
}

double estimate_phase_from_probability(double probability) {
    if (!(probability >= 0.0 && probability <= 1.0)) {
        throw std::invalid_argument(
            "probability must lie in [0, 1] (got " + std::to_string(probability) + ")");
    }
    return std::acos(1.0 - 2.0 * probability);
}

double estimation_error(double estimated, double actual) {
    return std::fabs(estimated - actual);
}

std::optional<double> propagate_phase_error(double probability, double probability_std) {
    const double theta = estimate_phase_from_probability(probability);
    const double slope = 0.5 * std::fabs(std::sin(theta));
    if (slope <= kBoundaryTolerance) {
        return std::nullopt;
    }
    return probability_std / slope;
}

std::optional<double> phase_standard_error(int count_one, int shots) {
    check_counts(count_one, shots);
    const double p_hat = static_cast<double>(count_one) / static_cast<double>(shots);
    const double p_std = std::sqrt(p_hat * (1.0 - p_hat) / static_cast<double>(shots));
    return propagate_phase_error(p_hat, p_std);
}

bool is_quadrant_ambiguous(double estimated_phase) {
    return estimated_phase > kBoundaryTolerance &&
           estimated_phase < kPi - kBoundaryTolerance;
}

void validate_tally(const OutcomeTally& tally) {
    if (tally.count_zero < 0 || tally.count_one < 0) {
        throw std::invalid_argument("tally counts must be non-negative");
    }
    if (tally.count_zero > std::numeric_limits<int>::max() - tally.count_one) {
        throw std::invalid_argument("tally exceeds the supported shot count");
    }
    if (tally.shots() <= 0) {
        throw std::invalid_argument("tally must contain at least one shot");
    }
}

EstimationResult estimate(const OutcomeTally& tally, std::optional<double> actual_phase) {
    validate_tally(tally);

    EstimationResult result;
    result.shots = tally.shots();
    result.probability_of_one =
        static_cast<double>(tally.count_one) / static_cast<double>(result.shots);
    result.estimated_phase = estimate_phase(tally.count_one, result.shots);
    result.standard_error = phase_standard_error(tally.count_one, result.shots);
    if (actual_phase) {
        result.actual_phase = actual_phase;
        result.absolute_error = estimation_error(result.estimated_phase, *actual_phase);
    }
    return result;
}

}  // namespace ramsey_lab

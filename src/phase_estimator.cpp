#include "phase_estimator.hpp"

#include "readout_mitigation.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace ramsey_lab {

namespace {

constexpr double kMinReadoutContrast = 1e-9;

}  // namespace

PhaseEstimator::PhaseEstimator(ExecutionService& service, EstimatorConfig config)
    : service_(service)
    , config_(std::move(config)) {
    if (config_.shots <= 0) {
        throw std::invalid_argument(
            "shots must be positive (got " + std::to_string(config_.shots) + ")");
    }
    if (config_.readout_mitigation) {
        SimpleNoiseConfig readout_only;
        readout_only.readout = *config_.readout_mitigation;
        SimpleNoiseEngine::validate_config(readout_only);
        if (readout_contrast(*config_.readout_mitigation) < kMinReadoutContrast) {
            std::ostringstream oss;
            oss << "readout confusion matrix is singular (p01="
                << config_.readout_mitigation->p_flip0_to_1
                << " p10=" << config_.readout_mitigation->p_flip1_to_0 << ")";
            throw std::invalid_argument(oss.str());
        }
    }
}

void PhaseEstimator::set_log_sink(LogSink sink) {
    log_sink_ = std::move(sink);
}

void PhaseEstimator::log_event(const std::string& category, const std::string& message) const {
    if (log_sink_) {
        log_sink_(ExecutionLog{kRunLevelShot, category, message});
    }
}

EstimationReport PhaseEstimator::run(double theta) const {
    RamseyCircuit circuit;
    circuit.label = config_.label;
    circuit.phase_shift = theta;
    return run(circuit, theta);
}

EstimationReport PhaseEstimator::run(
    const RamseyCircuit& circuit,
    std::optional<double> actual_phase
) const {
    const OutcomeTally tally = service_.run(circuit, config_.shots);
    validate_tally(tally);
    if (tally.shots() != config_.shots) {
        throw std::runtime_error(
            "execution service returned " + std::to_string(tally.shots()) +
            " outcomes for " + std::to_string(config_.shots) + " shots");
    }
    EstimationReport report = evaluate(tally, actual_phase);
    report.label = circuit.label;
    return report;
}

EstimationReport PhaseEstimator::evaluate(
    const OutcomeTally& tally,
    std::optional<double> actual_phase
) const {
    const EstimationResult raw = estimate(tally, actual_phase);

    EstimationReport report;
    report.label = config_.label;
    report.tally = tally;
    report.shots = raw.shots;
    report.raw_probability_of_one = raw.probability_of_one;
    report.probability_of_one = raw.probability_of_one;
    report.estimated_phase = raw.estimated_phase;
    report.standard_error = raw.standard_error;

    if (config_.readout_mitigation) {
        const MitigatedProbability mitigated =
            mitigate_readout(tally, *config_.readout_mitigation);
        const double p_obs = raw.probability_of_one;
        const double p_obs_std =
            std::sqrt(p_obs * (1.0 - p_obs) / static_cast<double>(raw.shots));
        report.readout_mitigated = true;
        report.mitigation_clipped = mitigated.clipped;
        report.probability_of_one = mitigated.probability_of_one;
        report.estimated_phase = estimate_phase_from_probability(mitigated.probability_of_one);
        report.standard_error = propagate_phase_error(
            mitigated.probability_of_one,
            p_obs_std / readout_contrast(*config_.readout_mitigation));

        std::ostringstream oss;
        oss << "raw_p=" << p_obs
            << " mitigated_p=" << mitigated.probability_of_one
            << " clipped=" << (mitigated.clipped ? "true" : "false");
        log_event("Mitigation", oss.str());
    }

    if (actual_phase) {
        report.actual_phase = actual_phase;
        report.absolute_error = estimation_error(report.estimated_phase, *actual_phase);
    }
    report.quadrant_ambiguous = is_quadrant_ambiguous(report.estimated_phase);

    std::ostringstream oss;
    oss << "count_one=" << tally.count_one
        << " shots=" << report.shots
        << " p_hat=" << report.probability_of_one
        << " theta_hat=" << report.estimated_phase;
    if (report.absolute_error) {
        oss << " error=" << *report.absolute_error;
    }
    log_event("Estimate", oss.str());
    if (report.quadrant_ambiguous) {
        std::ostringstream note;
        note << "theta_hat=" << report.estimated_phase
             << " is indistinguishable from " << (2.0 * kPi - report.estimated_phase)
             << " in a single measurement basis";
        log_event("Estimate", note.str());
    }
    return report;
}

}  // namespace ramsey_lab

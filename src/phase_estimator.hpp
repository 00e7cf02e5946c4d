#pragma once

#include <optional>
#include <string>

#include "execution_service.hpp"
#include "noise.hpp"
#include "phase_model.hpp"

namespace ramsey_lab {

struct EstimatorConfig {
    int shots = 1000;
    std::string label = "ramsey";
    // When set, tallies are corrected for this readout confusion before
    // the phase is inverted.
    std::optional<MeasurementNoiseConfig> readout_mitigation;
};

// Record handed to presentation layers: the estimate, plus the ground truth
// and its error when the caller knows the encoded phase.
struct EstimationReport {
    std::string label;
    OutcomeTally tally;
    int shots = 0;
    double raw_probability_of_one = 0.0;
    double probability_of_one = 0.0;
    double estimated_phase = 0.0;
    std::optional<double> actual_phase;
    std::optional<double> absolute_error;
    std::optional<double> standard_error;
    bool readout_mitigated = false;
    bool mitigation_clipped = false;
    // The tally is equally explained by 2 pi - estimated_phase.
    bool quadrant_ambiguous = false;
};

// Drives one Ramsey run through an execution service and inverts the
// resulting tally. Holds no state between calls; the service reference
// must outlive the estimator.
class PhaseEstimator {
  public:
    PhaseEstimator(ExecutionService& service, EstimatorConfig config);

    const EstimatorConfig& config() const { return config_; }

    void set_log_sink(LogSink sink);

    // Executes a circuit encoding `theta` and reports the estimate against
    // theta as ground truth.
    EstimationReport run(double theta) const;

    EstimationReport run(const RamseyCircuit& circuit, std::optional<double> actual_phase) const;

    // Inverts an externally obtained tally.
    EstimationReport evaluate(
        const OutcomeTally& tally,
        std::optional<double> actual_phase = std::nullopt
    ) const;

  private:
    ExecutionService& service_;
    EstimatorConfig config_;
    LogSink log_sink_;

    void log_event(const std::string& category, const std::string& message) const;
};

}  // namespace ramsey_lab

#include "deterministic_execution_service.hpp"

#include "phase_model.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>

DeterministicExecutionService::DeterministicExecutionService(
    std::optional<SimpleNoiseConfig> noise
)
    : noise_(std::move(noise)) {
    if (noise_) {
        SimpleNoiseEngine::validate_config(*noise_);
    }
}

OutcomeTally DeterministicExecutionService::run(const RamseyCircuit& circuit, int shots) {
    if (shots <= 0) {
        throw std::invalid_argument(
            "shots must be positive (got " + std::to_string(shots) + ")");
    }

    const double p = noise_
        ? expected_probability_of_one(circuit.phase_shift, *noise_)
        : ramsey_lab::predicted_probability_of_one(circuit.phase_shift);
    const long long rounded = std::llround(p * static_cast<double>(shots));
    const int count_one = static_cast<int>(std::clamp<long long>(rounded, 0, shots));

    OutcomeTally tally;
    tally.count_one = count_one;
    tally.count_zero = shots - count_one;

    std::ostringstream oss;
    oss << "mode=deterministic label=" << circuit.label
        << " phase=" << circuit.phase_shift
        << " p=" << p
        << " shots=" << shots
        << " count_one=" << tally.count_one;
    emit_log(ExecutionLog{kRunLevelShot, "Execution", oss.str()});
    report_progress(static_cast<std::size_t>(shots));
    return tally;
}

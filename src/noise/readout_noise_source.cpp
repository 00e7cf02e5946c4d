#include "noise/readout_noise_source.hpp"

#include <string>

ReadoutNoiseSource::ReadoutNoiseSource(
    double p_quantum_flip,
    MeasurementNoiseConfig readout
)
    : p_quantum_flip_(p_quantum_flip)
    , readout_(readout) {}

std::shared_ptr<NoiseEngine> ReadoutNoiseSource::clone() const {
    return std::make_shared<ReadoutNoiseSource>(*this);
}

void ReadoutNoiseSource::apply_measurement_noise(
    int& bit,
    RandomStream& rng
) const {
    const bool has_quantum = p_quantum_flip_ > 0.0;
    const bool has_readout =
        readout_.p_flip0_to_1 > 0.0 || readout_.p_flip1_to_0 > 0.0;

    if (!has_quantum && !has_readout) {
        return;
    }

    const int original = bit;
    if (has_quantum) {
        if (rng.uniform(0.0, 1.0) < p_quantum_flip_) {
            bit = (bit == 0) ? 1 : 0;
            log_event(
                "Noise",
                "type=measure_quantum_flip before=" + std::to_string(original) +
                    " after=" + std::to_string(bit) +
                    " p_quantum_flip=" + std::to_string(p_quantum_flip_)
            );
        }
    }

    if (has_readout) {
        const double r = rng.uniform(0.0, 1.0);
        if (bit == 0) {
            if (r < readout_.p_flip0_to_1) {
                bit = 1;
                log_event(
                    "Noise",
                    "type=measure_readout_flip before=0 after=1 p01=" +
                        std::to_string(readout_.p_flip0_to_1)
                );
            }
        } else if (bit == 1) {
            if (r < readout_.p_flip1_to_0) {
                bit = 0;
                log_event(
                    "Noise",
                    "type=measure_readout_flip before=1 after=0 p10=" +
                        std::to_string(readout_.p_flip1_to_0)
                );
            }
        }
    }
}

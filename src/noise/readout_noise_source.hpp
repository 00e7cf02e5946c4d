#pragma once

#include "noise.hpp"

class ReadoutNoiseSource : public NoiseEngine {
  public:
    ReadoutNoiseSource(
        double p_quantum_flip,
        MeasurementNoiseConfig readout
    );

    std::shared_ptr<NoiseEngine> clone() const override;

    void apply_measurement_noise(
        int& bit,
        RandomStream& rng
    ) const override;

  private:
    double p_quantum_flip_;
    MeasurementNoiseConfig readout_;
};

#pragma once

#include "noise.hpp"

class PhaseJitterSource : public NoiseEngine {
  public:
    explicit PhaseJitterSource(double magnitude);

    std::shared_ptr<NoiseEngine> clone() const override;

    void apply_phase_noise(
        double& phase,
        RandomStream& rng
    ) const override;

  private:
    double magnitude_;
};

// Uniform draw from [-magnitude, +magnitude]; zero for a non-positive magnitude.
double sample_phase_kick(double magnitude, RandomStream& rng);

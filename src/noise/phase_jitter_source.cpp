#include "noise/phase_jitter_source.hpp"

#include <sstream>

PhaseJitterSource::PhaseJitterSource(double magnitude) : magnitude_(magnitude) {}

std::shared_ptr<NoiseEngine> PhaseJitterSource::clone() const {
    return std::make_shared<PhaseJitterSource>(*this);
}

void PhaseJitterSource::apply_phase_noise(
    double& phase,
    RandomStream& rng
) const {
    if (magnitude_ <= 0.0) {
        return;
    }
    const double kick = sample_phase_kick(magnitude_, rng);
    const double before = phase;
    phase += kick;

    std::ostringstream oss;
    oss << "type=phase_jitter before=" << before
        << " after=" << phase
        << " magnitude=" << magnitude_;
    log_event("Noise", oss.str());
}

double sample_phase_kick(double magnitude, RandomStream& rng) {
    if (magnitude <= 0.0) {
        return 0.0;
    }
    const double r = rng.uniform(0.0, 1.0);
    return (2.0 * r - 1.0) * magnitude;
}

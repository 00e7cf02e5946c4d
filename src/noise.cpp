#include "noise.hpp"

#include <cmath>
#include <memory>
#include <random>
#include <stdexcept>
#include <utility>

#include "noise/phase_jitter_source.hpp"
#include "noise/readout_noise_source.hpp"

StdRandomStream::StdRandomStream(std::mt19937_64& rng) : rng_(rng) {}

double StdRandomStream::uniform(double lo, double hi) {
    if (hi <= lo) {
        return lo;
    }
    std::uniform_real_distribution<double> dist(lo, hi);
    return dist(rng_);
}

CompositeNoiseEngine::CompositeNoiseEngine(
    std::vector<std::shared_ptr<NoiseEngine>> sources
)
    : sources_(std::move(sources)) {}

std::shared_ptr<NoiseEngine> CompositeNoiseEngine::clone() const {
    std::vector<std::shared_ptr<NoiseEngine>> clones;
    clones.reserve(sources_.size());
    for (const auto& source : sources_) {
        if (source) {
            clones.push_back(source->clone());
        }
    }
    return std::make_shared<CompositeNoiseEngine>(std::move(clones));
}

void CompositeNoiseEngine::add_source(std::shared_ptr<NoiseEngine> source) {
    if (source) {
        sources_.push_back(std::move(source));
    }
}

void CompositeNoiseEngine::set_log_sink(NoiseLogSink sink) {
    for (const auto& source : sources_) {
        source->set_log_sink(sink);
    }
    NoiseEngine::set_log_sink(std::move(sink));
}

void CompositeNoiseEngine::apply_phase_noise(
    double& phase,
    RandomStream& rng
) const {
    for (const auto& source : sources_) {
        source->apply_phase_noise(phase, rng);
    }
}

void CompositeNoiseEngine::apply_measurement_noise(
    int& bit,
    RandomStream& rng
) const {
    for (const auto& source : sources_) {
        source->apply_measurement_noise(bit, rng);
    }
}

SimpleNoiseEngine::SimpleNoiseEngine(SimpleNoiseConfig config)
    : CompositeNoiseEngine(build_sources(config))
    , config_(config) {}

void SimpleNoiseEngine::validate_config(const SimpleNoiseConfig& config) {
    const auto is_probability = [](double p) {
        return p >= 0.0 && p <= 1.0;
    };
    if (!is_probability(config.p_quantum_flip) ||
        !is_probability(config.readout.p_flip0_to_1) ||
        !is_probability(config.readout.p_flip1_to_0)) {
        throw std::invalid_argument("Noise probabilities must be in [0, 1]");
    }
    if (!std::isfinite(config.phase_jitter) || config.phase_jitter < 0.0) {
        throw std::invalid_argument(
            "Phase jitter magnitude must be finite and non-negative");
    }
}

std::vector<std::shared_ptr<NoiseEngine>> SimpleNoiseEngine::build_sources(
    const SimpleNoiseConfig& config
) {
    validate_config(config);
    std::vector<std::shared_ptr<NoiseEngine>> sources;

    if (config.phase_jitter > 0.0) {
        sources.push_back(std::make_shared<PhaseJitterSource>(config.phase_jitter));
    }

    const bool has_measurement =
        config.p_quantum_flip > 0.0 ||
        config.readout.p_flip0_to_1 > 0.0 || config.readout.p_flip1_to_0 > 0.0;
    if (has_measurement) {
        sources.push_back(std::make_shared<ReadoutNoiseSource>(
            config.p_quantum_flip,
            config.readout
        ));
    }

    return sources;
}

double expected_probability_of_one(double theta, const SimpleNoiseConfig& config) {
    // A uniform kick on [-m, m] scales the fringe contrast by sin(m) / m.
    const double m = config.phase_jitter;
    const double contrast = m > 0.0 ? std::sin(m) / m : 1.0;
    double p = 0.5 * (1.0 - contrast * std::cos(theta));

    const double q = config.p_quantum_flip;
    p = p * (1.0 - q) + (1.0 - p) * q;

    const double p01 = config.readout.p_flip0_to_1;
    const double p10 = config.readout.p_flip1_to_0;
    return p * (1.0 - p10) + (1.0 - p) * p01;
}

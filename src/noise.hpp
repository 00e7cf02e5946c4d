#pragma once

#include <functional>
#include <memory>
#include <random>
#include <string>
#include <vector>

// Configuration for classical readout noise on measurement outcomes.
// Probabilities are per bit and must lie in [0, 1].
struct MeasurementNoiseConfig {
    double p_flip0_to_1 = 0.0;
    double p_flip1_to_0 = 0.0;
};

// Aggregated shot-level noise model for a Ramsey run:
// - Random phase kicks accumulated during the free-evolution window.
// - Symmetric bit flips from upstream errors in the measurement basis.
// - Classical readout noise.
struct SimpleNoiseConfig {
    // Maximum absolute phase kick in radians; each shot draws uniformly
    // from [-phase_jitter, +phase_jitter].
    double phase_jitter = 0.0;

    // Symmetric effective bit-flip probability applied before readout.
    double p_quantum_flip = 0.0;

    MeasurementNoiseConfig readout{};
};

class RandomStream {
  public:
    virtual ~RandomStream() = default;
    virtual double uniform(double lo = 0.0, double hi = 1.0) = 0;
};

class StdRandomStream : public RandomStream {
  public:
    explicit StdRandomStream(std::mt19937_64& rng);

    double uniform(double lo, double hi) override;

  private:
    std::mt19937_64& rng_;
};

using NoiseLogSink = std::function<void(const std::string& category, const std::string& message)>;

class NoiseEngine {
  public:
    virtual ~NoiseEngine() = default;

    // Returns an independent copy that can carry its own log sink.
    virtual std::shared_ptr<NoiseEngine> clone() const = 0;

    virtual void set_log_sink(NoiseLogSink sink) { log_sink_ = std::move(sink); }

    // Optional hooks. Default implementations are no-ops to keep engines
    // composable.
    virtual void apply_phase_noise(
        double& /*phase*/,
        RandomStream& /*rng*/
    ) const {}

    virtual void apply_measurement_noise(
        int& /*bit*/,
        RandomStream& /*rng*/
    ) const {}

  protected:
    void log_event(const std::string& category, const std::string& message) const {
        if (log_sink_) {
            log_sink_(category, message);
        }
    }

  private:
    NoiseLogSink log_sink_;
};

class CompositeNoiseEngine : public NoiseEngine {
  public:
    CompositeNoiseEngine() = default;
    explicit CompositeNoiseEngine(
        std::vector<std::shared_ptr<NoiseEngine>> sources
    );

    void add_source(std::shared_ptr<NoiseEngine> source);

    std::shared_ptr<NoiseEngine> clone() const override;

    void set_log_sink(NoiseLogSink sink) override;

    void apply_phase_noise(
        double& phase,
        RandomStream& rng
    ) const override;

    void apply_measurement_noise(
        int& bit,
        RandomStream& rng
    ) const override;

    std::size_t source_count() const { return sources_.size(); }

  private:
    std::vector<std::shared_ptr<NoiseEngine>> sources_;
};

// Simple engine realized as a composition of smaller noise sources.
class SimpleNoiseEngine : public CompositeNoiseEngine {
  public:
    explicit SimpleNoiseEngine(SimpleNoiseConfig config);

    const SimpleNoiseConfig& config() const { return config_; }

    // Throws std::invalid_argument for probabilities outside [0, 1] or a
    // negative / non-finite jitter magnitude.
    static void validate_config(const SimpleNoiseConfig& config);

  private:
    SimpleNoiseConfig config_;

    static std::vector<std::shared_ptr<NoiseEngine>> build_sources(
        const SimpleNoiseConfig& config
    );
};

// Probability of reading "1" for a circuit encoding `theta`, averaged over
// the noise model.
double expected_probability_of_one(double theta, const SimpleNoiseConfig& config);

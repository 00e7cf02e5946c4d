#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "execution_service.hpp"
#include "noise.hpp"

struct SamplingOptions {
    // Base seed used to derive one seed per shot. When empty, seeds come
    // from std::random_device and runs are not reproducible.
    std::optional<std::uint64_t> seed;
    // Explicit per-shot seeds; when non-empty the size must match the
    // requested shot count and `seed` is ignored.
    std::vector<std::uint64_t> shot_seeds;
    // Worker thread cap; 0 uses the hardware concurrency.
    std::size_t max_threads = 0;
    // Forward per-shot noise events to the log sink.
    bool log_noise_events = false;
};

// Draws one Bernoulli outcome per shot from the fringe model p(theta),
// after passing theta through the phase noise and the outcome through the
// measurement noise of the attached noise engine. Each shot owns its random
// stream, so a fixed seed reproduces the tally regardless of the number of
// worker threads.
class SamplingExecutionService : public ExecutionService {
  public:
    explicit SamplingExecutionService(
        std::shared_ptr<const NoiseEngine> noise = nullptr,
        SamplingOptions options = {}
    );

    const SamplingOptions& options() const { return options_; }

    OutcomeTally run(const RamseyCircuit& circuit, int shots) override;

  private:
    std::shared_ptr<const NoiseEngine> noise_;
    SamplingOptions options_;

    std::vector<std::uint64_t> seeds_for(int shots) const;
};

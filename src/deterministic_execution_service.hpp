#pragma once

#include "execution_service.hpp"
#include "noise.hpp"

#include <optional>

// Replaces sampling with its expectation: count_one = round(p * shots), where
// p is the noiseless fringe probability or, with a noise configuration, the
// probability averaged over that noise model.
class DeterministicExecutionService : public ExecutionService {
  public:
    DeterministicExecutionService() = default;
    explicit DeterministicExecutionService(std::optional<SimpleNoiseConfig> noise);

    OutcomeTally run(const RamseyCircuit& circuit, int shots) override;

  private:
    std::optional<SimpleNoiseConfig> noise_;
};

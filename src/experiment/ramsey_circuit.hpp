#pragma once

#include <string>

// Opaque description of a prepared Ramsey sequence (superposition, phase
// accumulation, recombination). Execution services own how it is realized;
// the estimator only forwards it.
struct RamseyCircuit {
    std::string label = "ramsey";
    double phase_shift = 0.0;  // radians
};

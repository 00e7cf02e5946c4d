#include "phase_model.hpp"
#include "service/job.hpp"

#include <iostream>

int main() {
    // Worked example: a quarter-turn phase read out over 1000 shots.
    service::EstimationJobRequest job;
    job.job_id = "demo-deterministic";
    job.device_id = "deterministic";
    job.label = "ramsey-quarter-turn";
    job.phase_shift = ramsey_lab::kPi / 2.0;
    job.shots = 1000;

    service::JobRunner runner;
    const auto expected = runner.run(job);
    std::cout << service::to_json(expected) << '\n';

    job.job_id = "demo-sampled";
    job.device_id = "sampler";
    job.seed = 2024;
    SimpleNoiseConfig noise;
    noise.readout.p_flip0_to_1 = 0.02;
    noise.readout.p_flip1_to_0 = 0.05;
    job.noise_config = noise;
    job.mitigate_readout = true;
    const auto sampled = runner.run(job);
    std::cout << service::to_json(sampled) << '\n';

    std::cout << "Logs:\n";
    for (const auto& log : sampled.logs) {
        std::cout << "[" << log.category << "] " << log.message << '\n';
    }

    return sampled.status == service::JobStatus::Completed ? 0 : 1;
}

#pragma once

#include "experiment/records.types.hpp"
#include "noise.hpp"
#include "phase_estimator.hpp"
#include "progress_reporter.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace service {

enum class JobStatus {
    Pending,
    Running,
    Completed,
    Failed,
};

enum class BackendKind {
    kSampling,
    kDeterministic,
};

struct EstimationJobRequest {
    std::string job_id;
    std::string device_id = "sampler";
    std::string label = "ramsey";
    double phase_shift = 0.0;
    // Ground truth for the error report; defaults to phase_shift when the
    // request is built for a simulation.
    std::optional<double> actual_phase;
    // Zero means "not supplied" and is rejected by validation.
    int shots = 0;
    std::size_t max_threads = 0;
    std::optional<std::uint64_t> seed;
    std::map<std::string, std::string> metadata;
    std::optional<SimpleNoiseConfig> noise_config;
    bool mitigate_readout = false;
    bool log_noise_events = false;
};

struct EstimationJobResult {
    std::string job_id;
    JobStatus status = JobStatus::Pending;
    OutcomeTally tally;
    std::optional<ramsey_lab::EstimationReport> report;
    std::vector<ExecutionLog> logs;
    double elapsed_time = 0.0;
    std::string message;
};

BackendKind backend_for_device(const std::string& device_id);

std::string to_json(const EstimationJobRequest& job);
std::string to_json(const ramsey_lab::EstimationReport& report);
std::string to_json(const EstimationJobResult& result);
std::string status_to_string(JobStatus status);

class JobRunner {
  public:
    EstimationJobResult run(
        const EstimationJobRequest& job,
        std::size_t max_threads = 0,
        ramsey_lab::ProgressReporter* reporter = nullptr
    );
};

}  // namespace service

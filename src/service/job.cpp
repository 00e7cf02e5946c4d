#include "service/job.hpp"
#include "service/job_validation.hpp"

#include "deterministic_execution_service.hpp"
#include "sampling_execution_service.hpp"

#include <chrono>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace service {

namespace {

std::string escape_json(const std::string& str) {
    std::ostringstream out;
    for (const char ch : str) {
        switch (ch) {
            case '"':
                out << "\\\"";
                break;
            case '\\':
                out << "\\\\";
                break;
            case '\n':
                out << "\\n";
                break;
            case '\r':
                out << "\\r";
                break;
            case '\t':
                out << "\\t";
                break;
            default:
                out << ch;
        }
    }
    return out.str();
}

void append_optional_double(const std::optional<double>& value, std::ostringstream& out) {
    if (value) {
        out << *value;
    } else {
        out << "null";
    }
}

void append_readout_json(const MeasurementNoiseConfig& readout, std::ostringstream& out) {
    out << "{\"p_flip0_to_1\":" << readout.p_flip0_to_1
        << ",\"p_flip1_to_0\":" << readout.p_flip1_to_0 << '}';
}

void append_noise_json(const SimpleNoiseConfig& noise, std::ostringstream& out) {
    out << "{\"phase_jitter\":" << noise.phase_jitter
        << ",\"p_quantum_flip\":" << noise.p_quantum_flip
        << ",\"readout\":";
    append_readout_json(noise.readout, out);
    out << '}';
}

void append_tally_json(const OutcomeTally& tally, std::ostringstream& out) {
    out << "{\"count_zero\":" << tally.count_zero
        << ",\"count_one\":" << tally.count_one << '}';
}

void append_report_json(const ramsey_lab::EstimationReport& report, std::ostringstream& out) {
    out << '{';
    out << "\"label\":\"" << escape_json(report.label) << "\",";
    out << "\"shots\":" << report.shots << ',';
    out << "\"tally\":";
    append_tally_json(report.tally, out);
    out << ",\"raw_probability_of_one\":" << report.raw_probability_of_one;
    out << ",\"probability_of_one\":" << report.probability_of_one;
    out << ",\"estimated_phase\":" << report.estimated_phase;
    out << ",\"actual_phase\":";
    append_optional_double(report.actual_phase, out);
    out << ",\"absolute_error\":";
    append_optional_double(report.absolute_error, out);
    out << ",\"standard_error\":";
    append_optional_double(report.standard_error, out);
    out << ",\"readout_mitigated\":" << (report.readout_mitigated ? "true" : "false");
    out << ",\"mitigation_clipped\":" << (report.mitigation_clipped ? "true" : "false");
    out << ",\"quadrant_ambiguous\":" << (report.quadrant_ambiguous ? "true" : "false");
    out << '}';
}

std::unique_ptr<ExecutionService> make_execution_service(
    const EstimationJobRequest& job,
    std::size_t threads
) {
    if (backend_for_device(job.device_id) == BackendKind::kDeterministic) {
        return std::make_unique<DeterministicExecutionService>(job.noise_config);
    }
    std::shared_ptr<const NoiseEngine> noise;
    if (job.noise_config) {
        noise = std::make_shared<SimpleNoiseEngine>(*job.noise_config);
    }
    SamplingOptions options;
    options.seed = job.seed;
    options.max_threads = threads;
    options.log_noise_events = job.log_noise_events;
    return std::make_unique<SamplingExecutionService>(std::move(noise), std::move(options));
}

}  // namespace

BackendKind backend_for_device(const std::string& device_id) {
    if (device_id == "deterministic") {
        return BackendKind::kDeterministic;
    }
    return BackendKind::kSampling;
}

std::string to_json(const EstimationJobRequest& job) {
    std::ostringstream out;
    out << std::setprecision(15);
    out << '{';
    out << "\"job_id\":\"" << escape_json(job.job_id) << "\",";
    out << "\"device_id\":\"" << escape_json(job.device_id) << "\",";
    out << "\"label\":\"" << escape_json(job.label) << "\",";
    out << "\"phase_shift\":" << job.phase_shift << ',';
    out << "\"actual_phase\":";
    append_optional_double(job.actual_phase, out);
    out << ',';
    out << "\"shots\":" << job.shots << ',';
    if (job.max_threads > 0) {
        out << "\"max_threads\":" << job.max_threads << ",";
    }
    if (job.seed) {
        out << "\"seed\":" << *job.seed << ",";
    }
    if (job.noise_config) {
        out << "\"noise\":";
        append_noise_json(*job.noise_config, out);
        out << ',';
    }
    out << "\"mitigate_readout\":" << (job.mitigate_readout ? "true" : "false") << ',';
    out << "\"metadata\":{";
    bool first_entry = true;
    for (const auto& [key, value] : job.metadata) {
        if (!first_entry) {
            out << ',';
        }
        first_entry = false;
        out << "\"" << escape_json(key) << "\":\"" << escape_json(value) << "\"";
    }
    out << "}";
    out << '}';
    return out.str();
}

std::string to_json(const ramsey_lab::EstimationReport& report) {
    std::ostringstream out;
    out << std::setprecision(15);
    append_report_json(report, out);
    return out.str();
}

std::string to_json(const EstimationJobResult& result) {
    std::ostringstream out;
    out << std::setprecision(15);
    out << '{';
    out << "\"job_id\":\"" << escape_json(result.job_id) << "\",";
    out << "\"status\":\"" << status_to_string(result.status) << "\",";
    out << "\"tally\":";
    append_tally_json(result.tally, out);
    out << ",\"report\":";
    if (result.report) {
        append_report_json(*result.report, out);
    } else {
        out << "null";
    }
    out << ",\"elapsed_time\":" << result.elapsed_time;
    out << ",\"message\":\"" << escape_json(result.message) << "\"";
    out << '}';
    return out.str();
}

std::string status_to_string(JobStatus status) {
    switch (status) {
        case JobStatus::Pending:
            return "pending";
        case JobStatus::Running:
            return "running";
        case JobStatus::Completed:
            return "completed";
        case JobStatus::Failed:
            return "failed";
    }
    return "unknown";
}

EstimationJobResult JobRunner::run(
    const EstimationJobRequest& job,
    std::size_t max_threads,
    ramsey_lab::ProgressReporter* reporter
) {
    auto start = std::chrono::steady_clock::now();
    EstimationJobResult result;
    result.job_id = job.job_id;

    auto sink = [&result, reporter](const ExecutionLog& log) {
        result.logs.push_back(log);
        if (reporter) {
            reporter->record_log(log);
        }
    };

    try {
        const ValidatorRegistry validators = make_validator_registry_for(job);
        validators.run_all_validators(job);

        const std::size_t threads = max_threads > 0 ? max_threads : job.max_threads;
        std::unique_ptr<ExecutionService> execution = make_execution_service(job, threads);
        execution->set_log_sink(sink);
        execution->set_progress_reporter(reporter);

        ramsey_lab::EstimatorConfig config;
        config.shots = job.shots;
        config.label = job.label;
        if (job.mitigate_readout && job.noise_config) {
            config.readout_mitigation = job.noise_config->readout;
        }
        ramsey_lab::PhaseEstimator estimator(*execution, config);
        estimator.set_log_sink(sink);

        RamseyCircuit circuit;
        circuit.label = job.label;
        circuit.phase_shift = job.phase_shift;
        const std::optional<double> truth =
            job.actual_phase ? job.actual_phase : std::optional<double>(job.phase_shift);

        ramsey_lab::EstimationReport report = estimator.run(circuit, truth);
        result.tally = report.tally;
        result.report = std::move(report);
        result.status = JobStatus::Completed;
    } catch (const std::exception& ex) {
        result.status = JobStatus::Failed;
        result.message = ex.what();
        sink(ExecutionLog{kRunLevelShot, "Job", std::string("failed: ") + ex.what()});
    }
    auto end = std::chrono::steady_clock::now();
    result.elapsed_time = std::chrono::duration<double>(end - start).count();
    return result;
}

}  // namespace service

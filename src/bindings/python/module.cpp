#include "noise.hpp"
#include "phase_model.hpp"
#include "service/job.hpp"
#include "service/job_service.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace py = pybind11;

namespace {

void fill_measurement_noise_config(const py::dict& src, MeasurementNoiseConfig& dst) {
    if (src.contains("p_flip0_to_1")) {
        dst.p_flip0_to_1 = py::cast<double>(src["p_flip0_to_1"]);
    }
    if (src.contains("p_flip1_to_0")) {
        dst.p_flip1_to_0 = py::cast<double>(src["p_flip1_to_0"]);
    }
}

SimpleNoiseConfig noise_config_from_dict(const py::dict& noise) {
    SimpleNoiseConfig cfg;
    if (noise.contains("phase_jitter")) {
        cfg.phase_jitter = py::cast<double>(noise["phase_jitter"]);
    }
    if (noise.contains("p_quantum_flip")) {
        cfg.p_quantum_flip = py::cast<double>(noise["p_quantum_flip"]);
    }
    if (noise.contains("readout")) {
        fill_measurement_noise_config(py::cast<py::dict>(noise["readout"]), cfg.readout);
    }
    return cfg;
}

service::EstimationJobRequest build_job_request(const py::dict& job_obj) {
    service::EstimationJobRequest job;
    if (!job_obj.contains("shots") || job_obj["shots"].is_none()) {
        throw std::invalid_argument("job must supply 'shots'");
    }
    job.shots = py::cast<int>(job_obj["shots"]);

    if (job_obj.contains("job_id")) {
        job.job_id = py::cast<std::string>(job_obj["job_id"]);
    }
    if (job_obj.contains("device_id")) {
        job.device_id = py::cast<std::string>(job_obj["device_id"]);
    }
    if (job_obj.contains("label")) {
        job.label = py::cast<std::string>(job_obj["label"]);
    }
    if (job_obj.contains("phase_shift")) {
        job.phase_shift = py::cast<double>(job_obj["phase_shift"]);
    }
    if (job_obj.contains("actual_phase") && !job_obj["actual_phase"].is_none()) {
        job.actual_phase = py::cast<double>(job_obj["actual_phase"]);
    }
    if (job_obj.contains("max_threads")) {
        job.max_threads = py::cast<std::size_t>(job_obj["max_threads"]);
    }
    if (job_obj.contains("seed") && !job_obj["seed"].is_none()) {
        job.seed = py::cast<std::uint64_t>(job_obj["seed"]);
    }
    if (job_obj.contains("metadata")) {
        job.metadata = py::cast<std::map<std::string, std::string>>(job_obj["metadata"]);
    }
    if (job_obj.contains("noise") && !job_obj["noise"].is_none()) {
        job.noise_config = noise_config_from_dict(py::cast<py::dict>(job_obj["noise"]));
    }
    if (job_obj.contains("mitigate_readout")) {
        job.mitigate_readout = py::cast<bool>(job_obj["mitigate_readout"]);
    }
    if (job_obj.contains("log_noise_events")) {
        job.log_noise_events = py::cast<bool>(job_obj["log_noise_events"]);
    }
    return job;
}

py::object optional_to_py(const std::optional<double>& value) {
    if (value) {
        return py::float_(*value);
    }
    return py::none();
}

py::dict tally_to_dict(const OutcomeTally& tally) {
    py::dict out;
    out["count_zero"] = tally.count_zero;
    out["count_one"] = tally.count_one;
    return out;
}

py::dict report_to_dict(const ramsey_lab::EstimationReport& report) {
    py::dict out;
    out["label"] = report.label;
    out["shots"] = report.shots;
    out["tally"] = tally_to_dict(report.tally);
    out["raw_probability_of_one"] = report.raw_probability_of_one;
    out["probability_of_one"] = report.probability_of_one;
    out["estimated_phase"] = report.estimated_phase;
    out["actual_phase"] = optional_to_py(report.actual_phase);
    out["absolute_error"] = optional_to_py(report.absolute_error);
    out["standard_error"] = optional_to_py(report.standard_error);
    out["readout_mitigated"] = report.readout_mitigated;
    out["mitigation_clipped"] = report.mitigation_clipped;
    out["quadrant_ambiguous"] = report.quadrant_ambiguous;
    return out;
}

py::dict execution_log_to_dict(const ExecutionLog& entry) {
    py::dict log;
    log["shot"] = entry.shot;
    log["category"] = entry.category;
    log["message"] = entry.message;
    return log;
}

py::dict job_result_to_dict(const service::EstimationJobResult& result) {
    py::dict out;
    out["job_id"] = result.job_id;
    out["status"] = service::status_to_string(result.status);
    out["elapsed_time"] = result.elapsed_time;
    out["tally"] = tally_to_dict(result.tally);
    if (result.report) {
        out["report"] = report_to_dict(*result.report);
    } else {
        out["report"] = py::none();
    }
    out["message"] = result.message;
    py::list log_list;
    for (const auto& entry : result.logs) {
        log_list.append(execution_log_to_dict(entry));
    }
    out["logs"] = log_list;
    return out;
}

service::JobService& job_service() {
    static service::JobService instance;
    return instance;
}

py::dict estimate_tally(int count_zero, int count_one, std::optional<double> actual_phase) {
    OutcomeTally tally;
    tally.count_zero = count_zero;
    tally.count_one = count_one;
    const ramsey_lab::EstimationResult result = ramsey_lab::estimate(tally, actual_phase);
    py::dict out;
    out["shots"] = result.shots;
    out["probability_of_one"] = result.probability_of_one;
    out["estimated_phase"] = result.estimated_phase;
    out["actual_phase"] = optional_to_py(result.actual_phase);
    out["absolute_error"] = optional_to_py(result.absolute_error);
    out["standard_error"] = optional_to_py(result.standard_error);
    return out;
}

py::dict submit_job(const py::dict& job_obj) {
    service::EstimationJobRequest job = build_job_request(job_obj);
    service::EstimationJobResult result;
    {
        py::gil_scoped_release release;
        service::JobRunner runner;
        result = runner.run(job);
    }
    return job_result_to_dict(result);
}

py::dict submit_job_async(const py::dict& job_obj) {
    service::EstimationJobRequest job = build_job_request(job_obj);
    const std::size_t threads = job.max_threads;
    const std::string job_id = job_service().submit(std::move(job), threads);
    py::dict out;
    out["job_id"] = job_id;
    return out;
}

py::dict job_status(const std::string& job_id) {
    const service::JobStatusSnapshot snapshot = job_service().status(job_id);
    py::dict out;
    out["job_id"] = job_id;
    out["status"] = service::status_to_string(snapshot.status);
    out["percent_complete"] = snapshot.percent_complete;
    out["message"] = snapshot.message;
    py::list logs;
    for (const auto& entry : snapshot.recent_logs) {
        logs.append(execution_log_to_dict(entry));
    }
    out["recent_logs"] = logs;
    return out;
}

py::dict job_result(const std::string& job_id, double timeout_seconds) {
    const std::chrono::milliseconds timeout = service::timeout_from_seconds(timeout_seconds);
    std::optional<service::EstimationJobResult> result;
    {
        py::gil_scoped_release release;
        result = job_service().wait_for_result(job_id, timeout);
    }
    if (!result) {
        throw std::runtime_error("job result not available yet");
    }
    return job_result_to_dict(*result);
}

}  // namespace

PYBIND11_MODULE(_ramsey_lab, m) {
    m.doc() = "Ramsey phase estimation bindings";
    m.def(
        "predicted_probability_of_one",
        &ramsey_lab::predicted_probability_of_one,
        py::arg("theta"),
        "Fringe model p(theta) = (1 - cos theta) / 2."
    );
    m.def(
        "estimate_phase",
        &ramsey_lab::estimate_phase,
        py::arg("count_one"),
        py::arg("shots"),
        "Principal-value phase estimate in [0, pi]; raises ValueError for malformed tallies."
    );
    m.def(
        "estimation_error",
        &ramsey_lab::estimation_error,
        py::arg("estimated"),
        py::arg("actual")
    );
    m.def(
        "estimate",
        &estimate_tally,
        py::arg("count_zero"),
        py::arg("count_one"),
        py::arg("actual_phase") = py::none(),
        "Estimate the phase from a tally and report error statistics."
    );
    m.def(
        "submit_job",
        &submit_job,
        py::arg("job"),
        "Run an estimation job synchronously. The job dict mirrors service::EstimationJobRequest."
    );
    m.def(
        "submit_job_async",
        &submit_job_async,
        py::arg("job"),
        "Submit an estimation job asynchronously and receive a job_id immediately."
    );
    m.def(
        "job_status",
        &job_status,
        py::arg("job_id"),
        "Query the current status snapshot for an async job."
    );
    m.def(
        "job_result",
        &job_result,
        py::arg("job_id"),
        py::arg("timeout_seconds") = 0.0,
        "Fetch the final result for an async job, waiting up to timeout_seconds (raises if not ready)."
    );
}

#pragma once

#include "service/job.hpp"

#include "progress_reporter.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

// Thread-safe progress sink shared between a running job and status queries.
// Keeps only the most recent logs.
class JobProgressReporter final : public ramsey_lab::ProgressReporter {
  public:
    JobProgressReporter() = default;

    void set_total_steps(std::size_t total_steps) override {
        std::lock_guard<std::mutex> lock(mutex_);
        total_steps_ = total_steps;
    }

    void increment_completed_steps(std::size_t delta = 1) override {
        completed_steps_.fetch_add(delta, std::memory_order_relaxed);
    }

    void record_log(const ExecutionLog& log) override {
        std::lock_guard<std::mutex> lock(mutex_);
        logs_.push_back(log);
        if (logs_.size() > kMaxLogs) {
            logs_.erase(logs_.begin());
        }
    }

    std::size_t total_steps() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return total_steps_;
    }

    std::size_t completed_steps() const {
        return completed_steps_.load(std::memory_order_relaxed);
    }

    std::vector<ExecutionLog> recent_logs() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return logs_;
    }

  private:
    static constexpr std::size_t kMaxLogs = 8;

    mutable std::mutex mutex_;
    std::vector<ExecutionLog> logs_;
    std::size_t total_steps_ = 0;
    std::atomic<std::size_t> completed_steps_{0};
};

namespace service {

struct JobStatusSnapshot {
    JobStatus status = JobStatus::Pending;
    double percent_complete = 0.0;
    std::string message;
    std::vector<ExecutionLog> recent_logs;
};

// Converts a caller-supplied timeout in seconds. Throws std::invalid_argument
// for negative, non-finite or unrepresentable values.
std::chrono::milliseconds timeout_from_seconds(double seconds);

class JobService {
  public:
    JobService();
    // Joins every worker that is still running.
    ~JobService();

    JobService(const JobService&) = delete;
    JobService& operator=(const JobService&) = delete;

    // Submit a job for asynchronous execution. Returns the generated job ID.
    std::string submit(EstimationJobRequest job, std::size_t max_threads = 0);

    // Poll for the final result if the job is complete.
    std::optional<EstimationJobResult> poll_result(const std::string& job_id) const;

    // Block until the job finishes or the timeout expires.
    std::optional<EstimationJobResult> wait_for_result(
        const std::string& job_id,
        std::chrono::milliseconds timeout
    ) const;

    // Query the current status snapshot for the given job.
    JobStatusSnapshot status(const std::string& job_id) const;

    // Worker threads not yet joined. Finished workers are joined on the
    // next submit.
    std::size_t retained_workers() const;

  private:
    struct JobEntry {
        EstimationJobRequest request;
        EstimationJobResult result;
        std::shared_ptr<JobProgressReporter> reporter;
        std::atomic<JobStatus> status{JobStatus::Pending};
        mutable std::mutex result_mutex;
        mutable std::condition_variable finished;
        std::atomic<bool> worker_done{false};
    };

    struct Worker {
        std::shared_ptr<JobEntry> entry;
        std::thread thread;
    };

    std::shared_ptr<JobEntry> find_entry(const std::string& job_id) const;
    void run_entry(const std::shared_ptr<JobEntry>& entry, std::size_t max_threads);
    // Caller holds mutex_.
    void reap_finished_workers();

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<JobEntry>> jobs_;
    std::vector<Worker> workers_;
    std::atomic<std::uint64_t> id_counter_{0};
    JobRunner runner_;
};

}  // namespace service

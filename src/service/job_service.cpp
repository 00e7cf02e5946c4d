#include "service/job_service.hpp"

#include "progress_reporter.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <limits>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace service {

namespace {

bool is_finished(JobStatus status) {
    return status == JobStatus::Completed || status == JobStatus::Failed;
}

std::size_t compute_total_steps(const EstimationJobRequest& job) {
    return static_cast<std::size_t>(std::max(1, job.shots));
}

}  // namespace

JobService::JobService()
    : id_counter_(0) {}

JobService::~JobService() {
    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        workers.swap(workers_);
    }
    for (auto& worker : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

std::chrono::milliseconds timeout_from_seconds(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0.0) {
        throw std::invalid_argument("timeout must be a finite, non-negative number of seconds");
    }
    const double millis = seconds * 1000.0;
    if (millis >= static_cast<double>(std::numeric_limits<std::int32_t>::max())) {
        throw std::invalid_argument("timeout is too large");
    }
    return std::chrono::milliseconds(static_cast<std::int64_t>(millis));
}

void JobService::run_entry(const std::shared_ptr<JobEntry>& entry, std::size_t max_threads) {
    entry->status.store(JobStatus::Running, std::memory_order_relaxed);
    entry->reporter->set_total_steps(compute_total_steps(entry->request));
    const auto start = std::chrono::steady_clock::now();
    EstimationJobResult result;
    try {
        const std::size_t threads =
            max_threads > 0 ? max_threads : entry->request.max_threads;
        result = runner_.run(entry->request, threads, entry->reporter.get());
    } catch (const std::exception& ex) {
        result.job_id = entry->request.job_id;
        result.status = JobStatus::Failed;
        result.message = ex.what();
    }
    const auto end = std::chrono::steady_clock::now();
    result.elapsed_time = std::chrono::duration<double>(end - start).count();
    {
        std::lock_guard<std::mutex> guard(entry->result_mutex);
        entry->result = std::move(result);
        entry->status.store(entry->result.status, std::memory_order_release);
    }
    entry->finished.notify_all();
    entry->worker_done.store(true, std::memory_order_release);
}

void JobService::reap_finished_workers() {
    auto it = workers_.begin();
    while (it != workers_.end()) {
        if (it->entry->worker_done.load(std::memory_order_acquire)) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

std::string JobService::submit(EstimationJobRequest job, std::size_t max_threads) {
    const std::uint64_t seq = id_counter_.fetch_add(1, std::memory_order_relaxed);
    const std::string job_id = "job-" + std::to_string(seq);
    job.job_id = job_id;

    auto entry = std::make_shared<JobEntry>();
    entry->request = std::move(job);
    entry->reporter = std::make_shared<JobProgressReporter>();
    entry->result.job_id = job_id;

    std::lock_guard<std::mutex> lock(mutex_);
    reap_finished_workers();
    workers_.reserve(workers_.size() + 1);
    // The job becomes visible only once its worker exists.
    std::thread thread([this, entry, max_threads]() { run_entry(entry, max_threads); });
    workers_.push_back(Worker{entry, std::move(thread)});
    jobs_.emplace(job_id, entry);

    return job_id;
}

std::size_t JobService::retained_workers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return workers_.size();
}

std::shared_ptr<JobService::JobEntry> JobService::find_entry(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = jobs_.find(job_id);
    if (it == jobs_.end()) {
        return nullptr;
    }
    return it->second;
}

std::optional<EstimationJobResult> JobService::poll_result(const std::string& job_id) const {
    const std::shared_ptr<JobEntry> entry = find_entry(job_id);
    if (!entry) {
        return std::nullopt;
    }
    if (!is_finished(entry->status.load(std::memory_order_acquire))) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> guard(entry->result_mutex);
    return entry->result;
}

std::optional<EstimationJobResult> JobService::wait_for_result(
    const std::string& job_id,
    std::chrono::milliseconds timeout
) const {
    const std::shared_ptr<JobEntry> entry = find_entry(job_id);
    if (!entry) {
        return std::nullopt;
    }
    std::unique_lock<std::mutex> guard(entry->result_mutex);
    const bool done = entry->finished.wait_for(guard, timeout, [&entry]() {
        return is_finished(entry->status.load(std::memory_order_acquire));
    });
    if (!done) {
        return std::nullopt;
    }
    return entry->result;
}

JobStatusSnapshot JobService::status(const std::string& job_id) const {
    JobStatusSnapshot snapshot;
    const std::shared_ptr<JobEntry> entry = find_entry(job_id);
    if (!entry) {
        snapshot.status = JobStatus::Failed;
        snapshot.message = std::string("job_id not found");
        return snapshot;
    }
    snapshot.status = entry->status.load(std::memory_order_acquire);
    const std::size_t total = entry->reporter->total_steps();
    const std::size_t completed = entry->reporter->completed_steps();
    snapshot.percent_complete = total == 0 ? 0.0
        : std::min(1.0, static_cast<double>(completed) / static_cast<double>(total));
    snapshot.recent_logs = entry->reporter->recent_logs();
    {
        std::lock_guard<std::mutex> guard(entry->result_mutex);
        snapshot.message = entry->result.message;
    }
    return snapshot;
}

}  // namespace service

#include "service/job_service.hpp"

#include "phase_model.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

using service::EstimationJobRequest;
using service::EstimationJobResult;
using service::JobService;
using service::JobStatus;

namespace {

EstimationJobRequest make_simple_job() {
    EstimationJobRequest job;
    job.device_id = "sampler";
    job.label = "async";
    job.phase_shift = ramsey_lab::kPi / 2.0;
    job.shots = 200;
    job.seed = 17;
    return job;
}

}  // namespace

TEST(ServiceJobServiceTests, SubmitsAsyncJobAndReturnsResult) {
    JobService service;
    EstimationJobRequest job = make_simple_job();

    const std::string job_id = service.submit(job, 1);
    ASSERT_FALSE(job_id.empty());

    auto snapshot = service.status(job_id);
    EXPECT_NE(snapshot.message, "job_id not found");

    std::optional<EstimationJobResult> result;
    for (int attempt = 0; attempt < 200 && !result; ++attempt) {
        result = service.poll_result(job_id);
        if (!result) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, JobStatus::Completed);
    EXPECT_EQ(result->job_id, job_id);
    EXPECT_EQ(result->tally.shots(), 200);
    ASSERT_TRUE(result->report.has_value());
    EXPECT_GE(result->report->estimated_phase, 0.0);
    EXPECT_LE(result->report->estimated_phase, ramsey_lab::kPi);
}

TEST(ServiceJobServiceTests, WaitForResultBlocksUntilDone) {
    JobService service;
    const std::string job_id = service.submit(make_simple_job());

    const auto result = service.wait_for_result(job_id, std::chrono::seconds(10));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, JobStatus::Completed);

    const auto snapshot = service.status(job_id);
    EXPECT_EQ(snapshot.status, JobStatus::Completed);
    EXPECT_DOUBLE_EQ(snapshot.percent_complete, 1.0);
    EXPECT_FALSE(snapshot.recent_logs.empty());
}

TEST(ServiceJobServiceTests, FailedJobCarriesMessage) {
    JobService service;
    EstimationJobRequest job = make_simple_job();
    job.shots = -1;

    const std::string job_id = service.submit(job);
    const auto result = service.wait_for_result(job_id, std::chrono::seconds(10));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, JobStatus::Failed);
    EXPECT_NE(result->message.find("shots must be positive"), std::string::npos);

    const auto snapshot = service.status(job_id);
    EXPECT_EQ(snapshot.status, JobStatus::Failed);
    EXPECT_EQ(snapshot.message, result->message);
}

TEST(ServiceJobServiceTests, AssignsSequentialIds) {
    JobService service;
    const std::string first = service.submit(make_simple_job());
    const std::string second = service.submit(make_simple_job());
    EXPECT_EQ(first, "job-0");
    EXPECT_EQ(second, "job-1");
}

TEST(ServiceJobServiceTests, UnknownJobReportsNotFound) {
    JobService service;
    const auto snapshot = service.status("job-404");
    EXPECT_EQ(snapshot.status, JobStatus::Failed);
    EXPECT_EQ(snapshot.message, "job_id not found");
    EXPECT_FALSE(service.poll_result("job-404").has_value());
    EXPECT_FALSE(service.wait_for_result("job-404", std::chrono::milliseconds(1)).has_value());
}

TEST(ServiceJobServiceTests, JoinsFinishedWorkersOnSubmit) {
    JobService service;
    EstimationJobRequest job = make_simple_job();
    job.device_id = "deterministic";

    for (int i = 0; i < 64; ++i) {
        const std::string job_id = service.submit(job);
        const auto result = service.wait_for_result(job_id, std::chrono::seconds(10));
        ASSERT_TRUE(result.has_value());
        EXPECT_LE(service.retained_workers(), 4u);
    }
    for (int attempt = 0; attempt < 200; ++attempt) {
        const std::string job_id = service.submit(job);
        ASSERT_TRUE(service.wait_for_result(job_id, std::chrono::seconds(10)).has_value());
        if (service.retained_workers() <= 1u) {
            break;
        }
    }
    EXPECT_LE(service.retained_workers(), 1u);
}

TEST(ServiceJobServiceTests, TimeoutConversionRejectsBadValues) {
    EXPECT_EQ(service::timeout_from_seconds(0.0), std::chrono::milliseconds(0));
    EXPECT_EQ(service::timeout_from_seconds(1.5), std::chrono::milliseconds(1500));
    EXPECT_THROW(service::timeout_from_seconds(-1.0), std::invalid_argument);
    EXPECT_THROW(
        service::timeout_from_seconds(std::numeric_limits<double>::quiet_NaN()),
        std::invalid_argument
    );
    EXPECT_THROW(
        service::timeout_from_seconds(std::numeric_limits<double>::infinity()),
        std::invalid_argument
    );
    EXPECT_THROW(service::timeout_from_seconds(1e300), std::invalid_argument);
}

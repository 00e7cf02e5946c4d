#include "phase_model.hpp"
#include "service/job.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using ramsey_lab::kPi;

namespace {

class RecordingReporter final : public ramsey_lab::ProgressReporter {
  public:
    void set_total_steps(std::size_t /*total_steps*/) override {}
    void increment_completed_steps(std::size_t delta) override { completed += delta; }
    void record_log(const ExecutionLog& log) override { logs.push_back(log); }

    std::size_t completed = 0;
    std::vector<ExecutionLog> logs;
};

service::EstimationJobRequest make_quarter_turn_job() {
    service::EstimationJobRequest job;
    job.job_id = "job-test";
    job.device_id = "deterministic";
    job.label = "quarter";
    job.phase_shift = kPi / 2.0;
    job.shots = 1000;
    return job;
}

TEST(ServiceApiTests, BackendSelectionRespectsDevices) {
    EXPECT_EQ(service::backend_for_device("deterministic"), service::BackendKind::kDeterministic);
    EXPECT_EQ(service::backend_for_device("sampler"), service::BackendKind::kSampling);
    EXPECT_EQ(service::backend_for_device("anything-else"), service::BackendKind::kSampling);
}

TEST(ServiceApiTests, JobRequestJson) {
    service::EstimationJobRequest job = make_quarter_turn_job();
    job.seed = 42;
    job.metadata = {{"user", "alice"}};
    SimpleNoiseConfig noise;
    noise.readout.p_flip0_to_1 = 0.25;
    job.noise_config = noise;

    const std::string json = service::to_json(job);
    EXPECT_NE(json.find("\"job_id\":\"job-test\""), std::string::npos);
    EXPECT_NE(json.find("\"device_id\":\"deterministic\""), std::string::npos);
    EXPECT_NE(json.find("\"label\":\"quarter\""), std::string::npos);
    EXPECT_NE(json.find("\"shots\":1000"), std::string::npos);
    EXPECT_NE(json.find("\"seed\":42"), std::string::npos);
    EXPECT_NE(json.find("\"actual_phase\":null"), std::string::npos);
    EXPECT_NE(json.find("\"p_flip0_to_1\":0.25"), std::string::npos);
    EXPECT_NE(json.find("\"mitigate_readout\":false"), std::string::npos);
    EXPECT_NE(json.find("\"user\":\"alice\""), std::string::npos);
}

TEST(ServiceApiTests, JsonEscapesStrings) {
    service::EstimationJobRequest job = make_quarter_turn_job();
    job.label = "say \"hi\"\n";
    const std::string json = service::to_json(job);
    EXPECT_NE(json.find("\"label\":\"say \\\"hi\\\"\\n\""), std::string::npos);
}

TEST(ServiceApiTests, JobRunnerEstimatesPhase) {
    service::JobRunner runner;
    RecordingReporter reporter;
    const auto result = runner.run(make_quarter_turn_job(), 0, &reporter);

    ASSERT_EQ(result.status, service::JobStatus::Completed) << result.message;
    EXPECT_EQ(result.job_id, "job-test");
    EXPECT_EQ(result.tally.count_one, 500);
    ASSERT_TRUE(result.report.has_value());
    EXPECT_NEAR(result.report->estimated_phase, kPi / 2.0, 1e-9);
    ASSERT_TRUE(result.report->absolute_error.has_value());
    EXPECT_LT(*result.report->absolute_error, 1e-9);
    EXPECT_EQ(reporter.completed, 1000u);
    EXPECT_EQ(reporter.logs.size(), result.logs.size());
    EXPECT_FALSE(result.logs.empty());
}

TEST(ServiceApiTests, JobRunnerUsesExplicitGroundTruth) {
    service::EstimationJobRequest job = make_quarter_turn_job();
    job.actual_phase = 2.0 * kPi - kPi / 2.0;
    service::JobRunner runner;
    const auto result = runner.run(job);

    ASSERT_EQ(result.status, service::JobStatus::Completed);
    ASSERT_TRUE(result.report->absolute_error.has_value());
    EXPECT_NEAR(*result.report->absolute_error, kPi, 1e-9);
    EXPECT_TRUE(result.report->quadrant_ambiguous);
}

TEST(ServiceApiTests, JobRunnerSampledJobIsReproducible) {
    service::EstimationJobRequest job = make_quarter_turn_job();
    job.device_id = "sampler";
    job.seed = 99;
    service::JobRunner runner;

    const auto first = runner.run(job, 1);
    const auto second = runner.run(job, 3);
    ASSERT_EQ(first.status, service::JobStatus::Completed);
    ASSERT_EQ(second.status, service::JobStatus::Completed);
    EXPECT_EQ(first.tally, second.tally);
    EXPECT_EQ(first.tally.shots(), 1000);
}

TEST(ServiceApiTests, JobRunnerReportsMissingShots) {
    service::EstimationJobRequest job = make_quarter_turn_job();
    job.shots = 0;
    service::JobRunner runner;
    const auto result = runner.run(job);

    EXPECT_EQ(result.status, service::JobStatus::Failed);
    EXPECT_EQ(result.message, "shots must be supplied");
    EXPECT_FALSE(result.report.has_value());
    ASSERT_FALSE(result.logs.empty());
    EXPECT_EQ(result.logs.back().category, "Job");
}

TEST(ServiceApiTests, JobRunnerMitigatesReadout) {
    service::EstimationJobRequest job = make_quarter_turn_job();
    job.phase_shift = kPi / 3.0;
    job.shots = 100000;
    SimpleNoiseConfig noise;
    noise.readout.p_flip0_to_1 = 0.05;
    noise.readout.p_flip1_to_0 = 0.02;
    job.noise_config = noise;
    job.mitigate_readout = true;

    service::JobRunner runner;
    const auto result = runner.run(job);
    ASSERT_EQ(result.status, service::JobStatus::Completed) << result.message;
    ASSERT_TRUE(result.report.has_value());
    EXPECT_TRUE(result.report->readout_mitigated);
    EXPECT_NEAR(result.report->estimated_phase, kPi / 3.0, 1e-6);
}

TEST(ServiceApiTests, JobResultJson) {
    service::JobRunner runner;
    const auto result = runner.run(make_quarter_turn_job());
    const std::string json = service::to_json(result);

    EXPECT_NE(json.find("\"status\":\"completed\""), std::string::npos);
    EXPECT_NE(json.find("\"tally\":{\"count_zero\":500,\"count_one\":500}"), std::string::npos);
    EXPECT_NE(json.find("\"quadrant_ambiguous\":true"), std::string::npos);
    EXPECT_NE(json.find("\"readout_mitigated\":false"), std::string::npos);
}

TEST(ServiceApiTests, ReportJsonUsesNullForMissingValues) {
    ramsey_lab::EstimationReport report;
    report.label = "bare";
    const std::string json = service::to_json(report);
    EXPECT_NE(json.find("\"actual_phase\":null"), std::string::npos);
    EXPECT_NE(json.find("\"absolute_error\":null"), std::string::npos);
    EXPECT_NE(json.find("\"standard_error\":null"), std::string::npos);
}

TEST(ServiceApiTests, StatusStrings) {
    EXPECT_EQ(service::status_to_string(service::JobStatus::Pending), "pending");
    EXPECT_EQ(service::status_to_string(service::JobStatus::Running), "running");
    EXPECT_EQ(service::status_to_string(service::JobStatus::Completed), "completed");
    EXPECT_EQ(service::status_to_string(service::JobStatus::Failed), "failed");
}

}  // namespace

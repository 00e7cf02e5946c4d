#include "readout_mitigation.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

namespace {

OutcomeTally make_tally(int count_zero, int count_one) {
    OutcomeTally tally;
    tally.count_zero = count_zero;
    tally.count_one = count_one;
    return tally;
}

TEST(ReadoutMitigationTests, IdealReadoutKeepsEmpiricalProbability) {
    const auto mitigated = ramsey_lab::mitigate_readout(make_tally(600, 400), {});
    EXPECT_NEAR(mitigated.probability_of_one, 0.4, 1e-12);
    EXPECT_FALSE(mitigated.clipped);
}

TEST(ReadoutMitigationTests, InvertsConfusionMatrix) {
    MeasurementNoiseConfig readout;
    readout.p_flip0_to_1 = 0.05;
    readout.p_flip1_to_0 = 0.02;

    // True p1 = 0.3 observed through the confusion matrix gives 0.329.
    const auto mitigated = ramsey_lab::mitigate_readout(make_tally(671, 329), readout);
    EXPECT_NEAR(mitigated.probability_of_one, 0.3, 1e-12);
    EXPECT_FALSE(mitigated.clipped);
}

TEST(ReadoutMitigationTests, ClipsNegativeComponents) {
    MeasurementNoiseConfig readout;
    readout.p_flip0_to_1 = 0.1;

    const auto mitigated = ramsey_lab::mitigate_readout(make_tally(1000, 0), readout);
    EXPECT_TRUE(mitigated.clipped);
    EXPECT_DOUBLE_EQ(mitigated.probability_of_one, 0.0);
}

TEST(ReadoutMitigationTests, RejectsSingularConfusion) {
    MeasurementNoiseConfig readout;
    readout.p_flip0_to_1 = 0.5;
    readout.p_flip1_to_0 = 0.5;
    EXPECT_THROW(ramsey_lab::mitigate_readout(make_tally(10, 10), readout), std::invalid_argument);
}

TEST(ReadoutMitigationTests, RejectsInvalidTally) {
    EXPECT_THROW(ramsey_lab::mitigate_readout(make_tally(0, 0), {}), std::invalid_argument);
    EXPECT_THROW(ramsey_lab::mitigate_readout(make_tally(-2, 4), {}), std::invalid_argument);
}

TEST(ReadoutMitigationTests, ContrastIsConfusionDeterminant) {
    MeasurementNoiseConfig readout;
    readout.p_flip0_to_1 = 0.05;
    readout.p_flip1_to_0 = 0.02;
    EXPECT_NEAR(ramsey_lab::readout_contrast(readout), 0.93, 1e-12);
    EXPECT_DOUBLE_EQ(ramsey_lab::readout_contrast({}), 1.0);
}

}  // namespace

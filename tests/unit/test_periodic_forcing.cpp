/**
 * @file test_periodic_forcing.cpp
 * @brief Unit tests for ForcingState and PeriodicForcingUpdater
 */

#include <gtest/gtest.h>
#include "PeriodicForcing.hpp"
#include <cmath>
#include <stdexcept>

using namespace SWCS;

class PeriodicForcingTest : public ::testing::Test {
protected:
    void SetUp() override {
        tide = ForcingState("tide", 1000.0, -2000.0, 43200.0);
    }

    // Drive the updater the way the solver does: t += dt after each step
    void advance(PeriodicForcingUpdater& updater, double dt, int nsteps) {
        double t = 0.0;
        for (int n = 0; n < nsteps; ++n) {
            t += dt;
            updater.onStep(t);
        }
    }

    ForcingState tide;
};

TEST_F(PeriodicForcingTest, EvaluateFollowsSine) {
    PeriodicForcingUpdater updater(tide);

    EXPECT_DOUBLE_EQ(updater.evaluate(0.0), 1000.0);
    EXPECT_NEAR(updater.evaluate(10800.0), -1000.0, 1e-9);
    EXPECT_NEAR(updater.evaluate(21600.0), 1000.0, 1e-9);
    EXPECT_NEAR(updater.evaluate(32400.0), 3000.0, 1e-9);

    double t = 1234.5;
    double expected = 1000.0 - 2000.0 * std::sin(2.0 * M_PI * t / 43200.0);
    EXPECT_NEAR(updater.evaluate(t), expected, 1e-9);
}

TEST_F(PeriodicForcingTest, EvaluateIsPeriodic) {
    PeriodicForcingUpdater updater(tide);

    for (double t : {0.0, 500.0, 7200.0, 30000.0}) {
        EXPECT_NEAR(updater.evaluate(t), updater.evaluate(t + 43200.0), 1e-8)
            << "t = " << t;
    }
}

TEST_F(PeriodicForcingTest, EvaluateDoesNotModifyState) {
    PeriodicForcingUpdater updater(tide);
    updater.evaluate(5000.0);
    EXPECT_DOUBLE_EQ(tide.value, 1000.0);
}

TEST_F(PeriodicForcingTest, OnStepWritesValueInPlace) {
    PeriodicForcingUpdater updater(tide);
    const ForcingState& seen_by_boundary = tide;

    updater.onStep(100.0);
    EXPECT_NEAR(seen_by_boundary.value,
                1000.0 - 2000.0 * std::sin(2.0 * M_PI * 100.0 / 43200.0), 1e-9);

    updater.onStep(200.0);
    EXPECT_NEAR(seen_by_boundary.value,
                1000.0 - 2000.0 * std::sin(2.0 * M_PI * 200.0 / 43200.0), 1e-9);
    EXPECT_EQ(updater.stepCount(), 2);
}

TEST_F(PeriodicForcingTest, InvalidPeriodThrows) {
    EXPECT_THROW(ForcingState("bad", 0.0, 1.0, 0.0), std::invalid_argument);
    EXPECT_THROW(ForcingState("bad", 0.0, 1.0, -10.0), std::invalid_argument);
}

TEST_F(PeriodicForcingTest, ExactTriggersFireOnMatchingSteps) {
    PeriodicForcingUpdater updater(tide);
    updater.setTriggerTimes({1000.0, 2000.0, 4000.0, 7000.0});

    std::vector<double> observed;
    updater.setObservationAction([&](double t) { observed.push_back(t); });

    advance(updater, 100.0, 72);

    ASSERT_EQ(observed.size(), 4u);
    EXPECT_DOUBLE_EQ(observed[0], 1000.0);
    EXPECT_DOUBLE_EQ(observed[1], 2000.0);
    EXPECT_DOUBLE_EQ(observed[2], 4000.0);
    EXPECT_DOUBLE_EQ(observed[3], 7000.0);
    EXPECT_EQ(updater.firedTriggers().size(), 4u);
}

TEST_F(PeriodicForcingTest, ExactMatchIgnoresNearbyTimes) {
    PeriodicForcingUpdater updater(tide);
    updater.setTriggerTimes({1000.0});

    int count = 0;
    updater.setObservationAction([&](double) { ++count; });

    updater.onStep(999.0);
    updater.onStep(1000.5);
    EXPECT_EQ(count, 0);

    updater.onStep(1000.0);
    EXPECT_EQ(count, 1);
}

TEST_F(PeriodicForcingTest, TriggerFiresOnlyOnce) {
    PeriodicForcingUpdater updater(tide);
    updater.setTriggerTimes({1000.0});

    int count = 0;
    updater.setObservationAction([&](double) { ++count; });

    updater.onStep(1000.0);
    updater.onStep(1000.0);
    EXPECT_EQ(count, 1);

    updater.reset();
    updater.onStep(1000.0);
    EXPECT_EQ(count, 2);
}

TEST_F(PeriodicForcingTest, ActionSeesUpdatedForcing) {
    PeriodicForcingUpdater updater(tide);
    updater.setTriggerTimes({2000.0});

    double value_at_trigger = 0.0;
    updater.setObservationAction([&](double) { value_at_trigger = tide.value; });

    advance(updater, 100.0, 20);
    EXPECT_NEAR(value_at_trigger, updater.evaluate(2000.0), 1e-9);
}

TEST_F(PeriodicForcingTest, MisalignedTriggerSkippedUnderExact) {
    PeriodicForcingUpdater updater(tide);
    updater.setTriggerTimes({1000.0, 2000.0});

    std::vector<double> misaligned = updater.checkAlignment(300.0);
    ASSERT_EQ(misaligned.size(), 2u);

    int count = 0;
    updater.setObservationAction([&](double) { ++count; });
    advance(updater, 300.0, 10);
    EXPECT_EQ(count, 0);
}

TEST_F(PeriodicForcingTest, AlignedTriggersPassCheck) {
    PeriodicForcingUpdater updater(tide);
    updater.setTriggerTimes({1000.0, 2000.0, 4000.0, 7000.0});

    EXPECT_TRUE(updater.checkAlignment(100.0).empty());
    EXPECT_TRUE(updater.checkAlignment(500.0).empty());
}

TEST_F(PeriodicForcingTest, ToleranceMatchesNearestStep) {
    PeriodicForcingUpdater updater(tide);
    updater.setTriggerTimes({1000.0, 2000.0});
    updater.setTimeStep(300.0);
    updater.setMatchPolicy(TriggerMatchPolicy::TOLERANCE);

    std::vector<double> observed;
    updater.setObservationAction([&](double t) { observed.push_back(t); });

    advance(updater, 300.0, 10);

    // |900 - 1000| < 150 and |2100 - 2000| < 150
    ASSERT_EQ(observed.size(), 2u);
    EXPECT_DOUBLE_EQ(observed[0], 900.0);
    EXPECT_DOUBLE_EQ(observed[1], 2100.0);
}

TEST_F(PeriodicForcingTest, ExplicitToleranceWindow) {
    PeriodicForcingUpdater updater(tide);
    updater.setTriggerTimes({1000.0});
    updater.setMatchPolicy(TriggerMatchPolicy::TOLERANCE, 10.0);

    int count = 0;
    updater.setObservationAction([&](double) { ++count; });

    updater.onStep(980.0);
    EXPECT_EQ(count, 0);
    updater.onStep(995.0);
    EXPECT_EQ(count, 1);
}

TEST_F(PeriodicForcingTest, StepIndexMatchesRoundedStep) {
    PeriodicForcingUpdater updater(tide);
    updater.setTriggerTimes({1000.0});
    updater.setTimeStep(300.0);
    updater.setMatchPolicy(TriggerMatchPolicy::STEP_INDEX);

    std::vector<double> observed;
    updater.setObservationAction([&](double t) { observed.push_back(t); });

    advance(updater, 300.0, 6);

    // round(1000 / 300) = 3
    ASSERT_EQ(observed.size(), 1u);
    EXPECT_DOUBLE_EQ(observed[0], 900.0);
}

TEST_F(PeriodicForcingTest, InvalidTimeStepThrows) {
    PeriodicForcingUpdater updater(tide);
    EXPECT_THROW(updater.setTimeStep(0.0), std::invalid_argument);
}

TEST_F(PeriodicForcingTest, ToleranceFiresTriggerHalfwayBetweenSteps) {
    PeriodicForcingUpdater updater(tide);
    updater.setTriggerTimes({1100.0});
    updater.setTimeStep(200.0);
    updater.setMatchPolicy(TriggerMatchPolicy::TOLERANCE);

    EXPECT_TRUE(updater.checkAlignment(200.0).empty());

    std::vector<double> observed;
    updater.setObservationAction([&](double t) { observed.push_back(t); });

    advance(updater, 200.0, 20);

    // 1000 and 1200 are both 100 s away; the earlier step wins
    ASSERT_EQ(observed.size(), 1u);
    EXPECT_DOUBLE_EQ(observed[0], 1000.0);
}

TEST_F(PeriodicForcingTest, ToleranceReportsUnreachableTriggers) {
    PeriodicForcingUpdater updater(tide);
    updater.setTriggerTimes({50.0, 1000.0, 1150.0});
    updater.setTimeStep(300.0);
    updater.setMatchPolicy(TriggerMatchPolicy::TOLERANCE, 60.0);

    // 50 is closest to step 0; 1150 is 50 s from 1200 and inside the window
    std::vector<double> missed = updater.checkAlignment(300.0);
    ASSERT_EQ(missed.size(), 2u);
    EXPECT_DOUBLE_EQ(missed[0], 50.0);
    EXPECT_DOUBLE_EQ(missed[1], 1000.0);
}

TEST_F(PeriodicForcingTest, StepIndexReportsTriggersAtStepZero) {
    PeriodicForcingUpdater updater(tide);
    updater.setTriggerTimes({100.0, 1000.0});
    updater.setMatchPolicy(TriggerMatchPolicy::STEP_INDEX);

    std::vector<double> missed = updater.checkAlignment(300.0);
    ASSERT_EQ(missed.size(), 1u);
    EXPECT_DOUBLE_EQ(missed[0], 100.0);
}

TEST_F(PeriodicForcingTest, RepeatedTriggerFiresOnce) {
    PeriodicForcingUpdater updater(tide);
    updater.setTriggerTimes({2000.0, 1000.0, 1000.0});

    ASSERT_EQ(updater.triggerTimes().size(), 2u);
    EXPECT_DOUBLE_EQ(updater.triggerTimes()[0], 1000.0);

    int count = 0;
    updater.setObservationAction([&](double) { ++count; });

    updater.onStep(1000.0);
    EXPECT_EQ(count, 1);
    EXPECT_EQ(updater.firedTriggers().size(), 1u);
}

TEST_F(PeriodicForcingTest, ResetRestoresStartValue) {
    PeriodicForcingUpdater updater(tide);
    updater.setTimeStep(100.0, 0.0);

    updater.onStep(10800.0);
    EXPECT_NEAR(tide.value, -1000.0, 1e-9);

    updater.reset();
    EXPECT_DOUBLE_EQ(tide.value, updater.evaluate(0.0));
    EXPECT_EQ(updater.stepCount(), 0);
}

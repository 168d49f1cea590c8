#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include "simulate.h"

TEST(GrowthSimulatorTest, ZeroProbability) {
    auto simulator = GrowthSimulator(1);
    auto res = simulator.simulate(0.0, 20);
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(res.value(), std::vector<std::size_t>(20, 0));

    auto expected = simulator.simulateExpected(0.0, 20);
    ASSERT_TRUE(expected.ok());
    EXPECT_EQ(expected.value(), std::vector<double>(20, 0.0));
}

TEST(GrowthSimulatorTest, ZeroDays) {
    auto simulator = GrowthSimulator(1);
    EXPECT_TRUE(simulator.simulate(0.5, 0).value().empty());
    EXPECT_TRUE(simulator.simulateExpected(0.5, 0).value().empty());
}

TEST(GrowthSimulatorTest, ExpectedOneDay) {
    auto res = GrowthSimulator().simulateExpected(1.0, 1);
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(res.value(), std::vector<double>{100.0});
}

TEST(GrowthSimulatorTest, ExpectedSaturation) {
    auto res = GrowthSimulator().simulateExpected(1.0, 15);
    ASSERT_TRUE(res.ok());
    const auto& totals = res.value();
    ASSERT_EQ(totals.size(), 15u);
    for (int day = 1; day <= 10; day++) {
        EXPECT_DOUBLE_EQ(totals[day - 1], 100.0 * day);
    }
    // Everyone reaches capacity at the end of day 10
    EXPECT_DOUBLE_EQ(totals[10], 1000.0);
    EXPECT_DOUBLE_EQ(totals[14], 1000.0);
}

TEST(GrowthSimulatorTest, ExpectedHalfProbability) {
    auto res = GrowthSimulator().simulateExpected(0.5, 2);
    ASSERT_TRUE(res.ok());
    EXPECT_DOUBLE_EQ(res.value()[0], 50.0);
    EXPECT_DOUBLE_EQ(res.value()[1], 100.0);
}

TEST(GrowthSimulatorTest, ExpectedIsMonotonic) {
    auto res = GrowthSimulator().simulateExpected(0.37, 60);
    ASSERT_TRUE(res.ok());
    const auto& totals = res.value();
    for (std::size_t i = 1; i < totals.size(); i++) {
        EXPECT_GE(totals[i], totals[i - 1]);
    }
    EXPECT_LE(totals.back(), 1000.0 + 1e-9);
}

TEST(GrowthSimulatorTest, ExpectedBoundedByCapacity) {
    auto simulator = GrowthSimulator();
    // None of these divides the capacity 10 evenly
    for (auto p: {0.1, 0.3, 0.37, 0.7, 0.9}) {
        auto res = simulator.simulateExpected(p, 200);
        ASSERT_TRUE(res.ok());
        for (auto total: res.value()) {
            EXPECT_LE(total, 1000.0 + 1e-9) << "p = " << p;
        }
        // Every referrer is saturated long before day 200
        EXPECT_NEAR(res.value().back(), 1000.0, 1e-6) << "p = " << p;
    }
}

TEST(GrowthSimulatorTest, ExpectedPartialLastDay) {
    auto simulator = GrowthSimulator(0, GrowthParams{.initialReferrers = 1, .capacity = 1, .maxDays = 10});
    // 0.75 on day 1, then only the remaining 0.25 on day 2
    auto res = simulator.simulateExpected(0.75, 3);
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(res.value(), (std::vector<double>{0.75, 1.0, 1.0}));
}

TEST(GrowthSimulatorTest, CustomParams) {
    auto simulator = GrowthSimulator(0, GrowthParams{.initialReferrers = 3, .capacity = 2, .maxDays = 50});
    auto res = simulator.simulateExpected(1.0, 4);
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(res.value(), (std::vector<double>{3.0, 6.0, 6.0, 6.0}));
    EXPECT_EQ(simulator.params().capacity, 2u);
}

TEST(GrowthSimulatorTest, StochasticCertainSuccess) {
    auto simulator = GrowthSimulator(42);
    auto res = simulator.simulate(1.0, 12);
    ASSERT_TRUE(res.ok());
    const auto& totals = res.value();
    EXPECT_EQ(totals[0], 100u);
    EXPECT_EQ(totals[1], 200u);
    EXPECT_EQ(totals[9], 1000u);
    EXPECT_EQ(totals[11], 1000u);
}

TEST(GrowthSimulatorTest, StochasticBounds) {
    auto simulator = GrowthSimulator(7);
    auto res = simulator.simulate(0.3, 100);
    ASSERT_TRUE(res.ok());
    const auto& totals = res.value();
    ASSERT_EQ(totals.size(), 100u);
    for (std::size_t i = 0; i < totals.size(); i++) {
        EXPECT_LE(totals[i], 1000u);
        if (i > 0) {
            EXPECT_GE(totals[i], totals[i - 1]);
            // At most one referral per referrer per day
            EXPECT_LE(totals[i] - totals[i - 1], 100u);
        }
    }
}

TEST(GrowthSimulatorTest, SeededReproducibility) {
    auto A = GrowthSimulator(2022);
    auto B = GrowthSimulator(2022);
    EXPECT_EQ(A.simulate(0.4, 30).value(), B.simulate(0.4, 30).value());
}

TEST(GrowthSimulatorTest, InvalidArguments) {
    auto simulator = GrowthSimulator(1);
    EXPECT_EQ(simulator.simulate(-0.1, 10).code(), ErrorCode::InvalidProbability);
    EXPECT_EQ(simulator.simulate(1.1, 10).code(), ErrorCode::InvalidProbability);
    EXPECT_EQ(simulator.simulate(std::nan(""), 10).code(), ErrorCode::InvalidProbability);
    EXPECT_EQ(simulator.simulate(0.5, -1).code(), ErrorCode::InvalidDuration);
    EXPECT_EQ(simulator.simulateExpected(2.0, 10).code(), ErrorCode::InvalidProbability);
    EXPECT_EQ(simulator.simulateExpected(0.5, -5).code(), ErrorCode::InvalidDuration);
    EXPECT_TRUE(checkSimulationArgs(1.0, 0).ok());
}

TEST(DaysToTargetTest, Basic) {
    auto simulator = GrowthSimulator();
    auto res = simulator.daysToTarget(0.5, 100.0);
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(res.value(), std::optional<int>(2));

    EXPECT_EQ(simulator.daysToTarget(1.0, 1000.0).value(), std::optional<int>(10));
    EXPECT_EQ(simulator.daysToTarget(1.0, 101.0).value(), std::optional<int>(2));
}

TEST(DaysToTargetTest, NonPositiveTarget) {
    auto simulator = GrowthSimulator();
    EXPECT_EQ(simulator.daysToTarget(0.5, 0.0).value(), std::optional<int>(0));
    EXPECT_EQ(simulator.daysToTarget(0.0, -3.0).value(), std::optional<int>(0));
}

TEST(DaysToTargetTest, Impossible) {
    auto simulator = GrowthSimulator();
    EXPECT_EQ(simulator.daysToTarget(0.0, 100.0).value(), std::nullopt);
    // Beyond N0 * C
    EXPECT_EQ(simulator.daysToTarget(1.0, 1001.0).value(), std::nullopt);
}

TEST(DaysToTargetTest, BeyondCapacityIsImpossible) {
    auto simulator = GrowthSimulator();
    EXPECT_EQ(simulator.daysToTarget(0.37, 1030.0).value(), std::nullopt);
    EXPECT_EQ(simulator.daysToTarget(0.7, 1001.0).value(), std::nullopt);
}

TEST(DaysToTargetTest, InvalidProbability) {
    EXPECT_EQ(GrowthSimulator().daysToTarget(1.5, 100.0).code(), ErrorCode::InvalidProbability);
}

TEST(DaysToTargetTest, MinimalityAgainstExpected) {
    auto simulator = GrowthSimulator();
    auto days = simulator.daysToTarget(0.23, 640.0).value();
    ASSERT_TRUE(days.has_value());
    auto totals = simulator.simulateExpected(0.23, *days).value();
    ASSERT_FALSE(totals.empty());
    EXPECT_GE(totals.back(), 640.0);
    if (*days > 1) {
        EXPECT_LT(totals[*days - 2], 640.0);
    }
}

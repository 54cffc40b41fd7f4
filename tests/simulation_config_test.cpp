// simulation_config_test.cpp — tests for SimulationConfig defaults, presets
// and validation

#include <gtest/gtest.h>

#include "errors.hpp"
#include "simulation/simulation_config.hpp"

#include <cmath>
#include <stdexcept>

// ===========================================================================
// 1. Defaults
// ===========================================================================

class SimulationConfigDefaultsTest : public ::testing::Test {
protected:
    SimulationConfig cfg;
};

TEST_F(SimulationConfigDefaultsTest, Bounds) {
    EXPECT_DOUBLE_EQ(cfg.lower_bound, 0.0);
    EXPECT_DOUBLE_EQ(cfg.upper_bound, 1.0);
}

TEST_F(SimulationConfigDefaultsTest, OneMillionTrials) {
    EXPECT_EQ(cfg.trial_count, 1000000);
}

TEST_F(SimulationConfigDefaultsTest, TentModeOn) {
    EXPECT_TRUE(cfg.tent_mode);
    EXPECT_EQ(cfg.mode(), SamplingMode::TENT);
}

TEST_F(SimulationConfigDefaultsTest, PrecisionFollowsTrialCount) {
    EXPECT_EQ(cfg.bisection_precision, 0);
    EXPECT_EQ(cfg.effective_precision(), 1000000);
    cfg.trial_count = 5000;
    EXPECT_EQ(cfg.effective_precision(), 5000);
}

TEST_F(SimulationConfigDefaultsTest, ExplicitPrecisionDecouplesFromTrialCount) {
    cfg.trial_count = 5000;
    cfg.bisection_precision = 1000000;
    EXPECT_EQ(cfg.effective_precision(), 1000000);
}

TEST_F(SimulationConfigDefaultsTest, NoSeedAndSingleWorker) {
    EXPECT_FALSE(cfg.seed.has_value());
    EXPECT_EQ(cfg.num_workers, 1);
}

TEST_F(SimulationConfigDefaultsTest, DefaultsValidate) {
    EXPECT_NO_THROW(cfg.validate());
}

// ===========================================================================
// 2. Validation
// ===========================================================================

TEST(SimulationConfigValidationTest, ZeroTrialsRejected) {
    SimulationConfig cfg;
    cfg.trial_count = 0;
    EXPECT_THROW(cfg.validate(), InvalidConfiguration);
}

TEST(SimulationConfigValidationTest, NegativeTrialsRejected) {
    SimulationConfig cfg;
    cfg.trial_count = -10;
    EXPECT_THROW(cfg.validate(), InvalidConfiguration);
}

TEST(SimulationConfigValidationTest, EqualBoundsRejected) {
    SimulationConfig cfg;
    cfg.lower_bound = 0.4;
    cfg.upper_bound = 0.4;
    EXPECT_THROW(cfg.validate(), InvalidConfiguration);
}

TEST(SimulationConfigValidationTest, InvertedBoundsRejected) {
    SimulationConfig cfg;
    cfg.lower_bound = 0.5;
    cfg.upper_bound = 0.1;
    EXPECT_THROW(cfg.validate(), InvalidConfiguration);
}

TEST(SimulationConfigValidationTest, NonFiniteBoundRejected) {
    SimulationConfig cfg;
    cfg.upper_bound = std::nan("");
    EXPECT_THROW(cfg.validate(), InvalidConfiguration);
}

TEST(SimulationConfigValidationTest, NegativePrecisionRejected) {
    SimulationConfig cfg;
    cfg.bisection_precision = -1;
    EXPECT_THROW(cfg.validate(), InvalidConfiguration);
}

TEST(SimulationConfigValidationTest, ZeroWorkersRejected) {
    SimulationConfig cfg;
    cfg.num_workers = 0;
    EXPECT_THROW(cfg.validate(), InvalidConfiguration);
}

TEST(SimulationConfigValidationTest, WorkerCountAboveLimitRejected) {
    SimulationConfig cfg;
    cfg.num_workers = SimulationConfig::MAX_WORKERS;
    EXPECT_NO_THROW(cfg.validate());
    cfg.num_workers = SimulationConfig::MAX_WORKERS + 1;
    EXPECT_THROW(cfg.validate(), InvalidConfiguration);
}

TEST(SimulationConfigValidationTest, ErrorMessageNamesTheProblem) {
    SimulationConfig cfg;
    cfg.trial_count = 0;
    try {
        cfg.validate();
        FAIL() << "expected InvalidConfiguration";
    } catch (const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("trial_count"), std::string::npos);
    }
}

// ===========================================================================
// 3. Presets
// ===========================================================================

TEST(SimulationConfigPresetTest, Figure1IsIndependentOnUnitInterval) {
    auto cfg = SimulationConfig::figure1();
    EXPECT_FALSE(cfg.tent_mode);
    EXPECT_DOUBLE_EQ(cfg.lower_bound, 0.0);
    EXPECT_DOUBLE_EQ(cfg.upper_bound, 1.0);
    EXPECT_NO_THROW(cfg.validate());
}

TEST(SimulationConfigPresetTest, Figure2UsesUpperBoundPointOne) {
    auto cfg = SimulationConfig::figure2();
    EXPECT_FALSE(cfg.tent_mode);
    EXPECT_DOUBLE_EQ(cfg.upper_bound, 0.1);
    EXPECT_NO_THROW(cfg.validate());
}

TEST(SimulationConfigPresetTest, AppendixDUsesTent) {
    auto cfg = SimulationConfig::appendix_d();
    EXPECT_TRUE(cfg.tent_mode);
    EXPECT_DOUBLE_EQ(cfg.upper_bound, 1.0);
}

TEST(SimulationConfigPresetTest, LookupByName) {
    EXPECT_DOUBLE_EQ(SimulationConfig::preset("figure2").upper_bound, 0.1);
    EXPECT_TRUE(SimulationConfig::preset("appendix-d").tent_mode);
    EXPECT_FALSE(SimulationConfig::preset("figure1").tent_mode);
}

TEST(SimulationConfigPresetTest, UnknownNameThrows) {
    EXPECT_THROW(SimulationConfig::preset("figure3"), InvalidConfiguration);
}

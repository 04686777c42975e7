/**
 * @file test_configuration.cpp
 * @brief YAML configuration loading for the engine and violation monitor
 */

#include <gtest/gtest.h>
#include <proctoreye/core/Configuration.hpp>
#include <proctoreye/core/exception.h>
#include <proctoreye/gaze/EngineConfig.hpp>
#include <proctoreye/gaze/ViolationMonitor.hpp>
#include <cstdio>
#include <fstream>

using namespace proctoreye;
using namespace proctoreye::gaze;

class ConfigurationTest : public ::testing::Test {
protected:
    void SetUp() override {
        core::Configuration::getInstance().clear();
    }

    void TearDown() override {
        core::Configuration::getInstance().clear();
    }
};

TEST_F(ConfigurationTest, DefaultsMatchDocumentedValues) {
    EngineConfig config;
    EXPECT_FLOAT_EQ(config.ear_threshold, 0.25f);
    EXPECT_EQ(config.blink_frames, 3);
    EXPECT_FLOAT_EQ(config.movement_threshold, 10.0f);
    EXPECT_FLOAT_EQ(config.look_away_threshold_x, 40.0f);
    EXPECT_FLOAT_EQ(config.look_away_threshold_y, 30.0f);
    EXPECT_EQ(config.ear_history_size, 30u);
    EXPECT_EQ(config.gaze_history_size, 60u);
    EXPECT_EQ(config.movement_history_size, 90u);
    EXPECT_EQ(config.analysis_window, 30u);
    EXPECT_FLOAT_EQ(config.gaze_bounds.left, -50.0f);
    EXPECT_FLOAT_EQ(config.gaze_bounds.down, 30.0f);
    EXPECT_TRUE(config.is_valid());
}

TEST_F(ConfigurationTest, EmptyDocumentKeepsDefaults) {
    EngineConfig config = EngineConfig::from_configuration();
    EXPECT_FLOAT_EQ(config.ear_threshold, 0.25f);
    EXPECT_EQ(config.max_pupil_radius, 25);
}

TEST_F(ConfigurationTest, OverridesFromYaml) {
    core::Configuration::getInstance().loadFromString(R"(
engine:
  blink:
    ear_threshold: 0.2
    blink_frames: 2
  movement:
    threshold: 15
  gaze:
    look_away_threshold_x: 35
    bounds:
      left: -60
  pupil:
    max_radius: 30
  attention:
    look_away_penalty: 40
)");

    EngineConfig config = EngineConfig::from_configuration("engine");
    EXPECT_FLOAT_EQ(config.ear_threshold, 0.2f);
    EXPECT_EQ(config.blink_frames, 2);
    EXPECT_FLOAT_EQ(config.movement_threshold, 15.0f);
    EXPECT_FLOAT_EQ(config.look_away_threshold_x, 35.0f);
    EXPECT_FLOAT_EQ(config.look_away_threshold_y, 30.0f);
    EXPECT_FLOAT_EQ(config.gaze_bounds.left, -60.0f);
    EXPECT_EQ(config.max_pupil_radius, 30);
    EXPECT_FLOAT_EQ(config.look_away_penalty, 40.0f);
}

TEST_F(ConfigurationTest, DottedKeyLookup) {
    auto& cfg = core::Configuration::getInstance();
    cfg.loadFromString("a:\n  b:\n    c: 7\n");

    EXPECT_TRUE(cfg.has("a.b.c"));
    EXPECT_FALSE(cfg.has("a.b.d"));
    EXPECT_FALSE(cfg.has("a.b.c.d"));
    EXPECT_EQ(cfg.get<int>("a.b.c", 0), 7);
    EXPECT_EQ(cfg.get<int>("a.x", 3), 3);

    // Lookups must not insert keys
    EXPECT_FALSE(cfg.has("a.x"));
}

TEST_F(ConfigurationTest, MalformedValueThrows) {
    core::Configuration::getInstance().loadFromString("engine:\n  blink:\n    ear_threshold: closed\n");
    EXPECT_THROW(EngineConfig::from_configuration(), core::ConfigurationException);
}

TEST_F(ConfigurationTest, InvalidResultThrows) {
    core::Configuration::getInstance().loadFromString("engine:\n  pupil:\n    min_radius: 40\n");
    EXPECT_THROW(EngineConfig::from_configuration(), core::ConfigurationException);

    core::Configuration::getInstance().loadFromString("engine:\n  blink:\n    ear_threshold: -0.1\n");
    EXPECT_THROW(EngineConfig::from_configuration(), core::ConfigurationException);
}

TEST_F(ConfigurationTest, NonPositiveHoughThresholdsAreInvalid) {
    EngineConfig config;
    config.hough_accumulator_threshold = 0.0;
    EXPECT_FALSE(config.is_valid());

    config = EngineConfig();
    config.hough_canny_threshold = -5.0;
    EXPECT_FALSE(config.is_valid());

    core::Configuration::getInstance().loadFromString(
        "engine:\n  pupil:\n    hough_accumulator_threshold: 0\n");
    EXPECT_THROW(EngineConfig::from_configuration(), core::ConfigurationException);
}

TEST_F(ConfigurationTest, UnparsableTextThrows) {
    EXPECT_THROW(core::Configuration::getInstance().loadFromString("engine: [unclosed"),
                 core::ConfigurationException);
}

TEST_F(ConfigurationTest, MissingFileThrows) {
    try {
        core::Configuration::getInstance().load("/nonexistent/proctoreye.yaml");
        FAIL() << "Expected ConfigurationException";
    } catch (const core::ConfigurationException& e) {
        EXPECT_EQ(e.getResultCode(), core::ResultCode::ERROR_FILE_NOT_FOUND);
        EXPECT_NE(e.getMessage().find("/nonexistent/proctoreye.yaml"), std::string::npos);
    }
}

TEST_F(ConfigurationTest, LoadsFile) {
    const std::string path = ::testing::TempDir() + "proctoreye_config_test.yaml";
    {
        std::ofstream out(path);
        out << "monitor:\n  alert_threshold: 70\n  max_consecutive_violations: 3\n";
    }

    auto& cfg = core::Configuration::getInstance();
    cfg.load(path);
    EXPECT_EQ(cfg.getFilename(), path);

    ViolationConfig config = ViolationConfig::from_configuration("monitor");
    EXPECT_FLOAT_EQ(config.alert_threshold, 70.0f);
    EXPECT_EQ(config.max_consecutive_violations, 3);
    EXPECT_EQ(config.violation_log_capacity, 1000u);

    std::remove(path.c_str());
}

TEST_F(ConfigurationTest, ShippedConfigMatchesDefaults) {
    core::Configuration::getInstance().load(std::string(PROCTOREYE_CONFIG_DIR) + "/proctoreye.yaml");

    EngineConfig loaded = EngineConfig::from_configuration();
    EngineConfig defaults;
    EXPECT_EQ(loaded.to_string(), defaults.to_string());
    EXPECT_FLOAT_EQ(loaded.abnormal_blink_rate_penalty, defaults.abnormal_blink_rate_penalty);
    EXPECT_FLOAT_EQ(loaded.max_normal_blink_rate, defaults.max_normal_blink_rate);
    EXPECT_DOUBLE_EQ(loaded.min_contour_area, defaults.min_contour_area);

    ViolationConfig monitor = ViolationConfig::from_configuration();
    EXPECT_EQ(monitor.attention_history_capacity, 300u);
    EXPECT_EQ(monitor.max_consecutive_violations, 5);
    EXPECT_FLOAT_EQ(monitor.min_detection_accuracy, 0.8f);
}

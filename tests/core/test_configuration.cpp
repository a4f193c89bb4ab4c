/**
 * @file test_configuration.cpp
 * @brief Unit tests for YAML configuration and CleaningConfig loading
 */

#include <gtest/gtest.h>
#include <backscan/core/Configuration.hpp>
#include <backscan/core/Logger.hpp>
#include <backscan/core/exception.h>
#include <backscan/cleaning/CleaningConfig.hpp>

#include <cstdio>
#include <fstream>
#include <limits>
#include <map>
#include <new>
#include <stdexcept>

using namespace backscan;

class ConfigurationTest : public ::testing::Test {
protected:
    void SetUp() override {
        core::Logger::getInstance().setLevel(core::LogLevel::WARNING);
    }

    core::Configuration config_;
};

TEST_F(ConfigurationTest, DottedKeysReadNestedValues) {
    config_.loadFromString(
        "cleaning:\n"
        "  border_rings: 3\n"
        "  variance_thresh: 0.002\n"
        "  clean_borders: false\n"
        "curvature:\n"
        "  type: gaussian\n");

    EXPECT_TRUE(config_.has("cleaning.border_rings"));
    EXPECT_EQ(config_.get<int>("cleaning.border_rings", 5), 3);
    EXPECT_DOUBLE_EQ(config_.get<double>("cleaning.variance_thresh", 0.001), 0.002);
    EXPECT_FALSE(config_.get<bool>("cleaning.clean_borders", true));
    EXPECT_EQ(config_.get<std::string>("curvature.type", "mean"), "gaussian");
}

TEST_F(ConfigurationTest, MissingKeysFallBackToDefaults) {
    config_.loadFromString("cleaning:\n  border_rings: 3\n");

    EXPECT_FALSE(config_.has("cleaning.remove_islands"));
    EXPECT_FALSE(config_.has("logging.level"));
    EXPECT_FALSE(config_.has("cleaning.border_rings.value"));
    EXPECT_TRUE(config_.get<bool>("cleaning.remove_islands", true));
    EXPECT_EQ(config_.get<std::string>("logging.level", "info"), "info");

    // Lookups must not create keys
    EXPECT_FALSE(config_.has("cleaning.remove_islands"));
}

TEST_F(ConfigurationTest, WrongTypeThrowsConfigException) {
    config_.loadFromString("cleaning:\n  border_rings: many\n");

    EXPECT_THROW(config_.get<int>("cleaning.border_rings", 5), core::ConfigException);
}

TEST_F(ConfigurationTest, ParseErrorsThrowConfigException) {
    EXPECT_THROW(config_.loadFromString("cleaning: [unterminated\n"), core::ConfigException);
}

TEST_F(ConfigurationTest, MissingFileThrowsFileException) {
    try {
        config_.load("/nonexistent/backscan/cleaning.yaml");
        FAIL() << "Expected FileException";
    } catch (const core::FileException& e) {
        EXPECT_EQ(e.getResultCode(), core::ResultCode::ERROR_FILE_NOT_FOUND);
    }
}

TEST_F(ConfigurationTest, LoadFromFile) {
    const std::string path = ::testing::TempDir() + "backscan_config_test.yaml";
    {
        std::ofstream out(path);
        out << "cleaning:\n  curv_high_thresh: 0.08\n";
    }

    config_.load(path);
    EXPECT_EQ(config_.getFilename(), path);
    EXPECT_DOUBLE_EQ(config_.get<double>("cleaning.curv_high_thresh", 0.05), 0.08);

    config_.clear();
    EXPECT_TRUE(config_.getFilename().empty());
    EXPECT_FALSE(config_.has("cleaning.curv_high_thresh"));
    std::remove(path.c_str());
}

TEST_F(ConfigurationTest, CleaningConfigDefaultsWhenSectionAbsent) {
    config_.loadFromString("other: 1\n");

    const cleaning::CleaningConfig cleaningConfig = cleaning::CleaningConfig::fromConfiguration(config_);

    EXPECT_TRUE(cleaningConfig.clean_by_curvature);
    EXPECT_DOUBLE_EQ(cleaningConfig.curv_high_thresh, 0.05);
    EXPECT_DOUBLE_EQ(cleaningConfig.curv_low_thresh, -0.1);
    EXPECT_TRUE(cleaningConfig.clean_by_variance);
    EXPECT_DOUBLE_EQ(cleaningConfig.variance_thresh, 0.001);
    EXPECT_TRUE(cleaningConfig.clean_borders);
    EXPECT_EQ(cleaningConfig.border_rings, 5);
    EXPECT_TRUE(cleaningConfig.remove_islands);
    EXPECT_TRUE(cleaningConfig.validate());
}

TEST_F(ConfigurationTest, CleaningConfigReadsSection) {
    config_.loadFromString(
        "cleaning:\n"
        "  clean_by_curvature: false\n"
        "  curv_high_thresh: 0.2\n"
        "  curv_low_thresh: -0.3\n"
        "  clean_by_variance: false\n"
        "  variance_thresh: 0.01\n"
        "  clean_borders: true\n"
        "  border_rings: 0\n"
        "  remove_islands: false\n");

    const cleaning::CleaningConfig cleaningConfig = cleaning::CleaningConfig::fromConfiguration(config_);

    EXPECT_FALSE(cleaningConfig.clean_by_curvature);
    EXPECT_DOUBLE_EQ(cleaningConfig.curv_high_thresh, 0.2);
    EXPECT_DOUBLE_EQ(cleaningConfig.curv_low_thresh, -0.3);
    EXPECT_FALSE(cleaningConfig.clean_by_variance);
    EXPECT_DOUBLE_EQ(cleaningConfig.variance_thresh, 0.01);
    EXPECT_TRUE(cleaningConfig.clean_borders);
    EXPECT_EQ(cleaningConfig.border_rings, 0);
    EXPECT_FALSE(cleaningConfig.remove_islands);

    const std::string text = cleaningConfig.toString();
    EXPECT_NE(text.find("Curvature Stage: Disabled"), std::string::npos);
    EXPECT_NE(text.find("Border Stage: Enabled (0 rings)"), std::string::npos);
}

TEST_F(ConfigurationTest, InvalidCleaningConfigIsRejected) {
    config_.loadFromString("cleaning:\n  border_rings: -2\n");
    EXPECT_THROW(cleaning::CleaningConfig::fromConfiguration(config_), core::ConfigException);

    cleaning::CleaningConfig direct;
    direct.curv_high_thresh = std::numeric_limits<double>::infinity();
    EXPECT_FALSE(direct.validate());
    EXPECT_FALSE(direct.validationError().empty());
}

TEST_F(ConfigurationTest, ExceptionCarriesCodeAndContext) {
    try {
        BACKSCAN_THROW(core::InputException, "bad mesh");
    } catch (const core::Exception& e) {
        EXPECT_EQ(e.getResultCode(), core::ResultCode::ERROR_INVALID_INPUT);
        EXPECT_EQ(e.getMessage(), "bad mesh");
        EXPECT_NE(e.getContext().find("test_configuration.cpp"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("bad mesh"), std::string::npos);
    }
    EXPECT_EQ(core::resultCodeToString(core::ResultCode::ERROR_FILE_IO), "ERROR_FILE_IO");
}

TEST_F(ConfigurationTest, LogLevelNames) {
    EXPECT_EQ(core::logLevelFromString("debug"), core::LogLevel::DEBUG);
    EXPECT_EQ(core::logLevelFromString("WARN"), core::LogLevel::WARNING);
    EXPECT_THROW(core::logLevelFromString("verbose"), core::ConfigException);
}

TEST_F(ConfigurationTest, OverridesReplaceFileValues) {
    config_.loadFromString("cleaning:\n  border_rings: 3\n  clean_borders: true\n");
    cleaning::CleaningConfig cleaningConfig = cleaning::CleaningConfig::fromConfiguration(config_);

    cleaningConfig.applyOverrides({{"border_rings", "0"},
                                   {"clean_borders", "off"},
                                   {"remove_islands", "No"},
                                   {"curv_high_thresh", "0.2"},
                                   {"variance_thresh", "1e-4"}});

    EXPECT_EQ(cleaningConfig.border_rings, 0);
    EXPECT_FALSE(cleaningConfig.clean_borders);
    EXPECT_FALSE(cleaningConfig.remove_islands);
    EXPECT_DOUBLE_EQ(cleaningConfig.curv_high_thresh, 0.2);
    EXPECT_DOUBLE_EQ(cleaningConfig.variance_thresh, 1e-4);
    // Untouched options keep their values
    EXPECT_TRUE(cleaningConfig.clean_by_curvature);
    EXPECT_DOUBLE_EQ(cleaningConfig.curv_low_thresh, -0.1);
}

TEST_F(ConfigurationTest, MalformedOverridesThrowConfigException) {
    const std::map<std::string, std::string> malformed[] = {
        {{"clean_borders", "maybe"}},
        {{"border_rings", "five"}},
        {{"border_rings", "3.5"}},
        {{"border_rings", "99999999999"}},
        {{"curv_low_thresh", "-0.1x"}},
        {{"variance_thresh", ""}},
        {{"erode_rings", "2"}},
    };

    for (const auto& overrides : malformed) {
        cleaning::CleaningConfig cleaningConfig;
        EXPECT_THROW(cleaningConfig.applyOverrides(overrides), core::ConfigException)
            << overrides.begin()->first << "=" << overrides.begin()->second;
    }
}

TEST_F(ConfigurationTest, OutOfRangeOverrideLeavesConfigUnchanged) {
    cleaning::CleaningConfig cleaningConfig;

    try {
        cleaningConfig.applyOverrides({{"border_rings", "-1"}, {"clean_by_variance", "false"}});
        FAIL() << "Expected ConfigException";
    } catch (const core::ConfigException& e) {
        EXPECT_EQ(core::exitStatusFor(e), core::ExitStatus::CONFIG_ERROR);
    }
    EXPECT_EQ(cleaningConfig.border_rings, 5);
    EXPECT_TRUE(cleaningConfig.clean_by_variance);

    EXPECT_THROW(cleaningConfig.applyOverrides({{"curv_high_thresh", "inf"}}), core::ConfigException);
}

TEST_F(ConfigurationTest, OptionNames) {
    EXPECT_TRUE(cleaning::CleaningConfig::isOption("border_rings"));
    EXPECT_TRUE(cleaning::CleaningConfig::isOption("remove_islands"));
    EXPECT_FALSE(cleaning::CleaningConfig::isOption("border-rings"));
    EXPECT_FALSE(cleaning::CleaningConfig::isOption("curvature_type"));
}

TEST_F(ConfigurationTest, ExitStatusPerExceptionType) {
    EXPECT_EQ(core::exitStatusFor(core::FileException(core::ResultCode::ERROR_INVALID_FORMAT, "bad ply")),
              core::ExitStatus::FILE_ERROR);
    EXPECT_EQ(core::exitStatusFor(core::InputException("empty mesh")), core::ExitStatus::INPUT_ERROR);
    EXPECT_EQ(core::exitStatusFor(core::ConfigException("bad rings")), core::ExitStatus::CONFIG_ERROR);
    EXPECT_EQ(core::exitStatusFor(std::bad_alloc()), core::ExitStatus::UNEXPECTED);
    EXPECT_EQ(core::exitStatusFor(std::runtime_error("other")), core::ExitStatus::UNEXPECTED);
    EXPECT_EQ(static_cast<int>(core::ExitStatus::CONFIG_ERROR), 5);
    EXPECT_EQ(static_cast<int>(core::ExitStatus::FILE_ERROR), 3);
}

/**
 * @file test_config_reader.cpp
 * @brief Unit tests for ConfigReader class
 */

#include <gtest/gtest.h>
#include "ConfigReader.hpp"
#include <fstream>
#include <cstdio>
#include <string>
#include <vector>

using namespace PTAX;

class ConfigReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_config_file = "test_config_unit.config";

        std::ofstream config(test_config_file);
        config << "# Conversion job\n";
        config << "[conversion]\n";
        config << "target_unit = ky BP\n";
        config << "num_threads = 2\n";
        config << "verbose = yes\n";
        config << "\n[series.sediment]\n";
        config << "time_unit = yr BP\n";
        config << "time = 1000, 5000, 10000\n";
        config << "value = 3.1, 3.4, 3.2   # d18O\n";
        config << "\n[series.instrumental]\n";
        config << "time_unit = years CE\n";
        config << "time = 1900, 1950, 2000\n";
        config.close();
    }

    void TearDown() override {
        std::remove(test_config_file.c_str());
    }

    std::string test_config_file;
};

// ============================================================================
// Loading
// ============================================================================

TEST_F(ConfigReaderTest, LoadConfigFile) {
    ConfigReader reader;
    bool loaded = reader.loadFile(test_config_file);
    EXPECT_TRUE(loaded) << "Should load config file successfully";
}

TEST_F(ConfigReaderTest, MissingFileFails) {
    ConfigReader reader;
    EXPECT_FALSE(reader.loadFile("does_not_exist.config"));
    EXPECT_TRUE(reader.getSections().empty());
}

TEST_F(ConfigReaderTest, ReadScalarValues) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    EXPECT_EQ(reader.getString("conversion", "target_unit"), "ky BP");
    EXPECT_EQ(reader.getInt("conversion", "num_threads", 0), 2);
    EXPECT_TRUE(reader.getBool("conversion", "verbose", false));

    // Defaults
    EXPECT_EQ(reader.getInt("conversion", "missing", 7), 7);
    EXPECT_DOUBLE_EQ(reader.getDouble("nowhere", "x", 1.5), 1.5);
    EXPECT_EQ(reader.getString("conversion", "missing", "fallback"), "fallback");
}

TEST_F(ConfigReaderTest, ReadArraysStripsComments) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    std::vector<double> value = reader.getDoubleArray("series.sediment", "value");
    ASSERT_EQ(value.size(), 3u);
    EXPECT_DOUBLE_EQ(value[0], 3.1);
    EXPECT_DOUBLE_EQ(value[2], 3.2);
}

TEST_F(ConfigReaderTest, SectionQueries) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    EXPECT_TRUE(reader.hasSection("conversion"));
    EXPECT_FALSE(reader.hasSection("grid"));
    EXPECT_TRUE(reader.hasKey("series.sediment", "time_unit"));
    EXPECT_FALSE(reader.hasKey("series.instrumental", "value"));

    std::vector<std::string> expected = {"conversion", "series.sediment", "series.instrumental"};
    EXPECT_EQ(reader.getSections(), expected);
    EXPECT_EQ(reader.getSectionsMatching("series.").size(), 2u);
    EXPECT_EQ(reader.getKeys("conversion").size(), 3u);
}

// ============================================================================
// Job Parsing
// ============================================================================

TEST_F(ConfigReaderTest, ParseConversionConfig) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    ConfigReader::ConversionConfig config;
    ASSERT_TRUE(reader.parseConversionConfig(config));
    EXPECT_EQ(config.target_unit, "ky BP");
    EXPECT_EQ(config.num_threads, 2);
    EXPECT_TRUE(config.verbose);

    ConversionOptions options = config.toOptions();
    EXPECT_EQ(options.num_threads, 2u);
    EXPECT_TRUE(options.verbose);
}

TEST_F(ConfigReaderTest, MissingConversionSectionKeepsDefaults) {
    ConfigReader reader;
    reader.loadString("[series.a]\ntime = 1, 2\n");

    ConfigReader::ConversionConfig config;
    EXPECT_FALSE(reader.parseConversionConfig(config));
    EXPECT_TRUE(config.target_unit.empty());
    EXPECT_EQ(config.num_threads, 1);
    EXPECT_FALSE(config.verbose);
}

TEST_F(ConfigReaderTest, ParseSeriesInFileOrder) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    auto series = reader.parseSeries();
    ASSERT_EQ(series.size(), 2u);
    EXPECT_EQ(series[0].name, "sediment");
    EXPECT_EQ(series[0].time_unit, "yr BP");
    EXPECT_EQ(series[0].time, (std::vector<double>{1000.0, 5000.0, 10000.0}));
    EXPECT_EQ(series[1].name, "instrumental");
    EXPECT_TRUE(series[1].value.empty());

    auto records = ConfigReader::toRecords(series);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[1].id, "instrumental");
    EXPECT_EQ(records[1].time_unit, "years CE");
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(ConfigReaderTest, ValidJobPasses) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    auto result = reader.validate();
    EXPECT_TRUE(result.valid);
    EXPECT_TRUE(result.errors.empty());
}

TEST_F(ConfigReaderTest, ValidationReportsErrors) {
    ConfigReader reader;
    reader.loadString("[conversion]\n"
                      "target_unit = parsecs\n"
                      "num_threads = 0\n"
                      "[series.bad_unit]\n"
                      "time_unit = moons\n"
                      "time = 1, 2\n"
                      "[series.no_time]\n"
                      "time_unit = ka\n"
                      "[series.short_value]\n"
                      "time = 1, 2, 3\n"
                      "value = 1, 2\n");

    auto result = reader.validate();
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.errors.size(), 5u);

    // short_value has no time_unit
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_NE(result.warnings[0].find("short_value"), std::string::npos);
}

TEST_F(ConfigReaderTest, PartialNumbersRejected) {
    ConfigReader reader;
    reader.loadString("[series.a]\n"
                      "time = 1871, 19OO, 1950\n");

    std::vector<std::string> rejected;
    std::vector<double> time = reader.getDoubleArray("series.a", "time", &rejected);
    EXPECT_EQ(time, (std::vector<double>{1871.0, 1950.0}));
    EXPECT_EQ(rejected, std::vector<std::string>{"19OO"});

    // Without a sink the token is still skipped, never truncated
    EXPECT_EQ(reader.getDoubleArray("series.a", "time").size(), 2u);
}

TEST_F(ConfigReaderTest, ValidationReportsUnparsableTokens) {
    ConfigReader reader;
    reader.loadString("[conversion]\n"
                      "target_unit = ky BP\n"
                      "[series.a]\n"
                      "time_unit = years\n"
                      "time = 1871, 19OO, 1950\n"
                      "[series.b]\n"
                      "time_unit = yr BP\n"
                      "time = 100, abc, 300\n"
                      "value = 1.0, 2.0, x\n");

    auto series = reader.parseSeries();
    ASSERT_EQ(series.size(), 2u);
    EXPECT_EQ(series[0].rejected, std::vector<std::string>{"time: 19OO"});
    EXPECT_EQ(series[1].rejected, (std::vector<std::string>{"time: abc", "value: x"}));

    // Equal lengths after skipping must not hide the misalignment
    EXPECT_EQ(series[1].time.size(), series[1].value.size());

    auto result = reader.validate();
    EXPECT_FALSE(result.valid);
    ASSERT_EQ(result.errors.size(), 3u);
    EXPECT_NE(result.errors[0].find("19OO"), std::string::npos);
    EXPECT_NE(result.errors[1].find("abc"), std::string::npos);
    EXPECT_NE(result.errors[2].find("value: x"), std::string::npos);
}

TEST_F(ConfigReaderTest, ValidationWarnsOnEmptyJob) {
    ConfigReader reader;
    reader.loadString("# nothing here\n");

    auto result = reader.validate();
    EXPECT_TRUE(result.valid);
    EXPECT_EQ(result.warnings.size(), 2u);
}

// ============================================================================
// Merging and Templates
// ============================================================================

TEST_F(ConfigReaderTest, MergeFileOverrides) {
    const std::string override_file = "test_config_override.config";
    {
        std::ofstream config(override_file);
        config << "[conversion]\n";
        config << "target_unit = ma\n";
        config << "[series.extra]\n";
        config << "time = 5, 6\n";
    }

    ConfigReader reader;
    reader.loadFile(test_config_file);
    EXPECT_TRUE(reader.mergeFile(override_file));
    std::remove(override_file.c_str());

    EXPECT_EQ(reader.getString("conversion", "target_unit"), "ma");
    EXPECT_EQ(reader.getInt("conversion", "num_threads", 0), 2);
    EXPECT_EQ(reader.parseSeries().size(), 3u);
    EXPECT_EQ(reader.parseSeries().back().name, "extra");
}

TEST_F(ConfigReaderTest, GeneratedTemplateIsValid) {
    const std::string template_file = "test_config_template.config";
    ConfigReader::generateTemplate(template_file);

    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(template_file));
    std::remove(template_file.c_str());

    auto result = reader.validate();
    EXPECT_TRUE(result.valid);
    EXPECT_EQ(reader.parseSeries().size(), 1u);

    ConfigReader::ConversionConfig config;
    ASSERT_TRUE(reader.parseConversionConfig(config));
    EXPECT_EQ(config.target_unit, "ky BP");
}

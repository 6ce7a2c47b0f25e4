/**
 * @file test_collection_workflow.cpp
 * @brief Integration test: config job to converted, aligned series
 */

#include <gtest/gtest.h>
#include "PTAX.hpp"
#include <map>
#include <string>
#include <vector>

using namespace PTAX;

class CollectionWorkflowTest : public ::testing::Test {
protected:
    void SetUp() override {
        job = "[conversion]\n"
              "target_unit = ky BP\n"
              "num_threads = 2\n"
              "\n"
              "[series.MD01-2444]\n"
              "time_unit = yr BP\n"
              "time = 500, 1500, 2500, 3500\n"
              "value = 1.0, 2.0, 3.0, 4.0\n"
              "\n"
              "[series.HadSST]\n"
              "time_unit = years CE\n"
              "time = 1850, 1900, 1950, 2000\n"
              "value = 14.0, 14.2, 14.4, 14.9\n"
              "\n"
              "[series.NGRIP]\n"
              "time_unit = ka b2k\n"
              "time = 10, 20, 30\n"
              "value = -35.0, -42.0, -41.0\n"
              "\n"
              "[series.lost]\n"
              "time_unit = dynasties\n"
              "time = 1, 2\n"
              "value = 0.5, 0.6\n";
    }

    std::string job;
};

TEST_F(CollectionWorkflowTest, ConvertsJobAndAlignsValues) {
    ConfigReader reader;
    ASSERT_TRUE(reader.loadString(job));

    // The unknown member unit is reported, the job is still run
    auto validation = reader.validate();
    EXPECT_FALSE(validation.valid);
    ASSERT_EQ(validation.errors.size(), 1u);
    EXPECT_NE(validation.errors[0].find("dynasties"), std::string::npos);

    ConfigReader::ConversionConfig config;
    ASSERT_TRUE(reader.parseConversionConfig(config));

    auto series = reader.parseSeries();
    SeriesCollection collection(ConfigReader::toRecords(series));
    CollectionConversion result = collection.convertTimeUnit(config.target_unit,
                                                             config.toOptions());

    ASSERT_EQ(result.collection.size(), 4u);
    EXPECT_EQ(result.failedMembers(), std::vector<std::string>{"lost"});
    EXPECT_THROW(result.throwIfFailed(), CollectionConversionError);

    std::map<std::string, std::vector<double>> aligned;
    for (size_t i = 0; i < series.size(); ++i) {
        const SeriesRecord& member = result.collection.members()[i];
        aligned[member.id] = reorderBoundValues(series[i].value, member.time.size(),
                                                result.status[i].reordered);
    }

    // Ages stay in order
    const SeriesRecord* core = result.collection.find("MD01-2444");
    ASSERT_NE(core, nullptr);
    EXPECT_FALSE(result.status[0].reordered);
    EXPECT_DOUBLE_EQ(core->time[0], 0.5);
    EXPECT_DOUBLE_EQ(aligned["MD01-2444"][0], 1.0);

    // Calendar years reverse, values follow
    const SeriesRecord* sst = result.collection.find("HadSST");
    ASSERT_NE(sst, nullptr);
    EXPECT_TRUE(result.status[1].reordered);
    EXPECT_DOUBLE_EQ(sst->time.front(), -0.05);
    EXPECT_DOUBLE_EQ(aligned["HadSST"].front(), 14.9);
    EXPECT_DOUBLE_EQ(sst->time.back(), 0.1);
    EXPECT_DOUBLE_EQ(aligned["HadSST"].back(), 14.0);

    // Every converted member shares the target and ascends
    for (size_t i = 0; i < 3; ++i) {
        const SeriesRecord& member = result.collection.members()[i];
        TimeAxis axis(member.time, member.time_unit);
        EXPECT_EQ(axis.descriptor(), resolveTimeUnit("ky BP"));
        EXPECT_TRUE(axis.isAscending()) << member.id;
        EXPECT_EQ(axis.timeName(), "Age");
    }

    // The failed member is kept unchanged with its values
    const SeriesRecord* lost = result.collection.find("lost");
    ASSERT_NE(lost, nullptr);
    EXPECT_EQ(lost->time_unit, "dynasties");
    EXPECT_EQ(aligned["lost"], (std::vector<double>{0.5, 0.6}));
}

TEST_F(CollectionWorkflowTest, ChainedConversionsRecoverAxes) {
    ConfigReader reader;
    reader.loadString(job);

    std::vector<SeriesRecord> records = ConfigReader::toRecords(reader.parseSeries());
    records.pop_back();
    SeriesCollection collection(records);

    CollectionConversion to_ma = collection.convertTimeUnit("ma");
    ASSERT_TRUE(to_ma.allConverted());
    CollectionConversion to_b2k = to_ma.collection.convertTimeUnit("yr b2k");
    ASSERT_TRUE(to_b2k.allConverted());
    CollectionConversion back = to_b2k.collection.convertTimeUnit("ky BP");
    ASSERT_TRUE(back.allConverted());

    CollectionConversion direct = collection.convertTimeUnit("ky BP");
    for (size_t i = 0; i < records.size(); ++i) {
        const auto& expected = direct.collection.members()[i].time;
        const auto& actual = back.collection.members()[i].time;
        ASSERT_EQ(actual.size(), expected.size());
        for (size_t j = 0; j < expected.size(); ++j) {
            EXPECT_NEAR(actual[j], expected[j], 1e-9) << records[i].id << " at " << j;
        }
    }
}

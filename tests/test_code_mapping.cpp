/**
 * @file test_code_mapping.cpp
 * @brief Land-cover class to category to resistance mapping
 */

#include "core/CodeMapping.hpp"
#include <gtest/gtest.h>
#include <limits>

using namespace rxgis;

TEST(CodeMappingTest, TwoStageLookupWithDefaults) {
    CodeMappingTable table;
    table.class_to_category = {{0, 4}, {20, 5}};
    table.default_category = 2;
    table.category_to_resistance = {{4, 90.0}, {5, 75.0}, {2, 15.0}};
    table.default_resistance = 0.0;

    const std::vector<int> categories = map_categories({0.0, 20.0, 5.0}, table);
    EXPECT_EQ(categories, (std::vector<int>{4, 5, 2}));

    const std::vector<double> resistances = map_resistances(categories, table);
    EXPECT_EQ(resistances, (std::vector<double>{90.0, 75.0, 15.0}));
}

TEST(CodeMappingTest, EveryInputGetsAValue) {
    const CodeMappingTable table = default_worldcover_mapping();
    const double nan = std::numeric_limits<double>::quiet_NaN();

    const std::vector<int> categories = map_categories({255.0, nan, 1e12, -1e12, -7.0}, table);
    ASSERT_EQ(categories.size(), 5u);
    for (int category : categories) {
        EXPECT_EQ(category, table.default_category);
    }

    const std::vector<double> resistances = map_resistances({42, 3}, table);
    EXPECT_DOUBLE_EQ(resistances[0], table.default_resistance);
    EXPECT_DOUBLE_EQ(resistances[1], 10.0);
}

TEST(CodeMappingTest, SamplesRoundToTheNearestClass) {
    const CodeMappingTable table = default_worldcover_mapping();
    EXPECT_EQ(map_categories({9.6, 50.4}, table), (std::vector<int>{4, 3}));
}

TEST(CodeMappingTest, ClassCodesOnlyForIntRangeSamples) {
    EXPECT_EQ(to_class_code(79.6), 80);
    EXPECT_EQ(to_class_code(-3.2), -3);
    EXPECT_FALSE(to_class_code(1e12).has_value());
    EXPECT_FALSE(to_class_code(-1e12).has_value());
    EXPECT_FALSE(to_class_code(std::numeric_limits<double>::infinity()).has_value());
    EXPECT_FALSE(to_class_code(std::numeric_limits<double>::quiet_NaN()).has_value());
}

TEST(CodeMappingTest, WorldCoverDefaults) {
    const CodeMappingTable table = default_worldcover_mapping();

    EXPECT_EQ(map_category(100, table.class_to_category, table.default_category), 1);
    EXPECT_EQ(map_category(80, table.class_to_category, table.default_category), 2);
    EXPECT_EQ(map_category(50, table.class_to_category, table.default_category), 3);
    EXPECT_EQ(map_category(10, table.class_to_category, table.default_category), 4);
    EXPECT_EQ(map_category(95, table.class_to_category, table.default_category), 2);

    EXPECT_DOUBLE_EQ(map_resistance(4, table.category_to_resistance, table.default_resistance), 15.0);
    EXPECT_DOUBLE_EQ(map_resistance(5, table.category_to_resistance, table.default_resistance), 20.0);
    EXPECT_DOUBLE_EQ(map_resistance(9, table.category_to_resistance, table.default_resistance), 0.0);
}

TEST(CodeMappingTest, EmptyTablesFallBackToDefaults) {
    CodeMappingTable table;
    table.default_category = 7;
    table.default_resistance = 3.5;

    EXPECT_EQ(map_categories({10.0}, table), (std::vector<int>{7}));
    EXPECT_EQ(map_resistances({7}, table), (std::vector<double>{3.5}));
}

/**
 * @file test_configuration.cpp
 * @brief JSON configuration, validation and command line parsing
 */

#include "TestData.hpp"
#include "ExtractionErrors.hpp"
#include "cli/CommandLineInterface.hpp"
#include "cli/ConfigurationManager.hpp"
#include "core/ConfigValidator.hpp"
#include <gtest/gtest.h>
#include <fstream>

using namespace rxgis;
using json = nlohmann::json;

namespace {

/**
 * @brief Owns argv storage for CommandLineInterface::parse_arguments
 */
class Arguments {
public:
    Arguments(std::initializer_list<std::string> args) : storage_(args) {
        storage_.insert(storage_.begin(), "rx-enrich");
        for (auto& arg : storage_) {
            pointers_.push_back(arg.data());
        }
        pointers_.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(storage_.size()); }
    char** argv() { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

EnrichmentConfig valid_config() {
    EnrichmentConfig config = ConfigurationManager().to_enrichment_config();
    config.elevation_raster = "dem.tif";
    return config;
}

} // anonymous namespace

// ============================================================================
// ConfigurationManager
// ============================================================================

TEST(ConfigurationManagerTest, DefaultsMatchBuiltInValues) {
    const EnrichmentConfig config = ConfigurationManager().to_enrichment_config();

    EXPECT_EQ(config.tx_id, "TX_0001");
    EXPECT_DOUBLE_EQ(config.tx_latitude, 9.345);
    EXPECT_DOUBLE_EQ(config.tx_longitude, -13.40694);
    EXPECT_DOUBLE_EQ(config.frequency_ghz, 0.9);
    EXPECT_EQ(config.zone_id_field, "zone_type_id");
    EXPECT_EQ(config.expected_zone_ids, (std::vector<int>{1, 3, 4}));
    EXPECT_EQ(config.receiver_layout, "radial");
    EXPECT_DOUBLE_EQ(config.layout_scale_m, 1000.0);
    EXPECT_DOUBLE_EQ(config.elevation_sentinel, -9999.0);
    EXPECT_DOUBLE_EQ(config.landcover_sentinel, 255.0);
    EXPECT_FALSE(config.points_file.has_value());

    EXPECT_EQ(config.mappings.class_to_category.at(10), 4);
    EXPECT_EQ(config.mappings.class_to_category.at(100), 1);
    EXPECT_DOUBLE_EQ(config.mappings.category_to_resistance.at(4), 15.0);
    EXPECT_EQ(config.mappings.default_category, 2);
    EXPECT_EQ(config.output_formats, (std::vector<std::string>{"csv"}));
}

TEST(ConfigurationManagerTest, MergeKeepsUnmentionedDefaults) {
    ConfigurationManager manager;
    manager.merge(json::parse(R"({
        "TRANSMITTER": {"latitude": 10.5},
        "LCM10_TO_CT": {"10": 5, "95": 3, "80": null},
        "OUTPUT": {"formats": "geojson"}
    })"));

    const EnrichmentConfig config = manager.to_enrichment_config();
    EXPECT_DOUBLE_EQ(config.tx_latitude, 10.5);
    EXPECT_DOUBLE_EQ(config.tx_longitude, -13.40694);

    EXPECT_EQ(config.mappings.class_to_category.at(10), 5);
    EXPECT_EQ(config.mappings.class_to_category.at(95), 3);
    EXPECT_EQ(config.mappings.class_to_category.at(50), 3);
    EXPECT_EQ(config.mappings.class_to_category.count(80), 0u);
    EXPECT_EQ(config.output_formats, (std::vector<std::string>{"geojson"}));
}

TEST(ConfigurationManagerTest, RejectsMalformedValues) {
    {
        ConfigurationManager manager;
        manager.merge(json::parse(R"({"CT_TO_R": {"forest": 12}})"));
        EXPECT_THROW(manager.to_enrichment_config(), ConfigurationError);
    }
    {
        ConfigurationManager manager;
        manager.merge(json::parse(R"({"P1812": {"frequency_ghz": "high"}})"));
        EXPECT_THROW(manager.to_enrichment_config(), ConfigurationError);
    }
    {
        ConfigurationManager manager;
        manager.merge(json::parse(R"({"DATA": null})"));
        EXPECT_THROW(manager.to_enrichment_config(), ConfigurationError);
    }
    {
        ConfigurationManager manager;
        EXPECT_THROW(manager.merge(json::array()), ConfigurationError);
    }
}

TEST(ConfigurationManagerTest, FileRoundTrip) {
    test::TempDir dir;
    const std::string path = dir.file("site.json");

    EnrichmentConfig config = valid_config();
    config.tx_id = "TX_0042";
    config.points_file = "receivers.gpkg";
    config.output_formats = {"csv", "profiles"};

    ConfigurationManager writer;
    writer.from_enrichment_config(config);
    ASSERT_TRUE(writer.save_to_file(path));

    ConfigurationManager reader;
    ASSERT_TRUE(reader.load_from_file(path));
    const EnrichmentConfig loaded = reader.to_enrichment_config();

    EXPECT_EQ(loaded.tx_id, "TX_0042");
    EXPECT_EQ(loaded.elevation_raster, "dem.tif");
    ASSERT_TRUE(loaded.points_file.has_value());
    EXPECT_EQ(*loaded.points_file, "receivers.gpkg");
    EXPECT_EQ(loaded.output_formats, config.output_formats);
    EXPECT_EQ(reader.get_value<std::string>("TRANSMITTER", "tx_id", ""), "TX_0042");
}

TEST(ConfigurationManagerTest, LoadReportsMissingAndInvalidFiles) {
    test::TempDir dir;
    ConfigurationManager manager;
    EXPECT_FALSE(manager.load_from_file(dir.file("absent.json")));

    const std::string broken = dir.file("broken.json");
    std::ofstream(broken) << "{ \"TRANSMITTER\": ";
    EXPECT_THROW(manager.load_from_file(broken), ConfigurationError);
}

// ============================================================================
// ConfigValidator
// ============================================================================

TEST(ConfigValidatorTest, DefaultsWithADataSourceAreValid) {
    const ValidationResult result = ConfigValidator().validate(valid_config());
    EXPECT_FALSE(result.has_errors());
    EXPECT_TRUE(result.format_error_message().empty());
}

TEST(ConfigValidatorTest, P1812Ranges) {
    EnrichmentConfig config = valid_config();
    config.frequency_ghz = 7.0;
    config.time_percentage = 0.5;
    config.polarization = 3;

    const ValidationResult result = ConfigValidator().validate(config);
    ASSERT_TRUE(result.has_errors());
    ASSERT_EQ(result.conflicts.size(), 1u);
    EXPECT_EQ(result.conflicts[0].involved_params.size(), 3u);
    EXPECT_NE(result.format_error_message().find("Problem 1"), std::string::npos);
}

TEST(ConfigValidatorTest, ReceiverGridAndTransmitter) {
    EnrichmentConfig config = valid_config();
    config.tx_latitude = 91.0;
    config.distance_step_km = 20.0;
    config.max_distance_km = 11.0;

    const ValidationResult result = ConfigValidator().validate(config);
    EXPECT_EQ(result.conflicts.size(), 2u);

    // Grid settings are irrelevant when points come from a file
    config.tx_latitude = 9.0;
    config.points_file = "receivers.gpkg";
    EXPECT_FALSE(ConfigValidator().validate(config).has_errors());
}

TEST(ConfigValidatorTest, ReceiverLayouts) {
    EnrichmentConfig config = valid_config();
    config.receiver_layout = "phyllotaxis";
    config.distance_step_km = 0.0;  // radial settings do not apply
    EXPECT_FALSE(ConfigValidator().validate(config).has_errors());

    config.num_points = 0;
    config.layout_scale_m = -5.0;
    ValidationResult result = ConfigValidator().validate(config);
    ASSERT_EQ(result.conflicts.size(), 1u);
    EXPECT_EQ(result.conflicts[0].involved_params.size(), 2u);

    config.receiver_layout = "hexagonal";
    result = ConfigValidator().validate(config);
    ASSERT_EQ(result.conflicts.size(), 1u);
    EXPECT_NE(result.format_error_message().find("hexagonal"), std::string::npos);
}

TEST(ConfigValidatorTest, DataSourcesAndFormats) {
    EnrichmentConfig config = ConfigurationManager().to_enrichment_config();
    EXPECT_TRUE(ConfigValidator().validate(config).has_errors());

    config.zone_layer = "zones.gpkg";
    config.output_formats = {"csv", "kml"};
    const ValidationResult result = ConfigValidator().validate(config);
    ASSERT_EQ(result.conflicts.size(), 1u);
    EXPECT_EQ(result.conflicts[0].description, "Unsupported output format");

    config.output_formats.clear();
    EXPECT_TRUE(ConfigValidator().validate(config).has_errors());
}

// ============================================================================
// CommandLineInterface
// ============================================================================

TEST(CommandLineInterfaceTest, ParseLatLon) {
    double lat = 0.0;
    double lon = 0.0;
    EXPECT_TRUE(CommandLineInterface::parse_lat_lon("9.345,-13.40694", lat, lon));
    EXPECT_DOUBLE_EQ(lat, 9.345);
    EXPECT_DOUBLE_EQ(lon, -13.40694);

    EXPECT_TRUE(CommandLineInterface::parse_lat_lon("-33.9, 18.4", lat, lon));
    EXPECT_DOUBLE_EQ(lat, -33.9);

    EXPECT_FALSE(CommandLineInterface::parse_lat_lon("9.345", lat, lon));
    EXPECT_FALSE(CommandLineInterface::parse_lat_lon("north,east", lat, lon));
    EXPECT_FALSE(CommandLineInterface::parse_lat_lon("9.3x,1", lat, lon));
    EXPECT_DOUBLE_EQ(lat, -33.9);
}

TEST(CommandLineInterfaceTest, ParseFormatsTrimsEntries) {
    EXPECT_EQ(CommandLineInterface::parse_formats(" csv, geojson ,,profiles"),
              (std::vector<std::string>{"csv", "geojson", "profiles"}));
}

TEST(CommandLineInterfaceTest, OptionsOverrideDefaults) {
    Arguments args{"--elevation", "dem.tif", "-z", "zones.gpkg", "--transmitter", "-9.5,13.25",
                   "--max-distance", "5", "--output-formats", "csv,geojson", "--sequential",
                   "--dry-run", "--silent"};

    CommandLineInterface cli;
    ASSERT_TRUE(cli.parse_arguments(args.argc(), args.argv()));

    const EnrichmentConfig& config = cli.get_config();
    EXPECT_EQ(config.elevation_raster, "dem.tif");
    EXPECT_EQ(config.zone_layer, "zones.gpkg");
    EXPECT_DOUBLE_EQ(config.tx_latitude, -9.5);
    EXPECT_DOUBLE_EQ(config.tx_longitude, 13.25);
    EXPECT_DOUBLE_EQ(config.max_distance_km, 5.0);
    EXPECT_EQ(config.output_formats, (std::vector<std::string>{"csv", "geojson"}));
    EXPECT_FALSE(config.parallel_processing);
    EXPECT_EQ(config.log_level, 1);
    EXPECT_TRUE(cli.is_dry_run());
    EXPECT_EQ(config.mappings.class_to_category.at(10), 4);
}

TEST(CommandLineInterfaceTest, ConfigFileThenOptions) {
    test::TempDir dir;
    const std::string path = dir.file("site.json");
    std::ofstream(path) << R"({"DATA": {"landcover_raster": "wc.tif"}, "RECEIVER_GENERATION": {"max_distance_km": 3}})";

    Arguments args{"--config", path, "--max-distance", "2", "-s"};
    CommandLineInterface cli;
    ASSERT_TRUE(cli.parse_arguments(args.argc(), args.argv()));

    EXPECT_EQ(cli.get_config().landcover_raster, "wc.tif");
    EXPECT_DOUBLE_EQ(cli.get_config().max_distance_km, 2.0);
    ASSERT_TRUE(cli.get_config().config_file.has_value());
}

TEST(CommandLineInterfaceTest, SelectsPhyllotaxisLayout) {
    Arguments args{"--elevation", "dem.tif", "--layout", "phyllotaxis", "-n", "120",
                   "--layout-scale", "2500", "--dry-run", "-s"};

    CommandLineInterface cli;
    ASSERT_TRUE(cli.parse_arguments(args.argc(), args.argv()));
    EXPECT_EQ(cli.get_config().receiver_layout, "phyllotaxis");
    EXPECT_EQ(cli.get_config().num_points, 120);
    EXPECT_DOUBLE_EQ(cli.get_config().layout_scale_m, 2500.0);
}

TEST(CommandLineInterfaceTest, LayoutFromConfigFile) {
    test::TempDir dir;
    const std::string path = dir.file("spiral.json");
    std::ofstream(path) << R"({"DATA": {"elevation_raster": "dem.tif"},
        "RECEIVER_GENERATION": {"layout": "phyllotaxis", "num_points": 64, "scale_m": 800}})";

    Arguments args{"--config", path, "-s"};
    CommandLineInterface cli;
    ASSERT_TRUE(cli.parse_arguments(args.argc(), args.argv()));
    EXPECT_EQ(cli.get_config().receiver_layout, "phyllotaxis");
    EXPECT_EQ(cli.get_config().num_points, 64);
    EXPECT_DOUBLE_EQ(cli.get_config().layout_scale_m, 800.0);

    Arguments invalid{"--config", path, "--num-points", "0", "-s"};
    CommandLineInterface rejecting;
    EXPECT_FALSE(rejecting.parse_arguments(invalid.argc(), invalid.argv()));
    EXPECT_EQ(rejecting.exit_code(), 1);
}

TEST(CommandLineInterfaceTest, InvalidInputSetsExitCode) {
    {
        Arguments args{"--elevation", "dem.tif", "--output-formats", "kml", "-s"};
        CommandLineInterface cli;
        EXPECT_FALSE(cli.parse_arguments(args.argc(), args.argv()));
        EXPECT_EQ(cli.exit_code(), 1);
    }
    {
        Arguments args{"--elevation", "dem.tif", "--max-distance", "far"};
        CommandLineInterface cli;
        EXPECT_FALSE(cli.parse_arguments(args.argc(), args.argv()));
        EXPECT_EQ(cli.exit_code(), 1);
    }
    {
        Arguments args{"--no-such-option"};
        CommandLineInterface cli;
        EXPECT_FALSE(cli.parse_arguments(args.argc(), args.argv()));
        EXPECT_EQ(cli.exit_code(), 1);
    }
}

TEST(CommandLineInterfaceTest, VersionExitsCleanly) {
    Arguments args{"--version"};
    CommandLineInterface cli;
    EXPECT_FALSE(cli.parse_arguments(args.argc(), args.argv()));
    EXPECT_EQ(cli.exit_code(), 0);
}

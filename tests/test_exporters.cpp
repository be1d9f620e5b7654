/**
 * @file test_exporters.cpp
 * @brief CSV, GeoJSON and path profile output
 */

#include "TestData.hpp"
#include "cli/ExportOrchestrator.hpp"
#include "export/CSVExporter.hpp"
#include "export/GeoJSONExporter.hpp"
#include "export/ProfileExporter.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <sstream>

using namespace rxgis;
using namespace rxgis::test;

namespace {

EnrichedPoint make_record(int rx_id, int azimuth_index, int distance_index, double elevation,
                          double resistance, int category, int zone_id) {
    EnrichedPoint record;
    record.point = make_point(-13.4 + 0.01 * distance_index, 9.3 + 0.01 * azimuth_index, rx_id,
                              azimuth_index, distance_index);
    record.point.azimuth_deg = azimuth_index * 90.0;
    record.point.distance_km = distance_index * 0.5;
    record.elevation = elevation;
    record.land_cover_code = 10;
    record.category = category;
    record.resistance = resistance;
    record.zone_id = zone_id;
    return record;
}

/**
 * Two radials, records deliberately out of distance order
 */
std::vector<EnrichedPoint> sample_records() {
    return {
        make_record(2, 0, 1, 12.5, 15.0, 4, 7),
        make_record(1, 0, 0, 10.0, 0.0, 2, 7),
        make_record(3, 1, 0, 10.0, 0.0, 2, 0),
        make_record(4, 1, 1, -9999.0, 20.0, 5, 0),
        make_record(5, 0, 2, 14.0, 10.0, 3, 9)
    };
}

std::vector<std::string> lines_of(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        lines.push_back(line);
    }
    return lines;
}

} // anonymous namespace

TEST(CSVExporterTest, OneRowPerRecord) {
    std::ostringstream out;
    CSVExporter().write(out, sample_records());

    const auto lines = lines_of(out.str());
    ASSERT_EQ(lines.size(), 6u);
    EXPECT_EQ(lines[0], "tx_id,rx_id,azimuth_index,distance_index,azimuth_deg,distance_km,lon,lat,h,ct,Ct,R,zone");
    EXPECT_EQ(lines[1], "TX_TEST,2,0,1,0.000,0.500,-13.3900000,9.3000000,12.500,10,4,15.000,7");
}

TEST(CSVExporterTest, HeaderIsOptional) {
    CSVExporter::Options options;
    options.include_header = false;

    std::ostringstream out;
    CSVExporter(options).write(out, sample_records());
    EXPECT_EQ(lines_of(out.str()).size(), 5u);
}

TEST(CSVExporterTest, QuotesTransmitterIdsWithSeparators) {
    std::vector<EnrichedPoint> records = {make_record(1, 0, 0, 10.0, 0.0, 2, 7)};
    records[0].point.tx_id = "Site \"A\", north";

    std::ostringstream out;
    CSVExporter().write(out, records);

    const auto lines = lines_of(out.str());
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[1], "\"Site \"\"A\"\", north\",1,0,0,0.000,0.000,-13.4000000,9.3000000,10.000,10,2,0.000,7");

    EXPECT_EQ(CSVExporter::escape_csv_field("TX_0001"), "TX_0001");
    EXPECT_EQ(CSVExporter::escape_csv_field("a\nb"), "\"a\nb\"");
}

TEST(GeoJSONExporterTest, FeaturePerRecordWithAttributes) {
    const nlohmann::json collection = GeoJSONExporter().to_feature_collection(sample_records());

    EXPECT_EQ(collection["type"], "FeatureCollection");
    EXPECT_EQ(collection["crs"]["properties"]["name"], "EPSG:4326");
    ASSERT_EQ(collection["features"].size(), 5u);

    const auto& feature = collection["features"][3];
    EXPECT_EQ(feature["geometry"]["type"], "Point");
    EXPECT_DOUBLE_EQ(feature["geometry"]["coordinates"][1].get<double>(), 9.31);
    EXPECT_EQ(feature["properties"]["rx_id"], 4);
    EXPECT_DOUBLE_EQ(feature["properties"]["h"].get<double>(), -9999.0);
    EXPECT_EQ(feature["properties"]["Ct"], 5);
    EXPECT_EQ(feature["properties"]["zone"], 0);
}

TEST(ProfileExporterTest, GroupsByRadialInDistanceOrder) {
    const std::vector<PathProfile> profiles = build_profiles(sample_records());

    ASSERT_EQ(profiles.size(), 2u);
    EXPECT_EQ(profiles[0].azimuth_index, 0);
    EXPECT_EQ(profiles[0].distances_km, (std::vector<double>{0.0, 0.5, 1.0}));
    EXPECT_EQ(profiles[0].heights, (std::vector<double>{10.0, 12.5, 14.0}));
    EXPECT_EQ(profiles[0].categories, (std::vector<int>{2, 4, 3}));
    EXPECT_EQ(profiles[0].zones, (std::vector<int>{7, 7, 9}));
    EXPECT_DOUBLE_EQ(profiles[0].rx_lon, -13.38);

    EXPECT_EQ(profiles[1].azimuth_index, 1);
    EXPECT_DOUBLE_EQ(profiles[1].azimuth_deg, 90.0);
    EXPECT_EQ(profiles[1].resistances, (std::vector<double>{0.0, 20.0}));
}

TEST(ProfileExporterTest, WritesP1812Columns) {
    ProfileExporter::Parameters parameters;
    parameters.frequency_ghz = 0.9;
    parameters.time_percentage = 50.0;
    parameters.tx_lon = -13.40694;
    parameters.tx_lat = 9.345;

    std::ostringstream out;
    ProfileExporter(parameters).write(out, build_profiles(sample_records()));

    const auto lines = lines_of(out.str());
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "f,p,d,h,R,Ct,zone,htg,hrg,pol,phi_t,phi_r,lam_t,lam_r,azimuth");
    EXPECT_EQ(lines[2].rfind("0.9,50,\"[0, 0.5]\",\"[10, -9999]\",\"[0, 20]\",\"[2, 5]\",\"[0, 0]\",57,10,1,9.345,", 0),
              0u);
}

TEST(ExportOrchestratorTest, WritesEveryRequestedFormat) {
    TempDir dir;
    EnrichmentConfig config;
    config.output_directory = (dir.path() / "nested" / "out").string();
    config.base_name = "site";
    config.output_formats = {"csv", "geojson", "profiles"};

    ExportOrchestrator exporter(config);
    ASSERT_TRUE(exporter.export_all_formats(sample_records()));

    ASSERT_EQ(exporter.written_files().size(), 3u);
    for (const auto& file : exporter.written_files()) {
        EXPECT_TRUE(std::filesystem::exists(file)) << file;
    }
    EXPECT_EQ(std::filesystem::path(exporter.output_path("profiles")).filename().string(), "site_profiles.csv");
    EXPECT_TRUE(exporter.output_path("kml").empty());
}

TEST(ExportOrchestratorTest, UnknownFormatFails) {
    TempDir dir;
    EnrichmentConfig config;
    config.output_directory = dir.path().string();
    config.output_formats = {"kml"};

    ExportOrchestrator exporter(config);
    EXPECT_FALSE(exporter.export_all_formats(sample_records()));
    EXPECT_TRUE(exporter.written_files().empty());
}

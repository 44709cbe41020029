#include "cli/CommandLineInterface.hpp"
#include "core/Logger.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <cstdio>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace tess {
namespace gtest {
namespace {

//! Runs the parser over "tess-chop" followed by args.
bool parse(CommandLineInterface& cli, std::vector<std::string> args) {
    args.insert(args.begin(), "tess-chop");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    return cli.parse_arguments(static_cast<int>(argv.size()), argv.data());
}

std::string writeFile(const std::string& name, const std::string& content) {
    std::string path = ::testing::TempDir() + name;
    std::ofstream out(path);
    out << content;
    return path;
}

} // namespace

TEST(CommandLineInterface, SplitListTrimsAndDropsEmptyItems) {
    const std::vector<std::string> expected = {"a", "b c", "d"};
    EXPECT_EQ(CommandLineInterface::split_list(" a, b c ,,d"), expected);
    EXPECT_TRUE(CommandLineInterface::split_list("").empty());
}

TEST(CommandLineInterface, NumberListRejectsText) {
    EXPECT_EQ(CommandLineInterface::parse_number_list("20, 20,10.5"), (std::vector<double>{20, 20, 10.5}));
    EXPECT_THROW(CommandLineInterface::parse_number_list("20,abc"), ConfigurationError);
}

TEST(CommandLineInterface, LayerReferenceSplitsOnLastColon) {
    auto ref = CommandLineInterface::parse_layer_ref("data/districts.gpkg:parishes");
    EXPECT_EQ(ref.path, "data/districts.gpkg");
    EXPECT_EQ(ref.layer, "parishes");

    ref = CommandLineInterface::parse_layer_ref("data/districts.shp");
    EXPECT_EQ(ref.path, "data/districts.shp");
    EXPECT_TRUE(ref.layer.empty());

    // Drive letters are part of the path
    ref = CommandLineInterface::parse_layer_ref("C:\\data\\roads.shp");
    EXPECT_EQ(ref.path, "C:\\data\\roads.shp");
    EXPECT_TRUE(ref.layer.empty());
}

TEST(CommandLineInterface, RasterListNeedsNameAndPath) {
    const auto rasters = CommandLineInterface::parse_raster_list("dem=dem.tif, slope = slope.tif");
    ASSERT_EQ(rasters.size(), 2u);
    EXPECT_EQ(rasters[0].name, "dem");
    EXPECT_EQ(rasters[1].name, "slope");
    EXPECT_EQ(rasters[1].path, "slope.tif");

    EXPECT_THROW(CommandLineInterface::parse_raster_list("dem.tif"), ConfigurationError);
    EXPECT_THROW(CommandLineInterface::parse_raster_list("=dem.tif"), ConfigurationError);
}

TEST(CommandLineInterface, BoundingBoxNeedsFourOrderedNumbers) {
    auto bbox = CommandLineInterface::parse_bbox("-10,0,10,5");
    ASSERT_TRUE(bbox.has_value());
    EXPECT_DOUBLE_EQ(bbox->min_x, -10.0);
    EXPECT_DOUBLE_EQ(bbox->max_y, 5.0);

    EXPECT_FALSE(CommandLineInterface::parse_bbox("0,0,10").has_value());
    EXPECT_FALSE(CommandLineInterface::parse_bbox("10,0,0,5").has_value());
    EXPECT_FALSE(CommandLineInterface::parse_bbox("a,b,c,d").has_value());
}

TEST(CommandLineInterface, ArgumentsFillConfiguration) {
    CommandLineInterface cli;
    ASSERT_TRUE(parse(cli, {"--bbox=-5,-5,5,5", "--point-method", "random-uniform", "-d", "2.5",
                            "--rasters", "dem=dem.tif", "--divisions", "10,30",
                            "--split-source", "data/d.gpkg:districts", "--split-fields", "code",
                            "--split-key", "code", "--optimize-field", "dem_mean",
                            "--no-neighbor-corners", "--no-parallel", "--silent", "--dry-run"}));

    const auto& config = cli.get_config();
    ASSERT_TRUE(config.bbox.has_value());
    EXPECT_DOUBLE_EQ(config.bbox->min_x, -5.0);
    EXPECT_EQ(config.point_method, PointMethod::RANDOM_UNIFORM);
    EXPECT_DOUBLE_EQ(config.min_distance, 2.5);
    ASSERT_EQ(config.rasters.size(), 1u);
    EXPECT_EQ(config.rasters[0].path, "dem.tif");
    EXPECT_EQ(config.area_divisions, (std::vector<double>{10, 30}));
    ASSERT_TRUE(config.split_source.has_value());
    EXPECT_EQ(config.split_source->layer, "districts");
    EXPECT_EQ(config.priority_split_key, (std::vector<std::string>{"code"}));
    EXPECT_EQ(config.priority_optimize_field, "dem_mean");
    EXPECT_FALSE(config.neighbor_corners);
    EXPECT_FALSE(config.parallel_processing);
    EXPECT_EQ(config.log_level, 1);
    EXPECT_TRUE(cli.is_dry_run());
    EXPECT_EQ(cli.exit_code(), 0);

    Logger::setDefaultLevel(LogLevel::INFO);
}

TEST(CommandLineInterface, MalformedBoundingBoxStopsWithError) {
    CommandLineInterface cli;
    EXPECT_FALSE(parse(cli, {"--bbox", "1,2,3"}));
    EXPECT_EQ(cli.exit_code(), 1);
}

TEST(CommandLineInterface, UnknownMethodIsAConfigurationError) {
    CommandLineInterface cli;
    EXPECT_THROW(parse(cli, {"--polygon-method", "hexagon"}), ConfigurationError);
}

TEST(CommandLineInterface, ConfigFileIsOverriddenByArguments) {
    const std::string path = writeFile("tess_config.json", R"({
        "name": "parishes",
        "point_method": "raster_weighted",
        "point_raster_path": "weights.tif",
        "min_distance": 50,
        "rasters": {"slope": "slope.tif", "dem": "dem.tif"},
        "formulas": {"cv": "std_div_mean"},
        "value_percentiles": {"dem": [1, 2]},
        "split_source": {"path": "districts.gpkg", "layer": "parishes"},
        "area_divisions": [25, 25],
        "log_level": 2
    })");

    CommandLineInterface cli;
    ASSERT_TRUE(parse(cli, {"--config", path, "--min-distance", "10"}));

    const auto& config = cli.get_config();
    EXPECT_EQ(config.name, "parishes");
    EXPECT_EQ(config.point_method, PointMethod::RASTER_WEIGHTED);
    EXPECT_EQ(config.point_raster_path, "weights.tif");
    EXPECT_DOUBLE_EQ(config.min_distance, 10.0);
    ASSERT_EQ(config.rasters.size(), 2u);
    EXPECT_EQ(config.rasters[0].name, "dem");
    ASSERT_EQ(config.formulas.size(), 1u);
    EXPECT_EQ(config.formulas[0].reducer, Reducer::STD_DIV_MEAN);
    EXPECT_EQ(config.value_percentiles.at("dem"), (std::vector<double>{1, 2}));
    ASSERT_TRUE(config.split_source.has_value());
    EXPECT_EQ(config.split_source->layer, "parishes");
    EXPECT_EQ(config.area_divisions, (std::vector<double>{25, 25}));
    EXPECT_EQ(config.config_file, path);

    Logger::setDefaultLevel(LogLevel::INFO);
}

TEST(CommandLineInterface, BrokenConfigFileIsReported) {
    const std::string path = writeFile("tess_broken.json", "{ \"name\": ");
    CommandLineInterface cli;
    EXPECT_FALSE(cli.load_config_file(path));
    EXPECT_FALSE(cli.load_config_file(::testing::TempDir() + "does_not_exist.json"));
}

TEST(CommandLineInterface, DefaultConfigFileLoadsBack) {
    const std::string path = ::testing::TempDir() + "tess_default.json";
    ASSERT_TRUE(CommandLineInterface::create_default_config_file(path));

    CommandLineInterface cli;
    ASSERT_TRUE(cli.load_config_file(path));
    const TessellationConfig defaults;
    EXPECT_EQ(cli.get_config().area_divisions, defaults.area_divisions);
    EXPECT_EQ(cli.get_config().point_method, defaults.point_method);
    EXPECT_EQ(cli.get_config().priority_optimize_field, defaults.priority_optimize_field);
}

TEST(TessellationTypes, MethodNamesRoundTrip) {
    EXPECT_EQ(parse_point_method("RASTER-WEIGHTED"), PointMethod::RASTER_WEIGHTED);
    EXPECT_EQ(parse_border_inclusion("after"), BorderInclusion::AFTER_DISTANCE_FILTER);
    EXPECT_EQ(parse_polygon_method("Delaunay"), PolygonMethod::DELAUNAY);
    EXPECT_EQ(to_string(parse_statistic("ptp")), "ptp");
    EXPECT_EQ(to_string(Reducer::VALID_AREA), "valid_area");
    EXPECT_THROW(parse_reducer("median_abs"), ConfigurationError);
}

TEST(TessellationTypes, NumbersFormatWithoutTrailingZeros) {
    EXPECT_EQ(format_number(25.0), "25");
    EXPECT_EQ(format_number(0.5), "0.5");
    EXPECT_EQ(format_number(-3.0), "-3");
}

TEST(TessellationTypes, AttributeTablePadsNewRowsWithNaN) {
    AttributeTable table(2);
    size_t column = table.add_column("a");
    EXPECT_EQ(table.add_column("a"), column);
    table.set(column, 1, 4.0);

    table.resize_rows(3);
    EXPECT_DOUBLE_EQ(table.get(column, 1), 4.0);
    EXPECT_TRUE(std::isnan(table.get(column, 2)));
    EXPECT_FALSE(table.column_index("b").has_value());
    EXPECT_THROW(table.get(column, 3), std::out_of_range);
}

TEST(Logger, LogConfigSetsDefaultAndFacilityLevels) {
    Logger::parseLogConfig("2,ChopPartitioner=6");
    Logger partitioner("ChopPartitioner");
    Logger other("CellBuilder");
    EXPECT_TRUE(partitioner.shouldOutput(LogLevel::TRACE));
    EXPECT_FALSE(other.shouldOutput(LogLevel::INFO));
    EXPECT_TRUE(other.shouldOutput(LogLevel::WARNING));

    Logger::clearFacilityLevels();
    Logger::setDefaultLevel(LogLevel::INFO);
    EXPECT_FALSE(partitioner.shouldOutput(LogLevel::TRACE));
}

TEST(Logger, ComponentLoggersShareTheLogFileLineByLine) {
    const std::string path = ::testing::TempDir() + "tess_threads.log";
    std::remove(path.c_str());
    ASSERT_TRUE(Logger::setLogFile(path));

    constexpr int MESSAGES = 200;
    auto write = [](const std::string& component) {
        Logger logger(component);
        for (int i = 0; i < MESSAGES; ++i) {
            logger.warning("message " + std::to_string(i));
        }
    };
    std::thread sampler(write, "PointSampler");
    std::thread builder(write, "CellBuilder");
    sampler.join();
    builder.join();
    ASSERT_TRUE(Logger::setLogFile(std::nullopt));

    std::ifstream in(path);
    std::string line;
    int lines = 0;
    while (std::getline(in, line)) {
        ++lines;
        EXPECT_EQ(line.front(), '[');
        EXPECT_TRUE(line.find("PointSampler: message ") != std::string::npos ||
                    line.find("CellBuilder: message ") != std::string::npos) << line;
    }
    EXPECT_EQ(lines, 2 * MESSAGES);
}

} // namespace gtest
} // namespace tess

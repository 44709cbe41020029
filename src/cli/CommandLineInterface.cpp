/**
 * @file CommandLineInterface.cpp
 * @brief Command line and JSON configuration parsing
 */

#include "CommandLineInterface.hpp"
#include "SimpleCommandLineParser.hpp"
#include "../core/Logger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

#ifndef TESS_VERSION_STRING
#define TESS_VERSION_STRING "1.0.0"
#endif

using json = nlohmann::json;

namespace tess {

namespace {

std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t");
    return text.substr(start, end - start + 1);
}

VectorLayerRef layer_ref_from_json(const json& value) {
    if (value.is_string()) {
        return CommandLineInterface::parse_layer_ref(value.get<std::string>());
    }
    VectorLayerRef ref;
    ref.path = value.at("path").get<std::string>();
    ref.layer = value.value("layer", std::string());
    return ref;
}

std::vector<VectorLayerRef> layer_refs_from_json(const json& value) {
    std::vector<VectorLayerRef> refs;
    if (value.is_array()) {
        for (const auto& entry : value) {
            refs.push_back(layer_ref_from_json(entry));
        }
    } else if (!value.is_null()) {
        refs.push_back(layer_ref_from_json(value));
    }
    return refs;
}

template<typename T>
void read_value(const json& config, const char* key, T& target) {
    if (config.contains(key) && !config[key].is_null()) {
        target = config[key].get<T>();
    }
}

} // anonymous namespace

bool CommandLineInterface::parse_arguments(int argc, char* argv[]) {
    SimpleCommandLineParser parser("tess-chop",
        "TESS-CHOP - Region tessellation with zonal statistics and priority chops\n"
        "\n"
        "Partitions a region into small polygonal cells, attaches raster statistics\n"
        "to every cell and assigns cells to area-bounded, mutually non-adjacent\n"
        "allocation tranches.");

    parser.add_option("config", "c", "Path to JSON configuration file");
    parser.add_option("create-config", "", "Create default configuration file at path");
    parser.add_option("name", "", "Run name");

    // Region
    parser.add_option("region", "", "Region polygon as WKT");
    parser.add_option("bbox", "", "Region bounding box minx,miny,maxx,maxy");
    parser.add_option("remove-before", "", "Layers subtracted from the region before sampling");
    parser.add_option("remove-after", "", "Layers subtracted from the cells");

    // Split source
    parser.add_option("split-source", "", "Split polygons PATH[:LAYER]");
    parser.add_option("split-filter", "", "OGR attribute filter on the split layer");
    parser.add_option("split-fields", "", "Split attributes copied onto every cell");

    // Tessellation
    parser.add_option("point-method", "p", "Point method: direct, raster_weighted, random_uniform");
    parser.add_option("point-raster", "", "Weight raster for raster_weighted sampling");
    parser.add_option("min-distance", "d", "Minimum distance between points");
    parser.add_option("border", "", "Border vertices: none, before, after");
    parser.add_option("seed", "", "Random seed");
    parser.add_option("polygon-method", "", "Cell method: voronoi, delaunay");
    parser.add_option("min-area", "", "Smallest region or cell area kept");
    parser.add_option("simplify", "", "Region simplification tolerance");

    // Statistics
    parser.add_option("rasters", "r", "Rasters NAME=PATH,NAME=PATH");
    parser.add_option("statistics", "", "Statistics to compute per raster");
    parser.add_option("percentiles", "", "Percentile ranks per raster");

    // Chops
    parser.add_option("split-key", "", "Fields grouping cells chopped together");
    parser.add_option("divisions", "", "Area quota per tranche in percent");
    parser.add_option("optimize-field", "", "Priority column");
    parser.add_flag("neighbor-corners", "", "Corner contact makes cells neighbours (default)");
    parser.add_flag("no-neighbor-corners", "", "Only shared edges make cells neighbours");
    parser.add_option("max-cluster-size", "", "Largest cluster enumerated exhaustively");
    parser.add_option("max-candidates", "", "Cap on enumerated keep sets per tranche");

    // Output
    parser.add_option("output", "o", "Output dataset path");
    parser.add_option("output-layer", "", "Output layer name prefix");
    parser.add_option("output-driver", "", "OGR driver name");
    parser.add_option("epsg", "", "Output EPSG code");
    parser.add_flag("force", "f", "Regenerate even if the output exists");

    // Processing, logging and utility options
    parser.add_flag("parallel", "", "Process split groups in parallel (default)");
    parser.add_flag("no-parallel", "", "Process split groups sequentially");
    parser.add_flag("silent", "s", "Only report errors");
    parser.add_flag("verbose", "v", "Enable verbose logging (same as --log-level 6)");
    parser.add_option("log-level", "", "Logging level: 1=ERROR, 2=WARNING, 3=INFO (default), 4=DETAILED, 5=DEBUG, 6=TRACE\n"
                                       "                Supports facility-specific: \"3,ChopPartitioner=6\"");
    parser.add_option("log-file", "", "Log to file (append if exists)");
    parser.add_flag("dry-run", "", "Parse arguments and validate without processing");
    parser.add_flag("version", "", "Show version information");

    if (!parser.parse(argc, argv)) {
        exit_code_ = parser.help_requested() ? 0 : 1;
        return false;
    }

    if (parser.get_flag("version")) {
        std::cout << "tess-chop v" << TESS_VERSION_STRING << std::endl;
        std::cout << "Built with GDAL/OGR, CGAL, Eigen, TBB" << std::endl;
        return false;
    }

    if (auto config_path = parser.get("create-config")) {
        if (!create_default_config_file(config_path.value())) {
            std::cerr << "Failed to create configuration file: " << config_path.value() << std::endl;
            exit_code_ = 1;
            return false;
        }
        std::cout << "Created default configuration file: " << config_path.value() << std::endl;
        return false;
    }

    if (auto config_file = parser.get("config")) {
        if (!load_config_file(config_file.value())) {
            std::cerr << "Failed to load configuration file: " << config_file.value() << std::endl;
            exit_code_ = 1;
            return false;
        }
        config_.config_file = config_file.value();
    }

    if (auto value = parser.get("bbox")) {
        auto bbox = parse_bbox(value.value());
        if (!bbox) {
            std::cerr << "Invalid bounding box: " << value.value() << " (use minx,miny,maxx,maxy)" << std::endl;
            exit_code_ = 1;
            return false;
        }
        config_.bbox = bbox;
    }

    parse_all_options(parser);
    return true;
}

void CommandLineInterface::parse_all_options(const SimpleCommandLineParser& parser) {
    if (auto value = parser.get("name")) config_.name = value.value();

    // Region
    if (auto value = parser.get("region")) config_.region_wkt = value.value();
    if (auto value = parser.get("remove-before")) {
        config_.remove_before.clear();
        for (const auto& item : split_list(value.value())) {
            config_.remove_before.push_back(parse_layer_ref(item));
        }
    }
    if (auto value = parser.get("remove-after")) {
        config_.remove_after.clear();
        for (const auto& item : split_list(value.value())) {
            config_.remove_after.push_back(parse_layer_ref(item));
        }
    }

    // Split source
    if (auto value = parser.get("split-source")) config_.split_source = parse_layer_ref(value.value());
    if (auto value = parser.get("split-filter")) config_.split_filter = value.value();
    if (auto value = parser.get("split-fields")) config_.split_fields = split_list(value.value());

    // Tessellation
    if (auto value = parser.get("point-method")) config_.point_method = parse_point_method(value.value());
    if (auto value = parser.get("point-raster")) config_.point_raster_path = value.value();
    if (auto value = parser.get_as<double>("min-distance")) config_.min_distance = value.value();
    if (auto value = parser.get("border")) config_.border_inclusion = parse_border_inclusion(value.value());
    if (auto value = parser.get_as<std::uint64_t>("seed")) config_.seed = value.value();
    if (auto value = parser.get("polygon-method")) config_.polygon_method = parse_polygon_method(value.value());
    if (auto value = parser.get_as<double>("min-area")) config_.min_area = value.value();
    if (auto value = parser.get_as<double>("simplify")) config_.simplify_tolerance = value.value();

    // Statistics
    if (auto value = parser.get("rasters")) config_.rasters = parse_raster_list(value.value());
    if (auto value = parser.get("statistics")) {
        config_.statistics.clear();
        for (const auto& name : split_list(value.value())) {
            config_.statistics.push_back(parse_statistic(name));
        }
    }
    if (auto value = parser.get("percentiles")) config_.percentiles = parse_number_list(value.value());

    // Chops
    if (auto value = parser.get("split-key")) config_.priority_split_key = split_list(value.value());
    if (auto value = parser.get("divisions")) config_.area_divisions = parse_number_list(value.value());
    if (auto value = parser.get("optimize-field")) config_.priority_optimize_field = value.value();
    parse_boolean_option(parser, "neighbor-corners", "no-neighbor-corners", config_.neighbor_corners);
    if (auto value = parser.get_as<size_t>("max-cluster-size")) config_.max_cluster_size = value.value();
    if (auto value = parser.get_as<size_t>("max-candidates")) config_.max_candidates = value.value();

    // Output
    if (auto value = parser.get("output")) config_.output_path = value.value();
    if (auto value = parser.get("output-layer")) config_.output_layer = value.value();
    if (auto value = parser.get("output-driver")) config_.output_driver = value.value();
    if (auto value = parser.get_as<int>("epsg")) config_.epsg = value.value();
    if (parser.get_flag("force")) config_.force = true;

    parse_boolean_option(parser, "parallel", "no-parallel", config_.parallel_processing);

    parse_logging_options(parser);

    dry_run_ = parser.get_flag("dry-run");
}

void CommandLineInterface::parse_logging_options(const SimpleCommandLineParser& parser) {
    // Priority: CLI > ENV > config file > defaults

    // 1. Configuration file
    if (!config_.log_config.empty()) {
        Logger::parseLogConfig(config_.log_config);
    } else {
        Logger::setDefaultLevel(static_cast<LogLevel>(std::clamp(config_.log_level, 1, 6)));
    }

    // 2. Environment
    if (const char* env_log_level = std::getenv("TESS_LOG_LEVEL")) {
        config_.log_config = env_log_level;
        Logger::parseLogConfig(config_.log_config);
    }

    // 3. Command line
    if (auto value = parser.get("log-level")) {
        config_.log_config = value.value();
        Logger::parseLogConfig(config_.log_config);
    }

    std::string first = trim(config_.log_config.substr(0, config_.log_config.find(',')));
    if (!first.empty() && first.find('=') == std::string::npos) {
        try {
            config_.log_level = std::clamp(std::stoi(first), 1, 6);
        } catch (const std::exception&) {
            std::cerr << "Warning: Invalid log level '" << first << "'" << std::endl;
        }
    }

    // 4. Flags override everything
    if (parser.get_flag("silent")) {
        config_.log_level = 1;
        Logger::setDefaultLevel(LogLevel::ERROR);
    }
    if (parser.get_flag("verbose")) {
        config_.log_level = 6;
        Logger::setDefaultLevel(LogLevel::TRACE);
    }

    // 5. Log file
    if (const char* env_log_file = std::getenv("TESS_LOG_FILE")) {
        config_.log_file = std::string(env_log_file);
    }
    if (auto value = parser.get("log-file")) {
        config_.log_file = value.value();
    }
    if (config_.log_file && !Logger::setLogFile(config_.log_file)) {
        std::cerr << "Warning: Could not open log file " << *config_.log_file << std::endl;
    }
}

void CommandLineInterface::parse_boolean_option(const SimpleCommandLineParser& parser,
                                                const std::string& positive_flag,
                                                const std::string& negative_flag,
                                                bool& config_value) {
    if (parser.get_flag(positive_flag)) {
        config_value = true;
    } else if (parser.get_flag(negative_flag)) {
        config_value = false;
    }
}

std::vector<std::string> CommandLineInterface::split_list(const std::string& text) {
    std::vector<std::string> items;
    std::istringstream iss(text);
    std::string item;
    while (std::getline(iss, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

std::vector<double> CommandLineInterface::parse_number_list(const std::string& text) {
    std::vector<double> values;
    for (const auto& item : split_list(text)) {
        try {
            values.push_back(std::stod(item));
        } catch (const std::exception&) {
            throw ConfigurationError("not a number: '" + item + "'");
        }
    }
    return values;
}

VectorLayerRef CommandLineInterface::parse_layer_ref(const std::string& text) {
    VectorLayerRef ref;
    ref.path = text;

    // PATH:LAYER, ignoring drive letters and colons inside directories
    size_t colon = text.rfind(':');
    size_t slash = text.find_last_of("/\\");
    if (colon != std::string::npos && colon > 1 && (slash == std::string::npos || colon > slash)) {
        ref.path = text.substr(0, colon);
        ref.layer = text.substr(colon + 1);
    }
    return ref;
}

std::vector<RasterLayerRef> CommandLineInterface::parse_raster_list(const std::string& text) {
    std::vector<RasterLayerRef> rasters;
    for (const auto& item : split_list(text)) {
        size_t eq = item.find('=');
        if (eq == std::string::npos || eq == 0 || eq + 1 == item.size()) {
            throw ConfigurationError("raster entry '" + item + "' is not NAME=PATH");
        }
        rasters.push_back({trim(item.substr(0, eq)), trim(item.substr(eq + 1))});
    }
    return rasters;
}

std::optional<BoundingBox> CommandLineInterface::parse_bbox(const std::string& text) {
    std::vector<double> coords;
    try {
        coords = parse_number_list(text);
    } catch (const ConfigurationError&) {
        return std::nullopt;
    }
    if (coords.size() != 4 || coords[0] >= coords[2] || coords[1] >= coords[3]) {
        return std::nullopt;
    }
    return BoundingBox(coords[0], coords[1], coords[2], coords[3]);
}

bool CommandLineInterface::create_default_config_file(const std::string& filename) {
    TessellationConfig defaults;

    json config;
    config["name"] = defaults.name;
    config["region_wkt"] = nullptr;
    config["bbox"] = {0.0, 0.0, 1000.0, 1000.0};
    config["remove_before"] = json::array();
    config["remove_after"] = json::array();
    config["split_source"] = nullptr;
    config["split_filter"] = defaults.split_filter;
    config["split_fields"] = defaults.split_fields;
    config["point_method"] = to_string(defaults.point_method);
    config["point_raster_path"] = defaults.point_raster_path;
    config["min_distance"] = defaults.min_distance;
    config["border_inclusion"] = to_string(defaults.border_inclusion);
    config["seed"] = defaults.seed;
    config["polygon_method"] = to_string(defaults.polygon_method);
    config["min_area"] = defaults.min_area;
    config["simplify_tolerance"] = defaults.simplify_tolerance;
    config["rasters"] = json::object();

    json statistics = json::array();
    for (auto statistic : defaults.statistics) {
        statistics.push_back(to_string(statistic));
    }
    config["statistics"] = statistics;
    config["percentiles"] = defaults.percentiles;
    config["formulas"] = json::object();
    config["value_percentiles"] = json::object();
    config["priority_split_key"] = defaults.priority_split_key;
    config["area_divisions"] = defaults.area_divisions;
    config["priority_optimize_field"] = defaults.priority_optimize_field;
    config["neighbor_corners"] = defaults.neighbor_corners;
    config["max_cluster_size"] = defaults.max_cluster_size;
    config["max_candidates"] = defaults.max_candidates;
    config["output_path"] = defaults.output_path;
    config["output_layer"] = defaults.output_layer;
    config["output_driver"] = defaults.output_driver;
    config["epsg"] = defaults.epsg;
    config["force"] = defaults.force;
    config["parallel_processing"] = defaults.parallel_processing;
    config["log_level"] = defaults.log_level;

    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    file << config.dump(2) << std::endl;
    return static_cast<bool>(file);
}

bool CommandLineInterface::load_config_file(const std::string& filename) {
    try {
        std::ifstream file(filename);
        if (!file.is_open()) {
            std::cerr << "Error: Could not open config file: " << filename << std::endl;
            return false;
        }

        json config;
        file >> config;

        read_value(config, "name", config_.name);

        // Region
        if (config.contains("region_wkt") && config["region_wkt"].is_string()) {
            config_.region_wkt = config["region_wkt"].get<std::string>();
        }
        if (config.contains("bbox") && !config["bbox"].is_null()) {
            auto coords = config["bbox"].get<std::vector<double>>();
            if (coords.size() != 4) {
                std::cerr << "Error: bbox needs four numbers" << std::endl;
                return false;
            }
            config_.bbox = BoundingBox(coords[0], coords[1], coords[2], coords[3]);
        }
        if (config.contains("remove_before")) config_.remove_before = layer_refs_from_json(config["remove_before"]);
        if (config.contains("remove_after")) config_.remove_after = layer_refs_from_json(config["remove_after"]);

        // Split source
        if (config.contains("split_source") && !config["split_source"].is_null()) {
            config_.split_source = layer_ref_from_json(config["split_source"]);
        }
        read_value(config, "split_filter", config_.split_filter);
        read_value(config, "split_fields", config_.split_fields);

        // Tessellation
        if (config.contains("point_method")) {
            config_.point_method = parse_point_method(config["point_method"].get<std::string>());
        }
        read_value(config, "point_raster_path", config_.point_raster_path);
        read_value(config, "min_distance", config_.min_distance);
        if (config.contains("border_inclusion")) {
            config_.border_inclusion = parse_border_inclusion(config["border_inclusion"].get<std::string>());
        }
        read_value(config, "seed", config_.seed);
        if (config.contains("polygon_method")) {
            config_.polygon_method = parse_polygon_method(config["polygon_method"].get<std::string>());
        }
        read_value(config, "min_area", config_.min_area);
        read_value(config, "simplify_tolerance", config_.simplify_tolerance);

        // Statistics: rasters as {"name": "path"} or [{"name": .., "path": ..}]
        if (config.contains("rasters")) {
            config_.rasters.clear();
            const auto& rasters = config["rasters"];
            if (rasters.is_object()) {
                for (auto it = rasters.begin(); it != rasters.end(); ++it) {
                    config_.rasters.push_back({it.key(), it.value().get<std::string>()});
                }
            } else {
                for (const auto& entry : rasters) {
                    config_.rasters.push_back({entry.at("name").get<std::string>(),
                                               entry.at("path").get<std::string>()});
                }
            }
        }
        if (config.contains("statistics")) {
            config_.statistics.clear();
            for (const auto& name : config["statistics"]) {
                config_.statistics.push_back(parse_statistic(name.get<std::string>()));
            }
        }
        read_value(config, "percentiles", config_.percentiles);
        if (config.contains("formulas")) {
            config_.formulas.clear();
            for (auto it = config["formulas"].begin(); it != config["formulas"].end(); ++it) {
                config_.formulas.push_back({it.key(), parse_reducer(it.value().get<std::string>())});
            }
        }
        if (config.contains("value_percentiles")) {
            config_.value_percentiles.clear();
            for (auto it = config["value_percentiles"].begin(); it != config["value_percentiles"].end(); ++it) {
                config_.value_percentiles[it.key()] = it.value().get<std::vector<double>>();
            }
        }

        // Chops
        read_value(config, "priority_split_key", config_.priority_split_key);
        read_value(config, "area_divisions", config_.area_divisions);
        read_value(config, "priority_optimize_field", config_.priority_optimize_field);
        read_value(config, "neighbor_corners", config_.neighbor_corners);
        read_value(config, "max_cluster_size", config_.max_cluster_size);
        read_value(config, "max_candidates", config_.max_candidates);

        // Output
        read_value(config, "output_path", config_.output_path);
        read_value(config, "output_layer", config_.output_layer);
        read_value(config, "output_driver", config_.output_driver);
        read_value(config, "epsg", config_.epsg);
        read_value(config, "force", config_.force);

        read_value(config, "parallel_processing", config_.parallel_processing);
        read_value(config, "log_level", config_.log_level);
        read_value(config, "log_config", config_.log_config);
        if (config.contains("log_file") && config["log_file"].is_string()) {
            config_.log_file = config["log_file"].get<std::string>();
        }

        return true;

    } catch (const json::exception& e) {
        std::cerr << "Error parsing JSON config file: " << e.what() << std::endl;
        return false;
    }
}

void CommandLineInterface::print_config() const {
    if (config_.log_level < 4) return;  // Only print at DETAILED level or higher

    std::cout << "\n=== Configuration ===\n";
    std::cout << "Name: " << config_.name << "\n";
    if (config_.region_wkt) {
        std::cout << "Region: WKT (" << config_.region_wkt->size() << " characters)\n";
    } else if (config_.bbox) {
        std::cout << "Region: (" << config_.bbox->min_x << "," << config_.bbox->min_y << ") to ("
                  << config_.bbox->max_x << "," << config_.bbox->max_y << ")\n";
    }
    if (config_.split_source) {
        std::cout << "Split source: " << config_.split_source->path
                  << (config_.split_source->layer.empty() ? "" : ":" + config_.split_source->layer) << "\n";
    }
    std::cout << "Points: " << to_string(config_.point_method) << ", min distance "
              << config_.min_distance << ", border " << to_string(config_.border_inclusion) << "\n";
    std::cout << "Cells: " << to_string(config_.polygon_method) << ", min area " << config_.min_area << "\n";
    std::cout << "Rasters: ";
    for (size_t i = 0; i < config_.rasters.size(); ++i) {
        if (i > 0) std::cout << ", ";
        std::cout << config_.rasters[i].name;
    }
    std::cout << "\nDivisions: ";
    for (size_t i = 0; i < config_.area_divisions.size(); ++i) {
        if (i > 0) std::cout << ",";
        std::cout << config_.area_divisions[i];
    }
    std::cout << "\nOptimize field: " << config_.priority_optimize_field << "\n";
    std::cout << "Output: " << config_.output_path << " (" << config_.output_driver << ", EPSG:" << config_.epsg << ")\n";
    std::cout << "Parallel processing: " << (config_.parallel_processing ? "yes" : "no") << "\n";
    std::cout << "===================\n\n";
}

} // namespace tess

/**
 * @file SimpleCommandLineParser.hpp
 * @brief Lightweight command-line parser for the tess-chop tool
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <sstream>
#include <iostream>

namespace tess {

/**
 * @brief Simple command-line argument parser
 *
 * Supports --long, --long=value, -s short aliases, boolean flags and
 * positional arguments. Help output is grouped by topic.
 */
class SimpleCommandLineParser {
public:
    struct Option {
        std::string long_name;
        std::string short_name;
        std::string description;
        bool required;
        bool has_value;
        std::string default_value;

        // Default constructor for std::map
        Option() : required(false), has_value(true) {}

        Option(const std::string& long_name, const std::string& short_name,
               const std::string& description, bool required = false,
               bool has_value = true, const std::string& default_value = "")
            : long_name(long_name), short_name(short_name), description(description),
              required(required), has_value(has_value), default_value(default_value) {}
    };

    SimpleCommandLineParser(const std::string& program_name, const std::string& description)
        : program_name_(program_name), description_(description) {}

    void add_option(const std::string& long_name, const std::string& short_name,
                    const std::string& description, bool required = false,
                    const std::string& default_value = "") {
        options_[long_name] = Option(long_name, short_name, description, required, true, default_value);
        if (!short_name.empty()) {
            short_to_long_[short_name] = long_name;
        }
    }

    void add_flag(const std::string& long_name, const std::string& short_name,
                  const std::string& description) {
        options_[long_name] = Option(long_name, short_name, description, false, false);
        if (!short_name.empty()) {
            short_to_long_[short_name] = long_name;
        }
    }

    /**
     * @brief Parse command line arguments
     * @return false when help was requested or an argument is invalid
     */
    bool parse(int argc, char* argv[]) {
        args_.clear();
        parsed_values_.clear();
        positional_args_.clear();
        help_requested_ = false;

        for (int i = 1; i < argc; ++i) {
            args_.push_back(argv[i]);
        }

        for (const auto& arg : args_) {
            if (arg == "--help" || arg == "-h") {
                help_requested_ = true;
                show_help();
                return false;
            }
        }

        for (size_t i = 0; i < args_.size(); ++i) {
            const std::string& arg = args_[i];

            if (arg.starts_with("--")) {
                std::string option_name = arg.substr(2);

                // --option=value
                size_t eq_pos = option_name.find('=');
                std::string value;
                bool has_inline_value = false;
                if (eq_pos != std::string::npos) {
                    value = option_name.substr(eq_pos + 1);
                    option_name = option_name.substr(0, eq_pos);
                    has_inline_value = true;
                }

                auto it = options_.find(option_name);
                if (it == options_.end()) {
                    std::cerr << "Unknown option: --" << option_name << std::endl;
                    return false;
                }

                const auto& option = it->second;
                if (option.has_value) {
                    if (!has_inline_value) {
                        if (i + 1 >= args_.size() || looks_like_option(args_[i + 1])) {
                            std::cerr << "Option --" << option_name << " requires a value" << std::endl;
                            return false;
                        }
                        value = args_[++i];
                    }
                    parsed_values_[option_name] = value;
                } else {
                    parsed_values_[option_name] = "true";
                }

            } else if (arg.starts_with("-") && arg.size() > 1 && !is_number(arg)) {
                std::string short_name = arg.substr(1);

                auto it = short_to_long_.find(short_name);
                if (it == short_to_long_.end()) {
                    std::cerr << "Unknown option: -" << short_name << std::endl;
                    return false;
                }

                const std::string& option_name = it->second;
                const auto& option = options_[option_name];

                if (option.has_value) {
                    if (i + 1 >= args_.size() || looks_like_option(args_[i + 1])) {
                        std::cerr << "Option -" << short_name << " requires a value" << std::endl;
                        return false;
                    }
                    parsed_values_[option_name] = args_[++i];
                } else {
                    parsed_values_[option_name] = "true";
                }
            } else {
                positional_args_.push_back(arg);
            }
        }

        for (const auto& [name, option] : options_) {
            if (option.required && parsed_values_.find(name) == parsed_values_.end()) {
                std::cerr << "Required option --" << name << " not provided" << std::endl;
                return false;
            }
        }

        for (const auto& [name, option] : options_) {
            if (parsed_values_.find(name) == parsed_values_.end() && !option.default_value.empty()) {
                parsed_values_[name] = option.default_value;
            }
        }

        return true;
    }

    std::optional<std::string> get(const std::string& option_name) const {
        auto it = parsed_values_.find(option_name);
        if (it != parsed_values_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    bool get_flag(const std::string& option_name) const {
        auto value = get(option_name);
        return value.has_value() && value.value() == "true";
    }

    template<typename T>
    std::optional<T> get_as(const std::string& option_name) const {
        auto value = get(option_name);
        if (!value.has_value()) {
            return std::nullopt;
        }

        std::istringstream iss(value.value());
        T result;
        if (iss >> result) {
            return result;
        }
        return std::nullopt;
    }

    const std::vector<std::string>& get_positional() const {
        return positional_args_;
    }

    bool help_requested() const { return help_requested_; }

    void show_help() const {
        std::cout << description_ << "\n\n";

        std::cout << "USAGE:\n";
        std::cout << "    " << program_name_ << " [OPTIONS]\n";
        std::cout << "    " << program_name_ << " --create-config my_run.json\n";
        std::cout << "    " << program_name_ << " --config my_run.json --force\n\n";

        std::cout << "MAIN OPTIONS:\n";
        print_help_section("config", "Load configuration from JSON file");
        print_help_section("create-config", "Write a default configuration file and exit");
        print_help_section("name", "Run name used in log messages");
        print_help_section("region", "Region polygon as WKT");
        print_help_section("bbox", "Region bounding box: minx,miny,maxx,maxy");
        print_help_section("remove-before", "Layers cut from the region before sampling (PATH[:LAYER],...)");
        print_help_section("remove-after", "Layers cut from the cells after tessellation (PATH[:LAYER],...)");
        print_help_section("dry-run", "Parse and validate without processing");
        print_help_section("force", "Regenerate even if the output exists");
        std::cout << "\n";

        std::cout << "TESSELLATION OPTIONS:\n";
        print_help_section("point-method", "direct, raster_weighted or random_uniform (default: raster_weighted)");
        print_help_section("point-raster", "Weight raster for raster_weighted sampling");
        print_help_section("min-distance", "Minimum distance between points (default: 35)");
        print_help_section("border", "Border vertices: none, before or after (default: none)");
        print_help_section("seed", "Random seed for random_uniform (default: 42)");
        print_help_section("polygon-method", "voronoi or delaunay (default: voronoi)");
        print_help_section("min-area", "Smallest region or cell area kept (default: 1)");
        print_help_section("simplify", "Region simplification tolerance (default: 1)");
        std::cout << "\n";

        std::cout << "SPLIT OPTIONS:\n";
        print_help_section("split-source", "Split polygons: PATH[:LAYER]");
        print_help_section("split-filter", "OGR attribute filter on the split layer");
        print_help_section("split-fields", "Split attributes copied onto cells (comma-separated)");
        std::cout << "\n";

        std::cout << "STATISTICS OPTIONS:\n";
        print_help_section("rasters", "Rasters for zonal statistics: NAME=PATH,...");
        print_help_section("statistics", "min,max,mean,std,var,sum,median,count,ptp (default: min,max,mean,std,var)");
        print_help_section("percentiles", "Percentile ranks (default: 1,25,50,75,99)");
        std::cout << "\n";

        std::cout << "CHOP OPTIONS:\n";
        print_help_section("split-key", "Fields grouping cells that are chopped together");
        print_help_section("divisions", "Area quota per tranche in percent (default: 20,20,20)");
        print_help_section("optimize-field", "Priority column (default: split_area_percentile)");
        print_help_section("no-neighbor-corners", "Cells touching only at a corner are not neighbours");
        print_help_section("max-cluster-size", "Largest cluster enumerated exhaustively (default: 12)");
        print_help_section("max-candidates", "Cap on enumerated keep sets per tranche (default: 100000)");
        std::cout << "\n";

        std::cout << "OUTPUT OPTIONS:\n";
        print_help_section("output", "Output dataset (default: output/tessellation.gpkg)");
        print_help_section("output-layer", "Layer name prefix (default: tessellation)");
        print_help_section("output-driver", "OGR driver (default: GPKG)");
        print_help_section("epsg", "Output EPSG code (default: 3059)");
        std::cout << "\n";

        std::cout << "PROCESSING AND LOGGING:\n";
        print_help_section("parallel", "Process split groups in parallel (default)");
        print_help_section("no-parallel", "Process split groups sequentially");
        print_help_section("silent", "Only report errors");
        print_help_section("verbose", "Enable trace logging (same as --log-level 6)");
        print_help_section("log-level", "1=ERROR .. 6=TRACE, or facility levels \"3,ChopPartitioner=6\"");
        print_help_section("log-file", "Log to file (append if exists)");
        print_help_section("version", "Show version information");
        std::cout << "\n";

        std::cout << "EXAMPLES:\n";
        std::cout << "    " << program_name_ << " --bbox 0,0,1000,1000 --point-method random_uniform --rasters dem=dem.tif\n";
        std::cout << "    " << program_name_ << " --config forest.json --optimize-field dem_mean --divisions 10,10\n";
    }

private:
    static bool is_number(const std::string& text) {
        std::istringstream iss(text);
        double value;
        return (iss >> value) && iss.eof();
    }

    static bool looks_like_option(const std::string& text) {
        return text.starts_with("-") && !is_number(text);
    }

    void print_help_section(const std::string& option_name, const std::string& description) const {
        auto it = options_.find(option_name);
        if (it != options_.end()) {
            const auto& option = it->second;
            std::string label = "--" + option.long_name + (option.has_value ? " VALUE" : "");
            std::cout << "    " << label;
            if (label.size() < 28) {
                std::cout << std::string(28 - label.size(), ' ');
            } else {
                std::cout << "  ";
            }
            std::cout << description << "\n";
        }
    }

    std::string program_name_;
    std::string description_;
    std::map<std::string, Option> options_;
    std::map<std::string, std::string> short_to_long_;
    std::vector<std::string> args_;
    std::map<std::string, std::string> parsed_values_;
    std::vector<std::string> positional_args_;
    bool help_requested_ = false;
};

} // namespace tess

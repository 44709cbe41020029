/**
 * @file CommandLineInterface.hpp
 * @brief Command line interface for the tessellation generator
 */

#pragma once

#include "tessellation.hpp"
#include "SimpleCommandLineParser.hpp"
#include <string>
#include <vector>

namespace tess {

/**
 * @brief Parses arguments and JSON configuration files into a TessellationConfig
 *
 * Precedence: command line > environment (TESS_LOG_LEVEL, TESS_LOG_FILE) >
 * configuration file > defaults.
 */
class CommandLineInterface {
public:
    CommandLineInterface() = default;

    /**
     * @brief Parse command line arguments
     * @return true if the generator should run
     * @throws ConfigurationError for unknown method names
     */
    bool parse_arguments(int argc, char* argv[]);

    const TessellationConfig& get_config() const { return config_; }

    bool is_dry_run() const { return dry_run_; }

    /// Nonzero when parsing stopped on an error rather than on --help/--version
    int exit_code() const { return exit_code_; }

    void print_config() const;

    // Configuration file methods
    static bool create_default_config_file(const std::string& filename);
    bool load_config_file(const std::string& filename);

    // List parsers shared by the command line and the configuration file
    static std::vector<std::string> split_list(const std::string& text);
    static std::vector<double> parse_number_list(const std::string& text);
    static VectorLayerRef parse_layer_ref(const std::string& text);
    static std::vector<RasterLayerRef> parse_raster_list(const std::string& text);
    static std::optional<BoundingBox> parse_bbox(const std::string& text);

private:
    TessellationConfig config_;
    bool dry_run_ = false;
    int exit_code_ = 0;

    void parse_all_options(const SimpleCommandLineParser& parser);

    // Boolean option parsing with --no- variants
    void parse_boolean_option(const SimpleCommandLineParser& parser,
                              const std::string& positive_flag,
                              const std::string& negative_flag,
                              bool& config_value);

    void parse_logging_options(const SimpleCommandLineParser& parser);
};

} // namespace tess

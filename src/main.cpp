/**
 * @file main.cpp
 * @brief Main entry point for tess-chop
 *
 * Tessellates a region into cells, computes zonal raster statistics and
 * assigns cells to non-adjacent, area-bounded priority chops.
 */

#include "tessellation.hpp"
#include "cli/CommandLineInterface.hpp"
#include "core/InputValidator.hpp"
#include <iostream>
#include <chrono>

using namespace tess;

/**
 * @brief Print performance summary
 */
void print_performance_summary(const TessellationMetrics& metrics) {
    std::cout << "\n=== Performance Summary ===\n";
    std::cout << "Input loading: " << metrics.loading_time.count() << "ms\n";
    std::cout << "Tessellation: " << metrics.tessellation_time.count() << "ms\n";
    std::cout << "Zonal statistics: " << metrics.statistics_time.count() << "ms\n";
    std::cout << "Chop partitioning: " << metrics.chop_time.count() << "ms\n";
    std::cout << "Export time: " << metrics.export_time.count() << "ms\n";
    std::cout << "Total time: " << metrics.total_time.count() << "ms\n";
    std::cout << "Regions: " << metrics.regions_processed << " processed, "
              << metrics.regions_skipped << " skipped\n";
    std::cout << "Points generated: " << metrics.points_generated << "\n";
    std::cout << "Cells generated: " << metrics.cells_generated << "\n";
    std::cout << "Split groups: " << metrics.split_groups << "\n";
    std::cout << "============================\n";
}

int main(int argc, char* argv[]) {
    auto start_time = std::chrono::high_resolution_clock::now();

    try {
        CommandLineInterface cli;
        if (!cli.parse_arguments(argc, argv)) {
            return cli.exit_code();  // Help, version, create-config or a parse error
        }

        const TessellationConfig& config = cli.get_config();
        cli.print_config();

        if (cli.is_dry_run()) {
            InputValidator validator;
            ValidationResult validation = validator.validate(config);
            if (validation.has_errors()) {
                std::cerr << validation.format_error_message();
                return 1;
            }
            if (config.log_level > 1) {
                std::cout << "Dry run mode - configuration validated successfully\n";
            }
            return 0;
        }

        TessellationGenerator generator(config);
        if (!generator.generate()) {
            std::cerr << "Error: Tessellation failed\n";
            return 1;
        }

        auto total_duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::high_resolution_clock::now() - start_time);

        if (config.log_level >= 4) {
            print_performance_summary(generator.get_metrics());
        }
        if (config.log_level > 1) {
            std::cout << "\nTessellation completed in " << total_duration.count() << "ms\n";
        }

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}

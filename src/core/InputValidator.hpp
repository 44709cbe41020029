/**
 * @file InputValidator.hpp
 * @brief Input validation for contradictory parameters
 *
 * Validates a tessellation configuration for contradictions and provides
 * clear error messages with suggested solutions when conflicts are detected.
 */

#pragma once

#include "tessellation.hpp"
#include <string>
#include <vector>
#include <optional>

namespace tess {

/**
 * @brief Represents a parameter conflict detected in user inputs
 */
struct ParameterConflict {
    std::string description;                   // Description of the conflict
    std::vector<std::string> involved_params;  // Parameters involved
    std::vector<std::string> suggestions;      // Suggested resolutions
};

/**
 * @brief Result of input validation
 */
struct ValidationResult {
    bool is_valid;
    std::vector<ParameterConflict> conflicts;

    ValidationResult() : is_valid(true) {}

    bool has_errors() const { return !is_valid; }

    std::string format_error_message() const;
};

/**
 * @brief Inputs supplied in memory rather than through the configuration
 */
struct ValidationContext {
    std::vector<std::string> memory_rasters;  // Names of injected rasters
    bool has_point_raster = false;
    bool has_split_regions = false;
};

/**
 * @brief Validates a configuration for contradictions and conflicts
 */
class InputValidator {
public:
    InputValidator() = default;

    /**
     * @brief Validate all configuration parameters
     * @param config Configuration to validate
     * @param context Inputs already supplied in memory
     * @return Validation result with every conflict found
     */
    ValidationResult validate(const TessellationConfig& config,
                              const ValidationContext& context = ValidationContext()) const;

    /**
     * @brief Numeric columns a run with this configuration produces
     */
    static std::vector<std::string> produced_columns(const TessellationConfig& config,
                                                     const std::vector<std::string>& memory_rasters = {});

private:
    std::optional<ParameterConflict> check_sampling_parameters(
        const TessellationConfig& config, const ValidationContext& context) const;

    std::optional<ParameterConflict> check_area_divisions(
        const TessellationConfig& config) const;

    /**
     * @brief Split key fields must be copied from an existing split source
     */
    std::optional<ParameterConflict> check_split_key(
        const TessellationConfig& config, const ValidationContext& context) const;

    std::optional<ParameterConflict> check_optimize_field(
        const TessellationConfig& config, const ValidationContext& context) const;

    /**
     * @brief Value occupancy layers must name configured rasters
     */
    std::optional<ParameterConflict> check_value_percentile_layers(
        const TessellationConfig& config, const ValidationContext& context) const;

    std::optional<ParameterConflict> check_raster_names(
        const TessellationConfig& config, const ValidationContext& context) const;
};

} // namespace tess

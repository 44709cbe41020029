/**
 * @file InputValidator.cpp
 * @brief Implementation of input validation
 */

#include "InputValidator.hpp"
#include "ZonalStatistics.hpp"
#include <algorithm>
#include <set>
#include <sstream>

namespace tess {

namespace {

std::vector<std::string> raster_names(const TessellationConfig& config, const std::vector<std::string>& memory_rasters) {
    std::vector<std::string> names;
    for (const auto& raster : config.rasters) {
        names.push_back(raster.name);
    }
    for (const auto& name : memory_rasters) {
        if (std::find(names.begin(), names.end(), name) == names.end()) {
            names.push_back(name);
        }
    }
    return names;
}

std::string join(const std::vector<std::string>& items) {
    std::ostringstream oss;
    for (size_t i = 0; i < items.size(); ++i) {
        oss << (i ? ", " : "") << items[i];
    }
    return oss.str();
}

} // anonymous namespace

std::string ValidationResult::format_error_message() const {
    if (is_valid || conflicts.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << "\nERROR: Contradictory parameters detected:\n\n";

    for (size_t i = 0; i < conflicts.size(); ++i) {
        const auto& conflict = conflicts[i];

        oss << "Conflict " << (i + 1) << ": " << conflict.description << "\n";

        if (!conflict.involved_params.empty()) {
            oss << "  Involved parameters:\n";
            for (const auto& param : conflict.involved_params) {
                oss << "    " << param << "\n";
            }
        }

        if (!conflict.suggestions.empty()) {
            oss << "  Suggested solutions:\n";
            for (size_t j = 0; j < conflict.suggestions.size(); ++j) {
                oss << "    " << (j + 1) << ". " << conflict.suggestions[j] << "\n";
            }
        }

        if (i < conflicts.size() - 1) {
            oss << "\n";
        }
    }

    oss << "\nProgram terminated due to contradictory inputs.\n";
    return oss.str();
}

std::vector<std::string> InputValidator::produced_columns(const TessellationConfig& config,
                                                          const std::vector<std::string>& memory_rasters) {
    ZonalStatsRequest request;
    request.statistics = config.statistics;
    request.percentiles = config.percentiles;
    request.formulas = config.formulas;
    request.value_percentiles = config.value_percentiles;
    ZonalStatsEngine engine(request);

    std::vector<std::string> columns{"split_area_percentile"};
    for (const auto& name : raster_names(config, memory_rasters)) {
        auto layer_columns = engine.column_names(name);
        columns.insert(columns.end(), layer_columns.begin(), layer_columns.end());
    }
    return columns;
}

ValidationResult InputValidator::validate(const TessellationConfig& config, const ValidationContext& context) const {
    ValidationResult result;
    result.is_valid = true;

    const std::optional<ParameterConflict> checks[] = {
        check_sampling_parameters(config, context),
        check_area_divisions(config),
        check_split_key(config, context),
        check_optimize_field(config, context),
        check_value_percentile_layers(config, context),
        check_raster_names(config, context)
    };

    for (const auto& conflict : checks) {
        if (conflict) {
            result.conflicts.push_back(*conflict);
            result.is_valid = false;
        }
    }

    return result;
}

std::optional<ParameterConflict> InputValidator::check_sampling_parameters(
    const TessellationConfig& config, const ValidationContext& context) const {

    if (config.point_method != PointMethod::DIRECT && !(config.min_distance > 0.0)) {
        ParameterConflict conflict;
        conflict.description = "Generated sampling needs a positive minimum distance";
        conflict.involved_params = {
            "--point-method " + to_string(config.point_method),
            "--min-distance " + format_number(config.min_distance)
        };
        conflict.suggestions = {
            "Use --min-distance 35 (or any positive distance in map units)",
            "Use --point-method direct to tessellate from the region vertices"
        };
        return conflict;
    }

    if (config.point_method == PointMethod::RASTER_WEIGHTED &&
        config.point_raster_path.empty() && !context.has_point_raster) {
        ParameterConflict conflict;
        conflict.description = "raster_weighted sampling has no point raster";
        conflict.involved_params = {"--point-method raster_weighted", "--point-raster (not set)"};
        conflict.suggestions = {
            "Use --point-raster PATH to name the weight raster",
            "Use --point-method random_uniform for unweighted sampling"
        };
        return conflict;
    }

    return std::nullopt;
}

std::optional<ParameterConflict> InputValidator::check_area_divisions(
    const TessellationConfig& config) const {

    std::vector<std::string> bad;
    for (double division : config.area_divisions) {
        if (!(division >= 0.0)) {
            bad.push_back(format_number(division));
        }
    }

    if (config.area_divisions.empty() || !bad.empty()) {
        ParameterConflict conflict;
        conflict.description = config.area_divisions.empty()
            ? "No area divisions configured"
            : "Area divisions must not be negative";
        conflict.involved_params = {"--divisions " + (bad.empty() ? std::string("(empty)") : join(bad))};
        conflict.suggestions = {"Use --divisions 20,20,20 (percent of the split polygon per tranche)"};
        return conflict;
    }

    return std::nullopt;
}

std::optional<ParameterConflict> InputValidator::check_split_key(
    const TessellationConfig& config, const ValidationContext& context) const {

    if (config.priority_split_key.empty()) {
        return std::nullopt;
    }

    if (!config.split_source && !context.has_split_regions) {
        ParameterConflict conflict;
        conflict.description = "Priority split key given without a split source";
        conflict.involved_params = {"--split-key " + join(config.priority_split_key), "--split-source (not set)"};
        conflict.suggestions = {
            "Use --split-source PATH[:LAYER] with --split-fields",
            "Remove --split-key to chop the whole region as one group"
        };
        return conflict;
    }

    std::vector<std::string> missing;
    for (const auto& field : config.priority_split_key) {
        if (std::find(config.split_fields.begin(), config.split_fields.end(), field) == config.split_fields.end()) {
            missing.push_back(field);
        }
    }

    if (!missing.empty()) {
        ParameterConflict conflict;
        conflict.description = "Priority split key fields are not copied from the split source";
        conflict.involved_params = {
            "--split-key " + join(config.priority_split_key),
            "--split-fields " + (config.split_fields.empty() ? std::string("(empty)") : join(config.split_fields))
        };
        std::vector<std::string> fields = config.split_fields;
        fields.insert(fields.end(), missing.begin(), missing.end());
        conflict.suggestions = {"Use --split-fields " + join(fields)};
        return conflict;
    }

    return std::nullopt;
}

std::optional<ParameterConflict> InputValidator::check_optimize_field(
    const TessellationConfig& config, const ValidationContext& context) const {

    auto columns = produced_columns(config, context.memory_rasters);
    if (std::find(columns.begin(), columns.end(), config.priority_optimize_field) != columns.end()) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Priority optimize field is not a produced column";
    conflict.involved_params = {"--optimize-field " + config.priority_optimize_field};
    conflict.suggestions = {"Use --optimize-field split_area_percentile"};
    for (size_t i = 1; i < columns.size() && conflict.suggestions.size() < 4; ++i) {
        conflict.suggestions.push_back("Use --optimize-field " + columns[i]);
    }
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_value_percentile_layers(
    const TessellationConfig& config, const ValidationContext& context) const {

    auto names = raster_names(config, context.memory_rasters);
    std::vector<std::string> unknown;
    for (const auto& entry : config.value_percentiles) {
        if (std::find(names.begin(), names.end(), entry.first) == names.end()) {
            unknown.push_back(entry.first);
        }
    }

    if (unknown.empty()) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Value occupancy requested for layers that are not configured rasters";
    conflict.involved_params = {"value_percentiles: " + join(unknown)};
    conflict.involved_params.push_back("rasters: " + (names.empty() ? std::string("(none)") : join(names)));
    conflict.suggestions = {"Add the layers with --rasters NAME=PATH", "Remove the layers from value_percentiles"};
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_raster_names(
    const TessellationConfig& config, const ValidationContext& context) const {

    std::set<std::string> seen;
    std::vector<std::string> duplicates;
    for (const auto& raster : config.rasters) {
        if (raster.name.empty() || !seen.insert(raster.name).second) {
            duplicates.push_back(raster.name.empty() ? "(empty name)" : raster.name);
        }
    }

    if (duplicates.empty()) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Raster layer names must be unique and non-empty";
    conflict.involved_params = {"--rasters " + join(duplicates)};
    if (!context.memory_rasters.empty()) {
        conflict.involved_params.push_back("in-memory rasters: " + join(context.memory_rasters));
    }
    conflict.suggestions = {"Give every raster its own name with --rasters NAME=PATH,NAME=PATH"};
    return conflict;
}

} // namespace tess

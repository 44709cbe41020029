#pragma once

/**
 * @file VectorSource.hpp
 * @brief Reading polygons and attributes from OGR vector layers
 */

#include "tessellation.hpp"
#include "Logger.hpp"
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace tess {

/**
 * @brief Geometry and selected string attributes of one feature
 */
struct VectorFeature {
    OGRGeometryUniquePtr geometry;
    std::vector<std::string> fields;
};

/**
 * @brief Reads vector layers once per run and serves cached copies
 */
class VectorSource {
public:
    VectorSource();

    /**
     * @brief Read the features of a layer
     * @param ref Dataset path and layer name (empty name selects the first layer)
     * @param bbox Optional spatial filter rectangle
     * @param attribute_filter OGR SQL WHERE clause, empty for none
     * @param fields Attribute names copied into VectorFeature::fields
     * @param features Receives one entry per feature with a geometry
     * @return false when the dataset, layer, filter or a field is unusable
     */
    bool read(const VectorLayerRef& ref,
              const std::optional<BoundingBox>& bbox,
              const std::string& attribute_filter,
              const std::vector<std::string>& fields,
              std::vector<VectorFeature>& features);

    /**
     * @brief Repaired union of all geometries of several layers
     * @return false when a layer cannot be read; geometry is null when the layers are empty
     */
    bool read_union(const std::vector<VectorLayerRef>& refs,
                    const std::optional<BoundingBox>& bbox,
                    OGRGeometryUniquePtr& geometry);

    size_t cached_layers() const { return cache_.size(); }

private:
    using CacheKey = std::tuple<std::string, std::string, std::string, std::vector<std::string>>;

    std::map<CacheKey, std::vector<VectorFeature>> cache_;
    Logger logger_;

    static std::vector<VectorFeature> copy_features(const std::vector<VectorFeature>& features);
};

} // namespace tess

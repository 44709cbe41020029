/**
 * @file VectorSource.cpp
 * @brief OGR vector layer reading with a per-run cache
 */

#include "VectorSource.hpp"
#include "GeometryUtils.hpp"
#include <gdal_priv.h>
#include <ogrsf_frmts.h>
#include <memory>

namespace tess {

namespace {

struct DatasetCloser {
    void operator()(GDALDataset* dataset) const {
        if (dataset) {
            GDALClose(dataset);
        }
    }
};

using VectorDatasetPtr = std::unique_ptr<GDALDataset, DatasetCloser>;

std::string layer_label(const VectorLayerRef& ref) {
    return ref.path + (ref.layer.empty() ? "" : ":" + ref.layer);
}

} // anonymous namespace

VectorSource::VectorSource() : logger_("VectorSource") {
    GDALAllRegister();
}

std::vector<VectorFeature> VectorSource::copy_features(const std::vector<VectorFeature>& features) {
    std::vector<VectorFeature> copy;
    copy.reserve(features.size());
    for (const auto& feature : features) {
        copy.push_back({geometry::clone(*feature.geometry), feature.fields});
    }
    return copy;
}

bool VectorSource::read(const VectorLayerRef& ref,
                        const std::optional<BoundingBox>& bbox,
                        const std::string& attribute_filter,
                        const std::vector<std::string>& fields,
                        std::vector<VectorFeature>& features) {
    CacheKey key{ref.path, ref.layer, attribute_filter, fields};
    auto cached = cache_.find(key);
    if (cached != cache_.end()) {
        features = copy_features(cached->second);
        logger_.debug("Reusing " + std::to_string(features.size()) + " features of " + layer_label(ref));
        return true;
    }

    VectorDatasetPtr dataset(static_cast<GDALDataset*>(
        GDALOpenEx(ref.path.c_str(), GDAL_OF_VECTOR | GDAL_OF_READONLY, nullptr, nullptr, nullptr)));
    if (!dataset) {
        logger_.error("Failed to open vector dataset: " + ref.path);
        return false;
    }

    OGRLayer* layer = ref.layer.empty() ? dataset->GetLayer(0) : dataset->GetLayerByName(ref.layer.c_str());
    if (layer == nullptr) {
        logger_.error("Layer not found: " + layer_label(ref));
        return false;
    }

    if (!attribute_filter.empty() && layer->SetAttributeFilter(attribute_filter.c_str()) != OGRERR_NONE) {
        logger_.error("Invalid attribute filter '" + attribute_filter + "' on " + layer_label(ref));
        return false;
    }
    if (bbox) {
        layer->SetSpatialFilterRect(bbox->min_x, bbox->min_y, bbox->max_x, bbox->max_y);
    }

    OGRFeatureDefn* definition = layer->GetLayerDefn();
    std::vector<int> field_indices;
    for (const auto& field : fields) {
        int index = definition->GetFieldIndex(field.c_str());
        if (index < 0) {
            logger_.error("Field '" + field + "' not found in " + layer_label(ref));
            return false;
        }
        field_indices.push_back(index);
    }

    std::vector<VectorFeature> loaded;
    layer->ResetReading();
    for (OGRFeatureUniquePtr feature(layer->GetNextFeature()); feature; feature.reset(layer->GetNextFeature())) {
        const OGRGeometry* geometry = feature->GetGeometryRef();
        if (geometry == nullptr || geometry->IsEmpty()) {
            continue;
        }

        VectorFeature entry;
        entry.geometry = geometry::clone(*geometry);
        for (int index : field_indices) {
            entry.fields.push_back(feature->IsFieldSetAndNotNull(index) ? feature->GetFieldAsString(index) : "");
        }
        loaded.push_back(std::move(entry));
    }

    logger_.detailed("Read " + std::to_string(loaded.size()) + " features from " + layer_label(ref));
    features = copy_features(loaded);
    cache_.emplace(std::move(key), std::move(loaded));
    return true;
}

bool VectorSource::read_union(const std::vector<VectorLayerRef>& refs,
                              const std::optional<BoundingBox>& bbox,
                              OGRGeometryUniquePtr& geometry) {
    std::vector<OGRGeometryUniquePtr> repaired;
    for (const auto& ref : refs) {
        std::vector<VectorFeature> features;
        if (!read(ref, bbox, "", {}, features)) {
            return false;
        }
        for (auto& feature : features) {
            auto fixed = geometry::repair(*feature.geometry);
            if (fixed && !fixed->IsEmpty()) {
                repaired.push_back(std::move(fixed));
            }
        }
    }

    std::vector<const OGRGeometry*> parts;
    for (const auto& part : repaired) {
        parts.push_back(part.get());
    }
    geometry = geometry::union_all(parts);
    if (geometry) {
        geometry = geometry::repair(*geometry);
    }
    return true;
}

} // namespace tess

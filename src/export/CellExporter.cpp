/**
 * @file CellExporter.cpp
 * @brief Implementation of cell and point export through OGR
 */

#include "CellExporter.hpp"
#include <gdal_priv.h>
#include <ogrsf_frmts.h>
#include <ogr_geometry.h>
#include <ogr_spatialref.h>
#include <cmath>
#include <filesystem>
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

} // anonymous namespace

CellExporter::CellExporter()
    : options_(), logger_("CellExporter") {
    GDALAllRegister();
}

CellExporter::CellExporter(const Options& options)
    : options_(options), logger_("CellExporter") {
    GDALAllRegister();
}

bool CellExporter::export_cells(const std::string& filename,
                                const std::vector<Cell>& cells,
                                const AttributeTable& table,
                                const ChopResult& chops,
                                const std::vector<Point2D>& points) {
    if (table.row_count() != cells.size() || chops.final_chop.size() != cells.size() ||
        chops.initial_chop.size() != cells.size()) {
        logger_.error("Attribute rows (" + std::to_string(table.row_count()) + ") or chops (" +
                      std::to_string(chops.final_chop.size()) + ") do not match " +
                      std::to_string(cells.size()) + " cells");
        return false;
    }

    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName(options_.driver_name.c_str());
    if (!driver) {
        logger_.error("OGR driver not available: " + options_.driver_name);
        return false;
    }

    std::filesystem::path output_path(filename);
    std::error_code ec;
    if (output_path.has_parent_path()) {
        std::filesystem::create_directories(output_path.parent_path(), ec);
        if (ec) {
            logger_.error("Cannot create output directory " + output_path.parent_path().string() + ": " + ec.message());
            return false;
        }
    }

    if (options_.overwrite && std::filesystem::exists(output_path)) {
        if (driver->Delete(filename.c_str()) != CE_None && !std::filesystem::remove(output_path, ec)) {
            logger_.error("Cannot replace existing output: " + filename);
            return false;
        }
    }

    std::unique_ptr<GDALDataset, DatasetCloser> dataset(
        driver->Create(filename.c_str(), 0, 0, 0, GDT_Unknown, nullptr));
    if (!dataset) {
        logger_.error("Failed to create dataset: " + filename);
        return false;
    }

    if (!write_cells_layer(dataset.get(), cells, table, chops)) {
        return false;
    }
    if (!write_points_layer(dataset.get(), points)) {
        return false;
    }

    logger_.info("Wrote " + std::to_string(cells.size()) + " cells and " + std::to_string(points.size()) +
                 " points to " + filename);
    return true;
}

bool CellExporter::write_cells_layer(GDALDataset* dataset,
                                     const std::vector<Cell>& cells,
                                     const AttributeTable& table,
                                     const ChopResult& chops) {
    OGRSpatialReference srs;
    srs.importFromEPSG(options_.epsg);
    srs.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);

    std::string layer_name = options_.layer_name + "_cells";
    OGRLayer* layer = dataset->CreateLayer(layer_name.c_str(), &srs, wkbPolygon, nullptr);
    if (!layer) {
        logger_.error("Failed to create layer: " + layer_name);
        return false;
    }

    for (const auto& field : options_.split_fields) {
        OGRFieldDefn definition(field.c_str(), OFTString);
        if (layer->CreateField(&definition) != OGRERR_NONE) {
            logger_.error("Failed to create field: " + field);
            return false;
        }
    }
    for (const auto& column : table.column_names()) {
        OGRFieldDefn definition(column.c_str(), OFTReal);
        if (layer->CreateField(&definition) != OGRERR_NONE) {
            logger_.error("Failed to create field: " + column);
            return false;
        }
    }
    for (const char* column : {"initial_chop", "final_chop"}) {
        OGRFieldDefn definition(column, OFTInteger);
        if (layer->CreateField(&definition) != OGRERR_NONE) {
            logger_.error(std::string("Failed to create field: ") + column);
            return false;
        }
    }

    OGRFeatureDefn* layer_definition = layer->GetLayerDefn();
    const int split_base = 0;
    const int numeric_base = static_cast<int>(options_.split_fields.size());
    const int chop_base = numeric_base + static_cast<int>(table.column_count());

    bool in_transaction = dataset->StartTransaction() == OGRERR_NONE;
    size_t failed = 0;

    for (size_t row = 0; row < cells.size(); ++row) {
        OGRFeatureUniquePtr feature(OGRFeature::CreateFeature(layer_definition));

        const Cell& cell = cells[row];
        for (size_t i = 0; i < options_.split_fields.size(); ++i) {
            if (i < cell.attributes.size()) {
                feature->SetField(split_base + static_cast<int>(i), cell.attributes[i].c_str());
            } else {
                feature->SetFieldNull(split_base + static_cast<int>(i));
            }
        }
        for (size_t column = 0; column < table.column_count(); ++column) {
            double value = table.get(column, row);
            if (std::isfinite(value)) {
                feature->SetField(numeric_base + static_cast<int>(column), value);
            } else {
                feature->SetFieldNull(numeric_base + static_cast<int>(column));
            }
        }
        feature->SetField(chop_base, chops.initial_chop[row]);
        feature->SetField(chop_base + 1, chops.final_chop[row]);

        if (cell.geometry) {
            feature->SetGeometry(cell.geometry.get());
        }

        if (layer->CreateFeature(feature.get()) != OGRERR_NONE) {
            ++failed;
        }
    }

    if (in_transaction && dataset->CommitTransaction() != OGRERR_NONE) {
        logger_.error("Failed to commit layer: " + layer_name);
        return false;
    }
    if (failed > 0) {
        logger_.error("Failed to write " + std::to_string(failed) + " of " + std::to_string(cells.size()) + " cells");
        return false;
    }
    return true;
}

bool CellExporter::write_points_layer(GDALDataset* dataset, const std::vector<Point2D>& points) {
    OGRSpatialReference srs;
    srs.importFromEPSG(options_.epsg);
    srs.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);

    std::string layer_name = options_.layer_name + "_points";
    OGRLayer* layer = dataset->CreateLayer(layer_name.c_str(), &srs, wkbPoint, nullptr);
    if (!layer) {
        logger_.error("Failed to create layer: " + layer_name);
        return false;
    }

    bool in_transaction = dataset->StartTransaction() == OGRERR_NONE;
    size_t failed = 0;

    for (const auto& point : points) {
        OGRFeatureUniquePtr feature(OGRFeature::CreateFeature(layer->GetLayerDefn()));
        OGRPoint geometry(point.x(), point.y());
        feature->SetGeometry(&geometry);
        if (layer->CreateFeature(feature.get()) != OGRERR_NONE) {
            ++failed;
        }
    }

    if (in_transaction && dataset->CommitTransaction() != OGRERR_NONE) {
        logger_.error("Failed to commit layer: " + layer_name);
        return false;
    }
    if (failed > 0) {
        logger_.error("Failed to write " + std::to_string(failed) + " of " + std::to_string(points.size()) + " points");
        return false;
    }
    return true;
}

} // namespace tess

#include "export/CellExporter.hpp"
#include "core/GeometryUtils.hpp"

#include <gtest/gtest.h>

#include <gdal_priv.h>
#include <ogrsf_frmts.h>

#include <cmath>
#include <filesystem>
#include <string>
#include <vector>

namespace tess {
namespace gtest {
namespace {

struct ExportData {
    std::vector<Cell> cells;
    AttributeTable table;
    ChopResult chops;
    std::vector<Point2D> points;
};

//! Two unit squares: the first is "north" with a full row, the second has no split value and a NaN mean.
ExportData twoCells() {
    ExportData data;
    for (int i = 0; i < 2; ++i) {
        Cell cell;
        cell.geometry = geometry::make_box(BoundingBox(i, 0, i + 1, 1));
        cell.bounds = BoundingBox(i, 0, i + 1, 1);
        if (i == 0) {
            cell.attributes = {"north"};
        }
        data.cells.push_back(std::move(cell));
    }

    data.table = AttributeTable(2);
    size_t mean = data.table.add_column("dem_mean");
    size_t max = data.table.add_column("dem_max");
    data.table.set(mean, 0, 1.5);
    data.table.set(mean, 1, std::nan(""));
    data.table.set(max, 0, 2.0);
    data.table.set(max, 1, 3.0);

    data.chops.initial_chop = {1, 2};
    data.chops.final_chop = {1, 0};
    data.points = {{0.5, 0.5}, {1.5, 0.5}, {1.0, 1.0}};
    return data;
}

CellExporter::Options gpkgOptions() {
    CellExporter::Options options;
    options.driver_name = "GPKG";
    options.layer_name = "parishes";
    options.split_fields = {"side"};
    return options;
}

//! Fresh output path under the test temp directory.
std::string outputPath(const std::string& name) {
    std::string path = ::testing::TempDir() + name;
    std::filesystem::remove(path);
    return path;
}

bool gpkgAvailable() {
    GDALAllRegister();
    return GetGDALDriverManager()->GetDriverByName("GPKG") != nullptr;
}

} // namespace

TEST(CellExporter, WritesCellAndPointLayers) {
    if (!gpkgAvailable()) {
        GTEST_SKIP() << "GPKG driver not available";
    }
    const std::string path = outputPath("tess_export.gpkg");
    ExportData data = twoCells();

    CellExporter exporter(gpkgOptions());
    ASSERT_TRUE(exporter.export_cells(path, data.cells, data.table, data.chops, data.points));

    GDALDatasetUniquePtr dataset(GDALDataset::Open(path.c_str(), GDAL_OF_VECTOR));
    ASSERT_NE(dataset, nullptr);
    EXPECT_EQ(dataset->GetLayerCount(), 2);

    OGRLayer* cells = dataset->GetLayerByName("parishes_cells");
    ASSERT_NE(cells, nullptr);
    OGRFeatureDefn* definition = cells->GetLayerDefn();
    const std::vector<std::string> names = {"side", "dem_mean", "dem_max", "initial_chop", "final_chop"};
    const std::vector<OGRFieldType> types = {OFTString, OFTReal, OFTReal, OFTInteger, OFTInteger};
    ASSERT_EQ(definition->GetFieldCount(), static_cast<int>(names.size()));
    for (size_t i = 0; i < names.size(); ++i) {
        EXPECT_EQ(definition->GetFieldDefn(static_cast<int>(i))->GetNameRef(), names[i]);
        EXPECT_EQ(definition->GetFieldDefn(static_cast<int>(i))->GetType(), types[i]);
    }
    EXPECT_EQ(cells->GetFeatureCount(), 2);

    cells->ResetReading();
    OGRFeatureUniquePtr first(cells->GetNextFeature());
    ASSERT_NE(first, nullptr);
    EXPECT_STREQ(first->GetFieldAsString(0), "north");
    EXPECT_DOUBLE_EQ(first->GetFieldAsDouble(1), 1.5);
    EXPECT_DOUBLE_EQ(first->GetFieldAsDouble(2), 2.0);
    EXPECT_EQ(first->GetFieldAsInteger(3), 1);
    EXPECT_EQ(first->GetFieldAsInteger(4), 1);
    ASSERT_NE(first->GetGeometryRef(), nullptr);
    EXPECT_NEAR(geometry::area(*first->GetGeometryRef()), 1.0, 1e-9);

    OGRFeatureUniquePtr second(cells->GetNextFeature());
    ASSERT_NE(second, nullptr);
    EXPECT_TRUE(second->IsFieldNull(0));
    EXPECT_TRUE(second->IsFieldNull(1));
    EXPECT_DOUBLE_EQ(second->GetFieldAsDouble(2), 3.0);
    EXPECT_EQ(second->GetFieldAsInteger(3), 2);
    EXPECT_EQ(second->GetFieldAsInteger(4), 0);

    OGRLayer* points = dataset->GetLayerByName("parishes_points");
    ASSERT_NE(points, nullptr);
    EXPECT_EQ(points->GetFeatureCount(), 3);
}

TEST(CellExporter, ReplacesExistingOutput) {
    if (!gpkgAvailable()) {
        GTEST_SKIP() << "GPKG driver not available";
    }
    const std::string path = outputPath("tess_replace.gpkg");
    ExportData data = twoCells();

    CellExporter exporter(gpkgOptions());
    ASSERT_TRUE(exporter.export_cells(path, data.cells, data.table, data.chops, data.points));

    ExportData single;
    Cell cell;
    cell.geometry = geometry::make_box(BoundingBox(0, 0, 2, 2));
    cell.attributes = {"south"};
    single.cells.push_back(std::move(cell));
    single.table = AttributeTable(1);
    size_t mean = single.table.add_column("dem_mean");
    single.table.set(mean, 0, 4.0);
    single.chops.initial_chop = {1};
    single.chops.final_chop = {1};

    ASSERT_TRUE(exporter.export_cells(path, single.cells, single.table, single.chops, single.points));

    GDALDatasetUniquePtr dataset(GDALDataset::Open(path.c_str(), GDAL_OF_VECTOR));
    ASSERT_NE(dataset, nullptr);
    EXPECT_EQ(dataset->GetLayerCount(), 2);

    OGRLayer* cells = dataset->GetLayerByName("parishes_cells");
    ASSERT_NE(cells, nullptr);
    EXPECT_EQ(cells->GetFeatureCount(), 1);
    EXPECT_EQ(cells->GetLayerDefn()->GetFieldCount(), 4);

    cells->ResetReading();
    OGRFeatureUniquePtr feature(cells->GetNextFeature());
    ASSERT_NE(feature, nullptr);
    EXPECT_STREQ(feature->GetFieldAsString(0), "south");

    OGRLayer* points = dataset->GetLayerByName("parishes_points");
    ASSERT_NE(points, nullptr);
    EXPECT_EQ(points->GetFeatureCount(), 0);
}

TEST(CellExporter, MismatchedRowsAreRejected) {
    ExportData data = twoCells();
    data.chops.final_chop.pop_back();

    const std::string path = outputPath("tess_mismatch.gpkg");
    CellExporter exporter(gpkgOptions());
    EXPECT_FALSE(exporter.export_cells(path, data.cells, data.table, data.chops, data.points));
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST(CellExporter, UnknownDriverIsReported) {
    ExportData data = twoCells();
    CellExporter::Options options = gpkgOptions();
    options.driver_name = "NoSuchDriver";

    const std::string path = outputPath("tess_unknown.gpkg");
    CellExporter exporter(options);
    EXPECT_FALSE(exporter.export_cells(path, data.cells, data.table, data.chops, data.points));
    EXPECT_FALSE(std::filesystem::exists(path));
}

} // namespace gtest
} // namespace tess

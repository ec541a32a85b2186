// Copyright 2024 IceSTAC Authors
// SPDX-License-Identifier: Apache-2.0
//
// Catalog store implementation

#include "catalog_store.hpp"
#include "catalog_batch.hpp"
#include "vector_dataset.hpp"
#include "geometry.hpp"
#include "json_utils.hpp"
#include "errors.hpp"

#include <gdal_priv.h>
#include <ogrsf_frmts.h>
#include <cpl_string.h>

#include <cstdio>
#include <cstring>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace icestac {

namespace {
    const char* PARQUET_DRIVER = "Parquet";

    // Non-geometry columns, in table order
    const char* const CATALOG_COLUMNS[] = {
        "id", "type", "stac_version", "datetime", "bbox", "assets", "links",
    };

    // Create the table fields from the batch schema, then append the batch
    bool writeBatch(OGRLayer& layer, const std::vector<CatalogItem>& items) {
        CatalogBatch batch(items);
        ArrowSchema* schema = batch.schema();

        std::string error;
        if (!layer.IsArrowSchemaSupported(schema, nullptr, error)) {
            std::cerr << "Catalog save failed: " << error << std::endl;
            return false;
        }

        for (int64_t i = 0; i < schema->n_children; ++i) {
            const ArrowSchema* column = schema->children[i];
            if (std::strcmp(column->name, GEOMETRY_COLUMN) == 0) continue;
            if (!layer.CreateFieldFromArrowSchema(column)) {
                std::cerr << "Catalog save failed: cannot create column " << column->name << std::endl;
                return false;
            }
        }

        if (items.empty()) return true;

        char** options = CSLSetNameValue(nullptr, "GEOMETRY_NAME", GEOMETRY_COLUMN);
        const bool written = layer.WriteArrowBatch(schema, batch.array(), options);
        CSLDestroy(options);
        if (!written) {
            std::cerr << "Catalog save failed: cannot write " << items.size() << " items" << std::endl;
        }
        return written;
    }

    CalendarDate readDate(const OGRFeature& feature, int index) {
        CalendarDate date;
        if (!feature.IsFieldSetAndNotNull(index)) return date;

        const OGRFieldType type = feature.GetFieldDefnRef(index)->GetType();
        if (type == OFTDate || type == OFTDateTime) {
            int hour = 0, minute = 0, tzFlag = 0;
            float second = 0.0f;
            feature.GetFieldAsDateTime(
                index, &date.year, &date.month, &date.day,
                &hour, &minute, &second, &tzFlag);
            return date;
        }

        // Dates stored as text: YYYY-MM-DD[...]
        const char* text = feature.GetFieldAsString(index);
        if (std::sscanf(text, "%4d-%2d-%2d", &date.year, &date.month, &date.day) != 3) {
            return CalendarDate{};
        }
        return date;
    }
}

CatalogStore::CatalogStore(const std::string& path) : path_(path) {
}

const std::string& CatalogStore::getPath() const {
    return path_;
}

bool CatalogStore::exists() const {
    std::error_code ec;
    return fs::exists(path_, ec);
}

std::string CatalogStore::layerName() const {
    return fs::path(path_).stem().string();
}

const std::vector<std::string>& CatalogStore::requiredColumns() {
    static const std::vector<std::string> columns = [] {
        std::vector<std::string> names;
        for (const char* column : CATALOG_COLUMNS) {
            names.emplace_back(column);
        }
        return names;
    }();
    return columns;
}

std::vector<CatalogItem> CatalogStore::load() const {
    std::vector<CatalogItem> items;
    if (!exists()) return items;

    VectorDataset dataset(path_);
    if (!dataset.isOpen()) {
        throw CatalogError("Failed to open catalog " + path_);
    }

    OGRLayer* layer = dataset.getLayer(0);
    if (!layer) {
        throw SchemaMismatch(path_ + " has no table");
    }

    OGRFeatureDefn* defn = layer->GetLayerDefn();
    for (const auto& column : requiredColumns()) {
        if (defn->GetFieldIndex(column.c_str()) < 0) {
            throw SchemaMismatch(path_ + " lacks column '" + column + "'");
        }
    }
    if (defn->GetGeomFieldCount() == 0) {
        throw SchemaMismatch(path_ + " lacks column 'geometry'");
    }

    const int idIdx = defn->GetFieldIndex("id");
    const int typeIdx = defn->GetFieldIndex("type");
    const int versionIdx = defn->GetFieldIndex("stac_version");
    const int datetimeIdx = defn->GetFieldIndex("datetime");
    const int assetsIdx = defn->GetFieldIndex("assets");
    const int linksIdx = defn->GetFieldIndex("links");

    dataset.processFeatures(layer, [&](const OGRFeature& feature) {
        CatalogItem item;
        item.id = feature.GetFieldAsString(idIdx);
        item.type = feature.GetFieldAsString(typeIdx);
        item.stacVersion = feature.GetFieldAsString(versionIdx);
        item.datetime = readDate(feature, datetimeIdx);

        const OGRGeometry* geometry = feature.GetGeometryRef();
        if (!geometry || geometry->IsEmpty()) {
            throw SchemaMismatch("item " + item.id + " in " + path_ + " has no geometry");
        }
        char* text = geometry->exportToJson();
        if (!text) {
            throw SchemaMismatch("item " + item.id + " in " + path_ + " has an unexportable geometry");
        }
        item.geometry = text;
        CPLFree(text);
        item.bbox = boundsOf(item.geometry);

        if (feature.IsFieldSetAndNotNull(assetsIdx)) {
            item.assets = json::assetsFromJson(feature.GetFieldAsString(assetsIdx));
        }
        if (feature.IsFieldSetAndNotNull(linksIdx)) {
            item.links = json::linksFromJson(feature.GetFieldAsString(linksIdx));
        }

        items.push_back(std::move(item));
    });

    return items;
}

bool CatalogStore::save(const std::vector<CatalogItem>& items) const {
    initGDAL();

    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName(PARQUET_DRIVER);
    if (!driver) {
        std::cerr << "Catalog save failed: GDAL has no " << PARQUET_DRIVER << " driver" << std::endl;
        return false;
    }

    // Read-then-overwrite
    if (exists()) {
        std::error_code ec;
        fs::remove(path_, ec);
        if (ec) {
            std::cerr << "Catalog save failed: cannot replace " << path_
                      << ": " << ec.message() << std::endl;
            return false;
        }
    }

    GDALDataset* dataset = driver->Create(path_.c_str(), 0, 0, 0, GDT_Unknown, nullptr);
    if (!dataset) {
        std::cerr << "Catalog save failed: cannot create " << path_ << std::endl;
        return false;
    }

    OGRSpatialReference wgs84;
    wgs84.SetWellKnownGeogCS("WGS84");
    wgs84.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);

    char** layerOptions = nullptr;
    layerOptions = CSLSetNameValue(layerOptions, "GEOMETRY_NAME", GEOMETRY_COLUMN);
    layerOptions = CSLSetNameValue(layerOptions, "WRITE_COVERING_BBOX", "NO");
    OGRLayer* layer = dataset->CreateLayer(layerName().c_str(), &wgs84, wkbPolygon, layerOptions);
    CSLDestroy(layerOptions);

    bool ok = layer != nullptr;
    if (ok) {
        try {
            ok = writeBatch(*layer, items);
        } catch (const std::exception& e) {
            std::cerr << "Catalog save failed: " << e.what() << std::endl;
            ok = false;
        }
    }

    // The Parquet file is finalized on close
    if (GDALClose(dataset) != CE_None) {
        ok = false;
    }
    if (!ok) {
        std::cerr << "Catalog " << path_ << " was not written" << std::endl;
    }
    return ok;
}

} // namespace icestac

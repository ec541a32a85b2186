// Copyright 2024 IceSTAC Authors
// SPDX-License-Identifier: Apache-2.0
//
// Geometry envelope utility implementation

#include "geometry.hpp"
#include "errors.hpp"

#include <gdal.h>
#include <ogrsf_frmts.h>
#include <ogr_geometry.h>
#include <ogr_spatialref.h>
#include <cpl_conv.h>
#include <cpl_error.h>

namespace icestac {

namespace {
    // GDAL initialization helper
    class GDALInit {
    public:
        GDALInit() {
            GDALAllRegister();
            // Catalog coordinates are always longitude/latitude
            CPLSetConfigOption("OGR_CT_FORCE_TRADITIONAL_GIS_ORDER", "YES");
        }
    };

    const char* const IGNORE_AXIS_MAPPING[] = {
        "IGNORE_DATA_AXIS_TO_SRS_AXIS_MAPPING=YES",
        nullptr
    };

    const OGRSpatialReference& wgs84() {
        static const OGRSpatialReference srs = [] {
            OGRSpatialReference s;
            s.SetWellKnownGeogCS("WGS84");
            s.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
            return s;
        }();
        return srs;
    }

    // A geometry without a spatial reference is in the catalog frame
    bool isCatalogFrame(const OGRSpatialReference* srs) {
        return srs == nullptr || srs->IsSame(&wgs84(), IGNORE_AXIS_MAPPING);
    }

    OGRGeometryUniquePtr parseGeoJson(const std::string& json) {
        OGRGeometry* geometry = OGRGeometryFactory::createFromGeoJson(json.c_str());
        if (!geometry) {
            throw InvalidInput("unreadable GeoJSON geometry: " + json.substr(0, 80));
        }
        return OGRGeometryUniquePtr(geometry);
    }

    // Union of all geometries, optionally repairing each one first.
    // Returns nullptr if GEOS rejects the input.
    OGRGeometryUniquePtr unionOf(const std::vector<const OGRGeometry*>& geometries, bool repair) {
        OGRGeometryCollection collection;
        for (const OGRGeometry* geometry : geometries) {
            if (repair) {
                OGRGeometry* valid = geometry->MakeValid();
                if (!valid) return nullptr;
                collection.addGeometryDirectly(valid);
            } else {
                collection.addGeometry(geometry);
            }
        }
        return OGRGeometryUniquePtr(collection.UnaryUnion());
    }

    // Zero-area polygon, such as the envelope of a point or of an
    // axis-parallel line. GEOS drops these from a union.
    bool isCollapsedSurface(const OGRGeometry& geometry) {
        if (geometry.IsEmpty()) return false;

        const OGRwkbGeometryType type = wkbFlatten(geometry.getGeometryType());
        if (OGR_GT_IsSubClassOf(type, wkbCurvePolygon)) {
            return geometry.toCurvePolygon()->get_Area() == 0.0;
        }
        if (OGR_GT_IsSubClassOf(type, wkbMultiSurface)) {
            return geometry.toMultiSurface()->get_Area() == 0.0;
        }
        return false;
    }

    std::string rectangleGeoJson(const OGREnvelope& env) {
        OGRLinearRing ring;
        ring.addPoint(env.MinX, env.MinY);
        ring.addPoint(env.MaxX, env.MinY);
        ring.addPoint(env.MaxX, env.MaxY);
        ring.addPoint(env.MinX, env.MaxY);
        ring.addPoint(env.MinX, env.MinY);

        OGRPolygon polygon;
        polygon.addRing(&ring);

        char* json = polygon.exportToJson();
        if (!json) {
            throw InvalidInput("envelope could not be exported as GeoJSON");
        }
        std::string result = json;
        CPLFree(json);
        return result;
    }
}

void initGDAL() {
    static GDALInit init;
}

std::string envelopeOf(const std::vector<std::string>& geoJsonGeometries) {
    if (geoJsonGeometries.empty()) {
        throw InvalidInput("envelope of an empty geometry collection");
    }

    std::vector<OGRGeometryUniquePtr> owned;
    owned.reserve(geoJsonGeometries.size());
    std::vector<const OGRGeometry*> geometries;
    geometries.reserve(geoJsonGeometries.size());
    for (const auto& json : geoJsonGeometries) {
        owned.push_back(parseGeoJson(json));
        geometries.push_back(owned.back().get());
    }
    return envelopeOf(geometries);
}

std::string envelopeOf(const std::vector<const OGRGeometry*>& geometries) {
    initGDAL();

    if (geometries.empty()) {
        throw InvalidInput("envelope of an empty geometry collection");
    }
    for (const OGRGeometry* geometry : geometries) {
        if (!geometry) {
            throw InvalidInput("null geometry in envelope input");
        }
        if (!isCatalogFrame(geometry->getSpatialReference())) {
            throw InvalidInput("geometry is not in WGS84; reference frames must not be mixed");
        }
    }

    // Union first, then envelope
    CPLPushErrorHandler(CPLQuietErrorHandler);
    OGRGeometryUniquePtr merged = unionOf(geometries, false);
    if (!merged) {
        merged = unionOf(geometries, true);
    }
    CPLPopErrorHandler();

    OGREnvelope env;
    bool covered = false;
    if (merged && !merged->IsEmpty()) {
        merged->getEnvelope(&env);
        covered = true;
    }
    for (const OGRGeometry* geometry : geometries) {
        if (isCollapsedSurface(*geometry)) {
            OGREnvelope part;
            geometry->getEnvelope(&part);
            env.Merge(part);
            covered = true;
        }
    }
    if (!covered) {
        throw InvalidInput(merged ? "union of geometries is empty" : "geometry union failed");
    }

    return rectangleGeoJson(env);
}

BBox boundsOf(const std::string& geoJsonGeometry) {
    OGRGeometryUniquePtr geometry = parseGeoJson(geoJsonGeometry);
    if (geometry->IsEmpty()) {
        throw InvalidInput("bounds of an empty geometry");
    }

    OGREnvelope env;
    geometry->getEnvelope(&env);
    return {env.MinX, env.MinY, env.MaxX, env.MaxY};
}

bool transformToWgs84(OGRGeometry& geometry) {
    initGDAL();

    const OGRSpatialReference* srcSRS = geometry.getSpatialReference();
    if (!srcSRS) {
        geometry.assignSpatialReference(&wgs84());
        return true;
    }
    if (srcSRS->IsSame(&wgs84(), IGNORE_AXIS_MAPPING)) {
        return true;
    }

    OGRCoordinateTransformation* transform =
        OGRCreateCoordinateTransformation(srcSRS, &wgs84());
    if (!transform) {
        return false;
    }
    OGRErr err = geometry.transform(transform);
    OGRCoordinateTransformation::DestroyCT(transform);
    return err == OGRERR_NONE;
}

} // namespace icestac

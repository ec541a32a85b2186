// Copyright 2024 IceSTAC Authors
// SPDX-License-Identifier: Apache-2.0
//
// Geometry envelope utility
// Union-then-envelope over OGR geometries

#ifndef ICESTAC_GEOMETRY_HPP
#define ICESTAC_GEOMETRY_HPP

#include "types.hpp"
#include <string>
#include <vector>

// Forward declarations for GDAL types
class OGRGeometry;

namespace icestac {

// Register GDAL drivers once per process
void initGDAL();

// Smallest axis-aligned rectangle containing the union of GeoJSON geometries.
// Returns the rectangle as a GeoJSON Polygon.
// Throws InvalidInput on empty input, unreadable geometry or an empty union.
std::string envelopeOf(const std::vector<std::string>& geoJsonGeometries);

// Same as above for OGR geometries. All geometries must share one WGS84
// reference frame; a geometry without a spatial reference is taken as WGS84.
std::string envelopeOf(const std::vector<const OGRGeometry*>& geometries);

// Bounds of a GeoJSON geometry as [minX, minY, maxX, maxY]
BBox boundsOf(const std::string& geoJsonGeometry);

// Reproject a geometry to WGS84 longitude/latitude in place.
// Returns false if no transformation to WGS84 exists.
bool transformToWgs84(OGRGeometry& geometry);

} // namespace icestac

#endif // ICESTAC_GEOMETRY_HPP

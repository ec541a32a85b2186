// Copyright 2024 IceSTAC Authors
// SPDX-License-Identifier: Apache-2.0
//
// VectorDataset class header - read access to an OGR vector file

#ifndef ICESTAC_VECTOR_DATASET_HPP
#define ICESTAC_VECTOR_DATASET_HPP

#include <string>
#include <vector>
#include <functional>

// Forward declarations for GDAL types
class GDALDataset;
class OGRLayer;
class OGRFeature;

namespace icestac {

// Owns a read-only GDAL vector dataset (shapefile, FlatGeobuf, GeoParquet...)
class VectorDataset {
public:
    // Constructor - opens the file
    explicit VectorDataset(const std::string& filePath);

    // Destructor - closes the file
    ~VectorDataset();

    // Prevent copying
    VectorDataset(const VectorDataset&) = delete;
    VectorDataset& operator=(const VectorDataset&) = delete;

    // Allow moving
    VectorDataset(VectorDataset&& other) noexcept;
    VectorDataset& operator=(VectorDataset&& other) noexcept;

    // Check if file was opened successfully
    bool isOpen() const;

    // Get the file path
    const std::string& getFilePath() const;

    // Get a layer by index, nullptr if out of range
    OGRLayer* getLayer(int index) const;

    // Visit every feature of a layer
    void processFeatures(OGRLayer* layer, const std::function<void(const OGRFeature&)>& callback) const;

    // Envelope of the union of every feature geometry of every layer,
    // reprojected to WGS84, as a GeoJSON polygon.
    // Throws InvalidInput if the dataset holds no geometry.
    std::string getEnvelopeGeoJson() const;

private:
    std::string filePath_;
    GDALDataset* dataset_ = nullptr;
};

} // namespace icestac

#endif // ICESTAC_VECTOR_DATASET_HPP

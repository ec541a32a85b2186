// Copyright 2024 IceSTAC Authors
// SPDX-License-Identifier: Apache-2.0
//
// VectorDataset class implementation

#include "vector_dataset.hpp"
#include "geometry.hpp"
#include "errors.hpp"

#include <gdal.h>
#include <ogrsf_frmts.h>

#include <stdexcept>

namespace icestac {

VectorDataset::VectorDataset(const std::string& filePath) : filePath_(filePath) {
    initGDAL();

    dataset_ = static_cast<GDALDataset*>(
        GDALOpenEx(filePath.c_str(), GDAL_OF_VECTOR | GDAL_OF_READONLY,
                   nullptr, nullptr, nullptr));
}

VectorDataset::~VectorDataset() {
    if (dataset_) {
        GDALClose(dataset_);
        dataset_ = nullptr;
    }
}

VectorDataset::VectorDataset(VectorDataset&& other) noexcept
    : filePath_(std::move(other.filePath_))
    , dataset_(other.dataset_) {
    other.dataset_ = nullptr;
}

VectorDataset& VectorDataset::operator=(VectorDataset&& other) noexcept {
    if (this != &other) {
        if (dataset_) {
            GDALClose(dataset_);
        }
        filePath_ = std::move(other.filePath_);
        dataset_ = other.dataset_;
        other.dataset_ = nullptr;
    }
    return *this;
}

bool VectorDataset::isOpen() const {
    return dataset_ != nullptr;
}

const std::string& VectorDataset::getFilePath() const {
    return filePath_;
}

OGRLayer* VectorDataset::getLayer(int index) const {
    if (!isOpen() || index < 0 || index >= dataset_->GetLayerCount()) {
        return nullptr;
    }
    return dataset_->GetLayer(index);
}

void VectorDataset::processFeatures(OGRLayer* layer,
                                    const std::function<void(const OGRFeature&)>& callback) const {
    if (!layer) return;

    layer->ResetReading();
    OGRFeatureUniquePtr feature;
    while ((feature = OGRFeatureUniquePtr(layer->GetNextFeature())) != nullptr) {
        callback(*feature);
    }
}

std::string VectorDataset::getEnvelopeGeoJson() const {
    if (!isOpen()) {
        throw std::runtime_error("Failed to open " + filePath_);
    }

    std::vector<OGRGeometryUniquePtr> owned;
    int layerCount = dataset_->GetLayerCount();
    for (int i = 0; i < layerCount; ++i) {
        processFeatures(dataset_->GetLayer(i), [&](const OGRFeature& feature) {
            const OGRGeometry* geometry = feature.GetGeometryRef();
            if (!geometry || geometry->IsEmpty()) return;

            OGRGeometryUniquePtr copy(geometry->clone());
            if (!transformToWgs84(*copy)) {
                throw std::runtime_error("Cannot reproject geometries of " + filePath_ + " to WGS84");
            }
            owned.push_back(std::move(copy));
        });
    }

    if (owned.empty()) {
        throw InvalidInput(filePath_ + " holds no geometry");
    }

    std::vector<const OGRGeometry*> geometries;
    geometries.reserve(owned.size());
    for (const auto& geometry : owned) {
        geometries.push_back(geometry.get());
    }
    return envelopeOf(geometries);
}

} // namespace icestac

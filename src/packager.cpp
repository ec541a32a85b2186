// Copyright 2024 IceSTAC Authors
// SPDX-License-Identifier: Apache-2.0
//
// FolderPackager class implementation

#include "packager.hpp"
#include "vector_dataset.hpp"
#include "geometry.hpp"

#include <gdal.h>
#include <gdal_utils.h>
#include <cpl_conv.h>
#include <cpl_string.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace fs = std::filesystem;

namespace icestac {

namespace {
    const size_t ZIP_CHUNK_SIZE = 1 << 20;

    void addFileToZip(void* zip, const fs::path& file) {
        std::ifstream in(file, std::ios::binary);
        if (!in) {
            throw std::runtime_error("Cannot read " + file.string());
        }

        if (CPLCreateFileInZip(zip, file.filename().string().c_str(), nullptr) != CE_None) {
            throw std::runtime_error("Cannot add " + file.filename().string() + " to archive");
        }

        std::vector<char> buffer(ZIP_CHUNK_SIZE);
        CPLErr err = CE_None;
        while (err == CE_None && in) {
            in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            std::streamsize count = in.gcount();
            if (count > 0) {
                err = CPLWriteFileInZip(zip, buffer.data(), static_cast<int>(count));
            }
        }

        if (CPLCloseFileInZip(zip) != CE_None || err != CE_None) {
            throw std::runtime_error("Failed writing " + file.filename().string() + " to archive");
        }
    }
}

FolderPackager::FolderPackager(const std::string& zipDir, const std::string& flatgeobufDir)
    : zipDir_(zipDir)
    , flatgeobufDir_(flatgeobufDir) {
}

std::string FolderPackager::zipFolder(const std::string& sourceDir, const std::string& folderName) const {
    initGDAL();

    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(sourceDir)) {
        if (entry.is_regular_file()) {
            files.push_back(entry.path());
        }
    }
    if (files.empty()) {
        throw std::runtime_error("Nothing to archive in " + sourceDir);
    }

    // Sort for reproducible archives
    std::sort(files.begin(), files.end());

    const std::string zipPath = (fs::path(zipDir_) / (folderName + ".zip")).string();
    std::error_code ec;
    fs::remove(zipPath, ec);

    void* zip = CPLCreateZip(zipPath.c_str(), nullptr);
    if (!zip) {
        throw std::runtime_error("Cannot create archive " + zipPath);
    }

    try {
        for (const auto& file : files) {
            addFileToZip(zip, file);
        }
    } catch (const std::exception&) {
        CPLCloseZip(zip);
        fs::remove(zipPath, ec);
        throw;
    }

    if (CPLCloseZip(zip) != CE_None) {
        throw std::runtime_error("Failed to finalize archive " + zipPath);
    }
    return zipPath;
}

std::string FolderPackager::convertToFlatGeobuf(const std::string& sourceDir,
                                                const std::string& folderName) const {
    initGDAL();

    const fs::path shpPath = fs::path(sourceDir) / (folderName + ".shp");
    if (!fs::exists(shpPath)) {
        throw std::runtime_error("No .shp file found for " + folderName);
    }

    const std::string fgbPath = (fs::path(flatgeobufDir_) / (folderName + ".fgb")).string();
    std::error_code ec;
    fs::remove(fgbPath, ec);

    GDALDatasetH source = GDALOpenEx(shpPath.string().c_str(), GDAL_OF_VECTOR | GDAL_OF_READONLY,
                                     nullptr, nullptr, nullptr);
    if (!source) {
        throw std::runtime_error("Failed to open " + shpPath.string());
    }

    char** argv = nullptr;
    argv = CSLAddString(argv, "-f");
    argv = CSLAddString(argv, "FlatGeobuf");
    GDALVectorTranslateOptions* options = GDALVectorTranslateOptionsNew(argv, nullptr);
    CSLDestroy(argv);
    if (!options) {
        GDALClose(source);
        throw std::runtime_error("Invalid FlatGeobuf translate options");
    }

    int usageError = FALSE;
    GDALDatasetH output = GDALVectorTranslate(fgbPath.c_str(), nullptr, 1, &source, options, &usageError);
    GDALVectorTranslateOptionsFree(options);
    GDALClose(source);

    if (!output) {
        throw std::runtime_error("FlatGeobuf conversion failed for " + folderName);
    }
    if (GDALClose(output) != CE_None) {
        throw std::runtime_error("Failed to finalize " + fgbPath);
    }
    return fgbPath;
}

std::string FolderPackager::readEnvelope(const std::string& vectorPath) {
    VectorDataset dataset(vectorPath);
    if (!dataset.isOpen()) {
        throw std::runtime_error("Failed to open " + vectorPath);
    }
    return dataset.getEnvelopeGeoJson();
}

} // namespace icestac

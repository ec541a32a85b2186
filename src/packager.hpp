// Copyright 2024 IceSTAC Authors
// SPDX-License-Identifier: Apache-2.0
//
// FolderPackager class header
// Repackages one fetched shapefile folder into a zip and a FlatGeobuf file

#ifndef ICESTAC_PACKAGER_HPP
#define ICESTAC_PACKAGER_HPP

#include <string>

namespace icestac {

class FolderPackager {
public:
    FolderPackager(const std::string& zipDir, const std::string& flatgeobufDir);

    // Zip every file of sourceDir (flat, sorted) into <zipDir>/<folderName>.zip.
    // Returns the archive path. Throws std::runtime_error on failure.
    std::string zipFolder(const std::string& sourceDir, const std::string& folderName) const;

    // Convert <sourceDir>/<folderName>.shp into <flatgeobufDir>/<folderName>.fgb.
    // Returns the output path. Throws std::runtime_error on failure.
    std::string convertToFlatGeobuf(const std::string& sourceDir, const std::string& folderName) const;

    // Envelope of every geometry in a vector file, in WGS84, as GeoJSON
    static std::string readEnvelope(const std::string& vectorPath);

private:
    std::string zipDir_;
    std::string flatgeobufDir_;
};

} // namespace icestac

#endif // ICESTAC_PACKAGER_HPP

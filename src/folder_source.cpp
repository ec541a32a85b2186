// Copyright 2024 IceSTAC Authors
// SPDX-License-Identifier: Apache-2.0
//
// Folder sources implementation

#include "folder_source.hpp"
#include "geometry.hpp"
#include "types.hpp"

#include <cpl_conv.h>
#include <cpl_error.h>
#include <cpl_http.h>
#include <cpl_string.h>
#include <cpl_vsi.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace icestac {

namespace {
    std::string withTrailingSlash(const std::string& url) {
        if (!url.empty() && url.back() == '/') return url;
        return url + "/";
    }

    // Directory index pages also list plain files; release folders have no extension
    bool looksLikeFolder(const std::string& name) {
        return !name.empty() && name != "." && name != ".." &&
               name.find('.') == std::string::npos;
    }
}

// ---------------------------------------------------------------------------
// HttpFolderSource
// ---------------------------------------------------------------------------

HttpFolderSource::HttpFolderSource(const std::string& baseUrl)
    : baseUrl_(withTrailingSlash(baseUrl)) {
}

std::string HttpFolderSource::yearUrl(const std::string& base, int year) {
    std::string url = base;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url + "/" + std::to_string(year) + "/";
}

std::string HttpFolderSource::describe() const {
    return baseUrl_;
}

std::vector<std::string> HttpFolderSource::listFolders() const {
    initGDAL();
    if (!CPLHTTPEnabled()) {
        throw std::runtime_error("GDAL was built without HTTP support");
    }

    // GDAL parses the HTML index page of the directory
    const std::string vsiPath = "/vsicurl/" + baseUrl_;
    char** entries = VSIReadDir(vsiPath.c_str());
    if (!entries) {
        throw std::runtime_error("Cannot list " + baseUrl_);
    }

    std::vector<std::string> folders;
    for (int i = 0; entries[i] != nullptr; ++i) {
        std::string name = entries[i];
        if (!name.empty() && name.back() == '/') name.pop_back();
        if (looksLikeFolder(name)) {
            folders.push_back(name);
        }
    }
    CSLDestroy(entries);

    std::sort(folders.begin(), folders.end());
    return folders;
}

int HttpFolderSource::fetchFolder(const std::string& folderName, const std::string& destination) const {
    initGDAL();

    int fetched = 0;
    for (const auto& ext : SHAPEFILE_EXTENSIONS) {
        const std::string url = baseUrl_ + folderName + "/" + folderName + ext;

        CPLPushErrorHandler(CPLQuietErrorHandler);
        CPLHTTPResult* result = CPLHTTPFetch(url.c_str(), nullptr);
        CPLPopErrorHandler();

        const bool ok = result && result->nStatus == 0 && result->pszErrBuf == nullptr &&
                        result->pabyData != nullptr;
        if (!ok) {
            std::cerr << "Missing: " << url << std::endl;
            CPLHTTPDestroyResult(result);
            continue;
        }

        const fs::path localPath = fs::path(destination) / (folderName + ext);
        std::ofstream out(localPath, std::ios::binary);
        out.write(reinterpret_cast<const char*>(result->pabyData), result->nDataLen);
        CPLHTTPDestroyResult(result);
        if (!out) {
            throw std::runtime_error("Cannot write " + localPath.string());
        }
        ++fetched;
    }
    return fetched;
}

// ---------------------------------------------------------------------------
// LocalFolderSource
// ---------------------------------------------------------------------------

LocalFolderSource::LocalFolderSource(const std::string& rootDir) : rootDir_(rootDir) {
}

std::string LocalFolderSource::describe() const {
    return rootDir_;
}

std::vector<std::string> LocalFolderSource::listFolders() const {
    std::vector<std::string> folders;

    fs::path root(rootDir_);
    if (!fs::is_directory(root)) {
        throw std::runtime_error("Not a directory: " + rootDir_);
    }

    for (const auto& entry : fs::directory_iterator(root)) {
        if (entry.is_directory()) {
            folders.push_back(entry.path().filename().string());
        }
    }

    // Sort for consistent ordering
    std::sort(folders.begin(), folders.end());
    return folders;
}

int LocalFolderSource::fetchFolder(const std::string& folderName, const std::string& destination) const {
    int fetched = 0;
    for (const auto& ext : SHAPEFILE_EXTENSIONS) {
        const fs::path source = fs::path(rootDir_) / folderName / (folderName + ext);
        if (!fs::is_regular_file(source)) {
            std::cerr << "Missing: " << source.string() << std::endl;
            continue;
        }
        fs::copy_file(source, fs::path(destination) / source.filename(),
                      fs::copy_options::overwrite_existing);
        ++fetched;
    }
    return fetched;
}

} // namespace icestac

// Copyright 2024 IceSTAC Authors
// SPDX-License-Identifier: Apache-2.0
//
// Folder sources header
// Discovery and download of dated shapefile release folders

#ifndef ICESTAC_FOLDER_SOURCE_HPP
#define ICESTAC_FOLDER_SOURCE_HPP

#include <string>
#include <vector>

namespace icestac {

// Where release folders come from
class FolderSource {
public:
    virtual ~FolderSource() = default;

    // Folder names available at the source, sorted
    virtual std::vector<std::string> listFolders() const = 0;

    // Copy <folder>/<folder>.{shp,shx,dbf,prj,cpg} into destination.
    // Missing parts are reported and skipped. Returns the number of files fetched.
    virtual int fetchFolder(const std::string& folderName, const std::string& destination) const = 0;

    // Human readable location, for logs
    virtual std::string describe() const = 0;
};

// Remote archive served over HTTP with directory index pages
class HttpFolderSource : public FolderSource {
public:
    // baseUrl is the year directory, e.g. .../SIGRID3/2024/
    explicit HttpFolderSource(const std::string& baseUrl);

    // <base>/<year>/ with exactly one slash between parts
    static std::string yearUrl(const std::string& base, int year);

    std::vector<std::string> listFolders() const override;
    int fetchFolder(const std::string& folderName, const std::string& destination) const override;
    std::string describe() const override;

private:
    std::string baseUrl_;
};

// Local mirror laid out as <root>/<folder>/<folder>.shp ...
class LocalFolderSource : public FolderSource {
public:
    explicit LocalFolderSource(const std::string& rootDir);

    std::vector<std::string> listFolders() const override;
    int fetchFolder(const std::string& folderName, const std::string& destination) const override;
    std::string describe() const override;

private:
    std::string rootDir_;
};

} // namespace icestac

#endif // ICESTAC_FOLDER_SOURCE_HPP

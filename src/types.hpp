// Copyright 2024 IceSTAC Authors
// SPDX-License-Identifier: Apache-2.0
//
// Common types and structures for IceSTAC
// Catalog item model shared by the zip and grouped catalogs

#ifndef ICESTAC_TYPES_HPP
#define ICESTAC_TYPES_HPP

#include <array>
#include <cstdio>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace icestac {

// STAC constants
inline const char* ITEM_TYPE = "Feature";
inline const char* STAC_VERSION = "1.0.0";

// Asset media types
inline const char* MEDIA_TYPE_ZIP = "application/zip";
inline const char* MEDIA_TYPE_FLATGEOBUF = "application/vnd.flatgeobuf";
inline const char* MEDIA_TYPE_STYLE = "text/vector-styles";

inline const char* ASSET_ROLE_DATA = "data";
inline const char* LINK_REL_STYLE = "style";
inline const char* ASSET_KEY_PREFIX = "asset_";

// Files that make up one shapefile release folder
inline const std::vector<std::string> SHAPEFILE_EXTENSIONS = {
    ".shp",
    ".shx",
    ".dbf",
    ".prj",
    ".cpg"
};

// Calendar day (UTC). A default-constructed date is unset.
struct CalendarDate {
    int year = 0;
    int month = 0;
    int day = 0;

    bool isValid() const {
        if (year < 1 || month < 1 || month > 12 || day < 1) return false;
        static const int daysInMonth[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        int maxDay = daysInMonth[month - 1];
        bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
        if (month == 2 && leap) maxDay = 29;
        return day <= maxDay;
    }

    // YYYY-MM-DD
    std::string toIsoString() const {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
        return buf;
    }

    bool operator==(const CalendarDate& other) const {
        return year == other.year && month == other.month && day == other.day;
    }
    bool operator!=(const CalendarDate& other) const { return !(*this == other); }
    bool operator<(const CalendarDate& other) const {
        if (year != other.year) return year < other.year;
        if (month != other.month) return month < other.month;
        return day < other.day;
    }
};

// [minX, minY, maxX, maxY]
using BBox = std::array<double, 4>;

struct Asset {
    std::string href;
    std::string type;                   // Media type
    std::vector<std::string> roles;

    bool operator==(const Asset& other) const {
        return href == other.href && type == other.type && roles == other.roles;
    }
    bool operator!=(const Asset& other) const { return !(*this == other); }
};

// Ordered asset map. Values loaded from a catalog table may be null.
using AssetMap = std::vector<std::pair<std::string, std::optional<Asset>>>;

struct Link {
    std::string rel;
    std::string href;
    std::string type;
    std::vector<std::string> assetKeys; // "asset:keys"

    bool operator==(const Link& other) const {
        return rel == other.rel && href == other.href && type == other.type &&
               assetKeys == other.assetKeys;
    }
    bool operator!=(const Link& other) const { return !(*this == other); }
};

// One row of either catalog
struct CatalogItem {
    std::string id;
    std::string type = ITEM_TYPE;
    std::string stacVersion = STAC_VERSION;
    CalendarDate datetime;
    std::string geometry;               // Rectangle polygon as GeoJSON (WGS84)
    BBox bbox{};
    AssetMap assets;
    std::vector<Link> links;

    bool operator==(const CatalogItem& other) const {
        return id == other.id && type == other.type &&
               stacVersion == other.stacVersion && datetime == other.datetime &&
               geometry == other.geometry && bbox == other.bbox &&
               assets == other.assets && links == other.links;
    }
    bool operator!=(const CatalogItem& other) const { return !(*this == other); }
};

// One (geometry, url) input to the synthesizer
struct AssetSpec {
    std::string geometry;               // GeoJSON geometry (WGS84)
    std::string href;
};

// Result of processing one source folder
struct FolderResult {
    bool success = false;
    bool skipped = false;               // Not an error (e.g. undated folder name)
    std::string folderName;
    CalendarDate date;
    int filesFetched = 0;
    std::string errorMessage;
};

// Runtime configuration, built once in main()
struct SyncOptions {
    std::string groupedCatalogPath = "daily_items.parquet";
    std::string zipCatalogPath = "zipped_assets.parquet";
    std::string flatgeobufDir = "flatgeobufs";
    std::string zipDir = "zips";
    std::string sourceBaseUrl = "https://download.dmi.dk/public/ICESERVICE/SIGRID3/";
    std::string fgbBaseUrl = "https://your-bucket.example.com/daily";
    std::string zipBaseUrl = "https://your-bucket.example.com/zips";
    std::string styleUrl;               // Empty: no style links
    int year = 0;                       // 0: current year
    std::string folderListPath;         // JSON {"list": [...]} instead of discovery
    std::string localSourceDir;         // Local mirror instead of HTTP
    bool verbose = false;
    bool listOnly = false;
    bool mergeOnly = false;
};

} // namespace icestac

#endif // ICESTAC_TYPES_HPP

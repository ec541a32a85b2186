// Copyright 2024 IceSTAC Authors
// SPDX-License-Identifier: Apache-2.0
//
// Shared helpers for the IceSTAC tests

#ifndef ICESTAC_TEST_HELPERS_HPP
#define ICESTAC_TEST_HELPERS_HPP

#include "types.hpp"
#include "item_synthesizer.hpp"

#include <filesystem>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace icestac {
namespace test {

// GeoJSON polygon for an axis-aligned rectangle
inline std::string rectangle(double minX, double minY, double maxX, double maxY) {
    std::ostringstream ss;
    ss << "{\"type\":\"Polygon\",\"coordinates\":[["
       << "[" << minX << "," << minY << "],"
       << "[" << maxX << "," << minY << "],"
       << "[" << maxX << "," << maxY << "],"
       << "[" << minX << "," << maxY << "],"
       << "[" << minX << "," << minY << "]]]}";
    return ss.str();
}

inline CalendarDate day(int year, int month, int dayOfMonth) {
    CalendarDate date;
    date.year = year;
    date.month = month;
    date.day = dayOfMonth;
    return date;
}

// A one-asset FlatGeobuf item for the given day
inline CatalogItem dailyItem(const std::string& id, const CalendarDate& date,
                             const std::string& geometry, const std::string& href) {
    return synthesize(date, id, {AssetSpec{geometry, href}}, MEDIA_TYPE_FLATGEOBUF);
}

// Keys are exactly asset_0 .. asset_{n-1}, in order
inline bool hasContiguousKeys(const AssetMap& assets) {
    for (size_t i = 0; i < assets.size(); ++i) {
        if (assets[i].first != assetKey(i)) return false;
    }
    return true;
}

inline int styleLinkCount(const CatalogItem& item) {
    int count = 0;
    for (const auto& link : item.links) {
        if (link.rel == LINK_REL_STYLE) ++count;
    }
    return count;
}

// Fresh directory under the system temp dir, removed on destruction
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("icestac-test-" + std::to_string(rd()) + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

} // namespace test
} // namespace icestac

#endif // ICESTAC_TEST_HELPERS_HPP

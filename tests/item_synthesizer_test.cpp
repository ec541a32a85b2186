// Copyright 2024 IceSTAC Authors
// SPDX-License-Identifier: Apache-2.0

#include "item_synthesizer.hpp"
#include "geometry.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

namespace icestac {

using test::day;
using test::rectangle;

class ItemSynthesizerTest : public ::testing::Test {
protected:
    std::vector<AssetSpec> twoFolders() const {
        return {
            {rectangle(0, 0, 1, 1), "https://example.com/daily/20240101_A.fgb"},
            {rectangle(2, 2, 3, 3), "https://example.com/daily/20240101_B.fgb"},
        };
    }
};

TEST_F(ItemSynthesizerTest, BuildsOneItemFromAllSpecs) {
    CatalogItem item = synthesize(day(2024, 1, 1), "2024-01-01", twoFolders(), MEDIA_TYPE_FLATGEOBUF);

    EXPECT_EQ(item.id, "2024-01-01");
    EXPECT_EQ(item.type, "Feature");
    EXPECT_EQ(item.stacVersion, STAC_VERSION);
    EXPECT_EQ(item.datetime, day(2024, 1, 1));
    EXPECT_EQ(item.bbox, (BBox{0, 0, 3, 3}));
    EXPECT_TRUE(item.links.empty());

    ASSERT_EQ(item.assets.size(), 2u);
    EXPECT_TRUE(test::hasContiguousKeys(item.assets));
    EXPECT_EQ(item.assets[0].second->href, "https://example.com/daily/20240101_A.fgb");
    EXPECT_EQ(item.assets[1].second->href, "https://example.com/daily/20240101_B.fgb");
    for (const auto& entry : item.assets) {
        EXPECT_EQ(entry.second->type, MEDIA_TYPE_FLATGEOBUF);
        EXPECT_EQ(entry.second->roles, std::vector<std::string>{"data"});
    }
}

TEST_F(ItemSynthesizerTest, BboxMatchesGeometry) {
    CatalogItem item = synthesize(day(2024, 3, 15), "20240315_Greenland", {
        {R"({"type":"Polygon","coordinates":[[[-50.5,59.1],[-20.25,70],[-35,83.6],[-50.5,59.1]]]})",
         "https://example.com/zips/20240315_Greenland.zip"}
    }, MEDIA_TYPE_ZIP);

    EXPECT_EQ(item.bbox, boundsOf(item.geometry));
    EXPECT_DOUBLE_EQ(item.bbox[0], -50.5);
    EXPECT_DOUBLE_EQ(item.bbox[3], 83.6);
    EXPECT_EQ(item.assets[0].second->type, "application/zip");
}

TEST_F(ItemSynthesizerTest, IsDeterministic) {
    auto a = synthesize(day(2024, 1, 1), "2024-01-01", twoFolders(), MEDIA_TYPE_FLATGEOBUF);
    auto b = synthesize(day(2024, 1, 1), "2024-01-01", twoFolders(), MEDIA_TYPE_FLATGEOBUF);
    EXPECT_EQ(a, b);
}

TEST_F(ItemSynthesizerTest, RejectsMissingInputs) {
    EXPECT_THROW(synthesize(day(2024, 1, 1), "2024-01-01", {}, MEDIA_TYPE_FLATGEOBUF), InvalidInput);
    EXPECT_THROW(synthesize(day(2024, 1, 1), "", twoFolders(), MEDIA_TYPE_FLATGEOBUF), InvalidInput);
    EXPECT_THROW(synthesize(CalendarDate{}, "2024-01-01", twoFolders(), MEDIA_TYPE_FLATGEOBUF), InvalidInput);
    EXPECT_THROW(synthesize(day(2023, 2, 29), "2023-02-29", twoFolders(), MEDIA_TYPE_FLATGEOBUF), InvalidInput);
}

TEST(AssetKeyTest, ZeroBased) {
    EXPECT_EQ(assetKey(0), "asset_0");
    EXPECT_EQ(assetKey(11), "asset_11");
}

} // namespace icestac

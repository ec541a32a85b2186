// Copyright 2024 IceSTAC Authors
// SPDX-License-Identifier: Apache-2.0

#include "json_utils.hpp"
#include "errors.hpp"
#include "item_synthesizer.hpp"

#include <gtest/gtest.h>

namespace icestac {

TEST(AssetsJsonTest, KeepsDocumentOrderPastTenAssets) {
    std::string document = "{";
    for (size_t i = 0; i < 12; ++i) {
        if (i > 0) document += ",";
        document += "\"" + assetKey(i) + "\": {\"href\": \"https://example.com/" + std::to_string(i) +
                    ".fgb\", \"type\": \"application/vnd.flatgeobuf\", \"roles\": [\"data\"]}";
    }
    document += "}";

    AssetMap decoded = json::assetsFromJson(document);
    ASSERT_EQ(decoded.size(), 12u);
    for (size_t i = 0; i < decoded.size(); ++i) {
        EXPECT_EQ(decoded[i].first, assetKey(i));
        EXPECT_EQ(decoded[i].second->href, "https://example.com/" + std::to_string(i) + ".fgb");
        EXPECT_EQ(decoded[i].second->type, MEDIA_TYPE_FLATGEOBUF);
    }
}

TEST(AssetsJsonTest, NullEntriesAreKept) {
    AssetMap decoded = json::assetsFromJson(
        R"({"asset_0": null, "asset_1": {"href": "a.zip", "type": "application/zip", "roles": ["data"]}})");

    ASSERT_EQ(decoded.size(), 2u);
    EXPECT_FALSE(decoded[0].second.has_value());
    ASSERT_TRUE(decoded[1].second.has_value());
    EXPECT_EQ(decoded[1].second->href, "a.zip");
    EXPECT_EQ(decoded[1].second->roles, std::vector<std::string>{"data"});
}

TEST(AssetsJsonTest, EmptyColumnIsAnEmptyMap) {
    EXPECT_TRUE(json::assetsFromJson("").empty());
    EXPECT_TRUE(json::assetsFromJson("{}").empty());
}

TEST(AssetsJsonTest, MalformedDocumentsAreSchemaMismatches) {
    EXPECT_THROW(json::assetsFromJson("{not json"), SchemaMismatch);
    EXPECT_THROW(json::assetsFromJson("[1, 2]"), SchemaMismatch);
    EXPECT_THROW(json::assetsFromJson(R"({"asset_0": 42})"), SchemaMismatch);
}

TEST(LinksJsonTest, ReadsAssetKeysMember) {
    std::vector<Link> links = json::linksFromJson(
        R"([{"rel": "license", "href": "https://example.com/license", "type": "text/html", "asset:keys": []},)"
        R"( {"rel": "style", "href": "https://example.com/style.json", "type": "text/vector-styles",)"
        R"(  "asset:keys": ["asset_0", "asset_1"]}])");

    std::vector<Link> expected = {
        {"license", "https://example.com/license", "text/html", {}},
        {"style", "https://example.com/style.json", MEDIA_TYPE_STYLE, {"asset_0", "asset_1"}},
    };
    EXPECT_EQ(links, expected);
}

TEST(LinksJsonTest, MalformedDocumentsAreSchemaMismatches) {
    EXPECT_THROW(json::linksFromJson(R"({"rel": "style"})"), SchemaMismatch);
    EXPECT_THROW(json::linksFromJson(R"(["style"])"), SchemaMismatch);
    EXPECT_TRUE(json::linksFromJson("[]").empty());
}

TEST(FolderListTest, ReadsTheListArray) {
    auto folders = json::folderListFromJson(
        R"({"list": ["20240101_CapeFarewell_RIC", "20240102_NorthEast_RIC"]})");
    ASSERT_EQ(folders.size(), 2u);
    EXPECT_EQ(folders[0], "20240101_CapeFarewell_RIC");
    EXPECT_EQ(folders[1], "20240102_NorthEast_RIC");
}

TEST(FolderListTest, MissingListIsInvalidInput) {
    EXPECT_THROW(json::folderListFromJson(R"({"folders": []})"), InvalidInput);
    EXPECT_THROW(json::folderListFromJson("nope"), InvalidInput);
    EXPECT_THROW(json::loadFolderList("/nonexistent/folders.json"), InvalidInput);
}

} // namespace icestac

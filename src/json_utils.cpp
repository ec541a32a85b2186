// Copyright 2024 IceSTAC Authors
// SPDX-License-Identifier: Apache-2.0
//
// JSON utilities implementation

#include "json_utils.hpp"
#include "errors.hpp"

#include <cpl_json.h>

namespace icestac {
namespace json {

namespace {
    CPLJSONObject parseDocument(const std::string& document, const char* what) {
        CPLJSONDocument doc;
        if (!doc.LoadMemory(document)) {
            throw SchemaMismatch(std::string("unparseable ") + what + " document");
        }
        return doc.GetRoot();
    }

    std::vector<std::string> toStringList(const CPLJSONArray& array) {
        std::vector<std::string> values;
        if (!array.IsValid()) return values;
        for (const auto& value : array) {
            values.push_back(value.ToString());
        }
        return values;
    }
}

AssetMap assetsFromJson(const std::string& document) {
    AssetMap assets;
    if (document.empty()) return assets;

    CPLJSONObject root = parseDocument(document, "assets");
    if (root.GetType() == CPLJSONObject::Type::Null) return assets;
    if (root.GetType() != CPLJSONObject::Type::Object) {
        throw SchemaMismatch("assets column must hold a JSON object");
    }

    for (const auto& child : root.GetChildren()) {
        if (child.GetType() == CPLJSONObject::Type::Null) {
            assets.emplace_back(child.GetName(), std::nullopt);
            continue;
        }
        if (child.GetType() != CPLJSONObject::Type::Object) {
            throw SchemaMismatch("asset " + child.GetName() + " is not an object");
        }
        Asset asset;
        asset.href = child.GetString("href");
        asset.type = child.GetString("type");
        asset.roles = toStringList(child.GetArray("roles"));
        assets.emplace_back(child.GetName(), std::move(asset));
    }
    return assets;
}

std::vector<Link> linksFromJson(const std::string& document) {
    std::vector<Link> links;
    if (document.empty()) return links;

    CPLJSONObject root = parseDocument(document, "links");
    if (root.GetType() == CPLJSONObject::Type::Null) return links;
    if (root.GetType() != CPLJSONObject::Type::Array) {
        throw SchemaMismatch("links column must hold a JSON array");
    }

    for (const auto& entry : root.ToArray()) {
        if (entry.GetType() != CPLJSONObject::Type::Object) {
            throw SchemaMismatch("link entry is not an object");
        }
        Link link;
        link.rel = entry.GetString("rel");
        link.href = entry.GetString("href");
        link.type = entry.GetString("type");
        link.assetKeys = toStringList(entry.GetArray("asset:keys"));
        links.push_back(std::move(link));
    }
    return links;
}

std::vector<std::string> folderListFromJson(const std::string& document) {
    CPLJSONDocument doc;
    if (!doc.LoadMemory(document)) {
        throw InvalidInput("folder list is not valid JSON");
    }
    CPLJSONArray list = doc.GetRoot().GetArray("list");
    if (!list.IsValid()) {
        throw InvalidInput("folder list document lacks a \"list\" array");
    }
    return toStringList(list);
}

std::vector<std::string> loadFolderList(const std::string& path) {
    CPLJSONDocument doc;
    if (!doc.Load(path)) {
        throw InvalidInput("cannot read folder list " + path);
    }
    CPLJSONArray list = doc.GetRoot().GetArray("list");
    if (!list.IsValid()) {
        throw InvalidInput("folder list " + path + " lacks a \"list\" array");
    }
    return toStringList(list);
}

} // namespace json
} // namespace icestac

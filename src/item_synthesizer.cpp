// Copyright 2024 IceSTAC Authors
// SPDX-License-Identifier: Apache-2.0
//
// Catalog item synthesizer implementation

#include "item_synthesizer.hpp"
#include "geometry.hpp"
#include "errors.hpp"

namespace icestac {

std::string assetKey(size_t index) {
    return ASSET_KEY_PREFIX + std::to_string(index);
}

CatalogItem synthesize(const CalendarDate& date,
                       const std::string& id,
                       const std::vector<AssetSpec>& specs,
                       const std::string& mediaType) {
    if (specs.empty()) {
        throw InvalidInput("item " + id + " has no assets");
    }
    if (id.empty()) {
        throw InvalidInput("item id is empty");
    }
    if (!date.isValid()) {
        throw InvalidInput("item " + id + " has no valid date");
    }

    std::vector<std::string> geometries;
    geometries.reserve(specs.size());
    for (const auto& spec : specs) {
        geometries.push_back(spec.geometry);
    }

    CatalogItem item;
    item.id = id;
    item.datetime = date;
    item.geometry = envelopeOf(geometries);
    item.bbox = boundsOf(item.geometry);

    item.assets.reserve(specs.size());
    for (size_t i = 0; i < specs.size(); ++i) {
        Asset asset;
        asset.href = specs[i].href;
        asset.type = mediaType;
        asset.roles = {ASSET_ROLE_DATA};
        item.assets.emplace_back(assetKey(i), std::move(asset));
    }

    return item;
}

} // namespace icestac

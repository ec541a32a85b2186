// Copyright 2024 IceSTAC Authors
// SPDX-License-Identifier: Apache-2.0
//
// Catalog item synthesizer header

#ifndef ICESTAC_ITEM_SYNTHESIZER_HPP
#define ICESTAC_ITEM_SYNTHESIZER_HPP

#include "types.hpp"
#include <string>
#include <vector>

namespace icestac {

// Key of the n-th asset of an item: asset_0, asset_1, ...
std::string assetKey(size_t index);

// Build one catalog item. The geometry is the envelope of every AssetSpec
// geometry, assets are keyed asset_0.. in input order and links start empty.
// Throws InvalidInput if specs is empty, date is unset or id is empty.
CatalogItem synthesize(const CalendarDate& date,
                       const std::string& id,
                       const std::vector<AssetSpec>& specs,
                       const std::string& mediaType);

} // namespace icestac

#endif // ICESTAC_ITEM_SYNTHESIZER_HPP

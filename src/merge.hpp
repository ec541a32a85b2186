// Copyright 2024 IceSTAC Authors
// SPDX-License-Identifier: Apache-2.0
//
// Per-day merge engine header

#ifndef ICESTAC_MERGE_HPP
#define ICESTAC_MERGE_HPP

#include "types.hpp"
#include <string>
#include <vector>

namespace icestac {

// Ids whose records disagreed on datetime during a merge
struct MergeDiagnostics {
    std::vector<std::string> datetimeConflicts;
};

// Collapse every group of items sharing an id into one item.
//
// Output is ordered by id; within an id, members are taken in input order.
// The merged geometry is the envelope of the members' geometries, assets are
// flattened (null entries dropped, duplicates kept) and re-keyed asset_0..,
// links are deduplicated on (rel, href) keeping the first occurrence, and
// datetime comes from the first member. Conflicting datetimes are recorded in
// diagnostics when given.
//
// mergeById(mergeById(x)) == mergeById(x).
std::vector<CatalogItem> mergeById(const std::vector<CatalogItem>& items,
                                   MergeDiagnostics* diagnostics = nullptr);

} // namespace icestac

#endif // ICESTAC_MERGE_HPP

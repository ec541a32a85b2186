// Copyright 2024 IceSTAC Authors
// SPDX-License-Identifier: Apache-2.0
//
// Per-day merge engine implementation

#include "merge.hpp"
#include "item_synthesizer.hpp"
#include "geometry.hpp"

#include <map>
#include <set>
#include <utility>

namespace icestac {

namespace {
    CatalogItem mergePartition(const std::vector<const CatalogItem*>& members,
                               MergeDiagnostics* diagnostics) {
        const CatalogItem& first = *members.front();

        CatalogItem merged;
        merged.id = first.id;
        merged.type = first.type;
        merged.stacVersion = first.stacVersion;
        merged.datetime = first.datetime;

        std::vector<std::string> geometries;
        geometries.reserve(members.size());
        for (const CatalogItem* member : members) {
            geometries.push_back(member->geometry);
            if (member->datetime != first.datetime && diagnostics) {
                auto& conflicts = diagnostics->datetimeConflicts;
                if (conflicts.empty() || conflicts.back() != first.id) {
                    conflicts.push_back(first.id);
                }
            }
        }
        merged.geometry = envelopeOf(geometries);
        merged.bbox = boundsOf(merged.geometry);

        // Assets are not deduplicated by href
        for (const CatalogItem* member : members) {
            for (const auto& entry : member->assets) {
                if (entry.second) {
                    merged.assets.emplace_back(assetKey(merged.assets.size()), entry.second);
                }
            }
        }

        std::set<std::pair<std::string, std::string>> seen;
        for (const CatalogItem* member : members) {
            for (const auto& link : member->links) {
                if (seen.insert({link.rel, link.href}).second) {
                    merged.links.push_back(link);
                }
            }
        }

        return merged;
    }
}

std::vector<CatalogItem> mergeById(const std::vector<CatalogItem>& items,
                                   MergeDiagnostics* diagnostics) {
    // Partition by id: keys sorted, members in input order
    std::map<std::string, std::vector<const CatalogItem*>> partitions;
    for (const auto& item : items) {
        partitions[item.id].push_back(&item);
    }

    std::vector<CatalogItem> merged;
    merged.reserve(partitions.size());
    for (const auto& [id, members] : partitions) {
        merged.push_back(mergePartition(members, diagnostics));
    }
    return merged;
}

} // namespace icestac

// Copyright 2024 IceSTAC Authors
// SPDX-License-Identifier: Apache-2.0
//
// Style link attacher implementation

#include "style_link.hpp"

namespace icestac {

std::vector<Link> attachStyleLink(const CatalogItem& item, const std::string& styleUrl) {
    if (styleUrl.empty()) {
        return item.links;
    }

    std::vector<Link> links;
    links.reserve(item.links.size() + 1);
    for (const auto& link : item.links) {
        if (link.rel != LINK_REL_STYLE) {
            links.push_back(link);
        }
    }

    Link style;
    style.rel = LINK_REL_STYLE;
    style.href = styleUrl;
    style.type = MEDIA_TYPE_STYLE;
    for (const auto& entry : item.assets) {
        style.assetKeys.push_back(entry.first);
    }
    links.push_back(std::move(style));

    return links;
}

} // namespace icestac

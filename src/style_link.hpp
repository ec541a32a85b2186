// Copyright 2024 IceSTAC Authors
// SPDX-License-Identifier: Apache-2.0
//
// Style link attacher header

#ifndef ICESTAC_STYLE_LINK_HPP
#define ICESTAC_STYLE_LINK_HPP

#include "types.hpp"
#include <string>
#include <vector>

namespace icestac {

// Links of item with its style link replaced by one pointing at styleUrl and
// keyed to every current asset. The style link is always last.
// An empty styleUrl returns the existing links unchanged.
std::vector<Link> attachStyleLink(const CatalogItem& item, const std::string& styleUrl);

} // namespace icestac

#endif // ICESTAC_STYLE_LINK_HPP

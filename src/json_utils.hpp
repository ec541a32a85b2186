// Copyright 2024 IceSTAC Authors
// SPDX-License-Identifier: Apache-2.0
//
// JSON utilities header
// Decoding of the nested assets/links columns (GDAL reports nested Arrow
// columns as JSON text) and of the folder list document

#ifndef ICESTAC_JSON_UTILS_HPP
#define ICESTAC_JSON_UTILS_HPP

#include "types.hpp"
#include <string>
#include <vector>

namespace icestac {
namespace json {

// {"asset_0": {"href": ..., "type": ..., "roles": [...]}, ...}
// Null entries are kept as empty optionals.
// Throws SchemaMismatch on a malformed document.
AssetMap assetsFromJson(const std::string& document);

// [{"rel": ..., "href": ..., "type": ..., "asset:keys": [...]}, ...]
// Throws SchemaMismatch on a malformed document.
std::vector<Link> linksFromJson(const std::string& document);

// Folder names from a {"list": ["20240101...", ...]} document
std::vector<std::string> folderListFromJson(const std::string& document);

// Same, read from a file
std::vector<std::string> loadFolderList(const std::string& path);

} // namespace json
} // namespace icestac

#endif // ICESTAC_JSON_UTILS_HPP

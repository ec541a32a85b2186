// Copyright 2024 IceSTAC Authors
// SPDX-License-Identifier: Apache-2.0
//
// Catalog store header
// GeoParquet persistence of a catalog table

#ifndef ICESTAC_CATALOG_STORE_HPP
#define ICESTAC_CATALOG_STORE_HPP

#include "types.hpp"
#include <string>
#include <vector>

namespace icestac {

// A catalog persisted as one GeoParquet table with the columns
// id, type, stac_version, datetime, geometry, bbox, assets, links.
//
// save() replaces the whole file. There is no locking and no transactional
// replace: two processes updating the same catalog will lose updates.
class CatalogStore {
public:
    // Constructor with the catalog file path
    explicit CatalogStore(const std::string& path);

    // Get the file path
    const std::string& getPath() const;

    // Check if the catalog file exists
    bool exists() const;

    // Read every item, in file order. A missing file is an empty catalog.
    // bbox is recomputed from the stored geometry.
    // Throws SchemaMismatch if a column is missing or a nested column is
    // malformed, CatalogError if the file cannot be opened.
    std::vector<CatalogItem> load() const;

    // Overwrite the catalog with items
    bool save(const std::vector<CatalogItem>& items) const;

    // Non-geometry columns every catalog table carries
    static const std::vector<std::string>& requiredColumns();

private:
    std::string path_;

    // Layer name derived from the file name
    std::string layerName() const;
};

} // namespace icestac

#endif // ICESTAC_CATALOG_STORE_HPP

// Copyright 2024 IceSTAC Authors
// SPDX-License-Identifier: Apache-2.0
//
// CatalogBatch class header
// Catalog items as one Arrow record batch (C data interface), the form the
// GDAL Parquet driver writes with nested column types preserved

#ifndef ICESTAC_CATALOG_BATCH_HPP
#define ICESTAC_CATALOG_BATCH_HPP

#include "types.hpp"
#include <ogr_recordbatch.h>
#include <vector>

namespace icestac {

// Name of the WKB geometry column of the batch
inline const char* GEOMETRY_COLUMN = "geometry";

// Columns, in order:
//   id, type, stac_version    utf8
//   datetime                  timestamp[ms, UTC]
//   geometry                  binary (ISO WKB)
//   bbox                      list<double>
//   assets                    map<utf8, struct<href, type, roles: list<utf8>>>
//   links                     list<struct<rel, href, type, asset:keys: list<utf8>>>
// Null assets are null map values.
class CatalogBatch {
public:
    // Throws InvalidInput if an item geometry cannot be read
    explicit CatalogBatch(const std::vector<CatalogItem>& items);

    // Releases whatever a consumer has not taken over
    ~CatalogBatch();

    CatalogBatch(const CatalogBatch&) = delete;
    CatalogBatch& operator=(const CatalogBatch&) = delete;

    ArrowSchema* schema() { return &schema_; }
    ArrowArray* array() { return &array_; }

private:
    ArrowSchema schema_{};
    ArrowArray array_{};
};

} // namespace icestac

#endif // ICESTAC_CATALOG_BATCH_HPP

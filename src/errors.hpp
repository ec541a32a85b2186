// Copyright 2024 IceSTAC Authors
// SPDX-License-Identifier: Apache-2.0
//
// Error types raised by the catalog core

#ifndef ICESTAC_ERRORS_HPP
#define ICESTAC_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace icestac {

class CatalogError : public std::runtime_error {
public:
    explicit CatalogError(const std::string& message)
        : std::runtime_error(message) {}
};

// Empty geometry/asset collections, unset date or id, mixed reference frames
class InvalidInput : public CatalogError {
public:
    explicit InvalidInput(const std::string& message)
        : CatalogError("Invalid input: " + message) {}
};

// Catalog table missing an expected column or holding malformed nested data
class SchemaMismatch : public CatalogError {
public:
    explicit SchemaMismatch(const std::string& message)
        : CatalogError("Schema mismatch: " + message) {}
};

} // namespace icestac

#endif // ICESTAC_ERRORS_HPP

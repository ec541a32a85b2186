// Copyright 2024 IceSTAC Authors
// SPDX-License-Identifier: Apache-2.0
//
// CatalogBatch class implementation

#include "catalog_batch.hpp"
#include "geometry.hpp"
#include "errors.hpp"

#include <ogr_geometry.h>
#include <cpl_time.h>

#include <cstdint>
#include <cstring>
#include <ctime>
#include <string>

namespace icestac {

namespace {
    // ---------------------------------------------------------------------
    // Owned schema and array nodes. Each node frees its children in its
    // release callback, as the C data interface requires.
    // ---------------------------------------------------------------------

    struct SchemaData {
        std::string format;
        std::string name;
        std::vector<ArrowSchema*> children;
    };

    void releaseSchema(ArrowSchema* schema) {
        auto* data = static_cast<SchemaData*>(schema->private_data);
        for (ArrowSchema* child : data->children) {
            if (child->release) child->release(child);
            delete child;
        }
        delete data;
        schema->release = nullptr;
    }

    void fillSchema(ArrowSchema& schema, const char* format, const char* name,
                    int64_t flags, std::vector<ArrowSchema*> children) {
        auto* data = new SchemaData{format, name, std::move(children)};
        schema.format = data->format.c_str();
        schema.name = data->name.c_str();
        schema.metadata = nullptr;
        schema.flags = flags;
        schema.n_children = static_cast<int64_t>(data->children.size());
        schema.children = data->children.empty() ? nullptr : data->children.data();
        schema.dictionary = nullptr;
        schema.release = releaseSchema;
        schema.private_data = data;
    }

    ArrowSchema* field(const char* format, const char* name,
                       std::vector<ArrowSchema*> children = {},
                       int64_t flags = ARROW_FLAG_NULLABLE) {
        auto* schema = new ArrowSchema{};
        fillSchema(*schema, format, name, flags, std::move(children));
        return schema;
    }

    struct ArrayData {
        std::vector<std::vector<uint8_t>> buffers;
        std::vector<const void*> pointers;
        std::vector<ArrowArray*> children;
    };

    void releaseArray(ArrowArray* array) {
        auto* data = static_cast<ArrayData*>(array->private_data);
        for (ArrowArray* child : data->children) {
            if (child->release) child->release(child);
            delete child;
        }
        delete data;
        array->release = nullptr;
    }

    // buffers[0] is the validity bitmap, empty when no slot is null
    void fillArray(ArrowArray& array, int64_t length, int64_t nullCount,
                   std::vector<std::vector<uint8_t>> buffers,
                   std::vector<ArrowArray*> children) {
        auto* data = new ArrayData{std::move(buffers), {}, std::move(children)};
        for (size_t i = 0; i < data->buffers.size(); ++i) {
            std::vector<uint8_t>& buffer = data->buffers[i];
            if (i == 0 && buffer.empty()) {
                data->pointers.push_back(nullptr);
                continue;
            }
            // Data buffers are never null, even when they hold no value
            if (buffer.empty()) buffer.push_back(0);
            data->pointers.push_back(buffer.data());
        }

        array.length = length;
        array.null_count = nullCount;
        array.offset = 0;
        array.n_buffers = static_cast<int64_t>(data->pointers.size());
        array.n_children = static_cast<int64_t>(data->children.size());
        array.buffers = data->pointers.data();
        array.children = data->children.empty() ? nullptr : data->children.data();
        array.dictionary = nullptr;
        array.release = releaseArray;
        array.private_data = data;
    }

    ArrowArray* newArray(int64_t length, int64_t nullCount,
                         std::vector<std::vector<uint8_t>> buffers,
                         std::vector<ArrowArray*> children = {}) {
        auto* array = new ArrowArray{};
        fillArray(*array, length, nullCount, std::move(buffers), std::move(children));
        return array;
    }

    const std::vector<uint8_t> NO_VALIDITY;

    template <typename T>
    std::vector<uint8_t> bytesOf(const std::vector<T>& values) {
        std::vector<uint8_t> bytes(values.size() * sizeof(T));
        if (!bytes.empty()) {
            std::memcpy(bytes.data(), values.data(), bytes.size());
        }
        return bytes;
    }

    std::vector<uint8_t> validityBitmap(const std::vector<bool>& valid, int64_t& nullCount) {
        nullCount = 0;
        std::vector<uint8_t> bits((valid.size() + 7) / 8, 0);
        for (size_t i = 0; i < valid.size(); ++i) {
            if (valid[i]) {
                bits[i / 8] |= static_cast<uint8_t>(1u << (i % 8));
            } else {
                ++nullCount;
            }
        }
        if (nullCount == 0) bits.clear();
        return bits;
    }

    // utf8 or binary values
    class StringColumn {
    public:
        void append(const void* bytes, size_t size) {
            const auto* first = static_cast<const uint8_t*>(bytes);
            data_.insert(data_.end(), first, first + size);
            offsets_.push_back(static_cast<int32_t>(data_.size()));
        }

        void append(const std::string& value) {
            append(value.data(), value.size());
        }

        ArrowArray* finish() const {
            return newArray(static_cast<int64_t>(offsets_.size() - 1), 0,
                            {NO_VALIDITY, bytesOf(offsets_), data_});
        }

    private:
        std::vector<int32_t> offsets_{0};
        std::vector<uint8_t> data_;
    };

    // Offsets of a list column into its child column
    class ListOffsets {
    public:
        // End the current list at childLength child values
        void close(size_t childLength) {
            offsets_.push_back(static_cast<int32_t>(childLength));
        }

        ArrowArray* finish(ArrowArray* child) const {
            return newArray(static_cast<int64_t>(offsets_.size() - 1), 0,
                            {NO_VALIDITY, bytesOf(offsets_)}, {child});
        }

    private:
        std::vector<int32_t> offsets_{0};
    };

    int64_t epochMillis(const CalendarDate& date) {
        struct tm brokenDown{};
        brokenDown.tm_year = date.year - 1900;
        brokenDown.tm_mon = date.month - 1;
        brokenDown.tm_mday = date.day;
        return static_cast<int64_t>(CPLYMDHMSToUnixTime(&brokenDown)) * 1000;
    }

    void appendWkb(StringColumn& column, const CatalogItem& item) {
        OGRGeometryUniquePtr geometry(OGRGeometryFactory::createFromGeoJson(item.geometry.c_str()));
        if (!geometry) {
            throw InvalidInput("item " + item.id + " has unreadable geometry");
        }
        std::vector<unsigned char> wkb(geometry->WkbSize());
        if (geometry->exportToWkb(wkbNDR, wkb.data(), wkbVariantIso) != OGRERR_NONE) {
            throw InvalidInput("item " + item.id + " geometry cannot be written as WKB");
        }
        column.append(wkb.data(), wkb.size());
    }
}

CatalogBatch::CatalogBatch(const std::vector<CatalogItem>& items) {
    StringColumn ids, types, versions, geometries;
    std::vector<int64_t> datetimes;
    std::vector<double> bboxValues;
    ListOffsets bboxes;

    StringColumn assetKeys, hrefs, assetTypes, roles;
    std::vector<bool> assetValid;
    ListOffsets assetEntries, assetRoles;
    size_t entryCount = 0;
    size_t roleCount = 0;

    StringColumn rels, linkHrefs, linkTypes, linkKeys;
    ListOffsets links, keyLists;
    size_t linkCount = 0;
    size_t keyCount = 0;

    for (const auto& item : items) {
        ids.append(item.id);
        types.append(item.type);
        versions.append(item.stacVersion);
        datetimes.push_back(epochMillis(item.datetime));
        appendWkb(geometries, item);

        const BBox bbox = boundsOf(item.geometry);
        bboxValues.insert(bboxValues.end(), bbox.begin(), bbox.end());
        bboxes.close(bboxValues.size());

        for (const auto& [key, asset] : item.assets) {
            assetKeys.append(key);
            assetValid.push_back(asset.has_value());
            hrefs.append(asset ? asset->href : std::string());
            assetTypes.append(asset ? asset->type : std::string());
            if (asset) {
                for (const auto& role : asset->roles) {
                    roles.append(role);
                    ++roleCount;
                }
            }
            assetRoles.close(roleCount);
            ++entryCount;
        }
        assetEntries.close(entryCount);

        for (const auto& link : item.links) {
            rels.append(link.rel);
            linkHrefs.append(link.href);
            linkTypes.append(link.type);
            for (const auto& key : link.assetKeys) {
                linkKeys.append(key);
                ++keyCount;
            }
            keyLists.close(keyCount);
            ++linkCount;
        }
        links.close(linkCount);
    }

    const int64_t length = static_cast<int64_t>(items.size());
    const int64_t entries = static_cast<int64_t>(entryCount);

    int64_t assetNulls = 0;
    std::vector<uint8_t> assetValidity = validityBitmap(assetValid, assetNulls);
    ArrowArray* assetValue = newArray(entries, assetNulls, {assetValidity},
                                      {hrefs.finish(), assetTypes.finish(),
                                       assetRoles.finish(roles.finish())});
    ArrowArray* assetEntry = newArray(entries, 0, {NO_VALIDITY}, {assetKeys.finish(), assetValue});

    ArrowArray* linkStruct = newArray(static_cast<int64_t>(linkCount), 0, {NO_VALIDITY},
                                      {rels.finish(), linkHrefs.finish(), linkTypes.finish(),
                                       keyLists.finish(linkKeys.finish())});

    fillArray(array_, length, 0, {NO_VALIDITY}, {
        ids.finish(),
        types.finish(),
        versions.finish(),
        newArray(length, 0, {NO_VALIDITY, bytesOf(datetimes)}),
        geometries.finish(),
        bboxes.finish(newArray(static_cast<int64_t>(bboxValues.size()), 0,
                               {NO_VALIDITY, bytesOf(bboxValues)})),
        assetEntries.finish(assetEntry),
        links.finish(linkStruct),
    });

    fillSchema(schema_, "+s", "", 0, {
        field("u", "id"),
        field("u", "type"),
        field("u", "stac_version"),
        field("tsm:UTC", "datetime"),
        field("z", GEOMETRY_COLUMN),
        field("+l", "bbox", {field("g", "item")}),
        field("+m", "assets", {
            field("+s", "entries", {
                field("u", "key", {}, 0),
                field("+s", "value", {
                    field("u", "href"),
                    field("u", "type"),
                    field("+l", "roles", {field("u", "item")}),
                }),
            }, 0),
        }),
        field("+l", "links", {
            field("+s", "item", {
                field("u", "rel"),
                field("u", "href"),
                field("u", "type"),
                field("+l", "asset:keys", {field("u", "item")}),
            }),
        }),
    });
}

CatalogBatch::~CatalogBatch() {
    if (array_.release) array_.release(&array_);
    if (schema_.release) schema_.release(&schema_);
}

} // namespace icestac

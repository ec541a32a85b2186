// Copyright 2024 IceSTAC Authors
// SPDX-License-Identifier: Apache-2.0
//
// CatalogSync class header
// Drives discovery, per-folder packaging and the catalog updates

#ifndef ICESTAC_SYNC_HPP
#define ICESTAC_SYNC_HPP

#include "types.hpp"
#include "folder_source.hpp"
#include "packager.hpp"
#include "merge.hpp"
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace icestac {

// Progress callback type
using ProgressCallback = std::function<void(int current, int total, const std::string& folderName)>;

// CatalogSync brings the zip and grouped catalogs up to date with a source.
// Folders are processed strictly one at a time.
class CatalogSync {
public:
    // Constructor
    CatalogSync(const SyncOptions& options, const FolderSource& source);

    // Set progress callback
    void setProgressCallback(ProgressCallback callback);

    // Date encoded in the first 8 characters of a folder name (YYYYMMDD)
    static std::optional<CalendarDate> extractFolderDate(const std::string& folderName);

    // <base>/<name> with exactly one slash between parts
    static std::string joinUrl(const std::string& base, const std::string& name);

    // Append new grouped items (with their style link) to the existing grouped
    // catalog, merge per day and refresh every style link
    static std::vector<CatalogItem> updateGroupedCatalog(const std::vector<CatalogItem>& existing,
                                                         const std::vector<CatalogItem>& newItems,
                                                         const std::string& styleUrl,
                                                         MergeDiagnostics* diagnostics = nullptr);

    // Fetch, package and synthesize one folder. A successful folder adds a
    // pending zip item and a grouped asset for its day.
    FolderResult processFolder(const std::string& folderName);

    // Process folders in order
    std::vector<FolderResult> processFolders(const std::vector<std::string>& folders);

    // Grouped items (one per day, ascending) for the pending assets
    std::vector<CatalogItem> buildGroupedItems() const;

    // Pending zip items, in processing order
    const std::vector<CatalogItem>& pendingZipItems() const;

    // Full run: load both catalogs, process folders not yet in the zip
    // catalog, then save. Throws if a catalog cannot be loaded or saved.
    std::vector<FolderResult> run(const std::vector<std::string>& folders);

    // Re-merge the grouped catalog without fetching anything
    void remergeGroupedCatalog();

    // Get processing statistics
    struct Statistics {
        int totalFolders = 0;
        int successCount = 0;
        int failCount = 0;
        int skippedCount = 0;
        int newZipItems = 0;
        int newGroupedItems = 0;
    };

    Statistics getStatistics() const;

private:
    SyncOptions options_;
    const FolderSource& source_;
    FolderPackager packager_;
    ProgressCallback progressCallback_;

    std::vector<CatalogItem> pendingZipItems_;
    std::map<CalendarDate, std::vector<AssetSpec>> pendingDayAssets_;
    Statistics stats_;

    void reportConflicts(const MergeDiagnostics& diagnostics) const;
};

} // namespace icestac

#endif // ICESTAC_SYNC_HPP

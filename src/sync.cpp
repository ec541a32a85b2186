// Copyright 2024 IceSTAC Authors
// SPDX-License-Identifier: Apache-2.0
//
// CatalogSync class implementation

#include "sync.hpp"
#include "catalog_store.hpp"
#include "item_synthesizer.hpp"
#include "style_link.hpp"
#include "errors.hpp"

#include <cctype>
#include <filesystem>
#include <iostream>
#include <random>
#include <set>

namespace fs = std::filesystem;

namespace icestac {

namespace {
    // Per-folder staging directory, removed when the folder is done
    class ScratchDir {
    public:
        explicit ScratchDir(const std::string& folderName) {
            std::random_device rd;
            path_ = fs::temp_directory_path() /
                    ("icestac-" + folderName + "-" + std::to_string(rd()));
            fs::create_directories(path_);
        }

        ~ScratchDir() {
            std::error_code ec;
            fs::remove_all(path_, ec);
            if (ec) {
                std::cerr << "Warning: could not remove " << path_.string()
                          << ": " << ec.message() << std::endl;
            }
        }

        ScratchDir(const ScratchDir&) = delete;
        ScratchDir& operator=(const ScratchDir&) = delete;

        std::string path() const { return path_.string(); }

    private:
        fs::path path_;
    };
}

CatalogSync::CatalogSync(const SyncOptions& options, const FolderSource& source)
    : options_(options)
    , source_(source)
    , packager_(options.zipDir, options.flatgeobufDir) {
}

void CatalogSync::setProgressCallback(ProgressCallback callback) {
    progressCallback_ = std::move(callback);
}

std::optional<CalendarDate> CatalogSync::extractFolderDate(const std::string& folderName) {
    if (folderName.size() < 8) return std::nullopt;
    for (size_t i = 0; i < 8; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(folderName[i]))) return std::nullopt;
    }

    CalendarDate date;
    date.year = std::stoi(folderName.substr(0, 4));
    date.month = std::stoi(folderName.substr(4, 2));
    date.day = std::stoi(folderName.substr(6, 2));
    if (!date.isValid()) return std::nullopt;
    return date;
}

std::string CatalogSync::joinUrl(const std::string& base, const std::string& name) {
    std::string url = base;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url + "/" + name;
}

std::vector<CatalogItem> CatalogSync::updateGroupedCatalog(const std::vector<CatalogItem>& existing,
                                                           const std::vector<CatalogItem>& newItems,
                                                           const std::string& styleUrl,
                                                           MergeDiagnostics* diagnostics) {
    std::vector<CatalogItem> combined = existing;
    combined.reserve(existing.size() + newItems.size());
    for (const auto& item : newItems) {
        CatalogItem styled = item;
        styled.links = attachStyleLink(styled, styleUrl);
        combined.push_back(std::move(styled));
    }

    std::vector<CatalogItem> merged = mergeById(combined, diagnostics);

    // The surviving style link only names the first member's assets
    for (auto& item : merged) {
        item.links = attachStyleLink(item, styleUrl);
    }
    return merged;
}

FolderResult CatalogSync::processFolder(const std::string& folderName) {
    FolderResult result;
    result.folderName = folderName;

    // Names become file names under the output directories
    if (folderName.find_first_of("/\\") != std::string::npos ||
        folderName.find("..") != std::string::npos) {
        result.errorMessage = "Invalid folder name";
        return result;
    }

    auto date = extractFolderDate(folderName);
    if (!date) {
        result.skipped = true;
        result.errorMessage = "Invalid date format";
        std::cerr << "Warning: invalid date format in " << folderName << std::endl;
        return result;
    }
    result.date = *date;

    try {
        ScratchDir scratch(folderName);

        result.filesFetched = source_.fetchFolder(folderName, scratch.path());
        if (result.filesFetched == 0) {
            result.errorMessage = "Download failed";
            return result;
        }

        std::string zipPath = packager_.zipFolder(scratch.path(), folderName);
        std::string fgbPath = packager_.convertToFlatGeobuf(scratch.path(), folderName);
        std::string envelope = FolderPackager::readEnvelope(fgbPath);

        if (options_.verbose) {
            std::cout << "  Packaged " << zipPath << " and " << fgbPath << std::endl;
        }

        AssetSpec zipAsset{envelope, joinUrl(options_.zipBaseUrl, folderName + ".zip")};
        pendingZipItems_.push_back(synthesize(*date, folderName, {zipAsset}, MEDIA_TYPE_ZIP));

        pendingDayAssets_[*date].push_back(
            AssetSpec{envelope, joinUrl(options_.fgbBaseUrl, folderName + ".fgb")});

        result.success = true;

    } catch (const std::exception& e) {
        result.success = false;
        result.errorMessage = e.what();
    }

    return result;
}

std::vector<FolderResult> CatalogSync::processFolders(const std::vector<std::string>& folders) {
    std::vector<FolderResult> results;
    results.reserve(folders.size());

    stats_ = Statistics{};
    int total = static_cast<int>(folders.size());
    int current = 0;

    for (const auto& folder : folders) {
        if (options_.verbose) {
            std::cout << "Processing: " << folder << std::endl;
        }

        FolderResult result = processFolder(folder);
        results.push_back(result);

        ++current;
        ++stats_.totalFolders;
        if (result.success) {
            ++stats_.successCount;
        } else if (result.skipped) {
            ++stats_.skippedCount;
        } else {
            ++stats_.failCount;
            std::cerr << "Failed: " << result.folderName
                      << " - " << result.errorMessage << std::endl;
        }

        if (progressCallback_) {
            progressCallback_(current, total, result.folderName);
        }
    }

    return results;
}

std::vector<CatalogItem> CatalogSync::buildGroupedItems() const {
    std::vector<CatalogItem> items;
    items.reserve(pendingDayAssets_.size());
    for (const auto& [date, specs] : pendingDayAssets_) {
        items.push_back(synthesize(date, date.toIsoString(), specs, MEDIA_TYPE_FLATGEOBUF));
    }
    return items;
}

const std::vector<CatalogItem>& CatalogSync::pendingZipItems() const {
    return pendingZipItems_;
}

std::vector<FolderResult> CatalogSync::run(const std::vector<std::string>& folders) {
    pendingZipItems_.clear();
    pendingDayAssets_.clear();

    CatalogStore zipStore(options_.zipCatalogPath);
    CatalogStore groupedStore(options_.groupedCatalogPath);

    // Both catalogs are loaded before anything is fetched
    std::vector<CatalogItem> zipItems = zipStore.load();
    std::vector<CatalogItem> groupedItems = groupedStore.load();

    std::set<std::string> known;
    for (const auto& item : zipItems) {
        known.insert(item.id);
    }

    std::vector<std::string> pending;
    for (const auto& folder : folders) {
        if (known.insert(folder).second) {
            pending.push_back(folder);
        }
    }

    std::cout << "Found " << folders.size() << " folders, "
              << pending.size() << " not yet cataloged" << std::endl;

    std::vector<FolderResult> results = processFolders(pending);

    std::vector<CatalogItem> newGrouped = buildGroupedItems();
    stats_.newZipItems = static_cast<int>(pendingZipItems_.size());
    stats_.newGroupedItems = static_cast<int>(newGrouped.size());

    // Grouped first: a folder missing from the zip catalog is fetched again next run
    if (!newGrouped.empty()) {
        MergeDiagnostics diagnostics;
        auto updated = updateGroupedCatalog(groupedItems, newGrouped, options_.styleUrl, &diagnostics);
        reportConflicts(diagnostics);
        if (!groupedStore.save(updated)) {
            throw CatalogError("Failed to save " + groupedStore.getPath());
        }
        std::cout << "Updated " << groupedStore.getPath() << " with "
                  << newGrouped.size() << " grouped items." << std::endl;
    } else {
        std::cout << "No new grouped items to add." << std::endl;
    }

    if (!pendingZipItems_.empty()) {
        zipItems.insert(zipItems.end(), pendingZipItems_.begin(), pendingZipItems_.end());
        if (!zipStore.save(zipItems)) {
            throw CatalogError("Failed to save " + zipStore.getPath());
        }
        std::cout << "Updated " << zipStore.getPath() << " with "
                  << pendingZipItems_.size() << " items." << std::endl;
    } else {
        std::cout << "No new zip items to add." << std::endl;
    }

    return results;
}

void CatalogSync::remergeGroupedCatalog() {
    CatalogStore groupedStore(options_.groupedCatalogPath);
    std::vector<CatalogItem> existing = groupedStore.load();

    MergeDiagnostics diagnostics;
    auto merged = updateGroupedCatalog(existing, {}, options_.styleUrl, &diagnostics);
    reportConflicts(diagnostics);

    if (!groupedStore.save(merged)) {
        throw CatalogError("Failed to save " + groupedStore.getPath());
    }
    std::cout << "Merged " << existing.size() << " records into "
              << merged.size() << " daily items." << std::endl;
}

void CatalogSync::reportConflicts(const MergeDiagnostics& diagnostics) const {
    for (const auto& id : diagnostics.datetimeConflicts) {
        std::cerr << "Warning: records of item " << id
                  << " disagree on datetime; kept the first" << std::endl;
    }
}

CatalogSync::Statistics CatalogSync::getStatistics() const {
    return stats_;
}

} // namespace icestac

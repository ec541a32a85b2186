// Copyright 2024 IceSTAC Authors
// SPDX-License-Identifier: Apache-2.0
//
// Main entry point with CLI
// IceSTAC - incremental STAC catalogs of daily sea-ice shapefile releases

#include "types.hpp"
#include "json_utils.hpp"
#include "folder_source.hpp"
#include "sync.hpp"

#include <ctime>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// Program version
const char* VERSION = "1.0.0";

// Print usage information
void printUsage(const char* progName) {
    std::cout << "IceSTAC v" << VERSION << "\n"
              << "Incremental STAC catalogs of daily sea-ice shapefile releases\n\n"
              << "Usage: " << progName << " [options]\n\n"
              << "Source Options:\n"
              << "  --source <url>          Remote archive base URL (env SHAPEFILE_BASE_URL)\n"
              << "  --year <yyyy>           Archive year to sync (default: current year)\n"
              << "  --local <dir>           Read folders from a local mirror instead\n"
              << "  --list-file <json>      Folder names from {\"list\": [...]} instead of discovery\n\n"
              << "Catalog Options:\n"
              << "  --grouped <path>        Grouped (daily) catalog (env GROUPED_PARQUET_PATH)\n"
              << "  --zip-catalog <path>    Zip catalog (env ZIP_PARQUET_PATH)\n"
              << "  --fgb-dir <dir>         FlatGeobuf output directory (env FLATGEOBUF_DIR)\n"
              << "  --zip-dir <dir>         Zip output directory (env ZIPPED_DIR)\n"
              << "  --fgb-base-url <url>    Published FlatGeobuf URL prefix (env ASSET_BASE_URL_FGB)\n"
              << "  --zip-base-url <url>    Published zip URL prefix (env ASSET_BASE_URL_ZIP)\n"
              << "  --style-url <url>       Style link target (env STYLE_URL)\n"
              << "  --merge-only            Re-merge the grouped catalog and exit\n\n"
              << "Other Options:\n"
              << "  --list                  List folders found at the source\n"
              << "  -v, --verbose           Verbose output\n"
              << "  -h, --help              Show this help\n"
              << "  --version               Show version\n\n"
              << "Examples:\n"
              << "  " << progName << " --year 2024 -v\n"
              << "  " << progName << " --list-file folders.json --style-url https://example.com/style.json\n"
              << "  " << progName << " --local /data/sigrid3/2024 --list\n"
              << std::endl;
}

// Print version
void printVersion() {
    std::cout << "icestac-sync " << VERSION << std::endl;
}

static std::string get_env_or(const char* key, const std::string& defval) {
    if (const char* v = std::getenv(key)) return std::string(v);
    return defval;
}

static int currentYear() {
    std::time_t now = std::time(nullptr);
    std::tm utc{};
    gmtime_r(&now, &utc);
    return utc.tm_year + 1900;
}

// Defaults, then environment
static icestac::SyncOptions optionsFromEnvironment() {
    icestac::SyncOptions opts;
    opts.groupedCatalogPath = get_env_or("GROUPED_PARQUET_PATH", opts.groupedCatalogPath);
    opts.zipCatalogPath = get_env_or("ZIP_PARQUET_PATH", opts.zipCatalogPath);
    opts.flatgeobufDir = get_env_or("FLATGEOBUF_DIR", opts.flatgeobufDir);
    opts.zipDir = get_env_or("ZIPPED_DIR", opts.zipDir);
    opts.sourceBaseUrl = get_env_or("SHAPEFILE_BASE_URL", opts.sourceBaseUrl);
    opts.fgbBaseUrl = get_env_or("ASSET_BASE_URL_FGB", opts.fgbBaseUrl);
    opts.zipBaseUrl = get_env_or("ASSET_BASE_URL_ZIP", opts.zipBaseUrl);
    opts.styleUrl = get_env_or("STYLE_URL", opts.styleUrl);
    return opts;
}

// Show effective configuration
void printConfig(const icestac::SyncOptions& opts, const icestac::FolderSource& source) {
    std::cout << "Using config:\n"
              << "  Grouped catalog:  " << opts.groupedCatalogPath << "\n"
              << "  Zip catalog:      " << opts.zipCatalogPath << "\n"
              << "  Source:           " << source.describe() << "\n"
              << "  FlatGeobuf URLs:  " << opts.fgbBaseUrl << "\n"
              << "  Zip URLs:         " << opts.zipBaseUrl << "\n"
              << "  Style URL:        " << (opts.styleUrl.empty() ? "(none)" : opts.styleUrl) << "\n"
              << std::endl;
}

int main(int argc, char* argv[]) {
    icestac::SyncOptions opts = optionsFromEnvironment();

    // Flags that take a value
    auto requireValue = [&](int& i, const std::string& arg, std::string& target) {
        if (i + 1 < argc) {
            target = argv[++i];
            return true;
        }
        std::cerr << "Error: " << arg << " requires a value\n";
        return false;
    };

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "--version") {
            printVersion();
            return 0;
        }
        if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
            continue;
        }
        if (arg == "--list") {
            opts.listOnly = true;
            continue;
        }
        if (arg == "--merge-only") {
            opts.mergeOnly = true;
            continue;
        }
        if (arg == "--year") {
            std::string value;
            if (!requireValue(i, arg, value)) return 1;
            try {
                opts.year = std::stoi(value);
            } catch (const std::exception&) {
                std::cerr << "Error: --year requires a number\n";
                return 1;
            }
            continue;
        }

        std::string* target = nullptr;
        if (arg == "--source") target = &opts.sourceBaseUrl;
        else if (arg == "--local") target = &opts.localSourceDir;
        else if (arg == "--list-file") target = &opts.folderListPath;
        else if (arg == "--grouped") target = &opts.groupedCatalogPath;
        else if (arg == "--zip-catalog") target = &opts.zipCatalogPath;
        else if (arg == "--fgb-dir") target = &opts.flatgeobufDir;
        else if (arg == "--zip-dir") target = &opts.zipDir;
        else if (arg == "--fgb-base-url") target = &opts.fgbBaseUrl;
        else if (arg == "--zip-base-url") target = &opts.zipBaseUrl;
        else if (arg == "--style-url") target = &opts.styleUrl;

        if (target) {
            if (!requireValue(i, arg, *target)) return 1;
            continue;
        }

        std::cerr << "Error: unknown option " << arg << "\n\n";
        printUsage(argv[0]);
        return 1;
    }

    if (opts.year == 0) {
        opts.year = currentYear();
    }

    // Select folder source
    std::unique_ptr<icestac::FolderSource> source;
    if (!opts.localSourceDir.empty()) {
        source = std::make_unique<icestac::LocalFolderSource>(opts.localSourceDir);
    } else {
        source = std::make_unique<icestac::HttpFolderSource>(
            icestac::HttpFolderSource::yearUrl(opts.sourceBaseUrl, opts.year));
    }

    printConfig(opts, *source);

    try {
        icestac::CatalogSync sync(opts, *source);

        // Handle --merge-only
        if (opts.mergeOnly) {
            sync.remergeGroupedCatalog();
            return 0;
        }

        std::vector<std::string> folders;
        if (!opts.folderListPath.empty()) {
            folders = icestac::json::loadFolderList(opts.folderListPath);
        } else {
            folders = source->listFolders();
        }

        // Handle --list
        if (opts.listOnly) {
            std::cout << "Found " << folders.size() << " folders:\n";
            for (const auto& folder : folders) {
                std::cout << "  " << folder << "\n";
            }
            std::cout << std::endl;
            return 0;
        }

        fs::create_directories(opts.flatgeobufDir);
        fs::create_directories(opts.zipDir);

        // Set progress callback
        if (!opts.verbose) {
            sync.setProgressCallback([](int current, int total, const std::string& folderName) {
                std::cout << "\rProcessing: " << current << "/" << total
                          << " (" << folderName << ")          " << std::flush;
            });
        }

        auto results = sync.run(folders);

        auto stats = sync.getStatistics();
        std::cout << "\nSync Complete:\n"
                  << "  Folders processed: " << stats.totalFolders << "\n"
                  << "  Successful:        " << stats.successCount << "\n"
                  << "  Skipped:           " << stats.skippedCount << "\n"
                  << "  Failed:            " << stats.failCount << "\n"
                  << "  New zip items:     " << stats.newZipItems << "\n"
                  << "  New daily items:   " << stats.newGroupedItems << "\n";

        // Print failures
        if (stats.failCount > 0) {
            std::cout << "\nFailed folders:\n";
            for (const auto& result : results) {
                if (!result.success && !result.skipped) {
                    std::cout << "  " << result.folderName << ": " << result.errorMessage << "\n";
                }
            }
        }

        return stats.failCount > 0 ? 1 : 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

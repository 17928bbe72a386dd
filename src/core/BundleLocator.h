// bundleloc — No impositions.
// Copyright (c) 2025 Berk Coşar <lookmainpoint@gmail.com>
// Licensed under the GNU Affero General Public License v3.0.
// See LICENSE file in the project root for full license text.

#pragma once
#include "PathCache.h"
#include <string>
#include <vector>
#include <optional>

// Inputs for bundle discovery
// Bundle kesfi icin girdiler
struct LocatorOptions {
    std::string explicitPath;                 // bundle.path / --bundle=
    std::vector<std::string> searchRoots;     // bundle.search_paths
    bool useEnvironment = true;               // BUNDLELOC_BUNDLE, CURSOR_PATH
    bool useDefaultRoots = true;              // OS install locations / OS kurulum konumlari
    int maxDepth = 5;                         // Recursive search depth / Rekursif arama derinligi
};

// Finds workbench.desktop.main.js. Order: explicit path, environment,
// cache, known layouts under each root, recursive search.
// workbench.desktop.main.js dosyasini bulur. Sira: acik yol, ortam,
// onbellek, her kok altindaki bilinen duzenler, rekursif arama.
class BundleLocator {
public:
    static constexpr const char* kBundleFileName = "workbench.desktop.main.js";
    static constexpr const char* kCacheKey = "bundle";

    BundleLocator(LocatorOptions options, PathCache* cache = nullptr);

    // First existing bundle file, written back to the cache on success
    // Ilk var olan bundle dosyasi, basarida onbellege geri yazilir
    std::optional<std::string> locate();

    // Inspect a file or directory: a file is taken as-is, a directory is tried with the known layouts
    // Bir dosya veya dizini yokla: dosya oldugu gibi alinir, dizin bilinen duzenlerle denenir
    static std::optional<std::string> inspect(const std::string& fileOrDir);

    // Relative bundle locations inside an install directory
    // Bir kurulum dizini icindeki goreli bundle konumlari
    static const std::vector<std::string>& relativeLayouts();

    // Platform install roots
    // Platform kurulum kokleri
    static std::vector<std::string> defaultRoots();

private:
    std::optional<std::string> fromEnvironment() const;
    std::optional<std::string> fromCache() const;
    std::optional<std::string> searchTree(const std::string& root) const;
    std::optional<std::string> remember(const std::string& path, const char* source);

    LocatorOptions options_;
    PathCache* cache_;
};

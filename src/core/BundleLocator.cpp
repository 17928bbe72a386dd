// bundleloc — No impositions.
// Copyright (c) 2025 Berk Coşar <lookmainpoint@gmail.com>
// Licensed under the GNU Affero General Public License v3.0.
// See LICENSE file in the project root for full license text.

#include "BundleLocator.h"
#include "Logger.h"
#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;

BundleLocator::BundleLocator(LocatorOptions options, PathCache* cache)
    : options_(std::move(options)), cache_(cache) {}

const std::vector<std::string>& BundleLocator::relativeLayouts() {
    static const std::vector<std::string> layouts = {
        "resources/app/out/vs/workbench/workbench.desktop.main.js",
        "out/vs/workbench/workbench.desktop.main.js",
        "vs/workbench/workbench.desktop.main.js",
    };
    return layouts;
}

std::vector<std::string> BundleLocator::defaultRoots() {
    std::vector<std::string> roots;
    if (const char* home = std::getenv("HOME")) {
        roots.push_back((fs::path(home) / ".local" / "share" / "cursor").string());
    }
#if defined(_WIN32)
    if (const char* local = std::getenv("LOCALAPPDATA")) {
        roots.push_back((fs::path(local) / "Programs" / "cursor").string());
    }
#endif
    roots.push_back("/usr/share/cursor");
    roots.push_back("/opt/cursor");
    roots.push_back("/Applications/Cursor.app/Contents/Resources/app");
    return roots;
}

std::optional<std::string> BundleLocator::inspect(const std::string& fileOrDir) {
    if (fileOrDir.empty()) return std::nullopt;

    std::error_code ec;
    fs::path p(fileOrDir);
    if (fs::is_regular_file(p, ec)) return p.string();
    if (!fs::is_directory(p, ec)) return std::nullopt;

    for (const auto& rel : relativeLayouts()) {
        fs::path candidate = p / rel;
        if (fs::is_regular_file(candidate, ec)) return candidate.string();
    }
    return std::nullopt;
}

std::optional<std::string> BundleLocator::locate() {
    if (!options_.explicitPath.empty()) {
        if (auto found = inspect(options_.explicitPath)) return remember(*found, "explicit path");
        // An explicit path that does not exist is not silently replaced by another bundle
        // Var olmayan acik bir yol sessizce baska bir bundle ile degistirilmez
        LOG_WARN("[Locator] Bundle not found at ", options_.explicitPath);
        return std::nullopt;
    }

    if (options_.useEnvironment) {
        if (auto found = fromEnvironment()) return remember(*found, "environment");
    }

    if (auto found = fromCache()) {
        LOG_DEBUG("[Locator] Using cached bundle path: ", *found);
        return found;
    }

    std::vector<std::string> roots = options_.searchRoots;
    if (options_.useDefaultRoots) {
        auto defaults = defaultRoots();
        roots.insert(roots.end(), defaults.begin(), defaults.end());
    }

    for (const auto& root : roots) {
        if (auto found = inspect(root)) return remember(*found, "known layout");
    }

    for (const auto& root : roots) {
        if (auto found = searchTree(root)) return remember(*found, "directory search");
    }

    LOG_WARN("[Locator] ", kBundleFileName, " not found in ", roots.size(), " search roots");
    return std::nullopt;
}

std::optional<std::string> BundleLocator::fromEnvironment() const {
    for (const char* var : {"BUNDLELOC_BUNDLE", "CURSOR_PATH"}) {
        const char* value = std::getenv(var);
        if (!value || !*value) continue;
        if (auto found = inspect(value)) return found;
        LOG_DEBUG("[Locator] ", var, "=", value, " has no bundle");
    }
    return std::nullopt;
}

// A cached path is used only while the file still exists
// Onbellekteki yol yalnizca dosya hala varsa kullanilir
std::optional<std::string> BundleLocator::fromCache() const {
    if (!cache_) return std::nullopt;
    auto cached = cache_->get(kCacheKey);
    if (!cached) return std::nullopt;

    std::error_code ec;
    if (fs::is_regular_file(*cached, ec)) return cached;

    LOG_DEBUG("[Locator] Cached bundle path is stale: ", *cached);
    cache_->erase(kCacheKey);
    return std::nullopt;
}

std::optional<std::string> BundleLocator::searchTree(const std::string& root) const {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) return std::nullopt;

    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) return std::nullopt;

    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            LOG_DEBUG("[Locator] Search stopped under ", root, ": ", ec.message());
            break;
        }
        if (it.depth() >= options_.maxDepth) {
            it.disable_recursion_pending();
        }
        if (it->path().filename() == kBundleFileName && it->is_regular_file(ec)) {
            return it->path().string();
        }
    }
    return std::nullopt;
}

std::optional<std::string> BundleLocator::remember(const std::string& path, const char* source) {
    LOG_INFO("[Locator] Bundle found (", source, "): ", path);
    if (cache_) {
        std::error_code ec;
        fs::path abs = fs::absolute(path, ec);
        cache_->set(kCacheKey, ec ? path : abs.string());
        if (cache_->dirty()) cache_->save();
    }
    return path;
}

// bundleloc — No impositions.
// Copyright (c) 2025 Berk Coşar <lookmainpoint@gmail.com>
// Licensed under the GNU Affero General Public License v3.0.
// See LICENSE file in the project root for full license text.

#include "BundleLocator.h"
#include "PathCache.h"
#include "test_helpers.h"
#include <gtest/gtest.h>
#include <cstdlib>

namespace {

LocatorOptions isolated() {
    LocatorOptions opts;
    opts.useEnvironment = false;
    opts.useDefaultRoots = false;
    return opts;
}

} // namespace

TEST(PathCache, PersistsValues) {
    testutil::TempDir dir;
    std::string file = dir.file("cache/paths.json");
    {
        PathCache cache(file);
        EXPECT_FALSE(cache.load());
        cache.set("bundle", "/opt/cursor/main.js");
        EXPECT_TRUE(cache.dirty());
        EXPECT_TRUE(cache.save());
        EXPECT_FALSE(cache.dirty());
    }
    PathCache reloaded(file);
    EXPECT_TRUE(reloaded.load());
    EXPECT_EQ(reloaded.get("bundle").value_or(""), "/opt/cursor/main.js");
    EXPECT_FALSE(reloaded.get("other").has_value());
}

TEST(PathCache, CorruptFileLoadsEmpty) {
    testutil::TempDir dir;
    testutil::writeFile(dir.file("paths.json"), "not json");
    PathCache cache(dir.file("paths.json"));
    EXPECT_FALSE(cache.load());
    EXPECT_FALSE(cache.get("bundle").has_value());
}

TEST(BundleLocator, ExplicitFileOrInstallDirectory) {
    testutil::TempDir dir;
    std::string bundle = dir.file("install/resources/app/out/vs/workbench/workbench.desktop.main.js");
    testutil::writeFile(bundle, "x");

    LocatorOptions opts = isolated();
    opts.explicitPath = bundle;
    EXPECT_EQ(BundleLocator(opts).locate().value_or(""), bundle);

    opts.explicitPath = dir.file("install");
    EXPECT_EQ(BundleLocator(opts).locate().value_or(""), bundle);
}

TEST(BundleLocator, MissingExplicitPathIsNotReplaced) {
    testutil::TempDir dir;
    testutil::writeFile(dir.file("root/out/vs/workbench/workbench.desktop.main.js"), "x");

    LocatorOptions opts = isolated();
    opts.explicitPath = dir.file("nowhere.js");
    opts.searchRoots = {dir.file("root")};
    EXPECT_FALSE(BundleLocator(opts).locate().has_value());
}

TEST(BundleLocator, EnvironmentBeatsCacheAndRoots) {
    testutil::TempDir dir;
    std::string fromEnv = dir.file("env/vs/workbench/workbench.desktop.main.js");
    std::string fromRoot = dir.file("root/out/vs/workbench/workbench.desktop.main.js");
    testutil::writeFile(fromEnv, "env");
    testutil::writeFile(fromRoot, "root");

    ::setenv("BUNDLELOC_BUNDLE", dir.file("env").c_str(), 1);
    LocatorOptions opts = isolated();
    opts.useEnvironment = true;
    opts.searchRoots = {dir.file("root")};
    auto found = BundleLocator(opts).locate();
    ::unsetenv("BUNDLELOC_BUNDLE");

    EXPECT_EQ(found.value_or(""), fromEnv);
}

TEST(BundleLocator, KnownLayoutUnderSearchRootIsCached) {
    testutil::TempDir dir;
    std::string bundle = dir.file("root/out/vs/workbench/workbench.desktop.main.js");
    testutil::writeFile(bundle, "x");

    PathCache cache(dir.file("paths.json"));
    LocatorOptions opts = isolated();
    opts.searchRoots = {dir.file("empty"), dir.file("root")};
    EXPECT_EQ(BundleLocator(opts, &cache).locate().value_or(""), bundle);
    EXPECT_EQ(cache.get(BundleLocator::kCacheKey).value_or(""), bundle);

    // Second run: the cache answers even without search roots
    PathCache again(dir.file("paths.json"));
    ASSERT_TRUE(again.load());
    EXPECT_EQ(BundleLocator(isolated(), &again).locate().value_or(""), bundle);
}

TEST(BundleLocator, StaleCacheFallsThroughToSearch) {
    testutil::TempDir dir;
    std::string bundle = dir.file("root/deep/a/b/workbench.desktop.main.js");
    testutil::writeFile(bundle, "x");

    PathCache cache(dir.file("paths.json"));
    cache.set(BundleLocator::kCacheKey, dir.file("deleted/workbench.desktop.main.js"));

    LocatorOptions opts = isolated();
    opts.searchRoots = {dir.file("root")};
    EXPECT_EQ(BundleLocator(opts, &cache).locate().value_or(""), bundle);
    EXPECT_EQ(cache.get(BundleLocator::kCacheKey).value_or(""), bundle);
}

TEST(BundleLocator, RecursiveSearchRespectsDepth) {
    testutil::TempDir dir;
    testutil::writeFile(dir.file("root/1/2/3/4/5/6/7/workbench.desktop.main.js"), "x");

    LocatorOptions opts = isolated();
    opts.searchRoots = {dir.file("root")};
    EXPECT_FALSE(BundleLocator(opts).locate().has_value());

    opts.maxDepth = 10;
    EXPECT_TRUE(BundleLocator(opts).locate().has_value());
}

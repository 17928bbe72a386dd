// bundleloc — No impositions.
// Copyright (c) 2025 Berk Coşar <lookmainpoint@gmail.com>
// Licensed under the GNU Affero General Public License v3.0.
// See LICENSE file in the project root for full license text.

#include "Config.h"
#include "Startup.h"
#include "test_helpers.h"
#include <gtest/gtest.h>
#include <cstdlib>

namespace {

// argv-style wrapper that owns its strings
// Dizelerine sahip argv bicimli sarmalayici
struct Args {
    explicit Args(std::vector<std::string> a) : storage(std::move(a)) {
        storage.insert(storage.begin(), "bundleloc");
        for (auto& s : storage) ptrs.push_back(s.data());
    }
    int argc() const { return static_cast<int>(ptrs.size()); }
    char** argv() { return ptrs.data(); }

    std::vector<std::string> storage;
    std::vector<char*> ptrs;
};

} // namespace

TEST(Config, DefaultsAreAvailable) {
    Config cfg;
    EXPECT_EQ(cfg.getString("mode"), "translate");
    EXPECT_EQ(cfg.getString("translation.language"), "ko");
    EXPECT_EQ(cfg.getInt("translation.chunk_size"), 50);
    EXPECT_EQ(cfg.getInt("substitute.min_key_length"), 3);
    EXPECT_TRUE(cfg.getBool("backup.enabled"));
    EXPECT_FALSE(cfg.getBool("dry_run", true));
    EXPECT_EQ(cfg.getString("does.not.exist", "fallback"), "fallback");
}

TEST(Config, JsoncLayersAreDeepMerged) {
    testutil::TempDir dir;
    testutil::writeFile(dir.file("app.jsonc"), R"({
        // shipped defaults
        "translation": { "language": "ja", "chunk_size": 25 },
        "bundle": { "search_paths": ["/opt/one", "/opt/two"] }
    })");
    testutil::writeFile(dir.file("user.jsonc"), R"({
        /* user override */
        "translation": { "language": "fr" },
        "store": { "dir": "~/my-stores" } // trailing comment
    })");

    Config cfg;
    EXPECT_TRUE(cfg.loadFile(dir.file("app.jsonc")));
    EXPECT_TRUE(cfg.loadFile(dir.file("user.jsonc")));
    EXPECT_FALSE(cfg.loadFile(dir.file("missing.jsonc")));

    EXPECT_EQ(cfg.getString("translation.language"), "fr");
    EXPECT_EQ(cfg.getInt("translation.chunk_size"), 25);
    EXPECT_EQ(cfg.getInt("translation.timeout_sec"), 30);
    EXPECT_EQ(cfg.getString("store.dir"), "~/my-stores");
    EXPECT_EQ(cfg.getStringList("bundle.search_paths"),
              (std::vector<std::string>{"/opt/one", "/opt/two"}));
}

TEST(Config, BrokenFileIsIgnored) {
    testutil::TempDir dir;
    testutil::writeFile(dir.file("bad.jsonc"), "{ \"translation\": ");
    Config cfg;
    EXPECT_FALSE(cfg.loadFile(dir.file("bad.jsonc")));
    EXPECT_EQ(cfg.getString("translation.language"), "ko");
}

TEST(Config, CliOverridesEverything) {
    Config cfg;
    cfg.set("translation.language", "ja");

    Args args({"--lang=de", "--bundle=/tmp/x.js", "--mode=extract", "--no-backup",
               "--dry-run", "--prune", "--json", "--chunk-size=10", "--no-verify",
               "--backup=/tmp/x.bak", "--log-level=debug"});
    std::string error;
    ASSERT_TRUE(cfg.applyCliArgs(args.argc(), args.argv(), &error)) << error;

    EXPECT_EQ(cfg.getString("translation.language"), "de");
    EXPECT_EQ(cfg.getString("bundle.path"), "/tmp/x.js");
    EXPECT_EQ(cfg.getString("mode"), "extract");
    EXPECT_FALSE(cfg.getBool("backup.enabled", true));
    EXPECT_TRUE(cfg.getBool("dry_run"));
    EXPECT_TRUE(cfg.getBool("store.prune"));
    EXPECT_TRUE(cfg.getBool("json"));
    EXPECT_FALSE(cfg.getBool("translation.verify", true));
    EXPECT_EQ(cfg.getInt("translation.chunk_size"), 10);
    EXPECT_EQ(cfg.getString("backup.restore_from"), "/tmp/x.bak");
    EXPECT_EQ(cfg.getString("log.level"), "debug");
}

TEST(Config, BadCliArgumentsAreReported) {
    {
        Config cfg;
        Args args({"--chunk-size=abc"});
        std::string error;
        EXPECT_FALSE(cfg.applyCliArgs(args.argc(), args.argv(), &error));
        EXPECT_NE(error.find("--chunk-size=abc"), std::string::npos);
        EXPECT_EQ(cfg.getInt("translation.chunk_size"), 50);
    }
    {
        Config cfg;
        Args args({"--frobnicate"});
        std::string error;
        EXPECT_FALSE(cfg.applyCliArgs(args.argc(), args.argv(), &error));
        EXPECT_NE(error.find("Unknown argument"), std::string::npos);
    }
}

TEST(Config, CredentialPrefersConfigThenEnvironment) {
    ::unsetenv("BUNDLELOC_DEEPL_KEY");
    ::unsetenv("DEEPL_API_KEY");

    Config cfg;
    EXPECT_EQ(ResolveCredential(cfg), "");

    ::setenv("DEEPL_API_KEY", "generic", 1);
    EXPECT_EQ(ResolveCredential(cfg), "generic");

    ::setenv("BUNDLELOC_DEEPL_KEY", "specific", 1);
    EXPECT_EQ(ResolveCredential(cfg), "specific");

    cfg.set("translation.api_key", "from-config");
    EXPECT_EQ(ResolveCredential(cfg), "from-config");

    ::unsetenv("BUNDLELOC_DEEPL_KEY");
    ::unsetenv("DEEPL_API_KEY");
}

TEST(Config, PipelineOptionsFollowConfig) {
    testutil::TempDir dir;
    std::string bundle = dir.file("resources/app/out/vs/workbench/workbench.desktop.main.js");
    testutil::writeFile(bundle, "x");

    Config cfg;
    cfg.set("bundle.path", dir.path().string());
    cfg.set("translation.language", "KO");
    cfg.set("store.dir", dir.file("stores"));
    cfg.set("backup.dir", dir.file("backups"));
    cfg.set("cache.path", dir.file("cache/paths.json"));
    cfg.set("backup.enabled", false);
    cfg.set("substitute.min_key_length", 4);

    PipelineOptions opts = BuildPipelineOptions(cfg);
    EXPECT_EQ(opts.bundlePath, bundle);
    EXPECT_EQ(opts.language, "ko");
    EXPECT_EQ(opts.storeDir, dir.file("stores"));
    EXPECT_EQ(opts.backupDir, dir.file("backups"));
    EXPECT_TRUE(opts.skipBackup);
    EXPECT_EQ(opts.minKeyLength, 4u);
}

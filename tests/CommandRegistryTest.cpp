// bundleloc — No impositions.
// Copyright (c) 2025 Berk Coşar <lookmainpoint@gmail.com>
// Licensed under the GNU Affero General Public License v3.0.
// See LICENSE file in the project root for full license text.

#include "CommandRegistry.h"
#include "ApiResponse.h"
#include "Startup.h"
#include "test_helpers.h"
#include <gtest/gtest.h>
#include <stdexcept>

TEST(CommandRegistry, WrapsDataAndPassesEnvelopesThrough) {
    CommandRegistry reg;
    EXPECT_TRUE(reg.registerQuery("plain", [](const json&) { return json{{"n", 1}}; }));
    EXPECT_TRUE(reg.registerQuery("enveloped", [](const json&) {
        return ApiResponse::error("WRITE_ERROR", "disk full");
    }));
    EXPECT_FALSE(reg.registerQuery("plain", [](const json&) { return json(); }));

    json plain = reg.executeWithResult("plain");
    EXPECT_TRUE(plain["ok"].get<bool>());
    EXPECT_EQ(plain["data"]["n"], 1);

    json failed = reg.executeWithResult("enveloped");
    EXPECT_FALSE(failed["ok"].get<bool>());
    EXPECT_EQ(failed["error"]["code"], "WRITE_ERROR");
    EXPECT_EQ(failed["message"], "disk full");
}

TEST(CommandRegistry, UnknownNamesAndThrowingHandlers) {
    CommandRegistry reg;
    reg.registerQuery("boom", [](const json&) -> json { throw std::runtime_error("bad state"); });

    json missing = reg.executeWithResult("nope");
    EXPECT_EQ(missing["error"]["code"], "NOT_FOUND");
    EXPECT_EQ(ExitCodeFor(missing), kExitInvalidArgs);

    json thrown = reg.executeWithResult("boom");
    EXPECT_EQ(thrown["error"]["code"], "QUERY_ERROR");
    EXPECT_EQ(ExitCodeFor(thrown), kExitFatal);
}

TEST(CommandRegistry, ModesAreRegisteredAndMapToExitCodes) {
    testutil::TempDir tmp;
    std::string bundle = tmp.file("main.js");
    testutil::writeFile(bundle, "x={title:\"Account\"}");

    PipelineOptions opts;
    opts.bundlePath = bundle;
    opts.storeDir = tmp.file("stores");
    opts.backupDir = tmp.file("backups");
    BundleLocalizer loc(opts);

    CommandRegistry reg;
    RegisterModes(reg, loc);
    EXPECT_EQ(reg.names(), (std::vector<std::string>{
        "extract", "list-backups", "modes", "restore", "status", "translate"}));

    json translated = reg.executeWithResult("translate");
    ASSERT_TRUE(translated["ok"].get<bool>()) << translated.dump();
    EXPECT_EQ(translated["data"]["summary"], "1 of 1 strings translated");
    EXPECT_EQ(ExitCodeFor(translated), kExitOk);

    json backups = reg.executeWithResult("list-backups");
    EXPECT_EQ(backups["meta"]["count"], 1);

    BundleLocalizer bad(PipelineOptions{});
    CommandRegistry reg2;
    RegisterModes(reg2, bad);
    json aborted = reg2.executeWithResult("translate");
    EXPECT_FALSE(aborted["ok"].get<bool>());
    EXPECT_EQ(aborted["error"]["code"], "PATH_NOT_FOUND");
    EXPECT_EQ(ExitCodeFor(aborted), kExitFatal);
}

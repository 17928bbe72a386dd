// bundleloc — No impositions.
// Copyright (c) 2025 Berk Coşar <lookmainpoint@gmail.com>
// Licensed under the GNU Affero General Public License v3.0.
// See LICENSE file in the project root for full license text.

#include "BackupManager.h"
#include "test_helpers.h"
#include <gtest/gtest.h>

namespace fs = std::filesystem;

TEST(BackupManager, BackupIsByteIdenticalWithSidecar) {
    testutil::TempDir dir;
    std::string bundle = dir.file("app/workbench.desktop.main.js");
    std::string content("label:\"Open File\"\0\xFF\xFE tail", 25);
    testutil::writeFile(bundle, content);

    BackupManager mgr(dir.file("backups"));
    BackupResult res = mgr.backup(bundle);
    ASSERT_TRUE(res.success) << res.message;

    EXPECT_EQ(res.error, BackupError::None);
    EXPECT_EQ(testutil::readFile(res.record.backupPath), content);
    EXPECT_EQ(res.record.size, content.size());
    EXPECT_TRUE(fs::exists(res.record.backupPath + ".json"));
    EXPECT_TRUE(fs::exists(dir.file("backups/README.txt")));
    EXPECT_EQ(fs::path(res.record.backupPath).filename().string().rfind("workbench.desktop.main.js.", 0), 0u);
    EXPECT_EQ(fs::path(res.record.backupPath).extension(), ".bak");
}

TEST(BackupManager, TimestampIsLocalDateTimeWithMillis) {
    std::string ts = BackupManager::makeTimestamp();
    ASSERT_EQ(ts.size(), 19u) << ts;
    for (size_t i = 0; i < ts.size(); ++i) {
        if (i == 8 || i == 15) EXPECT_EQ(ts[i], '_') << ts;
        else EXPECT_TRUE(ts[i] >= '0' && ts[i] <= '9') << ts;
    }
    EXPECT_GE(ts.substr(0, 4), "1970");
}

TEST(BackupManager, MissingSourceFails) {
    testutil::TempDir dir;
    BackupManager mgr(dir.file("backups"));
    BackupResult res = mgr.backup(dir.file("nope.js"));
    EXPECT_FALSE(res.success);
    EXPECT_EQ(res.error, BackupError::SourceMissing);
}

TEST(BackupManager, ListIsMostRecentFirst) {
    testutil::TempDir dir;
    std::string bundle = dir.file("main.js");
    BackupManager mgr(dir.file("backups"));

    std::vector<std::string> created;
    for (int i = 0; i < 3; ++i) {
        testutil::writeFile(bundle, "version " + std::to_string(i));
        BackupResult res = mgr.backup(bundle);
        ASSERT_TRUE(res.success) << res.message;
        created.push_back(res.record.backupPath);
    }

    auto records = mgr.list();
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0].backupPath, created[2]);
    EXPECT_EQ(records[1].backupPath, created[1]);
    EXPECT_EQ(records[2].backupPath, created[0]);

    auto latest = mgr.latest(bundle);
    ASSERT_TRUE(latest.has_value());
    EXPECT_EQ(testutil::readFile(latest->backupPath), "version 2");
}

TEST(BackupManager, RecordsWithoutSidecarAreRecoveredFromName) {
    testutil::TempDir dir;
    testutil::writeFile(dir.file("backups/main.js.20250101_120000_000.bak"), "old");
    testutil::writeFile(dir.file("backups/main.js.20250101_120000_000-1.bak"), "newer");
    testutil::writeFile(dir.file("backups/notes.txt"), "ignored");

    BackupManager mgr(dir.file("backups"));
    auto records = mgr.list();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].sequence, 1u);
    EXPECT_EQ(records[0].originalPath, "main.js");
    EXPECT_EQ(records[0].timestamp, "20250101_120000_000");
    EXPECT_EQ(records[1].sequence, 0u);
}

TEST(BackupManager, RestoreKeepsBackup) {
    testutil::TempDir dir;
    std::string bundle = dir.file("main.js");
    testutil::writeFile(bundle, "original");

    BackupManager mgr(dir.file("backups"));
    BackupResult snap = mgr.backup(bundle);
    ASSERT_TRUE(snap.success);

    testutil::writeFile(bundle, "rewritten");
    FileResult res = mgr.restore(snap.record, bundle);
    ASSERT_TRUE(res.success) << res.message;

    EXPECT_EQ(testutil::readFile(bundle), "original");
    EXPECT_TRUE(fs::exists(snap.record.backupPath));
    EXPECT_EQ(mgr.list().size(), 1u);
}

TEST(BackupManager, RestoreOfMissingSnapshotFailsWithoutTouchingTarget) {
    testutil::TempDir dir;
    std::string bundle = dir.file("main.js");
    testutil::writeFile(bundle, "current");

    BackupRecord ghost;
    ghost.originalPath = bundle;
    ghost.backupPath = dir.file("backups/gone.bak");

    BackupManager mgr(dir.file("backups"));
    FileResult res = mgr.restore(ghost, bundle);
    EXPECT_FALSE(res.success);
    EXPECT_EQ(testutil::readFile(bundle), "current");
}

TEST(BackupManager, RemoveDeletesSnapshotAndSidecar) {
    testutil::TempDir dir;
    std::string bundle = dir.file("main.js");
    testutil::writeFile(bundle, "x");

    BackupManager mgr(dir.file("backups"));
    BackupResult snap = mgr.backup(bundle);
    ASSERT_TRUE(snap.success);

    EXPECT_TRUE(mgr.remove(snap.record));
    EXPECT_FALSE(fs::exists(snap.record.backupPath));
    EXPECT_FALSE(fs::exists(snap.record.backupPath + ".json"));
    EXPECT_TRUE(mgr.list().empty());
}

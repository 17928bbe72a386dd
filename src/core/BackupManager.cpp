// bundleloc — No impositions.
// Copyright (c) 2025 Berk Coşar <lookmainpoint@gmail.com>
// Licensed under the GNU Affero General Public License v3.0.
// See LICENSE file in the project root for full license text.

#include "BackupManager.h"
#include "Logger.h"
#include "nlohmann/json.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string absolutePath(const std::string& path) {
    std::error_code ec;
    fs::path abs = fs::weakly_canonical(fs::absolute(path, ec), ec);
    return ec ? path : abs.string();
}

} // namespace

BackupManager::BackupManager(std::string directory) : dir_(std::move(directory)) {}

std::string BackupManager::makeTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &time);
#else
    localtime_r(&time, &tm);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%d_%H%M%S") << "_"
        << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

// Snapshot a file before it is mutated. Fails loudly if the copy cannot be verified.
// Bir dosyanin degistirilmeden once anlik goruntusunu al. Kopya dogrulanamazsa yuksek sesle basarisiz olur.
BackupResult BackupManager::backup(const std::string& path) {
    BackupResult result;

    auto sourceSize = FileSystem::fileSize(path);
    if (!FileSystem::exists(path) || !sourceSize) {
        result.error = BackupError::SourceMissing;
        result.message = "Nothing to back up, file not found: " + path;
        LOG_ERROR("[Backup] ", result.message);
        return result;
    }

    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        result.error = BackupError::CopyFailed;
        result.message = "Cannot create backup directory " + dir_ + ": " + ec.message();
        LOG_ERROR("[Backup] ", result.message);
        return result;
    }
    writeReadme();

    BackupRecord rec;
    rec.originalPath = absolutePath(path);
    rec.timestamp = makeTimestamp();
    rec.size = *sourceSize;

    // Pick a free name: <file>.<ts>.bak, then <file>.<ts>-1.bak, ...
    // Bos bir ad sec: <file>.<ts>.bak, sonra <file>.<ts>-1.bak, ...
    const std::string base = fs::path(path).filename().string() + "." + rec.timestamp;
    for (unsigned seq = 0;; ++seq) {
        std::string name = seq == 0 ? base + ".bak" : base + "-" + std::to_string(seq) + ".bak";
        fs::path candidate = fs::path(dir_) / name;
        if (!fs::exists(candidate, ec)) {
            rec.backupPath = candidate.string();
            rec.sequence = seq;
            break;
        }
    }

    if (!FileSystem::copyFile(path, rec.backupPath)) {
        result.error = BackupError::CopyFailed;
        result.message = "Copy failed: " + path + " -> " + rec.backupPath;
        LOG_ERROR("[Backup] ", result.message);
        return result;
    }

    // Verify: size first, then full byte comparison
    // Dogrula: once boyut, sonra tam bayt karsilastirmasi
    auto backupSize = FileSystem::fileSize(rec.backupPath);
    if (!backupSize || *backupSize != rec.size || !FileSystem::filesEqual(path, rec.backupPath)) {
        FileSystem::deleteFile(rec.backupPath);
        result.error = BackupError::VerificationFailed;
        result.message = "Backup verification failed for " + rec.backupPath;
        LOG_ERROR("[Backup] ", result.message);
        return result;
    }

    if (!writeSidecar(rec)) {
        LOG_WARN("[Backup] Sidecar not written for ", rec.backupPath, ", record rebuilt from name on list");
    }

    result.success = true;
    result.record = rec;
    result.message = "Backup created: " + rec.backupPath;
    LOG_INFO("[Backup] ", rec.originalPath, " -> ", rec.backupPath, " (", rec.size, " bytes, verified)");
    return result;
}

// Enumerate *.bak snapshots, newest first
// *.bak anlik goruntulerini listele, en yeni once
std::vector<BackupRecord> BackupManager::list() const {
    std::vector<BackupRecord> records;
    std::error_code ec;
    if (!fs::is_directory(dir_, ec)) return records;

    for (const auto& entry : fs::directory_iterator(dir_, ec)) {
        if (!entry.is_regular_file(ec) || entry.path().extension() != ".bak") continue;
        std::string path = entry.path().string();

        auto rec = readSidecar(path);
        if (!rec) rec = recordFromName(path);
        if (!rec) {
            LOG_DEBUG("[Backup] Ignoring unrecognized file: ", path);
            continue;
        }
        records.push_back(*rec);
    }

    std::sort(records.begin(), records.end(), [](const BackupRecord& a, const BackupRecord& b) {
        if (a.timestamp != b.timestamp) return a.timestamp > b.timestamp;
        if (a.sequence != b.sequence) return a.sequence > b.sequence;
        return a.backupPath > b.backupPath;
    });
    return records;
}

std::optional<BackupRecord> BackupManager::latest(const std::string& originalPath) const {
    const std::string wanted = absolutePath(originalPath);
    const std::string wantedName = fs::path(originalPath).filename().string();

    for (const auto& rec : list()) {
        if (rec.originalPath == wanted) return rec;
        // Sidecar-less records only know the file name
        // Yan dosyasi olmayan kayitlar yalnizca dosya adini bilir
        if (!fs::path(rec.originalPath).has_parent_path() && rec.originalPath == wantedName) return rec;
    }
    return std::nullopt;
}

std::optional<BackupRecord> BackupManager::findByPath(const std::string& backupPath) const {
    const std::string wanted = absolutePath(backupPath);
    for (const auto& rec : list()) {
        if (absolutePath(rec.backupPath) == wanted) return rec;
    }
    return std::nullopt;
}

// Restore through an atomic copy; failure is reported, the snapshot stays
// Atomik bir kopya ile geri yukle; hata bildirilir, anlik goruntu kalir
FileResult BackupManager::restore(const BackupRecord& record, const std::string& targetPath) const {
    if (!FileSystem::exists(record.backupPath)) {
        FileResult missing{false, "Backup file missing: " + record.backupPath, 0};
        LOG_ERROR("[Backup] ", missing.message);
        return missing;
    }

    FileResult result = FileSystem::copyFileAtomic(record.backupPath, targetPath);
    if (result.success) {
        result.message = "Restored " + targetPath + " from " + record.backupPath;
        LOG_INFO("[Backup] ", result.message);
    } else {
        LOG_ERROR("[Backup] Restore failed: ", result.message, " (backup kept at ", record.backupPath, ")");
    }
    return result;
}

bool BackupManager::remove(const BackupRecord& record) {
    bool removed = FileSystem::deleteFile(record.backupPath);
    std::string sidecar = record.backupPath + ".json";
    if (FileSystem::exists(sidecar)) {
        FileSystem::deleteFile(sidecar);
    }
    if (removed) {
        LOG_INFO("[Backup] Removed ", record.backupPath);
    }
    return removed;
}

bool BackupManager::writeSidecar(const BackupRecord& record) const {
    json j = {
        {"original", record.originalPath},
        {"backup", fs::path(record.backupPath).filename().string()},
        {"timestamp", record.timestamp},
        {"size", record.size},
        {"sequence", record.sequence}
    };
    FileResult res = FileSystem::saveAtomic(record.backupPath + ".json", j.dump(2) + "\n");
    return res.success;
}

std::optional<BackupRecord> BackupManager::readSidecar(const std::string& backupPath) const {
    auto bytes = FileSystem::loadBytes(backupPath + ".json");
    if (!bytes) return std::nullopt;

    try {
        json j = json::parse(*bytes);
        BackupRecord rec;
        rec.backupPath = backupPath;
        rec.originalPath = j.value("original", "");
        rec.timestamp = j.value("timestamp", "");
        rec.size = j.value("size", static_cast<uintmax_t>(0));
        rec.sequence = j.value("sequence", 0u);
        if (rec.originalPath.empty() || rec.timestamp.empty()) return std::nullopt;
        return rec;
    } catch (const json::exception& e) {
        LOG_WARN("[Backup] Bad sidecar for ", backupPath, ": ", e.what());
        return std::nullopt;
    }
}

// Parse "<filename>.<YYYYMMDD_HHMMSS_mmm>[-N].bak"
// "<filename>.<YYYYMMDD_HHMMSS_mmm>[-N].bak" bicimini ayristir
std::optional<BackupRecord> BackupManager::recordFromName(const std::string& backupPath) {
    std::string stem = fs::path(backupPath).stem().string();
    size_t dot = stem.rfind('.');
    if (dot == std::string::npos || dot == 0) return std::nullopt;

    std::string stamp = stem.substr(dot + 1);
    unsigned seq = 0;
    size_t dash = stamp.find('-');
    if (dash != std::string::npos) {
        try {
            seq = static_cast<unsigned>(std::stoul(stamp.substr(dash + 1)));
        } catch (const std::exception&) {
            return std::nullopt;
        }
        stamp = stamp.substr(0, dash);
    }
    if (stamp.size() != 19 || stamp[8] != '_' || stamp[15] != '_') return std::nullopt;
    if (!std::all_of(stamp.begin(), stamp.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)) || c == '_'; })) {
        return std::nullopt;
    }

    BackupRecord rec;
    rec.originalPath = stem.substr(0, dot);
    rec.backupPath = backupPath;
    rec.timestamp = stamp;
    rec.sequence = seq;
    rec.size = FileSystem::fileSize(backupPath).value_or(0);
    return rec;
}

void BackupManager::writeReadme() const {
    fs::path readme = fs::path(dir_) / "README.txt";
    std::error_code ec;
    if (fs::exists(readme, ec)) return;

    std::ostringstream body;
    body << "bundleloc backups\n"
         << "=================\n\n"
         << "Each <name>.<YYYYMMDD_HHMMSS_mmm>.bak file is a byte-identical copy of the\n"
         << "bundle taken right before it was rewritten. The matching .bak.json file\n"
         << "records the original path.\n\n"
         << "Restore with:\n"
         << "  bundleloc --mode=restore --bundle=<original path> [--backup=<file.bak>]\n\n"
         << "or copy the .bak file over the original by hand.\n";
    FileResult res = FileSystem::saveAtomic(readme.string(), body.str());
    if (!res.success) {
        LOG_WARN("[Backup] Could not write ", readme.string(), ": ", res.message);
    }
}

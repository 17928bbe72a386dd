// bundleloc — No impositions.
// Copyright (c) 2025 Berk Coşar <lookmainpoint@gmail.com>
// Licensed under the GNU Affero General Public License v3.0.
// See LICENSE file in the project root for full license text.

#pragma once
#include "file.h"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

// One immutable pre-mutation snapshot
// Degisiklik oncesi tek bir degismez anlik goruntu
struct BackupRecord {
    std::string originalPath;   // File that was backed up / Yedeklenen dosya
    std::string backupPath;     // Snapshot location / Anlik goruntu konumu
    std::string timestamp;      // YYYYMMDD_HHMMSS_mmm, sortable / siralanabilir
    uintmax_t size = 0;         // Bytes at backup time / Yedekleme anindaki bayt
    unsigned sequence = 0;      // Collision counter within one timestamp / Ayni zaman damgasinda cakisma sayaci
};

// Why a backup failed
// Bir yedeklemenin neden basarisiz oldugu
enum class BackupError { None, SourceMissing, CopyFailed, VerificationFailed };

struct BackupResult {
    bool success = false;
    BackupRecord record;
    BackupError error = BackupError::None;
    std::string message;
};

// Timestamped, verified, append-only snapshots of files about to be mutated.
// Degistirilmek uzere olan dosyalarin zaman damgali, dogrulanmis, yalnizca eklemeli anlik goruntuleri.
// Layout: <dir>/<filename>.<YYYYMMDD_HHMMSS_mmm>[-N].bak plus a <...>.bak.json sidecar.
// Duzen: <dir>/<filename>.<YYYYMMDD_HHMMSS_mmm>[-N].bak ve bir <...>.bak.json yan dosyasi.
class BackupManager {
public:
    explicit BackupManager(std::string directory);

    // Copy path byte-for-byte into the backup dir and verify size + content
    // path'i bayt bayt yedek dizinine kopyala ve boyut + icerigi dogrula
    BackupResult backup(const std::string& path);

    // All records, most recent first
    // Tum kayitlar, en yeni once
    std::vector<BackupRecord> list() const;

    // Most recent record for an original file
    // Bir orijinal dosya icin en yeni kayit
    std::optional<BackupRecord> latest(const std::string& originalPath) const;

    // Copy a snapshot back over targetPath; the snapshot is never removed
    // Bir anlik goruntuyu targetPath uzerine geri kopyala; anlik goruntu asla silinmez
    FileResult restore(const BackupRecord& record, const std::string& targetPath) const;

    // Explicit user action: delete a snapshot and its sidecar
    // Acik kullanici eylemi: bir anlik goruntuyu ve yan dosyasini sil
    bool remove(const BackupRecord& record);

    // Find a record by its snapshot path
    // Anlik goruntu yoluyla bir kayit bul
    std::optional<BackupRecord> findByPath(const std::string& backupPath) const;

    const std::string& directory() const { return dir_; }

    // Current local time as YYYYMMDD_HHMMSS_mmm
    // Mevcut yerel zaman YYYYMMDD_HHMMSS_mmm olarak
    static std::string makeTimestamp();

private:
    bool writeSidecar(const BackupRecord& record) const;
    std::optional<BackupRecord> readSidecar(const std::string& backupPath) const;

    // Rebuild a record from the snapshot file name when the sidecar is missing
    // Yan dosya yoksa kaydi anlik goruntu dosya adindan yeniden olustur
    static std::optional<BackupRecord> recordFromName(const std::string& backupPath);

    // Write README.txt with manual restore instructions (once)
    // Elle geri yukleme talimatlari iceren README.txt yaz (bir kez)
    void writeReadme() const;

    std::string dir_;
};

// bundleloc — No impositions.
// Copyright (c) 2025 Berk Coşar <lookmainpoint@gmail.com>
// Licensed under the GNU Affero General Public License v3.0.
// See LICENSE file in the project root for full license text.

#pragma once
#include "BackupManager.h"
#include "EncodingDetector.h"
#include "TranslationStore.h"
#include "Translator.h"
#include "nlohmann/json.hpp"
#include <string>
#include <vector>
#include <memory>
#include <optional>

using json = nlohmann::json;

// Stages of one translate run. Nothing touches the bundle before BackingUp succeeds.
// Tek bir ceviri calismasinin asamalari. BackingUp basarili olmadan bundle'a dokunulmaz.
enum class PipelineStage {
    Idle, Extracting, Diffing, Translating, Merging,
    BackingUp, Substituting, Writing, Done, Aborted
};

// Error classes a run can end with
// Bir calismanin bitebilecegi hata siniflari
enum class ErrorKind {
    None,
    PathNotFound,
    DecodeError,
    StoreCorrupt,
    ProviderError,
    BackupVerificationError,
    WriteError,
    InvalidArgument
};

// Already-validated inputs for a run
// Bir calisma icin onceden dogrulanmis girdiler
struct PipelineOptions {
    std::string bundlePath;
    std::string language = "ko";
    std::string apiKey;              // Empty = fallback dictionary / Bos = yedek sozluk
    std::string storeDir;
    std::string backupDir;
    std::string dictionaryDir;
    std::string extractOutput;       // Strings artifact for extract mode / extract modu icin dizgi ciktisi
    std::string restoreFrom;         // Explicit backup for restore mode / restore modu icin acik yedek
    bool skipBackup = false;
    bool dryRun = false;
    bool prune = false;
    int chunkSize = 50;
    int timeoutSec = 30;
    bool verify = true;
    size_t minKeyLength = 3;
};

// What a run did, reported even when it aborts
// Bir calismanin yaptiklari, iptal edilse bile raporlanir
struct PipelineReport {
    PipelineStage stage = PipelineStage::Idle;
    ErrorKind error = ErrorKind::None;
    std::string message;

    size_t candidates = 0;
    size_t untranslated = 0;
    size_t translated = 0;
    size_t failedChunks = 0;
    size_t changed = 0;          // Store entries merged / Birlestirilen depo girdileri
    size_t pruned = 0;
    size_t seeded = 0;
    size_t keysApplied = 0;
    size_t occurrencesReplaced = 0;
    bool storeCorrupt = false;
    bool decodedWithFallback = false;
    std::string translatorName;
    std::optional<BackupRecord> backup;

    bool ok() const { return error == ErrorKind::None; }

    // "X of Y strings translated"
    std::string summary() const;

    json toJson() const;
};

const char* stageName(PipelineStage stage);
const char* errorKindName(ErrorKind kind);

// Runs the extract -> merge -> substitute pipeline and the backup-based modes.
// Cikar -> birlestir -> degistir hattini ve yedek tabanli modlari calistirir.
class BundleLocalizer {
public:
    explicit BundleLocalizer(PipelineOptions options);

    // Use a ready translator instead of Translator::create (tests, offline runs)
    // Translator::create yerine hazir bir cevirmen kullan (testler, cevrimdisi calismalar)
    void setTranslator(std::unique_ptr<Translator> translator);

    // Transport handed to Translator::create when no translator was set
    // Cevirmen ayarlanmadiysa Translator::create'e verilen tasima
    void setTransport(std::shared_ptr<ProviderTransport> transport);

    // Decode, extract, write the artifact and seed pending keys; never writes the bundle
    // Coz, cikar, ciktiyi yaz ve bekleyen anahtarlari ekle; bundle'a asla yazmaz
    PipelineReport runExtract();

    // Full state machine up to the atomic rewrite of the bundle
    // Bundle'in atomik yeniden yazimina kadar tam durum makinesi
    PipelineReport runTranslate();

    // Copy the latest (or the given) backup over the bundle
    // En son (veya verilen) yedegi bundle uzerine kopyala
    PipelineReport runRestore();

    // Backup records, most recent first
    // Yedek kayitlari, en yeni once
    std::vector<BackupRecord> listBackups() const;

    // Store statistics, backup count and bundle presence
    // Depo istatistikleri, yedek sayisi ve bundle varligi
    json status() const;

    PipelineStage stage() const { return stage_; }
    const PipelineOptions& options() const { return options_; }

private:
    // Checks shared by every mode before any I/O
    // Her modun herhangi bir G/C oncesi ortak kontrolleri
    bool validate(PipelineReport& report, bool needsLanguage);

    // Read and decode the bundle (DecodeError / PathNotFound on failure)
    // Bundle'i oku ve coz (basarisizlikta DecodeError / PathNotFound)
    bool loadBundle(PipelineReport& report, DecodedText& out);

    // Load the language store; corrupt files are kept aside and treated as empty
    // Dil deposunu yukle; bozuk dosyalar kenara alinir ve bos sayilir
    TranslationStore loadStore(PipelineReport& report) const;

    bool saveStore(const TranslationStore& store) const;

    Translator* translator(PipelineReport& report);

    void enter(PipelineStage stage, PipelineReport& report);
    PipelineReport& abort(PipelineReport& report, ErrorKind kind, const std::string& message);

    std::string storePath() const;

    PipelineOptions options_;
    PipelineStage stage_ = PipelineStage::Idle;
    std::unique_ptr<Translator> translator_;
    std::shared_ptr<ProviderTransport> transport_;
};

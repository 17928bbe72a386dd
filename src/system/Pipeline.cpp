// bundleloc — No impositions.
// Copyright (c) 2025 Berk Coşar <lookmainpoint@gmail.com>
// Licensed under the GNU Affero General Public License v3.0.
// See LICENSE file in the project root for full license text.

#include "Pipeline.h"
#include "EncodingDetector.h"
#include "LiteralExtractor.h"
#include "SubstitutionEngine.h"
#include "ProviderTransport.h"
#include "file.h"
#include "Logger.h"
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

const char* stageName(PipelineStage stage) {
    switch (stage) {
        case PipelineStage::Idle:         return "idle";
        case PipelineStage::Extracting:   return "extracting";
        case PipelineStage::Diffing:      return "diffing";
        case PipelineStage::Translating:  return "translating";
        case PipelineStage::Merging:      return "merging";
        case PipelineStage::BackingUp:    return "backing-up";
        case PipelineStage::Substituting: return "substituting";
        case PipelineStage::Writing:      return "writing";
        case PipelineStage::Done:         return "done";
        case PipelineStage::Aborted:      return "aborted";
    }
    return "unknown";
}

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                    return "NONE";
        case ErrorKind::PathNotFound:            return "PATH_NOT_FOUND";
        case ErrorKind::DecodeError:             return "DECODE_ERROR";
        case ErrorKind::StoreCorrupt:            return "STORE_CORRUPT";
        case ErrorKind::ProviderError:           return "PROVIDER_ERROR";
        case ErrorKind::BackupVerificationError: return "BACKUP_VERIFICATION_ERROR";
        case ErrorKind::WriteError:              return "WRITE_ERROR";
        case ErrorKind::InvalidArgument:         return "INVALID_ARGUMENT";
    }
    return "UNKNOWN";
}

std::string PipelineReport::summary() const {
    return std::to_string(translated) + " of " + std::to_string(untranslated) + " strings translated";
}

json PipelineReport::toJson() const {
    json j = {
        {"stage", stageName(stage)},
        {"error", errorKindName(error)},
        {"message", message},
        {"summary", summary()},
        {"translator", translatorName},
        {"counts", {
            {"candidates", candidates},
            {"untranslated", untranslated},
            {"translated", translated},
            {"failedChunks", failedChunks},
            {"changed", changed},
            {"pruned", pruned},
            {"seeded", seeded},
            {"keysApplied", keysApplied},
            {"occurrencesReplaced", occurrencesReplaced}
        }},
        {"storeCorrupt", storeCorrupt},
        {"decodedWithFallback", decodedWithFallback},
        {"backup", nullptr}
    };
    if (backup) {
        j["backup"] = {
            {"original", backup->originalPath},
            {"backup", backup->backupPath},
            {"timestamp", backup->timestamp},
            {"size", backup->size}
        };
    }
    return j;
}

BundleLocalizer::BundleLocalizer(PipelineOptions options) : options_(std::move(options)) {}

void BundleLocalizer::setTranslator(std::unique_ptr<Translator> translator) {
    translator_ = std::move(translator);
}

void BundleLocalizer::setTransport(std::shared_ptr<ProviderTransport> transport) {
    transport_ = std::move(transport);
}

void BundleLocalizer::enter(PipelineStage stage, PipelineReport& report) {
    stage_ = stage;
    report.stage = stage;
    LOG_DEBUG("[Pipeline] -> ", stageName(stage));
}

PipelineReport& BundleLocalizer::abort(PipelineReport& report, ErrorKind kind, const std::string& message) {
    LOG_ERROR("[Pipeline] Aborted during ", stageName(report.stage), ": ", message);
    stage_ = PipelineStage::Aborted;
    report.stage = PipelineStage::Aborted;
    report.error = kind;
    report.message = message;
    return report;
}

std::string BundleLocalizer::storePath() const {
    return TranslationStore::pathFor(options_.storeDir, options_.language);
}

// Validate without touching the file system
// Dosya sistemine dokunmadan dogrula
bool BundleLocalizer::validate(PipelineReport& report, bool needsLanguage) {
    stage_ = PipelineStage::Idle;
    report.stage = PipelineStage::Idle;

    if (options_.bundlePath.empty()) {
        abort(report, ErrorKind::PathNotFound, "No bundle path given and none could be located");
        return false;
    }
    if (!needsLanguage) return true;

    const std::string& lang = options_.language;
    if (lang.empty()) {
        abort(report, ErrorKind::InvalidArgument, "Target language is empty");
        return false;
    }
    // The language names the store file, so keep it a plain token
    // Dil depo dosyasini adlandirir, bu yuzden duz bir belirtec olarak kalmali
    bool plain = std::all_of(lang.begin(), lang.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '-' || c == '_';
    });
    if (!plain) {
        abort(report, ErrorKind::InvalidArgument, "Invalid language code: " + lang);
        return false;
    }
    if (options_.storeDir.empty()) {
        abort(report, ErrorKind::InvalidArgument, "No store directory configured");
        return false;
    }
    return true;
}

bool BundleLocalizer::loadBundle(PipelineReport& report, DecodedText& out) {
    enter(PipelineStage::Extracting, report);

    if (!FileSystem::exists(options_.bundlePath)) {
        LOG_WARN("[Pipeline] Bundle not found, nothing to do: ", options_.bundlePath);
        abort(report, ErrorKind::PathNotFound, "Bundle not found: " + options_.bundlePath);
        return false;
    }

    auto bytes = FileSystem::loadBytes(options_.bundlePath);
    if (!bytes) {
        abort(report, ErrorKind::PathNotFound, "Cannot read bundle: " + options_.bundlePath);
        return false;
    }

    out = EncodingDetector::decode(*bytes);
    if (!out.ok) {
        abort(report, ErrorKind::DecodeError, "Cannot decode bundle: " + out.message);
        return false;
    }
    report.decodedWithFallback = out.usedFallback;
    if (out.usedFallback) {
        LOG_WARN("[Pipeline] Bundle is not valid UTF-8, decoded as ",
                 EncodingDetector::encodingName(out.encoding));
    }
    LOG_INFO("[Pipeline] Loaded bundle ", options_.bundlePath, " (", bytes->size(), " bytes, ",
             EncodingDetector::encodingName(out.encoding), ")");
    return true;
}

TranslationStore BundleLocalizer::loadStore(PipelineReport& report) const {
    const std::string path = storePath();
    StoreLoadResult loaded = TranslationStore::load(path);

    if (loaded.status == StoreStatus::Corrupt) {
        report.storeCorrupt = true;
        // Keep the unreadable file aside before it gets overwritten
        // Uzerine yazilmadan once okunamayan dosyayi kenara al
        std::string aside = path + ".corrupt-" + BackupManager::makeTimestamp();
        if (FileSystem::copyFile(path, aside)) {
            LOG_WARN("[Pipeline] Corrupt store kept as ", aside, ", continuing with an empty store");
        } else {
            LOG_WARN("[Pipeline] Corrupt store could not be copied aside, continuing with an empty store");
        }
    } else if (loaded.status == StoreStatus::NotFound) {
        LOG_INFO("[Pipeline] No store yet for '", options_.language, "', starting empty");
    }
    return std::move(loaded.store);
}

bool BundleLocalizer::saveStore(const TranslationStore& store) const {
    FileResult res = store.save(storePath());
    if (!res.success) {
        LOG_ERROR("[Pipeline] Store not saved: ", res.message);
        return false;
    }
    LOG_INFO("[Pipeline] Store saved: ", storePath(), " (", store.size(), " entries)");
    return true;
}

Translator* BundleLocalizer::translator(PipelineReport& report) {
    if (!translator_) {
        TranslatorOptions opts;
        opts.apiKey = options_.apiKey;
        opts.language = options_.language;
        opts.dictionaryDir = options_.dictionaryDir;
        opts.chunkSize = options_.chunkSize;
        opts.timeoutSec = options_.timeoutSec;
        opts.verify = options_.verify;
        translator_ = Translator::create(opts, transport_);
    }
    report.translatorName = translator_->name();
    return translator_.get();
}

PipelineReport BundleLocalizer::runExtract() {
    PipelineReport report;
    if (!validate(report, true)) return report;

    DecodedText decoded;
    if (!loadBundle(report, decoded)) return report;

    LiteralExtractor extractor;
    std::vector<std::string> extracted = extractor.extract(decoded.text);
    report.candidates = extracted.size();

    if (!options_.extractOutput.empty()) {
        FileResult written = LiteralExtractor::writeArtifact(extracted, options_.extractOutput);
        if (!written.success) {
            return abort(report, ErrorKind::WriteError, "Cannot write strings artifact: " + written.message);
        }
    }

    enter(PipelineStage::Diffing, report);
    TranslationStore store = loadStore(report);
    std::vector<std::string> candidates = store.withoutTranslatedValues(extracted);
    report.untranslated = store.diffUntranslated(candidates).size();
    if (options_.prune) report.pruned = store.prune(candidates);
    report.seeded = store.seedPending(candidates);

    enter(PipelineStage::Merging, report);
    if (report.seeded > 0 || report.pruned > 0 || report.storeCorrupt) {
        if (!saveStore(store)) {
            return abort(report, ErrorKind::WriteError, "Cannot save store " + storePath());
        }
    }

    enter(PipelineStage::Done, report);
    report.message = "Extracted " + std::to_string(report.candidates) + " strings, "
                   + std::to_string(report.seeded) + " new pending keys";
    LOG_INFO("[Pipeline] ", report.message);
    return report;
}

PipelineReport BundleLocalizer::runTranslate() {
    PipelineReport report;
    if (!validate(report, true)) return report;

    Translator* tr = translator(report);
    if (!tr->supports(options_.language)) {
        return abort(report, ErrorKind::InvalidArgument,
                     "Language '" + options_.language + "' is not supported by " + tr->name()
                     + " (add a dictionary file or a provider key)");
    }
    if (options_.backupDir.empty() && !options_.skipBackup && !options_.dryRun) {
        return abort(report, ErrorKind::InvalidArgument, "No backup directory configured");
    }

    // Extracting
    DecodedText decoded;
    if (!loadBundle(report, decoded)) return report;

    LiteralExtractor extractor;
    std::vector<std::string> extracted = extractor.extract(decoded.text);
    report.candidates = extracted.size();

    // Diffing
    enter(PipelineStage::Diffing, report);
    TranslationStore store = loadStore(report);
    std::vector<std::string> candidates = store.withoutTranslatedValues(extracted);
    if (candidates.size() < extracted.size()) {
        LOG_DEBUG("[Pipeline] ", extracted.size() - candidates.size(), " literals are existing translations");
    }
    if (options_.prune) report.pruned = store.prune(candidates);
    std::vector<std::string> pending = store.diffUntranslated(candidates);
    report.untranslated = pending.size();
    LOG_INFO("[Pipeline] ", candidates.size(), " candidates, ", pending.size(), " need translation");

    // Translating
    enter(PipelineStage::Translating, report);
    TranslationOutcome outcome;
    if (!pending.empty()) {
        outcome = tr->translateDetailed(pending, options_.language);
    }
    report.translated = outcome.translatedCount();
    report.failedChunks = outcome.failedChunks;
    if (outcome.failedChunks > 0) {
        LOG_WARN("[Pipeline] ", outcome.failedChunks, " chunks failed, their strings stay pending");
    }

    // Merging: only real translations, passthroughs stay pending
    // Birlestirme: yalnizca gercek ceviriler, gecisler beklemede kalir
    enter(PipelineStage::Merging, report);
    TranslationStore::Entries incoming;
    std::vector<std::string> stillPending;
    for (size_t i = 0; i < pending.size() && i < outcome.texts.size(); ++i) {
        if (outcome.translated[i]) {
            incoming.emplace(pending[i], outcome.texts[i]);
        } else {
            stillPending.push_back(pending[i]);
        }
    }
    report.changed = store.merge(incoming);
    report.seeded = store.seedPending(stillPending);

    if (report.changed > 0 || report.seeded > 0 || report.pruned > 0 || report.storeCorrupt) {
        if (!saveStore(store)) {
            return abort(report, ErrorKind::WriteError, "Cannot save store " + storePath());
        }
    }

    SubstitutionEngine engine(options_.minKeyLength);

    if (options_.dryRun) {
        SubstitutionOutput preview = engine.apply(decoded.text, store);
        report.keysApplied = preview.result.keysApplied;
        report.occurrencesReplaced = preview.result.occurrencesReplaced;
        enter(PipelineStage::Done, report);
        report.message = "Dry run: " + report.summary() + ", "
                       + std::to_string(report.occurrencesReplaced) + " literals would change";
        LOG_INFO("[Pipeline] ", report.message);
        return report;
    }

    // BackingUp
    enter(PipelineStage::BackingUp, report);
    if (options_.skipBackup) {
        LOG_WARN("[Pipeline] Backup skipped on request, the bundle will be rewritten without a snapshot");
    } else {
        BackupManager backups(options_.backupDir);
        BackupResult snap = backups.backup(options_.bundlePath);
        if (!snap.success) {
            return abort(report, ErrorKind::BackupVerificationError, snap.message);
        }
        report.backup = snap.record;
    }

    // Substituting
    enter(PipelineStage::Substituting, report);
    SubstitutionOutput rewritten = engine.apply(decoded.text, store);
    report.keysApplied = rewritten.result.keysApplied;
    report.occurrencesReplaced = rewritten.result.occurrencesReplaced;

    // Writing
    enter(PipelineStage::Writing, report);
    if (report.occurrencesReplaced == 0) {
        LOG_INFO("[Pipeline] Bundle unchanged, nothing written");
    } else {
        std::string bytes = EncodingDetector::encodeForWrite(rewritten.text, decoded.encoding);
        FileResult written = FileSystem::saveAtomic(options_.bundlePath, bytes);
        if (!written.success) {
            std::string msg = "Cannot write bundle: " + written.message;
            if (report.backup) msg += " (original intact, backup at " + report.backup->backupPath + ")";
            return abort(report, ErrorKind::WriteError, msg);
        }
        LOG_INFO("[Pipeline] Bundle written: ", options_.bundlePath, " (", written.bytes, " bytes)");
    }

    enter(PipelineStage::Done, report);
    report.message = report.summary() + ", " + std::to_string(report.keysApplied) + " keys applied, "
                   + std::to_string(report.occurrencesReplaced) + " literals replaced";
    LOG_INFO("[Pipeline] ", report.message);
    return report;
}

PipelineReport BundleLocalizer::runRestore() {
    PipelineReport report;
    if (!validate(report, false)) return report;
    if (options_.backupDir.empty() && options_.restoreFrom.empty()) {
        return abort(report, ErrorKind::InvalidArgument, "No backup directory configured");
    }

    BackupManager backups(options_.backupDir);
    std::optional<BackupRecord> record;
    if (!options_.restoreFrom.empty()) {
        record = backups.findByPath(options_.restoreFrom);
        if (!record && FileSystem::exists(options_.restoreFrom)) {
            // A snapshot outside the backup directory
            // Yedek dizini disindaki bir anlik goruntu
            BackupRecord external;
            external.originalPath = options_.bundlePath;
            external.backupPath = options_.restoreFrom;
            external.size = FileSystem::fileSize(options_.restoreFrom).value_or(0);
            record = external;
        }
    } else {
        record = backups.latest(options_.bundlePath);
    }

    if (!record) {
        return abort(report, ErrorKind::PathNotFound, "No backup found for " + options_.bundlePath);
    }
    report.backup = record;

    enter(PipelineStage::Writing, report);
    FileResult res = backups.restore(*record, options_.bundlePath);
    if (!res.success) {
        return abort(report, ErrorKind::WriteError, res.message);
    }

    enter(PipelineStage::Done, report);
    report.message = res.message;
    return report;
}

std::vector<BackupRecord> BundleLocalizer::listBackups() const {
    if (options_.backupDir.empty()) return {};
    return BackupManager(options_.backupDir).list();
}

json BundleLocalizer::status() const {
    json j;
    j["language"] = options_.language;

    json storeInfo = {{"path", nullptr}};
    if (!options_.storeDir.empty() && !options_.language.empty()) {
        StoreLoadResult loaded = TranslationStore::load(storePath());
        StoreStats st = loaded.store.stats();
        storeInfo = {
            {"path", storePath()},
            {"state", loaded.status == StoreStatus::Ok ? "ok"
                    : loaded.status == StoreStatus::NotFound ? "missing" : "corrupt"},
            {"total", st.total},
            {"translated", st.translated},
            {"pending", st.pending},
            {"percent", st.percent}
        };
    }
    j["store"] = storeInfo;

    auto records = listBackups();
    j["backups"] = {
        {"dir", options_.backupDir},
        {"count", records.size()},
        {"latest", records.empty() ? json(nullptr) : json(records.front().backupPath)}
    };

    j["bundle"] = {
        {"path", options_.bundlePath},
        {"exists", !options_.bundlePath.empty() && FileSystem::exists(options_.bundlePath)}
    };
    return j;
}

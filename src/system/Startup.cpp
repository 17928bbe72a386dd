// bundleloc — No impositions.
// Copyright (c) 2025 Berk Coşar <lookmainpoint@gmail.com>
// Licensed under the GNU Affero General Public License v3.0.
// See LICENSE file in the project root for full license text.

#include "Startup.h"
#include "BundlelocPaths.h"
#include "BundleLocator.h"
#include "PathCache.h"
#include "ApiResponse.h"
#include "Logger.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>

bool LoadConfiguration(Config& config, int argc, char* argv[], std::string* error) {
    auto& paths = bundleloc::BundlelocPaths::instance();
    config.loadFile(paths.appConfigFile());     // app defaults / uygulama varsayilanlari
    config.loadFile(paths.userConfigFile());    // user override / kullanici gecersiz kilma
    return config.applyCliArgs(argc, argv, error);  // CLI highest priority / CLI en yuksek oncelik
}

void InitEnvironment(const Config& config) {
    auto& paths = bundleloc::BundlelocPaths::instance();

    Logger::instance().setLevel(Logger::parseLevel(config.getString("log.level", "info")));
    Logger::instance().setStderrOnly(config.getBool("json", false));

    paths.ensureStructure();
    if (config.getBool("log.file", false)) {
        std::string logDir = config.getString("log.path", "");
        logDir = logDir.empty() ? paths.logsDir() : paths.expandHome(logDir);
        if (!Logger::instance().enableFileLog(logDir)) {
            LOG_WARN("[bundleloc] File logging unavailable in ", logDir);
        }
    }

    LOG_DEBUG("[bundleloc] App root: ", paths.appRoot);
    LOG_DEBUG("[bundleloc] User runtime: ", paths.userBundleloc);
}

std::string ResolveCredential(const Config& config) {
    std::string key = config.getString("translation.api_key", "");
    if (!key.empty()) return key;

    for (const char* var : {"BUNDLELOC_DEEPL_KEY", "DEEPL_API_KEY"}) {
        const char* value = std::getenv(var);
        if (value && *value) {
            LOG_DEBUG("[Config] Provider key taken from ", var);
            return value;
        }
    }
    return "";
}

PipelineOptions BuildPipelineOptions(const Config& config) {
    auto& paths = bundleloc::BundlelocPaths::instance();
    auto dirOr = [&](const std::string& key, const std::string& fallback) {
        std::string value = config.getString(key, "");
        return value.empty() ? fallback : paths.expandHome(value);
    };

    PipelineOptions opts;
    opts.language = config.getString("translation.language", "ko");
    std::transform(opts.language.begin(), opts.language.end(), opts.language.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    opts.apiKey        = ResolveCredential(config);
    opts.storeDir      = dirOr("store.dir", paths.storesDir());
    opts.backupDir     = dirOr("backup.dir", paths.backupsDir());
    opts.dictionaryDir = dirOr("dictionary.dir", paths.dictionariesDir());
    opts.extractOutput = dirOr("extract.output", "");
    opts.restoreFrom   = dirOr("backup.restore_from", "");
    opts.skipBackup    = !config.getBool("backup.enabled", true);
    opts.dryRun        = config.getBool("dry_run", false);
    opts.prune         = config.getBool("store.prune", false);
    opts.chunkSize     = config.getInt("translation.chunk_size", 50);
    opts.timeoutSec    = config.getInt("translation.timeout_sec", 30);
    opts.verify         = config.getBool("translation.verify", true);
    opts.minKeyLength  = static_cast<size_t>(std::max(1, config.getInt("substitute.min_key_length", 3)));

    // Locate the bundle: explicit path, environment, cache, known installs, search
    // Bundle'i bul: acik yol, ortam, onbellek, bilinen kurulumlar, arama
    PathCache cache(dirOr("cache.path", paths.cacheFile()));
    cache.load();

    LocatorOptions loc;
    loc.explicitPath = dirOr("bundle.path", "");
    for (const auto& root : config.getStringList("bundle.search_paths")) {
        loc.searchRoots.push_back(paths.expandHome(root));
    }

    BundleLocator locator(loc, &cache);
    if (auto found = locator.locate()) {
        opts.bundlePath = *found;
    } else {
        // Keep the explicit path so the pipeline reports it as missing
        // Hattin eksik olarak bildirmesi icin acik yolu koru
        opts.bundlePath = loc.explicitPath;
    }
    if (cache.dirty()) cache.save();
    return opts;
}

void RegisterModes(CommandRegistry& registry, BundleLocalizer& localizer) {
    auto envelope = [](const PipelineReport& report) {
        if (report.ok()) {
            return ApiResponse::ok(report.toJson(), nullptr, report.message);
        }
        return ApiResponse::error(errorKindName(report.error), report.message,
                                  {{"stage", stageName(report.stage)}}, report.toJson());
    };

    registry.registerQuery("extract", [&localizer, envelope](const json&) {
        return envelope(localizer.runExtract());
    }, "Extract candidate strings and seed pending store keys");

    registry.registerQuery("translate", [&localizer, envelope](const json&) {
        return envelope(localizer.runTranslate());
    }, "Translate pending keys, back up and rewrite the bundle");

    registry.registerQuery("restore", [&localizer, envelope](const json&) {
        return envelope(localizer.runRestore());
    }, "Restore the bundle from the latest or the given backup");

    registry.registerQuery("list-backups", [&localizer](const json&) {
        json list = json::array();
        for (const auto& rec : localizer.listBackups()) {
            list.push_back({
                {"original", rec.originalPath},
                {"backup", rec.backupPath},
                {"timestamp", rec.timestamp},
                {"size", rec.size}
            });
        }
        return ApiResponse::ok(list, {{"count", list.size()}});
    }, "List backups, most recent first");

    registry.registerQuery("status", [&localizer](const json&) {
        return ApiResponse::ok(localizer.status());
    }, "Show store progress, backups and bundle location");

    registry.registerQuery("modes", [&registry](const json&) {
        return registry.listAll();
    }, "List available modes");
}

int ExitCodeFor(const json& envelope) {
    if (envelope.value("ok", false)) return kExitOk;
    if (envelope.contains("error") && envelope["error"].is_object()) {
        std::string code = envelope["error"].value("code", "");
        if (code == errorKindName(ErrorKind::InvalidArgument) || code == "NOT_FOUND") {
            return kExitInvalidArgs;
        }
    }
    return kExitFatal;
}

// bundleloc — No impositions.
// Copyright (c) 2025 Berk Coşar <lookmainpoint@gmail.com>
// Licensed under the GNU Affero General Public License v3.0.
// See LICENSE file in the project root for full license text.

#include "Config.h"
#include "Pipeline.h"
#include "Startup.h"
#include "CommandRegistry.h"
#include "Logger.h"
#include <iostream>
#include <string>

static void printUsage() {
    std::cout <<
        "Usage: bundleloc [--mode=extract|translate|restore|list-backups|status|modes]\n"
        "                 [--bundle=PATH] [--lang=ko] [--api-key=KEY]\n"
        "                 [--no-backup] [--dry-run] [--prune] [--backup=FILE.bak]\n"
        "                 [--store-dir=DIR] [--backup-dir=DIR] [--dictionary-dir=DIR]\n"
        "                 [--output=FILE] [--chunk-size=N] [--timeout=SEC] [--no-verify]\n"
        "                 [--json] [--log-level=debug|info|warn|error] [--log-file]\n"
        "\n"
        "The provider key may also come from BUNDLELOC_DEEPL_KEY or DEEPL_API_KEY.\n"
        "Without a key the built-in dictionary is used.\n";
}

// Human-readable result for the terminal
// Terminal icin okunabilir sonuc
static void printResult(const std::string& mode, const json& result) {
    const json& data = result["data"];
    if (!result.value("ok", false)) {
        std::cerr << "bundleloc: " << result.value("message", std::string("failed")) << "\n";
        if (data.is_object() && data.contains("summary")) {
            std::cerr << "  " << data["summary"].get<std::string>() << "\n";
        }
        return;
    }

    if (mode == "translate" || mode == "extract" || mode == "restore") {
        if (mode == "translate") std::cout << data["summary"].get<std::string>() << "\n";
        std::cout << result.value("message", std::string()) << "\n";
        if (data.contains("backup") && data["backup"].is_object()) {
            std::cout << "Backup: " << data["backup"]["backup"].get<std::string>() << "\n";
        }
    } else if (mode == "list-backups") {
        if (data.empty()) std::cout << "No backups.\n";
        for (const auto& rec : data) {
            std::cout << rec["timestamp"].get<std::string>() << "  "
                      << rec["backup"].get<std::string>() << "  ("
                      << rec["size"].get<uintmax_t>() << " bytes)\n";
        }
    } else if (mode == "status") {
        const json& store = data["store"];
        std::cout << "Language: " << data["language"].get<std::string>() << "\n";
        if (store.contains("total")) {
            std::cout << "Store:    " << store["path"].get<std::string>() << " ("
                      << store["translated"].get<size_t>() << "/" << store["total"].get<size_t>()
                      << " translated, " << store["pending"].get<size_t>() << " pending)\n";
        }
        std::cout << "Bundle:   " << data["bundle"]["path"].get<std::string>()
                  << (data["bundle"]["exists"].get<bool>() ? "" : " (missing)") << "\n";
        std::cout << "Backups:  " << data["backups"]["count"].get<size_t>() << "\n";
    } else {
        std::cout << data.dump(2) << "\n";
    }
}

// bundleloc main entry point (one mode per invocation)
// bundleloc ana giris noktasi (cagri basina bir mod)
int main(int argc, char* argv[])
{
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage();
            return kExitOk;
        }
    }

    // Load config layers: hardcoded defaults -> app config -> user config -> CLI args
    // Config katmanlarini yukle: sabit varsayilanlar -> uygulama config -> kullanici config -> CLI argumanlar
    Config& config = Config::instance();
    std::string argError;
    if (!LoadConfiguration(config, argc, argv, &argError)) {
        std::cerr << "bundleloc: " << argError << "\n\n";
        printUsage();
        return kExitInvalidArgs;
    }

    try {
        InitEnvironment(config);

        const std::string mode = config.getString("mode", "translate");
        const bool asJson = config.getBool("json", false);

        BundleLocalizer localizer(BuildPipelineOptions(config));
        CommandRegistry registry;
        RegisterModes(registry, localizer);

        if (!registry.exists(mode)) {
            std::cerr << "bundleloc: unknown mode '" << mode << "'\n\n";
            printUsage();
            return kExitInvalidArgs;
        }

        LOG_INFO("[bundleloc] Mode: ", mode);
        json result = registry.executeWithResult(mode);

        if (asJson) {
            std::cout << result.dump(2) << "\n";
        } else {
            printResult(mode, result);
        }
        return ExitCodeFor(result);
    }
    catch (const std::exception& e) {
        LOG_ERROR("[bundleloc] Error: ", e.what());
        return kExitFatal;
    }
}

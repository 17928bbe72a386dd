// bundleloc — No impositions.
// Copyright (c) 2025 Berk Coşar <lookmainpoint@gmail.com>
// Licensed under the GNU Affero General Public License v3.0.
// See LICENSE file in the project root for full license text.

#pragma once
#include "Config.h"
#include "Pipeline.h"
#include "CommandRegistry.h"
#include <string>

// Process exit codes
// Surec cikis kodlari
constexpr int kExitOk = 0;
constexpr int kExitFatal = 1;
constexpr int kExitInvalidArgs = 2;

// Load config layers: app config -> user config -> CLI (false on a bad CLI argument)
// Config katmanlarini yukle: uygulama config -> kullanici config -> CLI (hatali CLI argumaninda false)
bool LoadConfiguration(Config& config, int argc, char* argv[], std::string* error = nullptr);

// Apply log.level and optional file logging, create ~/.bundleloc/
// log.level ve istege bagli dosya loglamayi uygula, ~/.bundleloc/ olustur
void InitEnvironment(const Config& config);

// Turn the merged config into validated pipeline inputs; locates the bundle if needed
// Birlestirilmis config'i dogrulanmis hat girdilerine donustur; gerekirse bundle'i bul
PipelineOptions BuildPipelineOptions(const Config& config);

// Provider credential: translation.api_key, then BUNDLELOC_DEEPL_KEY, then DEEPL_API_KEY
// Saglayici kimligi: translation.api_key, sonra BUNDLELOC_DEEPL_KEY, sonra DEEPL_API_KEY
std::string ResolveCredential(const Config& config);

// Register extract, translate, restore, list-backups, status and modes
// extract, translate, restore, list-backups, status ve modes komutlarini kaydet
void RegisterModes(CommandRegistry& registry, BundleLocalizer& localizer);

// Map a mode envelope to a process exit code
// Bir mod zarfini surec cikis koduna esle
int ExitCodeFor(const json& envelope);

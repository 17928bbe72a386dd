// bundleloc — No impositions.
// Copyright (c) 2025 Berk Coşar <lookmainpoint@gmail.com>
// Licensed under the GNU Affero General Public License v3.0.
// See LICENSE file in the project root for full license text.

#include "FallbackDictionary.h"
#include "file.h"
#include "Logger.h"
#include <filesystem>
#include <algorithm>

namespace fs = std::filesystem;

// Built-in Korean samples for common settings-page strings
// Yaygin ayar sayfasi dizeleri icin yerlesik Korece ornekler
FallbackDictionary FallbackDictionary::withBuiltins() {
    FallbackDictionary dict;
    dict.registerKeys("ko", json{
        {"A powerful Copilot replacement that can suggest changes across multiple lines.",
         "여러 줄에 걸쳐 변경 사항을 제안할 수 있는 강력한 Copilot 대체품입니다."},
        {"If on, none of your code will be stored by us.",
         "켜면 귀하의 코드는 저희 측에 저장되지 않습니다."},
        {"Enable or disable Cursor Tab suggestions in comments",
         "주석에서 Cursor Tab 제안 활성화 또는 비활성화"},
        {"Auto-scroll to bottom", "자동으로 맨 아래로 스크롤"},
        {"Allow Agent to run tools without asking for confirmation",
         "확인 요청 없이 에이전트가 도구를 실행하도록 허용"},
        {"Cursor Settings", "Cursor 설정"},
        {"Account", "계정"},
        {"Features", "기능"},
        {"Models", "모델"},
        {"Rules", "규칙"},
        {"General", "일반"},
        {"VS Code Import", "VS Code 가져오기"},
        {"Appearance", "외관"},
        {"Cursor Tab", "Cursor 탭"},
        {"Chat", "채팅"},
        {"Tab to import necessary dependencies", "탭으로 필요한 종속성 가져오기"},
        {"Command allowlist", "명령 허용 목록"},
        {"Delete file protection", "파일 삭제 보호"},
        {"Privacy mode", "개인 정보 보호 모드"},
        {"Enable auto-run mode", "자동 실행 모드 활성화"},
    });
    return dict;
}

// Load a JSON locale file and merge its keys into the translations map
// Bir JSON yerel ayar dosyasini yukle ve anahtarlarini ceviri haritasina birlestir
bool FallbackDictionary::loadLocaleFile(const std::string& locale, const std::string& path) {
    auto bytes = FileSystem::loadBytes(path);
    if (!bytes) {
        LOG_DEBUG("[Translate] Dictionary file not found: ", path);
        return false;
    }

    try {
        json j = json::parse(*bytes);
        if (!j.is_object()) {
            LOG_ERROR("[Translate] Dictionary file is not a JSON object: ", path);
            return false;
        }
        registerKeys(locale, j);
        LOG_INFO("[Translate] Loaded ", size(locale), " dictionary keys for '", locale, "' from ", path);
        return true;
    } catch (const json::exception& e) {
        LOG_ERROR("[Translate] Failed to parse dictionary file: ", path, " (", e.what(), ")");
        return false;
    }
}

// Scan a directory for <locale>.json files
// Bir dizini <locale>.json dosyalari icin tara
size_t FallbackDictionary::loadDirectory(const std::string& dir) {
    std::error_code ec;
    if (dir.empty() || !fs::is_directory(dir, ec)) return 0;

    size_t loaded = 0;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (!entry.is_regular_file(ec) || entry.path().extension() != ".json") continue;
        if (loadLocaleFile(entry.path().stem().string(), entry.path().string())) ++loaded;
    }
    if (ec) {
        LOG_WARN("[Translate] Dictionary scan of ", dir, " incomplete: ", ec.message());
    }
    return loaded;
}

void FallbackDictionary::registerKeys(const std::string& locale, const json& keys) {
    if (!keys.is_object()) return;

    auto& localeMap = translations_[locale];
    for (auto& [key, val] : keys.items()) {
        if (val.is_string() && !val.get_ref<const std::string&>().empty()) {
            localeMap[key] = val.get<std::string>();
        }
    }
}

std::optional<std::string> FallbackDictionary::lookup(const std::string& locale,
                                                      const std::string& key) const {
    auto locIt = translations_.find(locale);
    if (locIt == translations_.end()) return std::nullopt;
    auto keyIt = locIt->second.find(key);
    if (keyIt == locIt->second.end()) return std::nullopt;
    return keyIt->second;
}

bool FallbackDictionary::hasLocale(const std::string& locale) const {
    return translations_.count(locale) > 0;
}

// Return loaded locale identifiers, sorted
// Yuklenmis yerel ayar tanimlayicilarini sirali dondur
std::vector<std::string> FallbackDictionary::locales() const {
    std::vector<std::string> result;
    result.reserve(translations_.size());
    for (const auto& [loc, _] : translations_) {
        result.push_back(loc);
    }
    std::sort(result.begin(), result.end());
    return result;
}

size_t FallbackDictionary::size(const std::string& locale) const {
    auto it = translations_.find(locale);
    return it == translations_.end() ? 0 : it->second.size();
}

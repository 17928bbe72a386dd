// bundleloc — No impositions.
// Copyright (c) 2025 Berk Coşar <lookmainpoint@gmail.com>
// Licensed under the GNU Affero General Public License v3.0.
// See LICENSE file in the project root for full license text.

#pragma once
#include <string>
#include <unordered_map>
#include <optional>
#include <vector>
#include "nlohmann/json.hpp"

using json = nlohmann::json;

// Static per-language sample dictionary used when no live provider is usable.
// Canli saglayici kullanilamadiginda kullanilan statik dil basina ornek sozluk.
// Flat namespace: locale -> (source text -> translated text).
// Duz ad alani: yerel ayar -> (kaynak metin -> cevrilmis metin).
class FallbackDictionary {
public:
    FallbackDictionary() = default;

    // Dictionary preloaded with the built-in samples
    // Yerlesik orneklerle onceden yuklenmis sozluk
    static FallbackDictionary withBuiltins();

    // Load translations from a JSON object file for a given locale (merged over existing keys)
    // Belirli bir yerel ayar icin JSON nesne dosyasindan cevirileri yukle (mevcut anahtarlarin uzerine)
    bool loadLocaleFile(const std::string& locale, const std::string& path);

    // Load every <locale>.json in a directory, returns the number of files loaded
    // Bir dizindeki her <locale>.json dosyasini yukle, yuklenen dosya sayisini dondur
    size_t loadDirectory(const std::string& dir);

    // Register keys from a JSON object (string values only, empty values ignored)
    // Bir JSON nesnesinden anahtarlari kaydet (yalnizca string degerler, bos degerler yok sayilir)
    void registerKeys(const std::string& locale, const json& keys);

    // Look up a key in a locale, no fallback chain
    // Bir yerel ayarda anahtar ara, geri donus zinciri yok
    std::optional<std::string> lookup(const std::string& locale, const std::string& key) const;

    bool hasLocale(const std::string& locale) const;
    std::vector<std::string> locales() const;
    size_t size(const std::string& locale) const;

private:
    std::unordered_map<std::string,                                      // locale -> (key -> translation)
        std::unordered_map<std::string, std::string>> translations_;     // yerel ayar -> (anahtar -> ceviri)
};

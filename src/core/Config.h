// bundleloc — No impositions.
// Copyright (c) 2025 Berk Coşar <lookmainpoint@gmail.com>
// Licensed under the GNU Affero General Public License v3.0.
// See LICENSE file in the project root for full license text.

#pragma once
#include <string>
#include <vector>
#include <mutex>
#include "nlohmann/json.hpp"

using json = nlohmann::json;

// Layered JSONC configuration for a localizer run:
//   built-in defaults -> config.jsonc beside the binary -> ~/.bundleloc/config.jsonc -> CLI flags
// Bir yerellestirme calismasi icin katmanli JSONC yapilandirmasi:
//   yerlesik varsayilanlar -> ikili yanindaki config.jsonc -> ~/.bundleloc/config.jsonc -> CLI bayraklari
class Config {
public:
    // Singleton access
    // Tekil erisim
    static Config& instance();

    // Fresh instance holding only the hardcoded defaults (tests, tools)
    // Yalnizca sabit varsayilanlari tutan yeni ornek (testler, araclar)
    Config();

    // Load a JSONC file and deep-merge into current config.
    // Bir JSONC dosyasini yukle ve mevcut config'e derin birlestir.
    // Call multiple times for layered loading (app defaults first, then user override).
    // Katmanli yukleme icin birden fazla kez cagir (once uygulama varsayilanlari, sonra kullanici gecersiz kilma).
    bool loadFile(const std::string& path);

    // Apply CLI arguments as highest-priority overrides.
    // CLI argumanlarini en yuksek oncelikli gecersiz kilma olarak uygula.
    // Returns false and fills error on an unknown flag or a bad value.
    // Bilinmeyen bayrakta veya hatali degerde false dondurur ve error'u doldurur.
    bool applyCliArgs(int argc, char* argv[], std::string* error = nullptr);

    // Dot-notation accessors: "translation.language", "log.level", etc.
    // Nokta notasyonu erisimcileri: "translation.language", "log.level", vb.
    std::string getString(const std::string& key, const std::string& defaultVal = "") const;
    int         getInt(const std::string& key, int defaultVal = 0) const;
    bool        getBool(const std::string& key, bool defaultVal = false) const;
    std::vector<std::string> getStringList(const std::string& key) const;

    // Set a single dot-notation key, creating intermediate objects
    // Tek bir nokta notasyonu anahtarini ayarla, ara nesneleri olustur
    void set(const std::string& key, const json& value);

private:
    // Unlocked form of set()
    // set()'in kilitsiz bicimi
    void setLocked(const std::string& key, const json& value);

    // Strip // and /* */ comments from JSONC input, respecting string literals.
    // JSONC girdisinden // ve /* */ yorumlarini temizle, string literallere dokunma.
    static std::string stripComments(const std::string& input);

    // Recursively merge 'override' into 'base'. Override values win.
    // 'override'i 'base'e rekursif olarak birlestir. Override degerleri kazanir.
    static void deepMerge(json& base, const json& override);

    // Resolve a dot-notation key ("a.b.c") to a json pointer.
    // Nokta notasyonu anahtarini ("a.b.c") json pointer'a cozumle.
    const json* resolve(const std::string& key) const;

    static std::vector<std::string> splitKey(const std::string& key);

    mutable std::mutex mutex_;
    json data_;    // Merged config data / Birlestirilmis config verisi
};

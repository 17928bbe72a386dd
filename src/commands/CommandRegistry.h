// bundleloc — No impositions.
// Copyright (c) 2025 Berk Coşar <lookmainpoint@gmail.com>
// Licensed under the GNU Affero General Public License v3.0.
// See LICENSE file in the project root for full license text.

#pragma once
#include <string>
#include <unordered_map>
#include <functional>
#include <mutex>
#include <vector>
#include "nlohmann/json.hpp"

using json = nlohmann::json;

// Thread-safe registry that maps mode names (extract, translate, ...) to handlers.
// Mod adlarini (extract, translate, ...) isleyicilere eslestiren thread-safe kayit defteri.
// A handler returns JSON data or a complete ApiResponse envelope.
// Bir isleyici JSON verisi veya tam bir ApiResponse zarfi dondurur.
class CommandRegistry {
public:
    // Query command: runs a mode, returns JSON data or an envelope
    // Sorgu komutu: bir modu calistirir, JSON verisi veya zarf dondurur
    using QueryFn = std::function<json(const json&)>;

    // Register a query command with a unique name and a one-line description
    // Benzersiz bir isim ve tek satirlik aciklama ile sorgu komutu kaydet
    bool registerQuery(const std::string& name, QueryFn fn, const std::string& description = "");

    // Execute and return the result as an ApiResponse envelope
    // Calistir ve sonucu ApiResponse zarfi olarak dondur
    json executeWithResult(const std::string& name, const json& args = {});

    // Check if a query exists in the registry
    // Kayit defterinde bir sorgunun var olup olmadigini kontrol et
    bool exists(const std::string& name) const;

    // Sorted list of registered names
    // Kayitli adlarin sirali listesi
    std::vector<std::string> names() const;

    // All registered names with their descriptions
    // Tum kayitli adlar ve aciklamalari
    json listAll() const;

private:
    struct Entry {
        QueryFn fn;
        std::string description;
    };

    mutable std::mutex mutex_;                           // Thread safety lock / Thread guvenligi kilidi
    std::unordered_map<std::string, Entry> queries_;     // Query handlers / Sorgu isleyicileri
};

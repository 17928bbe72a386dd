// bundleloc — No impositions.
// Copyright (c) 2025 Berk Coşar <lookmainpoint@gmail.com>
// Licensed under the GNU Affero General Public License v3.0.
// See LICENSE file in the project root for full license text.

#include "CommandRegistry.h"
#include "ApiResponse.h"
#include "Logger.h"
#include <algorithm>

// Register a named query command that returns JSON data (thread-safe)
// JSON verisi donduren adlandirilmis bir sorgu komutunu kaydet (is parcacigi guvenli)
bool CommandRegistry::registerQuery(const std::string& name, QueryFn fn, const std::string& description) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queries_.contains(name)) {
        LOG_WARN("[Command] Query already registered: ", name);
        return false;
    }
    queries_[name] = Entry{std::move(fn), description};
    LOG_DEBUG("[Command] Registered query: ", name);
    return true;
}

// Execute a query and return the JSON result in standard ApiResponse format
// Sorguyu calistir ve standart ApiResponse formatinda JSON sonucunu dondur
json CommandRegistry::executeWithResult(const std::string& name, const json& args) {
    QueryFn fn;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = queries_.find(name);
        if (it != queries_.end()) {
            fn = it->second.fn;
        }
    }

    if (!fn) {
        LOG_ERROR("[Command] Unknown mode: ", name);
        return ApiResponse::error("NOT_FOUND", "Unknown mode: " + name, {{"name", name}});
    }

    try {
        json data = fn(args);
        if (ApiResponse::isEnvelope(data)) return data;
        return ApiResponse::ok(data);
    } catch (const std::exception& e) {
        LOG_ERROR("[Command] Query error in '", name, "': ", e.what());
        return ApiResponse::error("QUERY_ERROR", e.what(), {{"name", name}});
    }
}

// Check whether a query with the given name is registered
// Verilen isimde bir sorgunun kayitli olup olmadigini kontrol et
bool CommandRegistry::exists(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queries_.contains(name);
}

std::vector<std::string> CommandRegistry::names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(queries_.size());
    for (const auto& [name, _] : queries_) {
        out.push_back(name);
    }
    std::sort(out.begin(), out.end());
    return out;
}

// List all registered queries with their descriptions
// Tum kayitli sorgulari aciklamalariyla listele
json CommandRegistry::listAll() const {
    std::lock_guard<std::mutex> lock(mutex_);
    json result;
    json qrys = json::array();
    for (const auto& [name, entry] : queries_) {
        qrys.push_back({{"name", name}, {"description", entry.description}});
    }
    result["queries"] = qrys;
    result["total"] = queries_.size();
    return result;
}

// bundleloc — No impositions.
// Copyright (c) 2025 Berk Coşar <lookmainpoint@gmail.com>
// Licensed under the GNU Affero General Public License v3.0.
// See LICENSE file in the project root for full license text.

#include "PathCache.h"
#include "file.h"
#include "Logger.h"
#include "nlohmann/json.hpp"

using json = nlohmann::json;

PathCache::PathCache(std::string file) : file_(std::move(file)) {}

bool PathCache::load() {
    values_.clear();
    dirty_ = false;

    auto bytes = FileSystem::loadBytes(file_);
    if (!bytes) return false;

    try {
        json j = json::parse(*bytes);
        if (!j.is_object()) {
            LOG_WARN("[Locator] Cache is not a JSON object, ignoring: ", file_);
            return false;
        }
        for (auto& [key, val] : j.items()) {
            if (val.is_string()) values_[key] = val.get<std::string>();
        }
        return true;
    } catch (const json::exception& e) {
        LOG_WARN("[Locator] Cache unreadable, ignoring: ", file_, " (", e.what(), ")");
        return false;
    }
}

bool PathCache::save() {
    json j = json::object();
    for (const auto& [key, val] : values_) j[key] = val;

    FileResult res = FileSystem::saveAtomic(file_, j.dump(2) + "\n");
    if (!res.success) {
        LOG_WARN("[Locator] Cache not saved: ", res.message);
        return false;
    }
    dirty_ = false;
    return true;
}

std::optional<std::string> PathCache::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) return std::nullopt;
    return it->second;
}

void PathCache::set(const std::string& key, const std::string& value) {
    auto it = values_.find(key);
    if (it != values_.end() && it->second == value) return;
    values_[key] = value;
    dirty_ = true;
}

void PathCache::erase(const std::string& key) {
    if (values_.erase(key) > 0) dirty_ = true;
}

// bundleloc — No impositions.
// Copyright (c) 2025 Berk Coşar <lookmainpoint@gmail.com>
// Licensed under the GNU Affero General Public License v3.0.
// See LICENSE file in the project root for full license text.

#include "TranslationStore.h"
#include "EncodingDetector.h"
#include "Logger.h"
#include "nlohmann/json.hpp"
#include <filesystem>
#include <string_view>
#include <unordered_set>

using json = nlohmann::json;

TranslationStore::TranslationStore(Entries entries) : entries_(std::move(entries)) {}

// Load and parse a store file; missing -> NotFound, unparsable -> Corrupt (both empty)
// Bir depo dosyasini yukle ve ayristir; eksik -> NotFound, ayristirilamaz -> Corrupt (ikisi de bos)
StoreLoadResult TranslationStore::load(const std::string& path) {
    StoreLoadResult result;

    if (!FileSystem::exists(path)) {
        result.status = StoreStatus::NotFound;
        result.message = "Store not found, starting empty: " + path;
        LOG_INFO("[Store] ", result.message);
        return result;
    }

    auto bytes = FileSystem::loadBytes(path);
    if (!bytes) {
        result.status = StoreStatus::Corrupt;
        result.message = "Store unreadable, starting empty: " + path;
        LOG_WARN("[Store] ", result.message);
        return result;
    }

    DecodedText decoded = EncodingDetector::decode(*bytes);
    if (!decoded.ok) {
        result.status = StoreStatus::Corrupt;
        result.message = "Store not decodable (" + decoded.message + "), starting empty: " + path;
        LOG_WARN("[Store] ", result.message);
        return result;
    }

    try {
        json j = json::parse(decoded.text);
        if (!j.is_object()) {
            result.status = StoreStatus::Corrupt;
            result.message = "Store is not a JSON object, starting empty: " + path;
            LOG_WARN("[Store] ", result.message);
            return result;
        }

        Entries entries;
        entries.reserve(j.size());
        size_t skipped = 0;
        for (auto& [key, val] : j.items()) {
            if (val.is_string()) {
                entries[key] = val.get<std::string>();
            } else if (val.is_null()) {
                entries[key] = "";
            } else {
                ++skipped;
                LOG_DEBUG("[Store] Skipping non-string value for key: ", key);
            }
        }
        if (skipped > 0) {
            LOG_WARN("[Store] Skipped ", skipped, " non-string values in ", path);
        }

        result.store = TranslationStore(std::move(entries));
        result.message = "Loaded " + std::to_string(result.store.size()) + " keys";
        LOG_INFO("[Store] Loaded ", result.store.size(), " keys from ", path);
        return result;
    } catch (const json::exception& e) {
        result.status = StoreStatus::Corrupt;
        result.message = std::string("Store corrupt (") + e.what() + "), starting empty: " + path;
        LOG_WARN("[Store] ", result.message);
        return result;
    }
}

std::string TranslationStore::pathFor(const std::string& dir, const std::string& lang) {
    return (std::filesystem::path(dir) / (lang + ".json")).string();
}

// Single pass over candidates with hash lookups into the store
// Depoya hash aramalariyla adaylar uzerinde tek gecis
std::vector<std::string> TranslationStore::diffUntranslated(
        const std::vector<std::string>& candidates) const {
    std::vector<std::string> out;
    std::unordered_set<std::string_view> seen;
    seen.reserve(candidates.size());

    for (const auto& c : candidates) {
        if (!seen.insert(c).second) continue;
        auto it = entries_.find(c);
        if (it == entries_.end() || it->second.empty()) {
            out.push_back(c);
        }
    }
    return out;
}

std::vector<std::string> TranslationStore::withoutTranslatedValues(
        const std::vector<std::string>& candidates) const {
    std::unordered_set<std::string_view> values;
    values.reserve(entries_.size());
    for (const auto& [key, value] : entries_) {
        if (!value.empty() && value != key) values.insert(value);
    }

    std::vector<std::string> out;
    out.reserve(candidates.size());
    for (const auto& c : candidates) {
        if (values.count(c) == 0 || entries_.count(c) > 0) out.push_back(c);
    }
    return out;
}

// Set non-empty incoming values that are new or different
// Yeni veya farkli olan bos olmayan gelen degerleri ata
size_t TranslationStore::merge(const Entries& incoming) {
    size_t changed = 0;
    for (const auto& [key, value] : incoming) {
        if (value.empty()) continue;
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            entries_.emplace(key, value);
            ++changed;
        } else if (it->second != value) {
            it->second = value;
            ++changed;
        }
    }
    LOG_DEBUG("[Store] merge: ", incoming.size(), " incoming, ", changed, " changed");
    return changed;
}

size_t TranslationStore::seedPending(const std::vector<std::string>& candidates) {
    size_t added = 0;
    for (const auto& c : candidates) {
        if (entries_.emplace(c, "").second) ++added;
    }
    return added;
}

// Remove empty values whose key is not in the current candidate set
// Anahtari mevcut aday kumesinde olmayan bos degerleri kaldir
size_t TranslationStore::prune(const std::vector<std::string>& candidates) {
    std::unordered_set<std::string_view> current(candidates.begin(), candidates.end());
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.empty() && current.count(it->first) == 0) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        LOG_INFO("[Store] Pruned ", removed, " stale pending keys");
    }
    return removed;
}

// nlohmann::json objects are std::map backed, so dump() is already key-sorted
// nlohmann::json nesneleri std::map tabanlidir, dump() zaten anahtara gore siralidir
std::string TranslationStore::serialize() const {
    json j = json::object();
    for (const auto& [key, value] : entries_) {
        j[key] = value;
    }
    return j.dump(2, ' ', false, json::error_handler_t::replace) + "\n";
}

FileResult TranslationStore::save(const std::string& path) const {
    FileResult result = FileSystem::saveAtomic(path, serialize());
    if (result.success) {
        LOG_INFO("[Store] Saved ", entries_.size(), " keys to ", path);
    } else {
        LOG_ERROR("[Store] Save failed: ", result.message);
    }
    return result;
}

std::optional<std::string> TranslationStore::get(const std::string& key) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

void TranslationStore::set(const std::string& key, const std::string& value) {
    entries_[key] = value;
}

StoreStats TranslationStore::stats() const {
    StoreStats s;
    s.total = entries_.size();
    for (const auto& [key, value] : entries_) {
        // Identity values are never substituted, so they still wait for a translation
        // Ayni degerler asla yerine konmaz, bu yuzden hala ceviri bekler
        if (value.empty() || value == key) ++s.pending;
        else ++s.translated;
    }
    s.percent = s.total == 0 ? 0.0 : (100.0 * static_cast<double>(s.translated) / static_cast<double>(s.total));
    return s;
}

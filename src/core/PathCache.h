// bundleloc — No impositions.
// Copyright (c) 2025 Berk Coşar <lookmainpoint@gmail.com>
// Licensed under the GNU Affero General Public License v3.0.
// See LICENSE file in the project root for full license text.

#pragma once
#include <string>
#include <optional>
#include <map>

// Small persisted key -> value map (paths.json), owned by whoever passes it around.
// Kalici kucuk anahtar -> deger haritasi (paths.json), onu aktaran tarafindan sahiplenilir.
class PathCache {
public:
    explicit PathCache(std::string file);

    // Read the cache file; a missing or unreadable file leaves the cache empty
    // Onbellek dosyasini oku; eksik veya okunamayan dosya onbellegi bos birakir
    bool load();

    // Persist atomically
    // Atomik olarak kaydet
    bool save();

    std::optional<std::string> get(const std::string& key) const;
    void set(const std::string& key, const std::string& value);
    void erase(const std::string& key);

    bool dirty() const { return dirty_; }
    const std::string& file() const { return file_; }

private:
    std::string file_;
    std::map<std::string, std::string> values_;
    bool dirty_ = false;
};

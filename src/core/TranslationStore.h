// bundleloc — No impositions.
// Copyright (c) 2025 Berk Coşar <lookmainpoint@gmail.com>
// Licensed under the GNU Affero General Public License v3.0.
// See LICENSE file in the project root for full license text.

#pragma once
#include "file.h"
#include <string>
#include <vector>
#include <unordered_map>
#include <optional>

// How a store file was found on load
// Depo dosyasinin yuklemede hangi durumda bulundugu
enum class StoreStatus { Ok, NotFound, Corrupt };

// Counts for the status view
// Durum gorunumu icin sayilar
struct StoreStats {
    size_t total = 0;        // All keys / Tum anahtarlar
    size_t translated = 0;   // Values differing from their key / Anahtarindan farkli degerler
    size_t pending = 0;      // Empty or identity values / Bos veya ayni degerler
    double percent = 0.0;    // translated / total * 100
};

struct StoreLoadResult;

// Persistent key -> translated text mapping for one target language.
// Tek bir hedef dil icin kalici anahtar -> cevrilmis metin eslemesi.
// An empty value means "pending". Confirmed (non-empty) values are never
// replaced by empty ones, so manual edits in the JSON file survive every run.
// Bos deger "beklemede" demektir. Onaylanmis (bos olmayan) degerler asla bos
// degerlerle degistirilmez, boylece JSON dosyasindaki elle duzenlemeler her calismada korunur.
class TranslationStore {
public:
    using Entries = std::unordered_map<std::string, std::string>;

    TranslationStore() = default;
    explicit TranslationStore(Entries entries);

    // Load a store file. Missing or corrupt files yield an empty store, never an error.
    // Bir depo dosyasi yukle. Eksik veya bozuk dosyalar hata degil, bos depo verir.
    static StoreLoadResult load(const std::string& path);

    // Conventional store path: <dir>/<lang>.json
    // Geleneksel depo yolu: <dir>/<lang>.json
    static std::string pathFor(const std::string& dir, const std::string& lang);

    // Candidates that are absent or pending, in candidate order
    // Eksik veya beklemedeki adaylar, aday sirasinda
    std::vector<std::string> diffUntranslated(const std::vector<std::string>& candidates) const;

    // Drop candidates that are themselves stored translations (a bundle that was
    // already rewritten shows its translations as literals)
    // Kendisi kayitli ceviri olan adaylari cikar (daha once yeniden yazilmis bir
    // bundle cevirilerini literal olarak gosterir)
    std::vector<std::string> withoutTranslatedValues(const std::vector<std::string>& candidates) const;

    // Apply incoming translations; empty values are ignored. Returns the changed count.
    // Gelen cevirileri uygula; bos degerler yok sayilir. Degisen sayisini dondurur.
    size_t merge(const Entries& incoming);

    // Insert "" for candidates not yet in the store. Returns the added count.
    // Depoda henuz olmayan adaylar icin "" ekle. Eklenen sayisini dondurur.
    size_t seedPending(const std::vector<std::string>& candidates);

    // Drop pending keys that are no longer extracted. Returns the removed count.
    // Artik cikarilmayan beklemedeki anahtarlari at. Silinen sayisini dondurur.
    size_t prune(const std::vector<std::string>& candidates);

    // Persist as UTF-8 JSON sorted by key, written atomically
    // Anahtara gore sirali UTF-8 JSON olarak atomik yaz
    FileResult save(const std::string& path) const;

    // Serialized form exactly as save() writes it
    // save()'in yazdigi haliyle serilestirilmis bicim
    std::string serialize() const;

    std::optional<std::string> get(const std::string& key) const;
    void set(const std::string& key, const std::string& value);
    bool contains(const std::string& key) const { return entries_.count(key) > 0; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    const Entries& entries() const { return entries_; }

    StoreStats stats() const;

private:
    Entries entries_;   // key -> value / anahtar -> deger
};

// Result of TranslationStore::load
// TranslationStore::load sonucu
struct StoreLoadResult {
    TranslationStore store;
    StoreStatus status = StoreStatus::Ok;
    std::string message;
};

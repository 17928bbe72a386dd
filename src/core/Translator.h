// bundleloc — No impositions.
// Copyright (c) 2025 Berk Coşar <lookmainpoint@gmail.com>
// Licensed under the GNU Affero General Public License v3.0.
// See LICENSE file in the project root for full license text.

#pragma once
#include "FallbackDictionary.h"
#include <string>
#include <vector>
#include <memory>

class ProviderTransport;

// Per-item result of a translation batch.
// Bir ceviri grubunun oge bazli sonucu.
// texts always has one entry per input, in input order; untranslated items
// carry their source text unchanged and translated[i] == false.
// texts her girdi icin, girdi sirasinda bir oge icerir; cevrilmeyen ogeler
// kaynak metni degistirmeden tasir ve translated[i] == false olur.
struct TranslationOutcome {
    std::vector<std::string> texts;
    std::vector<bool> translated;
    size_t failedChunks = 0;   // ProviderError count / ProviderError sayisi

    size_t translatedCount() const;
};

// Settings for building a translator
// Bir cevirmen olusturmak icin ayarlar
struct TranslatorOptions {
    std::string apiKey;          // Provider credential, empty = fallback / Saglayici kimligi, bos = geri donus
    std::string language;        // Target language for the validity check / Gecerlilik denetimi icin hedef dil
    std::string dictionaryDir;   // Extra <locale>.json dictionaries / Ek <locale>.json sozlukleri
    int chunkSize = 50;          // Items per request (1..50) / Istek basina oge (1..50)
    int timeoutSec = 30;         // Per-request timeout / Istek basina zaman asimi
    bool verify = true;           // Run the validity check / Gecerlilik denetimini calistir
};

// Abstract translation capability: batch in, same-length batch out.
// Soyut ceviri yetenegi: grup girer, ayni uzunlukta grup cikar.
class Translator {
public:
    virtual ~Translator() = default;

    // Translate a batch, one output per input in the same order; never throws
    // Bir grubu cevir, ayni sirada her girdi icin bir cikti; asla istisna firlatmaz
    std::vector<std::string> translate(const std::vector<std::string>& batch,
                                       const std::string& targetLanguage);

    // Translate with per-item flags and failure counts
    // Oge bazli bayraklar ve hata sayilariyla cevir
    virtual TranslationOutcome translateDetailed(const std::vector<std::string>& batch,
                                                 const std::string& targetLanguage) = 0;

    // Whether the target language can be served at all
    // Hedef dilin hic sunulup sunulamayacagi
    virtual bool supports(const std::string& targetLanguage) const = 0;

    // Human-readable strategy name ("deepl", "dictionary")
    // Insan tarafindan okunabilir strateji adi ("deepl", "dictionary")
    virtual std::string name() const = 0;

    virtual bool isLive() const = 0;

    // Build the live provider when a credential is present and the check passes,
    // otherwise the dictionary fallback. Callers see the same interface either way.
    // Kimlik varsa ve denetim gecerse canli saglayiciyi, aksi halde sozluk geri donusunu
    // olustur. Cagiranlar her iki durumda da ayni arayuzu gorur.
    static std::unique_ptr<Translator> create(const TranslatorOptions& options,
                                              std::shared_ptr<ProviderTransport> transport = nullptr);

    // Language codes the built-in strategies know about
    // Yerlesik stratejilerin bildigi dil kodlari
    static const std::vector<std::string>& knownLanguages();
};

// Fallback strategy: static dictionary lookups, misses pass through unchanged
// Geri donus stratejisi: statik sozluk aramalari, bulunamayanlar degismeden gecer
class SampleTranslator : public Translator {
public:
    explicit SampleTranslator(FallbackDictionary dictionary);

    TranslationOutcome translateDetailed(const std::vector<std::string>& batch,
                                         const std::string& targetLanguage) override;
    bool supports(const std::string& targetLanguage) const override;
    std::string name() const override { return "dictionary"; }
    bool isLive() const override { return false; }

    const FallbackDictionary& dictionary() const { return dictionary_; }

private:
    FallbackDictionary dictionary_;
};

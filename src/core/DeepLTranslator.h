// bundleloc — No impositions.
// Copyright (c) 2025 Berk Coşar <lookmainpoint@gmail.com>
// Licensed under the GNU Affero General Public License v3.0.
// See LICENSE file in the project root for full license text.

#pragma once
#include "Translator.h"
#include "ProviderTransport.h"
#include <memory>

// Live provider strategy backed by the DeepL v2 REST API.
// DeepL v2 REST API destekli canli saglayici stratejisi.
// Batches are split into chunks of at most 50 texts, sent one at a time.
// A failed chunk keeps its source texts and the next chunk is still sent.
// Gruplar en fazla 50 metinlik parcalara bolunur, birer birer gonderilir.
// Basarisiz bir parca kaynak metinlerini korur ve sonraki parca yine gonderilir.
class DeepLTranslator : public Translator {
public:
    static constexpr int kMaxChunkSize = 50;

    DeepLTranslator(std::string apiKey,
                    std::shared_ptr<ProviderTransport> transport,
                    int chunkSize = kMaxChunkSize,
                    int timeoutSec = 30);

    TranslationOutcome translateDetailed(const std::vector<std::string>& batch,
                                         const std::string& targetLanguage) override;
    bool supports(const std::string& targetLanguage) const override;
    std::string name() const override { return "deepl"; }
    bool isLive() const override { return true; }

    // Free-tier keys end in ":fx" and use a separate host
    // Ucretsiz katman anahtarlari ":fx" ile biter ve ayri bir host kullanir
    static std::string hostForKey(const std::string& apiKey);

    // "ko" -> "KO"
    static std::string targetLangCode(const std::string& lang);

    int chunkSize() const { return chunkSize_; }

private:
    // Send one chunk [begin, end) and fill the outcome slots; false on ProviderError
    // Tek bir parcayi [begin, end) gonder ve sonuc yuvalarini doldur; ProviderError'da false
    bool translateChunk(const std::vector<std::string>& batch, size_t begin, size_t end,
                        const std::string& targetLanguage, TranslationOutcome& out);

    std::string apiKey_;
    std::string host_;
    std::shared_ptr<ProviderTransport> transport_;
    int chunkSize_;
    int timeoutSec_;
};

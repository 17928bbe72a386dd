// bundleloc — No impositions.
// Copyright (c) 2025 Berk Coşar <lookmainpoint@gmail.com>
// Licensed under the GNU Affero General Public License v3.0.
// See LICENSE file in the project root for full license text.

#include "Translator.h"
#include "DeepLTranslator.h"
#include "ProviderTransport.h"
#include "Logger.h"
#include <algorithm>

size_t TranslationOutcome::translatedCount() const {
    return static_cast<size_t>(std::count(translated.begin(), translated.end(), true));
}

std::vector<std::string> Translator::translate(const std::vector<std::string>& batch,
                                               const std::string& targetLanguage) {
    return translateDetailed(batch, targetLanguage).texts;
}

const std::vector<std::string>& Translator::knownLanguages() {
    static const std::vector<std::string> langs = {
        "ko", "ja", "zh", "fr", "de", "es", "it", "pt", "ru"
    };
    return langs;
}

// Pick the strategy: live provider if credential + check succeed, dictionary otherwise
// Stratejiyi sec: kimlik + denetim basariliysa canli saglayici, aksi halde sozluk
std::unique_ptr<Translator> Translator::create(const TranslatorOptions& options,
                                               std::shared_ptr<ProviderTransport> transport) {
    auto makeFallback = [&options]() {
        FallbackDictionary dict = FallbackDictionary::withBuiltins();
        if (!options.dictionaryDir.empty()) {
            dict.loadDirectory(options.dictionaryDir);
        }
        return std::make_unique<SampleTranslator>(std::move(dict));
    };

    if (options.apiKey.empty()) {
        LOG_INFO("[Translate] No provider credential, using sample dictionary");
        return makeFallback();
    }

    if (!transport) {
        if (!HttpsTransport::tlsAvailable()) {
            LOG_WARN("[Translate] Built without TLS, DeepL unreachable; using sample dictionary");
            return makeFallback();
        }
        transport = std::make_shared<HttpsTransport>();
    }

    auto live = std::make_unique<DeepLTranslator>(options.apiKey, std::move(transport),
                                                  options.chunkSize, options.timeoutSec);
    if (!options.verify) {
        LOG_INFO("[Translate] Using DeepL without validity check");
        return live;
    }

    // Validity check: one trivial string must come back non-empty
    // Gecerlilik denetimi: basit bir dize bos olmadan geri donmeli
    std::string checkLang = options.language.empty() ? "de" : options.language;
    TranslationOutcome check = live->translateDetailed({"Hello"}, checkLang);
    if (check.failedChunks > 0 || check.texts.size() != 1 || check.texts[0].empty()
        || check.translatedCount() != 1) {
        LOG_WARN("[Translate] DeepL check failed, falling back to sample dictionary");
        return makeFallback();
    }

    LOG_INFO("[Translate] DeepL check ok (\"Hello\" -> \"", check.texts[0], "\")");
    return live;
}

SampleTranslator::SampleTranslator(FallbackDictionary dictionary)
    : dictionary_(std::move(dictionary)) {}

// Look up every item; misses keep their source text
// Her ogeyi ara; bulunamayanlar kaynak metnini korur
TranslationOutcome SampleTranslator::translateDetailed(const std::vector<std::string>& batch,
                                                       const std::string& targetLanguage) {
    TranslationOutcome out;
    out.texts.reserve(batch.size());
    out.translated.reserve(batch.size());

    for (const auto& text : batch) {
        auto hit = dictionary_.lookup(targetLanguage, text);
        if (hit) {
            out.texts.push_back(*hit);
            out.translated.push_back(true);
        } else {
            out.texts.push_back(text);
            out.translated.push_back(false);
        }
    }

    if (!batch.empty()) {
        LOG_INFO("[Translate] Dictionary covered ", out.translatedCount(), " of ", batch.size(),
                 " strings for '", targetLanguage, "'");
    }
    return out;
}

bool SampleTranslator::supports(const std::string& targetLanguage) const {
    const auto& known = knownLanguages();
    return dictionary_.hasLocale(targetLanguage)
        || std::find(known.begin(), known.end(), targetLanguage) != known.end();
}

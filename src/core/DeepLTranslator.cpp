// bundleloc — No impositions.
// Copyright (c) 2025 Berk Coşar <lookmainpoint@gmail.com>
// Licensed under the GNU Affero General Public License v3.0.
// See LICENSE file in the project root for full license text.

#include "DeepLTranslator.h"
#include "Logger.h"
#include "nlohmann/json.hpp"
#include <algorithm>
#include <cctype>

using json = nlohmann::json;

DeepLTranslator::DeepLTranslator(std::string apiKey,
                                 std::shared_ptr<ProviderTransport> transport,
                                 int chunkSize,
                                 int timeoutSec)
    : apiKey_(std::move(apiKey)),
      host_(hostForKey(apiKey_)),
      transport_(std::move(transport)),
      chunkSize_(std::clamp(chunkSize, 1, kMaxChunkSize)),
      timeoutSec_(std::max(1, timeoutSec)) {}

std::string DeepLTranslator::hostForKey(const std::string& apiKey) {
    const std::string freeSuffix = ":fx";
    bool isFree = apiKey.size() >= freeSuffix.size()
        && apiKey.compare(apiKey.size() - freeSuffix.size(), freeSuffix.size(), freeSuffix) == 0;
    return isFree ? "api-free.deepl.com" : "api.deepl.com";
}

std::string DeepLTranslator::targetLangCode(const std::string& lang) {
    std::string code = lang;
    std::transform(code.begin(), code.end(), code.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return code;
}

bool DeepLTranslator::supports(const std::string& targetLanguage) const {
    return !targetLanguage.empty();
}

// Pre-fill with passthrough, then let each successful chunk overwrite its slots
// Once gecis ile doldur, sonra her basarili parca kendi yuvalarinin uzerine yazsin
TranslationOutcome DeepLTranslator::translateDetailed(const std::vector<std::string>& batch,
                                                      const std::string& targetLanguage) {
    TranslationOutcome out;
    out.texts = batch;
    out.translated.assign(batch.size(), false);
    if (batch.empty()) return out;

    const size_t step = static_cast<size_t>(chunkSize_);
    const size_t chunks = (batch.size() + step - 1) / step;
    for (size_t begin = 0, index = 1; begin < batch.size(); begin += step, ++index) {
        size_t end = std::min(batch.size(), begin + step);
        if (!translateChunk(batch, begin, end, targetLanguage, out)) {
            ++out.failedChunks;
            LOG_WARN("[DeepL] Chunk ", index, "/", chunks, " failed, ", end - begin,
                     " strings left untranslated");
        } else {
            LOG_DEBUG("[DeepL] Chunk ", index, "/", chunks, " ok");
        }
    }

    LOG_INFO("[DeepL] Translated ", out.translatedCount(), " of ", batch.size(),
             " strings (", out.failedChunks, " failed chunks)");
    return out;
}

bool DeepLTranslator::translateChunk(const std::vector<std::string>& batch, size_t begin, size_t end,
                                     const std::string& targetLanguage, TranslationOutcome& out) {
    FieldList form;
    form.reserve(end - begin + 1);
    for (size_t i = begin; i < end; ++i) {
        form.emplace_back("text", batch[i]);
    }
    form.emplace_back("target_lang", targetLangCode(targetLanguage));

    FieldList headers = {
        {"Authorization", "DeepL-Auth-Key " + apiKey_},
        {"User-Agent", "bundleloc/1.0"},
    };

    TransportResponse res = transport_->postForm(host_, "/v2/translate", form, headers, timeoutSec_);
    if (!res.ok) {
        LOG_ERROR("[DeepL] Request failed: ", res.error);
        return false;
    }
    if (res.status < 200 || res.status >= 300) {
        LOG_ERROR("[DeepL] HTTP ", res.status, ": ", res.body.substr(0, 200));
        return false;
    }

    try {
        json j = json::parse(res.body);
        const json& items = j.at("translations");
        if (!items.is_array() || items.size() != end - begin) {
            LOG_ERROR("[DeepL] Expected ", end - begin, " translations, got ",
                      items.is_array() ? items.size() : 0);
            return false;
        }

        // Validate the whole chunk before writing any slot
        // Herhangi bir yuvaya yazmadan once tum parcayi dogrula
        std::vector<std::string> texts;
        texts.reserve(items.size());
        for (const auto& item : items) {
            texts.push_back(item.at("text").get<std::string>());
        }
        for (size_t i = 0; i < texts.size(); ++i) {
            if (texts[i].empty()) continue;
            out.texts[begin + i] = std::move(texts[i]);
            out.translated[begin + i] = true;
        }
        return true;
    } catch (const json::exception& e) {
        LOG_ERROR("[DeepL] Malformed response: ", e.what());
        return false;
    }
}

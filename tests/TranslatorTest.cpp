// bundleloc — No impositions.
// Copyright (c) 2025 Berk Coşar <lookmainpoint@gmail.com>
// Licensed under the GNU Affero General Public License v3.0.
// See LICENSE file in the project root for full license text.

#include "Translator.h"
#include "DeepLTranslator.h"
#include "FallbackDictionary.h"
#include "test_helpers.h"
#include <gtest/gtest.h>

using testutil::FakeTransport;
using testutil::RecordedRequest;

namespace {

std::vector<std::string> numbered(size_t n) {
    std::vector<std::string> out;
    for (size_t i = 0; i < n; ++i) out.push_back("String number " + std::to_string(i));
    return out;
}

} // namespace

TEST(DeepLTranslator, ChunksOf50AreSentSequentiallyInOrder) {
    auto transport = std::make_shared<FakeTransport>();
    DeepLTranslator tr("secret:fx", transport);

    auto batch = numbered(120);
    TranslationOutcome out = tr.translateDetailed(batch, "ko");

    ASSERT_EQ(transport->requests().size(), 3u);
    EXPECT_EQ(transport->requests()[0].texts().size(), 50u);
    EXPECT_EQ(transport->requests()[1].texts().size(), 50u);
    EXPECT_EQ(transport->requests()[2].texts().size(), 20u);

    ASSERT_EQ(out.texts.size(), batch.size());
    for (size_t i = 0; i < batch.size(); ++i) {
        EXPECT_EQ(out.texts[i], "KO:" + batch[i]);
    }
    EXPECT_EQ(out.translatedCount(), 120u);
    EXPECT_EQ(out.failedChunks, 0u);
}

TEST(DeepLTranslator, RequestCarriesKeyLanguageAndHost) {
    auto transport = std::make_shared<FakeTransport>();
    DeepLTranslator free("abc:fx", transport);
    free.translate({"Account"}, "ja");

    DeepLTranslator pro("abc", transport);
    pro.translate({"Account"}, "ja");

    ASSERT_EQ(transport->requests().size(), 2u);
    const RecordedRequest& first = transport->requests()[0];
    EXPECT_EQ(first.host, "api-free.deepl.com");
    EXPECT_EQ(first.path, "/v2/translate");
    EXPECT_EQ(first.field("target_lang"), "JA");
    EXPECT_EQ(first.field("Authorization"), "DeepL-Auth-Key abc:fx");
    EXPECT_EQ(transport->requests()[1].host, "api.deepl.com");
}

TEST(DeepLTranslator, FailedChunkPassesThroughAndOthersContinue) {
    auto transport = std::make_shared<FakeTransport>();
    transport->setHandler([](const RecordedRequest& req, size_t call) {
        if (call == 1) return FakeTransport::failure("connection reset");
        return FakeTransport::echo(req);
    });
    DeepLTranslator tr("key", transport);

    auto batch = numbered(120);
    TranslationOutcome out = tr.translateDetailed(batch, "de");

    ASSERT_EQ(out.texts.size(), 120u);
    EXPECT_EQ(out.failedChunks, 1u);
    EXPECT_EQ(out.translatedCount(), 70u);
    EXPECT_EQ(out.texts[0], "DE:" + batch[0]);
    EXPECT_EQ(out.texts[75], batch[75]);
    EXPECT_FALSE(out.translated[75]);
    EXPECT_EQ(out.texts[110], "DE:" + batch[110]);
}

TEST(DeepLTranslator, HttpErrorsAndMalformedBodiesCountAsChunkFailures) {
    auto transport = std::make_shared<FakeTransport>();
    transport->setHandler([](const RecordedRequest&, size_t call) {
        TransportResponse res;
        res.ok = true;
        if (call == 0) {
            res.status = 403;
            res.body = "{\"message\":\"Wrong key\"}";
        } else {
            res.status = 200;
            res.body = "{\"translations\":[{\"text\":\"only one\"}]}";
        }
        return res;
    });
    DeepLTranslator tr("key", transport, 2);

    TranslationOutcome out = tr.translateDetailed({"Alpha", "Beta", "Gamma", "Delta"}, "fr");
    EXPECT_EQ(out.failedChunks, 2u);
    EXPECT_EQ(out.translatedCount(), 0u);
    EXPECT_EQ(out.texts, (std::vector<std::string>{"Alpha", "Beta", "Gamma", "Delta"}));
}

TEST(DeepLTranslator, EmptyBatchMakesNoRequests) {
    auto transport = std::make_shared<FakeTransport>();
    DeepLTranslator tr("key", transport);
    EXPECT_TRUE(tr.translate({}, "ko").empty());
    EXPECT_TRUE(transport->requests().empty());
}

TEST(DeepLTranslator, ChunkSizeIsClamped) {
    auto transport = std::make_shared<FakeTransport>();
    EXPECT_EQ(DeepLTranslator("k", transport, 500).chunkSize(), 50);
    EXPECT_EQ(DeepLTranslator("k", transport, 0).chunkSize(), 1);
}

TEST(Translator, InvalidCredentialDegradesToDictionary) {
    auto transport = std::make_shared<FakeTransport>();
    transport->setHandler([](const RecordedRequest&, size_t) {
        TransportResponse res;
        res.ok = true;
        res.status = 403;
        res.body = "{\"message\":\"Authorization failure\"}";
        return res;
    });

    TranslatorOptions opts;
    opts.apiKey = "invalid";
    opts.language = "ko";
    auto tr = Translator::create(opts, transport);

    ASSERT_NE(tr, nullptr);
    EXPECT_FALSE(tr->isLive());
    EXPECT_EQ(transport->requests().size(), 1u);  // the check only

    std::vector<std::string> out;
    ASSERT_NO_THROW(out = tr->translate({"Account", "Something unknown"}, "ko"));
    EXPECT_EQ(out, (std::vector<std::string>{"계정", "Something unknown"}));
    EXPECT_EQ(transport->requests().size(), 1u);
}

TEST(Translator, WorkingCredentialKeepsLiveProvider) {
    auto transport = std::make_shared<FakeTransport>();
    TranslatorOptions opts;
    opts.apiKey = "good:fx";
    opts.language = "ko";
    auto tr = Translator::create(opts, transport);

    EXPECT_TRUE(tr->isLive());
    ASSERT_EQ(transport->requests().size(), 1u);
    EXPECT_EQ(transport->requests()[0].texts(), (std::vector<std::string>{"Hello"}));
}

TEST(Translator, NoCredentialUsesDictionaryWithoutNetwork) {
    TranslatorOptions opts;
    auto tr = Translator::create(opts);
    EXPECT_FALSE(tr->isLive());
    EXPECT_EQ(tr->name(), "dictionary");

    auto out = tr->translateDetailed({"Cursor Settings", "Not in dictionary"}, "ko");
    ASSERT_EQ(out.texts.size(), 2u);
    EXPECT_EQ(out.texts[0], "Cursor 설정");
    EXPECT_TRUE(out.translated[0]);
    EXPECT_EQ(out.texts[1], "Not in dictionary");
    EXPECT_FALSE(out.translated[1]);
    EXPECT_TRUE(tr->translate({}, "ko").empty());
}

TEST(SampleTranslator, SupportsKnownLanguagesAndLoadedLocales) {
    testutil::TempDir dir;
    testutil::writeFile(dir.file("tr.json"), R"({"Account": "Hesap", "Chat": ""})");

    FallbackDictionary dict = FallbackDictionary::withBuiltins();
    EXPECT_EQ(dict.loadDirectory(dir.path().string()), 1u);
    SampleTranslator tr(std::move(dict));

    EXPECT_TRUE(tr.supports("ko"));
    EXPECT_TRUE(tr.supports("de"));
    EXPECT_TRUE(tr.supports("tr"));
    EXPECT_FALSE(tr.supports("xx"));

    auto out = tr.translateDetailed({"Account", "Chat"}, "tr");
    EXPECT_EQ(out.texts[0], "Hesap");
    EXPECT_EQ(out.texts[1], "Chat");
    EXPECT_FALSE(out.translated[1]);
}

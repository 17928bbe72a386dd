// bundleloc — No impositions.
// Copyright (c) 2025 Berk Coşar <lookmainpoint@gmail.com>
// Licensed under the GNU Affero General Public License v3.0.
// See LICENSE file in the project root for full license text.

#include "SubstitutionEngine.h"
#include <gtest/gtest.h>

TEST(SubstitutionEngine, OpenFileAndSaveScenario) {
    TranslationStore store({{"Open File", "파일 열기"}, {"Save", "저장"}});
    SubstitutionEngine engine;

    SubstitutionOutput out = engine.apply("label:\"Open File\"\ntitle:\"Save\"", store);
    EXPECT_EQ(out.text, "label:\"파일 열기\"\ntitle:\"저장\"");
    EXPECT_EQ(out.result.keysApplied, 2u);
    EXPECT_EQ(out.result.occurrencesReplaced, 2u);
}

TEST(SubstitutionEngine, LongestKeyWinsOverPrefixKey) {
    TranslationStore store({{"Save", "Save X"}, {"Save As...", "Save As... Y"}});
    SubstitutionEngine engine;

    SubstitutionOutput out = engine.apply("\"Save\" \"Save As...\"", store);
    EXPECT_EQ(out.text, "\"Save X\" \"Save As... Y\"");
    EXPECT_EQ(out.result.keysApplied, 2u);
}

TEST(SubstitutionEngine, SecondPassChangesNothing) {
    TranslationStore store({{"Open File", "파일 열기"}, {"Save", "저장"}, {"Save As...", "다른 이름으로 저장"}});
    SubstitutionEngine engine;
    std::string text = "a={label:\"Open File\"},b='Save',c=[\"Save As...\",\"Save\"]";

    SubstitutionOutput once = engine.apply(text, store);
    SubstitutionOutput twice = engine.apply(once.text, store);
    EXPECT_EQ(twice.text, once.text);
    EXPECT_EQ(twice.result.occurrencesReplaced, 0u);
    EXPECT_EQ(once.result.occurrencesReplaced, 4u);
    EXPECT_EQ(once.result.keysApplied, 3u);
}

TEST(SubstitutionEngine, SingleQuotesAreKeptAndEscaped) {
    TranslationStore store({{"Don't save", "l'archive"}, {"Account", "Compte \"perso\""}});
    SubstitutionEngine engine;

    SubstitutionOutput out = engine.apply("x='Account';y=\"Account\"", store);
    EXPECT_EQ(out.text, "x='Compte \"perso\"';y=\"Compte \\\"perso\\\"\"");

    out = engine.apply("z=\"Account is l'archive\"", TranslationStore(TranslationStore::Entries{{"Account", "Konto"}}));
    EXPECT_EQ(out.result.occurrencesReplaced, 0u);
}

TEST(SubstitutionEngine, ShortAndEmptyEntriesDoNotParticipate) {
    TranslationStore store({{"OK", "확인"}, {"Chat", ""}, {"Models", "Models"}});
    SubstitutionEngine engine;

    std::string text = "a=\"OK\",b=\"Chat\",c=\"Models\"";
    SubstitutionOutput out = engine.apply(text, store);
    EXPECT_EQ(out.text, text);
    EXPECT_EQ(out.result.keysApplied, 0u);
}

TEST(SubstitutionEngine, OnlyWholeLiteralsMatch) {
    TranslationStore store(TranslationStore::Entries{{"Save", "저장"}});
    SubstitutionEngine engine;

    std::string text = "a=\"Save all\",b=\"Autosave\",c=Save,d=\"Save\"";
    SubstitutionOutput out = engine.apply(text, store);
    EXPECT_EQ(out.text, "a=\"Save all\",b=\"Autosave\",c=Save,d=\"저장\"");
    EXPECT_EQ(out.result.occurrencesReplaced, 1u);
}

TEST(SubstitutionEngine, ClosingQuoteIsNotReadAsOpeningQuote) {
    TranslationStore store(TranslationStore::Entries{{"Chat", "채팅"}});
    SubstitutionEngine engine;

    // The quotes around Chat close "one" and open "two"
    std::string glued = "s=\"one\"Chat\"two\"";
    EXPECT_EQ(engine.apply(glued, store).text, glued);

    SubstitutionOutput out = engine.apply("f(\"x\"+a+\"Chat\",\"y\")", store);
    EXPECT_EQ(out.text, "f(\"x\"+a+\"채팅\",\"y\")");
}

TEST(SubstitutionEngine, QuotesInsideAnUntranslatedLiteralAreText) {
    TranslationStore store(TranslationStore::Entries{{"Save", "저장"}});
    SubstitutionEngine engine;

    std::string nested = "x=\"it's 'Save' now\"";
    SubstitutionOutput out = engine.apply(nested, store);
    EXPECT_EQ(out.text, nested);
    EXPECT_EQ(out.result.keysApplied, 0u);

    std::string swapped = "y='say \"Save\" twice',z=\"Save\"";
    out = engine.apply(swapped, store);
    EXPECT_EQ(out.text, "y='say \"Save\" twice',z=\"저장\"");
    EXPECT_EQ(out.result.occurrencesReplaced, 1u);
}

TEST(SubstitutionEngine, EscapedQuotesNeverOpenOrClose) {
    TranslationStore store(TranslationStore::Entries{{"Save", "저장"}});
    SubstitutionEngine engine;

    std::string text = "s=\"say \\\"Save\\\" now\"";
    EXPECT_EQ(engine.apply(text, store).text, text);
}

TEST(SubstitutionEngine, KeywordBeforeLiteralStillMatches) {
    TranslationStore store(TranslationStore::Entries{{"Save", "저장"}});
    SubstitutionEngine engine;

    SubstitutionOutput out = engine.apply("function f(){return\"Save\"}", store);
    EXPECT_EQ(out.text, "function f(){return\"저장\"}");
}

TEST(SubstitutionEngine, EscapeForQuote) {
    EXPECT_EQ(SubstitutionEngine::escapeForQuote("a\"b'c", '"'), "a\\\"b'c");
    EXPECT_EQ(SubstitutionEngine::escapeForQuote("a\"b'c", '\''), "a\"b\\'c");
    EXPECT_EQ(SubstitutionEngine::escapeForQuote("line\nnext\\", '"'), "line\\nnext\\\\");
}

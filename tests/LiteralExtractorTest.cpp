// bundleloc — No impositions.
// Copyright (c) 2025 Berk Coşar <lookmainpoint@gmail.com>
// Licensed under the GNU Affero General Public License v3.0.
// See LICENSE file in the project root for full license text.

#include "LiteralExtractor.h"
#include "EncodingDetector.h"
#include "test_helpers.h"
#include <gtest/gtest.h>
#include <algorithm>

namespace {

bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

} // namespace

TEST(LiteralExtractor, FindsUiPropertiesSentencesAndReturns) {
    LiteralExtractor ex;
    std::string bundle =
        "x={label:\"Open File\",title:'Save As...',placeholder:\"Search files\"};"
        "function f(){return\"Nothing to show\"}"
        "const m=\"This setting is applied after restart.\";"
        "y={ariaLabel:\"Close Editor\",children:()=>\"Learn more\"};";

    auto out = ex.extract(bundle);
    EXPECT_TRUE(contains(out, "Open File"));
    EXPECT_TRUE(contains(out, "Save As..."));
    EXPECT_TRUE(contains(out, "Search files"));
    EXPECT_TRUE(contains(out, "Nothing to show"));
    EXPECT_TRUE(contains(out, "This setting is applied after restart."));
    EXPECT_TRUE(contains(out, "Close Editor"));
    EXPECT_TRUE(contains(out, "Learn more"));
}

TEST(LiteralExtractor, OutputIsSortedAndDeduplicated) {
    LiteralExtractor ex;
    auto out = ex.extract("a={title:\"Zoom In\"};b={label:\"Zoom In\"};c={text:\"Account\"}");
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0], "Account");
    EXPECT_EQ(out[1], "Zoom In");
}

TEST(LiteralExtractor, NoiseShapesAreFiltered) {
    LiteralExtractor ex;
    EXPECT_FALSE(ex.isCandidate("12345"));
    EXPECT_FALSE(ex.isCandidate("ok"));
    EXPECT_FALSE(ex.isCandidate("abc"));
    EXPECT_FALSE(ex.isCandidate("https://cursor.com/docs"));
    EXPECT_FALSE(ex.isCandidate("www.example.org"));
    EXPECT_FALSE(ex.isCandidate("support@cursor.com"));
    EXPECT_FALSE(ex.isCandidate("vs/workbench/main.js"));
    EXPECT_FALSE(ex.isCandidate("editor.fontSize"));
    EXPECT_FALSE(ex.isCandidate("snake_case_id"));
    EXPECT_FALSE(ex.isCandidate("!"));
    EXPECT_FALSE(ex.isCandidate("x"));

    EXPECT_TRUE(ex.isCandidate("Account"));
    EXPECT_TRUE(ex.isCandidate("Open File"));
    EXPECT_TRUE(ex.isCandidate("Auto-scroll to bottom"));
}

TEST(LiteralExtractor, LengthIsMeasuredWithoutSurroundingSpace) {
    ExtractorOptions opts;
    opts.maxLength = 10;
    LiteralExtractor ex(opts);
    EXPECT_TRUE(ex.isCandidate("   Open File   "));
    EXPECT_FALSE(ex.isCandidate("  Open Folder...  "));
}

TEST(LiteralExtractor, LengthBoundsHold) {
    LiteralExtractor ex;
    std::string longValue = "A" + std::string(520, 'b') + " c.";
    std::string bundle = "t={title:\"" + longValue + "\",label:\"Fine label\",name:\"X\"}";

    for (const auto& s : ex.extract(bundle)) {
        size_t n = EncodingDetector::codePointCount(s);
        EXPECT_GE(n, 2u) << s;
        EXPECT_LE(n, 500u) << s;
    }
    EXPECT_FALSE(ex.isCandidate(longValue));
}

TEST(LiteralExtractor, NonAsciiTextIsKept) {
    LiteralExtractor ex;
    auto out = ex.extract("q={label:\"Cursor \xEC\x84\xA4\xEC\xA0\x95\"}");
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0], "Cursor \xEC\x84\xA4\xEC\xA0\x95");
}

TEST(LiteralExtractor, WriteArtifactIsNewlineDelimited) {
    testutil::TempDir dir;
    std::string path = dir.file("strings.txt");
    FileResult res = LiteralExtractor::writeArtifact({"Account", "Open File"}, path);
    ASSERT_TRUE(res.success) << res.message;
    EXPECT_EQ(testutil::readFile(path), "Account\nOpen File\n");
}

// bundleloc — No impositions.
// Copyright (c) 2025 Berk Coşar <lookmainpoint@gmail.com>
// Licensed under the GNU Affero General Public License v3.0.
// See LICENSE file in the project root for full license text.

#include "LiteralExtractor.h"
#include "EncodingDetector.h"
#include "Logger.h"
#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace {

// UI-bearing property names whose string values are shown to the user
// Dize degerleri kullaniciya gosterilen arayuz ozellik adlari
const char* kPropertyNames =
    "aria-label|ariaLabel|categoryLabel|buttonLabel|failureMessage|successMessage|"
    "placeholder|description|tooltip|children|message|detail|label|title|value|name|text";

// Literal bodies are bounded so the regex backtracking stays shallow
// Literal govdeleri sinirlidir, boylece regex geri izleme sig kalir
std::string doubleQuoted() { return "\"([^\"\\\\\\n]{1,500})\""; }
std::string singleQuoted() { return "'([^'\\\\\\n]{1,500})'"; }

std::string_view trimView(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

bool hasLetter(std::string_view s) {
    for (char c : s) {
        auto u = static_cast<unsigned char>(c);
        if (u >= 0x80 || std::isalpha(u)) return true;
    }
    return false;
}

} // namespace

const std::vector<ExtractionPattern>& LiteralExtractor::defaultPatterns() {
    static const std::vector<ExtractionPattern> patterns = [] {
        std::string props = std::string("[\"']?\\b(?:") + kPropertyNames + ")\\b[\"']?\\s*:\\s*";
        return std::vector<ExtractionPattern>{
            {"property-double", props + doubleQuoted(), 1, false},
            {"property-single", props + singleQuoted(), 1, false},
            {"sentence", "\"([A-Z][^\"\\\\\\n]{0,498}\\.)\"", 1, true},
            {"return-double", "\\breturn\\s*" + doubleQuoted(), 1, false},
            {"return-single", "\\breturn\\s*" + singleQuoted(), 1, false},
            {"children-arrow", "\\bchildren:\\s*\\(\\)\\s*=>\\s*" + doubleQuoted(), 1, false},
        };
    }();
    return patterns;
}

LiteralExtractor::LiteralExtractor() : LiteralExtractor(ExtractorOptions{}) {}

LiteralExtractor::LiteralExtractor(ExtractorOptions options) : options_(options) {
    compilePatterns();
}

// Compile structural patterns and the noise shapes once per extractor
// Yapisal kaliplari ve gurultu sekillerini cikarici basina bir kez derle
void LiteralExtractor::compilePatterns() {
    for (const auto& p : defaultPatterns()) {
        auto engine = RegexEngine::create(p.regex);
        if (!engine->isValid()) continue;
        patterns_.push_back({p, std::move(engine)});
    }

    for (const char* shape : {
            "[0-9]+",                                         // pure number
            "[A-Za-z0-9]{1,3}",                               // short token
            "(?:https?://|www\\.)[^\\s]*",                     // URL
            "[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\\.[A-Za-z]{2,}", // email
        }) {
        exclusions_.push_back(RegexEngine::create(shape));
    }

    identifierShape_ = RegexEngine::create("[A-Za-z0-9_/\\\\.-]+");
    capitalizedWord_ = RegexEngine::create("[A-Z][a-z0-9-]*");
}

// Run every pattern over the text, pool the filtered values, return them sorted
// Her kalibi metin uzerinde calistir, filtrelenmis degerleri topla, sirali dondur
std::vector<std::string> LiteralExtractor::extract(std::string_view text) const {
    std::unordered_set<std::string> pool;

    for (const auto& p : patterns_) {
        size_t raw = 0;
        size_t kept = 0;
        p.engine->forEachMatch(text, [&](const RegexMatch& m) {
            ++raw;
            if (p.def.group >= static_cast<int>(m.groups.size())) return true;
            const std::string& value = m.groups[static_cast<size_t>(p.def.group)];
            if (p.def.requireSpace && value.find(' ') == std::string::npos) return true;
            if (isCandidate(value) && pool.insert(value).second) ++kept;
            return true;
        });
        LOG_DEBUG("[Extract] ", p.def.name, ": ", raw, " matches, ", kept, " new");
    }

    std::vector<std::string> out(pool.begin(), pool.end());
    std::sort(out.begin(), out.end());
    LOG_INFO("[Extract] ", out.size(), " candidate strings");
    return out;
}

// Reject lengths outside limits, lone punctuation and the noise shapes
// Sinir disi uzunluklari, tek noktalama isaretlerini ve gurultu sekillerini reddet
bool LiteralExtractor::isCandidate(const std::string& value) const {
    std::string_view trimmed = trimView(value);
    size_t len = EncodingDetector::codePointCount(trimmed);
    if (len < options_.minLength || len > options_.maxLength) return false;

    if (trimmed.size() == 1 && std::ispunct(static_cast<unsigned char>(trimmed[0]))) {
        return false;
    }
    if (!hasLetter(trimmed)) return false;

    for (const auto& ex : exclusions_) {
        if (ex->matchesWhole(trimmed)) return false;
    }

    if (identifierShape_->matchesWhole(trimmed) && !capitalizedWord_->matchesWhole(trimmed)) {
        return false;
    }
    return true;
}

// Write the sorted candidate list, one per line
// Sirali aday listesini her satira bir tane olacak sekilde yaz
FileResult LiteralExtractor::writeArtifact(const std::vector<std::string>& candidates,
                                           const std::string& path) {
    std::string content;
    size_t total = 0;
    for (const auto& c : candidates) total += c.size() + 1;
    content.reserve(total);
    for (const auto& c : candidates) {
        content += c;
        content += '\n';
    }

    FileResult result = FileSystem::saveAtomic(path, content);
    if (result.success) {
        LOG_INFO("[Extract] Wrote ", candidates.size(), " strings to ", path);
    } else {
        LOG_ERROR("[Extract] ", result.message);
    }
    return result;
}

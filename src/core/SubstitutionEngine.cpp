// bundleloc — No impositions.
// Copyright (c) 2025 Berk Coşar <lookmainpoint@gmail.com>
// Licensed under the GNU Affero General Public License v3.0.
// See LICENSE file in the project root for full license text.

#include "SubstitutionEngine.h"
#include "EncodingDetector.h"
#include "Logger.h"
#include <algorithm>
#include <unordered_set>

namespace {

bool isIdentChar(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '_' || c == '$';
}

// Keywords after which a string literal may start
// Ardindan bir string literali baslayabilecek anahtar kelimeler
const std::unordered_set<std::string_view>& expressionKeywords() {
    static const std::unordered_set<std::string_view> words = {
        "return", "case", "typeof", "in", "of", "void", "delete", "throw",
        "else", "do", "yield", "await", "new", "instanceof"
    };
    return words;
}

} // namespace

SubstitutionEngine::SubstitutionEngine(size_t minKeyLength) : minKeyLength_(minKeyLength) {}

std::vector<std::pair<std::string_view, std::string_view>>
SubstitutionEngine::qualifyingEntries(const TranslationStore& store) const {
    std::vector<std::pair<std::string_view, std::string_view>> entries;
    entries.reserve(store.size());

    for (const auto& [key, value] : store.entries()) {
        if (value.empty() || value == key) continue;
        if (EncodingDetector::codePointCount(key) < minKeyLength_) continue;
        entries.emplace_back(key, value);
    }

    std::sort(entries.begin(), entries.end(), [](const auto& a, const auto& b) {
        if (a.first.size() != b.first.size()) return a.first.size() > b.first.size();
        return a.first < b.first;
    });
    return entries;
}

bool SubstitutionEngine::isEscaped(std::string_view text, size_t pos) {
    size_t backslashes = 0;
    while (pos > backslashes && text[pos - backslashes - 1] == '\\') ++backslashes;
    return (backslashes % 2) == 1;
}

// Next unescaped quote of the same kind on the same line, npos if the literal never closes
// Ayni satirdaki ayni turden kacissiz sonraki tirnak, literal kapanmiyorsa npos
size_t SubstitutionEngine::findClosingQuote(std::string_view text, size_t open) {
    const char quote = text[open];
    for (size_t i = open + 1; i < text.size(); ++i) {
        if (text[i] == '\n') return std::string_view::npos;
        if (text[i] == quote && !isEscaped(text, i)) return i;
    }
    return std::string_view::npos;
}

// Reject escaped quotes and quotes glued to a preceding identifier (closing quotes)
// Kacisli tirnaklari ve onceki bir tanimlayiciya yapisik tirnaklari (kapanis tirnaklari) reddet
bool SubstitutionEngine::canOpenLiteral(std::string_view text, size_t pos) {
    if (isEscaped(text, pos)) return false;

    size_t start = pos;
    while (start > 0 && isIdentChar(text[start - 1])) --start;
    if (start == pos) return true;

    return expressionKeywords().count(text.substr(start, pos - start)) > 0;
}

std::string SubstitutionEngine::escapeForQuote(const std::string& value, char quote) {
    std::string out;
    out.reserve(value.size() + 8);
    for (char c : value) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            default:
                if (c == quote) out += '\\';
                out += c;
        }
    }
    return out;
}

// One pass over the quotes of the text; longest key length tried first at each quote
// Metnin tirnaklari uzerinde tek gecis; her tirnakta once en uzun anahtar uzunlugu denenir
SubstitutionOutput SubstitutionEngine::apply(std::string_view text, const TranslationStore& store) const {
    SubstitutionOutput out;
    auto entries = qualifyingEntries(store);
    if (entries.empty()) {
        out.text.assign(text);
        LOG_INFO("[Substitute] No applicable translations found");
        return out;
    }

    std::unordered_map<std::string_view, size_t> index;
    index.reserve(entries.size());
    std::vector<size_t> lengths;
    for (size_t i = 0; i < entries.size(); ++i) {
        index.emplace(entries[i].first, i);
        if (lengths.empty() || lengths.back() != entries[i].first.size()) {
            lengths.push_back(entries[i].first.size());
        }
    }

    std::vector<size_t> hits(entries.size(), 0);
    std::vector<std::string> escapedDouble(entries.size());
    std::vector<std::string> escapedSingle(entries.size());

    out.text.reserve(text.size() + text.size() / 8);
    size_t copyFrom = 0;
    size_t pos = 0;
    const size_t n = text.size();

    while ((pos = text.find_first_of("\"'", pos)) != std::string_view::npos) {
        const char quote = text[pos];
        bool replaced = false;

        if (canOpenLiteral(text, pos)) {
            for (size_t len : lengths) {
                size_t close = pos + 1 + len;
                if (close >= n || text[close] != quote || isEscaped(text, close)) continue;

                std::string_view body = text.substr(pos + 1, len);
                if (body.find(quote) != std::string_view::npos) continue;

                auto it = index.find(body);
                if (it == index.end()) continue;

                size_t idx = it->second;
                std::string& escaped = (quote == '"') ? escapedDouble[idx] : escapedSingle[idx];
                if (escaped.empty()) {
                    escaped = escapeForQuote(std::string(entries[idx].second), quote);
                }

                out.text.append(text.substr(copyFrom, pos - copyFrom));
                out.text += quote;
                out.text += escaped;
                out.text += quote;
                copyFrom = close + 1;
                pos = close + 1;
                ++hits[idx];
                ++out.result.occurrencesReplaced;
                replaced = true;
                break;
            }
        }

        if (replaced) continue;
        if (canOpenLiteral(text, pos)) {
            // Not a key: step over the whole literal so quotes inside it never open one
            // Anahtar degil: icindeki tirnaklar yeni bir literal acmasin diye tum literali atla
            size_t close = findClosingQuote(text, pos);
            pos = (close == std::string_view::npos) ? pos + 1 : close + 1;
        } else {
            ++pos;
        }
    }
    out.text.append(text.substr(copyFrom));

    for (size_t h : hits) {
        if (h > 0) ++out.result.keysApplied;
    }

    if (out.result.keysApplied == 0) {
        LOG_INFO("[Substitute] No applicable translations found");
    } else {
        LOG_INFO("[Substitute] Applied ", out.result.keysApplied, " keys, replaced ",
                 out.result.occurrencesReplaced, " literals");
    }
    return out;
}

// bundleloc — No impositions.
// Copyright (c) 2025 Berk Coşar <lookmainpoint@gmail.com>
// Licensed under the GNU Affero General Public License v3.0.
// See LICENSE file in the project root for full license text.

#pragma once
#include "TranslationStore.h"
#include <string>
#include <string_view>
#include <vector>
#include <unordered_map>

// Counts reported by one substitution pass
// Tek bir degistirme gecisinin bildirdigi sayilar
struct SubstitutionResult {
    size_t keysApplied = 0;            // Distinct keys with >= 1 replacement / En az 1 degisimi olan farkli anahtarlar
    size_t occurrencesReplaced = 0;    // Quoted literals rewritten / Yeniden yazilan tirnakli literaller
};

// Output of SubstitutionEngine::apply
// SubstitutionEngine::apply ciktisi
struct SubstitutionOutput {
    std::string text;
    SubstitutionResult result;
};

// Rewrites whole quoted literals ("key" or 'key') whose content equals a translated key.
// Icerigi cevrilmis bir anahtara esit olan tum tirnakli literalleri ("key" veya 'key') yeniden yazar.
//
// Single left-to-right pass. At each quote, key lengths are tried longest first
// and only whole literals match, so a short key can never land inside a longer
// literal. An opening quote is ignored when it is escaped or when it directly
// follows an identifier (that quote closes the previous literal).
// Tek soldan saga gecis. Her tirnakta anahtar uzunluklari en uzundan baslayarak
// denenir ve yalnizca tum literaller eslesir, boylece kisa bir anahtar asla uzun bir
// literalin icine dusmez. Acilis tirnagi kacisliysa veya dogrudan bir tanimlayiciyi
// izliyorsa yok sayilir (o tirnak onceki literali kapatir).
class SubstitutionEngine {
public:
    explicit SubstitutionEngine(size_t minKeyLength = 3);

    // Rewrite text with every qualifying store entry; deterministic and idempotent
    // Metni uygun her depo girdisiyle yeniden yaz; deterministik ve idempotent
    SubstitutionOutput apply(std::string_view text, const TranslationStore& store) const;

    // Escape a translation so it is a valid body for the given quote character
    // Bir ceviriyi verilen tirnak karakteri icin gecerli govde olacak sekilde kacisla
    static std::string escapeForQuote(const std::string& value, char quote);

    size_t minKeyLength() const { return minKeyLength_; }

private:
    // Entries that take part: non-empty value, key >= minKeyLength code points,
    // value differs from key. Sorted longest key first, ties lexicographic.
    // Katilan girdiler: bos olmayan deger, anahtar >= minKeyLength kod noktasi,
    // deger anahtardan farkli. En uzun anahtar once, esitlikte sozluk sirasi.
    std::vector<std::pair<std::string_view, std::string_view>>
        qualifyingEntries(const TranslationStore& store) const;

    // True if the quote at pos can open a string literal
    // pos'taki tirnak bir string literali acabiliyorsa true
    static bool canOpenLiteral(std::string_view text, size_t pos);

    // True if the character at pos is escaped by an odd run of backslashes
    // pos'taki karakter tek sayida ters egik cizgiyle kacislanmissa true
    static bool isEscaped(std::string_view text, size_t pos);

    // Position of the quote closing the literal opened at open, or npos
    // open'da acilan literali kapatan tirnagin konumu veya npos
    static size_t findClosingQuote(std::string_view text, size_t open);

    size_t minKeyLength_;
};

// bundleloc — No impositions.
// Copyright (c) 2025 Berk Coşar <lookmainpoint@gmail.com>
// Licensed under the GNU Affero General Public License v3.0.
// See LICENSE file in the project root for full license text.

#pragma once
#include "RegexEngine.h"
#include "file.h"
#include <string>
#include <string_view>
#include <vector>
#include <memory>

// One structural pattern: a regex whose capture group holds the literal's content
// Tek bir yapisal kalip: yakalama grubu literal icerigini tutan bir regex
struct ExtractionPattern {
    std::string name;          // Pattern id for logs / Loglar icin kalip kimligi
    std::string regex;         // ECMAScript regex / ECMAScript regex
    int group = 1;             // Capture group of the value / Degerin yakalama grubu
    bool requireSpace = false; // Sentence forms need at least one space / Cumle formlari en az bir bosluk ister
};

// Extraction limits (code points)
// Cikarma sinirlari (kod noktasi)
struct ExtractorOptions {
    size_t minLength = 2;
    size_t maxLength = 500;
};

// Scans bundle text for user-visible string literals.
// Bundle metnini kullaniciya gorunen string literalleri icin tarar.
// Heuristic and best-effort: the bundle is never parsed, only quoted runs in
// known structural positions are collected, then noise is filtered out.
// Bulussel ve en iyi caba: bundle hic ayristirilmaz, yalnizca bilinen yapisal
// konumlardaki tirnakli diziler toplanir, sonra gurultu elenir.
class LiteralExtractor {
public:
    LiteralExtractor();
    explicit LiteralExtractor(ExtractorOptions options);

    // Pure function of the text: sorted, deduplicated candidate strings
    // Metnin saf fonksiyonu: sirali, tekillestirilmis aday dizeler
    std::vector<std::string> extract(std::string_view text) const;

    // Noise filter applied to every raw match
    // Her ham eslemeye uygulanan gurultu filtresi
    bool isCandidate(const std::string& value) const;

    // Built-in pattern list (property forms, sentences, returned literals)
    // Yerlesik kalip listesi (ozellik formlari, cumleler, dondurulen literaller)
    static const std::vector<ExtractionPattern>& defaultPatterns();

    // Write candidates as newline-delimited UTF-8, one per line
    // Adaylari satir satir UTF-8 olarak yaz
    static FileResult writeArtifact(const std::vector<std::string>& candidates,
                                    const std::string& path);

    const ExtractorOptions& options() const { return options_; }

private:
    struct CompiledPattern {
        ExtractionPattern def;
        std::unique_ptr<RegexEngine> engine;
    };

    void compilePatterns();

    ExtractorOptions options_;
    std::vector<CompiledPattern> patterns_;
    std::vector<std::unique_ptr<RegexEngine>> exclusions_;  // Whole-match noise shapes / Tam eslesen gurultu sekilleri
    std::unique_ptr<RegexEngine> identifierShape_;          // Bare path/identifier / Ciplak yol/tanimlayici
    std::unique_ptr<RegexEngine> capitalizedWord_;          // Allowed single word / Izin verilen tek kelime
};

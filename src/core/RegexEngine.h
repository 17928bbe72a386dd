// bundleloc — No impositions.
// Copyright (c) 2025 Berk Coşar <lookmainpoint@gmail.com>
// Licensed under the GNU Affero General Public License v3.0.
// See LICENSE file in the project root for full license text.

#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <memory>
#include <functional>

// Regex match result (position and captured groups)
// Regex esleme sonucu (konum ve yakalanan gruplar)
struct RegexMatch {
    size_t position = 0;              // Start position in text / Metindeki baslangic konumu
    size_t length = 0;                // Match length / Esleme uzunlugu
    std::vector<std::string> groups;  // Group 0 is the whole match / Grup 0 tum eslemedir
};

// Abstract regex engine interface for pluggable backends.
// Takilabilir arka uclar icin soyut regex motoru arayuzu.
// Works on string_view so multi-megabyte bundles are scanned without copies.
// Cok megabaytlik bundle'lar kopyasiz taransin diye string_view uzerinde calisir.
class RegexEngine {
public:
    virtual ~RegexEngine() = default;

    // Compile a regex pattern with options
    // Seceneklerle bir regex kalibi derle
    virtual bool compile(const std::string& pattern, bool caseSensitive = true) = 0;

    // Check if the engine has a valid compiled pattern
    // Motorun gecerli bir derlenmis kalibi olup olmadigini kontrol et
    virtual bool isValid() const = 0;

    // Visit every non-overlapping match in order; return false from fn to stop early
    // Her cakismayan eslemeyi sirayla ziyaret et; erken durmak icin fn'den false dondur
    virtual size_t forEachMatch(std::string_view text,
                                const std::function<bool(const RegexMatch&)>& fn) const = 0;

    // True if the whole text matches the pattern
    // Metnin tamami kaliba uyuyorsa true
    virtual bool matchesWhole(std::string_view text) const = 0;

    // Get last error message (empty if no error)
    // Son hata mesajini al (hata yoksa bos)
    virtual std::string lastError() const = 0;

    // Factory: create the default engine, optionally compiling a pattern right away
    // Fabrika: varsayilan motoru olustur, istege bagli olarak kalibi hemen derle
    static std::unique_ptr<RegexEngine> create();
    static std::unique_ptr<RegexEngine> create(const std::string& pattern, bool caseSensitive = true);
};

// Default implementation using std::regex (ECMAScript grammar)
// std::regex kullanan varsayilan uygulama (ECMAScript grameri)
class StdRegexEngine : public RegexEngine {
public:
    StdRegexEngine() = default;

    bool compile(const std::string& pattern, bool caseSensitive = true) override;
    bool isValid() const override;
    size_t forEachMatch(std::string_view text,
                        const std::function<bool(const RegexMatch&)>& fn) const override;
    bool matchesWhole(std::string_view text) const override;
    std::string lastError() const override;

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
    std::string error_;
};

// bundleloc — No impositions.
// Copyright (c) 2025 Berk Coşar <lookmainpoint@gmail.com>
// Licensed under the GNU Affero General Public License v3.0.
// See LICENSE file in the project root for full license text.

#include "RegexEngine.h"
#include "Logger.h"
#include <regex>

// Internal state for std::regex-based engine
// std::regex tabanli motor icin dahili durum
struct StdRegexEngine::Impl {
    std::regex re;
    bool valid = false;
};

namespace {

// Copy a cmatch into the engine-neutral RegexMatch, positions relative to base
// Bir cmatch'i motordan bagimsiz RegexMatch'e kopyala, konumlar base'e gore
void fillMatch(const std::cmatch& m, const char* base, RegexMatch& out) {
    out.position = static_cast<size_t>(m[0].first - base);
    out.length = static_cast<size_t>(m.length(0));
    out.groups.clear();
    out.groups.reserve(m.size());
    for (size_t i = 0; i < m.size(); ++i) {
        out.groups.push_back(m[i].matched ? m[i].str() : std::string());
    }
}

} // namespace

// Factory: create the default regex engine
// Fabrika: varsayilan regex motorunu olustur
std::unique_ptr<RegexEngine> RegexEngine::create() {
    return std::make_unique<StdRegexEngine>();
}

std::unique_ptr<RegexEngine> RegexEngine::create(const std::string& pattern, bool caseSensitive) {
    auto engine = create();
    if (!engine->compile(pattern, caseSensitive)) {
        LOG_ERROR("[Regex] Invalid pattern '", pattern, "': ", engine->lastError());
    }
    return engine;
}

// Compile a regex pattern with the given case sensitivity option
// Verilen buyuk/kucuk harf duyarlilik secenegiyle bir regex kalibi derle
bool StdRegexEngine::compile(const std::string& pattern, bool caseSensitive) {
    impl_ = std::make_shared<Impl>();
    error_.clear();
    try {
        auto flags = std::regex_constants::ECMAScript | std::regex_constants::optimize;
        if (!caseSensitive) flags |= std::regex_constants::icase;
        impl_->re = std::regex(pattern, flags);
        impl_->valid = true;
        return true;
    } catch (const std::regex_error& e) {
        error_ = e.what();
        impl_->valid = false;
        return false;
    }
}

// Check if engine has a valid compiled regex
// Motorun gecerli bir derlenmis regex'i olup olmadigini kontrol et
bool StdRegexEngine::isValid() const {
    return impl_ && impl_->valid;
}

// Walk all matches with cregex_iterator over the original buffer
// Orijinal tampon uzerinde cregex_iterator ile tum eslemeleri gez
size_t StdRegexEngine::forEachMatch(std::string_view text,
                                    const std::function<bool(const RegexMatch&)>& fn) const {
    if (!impl_ || !impl_->valid) return 0;

    const char* base = text.data();
    size_t count = 0;
    try {
        std::cregex_iterator it(base, base + text.size(), impl_->re);
        std::cregex_iterator end;
        RegexMatch match;
        for (; it != end; ++it) {
            fillMatch(*it, base, match);
            ++count;
            if (!fn(match)) break;
        }
    } catch (const std::regex_error& e) {
        // regex_error here means the engine hit its complexity or stack limit
        // Buradaki regex_error motorun karmasiklik veya yigin sinirina ulastigi anlamina gelir
        LOG_WARN("[Regex] scan stopped after ", count, " matches: ", e.what());
    }
    return count;
}

bool StdRegexEngine::matchesWhole(std::string_view text) const {
    if (!impl_ || !impl_->valid) return false;
    try {
        return std::regex_match(text.data(), text.data() + text.size(), impl_->re);
    } catch (const std::regex_error& e) {
        LOG_WARN("[Regex] match aborted: ", e.what());
        return false;
    }
}

// Get the last error message
// Son hata mesajini al
std::string StdRegexEngine::lastError() const {
    return error_;
}

// bundleloc — No impositions.
// Copyright (c) 2025 Berk Coşar <lookmainpoint@gmail.com>
// Licensed under the GNU Affero General Public License v3.0.
// See LICENSE file in the project root for full license text.

#include "Config.h"
#include "file.h"
#include "Logger.h"
#include <optional>
#include <sstream>

namespace {

// --flag=value options mapped straight onto config keys
// Dogrudan config anahtarlarina eslenen --flag=value secenekleri
const std::pair<std::string, std::string> kValueFlags[] = {
    {"--bundle=",         "bundle.path"},
    {"--lang=",           "translation.language"},
    {"--api-key=",        "translation.api_key"},
    {"--mode=",           "mode"},
    {"--backup=",         "backup.restore_from"},
    {"--log-level=",      "log.level"},
    {"--store-dir=",      "store.dir"},
    {"--backup-dir=",     "backup.dir"},
    {"--dictionary-dir=", "dictionary.dir"},
    {"--output=",         "extract.output"},
};

// Switches without a value and the key/value each one sets
// Degersiz anahtarlar ve her birinin ayarladigi anahtar/deger
struct Switch { const char* flag; const char* key; bool value; };
const Switch kSwitches[] = {
    {"--no-backup", "backup.enabled",    false},
    {"--dry-run",   "dry_run",           true},
    {"--prune",     "store.prune",       true},
    {"--json",      "json",              true},
    {"--no-verify",  "translation.verify", false},
    {"--log-file",  "log.file",          true},
};

// Numeric flags that only accept a positive whole number
// Yalnizca pozitif tam sayi kabul eden sayisal bayraklar
const std::pair<std::string, std::string> kPositiveFlags[] = {
    {"--chunk-size=", "translation.chunk_size"},
    {"--timeout=",    "translation.timeout_sec"},
};

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

std::optional<int> parsePositive(const std::string& text) {
    try {
        size_t used = 0;
        int n = std::stoi(text, &used);
        if (used == text.size() && n > 0) return n;
    } catch (const std::exception&) {
        // stoi rejects empty and non-numeric input; reported by the caller
        // stoi bos ve sayisal olmayan girdiyi reddeder; cagiran bildirir
    }
    return std::nullopt;
}

} // namespace

Config& Config::instance() {
    static Config inst;
    return inst;
}

// Built-in defaults, the lowest layer
// Yerlesik varsayilanlar, en alt katman
Config::Config() {
    data_ = json::parse(R"({
        "mode": "translate",
        "dry_run": false,
        "json": false,
        "bundle":      { "path": "", "search_paths": [] },
        "translation": { "language": "ko", "api_key": "", "chunk_size": 50,
                         "timeout_sec": 30, "verify": true },
        "store":       { "dir": "", "prune": false },
        "extract":     { "output": "strings.txt" },
        "substitute":  { "min_key_length": 3 },
        "backup":      { "enabled": true, "dir": "", "restore_from": "" },
        "dictionary":  { "dir": "" },
        "cache":       { "path": "" },
        "log":         { "level": "info", "file": false, "path": "" }
    })");
}

// Read a JSONC layer and deep-merge it; a missing or broken file leaves the config as it was
// Bir JSONC katmanini oku ve derin birlestir; eksik ya da bozuk dosya config'i degistirmez
bool Config::loadFile(const std::string& path) {
    auto bytes = FileSystem::loadBytes(path);
    if (!bytes) {
        LOG_DEBUG("[Config] No config at ", path);
        return false;
    }

    json parsed = json::parse(stripComments(*bytes), nullptr, false);
    if (parsed.is_discarded()) {
        LOG_ERROR("[Config] Parse error in ", path);
        return false;
    }
    if (!parsed.is_object()) {
        LOG_ERROR("[Config] Not a JSON object: ", path);
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    deepMerge(data_, parsed);
    LOG_INFO("[Config] Loaded: ", path);
    return true;
}

bool Config::applyCliArgs(int argc, char* argv[], std::string* error) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto fail = [&](const std::string& msg) {
        LOG_ERROR("[Config] ", msg);
        if (error) *error = msg;
        return false;
    };

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        bool handled = false;

        for (const auto& [flag, key] : kValueFlags) {
            if (startsWith(arg, flag)) {
                setLocked(key, arg.substr(flag.size()));
                handled = true;
                break;
            }
        }
        for (const auto& sw : kSwitches) {
            if (handled) break;
            if (arg == sw.flag) {
                setLocked(sw.key, sw.value);
                handled = true;
            }
        }
        for (const auto& [flag, key] : kPositiveFlags) {
            if (handled) break;
            if (startsWith(arg, flag)) {
                auto n = parsePositive(arg.substr(flag.size()));
                if (!n) return fail("Expected a positive number: " + arg);
                setLocked(key, *n);
                handled = true;
            }
        }

        if (!handled) return fail("Unknown argument: " + arg);
    }
    return true;
}

std::string Config::getString(const std::string& key, const std::string& defaultVal) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const json* node = resolve(key);
    return (node && node->is_string()) ? node->get<std::string>() : defaultVal;
}

int Config::getInt(const std::string& key, int defaultVal) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const json* node = resolve(key);
    return (node && node->is_number_integer()) ? node->get<int>() : defaultVal;
}

bool Config::getBool(const std::string& key, bool defaultVal) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const json* node = resolve(key);
    return (node && node->is_boolean()) ? node->get<bool>() : defaultVal;
}

// A single string counts as a one-element list
// Tek bir string tek elemanli liste sayilir
std::vector<std::string> Config::getStringList(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    const json* node = resolve(key);
    if (!node) return out;
    if (node->is_string()) {
        out.push_back(node->get<std::string>());
        return out;
    }
    if (node->is_array()) {
        for (const auto& item : *node) {
            if (item.is_string()) out.push_back(item.get<std::string>());
        }
    }
    return out;
}

void Config::set(const std::string& key, const json& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    setLocked(key, value);
}

void Config::setLocked(const std::string& key, const json& value) {
    auto parts = splitKey(key);
    if (parts.empty()) return;

    json* node = &data_;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        json& child = (*node)[parts[i]];
        if (!child.is_object()) child = json::object();
        node = &child;
    }
    (*node)[parts.back()] = value;
}

// Drop // and /* */ comments outside string literals
// String literallerin disindaki // ve /* */ yorumlarini at
std::string Config::stripComments(const std::string& input) {
    enum class State { Code, String, Escape, LineComment, BlockComment };
    State state = State::Code;
    std::string out;
    out.reserve(input.size());

    for (size_t i = 0; i < input.size(); ++i) {
        const char c = input[i];
        const char next = (i + 1 < input.size()) ? input[i + 1] : '\0';

        switch (state) {
            case State::Code:
                if (c == '/' && next == '/') { state = State::LineComment; ++i; break; }
                if (c == '/' && next == '*') { state = State::BlockComment; ++i; break; }
                if (c == '"') state = State::String;
                out += c;
                break;
            case State::String:
                if (c == '\\') state = State::Escape;
                else if (c == '"') state = State::Code;
                out += c;
                break;
            case State::Escape:
                state = State::String;
                out += c;
                break;
            case State::LineComment:
                if (c == '\n') { state = State::Code; out += c; }
                break;
            case State::BlockComment:
                if (c == '*' && next == '/') { state = State::Code; ++i; }
                break;
        }
    }
    return out;
}

// Objects merge key by key; anything else in the override replaces the base value
// Nesneler anahtar anahtar birlesir; override'daki diger her sey temel degerin yerine gecer
void Config::deepMerge(json& base, const json& override) {
    for (const auto& [key, val] : override.items()) {
        auto it = base.find(key);
        if (val.is_object() && it != base.end() && it->is_object()) {
            deepMerge(*it, val);
        } else {
            base[key] = val;
        }
    }
}

const json* Config::resolve(const std::string& key) const {
    const json* node = &data_;
    for (const auto& part : splitKey(key)) {
        if (!node->is_object()) return nullptr;
        auto it = node->find(part);
        if (it == node->end()) return nullptr;
        node = &*it;
    }
    return node;
}

std::vector<std::string> Config::splitKey(const std::string& key) {
    std::vector<std::string> parts;
    std::istringstream ss(key);
    std::string part;
    while (std::getline(ss, part, '.')) {
        if (!part.empty()) parts.push_back(part);
    }
    return parts;
}

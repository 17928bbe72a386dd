// bundleloc — No impositions.
// Copyright (c) 2025 Berk Coşar <lookmainpoint@gmail.com>
// Licensed under the GNU Affero General Public License v3.0.
// See LICENSE file in the project root for full license text.

#include "EncodingDetector.h"
#include "Logger.h"

namespace {

struct Bom {
    std::string_view bytes;
    TextEncoding encoding;
};

// UTF-32 LE must be tested before UTF-16 LE, they share the FF FE prefix
// UTF-32 LE, UTF-16 LE'den once denenmeli, ikisi de FF FE ile baslar
constexpr Bom kBoms[] = {
    {std::string_view("\xFF\xFE\x00\x00", 4), TextEncoding::UTF32_LE},
    {std::string_view("\x00\x00\xFE\xFF", 4), TextEncoding::UTF32_BE},
    {std::string_view("\xEF\xBB\xBF", 3),     TextEncoding::UTF8_BOM},
    {std::string_view("\xFF\xFE", 2),         TextEncoding::UTF16_LE},
    {std::string_view("\xFE\xFF", 2),         TextEncoding::UTF16_BE},
};

constexpr bool isContinuation(uint8_t b) { return (b & 0xC0) == 0x80; }

// Length of the well-formed sequence starting at data[i], 0 if malformed.
// data[i]'de baslayan iyi bicimli dizinin uzunlugu, bozuksa 0.
// Overlong forms, surrogates and code points past U+10FFFF are malformed.
// Asiri uzun bicimler, vekiller ve U+10FFFF otesi kod noktalari bozuktur.
size_t sequenceLength(const uint8_t* data, size_t size, size_t i) {
    const uint8_t lead = data[i];
    size_t len;
    uint32_t cp;
    uint32_t minimum;
    if (lead < 0x80)                { return 1; }
    else if ((lead & 0xE0) == 0xC0) { len = 2; cp = lead & 0x1F; minimum = 0x80; }
    else if ((lead & 0xF0) == 0xE0) { len = 3; cp = lead & 0x0F; minimum = 0x800; }
    else if ((lead & 0xF8) == 0xF0) { len = 4; cp = lead & 0x07; minimum = 0x10000; }
    else return 0;

    if (i + len > size) return 0;
    for (size_t k = 1; k < len; ++k) {
        if (!isContinuation(data[i + k])) return 0;
        cp = (cp << 6) | (data[i + k] & 0x3F);
    }
    if (cp < minimum || cp > 0x10FFFF) return 0;
    if (cp >= 0xD800 && cp <= 0xDFFF) return 0;
    return len;
}

} // namespace

// BOM check first, then strict UTF-8, then Latin-1 for anything that is not binary
// Once BOM kontrolu, sonra kati UTF-8, ikili olmayan her sey icin Latin-1
DecodedText EncodingDetector::decode(std::string_view bytes) {
    DecodedText result;

    TextEncoding bomEnc = TextEncoding::Unknown;
    const size_t bomSize = detectBOM(bytes, bomEnc);
    if (bomSize > 0 && bomEnc != TextEncoding::UTF8_BOM) {
        result.encoding = bomEnc;
        result.message = "Unsupported encoding: " + encodingName(bomEnc);
        return result;
    }

    std::string_view body = bytes.substr(bomSize);
    const auto* data = reinterpret_cast<const uint8_t*>(body.data());

    if (isValidUTF8(data, body.size())) {
        result.ok = true;
        result.text.assign(body);
        if (bomSize > 0) result.encoding = TextEncoding::UTF8_BOM;
        else result.encoding = isASCII(data, body.size()) ? TextEncoding::ASCII : TextEncoding::UTF8;
        return result;
    }

    if (body.find('\0') != std::string_view::npos) {
        result.message = "Not valid UTF-8 and contains NUL bytes (binary data)";
        return result;
    }

    LOG_WARN("[Encoding] Input is not valid UTF-8, decoding as Latin-1");
    result.ok = true;
    result.usedFallback = true;
    result.encoding = TextEncoding::Latin1;
    result.text = latin1ToUTF8(body);
    return result;
}

std::string EncodingDetector::encodeForWrite(const std::string& utf8, TextEncoding source) {
    if (source != TextEncoding::UTF8_BOM) return utf8;
    std::string out;
    out.reserve(utf8.size() + 3);
    out.append(kBoms[2].bytes);
    out.append(utf8);
    return out;
}

size_t EncodingDetector::detectBOM(std::string_view data, TextEncoding& enc) {
    for (const auto& bom : kBoms) {
        if (data.substr(0, bom.bytes.size()) == bom.bytes) {
            enc = bom.encoding;
            return bom.bytes.size();
        }
    }
    return 0;
}

bool EncodingDetector::isValidUTF8(const uint8_t* data, size_t size) {
    for (size_t i = 0; i < size;) {
        size_t len = sequenceLength(data, size, i);
        if (len == 0) return false;
        i += len;
    }
    return true;
}

bool EncodingDetector::isASCII(const uint8_t* data, size_t size) {
    for (size_t i = 0; i < size; ++i) {
        if (data[i] & 0x80) return false;
    }
    return true;
}

size_t EncodingDetector::codePointCount(std::string_view utf8) {
    size_t count = 0;
    for (char c : utf8) {
        if (!isContinuation(static_cast<uint8_t>(c))) ++count;
    }
    return count;
}

std::string EncodingDetector::latin1ToUTF8(std::string_view data) {
    std::string out;
    out.reserve(data.size() + data.size() / 4);
    for (char ch : data) {
        const auto b = static_cast<uint8_t>(ch);
        if (b < 0x80) {
            out += ch;
        } else {
            out += static_cast<char>(0xC0 | (b >> 6));
            out += static_cast<char>(0x80 | (b & 0x3F));
        }
    }
    return out;
}

std::string EncodingDetector::encodingName(TextEncoding enc) {
    switch (enc) {
        case TextEncoding::UTF8:     return "UTF-8";
        case TextEncoding::UTF8_BOM: return "UTF-8 with BOM";
        case TextEncoding::ASCII:    return "ASCII";
        case TextEncoding::Latin1:   return "ISO-8859-1";
        case TextEncoding::UTF16_LE: return "UTF-16 LE";
        case TextEncoding::UTF16_BE: return "UTF-16 BE";
        case TextEncoding::UTF32_LE: return "UTF-32 LE";
        case TextEncoding::UTF32_BE: return "UTF-32 BE";
        case TextEncoding::Unknown:  return "Unknown";
    }
    return "Unknown";
}

// bundleloc — No impositions.
// Copyright (c) 2025 Berk Coşar <lookmainpoint@gmail.com>
// Licensed under the GNU Affero General Public License v3.0.
// See LICENSE file in the project root for full license text.

#pragma once
#include <string>
#include <string_view>
#include <cstdint>

// Encodings a bundle can arrive in
// Bir bundle'in gelebilecegi kodlamalar
enum class TextEncoding {
    UTF8,          // UTF-8 without BOM
    UTF8_BOM,      // UTF-8 with BOM
    ASCII,         // Pure 7-bit ASCII
    Latin1,        // ISO-8859-1, permissive fallback / ISO-8859-1, hosgoruli geri donus
    UTF16_LE,      // Rejected: BOM says UTF-16 LE / Reddedilir
    UTF16_BE,      // Rejected: BOM says UTF-16 BE / Reddedilir
    UTF32_LE,      // Rejected: BOM says UTF-32 LE / Reddedilir
    UTF32_BE,      // Rejected: BOM says UTF-32 BE / Reddedilir
    Unknown
};

// Result of decoding raw bundle bytes into UTF-8 text
// Ham bundle baytlarini UTF-8 metne cozmenin sonucu
struct DecodedText {
    bool ok = false;
    std::string text;                               // UTF-8 text without BOM / BOM'suz UTF-8 metin
    TextEncoding encoding = TextEncoding::Unknown;  // Source encoding / Kaynak kodlama
    bool usedFallback = false;                      // Latin-1 fallback was needed / Latin-1 geri donusu gerekti
    std::string message;
};

// Decodes bundle bytes (UTF-8 first, Latin-1 second) and re-encodes output as UTF-8.
// Bundle baytlarini cozer (once UTF-8, sonra Latin-1) ve ciktiyi UTF-8 olarak yeniden kodlar.
// No external dependencies (no ICU).
// Dis bagimliliklari yok (ICU yok).
class EncodingDetector {
public:
    // Decode bytes: BOM check, UTF-8 validation, Latin-1 fallback.
    // Baytlari coz: BOM kontrolu, UTF-8 dogrulama, Latin-1 geri donusu.
    // Fails for UTF-16/32 BOMs and for binary data (NUL bytes).
    // UTF-16/32 BOM'lari ve ikili veri (NUL baytlari) icin basarisiz olur.
    static DecodedText decode(std::string_view bytes);

    // Encode text for writing; output is always UTF-8, BOM restored if the source had one
    // Metni yazmak icin kodla; cikti her zaman UTF-8, kaynakta varsa BOM geri eklenir
    static std::string encodeForWrite(const std::string& utf8, TextEncoding source);

    // Check if data is valid UTF-8 (pure ASCII counts as valid)
    // Verinin gecerli UTF-8 olup olmadigini kontrol et (saf ASCII gecerli sayilir)
    static bool isValidUTF8(const uint8_t* data, size_t size);

    // Check if data is pure 7-bit ASCII
    // Verinin saf 7-bit ASCII olup olmadigini kontrol et
    static bool isASCII(const uint8_t* data, size_t size);

    // Number of code points in a UTF-8 string (continuation bytes are not counted)
    // UTF-8 dizesindeki kod noktasi sayisi (devam baytlari sayilmaz)
    static size_t codePointCount(std::string_view utf8);

    // Get human-readable encoding name
    // Insan tarafindan okunabilir kodlama adini al
    static std::string encodingName(TextEncoding enc);

private:
    // Recognize a BOM at the start of data, returns its size in bytes (0 if none)
    // Verinin basindaki BOM'u tani, boyutunu bayt olarak dondur (yoksa 0)
    static size_t detectBOM(std::string_view data, TextEncoding& enc);

    // Every Latin-1 byte is the code point of the same value
    // Her Latin-1 bayti ayni degerdeki kod noktasidir
    static std::string latin1ToUTF8(std::string_view data);
};

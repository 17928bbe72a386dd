#pragma once
#include <string>
#include <optional>
#include <cstdint>

// Result of a file I/O operation (success/failure, message, bytes written)
// Bir dosya giris/cikis isleminin sonucu (basari/basarisizlik, mesaj, yazilan bayt)
struct FileResult {
    bool success;
    std::string message;
    uintmax_t bytes = 0;
};

// Static file system operations for the bundle, stores and backups.
// Bundle, depolar ve yedekler icin statik dosya sistemi islemleri.
// Every write that replaces an existing file goes through a temp file + rename.
// Mevcut bir dosyanin yerine gecen her yazma gecici dosya + yeniden adlandirma ile yapilir.
class FileSystem {
public:
    // Load entire file as raw bytes
    // Tum dosyayi ham bayt olarak yukle
    static std::optional<std::string> loadBytes(const std::string& path);

    // Write content to a sibling temp file, flush it, then rename over path.
    // Icerigi kardes gecici dosyaya yaz, bosalt, sonra path uzerine yeniden adlandir.
    // On failure the previous file at path is left untouched.
    // Basarisizlikta path'teki onceki dosyaya dokunulmaz.
    static FileResult saveAtomic(const std::string& path, const std::string& content);

    // Copy src over dest through saveAtomic, then compare the bytes
    // src'yi saveAtomic ile dest uzerine kopyala, sonra baytlari karsilastir
    static FileResult copyFileAtomic(const std::string& src, const std::string& dest);

    // Plain copy that refuses to overwrite an existing dest
    // Mevcut dest'in uzerine yazmayi reddeden duz kopya
    static bool copyFile(const std::string& src, const std::string& dest);

    // Byte-for-byte comparison, size first
    // Bayt bayt karsilastirma, once boyut
    static bool filesEqual(const std::string& a, const std::string& b);

    // Size in bytes, or nullopt if the file is missing
    // Bayt cinsinden boyut, dosya yoksa nullopt
    static std::optional<uintmax_t> fileSize(const std::string& path);

    // Check if a regular file exists at the given path
    // Verilen yolda normal bir dosyanin var olup olmadigini kontrol et
    static bool exists(const std::string& path);

    // Delete a file at the given path
    // Verilen yoldaki dosyayi sil
    static bool deleteFile(const std::string& path);

    // Create the parent directory of path if needed
    // Gerekirse path'in ust dizinini olustur
    static bool ensureParentDir(const std::string& path);
};

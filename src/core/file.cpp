#include "file.h"
#include "Logger.h"
#include <fstream>
#include <filesystem>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;

// Read a file and return its entire content as bytes
// Bir dosyayi oku ve tum icerigini bayt olarak dondur
std::optional<std::string> FileSystem::loadBytes(const std::string& path) {
    try {
        std::ifstream file(path, std::ios::in | std::ios::binary);
        if (!file.is_open()) {
            LOG_DEBUG("[File] loadBytes: cannot open ", path);
            return std::nullopt;
        }

        std::ostringstream ss;
        ss << file.rdbuf();
        if (file.bad()) {
            LOG_ERROR("[File] loadBytes: read failed for ", path);
            return std::nullopt;
        }
        return ss.str();
    } catch (const std::exception& e) {
        LOG_ERROR("[File] Exception in loadBytes: ", e.what());
        return std::nullopt;
    }
}

// Write to "<path>.tmp-<pid>", fsync-equivalent flush, keep permissions, then rename
// "<path>.tmp-<pid>" dosyasina yaz, bosalt, izinleri koru, sonra yeniden adlandir
FileResult FileSystem::saveAtomic(const std::string& path, const std::string& content) {
    FileResult result{false, "", 0};

    if (!ensureParentDir(path)) {
        result.message = "Cannot create parent directory for: " + path;
        return result;
    }

    std::string tmpPath = path + ".tmp-" + std::to_string(::getpid());

    {
        std::ofstream file(tmpPath, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            result.message = "Cannot open temp file: " + tmpPath;
            return result;
        }
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        file.flush();
        if (!file.good()) {
            file.close();
            std::error_code rmEc;
            fs::remove(tmpPath, rmEc);
            result.message = "Write failed: " + tmpPath;
            return result;
        }
    }

    std::error_code ec;
    if (fs::exists(path, ec)) {
        auto perms = fs::status(path, ec).permissions();
        if (!ec) fs::permissions(tmpPath, perms, ec);
        if (ec) {
            LOG_WARN("[File] Could not carry permissions to ", tmpPath, ": ", ec.message());
            ec.clear();
        }
    }

    fs::rename(tmpPath, path, ec);
    if (ec) {
        std::error_code rmEc;
        fs::remove(tmpPath, rmEc);
        result.message = "Rename failed for " + path + ": " + ec.message();
        return result;
    }

    result.success = true;
    result.bytes = content.size();
    result.message = "Saved " + path;
    return result;
}

// Copy a file atomically over dest and verify the bytes landed
// Bir dosyayi dest uzerine atomik olarak kopyala ve baytlarin yerine ulastigini dogrula
FileResult FileSystem::copyFileAtomic(const std::string& src, const std::string& dest) {
    auto bytes = loadBytes(src);
    if (!bytes) {
        return {false, "Cannot read source: " + src, 0};
    }

    FileResult result = saveAtomic(dest, *bytes);
    if (!result.success) return result;

    auto written = loadBytes(dest);
    if (!written || *written != *bytes) {
        return {false, "Verification failed after copy to " + dest, 0};
    }
    return result;
}

// Copy a file from source path to destination path, never overwriting
// Kaynak yoldan hedef yola bir dosya kopyala, asla uzerine yazma
bool FileSystem::copyFile(const std::string& src, const std::string& dest) {
    std::error_code ec;
    bool copied = fs::copy_file(src, dest, fs::copy_options::none, ec);
    if (ec) {
        LOG_ERROR("[File] copy ", src, " -> ", dest, " failed: ", ec.message());
        return false;
    }
    return copied;
}

// Compare two files: equal sizes first, then a chunked byte comparison
// Iki dosyayi karsilastir: once boyut esitligi, sonra parcali bayt karsilastirmasi
bool FileSystem::filesEqual(const std::string& a, const std::string& b) {
    auto sizeA = fileSize(a);
    auto sizeB = fileSize(b);
    if (!sizeA || !sizeB || *sizeA != *sizeB) return false;

    std::ifstream fa(a, std::ios::binary);
    std::ifstream fb(b, std::ios::binary);
    if (!fa.is_open() || !fb.is_open()) return false;

    constexpr size_t kChunk = 64 * 1024;
    std::string bufA(kChunk, '\0');
    std::string bufB(kChunk, '\0');
    while (fa && fb) {
        fa.read(bufA.data(), kChunk);
        fb.read(bufB.data(), kChunk);
        auto na = fa.gcount();
        auto nb = fb.gcount();
        if (na != nb) return false;
        if (bufA.compare(0, static_cast<size_t>(na), bufB, 0, static_cast<size_t>(nb)) != 0) {
            return false;
        }
    }
    return fa.eof() && fb.eof();
}

std::optional<uintmax_t> FileSystem::fileSize(const std::string& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) return std::nullopt;
    return size;
}

// Check if a regular file exists at the given path
// Verilen yolda normal bir dosya olup olmadigini kontrol et
bool FileSystem::exists(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(fs::path(path), ec);
}

// Delete a file at the given path
// Verilen yoldaki dosyayi sil
bool FileSystem::deleteFile(const std::string& path) {
    std::error_code ec;
    bool removed = fs::remove(path, ec);
    if (ec) {
        LOG_WARN("[File] Cannot delete ", path, ": ", ec.message());
        return false;
    }
    return removed;
}

bool FileSystem::ensureParentDir(const std::string& path) {
    fs::path parent = fs::path(path).parent_path();
    if (parent.empty()) return true;
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        LOG_ERROR("[File] Cannot create ", parent.string(), ": ", ec.message());
        return false;
    }
    return true;
}

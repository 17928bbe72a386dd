// bundleloc — No impositions.
// Copyright (c) 2025 Berk Coşar <lookmainpoint@gmail.com>
// Licensed under the GNU Affero General Public License v3.0.
// See LICENSE file in the project root for full license text.

#include "BundlelocPaths.h"
#include "Logger.h"
#include <cstdlib>
#include <filesystem>

#if defined(__APPLE__)
    #include <mach-o/dyld.h>
#elif defined(__linux__)
    #include <unistd.h>
#elif defined(_WIN32)
    #include <windows.h>
#endif

namespace fs = std::filesystem;
namespace bundleloc {

// Get the directory containing the running executable (macOS, Linux, Windows)
// Calisan yurutulebilir dosyanin bulundugu dizini al (macOS, Linux, Windows)
static std::string getExecutableDir() {
    char buf[4096];
    std::string exePath;

#if defined(__APPLE__)
    uint32_t size = sizeof(buf);
    if (_NSGetExecutablePath(buf, &size) == 0)
        exePath = buf;
    else
        exePath = fs::current_path().string();

#elif defined(__linux__)
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len > 0) {
        buf[len] = '\0';
        exePath = buf;
    } else {
        exePath = fs::current_path().string();
    }

#elif defined(_WIN32)
    DWORD len = GetModuleFileNameA(nullptr, buf, sizeof(buf));
    exePath = (len > 0) ? std::string(buf, len) : fs::current_path().string();
#else
    exePath = fs::current_path().string();
#endif

    return fs::path(exePath).parent_path().string();
}

// Return the singleton instance, resolving app and user paths on first call
// Tek ornek nesneyi dondur, ilk cagrimda uygulama ve kullanici yollarini coz
BundlelocPaths& BundlelocPaths::instance() {
    static BundlelocPaths paths;
    static bool initialized = false;

    if (!initialized) {
        initialized = true;
        paths.appRoot = getExecutableDir();

        const char* homeEnv = std::getenv("HOME");
#if defined(_WIN32)
        if (!homeEnv) homeEnv = std::getenv("USERPROFILE");
#endif
        paths.userHome = homeEnv ? homeEnv : fs::current_path().string();
        paths.userBundleloc = (fs::path(paths.userHome) / ".bundleloc").string();
    }
    return paths;
}

std::string BundlelocPaths::storesDir() const {
    return (fs::path(userBundleloc) / "stores").string();
}

std::string BundlelocPaths::backupsDir() const {
    return (fs::path(userBundleloc) / "backups").string();
}

std::string BundlelocPaths::dictionariesDir() const {
    return (fs::path(userBundleloc) / "dictionaries").string();
}

std::string BundlelocPaths::cacheFile() const {
    return (fs::path(userBundleloc) / "cache" / "paths.json").string();
}

std::string BundlelocPaths::logsDir() const {
    return (fs::path(userBundleloc) / "logs").string();
}

std::string BundlelocPaths::appConfigFile() const {
    return (fs::path(appRoot) / "config.jsonc").string();
}

std::string BundlelocPaths::userConfigFile() const {
    return (fs::path(userBundleloc) / "config.jsonc").string();
}

// Create the user .bundleloc directory structure (stores, backups, dictionaries, cache, logs)
// Kullanici .bundleloc dizin yapisini olustur (stores, backups, dictionaries, cache, logs)
void BundlelocPaths::ensureStructure() {
    for (const auto& sub : {"stores", "backups", "dictionaries", "cache", "logs"}) {
        ensureDir((fs::path(userBundleloc) / sub).string());
    }
}

// Create a directory at the given path if it does not already exist
// Verilen yolda dizin yoksa olustur
bool BundlelocPaths::ensureDir(const std::string& path) {
    try {
        fs::path p(path);
        if (!fs::exists(p)) {
            fs::create_directories(p);
            LOG_DEBUG("[bundleloc] created dir: ", p.string());
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("[bundleloc] failed to create dir: ", path, " (", e.what(), ")");
        return false;
    }
}

std::string BundlelocPaths::expandHome(const std::string& path) const {
    if (path == "~") return userHome;
    if (path.rfind("~/", 0) == 0) {
        return (fs::path(userHome) / path.substr(2)).string();
    }
    return path;
}

}

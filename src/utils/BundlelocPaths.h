#pragma once
#include <string>
#include <filesystem>

namespace bundleloc {

// Manages runtime directory paths for bundleloc.
// bundleloc icin calisma zamani dizin yollarini yonetir.
// Detects executable location and user home for the .bundleloc/ working tree.
// .bundleloc/ calisma agaci icin calistirilabilir dosya konumunu ve kullanici evini tespit eder.
struct BundlelocPaths {
    std::string appRoot;        // Directory where the binary resides / Binary'nin bulundugu dizin
    std::string userHome;       // User home directory (~) / Kullanici ev dizini (~)
    std::string userBundleloc;  // ~/.bundleloc/ working tree / ~/.bundleloc/ calisma agaci

    // Singleton access to the paths instance
    // Yollar ornegine tekil erisim
    static BundlelocPaths& instance();

    // Well-known subdirectories of ~/.bundleloc
    // ~/.bundleloc altindaki bilinen alt dizinler
    std::string storesDir() const;
    std::string backupsDir() const;
    std::string dictionariesDir() const;
    std::string cacheFile() const;
    std::string logsDir() const;
    std::string appConfigFile() const;
    std::string userConfigFile() const;

    // Create required directory structure if it doesn't exist
    // Gerekli dizin yapisini yoksa olustur
    void ensureStructure();

    // Create a directory (and parents) if it doesn't exist, false on failure
    // Yoksa bir dizin (ve ust dizinleri) olustur, basarisizlikta false
    static bool ensureDir(const std::string& path);

    // Expand a leading "~/" using the user home directory
    // Bastaki "~/" ifadesini kullanici ev diziniyle genislet
    std::string expandHome(const std::string& path) const;
};

}

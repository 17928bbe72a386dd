#pragma once
#include <iostream>
#include <fstream>
#include <string>
#include <mutex>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <cstdlib>
#include <filesystem>
#ifdef _WIN32
    #include <io.h>
    #define isatty _isatty
    #define STDERR_FILENO 2
#else
    #include <unistd.h>
#endif

// Log severity levels from lowest (Debug) to highest (Error)
// En dusukten (Debug) en yuksege (Error) log ciddiyet seviyeleri
enum class LogLevel { Debug, Info, Warn, Error };

// Thread-safe singleton logger shared by every pipeline stage.
// Tum hat asamalarinin paylastigi thread-safe tekil loglayici.
//
//   20:33:14.818  INFO  [Extract] 1843 candidate strings
//
// The leading [Tag] names the component and is colored on a terminal.
// Bastaki [Tag] bileseni adlandirir ve terminalde renklendirilir.
// Color is off when NO_COLOR is set or the stream is not a tty.
// NO_COLOR tanimliysa veya akis tty degilse renk kapalidir.
class Logger {
public:
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    void setLevel(LogLevel level) { level_ = level; }
    LogLevel getLevel() const { return level_; }
    void setColor(bool enabled) { color_ = enabled; }

    // Send every level to stderr, leaving stdout to the --json envelope
    // Her seviyeyi stderr'e gonder, stdout --json zarfina kalsin
    void setStderrOnly(bool enabled) { stderrOnly_ = enabled; }

    // "debug" / "info" / "warn" / "error", fallback on anything else
    // "debug" / "info" / "warn" / "error", digerlerinde varsayilan
    static LogLevel parseLevel(const std::string& name, LogLevel fallback = LogLevel::Info) {
        if (name == "debug") return LogLevel::Debug;
        if (name == "info")  return LogLevel::Info;
        if (name == "warn" || name == "warning") return LogLevel::Warn;
        if (name == "error") return LogLevel::Error;
        return fallback;
    }

    // Append a plain copy of every line to <dir>/bundleloc.log
    // Her satirin duz bir kopyasini <dir>/bundleloc.log dosyasina ekle
    bool enableFileLog(const std::string& dir) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        std::lock_guard<std::mutex> lock(mutex_);
        file_.open((std::filesystem::path(dir) / "bundleloc.log").string(), std::ios::app);
        return file_.is_open();
    }

    template<typename... Args>
    void debug(Args&&... args) { log(LogLevel::Debug, std::forward<Args>(args)...); }

    template<typename... Args>
    void info(Args&&... args) { log(LogLevel::Info, std::forward<Args>(args)...); }

    // Warn and Error always go to stderr
    // Warn ve Error her zaman stderr'e gider
    template<typename... Args>
    void warn(Args&&... args) { log(LogLevel::Warn, std::forward<Args>(args)...); }

    template<typename... Args>
    void error(Args&&... args) { log(LogLevel::Error, std::forward<Args>(args)...); }

private:
    Logger() {
        const char* nc = std::getenv("NO_COLOR");
        color_ = !(nc && nc[0] != '\0') && isatty(STDERR_FILENO);
    }

    LogLevel level_ = LogLevel::Info;
    bool color_ = true;
    bool stderrOnly_ = false;
    std::ofstream file_;
    std::mutex mutex_;

    static constexpr const char* kReset = "\x1b[0m";
    static constexpr const char* kBold  = "\x1b[1m";
    static constexpr const char* kDim   = "\x1b[2;90m";

    static std::string clock() {
        using namespace std::chrono;
        auto now = system_clock::now();
        std::time_t t = system_clock::to_time_t(now);
        auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
        std::tm tm{};
#ifdef _WIN32
        localtime_s(&tm, &t);
#else
        localtime_r(&t, &tm);
#endif
        std::ostringstream oss;
        oss << std::put_time(&tm, "%H:%M:%S") << '.'
            << std::setfill('0') << std::setw(3) << ms;
        return oss.str();
    }

    static const char* label(LogLevel level) {
        switch (level) {
            case LogLevel::Debug: return "DEBUG";
            case LogLevel::Info:  return " INFO";
            case LogLevel::Warn:  return " WARN";
            case LogLevel::Error: return "ERROR";
        }
        return "";
    }

    static const char* levelColor(LogLevel level) {
        switch (level) {
            case LogLevel::Debug: return "\x1b[90m";
            case LogLevel::Info:  return "\x1b[36m";
            case LogLevel::Warn:  return "\x1b[33m";
            case LogLevel::Error: return "\x1b[31m";
        }
        return "";
    }

    // Stage tags share a color with the stage that owns them
    // Asama etiketleri, sahibi olan asamayla ayni rengi paylasir
    static const char* tagColor(const std::string& tag) {
        if (tag == "Pipeline" || tag == "bundleloc") return "\x1b[32m";
        if (tag == "Extract" || tag == "Regex" || tag == "Encoding") return "\x1b[36m";
        if (tag == "Store")                         return "\x1b[34m";
        if (tag == "Translate" || tag == "DeepL")   return "\x1b[35m";
        if (tag == "Substitute")                    return "\x1b[38;5;208m";
        if (tag == "Backup" || tag == "File")       return "\x1b[33m";
        if (tag == "Locator")                       return "\x1b[38;5;117m";
        return "\x1b[38;5;43m";
    }

    // Only a leading "[Tag] " is colored; brackets inside messages are left alone
    // Yalnizca bastaki "[Tag] " renklendirilir; mesaj icindeki koseli parantezlere dokunulmaz
    std::string decorate(const std::string& msg) const {
        if (!color_ || msg.empty() || msg[0] != '[') return msg;
        size_t end = msg.find(']');
        if (end == std::string::npos || end > 24) return msg;
        std::string tag = msg.substr(1, end - 1);
        return std::string(tagColor(tag)) + kBold + msg.substr(0, end + 1) + kReset + msg.substr(end + 1);
    }

    template<typename... Args>
    void log(LogLevel level, Args&&... args) {
        if (level < level_) return;

        std::ostringstream body;
        (body << ... << std::forward<Args>(args));
        const std::string msg = body.str();
        const std::string ts = clock();

        std::lock_guard<std::mutex> lock(mutex_);
        auto& out = (stderrOnly_ || level >= LogLevel::Warn) ? std::cerr : std::cout;
        if (color_) {
            out << kDim << ts << kReset << "  " << levelColor(level) << kBold << label(level)
                << kReset << "  " << decorate(msg) << "\n";
        } else {
            out << ts << "  " << label(level) << "  " << msg << "\n";
        }

        if (file_.is_open()) {
            file_ << ts << "  " << label(level) << "  " << msg << std::endl;
        }
    }
};

#define LOG_DEBUG(...) Logger::instance().debug(__VA_ARGS__)
#define LOG_INFO(...)  Logger::instance().info(__VA_ARGS__)
#define LOG_WARN(...)  Logger::instance().warn(__VA_ARGS__)
#define LOG_ERROR(...) Logger::instance().error(__VA_ARGS__)

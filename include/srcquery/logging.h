#pragma once

// srcquery logging
//
// Lines look like
//   [2025-12-20 10:30:45.123] [DEBUG] [REASSEMBLY] message
// and are filtered by a global level plus optional per-module overrides.
// FATAL and ERROR are printed even at level NONE. Everything goes to one
// sink (stdout unless changed) except FATAL/ERROR, which always go to stderr.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <ctime>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>
#include <fmt/format.h>

// =============================================================================
// Levels and Modules
// =============================================================================

enum LogLevel {
    LOG_NONE  = 0,
    LOG_FATAL = 1,
    LOG_ERROR = 2,
    LOG_WARN  = 3,  // bad input that was rejected
    LOG_INFO  = 4,
    LOG_DEBUG = 5,  // one line per decoded or rejected packet
    LOG_TRACE = 6   // payload sizes, flags, fragment bookkeeping
};

enum LogModule {
    MOD_NET = 0,        // datagram framing
    MOD_NET_PACKET,     // packet decode/encode
    MOD_REASSEMBLY,     // split replies, bzip2, CRC32
    MOD_RCON,
    MOD_MASTER,
    MOD_CONFIG,
    MOD_MAIN,
    MOD_COUNT
};

namespace SQ
{
    namespace detail
    {
        struct LogModuleEntry
        {
            const char* name;
            LogModule mod;
        };

        constexpr std::array<LogModuleEntry, MOD_COUNT> LogModuleTable = {{
            {"NET", MOD_NET},
            {"NET_PACKET", MOD_NET_PACKET},
            {"REASSEMBLY", MOD_REASSEMBLY},
            {"RCON", MOD_RCON},
            {"MASTER", MOD_MASTER},
            {"CONFIG", MOD_CONFIG},
            {"MAIN", MOD_MAIN}
        }};

        struct LogLevelEntry
        {
            const char* name;   // accepted on the command line and in config
            const char* label;  // fixed width, printed in log lines
            LogLevel level;
        };

        constexpr std::array<LogLevelEntry, 7> LogLevelTable = {{
            {"NONE",  "NONE ", LOG_NONE},
            {"FATAL", "FATAL", LOG_FATAL},
            {"ERROR", "ERROR", LOG_ERROR},
            {"WARN",  "WARN ", LOG_WARN},
            {"INFO",  "INFO ", LOG_INFO},
            {"DEBUG", "DEBUG", LOG_DEBUG},
            {"TRACE", "TRACE", LOG_TRACE}
        }};
    }
}

inline const char* GetModuleName(LogModule mod) {
    if (mod >= 0 && mod < MOD_COUNT) {
        return SQ::detail::LogModuleTable[mod].name;
    }
    return "UNKNOWN";
}

// Unknown names return MOD_COUNT; callers skip those.
inline LogModule ParseModuleName(std::string_view name) {
    for (const auto& entry : SQ::detail::LogModuleTable) {
        if (name == entry.name) {
            return entry.mod;
        }
    }
    return MOD_COUNT;
}

inline const char* GetLevelName(LogLevel level) {
    if (level >= LOG_NONE && level <= LOG_TRACE) {
        return SQ::detail::LogLevelTable[level].label;
    }
    return "?????";
}

// Unknown names map to LOG_NONE. "OFF" is an alias of NONE.
inline LogLevel ParseLevelName(std::string_view name) {
    if (name == "OFF") {
        return LOG_NONE;
    }
    for (const auto& entry : SQ::detail::LogLevelTable) {
        if (name == entry.name) {
            return entry.level;
        }
    }
    return LOG_NONE;
}

// =============================================================================
// Timestamp Formatting
// =============================================================================

// "YYYY-MM-DD HH:MM:SS.mmm" in local time
inline void FormatTimestamp(char* buffer, size_t size) {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    struct tm local;
#ifdef _WIN32
    localtime_s(&local, &seconds);
#else
    localtime_r(&seconds, &local);
#endif

    snprintf(buffer, size, "%04d-%02d-%02d %02d:%02d:%02d.%03d",
        local.tm_year + 1900, local.tm_mon + 1, local.tm_mday,
        local.tm_hour, local.tm_min, local.tm_sec, static_cast<int>(millis));
}

// =============================================================================
// Logging State
// =============================================================================

class LogManager {
public:
    static LogManager& Instance() {
        static LogManager instance;
        return instance;
    }

    int GetGlobalLevel() const { return m_global_level.load(); }
    void SetGlobalLevel(int level) { m_global_level.store(level); }

    // -1 means the module follows the global level
    int GetModuleLevel(LogModule mod) const {
        if (mod >= 0 && mod < MOD_COUNT) {
            return m_module_levels[mod].load();
        }
        return -1;
    }

    void SetModuleLevel(LogModule mod, int level) {
        if (mod >= 0 && mod < MOD_COUNT) {
            m_module_levels[mod].store(level);
        }
    }

    bool ShouldLog(LogModule mod, LogLevel level) const {
        int mod_level = GetModuleLevel(mod);

        // A module override can silence errors; the global level cannot.
        if (level <= LOG_ERROR) {
            return mod_level < 0 || level <= mod_level;
        }

        int effective = mod_level >= 0 ? mod_level : GetGlobalLevel();
        return level <= effective;
    }

    // Safe to call from a signal handler.
    void IncreaseLevel() {
        int level = m_global_level.load();
        while (level < LOG_TRACE && !m_global_level.compare_exchange_weak(level, level + 1)) {
        }
    }

    void DecreaseLevel() {
        int level = m_global_level.load();
        while (level > LOG_NONE && !m_global_level.compare_exchange_weak(level, level - 1)) {
        }
    }

    // Sink for WARN..TRACE lines. Tools that print results on stdout point
    // this at std::cerr.
    void SetOutput(std::ostream& out) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_output = &out;
    }

    void Write(LogModule mod, LogLevel level, std::string_view message) {
        char timestamp[32];
        FormatTimestamp(timestamp, sizeof(timestamp));

        std::lock_guard<std::mutex> lock(m_mutex);
        std::ostream& out = level <= LOG_ERROR ? std::cerr : *m_output;
        out << "[" << timestamp << "] [" << GetLevelName(level) << "] [" << GetModuleName(mod) << "] "
            << message << std::endl;
    }

private:
    LogManager() : m_global_level(LOG_NONE), m_output(&std::cout) {
        for (auto& level : m_module_levels) {
            level.store(-1);
        }
    }

    std::atomic<int> m_global_level;
    std::array<std::atomic<int>, MOD_COUNT> m_module_levels;
    std::ostream* m_output;
    std::mutex m_mutex;
};

inline int GetLogLevel() {
    return LogManager::Instance().GetGlobalLevel();
}

inline void SetLogLevel(int level) {
    LogManager::Instance().SetGlobalLevel(level);
}

inline void SetModuleLogLevel(LogModule mod, int level) {
    LogManager::Instance().SetModuleLevel(mod, level);
}

inline bool ShouldLog(LogModule mod, LogLevel level) {
    return LogManager::Instance().ShouldLog(mod, level);
}

inline void LogLevelIncrease() {
    LogManager::Instance().IncreaseLevel();
}

inline void LogLevelDecrease() {
    LogManager::Instance().DecreaseLevel();
}

// =============================================================================
// Logging Macros
// =============================================================================
// Arguments are only evaluated when the line will be printed, so hex dumps
// and Describe() calls cost nothing at lower levels.

#define SQ_LOG_IMPL(module, level, ...) \
    do { \
        if (ShouldLog(module, level)) { \
            std::string _sq_msg; \
            try { \
                _sq_msg = fmt::format(__VA_ARGS__); \
            } catch (const fmt::format_error& _sq_ex) { \
                _sq_msg = std::string("(format error: ") + _sq_ex.what() + ")"; \
            } \
            LogManager::Instance().Write(module, level, _sq_msg); \
        } \
    } while(0)

#define LOG_FATAL(module, ...) SQ_LOG_IMPL(module, LOG_FATAL, __VA_ARGS__)
#define LOG_ERROR(module, ...) SQ_LOG_IMPL(module, LOG_ERROR, __VA_ARGS__)

#ifdef SQ_DEBUG
#define LOG_WARN(module, ...)  SQ_LOG_IMPL(module, LOG_WARN, __VA_ARGS__)
#define LOG_INFO(module, ...)  SQ_LOG_IMPL(module, LOG_INFO, __VA_ARGS__)
#define LOG_DEBUG(module, ...) SQ_LOG_IMPL(module, LOG_DEBUG, __VA_ARGS__)
#define LOG_TRACE(module, ...) SQ_LOG_IMPL(module, LOG_TRACE, __VA_ARGS__)
#else
// Release builds keep FATAL and ERROR only
#define LOG_WARN(module, ...)  ((void)0)
#define LOG_INFO(module, ...)  ((void)0)
#define LOG_DEBUG(module, ...) ((void)0)
#define LOG_TRACE(module, ...) ((void)0)
#endif

// =============================================================================
// Initialization
// =============================================================================

// Applies --log-level=LEVEL and --log-module=MODULE:LEVEL; other arguments
// are left for the caller. Malformed or unknown --log-module values are
// skipped.
inline void InitLogging(int argc, char* argv[]) {
    constexpr std::string_view level_flag = "--log-level=";
    constexpr std::string_view module_flag = "--log-module=";

    for (int i = 1; i < argc; i++) {
        std::string_view arg = argv[i];

        if (arg.substr(0, level_flag.size()) == level_flag) {
            SetLogLevel(ParseLevelName(arg.substr(level_flag.size())));
        }
        else if (arg.substr(0, module_flag.size()) == module_flag) {
            std::string_view value = arg.substr(module_flag.size());
            size_t colon = value.find(':');
            if (colon == std::string_view::npos) {
                continue;
            }
            LogModule mod = ParseModuleName(value.substr(0, colon));
            if (mod == MOD_COUNT) {
                continue;
            }
            SetModuleLogLevel(mod, ParseLevelName(value.substr(colon + 1)));
        }
    }
}

// Reads the "logging" section of a config file. Include <json/json.h>
// first to get it.
//   "logging": { "level": "INFO", "modules": { "REASSEMBLY": "TRACE" } }
#ifdef JSONCPP_VERSION_STRING
inline void InitLoggingFromJson(const Json::Value& config) {
    if (!config.isObject() || !config.isMember("logging")) {
        return;
    }

    const Json::Value& logging = config["logging"];
    if (!logging.isObject()) {
        return;
    }

    const Json::Value& level = logging["level"];
    if (level.isString()) {
        SetLogLevel(ParseLevelName(level.asString()));
    }

    const Json::Value& modules = logging["modules"];
    if (!modules.isObject()) {
        return;
    }
    for (const auto& name : modules.getMemberNames()) {
        LogModule mod = ParseModuleName(name);
        if (mod != MOD_COUNT && modules[name].isString()) {
            SetModuleLogLevel(mod, ParseLevelName(modules[name].asString()));
        }
    }
}
#endif

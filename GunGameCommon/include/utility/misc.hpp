#ifndef GUNGAMESERVER_MISC_HPP
#define GUNGAMESERVER_MISC_HPP
#include <cstdio>
#include <cstdarg>
#include <cstring>
#include <string>
#include <algorithm>
#include <utility>

namespace ggs {
    // lower values are more severe; anything above the current level is discarded
    enum class log_level: int {
        Bug = 1,
        Error,
        Important,
        Warning,
        Msg,
        Verbose,
    };

    void set_log_file(FILE* file);
    void set_logging_level(log_level level);
    log_level get_logging_level();
    bool parse_logging_level(const std::string& name, log_level& level);
    const char* get_logging_level_name(log_level level);

    void LogFileOutput(const char* pMsg);

    void DebugOutput(log_level eType, const char* pszMsg, int ansiColor);
    void DebugOutput(log_level eType, const char* pszMsg);

    void RightTrim(char* text);

    template <typename T>
    inline const T& ConvertArgument(const T& arg) noexcept {
        return arg;
    }

    inline const char* ConvertArgument(const std::string& str) noexcept {
        return str.c_str();
    }

    // create a new string and format it
    template <typename ... Args>
    inline std::string Sprintf(const char* fmt, Args&& ... args) {
        std::string buf(2048, 0);
        int length = std::snprintf(buf.data(), buf.size(), fmt, ConvertArgument(args)...);
        buf.resize(length < 0 ? 0 : std::min<std::size_t>(length, buf.size() - 1));
        return buf;
    }

    template <typename ... Args>
    inline void Logf(log_level level, int ansiColor, const char* fmt, Args&& ... args) {
        if (level > get_logging_level())
            return;
        char text[2048]{};
        std::snprintf(text, sizeof(text), fmt, ConvertArgument(args)...);
        RightTrim(text);
        DebugOutput(level, text, ansiColor);
    }

    template <typename ... Args>
    inline void Printf(const char* fmt, Args&& ... args) {
        Logf(log_level::Important, 0, fmt, std::forward<Args>(args)...);
    }

    template <typename ... Args>
    inline void Printf(int ansiColor, const char* fmt, Args&& ... args) {
        Logf(log_level::Important, ansiColor, fmt, std::forward<Args>(args)...);
    }

    inline void Printf(const char* fmt) {
        Printf("%s", fmt);
    }

    inline void Printf(int ansiColor, const char* fmt) {
        Printf(ansiColor, "%s", fmt);
    }

    // per-packet traces
    template <typename ... Args>
    inline void Verbosef(const char* fmt, Args&& ... args) {
        Logf(log_level::Verbose, 0, fmt, std::forward<Args>(args)...);
    }

    template <typename ... Args>
    inline void Warnf(const char* fmt, Args&& ... args) {
        Logf(log_level::Warning, 0, fmt, std::forward<Args>(args)...);
    }

    // logs to stderr and terminates the process
    [[noreturn]] void FatalError(const char* fmt, ...);

    void set_auto_flush_log(bool flush);
    void flush_log();
    void close_log();
}

#endif //GUNGAMESERVER_MISC_HPP

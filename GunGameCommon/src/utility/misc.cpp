#include <cstdlib>
#include <ctime>
#include <cstring>
#include <chrono>
#include <atomic>
#include <unistd.h>
#include <replxx.hxx>
#include "entity/globals.hpp"
#include "utility/misc.hpp"
#include "utility/ansi_colors.hpp"

namespace ggs {

    namespace {
        FILE* log_file = nullptr;
        std::atomic_bool auto_flush = false;
        std::atomic<log_level> logging_level = log_level::Important;

        void get_time_string(char* buf, std::size_t size) {
            auto time = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::tm local_time{};
            localtime_r(&time, &local_time);
            std::strftime(buf, size, "%m-%d %T", &local_time);
        }
    }

    void set_log_file(FILE* file) { log_file = file; }

    void set_logging_level(log_level level) { logging_level = level; }

    log_level get_logging_level() { return logging_level; }

    bool parse_logging_level(const std::string& name, log_level& level) {
        if (name == "important")
            level = log_level::Important;
        else if (name == "warning")
            level = log_level::Warning;
        else if (name == "msg")
            level = log_level::Msg;
        else if (name == "verbose")
            level = log_level::Verbose;
        else if (name == "error")
            level = log_level::Error;
        else
            return false;
        return true;
    }

    const char* get_logging_level_name(log_level level) {
        switch (level) {
            case log_level::Bug: return "bug";
            case log_level::Error: return "error";
            case log_level::Important: return "important";
            case log_level::Warning: return "warning";
            case log_level::Msg: return "msg";
            case log_level::Verbose: return "verbose";
        }
        return "unknown";
    }

    void LogFileOutput(const char* pMsg) {
        if (!log_file)
            return;
        char timeStr[15];
        get_time_string(timeStr, sizeof(timeStr));
        fprintf(log_file, "[%s] %s\n", timeStr, pMsg);
        if (auto_flush) fflush(log_file);
    }

    void RightTrim(char* text) {
        char* el = strchr(text, '\0');
        if (el > text && el[-1] == '\n')
            text[el - text - 1] = '\0';
    }

    void DebugOutput(log_level eType, const char* pszMsg, int ansiColor) {
        char timeStr[15];
        get_time_string(timeStr, sizeof(timeStr));

        if (log_file) {
            fprintf(log_file, "[%s] %s\n", timeStr, pszMsg);
            if (auto_flush) fflush(log_file);
        }

        if (eType == log_level::Bug) {
            fprintf(stderr, "\r[%s] %s\n", timeStr, pszMsg);
            fflush(stdout);
            fflush(stderr);
            if (log_file) fflush(log_file);
            return;
        }
        else if (!isatty(fileno(stdout))) {
            printf("[%s] %s\n", timeStr, pszMsg);
        }
        else {
            if (ansiColor == ansi::Reset)
                replxx_instance.print("\r[%s] %s\n", timeStr, pszMsg);
            else
                replxx_instance.print("\r[%s] %s%s\033[m\n", timeStr,
                                      ansi::get_escape_code(ansiColor).c_str(), pszMsg);
        }
        fflush(stdout);
    }

    void DebugOutput(log_level eType, const char* pszMsg) {
        DebugOutput(eType, pszMsg, ansi::Reset);
    }

    void FatalError(const char* fmt, ...) {
        char text[2048];
        va_list ap;
        va_start(ap, fmt);
        vsnprintf(text, sizeof(text), fmt, ap);
        va_end(ap);
        RightTrim(text);
        DebugOutput(log_level::Bug, text);
        close_log();
        std::exit(2);
    }

    void set_auto_flush_log(bool flush) {
        auto_flush = flush;
    }

    void flush_log() {
        if (!log_file) return;
        if (fflush(log_file) == 0)
            Printf("Log file flushed successfully.");
    }

    void close_log() {
        if (!log_file) return;
        fclose(log_file);
        log_file = nullptr;
    }
}

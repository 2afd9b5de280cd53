#ifndef GUNGAMESERVER_ROLE_HPP
#define GUNGAMESERVER_ROLE_HPP

#include <atomic>
#include <mutex>
#include <condition_variable>
#include "../entity/globals.hpp"
#include "../utility/ansi_colors.hpp"
#include "../utility/misc.hpp"

class role {
public:
    virtual ~role() = default;

    virtual bool setup() { return true; };
    virtual void run() = 0;
    virtual void shutdown() = 0;

    virtual bool running() {
        return running_;
    }

    // blocks until setup() has either started the role or given up
    void wait_till_started() {
        std::unique_lock<std::mutex> lk(startup_mutex_);
        startup_cv_.wait(lk, [this] { return running_ || startup_finished_; });
    }

    static void set_logging_level(ggs::log_level level) {
        ggs::set_logging_level(level);
    }

    static void set_log_file(FILE* file) {
        ggs::set_log_file(file);
    }

    static void destroy() {
        ggs::close_log();
    }

    template <typename ... Args>
    static void Printf(Args&& ... args) {
        ggs::Printf(std::forward<Args>(args)...);
    }

    static void LogFileOutput(const char* msg) {
        ggs::LogFileOutput(msg);
    }

protected:
    std::atomic_bool running_ = false;
    bool startup_finished_ = false;
    std::mutex startup_mutex_;
    std::condition_variable startup_cv_;

    void notify_started(bool success) {
        {
            std::lock_guard<std::mutex> lk(startup_mutex_);
            running_ = success;
            startup_finished_ = true;
        }
        startup_cv_.notify_all();
    }
};

#endif //GUNGAMESERVER_ROLE_HPP

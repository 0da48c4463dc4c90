#pragma once

#include <atomic>
#include <cstdio>
#include <exception>
#include <mutex>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>
#include <chrono>
#include <ctime>

namespace lcr {
namespace log {

// ---------------------------------------------------------
// Log level
// ---------------------------------------------------------
enum class Level : uint8_t {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

// Parses "trace" | "debug" | "info" | "warn" | "error" | "fatal".
// Unknown names fall back to Info.
[[nodiscard]]
inline Level parse_level(std::string_view name) noexcept {
    if (name == "trace") return Level::Trace;
    if (name == "debug") return Level::Debug;
    if (name == "warn")  return Level::Warn;
    if (name == "error") return Level::Error;
    if (name == "fatal") return Level::Fatal;
    return Level::Info;
}

// ---------------------------------------------------------
// Thread-safe logger
//
// Explicitly constructed and passed by reference to the
// components that log. Writes every accepted line to all
// registered outputs (console, log file, test buffers).
//
// Logging never throws: a line that cannot be formatted or
// written is reported on stderr and dropped.
// ---------------------------------------------------------
class Logger {
public:
    explicit Logger(Level lvl = Level::Info) noexcept
        : level_(lvl)
    {}

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_level(Level lvl) noexcept { level_.store(lvl, std::memory_order_relaxed); }

    [[nodiscard]]
    Level level() const noexcept { return level_.load(std::memory_order_relaxed); }

    [[nodiscard]]
    bool enabled(Level lvl) const noexcept { return lvl >= level(); }

    // Registers an output. The stream must outlive the logger.
    // Colored outputs receive ANSI escape codes.
    void add_output(std::ostream& os, bool color = false) {
        std::lock_guard<std::mutex> lock(mutex_);
        outputs_.push_back(Output{&os, color});
    }

    void clear_outputs() noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        outputs_.clear();
    }

    // ---------------------------------------------------------
    // Core logging function (thread-safe)
    // ---------------------------------------------------------
    void log(Level lvl, const std::string& msg) noexcept {
        if (!enabled(lvl)) return;
        try {
            const std::string ts = timestamp();
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& out : outputs_) {
                auto& os = *out.os;
                if (out.color) os << color_code(lvl);
                os << ts << " [" << level_name(lvl) << "] " << msg;
                if (out.color) os << "\033[0m"; // reset
                os << std::endl;
            }
        }
        catch (const std::exception& e) {
            drop(lvl, e.what());
        }
    }

    // Counts a lost line and reports it on stderr
    void drop(Level lvl, const char* what) noexcept {
        dropped_.fetch_add(1, std::memory_order_relaxed);
        std::fprintf(stderr, "[%s] log line dropped: %s\n", level_name(lvl), what);
    }

    [[nodiscard]]
    std::uint64_t dropped() const noexcept { return dropped_.load(std::memory_order_relaxed); }

    // Human-readable severity names
    [[nodiscard]]
    static const char* level_name(Level lvl) noexcept {
        switch (lvl) {
            case Level::Trace: return "TRACE";
            case Level::Debug: return "DEBUG";
            case Level::Info:  return "INFO";
            case Level::Warn:  return "WARN";
            case Level::Error: return "ERROR";
            case Level::Fatal: return "FATAL";
        }
        return "?????";
    }

private:
    struct Output {
        std::ostream* os;
        bool color;
    };

    // ANSI color mappings
    static constexpr const char* color_code(Level lvl) {
        switch (lvl) {
            case Level::Trace: return "\033[37m";     // light gray
            case Level::Debug: return "\033[36m";     // cyan
            case Level::Info:  return "\033[32m";     // green
            case Level::Warn:  return "\033[33m";     // yellow
            case Level::Error: return "\033[31m";     // red
            case Level::Fatal: return "\033[1;31m";   // bold bright red
        }
        return "\033[0m";
    }

    // Timestamp generation
    static std::string timestamp() {
        using namespace std::chrono;
        auto now = system_clock::now();
        auto t = system_clock::to_time_t(now);
        std::tm tm{};
        localtime_r(&t, &tm);
        char buf[64];
        std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
        return buf;
    }

private:
    std::vector<Output> outputs_;
    std::atomic<Level> level_;
    std::atomic<std::uint64_t> dropped_{0};
    std::mutex mutex_;
};

// ---------------------------------------------------------
// Streaming log wrapper (collects << into a string)
// ---------------------------------------------------------
class LogStream {
public:
    LogStream(Logger& logger, Level lvl) : logger_(logger), lvl_(lvl) {}

    // After a failed insertion the rest of the line is skipped
    template<typename T>
    LogStream& operator<<(const T& v) noexcept {
        if (failed_) return *this;
        try {
            ss_ << v;
        }
        catch (const std::exception& e) {
            failed_ = true;
            std::snprintf(failure_, sizeof(failure_), "%s", e.what());
        }
        return *this;
    }

    ~LogStream() {
        if (failed_) {
            logger_.drop(lvl_, failure_);
            return;
        }
        try {
            logger_.log(lvl_, ss_.str());
        }
        catch (const std::exception& e) {
            logger_.drop(lvl_, e.what());
        }
    }

private:
    Logger& logger_;
    Level lvl_;
    std::ostringstream ss_;
    bool failed_ = false;
    char failure_[128] = {};
};

} // namespace log
} // namespace lcr


// ---------------------------------------------------------
// Macros for easy logging
//
// The message expression is only evaluated when the level
// is enabled on the given logger.
// ---------------------------------------------------------
#define WD_LOG_LEVEL(logger, lvl) \
    if (!(logger).enabled((lvl))) {} else ::lcr::log::LogStream((logger), (lvl))

#define WD_TRACE(logger, msg)  WD_LOG_LEVEL(logger, ::lcr::log::Level::Trace) << msg
#define WD_DEBUG(logger, msg)  WD_LOG_LEVEL(logger, ::lcr::log::Level::Debug) << msg
#define WD_INFO(logger, msg)   WD_LOG_LEVEL(logger, ::lcr::log::Level::Info)  << msg
#define WD_WARN(logger, msg)   WD_LOG_LEVEL(logger, ::lcr::log::Level::Warn)  << msg
#define WD_ERROR(logger, msg)  WD_LOG_LEVEL(logger, ::lcr::log::Level::Error) << msg
#define WD_FATAL(logger, msg)  WD_LOG_LEVEL(logger, ::lcr::log::Level::Fatal) << msg

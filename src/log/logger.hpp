#pragma once

#include <atomic>
#include <chrono>
#include <fmt/chrono.h>
#include <fmt/color.h>
#include <fmt/core.h>
#include <memory>
#include <mutex>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

namespace strata::log {

    enum class Level { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Fatal = 5, Off = 6 };

    struct LogConfig {
        Level level = Level::Warn;
        bool console_output = true; // stderr; stdout belongs to the REPL
        std::string file_path = ""; // empty for no file output
    };

    // "trace", "debug", ... "off"; nullopt for anything else
    auto parse_level(std::string_view name) -> std::optional<Level>;
    auto level_name(Level level) -> std::string_view;

    class Logger {
      public:
        static auto instance() -> Logger &;

        Logger(const Logger &) = delete;
        Logger &operator=(const Logger &) = delete;

        void init(const LogConfig &config);
        void shutdown();

        template <typename... Args>
        void log(Level level, const std::source_location &loc,
                 fmt::format_string<Args...> format_str, Args &&...args) {
            if (level < current_level_.load(std::memory_order_relaxed))
                return;

            try {
                write_entry(level, loc, fmt::format(format_str, std::forward<Args>(args)...));
            } catch (const std::exception &e) {
                write_entry(Level::Error, loc, fmt::format("LOG FORMAT ERROR: {}", e.what()));
            }
        }

        void set_level(Level level) {
            current_level_.store(level, std::memory_order_relaxed);
            config_.level = level;
        }

        [[nodiscard]] auto level() const -> Level {
            return current_level_.load(std::memory_order_relaxed);
        }

        [[nodiscard]] auto is_initialized() const -> bool {
            return static_cast<bool>(impl_);
        }

      private:
        Logger() = default;
        ~Logger();

        void write_entry(Level level, const std::source_location &loc, const std::string &msg);

        struct Impl;
        std::unique_ptr<Impl> impl_;
        std::atomic<Level> current_level_{Level::Warn};
        LogConfig config_;
    };
} // namespace strata::log

// Level guidance
// - Trace: per-page cache traffic.
// - Debug: individual page flushes.
// - Info: open/teardown summaries.
// - Warn: rejected operations the caller can recover from (table full).
// - Error: an operation failed and its effect is lost.
// - Fatal: teardown could not persist a page; the process stops.

#define STRATA_LOG(lvl, ...)                                                                       \
    do {                                                                                           \
        auto &logger = ::strata::log::Logger::instance();                                          \
        if (logger.is_initialized()) {                                                             \
            logger.log(lvl, std::source_location::current(), __VA_ARGS__);                        \
        }                                                                                          \
    } while (0)

#define LOG_TRACE(...) STRATA_LOG(::strata::log::Level::Trace, __VA_ARGS__)
#define LOG_DEBUG(...) STRATA_LOG(::strata::log::Level::Debug, __VA_ARGS__)
#define LOG_INFO(...) STRATA_LOG(::strata::log::Level::Info, __VA_ARGS__)
#define LOG_WARN(...) STRATA_LOG(::strata::log::Level::Warn, __VA_ARGS__)
#define LOG_ERROR(...) STRATA_LOG(::strata::log::Level::Error, __VA_ARGS__)
#define LOG_FATAL(...) STRATA_LOG(::strata::log::Level::Fatal, __VA_ARGS__)

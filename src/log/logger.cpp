#include "log/logger.hpp"
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>

namespace strata::log {
    struct Logger::Impl {
        std::mutex write_mutex;
        std::ofstream log_file;
    };

    auto parse_level(std::string_view name) -> std::optional<Level> {
        if (name == "trace")
            return Level::Trace;
        if (name == "debug")
            return Level::Debug;
        if (name == "info")
            return Level::Info;
        if (name == "warn")
            return Level::Warn;
        if (name == "error")
            return Level::Error;
        if (name == "fatal")
            return Level::Fatal;
        if (name == "off")
            return Level::Off;
        return std::nullopt;
    }

    auto level_name(Level level) -> std::string_view {
        switch (level) {
        case Level::Trace:
            return "trace";
        case Level::Debug:
            return "debug";
        case Level::Info:
            return "info";
        case Level::Warn:
            return "warn";
        case Level::Error:
            return "error";
        case Level::Fatal:
            return "fatal";
        case Level::Off:
            return "off";
        }
        return "unknown";
    }

    auto Logger::instance() -> Logger & {
        static Logger instance;
        return instance;
    }

    Logger::~Logger() {
        shutdown();
    }

    void Logger::init(const LogConfig &config) {
        if (impl_) {
            LOG_WARN("Logger already initialized, ignoring duplicate init() call");
            return;
        }
        config_ = config;
        current_level_.store(config.level, std::memory_order_relaxed);
        impl_ = std::make_unique<Impl>();
        if (!config_.file_path.empty()) {
            impl_->log_file.open(config_.file_path, std::ios::out | std::ios::app);
            if (!impl_->log_file.is_open()) {
                std::fprintf(stderr, "Failed to open log file: %s\n", config_.file_path.c_str());
            }
        }
    }

    void Logger::shutdown() {
        if (impl_ && impl_->log_file.is_open()) {
            impl_->log_file.flush();
            impl_->log_file.close();
        }
        impl_.reset();
    }

    static auto get_level_color(Level level) -> fmt::text_style {
        switch (level) {
        case Level::Trace:
            return fmt::fg(fmt::color::gray);
        case Level::Debug:
            return fmt::fg(fmt::color::cyan);
        case Level::Info:
            return fmt::fg(fmt::color::green);
        case Level::Warn:
            return fmt::fg(fmt::color::yellow) | fmt::emphasis::bold;
        case Level::Error:
            return fmt::fg(fmt::color::red) | fmt::emphasis::bold;
        case Level::Fatal:
            return fmt::bg(fmt::color::red) | fmt::fg(fmt::color::white) | fmt::emphasis::bold;
        default:
            return fmt::fg(fmt::color::white);
        }
    }

    static auto get_level_string(Level level) -> std::string_view {
        switch (level) {
        case Level::Trace:
            return "TRACE";
        case Level::Debug:
            return "DEBUG";
        case Level::Info:
            return " INFO"; // Space for alignment
        case Level::Warn:
            return " WARN";
        case Level::Error:
            return "ERROR";
        case Level::Fatal:
            return "FATAL";
        default:
            return "UNKNOWN";
        }
    }

    void Logger::write_entry(Level level, const std::source_location &loc,
                             const std::string &msg) {
        if (!impl_)
            return;

        const std::string file_name = std::filesystem::path(loc.file_name()).filename().string();
        const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        const auto time_fmt = fmt::format("{:%Y-%m-%d %H:%M:%S}", fmt::localtime(now));

        std::lock_guard<std::mutex> lock(impl_->write_mutex);

        // Format: [YYYY-MM-DD HH:MM:SS] [LEVEL] [file:line] message
        if (config_.console_output) {
            fmt::print(stderr, "{} ", fmt::format(fmt::fg(fmt::color::dim_gray), "[{}]", time_fmt));
            fmt::print(stderr, "{} ",
                       fmt::format(get_level_color(level), "[{}]", get_level_string(level)));
            fmt::print(stderr, "{} ",
                       fmt::format(fmt::fg(fmt::color::steel_blue), "[{}:{}]", file_name,
                                   loc.line()));
            fmt::print(stderr, "{}\n", msg);
        }

        if (impl_->log_file.is_open()) {
            impl_->log_file << fmt::format("[{}] [{}] [{}:{}] {}\n", time_fmt,
                                           get_level_string(level), file_name, loc.line(), msg);
            // fatal entries precede process termination
            if (level >= Level::Error)
                impl_->log_file.flush();
        }
    }
} // namespace strata::log

#include "core/config.hpp"

#include <fmt/core.h>
#include <string_view>

namespace strata::core {

    static constexpr std::string_view LOG_LEVEL_FLAG = "--log-level=";
    static constexpr std::string_view LOG_FILE_FLAG = "--log-file=";
    static constexpr std::string_view QUIET_FLAG = "--quiet";

    auto parse_args(int argc, const char *const *argv) -> std::pair<Status, Config> {
        Config config;

        for (int i = 1; i < argc; ++i) {
            const std::string_view arg = argv[i];

            if (arg.starts_with(LOG_LEVEL_FLAG)) {
                const auto level = log::parse_level(arg.substr(LOG_LEVEL_FLAG.size()));
                if (!level) {
                    return {Status::InvalidArgument(fmt::format("Unknown log level in '{}'", arg)),
                            config};
                }
                config.log.level = *level;
            } else if (arg.starts_with(LOG_FILE_FLAG)) {
                config.log.file_path = std::string(arg.substr(LOG_FILE_FLAG.size()));
            } else if (arg == QUIET_FLAG) {
                config.log.console_output = false;
            } else if (arg.starts_with("--")) {
                return {Status::InvalidArgument(fmt::format("Unknown option '{}'", arg)), config};
            } else if (config.db_path.empty()) {
                config.db_path = std::string(arg);
            } else {
                return {Status::InvalidArgument(fmt::format("Unexpected argument '{}'", arg)),
                        config};
            }
        }

        if (config.db_path.empty()) {
            return {Status::InvalidArgument("Must supply a database filename."), config};
        }
        return {Status::Ok(), config};
    }

    auto usage(const std::string &program) -> std::string {
        return fmt::format("Usage: {} <db-file> [--log-level=trace|debug|info|warn|error|fatal|off] "
                           "[--log-file=<path>] [--quiet]",
                           program);
    }

} // namespace strata::core

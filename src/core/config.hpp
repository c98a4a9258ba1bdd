#pragma once

#include "core/status.hpp"
#include "log/logger.hpp"

#include <string>
#include <utility>

namespace strata::core {

    struct Config {
        std::string db_path;
        log::LogConfig log;
    };

    // strata <db-file> [--log-level=<level>] [--log-file=<path>] [--quiet]
    [[nodiscard]] auto parse_args(int argc, const char *const *argv) -> std::pair<Status, Config>;

    auto usage(const std::string &program) -> std::string;

} // namespace strata::core

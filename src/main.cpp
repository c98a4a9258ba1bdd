#include "core/config.hpp"
#include "frontend/repl.hpp"
#include "log/logger.hpp"
#include "storage/table.hpp"
#include <cstdlib>
#include <fmt/core.h>
#include <iostream>

auto main(int argc, char **argv) -> int {
    auto [arg_status, config] = strata::core::parse_args(argc, argv);
    if (!arg_status.ok()) {
        fmt::print(stderr, "{}\n{}\n", arg_status.message(),
                   strata::core::usage(argc > 0 ? argv[0] : "strata"));
        return EXIT_FAILURE;
    }

    auto &logger = strata::log::Logger::instance();
    logger.init(config.log);

    auto [open_status, table] = strata::storage::Table::open(config.db_path);
    if (!open_status.ok()) {
        LOG_ERROR("Unable to open database: {}", open_status.to_string());
        fmt::print(stderr, "Unable to open database '{}': {}\n", config.db_path,
                   open_status.to_string());
        logger.shutdown();
        return EXIT_FAILURE;
    }

    strata::frontend::Repl repl(*table, std::cin, std::cout);
    auto run_status = repl.run();
    if (!run_status.ok()) {
        LOG_ERROR("Session ended: {}", run_status.to_string());
    }

    // flush failures are fatal: report and stop with a failure code
    auto close_status = table->close();
    if (!close_status.ok()) {
        fmt::print(stderr, "Fatal: {}\n", close_status.to_string());
        logger.shutdown();
        return EXIT_FAILURE;
    }

    logger.shutdown();
    return run_status.ok() ? EXIT_SUCCESS : EXIT_FAILURE;
}

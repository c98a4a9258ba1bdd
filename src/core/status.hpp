#pragma once

#include <fmt/core.h>
#include <string>
#include <utility>

namespace strata::core {

    enum class StatusCode {
        Ok = 0,
        InvalidArgument = 1,
        IOError = 2,
        OutOfRange = 3,
        TableFull = 4
    };

    class Status {
      public:
        // default constructor : OK status (fast path)
        Status() : code_(StatusCode::Ok), msg_("") {}
        Status(StatusCode code, std::string msg) : code_(code), msg_(std::move(msg)) {}

        // static helpers
        static auto Ok() -> Status {
            return Status();
        }
        static auto InvalidArgument(const std::string &msg) -> Status {
            return Status(StatusCode::InvalidArgument, msg);
        }
        static auto IOError(const std::string &msg) -> Status {
            return Status(StatusCode::IOError, msg);
        }
        static auto OutOfRange(const std::string &msg) -> Status {
            return Status(StatusCode::OutOfRange, msg);
        }
        static auto TableFull(const std::string &msg) -> Status {
            return Status(StatusCode::TableFull, msg);
        }

        // checkers
        [[nodiscard]] auto ok() const -> bool {
            return code_ == StatusCode::Ok;
        }
        [[nodiscard]] auto is_table_full() const -> bool {
            return code_ == StatusCode::TableFull;
        }
        [[nodiscard]] auto is_out_of_range() const -> bool {
            return code_ == StatusCode::OutOfRange;
        }
        [[nodiscard]] auto code() const -> StatusCode {
            return code_;
        }
        [[nodiscard]] auto message() const -> const std::string & {
            return msg_;
        }

        // formatting for logging
        [[nodiscard]] auto to_string() const -> std::string {
            if (ok())
                return "OK";
            return fmt::format("{}: {}", code_to_string(code_), msg_);
        }

      private:
        StatusCode code_;
        std::string msg_;

        static auto code_to_string(StatusCode code) -> std::string {
            switch (code) {
            case StatusCode::Ok:
                return "Ok";
            case StatusCode::InvalidArgument:
                return "InvalidArgument";
            case StatusCode::IOError:
                return "IOError";
            case StatusCode::OutOfRange:
                return "OutOfRange";
            case StatusCode::TableFull:
                return "TableFull";
            default:
                return "Unknown";
            }
        }
    };
} // namespace strata::core

#include "frontend/statement.hpp"

#include <cctype>
#include <charconv>
#include <fmt/core.h>
#include <optional>
#include <vector>

namespace strata::frontend {

    static auto split_whitespace(std::string_view input) -> std::vector<std::string_view> {
        std::vector<std::string_view> words;
        size_t pos = 0;
        while (pos < input.size()) {
            while (pos < input.size() && std::isspace(static_cast<unsigned char>(input[pos])))
                pos++;
            const size_t start = pos;
            while (pos < input.size() && !std::isspace(static_cast<unsigned char>(input[pos])))
                pos++;
            if (pos > start)
                words.push_back(input.substr(start, pos - start));
        }
        return words;
    }

    static auto parse_id(std::string_view text) -> std::optional<uint32_t> {
        if (!text.empty() && text.front() == '+')
            text.remove_prefix(1);

        uint32_t value = 0;
        const char *end = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(text.data(), end, value);
        if (text.empty() || ec != std::errc() || ptr != end)
            return std::nullopt;
        return value;
    }

    static auto invalid_input(std::string_view input) -> core::Status {
        return core::Status::InvalidArgument(fmt::format("Invalid input: '{}'.", input));
    }

    auto prepare_statement(std::string_view input) -> std::pair<core::Status, Statement> {
        const auto words = split_whitespace(input);
        if (words.empty()) {
            return {invalid_input(input), {}};
        }

        const std::string_view keyword = words[0];
        if (keyword == "select") {
            return {core::Status::Ok(), Statement{StatementType::Select, {}}};
        }
        if (keyword != "insert") {
            return {core::Status::InvalidArgument(
                        fmt::format("Unrecognized statement: '{}' in '{}'.", keyword, input)),
                    {}};
        }

        if (words.size() < 2) {
            return {invalid_input(input), {}};
        }
        const std::string_view id_text = words[1];
        const auto id = id_text.starts_with('-') ? std::nullopt : parse_id(id_text);
        if (!id) {
            return {core::Status::InvalidArgument(
                        fmt::format("Invalid id: '{}' in '{}'.\nId has to be a positive integer.",
                                    id_text, input)),
                    {}};
        }

        if (words.size() < 3) {
            return {invalid_input(input), {}};
        }
        const std::string_view username = words[2];
        if (username.size() > core::COLUMN_USERNAME_SIZE) {
            return {core::Status::InvalidArgument(fmt::format(
                        "Invalid username: '{}' in '{}'.\nMaximum valid size: {}.\nUsername's size: {}",
                        username, input, core::COLUMN_USERNAME_SIZE, username.size())),
                    {}};
        }

        if (words.size() < 4) {
            return {invalid_input(input), {}};
        }
        const std::string_view email = words[3];
        if (email.size() > core::COLUMN_EMAIL_SIZE) {
            return {core::Status::InvalidArgument(fmt::format(
                        "Invalid email: '{}' in '{}'.\nMaximum valid size: {}.\nEmail's size: {}",
                        email, input, core::COLUMN_EMAIL_SIZE, email.size())),
                    {}};
        }

        return {core::Status::Ok(),
                Statement{StatementType::Insert, storage::Row(*id, username, email)}};
    }

    auto do_meta_command(std::string_view input) -> std::pair<core::Status, MetaCommand> {
        if (input.starts_with(".exit")) {
            return {core::Status::Ok(), MetaCommand::Exit};
        }

        const auto words = split_whitespace(input);
        const std::string_view meta = words.empty() ? std::string_view() : words[0];
        return {core::Status::InvalidArgument(
                    fmt::format("Unrecognized command: '{}' in '{}'", meta, input)),
                MetaCommand::Exit};
    }

} // namespace strata::frontend

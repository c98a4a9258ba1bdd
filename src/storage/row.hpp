#pragma once

#include "core/common.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace strata::storage {

    // One record of the users table. Text columns are fixed width, left
    // justified and zero padded; one byte per character.
    struct Row {
        uint32_t id = 0;
        std::array<char, core::USERNAME_SIZE> username{};
        std::array<char, core::EMAIL_SIZE> email{};

        Row() = default;
        Row(uint32_t id, std::string_view username, std::string_view email);

        // Writes exactly ROW_SIZE bytes: id (little endian) | username | email
        void serialize(core::ByteSpan destination) const;
        [[nodiscard]] static auto deserialize(core::ConstByteSpan source) -> Row;

        // Column contents up to the zero padding, raw bytes
        [[nodiscard]] auto username_view() const -> std::string_view;
        [[nodiscard]] auto email_view() const -> std::string_view;

        // "(id username email)" with invalid UTF-8 replaced by U+FFFD
        [[nodiscard]] auto to_display() const -> std::string;

        friend auto operator==(const Row &, const Row &) -> bool = default;
    };

    // Lossy text rendering: each maximal invalid UTF-8 subsequence becomes U+FFFD.
    auto display_text(std::string_view column) -> std::string;

} // namespace strata::storage

#include "storage/row.hpp"

#include <algorithm>
#include <cstring>
#include <fmt/core.h>

namespace strata::storage {

    static constexpr std::string_view REPLACEMENT_CHARACTER = "\xEF\xBF\xBD";

    static auto write_le32(char *dest, uint32_t val) -> void {
        dest[0] = static_cast<char>(val & 0xFF);
        dest[1] = static_cast<char>((val >> 8) & 0xFF);
        dest[2] = static_cast<char>((val >> 16) & 0xFF);
        dest[3] = static_cast<char>((val >> 24) & 0xFF);
    }

    static auto read_le32(const char *data) -> uint32_t {
        return static_cast<uint32_t>(static_cast<unsigned char>(data[0])) |
               (static_cast<uint32_t>(static_cast<unsigned char>(data[1])) << 8) |
               (static_cast<uint32_t>(static_cast<unsigned char>(data[2])) << 16) |
               (static_cast<uint32_t>(static_cast<unsigned char>(data[3])) << 24);
    }

    template <size_t N>
    static auto fill_column(std::array<char, N> &column, std::string_view text) -> void {
        column.fill('\0');
        std::memcpy(column.data(), text.data(), std::min(text.size(), N));
    }

    static auto trim_padding(std::string_view column) -> std::string_view {
        while (!column.empty() && column.back() == '\0') {
            column.remove_suffix(1);
        }
        return column;
    }

    Row::Row(uint32_t id, std::string_view username, std::string_view email) : id(id) {
        fill_column(this->username, username);
        fill_column(this->email, email);
    }

    void Row::serialize(core::ByteSpan destination) const {
        write_le32(destination.data() + core::ID_OFFSET, id);
        std::memcpy(destination.data() + core::USERNAME_OFFSET, username.data(),
                    core::USERNAME_SIZE);
        std::memcpy(destination.data() + core::EMAIL_OFFSET, email.data(), core::EMAIL_SIZE);
    }

    auto Row::deserialize(core::ConstByteSpan source) -> Row {
        Row row;
        row.id = read_le32(source.data() + core::ID_OFFSET);
        std::memcpy(row.username.data(), source.data() + core::USERNAME_OFFSET,
                    core::USERNAME_SIZE);
        std::memcpy(row.email.data(), source.data() + core::EMAIL_OFFSET, core::EMAIL_SIZE);
        return row;
    }

    auto Row::username_view() const -> std::string_view {
        return trim_padding(std::string_view(username.data(), username.size()));
    }

    auto Row::email_view() const -> std::string_view {
        return trim_padding(std::string_view(email.data(), email.size()));
    }

    auto Row::to_display() const -> std::string {
        return fmt::format("({} {} {})", id, display_text(username_view()),
                           display_text(email_view()));
    }

    // Length of the valid UTF-8 prefix starting at text[pos] and the length the
    // lead byte announces. A byte that cannot start a sequence yields {0, 1}.
    static auto utf8_prefix(std::string_view text, size_t pos) -> std::pair<size_t, size_t> {
        const auto lead = static_cast<unsigned char>(text[pos]);
        if (lead < 0x80)
            return {1, 1};

        size_t expected = 0;
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF) {
            expected = 2;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            expected = 3;
            if (lead == 0xE0)
                lo = 0xA0;
            if (lead == 0xED)
                hi = 0x9F;
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            expected = 4;
            if (lead == 0xF0)
                lo = 0x90;
            if (lead == 0xF4)
                hi = 0x8F;
        } else {
            return {0, 1};
        }

        size_t valid = 1;
        while (valid < expected && pos + valid < text.size()) {
            const auto byte = static_cast<unsigned char>(text[pos + valid]);
            if (byte < lo || byte > hi)
                break;
            lo = 0x80;
            hi = 0xBF;
            ++valid;
        }
        return {valid, expected};
    }

    auto display_text(std::string_view column) -> std::string {
        std::string out;
        out.reserve(column.size());

        size_t pos = 0;
        while (pos < column.size()) {
            auto [valid, expected] = utf8_prefix(column, pos);
            if (valid == expected) {
                out.append(column.substr(pos, valid));
                pos += valid;
            } else {
                out.append(REPLACEMENT_CHARACTER);
                pos += std::max<size_t>(valid, 1);
            }
        }
        return out;
    }

} // namespace strata::storage

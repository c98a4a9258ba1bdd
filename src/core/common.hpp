#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace strata::core {

    // Column widths
    constexpr size_t COLUMN_USERNAME_SIZE = 32;
    constexpr size_t COLUMN_EMAIL_SIZE = 255;

    // Row layout: id | username | email, no gaps
    constexpr size_t ID_SIZE = sizeof(uint32_t);
    constexpr size_t USERNAME_SIZE = COLUMN_USERNAME_SIZE;
    constexpr size_t EMAIL_SIZE = COLUMN_EMAIL_SIZE;
    constexpr size_t ID_OFFSET = 0;
    constexpr size_t USERNAME_OFFSET = ID_OFFSET + ID_SIZE;
    constexpr size_t EMAIL_OFFSET = USERNAME_OFFSET + USERNAME_SIZE;
    constexpr size_t ROW_SIZE = ID_SIZE + USERNAME_SIZE + EMAIL_SIZE;

    // Paging
    constexpr size_t PAGE_SIZE = 4096;
    constexpr size_t TABLE_MAX_PAGES = 100;
    constexpr size_t ROWS_PER_PAGE = PAGE_SIZE / ROW_SIZE;
    constexpr size_t TABLE_MAX_ROWS = ROWS_PER_PAGE * TABLE_MAX_PAGES;

    static_assert(ROW_SIZE == 291, "row layout is part of the file format");
    static_assert(ROWS_PER_PAGE == 14, "row layout is part of the file format");

    using PageId = uint32_t;
    using RowId = size_t;

    using ByteSpan = std::span<char>;
    using ConstByteSpan = std::span<const char>;

} // namespace strata::core

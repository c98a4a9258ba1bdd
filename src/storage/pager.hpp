#pragma once

#include "core/common.hpp"
#include "core/status.hpp"

#include <array>
#include <memory>
#include <string>
#include <unistd.h>
#include <utility>

namespace strata::storage {

    using Page = std::array<char, core::PAGE_SIZE>;

    // Page cache over a single backing file. A slot stays empty until its page
    // is first requested; from then on the in-memory buffer is authoritative
    // and the file is only written by an explicit flush().
    class Pager {
        // restricts construction to open() while keeping make_unique usable
        struct OpenTag {
            explicit OpenTag() = default;
        };

      public:
        static auto open(const std::string &path) -> std::pair<core::Status, std::unique_ptr<Pager>>;
        Pager(OpenTag, std::string path, int fd, size_t file_length);
        ~Pager();

        Pager(const Pager &) = delete;
        Pager &operator=(const Pager &) = delete;
        Pager(Pager &&) = delete;
        Pager &operator=(Pager &&) = delete;

        // Loads the page on first access; later calls return the same buffer.
        auto get_page(core::PageId page_num) -> std::pair<core::Status, core::ByteSpan>;

        // Writes the first `size` bytes of a cached page. No-op for an empty slot.
        auto flush(core::PageId page_num, size_t size) -> core::Status;

        [[nodiscard]] auto is_cached(core::PageId page_num) const -> bool;
        void release(core::PageId page_num);
        void release_all();

        [[nodiscard]] auto file_length() const -> size_t {
            return file_length_;
        }
        // Pages present in the file at open time, counting a partial last page
        [[nodiscard]] auto file_pages() const -> size_t {
            return (file_length_ + core::PAGE_SIZE - 1) / core::PAGE_SIZE;
        }
        [[nodiscard]] auto cached_pages() const -> size_t;
        [[nodiscard]] auto path() const -> const std::string & {
            return path_;
        }

      private:
        class FileHandle {
          public:
            explicit FileHandle(int fd) : fd_(fd) {}
            ~FileHandle() {
                if (fd_ >= 0)
                    ::close(fd_);
            }

            FileHandle(const FileHandle &) = delete;
            FileHandle &operator=(const FileHandle &) = delete;

            [[nodiscard]] auto get() const -> int {
                return fd_;
            }
            // gives up ownership without closing
            auto release() -> int {
                return std::exchange(fd_, -1);
            }

          private:
            int fd_;
        };

        auto read_page(core::PageId page_num, Page &page) -> core::Status;

        std::string path_;
        FileHandle file_;
        size_t file_length_;
        std::array<std::unique_ptr<Page>, core::TABLE_MAX_PAGES> pages_;
    };

} // namespace strata::storage

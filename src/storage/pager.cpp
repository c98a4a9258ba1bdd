#include "storage/pager.hpp"
#include "log/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fmt/core.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <utility>

namespace strata::storage {

    static auto page_offset(core::PageId page_num) -> off_t {
        return static_cast<off_t>(page_num) * static_cast<off_t>(core::PAGE_SIZE);
    }

    auto Pager::open(const std::string &path) -> std::pair<core::Status, std::unique_ptr<Pager>> {
        int fd = ::open(path.c_str(), O_RDWR | O_CREAT, 0600);
        if (fd < 0) {
            return {core::Status::IOError(
                        fmt::format("Failed to open '{}': {}", path, strerror(errno))),
                    nullptr};
        }
        FileHandle guard(fd);

        struct stat st;
        if (::fstat(fd, &st) != 0) {
            return {core::Status::IOError(
                        fmt::format("Failed to stat '{}': {}", path, strerror(errno))),
                    nullptr};
        }
        if (!std::in_range<size_t>(st.st_size)) {
            return {core::Status::OutOfRange(fmt::format(
                        "File length of '{}' does not fit in size_t: {}", path, st.st_size)),
                    nullptr};
        }

        auto pager = std::make_unique<Pager>(OpenTag{}, path, guard.release(),
                                             static_cast<size_t>(st.st_size));

        LOG_INFO("Pager opened: path='{}', length={}, pages_on_disk={}", path,
                 pager->file_length_, pager->file_pages());
        return {core::Status::Ok(), std::move(pager)};
    }

    Pager::Pager(OpenTag, std::string path, int fd, size_t file_length)
        : path_(std::move(path)), file_(fd), file_length_(file_length), pages_() {}

    Pager::~Pager() {
        if (cached_pages() > 0) {
            LOG_DEBUG("Pager closing with {} unflushed page(s) discarded: path='{}'",
                      cached_pages(), path_);
        }
    }

    auto Pager::read_page(core::PageId page_num, Page &page) -> core::Status {
        if (::lseek(file_.get(), page_offset(page_num), SEEK_SET) < 0) {
            return core::Status::IOError(
                fmt::format("Failed to seek to page {}: {}", page_num, strerror(errno)));
        }

        size_t total_read = 0;
        while (total_read < page.size()) {
            ssize_t n = ::read(file_.get(), page.data() + total_read, page.size() - total_read);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return core::Status::IOError(
                    fmt::format("Failed to read page {}: {}", page_num, strerror(errno)));
            }
            if (n == 0) {
                // partial last page, remainder stays zeroed
                break;
            }
            total_read += static_cast<size_t>(n);
        }

        LOG_TRACE("Loaded page {} ({} bytes from disk)", page_num, total_read);
        return core::Status::Ok();
    }

    auto Pager::get_page(core::PageId page_num) -> std::pair<core::Status, core::ByteSpan> {
        if (page_num >= core::TABLE_MAX_PAGES) {
            return {core::Status::OutOfRange(fmt::format(
                        "Tried to fetch page out of bounds. {} >= {}", page_num,
                        core::TABLE_MAX_PAGES)),
                    {}};
        }

        auto &slot = pages_[page_num];
        if (!slot) {
            auto page = std::make_unique<Page>();
            page->fill('\0');

            if (page_num < file_pages()) {
                auto status = read_page(page_num, *page);
                if (!status.ok()) {
                    return {status, {}};
                }
            } else {
                LOG_TRACE("Allocated fresh page {}", page_num);
            }
            slot = std::move(page);
        }

        return {core::Status::Ok(), core::ByteSpan(slot->data(), slot->size())};
    }

    auto Pager::flush(core::PageId page_num, size_t size) -> core::Status {
        if (page_num >= core::TABLE_MAX_PAGES) {
            return core::Status::OutOfRange(fmt::format("Tried to flush page out of bounds. {} >= {}",
                                                        page_num, core::TABLE_MAX_PAGES));
        }
        if (size > core::PAGE_SIZE) {
            return core::Status::InvalidArgument(
                fmt::format("Flush size {} exceeds page size {}", size, core::PAGE_SIZE));
        }

        const auto &slot = pages_[page_num];
        if (!slot) {
            return core::Status::Ok();
        }

        if (::lseek(file_.get(), page_offset(page_num), SEEK_SET) < 0) {
            return core::Status::IOError(
                fmt::format("Unable to seek in flush of page {}: {}", page_num, strerror(errno)));
        }

        size_t total_written = 0;
        while (total_written < size) {
            ssize_t n = ::write(file_.get(), slot->data() + total_written, size - total_written);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return core::Status::IOError(fmt::format("Unable to write in flush of page {}: {}",
                                                         page_num, strerror(errno)));
            }
            if (n == 0) {
                return core::Status::IOError(
                    fmt::format("Short write flushing page {} (wrote 0 bytes)", page_num));
            }
            total_written += static_cast<size_t>(n);
        }

        LOG_DEBUG("Flushed page {} ({} bytes)", page_num, size);
        return core::Status::Ok();
    }

    auto Pager::is_cached(core::PageId page_num) const -> bool {
        return page_num < core::TABLE_MAX_PAGES && pages_[page_num] != nullptr;
    }

    void Pager::release(core::PageId page_num) {
        if (page_num < core::TABLE_MAX_PAGES) {
            pages_[page_num].reset();
        }
    }

    void Pager::release_all() {
        for (auto &slot : pages_) {
            slot.reset();
        }
    }

    auto Pager::cached_pages() const -> size_t {
        return static_cast<size_t>(
            std::count_if(pages_.begin(), pages_.end(), [](const auto &slot) { return slot != nullptr; }));
    }

} // namespace strata::storage

#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <string>

#include "page_io.h"

namespace strata {

/*
    PageStoreReader

    Read-only access to one partition file of fixed-size pages.
    Page N lives at byte offset N * page_size.

    read_page() throws CorruptPageError when the stored checksum does not
    match the page contents and StructureError when the page or file does
    not have the expected shape. Mismatches are never retried.
*/
class PageStoreReader {
public:
    PageStoreReader(const std::filesystem::path& path, uint32_t page_size, uint32_t partition);

    uint32_t page_count() const { return page_count_; }
    uint32_t page_size() const { return page_size_; }
    const std::filesystem::path& path() const { return path_; }

    PageView read_page(uint32_t page_index);

    // Reads pages 0..page_count-1 in order, skips never written pages.
    // Returns the number of pages handed to the visitor.
    uint32_t for_each_page(const std::function<void(const PageView&)>& visitor);

private:
    std::filesystem::path path_;
    uint32_t page_size_;
    uint32_t partition_;
    uint32_t page_count_;
    std::ifstream file_;
};

}  // namespace strata

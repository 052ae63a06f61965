#include "page_store.h"

#include <limits>
#include <sstream>
#include <vector>

#include "strata_errors.h"

namespace strata {

PageStoreReader::PageStoreReader(const std::filesystem::path& path,
                                 uint32_t page_size,
                                 uint32_t partition)
    : path_(path),
      page_size_(page_size),
      partition_(partition),
      page_count_(0) {
    if (page_size_ < MIN_PAGE_SIZE) {
        throw StructureError("Invalid page size " + std::to_string(page_size_) +
                             " for partition file: " + path_.string());
    }
    if (partition_ > MAX_PARTITION_ID) {
        throw StructureError("Partition id " + std::to_string(partition_) + " exceeds " +
                             std::to_string(MAX_PARTITION_ID) + ": " + path_.string());
    }

    std::error_code ec;
    uint64_t size = std::filesystem::file_size(path_, ec);
    if (ec) {
        throw StrataError(FailureKind::Internal,
                          "Failed to stat partition file: " + path_.string() + ": " + ec.message());
    }
    if (size == 0) {
        throw StructureError("Partition file is empty: " + path_.string());
    }
    if (size % page_size_ != 0) {
        std::ostringstream ss;
        ss << "Partition file size " << size << " is not a multiple of page size "
           << page_size_ << ": " << path_.string();
        throw StructureError(ss.str());
    }
    if (size / page_size_ > std::numeric_limits<uint32_t>::max()) {
        throw StructureError("Partition file has more than " +
                             std::to_string(std::numeric_limits<uint32_t>::max()) +
                             " pages: " + path_.string());
    }
    page_count_ = static_cast<uint32_t>(size / page_size_);

    file_.open(path_, std::ios::binary | std::ios::in);
    if (!file_.is_open()) {
        throw StrataError(FailureKind::Internal, "Failed to open partition file: " + path_.string());
    }
}

PageView PageStoreReader::read_page(uint32_t page_index) {
    if (page_index >= page_count_) {
        throw StructureError("Page index " + std::to_string(page_index) + " is out of range [0, " +
                             std::to_string(page_count_) + ") in " + path_.string());
    }

    std::vector<uint8_t> buf(page_size_);
    file_.clear();
    file_.seekg(static_cast<std::streamoff>(page_index) * page_size_, std::ios::beg);
    file_.read(reinterpret_cast<char*>(buf.data()), page_size_);
    if (!file_ || static_cast<uint32_t>(file_.gcount()) != page_size_) {
        throw StructureError("Short read of page " + std::to_string(page_index) +
                             " in " + path_.string());
    }

    PageView page(page_index, std::move(buf));
    if (page.is_empty()) {
        return page;
    }

    uint32_t stored = page.stored_crc();
    uint32_t actual = page.computed_crc();
    if (stored != actual) {
        std::ostringstream ss;
        ss << "Failed to read page [file=" << path_.string() << ", pageIdx=" << page_index
           << ", pageId=0x" << std::hex << page.page_id() << "]: CRC mismatch (stored=0x"
           << stored << ", calculated=0x" << actual << ")";
        throw CorruptPageError(ss.str());
    }

    uint64_t page_id = page.page_id();
    if (page_index_of(page_id) != page_index || partition_of(page_id) != partition_) {
        std::ostringstream ss;
        ss << "Page id 0x" << std::hex << page_id << std::dec << " does not match position [partId="
           << partition_ << ", pageIdx=" << page_index << "] in " << path_.string();
        throw StructureError(ss.str());
    }

    return page;
}

uint32_t PageStoreReader::for_each_page(const std::function<void(const PageView&)>& visitor) {
    uint32_t visited = 0;
    for (uint32_t i = 0; i < page_count_; ++i) {
        PageView page = read_page(i);
        if (page.is_empty()) {
            continue;
        }
        visitor(page);
        ++visited;
    }
    return visited;
}

}  // namespace strata

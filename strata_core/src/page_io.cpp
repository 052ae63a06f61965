#include "page_io.h"

#include <algorithm>
#include <sstream>

#include <boost/crc.hpp>

#include "strata_errors.h"

namespace strata {

// ----------------------------
// Little-endian helpers
// ----------------------------
static uint64_t read_le(const uint8_t* p, std::size_t n) {
    uint64_t v = 0;
    for (std::size_t i = 0; i < n; ++i) {
        v |= static_cast<uint64_t>(p[i]) << (8 * i);
    }
    return v;
}

static void write_le(uint8_t* p, uint64_t v, std::size_t n) {
    for (std::size_t i = 0; i < n; ++i) {
        p[i] = static_cast<uint8_t>((v >> (8 * i)) & 0xFF);
    }
}

uint64_t make_page_id(uint8_t flags, uint32_t partition, uint32_t page_index) {
    if (partition > MAX_PARTITION_ID) {
        throw StructureError("Partition id " + std::to_string(partition) + " does not fit a page id");
    }
    return (static_cast<uint64_t>(flags) << 56) |
           (static_cast<uint64_t>(partition) << 32) |
           static_cast<uint64_t>(page_index);
}

uint32_t page_index_of(uint64_t page_id) {
    return static_cast<uint32_t>(page_id & 0xFFFFFFFFULL);
}

uint32_t partition_of(uint64_t page_id) {
    return static_cast<uint32_t>((page_id >> 32) & 0xFFFF);
}

uint32_t page_crc(const uint8_t* page, std::size_t page_size) {
    boost::crc_32_type crc;
    crc.process_bytes(page, PAGE_CRC_OFF);
    crc.process_bytes(page + PAGE_ID_OFF, page_size - PAGE_ID_OFF);
    return crc.checksum();
}

// ----------------------------
// PageView
// ----------------------------
PageView::PageView(uint32_t index, std::vector<uint8_t> bytes)
    : index_(index),
      bytes_(std::move(bytes)) {
    if (bytes_.size() < MIN_PAGE_SIZE) {
        throw StructureError("Page " + std::to_string(index_) + " is shorter than " +
                             std::to_string(MIN_PAGE_SIZE) + " bytes");
    }
}

uint16_t PageView::type_tag() const {
    return static_cast<uint16_t>(read_le(bytes_.data() + PAGE_TYPE_OFF, 2));
}

bool PageView::is_partition_meta() const {
    return type_tag() == static_cast<uint16_t>(PageType::PartitionMeta);
}

uint16_t PageView::version() const {
    return static_cast<uint16_t>(read_le(bytes_.data() + PAGE_VERSION_OFF, 2));
}

uint32_t PageView::stored_crc() const {
    return static_cast<uint32_t>(read_le(bytes_.data() + PAGE_CRC_OFF, 4));
}

uint32_t PageView::computed_crc() const {
    return page_crc(bytes_.data(), bytes_.size());
}

uint64_t PageView::page_id() const {
    return read_le(bytes_.data() + PAGE_ID_OFF, 8);
}

void PageView::require_meta() const {
    if (!is_partition_meta()) {
        std::ostringstream ss;
        ss << "Page " << index_ << " is not a partition meta page (type=" << type_tag() << ")";
        throw StructureError(ss.str());
    }
}

uint64_t PageView::update_counter() const {
    require_meta();
    return read_le(bytes_.data() + META_UPDATE_COUNTER_OFF, 8);
}

uint64_t PageView::partition_size() const {
    require_meta();
    return read_le(bytes_.data() + META_SIZE_OFF, 8);
}

uint8_t PageView::partition_state() const {
    require_meta();
    return bytes_[META_STATE_OFF];
}

bool PageView::is_empty() const {
    return std::all_of(bytes_.begin(), bytes_.end(), [](uint8_t b) { return b == 0; });
}

// ----------------------------
// PageBuffer
// ----------------------------
PageBuffer::PageBuffer(uint32_t page_size)
    : bytes_(page_size, 0) {
    if (page_size < MIN_PAGE_SIZE) {
        throw std::invalid_argument("page size must be at least " + std::to_string(MIN_PAGE_SIZE));
    }
}

PageBuffer::PageBuffer(std::vector<uint8_t> bytes)
    : bytes_(std::move(bytes)) {
    if (bytes_.size() < MIN_PAGE_SIZE) {
        throw std::invalid_argument("page image shorter than " + std::to_string(MIN_PAGE_SIZE));
    }
}

void PageBuffer::init(PageType type, uint32_t partition, uint32_t page_index) {
    std::fill(bytes_.begin(), bytes_.end(), 0);
    write_le(bytes_.data() + PAGE_TYPE_OFF, static_cast<uint16_t>(type), 2);
    write_le(bytes_.data() + PAGE_VERSION_OFF, PAGE_FORMAT_VERSION, 2);
    write_le(bytes_.data() + PAGE_ID_OFF, make_page_id(PAGE_FLAG_DATA, partition, page_index), 8);
}

void PageBuffer::set_update_counter(uint64_t counter) {
    write_le(bytes_.data() + META_UPDATE_COUNTER_OFF, counter, 8);
}

void PageBuffer::set_partition_size(uint64_t size) {
    write_le(bytes_.data() + META_SIZE_OFF, size, 8);
}

void PageBuffer::set_partition_state(uint8_t state) {
    bytes_[META_STATE_OFF] = state;
}

void PageBuffer::set_stored_crc(uint32_t crc) {
    write_le(bytes_.data() + PAGE_CRC_OFF, crc, 4);
}

void PageBuffer::fill_payload(uint8_t seed) {
    for (std::size_t i = PAGE_HEADER_SIZE; i < bytes_.size(); ++i) {
        bytes_[i] = static_cast<uint8_t>(seed + i * 7);
    }
}

void PageBuffer::update_crc() {
    set_stored_crc(page_crc(bytes_.data(), bytes_.size()));
}

}  // namespace strata

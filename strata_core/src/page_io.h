#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace strata {

enum class PageType : uint16_t {
    Data          = 1,
    PartitionMeta = 2
};

// Page header layout, little-endian on disk:
//
//   [0]  u16 type
//   [2]  u16 version
//   [4]  u32 crc32 of the page with this field left out
//   [8]  u64 page id  (flags << 56 | partition << 32 | page index)
//   [16] u64 reserved
//
// Partition meta pages continue with
//
//   [24] u64 update counter
//   [32] u64 partition size
//   [40] u8  partition state
constexpr std::size_t PAGE_TYPE_OFF = 0;
constexpr std::size_t PAGE_VERSION_OFF = 2;
constexpr std::size_t PAGE_CRC_OFF = 4;
constexpr std::size_t PAGE_ID_OFF = 8;
constexpr std::size_t PAGE_HEADER_SIZE = 24;

constexpr std::size_t META_UPDATE_COUNTER_OFF = 24;
constexpr std::size_t META_SIZE_OFF = 32;
constexpr std::size_t META_STATE_OFF = 40;

constexpr uint32_t MIN_PAGE_SIZE = 64;
constexpr uint8_t PAGE_FLAG_DATA = 1;
constexpr uint16_t PAGE_FORMAT_VERSION = 1;

// The page id keeps 16 bits for the partition
constexpr uint32_t MAX_PARTITION_ID = 0xFFFF;

// Throws StructureError when the partition does not fit the page id
uint64_t make_page_id(uint8_t flags, uint32_t partition, uint32_t page_index);
uint32_t page_index_of(uint64_t page_id);
uint32_t partition_of(uint64_t page_id);

// CRC-32 over the page, skipping the crc field itself
uint32_t page_crc(const uint8_t* page, std::size_t page_size);

// Read-only view of one page as read from a partition file
class PageView {
public:
    PageView(uint32_t index, std::vector<uint8_t> bytes);

    uint32_t index() const { return index_; }
    std::size_t size() const { return bytes_.size(); }

    uint16_t type_tag() const;
    bool is_partition_meta() const;
    uint16_t version() const;
    uint32_t stored_crc() const;
    uint32_t computed_crc() const;
    uint64_t page_id() const;

    // Partition meta fields, throw StructureError on other page types
    uint64_t update_counter() const;
    uint64_t partition_size() const;
    uint8_t partition_state() const;

    // Never written pages are all zero
    bool is_empty() const;

    const std::vector<uint8_t>& bytes() const { return bytes_; }

private:
    void require_meta() const;

    uint32_t index_;
    std::vector<uint8_t> bytes_;
};

// Writable page image used to lay out partition files
class PageBuffer {
public:
    explicit PageBuffer(uint32_t page_size);
    PageBuffer(std::vector<uint8_t> bytes);

    void init(PageType type, uint32_t partition, uint32_t page_index);

    void set_update_counter(uint64_t counter);
    void set_partition_size(uint64_t size);
    void set_partition_state(uint8_t state);
    void set_stored_crc(uint32_t crc);
    void fill_payload(uint8_t seed);

    // Recompute and store the checksum, call after the last modification
    void update_crc();

    const std::vector<uint8_t>& bytes() const { return bytes_; }

private:
    std::vector<uint8_t> bytes_;
};

}  // namespace strata

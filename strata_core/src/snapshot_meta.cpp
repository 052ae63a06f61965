#include "snapshot_meta.h"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>

#include "strata_wire.h"

namespace fs = std::filesystem;

namespace strata {

using namespace wire;

static constexpr uint32_t SMF_MAGIC = 0x53534D46;   // "SSMF"
static constexpr uint32_t CGD_MAGIC = 0x53434744;   // "SCGD"
static constexpr uint16_t META_VERSION = 1;

namespace {

void seal(std::vector<uint8_t>& out) {
    put_u32(out, crc32(out));
}

// Checks the trailing crc and returns the length of the sealed content
bool unseal(const std::vector<uint8_t>& buf, std::size_t& content_len) {
    if (buf.size() < 4) {
        return false;
    }
    content_len = buf.size() - 4;
    std::size_t off = content_len;
    uint32_t stored = 0;
    get_u32(buf, off, stored);
    return crc32(buf.data(), content_len) == stored;
}

bool read_file_bytes(const fs::path& file, std::vector<uint8_t>& out) {
    std::ifstream in(file, std::ios::binary);
    if (!in.is_open()) {
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return !in.bad();
}

void write_file_bytes(const fs::path& file, const std::vector<uint8_t>& bytes) {
    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("Failed to open for writing: " + file.string());
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out) {
        throw std::runtime_error("Failed to write: " + file.string());
    }
}

}  // namespace

// -------- snapshot metafile --------
//
//   [u32 magic][u16 version][str snapshot][str node_id][u64 epoch][u32 page_size]
//   [u32 n] baseline ids
//   [u32 n] groups: [i32 id][str name][u32 partitions][u32 backups][u32 n] filter ids
//   [u32 crc32]

void encode_snapshot_metadata(const SnapshotMetadata& meta, std::vector<uint8_t>& out) {
    const auto& d = meta.descriptor;
    out.clear();
    put_u32(out, SMF_MAGIC);
    put_u16(out, META_VERSION);
    put_string(out, d.name);
    put_string(out, meta.node_id);
    put_u64(out, d.epoch);
    put_u32(out, d.page_size);

    put_u32(out, static_cast<uint32_t>(d.baseline.size()));
    for (const auto& id : d.baseline) {
        put_string(out, id);
    }

    put_u32(out, static_cast<uint32_t>(d.groups.size()));
    for (const auto& g : d.groups) {
        put_i32(out, g.id);
        put_string(out, g.name);
        put_u32(out, g.partitions);
        put_u32(out, g.backups);
        put_u32(out, static_cast<uint32_t>(g.node_filter.size()));
        for (const auto& id : g.node_filter) {
            put_string(out, id);
        }
    }
    seal(out);
}

bool decode_snapshot_metadata(const std::vector<uint8_t>& buf, SnapshotMetadata& meta) {
    std::size_t content_len = 0;
    if (!unseal(buf, content_len)) return false;

    std::vector<uint8_t> content(buf.begin(), buf.begin() + static_cast<std::ptrdiff_t>(content_len));
    std::size_t off = 0;

    uint32_t magic = 0;
    uint16_t version = 0;
    if (!get_u32(content, off, magic) || magic != SMF_MAGIC) return false;
    if (!get_u16(content, off, version) || version != META_VERSION) return false;

    SnapshotDescriptor& d = meta.descriptor;
    d = SnapshotDescriptor{};
    if (!get_string(content, off, d.name)) return false;
    if (!get_string(content, off, meta.node_id)) return false;
    if (!get_u64(content, off, d.epoch)) return false;
    if (!get_u32(content, off, d.page_size)) return false;

    uint32_t n = 0;
    if (!get_u32(content, off, n)) return false;
    for (uint32_t i = 0; i < n; ++i) {
        std::string id;
        if (!get_string(content, off, id)) return false;
        d.baseline.push_back(std::move(id));
    }

    if (!get_u32(content, off, n)) return false;
    for (uint32_t i = 0; i < n; ++i) {
        CacheGroupDescriptor g;
        if (!get_i32(content, off, g.id)) return false;
        if (!get_string(content, off, g.name)) return false;
        if (!get_u32(content, off, g.partitions)) return false;
        if (!get_u32(content, off, g.backups)) return false;

        uint32_t filter = 0;
        if (!get_u32(content, off, filter)) return false;
        for (uint32_t j = 0; j < filter; ++j) {
            std::string id;
            if (!get_string(content, off, id)) return false;
            g.node_filter.push_back(std::move(id));
        }
        d.groups.push_back(std::move(g));
    }

    return off == content.size();
}

// -------- cache group data --------
//
//   [u32 magic][u16 version][i32 id][str name][u32 partitions][u32 backups][u32 crc32]

void encode_cache_group_data(const CacheGroupData& data, std::vector<uint8_t>& out) {
    out.clear();
    put_u32(out, CGD_MAGIC);
    put_u16(out, META_VERSION);
    put_i32(out, data.group_id);
    put_string(out, data.name);
    put_u32(out, data.partitions);
    put_u32(out, data.backups);
    seal(out);
}

bool decode_cache_group_data(const std::vector<uint8_t>& buf, CacheGroupData& data) {
    std::size_t content_len = 0;
    if (!unseal(buf, content_len)) return false;

    std::vector<uint8_t> content(buf.begin(), buf.begin() + static_cast<std::ptrdiff_t>(content_len));
    std::size_t off = 0;

    uint32_t magic = 0;
    uint16_t version = 0;
    if (!get_u32(content, off, magic) || magic != CGD_MAGIC) return false;
    if (!get_u16(content, off, version) || version != META_VERSION) return false;
    if (!get_i32(content, off, data.group_id)) return false;
    if (!get_string(content, off, data.name)) return false;
    if (!get_u32(content, off, data.partitions)) return false;
    if (!get_u32(content, off, data.backups)) return false;

    return off == content.size();
}

void write_snapshot_metadata(const fs::path& file, const SnapshotMetadata& meta) {
    std::vector<uint8_t> bytes;
    encode_snapshot_metadata(meta, bytes);
    write_file_bytes(file, bytes);
}

void write_cache_group_data(const fs::path& file, const CacheGroupData& data) {
    std::vector<uint8_t> bytes;
    encode_cache_group_data(data, bytes);
    write_file_bytes(file, bytes);
}

std::optional<SnapshotMetadata> read_snapshot_metadata(const fs::path& file) {
    std::vector<uint8_t> bytes;
    if (!read_file_bytes(file, bytes)) {
        return std::nullopt;
    }
    SnapshotMetadata meta;
    if (!decode_snapshot_metadata(bytes, meta)) {
        return std::nullopt;
    }
    return meta;
}

std::optional<CacheGroupData> read_cache_group_data(const fs::path& file) {
    std::vector<uint8_t> bytes;
    if (!read_file_bytes(file, bytes)) {
        return std::nullopt;
    }
    CacheGroupData data{};
    if (!decode_cache_group_data(bytes, data)) {
        return std::nullopt;
    }
    return data;
}

// -------- catalog --------

SnapshotCatalog::SnapshotCatalog(fs::path snapshot_root, std::string node_id)
    : root_(std::move(snapshot_root)),
      node_id_(std::move(node_id)) {}

std::optional<SnapshotDescriptor> SnapshotCatalog::find(const std::string& name) const {
    fs::path dir = root_ / name;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return std::nullopt;
    }

    auto own = read_snapshot_metadata(dir / snapshot_meta_file_name(node_id_));
    if (own.has_value() && own->descriptor.name == name) {
        return own->descriptor;
    }

    std::vector<fs::path> candidates;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == SNAPSHOT_METAFILE_EXT) {
            candidates.push_back(entry.path());
        }
    }
    std::sort(candidates.begin(), candidates.end());

    for (const auto& file : candidates) {
        auto meta = read_snapshot_metadata(file);
        if (meta.has_value() && meta->descriptor.name == name) {
            return meta->descriptor;
        }
        std::cerr << "[SnapshotCatalog " << node_id_ << "] ignoring unreadable metafile "
                  << file.string() << "\n";
    }
    return std::nullopt;
}

std::vector<std::string> SnapshotCatalog::list() const {
    std::vector<std::string> out;
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        return out;
    }
    for (const auto& entry : fs::directory_iterator(root_, ec)) {
        if (entry.is_directory()) {
            out.push_back(entry.path().filename().string());
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

}  // namespace strata

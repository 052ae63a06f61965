#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "snapshot_types.h"

namespace strata {

// Content of <node>.smf, one per node in the snapshot directory
struct SnapshotMetadata {
    SnapshotDescriptor descriptor;
    std::string node_id;

    bool operator==(const SnapshotMetadata&) const = default;
};

// Content of cache_data.dat inside a cache group directory
struct CacheGroupData {
    int32_t group_id;
    std::string name;
    uint32_t partitions;
    uint32_t backups;

    bool operator==(const CacheGroupData&) const = default;
};

// Both formats: [u32 magic][u16 version] ... [u32 crc32 of everything before]
void encode_snapshot_metadata(const SnapshotMetadata& meta, std::vector<uint8_t>& out);
bool decode_snapshot_metadata(const std::vector<uint8_t>& buf, SnapshotMetadata& meta);

void encode_cache_group_data(const CacheGroupData& data, std::vector<uint8_t>& out);
bool decode_cache_group_data(const std::vector<uint8_t>& buf, CacheGroupData& data);

// Throws std::runtime_error when the file cannot be written
void write_snapshot_metadata(const std::filesystem::path& file, const SnapshotMetadata& meta);
void write_cache_group_data(const std::filesystem::path& file, const CacheGroupData& data);

// Returns nullopt when the file cannot be read or does not parse
std::optional<SnapshotMetadata> read_snapshot_metadata(const std::filesystem::path& file);
std::optional<CacheGroupData> read_cache_group_data(const std::filesystem::path& file);

/*
    SnapshotCatalog

    Resolves snapshot names to descriptors from the metafiles found under
    <snapshot_root>/<name>/. The local node's metafile is preferred, any
    other parseable one is accepted.
*/
class SnapshotCatalog {
public:
    SnapshotCatalog(std::filesystem::path snapshot_root, std::string node_id);

    std::optional<SnapshotDescriptor> find(const std::string& name) const;
    std::vector<std::string> list() const;

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
    std::string node_id_;
};

}  // namespace strata

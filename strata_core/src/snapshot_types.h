#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "strata_errors.h"

namespace strata {

struct PartitionKey {
    int32_t group_id;
    uint32_t partition;

    auto operator<=>(const PartitionKey&) const = default;
};

std::ostream& operator<<(std::ostream& os, const PartitionKey& key);

struct CacheGroupDescriptor {
    int32_t id;
    std::string name;
    uint32_t partitions;
    uint32_t backups;
    // Consistent ids admitted by the group's node filter, empty admits all
    std::vector<std::string> node_filter;

    bool admits(const std::string& node_id) const;

    bool operator==(const CacheGroupDescriptor&) const = default;
};

// Identity of a snapshot as recorded when it was created
struct SnapshotDescriptor {
    std::string name;
    uint64_t epoch{0};
    uint32_t page_size{0};
    std::vector<std::string> baseline;
    std::vector<CacheGroupDescriptor> groups;

    const CacheGroupDescriptor* find_group(int32_t id) const;

    bool operator==(const SnapshotDescriptor&) const = default;
};

struct PartitionRecord {
    PartitionKey key;
    uint64_t update_counter;
    bool checksum_ok;
    bool present;
    uint32_t pages_checked;

    bool operator==(const PartitionRecord&) const = default;
};

struct MissingMetadata {
    std::optional<int32_t> group_id;  // empty for the node metafile
    std::string file;

    bool operator==(const MissingMetadata&) const = default;
};

// Partitions one node is expected to hold for one cache group
struct ExpectedGroup {
    int32_t group_id;
    std::string name;
    std::vector<uint32_t> partitions;

    bool operator==(const ExpectedGroup&) const = default;
};

struct VerifyJobRequest {
    uint64_t job_id{0};
    std::string snapshot_name;
    uint32_t page_size{0};
    std::vector<ExpectedGroup> groups;

    bool operator==(const VerifyJobRequest&) const = default;
};

struct NodeVerificationOutcome {
    std::string node_id;
    std::optional<NodeFailure> failure;

    std::vector<PartitionRecord> partitions;
    std::vector<int32_t> missing_groups;
    std::vector<PartitionKey> missing_partitions;
    std::vector<MissingMetadata> missing_metadata;

    bool failed() const { return failure.has_value(); }

    static NodeVerificationOutcome failed_with(const std::string& node_id, NodeFailure failure);

    bool operator==(const NodeVerificationOutcome&) const = default;
};

// ---- snapshot file naming ----

// Group id derived from the group name, stable across nodes and restarts
int32_t cache_group_id(const std::string& group_name);

std::string cache_dir_name(const std::string& group_name);
std::string partition_file_name(uint32_t partition);
std::string snapshot_meta_file_name(const std::string& node_id);

extern const char* const SNAPSHOT_METAFILE_EXT;
extern const char* const CACHE_DATA_FILENAME;
extern const char* const SNAPSHOTS_DIR;

}  // namespace strata

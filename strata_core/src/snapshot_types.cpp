#include "snapshot_types.h"

#include <algorithm>

namespace strata {

const char* const SNAPSHOT_METAFILE_EXT = ".smf";
const char* const CACHE_DATA_FILENAME = "cache_data.dat";
const char* const SNAPSHOTS_DIR = "snapshots";

std::ostream& operator<<(std::ostream& os, const PartitionKey& key) {
    return os << "[grpId=" << key.group_id << ", partId=" << key.partition << "]";
}

bool CacheGroupDescriptor::admits(const std::string& node_id) const {
    if (node_filter.empty()) {
        return true;
    }
    return std::find(node_filter.begin(), node_filter.end(), node_id) != node_filter.end();
}

const CacheGroupDescriptor* SnapshotDescriptor::find_group(int32_t id) const {
    for (const auto& g : groups) {
        if (g.id == id) {
            return &g;
        }
    }
    return nullptr;
}

NodeVerificationOutcome NodeVerificationOutcome::failed_with(const std::string& node_id,
                                                             NodeFailure failure) {
    NodeVerificationOutcome out;
    out.node_id = node_id;
    out.failure = std::move(failure);
    return out;
}

int32_t cache_group_id(const std::string& group_name) {
    // 31-based string hash, wraps like a signed 32-bit integer
    uint32_t h = 0;
    for (unsigned char c : group_name) {
        h = h * 31u + c;
    }
    return static_cast<int32_t>(h);
}

std::string cache_dir_name(const std::string& group_name) {
    return "cache-" + group_name;
}

std::string partition_file_name(uint32_t partition) {
    return "part-" + std::to_string(partition) + ".bin";
}

std::string snapshot_meta_file_name(const std::string& node_id) {
    return node_id + SNAPSHOT_METAFILE_EXT;
}

}  // namespace strata

#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "snapshot_types.h"

namespace strata {

// Which baseline node holds which partition of a snapshot
struct PartitionAssignment {
    // primary first, then backups
    std::map<PartitionKey, std::vector<std::string>> owners;
    // group id -> baseline nodes admitted by the group's node filter
    std::map<int32_t, std::set<std::string>> eligible;

    bool is_owner(const PartitionKey& key, const std::string& node_id) const;
    bool is_eligible(const std::string& node_id) const;

    // Groups the node must hold, each with the partitions it owns (possibly none)
    std::vector<ExpectedGroup> expected_for(const SnapshotDescriptor& desc,
                                            const std::string& node_id) const;
};

class IAffinity {
public:
    virtual ~IAffinity() = default;

    virtual PartitionAssignment assign(const SnapshotDescriptor& desc) const = 0;
};

/*
    RendezvousAffinity

    Highest-random-weight assignment over the snapshot baseline: every
    partition goes to the backups + 1 admitted nodes with the largest
    weight(node, group, partition). Depends only on the descriptor, so
    every node computes the same assignment for a snapshot.
*/
class RendezvousAffinity : public IAffinity {
public:
    PartitionAssignment assign(const SnapshotDescriptor& desc) const override;

    static uint64_t weight(const std::string& node_id, int32_t group_id, uint32_t partition);
};

}  // namespace strata

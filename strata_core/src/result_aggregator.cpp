#include "result_aggregator.h"

#include <iostream>

namespace strata {

ResultAggregator::ResultAggregator(const SnapshotDescriptor& desc,
                                   const PartitionAssignment& assignment)
    : desc_(desc),
      assignment_(assignment) {}

VerificationVerdict ResultAggregator::aggregate(
    const std::map<std::string, NodeVerificationOutcome>& outcomes) const {

    VerificationVerdict v;
    v.snapshot_ = desc_.name;
    v.epoch_ = desc_.epoch;
    for (const auto& g : desc_.groups) {
        v.group_names_[g.id] = g.name;
    }

    for (const auto& [node, outcome] : outcomes) {
        v.nodes_.insert(node);

        if (outcome.failed()) {
            v.failures_.emplace(node, *outcome.failure);
            continue;
        }

        for (int32_t gid : outcome.missing_groups) {
            const CacheGroupDescriptor* g = desc_.find_group(gid);
            if (g == nullptr) {
                std::cerr << "[ResultAggregator] dropping missing group " << gid
                          << " reported by " << node << ": not part of snapshot\n";
                continue;
            }
            v.missing_groups_.insert(MissingGroupEntry{gid, g->name, node});
        }

        for (const auto& key : outcome.missing_partitions) {
            const CacheGroupDescriptor* g = desc_.find_group(key.group_id);
            if (g == nullptr || key.partition >= g->partitions) {
                std::cerr << "[ResultAggregator] dropping missing partition " << key
                          << " reported by " << node << ": not part of snapshot\n";
                continue;
            }
            v.missing_partitions_.insert(MissingPartitionEntry{key, g->name, node});
        }

        for (const auto& m : outcome.missing_metadata) {
            v.missing_metadata_.insert(MissingMetadataEntry{node, m.group_id, m.file});
        }

        for (const auto& rec : outcome.partitions) {
            if (desc_.find_group(rec.key.group_id) == nullptr) {
                std::cerr << "[ResultAggregator] dropping record " << rec.key
                          << " from " << node << ": unknown cache group\n";
                continue;
            }
            if (!assignment_.is_owner(rec.key, node)) {
                std::cerr << "[ResultAggregator] dropping record " << rec.key
                          << " from " << node << ": node is not an owner\n";
                continue;
            }
            v.partitions_[rec.key][node] = rec;
        }
    }

    for (const auto& [key, records] : v.partitions_) {
        if (records.size() < 2) {
            continue;
        }

        uint64_t first = records.begin()->second.update_counter;
        bool conflict = false;
        for (const auto& kv : records) {
            if (kv.second.update_counter != first) {
                conflict = true;
                break;
            }
        }
        if (!conflict) {
            continue;
        }

        VerificationVerdict::CounterMap& counters = v.conflicts_[key];
        for (const auto& [node, rec] : records) {
            counters[node] = rec.update_counter;
        }
    }

    return v;
}

}  // namespace strata

#include "affinity.h"

#include <algorithm>

#include "strata_wire.h"

namespace strata {

bool PartitionAssignment::is_owner(const PartitionKey& key, const std::string& node_id) const {
    auto it = owners.find(key);
    if (it == owners.end()) {
        return false;
    }
    return std::find(it->second.begin(), it->second.end(), node_id) != it->second.end();
}

bool PartitionAssignment::is_eligible(const std::string& node_id) const {
    for (const auto& kv : eligible) {
        if (kv.second.count(node_id) > 0) {
            return true;
        }
    }
    return false;
}

std::vector<ExpectedGroup> PartitionAssignment::expected_for(const SnapshotDescriptor& desc,
                                                             const std::string& node_id) const {
    std::vector<ExpectedGroup> out;
    for (const auto& g : desc.groups) {
        auto it = eligible.find(g.id);
        if (it == eligible.end() || it->second.count(node_id) == 0) {
            continue;
        }

        ExpectedGroup eg;
        eg.group_id = g.id;
        eg.name = g.name;
        for (uint32_t p = 0; p < g.partitions; ++p) {
            if (is_owner(PartitionKey{g.id, p}, node_id)) {
                eg.partitions.push_back(p);
            }
        }
        out.push_back(std::move(eg));
    }
    return out;
}

// splitmix64 finalizer over the crc of the node id
uint64_t RendezvousAffinity::weight(const std::string& node_id, int32_t group_id, uint32_t partition) {
    uint64_t x = static_cast<uint64_t>(crc32(reinterpret_cast<const uint8_t*>(node_id.data()),
                                             node_id.size()));
    x ^= (static_cast<uint64_t>(static_cast<uint32_t>(group_id)) << 32) | partition;
    x += 0x9e3779b97f4a7c15ULL;
    x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
    x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
    return x ^ (x >> 31);
}

PartitionAssignment RendezvousAffinity::assign(const SnapshotDescriptor& desc) const {
    PartitionAssignment out;

    for (const auto& g : desc.groups) {
        std::vector<std::string> nodes;
        for (const auto& id : desc.baseline) {
            if (g.admits(id)) {
                nodes.push_back(id);
            }
        }
        out.eligible[g.id] = std::set<std::string>(nodes.begin(), nodes.end());

        std::size_t copies = std::min<std::size_t>(nodes.size(), static_cast<std::size_t>(g.backups) + 1);

        for (uint32_t p = 0; p < g.partitions; ++p) {
            std::vector<std::pair<uint64_t, std::string>> ranked;
            ranked.reserve(nodes.size());
            for (const auto& id : nodes) {
                ranked.emplace_back(weight(id, g.id, p), id);
            }
            std::sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
                if (a.first != b.first) return a.first > b.first;
                return a.second < b.second;
            });

            std::vector<std::string>& owners = out.owners[PartitionKey{g.id, p}];
            for (std::size_t i = 0; i < copies; ++i) {
                owners.push_back(ranked[i].second);
            }
        }
    }
    return out;
}

}  // namespace strata

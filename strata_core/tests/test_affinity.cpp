#include "../src/affinity.h"

#include <cassert>
#include <iostream>
#include <map>
#include <set>
#include <string>

using namespace strata;

int main() {
    SnapshotDescriptor desc;
    desc.name = "snap1";
    desc.page_size = 256;
    desc.baseline = {"node1", "node2", "node3", "node4"};
    desc.groups.push_back(CacheGroupDescriptor{cache_group_id("accounts"), "accounts", 32, 1, {}});
    desc.groups.push_back(CacheGroupDescriptor{cache_group_id("audit"), "audit", 8, 2, {"node2", "node4"}});
    desc.groups.push_back(CacheGroupDescriptor{cache_group_id("local"), "local", 4, 0, {}});

    RendezvousAffinity affinity;
    PartitionAssignment asg = affinity.assign(desc);

    const int32_t accounts = cache_group_id("accounts");
    const int32_t audit = cache_group_id("audit");

    // 1) backups + 1 distinct owners per partition
    std::map<std::string, int> primaries;
    for (uint32_t p = 0; p < 32; ++p) {
        const auto& owners = asg.owners.at(PartitionKey{accounts, p});
        assert(owners.size() == 2);
        assert(owners[0] != owners[1]);
        primaries[owners[0]]++;
    }
    // primaries spread over the baseline
    assert(primaries.size() >= 3);

    // 2) Node filter limits owners, copies capped by admitted nodes
    for (uint32_t p = 0; p < 8; ++p) {
        const auto& owners = asg.owners.at(PartitionKey{audit, p});
        assert(owners.size() == 2);
        for (const auto& id : owners) {
            assert(id == "node2" || id == "node4");
        }
    }
    assert((asg.eligible.at(audit) == std::set<std::string>{"node2", "node4"}));

    // 3) Deterministic
    assert(affinity.assign(desc).owners == asg.owners);

    // 4) Expected groups per node
    auto node1 = asg.expected_for(desc, "node1");
    assert(node1.size() == 2);  // accounts and local, not audit
    for (const auto& g : node1) {
        assert(g.group_id != audit);
        for (uint32_t p : g.partitions) {
            assert(asg.is_owner(PartitionKey{g.group_id, p}, "node1"));
        }
    }

    auto node2 = asg.expected_for(desc, "node2");
    assert(node2.size() == 3);

    std::size_t total = 0;
    for (const auto& id : desc.baseline) {
        for (const auto& g : asg.expected_for(desc, id)) {
            if (g.group_id == accounts) {
                total += g.partitions.size();
            }
        }
    }
    assert(total == 64);

    // 5) Eligibility and ownership of strangers
    assert(asg.is_eligible("node3"));
    assert(!asg.is_eligible("node9"));
    assert(!asg.is_owner(PartitionKey{accounts, 0}, "node9"));
    assert(asg.expected_for(desc, "node9").empty());

    // 6) Filter naming only unknown nodes leaves the group without owners
    SnapshotDescriptor odd = desc;
    odd.groups = {CacheGroupDescriptor{cache_group_id("nowhere"), "nowhere", 2, 1, {"ghost"}}};
    PartitionAssignment odd_asg = affinity.assign(odd);
    assert(odd_asg.owners.at(PartitionKey{cache_group_id("nowhere"), 0}).empty());
    assert(!odd_asg.is_eligible("node1"));

    std::cout << "Rendezvous affinity test passed\n";
    return 0;
}

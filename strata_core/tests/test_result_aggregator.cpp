#include "../src/result_aggregator.h"

#include <cassert>
#include <iostream>
#include <map>
#include <string>

using namespace strata;

static PartitionRecord record(int32_t group, uint32_t part, uint64_t counter) {
    return PartitionRecord{PartitionKey{group, part}, counter, true, true, 3};
}

static bool contains(const std::string& text, const std::string& what) {
    return text.find(what) != std::string::npos;
}

int main() {
    SnapshotDescriptor desc;
    desc.name = "snap1";
    desc.epoch = 7;
    desc.page_size = 256;
    desc.baseline = {"node1", "node2", "node3"};
    const int32_t gid = cache_group_id("accounts");
    desc.groups.push_back(CacheGroupDescriptor{gid, "accounts", 2, 1, {}});

    // p0 on node1+node2, p1 on node2+node3
    PartitionAssignment asg;
    asg.owners[PartitionKey{gid, 0}] = {"node1", "node2"};
    asg.owners[PartitionKey{gid, 1}] = {"node2", "node3"};
    asg.eligible[gid] = {"node1", "node2", "node3"};

    auto clean_outcomes = [&]() {
        std::map<std::string, NodeVerificationOutcome> m;
        m["node1"].node_id = "node1";
        m["node1"].partitions = {record(gid, 0, 10)};
        m["node2"].node_id = "node2";
        m["node2"].partitions = {record(gid, 0, 10), record(gid, 1, 20)};
        m["node3"].node_id = "node3";
        m["node3"].partitions = {record(gid, 1, 20)};
        return m;
    };

    ResultAggregator agg(desc, asg);

    // 1) Agreeing replicas
    {
        VerificationVerdict v = agg.aggregate(clean_outcomes());
        assert(v.clean());
        assert(v.snapshot_name() == "snap1");
        assert(v.epoch() == 7);
        assert(v.nodes().size() == 3);
        assert(v.partitions().size() == 2);
        assert(v.conflicts().empty());

        std::string report = v.to_string();
        assert(contains(report, "The check procedure has finished, no conflicts have been found."));

        std::string verbose = v.to_string(true);
        assert(contains(verbose, "node1:updateCntr=10"));
    }

    // 2) Counter disagreement: one conflict entry with both values
    {
        auto m = clean_outcomes();
        m["node3"].partitions = {record(gid, 1, 21)};
        VerificationVerdict v = agg.aggregate(m);

        assert(!v.clean());
        assert(v.conflicts().size() == 1);
        const auto& counters = v.conflicts().at(PartitionKey{gid, 1});
        assert(counters.size() == 2);
        assert(counters.at("node2") == 20);
        assert(counters.at("node3") == 21);

        std::string report = v.to_string();
        assert(contains(report, "Conflict partition: PartitionKey [grpId=" + std::to_string(gid) +
                                ", grpName=accounts, partId=1]"));
        assert(contains(report, "Partition instances: [node2:updateCntr=20, node3:updateCntr=21]"));
        assert(contains(report, "The check procedure has finished, found 1 conflict partitions."));
    }

    // 3) Failed node contributes only its failure and hides nothing of the others
    {
        auto m = clean_outcomes();
        NodeFailure f;
        f.causes.push_back(FailureCause{FailureKind::CorruptPage, "Failed to verify snapshot partition"});
        f.causes.push_back(FailureCause{FailureKind::CorruptPage, "CRC mismatch"});
        m["node3"] = NodeVerificationOutcome::failed_with("node3", f);
        m["node3"].missing_partitions = {PartitionKey{gid, 1}};

        VerificationVerdict v = agg.aggregate(m);
        assert(!v.clean());
        assert(v.failures().size() == 1);
        assert(v.failures().at("node3").has_cause(FailureKind::CorruptPage));
        assert(v.missing_partitions().empty());
        assert(v.partitions().at(PartitionKey{gid, 1}).size() == 1);

        std::string report = v.to_string();
        assert(contains(report, "caused by: CRC mismatch"));
        assert(contains(report, "The check procedure failed on 1 node."));
    }

    // 4) Findings from any node are unioned
    {
        auto m = clean_outcomes();
        m["node1"].partitions.clear();
        m["node1"].missing_partitions = {PartitionKey{gid, 0}};
        m["node2"].missing_metadata = {MissingMetadata{std::nullopt, "node2.smf"}};
        m["node3"].partitions.clear();
        m["node3"].missing_groups = {gid};

        VerificationVerdict v = agg.aggregate(m);
        assert(!v.clean());
        assert(v.is_missing_partition(PartitionKey{gid, 0}));
        assert(!v.is_missing_partition(PartitionKey{gid, 1}));
        assert(v.is_missing_group(gid));
        assert(v.missing_metadata().size() == 1);
        assert(v.missing_count() == 3);
        assert(v.conflicts().empty());

        std::string report = v.to_string();
        assert(contains(report, "Snapshot data doesn't contain required cache groups"));
        assert(contains(report, "Snapshot data doesn't contain required cache group partition"));
        assert(contains(report, "Some metadata is missing from the snapshot"));
        assert(contains(report, "found 0 conflict partitions and 3 missing snapshot entries."));
    }

    // 5) Records from non-owners and unknown groups are dropped
    {
        auto m = clean_outcomes();
        m["node1"].partitions.push_back(record(gid, 1, 99));
        m["node1"].partitions.push_back(record(cache_group_id("ghost"), 0, 5));
        m["node3"].missing_partitions = {PartitionKey{gid, 9}};

        VerificationVerdict v = agg.aggregate(m);
        assert(v.clean());
        assert(v.partitions().at(PartitionKey{gid, 1}).count("node1") == 0);
        assert(v.partitions().count(PartitionKey{cache_group_id("ghost"), 0}) == 0);
    }

    // 6) Two failed nodes use the plural form
    {
        auto m = clean_outcomes();
        m["node1"] = NodeVerificationOutcome::failed_with(
            "node1", NodeFailure::make(FailureKind::NodeTimedOut, "no reply"));
        m["node2"] = NodeVerificationOutcome::failed_with(
            "node2", NodeFailure::make(FailureKind::NodeUnreachable, "refused"));
        VerificationVerdict v = agg.aggregate(m);
        assert(contains(v.to_string(), "The check procedure failed on 2 nodes."));
    }

    std::cout << "Result aggregator test passed\n";
    return 0;
}

#pragma once

#include <compare>
#include <cstdint>
#include <map>
#include <optional>
#include <ostream>
#include <set>
#include <string>

#include "snapshot_types.h"
#include "strata_errors.h"

namespace strata {

struct MissingGroupEntry {
    int32_t group_id;
    std::string group_name;
    std::string node_id;

    auto operator<=>(const MissingGroupEntry&) const = default;
};

struct MissingPartitionEntry {
    PartitionKey key;
    std::string group_name;
    std::string node_id;

    auto operator<=>(const MissingPartitionEntry&) const = default;
};

struct MissingMetadataEntry {
    std::string node_id;
    std::optional<int32_t> group_id;  // empty for the node metafile
    std::string file;

    auto operator<=>(const MissingMetadataEntry&) const = default;
};

/*
    VerificationVerdict

    Result of one snapshot check. Built only by ResultAggregator and
    immutable afterwards. All collections are ordered, so two verdicts
    over the same outcomes compare equal no matter in which order the
    nodes replied.
*/
class VerificationVerdict {
public:
    using CounterMap = std::map<std::string, uint64_t>;           // node -> update counter
    using RecordMap = std::map<std::string, PartitionRecord>;     // node -> record

    const std::string& snapshot_name() const { return snapshot_; }
    uint64_t epoch() const { return epoch_; }
    const std::set<std::string>& nodes() const { return nodes_; }

    const std::map<std::string, NodeFailure>& failures() const { return failures_; }
    const std::set<MissingGroupEntry>& missing_groups() const { return missing_groups_; }
    const std::set<MissingPartitionEntry>& missing_partitions() const { return missing_partitions_; }
    const std::set<MissingMetadataEntry>& missing_metadata() const { return missing_metadata_; }
    const std::map<PartitionKey, CounterMap>& conflicts() const { return conflicts_; }
    const std::map<PartitionKey, RecordMap>& partitions() const { return partitions_; }

    bool clean() const;
    std::size_t missing_count() const;

    bool is_missing_group(int32_t group_id) const;
    bool is_missing_partition(const PartitionKey& key) const;

    // Name of a group of the checked snapshot, the numeric id when unknown
    std::string group_name(int32_t group_id) const;

    void print(std::ostream& os, bool verbose = false) const;
    std::string to_string(bool verbose = false) const;

    bool operator==(const VerificationVerdict&) const = default;

private:
    friend class ResultAggregator;

    std::string snapshot_;
    uint64_t epoch_{0};
    std::set<std::string> nodes_;

    std::map<std::string, NodeFailure> failures_;
    std::set<MissingGroupEntry> missing_groups_;
    std::set<MissingPartitionEntry> missing_partitions_;
    std::set<MissingMetadataEntry> missing_metadata_;
    std::map<PartitionKey, CounterMap> conflicts_;
    std::map<PartitionKey, RecordMap> partitions_;
    std::map<int32_t, std::string> group_names_;
};

}  // namespace strata

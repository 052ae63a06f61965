#pragma once

#include <filesystem>
#include <functional>
#include <string>

#include "snapshot_types.h"

namespace strata {

/*
    LocalSnapshotInspector

    Checks the snapshot copy of one node against what the node is expected
    to hold. Missing groups, partitions and metadata files are collected as
    findings; a corrupt page or a structural violation ends the inspection
    and becomes the node's failure.
*/
class LocalSnapshotInspector {
public:
    using CancelCheck = std::function<bool()>;

    LocalSnapshotInspector(std::string node_id, std::filesystem::path snapshot_root);

    NodeVerificationOutcome inspect(const VerifyJobRequest& req,
                                    const CancelCheck& cancelled = {}) const;

    std::filesystem::path snapshot_dir(const std::string& snapshot_name) const;

    const std::string& node_id() const { return node_id_; }

private:
    void check_node_metafile(const std::filesystem::path& dir,
                             const VerifyJobRequest& req,
                             NodeVerificationOutcome& out) const;

    void check_group(const std::filesystem::path& dir,
                     const VerifyJobRequest& req,
                     const ExpectedGroup& group,
                     const CancelCheck& cancelled,
                     NodeVerificationOutcome& out) const;

    PartitionRecord check_partition(const std::filesystem::path& file,
                                    uint32_t page_size,
                                    const PartitionKey& key) const;

    std::string node_id_;
    std::filesystem::path root_;
};

}  // namespace strata

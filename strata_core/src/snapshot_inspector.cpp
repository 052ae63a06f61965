#include "snapshot_inspector.h"

#include <iostream>
#include <sstream>

#include "page_store.h"
#include "snapshot_meta.h"
#include "strata_errors.h"

namespace fs = std::filesystem;

namespace strata {

LocalSnapshotInspector::LocalSnapshotInspector(std::string node_id, fs::path snapshot_root)
    : node_id_(std::move(node_id)),
      root_(std::move(snapshot_root)) {}

fs::path LocalSnapshotInspector::snapshot_dir(const std::string& snapshot_name) const {
    return root_ / snapshot_name;
}

NodeVerificationOutcome LocalSnapshotInspector::inspect(const VerifyJobRequest& req,
                                                        const CancelCheck& cancelled) const {
    NodeVerificationOutcome out;
    out.node_id = node_id_;

    try {
        fs::path dir = snapshot_dir(req.snapshot_name);
        std::error_code ec;
        if (req.snapshot_name.empty() || !fs::is_directory(dir, ec)) {
            throw SnapshotNotFoundError("Snapshot \"" + req.snapshot_name +
                                        "\" not found on node " + node_id_ + ": " + dir.string());
        }

        check_node_metafile(dir, req, out);

        for (const auto& group : req.groups) {
            if (cancelled && cancelled()) {
                throw CancelledError("Snapshot check job " + std::to_string(req.job_id) +
                                     " cancelled on node " + node_id_);
            }
            check_group(dir, req, group, cancelled, out);
        }
    } catch (const std::exception&) {
        NodeFailure failure = NodeFailure::from_exception(std::current_exception());
        std::cerr << "[SnapshotInspector " << node_id_ << "] check of \"" << req.snapshot_name
                  << "\" failed: " << failure.root_cause().message << "\n";
        return NodeVerificationOutcome::failed_with(node_id_, std::move(failure));
    }

    return out;
}

void LocalSnapshotInspector::check_node_metafile(const fs::path& dir,
                                                 const VerifyJobRequest& req,
                                                 NodeVerificationOutcome& out) const {
    std::string name = snapshot_meta_file_name(node_id_);
    fs::path file = dir / name;

    std::error_code ec;
    if (!fs::is_regular_file(file, ec)) {
        out.missing_metadata.push_back(MissingMetadata{std::nullopt, name});
        return;
    }

    auto meta = read_snapshot_metadata(file);
    if (!meta.has_value()) {
        throw StructureError("Snapshot metafile cannot be parsed: " + file.string());
    }
    if (meta->descriptor.name != req.snapshot_name || meta->node_id != node_id_) {
        throw StructureError("Snapshot metafile " + file.string() + " belongs to snapshot \"" +
                             meta->descriptor.name + "\" of node " + meta->node_id);
    }
}

void LocalSnapshotInspector::check_group(const fs::path& dir,
                                         const VerifyJobRequest& req,
                                         const ExpectedGroup& group,
                                         const CancelCheck& cancelled,
                                         NodeVerificationOutcome& out) const {
    fs::path group_dir = dir / cache_dir_name(group.name);

    std::error_code ec;
    if (!fs::is_directory(group_dir, ec)) {
        out.missing_groups.push_back(group.group_id);
        return;
    }

    fs::path data_file = group_dir / CACHE_DATA_FILENAME;
    if (!fs::is_regular_file(data_file, ec)) {
        out.missing_metadata.push_back(MissingMetadata{group.group_id, CACHE_DATA_FILENAME});
    } else {
        auto data = read_cache_group_data(data_file);
        if (!data.has_value()) {
            throw StructureError("Cache group data cannot be parsed: " + data_file.string());
        }
        if (data->group_id != group.group_id) {
            std::ostringstream ss;
            ss << "Cache group data " << data_file.string() << " describes group "
               << data->group_id << ", expected " << group.group_id;
            throw StructureError(ss.str());
        }
    }

    for (uint32_t part : group.partitions) {
        if (cancelled && cancelled()) {
            throw CancelledError("Snapshot check job " + std::to_string(req.job_id) +
                                 " cancelled on node " + node_id_);
        }

        PartitionKey key{group.group_id, part};
        fs::path file = group_dir / partition_file_name(part);
        if (!fs::is_regular_file(file, ec)) {
            out.missing_partitions.push_back(key);
            continue;
        }

        try {
            out.partitions.push_back(check_partition(file, req.page_size, key));
        } catch (const StrataError& ex) {
            std::ostringstream ss;
            ss << "Failed to verify snapshot partition [node=" << node_id_
               << ", grpName=" << group.name << ", key=" << key
               << ", file=" << file.string() << "]";
            std::throw_with_nested(StrataError(ex.kind(), ss.str()));
        }
    }
}

PartitionRecord LocalSnapshotInspector::check_partition(const fs::path& file,
                                                        uint32_t page_size,
                                                        const PartitionKey& key) const {
    PageStoreReader reader(file, page_size, key.partition);

    PartitionRecord rec{};
    rec.key = key;
    rec.present = true;
    bool meta_seen = false;

    rec.pages_checked = reader.for_each_page([&](const PageView& page) {
        if (page.index() == 0) {
            rec.update_counter = page.update_counter();
            meta_seen = true;
        }
    });

    if (!meta_seen) {
        throw StructureError("Partition meta page is missing in " + file.string());
    }

    rec.checksum_ok = true;
    return rec;
}

}  // namespace strata

#include "../src/snapshot_inspector.h"
#include "../src/strata_errors.h"
#include "test_support.h"

#include <algorithm>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

using namespace strata;
using namespace strata::testing;

static VerifyJobRequest request_for(const SnapshotFixture& fx, const SnapshotDescriptor& desc,
                                    const std::string& node) {
    VerifyJobRequest req;
    req.job_id = 1;
    req.snapshot_name = desc.name;
    req.page_size = desc.page_size;
    req.groups = fx.assignment().expected_for(desc, node);
    return req;
}

int main() {
    // Single node holding everything keeps the expectations obvious
    SnapshotFixture fx("inspector_test_data", {"node1"});
    fx.add_group("accounts", 4, 0);
    fx.add_group("orders", 2, 0);
    SnapshotDescriptor desc = fx.create("snap1");

    LocalSnapshotInspector inspector("node1", fx.snapshot_root("node1"));
    const int32_t accounts = cache_group_id("accounts");
    const int32_t orders = cache_group_id("orders");

    // 1) Clean snapshot: one record per partition with the stored counter
    {
        auto out = inspector.inspect(request_for(fx, desc, "node1"));
        assert(!out.failed());
        assert(out.node_id == "node1");
        assert(out.partitions.size() == 6);
        assert(out.missing_groups.empty());
        assert(out.missing_partitions.empty());
        assert(out.missing_metadata.empty());

        for (const auto& rec : out.partitions) {
            assert(rec.present);
            assert(rec.checksum_ok);
            assert(rec.update_counter == default_counter(rec.key.partition));
            assert(rec.pages_checked == 3);
        }
    }

    // 2) Unknown snapshot name
    {
        VerifyJobRequest req = request_for(fx, desc, "node1");
        req.snapshot_name = "nope";
        auto out = inspector.inspect(req);
        assert(out.failed());
        assert(out.failure->kind() == FailureKind::SnapshotNotFound);
    }

    // 3) Missing partition file is a finding
    {
        std::filesystem::remove(fx.partition_file("node1", "snap1", "accounts", 2));
        auto out = inspector.inspect(request_for(fx, desc, "node1"));
        assert(!out.failed());
        assert(out.missing_partitions.size() == 1);
        assert((out.missing_partitions[0] == PartitionKey{accounts, 2}));
        assert(out.partitions.size() == 5);
        write_partition_file(fx.partition_file("node1", "snap1", "accounts", 2),
                             fx.page_size(), 2, default_counter(2));
    }

    // 4) Missing group directory: the group only, not its partitions
    {
        std::filesystem::path moved = "inspector_test_orders";
        std::filesystem::remove_all(moved);
        std::filesystem::rename(fx.group_dir("node1", "snap1", "orders"), moved);

        auto out = inspector.inspect(request_for(fx, desc, "node1"));
        assert(!out.failed());
        assert(out.missing_groups == std::vector<int32_t>{orders});
        assert(out.missing_partitions.empty());
        assert(out.partitions.size() == 4);

        std::filesystem::rename(moved, fx.group_dir("node1", "snap1", "orders"));
    }

    // 5) Missing metadata files are findings of their own
    {
        std::filesystem::path meta = fx.meta_file("node1", "snap1");
        std::filesystem::path meta_copy = "inspector_test_meta.smf";
        std::filesystem::copy_file(meta, meta_copy, std::filesystem::copy_options::overwrite_existing);
        std::filesystem::remove(meta);

        std::filesystem::path group_data = fx.group_dir("node1", "snap1", "accounts") / CACHE_DATA_FILENAME;
        std::filesystem::path group_copy = "inspector_test_cache_data.dat";
        std::filesystem::copy_file(group_data, group_copy, std::filesystem::copy_options::overwrite_existing);
        std::filesystem::remove(group_data);

        auto out = inspector.inspect(request_for(fx, desc, "node1"));
        assert(!out.failed());
        assert(out.missing_metadata.size() == 2);
        assert((out.missing_metadata[0] == MissingMetadata{std::nullopt, "node1.smf"}));
        assert((out.missing_metadata[1] == MissingMetadata{accounts, CACHE_DATA_FILENAME}));
        assert(out.missing_groups.empty());
        assert(out.missing_partitions.empty());

        std::filesystem::rename(meta_copy, meta);
        std::filesystem::rename(group_copy, group_data);
    }

    // 6) Unparseable cache group data is a structure failure
    {
        std::filesystem::path group_data = fx.group_dir("node1", "snap1", "orders") / CACHE_DATA_FILENAME;
        std::filesystem::path group_copy = "inspector_test_cache_data.dat";
        std::filesystem::copy_file(group_data, group_copy, std::filesystem::copy_options::overwrite_existing);
        {
            std::ofstream out(group_data, std::ios::binary | std::ios::trunc);
            out << "garbage";
        }

        auto out = inspector.inspect(request_for(fx, desc, "node1"));
        assert(out.failed());
        assert(out.failure->kind() == FailureKind::StructureViolation);

        std::filesystem::rename(group_copy, group_data);
    }

    // 7) Corrupted page: node failure with the checksum violation at the root
    {
        std::filesystem::path file = fx.partition_file("node1", "snap1", "orders", 1);
        corrupt_page_crc(file, fx.page_size(), 1);

        auto out = inspector.inspect(request_for(fx, desc, "node1"));
        assert(out.failed());
        assert(out.partitions.empty());
        assert(out.failure->kind() == FailureKind::CorruptPage);
        assert(out.failure->has_cause(FailureKind::CorruptPage));
        assert(out.failure->causes.size() == 2);
        assert(out.failure->message().find("Failed to verify snapshot partition") != std::string::npos);
        assert(out.failure->root_cause().message.find("CRC mismatch") != std::string::npos);

        write_partition_file(file, fx.page_size(), 1, default_counter(1));
    }

    // 8) A meta page turned into a data page is a structure failure
    {
        std::filesystem::path file = fx.partition_file("node1", "snap1", "accounts", 0);
        PageBuffer page(fx.page_size());
        page.init(PageType::Data, 0, 0);
        page.update_crc();
        write_raw_page(file, fx.page_size(), 0, page.bytes());

        auto out = inspector.inspect(request_for(fx, desc, "node1"));
        assert(out.failed());
        assert(out.failure->kind() == FailureKind::StructureViolation);
        assert(!out.failure->has_cause(FailureKind::CorruptPage));

        write_partition_file(file, fx.page_size(), 0, default_counter(0));
    }

    // 9) Cancellation between partitions
    {
        auto out = inspector.inspect(request_for(fx, desc, "node1"), []() { return true; });
        assert(out.failed());
        assert(out.failure->kind() == FailureKind::Cancelled);
    }

    // 10) Restored tree is clean again
    {
        auto out = inspector.inspect(request_for(fx, desc, "node1"));
        assert(!out.failed());
        assert(out.partitions.size() == 6);
    }

    std::cout << "Snapshot inspector test passed\n";
    return 0;
}

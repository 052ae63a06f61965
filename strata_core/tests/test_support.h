#pragma once

// Shared helpers for the snapshot check tests: writes snapshot trees in the
// on-disk layout the inspector reads, and a fixed cluster view.

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "../src/affinity.h"
#include "../src/cluster.h"
#include "../src/page_io.h"
#include "../src/snapshot_meta.h"
#include "../src/snapshot_types.h"

namespace strata::testing {

namespace fs = std::filesystem;

constexpr uint32_t TEST_PAGE_SIZE = 256;
constexpr uint32_t TEST_PAGES_PER_PARTITION = 4;

inline uint64_t default_counter(uint32_t partition) {
    return 100 + partition;
}

// Page 0 is the partition meta page, page 2 is left unallocated
inline void write_partition_file(const fs::path& file,
                                 uint32_t page_size,
                                 uint32_t partition,
                                 uint64_t update_counter,
                                 uint32_t pages = TEST_PAGES_PER_PARTITION) {
    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("cannot create " + file.string());
    }

    for (uint32_t idx = 0; idx < pages; ++idx) {
        PageBuffer page(page_size);
        if (idx == 2) {
            out.write(reinterpret_cast<const char*>(page.bytes().data()), page_size);
            continue;
        }
        if (idx == 0) {
            page.init(PageType::PartitionMeta, partition, idx);
            page.set_update_counter(update_counter);
            page.set_partition_size(update_counter * 2);
            page.set_partition_state(1);
        } else {
            page.init(PageType::Data, partition, idx);
            page.fill_payload(static_cast<uint8_t>(partition * 7 + idx));
        }
        page.update_crc();
        out.write(reinterpret_cast<const char*>(page.bytes().data()), page_size);
    }
}

inline std::vector<uint8_t> read_raw_page(const fs::path& file, uint32_t page_size, uint32_t idx) {
    std::ifstream in(file, std::ios::binary);
    std::vector<uint8_t> bytes(page_size);
    in.seekg(static_cast<std::streamoff>(idx) * page_size);
    in.read(reinterpret_cast<char*>(bytes.data()), page_size);
    if (!in) {
        throw std::runtime_error("cannot read page " + std::to_string(idx) + " of " + file.string());
    }
    return bytes;
}

inline void write_raw_page(const fs::path& file, uint32_t page_size, uint32_t idx,
                           const std::vector<uint8_t>& bytes) {
    std::fstream io(file, std::ios::binary | std::ios::in | std::ios::out);
    io.seekp(static_cast<std::streamoff>(idx) * page_size);
    io.write(reinterpret_cast<const char*>(bytes.data()), page_size);
    if (!io) {
        throw std::runtime_error("cannot write page " + std::to_string(idx) + " of " + file.string());
    }
}

// Breaks the stored checksum of one page, contents stay intact
inline void corrupt_page_crc(const fs::path& file, uint32_t page_size, uint32_t idx) {
    PageBuffer page(read_raw_page(file, page_size, idx));
    page.set_stored_crc(page_crc(page.bytes().data(), page_size) ^ 0xFFFFFFFFu);
    write_raw_page(file, page_size, idx, page.bytes());
}

// Rewrites the update counter of the meta page with a valid checksum
inline void set_update_counter(const fs::path& file, uint32_t page_size, uint64_t counter) {
    PageBuffer page(read_raw_page(file, page_size, 0));
    page.set_update_counter(counter);
    page.update_crc();
    write_raw_page(file, page_size, 0, page.bytes());
}

/*
    SnapshotFixture

    Lays out one snapshot for a set of nodes under base/<node>/snapshots,
    placing partitions where RendezvousAffinity assigns them.
*/
class SnapshotFixture {
public:
    SnapshotFixture(fs::path base, std::vector<std::string> nodes, uint32_t page_size = TEST_PAGE_SIZE)
        : base_(std::move(base)),
          nodes_(std::move(nodes)),
          page_size_(page_size) {
        fs::remove_all(base_);
    }

    ~SnapshotFixture() {
        std::error_code ec;
        fs::remove_all(base_, ec);
    }

    void add_group(const std::string& name, uint32_t partitions, uint32_t backups,
                   std::vector<std::string> node_filter = {}) {
        CacheGroupDescriptor g;
        g.id = cache_group_id(name);
        g.name = name;
        g.partitions = partitions;
        g.backups = backups;
        g.node_filter = std::move(node_filter);
        groups_.push_back(std::move(g));
    }

    SnapshotDescriptor create(const std::string& snapshot, uint64_t epoch = 1) {
        SnapshotDescriptor desc;
        desc.name = snapshot;
        desc.epoch = epoch;
        desc.page_size = page_size_;
        desc.baseline = nodes_;
        desc.groups = groups_;

        assignment_ = RendezvousAffinity().assign(desc);

        for (const auto& node : nodes_) {
            fs::path dir = snapshot_dir(node, snapshot);
            fs::create_directories(dir);
            write_snapshot_metadata(dir / snapshot_meta_file_name(node), SnapshotMetadata{desc, node});

            for (const auto& eg : assignment_.expected_for(desc, node)) {
                const CacheGroupDescriptor* g = desc.find_group(eg.group_id);
                fs::path gdir = dir / cache_dir_name(eg.name);
                fs::create_directories(gdir);
                write_cache_group_data(gdir / CACHE_DATA_FILENAME,
                                       CacheGroupData{g->id, g->name, g->partitions, g->backups});
                for (uint32_t p : eg.partitions) {
                    write_partition_file(gdir / partition_file_name(p), page_size_, p, default_counter(p));
                }
            }
        }
        return desc;
    }

    fs::path data_root(const std::string& node) const { return base_ / node; }
    fs::path snapshot_root(const std::string& node) const { return data_root(node) / SNAPSHOTS_DIR; }

    fs::path snapshot_dir(const std::string& node, const std::string& snapshot) const {
        return snapshot_root(node) / snapshot;
    }

    fs::path group_dir(const std::string& node, const std::string& snapshot, const std::string& group) const {
        return snapshot_dir(node, snapshot) / cache_dir_name(group);
    }

    fs::path partition_file(const std::string& node, const std::string& snapshot,
                            const std::string& group, uint32_t part) const {
        return group_dir(node, snapshot, group) / partition_file_name(part);
    }

    fs::path meta_file(const std::string& node, const std::string& snapshot) const {
        return snapshot_dir(node, snapshot) / snapshot_meta_file_name(node);
    }

    const std::vector<std::string>& owners(const std::string& group, uint32_t part) const {
        return assignment_.owners.at(PartitionKey{cache_group_id(group), part});
    }

    const PartitionAssignment& assignment() const { return assignment_; }
    const std::vector<std::string>& nodes() const { return nodes_; }
    uint32_t page_size() const { return page_size_; }

private:
    fs::path base_;
    std::vector<std::string> nodes_;
    uint32_t page_size_;
    std::vector<CacheGroupDescriptor> groups_;
    PartitionAssignment assignment_;
};

// Cluster view with a fixed member list
class StaticClusterView : public IClusterView {
public:
    void add(const std::string& id, NodeRole role = NodeRole::Server) {
        std::lock_guard<std::mutex> lock(mtx_);
        members_.push_back(MemberView{id, role, 1, std::chrono::milliseconds(0)});
    }

    void remove(const std::string& id) {
        std::lock_guard<std::mutex> lock(mtx_);
        for (auto it = members_.begin(); it != members_.end(); ++it) {
            if (it->id == id) {
                members_.erase(it);
                return;
            }
        }
    }

    std::vector<MemberView> members_snapshot() const override {
        std::lock_guard<std::mutex> lock(mtx_);
        return members_;
    }

private:
    mutable std::mutex mtx_;
    std::vector<MemberView> members_;
};

}  // namespace strata::testing

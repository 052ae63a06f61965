#pragma once

#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "snapshot_inspector.h"
#include "snapshot_meta.h"
#include "snapshot_types.h"

namespace strata {

/*
    SnapshotVerifyService

    Node side of the snapshot check. Every job runs a local inspection,
    and at most one inspection per snapshot name runs at a time. Jobs
    asking the same question (snapshot name, page size and expected
    groups) as the running inspection share it and get the same outcome.
    A job with a different question waits until the running one is done.
    A cancelled job is no longer pending on this node and is answered
    with a Cancelled failure.
*/
class SnapshotVerifyService {
public:
    SnapshotVerifyService(std::string node_id, std::filesystem::path snapshot_root);

    // Blocks until the inspection the job is attached to has finished
    NodeVerificationOutcome execute(const VerifyJobRequest& req);

    // Returns true when the job was pending on this node
    bool cancel(uint64_t job_id);

    // Descriptor from the metafiles this node holds for the snapshot
    std::optional<SnapshotDescriptor> describe(const std::string& snapshot_name) const;

    // Called on the inspecting thread right before an inspection starts
    void set_inspection_hook(std::function<void(const VerifyJobRequest&)> hook);

    std::size_t pending_jobs() const;
    uint64_t inspections_started() const;

    const std::string& node_id() const { return node_id_; }
    const LocalSnapshotInspector& inspector() const { return inspector_; }

private:
    struct Inspection {
        std::string snapshot_name;
        uint32_t page_size;
        std::vector<ExpectedGroup> groups;
        std::shared_future<NodeVerificationOutcome> result;
        std::set<uint64_t> jobs;

        // An inspection whose jobs were all cancelled is winding down, never joined
        bool answers(const VerifyJobRequest& req) const {
            return !jobs.empty() && snapshot_name == req.snapshot_name && page_size == req.page_size &&
                   groups == req.groups;
        }
    };

    void run_inspection(const VerifyJobRequest& req,
                        const std::shared_ptr<Inspection>& insp,
                        std::promise<NodeVerificationOutcome>& promise);

    NodeVerificationOutcome cancelled_outcome(uint64_t job_id, const std::string& when) const;

    std::string node_id_;
    LocalSnapshotInspector inspector_;
    SnapshotCatalog catalog_;

    mutable std::mutex mtx_;
    std::condition_variable inspection_done_;
    std::function<void(const VerifyJobRequest&)> hook_;
    std::map<std::string, std::shared_ptr<Inspection>> inflight_;  // snapshot -> running inspection
    std::map<uint64_t, std::shared_ptr<Inspection>> pending_;      // job id -> inspection, null while queued
    std::set<uint64_t> cancelled_early_;
    uint64_t inspections_started_{0};
};

}  // namespace strata

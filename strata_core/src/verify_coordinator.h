#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <utility>
#include <boost/asio.hpp>

#include "affinity.h"
#include "cluster.h"
#include "job_dispatcher.h"
#include "snapshot_meta.h"
#include "snapshot_types.h"
#include "verification_verdict.h"

namespace strata {

class SnapshotVerifyService;
class VerificationCoordinator;

struct CoordinatorConfig {
    std::string self_id;
    std::chrono::milliseconds timeout{30000};
    std::size_t threads{4};
};

namespace detail {

// Cleared by the coordinator's destructor, handles may outlive it
struct OwnerLink {
    std::mutex mtx;
    VerificationCoordinator* coordinator{nullptr};
};

// State of one check, shared by the handle, the job tasks and the deadline timer
struct CheckRun {
    std::shared_ptr<OwnerLink> owner;
    uint64_t job_id{0};
    SnapshotDescriptor desc;
    PartitionAssignment assignment;
    std::vector<std::string> participants;
    std::size_t expected_outcomes{0};  // participants plus offline baseline nodes

    std::mutex mtx;
    bool finished{false};
    std::map<std::string, NodeVerificationOutcome> outcomes;
    std::promise<VerificationVerdict> promise;
    std::shared_future<VerificationVerdict> result;
};

}  // namespace detail

class CheckHandle {
public:
    uint64_t job_id() const;
    const std::string& snapshot_name() const;

    // Blocks until the check completes; throws CancelledError after cancel()
    VerificationVerdict get() const;

    bool wait_for(std::chrono::milliseconds timeout) const;
    bool done() const;

    // Returns false when the check had already completed or its coordinator is gone
    bool cancel();

private:
    friend class VerificationCoordinator;

    explicit CheckHandle(std::shared_ptr<detail::CheckRun> run);

    std::shared_ptr<detail::CheckRun> run_;
};

/*
    VerificationCoordinator

    Runs a snapshot check from one node: fixes the topology at the start
    of the call, sends one job to every participating server node, runs
    the local part in-process, and aggregates the outcomes once every
    participant has answered or the deadline has passed. Remote jobs are
    asynchronous dispatches, so the worker pool only carries the local
    inspection and cancel notices. Baseline nodes that are not online
    are reported as unreachable.
*/
class VerificationCoordinator {
public:
    VerificationCoordinator(const CoordinatorConfig& cfg,
                            const SnapshotCatalog& catalog,
                            const IClusterView& cluster,
                            const IAffinity& affinity,
                            IJobDispatcher& dispatcher,
                            SnapshotVerifyService& local);
    ~VerificationCoordinator();

    VerificationCoordinator(const VerificationCoordinator&) = delete;
    VerificationCoordinator& operator=(const VerificationCoordinator&) = delete;

    // The descriptor comes from the local catalog, else from the first online
    // server that holds metadata for the snapshot. Throws SnapshotNotFoundError
    // when no node knows the name.
    CheckHandle check(const std::string& snapshot_name);

    // Online server members eligible for at least one group of the snapshot
    static std::vector<std::string> participants(const PartitionAssignment& assignment,
                                                 const std::vector<MemberView>& members);

    // Participants that are reached through the dispatcher
    std::vector<std::string> remote_participants(const std::vector<std::string>& participants) const;

    const CoordinatorConfig& config() const { return cfg_; }

private:
    friend class CheckHandle;

    VerifyJobRequest request_for(const detail::CheckRun& run, const std::string& node_id) const;

    std::optional<SnapshotDescriptor> describe_from_peers(const std::string& snapshot_name) const;

    void run_local(const std::shared_ptr<detail::CheckRun>& run);
    void dispatch(const std::shared_ptr<detail::CheckRun>& run, const std::string& node_id);
    void on_reply(const std::shared_ptr<detail::CheckRun>& run, const std::string& node_id,
                  DispatchResult res);

    void arm_deadline(const std::shared_ptr<detail::CheckRun>& run);
    void release_deadline(uint64_t job_id);

    void record(const std::shared_ptr<detail::CheckRun>& run, NodeVerificationOutcome outcome);
    void on_deadline(const std::shared_ptr<detail::CheckRun>& run);
    bool cancel(const std::shared_ptr<detail::CheckRun>& run);
    void complete(const std::shared_ptr<detail::CheckRun>& run,
                  const std::map<std::string, NodeVerificationOutcome>& outcomes);

    void send_cancel_notices(uint64_t job_id, const std::vector<std::string>& nodes);

    CoordinatorConfig cfg_;
    const SnapshotCatalog& catalog_;
    const IClusterView& cluster_;
    const IAffinity& affinity_;
    IJobDispatcher& dispatcher_;
    SnapshotVerifyService& local_;

    std::shared_ptr<detail::OwnerLink> link_;

    // Dispatcher handlers still to run; the destructor waits for them
    std::mutex dispatch_mtx_;
    std::condition_variable dispatch_cv_;
    std::size_t dispatches_in_flight_{0};

    boost::asio::io_context io_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    std::map<uint64_t, std::unique_ptr<boost::asio::steady_timer>> timers_;  // io thread only
    std::thread io_thread_;
    boost::asio::thread_pool pool_;

    std::atomic<uint64_t> next_job_id_;
};

}  // namespace strata

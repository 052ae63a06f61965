#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <utility>
#include <boost/asio.hpp>

#include "cluster.h"
#include "snapshot_types.h"
#include "strata_wire.h"

namespace strata {

class SnapshotVerifyService;

enum class DispatchStatus : uint8_t {
    Replied  = 1,
    Failed   = 2,
    TimedOut = 3
};

struct DispatchResult {
    DispatchStatus status;
    std::optional<NodeVerificationOutcome> outcome;  // set when Replied
    std::string error;
};

using DispatchHandler = std::function<void(DispatchResult)>;

// Sends snapshot check jobs to other nodes
class IJobDispatcher {
public:
    virtual ~IJobDispatcher() = default;

    // Returns at once; the handler runs exactly once, when the node replies,
    // fails or the timeout passes, on a thread owned by the dispatcher
    virtual void async_execute(const std::string& node_id,
                               const VerifyJobRequest& req,
                               std::chrono::milliseconds timeout,
                               DispatchHandler handler) = 0;

    // Best-effort cancellation notice
    virtual void cancel(const std::string& node_id, uint64_t job_id) = 0;

    // Descriptor of a snapshot as recorded in the node's metafiles
    virtual std::optional<SnapshotDescriptor> describe(const std::string& node_id,
                                                       const std::string& snapshot_name,
                                                       std::chrono::milliseconds timeout) = 0;

    // Blocks until the handler of async_execute has run
    DispatchResult execute(const std::string& node_id,
                           const VerifyJobRequest& req,
                           std::chrono::milliseconds timeout);
};

// Dispatch over JobClient to the job port of each known server node
class TcpJobDispatcher : public IJobDispatcher {
public:
    explicit TcpJobDispatcher(const std::vector<NodeId>& nodes,
                              std::chrono::milliseconds cancel_timeout = std::chrono::milliseconds(2000));
    ~TcpJobDispatcher();

    TcpJobDispatcher(const TcpJobDispatcher&) = delete;
    TcpJobDispatcher& operator=(const TcpJobDispatcher&) = delete;

    void async_execute(const std::string& node_id,
                       const VerifyJobRequest& req,
                       std::chrono::milliseconds timeout,
                       DispatchHandler handler) override;

    void cancel(const std::string& node_id, uint64_t job_id) override;

    std::optional<SnapshotDescriptor> describe(const std::string& node_id,
                                               const std::string& snapshot_name,
                                               std::chrono::milliseconds timeout) override;

private:
    std::map<std::string, NodeId> nodes_;
    std::chrono::milliseconds cancel_timeout_;

    // Every job in flight is one JobClient call on this context
    boost::asio::io_context io_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    std::thread io_thread_;
};

struct DispatchLogEntry {
    std::string node_id;
    MessageType type;
    uint64_t job_id;
};

/*
    InProcessJobDispatcher

    Delivers jobs straight to SnapshotVerifyService instances living in
    the same process. Used by tests and single-process clusters; every
    delivered message is recorded in message_log().

    Reply delays and timeouts are timers on an internal io thread, jobs
    run on a fixed worker pool.
*/
class InProcessJobDispatcher : public IJobDispatcher {
public:
    explicit InProcessJobDispatcher(std::size_t worker_threads = 4);
    ~InProcessJobDispatcher();

    InProcessJobDispatcher(const InProcessJobDispatcher&) = delete;
    InProcessJobDispatcher& operator=(const InProcessJobDispatcher&) = delete;

    void register_node(SnapshotVerifyService& service);
    void unregister_node(const std::string& node_id);

    // Delays the node's replies; a cancel for the job cuts the delay short
    void set_reply_delay(const std::string& node_id, std::chrono::milliseconds delay);

    void async_execute(const std::string& node_id,
                       const VerifyJobRequest& req,
                       std::chrono::milliseconds timeout,
                       DispatchHandler handler) override;

    void cancel(const std::string& node_id, uint64_t job_id) override;

    std::optional<SnapshotDescriptor> describe(const std::string& node_id,
                                               const std::string& snapshot_name,
                                               std::chrono::milliseconds timeout) override;

    std::vector<DispatchLogEntry> message_log() const;

    // Jobs delivered but not yet finished by their node
    std::size_t jobs_in_flight() const;

private:
    struct Call;

    void run(const std::shared_ptr<Call>& call);
    void forget(const std::shared_ptr<Call>& call);

    mutable std::mutex mtx_;
    std::map<std::string, SnapshotVerifyService*> nodes_;
    std::map<std::string, std::chrono::milliseconds> delays_;
    std::set<std::shared_ptr<Call>> calls_;
    std::vector<DispatchLogEntry> log_;
    bool shutting_down_{false};

    boost::asio::io_context io_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    std::thread io_thread_;
    boost::asio::thread_pool workers_;
};

}  // namespace strata

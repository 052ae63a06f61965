#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <utility>
#include <boost/asio.hpp>

#include "snapshot_types.h"
#include "strata_wire.h"

namespace strata {

class SnapshotVerifyService;

// Job port of a server node is its gossip port plus this offset
constexpr uint16_t JOB_PORT_OFFSET = 1000;

struct JobServerConfig {
    std::string host;
    uint16_t port;
    std::size_t worker_threads{4};
};

/**
 * JobServer
 *
 * TCP endpoint of a server node for snapshot check jobs.
 *
 *  - frames are strata_wire frames: 12-byte header, then the body
 *  - VerifyRequest runs on the worker pool, answered by VerifyResponse
 *  - CancelRequest is answered inline by CancelAck
 *  - DescribeRequest is answered inline by DescribeResponse
 *  - a malformed frame is answered by Error and the connection is closed
 */
class JobServer {
public:
    JobServer(const JobServerConfig& cfg, SnapshotVerifyService& service);
    ~JobServer();

    JobServer(const JobServer&) = delete;
    JobServer& operator=(const JobServer&) = delete;

    // Returns false when the endpoint could not be opened
    bool start();
    void stop();

    bool listening() const { return running_; }
    uint64_t jobs_received() const { return jobs_received_.load(); }

private:
    void do_accept();

    JobServerConfig cfg_;
    SnapshotVerifyService& service_;

    boost::asio::io_context io_;
    std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
    std::thread io_thread_;
    boost::asio::thread_pool workers_;
    bool running_;
    std::atomic<uint64_t> jobs_received_{0};
};

/**
 * JobClient
 *
 * Sends one request per connection and waits for the reply with a
 * deadline. Throws JobTimeoutError when the deadline passes,
 * StrataError(NodeUnreachable) on transport errors and StrataError
 * for an Error reply. The async calls hand the same errors to their
 * handler instead.
 */
class JobClient {
public:
    using OutcomeHandler = std::function<void(std::exception_ptr, NodeVerificationOutcome)>;

    JobClient(const std::string& host, uint16_t port);

    NodeVerificationOutcome execute(const VerifyJobRequest& req,
                                    std::chrono::milliseconds timeout);

    // Runs the call on io; the handler is invoked once, on a thread running io
    void async_execute(boost::asio::io_context& io,
                       const VerifyJobRequest& req,
                       std::chrono::milliseconds timeout,
                       OutcomeHandler handler);

    // Returns whether the job was still pending on the remote node
    bool cancel(uint64_t job_id, std::chrono::milliseconds timeout);

    // Empty when the remote node holds no metadata for the snapshot
    std::optional<SnapshotDescriptor> describe(const std::string& snapshot_name,
                                               std::chrono::milliseconds timeout);

private:
    using ReplyHandler = std::function<void(std::exception_ptr, std::vector<uint8_t>)>;

    void async_round_trip(boost::asio::io_context& io,
                          MessageType type,
                          const std::vector<uint8_t>& body,
                          MessageType expected,
                          std::chrono::milliseconds timeout,
                          ReplyHandler handler);

    std::vector<uint8_t> round_trip(MessageType type,
                                    const std::vector<uint8_t>& body,
                                    MessageType expected,
                                    std::chrono::milliseconds timeout);

    std::string target() const;

    std::string host_;
    uint16_t port_;
};

}  // namespace strata

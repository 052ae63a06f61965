#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <utility>
#include <boost/asio.hpp>

#include "affinity.h"
#include "cluster.h"
#include "job_dispatcher.h"
#include "job_server.h"
#include "snapshot_meta.h"
#include "verify_coordinator.h"
#include "verify_service.h"

namespace strata {

struct StrataNodeConfig {
    std::string data_root;
    NodeId self;
    std::vector<NodeId> peers;
    NodeRole role{NodeRole::Server};
    std::chrono::milliseconds verify_timeout{30000};
    std::size_t verify_threads{4};
};

/*
    StrataNode

    One cluster member: gossip membership, the snapshot catalog of its
    data root, the verify service and, on server nodes, the job server
    answering checks started elsewhere. Any node can start a check.
*/
class StrataNode {
public:
    explicit StrataNode(const StrataNodeConfig& cfg);
    ~StrataNode();

    StrataNode(const StrataNode&) = delete;
    StrataNode& operator=(const StrataNode&) = delete;

    // Throws std::runtime_error when the job endpoint cannot be opened
    void start();
    void stop();

    CheckHandle check_snapshot(const std::string& snapshot_name);

    std::filesystem::path snapshot_root() const;

    const StrataNodeConfig& config() const { return cfg_; }
    const GossipCluster& cluster() const { return *cluster_; }
    const SnapshotCatalog& catalog() const { return *catalog_; }
    SnapshotVerifyService& verify_service() { return *service_; }
    const JobServer* job_server() const { return job_server_.get(); }

private:
    void run_io();

    StrataNodeConfig cfg_;

    boost::asio::io_context io_;

    using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;
    std::optional<WorkGuard> work_guard_;

    std::thread io_thread_;
    bool running_{false};

    std::unique_ptr<GossipCluster> cluster_;
    std::unique_ptr<SnapshotCatalog> catalog_;
    RendezvousAffinity affinity_;
    std::unique_ptr<SnapshotVerifyService> service_;
    std::unique_ptr<JobServer> job_server_;
    std::unique_ptr<TcpJobDispatcher> dispatcher_;
    std::unique_ptr<VerificationCoordinator> coordinator_;
};

}  // namespace strata

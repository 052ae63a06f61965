#include "strata_node.h"

#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace strata {

StrataNode::StrataNode(const StrataNodeConfig& cfg)
    : cfg_(cfg),
      io_() {

    fs::create_directories(snapshot_root());

    cluster_ = std::make_unique<GossipCluster>(io_, cfg_.self, cfg_.role, cfg_.peers);
    catalog_ = std::make_unique<SnapshotCatalog>(snapshot_root(), cfg_.self.id);
    service_ = std::make_unique<SnapshotVerifyService>(cfg_.self.id, snapshot_root());

    if (cfg_.role == NodeRole::Server) {
        JobServerConfig jsc;
        jsc.host = cfg_.self.host;
        jsc.port = static_cast<uint16_t>(cfg_.self.gossip_port + JOB_PORT_OFFSET);
        jsc.worker_threads = cfg_.verify_threads;
        job_server_ = std::make_unique<JobServer>(jsc, *service_);
    }

    dispatcher_ = std::make_unique<TcpJobDispatcher>(cfg_.peers);

    CoordinatorConfig cc;
    cc.self_id = cfg_.self.id;
    cc.timeout = cfg_.verify_timeout;
    cc.threads = cfg_.verify_threads;
    coordinator_ = std::make_unique<VerificationCoordinator>(
        cc, *catalog_, *cluster_, affinity_, *dispatcher_, *service_);

    // Keep io_context alive
    work_guard_.emplace(boost::asio::make_work_guard(io_));
}

StrataNode::~StrataNode() {
    stop();
}

void StrataNode::run_io() {
    try {
        io_.run();
    } catch (const std::exception& ex) {
        std::cerr << "[StrataNode " << cfg_.self.id << "] io_context exception: " << ex.what() << "\n";
    }
}

void StrataNode::start() {
    if (running_) {
        return;
    }

    if (job_server_ && !job_server_->start()) {
        throw std::runtime_error("StrataNode " + cfg_.self.id + ": job server failed to start");
    }

    cluster_->start();
    io_thread_ = std::thread([this]() { run_io(); });
    running_ = true;

    std::cout << "[StrataNode " << cfg_.self.id << "] started as "
              << (cfg_.role == NodeRole::Server ? "server" : "client")
              << ", snapshots under " << snapshot_root() << "\n";
}

void StrataNode::stop() {
    if (!running_) {
        return;
    }
    running_ = false;

    if (job_server_) {
        job_server_->stop();
    }

    cluster_->stop();

    if (work_guard_.has_value()) {
        work_guard_.reset();
    }

    io_.stop();

    if (io_thread_.joinable()) {
        io_thread_.join();
    }
}

CheckHandle StrataNode::check_snapshot(const std::string& snapshot_name) {
    return coordinator_->check(snapshot_name);
}

fs::path StrataNode::snapshot_root() const {
    return fs::path(cfg_.data_root) / SNAPSHOTS_DIR;
}

}  // namespace strata

#include "job_dispatcher.h"

#include <atomic>
#include <future>
#include <iostream>

#include "job_server.h"
#include "strata_errors.h"
#include "verify_service.h"

namespace strata {

DispatchResult IJobDispatcher::execute(const std::string& node_id,
                                       const VerifyJobRequest& req,
                                       std::chrono::milliseconds timeout) {
    auto reply = std::make_shared<std::promise<DispatchResult>>();
    std::future<DispatchResult> fut = reply->get_future();
    async_execute(node_id, req, timeout, [reply](DispatchResult res) {
        reply->set_value(std::move(res));
    });
    return fut.get();
}

// ----------------- TcpJobDispatcher --------------------

TcpJobDispatcher::TcpJobDispatcher(const std::vector<NodeId>& nodes,
                                   std::chrono::milliseconds cancel_timeout)
    : cancel_timeout_(cancel_timeout),
      io_(),
      work_(boost::asio::make_work_guard(io_)),
      io_thread_() {
    for (const auto& n : nodes) {
        nodes_[n.id] = n;
    }

    io_thread_ = std::thread([this]() {
        try {
            io_.run();
        } catch (const std::exception& ex) {
            std::cerr << "[TcpJobDispatcher] io_context exception: " << ex.what() << "\n";
        }
    });
}

TcpJobDispatcher::~TcpJobDispatcher() {
    work_.reset();
    io_.stop();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }
}

void TcpJobDispatcher::async_execute(const std::string& node_id,
                                     const VerifyJobRequest& req,
                                     std::chrono::milliseconds timeout,
                                     DispatchHandler handler) {
    auto it = nodes_.find(node_id);
    if (it == nodes_.end()) {
        boost::asio::post(io_, [handler, node_id]() {
            handler(DispatchResult{DispatchStatus::Failed, std::nullopt,
                                   "no address known for node " + node_id});
        });
        return;
    }

    JobClient client(it->second.host, static_cast<uint16_t>(it->second.gossip_port + JOB_PORT_OFFSET));
    client.async_execute(io_, req, timeout, [handler](std::exception_ptr error, NodeVerificationOutcome out) {
        if (!error) {
            handler(DispatchResult{DispatchStatus::Replied, std::move(out), ""});
            return;
        }
        DispatchResult res{DispatchStatus::Failed, std::nullopt, ""};
        try {
            std::rethrow_exception(error);
        } catch (const JobTimeoutError& ex) {
            res.status = DispatchStatus::TimedOut;
            res.error = ex.what();
        } catch (const std::exception& ex) {
            res.error = ex.what();
        }
        handler(std::move(res));
    });
}

void TcpJobDispatcher::cancel(const std::string& node_id, uint64_t job_id) {
    auto it = nodes_.find(node_id);
    if (it == nodes_.end()) {
        return;
    }

    JobClient client(it->second.host, static_cast<uint16_t>(it->second.gossip_port + JOB_PORT_OFFSET));
    try {
        client.cancel(job_id, cancel_timeout_);
    } catch (const std::exception& ex) {
        std::cerr << "[TcpJobDispatcher] cancel of job " << job_id << " on " << node_id
                  << " failed: " << ex.what() << "\n";
    }
}

std::optional<SnapshotDescriptor> TcpJobDispatcher::describe(const std::string& node_id,
                                                             const std::string& snapshot_name,
                                                             std::chrono::milliseconds timeout) {
    auto it = nodes_.find(node_id);
    if (it == nodes_.end()) {
        return std::nullopt;
    }

    JobClient client(it->second.host, static_cast<uint16_t>(it->second.gossip_port + JOB_PORT_OFFSET));
    try {
        return client.describe(snapshot_name, timeout);
    } catch (const std::exception& ex) {
        std::cerr << "[TcpJobDispatcher] describe of snapshot \"" << snapshot_name << "\" on " << node_id
                  << " failed: " << ex.what() << "\n";
        return std::nullopt;
    }
}

// ----------------- InProcessJobDispatcher --------------------

struct InProcessJobDispatcher::Call {
    Call(boost::asio::io_context& io, std::string node, VerifyJobRequest r,
         SnapshotVerifyService* svc, DispatchHandler h)
        : node_id(std::move(node)),
          req(std::move(r)),
          service(svc),
          handler(std::move(h)),
          delay(io),
          deadline(io) {}

    // First of reply and deadline wins
    bool claim() { return !answered.exchange(true); }

    std::string node_id;
    VerifyJobRequest req;
    SnapshotVerifyService* service;
    DispatchHandler handler;
    boost::asio::steady_timer delay;     // io thread only
    boost::asio::steady_timer deadline;  // io thread only
    std::atomic<bool> answered{false};
};

InProcessJobDispatcher::InProcessJobDispatcher(std::size_t worker_threads)
    : io_(),
      work_(boost::asio::make_work_guard(io_)),
      io_thread_(),
      workers_(worker_threads) {
    io_thread_ = std::thread([this]() {
        try {
            io_.run();
        } catch (const std::exception& ex) {
            std::cerr << "[InProcessJobDispatcher] io_context exception: " << ex.what() << "\n";
        }
    });
}

InProcessJobDispatcher::~InProcessJobDispatcher() {
    std::vector<std::shared_ptr<Call>> live;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        shutting_down_ = true;
        live.assign(calls_.begin(), calls_.end());
    }

    // Delayed jobs run at once, callers still waiting are not answered
    boost::asio::post(io_, [live]() {
        for (const auto& call : live) {
            call->delay.cancel();
            call->deadline.cancel();
        }
    });

    work_.reset();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }
    workers_.join();
}

void InProcessJobDispatcher::register_node(SnapshotVerifyService& service) {
    std::lock_guard<std::mutex> lock(mtx_);
    nodes_[service.node_id()] = &service;
}

void InProcessJobDispatcher::unregister_node(const std::string& node_id) {
    std::lock_guard<std::mutex> lock(mtx_);
    nodes_.erase(node_id);
}

void InProcessJobDispatcher::set_reply_delay(const std::string& node_id,
                                             std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lock(mtx_);
    delays_[node_id] = delay;
}

void InProcessJobDispatcher::async_execute(const std::string& node_id,
                                           const VerifyJobRequest& req,
                                           std::chrono::milliseconds timeout,
                                           DispatchHandler handler) {
    std::lock_guard<std::mutex> lock(mtx_);
    log_.push_back(DispatchLogEntry{node_id, MessageType::VerifyRequest, req.job_id});

    auto it = nodes_.find(node_id);
    if (it == nodes_.end() || shutting_down_) {
        boost::asio::post(workers_, [handler, node_id]() {
            handler(DispatchResult{DispatchStatus::Failed, std::nullopt,
                                   "node " + node_id + " is not reachable"});
        });
        return;
    }

    std::chrono::milliseconds delay{0};
    auto d = delays_.find(node_id);
    if (d != delays_.end()) {
        delay = d->second;
    }

    auto call = std::make_shared<Call>(io_, node_id, req, it->second, std::move(handler));
    calls_.insert(call);

    // Posted under the lock so the destructor's timer cancel is queued after it
    boost::asio::post(io_, [this, call, delay, timeout]() {
        call->deadline.expires_after(timeout);
        call->deadline.async_wait([call, timeout](const boost::system::error_code& ec) {
            if (ec || !call->claim()) {
                return;
            }
            // The node keeps working on it, as a remote node would
            call->handler(DispatchResult{DispatchStatus::TimedOut, std::nullopt,
                                         "node " + call->node_id + " did not reply within " +
                                         std::to_string(timeout.count()) + " ms"});
        });

        call->delay.expires_after(delay);
        call->delay.async_wait([this, call](const boost::system::error_code& /*ec*/) {
            // A cancelled delay still delivers the job, the node answers it as cancelled
            boost::asio::post(workers_, [this, call]() { run(call); });
        });
    });
}

void InProcessJobDispatcher::run(const std::shared_ptr<Call>& call) {
    DispatchResult res{DispatchStatus::Failed, std::nullopt, ""};
    try {
        res.outcome = call->service->execute(call->req);
        res.status = DispatchStatus::Replied;
    } catch (const std::exception& ex) {
        res.error = ex.what();
    }

    boost::asio::post(io_, [call]() { call->deadline.cancel(); });
    if (call->claim()) {
        call->handler(std::move(res));
    }
    forget(call);
}

void InProcessJobDispatcher::forget(const std::shared_ptr<Call>& call) {
    std::lock_guard<std::mutex> lock(mtx_);
    calls_.erase(call);
}

void InProcessJobDispatcher::cancel(const std::string& node_id, uint64_t job_id) {
    SnapshotVerifyService* service = nullptr;
    std::vector<std::shared_ptr<Call>> delayed;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        log_.push_back(DispatchLogEntry{node_id, MessageType::CancelRequest, job_id});
        auto it = nodes_.find(node_id);
        if (it != nodes_.end()) {
            service = it->second;
        }
        for (const auto& call : calls_) {
            if (call->node_id == node_id && call->req.job_id == job_id) {
                delayed.push_back(call);
            }
        }
    }

    if (service != nullptr) {
        service->cancel(job_id);
    }

    boost::asio::post(io_, [delayed]() {
        for (const auto& call : delayed) {
            call->delay.cancel();
        }
    });
}

std::optional<SnapshotDescriptor> InProcessJobDispatcher::describe(const std::string& node_id,
                                                                   const std::string& snapshot_name,
                                                                   std::chrono::milliseconds /*timeout*/) {
    SnapshotVerifyService* service = nullptr;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        log_.push_back(DispatchLogEntry{node_id, MessageType::DescribeRequest, 0});
        auto it = nodes_.find(node_id);
        if (it != nodes_.end()) {
            service = it->second;
        }
    }

    if (service == nullptr) {
        return std::nullopt;
    }
    return service->describe(snapshot_name);
}

std::vector<DispatchLogEntry> InProcessJobDispatcher::message_log() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return log_;
}

std::size_t InProcessJobDispatcher::jobs_in_flight() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return calls_.size();
}

}  // namespace strata

#include "verify_coordinator.h"

#include <algorithm>
#include <iostream>
#include <random>
#include <set>

#include "result_aggregator.h"
#include "strata_errors.h"
#include "verify_service.h"

namespace strata {

// ----------------- CheckHandle --------------------

CheckHandle::CheckHandle(std::shared_ptr<detail::CheckRun> run)
    : run_(std::move(run)) {}

uint64_t CheckHandle::job_id() const {
    return run_->job_id;
}

const std::string& CheckHandle::snapshot_name() const {
    return run_->desc.name;
}

VerificationVerdict CheckHandle::get() const {
    return run_->result.get();
}

bool CheckHandle::wait_for(std::chrono::milliseconds timeout) const {
    return run_->result.wait_for(timeout) == std::future_status::ready;
}

bool CheckHandle::done() const {
    return wait_for(std::chrono::milliseconds(0));
}

bool CheckHandle::cancel() {
    std::lock_guard<std::mutex> lock(run_->owner->mtx);
    if (run_->owner->coordinator == nullptr) {
        return false;
    }
    return run_->owner->coordinator->cancel(run_);
}

// ----------------- VerificationCoordinator --------------------

VerificationCoordinator::VerificationCoordinator(const CoordinatorConfig& cfg,
                                                 const SnapshotCatalog& catalog,
                                                 const IClusterView& cluster,
                                                 const IAffinity& affinity,
                                                 IJobDispatcher& dispatcher,
                                                 SnapshotVerifyService& local)
    : cfg_(cfg),
      catalog_(catalog),
      cluster_(cluster),
      affinity_(affinity),
      dispatcher_(dispatcher),
      local_(local),
      link_(std::make_shared<detail::OwnerLink>()),
      io_(),
      work_(boost::asio::make_work_guard(io_)),
      io_thread_(),
      pool_(cfg.threads),
      next_job_id_(static_cast<uint64_t>(std::random_device{}()) << 32) {
    link_->coordinator = this;
    io_thread_ = std::thread([this]() {
        try {
            io_.run();
        } catch (const std::exception& ex) {
            std::cerr << "[VerifyCoordinator " << cfg_.self_id << "] io_context exception: "
                      << ex.what() << "\n";
        }
    });
}

VerificationCoordinator::~VerificationCoordinator() {
    {
        std::lock_guard<std::mutex> lock(link_->mtx);
        link_->coordinator = nullptr;
    }

    // Every dispatch is bounded by the dispatch timeout
    {
        std::unique_lock<std::mutex> lock(dispatch_mtx_);
        dispatch_cv_.wait(lock, [this]() { return dispatches_in_flight_ == 0; });
    }
    pool_.join();

    work_.reset();
    io_.stop();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }
}

std::vector<std::string> VerificationCoordinator::participants(
    const PartitionAssignment& assignment,
    const std::vector<MemberView>& members) {

    std::set<std::string> out;
    for (const auto& m : members) {
        if (m.role != NodeRole::Server) {
            continue;
        }
        if (!assignment.is_eligible(m.id)) {
            continue;
        }
        out.insert(m.id);
    }
    return std::vector<std::string>(out.begin(), out.end());
}

std::vector<std::string> VerificationCoordinator::remote_participants(
    const std::vector<std::string>& participants) const {

    std::vector<std::string> out;
    for (const auto& id : participants) {
        if (id != cfg_.self_id) {
            out.push_back(id);
        }
    }
    return out;
}

VerifyJobRequest VerificationCoordinator::request_for(const detail::CheckRun& run,
                                                      const std::string& node_id) const {
    VerifyJobRequest req;
    req.job_id = run.job_id;
    req.snapshot_name = run.desc.name;
    req.page_size = run.desc.page_size;
    req.groups = run.assignment.expected_for(run.desc, node_id);
    return req;
}

std::optional<SnapshotDescriptor> VerificationCoordinator::describe_from_peers(
    const std::string& snapshot_name) const {

    for (const auto& m : cluster_.members_snapshot()) {
        if (m.role != NodeRole::Server || m.id == cfg_.self_id) {
            continue;
        }
        std::optional<SnapshotDescriptor> desc = dispatcher_.describe(m.id, snapshot_name, cfg_.timeout);
        if (desc) {
            std::cout << "[VerifyCoordinator " << cfg_.self_id << "] no readable metadata for snapshot \""
                      << snapshot_name << "\" on this node, using the one held by " << m.id << "\n";
            return desc;
        }
    }
    return std::nullopt;
}

CheckHandle VerificationCoordinator::check(const std::string& snapshot_name) {
    std::optional<SnapshotDescriptor> desc = catalog_.find(snapshot_name);
    if (!desc) {
        desc = describe_from_peers(snapshot_name);
    }
    if (!desc) {
        throw SnapshotNotFoundError("Snapshot does not exist [snapshot=" + snapshot_name +
                                    ", node=" + cfg_.self_id + "]");
    }

    // Topology is fixed for the whole run
    auto run = std::make_shared<detail::CheckRun>();
    run->owner = link_;
    run->job_id = next_job_id_.fetch_add(1);
    run->desc = std::move(*desc);
    run->assignment = affinity_.assign(run->desc);
    run->participants = participants(run->assignment, cluster_.members_snapshot());
    run->expected_outcomes = run->participants.size();
    run->result = run->promise.get_future().share();

    // The partitions of an offline baseline node cannot be checked, which is a finding
    for (const auto& id : run->desc.baseline) {
        if (run->assignment.is_eligible(id) &&
            std::find(run->participants.begin(), run->participants.end(), id) == run->participants.end()) {
            std::cerr << "[VerifyCoordinator " << cfg_.self_id << "] baseline node " << id
                      << " is offline, its snapshot copy is not checked\n";
            run->outcomes.emplace(id, NodeVerificationOutcome::failed_with(
                id, NodeFailure::make(FailureKind::NodeUnreachable,
                                      "Baseline node " + id + " is not an online server node")));
            ++run->expected_outcomes;
        }
    }

    std::cout << "[VerifyCoordinator " << cfg_.self_id << "] job " << run->job_id
              << " checking snapshot \"" << run->desc.name << "\" on "
              << run->participants.size() << " node(s)\n";

    if (run->participants.empty()) {
        std::map<std::string, NodeVerificationOutcome> outcomes;
        {
            std::lock_guard<std::mutex> lock(run->mtx);
            run->finished = true;
            outcomes = run->outcomes;
        }
        complete(run, outcomes);
        return CheckHandle(run);
    }

    arm_deadline(run);

    bool local_participates = false;
    for (const auto& id : run->participants) {
        if (id == cfg_.self_id) {
            local_participates = true;
        }
    }
    if (local_participates) {
        boost::asio::post(pool_, [this, run]() { run_local(run); });
    }
    for (const auto& id : remote_participants(run->participants)) {
        dispatch(run, id);
    }

    return CheckHandle(run);
}

void VerificationCoordinator::run_local(const std::shared_ptr<detail::CheckRun>& run) {
    NodeVerificationOutcome outcome;
    try {
        outcome = local_.execute(request_for(*run, cfg_.self_id));
    } catch (const std::exception&) {
        outcome = NodeVerificationOutcome::failed_with(
            cfg_.self_id, NodeFailure::from_exception(std::current_exception()));
    }
    outcome.node_id = cfg_.self_id;
    record(run, std::move(outcome));
}

void VerificationCoordinator::dispatch(const std::shared_ptr<detail::CheckRun>& run,
                                       const std::string& node_id) {
    {
        std::lock_guard<std::mutex> lock(dispatch_mtx_);
        ++dispatches_in_flight_;
    }

    dispatcher_.async_execute(node_id, request_for(*run, node_id), cfg_.timeout,
                              [this, run, node_id](DispatchResult res) {
        on_reply(run, node_id, std::move(res));

        std::lock_guard<std::mutex> lock(dispatch_mtx_);
        --dispatches_in_flight_;
        dispatch_cv_.notify_all();
    });
}

void VerificationCoordinator::on_reply(const std::shared_ptr<detail::CheckRun>& run,
                                       const std::string& node_id,
                                       DispatchResult res) {
    NodeVerificationOutcome outcome;
    switch (res.status) {
        case DispatchStatus::Replied:
            outcome = std::move(*res.outcome);
            // The reply speaks for the node it was sent to
            outcome.node_id = node_id;
            break;
        case DispatchStatus::TimedOut: {
            // The node may still be working on it. The notice blocks, so not on the dispatcher thread
            uint64_t job_id = run->job_id;
            boost::asio::post(pool_, [this, node_id, job_id]() { dispatcher_.cancel(node_id, job_id); });
            outcome = NodeVerificationOutcome::failed_with(
                node_id, NodeFailure::make(FailureKind::NodeTimedOut,
                                           "Node " + node_id + " did not reply: " + res.error));
            break;
        }
        case DispatchStatus::Failed:
            outcome = NodeVerificationOutcome::failed_with(
                node_id, NodeFailure::make(FailureKind::NodeUnreachable,
                                           "Node " + node_id + " is unreachable: " + res.error));
            break;
    }
    record(run, std::move(outcome));
}

void VerificationCoordinator::arm_deadline(const std::shared_ptr<detail::CheckRun>& run) {
    boost::asio::post(io_, [this, run]() {
        auto timer = std::make_unique<boost::asio::steady_timer>(io_);
        timer->expires_after(cfg_.timeout);
        timer->async_wait([this, run](const boost::system::error_code& ec) {
            if (ec) {
                return;
            }
            timers_.erase(run->job_id);
            on_deadline(run);
        });
        timers_[run->job_id] = std::move(timer);
    });
}

void VerificationCoordinator::release_deadline(uint64_t job_id) {
    boost::asio::post(io_, [this, job_id]() {
        auto it = timers_.find(job_id);
        if (it != timers_.end()) {
            it->second->cancel();
            timers_.erase(it);
        }
    });
}

void VerificationCoordinator::record(const std::shared_ptr<detail::CheckRun>& run,
                                     NodeVerificationOutcome outcome) {
    std::map<std::string, NodeVerificationOutcome> outcomes;
    {
        std::lock_guard<std::mutex> lock(run->mtx);
        if (run->finished || run->outcomes.count(outcome.node_id) > 0) {
            return;
        }
        std::string node = outcome.node_id;
        run->outcomes.emplace(node, std::move(outcome));
        if (run->outcomes.size() < run->expected_outcomes) {
            return;
        }
        run->finished = true;
        outcomes = run->outcomes;
    }

    release_deadline(run->job_id);
    complete(run, outcomes);
}

void VerificationCoordinator::on_deadline(const std::shared_ptr<detail::CheckRun>& run) {
    std::vector<std::string> pending;
    std::map<std::string, NodeVerificationOutcome> outcomes;
    {
        std::lock_guard<std::mutex> lock(run->mtx);
        if (run->finished) {
            return;
        }
        for (const auto& id : run->participants) {
            if (run->outcomes.count(id) == 0) {
                pending.push_back(id);
                run->outcomes.emplace(id, NodeVerificationOutcome::failed_with(
                    id, NodeFailure::make(FailureKind::NodeTimedOut,
                                          "Node " + id + " did not reply within " +
                                          std::to_string(cfg_.timeout.count()) + " ms")));
            }
        }
        run->finished = true;
        outcomes = run->outcomes;
    }

    std::cerr << "[VerifyCoordinator " << cfg_.self_id << "] job " << run->job_id
              << " deadline passed, " << pending.size() << " node(s) did not reply\n";

    // Keep the io thread free of blocking dispatcher calls
    uint64_t job_id = run->job_id;
    boost::asio::post(pool_, [this, job_id, pending]() { send_cancel_notices(job_id, pending); });

    complete(run, outcomes);
}

bool VerificationCoordinator::cancel(const std::shared_ptr<detail::CheckRun>& run) {
    std::vector<std::string> pending;
    {
        std::lock_guard<std::mutex> lock(run->mtx);
        if (run->finished) {
            return false;
        }
        for (const auto& id : run->participants) {
            if (run->outcomes.count(id) == 0) {
                pending.push_back(id);
            }
        }
        run->outcomes.clear();
        run->finished = true;
    }

    std::cout << "[VerifyCoordinator " << cfg_.self_id << "] job " << run->job_id
              << " cancelled, notifying " << pending.size() << " node(s)\n";

    release_deadline(run->job_id);
    send_cancel_notices(run->job_id, pending);

    run->promise.set_exception(std::make_exception_ptr(
        CancelledError("Snapshot check of \"" + run->desc.name + "\" was cancelled [job=" +
                       std::to_string(run->job_id) + "]")));
    return true;
}

void VerificationCoordinator::complete(const std::shared_ptr<detail::CheckRun>& run,
                                       const std::map<std::string, NodeVerificationOutcome>& outcomes) {
    VerificationVerdict verdict = ResultAggregator(run->desc, run->assignment).aggregate(outcomes);

    std::cout << "[VerifyCoordinator " << cfg_.self_id << "] job " << run->job_id
              << " finished: " << (verdict.clean() ? "clean" : "not clean") << " ("
              << verdict.failures().size() << " failed, "
              << verdict.conflicts().size() << " conflicts, "
              << verdict.missing_count() << " missing)\n";

    run->promise.set_value(std::move(verdict));
}

void VerificationCoordinator::send_cancel_notices(uint64_t job_id, const std::vector<std::string>& nodes) {
    for (const auto& id : nodes) {
        if (id == cfg_.self_id) {
            local_.cancel(job_id);
        } else {
            dispatcher_.cancel(id, job_id);
        }
    }
}

}  // namespace strata

#include "verify_service.h"

#include <iostream>

#include "strata_errors.h"

namespace strata {

static constexpr std::size_t MAX_EARLY_CANCELS = 1024;

SnapshotVerifyService::SnapshotVerifyService(std::string node_id,
                                             std::filesystem::path snapshot_root)
    : node_id_(node_id),
      inspector_(node_id, snapshot_root),
      catalog_(snapshot_root, node_id) {}

NodeVerificationOutcome SnapshotVerifyService::cancelled_outcome(uint64_t job_id,
                                                                 const std::string& when) const {
    return NodeVerificationOutcome::failed_with(
        node_id_,
        NodeFailure::make(FailureKind::Cancelled,
                          "Snapshot check job " + std::to_string(job_id) + " was cancelled " +
                          when + " on node " + node_id_));
}

NodeVerificationOutcome SnapshotVerifyService::execute(const VerifyJobRequest& req) {
    std::shared_ptr<Inspection> insp;
    std::promise<NodeVerificationOutcome> promise;
    std::function<void(const VerifyJobRequest&)> hook;
    bool owner = false;

    {
        std::unique_lock<std::mutex> lock(mtx_);

        // Cancellation notice overtook the job itself
        if (cancelled_early_.erase(req.job_id) > 0) {
            return cancelled_outcome(req.job_id, "before it started");
        }

        pending_[req.job_id] = nullptr;
        bool queued = false;
        for (;;) {
            if (pending_.count(req.job_id) == 0) {
                return cancelled_outcome(req.job_id, "while queued");
            }

            auto it = inflight_.find(req.snapshot_name);
            if (it == inflight_.end()) {
                insp = std::make_shared<Inspection>();
                insp->snapshot_name = req.snapshot_name;
                insp->page_size = req.page_size;
                insp->groups = req.groups;
                insp->result = promise.get_future().share();
                inflight_.emplace(req.snapshot_name, insp);
                ++inspections_started_;
                owner = true;
                break;
            }
            if (it->second->answers(req)) {
                insp = it->second;
                break;
            }

            if (!queued) {
                queued = true;
                std::cout << "[VerifyService " << node_id_ << "] job " << req.job_id
                          << " waits for the running inspection of \"" << req.snapshot_name << "\"\n";
            }
            inspection_done_.wait(lock);
        }

        pending_[req.job_id] = insp;
        insp->jobs.insert(req.job_id);
        hook = hook_;
    }

    if (owner) {
        std::cout << "[VerifyService " << node_id_ << "] job " << req.job_id
                  << " inspecting snapshot \"" << req.snapshot_name << "\"\n";
        if (hook) {
            hook(req);
        }
        run_inspection(req, insp, promise);
    } else {
        std::cout << "[VerifyService " << node_id_ << "] job " << req.job_id
                  << " joined running inspection of \"" << req.snapshot_name << "\"\n";
    }

    auto detach = [this, &req, &insp]() {
        std::lock_guard<std::mutex> lock(mtx_);
        insp->jobs.erase(req.job_id);
        return pending_.erase(req.job_id) > 0;
    };

    NodeVerificationOutcome outcome;
    try {
        outcome = insp->result.get();
    } catch (...) {
        detach();
        throw;
    }

    bool still_pending = detach();

    if (!still_pending) {
        return cancelled_outcome(req.job_id, "while running");
    }
    return outcome;
}

void SnapshotVerifyService::run_inspection(
    const VerifyJobRequest& req,
    const std::shared_ptr<Inspection>& insp,
    std::promise<NodeVerificationOutcome>& promise) {

    // The shared inspection stops only when every attached job is gone
    auto cancelled = [this, insp]() {
        std::lock_guard<std::mutex> lock(mtx_);
        return insp->jobs.empty();
    };

    auto finish = [this, &req, &insp]() {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            auto it = inflight_.find(req.snapshot_name);
            if (it != inflight_.end() && it->second == insp) {
                inflight_.erase(it);
            }
        }
        inspection_done_.notify_all();
    };

    try {
        NodeVerificationOutcome outcome = inspector_.inspect(req, cancelled);
        finish();
        promise.set_value(std::move(outcome));
    } catch (...) {
        // Rethrown to every attached job by the shared future
        finish();
        promise.set_exception(std::current_exception());
    }
}

bool SnapshotVerifyService::cancel(uint64_t job_id) {
    {
        std::lock_guard<std::mutex> lock(mtx_);

        auto it = pending_.find(job_id);
        if (it == pending_.end()) {
            // Unknown ids are either finished or not arrived yet; keep a bounded memory of them
            if (cancelled_early_.size() >= MAX_EARLY_CANCELS) {
                cancelled_early_.erase(cancelled_early_.begin());
            }
            cancelled_early_.insert(job_id);
            return false;
        }

        if (it->second) {
            it->second->jobs.erase(job_id);
        }
        pending_.erase(it);
    }
    // A queued job wakes up to see it is gone
    inspection_done_.notify_all();

    std::cout << "[VerifyService " << node_id_ << "] job " << job_id << " cancelled\n";
    return true;
}

std::optional<SnapshotDescriptor> SnapshotVerifyService::describe(const std::string& snapshot_name) const {
    return catalog_.find(snapshot_name);
}

void SnapshotVerifyService::set_inspection_hook(std::function<void(const VerifyJobRequest&)> hook) {
    std::lock_guard<std::mutex> lock(mtx_);
    hook_ = std::move(hook);
}

std::size_t SnapshotVerifyService::pending_jobs() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return pending_.size();
}

uint64_t SnapshotVerifyService::inspections_started() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return inspections_started_;
}

}  // namespace strata

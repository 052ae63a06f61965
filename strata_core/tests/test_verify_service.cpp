#include "../src/verify_service.h"
#include "test_support.h"

#include <cassert>
#include <chrono>
#include <functional>
#include <future>
#include <iostream>
#include <optional>
#include <thread>
#include <vector>

using namespace strata;
using namespace strata::testing;

static VerifyJobRequest job(uint64_t id, const SnapshotFixture& fx, const SnapshotDescriptor& desc) {
    VerifyJobRequest req;
    req.job_id = id;
    req.snapshot_name = desc.name;
    req.page_size = desc.page_size;
    req.groups = fx.assignment().expected_for(desc, "node1");
    return req;
}

// Same snapshot, fewer partitions of the first group
static VerifyJobRequest narrow_job(uint64_t id, const SnapshotFixture& fx, const SnapshotDescriptor& desc) {
    VerifyJobRequest req = job(id, fx, desc);
    req.groups.front().partitions.resize(10);
    return req;
}

static void wait_until(const std::function<bool()>& cond) {
    for (int i = 0; i < 5000 && !cond(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    assert(cond());
}

int main() {
    SnapshotFixture fx("verify_service_test_data", {"node1"});
    // enough partitions to keep an inspection busy for a moment
    fx.add_group("big", 400, 0);
    SnapshotDescriptor desc = fx.create("snap1");

    SnapshotVerifyService service("node1", fx.snapshot_root("node1"));

    // 1) Single job
    {
        auto out = service.execute(job(1, fx, desc));
        assert(!out.failed());
        assert(out.partitions.size() == 400);
        assert(service.pending_jobs() == 0);
        assert(service.inspections_started() == 1);
    }

    // 2) Jobs arriving during an inspection share it
    {
        const uint64_t before = service.inspections_started();
        std::promise<void> release;
        std::shared_future<void> gate = release.get_future().share();
        service.set_inspection_hook([gate](const VerifyJobRequest&) { gate.wait(); });

        std::vector<std::future<NodeVerificationOutcome>> results;
        results.push_back(std::async(std::launch::async, [&]() { return service.execute(job(10, fx, desc)); }));
        wait_until([&]() { return service.inspections_started() == before + 1; });

        for (uint64_t id = 11; id < 14; ++id) {
            results.push_back(std::async(std::launch::async, [&, id]() {
                return service.execute(job(id, fx, desc));
            }));
        }
        wait_until([&]() { return service.pending_jobs() == 4; });
        release.set_value();

        std::vector<NodeVerificationOutcome> outs;
        for (auto& r : results) {
            outs.push_back(r.get());
        }
        for (const auto& o : outs) {
            assert(o == outs.front());
        }
        assert(!outs.front().failed());
        assert(service.inspections_started() - before == 1);
        assert(service.pending_jobs() == 0);
        service.set_inspection_hook(nullptr);
    }

    // 3) Cancel before the job arrives
    {
        assert(!service.cancel(20));
        auto out = service.execute(job(20, fx, desc));
        assert(out.failed());
        assert(out.failure->kind() == FailureKind::Cancelled);
        assert(service.pending_jobs() == 0);
    }

    // 4) Cancel while running: the job answers Cancelled
    {
        auto fut = std::async(std::launch::async, [&]() { return service.execute(job(30, fx, desc)); });

        bool cancelled = false;
        for (int i = 0; i < 2000 && !cancelled; ++i) {
            cancelled = service.cancel(30);
            if (!cancelled) {
                std::this_thread::sleep_for(std::chrono::microseconds(100));
            }
        }

        auto out = fut.get();
        if (cancelled) {
            assert(out.failed());
            assert(out.failure->kind() == FailureKind::Cancelled);
        }
        assert(service.pending_jobs() == 0);
    }

    // 5) Unknown snapshot is a node failure, not an exception
    {
        VerifyJobRequest req = job(40, fx, desc);
        req.snapshot_name = "missing";
        auto out = service.execute(req);
        assert(out.failed());
        assert(out.failure->kind() == FailureKind::SnapshotNotFound);
    }

    // 6) A job asking a different question waits for the running inspection
    {
        const uint64_t before = service.inspections_started();
        std::promise<void> release;
        std::shared_future<void> gate = release.get_future().share();
        service.set_inspection_hook([gate](const VerifyJobRequest&) { gate.wait(); });

        auto full = std::async(std::launch::async, [&]() { return service.execute(job(50, fx, desc)); });
        wait_until([&]() { return service.inspections_started() == before + 1; });

        auto narrow = std::async(std::launch::async, [&]() { return service.execute(narrow_job(51, fx, desc)); });
        wait_until([&]() { return service.pending_jobs() == 2; });
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        assert(service.inspections_started() == before + 1);

        release.set_value();
        auto full_out = full.get();
        auto narrow_out = narrow.get();
        assert(!full_out.failed());
        assert(!narrow_out.failed());
        assert(full_out.partitions.size() == 400);
        assert(narrow_out.partitions.size() == 10);
        assert(service.inspections_started() == before + 2);
        assert(service.pending_jobs() == 0);
        service.set_inspection_hook(nullptr);
    }

    // 7) Cancelling a queued job releases it without an inspection
    {
        const uint64_t before = service.inspections_started();
        std::promise<void> release;
        std::shared_future<void> gate = release.get_future().share();
        service.set_inspection_hook([gate](const VerifyJobRequest&) { gate.wait(); });

        auto full = std::async(std::launch::async, [&]() { return service.execute(job(60, fx, desc)); });
        wait_until([&]() { return service.inspections_started() == before + 1; });

        auto narrow = std::async(std::launch::async, [&]() { return service.execute(narrow_job(61, fx, desc)); });
        wait_until([&]() { return service.pending_jobs() == 2; });

        assert(service.cancel(61));
        auto narrow_out = narrow.get();
        assert(narrow_out.failed());
        assert(narrow_out.failure->kind() == FailureKind::Cancelled);

        release.set_value();
        assert(!full.get().failed());
        assert(service.inspections_started() == before + 1);
        assert(service.pending_jobs() == 0);
        service.set_inspection_hook(nullptr);
    }

    // 8) Descriptor lookup from the local metafiles
    {
        std::optional<SnapshotDescriptor> found = service.describe("snap1");
        assert(found.has_value());
        assert(*found == desc);
        assert(!service.describe("missing").has_value());
    }

    std::cout << "Snapshot verify service test passed\n";
    return 0;
}

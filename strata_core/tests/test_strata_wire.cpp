#include "../src/strata_wire.h"

#include <cassert>
#include <exception>
#include <iostream>
#include <optional>
#include <vector>

using namespace strata;

int main() {
    // 1) Verify request with several groups
    {
        VerifyJobRequest req;
        req.job_id = 0x1122334455667788ULL;
        req.snapshot_name = "nightly";
        req.page_size = 4096;
        req.groups.push_back(ExpectedGroup{cache_group_id("a"), "a", {0, 3, 7}});
        req.groups.push_back(ExpectedGroup{cache_group_id("b"), "b", {}});

        std::vector<uint8_t> body;
        encode_verify_request(req, body);

        VerifyJobRequest out;
        assert(decode_verify_request(body, out));
        assert(out == req);

        // trailing garbage is rejected
        body.push_back(0);
        assert(!decode_verify_request(body, out));
    }

    // 2) Outcome carrying a nested failure chain
    {
        NodeVerificationOutcome o;
        try {
            try {
                throw CorruptPageError("CRC mismatch on page 3");
            } catch (const StrataError& ex) {
                std::throw_with_nested(StrataError(ex.kind(), "Failed to verify snapshot partition"));
            }
        } catch (const std::exception&) {
            o = NodeVerificationOutcome::failed_with("node2", NodeFailure::from_exception(std::current_exception()));
        }
        assert(o.failure->causes.size() == 2);

        std::vector<uint8_t> body;
        encode_verification_outcome(o, body);

        NodeVerificationOutcome out;
        assert(decode_verification_outcome(body, out));
        assert(out == o);
        assert(out.failure->has_cause(FailureKind::CorruptPage));
        assert(out.failure->root_cause().message == "CRC mismatch on page 3");
        assert(out.failure->message() == "Failed to verify snapshot partition");
    }

    // 3) Outcome with records and findings
    {
        NodeVerificationOutcome o;
        o.node_id = "node3";
        o.partitions.push_back(PartitionRecord{PartitionKey{-5, 1}, 77, true, true, 12});
        o.missing_groups.push_back(42);
        o.missing_partitions.push_back(PartitionKey{-5, 2});
        o.missing_metadata.push_back(MissingMetadata{std::nullopt, "node3.smf"});
        o.missing_metadata.push_back(MissingMetadata{-5, "cache_data.dat"});

        std::vector<uint8_t> body;
        encode_verification_outcome(o, body);

        NodeVerificationOutcome out;
        assert(decode_verification_outcome(body, out));
        assert(out == o);
        assert(!out.failed());

        // truncated body is rejected
        body.resize(body.size() - 3);
        assert(!decode_verification_outcome(body, out));
    }

    // 4) Framing: header fields and body checksum
    {
        std::vector<uint8_t> body;
        encode_cancel_request(99, body);

        std::vector<uint8_t> frame;
        encode_frame(MessageType::CancelRequest, body, frame);
        assert(frame.size() == FRAME_HEADER_SIZE + body.size());
        assert(frame[0] == 'S' && frame[1] == 'V');

        FrameHeader h{};
        assert(decode_frame_header(frame.data(), h));
        assert(h.msg_type == static_cast<uint8_t>(MessageType::CancelRequest));
        assert(h.length == body.size());

        std::vector<uint8_t> received(frame.begin() + FRAME_HEADER_SIZE, frame.end());
        assert(verify_frame_body(h, received));

        uint64_t job_id = 0;
        assert(decode_cancel_request(received, job_id));
        assert(job_id == 99);

        // flipped body byte
        received[0] ^= 0x01;
        assert(!verify_frame_body(h, received));

        // bad magic, unknown type, oversized length
        std::vector<uint8_t> bad = frame;
        bad[0] = 'X';
        assert(!decode_frame_header(bad.data(), h));

        bad = frame;
        bad[3] = 0x7F;
        assert(!decode_frame_header(bad.data(), h));

        bad = frame;
        bad[4] = 0xFF;
        assert(!decode_frame_header(bad.data(), h));
    }

    // 5) Small messages
    {
        std::vector<uint8_t> body;
        encode_cancel_ack(true, body);
        bool pending = false;
        assert(decode_cancel_ack(body, pending));
        assert(pending);

        encode_error("malformed verify request", body);
        std::string msg;
        assert(decode_error(body, msg));
        assert(msg == "malformed verify request");
    }

    // 6) Unknown failure kinds are rejected
    {
        NodeVerificationOutcome o = NodeVerificationOutcome::failed_with(
            "node1", NodeFailure::make(FailureKind::NodeTimedOut, "late"));
        std::vector<uint8_t> body;
        encode_verification_outcome(o, body);

        // [str node_id = 4+5][u8 has_failure][u32 count] then the kind byte
        std::size_t kind_off = 4 + 5 + 1 + 4;
        assert(body[kind_off] == static_cast<uint8_t>(FailureKind::NodeTimedOut));
        body[kind_off] = 200;

        NodeVerificationOutcome out;
        assert(!decode_verification_outcome(body, out));
    }

    // 7) Snapshot descriptor lookup between nodes
    {
        std::vector<uint8_t> body;
        encode_describe_request("nightly", body);
        std::string name;
        assert(decode_describe_request(body, name));
        assert(name == "nightly");

        SnapshotDescriptor desc;
        desc.name = "nightly";
        desc.epoch = 9;
        desc.page_size = 4096;
        desc.baseline = {"node1", "node2"};
        desc.groups.push_back(CacheGroupDescriptor{cache_group_id("a"), "a", 16, 1, {"node2"}});

        encode_describe_response(desc, body);
        std::optional<SnapshotDescriptor> out;
        assert(decode_describe_response(body, out));
        assert(out.has_value());
        assert(*out == desc);

        // the metafile checksum travels with the descriptor
        body[body.size() - 6] ^= 0x20;
        assert(!decode_describe_response(body, out));

        encode_describe_response(std::nullopt, body);
        assert(body.size() == 1);
        assert(decode_describe_response(body, out));
        assert(!out.has_value());

        std::vector<uint8_t> frame;
        encode_frame(MessageType::DescribeResponse, body, frame);
        FrameHeader h{};
        assert(decode_frame_header(frame.data(), h));
        assert(h.msg_type == static_cast<uint8_t>(MessageType::DescribeResponse));
    }

    std::cout << "Strata wire codec test passed\n";
    return 0;
}

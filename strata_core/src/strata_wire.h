#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "snapshot_types.h"

namespace strata {

// Message types of the snapshot job protocol
enum class MessageType : uint8_t {
    VerifyRequest  = 1,
    VerifyResponse = 2,
    CancelRequest  = 3,
    CancelAck      = 4,
    Error          = 5,
    DescribeRequest  = 6,
    DescribeResponse = 7
};

// Every frame: [u16 magic][u8 version][u8 msg_type][u32 length][u32 crc32] + body.
// All header fields big-endian, crc32 covers the body.
struct FrameHeader {
    uint16_t magic;
    uint8_t version;
    uint8_t msg_type;
    uint32_t length;
    uint32_t crc32;
};

constexpr std::size_t FRAME_HEADER_SIZE = 12;
constexpr uint16_t FRAME_MAGIC = 0x5356;  // "SV"
constexpr uint8_t PROTOCOL_VERSION = 1;
constexpr uint32_t MAX_FRAME_BYTES = 64 * 1024 * 1024;

uint32_t crc32(const uint8_t* data, std::size_t size);
uint32_t crc32(const std::vector<uint8_t>& data);

// Big-endian primitives shared by the wire protocol and the snapshot metafiles
namespace wire {

void put_u8(std::vector<uint8_t>& out, uint8_t v);
void put_u16(std::vector<uint8_t>& out, uint16_t v);
void put_u32(std::vector<uint8_t>& out, uint32_t v);
void put_u64(std::vector<uint8_t>& out, uint64_t v);
void put_i32(std::vector<uint8_t>& out, int32_t v);
void put_string(std::vector<uint8_t>& out, const std::string& s);  // u32 length prefix

bool get_u8(const std::vector<uint8_t>& buf, std::size_t& off, uint8_t& v);
bool get_u16(const std::vector<uint8_t>& buf, std::size_t& off, uint16_t& v);
bool get_u32(const std::vector<uint8_t>& buf, std::size_t& off, uint32_t& v);
bool get_u64(const std::vector<uint8_t>& buf, std::size_t& off, uint64_t& v);
bool get_i32(const std::vector<uint8_t>& buf, std::size_t& off, int32_t& v);
bool get_string(const std::vector<uint8_t>& buf, std::size_t& off, std::string& s);

}  // namespace wire

// -------- framing --------

void encode_frame(MessageType type, const std::vector<uint8_t>& body, std::vector<uint8_t>& out);

// Validates magic, version and length bound; the body crc is checked by verify_frame_body
bool decode_frame_header(const uint8_t* data, FrameHeader& out);
bool verify_frame_body(const FrameHeader& header, const std::vector<uint8_t>& body);

// -------- message bodies --------

void encode_verify_request(const VerifyJobRequest& req, std::vector<uint8_t>& out);
bool decode_verify_request(const std::vector<uint8_t>& buf, VerifyJobRequest& req);

void encode_verification_outcome(const NodeVerificationOutcome& o, std::vector<uint8_t>& out);
bool decode_verification_outcome(const std::vector<uint8_t>& buf, NodeVerificationOutcome& o);

void encode_cancel_request(uint64_t job_id, std::vector<uint8_t>& out);
bool decode_cancel_request(const std::vector<uint8_t>& buf, uint64_t& job_id);

void encode_cancel_ack(bool was_pending, std::vector<uint8_t>& out);
bool decode_cancel_ack(const std::vector<uint8_t>& buf, bool& was_pending);

void encode_error(const std::string& msg, std::vector<uint8_t>& out);
bool decode_error(const std::vector<uint8_t>& buf, std::string& msg);

void encode_describe_request(const std::string& snapshot_name, std::vector<uint8_t>& out);
bool decode_describe_request(const std::vector<uint8_t>& buf, std::string& snapshot_name);

// An empty optional means the node holds no metadata for the snapshot
void encode_describe_response(const std::optional<SnapshotDescriptor>& desc, std::vector<uint8_t>& out);
bool decode_describe_response(const std::vector<uint8_t>& buf, std::optional<SnapshotDescriptor>& desc);

}  // namespace strata

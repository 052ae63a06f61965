#include "strata_wire.h"

#include <boost/crc.hpp>

#include "snapshot_meta.h"

namespace strata {

uint32_t crc32(const uint8_t* data, std::size_t size) {
    boost::crc_32_type crc;
    crc.process_bytes(data, size);
    return crc.checksum();
}

uint32_t crc32(const std::vector<uint8_t>& data) {
    return crc32(data.data(), data.size());
}

namespace wire {

void put_u8(std::vector<uint8_t>& out, uint8_t v) {
    out.push_back(v);
}

void put_u16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(v & 0xFF));
}

void put_u32(std::vector<uint8_t>& out, uint32_t v) {
    out.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(v & 0xFF));
}

void put_u64(std::vector<uint8_t>& out, uint64_t v) {
    for (int i = 7; i >= 0; --i) {
        out.push_back(static_cast<uint8_t>((v >> (i * 8)) & 0xFF));
    }
}

void put_i32(std::vector<uint8_t>& out, int32_t v) {
    put_u32(out, static_cast<uint32_t>(v));
}

void put_string(std::vector<uint8_t>& out, const std::string& s) {
    put_u32(out, static_cast<uint32_t>(s.size()));
    out.insert(out.end(), s.begin(), s.end());
}

bool get_u8(const std::vector<uint8_t>& buf, std::size_t& off, uint8_t& v) {
    if (off + 1 > buf.size()) return false;
    v = buf[off++];
    return true;
}

bool get_u16(const std::vector<uint8_t>& buf, std::size_t& off, uint16_t& v) {
    if (off + 2 > buf.size()) return false;
    v = static_cast<uint16_t>((buf[off] << 8) | buf[off + 1]);
    off += 2;
    return true;
}

bool get_u32(const std::vector<uint8_t>& buf, std::size_t& off, uint32_t& v) {
    if (off + 4 > buf.size()) return false;
    v = 0;
    for (int i = 0; i < 4; ++i) {
        v = (v << 8) | buf[off++];
    }
    return true;
}

bool get_u64(const std::vector<uint8_t>& buf, std::size_t& off, uint64_t& v) {
    if (off + 8 > buf.size()) return false;
    v = 0;
    for (int i = 0; i < 8; ++i) {
        v = (v << 8) | buf[off++];
    }
    return true;
}

bool get_i32(const std::vector<uint8_t>& buf, std::size_t& off, int32_t& v) {
    uint32_t tmp = 0;
    if (!get_u32(buf, off, tmp)) return false;
    v = static_cast<int32_t>(tmp);
    return true;
}

bool get_string(const std::vector<uint8_t>& buf, std::size_t& off, std::string& s) {
    uint32_t len = 0;
    if (!get_u32(buf, off, len)) return false;
    if (off + len > buf.size()) return false;
    s.assign(reinterpret_cast<const char*>(buf.data() + off), len);
    off += len;
    return true;
}

}  // namespace wire

using namespace wire;

// -------- framing --------

void encode_frame(MessageType type, const std::vector<uint8_t>& body, std::vector<uint8_t>& out) {
    out.clear();
    out.reserve(FRAME_HEADER_SIZE + body.size());
    put_u16(out, FRAME_MAGIC);
    put_u8(out, PROTOCOL_VERSION);
    put_u8(out, static_cast<uint8_t>(type));
    put_u32(out, static_cast<uint32_t>(body.size()));
    put_u32(out, crc32(body));
    out.insert(out.end(), body.begin(), body.end());
}

bool decode_frame_header(const uint8_t* data, FrameHeader& out) {
    std::vector<uint8_t> buf(data, data + FRAME_HEADER_SIZE);
    std::size_t off = 0;
    get_u16(buf, off, out.magic);
    get_u8(buf, off, out.version);
    get_u8(buf, off, out.msg_type);
    get_u32(buf, off, out.length);
    get_u32(buf, off, out.crc32);

    if (out.magic != FRAME_MAGIC || out.version != PROTOCOL_VERSION) {
        return false;
    }
    if (out.msg_type < static_cast<uint8_t>(MessageType::VerifyRequest) ||
        out.msg_type > static_cast<uint8_t>(MessageType::DescribeResponse)) {
        return false;
    }
    return out.length <= MAX_FRAME_BYTES;
}

bool verify_frame_body(const FrameHeader& header, const std::vector<uint8_t>& body) {
    return body.size() == header.length && crc32(body) == header.crc32;
}

// -------- verify request --------
//
//   [u64 job_id][str snapshot][u32 page_size][u32 group_count]
//   per group: [i32 id][str name][u32 part_count][u32 part]...

void encode_verify_request(const VerifyJobRequest& req, std::vector<uint8_t>& out) {
    out.clear();
    put_u64(out, req.job_id);
    put_string(out, req.snapshot_name);
    put_u32(out, req.page_size);
    put_u32(out, static_cast<uint32_t>(req.groups.size()));
    for (const auto& g : req.groups) {
        put_i32(out, g.group_id);
        put_string(out, g.name);
        put_u32(out, static_cast<uint32_t>(g.partitions.size()));
        for (uint32_t p : g.partitions) {
            put_u32(out, p);
        }
    }
}

bool decode_verify_request(const std::vector<uint8_t>& buf, VerifyJobRequest& req) {
    std::size_t off = 0;
    if (!get_u64(buf, off, req.job_id)) return false;
    if (!get_string(buf, off, req.snapshot_name)) return false;
    if (!get_u32(buf, off, req.page_size)) return false;

    uint32_t groups = 0;
    if (!get_u32(buf, off, groups)) return false;

    req.groups.clear();
    for (uint32_t i = 0; i < groups; ++i) {
        ExpectedGroup g;
        if (!get_i32(buf, off, g.group_id)) return false;
        if (!get_string(buf, off, g.name)) return false;

        uint32_t parts = 0;
        if (!get_u32(buf, off, parts)) return false;
        if (off + static_cast<std::size_t>(parts) * 4 > buf.size()) return false;
        g.partitions.resize(parts);
        for (uint32_t j = 0; j < parts; ++j) {
            get_u32(buf, off, g.partitions[j]);
        }
        req.groups.push_back(std::move(g));
    }
    return off == buf.size();
}

// -------- verification outcome --------
//
//   [str node_id][u8 has_failure]
//   failure: [u32 cause_count] per cause: [u8 kind][str message]
//   [u32 n] records:   [i32 grp][u32 part][u64 counter][u8 crc_ok][u8 present][u32 pages]
//   [u32 n] missing groups:     [i32 grp]
//   [u32 n] missing partitions: [i32 grp][u32 part]
//   [u32 n] missing metadata:   [u8 has_grp][i32 grp][str file]

namespace {

void put_failure(std::vector<uint8_t>& out, const NodeFailure& f) {
    put_u32(out, static_cast<uint32_t>(f.causes.size()));
    for (const auto& c : f.causes) {
        put_u8(out, static_cast<uint8_t>(c.kind));
        put_string(out, c.message);
    }
}

bool get_failure(const std::vector<uint8_t>& buf, std::size_t& off, NodeFailure& f) {
    uint32_t count = 0;
    if (!get_u32(buf, off, count)) return false;
    f.causes.clear();
    for (uint32_t i = 0; i < count; ++i) {
        uint8_t kind = 0;
        FailureCause c;
        if (!get_u8(buf, off, kind)) return false;
        if (!failure_kind_from_u8(kind, c.kind)) return false;
        if (!get_string(buf, off, c.message)) return false;
        f.causes.push_back(std::move(c));
    }
    return true;
}

}  // namespace

void encode_verification_outcome(const NodeVerificationOutcome& o, std::vector<uint8_t>& out) {
    out.clear();
    put_string(out, o.node_id);
    put_u8(out, o.failure.has_value() ? 1 : 0);
    if (o.failure.has_value()) {
        put_failure(out, *o.failure);
    }

    put_u32(out, static_cast<uint32_t>(o.partitions.size()));
    for (const auto& r : o.partitions) {
        put_i32(out, r.key.group_id);
        put_u32(out, r.key.partition);
        put_u64(out, r.update_counter);
        put_u8(out, r.checksum_ok ? 1 : 0);
        put_u8(out, r.present ? 1 : 0);
        put_u32(out, r.pages_checked);
    }

    put_u32(out, static_cast<uint32_t>(o.missing_groups.size()));
    for (int32_t g : o.missing_groups) {
        put_i32(out, g);
    }

    put_u32(out, static_cast<uint32_t>(o.missing_partitions.size()));
    for (const auto& k : o.missing_partitions) {
        put_i32(out, k.group_id);
        put_u32(out, k.partition);
    }

    put_u32(out, static_cast<uint32_t>(o.missing_metadata.size()));
    for (const auto& m : o.missing_metadata) {
        put_u8(out, m.group_id.has_value() ? 1 : 0);
        put_i32(out, m.group_id.value_or(0));
        put_string(out, m.file);
    }
}

bool decode_verification_outcome(const std::vector<uint8_t>& buf, NodeVerificationOutcome& o) {
    std::size_t off = 0;
    o = NodeVerificationOutcome{};

    if (!get_string(buf, off, o.node_id)) return false;

    uint8_t has_failure = 0;
    if (!get_u8(buf, off, has_failure)) return false;
    if (has_failure) {
        NodeFailure f;
        if (!get_failure(buf, off, f)) return false;
        o.failure = std::move(f);
    }

    uint32_t n = 0;
    if (!get_u32(buf, off, n)) return false;
    for (uint32_t i = 0; i < n; ++i) {
        PartitionRecord r{};
        uint8_t crc_ok = 0;
        uint8_t present = 0;
        if (!get_i32(buf, off, r.key.group_id)) return false;
        if (!get_u32(buf, off, r.key.partition)) return false;
        if (!get_u64(buf, off, r.update_counter)) return false;
        if (!get_u8(buf, off, crc_ok)) return false;
        if (!get_u8(buf, off, present)) return false;
        if (!get_u32(buf, off, r.pages_checked)) return false;
        r.checksum_ok = crc_ok != 0;
        r.present = present != 0;
        o.partitions.push_back(r);
    }

    if (!get_u32(buf, off, n)) return false;
    for (uint32_t i = 0; i < n; ++i) {
        int32_t g = 0;
        if (!get_i32(buf, off, g)) return false;
        o.missing_groups.push_back(g);
    }

    if (!get_u32(buf, off, n)) return false;
    for (uint32_t i = 0; i < n; ++i) {
        PartitionKey k{};
        if (!get_i32(buf, off, k.group_id)) return false;
        if (!get_u32(buf, off, k.partition)) return false;
        o.missing_partitions.push_back(k);
    }

    if (!get_u32(buf, off, n)) return false;
    for (uint32_t i = 0; i < n; ++i) {
        MissingMetadata m;
        uint8_t has_grp = 0;
        int32_t grp = 0;
        if (!get_u8(buf, off, has_grp)) return false;
        if (!get_i32(buf, off, grp)) return false;
        if (!get_string(buf, off, m.file)) return false;
        if (has_grp) {
            m.group_id = grp;
        }
        o.missing_metadata.push_back(std::move(m));
    }

    return off == buf.size();
}

// -------- cancel / error --------

void encode_cancel_request(uint64_t job_id, std::vector<uint8_t>& out) {
    out.clear();
    put_u64(out, job_id);
}

bool decode_cancel_request(const std::vector<uint8_t>& buf, uint64_t& job_id) {
    std::size_t off = 0;
    return get_u64(buf, off, job_id) && off == buf.size();
}

void encode_cancel_ack(bool was_pending, std::vector<uint8_t>& out) {
    out.clear();
    put_u8(out, was_pending ? 1 : 0);
}

bool decode_cancel_ack(const std::vector<uint8_t>& buf, bool& was_pending) {
    std::size_t off = 0;
    uint8_t v = 0;
    if (!get_u8(buf, off, v)) return false;
    was_pending = v != 0;
    return off == buf.size();
}

void encode_error(const std::string& msg, std::vector<uint8_t>& out) {
    out.clear();
    put_string(out, msg);
}

bool decode_error(const std::vector<uint8_t>& buf, std::string& msg) {
    std::size_t off = 0;
    return get_string(buf, off, msg) && off == buf.size();
}

// -------- describe --------
//
//   request:  [str snapshot]
//   response: [u8 found] then, when found, [u32 len][snapshot metafile bytes]

void encode_describe_request(const std::string& snapshot_name, std::vector<uint8_t>& out) {
    out.clear();
    put_string(out, snapshot_name);
}

bool decode_describe_request(const std::vector<uint8_t>& buf, std::string& snapshot_name) {
    std::size_t off = 0;
    return get_string(buf, off, snapshot_name) && off == buf.size();
}

void encode_describe_response(const std::optional<SnapshotDescriptor>& desc, std::vector<uint8_t>& out) {
    out.clear();
    if (!desc) {
        put_u8(out, 0);
        return;
    }
    put_u8(out, 1);

    std::vector<uint8_t> meta;
    encode_snapshot_metadata(SnapshotMetadata{*desc, ""}, meta);
    put_u32(out, static_cast<uint32_t>(meta.size()));
    out.insert(out.end(), meta.begin(), meta.end());
}

bool decode_describe_response(const std::vector<uint8_t>& buf, std::optional<SnapshotDescriptor>& desc) {
    std::size_t off = 0;
    uint8_t found = 0;
    if (!get_u8(buf, off, found)) return false;
    if (!found) {
        desc.reset();
        return off == buf.size();
    }

    uint32_t len = 0;
    if (!get_u32(buf, off, len)) return false;
    if (len != buf.size() - off) return false;

    std::vector<uint8_t> bytes(buf.begin() + static_cast<std::ptrdiff_t>(off), buf.end());
    SnapshotMetadata meta;
    if (!decode_snapshot_metadata(bytes, meta)) return false;
    desc = std::move(meta.descriptor);
    return true;
}

}  // namespace strata

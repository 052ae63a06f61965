#include "cluster.h"

#include <cstring>
#include <iostream>

namespace strata {

using boost::asio::ip::udp;

static constexpr int GOSSIP_INTERVAL_MS = 500;
static constexpr int FAILURE_TIMEOUT_MS = 5000;

GossipCluster::GossipCluster(boost::asio::io_context& io,
                             const NodeId& self,
                             NodeRole role,
                             const std::vector<NodeId>& peers)
    : io_(io),
      self_(self),
      role_(role),
      peers_(peers),
      socket_(io),
      timer_(io),
      running_(false),
      local_heartbeat_(0) {
    udp::endpoint local_ep(udp::v4(), self_.gossip_port);
    socket_.open(udp::v4());
    socket_.bind(local_ep);

    // register self in members map
    MemberState self_state;
    self_state.role = role_;
    self_state.heartbeat = 0;
    self_state.last_seen = std::chrono::steady_clock::now();
    members_.emplace(self_.id, self_state);
}

void GossipCluster::start() {
    if (running_) return;
    running_ = true;
    start_receive();
    schedule_gossip();
}

void GossipCluster::stop() {
    if (!running_) return;
    running_ = false;
    boost::system::error_code ec;
    socket_.close(ec);
    timer_.cancel();
}

void GossipCluster::start_receive() {
    socket_.async_receive_from(
        boost::asio::buffer(recv_buffer_),
        remote_endpoint_,
        [this](const boost::system::error_code& ec, std::size_t bytes) {
            handle_receive(ec, bytes);
        });
}

// Datagram: [uint16 id_len][id bytes][uint64 heartbeat][uint8 role]
void GossipCluster::handle_receive(const boost::system::error_code& ec, std::size_t bytes) {
    if (ec || !running_) {
        return;
    }

    if (bytes < sizeof(uint16_t) + sizeof(uint64_t) + sizeof(uint8_t)) {
        start_receive();
        return;
    }

    const char* data = recv_buffer_.data();
    std::size_t pos = 0;

    uint16_t id_len;
    std::memcpy(&id_len, data + pos, sizeof(id_len));
    pos += sizeof(id_len);

    if (pos + id_len + sizeof(uint64_t) + sizeof(uint8_t) > bytes) {
        start_receive();
        return;
    }

    std::string node_id(data + pos, id_len);
    pos += id_len;

    uint64_t hb;
    std::memcpy(&hb, data + pos, sizeof(hb));
    pos += sizeof(hb);

    uint8_t role = static_cast<uint8_t>(data[pos]);
    pos += sizeof(role);

    if (role != static_cast<uint8_t>(NodeRole::Server) &&
        role != static_cast<uint8_t>(NodeRole::Client)) {
        std::cerr << "[GossipCluster " << self_.id << "] dropping datagram from "
                  << node_id << " with unknown role " << static_cast<int>(role) << "\n";
        start_receive();
        return;
    }

    apply_heartbeat(node_id, static_cast<NodeRole>(role), hb);

    start_receive();
}

void GossipCluster::schedule_gossip() {
    if (!running_) return;

    timer_.expires_after(std::chrono::milliseconds(GOSSIP_INTERVAL_MS));
    timer_.async_wait([this](const boost::system::error_code& ec) {
        if (!ec && running_) {
            send_gossip();
            schedule_gossip();
        }
    });
}

void GossipCluster::send_gossip() {
    local_heartbeat_ += 1;

    {
        std::lock_guard<std::mutex> lock(mtx_);
        MemberState& st = members_[self_.id];
        st.role = role_;
        st.heartbeat = local_heartbeat_;
        st.last_seen = std::chrono::steady_clock::now();
    }

    uint16_t id_len = static_cast<uint16_t>(self_.id.size());
    uint8_t role = static_cast<uint8_t>(role_);
    auto buf = std::make_shared<std::string>();
    buf->resize(sizeof(id_len) + id_len + sizeof(uint64_t) + sizeof(role));
    std::size_t pos = 0;
    std::memcpy(buf->data() + pos, &id_len, sizeof(id_len));
    pos += sizeof(id_len);
    std::memcpy(buf->data() + pos, self_.id.data(), id_len);
    pos += id_len;
    std::memcpy(buf->data() + pos, &local_heartbeat_, sizeof(local_heartbeat_));
    pos += sizeof(local_heartbeat_);
    std::memcpy(buf->data() + pos, &role, sizeof(role));

    for (const auto& peer : peers_) {
        boost::system::error_code ec;
        auto addr = boost::asio::ip::make_address(peer.host, ec);
        if (ec) {
            std::cerr << "[GossipCluster " << self_.id << "] bad peer address "
                      << peer.host << ": " << ec.message() << "\n";
            continue;
        }
        udp::endpoint ep(addr, peer.gossip_port);
        socket_.async_send_to(
            boost::asio::buffer(*buf),
            ep,
            [buf](const boost::system::error_code& /*ec*/, std::size_t /*bytes*/) {});
    }
}

void GossipCluster::apply_heartbeat(const std::string& node_id, NodeRole role, uint64_t hb) {
    auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = members_.find(node_id);
    if (it == members_.end()) {
        MemberState st;
        st.role = role;
        st.heartbeat = hb;
        st.last_seen = now;
        members_.emplace(node_id, st);
    } else if (hb > it->second.heartbeat) {
        it->second.role = role;
        it->second.heartbeat = hb;
        it->second.last_seen = now;
    }
}

std::vector<MemberView> GossipCluster::members_snapshot() const {
    auto now = std::chrono::steady_clock::now();
    std::vector<MemberView> out;

    std::lock_guard<std::mutex> lock(mtx_);
    for (const auto& kv : members_) {
        const auto& id = kv.first;
        const auto& state = kv.second;
        auto age_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now - state.last_seen);

        if (age_ms.count() > FAILURE_TIMEOUT_MS) {
            continue;
        }

        MemberView v;
        v.id = id;
        v.role = state.role;
        v.heartbeat = state.heartbeat;
        v.age_ms = age_ms;
        out.push_back(v);
    }
    return out;
}

}  // namespace strata

#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <array>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace strata {

enum class NodeRole : uint8_t {
    Server = 1,
    Client = 2
};

struct NodeId {
    std::string id;
    std::string host;
    uint16_t gossip_port;
};

struct MemberView {
    std::string id;
    NodeRole role;
    uint64_t heartbeat;
    std::chrono::milliseconds age_ms;
};

// Read-only view of the currently alive cluster members
class IClusterView {
public:
    virtual ~IClusterView() = default;

    virtual std::vector<MemberView> members_snapshot() const = 0;
};

class GossipCluster : public IClusterView {
public:
    GossipCluster(boost::asio::io_context& io,
                  const NodeId& self,
                  NodeRole role,
                  const std::vector<NodeId>& peers);

    void start();
    void stop();

    // Snapshot of known members, safe to call from test thread
    std::vector<MemberView> members_snapshot() const override;

private:
    void start_receive();
    void handle_receive(const boost::system::error_code& ec, std::size_t bytes);
    void schedule_gossip();
    void send_gossip();

    void apply_heartbeat(const std::string& node_id, NodeRole role, uint64_t hb);

    struct MemberState {
        NodeRole role;
        uint64_t heartbeat;
        std::chrono::steady_clock::time_point last_seen;
    };

    boost::asio::io_context& io_;
    NodeId self_;
    NodeRole role_;
    std::vector<NodeId> peers_;

    mutable std::mutex mtx_;
    std::unordered_map<std::string, MemberState> members_;

    boost::asio::ip::udp::socket socket_;
    boost::asio::ip::udp::endpoint remote_endpoint_;
    std::array<char, 1024> recv_buffer_;

    boost::asio::steady_timer timer_;
    bool running_;
    uint64_t local_heartbeat_;
};

}  // namespace strata

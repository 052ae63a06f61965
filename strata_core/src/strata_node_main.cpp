#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "strata_errors.h"
#include "strata_node.h"

using namespace strata;

// Simple parser for peer specs of the form "id:host:port"
static bool parse_peer_spec(const std::string& spec, NodeId& out) {
    std::size_t first_colon = spec.find(':');
    if (first_colon == std::string::npos) {
        return false;
    }
    std::size_t second_colon = spec.find(':', first_colon + 1);
    if (second_colon == std::string::npos) {
        return false;
    }

    std::string id = spec.substr(0, first_colon);
    std::string host = spec.substr(first_colon + 1, second_colon - first_colon - 1);
    std::string port_str = spec.substr(second_colon + 1);

    if (id.empty() || host.empty() || port_str.empty()) {
        return false;
    }

    try {
        int p = std::stoi(port_str);
        if (p <= 0 || p > 65535 - JOB_PORT_OFFSET) {
            return false;
        }
        out.gossip_port = static_cast<uint16_t>(p);
    } catch (const std::exception&) {
        return false;
    }

    out.id = id;
    out.host = host;
    return true;
}

static void usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " <id> <host> <gossip_port> [peer_id:peer_host:peer_gossip_port ...]\n"
              << "       [--data-root <dir>] [--client] [--timeout-ms <ms>]\n"
              << "       [--check <snapshot> [--verbose]]\n";
}

int main(int argc, char** argv) {
    // Example for three terminals:
    //
    //   strata_node n1 127.0.0.1 5001 n2:127.0.0.1:5002 n3:127.0.0.1:5003
    //   strata_node n2 127.0.0.1 5002 n1:127.0.0.1:5001 n3:127.0.0.1:5003
    //   strata_node n3 127.0.0.1 5003 n1:127.0.0.1:5001 n2:127.0.0.1:5002 --check snap1

    if (argc < 4) {
        usage(argv[0]);
        return 1;
    }

    NodeId self{};
    self.id = argv[1];
    self.host = argv[2];
    try {
        int p = std::stoi(argv[3]);
        if (p <= 0 || p > 65535 - JOB_PORT_OFFSET) {
            std::cerr << "Invalid gossip port\n";
            return 1;
        }
        self.gossip_port = static_cast<uint16_t>(p);
    } catch (const std::exception&) {
        std::cerr << "Invalid gossip port\n";
        return 1;
    }

    StrataNodeConfig cfg;
    cfg.self = self;
    cfg.data_root = "data_" + self.id;

    std::string check_name;
    bool verbose = false;

    for (int i = 4; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--data-root" && i + 1 < argc) {
            cfg.data_root = argv[++i];
        } else if (arg == "--client") {
            cfg.role = NodeRole::Client;
        } else if (arg == "--timeout-ms" && i + 1 < argc) {
            try {
                long ms = std::stol(argv[++i]);
                if (ms <= 0) {
                    throw std::out_of_range("timeout");
                }
                cfg.verify_timeout = std::chrono::milliseconds(ms);
            } catch (const std::exception&) {
                std::cerr << "Invalid --timeout-ms value: " << argv[i] << "\n";
                return 1;
            }
        } else if (arg == "--check" && i + 1 < argc) {
            check_name = argv[++i];
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (arg.rfind("--", 0) == 0) {
            std::cerr << "Unknown or incomplete option: " << arg << "\n";
            usage(argv[0]);
            return 1;
        } else {
            NodeId peer{};
            if (!parse_peer_spec(arg, peer)) {
                std::cerr << "Invalid peer spec: " << arg
                          << " expected id:host:gossip_port\n";
                return 1;
            }
            // ignore self if accidentally listed
            if (peer.id == self.id) {
                continue;
            }
            cfg.peers.push_back(peer);
        }
    }

    try {
        StrataNode node(cfg);
        node.start();

        if (check_name.empty()) {
            std::cout << "[StrataNode " << cfg.self.id
                      << "] running. Press Ctrl+C to terminate process.\n";
            // Block forever. Normal exit is via process kill or Ctrl+C.
            for (;;) {
                std::this_thread::sleep_for(std::chrono::seconds(60));
            }
        }

        // Give gossip a few rounds to discover the peers before fixing the topology
        std::this_thread::sleep_for(std::chrono::seconds(3));

        CheckHandle handle = node.check_snapshot(check_name);
        VerificationVerdict verdict = handle.get();
        verdict.print(std::cout, verbose);

        node.stop();
        return verdict.clean() ? 0 : 2;
    } catch (const SnapshotNotFoundError& ex) {
        std::cerr << ex.what() << "\n";
        return 3;
    } catch (const std::exception& ex) {
        std::cerr << "[StrataNode " << cfg.self.id << "] fatal: " << ex.what() << "\n";
        return 1;
    }
}

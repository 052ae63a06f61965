#include "job_server.h"

#include <iostream>
#include <optional>

#include "strata_errors.h"
#include "verify_service.h"

namespace strata {

using boost::asio::ip::tcp;

// ----------------- JobSession (server side) ---------------------

class JobSession : public std::enable_shared_from_this<JobSession> {
public:
    JobSession(tcp::socket socket,
               SnapshotVerifyService& service,
               boost::asio::thread_pool& workers,
               std::atomic<uint64_t>& jobs_received)
        : socket_(std::move(socket)),
          service_(service),
          workers_(workers),
          jobs_received_(jobs_received),
          read_header_(FRAME_HEADER_SIZE) {}

    void start() {
        read_header();
    }

private:
    void read_header() {
        auto self = shared_from_this();
        boost::asio::async_read(
            socket_,
            boost::asio::buffer(read_header_),
            [this, self](const boost::system::error_code& ec, std::size_t /*bytes*/) {
                if (ec) {
                    return;
                }
                if (!decode_frame_header(read_header_.data(), header_)) {
                    send_error("malformed frame header", true);
                    return;
                }
                read_body_.resize(header_.length);
                read_body();
            });
    }

    void read_body() {
        auto self = shared_from_this();
        boost::asio::async_read(
            socket_,
            boost::asio::buffer(read_body_),
            [this, self](const boost::system::error_code& ec, std::size_t /*bytes*/) {
                if (ec) {
                    return;
                }
                if (!verify_frame_body(header_, read_body_)) {
                    send_error("frame checksum mismatch", true);
                    return;
                }
                handle_request();
            });
    }

    void handle_request() {
        auto type = static_cast<MessageType>(header_.msg_type);

        if (type == MessageType::VerifyRequest) {
            handle_verify();
        } else if (type == MessageType::CancelRequest) {
            handle_cancel();
        } else if (type == MessageType::DescribeRequest) {
            handle_describe();
        } else {
            send_error("unexpected message type " + std::to_string(header_.msg_type), true);
        }
    }

    void handle_verify() {
        VerifyJobRequest req;
        if (!decode_verify_request(read_body_, req)) {
            send_error("malformed verify request", true);
            return;
        }
        jobs_received_.fetch_add(1);

        // The inspection may take long; keep the io thread free for cancel requests
        auto self = shared_from_this();
        boost::asio::post(workers_, [this, self, req]() {
            NodeVerificationOutcome outcome;
            try {
                outcome = service_.execute(req);
            } catch (const std::exception&) {
                outcome = NodeVerificationOutcome::failed_with(
                    service_.node_id(), NodeFailure::from_exception(std::current_exception()));
            }

            auto body = std::make_shared<std::vector<uint8_t>>();
            encode_verification_outcome(outcome, *body);
            boost::asio::post(socket_.get_executor(), [this, self, body]() {
                send_frame(MessageType::VerifyResponse, *body, false);
            });
        });
    }

    void handle_cancel() {
        uint64_t job_id = 0;
        if (!decode_cancel_request(read_body_, job_id)) {
            send_error("malformed cancel request", true);
            return;
        }

        bool was_pending = service_.cancel(job_id);

        std::vector<uint8_t> body;
        encode_cancel_ack(was_pending, body);
        send_frame(MessageType::CancelAck, body, false);
    }

    void handle_describe() {
        std::string name;
        if (!decode_describe_request(read_body_, name)) {
            send_error("malformed describe request", true);
            return;
        }

        std::vector<uint8_t> body;
        encode_describe_response(service_.describe(name), body);
        send_frame(MessageType::DescribeResponse, body, false);
    }

    void send_error(const std::string& msg, bool close_after) {
        std::cerr << "[JobServer " << service_.node_id() << "] rejecting request: " << msg << "\n";
        std::vector<uint8_t> body;
        encode_error(msg, body);
        send_frame(MessageType::Error, body, close_after);
    }

    void send_frame(MessageType type, const std::vector<uint8_t>& body, bool close_after) {
        encode_frame(type, body, write_buf_);

        auto self = shared_from_this();
        boost::asio::async_write(
            socket_,
            boost::asio::buffer(write_buf_),
            [this, self, close_after](const boost::system::error_code& ec, std::size_t /*bytes*/) {
                if (ec || close_after) {
                    boost::system::error_code ignored;
                    socket_.close(ignored);
                    return;
                }
                // ready for next request
                read_header();
            });
    }

    tcp::socket socket_;
    SnapshotVerifyService& service_;
    boost::asio::thread_pool& workers_;
    std::atomic<uint64_t>& jobs_received_;

    FrameHeader header_{};
    std::vector<uint8_t> read_header_;
    std::vector<uint8_t> read_body_;
    std::vector<uint8_t> write_buf_;
};

// ----------------- JobServer implementation --------------------

JobServer::JobServer(const JobServerConfig& cfg, SnapshotVerifyService& service)
    : cfg_(cfg),
      service_(service),
      io_(),
      acceptor_(nullptr),
      io_thread_(),
      workers_(cfg.worker_threads),
      running_(false) {}

JobServer::~JobServer() {
    stop();
}

bool JobServer::start() {
    if (running_) {
        return true;
    }

    boost::system::error_code ec;
    auto addr = boost::asio::ip::make_address(cfg_.host, ec);
    if (ec) {
        std::cerr << "[JobServer " << service_.node_id() << "] address error: " << ec.message() << "\n";
        return false;
    }

    tcp::endpoint ep(addr, cfg_.port);
    acceptor_ = std::make_unique<tcp::acceptor>(io_);

    acceptor_->open(ep.protocol(), ec);
    if (ec) {
        std::cerr << "[JobServer " << service_.node_id() << "] open error: " << ec.message() << "\n";
        return false;
    }

    acceptor_->set_option(tcp::acceptor::reuse_address(true), ec);
    if (ec) {
        std::cerr << "[JobServer " << service_.node_id() << "] reuse_address error: " << ec.message() << "\n";
        return false;
    }

    acceptor_->bind(ep, ec);
    if (ec) {
        std::cerr << "[JobServer " << service_.node_id() << "] bind error on port " << cfg_.port
                  << ": " << ec.message() << "\n";
        return false;
    }

    acceptor_->listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
        std::cerr << "[JobServer " << service_.node_id() << "] listen error: " << ec.message() << "\n";
        return false;
    }

    running_ = true;
    do_accept();

    io_thread_ = std::thread([this]() {
        try {
            io_.run();
        } catch (const std::exception& ex) {
            std::cerr << "[JobServer " << service_.node_id() << "] io_context exception: "
                      << ex.what() << "\n";
        }
    });

    std::cout << "[JobServer " << service_.node_id() << "] listening on "
              << cfg_.host << ":" << cfg_.port << "\n";
    return true;
}

void JobServer::stop() {
    if (!running_) {
        return;
    }
    running_ = false;

    boost::system::error_code ec;
    if (acceptor_) {
        acceptor_->close(ec);
    }

    io_.stop();

    if (io_thread_.joinable()) {
        io_thread_.join();
    }
}

void JobServer::do_accept() {
    if (!acceptor_ || !running_) {
        return;
    }

    auto socket = std::make_shared<tcp::socket>(io_);
    acceptor_->async_accept(
        *socket,
        [this, socket](const boost::system::error_code& ec) {
            if (!ec && running_) {
                auto session = std::make_shared<JobSession>(
                    std::move(*socket), service_, workers_, jobs_received_);
                session->start();
            }
            if (running_) {
                do_accept();
            }
        });
}

// ----------------- JobCall (client side) ---------------------

// One request and its reply on a fresh connection, bounded by a timer.
// Every handler runs on the thread of the io_context it was created on.
class JobCall : public std::enable_shared_from_this<JobCall> {
public:
    using Handler = std::function<void(std::exception_ptr, std::vector<uint8_t>)>;

    JobCall(boost::asio::io_context& io,
            tcp::endpoint ep,
            std::string target,
            std::vector<uint8_t> frame,
            MessageType expected,
            std::chrono::milliseconds timeout,
            Handler handler)
        : socket_(io),
          timer_(io),
          ep_(ep),
          target_(std::move(target)),
          frame_(std::move(frame)),
          expected_(expected),
          timeout_(timeout),
          handler_(std::move(handler)),
          read_header_(FRAME_HEADER_SIZE) {}

    void start() {
        auto self = shared_from_this();

        timer_.expires_after(timeout_);
        timer_.async_wait([this, self](const boost::system::error_code& ec) {
            if (ec) {
                return;
            }
            finish(std::make_exception_ptr(JobTimeoutError(
                       "No reply from " + target_ + " within " + std::to_string(timeout_.count()) + " ms")),
                   {});
        });

        socket_.async_connect(ep_, [this, self](const boost::system::error_code& ec) {
            if (ec) {
                transport_error(ec);
                return;
            }
            boost::asio::async_write(
                socket_,
                boost::asio::buffer(frame_),
                [this, self](const boost::system::error_code& ec2, std::size_t /*bytes*/) {
                    if (ec2) {
                        transport_error(ec2);
                        return;
                    }
                    read_header();
                });
        });
    }

private:
    void read_header() {
        auto self = shared_from_this();
        boost::asio::async_read(
            socket_,
            boost::asio::buffer(read_header_),
            [this, self](const boost::system::error_code& ec, std::size_t /*bytes*/) {
                if (ec) {
                    transport_error(ec);
                    return;
                }
                if (!decode_frame_header(read_header_.data(), header_)) {
                    protocol_error("malformed reply header");
                    return;
                }
                read_body_.resize(header_.length);
                read_body();
            });
    }

    void read_body() {
        auto self = shared_from_this();
        boost::asio::async_read(
            socket_,
            boost::asio::buffer(read_body_),
            [this, self](const boost::system::error_code& ec, std::size_t /*bytes*/) {
                if (ec) {
                    transport_error(ec);
                    return;
                }
                on_reply();
            });
    }

    void on_reply() {
        if (!verify_frame_body(header_, read_body_)) {
            protocol_error("reply checksum mismatch");
            return;
        }

        auto type = static_cast<MessageType>(header_.msg_type);
        if (type == MessageType::Error) {
            std::string msg;
            if (!decode_error(read_body_, msg)) {
                msg = "undecodable error reply";
            }
            finish(std::make_exception_ptr(StrataError(
                       FailureKind::Internal, "Node " + target_ + " rejected request: " + msg)),
                   {});
            return;
        }
        if (type != expected_) {
            protocol_error("unexpected reply type " + std::to_string(header_.msg_type));
            return;
        }
        finish(nullptr, std::move(read_body_));
    }

    void transport_error(const boost::system::error_code& ec) {
        if (done_) {
            return;
        }
        finish(std::make_exception_ptr(StrataError(
                   FailureKind::NodeUnreachable,
                   "JobClient transport error with " + target_ + ": " + ec.message())),
               {});
    }

    void protocol_error(const std::string& what) {
        finish(std::make_exception_ptr(StrataError(
                   FailureKind::NodeUnreachable,
                   "JobClient protocol error with " + target_ + ": " + what)),
               {});
    }

    void finish(std::exception_ptr error, std::vector<uint8_t> body) {
        if (done_) {
            return;
        }
        done_ = true;

        timer_.cancel();
        boost::system::error_code ignored;
        socket_.close(ignored);

        handler_(error, std::move(body));
    }

    tcp::socket socket_;
    boost::asio::steady_timer timer_;
    tcp::endpoint ep_;
    std::string target_;
    std::vector<uint8_t> frame_;
    MessageType expected_;
    std::chrono::milliseconds timeout_;
    Handler handler_;
    bool done_{false};

    FrameHeader header_{};
    std::vector<uint8_t> read_header_;
    std::vector<uint8_t> read_body_;
};

// ----------------- JobClient implementation --------------------

JobClient::JobClient(const std::string& host, uint16_t port)
    : host_(host),
      port_(port) {}

std::string JobClient::target() const {
    return host_ + ":" + std::to_string(port_);
}

void JobClient::async_round_trip(boost::asio::io_context& io,
                                 MessageType type,
                                 const std::vector<uint8_t>& body,
                                 MessageType expected,
                                 std::chrono::milliseconds timeout,
                                 ReplyHandler handler) {
    boost::system::error_code ec;
    auto addr = boost::asio::ip::make_address(host_, ec);
    if (ec) {
        auto error = std::make_exception_ptr(StrataError(
            FailureKind::NodeUnreachable, "JobClient invalid host " + host_ + ": " + ec.message()));
        boost::asio::post(io, [handler, error]() { handler(error, {}); });
        return;
    }

    std::vector<uint8_t> frame;
    encode_frame(type, body, frame);

    auto call = std::make_shared<JobCall>(io, tcp::endpoint(addr, port_), target(), std::move(frame),
                                          expected, timeout, std::move(handler));
    // Started from the io thread so the timer and the socket are never touched concurrently
    boost::asio::post(io, [call]() { call->start(); });
}

std::vector<uint8_t> JobClient::round_trip(MessageType type,
                                           const std::vector<uint8_t>& body,
                                           MessageType expected,
                                           std::chrono::milliseconds timeout) {
    // Fresh io_context per call so an abandoned call leaves no handlers behind
    boost::asio::io_context io;
    std::exception_ptr error;
    std::vector<uint8_t> reply;

    async_round_trip(io, type, body, expected, timeout,
                     [&error, &reply](std::exception_ptr err, std::vector<uint8_t> resp) {
                         error = err;
                         reply = std::move(resp);
                     });
    io.run();

    if (error) {
        std::rethrow_exception(error);
    }
    return reply;
}

void JobClient::async_execute(boost::asio::io_context& io,
                              const VerifyJobRequest& req,
                              std::chrono::milliseconds timeout,
                              OutcomeHandler handler) {
    std::vector<uint8_t> body;
    encode_verify_request(req, body);

    const std::string from = target();
    async_round_trip(io, MessageType::VerifyRequest, body, MessageType::VerifyResponse, timeout,
                     [handler, from](std::exception_ptr error, std::vector<uint8_t> resp) {
                         NodeVerificationOutcome out;
                         if (!error && !decode_verification_outcome(resp, out)) {
                             error = std::make_exception_ptr(StrataError(
                                 FailureKind::NodeUnreachable, "JobClient: bad VerifyResponse from " + from));
                         }
                         handler(error, std::move(out));
                     });
}

NodeVerificationOutcome JobClient::execute(const VerifyJobRequest& req,
                                           std::chrono::milliseconds timeout) {
    boost::asio::io_context io;
    std::exception_ptr error;
    NodeVerificationOutcome out;

    async_execute(io, req, timeout, [&error, &out](std::exception_ptr err, NodeVerificationOutcome o) {
        error = err;
        out = std::move(o);
    });
    io.run();

    if (error) {
        std::rethrow_exception(error);
    }
    return out;
}

bool JobClient::cancel(uint64_t job_id, std::chrono::milliseconds timeout) {
    std::vector<uint8_t> body;
    encode_cancel_request(job_id, body);

    auto resp = round_trip(MessageType::CancelRequest, body, MessageType::CancelAck, timeout);

    bool was_pending = false;
    if (!decode_cancel_ack(resp, was_pending)) {
        throw StrataError(FailureKind::NodeUnreachable, "JobClient: bad CancelAck from " + target());
    }
    return was_pending;
}

std::optional<SnapshotDescriptor> JobClient::describe(const std::string& snapshot_name,
                                                      std::chrono::milliseconds timeout) {
    std::vector<uint8_t> body;
    encode_describe_request(snapshot_name, body);

    auto resp = round_trip(MessageType::DescribeRequest, body, MessageType::DescribeResponse, timeout);

    std::optional<SnapshotDescriptor> desc;
    if (!decode_describe_response(resp, desc)) {
        throw StrataError(FailureKind::NodeUnreachable, "JobClient: bad DescribeResponse from " + target());
    }
    return desc;
}

}  // namespace strata

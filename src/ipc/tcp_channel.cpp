#include <raylink/ipc/frame.hpp>
#include <raylink/ipc/tcp_channel.hpp>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <array>
#include <deque>
#include <span>

namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace raylink::ipc {

/// Handlers are copied before each call so a callback may close the channel.
class TcpChannel::Session : public std::enable_shared_from_this<Session> {
   public:
    Session(net::io_context& io, Address address)
        : resolver_(io), socket_(io), address_(std::move(address)) {}

    void start(ChannelHandlers handlers) {
        handlers_ = std::move(handlers);
        resolver_.async_resolve(
            address_.host, std::to_string(address_.port),
            [self = shared_from_this()](boost::system::error_code ec,
                                        tcp::resolver::results_type results) {
                self->on_resolve(ec, std::move(results));
            });
    }

    void send(std::vector<std::uint8_t> bytes) {
        if (detached_) {
            return;
        }
        queue_.push_back(std::move(bytes));
        if (open_ && !writing_) {
            do_write();
        }
    }

    void close() {
        if (detached_) {
            return;
        }
        detached_ = true;
        open_ = false;
        handlers_ = {};
        resolver_.cancel();
        boost::system::error_code ec;
        socket_.shutdown(tcp::socket::shutdown_both, ec);
        socket_.close(ec);
        if (ec) {
            spdlog::debug("[remote] socket close: {}", ec.message());
        }
    }

   private:
    void on_resolve(boost::system::error_code ec, tcp::resolver::results_type results) {
        if (ec) {
            fail(ec, "resolve");
            return;
        }
        net::async_connect(socket_, results,
                           [self = shared_from_this()](boost::system::error_code ec,
                                                       const tcp::endpoint&) {
                               self->on_connect(ec);
                           });
    }

    void on_connect(boost::system::error_code ec) {
        if (ec) {
            fail(ec, "connect");
            return;
        }
        if (detached_) {
            return;
        }
        open_ = true;
        spdlog::debug("[remote] tcp open: {}", address_.to_string());
        if (auto callback = handlers_.on_open) {
            callback();
        }
        if (detached_) {
            return;
        }
        read_handshake();
        if (!queue_.empty() && !writing_) {
            do_write();
        }
    }

    void read_handshake() {
        net::async_read(socket_, net::buffer(header_.data(), 1),
                        [self = shared_from_this()](boost::system::error_code ec, std::size_t) {
                            if (self->check_read(ec)) {
                                self->deliver({self->header_[0]});
                                self->read_header();
                            }
                        });
    }

    void read_header() {
        if (detached_) {
            return;
        }
        net::async_read(socket_, net::buffer(header_),
                        [self = shared_from_this()](boost::system::error_code ec, std::size_t) {
                            if (self->check_read(ec)) {
                                self->on_header();
                            }
                        });
    }

    void on_header() {
        auto header = decode_header(std::span<const std::uint8_t>(header_));
        if (!header) {
            protocol_error(header.error().message);
            return;
        }
        const std::int64_t size = header->size;
        if (size > kMaxTcpPayload) {
            protocol_error(fmt::format("frame payload of {} bytes exceeds limit", size));
            return;
        }
        message_.assign(header_.begin(), header_.end());
        message_.resize(kHeaderSize + static_cast<std::size_t>(size));
        if (size == 0) {
            finish_message();
            return;
        }
        net::async_read(socket_, net::buffer(message_.data() + kHeaderSize,
                                             static_cast<std::size_t>(size)),
                        [self = shared_from_this()](boost::system::error_code ec, std::size_t) {
                            if (self->check_read(ec)) {
                                self->finish_message();
                            }
                        });
    }

    void finish_message() {
        deliver(std::move(message_));
        message_.clear();
        read_header();
    }

    void deliver(std::vector<std::uint8_t> bytes) {
        if (detached_) {
            return;
        }
        if (auto callback = handlers_.on_binary) {
            callback(std::move(bytes));
        }
    }

    /// True when the read succeeded and the session is still attached.
    auto check_read(boost::system::error_code ec) -> bool {
        if (detached_) {
            return false;
        }
        if (ec == net::error::eof || ec == net::error::connection_reset) {
            open_ = false;
            if (auto callback = handlers_.on_close) {
                callback();
            }
            return false;
        }
        if (ec) {
            fail(ec, "read");
            return false;
        }
        return true;
    }

    void protocol_error(const std::string& message) {
        spdlog::warn("[remote] {}", message);
        open_ = false;
        if (auto callback = handlers_.on_error) {
            callback(message);
        }
        close();
    }

    void do_write() {
        writing_ = true;
        net::async_write(socket_, net::buffer(queue_.front()),
                         [self = shared_from_this()](boost::system::error_code ec, std::size_t) {
                             self->on_write(ec);
                         });
    }

    void on_write(boost::system::error_code ec) {
        writing_ = false;
        if (ec) {
            fail(ec, "write");
            return;
        }
        queue_.pop_front();
        if (!queue_.empty() && !detached_) {
            do_write();
        }
    }

    void fail(boost::system::error_code ec, const char* what) {
        if (detached_) {
            return;
        }
        open_ = false;
        spdlog::debug("[remote] tcp {} failed: {}", what, ec.message());
        if (auto callback = handlers_.on_error) {
            callback(fmt::format("{}: {}", what, ec.message()));
        }
    }

    tcp::resolver resolver_;
    tcp::socket socket_;
    Address address_;
    ChannelHandlers handlers_;
    std::array<std::uint8_t, kHeaderSize> header_{};
    std::vector<std::uint8_t> message_;
    std::deque<std::vector<std::uint8_t>> queue_;
    bool open_ = false;
    bool writing_ = false;
    bool detached_ = false;
};

TcpChannel::TcpChannel(net::io_context& io, Address address)
    : session_(std::make_shared<Session>(io, std::move(address))) {}

TcpChannel::~TcpChannel() {
    session_->close();
}

void TcpChannel::open(ChannelHandlers handlers) {
    session_->start(std::move(handlers));
}

void TcpChannel::send(std::vector<std::uint8_t> bytes) {
    session_->send(std::move(bytes));
}

void TcpChannel::close() {
    session_->close();
}

}  // namespace raylink::ipc

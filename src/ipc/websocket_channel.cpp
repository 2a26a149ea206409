#include <raylink/ipc/websocket_channel.hpp>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <deque>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace raylink::ipc {

/// Handlers are copied before each call so a callback may close the channel.
class WebSocketChannel::Session : public std::enable_shared_from_this<Session> {
   public:
    Session(net::io_context& io, Address address)
        : resolver_(io), ws_(io), address_(std::move(address)) {}

    void start(ChannelHandlers handlers) {
        handlers_ = std::move(handlers);
        resolver_.async_resolve(
            address_.host, std::to_string(address_.port),
            [self = shared_from_this()](beast::error_code ec, tcp::resolver::results_type results) {
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
        handlers_ = {};
        if (open_) {
            ws_.async_close(websocket::close_code::normal,
                            [self = shared_from_this()](beast::error_code ec) {
                                if (ec) {
                                    spdlog::debug("[remote] websocket close: {}", ec.message());
                                }
                            });
            return;
        }
        resolver_.cancel();
        beast::error_code ec;
        ws_.next_layer().close(ec);
        if (ec) {
            spdlog::debug("[remote] socket close: {}", ec.message());
        }
    }

   private:
    void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) {
            fail(ec, "resolve");
            return;
        }
        net::async_connect(ws_.next_layer(), results,
                           [self = shared_from_this()](beast::error_code ec, const tcp::endpoint&) {
                               self->on_connect(ec);
                           });
    }

    void on_connect(beast::error_code ec) {
        if (ec) {
            fail(ec, "connect");
            return;
        }
        ws_.binary(true);
        ws_.async_handshake(fmt::format("{}:{}", address_.host, address_.port), address_.path,
                            [self = shared_from_this()](beast::error_code ec) {
                                self->on_handshake(ec);
                            });
    }

    void on_handshake(beast::error_code ec) {
        if (ec) {
            fail(ec, "handshake");
            return;
        }
        if (detached_) {
            return;
        }
        open_ = true;
        spdlog::debug("[remote] websocket open: {}", address_.to_string());
        if (auto callback = handlers_.on_open) {
            callback();
        }
        do_read();
        if (!queue_.empty() && !writing_) {
            do_write();
        }
    }

    void do_read() {
        ws_.async_read(buffer_, [self = shared_from_this()](beast::error_code ec, std::size_t) {
            self->on_read(ec);
        });
    }

    void on_read(beast::error_code ec) {
        if (detached_) {
            return;
        }
        if (ec == websocket::error::closed) {
            open_ = false;
            if (auto callback = handlers_.on_close) {
                callback();
            }
            return;
        }
        if (ec) {
            fail(ec, "read");
            return;
        }
        if (ws_.got_text()) {
            std::string text = beast::buffers_to_string(buffer_.cdata());
            buffer_.consume(buffer_.size());
            if (auto callback = handlers_.on_text) {
                callback(std::move(text));
            }
        } else {
            std::vector<std::uint8_t> bytes(net::buffer_size(buffer_.cdata()));
            net::buffer_copy(net::buffer(bytes), buffer_.cdata());
            buffer_.consume(buffer_.size());
            if (auto callback = handlers_.on_binary) {
                callback(std::move(bytes));
            }
        }
        if (!detached_) {
            do_read();
        }
    }

    void do_write() {
        writing_ = true;
        ws_.async_write(net::buffer(queue_.front()),
                        [self = shared_from_this()](beast::error_code ec, std::size_t) {
                            self->on_write(ec);
                        });
    }

    void on_write(beast::error_code ec) {
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

    void fail(beast::error_code ec, const char* what) {
        if (detached_) {
            return;
        }
        open_ = false;
        spdlog::debug("[remote] websocket {} failed: {}", what, ec.message());
        if (auto callback = handlers_.on_error) {
            callback(fmt::format("{}: {}", what, ec.message()));
        }
    }

    tcp::resolver resolver_;
    websocket::stream<tcp::socket> ws_;
    beast::flat_buffer buffer_;
    Address address_;
    ChannelHandlers handlers_;
    std::deque<std::vector<std::uint8_t>> queue_;
    bool open_ = false;
    bool writing_ = false;
    bool detached_ = false;
};

WebSocketChannel::WebSocketChannel(net::io_context& io, Address address)
    : session_(std::make_shared<Session>(io, std::move(address))) {}

WebSocketChannel::~WebSocketChannel() {
    session_->close();
}

void WebSocketChannel::open(ChannelHandlers handlers) {
    session_->start(std::move(handlers));
}

void WebSocketChannel::send(std::vector<std::uint8_t> bytes) {
    session_->send(std::move(bytes));
}

void WebSocketChannel::close() {
    session_->close();
}

}  // namespace raylink::ipc

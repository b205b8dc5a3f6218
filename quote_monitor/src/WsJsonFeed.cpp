#include "WsJsonFeed.hpp"
#include "Log.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ssl.hpp>
#include <exception>
#include <utility>

namespace beast     = boost::beast;
namespace websocket = beast::websocket;
namespace net       = boost::asio;
namespace ssl       = net::ssl;
using tcp           = net::ip::tcp;

WsJsonFeed::WsJsonFeed(WsEndpoint endpoint, std::vector<std::string> subscribe_messages)
    : endpoint_(std::move(endpoint))
    , subscribe_messages_(std::move(subscribe_messages))
{}

template <typename WsStream>
void WsJsonFeed::session(WsStream& ws) {
    // closer_ must not outlive ws, whichever way we leave
    struct CloserReset {
        WsJsonFeed* self;
        ~CloserReset() {
            std::lock_guard<std::mutex> lk(self->closer_mtx_);
            self->closer_ = nullptr;
        }
    } reset_guard{this};

    {
        std::lock_guard<std::mutex> lk(closer_mtx_);
        closer_ = [&ws] {
            beast::error_code ec;
            beast::get_lowest_layer(ws).socket().shutdown(tcp::socket::shutdown_both, ec);
        };
    }

    ws.text(true);
    ws.handshake(endpoint_.host, endpoint_.path);
    log_info("WsJsonFeed", "connected " + endpoint_.host + ":" + endpoint_.port + endpoint_.path);

    for (const auto& sub : subscribe_messages_) {
        ws.write(net::buffer(sub));
    }
    log_info("WsJsonFeed", "sent " + std::to_string(subscribe_messages_.size()) + " subscribe messages");

    beast::flat_buffer buffer;
    while (running_) {
        buffer.consume(buffer.size());
        ws.read(buffer);

        // Receive instant as close to the socket as we get
        const Instant received = now_instant();
        if (on_message)
            on_message(beast::buffers_to_string(buffer.data()), received);
    }

    beast::error_code ec;
    ws.close(websocket::close_code::normal, ec);
}

void WsJsonFeed::run() {
    if (!running_)
        return;
    try {
        net::io_context ioc;
        tcp::resolver resolver(ioc);
        auto const results = resolver.resolve(endpoint_.host, endpoint_.port);

        if (endpoint_.tls) {
            ssl::context ctx(ssl::context::tlsv12_client);
            ctx.set_default_verify_paths();
            ctx.set_verify_mode(ssl::verify_peer);

            beast::ssl_stream<beast::tcp_stream> tls_stream(ioc, ctx);
            beast::get_lowest_layer(tls_stream).connect(results);
            SSL_set_tlsext_host_name(tls_stream.native_handle(), endpoint_.host.c_str());
            tls_stream.handshake(ssl::stream_base::client);

            websocket::stream<beast::ssl_stream<beast::tcp_stream>> ws(std::move(tls_stream));
            session(ws);
        } else {
            websocket::stream<beast::tcp_stream> ws(ioc);
            beast::get_lowest_layer(ws).connect(results);
            session(ws);
        }
    } catch (const std::exception& ex) {
        if (running_) {
            log_error("WsJsonFeed", std::string("transport error (") + endpoint_.host + "): " + ex.what());
        }
    }

    running_ = false;
}

void WsJsonFeed::stop() {
    running_ = false;
    std::lock_guard<std::mutex> lk(closer_mtx_);
    if (closer_) closer_();
}

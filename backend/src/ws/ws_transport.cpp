#include "ws.hpp"
#include "util/errors.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <atomic>
#include <memory>
#include <mutex>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

using TlsWsStream = websocket::stream<beast::ssl_stream<tcp::socket>>;

struct BeastWsTransport::Impl
{
    std::string user_agent;

    net::io_context ioc{1};
    net::ssl::context ssl_ctx{net::ssl::context::tls_client};
    std::unique_ptr<TlsWsStream> ws;
    std::mutex ws_mtx; // guards swapping `ws` against close()
    std::atomic<bool> closing{false};

    explicit Impl(std::string ua) : user_agent(std::move(ua))
    {
        ssl_ctx.set_default_verify_paths();
        ssl_ctx.set_verify_mode(net::ssl::verify_peer);
    }

    void open(const WsEndpoint &ep)
    {
        closing.store(false, std::memory_order_relaxed);
        TlsWsStream *s = nullptr;
        {
            std::lock_guard<std::mutex> lk(ws_mtx);
            ws = std::make_unique<TlsWsStream>(ioc, ssl_ctx);
            s = ws.get();
        }

        try
        {
            tcp::resolver resolver{ioc};
            auto const results = resolver.resolve(ep.host, std::to_string(ep.port));

            net::connect(beast::get_lowest_layer(*s), results);

            // SNI (Server Name Indication) for TLS
            if (!SSL_set_tlsext_host_name(s->next_layer().native_handle(), ep.host.c_str())) {
                throw beast::system_error{
                    beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()),
                    "SNI set failed"
                };
            }

            s->next_layer().handshake(net::ssl::stream_base::client);

            s->set_option(websocket::stream_base::decorator([ua = user_agent](websocket::request_type &req){
                req.set(http::field::user_agent, ua);
            }));
            s->handshake(ep.host + ":" + std::to_string(ep.port), ep.target);
            s->text(true);
        }
        catch (const beast::system_error &e)
        {
            throw TransportError("open " + ep.host + ":" + std::to_string(ep.port) + ep.target +
                                 " failed: " + e.code().message());
        }
    }

    void write(const std::string &text)
    {
        if (!ws) throw TransportError("write on unopened connection");
        beast::error_code ec;
        ws->write(net::buffer(text), ec);
        if (ec) throw TransportError("write failed: " + ec.message());
    }

    bool read(std::string &out)
    {
        if (!ws) return false;
        beast::flat_buffer buffer;
        beast::error_code ec;
        ws->read(buffer, ec);
        if (ec)
        {
            // Expected during close() or orderly remote shutdown
            if (closing.load(std::memory_order_relaxed) ||
                ec == websocket::error::closed ||
                ec == net::error::operation_aborted ||
                ec == net::error::eof ||
                ec == net::error::not_connected ||
                ec == beast::errc::not_connected) {
                return false;
            }
            throw TransportError("read failed: " + ec.message());
        }
        out = beast::buffers_to_string(buffer.cdata());
        return true;
    }

    void close() noexcept
    {
        closing.store(true, std::memory_order_relaxed);
        std::lock_guard<std::mutex> lk(ws_mtx);
        if (!ws) return;
        beast::error_code ec;
        // shutdown wakes a reader blocked in read(); the stream is destroyed on the next open()
        beast::get_lowest_layer(*ws).shutdown(tcp::socket::shutdown_both, ec);
    }
};

BeastWsTransport::BeastWsTransport(std::string user_agent)
    : impl_(std::make_unique<Impl>(std::move(user_agent))) {}

BeastWsTransport::~BeastWsTransport()
{
    impl_->close();
}

void BeastWsTransport::open(const WsEndpoint &ep) { impl_->open(ep); }
void BeastWsTransport::write(const std::string &text) { impl_->write(text); }
bool BeastWsTransport::read(std::string &out) { return impl_->read(out); }
void BeastWsTransport::close() noexcept { impl_->close(); }

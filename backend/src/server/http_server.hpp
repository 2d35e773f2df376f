#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/strand.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

// Minimal one-request-per-connection HTTP/1.1 server.
// The handler runs on the connection's strand and fills in the response.
class HttpServer {
public:
    using HandlerFn = std::function<void(const http::request<http::string_body>&, http::response<http::string_body>&)>;

    static constexpr std::uint64_t kBodyLimit = 1024 * 1024;

    HttpServer(boost::asio::io_context& ioc, tcp::endpoint ep, HandlerFn handler,
               std::shared_ptr<spdlog::logger> log)
    : ioc_(ioc), acceptor_(ioc), handler_(std::move(handler)), log_(std::move(log)) {
        boost::beast::error_code ec;
        acceptor_.open(ep.protocol(), ec);
        if (ec) throw std::runtime_error("open: " + ec.message());
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
        if (ec) throw std::runtime_error("set_option: " + ec.message());
        acceptor_.bind(ep, ec);
        if (ec) throw std::runtime_error("bind " + ep.address().to_string() + ":" + std::to_string(ep.port()) + ": " + ec.message());
        acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
        if (ec) throw std::runtime_error("listen: " + ec.message());
    }

    void run() { do_accept(); }

    void stop() {
        boost::beast::error_code ec;
        acceptor_.close(ec);
    }

private:
    struct Session : public std::enable_shared_from_this<Session> {
        tcp::socket socket_;
        boost::beast::flat_buffer buffer_;
        http::request_parser<http::string_body> parser_;
        HttpServer::HandlerFn handler_;
        std::shared_ptr<spdlog::logger> log_;

        Session(tcp::socket s, HandlerFn h, std::shared_ptr<spdlog::logger> log)
        : socket_(std::move(s)), handler_(std::move(h)), log_(std::move(log)) {
            parser_.body_limit(kBodyLimit);
        }

        void run() { do_read(); }

        void do_read() {
            auto self = shared_from_this();
            http::async_read(socket_, buffer_, parser_,
                [self](boost::beast::error_code ec, std::size_t){
                    if (ec == http::error::end_of_stream) return self->do_close();
                    if (ec == http::error::body_limit) return self->reply_too_large();
                    if (ec) {
                        self->log_->debug("read error: {}", ec.message());
                        return;
                    }
                    self->handle(self->parser_.release());
                });
        }

        void handle(http::request<http::string_body> req) {
            auto res = std::make_shared<http::response<http::string_body>>();
            res->version(req.version());
            res->keep_alive(false);
            const auto started = std::chrono::steady_clock::now();
            if (req.method() == http::verb::options) {
                res->result(http::status::no_content);
            } else {
                try {
                    handler_(req, *res);
                } catch (const std::exception& e) {
                    log_->error("handler failed target={} error={}", std::string(req.target()), e.what());
                    res->result(http::status::internal_server_error);
                    res->set(http::field::content_type, "application/json");
                    res->body() = R"({"error":"internal error"})";
                }
            }
            // CORS
            res->set(http::field::access_control_allow_origin, "*");
            res->set(http::field::access_control_allow_headers, "*");
            res->set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
            res->prepare_payload();
            log_->debug("{} {} -> {} in {}ms", std::string(req.method_string()), std::string(req.target()),
                        res->result_int(),
                        std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::steady_clock::now() - started).count());
            write(res);
        }

        void reply_too_large() {
            auto res = std::make_shared<http::response<http::string_body>>(http::status::payload_too_large, 11);
            res->keep_alive(false);
            res->set(http::field::content_type, "application/json");
            res->body() = R"({"error":"request body too large"})";
            res->prepare_payload();
            write(res);
        }

        void write(std::shared_ptr<http::response<http::string_body>> res) {
            auto self = shared_from_this();
            http::async_write(socket_, *res,
                [self, res](boost::beast::error_code, std::size_t){
                    self->do_close();
                });
        }

        void do_close() {
            boost::beast::error_code ec;
            socket_.shutdown(tcp::socket::shutdown_send, ec);
        }
    };

    void do_accept() {
        acceptor_.async_accept(
            boost::asio::make_strand(ioc_),
            [this](boost::beast::error_code ec, tcp::socket s){
                if (ec == boost::asio::error::operation_aborted) return;
                if (!ec) std::make_shared<Session>(std::move(s), handler_, log_)->run();
                do_accept();
            });
    }

    boost::asio::io_context& ioc_;
    tcp::acceptor acceptor_;
    HandlerFn handler_;
    std::shared_ptr<spdlog::logger> log_;
};

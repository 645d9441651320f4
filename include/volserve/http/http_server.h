#pragma once

#include <volserve/core/types.h>
#include <volserve/http/delivery_handler.h>
#include <volserve/http/response_writer.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <list>
#include <mutex>
#include <string>
#include <thread>

namespace volserve::http {

namespace beast = boost::beast;
namespace bhttp = boost::beast::http;
using tcp = boost::asio::ip::tcp;

/**
 * IResponseWriter over a blocking socket. The head goes out through Beast's header
 * serializer; body bytes are written to the socket as they come.
 */
class SocketResponseWriter final : public IResponseWriter {
public:
    SocketResponseWriter(tcp::socket& socket, unsigned version)
        : socket_(socket), version_(version) {}

    Result<void> writeHead(const ResponseHead& head) override;
    Result<void> writeBody(ByteSpan data) override;
    [[nodiscard]] bool headersSent() const override { return headersSent_; }

    [[nodiscard]] unsigned status() const noexcept { return status_; }
    [[nodiscard]] std::uint64_t bodyBytes() const noexcept { return bodyBytes_; }

private:
    tcp::socket& socket_;
    unsigned version_;
    unsigned status_{0};
    bool headersSent_{false};
    std::uint64_t bodyBytes_{0};
};

// Peer-gone conditions (broken pipe, reset, eof) map to ClientDisconnected
Error socketError(const beast::error_code& ec, const char* what);

/**
 * Thread-per-connection HTTP/1.1 server. Accepts on the io_context, then hands each
 * socket to a worker thread that serves keep-alive requests through the handler
 * with blocking reads and writes. Finished workers are joined on the next accept;
 * stop() joins the rest, so no worker outlives the server.
 */
class HttpServer {
public:
    struct Config {
        std::string bindAddress = "0.0.0.0";
        std::uint16_t bindPort = 8080;
    };

    HttpServer(boost::asio::io_context& ioc, DeliveryHandler& handler, Config cfg);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Bind and listen; port 0 picks an ephemeral port
    Result<void> listen();

    // Start accepting. Connections are served while the io_context runs.
    void start();

    // Stop accepting, shut down open connections and join their workers. A worker busy
    // in a rebuild finishes it first.
    void stop();

    [[nodiscard]] std::uint16_t port() const noexcept { return boundPort_; }
    [[nodiscard]] std::size_t activeConnections() const;

private:
    struct Session {
        std::shared_ptr<tcp::socket> socket;
        std::thread worker;
        bool finished{false}; // guarded by sessionsMutex_
    };

    void doAccept();
    void handleSession(Session* session);
    void reapFinishedLocked();

    boost::asio::io_context& ioc_;
    tcp::acceptor acceptor_;
    DeliveryHandler& handler_;
    Config cfg_;
    std::uint16_t boundPort_{0};
    std::atomic<bool> stopping_{false};

    mutable std::mutex sessionsMutex_;
    std::list<Session> sessions_; // nodes stay put while their worker runs
};

} // namespace volserve::http

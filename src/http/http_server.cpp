#include <volserve/http/http_server.h>

#include <boost/asio/error.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <thread>

namespace volserve::http {

Error socketError(const beast::error_code& ec, const char* what) {
    namespace aerr = boost::asio::error;
    if (ec == aerr::broken_pipe || ec == aerr::connection_reset || ec == aerr::eof ||
        ec == aerr::not_connected || ec == aerr::connection_aborted || ec == aerr::shut_down ||
        ec == bhttp::error::end_of_stream) {
        return Error{ErrorCode::ClientDisconnected, std::string(what) + ": " + ec.message()};
    }
    return Error{ErrorCode::IoError, std::string(what) + ": " + ec.message()};
}

// --- SocketResponseWriter ---

Result<void> SocketResponseWriter::writeHead(const ResponseHead& head) {
    if (headersSent_)
        return Error{ErrorCode::InternalError, "response head already sent"};

    bhttp::response<bhttp::empty_body> res{static_cast<bhttp::status>(head.status), version_};
    res.set(bhttp::field::server, "volserve");
    for (const auto& [name, value] : head.headers)
        res.set(name, value);
    if (head.contentLength)
        res.content_length(*head.contentLength);
    res.keep_alive(head.keepAlive);

    beast::error_code ec;
    bhttp::response_serializer<bhttp::empty_body> sr{res};
    bhttp::write_header(socket_, sr, ec);
    status_ = head.status;
    headersSent_ = true;
    if (ec)
        return socketError(ec, "write header");
    return Result<void>();
}

Result<void> SocketResponseWriter::writeBody(ByteSpan data) {
    if (!headersSent_)
        return Error{ErrorCode::InternalError, "body before response head"};
    if (data.empty())
        return Result<void>();
    beast::error_code ec;
    boost::asio::write(socket_, boost::asio::buffer(data.data(), data.size()), ec);
    if (ec)
        return socketError(ec, "write body");
    bodyBytes_ += data.size();
    return Result<void>();
}

// --- HttpServer ---

HttpServer::HttpServer(boost::asio::io_context& ioc, DeliveryHandler& handler, Config cfg)
    : ioc_(ioc), acceptor_(ioc), handler_(handler), cfg_(std::move(cfg)) {}

HttpServer::~HttpServer() {
    stop();
}

Result<void> HttpServer::listen() {
    beast::error_code ec;
    const tcp::endpoint ep{boost::asio::ip::make_address(cfg_.bindAddress, ec), cfg_.bindPort};
    if (ec)
        return Error{ErrorCode::InvalidArgument, "invalid bind address: " + ec.message()};
    acceptor_.open(ep.protocol(), ec);
    if (ec)
        return Error{ErrorCode::IoError, "acceptor open failed: " + ec.message()};
    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    acceptor_.bind(ep, ec);
    if (ec)
        return Error{ErrorCode::IoError, "bind failed: " + ec.message()};
    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec)
        return Error{ErrorCode::IoError, "listen failed: " + ec.message()};
    boundPort_ = acceptor_.local_endpoint(ec).port();
    spdlog::info("listening on {}:{}", cfg_.bindAddress, boundPort_);
    return Result<void>();
}

void HttpServer::start() {
    doAccept();
}

void HttpServer::doAccept() {
    acceptor_.async_accept([this](beast::error_code ec, tcp::socket socket) {
        if (ec == boost::asio::error::operation_aborted || stopping_.load())
            return;
        if (ec) {
            spdlog::warn("accept error: {}", ec.message());
        } else {
            std::lock_guard lk(sessionsMutex_);
            if (stopping_.load())
                return;
            reapFinishedLocked();
            auto& session = sessions_.emplace_back();
            session.socket = std::make_shared<tcp::socket>(std::move(socket));
            session.worker = std::thread(&HttpServer::handleSession, this, &session);
        }
        doAccept();
    });
}

void HttpServer::reapFinishedLocked() {
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (it->finished) {
            // The worker only has to return from handleSession
            if (it->worker.joinable())
                it->worker.join();
            it = sessions_.erase(it);
        } else {
            ++it;
        }
    }
}

void HttpServer::handleSession(Session* session) {
    auto& socket = session->socket;
    beast::error_code ec;
    std::string peer = "?";
    if (auto remote = socket->remote_endpoint(ec); !ec)
        peer = remote.address().to_string();

    try {
        beast::flat_buffer buffer;
        for (;;) {
            bhttp::request<bhttp::string_body> req;
            bhttp::read(*socket, buffer, req, ec);
            if (ec == bhttp::error::end_of_stream)
                break;
            if (ec) {
                spdlog::debug("http read error from {}: {}", peer, ec.message());
                break;
            }

            Request request;
            request.method = std::string(req.method_string());
            request.target = std::string(req.target());
            request.version = req.version();
            request.keepAlive = req.keep_alive() && !stopping_.load();

            const auto started = std::chrono::steady_clock::now();
            SocketResponseWriter writer(*socket, req.version());
            const bool keepAlive = handler_.handle(request, writer);
            const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started);
            spdlog::info("{} {} {} -> {} ({} bytes, {} ms)", peer, request.method, request.target,
                         writer.status(), writer.bodyBytes(), elapsed.count());
            if (!keepAlive)
                break;
        }
    } catch (const std::exception& e) {
        spdlog::error("connection from {} failed: {}", peer, e.what());
    }

    socket->shutdown(tcp::socket::shutdown_send, ec);
    socket->close(ec);
    std::lock_guard lk(sessionsMutex_);
    session->finished = true;
}

std::size_t HttpServer::activeConnections() const {
    std::lock_guard lk(sessionsMutex_);
    std::size_t n = 0;
    for (const auto& session : sessions_) {
        if (!session.finished)
            ++n;
    }
    return n;
}

void HttpServer::stop() {
    std::list<Session> draining;
    {
        std::lock_guard lk(sessionsMutex_);
        if (stopping_.exchange(true))
            return;
        beast::error_code ec;
        acceptor_.close(ec);
        for (auto& session : sessions_) {
            // Unblocks reads and writes in progress; the worker then finishes on its own
            session.socket->shutdown(tcp::socket::shutdown_both, ec);
        }
        draining.splice(draining.end(), sessions_);
    }

    if (!draining.empty())
        spdlog::info("waiting for {} connection(s) to finish", draining.size());
    for (auto& session : draining) {
        if (session.worker.joinable())
            session.worker.join();
    }
}

} // namespace volserve::http

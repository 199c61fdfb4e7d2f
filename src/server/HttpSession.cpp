#include "server/HttpSession.hpp"
#include "server/Logger.hpp"

namespace slugline {
namespace server {

HttpSession::HttpSession(tcp::socket socket, RequestHandler& handler)
    : m_stream(std::move(socket))
    , m_handler(handler)
{
    beast::error_code ec;
    auto endpoint = m_stream.socket().remote_endpoint(ec);
    if (!ec) {
        m_remoteAddress = endpoint.address().to_string();
    }
}

void HttpSession::run() {
    net::dispatch(
        m_stream.get_executor(),
        beast::bind_front_handler(&HttpSession::doRead, shared_from_this()));
}

void HttpSession::doRead() {
    m_parser.emplace();
    m_parser->body_limit(kBodyLimit);
    m_stream.expires_after(std::chrono::seconds(30));

    http::async_read(
        m_stream,
        m_buffer,
        *m_parser,
        beast::bind_front_handler(&HttpSession::onRead, shared_from_this()));
}

void HttpSession::onRead(beast::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec == http::error::end_of_stream) {
        return doClose();
    }

    if (ec) {
        // Idle keep-alive connections time out routinely
        if (ec != beast::error::timeout) {
            LOG_WARN("Read error: " + ec.message());
        }
        return;
    }

    sendResponse(handleRequest(m_parser->release()));
}

void HttpSession::sendResponse(http::response<http::string_body> response) {
    auto sp = std::make_shared<http::response<http::string_body>>(std::move(response));
    bool needEof = sp->need_eof();

    http::async_write(
        m_stream,
        *sp,
        [self = shared_from_this(), sp, needEof](beast::error_code ec, std::size_t bytes) {
            self->onWrite(needEof, ec, bytes);
        });
}

void HttpSession::onWrite(bool close, beast::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
        LOG_WARN("Write error: " + ec.message());
        return;
    }

    if (close) {
        return doClose();
    }

    doRead();
}

void HttpSession::doClose() {
    beast::error_code ec;
    m_stream.socket().shutdown(tcp::socket::shutdown_send, ec);
}

http::response<http::string_body> HttpSession::makeResponse(
    const Reply& reply, unsigned version, bool keepAlive, bool headOnly)
{
    http::response<http::string_body> res{static_cast<http::status>(reply.status), version};
    res.set(http::field::server, "slugline");
    res.set(http::field::content_type, reply.contentType);
    res.set(http::field::cache_control, "no-store");
    if (!reply.location.empty()) {
        res.set(http::field::location, reply.location);
    }
    res.keep_alive(keepAlive);
    res.body() = reply.body;
    res.prepare_payload();
    if (headOnly) {
        // Content-Length stays that of the GET body
        res.body().clear();
    }
    return res;
}

http::response<http::string_body> HttpSession::handleRequest(
    http::request<http::string_body>&& req)
{
    auto& logger = Logger::instance();

    Request request;
    request.method = std::string(req.method_string());
    request.target = std::string(req.target());
    request.remoteAddress = m_remoteAddress;
    if (auto it = req.find(http::field::user_agent); it != req.end()) {
        request.userAgent = std::string(it->value());
    }
    if (auto it = req.find(http::field::referer); it != req.end()) {
        request.referrer = std::string(it->value());
    }

    // Log request and get request ID for correlation
    uint64_t requestId = logger.logRequest(request.method, request.target, m_remoteAddress);

    Reply reply = m_handler.handle(request);
    auto res = makeResponse(reply, req.version(), req.keep_alive(),
                            req.method() == http::verb::head);

    logger.logResponse(requestId, static_cast<int>(reply.status), reply.body.size());
    return res;
}

} // namespace server
} // namespace slugline

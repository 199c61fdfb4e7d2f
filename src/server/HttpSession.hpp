#pragma once

#include "server/RequestHandler.hpp"
#include <utility>
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <memory>
#include <optional>
#include <string>

namespace slugline {
namespace server {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

/**
 * Session HTTP - one client connection, keep-alive aware
 */
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    static constexpr size_t kBodyLimit = 64 * 1024;

    HttpSession(tcp::socket socket, RequestHandler& handler);

    void run();

    /**
     * @brief Convert a handler Reply into a Beast response
     */
    static http::response<http::string_body> makeResponse(
        const Reply& reply, unsigned version, bool keepAlive, bool headOnly);

private:
    void doRead();
    void onRead(beast::error_code ec, std::size_t bytes_transferred);
    void sendResponse(http::response<http::string_body> response);
    void onWrite(bool close, beast::error_code ec, std::size_t bytes_transferred);
    void doClose();

    http::response<http::string_body> handleRequest(
        http::request<http::string_body>&& req);

    beast::tcp_stream m_stream;
    beast::flat_buffer m_buffer;
    std::optional<http::request_parser<http::string_body>> m_parser;
    RequestHandler& m_handler;
    std::string m_remoteAddress;
};

} // namespace server
} // namespace slugline

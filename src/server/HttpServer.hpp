#pragma once

#include "server/RequestHandler.hpp"
#include <utility>
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <atomic>
#include <string>

namespace slugline {
namespace server {

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

/**
 * Serveur HTTP basé sur Boost.Beast
 */
class HttpServer {
public:
    /**
     * @throws std::runtime_error if the address cannot be bound
     */
    HttpServer(net::io_context& ioc, const std::string& address, unsigned short port,
               RequestHandler& handler);

    void run();

    /**
     * Stop accepting; sessions in flight finish on their own
     */
    void stop();

    /**
     * Bound port, useful when constructed with port 0
     */
    unsigned short port() const;

private:
    void doAccept();

    net::io_context& m_ioc;
    tcp::acceptor m_acceptor;
    RequestHandler& m_handler;
    std::atomic<bool> m_running{false};
};

} // namespace server
} // namespace slugline

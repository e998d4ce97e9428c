#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <chrono>
#include <memory>
#include <string>

namespace datachat {
namespace server {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

class RequestHandler;

/**
 * HTTP server based on Boost.Beast. Accepts connections and hands each
 * to an HttpSession on its own strand; the io_context may be run on
 * several threads.
 */
class HttpServer {
public:
    HttpServer(net::io_context& ioc,
               const std::string& address,
               unsigned short port,
               RequestHandler& handler,
               std::chrono::milliseconds requestTimeout);

    void run();
    void stop();

    unsigned short port() const;

private:
    void doAccept();

    net::io_context& m_ioc;
    tcp::acceptor m_acceptor;
    RequestHandler& m_handler;
    std::chrono::milliseconds m_requestTimeout;
    bool m_running;
};

} // namespace server
} // namespace datachat

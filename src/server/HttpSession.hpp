#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace datachat {
namespace server {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

class RequestHandler;

/**
 * One client connection. Reads a request, lets RequestHandler produce
 * the JSON response and writes it back; keep-alive connections loop.
 */
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    static constexpr size_t kBodyLimit = 110 * 1024 * 1024;   // room for a 100 MB table

    HttpSession(tcp::socket socket, RequestHandler& handler, std::chrono::milliseconds requestTimeout);

    void run();

private:
    void doRead();
    void onRead(beast::error_code ec, std::size_t bytes_transferred);
    void sendResponse(http::response<http::string_body> response);
    void onWrite(bool close, beast::error_code ec, std::size_t bytes_transferred);
    void doClose();

    http::response<http::string_body> handleRequest(http::request<http::string_body>&& req);

    beast::tcp_stream m_stream;
    beast::flat_buffer m_buffer;
    std::optional<http::request_parser<http::string_body>> m_parser;
    RequestHandler& m_handler;
    std::chrono::milliseconds m_requestTimeout;
};

} // namespace server
} // namespace datachat

#include "server/HttpSession.hpp"
#include "server/RequestHandler.hpp"
#include "common/Logger.hpp"

namespace datachat {
namespace server {

namespace {

constexpr auto kIdleTimeout = std::chrono::seconds(30);

http::response<http::string_body> makeJsonResponse(
    http::status status,
    const json& body,
    unsigned version,
    bool keepAlive,
    uint64_t requestId)
{
    http::response<http::string_body> res{status, version};
    res.set(http::field::server, "datachat/1.0");
    res.set(http::field::content_type, "application/json");
    res.set(http::field::cache_control, "no-store");
    res.set(http::field::access_control_allow_origin, "*");
    res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
    res.set(http::field::access_control_allow_headers, "Content-Type");
    res.keep_alive(keepAlive);
    res.body() = body.dump();
    res.prepare_payload();

    Logger::instance().logResponse(requestId, static_cast<int>(status), res.body().size());

    return res;
}

} // anonymous namespace

HttpSession::HttpSession(tcp::socket socket, RequestHandler& handler, std::chrono::milliseconds requestTimeout)
    : m_stream(std::move(socket))
    , m_handler(handler)
    , m_requestTimeout(requestTimeout)
{
}

void HttpSession::run() {
    net::dispatch(
        m_stream.get_executor(),
        beast::bind_front_handler(&HttpSession::doRead, shared_from_this()));
}

void HttpSession::doRead() {
    m_parser.emplace();
    m_parser->body_limit(kBodyLimit);
    m_stream.expires_after(kIdleTimeout);

    http::async_read(
        m_stream,
        m_buffer,
        *m_parser,
        beast::bind_front_handler(&HttpSession::onRead, shared_from_this()));
}

void HttpSession::onRead(beast::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec == http::error::end_of_stream || ec == beast::error::timeout) {
        return doClose();
    }

    if (ec) {
        LOG_WARN("http", "Read error: " + ec.message());
        return;
    }

    // Handling may block on a query; the write must still fit the request budget
    m_stream.expires_after(m_requestTimeout);
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
        LOG_WARN("http", "Write error: " + ec.message());
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

http::response<http::string_body> HttpSession::handleRequest(
    http::request<http::string_body>&& req)
{
    auto& logger = Logger::instance();
    std::string target(req.target());
    std::string method(req.method_string());

    uint64_t requestId = logger.logRequest(method, target, req.body());

    // CORS preflight
    if (req.method() == http::verb::options) {
        http::response<http::string_body> res{http::status::no_content, req.version()};
        res.set(http::field::server, "datachat/1.0");
        res.set(http::field::access_control_allow_origin, "*");
        res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
        res.set(http::field::access_control_allow_headers, "Content-Type");
        res.keep_alive(req.keep_alive());
        res.prepare_payload();
        logger.logResponse(requestId, 204, 0);
        return res;
    }

    auto [code, body] = m_handler.handle(method, target, req.body());
    return makeJsonResponse(static_cast<http::status>(code), body, req.version(), req.keep_alive(), requestId);
}

} // namespace server
} // namespace datachat

#include "server/HttpSession.hpp"
#include "server/RequestHandler.hpp"
#include "server/Logger.hpp"

namespace coderun {
namespace server {

namespace {

const char* kServerHeader = "CodeRun/1.0";

void setCommonHeaders(http::response<http::string_body>& res) {
    res.set(http::field::server, kServerHeader);
    res.set(http::field::cache_control, "no-store");
    res.set(http::field::access_control_allow_origin, "*");
    res.set(http::field::access_control_allow_methods, "GET, DELETE, OPTIONS");
    res.set(http::field::access_control_allow_headers, "Content-Type");
}

} // anonymous namespace

HttpSession::HttpSession(tcp::socket socket)
    : m_stream(std::move(socket))
{
}

void HttpSession::run() {
    net::dispatch(
        m_stream.get_executor(),
        beast::bind_front_handler(&HttpSession::doRead, shared_from_this()));
}

void HttpSession::doRead() {
    m_parser.emplace();
    m_parser->body_limit(1024 * 1024); // requests carry no payload
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
        if (ec != beast::error::timeout) {
            LOG_ERROR("Read error: " + ec.message());
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
        LOG_ERROR("Write error: " + ec.message());
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

    uint64_t requestId = logger.logRequest(method, target);

    // CORS preflight
    if (req.method() == http::verb::options) {
        http::response<http::string_body> res{http::status::no_content, req.version()};
        setCommonHeaders(res);
        res.keep_alive(req.keep_alive());
        res.prepare_payload();
        logger.logResponse(requestId, 204, 0);
        return res;
    }

    ApiResponse api = RequestHandler::instance().dispatch(method, target);

    http::response<http::string_body> res{static_cast<http::status>(api.status), req.version()};
    setCommonHeaders(res);
    res.set(http::field::content_type, api.contentType);
    res.keep_alive(req.keep_alive());
    res.body() = std::move(api.body);
    res.prepare_payload();

    logger.logResponse(requestId, static_cast<int>(api.status), res.body().size());
    return res;
}

} // namespace server
} // namespace coderun

#include "server/HttpServer.hpp"
#include "server/HttpSession.hpp"
#include "server/Logger.hpp"
#include <stdexcept>

namespace coderun {
namespace server {

HttpServer::HttpServer(net::io_context& ioc, const std::string& address, unsigned short port)
    : m_ioc(ioc)
    , m_acceptor(net::make_strand(ioc))
    , m_running(false)
{
    beast::error_code ec;
    auto ip = net::ip::make_address(address, ec);
    if (ec) {
        throw std::runtime_error("Invalid listen address '" + address + "': " + ec.message());
    }

    for (int attempt = 0; attempt < kPortAttempts; ++attempt) {
        int candidate = static_cast<int>(port) + attempt;
        if (candidate > 65535) {
            break;
        }
        tcp::endpoint endpoint(ip, static_cast<unsigned short>(candidate));
        if (tryBind(endpoint, ec)) {
            m_port = m_acceptor.local_endpoint().port();
            if (attempt > 0) {
                LOG_WARN("Port " + std::to_string(port) + " unavailable, using " + std::to_string(m_port));
            }
            LOG_INFO("Query API listening on http://" + address + ":" + std::to_string(m_port));
            return;
        }
        LOG_DEBUG("Cannot listen on port " + std::to_string(candidate) + ": " + ec.message());
    }

    throw std::runtime_error("Failed to bind " + address + " on ports " + std::to_string(port) +
                             "-" + std::to_string(port + kPortAttempts - 1) + ": " + ec.message());
}

bool HttpServer::tryBind(const tcp::endpoint& endpoint, beast::error_code& ec) {
    beast::error_code ignored;
    if (m_acceptor.is_open()) {
        m_acceptor.close(ignored);
    }

    // Open the acceptor
    m_acceptor.open(endpoint.protocol(), ec);
    if (ec) return false;

    // Allow address reuse
    m_acceptor.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) return false;

    m_acceptor.bind(endpoint, ec);
    if (ec) return false;

    m_acceptor.listen(net::socket_base::max_listen_connections, ec);
    return !ec;
}

void HttpServer::run() {
    m_running = true;
    doAccept();
}

void HttpServer::stop() {
    m_running = false;
    beast::error_code ec;
    m_acceptor.close(ec);
    if (ec) {
        LOG_WARN("Closing acceptor: " + ec.message());
    }
}

void HttpServer::doAccept() {
    if (!m_running) return;

    m_acceptor.async_accept(
        net::make_strand(m_ioc),
        [this](beast::error_code ec, tcp::socket socket) {
            if (!ec) {
                std::make_shared<HttpSession>(std::move(socket))->run();
            } else if (m_running) {
                LOG_WARN("Accept failed: " + ec.message());
            }

            if (m_running) {
                doAccept();
            }
        });
}

} // namespace server
} // namespace coderun

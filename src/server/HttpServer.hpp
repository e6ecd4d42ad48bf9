#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <memory>
#include <string>

namespace coderun {
namespace server {

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

/**
 * HTTP server built on Boost.Beast
 *
 * When the requested port is taken, the next kPortAttempts - 1 ports are
 * tried in order; port() reports the one actually bound.
 */
class HttpServer {
public:
    static constexpr int kPortAttempts = 10;

    HttpServer(net::io_context& ioc, const std::string& address, unsigned short port);

    void run();
    void stop();

    unsigned short port() const { return m_port; }

private:
    void doAccept();
    bool tryBind(const tcp::endpoint& endpoint, beast::error_code& ec);

    net::io_context& m_ioc;
    tcp::acceptor m_acceptor;
    unsigned short m_port = 0;
    bool m_running;
};

} // namespace server
} // namespace coderun

#include "delivery/HttpClient.hpp"
#include "delivery/DeliveryTypes.hpp"
#include <boost/asio.hpp>
#include <boost/beast.hpp>

namespace coderun {
namespace delivery {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

HttpReply postJson(const HttpPostRequest& request) {
    net::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);
    beast::error_code ec;

    auto endpoints = resolver.resolve(request.host, std::to_string(request.port), ec);
    if (ec) {
        throw DeliveryError("Cannot resolve " + request.host + ": " + ec.message());
    }

    stream.expires_after(request.timeout);
    stream.connect(endpoints, ec);
    if (ec) {
        throw DeliveryError("Cannot connect to " + request.host + ":" + std::to_string(request.port)
                            + ": " + ec.message());
    }

    http::request<http::string_body> req{http::verb::post, request.target, 11};
    req.set(http::field::host, request.host);
    req.set(http::field::user_agent, "CodeRun/1.0");
    req.set(http::field::content_type, "application/json");
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }
    req.body() = request.body;
    req.prepare_payload();

    stream.expires_after(request.timeout);
    http::write(stream, req, ec);
    if (ec) {
        throw DeliveryError("Write to " + request.host + " failed: " + ec.message());
    }

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(stream, buffer, res, ec);
    if (ec) {
        throw DeliveryError("Read from " + request.host + " failed: " + ec.message());
    }

    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    // not_connected happens when the server closed first

    return HttpReply{static_cast<int>(res.result_int()), res.body()};
}

} // namespace delivery
} // namespace coderun

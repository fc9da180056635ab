#include "adapters/secondary/network/BeastHttpClient.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

namespace sandbox::adapters::secondary {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

ports::output::HttpResponse BeastHttpClient::send(
    const ports::output::HttpRequest& request,
    std::chrono::seconds timeout)
{
    net::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);

    std::string where = request.host + ":" + std::to_string(request.port) + request.target;
    auto fail = [&](const beast::error_code& ec, const char* stage) {
        if (ec == beast::error::timeout) {
            throw ports::output::HttpTimeoutError("Timed out (" + std::string(stage) + ") for " + where);
        }
        throw std::runtime_error(std::string(stage) + " failed for " + where + ": " + ec.message());
    };

    beast::error_code ec;
    auto results = resolver.resolve(request.host, std::to_string(request.port), ec);
    if (ec) fail(ec, "resolve");

    stream.expires_after(timeout);
    stream.connect(results, ec);
    if (ec) fail(ec, "connect");

    http::verb verb = http::string_to_verb(request.method);
    if (verb == http::verb::unknown) {
        throw std::invalid_argument("Unsupported HTTP method: " + request.method);
    }

    http::request<http::string_body> req{verb, request.target, 11};
    req.set(http::field::host, request.host);
    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }
    if (!request.body.empty()) {
        req.body() = request.body;
        req.prepare_payload();
    }

    stream.expires_after(timeout);
    http::write(stream, req, ec);
    if (ec) fail(ec, "write");

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    stream.expires_after(timeout);
    http::read(stream, buffer, res, ec);
    if (ec) fail(ec, "read");

    stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    ports::output::HttpResponse response;
    response.status = static_cast<int>(res.result_int());
    response.body = res.body();
    return response;
}

} // namespace sandbox::adapters::secondary

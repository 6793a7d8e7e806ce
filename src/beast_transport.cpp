#include <chrono>
#include <limits>
#include <string_view>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <fmt/core.h>

#include "beast_transport.hpp"
#include "errors.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace io = boost::asio;
using tcp = io::ip::tcp;

using response_parser_t = http::response_parser<http::vector_body<std::uint8_t>>;

static std::string_view to_std(beast::string_view view)
{
    return {view.data(), view.size()};
}

// The server ending the response early, by closing or by going silent past
// the timeout, is not a failure as long as we got the status line and headers.
static bool is_truncated_body(const beast::error_code &ec,
                              const response_parser_t &parser)
{
    if (!parser.is_header_done())
    {
        return false;
    }
    return ec == http::error::partial_message ||
           ec == http::error::end_of_stream || ec == io::error::eof ||
           ec == io::error::connection_reset || ec == beast::error::timeout;
}

static Response to_response(response_parser_t &parser)
{
    auto message = parser.release();
    Response response;
    response.status = message.result_int();
    for (const auto &field : message)
    {
        response.set_header(to_std(field.name_string()), to_std(field.value()));
    }
    response.body = std::move(message.body());
    return response;
}

BeastTransport::BeastTransport(std::string host, std::string port,
                               std::string target, std::size_t timeout)
    : m_host(std::move(host)), m_port(std::move(port)),
      m_target(std::move(target)), m_timeout(timeout)
{}

Response BeastTransport::request(const std::optional<ByteRange> &range)
{
    io::io_context ioc;
    beast::error_code ec;
    char const *failed_step = nullptr;
    Response response;

    io::spawn(
        ioc,
        [&](io::yield_context yield)
        {
            auto fail = [&](char const *what) { failed_step = what; };

            tcp::resolver resolver(ioc);
            auto endpoints = resolver.async_resolve(m_host, m_port, yield[ec]);
            if (ec)
                return fail("resolve");

            beast::tcp_stream stream(ioc);
            if (m_timeout > 0)
            {
                stream.expires_after(std::chrono::milliseconds(m_timeout));
            }
            stream.async_connect(endpoints, yield[ec]);
            if (ec)
                return fail("connect");

            http::request<http::empty_body> req{http::verb::get, m_target, 11};
            req.set(http::field::host, m_host);
            req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
            req.set(http::field::connection, "close");
            if (range)
            {
                req.set(http::field::range, range->to_header());
            }

            // Send the HTTP request to the remote host
            http::async_write(stream, req, yield[ec]);
            if (ec)
                return fail("write");

            beast::flat_buffer buffer;
            response_parser_t parser;
            // An explicit maximum, boost::none is compared as a zero limit by
            // Boost 1.74 when the header is finished
            parser.body_limit((std::numeric_limits<std::uint64_t>::max)());
            if (range)
            {
                http::async_read(stream, buffer, parser, yield[ec]);
            }
            else
            {
                // Only the declared length is of interest
                http::async_read_header(stream, buffer, parser, yield[ec]);
            }
            if (ec && !is_truncated_body(ec, parser))
                return fail("read");
            ec = {};

            response = to_response(parser);

            beast::error_code ignored;
            stream.socket().shutdown(tcp::socket::shutdown_both, ignored);
        });

    ioc.run();

    if (failed_step != nullptr)
    {
        throw TransportError(fmt::format("{} {}:{}: {}", failed_step, m_host,
                                         m_port, ec.message()));
    }
    return response;
}

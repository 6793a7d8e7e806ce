#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <string>
#include <thread>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <fmt/core.h>

#include "beast_transport.hpp"
#include "downloader.hpp"
#include "errors.hpp"
#include "fake_transport.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace io = boost::asio;
using tcp = io::ip::tcp;

namespace {

struct ServerBehaviour
{
    // Send the whole stream after the header of an unranged answer
    bool full_unranged_body = false;
    // Keep the connection open and silent this long after the last byte
    std::chrono::milliseconds silence{0};
};

/**
 * Loopback HTTP server that announces the full length of every range but
 * closes the connection after at most `cap` body bytes.
 */
class TruncatingServer {
  public:
    TruncatingServer(bytes_t stream, std::size_t cap,
                     ServerBehaviour behaviour = {})
        : m_stream(std::move(stream)), m_cap(cap), m_behaviour(behaviour),
          m_acceptor(m_ioc, tcp::endpoint(io::ip::make_address("127.0.0.1"), 0)),
          m_thread([this]() { serve(); })
    {}

    ~TruncatingServer()
    {
        m_stopping = true;
        // Unblock accept()
        io::io_context ioc;
        tcp::socket wake(ioc);
        beast::error_code ec;
        wake.connect(m_acceptor.local_endpoint(), ec);
        m_thread.join();
    }

    std::string port() const
    {
        return std::to_string(m_acceptor.local_endpoint().port());
    }

    std::size_t connections() const { return m_connections; }

  private:
    void serve()
    {
        while (true)
        {
            tcp::socket socket(m_ioc);
            beast::error_code ec;
            m_acceptor.accept(socket, ec);
            if (m_stopping || ec)
            {
                return;
            }
            ++m_connections;
            handle(socket);
        }
    }

    void handle(tcp::socket &socket)
    {
        beast::error_code ec;
        beast::flat_buffer buffer;
        http::request<http::empty_body> request;
        http::read(socket, buffer, request, ec);
        if (ec)
        {
            return;
        }

        auto range_header = request[http::field::range];
        std::string head;
        std::size_t begin = 0;
        std::size_t length = 0;
        if (range_header.empty())
        {
            head = fmt::format("HTTP/1.1 200 OK\r\nContent-Length: {}\r\n"
                               "Connection: close\r\n\r\n",
                               m_stream.size());
            if (m_behaviour.full_unranged_body)
            {
                length = m_stream.size();
            }
        }
        else
        {
            unsigned long long first = 0;
            unsigned long long last = 0;
            std::string value(range_header.data(), range_header.size());
            if (std::sscanf(value.c_str(), "bytes=%llu-%llu", &first, &last) !=
                2)
            {
                return;
            }
            begin = first;
            auto requested = last - first + 1;
            length = std::min<std::size_t>(requested, m_cap);
            head = fmt::format(
                "HTTP/1.1 206 Partial Content\r\nContent-Length: {}\r\n"
                "Content-Range: bytes {}-{}/{}\r\nConnection: close\r\n\r\n",
                requested, first, last, m_stream.size());
        }

        io::write(socket, io::buffer(head), ec);
        if (!ec && length > 0)
        {
            io::write(socket, io::buffer(m_stream.data() + begin, length), ec);
        }
        if (m_behaviour.silence.count() > 0)
        {
            std::this_thread::sleep_for(m_behaviour.silence);
        }
        socket.shutdown(tcp::socket::shutdown_both, ec);
        socket.close(ec);
    }

    bytes_t m_stream;
    std::size_t m_cap;
    ServerBehaviour m_behaviour;
    std::atomic<bool> m_stopping{false};
    std::atomic<std::size_t> m_connections{0};
    io::io_context m_ioc;
    tcp::acceptor m_acceptor;
    std::thread m_thread;
};

} // namespace

TEST(BeastTransport, UnrangedRequestReadsDeclaredLength)
{
    TruncatingServer server(make_stream(5000), 1000);
    BeastTransport transport("127.0.0.1", server.port(), "/", 5000);

    auto response = transport.request(std::nullopt);
    EXPECT_EQ(response.status, 200u);
    EXPECT_EQ(response.header("Content-Length"), "5000");
    EXPECT_TRUE(response.body.empty());
}

TEST(BeastTransport, UnrangedResponseWithBody)
{
    ServerBehaviour behaviour;
    behaviour.full_unranged_body = true;
    TruncatingServer server(make_stream(5000), 1000, behaviour);
    BeastTransport transport("127.0.0.1", server.port(), "/", 5000);

    auto response = transport.request(std::nullopt);
    EXPECT_EQ(response.status, 200u);
    EXPECT_EQ(response.header("Content-Length"), "5000");
}

TEST(BeastTransport, SilentServerKeepsPartialBody)
{
    auto stream = make_stream(5000);
    ServerBehaviour behaviour;
    behaviour.silence = std::chrono::milliseconds(1500);
    TruncatingServer server(stream, 1000, behaviour);
    BeastTransport transport("127.0.0.1", server.port(), "/", 300);

    auto response = transport.request(ByteRange{0, 4000});
    EXPECT_EQ(response.status, 206u);
    EXPECT_EQ(response.body, bytes_t(stream.begin(), stream.begin() + 1000));
}

TEST(BeastTransport, TruncatedBodyKeepsReceivedBytes)
{
    auto stream = make_stream(5000);
    TruncatingServer server(stream, 1000);
    BeastTransport transport("127.0.0.1", server.port(), "/", 5000);

    auto response = transport.request(ByteRange{200, 4200});
    EXPECT_EQ(response.status, 206u);
    EXPECT_EQ(response.body,
              bytes_t(stream.begin() + 200, stream.begin() + 1200));
}

TEST(BeastTransport, CompleteBody)
{
    auto stream = make_stream(5000);
    TruncatingServer server(stream, 1000);
    BeastTransport transport("127.0.0.1", server.port(), "/", 5000);

    auto response = transport.request(ByteRange{4500, 5000});
    EXPECT_EQ(response.status, 206u);
    EXPECT_EQ(response.body, bytes_t(stream.begin() + 4500, stream.end()));
}

TEST(BeastTransport, ConnectionRefused)
{
    std::string port;
    {
        io::io_context ioc;
        tcp::acceptor acceptor(
            ioc, tcp::endpoint(io::ip::make_address("127.0.0.1"), 0));
        port = std::to_string(acceptor.local_endpoint().port());
    }
    BeastTransport transport("127.0.0.1", port, "/", 5000);

    EXPECT_THROW(transport.request(ByteRange{0, 10}), TransportError);
}

TEST(BeastTransport, DownloadThroughTruncatingServer)
{
    auto stream = make_stream(300000);
    TruncatingServer server(stream, 65536);
    BeastTransport transport("127.0.0.1", server.port(), "/", 5000);

    DownloadSettings settings;
    settings.n_threads = 3;
    Downloader downloader(transport, settings);
    auto result = downloader.run();

    EXPECT_EQ(result.total_length, stream.size());
    EXPECT_EQ(result.digest, reference_digest(stream));
    // One length request and two requests for each range of 100000 bytes
    EXPECT_EQ(server.connections(), 7u);
}

#pragma once

#include <string>

#include "transport.hpp"

/**
 * HTTP/1.1 transport over plain TCP.
 *
 * Every request runs on its own io_context and connection
 * (`Connection: close`), so a single instance can be shared by all workers.
 * When the server closes the connection in the middle of a body, the bytes
 * parsed up to that point are returned as the response body.
 */
class BeastTransport : public Transport {
  public:
    /**
     * @param host Address or name of the server
     * @param port Service port
     * @param target Request target, e.g. "/"
     * @param timeout Per-request timeout in [ms], 0 disables it
     */
    BeastTransport(std::string host, std::string port, std::string target,
                   std::size_t timeout);

    Response request(const std::optional<ByteRange> &range) override;


  private:
    std::string m_host;
    std::string m_port;
    std::string m_target;
    std::size_t m_timeout;
};

#pragma once

#include <chrono>
#include <cstdint>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

#include "resupload/client/transport.hpp"

namespace resupload::client
{

    // HTTP/1.1 over TCP or TLS, one connection per request. The response is read while the
    // request body is still being written, so an early rejection is reported even when the
    // peer closes without draining the body.
    class HttpTransport : public Transport
    {
    public:
        static constexpr std::uint64_t kMaxResponseBody = 1024 * 1024;

        // A zero timeout waits indefinitely. Peer certificates are checked against the
        // system trust store.
        HttpTransport(boost::asio::io_context &io_context, std::chrono::milliseconds timeout);

        void async_send(http::Request request, CancellationToken token, Handler handler) override;

    private:
        boost::asio::io_context &io_context_;
        std::chrono::milliseconds timeout_;
        boost::asio::ssl::context tls_;
    };

} // namespace resupload::client

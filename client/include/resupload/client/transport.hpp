#pragma once

#include <functional>

#include <boost/system/error_code.hpp>

#include "resupload/client/cancellation.hpp"
#include "resupload/http.hpp"

namespace resupload::client
{

    // Sends one request. The handler runs exactly once on the transport's io_context; a
    // cancelled token completes it with boost::asio::error::operation_aborted.
    class Transport
    {
    public:
        using Handler = std::function<void(const boost::system::error_code &, http::Response)>;

        virtual ~Transport() = default;

        virtual void async_send(http::Request request, CancellationToken token, Handler handler) = 0;
    };

} // namespace resupload::client

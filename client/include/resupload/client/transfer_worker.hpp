#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/error_code.hpp>

#include "resupload/client/backoff.hpp"
#include "resupload/client/cancellation.hpp"
#include "resupload/client/chunk_planner.hpp"
#include "resupload/client/config.hpp"
#include "resupload/client/events.hpp"
#include "resupload/client/logger.hpp"
#include "resupload/client/payload.hpp"
#include "resupload/client/transport.hpp"
#include "resupload/error_codes.hpp"
#include "resupload/http.hpp"

namespace resupload::client
{

    // Everything a worker of one generation shares with its siblings.
    struct GenerationContext
    {
        boost::asio::io_context &io_context;
        Transport &transport;
        ChunkPlanner &planner;
        Payload &payload;
        const Backoff &backoff;
        const UploaderConfig &config;
        const http::Url &endpoint;
        const UploadEvents &events;
        Logger &logger;
        CancellationSource generation;
    };

    // Claims and transmits ranges until the planner runs dry, a restart is requested or the
    // generation is cancelled. Completion reports ErrorCode::Ok for all of those; anything
    // else is fatal for the whole upload.
    class TransferWorker : public std::enable_shared_from_this<TransferWorker>
    {
    public:
        using Completion = std::function<void(ErrorCode, const std::string &)>;

        TransferWorker(std::size_t id, std::shared_ptr<GenerationContext> context, Completion completion);

        void start();

    private:
        void claim_next();
        void send();
        void on_response(const boost::system::error_code &ec, const http::Response &response);
        void on_transient_failure(ChunkError error);
        void restart(unsigned status);
        void wait_then_retry(std::chrono::milliseconds delay);
        void finish(ErrorCode code = ErrorCode::Ok, const std::string &message = {});

        std::size_t id_;
        std::shared_ptr<GenerationContext> context_;
        Completion completion_;
        CancellationToken token_;
        boost::asio::steady_timer timer_;
        ChunkClaim claim_{};
        bool retried_{false};
        std::uint32_t attempt_{0};
        bool finished_{false};
    };

} // namespace resupload::client

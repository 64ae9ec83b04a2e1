#include "resupload/client/transfer_worker.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>

#include <string>
#include <utility>

namespace resupload::client
{

    namespace net = boost::asio;

    TransferWorker::TransferWorker(std::size_t id, std::shared_ptr<GenerationContext> context, Completion completion)
        : id_(id),
          context_(std::move(context)),
          completion_(std::move(completion)),
          token_(context_->generation.token()),
          timer_(context_->io_context)
    {
    }

    void TransferWorker::start()
    {
        claim_next();
    }

    void TransferWorker::claim_next()
    {
        if (token_.cancelled())
        {
            finish();
            return;
        }
        const auto claim = context_->planner.claim();
        if (!claim)
        {
            finish();
            return;
        }
        claim_ = *claim;
        retried_ = false;
        send();
    }

    void TransferWorker::send()
    {
        auto &ctx = *context_;
        http::Request request;
        try
        {
            request.body = ctx.payload.read(claim_.start, claim_.length());
        }
        catch (const UploadError &ex)
        {
            finish(ex.code(), ex.what());
            return;
        }

        const auto file_size = ctx.payload.size();
        request.method = ctx.config.method;
        request.url = ctx.endpoint;
        request.headers = ctx.config.headers;
        http::set_header(request.headers, ctx.config.header_names.content_range,
                         http::format_content_range(claim_.start, claim_.end_inclusive, file_size));
        http::set_header(request.headers, ctx.config.header_names.upload_id, ctx.planner.state().session_id);
        http::set_header(request.headers, ctx.config.header_names.content_type, ctx.payload.content_type());

        ctx.logger.debug("worker", "#", id_, " sending bytes ", claim_.start, "-", claim_.end_inclusive, "/", file_size);

        auto self = shared_from_this();
        ctx.transport.async_send(std::move(request), token_,
                                 [this, self](const boost::system::error_code &ec, http::Response response)
                                 { on_response(ec, response); });
    }

    void TransferWorker::on_response(const boost::system::error_code &ec, const http::Response &response)
    {
        if (ec == net::error::operation_aborted && token_.cancelled())
        {
            // The next generation claims these bytes again.
            finish();
            return;
        }

        if (!ec && http::is_success(response.status))
        {
            context_->planner.confirm(claim_.start, claim_.end_inclusive);
            attempt_ = 0;
            if (context_->events.on_chunk_success)
            {
                context_->events.on_chunk_success(claim_.start, claim_.end_inclusive);
            }
            claim_next();
            return;
        }

        if (!ec && response.status == http::kStatusPayloadTooLarge)
        {
            restart(response.status);
            return;
        }

        ChunkError error{
            .start = claim_.start,
            .end_inclusive = claim_.end_inclusive,
            .code = ec ? ErrorCode::TransportError : ErrorCode::HttpError,
            .status = ec ? 0u : response.status,
            .message = ec ? ec.message() : "HTTP " + std::to_string(response.status) + " " + response.reason,
        };
        on_transient_failure(std::move(error));
    }

    void TransferWorker::on_transient_failure(ChunkError error)
    {
        auto &ctx = *context_;
        ctx.logger.warn("worker", "#", id_, " bytes ", error.start, "-", error.end_inclusive, " failed: ", error.message);
        if (ctx.events.on_chunk_error)
        {
            ctx.events.on_chunk_error(error);
        }

        if (retried_)
        {
            ctx.planner.release(claim_.start);
            finish();
            return;
        }
        retried_ = true;
        const auto delay = ctx.backoff.delay(attempt_++);
        wait_then_retry(delay);
    }

    void TransferWorker::restart(unsigned status)
    {
        auto &ctx = *context_;
        if (ctx.events.on_chunk_error)
        {
            ctx.events.on_chunk_error(ChunkError{
                .start = claim_.start,
                .end_inclusive = claim_.end_inclusive,
                .code = ErrorCode::PayloadTooLarge,
                .status = status,
                .message = "Chunk rejected as too large",
            });
        }
        if (ctx.planner.request_restart())
        {
            ctx.logger.warn("worker", "#", id_, " chunk rejected as too large, restarting with ", ctx.planner.chunk_size(),
                            " byte chunks");
        }
        ctx.generation.cancel();
        finish();
    }

    void TransferWorker::wait_then_retry(std::chrono::milliseconds delay)
    {
        std::weak_ptr<TransferWorker> weak = shared_from_this();
        auto &io_context = context_->io_context;
        const auto subscription = token_.subscribe([weak, &io_context]
                                                   { net::post(io_context, [weak]
                                                                {
            if (auto self = weak.lock())
            {
                self->timer_.cancel();
            } }); });

        timer_.expires_after(delay);
        auto self = shared_from_this();
        timer_.async_wait([this, self, subscription](const boost::system::error_code & /*ec*/)
                          {
            token_.unsubscribe(subscription);
            if (token_.cancelled())
            {
                finish();
                return;
            }
            send(); });
    }

    void TransferWorker::finish(ErrorCode code, const std::string &message)
    {
        if (finished_)
        {
            return;
        }
        finished_ = true;
        auto completion = std::move(completion_);
        if (completion)
        {
            completion(code, message);
        }
    }

} // namespace resupload::client

#include "resupload/client/uploader.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <optional>
#include <utility>

#include "resupload/client/chunk_planner.hpp"
#include "resupload/client/image_preprocessor.hpp"
#include "resupload/client/transfer_worker.hpp"
#include "resupload/crypto.hpp"
#include "resupload/http.hpp"
#include "resupload/protocol.hpp"

namespace resupload::client
{

    namespace net = boost::asio;

    namespace
    {

        bool matches(const protocol::Checkpoint &checkpoint, const Payload &payload,
                     const std::optional<std::string> &session_id)
        {
            return checkpoint.file_name == payload.name() && checkpoint.file_size == payload.size() &&
                   checkpoint.file_type == payload.content_type() && !checkpoint.session_id.empty() &&
                   checkpoint.chunk_size > 0 && checkpoint.confirmed_offset <= checkpoint.file_size &&
                   (!session_id || *session_id == checkpoint.session_id);
        }

    } // namespace

    // State of one upload, kept alive by the handlers that reference it.
    class UploadRun : public std::enable_shared_from_this<UploadRun>
    {
    public:
        UploadRun(net::io_context &io_context, const UploaderConfig &config, std::shared_ptr<Transport> transport,
                  KeyValueStore &store, const UploadEvents &events, Logger logger, const Backoff &backoff,
                  std::unique_ptr<Payload> payload, Uploader::Completion completion)
            : io_context_(io_context),
              config_(config),
              transport_(std::move(transport)),
              checkpoints_(store, config.storage_key_prefix),
              events_(events),
              logger_(std::move(logger)),
              backoff_(backoff),
              payload_(std::move(payload)),
              completion_(std::move(completion)),
              timer_(io_context)
        {
        }

        void start()
        {
            auto self = shared_from_this();
            net::post(io_context_, [self]
                       { self->begin(); });
        }

        void cancel()
        {
            if (finished_)
            {
                return;
            }
            logger_.warn("upload", "Cancellation requested");
            cancelled_ = true;
            external_.cancel();
            if (generation_)
            {
                generation_->generation.cancel();
            }
            timer_.cancel();
        }

    private:
        void begin()
        {
            try
            {
                if (config_.compression.enabled)
                {
                    ImagePreprocessor preprocessor(config_.compression, logger_);
                    payload_ = preprocessor.apply(std::move(payload_));
                }
                endpoint_ = http::parse_url(config_.endpoint);
                restore_or_create();
            }
            catch (const UploadError &ex)
            {
                complete(ex.code(), ex.what());
                return;
            }

            if (config_.init_endpoint)
            {
                send_init();
                return;
            }
            start_generation();
        }

        void restore_or_create()
        {
            const auto &payload = *payload_;
            key_ = checkpoints_.key_for(config_.endpoint, payload.name(), payload.size(), payload.content_type());

            UploadState state{
                .session_id = {},
                .file_name = payload.name(),
                .file_size = payload.size(),
                .file_type = payload.content_type(),
                .chunk_size = config_.initial_chunk_size,
                .next_offset = 0,
                .confirmed_offset = 0,
            };

            auto checkpoint = checkpoints_.load(key_);
            if (checkpoint && matches(*checkpoint, payload, config_.session_id))
            {
                state.session_id = checkpoint->session_id;
                state.chunk_size = checkpoint->chunk_size;
                state.next_offset = checkpoint->confirmed_offset;
                state.confirmed_offset = checkpoint->confirmed_offset;
                logger_.log("upload", "Resuming session ", state.session_id, " at byte ", state.confirmed_offset, " of ",
                            state.file_size);
            }
            else
            {
                if (checkpoint)
                {
                    logger_.warn("upload", "Discarding checkpoint that does not match ", payload.name());
                }
                state.session_id = config_.session_id ? *config_.session_id : crypto::random_session_id();
                logger_.log("upload", "Starting session ", state.session_id, " for ", payload.name(), " (",
                            state.file_size, " bytes)");
            }

            std::weak_ptr<UploadRun> weak = shared_from_this();
            planner_ = std::make_unique<ChunkPlanner>(
                std::move(state), config_.min_chunk_size,
                [weak](const protocol::Checkpoint &snapshot)
                {
                    if (auto self = weak.lock())
                    {
                        self->persist(snapshot);
                    }
                },
                events_.on_progress);
            persist(planner_->checkpoint());
        }

        void persist(const protocol::Checkpoint &checkpoint)
        {
            try
            {
                checkpoints_.save(key_, checkpoint);
            }
            catch (const std::exception &ex)
            {
                logger_.warn("upload", "Could not persist checkpoint: ", ex.what());
            }
            if (events_.on_checkpoint)
            {
                events_.on_checkpoint(checkpoint);
            }
        }

        void send_init()
        {
            const auto state = planner_->state();
            http::Request request;
            try
            {
                request.url = http::parse_url(*config_.init_endpoint);
            }
            catch (const UploadError &ex)
            {
                complete(ex.code(), ex.what());
                return;
            }
            request.method = config_.init_method;
            request.headers = config_.headers;
            http::set_header(request.headers, "Content-Type", "application/json");
            http::set_header(request.headers, config_.header_names.upload_id, state.session_id);

            const nlohmann::json body = protocol::InitRequest{
                .file_name = state.file_name,
                .file_size = state.file_size,
                .file_type = state.file_type,
                .session_id = state.session_id,
            };
            const auto text = body.dump();
            request.body.resize(text.size());
            std::transform(text.begin(), text.end(), request.body.begin(), [](char ch)
                           { return static_cast<std::byte>(ch); });

            auto self = shared_from_this();
            transport_->async_send(std::move(request), external_.token(),
                                   [this, self](const boost::system::error_code &ec, http::Response response)
                                   { on_init_response(ec, response); });
        }

        void on_init_response(const boost::system::error_code &ec, const http::Response &response)
        {
            if (cancelled_)
            {
                complete(ErrorCode::Cancelled, "Upload cancelled");
                return;
            }
            if (ec)
            {
                complete(ErrorCode::InitFailed, "Initialization request failed: " + ec.message());
                return;
            }
            if (!http::is_success(response.status))
            {
                complete(ErrorCode::InitFailed,
                         "Initialization request failed: HTTP " + std::to_string(response.status) + " " + response.reason);
                return;
            }
            if (const auto upload_id = protocol::parse_init_response(response.body))
            {
                if (*upload_id != planner_->state().session_id)
                {
                    logger_.log("upload", "Server assigned upload id ", *upload_id);
                    planner_->set_session_id(*upload_id);
                }
            }
            start_generation();
        }

        void start_generation()
        {
            if (cancelled_)
            {
                complete(ErrorCode::Cancelled, "Upload cancelled");
                return;
            }
            if (planner_->complete())
            {
                succeed();
                return;
            }

            planner_->begin_generation();
            ++generation_index_;
            confirmed_at_start_ = planner_->state().confirmed_offset;
            generation_ = std::make_shared<GenerationContext>(GenerationContext{
                .io_context = io_context_,
                .transport = *transport_,
                .planner = *planner_,
                .payload = *payload_,
                .backoff = backoff_,
                .config = config_,
                .endpoint = endpoint_,
                .events = events_,
                .logger = logger_,
                .generation = CancellationSource{},
            });
            logger_.log("upload", "Generation ", generation_index_, " from byte ", confirmed_at_start_, " with ",
                        planner_->chunk_size(), " byte chunks and ", config_.max_concurrency, " workers");

            active_workers_ = config_.max_concurrency;
            auto self = shared_from_this();
            for (std::size_t i = 0; i < config_.max_concurrency; ++i)
            {
                auto worker = std::make_shared<TransferWorker>(
                    i + 1, generation_,
                    [this, self](ErrorCode code, const std::string &message)
                    { on_worker_done(code, message); });
                worker->start();
            }
        }

        void on_worker_done(ErrorCode code, const std::string &message)
        {
            if (code != ErrorCode::Ok && !fatal_)
            {
                logger_.error("upload", message);
                fatal_ = UploadResult{.error = code, .message = message, .session_id = {}};
                generation_->generation.cancel();
            }
            if (--active_workers_ > 0)
            {
                return;
            }
            generation_.reset();

            if (fatal_)
            {
                complete(fatal_->error, fatal_->message);
                return;
            }
            if (cancelled_)
            {
                complete(ErrorCode::Cancelled, "Upload cancelled");
                return;
            }
            if (planner_->complete())
            {
                succeed();
                return;
            }

            if (planner_->state().confirmed_offset > confirmed_at_start_)
            {
                generation_attempt_ = 0;
            }
            const auto delay = backoff_.delay(generation_attempt_++);
            logger_.log("upload", "Generation ", generation_index_, " ended at byte ", planner_->state().confirmed_offset,
                        ", next in ", delay.count(), " ms");

            timer_.expires_after(delay);
            auto self = shared_from_this();
            timer_.async_wait([this, self](const boost::system::error_code & /*ec*/)
                              { start_generation(); });
        }

        void succeed()
        {
            try
            {
                checkpoints_.erase(key_);
            }
            catch (const std::exception &ex)
            {
                logger_.warn("upload", "Could not erase checkpoint: ", ex.what());
            }
            const auto session_id = planner_->state().session_id;
            logger_.log("upload", "Upload of ", payload_->name(), " complete (session ", session_id, ")");
            complete(ErrorCode::Ok, {}, session_id);
        }

        void complete(ErrorCode code, const std::string &message, std::string session_id = {})
        {
            if (finished_)
            {
                return;
            }
            finished_ = true;
            auto self = shared_from_this();
            timer_.cancel();
            if (session_id.empty() && planner_)
            {
                session_id = planner_->state().session_id;
            }
            auto completion = std::move(completion_);
            completion(UploadResult{.error = code, .message = message, .session_id = std::move(session_id)});
        }

        net::io_context &io_context_;
        const UploaderConfig &config_;
        std::shared_ptr<Transport> transport_;
        CheckpointStore checkpoints_;
        const UploadEvents &events_;
        Logger logger_;
        const Backoff &backoff_;
        std::unique_ptr<Payload> payload_;
        Uploader::Completion completion_;
        net::steady_timer timer_;
        http::Url endpoint_;
        std::string key_;
        std::unique_ptr<ChunkPlanner> planner_;
        CancellationSource external_;
        std::shared_ptr<GenerationContext> generation_;
        std::size_t active_workers_{0};
        std::size_t generation_index_{0};
        std::uint64_t confirmed_at_start_{0};
        std::uint32_t generation_attempt_{0};
        std::optional<UploadResult> fatal_;
        bool cancelled_{false};
        bool finished_{false};
    };

    Uploader::Uploader(net::io_context &io_context, UploaderConfig config, std::shared_ptr<Transport> transport,
                       KeyValueStore &store, UploadEvents events, Logger logger)
        : io_context_(io_context),
          config_(normalize(std::move(config))),
          transport_(std::move(transport)),
          store_(store),
          events_(std::move(events)),
          logger_(std::move(logger)),
          backoff_(BackoffConfig{config_.backoff_base, config_.backoff_max})
    {
        if (!transport_)
        {
            throw UploadError(ErrorCode::InvalidConfig, "A transport is required");
        }
    }

    Uploader::~Uploader() = default;

    void Uploader::set_jitter_source(Backoff::UnitSource source)
    {
        backoff_ = Backoff(backoff_.config(), std::move(source));
    }

    void Uploader::async_upload(std::unique_ptr<Payload> payload, Completion completion)
    {
        if (!payload)
        {
            throw UploadError(ErrorCode::InvalidConfig, "A payload is required");
        }
        std::shared_ptr<UploadRun> run;
        {
            std::lock_guard lock(mutex_);
            if (run_)
            {
                throw UploadError(ErrorCode::InternalError, "An upload is already running");
            }
            run = std::make_shared<UploadRun>(
                io_context_, config_, transport_, store_, events_, logger_, backoff_, std::move(payload),
                [this, completion = std::move(completion)](const UploadResult &result)
                {
                    {
                        std::lock_guard lock(mutex_);
                        run_.reset();
                    }
                    if (completion)
                    {
                        completion(result);
                    }
                });
            run_ = run;
        }
        run->start();
    }

    std::string Uploader::upload(std::unique_ptr<Payload> payload)
    {
        std::optional<UploadResult> result;
        async_upload(std::move(payload), [&result](const UploadResult &outcome)
                     { result = outcome; });
        io_context_.restart();
        io_context_.run();
        if (!result)
        {
            throw UploadError(ErrorCode::InternalError, "The event loop stopped before the upload finished");
        }
        if (!result->ok())
        {
            throw UploadError(result->error, result->message);
        }
        return result->session_id;
    }

    void Uploader::cancel()
    {
        std::shared_ptr<UploadRun> run;
        {
            std::lock_guard lock(mutex_);
            run = run_;
        }
        if (!run)
        {
            return;
        }
        net::post(io_context_, [run]
                   { run->cancel(); });
    }

} // namespace resupload::client

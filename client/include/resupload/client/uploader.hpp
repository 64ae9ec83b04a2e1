#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include <boost/asio/io_context.hpp>

#include "resupload/client/backoff.hpp"
#include "resupload/client/checkpoint_store.hpp"
#include "resupload/client/config.hpp"
#include "resupload/client/events.hpp"
#include "resupload/client/logger.hpp"
#include "resupload/client/payload.hpp"
#include "resupload/client/transport.hpp"
#include "resupload/error_codes.hpp"

namespace resupload::client
{

    struct UploadResult
    {
        ErrorCode error{ErrorCode::Ok};
        std::string message;
        std::string session_id;

        bool ok() const
        {
            return error == ErrorCode::Ok;
        }
    };

    class UploadRun;

    // Drives one payload at a time to full confirmed coverage. The uploader must outlive the
    // uploads it starts.
    class Uploader
    {
    public:
        using Completion = std::function<void(const UploadResult &)>;

        // Throws UploadError(InvalidConfig) when the configuration cannot be normalized.
        Uploader(boost::asio::io_context &io_context, UploaderConfig config, std::shared_ptr<Transport> transport,
                 KeyValueStore &store, UploadEvents events = {}, Logger logger = {});
        ~Uploader();

        Uploader(const Uploader &) = delete;
        Uploader &operator=(const Uploader &) = delete;

        // Completion runs on the io_context once the upload finished, failed or was cancelled.
        void async_upload(std::unique_ptr<Payload> payload, Completion completion);

        // Runs the io_context until the upload finishes; returns the session id or throws UploadError.
        std::string upload(std::unique_ptr<Payload> payload);

        // Stops the running upload and keeps its checkpoint. Safe to call from any thread.
        void cancel();

        const UploaderConfig &config() const
        {
            return config_;
        }

        void set_jitter_source(Backoff::UnitSource source);

    private:
        boost::asio::io_context &io_context_;
        UploaderConfig config_;
        std::shared_ptr<Transport> transport_;
        KeyValueStore &store_;
        UploadEvents events_;
        Logger logger_;
        Backoff backoff_;
        std::mutex mutex_;
        std::shared_ptr<UploadRun> run_;
    };

} // namespace resupload::client

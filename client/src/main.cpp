#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "resupload/client/checkpoint_store.hpp"
#include "resupload/client/config.hpp"
#include "resupload/client/http_transport.hpp"
#include "resupload/client/logger.hpp"
#include "resupload/client/payload.hpp"
#include "resupload/client/uploader.hpp"
#include "resupload/error_codes.hpp"
#include "resupload/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    constexpr int kExitUsage = 2;

    void print_usage()
    {
        std::cout << "resupload " << resupload::version() << "\n"
                  << resupload::client::usage() << std::endl;
    }

    void install_default_logger(const resupload::client::ClientConfig &config)
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        if (config.log_path)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_path->string(), true));
        }
        auto logger = std::make_shared<spdlog::logger>("resupload", sinks.begin(), sinks.end());
        logger->set_level(config.verbose ? spdlog::level::debug : spdlog::level::info);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
    }

} // namespace

int main(int argc, char *argv[])
{
    using namespace resupload::client;

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            print_usage();
            return EXIT_SUCCESS;
        }
        if (arg == "--version")
        {
            std::cout << resupload::version() << std::endl;
            return EXIT_SUCCESS;
        }
    }

    ClientConfig config;
    try
    {
        config = parse_arguments(argc, argv);
    }
    catch (const resupload::UploadError &ex)
    {
        std::cerr << ex.what() << std::endl;
        print_usage();
        return kExitUsage;
    }

    try
    {
        install_default_logger(config);
        spdlog::info("resupload {} uploading {} to {}", resupload::version(), config.file.string(),
                     config.uploader.endpoint);

        Logger logger(spdlog::default_logger());

        auto payload = std::make_unique<FilePayload>(config.file, config.content_type.value_or(std::string{}));
        JsonFileStore store(config.state_file ? *config.state_file : JsonFileStore::default_state_path());

        boost::asio::io_context io_context;
        auto transport = std::make_shared<HttpTransport>(io_context, config.uploader.request_timeout);

        UploadEvents events;
        events.on_progress = [](std::uint64_t confirmed, std::uint64_t total)
        {
            const auto percent = total == 0 ? 100.0 : 100.0 * static_cast<double>(confirmed) / static_cast<double>(total);
            std::cout << "\rUploaded " << confirmed << " / " << total << " bytes (" << static_cast<int>(percent) << "%)"
                      << std::flush;
        };

        Uploader uploader(io_context, config.uploader, transport, store, std::move(events), logger);

        boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&uploader](const boost::system::error_code &ec, int signal)
                           {
            if (!ec)
            {
                spdlog::warn("Received signal {}, stopping upload", signal);
                uploader.cancel();
            } });

        resupload::client::UploadResult result;
        uploader.async_upload(std::move(payload), [&result, &signals](const UploadResult &outcome)
                              {
            result = outcome;
            boost::system::error_code ignored;
            signals.cancel(ignored); });
        io_context.run();

        std::cout << std::endl;
        if (!result.ok())
        {
            spdlog::error("Upload failed ({}): {}", resupload::to_string(result.error), result.message);
            if (!result.session_id.empty() && result.error != resupload::ErrorCode::InitFailed)
            {
                spdlog::info("Checkpoint kept for session {}; rerun the same command to resume", result.session_id);
            }
            return EXIT_FAILURE;
        }
        std::cout << result.session_id << std::endl;
    }
    catch (const resupload::UploadError &ex)
    {
        std::cerr << "Upload failed (" << resupload::to_string(ex.code()) << "): " << ex.what() << std::endl;
        return ex.code() == resupload::ErrorCode::InvalidConfig ? kExitUsage : EXIT_FAILURE;
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Upload failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

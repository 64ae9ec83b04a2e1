#include "resupload/client/logger.hpp"

#include <utility>

namespace resupload::client
{

    Logger::Logger() = default;

    Logger::Logger(std::shared_ptr<spdlog::logger> logger)
        : logger_(std::move(logger)) {}

} // namespace resupload::client

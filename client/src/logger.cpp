#include "scplink/client/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <vector>

namespace scplink::client
{

    std::shared_ptr<spdlog::logger> init_logging(const std::optional<std::filesystem::path> &log_path, bool verbose)
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        if (log_path)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path->string(), true));
        }
        auto logger = std::make_shared<spdlog::logger>("scplink", sinks.begin(), sinks.end());
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
        logger->flush_on(spdlog::level::warn);
        spdlog::set_default_logger(logger);
        return logger;
    }

} // namespace scplink::client

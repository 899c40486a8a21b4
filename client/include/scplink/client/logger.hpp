#pragma once

#include <filesystem>
#include <memory>
#include <optional>

#include <spdlog/logger.h>

namespace scplink::client
{

    /**
     * Builds the "scplink" logger (colored stderr, plus `log_path` when given) and installs
     * it as the spdlog default logger. `verbose` lowers the level to debug.
     */
    std::shared_ptr<spdlog::logger> init_logging(const std::optional<std::filesystem::path> &log_path, bool verbose);

} // namespace scplink::client

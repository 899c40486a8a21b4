#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "scplink/options.hpp"

namespace scplink::client
{

    // `[user@]host:path`; host may be empty in local mode (`:path`).
    struct RemoteEndpoint
    {
        std::optional<std::string> user;
        std::string host;
        std::string path;
    };

    enum class Mode : std::uint8_t
    {
        Download,
        Upload
    };

    struct ClientConfig
    {
        Mode mode{Mode::Download};
        RemoteEndpoint remote;
        // The non-remote operand: destination of a download, source of an upload.
        std::filesystem::path local_path;

        std::string ssh_program{"ssh"};
        std::optional<std::uint16_t> port;
        std::optional<std::filesystem::path> identity;
        std::vector<std::string> ssh_options;
        std::string remote_command{"scp"};
        bool local{false};

        bool verbose{false};
        bool progress{true};
        bool stop_on_error{false};
        bool preserve{false};

        std::optional<std::filesystem::path> log_path;
        std::optional<std::filesystem::path> manifest_path;

        bool show_help{false};
        bool show_version{false};
    };

    std::string usage(std::string_view program_name);

    /**
     * Parses `scplink [options] <source> <destination>`. Exactly one operand must be remote.
     * Values from `--config <file>` are applied first and overridden by the other flags.
     * Throws std::runtime_error on malformed input.
     */
    ClientConfig parse_arguments(int argc, char *argv[]);

    // Reads a JSON object of option values into `config`. Throws std::runtime_error.
    void apply_config_file(ClientConfig &config, const std::filesystem::path &path);

    // Returns std::nullopt when `operand` names a local path.
    std::optional<RemoteEndpoint> parse_endpoint(const std::string &operand);

    TransferOptions make_transfer_options(const ClientConfig &config);

} // namespace scplink::client

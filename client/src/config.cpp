#include "scplink/client/config.hpp"

#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace scplink::client
{

    namespace
    {

        std::string require_value(int &index, int argc, char *argv[], const std::string &flag)
        {
            if (index >= argc)
            {
                throw std::runtime_error(flag + " requires a value");
            }
            return argv[index++];
        }

        std::uint16_t parse_port(const std::string &text)
        {
            std::size_t consumed = 0;
            int value = 0;
            try
            {
                value = std::stoi(text, &consumed);
            }
            catch (const std::exception &)
            {
                throw std::runtime_error("Invalid port: " + text);
            }
            if (consumed != text.size() || value <= 0 || value > 65535)
            {
                throw std::runtime_error("Invalid port: " + text);
            }
            return static_cast<std::uint16_t>(value);
        }

    } // namespace

    std::string usage(std::string_view program_name)
    {
        std::string text = "Usage: ";
        text += program_name;
        text += " [options] <source> <destination>\n"
                "  Exactly one operand is remote: [user@]host:path (or :path with --local).\n"
                "Options:\n"
                "  --ssh <program>       ssh executable (default: ssh)\n"
                "  --port <port>         ssh port\n"
                "  -i, --identity <file> ssh identity file\n"
                "  -o <option>           extra ssh option, may be repeated\n"
                "  --scp <command>       remote scp command (default: scp)\n"
                "  --local               run the scp command locally through /bin/sh\n"
                "  -p, --preserve        preserve modification times and modes\n"
                "  --stop-on-error       abort an upload on the first unreadable entry\n"
                "  -v, --verbose         log every protocol event\n"
                "  --no-progress         do not print progress\n"
                "  --log <file>          also log to a file\n"
                "  --manifest <file>     write a JSON manifest of the transfer\n"
                "  --config <file>       read option defaults from a JSON file\n"
                "  -h, --help            show this help\n"
                "  --version             show the version\n";
        return text;
    }

    std::optional<RemoteEndpoint> parse_endpoint(const std::string &operand)
    {
        const auto colon = operand.find(':');
        if (colon == std::string::npos)
        {
            return std::nullopt;
        }
        const auto slash = operand.find('/');
        if (slash != std::string::npos && slash < colon)
        {
            return std::nullopt;
        }

        RemoteEndpoint endpoint;
        auto host = operand.substr(0, colon);
        const auto at = host.find('@');
        if (at != std::string::npos)
        {
            endpoint.user = host.substr(0, at);
            host = host.substr(at + 1);
        }
        endpoint.host = host;
        endpoint.path = operand.substr(colon + 1);
        if (endpoint.path.empty())
        {
            endpoint.path = ".";
        }
        return endpoint;
    }

    void apply_config_file(ClientConfig &config, const std::filesystem::path &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw std::runtime_error("Cannot open config file " + path.string());
        }
        nlohmann::json json;
        try
        {
            in >> json;
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw std::runtime_error("Invalid config file " + path.string() + ": " + ex.what());
        }
        if (!json.is_object())
        {
            throw std::runtime_error("Config file " + path.string() + " must contain a JSON object");
        }

        try
        {
            config.ssh_program = json.value("ssh", config.ssh_program);
            if (json.contains("port"))
            {
                config.port = json.at("port").get<std::uint16_t>();
            }
            if (json.contains("identity"))
            {
                config.identity = std::filesystem::path(json.at("identity").get<std::string>());
            }
            if (json.contains("ssh_options"))
            {
                config.ssh_options = json.at("ssh_options").get<std::vector<std::string>>();
            }
            config.remote_command = json.value("scp", config.remote_command);
            config.local = json.value("local", config.local);
            config.verbose = json.value("verbose", config.verbose);
            config.progress = json.value("progress", config.progress);
            config.stop_on_error = json.value("stop_on_error", config.stop_on_error);
            config.preserve = json.value("preserve", config.preserve);
            if (json.contains("log"))
            {
                config.log_path = std::filesystem::path(json.at("log").get<std::string>());
            }
            if (json.contains("manifest"))
            {
                config.manifest_path = std::filesystem::path(json.at("manifest").get<std::string>());
            }
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw std::runtime_error("Invalid value in config file " + path.string() + ": " + ex.what());
        }
    }

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        ClientConfig config;

        for (int i = 1; i + 1 < argc; ++i)
        {
            if (std::string(argv[i]) == "--config")
            {
                apply_config_file(config, argv[i + 1]);
            }
        }

        std::vector<std::string> operands;
        int index = 1;
        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "-h" || arg == "--help")
            {
                config.show_help = true;
            }
            else if (arg == "--version")
            {
                config.show_version = true;
            }
            else if (arg == "--config")
            {
                require_value(index, argc, argv, arg);
            }
            else if (arg == "--ssh")
            {
                config.ssh_program = require_value(index, argc, argv, arg);
            }
            else if (arg == "--port")
            {
                config.port = parse_port(require_value(index, argc, argv, arg));
            }
            else if (arg == "-i" || arg == "--identity")
            {
                config.identity = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "-o")
            {
                config.ssh_options.push_back(require_value(index, argc, argv, arg));
            }
            else if (arg == "--scp")
            {
                config.remote_command = require_value(index, argc, argv, arg);
            }
            else if (arg == "--local")
            {
                config.local = true;
            }
            else if (arg == "-p" || arg == "--preserve")
            {
                config.preserve = true;
            }
            else if (arg == "--stop-on-error")
            {
                config.stop_on_error = true;
            }
            else if (arg == "-v" || arg == "--verbose")
            {
                config.verbose = true;
            }
            else if (arg == "--no-progress")
            {
                config.progress = false;
            }
            else if (arg == "--log")
            {
                config.log_path = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--manifest")
            {
                config.manifest_path = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg.size() > 1 && arg.front() == '-')
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
            else
            {
                operands.push_back(arg);
            }
        }

        if (config.show_help || config.show_version)
        {
            return config;
        }
        if (operands.size() != 2)
        {
            throw std::runtime_error("Expected exactly two operands: <source> <destination>");
        }

        const auto source = parse_endpoint(operands[0]);
        const auto destination = parse_endpoint(operands[1]);
        if (source && destination)
        {
            throw std::runtime_error("Copying between two remote endpoints is not supported");
        }
        if (!source && !destination)
        {
            throw std::runtime_error("One operand must be remote: [user@]host:path");
        }

        if (source)
        {
            config.mode = Mode::Download;
            config.remote = *source;
            config.local_path = operands[1];
        }
        else
        {
            config.mode = Mode::Upload;
            config.remote = *destination;
            config.local_path = operands[0];
        }

        if (!config.local && config.remote.host.empty())
        {
            throw std::runtime_error("Remote endpoint needs a host unless --local is given");
        }
        return config;
    }

    TransferOptions make_transfer_options(const ClientConfig &config)
    {
        TransferOptions options;
        options.remote_command = config.remote_command;
        options.verbose = config.verbose;
        options.stop_on_walk_error = config.stop_on_error;
        options.preserve = config.preserve;
        return options;
    }

} // namespace scplink::client

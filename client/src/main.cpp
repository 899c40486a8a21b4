#include <asio.hpp>

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string_view>
#include <thread>

#include <spdlog/spdlog.h>

#include "scplink/client/config.hpp"
#include "scplink/client/logger.hpp"
#include "scplink/client/process_session.hpp"
#include "scplink/client/progress.hpp"
#include "scplink/manifest.hpp"
#include "scplink/transfer.hpp"
#include "scplink/version.hpp"

namespace
{

    scplink::client::LaunchSettings launch_settings(const scplink::client::ClientConfig &config)
    {
        return scplink::client::LaunchSettings{
            .local = config.local,
            .ssh_program = config.ssh_program,
            .port = config.port,
            .identity = config.identity,
            .ssh_options = config.ssh_options,
            .user = config.remote.user,
            .host = config.remote.host,
        };
    }

    int run(const scplink::client::ClientConfig &config)
    {
        using scplink::client::Mode;

        auto options = scplink::client::make_transfer_options(config);
        if (config.progress)
        {
            options.progress = std::make_shared<scplink::client::ConsoleProgress>(std::cerr);
        }
        options.on_event = [](std::string_view text)
        { spdlog::info("{}", text); };

        const auto settings = launch_settings(config);
        scplink::TransferClient client(
            [settings]()
            { return std::make_unique<scplink::client::ProcessSession>(settings); },
            std::move(options));

        asio::io_context signal_context;
        asio::signal_set signals(signal_context, SIGINT, SIGTERM);
        signals.async_wait([&client](const std::error_code &ec, int signal)
                           {
            if (!ec) {
                spdlog::warn("Signal {} received", signal);
                client.cancel();
            } });
        std::thread signal_thread([&signal_context]()
                                  { signal_context.run(); });

        if (config.mode == Mode::Download)
        {
            client.set_destination_path(config.local_path);
            client.download(config.remote.path);
        }
        else
        {
            client.set_destination_path(config.remote.path);
            client.upload(config.local_path);
        }

        signal_context.stop();
        signal_thread.join();

        for (const auto &error : client.error_stack())
        {
            std::cerr << "ERROR [" << scplink::to_string(error.code()) << "]: " << error.what() << std::endl;
        }

        if (config.manifest_path)
        {
            scplink::write_manifest(*config.manifest_path, client.report());
            spdlog::info("Manifest written to {}", config.manifest_path->string());
        }

        return client.last_error() ? EXIT_FAILURE : EXIT_SUCCESS;
    }

} // namespace

int main(int argc, char *argv[])
{
    try
    {
        const auto config = scplink::client::parse_arguments(argc, argv);
        if (config.show_help)
        {
            std::cout << scplink::client::usage(argv[0]);
            return EXIT_SUCCESS;
        }
        if (config.show_version)
        {
            std::cout << "scplink " << scplink::version() << "\n";
            return EXIT_SUCCESS;
        }

        std::signal(SIGPIPE, SIG_IGN);
        scplink::client::init_logging(config.log_path, config.verbose);
        return run(config);
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
}

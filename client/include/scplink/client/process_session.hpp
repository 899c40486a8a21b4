#pragma once

#include <asio.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

#include "scplink/transfer.hpp"

namespace scplink::client
{

    struct LaunchSettings
    {
        // Runs the command through /bin/sh instead of ssh.
        bool local{false};
        std::string ssh_program{"ssh"};
        std::optional<std::uint16_t> port;
        std::optional<std::filesystem::path> identity;
        std::vector<std::string> ssh_options;
        std::optional<std::string> user;
        std::string host;
    };

    /**
     * A child process with its stdin and stdout connected through pipes; stderr is inherited.
     * The stream ends are asio posix descriptors driven synchronously.
     */
    class ProcessSession : public RemoteSession
    {
    public:
        // Exit status of a child whose exec failed.
        static constexpr int kLaunchFailedStatus = 120;

        explicit ProcessSession(LaunchSettings settings);
        ~ProcessSession() override;

        ProcessSession(const ProcessSession &) = delete;
        ProcessSession &operator=(const ProcessSession &) = delete;

        void start(const std::string &command) override;
        OutputStream &input() override;
        InputStream &output() override;
        int wait() override;
        void close() override;

        // `ssh [-p port] [-i identity] [-o option]... [user@]host <command>` or `/bin/sh -c <command>`.
        static std::vector<std::string> command_line(const LaunchSettings &settings, const std::string &command);

    private:
        class PipeWriter;
        class PipeReader;

        void terminate() noexcept;

        LaunchSettings settings_;
        asio::io_context io_context_;
        std::unique_ptr<PipeWriter> stdin_;
        std::unique_ptr<PipeReader> stdout_;
        pid_t pid_{-1};
        std::optional<int> exit_status_;
    };

} // namespace scplink::client

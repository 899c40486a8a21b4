#include "scplink/client/process_session.hpp"

#include <cerrno>
#include <csignal>
#include <string>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include "scplink/error_codes.hpp"

namespace scplink::client
{

    namespace
    {

        [[noreturn]] void throw_system_error(const std::string &operation)
        {
            throw TransferError(ErrorCode::SessionError,
                                operation + " failed: " + std::error_code(errno, std::generic_category()).message());
        }

        struct PipePair
        {
            int read_end{-1};
            int write_end{-1};

            ~PipePair()
            {
                close_read();
                close_write();
            }

            void close_read() noexcept
            {
                if (read_end >= 0)
                {
                    ::close(read_end);
                    read_end = -1;
                }
            }

            void close_write() noexcept
            {
                if (write_end >= 0)
                {
                    ::close(write_end);
                    write_end = -1;
                }
            }

            int release_read() noexcept { return std::exchange(read_end, -1); }
            int release_write() noexcept { return std::exchange(write_end, -1); }
        };

        void open_pipe(PipePair &pipe)
        {
            int fds[2] = {};
            if (::pipe2(fds, O_CLOEXEC) != 0)
            {
                throw_system_error("pipe2");
            }
            pipe.read_end = fds[0];
            pipe.write_end = fds[1];
        }

    } // namespace

    class ProcessSession::PipeWriter : public OutputStream
    {
    public:
        PipeWriter(asio::io_context &io_context, int fd) : descriptor_(io_context, fd) {}

        void write(std::span<const std::byte> data) override
        {
            asio::error_code ec;
            asio::write(descriptor_, asio::buffer(data.data(), data.size()), ec);
            if (ec)
            {
                throw TransferError(ErrorCode::IoError, "Write to remote command failed: " + ec.message());
            }
        }

        void close() override
        {
            asio::error_code ec;
            descriptor_.close(ec);
        }

    private:
        asio::posix::stream_descriptor descriptor_;
    };

    class ProcessSession::PipeReader : public InputStream
    {
    public:
        PipeReader(asio::io_context &io_context, int fd) : descriptor_(io_context, fd) {}

        std::size_t read_some(std::span<std::byte> buffer) override
        {
            if (!descriptor_.is_open())
            {
                return 0;
            }
            asio::error_code ec;
            const auto count = descriptor_.read_some(asio::buffer(buffer.data(), buffer.size()), ec);
            if (ec == asio::error::eof)
            {
                return 0;
            }
            if (ec)
            {
                throw TransferError(ErrorCode::IoError, "Read from remote command failed: " + ec.message());
            }
            return count;
        }

        void close() override
        {
            asio::error_code ec;
            descriptor_.close(ec);
        }

    private:
        asio::posix::stream_descriptor descriptor_;
    };

    ProcessSession::ProcessSession(LaunchSettings settings) : settings_(std::move(settings)) {}

    ProcessSession::~ProcessSession()
    {
        terminate();
        close();
    }

    std::vector<std::string> ProcessSession::command_line(const LaunchSettings &settings, const std::string &command)
    {
        if (settings.local)
        {
            return {"/bin/sh", "-c", command};
        }

        std::vector<std::string> args{settings.ssh_program};
        if (settings.port)
        {
            args.push_back("-p");
            args.push_back(std::to_string(*settings.port));
        }
        if (settings.identity)
        {
            args.push_back("-i");
            args.push_back(settings.identity->string());
        }
        for (const auto &option : settings.ssh_options)
        {
            args.push_back("-o");
            args.push_back(option);
        }
        args.push_back(settings.user ? *settings.user + "@" + settings.host : settings.host);
        args.push_back(command);
        return args;
    }

    void ProcessSession::start(const std::string &command)
    {
        if (pid_ > 0)
        {
            throw TransferError(ErrorCode::SessionError, "Session already started");
        }

        const auto args = command_line(settings_, command);
        std::vector<const char *> argv;
        for (const auto &arg : args)
        {
            argv.push_back(arg.c_str());
        }
        argv.push_back(nullptr);

        PipePair to_child;
        PipePair from_child;
        open_pipe(to_child);
        open_pipe(from_child);

        spdlog::debug("Launching {}", args.front());
        const pid_t pid = ::fork();
        if (pid < 0)
        {
            throw_system_error("fork");
        }
        if (pid == 0)
        {
            // O_CLOEXEC is not carried over by dup2, so only the two duplicated ends survive exec.
            if (::dup2(to_child.read_end, STDIN_FILENO) == STDIN_FILENO &&
                ::dup2(from_child.write_end, STDOUT_FILENO) == STDOUT_FILENO)
            {
                ::execvp(argv[0], const_cast<char **>(argv.data()));
            }
            ::_exit(kLaunchFailedStatus);
        }

        pid_ = pid;
        to_child.close_read();
        from_child.close_write();
        stdin_ = std::make_unique<PipeWriter>(io_context_, to_child.release_write());
        stdout_ = std::make_unique<PipeReader>(io_context_, from_child.release_read());
    }

    OutputStream &ProcessSession::input()
    {
        if (!stdin_)
        {
            throw TransferError(ErrorCode::SessionError, "Session not started");
        }
        return *stdin_;
    }

    InputStream &ProcessSession::output()
    {
        if (!stdout_)
        {
            throw TransferError(ErrorCode::SessionError, "Session not started");
        }
        return *stdout_;
    }

    int ProcessSession::wait()
    {
        if (exit_status_)
        {
            return *exit_status_;
        }
        if (pid_ <= 0)
        {
            throw TransferError(ErrorCode::SessionError, "Session not started");
        }

        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0)
        {
            if (errno != EINTR)
            {
                throw_system_error("waitpid");
            }
        }

        if (WIFEXITED(status))
        {
            exit_status_ = WEXITSTATUS(status);
        }
        else if (WIFSIGNALED(status))
        {
            exit_status_ = 128 + WTERMSIG(status);
        }
        else
        {
            exit_status_ = -1;
        }
        if (*exit_status_ == kLaunchFailedStatus)
        {
            spdlog::warn("Remote command exited with status {}; it may not have been launched", kLaunchFailedStatus);
        }
        return *exit_status_;
    }

    void ProcessSession::close()
    {
        if (stdin_)
        {
            stdin_->close();
        }
        if (stdout_)
        {
            stdout_->close();
        }
    }

    void ProcessSession::terminate() noexcept
    {
        if (pid_ <= 0 || exit_status_)
        {
            return;
        }
        ::kill(pid_, SIGTERM);
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR)
        {
        }
        exit_status_ = -1;
    }

} // namespace scplink::client

#include "scplink/transfer.hpp"

#include <exception>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

#include "scplink/file_walker.hpp"
#include "scplink/sink.hpp"
#include "scplink/source.hpp"

namespace scplink
{

    namespace
    {

        void close_streams(RemoteSession &session, TransferState &state)
        {
            try
            {
                session.input().close();
                session.output().close();
            }
            catch (const TransferError &error)
            {
                state.errors.add(error);
            }
            catch (const std::exception &ex)
            {
                state.errors.add(TransferError(ErrorCode::SessionError, ex.what()));
            }
        }

    } // namespace

    std::string_view to_string(TransferDirection direction) noexcept
    {
        switch (direction)
        {
        case TransferDirection::Download:
            return "download";
        case TransferDirection::Upload:
            return "upload";
        }
        return "unknown";
    }

    std::string quote_argument(const std::string &text)
    {
        std::string quoted;
        quoted.reserve(text.size() + 2);
        quoted.push_back('"');
        for (const char ch : text)
        {
            if (ch == '\\' || ch == '"')
            {
                quoted.push_back('\\');
            }
            quoted.push_back(ch);
        }
        quoted.push_back('"');
        return quoted;
    }

    std::string build_remote_command(const TransferOptions &options, TransferDirection direction,
                                     const std::string &remote_path)
    {
        std::string command = options.remote_command;
        if (options.preserve)
        {
            command += " -p";
        }
        command += direction == TransferDirection::Download ? " -rf " : " -rt ";
        command += quote_argument(remote_path);
        return command;
    }

    TransferClient::TransferClient(SessionFactory factory, TransferOptions options)
        : factory_(std::move(factory)), options_(std::move(options)) {}

    void TransferClient::set_destination_path(std::filesystem::path path)
    {
        destination_ = std::move(path);
    }

    void TransferClient::download(const std::string &remote_path)
    {
        TransferState state;
        state.path.replace({destination_.string()});
        run_transfer(TransferDirection::Download, remote_path, destination_.string(), remote_path, std::move(state),
                     [this](LineReader &reader, OutputStream &writer, TransferState &engine_state)
                     {
                         SinkEngine sink(reader, writer, engine_state, options_);
                         sink.run();
                     });
    }

    void TransferClient::upload(const std::filesystem::path &local_path)
    {
        const auto root = normalize_walk_root(local_path);
        const auto remote = destination_.generic_string();
        run_transfer(TransferDirection::Upload, root.string(), remote, remote, TransferState{},
                     [this, root](LineReader &reader, OutputStream &writer, TransferState &engine_state)
                     {
                         SourceEngine source(reader, writer, engine_state, options_);
                         source.run(root);
                     });
    }

    void TransferClient::cancel()
    {
        std::lock_guard lock(cancel_mutex_);
        if (!active_)
        {
            return;
        }
        if (token_.cancel())
        {
            spdlog::info("Cancelling transfer");
        }
    }

    std::optional<TransferError> TransferClient::last_error() const
    {
        if (report_.errors.empty())
        {
            return std::nullopt;
        }
        return report_.errors.back();
    }

    template <typename Engine>
    void TransferClient::run_transfer(TransferDirection direction, const std::string &source,
                                      const std::string &destination, const std::string &remote_path,
                                      TransferState state, Engine engine)
    {
        report_ = TransferReport{
            .direction = direction,
            .source = source,
            .destination = destination,
        };
        const auto command = build_remote_command(options_, direction, remote_path);
        spdlog::debug("Starting {}: {}", to_string(direction), command);

        std::unique_ptr<RemoteSession> session;
        try
        {
            session = factory_();
            if (!session)
            {
                throw TransferError(ErrorCode::SessionError, "Session factory returned no session");
            }
            session->start(command);
        }
        catch (const TransferError &error)
        {
            state.errors.add(error);
        }
        catch (const std::exception &ex)
        {
            state.errors.add(TransferError(ErrorCode::SessionError, ex.what()));
        }

        if (state.errors.empty())
        {
            {
                std::lock_guard lock(cancel_mutex_);
                token_.reset();
                active_ = true;
            }
            std::thread worker([&]()
                               {
                                   try
                                   {
                                       CancellableReader cancellable(session->output(), token_);
                                       LineReader reader(cancellable);
                                       engine(reader, session->input(), state);
                                   }
                                   catch (const TransferError &error)
                                   {
                                       state.errors.add(error);
                                   }
                                   catch (const std::exception &ex)
                                   {
                                       state.errors.add(TransferError(ErrorCode::IoError, ex.what()));
                                   }
                                   close_streams(*session, state); });

            std::optional<TransferError> wait_error;
            int status = 0;
            try
            {
                status = session->wait();
            }
            catch (const TransferError &error)
            {
                wait_error = error;
            }
            catch (const std::exception &ex)
            {
                wait_error = TransferError(ErrorCode::SessionError, ex.what());
            }
            worker.join();
            {
                std::lock_guard lock(cancel_mutex_);
                active_ = false;
            }

            if (wait_error)
            {
                state.errors.add(*wait_error);
            }
            else if (status != 0)
            {
                state.errors.add(TransferError(ErrorCode::SessionError,
                                               "Remote command exited with status " + std::to_string(status)));
            }

            try
            {
                session->close();
            }
            catch (const std::exception &ex)
            {
                spdlog::debug("Closing session failed: {}", ex.what());
            }
        }

        report_.errors = state.errors.all();
        report_.files = std::move(state.files);

        if (report_.errors.empty())
        {
            spdlog::info("{} finished: {} file(s) from {} to {}", to_string(direction), report_.files.size(), source,
                         destination);
        }
        else
        {
            spdlog::warn("{} finished with {} error(s), last: {}", to_string(direction), report_.errors.size(),
                         report_.errors.back().what());
        }
    }

} // namespace scplink

#include "scplink/sink.hpp"

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>
#include <variant>

#include <fcntl.h>
#include <sys/stat.h>

#include <spdlog/spdlog.h>

#include "engine_common.hpp"
#include "scplink/crypto.hpp"
#include "scplink/error_codes.hpp"

namespace scplink
{

    namespace
    {

        void validate_name(const std::string &name)
        {
            if (name.empty() || name == "." || name == ".." || name.find('/') != std::string::npos)
            {
                throw TransferError(ErrorCode::ProtocolViolation, "Refusing unsafe name in protocol message: " + name);
            }
        }

        void set_times(const std::filesystem::path &target, const protocol::Timestamp &times)
        {
            struct timespec values[2]{};
            values[0].tv_sec = static_cast<time_t>(times.atime);
            values[1].tv_sec = static_cast<time_t>(times.mtime);
            if (::utimensat(AT_FDCWD, target.c_str(), values, 0) != 0)
            {
                throw TransferError(ErrorCode::IoError, "Failed to set times on " + target.string() + ": " +
                                                            std::error_code(errno, std::generic_category()).message());
            }
        }

    } // namespace

    SinkEngine::SinkEngine(LineReader &reader, OutputStream &writer, TransferState &state,
                           const TransferOptions &options)
        : reader_(reader), writer_(writer), state_(state), options_(options) {}

    void SinkEngine::run()
    {
        try
        {
            send_ack();
            for (;;)
            {
                event("Reading message from source");
                const auto line = reader_.read_line();
                if (!line)
                {
                    event("Source closed the stream");
                    return;
                }
                event("Received: " + protocol::strip_message(*line));

                send_ack();
                apply(protocol::decode(*line));
                send_ack();
            }
        }
        catch (const TransferError &error)
        {
            state_.errors.add(error);
        }
        catch (const std::exception &ex)
        {
            state_.errors.add(TransferError(ErrorCode::IoError, ex.what()));
        }
    }

    void SinkEngine::apply(const protocol::Message &message)
    {
        std::visit([this](const auto &concrete)
                   { handle(concrete); },
                   message);
    }

    void SinkEngine::handle(const protocol::FileCopy &file)
    {
        validate_name(file.name);
        const auto target = state_.path.current() / file.name;
        const auto times = std::exchange(state_.pending_times, std::nullopt);

        receive_body(file, target);
        apply_metadata(target, file.mode, times);
    }

    void SinkEngine::handle(const protocol::DirCopy &dir)
    {
        validate_name(dir.name);
        const auto target = state_.path.current() / dir.name;

        std::error_code ec;
        if (!std::filesystem::create_directory(target, ec))
        {
            throw TransferError(ErrorCode::IoError,
                                ec ? "Failed to create directory " + target.string() + ": " + ec.message()
                                   : "Directory already exists: " + target.string());
        }
        event("Created directory " + target.string());

        open_directories_.push_back(OpenDirectory{
            .path = target,
            .mode = dir.mode,
            .times = std::exchange(state_.pending_times, std::nullopt),
        });
        state_.path.push(dir.name);
    }

    void SinkEngine::handle(const protocol::EndOfDirectory &)
    {
        if (state_.path.depth() <= 1 || open_directories_.empty())
        {
            throw TransferError(ErrorCode::ProtocolViolation, "End of directory without a matching directory");
        }
        const auto closed = std::move(open_directories_.back());
        open_directories_.pop_back();
        state_.path.pop();
        apply_metadata(closed.path, closed.mode, closed.times);
    }

    void SinkEngine::handle(const protocol::Timestamp &times)
    {
        state_.pending_times = times;
    }

    void SinkEngine::handle(const protocol::Ack &)
    {
        throw TransferError(ErrorCode::ProtocolViolation, "Unexpected acknowledgement in place of a message");
    }

    void SinkEngine::handle(const protocol::Warning &warning)
    {
        throw TransferError(ErrorCode::RemoteWarning, "Warning message: [" + warning.text + "]");
    }

    void SinkEngine::handle(const protocol::Error &error)
    {
        throw TransferError(ErrorCode::RemoteError, "Error message: [" + error.text + "]");
    }

    void SinkEngine::receive_body(const protocol::FileCopy &file, const std::filesystem::path &target)
    {
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            throw TransferError(ErrorCode::IoError, "Failed to create file " + target.string());
        }
        event("Receiving " + std::to_string(file.length) + " bytes into " + target.string());

        crypto::ContentHasher hasher;
        std::vector<std::byte> buffer(engine_common::kCopyBufferSize);
        std::uint64_t received = 0;
        try
        {
            engine_common::ProgressScope progress(options_, file.name, file.length);
            while (received < file.length)
            {
                const auto wanted = static_cast<std::size_t>(
                    std::min<std::uint64_t>(file.length - received, buffer.size()));
                const auto count = reader_.read_some(std::span<std::byte>(buffer.data(), wanted));
                if (count == 0)
                {
                    throw TransferError(ErrorCode::IoError, "Unexpected end of stream after " + std::to_string(received) +
                                                                " of " + std::to_string(file.length) + " bytes of " +
                                                                file.name);
                }
                out.write(reinterpret_cast<const char *>(buffer.data()), static_cast<std::streamsize>(count));
                if (!out)
                {
                    throw TransferError(ErrorCode::IoError, "Failed to write " + target.string());
                }
                const std::span<const std::byte> chunk(buffer.data(), count);
                hasher.update(chunk);
                progress.advance(count);
                received += count;
            }
            out.close();
            if (!out)
            {
                throw TransferError(ErrorCode::IoError, "Failed to close " + target.string());
            }
        }
        catch (const TransferError &error)
        {
            if (error.code() != ErrorCode::Cancelled)
            {
                engine_common::report_failure(writer_, error.what());
            }
            throw;
        }

        state_.files.push_back(FileRecord{
            .path = engine_common::relative_path(state_.path.segments(), 1, file.name),
            .size = received,
            .content_hash = hasher.finish(),
        });
    }

    void SinkEngine::apply_metadata(const std::filesystem::path &target, std::uint32_t mode,
                                    const std::optional<protocol::Timestamp> &times) const
    {
        if (!options_.preserve)
        {
            return;
        }
        std::error_code ec;
        std::filesystem::permissions(target, static_cast<std::filesystem::perms>(mode & 07777), ec);
        if (ec)
        {
            throw TransferError(ErrorCode::IoError, "Failed to set permissions on " + target.string() + ": " +
                                                        ec.message());
        }
        if (times)
        {
            set_times(target, *times);
        }
    }

    void SinkEngine::send_ack()
    {
        if (peer_gone_)
        {
            return;
        }
        try
        {
            engine_common::send_message(writer_, protocol::Ack{});
        }
        catch (const std::exception &ex)
        {
            // The source may exit once it has every response it waits for; keep draining its output.
            peer_gone_ = true;
            spdlog::debug("Acknowledgement not delivered, reading on: {}", ex.what());
        }
    }

    void SinkEngine::event(std::string_view text) const
    {
        engine_common::emit_event(options_, text);
    }

} // namespace scplink

#include "scplink/source.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "engine_common.hpp"
#include "scplink/crypto.hpp"
#include "scplink/error_codes.hpp"

namespace scplink
{

    namespace
    {

        std::string hex_byte(std::byte value)
        {
            std::array<char, 5> text{};
            std::snprintf(text.data(), text.size(), "0x%02x", static_cast<unsigned>(value));
            return text.data();
        }

    } // namespace

    SourceEngine::SourceEngine(LineReader &reader, OutputStream &writer, TransferState &state,
                               const TransferOptions &options)
        : reader_(reader), writer_(writer), state_(state), options_(options) {}

    void SourceEngine::run(const std::filesystem::path &local_path)
    {
        try
        {
            event("Waiting for sink to get ready");
            await_response();
            state_.path.replace({});
            walk_tree(local_path, [this](const WalkEntry &entry)
                      {
                          send_entry(entry);
                          return true; });
            finish();
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

    void SourceEngine::send_entry(const WalkEntry &entry)
    {
        if (entry.error)
        {
            skip_or_fail(*entry.error);
            return;
        }
        if (entry.is_directory)
        {
            send_directory(entry);
            return;
        }

        std::ifstream input(entry.path, std::ios::binary);
        if (!input.is_open())
        {
            skip_or_fail(TransferError(ErrorCode::WalkError, entry.path.string() + ": cannot open for reading"));
            return;
        }
        send_file(entry, input);
    }

    void SourceEngine::finish()
    {
        close_directories(0);
    }

    void SourceEngine::await_response()
    {
        std::array<std::byte, 1> response{};
        if (reader_.read_some(response) == 0)
        {
            throw TransferError(ErrorCode::IoError, "Sink closed the stream while a response was expected");
        }

        switch (static_cast<protocol::ControlByte>(response[0]))
        {
        case protocol::ControlByte::Ack:
            return;
        case protocol::ControlByte::Warning:
        case protocol::ControlByte::Error:
        {
            const auto line = reader_.read_line();
            const auto text = line ? protocol::strip_message(*line) : std::string{};
            if (static_cast<protocol::ControlByte>(response[0]) == protocol::ControlByte::Warning)
            {
                throw TransferError(ErrorCode::RemoteWarning, "Warning message: [" + text + "]");
            }
            throw TransferError(ErrorCode::RemoteError, "Error message: [" + text + "]");
        }
        }
        throw TransferError(ErrorCode::ProtocolViolation, "Unexpected response byte " + hex_byte(response[0]));
    }

    void SourceEngine::send_directory(const WalkEntry &entry)
    {
        close_directories(entry.segments.size() - 1);
        if (options_.preserve)
        {
            send_line(protocol::Timestamp{.mtime = entry.modified_time, .atime = entry.access_time});
        }
        state_.path.replace(entry.segments);
        send_line(protocol::DirCopy{
            .mode = options_.preserve ? entry.mode : protocol::kDefaultMode,
            .length = 0,
            .name = entry.segments.back(),
        });
    }

    void SourceEngine::send_file(const WalkEntry &entry, std::ifstream &input)
    {
        const auto &name = entry.segments.back();
        close_directories(entry.segments.size() - 1);
        if (options_.preserve)
        {
            send_line(protocol::Timestamp{.mtime = entry.modified_time, .atime = entry.access_time});
        }
        send_line(protocol::FileCopy{
            .mode = options_.preserve ? entry.mode : protocol::kDefaultMode,
            .length = entry.size,
            .name = name,
        });

        crypto::ContentHasher hasher;
        if (entry.size > 0)
        {
            event("Sending file: " + entry.path.string());
            engine_common::ProgressScope progress(options_, name, entry.size);
            std::vector<std::byte> buffer(engine_common::kCopyBufferSize);
            std::uint64_t remaining = entry.size;
            while (remaining > 0)
            {
                const auto wanted = static_cast<std::streamsize>(std::min<std::uint64_t>(remaining, buffer.size()));
                input.read(reinterpret_cast<char *>(buffer.data()), wanted);
                const auto count = static_cast<std::size_t>(input.gcount());
                if (count == 0)
                {
                    const auto reason = entry.path.string() + ": file shrank while it was being sent";
                    engine_common::report_failure(writer_, reason);
                    throw TransferError(ErrorCode::IoError, reason);
                }
                const std::span<const std::byte> chunk(buffer.data(), count);
                try
                {
                    writer_.write(chunk);
                }
                catch (const TransferError &error)
                {
                    engine_common::report_failure(writer_, error.what());
                    throw;
                }
                hasher.update(chunk);
                progress.advance(count);
                remaining -= count;
            }
        }
        else
        {
            event("Sending empty file: " + entry.path.string());
        }

        engine_common::send_message(writer_, protocol::Ack{});
        await_response();

        state_.files.push_back(FileRecord{
            .path = engine_common::relative_path({entry.segments.begin(), entry.segments.end() - 1}, 0, name),
            .size = entry.size,
            .content_hash = hasher.finish(),
        });
    }

    void SourceEngine::skip_or_fail(const TransferError &error)
    {
        event(std::string("Item error: ") + error.what());
        if (options_.stop_on_walk_error)
        {
            throw TransferError(ErrorCode::WalkError, error.what());
        }
        spdlog::warn("Skipping {}", error.what());
    }

    void SourceEngine::close_directories(std::size_t target_depth)
    {
        while (state_.path.depth() > target_depth)
        {
            send_line(protocol::EndOfDirectory{});
            state_.path.pop();
        }
    }

    void SourceEngine::send_line(const protocol::Message &message)
    {
        engine_common::send_message(writer_, message);
        event("Sent: " + protocol::describe(message));
        await_response();
    }

    void SourceEngine::event(std::string_view text) const
    {
        engine_common::emit_event(options_, text);
    }

} // namespace scplink

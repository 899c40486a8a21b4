/**
 * scplink - Byte stream interfaces bound to the remote command and a buffered line reader.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace scplink
{

    class InputStream
    {
    public:
        virtual ~InputStream() = default;

        // Returns the number of bytes read, 0 at end of stream. Throws TransferError on failure.
        virtual std::size_t read_some(std::span<std::byte> buffer) = 0;

        virtual void close() = 0;
    };

    class OutputStream
    {
    public:
        virtual ~OutputStream() = default;

        // Writes every byte or throws TransferError(IoError).
        virtual void write(std::span<const std::byte> data) = 0;

        virtual void close() = 0;
    };

    void write_text(OutputStream &stream, std::string_view text);

    class LineReader
    {
    public:
        static constexpr std::size_t kDefaultBufferSize = 32 * 1024;
        static constexpr std::size_t kMaxLineLength = 64 * 1024;

        explicit LineReader(InputStream &source, std::size_t buffer_size = kDefaultBufferSize);

        /**
         * Reads up to and including the next '\n'. Returns std::nullopt at end of stream,
         * including when the stream ends in the middle of an unterminated line.
         */
        std::optional<std::string> read_line();

        // Serves buffered bytes first, then reads from the source. Returns 0 at end of stream.
        std::size_t read_some(std::span<std::byte> buffer);

    private:
        bool fill();

        InputStream &source_;
        std::vector<std::byte> buffer_;
        std::size_t begin_{0};
        std::size_t end_{0};
    };

} // namespace scplink

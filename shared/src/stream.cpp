#include "scplink/stream.hpp"

#include <algorithm>
#include <cstring>

#include "scplink/error_codes.hpp"

namespace scplink
{

    void write_text(OutputStream &stream, std::string_view text)
    {
        stream.write(std::as_bytes(std::span(text.data(), text.size())));
    }

    LineReader::LineReader(InputStream &source, std::size_t buffer_size)
        : source_(source), buffer_(buffer_size == 0 ? kDefaultBufferSize : buffer_size) {}

    std::optional<std::string> LineReader::read_line()
    {
        std::string line;
        for (;;)
        {
            if (begin_ == end_ && !fill())
            {
                return std::nullopt;
            }
            const auto *first = buffer_.data() + begin_;
            const auto *last = buffer_.data() + end_;
            const auto *newline = std::find(first, last, static_cast<std::byte>('\n'));
            const auto *stop = newline == last ? last : newline + 1;
            line.append(reinterpret_cast<const char *>(first), static_cast<std::size_t>(stop - first));
            begin_ += static_cast<std::size_t>(stop - first);
            if (newline != last)
            {
                return line;
            }
            if (line.size() > kMaxLineLength)
            {
                throw TransferError(ErrorCode::ProtocolViolation,
                                    "Protocol line exceeds " + std::to_string(kMaxLineLength) + " bytes");
            }
        }
    }

    std::size_t LineReader::read_some(std::span<std::byte> buffer)
    {
        if (buffer.empty())
        {
            return 0;
        }
        if (begin_ == end_)
        {
            if (buffer.size() >= buffer_.size())
            {
                return source_.read_some(buffer);
            }
            if (!fill())
            {
                return 0;
            }
        }
        const auto count = std::min(buffer.size(), end_ - begin_);
        std::memcpy(buffer.data(), buffer_.data() + begin_, count);
        begin_ += count;
        return count;
    }

    bool LineReader::fill()
    {
        begin_ = 0;
        end_ = source_.read_some(buffer_);
        return end_ > 0;
    }

} // namespace scplink

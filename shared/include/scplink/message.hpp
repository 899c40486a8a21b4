/**
 * scplink - scp wire messages: the textual shapes and the control bytes.
 */
#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>

namespace scplink::protocol
{

    // Permission bits sent when metadata is not preserved.
    constexpr std::uint32_t kDefaultMode = 0644;

    enum class ControlByte : std::uint8_t
    {
        Ack = 0x00,
        Warning = 0x01,
        Error = 0x02
    };

    enum class MessageShape : std::uint8_t
    {
        FileCopy,
        DirCopy,
        EndOfDirectory,
        Timestamp
    };

    struct FileCopy
    {
        std::uint32_t mode{kDefaultMode};
        std::uint64_t length{};
        std::string name;

        bool operator==(const FileCopy &) const = default;
    };

    struct DirCopy
    {
        std::uint32_t mode{kDefaultMode};
        std::uint64_t length{};
        std::string name;

        bool operator==(const DirCopy &) const = default;
    };

    struct EndOfDirectory
    {
        bool operator==(const EndOfDirectory &) const = default;
    };

    struct Timestamp
    {
        std::uint64_t mtime{};
        std::uint64_t atime{};

        bool operator==(const Timestamp &) const = default;
    };

    struct Ack
    {
        bool operator==(const Ack &) const = default;
    };

    struct Warning
    {
        std::string text;

        bool operator==(const Warning &) const = default;
    };

    struct Error
    {
        std::string text;

        bool operator==(const Error &) const = default;
    };

    using Message = std::variant<FileCopy, DirCopy, EndOfDirectory, Timestamp, Ack, Warning, Error>;

    // Named fields of a textual message, e.g. {"mode", "0644"}, {"length", "25"}, {"filename", "a.txt"}.
    using MessageFields = std::map<std::string, std::string>;

    /**
     * Matches `line` against one textual shape. Throws TransferError(ProtocolViolation) with
     * "Could not parse protocol message: <line>" when it does not match.
     */
    MessageFields parse_fields(std::string_view line, MessageShape shape);

    /**
     * Decodes one line read from the peer. A trailing newline and surrounding NUL/whitespace
     * bytes are stripped first; a line made only of NUL bytes decodes to Ack.
     */
    Message decode(std::string_view line);

    std::string encode(const Message &message);

    // Short label for logs ("C0644 11 hello.txt", "E", "<ack>", ...).
    std::string describe(const Message &message);

    std::string strip_message(std::string_view line);

} // namespace scplink::protocol

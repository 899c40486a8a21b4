/**
 * scplink - State owned by the engine thread for the duration of one transfer.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "scplink/directory_stack.hpp"
#include "scplink/error_codes.hpp"
#include "scplink/message.hpp"

namespace scplink
{

    struct FileRecord
    {
        std::string path;
        std::uint64_t size{};
        std::string content_hash;
    };

    struct TransferState
    {
        ErrorStack errors;
        DirectoryStack path;
        std::vector<FileRecord> files;
        std::optional<protocol::Timestamp> pending_times{};
    };

    enum class TransferDirection : std::uint8_t
    {
        Download,
        Upload
    };

    std::string_view to_string(TransferDirection direction) noexcept;

    // What remains of a TransferState once the transfer call has returned.
    struct TransferReport
    {
        TransferDirection direction{TransferDirection::Download};
        std::string source;
        std::string destination;
        std::vector<TransferError> errors;
        std::vector<FileRecord> files;
    };

} // namespace scplink

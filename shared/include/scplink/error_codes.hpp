/**
 * scplink - Error codes and the exception type shared by every transfer layer.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace scplink
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        SessionError = 1,
        ProtocolViolation = 2,
        IoError = 3,
        Cancelled = 4,
        WalkError = 5,
        RemoteWarning = 6,
        RemoteError = 7
    };

    std::string_view to_string(ErrorCode code) noexcept;

    class TransferError : public std::runtime_error
    {
    public:
        TransferError(ErrorCode code, std::string message);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

    // Append-only, chronological list of the errors recorded by one transfer.
    class ErrorStack
    {
    public:
        void add(TransferError error);

        bool empty() const noexcept { return errors_.empty(); }
        std::size_t size() const noexcept { return errors_.size(); }

        std::optional<TransferError> last() const;
        const std::vector<TransferError> &all() const noexcept { return errors_; }

    private:
        std::vector<TransferError> errors_;
    };

} // namespace scplink

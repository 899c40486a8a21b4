#include "scplink/error_codes.hpp"

#include <array>
#include <utility>

namespace scplink
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 8> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::SessionError, "session_error"},
            {ErrorCode::ProtocolViolation, "protocol_violation"},
            {ErrorCode::IoError, "io_error"},
            {ErrorCode::Cancelled, "cancelled"},
            {ErrorCode::WalkError, "walk_error"},
            {ErrorCode::RemoteWarning, "remote_warning"},
            {ErrorCode::RemoteError, "remote_error"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    TransferError::TransferError(ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    void ErrorStack::add(TransferError error)
    {
        errors_.push_back(std::move(error));
    }

    std::optional<TransferError> ErrorStack::last() const
    {
        if (errors_.empty())
        {
            return std::nullopt;
        }
        return errors_.back();
    }

} // namespace scplink

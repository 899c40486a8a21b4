#include "scplink/cancellation.hpp"

#include "scplink/error_codes.hpp"

namespace scplink
{

    bool CancellationToken::cancel() noexcept
    {
        return !cancelled_.exchange(true, std::memory_order_acq_rel);
    }

    bool CancellationToken::cancelled() const noexcept
    {
        return cancelled_.load(std::memory_order_acquire);
    }

    void CancellationToken::reset() noexcept
    {
        cancelled_.store(false, std::memory_order_release);
    }

    CancellableReader::CancellableReader(InputStream &source, const CancellationToken &token)
        : source_(source), token_(token) {}

    std::size_t CancellableReader::read_some(std::span<std::byte> buffer)
    {
        if (token_.cancelled())
        {
            throw TransferError(ErrorCode::Cancelled, "Transfer cancelled");
        }
        return source_.read_some(buffer);
    }

    void CancellableReader::close()
    {
        source_.close();
    }

} // namespace scplink

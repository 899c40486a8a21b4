/**
 * scplink - Cooperative cancellation of the inbound byte stream.
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <span>

#include "scplink/stream.hpp"

namespace scplink
{

    class CancellationToken
    {
    public:
        // Returns true only for the call that raised the signal.
        bool cancel() noexcept;

        bool cancelled() const noexcept;

        void reset() noexcept;

    private:
        std::atomic<bool> cancelled_{false};
    };

    /**
     * Checks the token before every physical read of the wrapped stream, so a cancelled
     * transfer fails at its next read instead of blocking. A read already waiting inside
     * the wrapped stream is not interrupted.
     */
    class CancellableReader : public InputStream
    {
    public:
        CancellableReader(InputStream &source, const CancellationToken &token);

        std::size_t read_some(std::span<std::byte> buffer) override;

        void close() override;

    private:
        InputStream &source_;
        const CancellationToken &token_;
    };

} // namespace scplink

/**
 * scplink - Immutable configuration handed to a transfer client and its engines.
 */
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace scplink
{

    // Side-channel observer of file body bytes; never affects the protocol.
    class ProgressObserver
    {
    public:
        virtual ~ProgressObserver() = default;

        virtual void begin(const std::string &name, std::uint64_t total_bytes) = 0;
        virtual void advance(std::uint64_t bytes) = 0;
        virtual void finish() = 0;
    };

    using EventCallback = std::function<void(std::string_view)>;

    struct TransferOptions
    {
        std::string remote_command{"scp"};
        bool verbose{false};
        // Abort the upload on the first entry the walker cannot read.
        bool stop_on_walk_error{false};
        // Send and apply modification times and real permission bits (scp -p).
        bool preserve{false};
        std::shared_ptr<ProgressObserver> progress{};
        EventCallback on_event{};
    };

} // namespace scplink

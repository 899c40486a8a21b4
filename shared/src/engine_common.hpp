#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "scplink/message.hpp"
#include "scplink/options.hpp"
#include "scplink/stream.hpp"

namespace scplink::engine_common
{

    constexpr std::size_t kCopyBufferSize = 32 * 1024;

    void send_message(OutputStream &stream, const protocol::Message &message);

    void emit_event(const TransferOptions &options, std::string_view text);

    // Tells the peer a transfer failed; a failure to deliver is only logged.
    void report_failure(OutputStream &stream, const std::string &text) noexcept;

    std::string relative_path(const std::vector<std::string> &segments, std::size_t skip, const std::string &leaf);

    class ProgressScope
    {
    public:
        ProgressScope(const TransferOptions &options, const std::string &name, std::uint64_t total_bytes);
        ~ProgressScope();

        ProgressScope(const ProgressScope &) = delete;
        ProgressScope &operator=(const ProgressScope &) = delete;

        void advance(std::uint64_t bytes);

    private:
        ProgressObserver *observer_;
    };

} // namespace scplink::engine_common

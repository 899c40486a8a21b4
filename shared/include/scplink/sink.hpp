/**
 * scplink - Receiving half of the scp protocol (the local side of `scp -f`).
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

#include "scplink/message.hpp"
#include "scplink/options.hpp"
#include "scplink/stream.hpp"
#include "scplink/transfer_state.hpp"

namespace scplink
{

    /**
     * Reads framed messages from the peer and recreates files and directories under
     * `state.path`, which must hold the destination root when run() starts. Every line is
     * acknowledged once on receipt and once after it has been acted on. Acknowledgements the
     * peer no longer accepts are dropped; only end of stream or a failed message ends the run.
     */
    class SinkEngine
    {
    public:
        SinkEngine(LineReader &reader, OutputStream &writer, TransferState &state, const TransferOptions &options);

        // Runs until end of stream or the first terminal error, which is recorded in the state.
        void run();

        // Acts on one decoded message. Throws TransferError on a terminal condition.
        void apply(const protocol::Message &message);

    private:
        void handle(const protocol::FileCopy &file);
        void handle(const protocol::DirCopy &dir);
        void handle(const protocol::EndOfDirectory &end);
        void handle(const protocol::Timestamp &times);
        void handle(const protocol::Ack &ack);
        void handle(const protocol::Warning &warning);
        void handle(const protocol::Error &error);

        void receive_body(const protocol::FileCopy &file, const std::filesystem::path &target);
        void apply_metadata(const std::filesystem::path &target, std::uint32_t mode,
                            const std::optional<protocol::Timestamp> &times) const;
        void send_ack();
        void event(std::string_view text) const;

        LineReader &reader_;
        OutputStream &writer_;
        TransferState &state_;
        const TransferOptions &options_;

        struct OpenDirectory
        {
            std::filesystem::path path;
            std::uint32_t mode{};
            std::optional<protocol::Timestamp> times;
        };

        // Metadata of every directory created and not yet closed, applied on EndOfDirectory.
        std::vector<OpenDirectory> open_directories_;
        bool peer_gone_{false};
    };

} // namespace scplink

/**
 * scplink - Sending half of the scp protocol (the local side of `scp -t`).
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <string_view>

#include "scplink/file_walker.hpp"
#include "scplink/message.hpp"
#include "scplink/options.hpp"
#include "scplink/stream.hpp"
#include "scplink/transfer_state.hpp"

namespace scplink
{

    /**
     * Turns walked entries into framed messages and file bodies. `state.path` tracks the
     * directories opened on the peer as path segments relative to the walk root's parent.
     * Every message waits for the peer's one-byte response before the next one is sent.
     */
    class SourceEngine
    {
    public:
        SourceEngine(LineReader &reader, OutputStream &writer, TransferState &state, const TransferOptions &options);

        // Waits for the peer to get ready, sends `local_path` recursively and closes every open directory.
        void run(const std::filesystem::path &local_path);

        // Sends one walked entry. Throws TransferError on a terminal condition.
        void send_entry(const WalkEntry &entry);

        // Emits one EndOfDirectory per directory still open.
        void finish();

        void await_response();

    private:
        void send_directory(const WalkEntry &entry);
        void send_file(const WalkEntry &entry, std::ifstream &input);
        void skip_or_fail(const TransferError &error);
        void close_directories(std::size_t target_depth);
        void send_line(const protocol::Message &message);
        void event(std::string_view text) const;

        LineReader &reader_;
        OutputStream &writer_;
        TransferState &state_;
        const TransferOptions &options_;
    };

} // namespace scplink

/**
 * scplink - Remote session interface and the client that runs one transfer per call over it.
 */
#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "scplink/cancellation.hpp"
#include "scplink/error_codes.hpp"
#include "scplink/options.hpp"
#include "scplink/stream.hpp"
#include "scplink/transfer_state.hpp"

namespace scplink
{

    /**
     * A remote command with its stdin and stdout exposed as byte streams. start() is called
     * once; wait() blocks until the command has exited and returns its exit status.
     */
    class RemoteSession
    {
    public:
        virtual ~RemoteSession() = default;

        // Throws TransferError(SessionError) when the command cannot be started.
        virtual void start(const std::string &command) = 0;

        // Bound to the remote command's stdin.
        virtual OutputStream &input() = 0;

        // Bound to the remote command's stdout.
        virtual InputStream &output() = 0;

        virtual int wait() = 0;

        virtual void close() = 0;
    };

    using SessionFactory = std::function<std::unique_ptr<RemoteSession>()>;

    // `<remote_command> [-p] -rf "<path>"` for a download, `-rt` for an upload.
    std::string build_remote_command(const TransferOptions &options, TransferDirection direction,
                                     const std::string &remote_path);

    // Wraps `text` in double quotes, escaping backslashes and double quotes.
    std::string quote_argument(const std::string &text);

    /**
     * Runs downloads and uploads against sessions made by the factory. Each call blocks until
     * the remote command has exited; failures are recorded, never thrown, and can be read
     * back until the next transfer starts. Only cancel() may be called from another thread.
     */
    class TransferClient
    {
    public:
        TransferClient(SessionFactory factory, TransferOptions options);

        void set_destination_path(std::filesystem::path path);
        const std::filesystem::path &destination_path() const noexcept { return destination_; }

        // Copies the remote file or tree at `remote_path` into the destination path.
        void download(const std::string &remote_path);

        // Copies the local file or tree at `local_path` into the remote destination path.
        void upload(const std::filesystem::path &local_path);

        // Raises the active transfer's cancellation signal; no-op when idle.
        void cancel();

        std::optional<TransferError> last_error() const;
        const std::vector<TransferError> &error_stack() const noexcept { return report_.errors; }
        const std::vector<FileRecord> &transferred_files() const noexcept { return report_.files; }
        const TransferReport &report() const noexcept { return report_; }

    private:
        template <typename Engine>
        void run_transfer(TransferDirection direction, const std::string &source, const std::string &destination,
                          const std::string &remote_path, TransferState state, Engine engine);

        SessionFactory factory_;
        TransferOptions options_;
        std::filesystem::path destination_{"."};
        TransferReport report_{};

        // Guards active_ so a cancel() lands only on the transfer it observed as running.
        std::mutex cancel_mutex_;
        CancellationToken token_;
        bool active_{false};
    };

} // namespace scplink

#pragma once

#include <algorithm>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <filesystem>
#include <limits>
#include <memory>
#include <mutex>
#include <string>

#include "scplink/error_codes.hpp"
#include "scplink/stream.hpp"
#include "scplink/transfer.hpp"

namespace scplink::test
{

    inline std::filesystem::path fresh_directory(const std::string &name)
    {
        const auto path = std::filesystem::temp_directory_path() / name;
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
        std::filesystem::create_directories(path);
        return path;
    }

    inline void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    // Serves a fixed byte string, at most `chunk` bytes per read.
    class MemoryInput : public InputStream
    {
    public:
        explicit MemoryInput(std::string data, std::size_t chunk = std::numeric_limits<std::size_t>::max())
            : data_(std::move(data)), chunk_(chunk) {}

        std::size_t read_some(std::span<std::byte> buffer) override
        {
            ++reads_;
            const auto count = std::min({buffer.size(), data_.size() - offset_, chunk_});
            std::memcpy(buffer.data(), data_.data() + offset_, count);
            offset_ += count;
            return count;
        }

        void close() override { closed_ = true; }

        bool closed() const { return closed_; }
        std::size_t reads() const { return reads_; }

    private:
        std::string data_;
        std::size_t chunk_;
        std::size_t offset_{0};
        std::size_t reads_{0};
        bool closed_{false};
    };

    class MemoryOutput : public OutputStream
    {
    public:
        void write(std::span<const std::byte> data) override
        {
            if (closed_)
            {
                throw TransferError(ErrorCode::IoError, "write on closed stream");
            }
            data_.append(reinterpret_cast<const char *>(data.data()), data.size());
        }

        void close() override { closed_ = true; }

        const std::string &text() const { return data_; }
        bool closed() const { return closed_; }

    private:
        std::string data_;
        bool closed_{false};
    };

    // Accepts `limit` writes, then fails every later one the way a pipe whose reader exited does.
    class BrokenPipeOutput : public OutputStream
    {
    public:
        explicit BrokenPipeOutput(std::size_t limit) : limit_(limit) {}

        void write(std::span<const std::byte> data) override
        {
            if (accepted_ == limit_)
            {
                ++rejected_;
                throw TransferError(ErrorCode::IoError, "write: Broken pipe");
            }
            ++accepted_;
            data_.append(reinterpret_cast<const char *>(data.data()), data.size());
        }

        void close() override {}

        const std::string &text() const { return data_; }
        std::size_t rejected() const { return rejected_; }

    private:
        std::size_t limit_;
        std::size_t accepted_{0};
        std::size_t rejected_{0};
        std::string data_;
    };

    // Blocks readers until bytes are pushed or the pipe is closed.
    class BlockingPipe : public InputStream
    {
    public:
        void push(const std::string &bytes)
        {
            {
                std::lock_guard lock(mutex_);
                pending_.insert(pending_.end(), bytes.begin(), bytes.end());
            }
            cv_.notify_all();
        }

        std::size_t read_some(std::span<std::byte> buffer) override
        {
            std::unique_lock lock(mutex_);
            ++waiting_;
            cv_.notify_all();
            cv_.wait(lock, [this]
                     { return !pending_.empty() || closed_; });
            --waiting_;
            const auto count = std::min(buffer.size(), pending_.size());
            for (std::size_t i = 0; i < count; ++i)
            {
                buffer[i] = static_cast<std::byte>(pending_.front());
                pending_.pop_front();
            }
            return count;
        }

        void close() override
        {
            {
                std::lock_guard lock(mutex_);
                closed_ = true;
            }
            cv_.notify_all();
        }

        // Waits until a reader is blocked on an empty pipe.
        void wait_for_reader()
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [this]
                     { return waiting_ > 0 && pending_.empty(); });
        }

    private:
        std::mutex mutex_;
        std::condition_variable cv_;
        std::deque<char> pending_;
        int waiting_{0};
        bool closed_{false};
    };

    // What a FakeSession saw, kept alive after the client has dropped the session.
    struct SessionRecord
    {
        std::string command;
        std::string written;
        bool input_closed{false};
        std::size_t rejected_writes{0};
    };

    /**
     * Remote peer scripted by the bytes it sends. wait() returns `exit_status` once the
     * engine has closed the remote command's stdin. Writes beyond `accepted_writes` fail
     * as if the remote command had already exited.
     */
    class FakeSession : public RemoteSession
    {
    public:
        FakeSession(std::shared_ptr<SessionRecord> record, std::unique_ptr<InputStream> peer_output, int exit_status,
                    std::size_t accepted_writes = std::numeric_limits<std::size_t>::max())
            : record_(std::move(record)), input_(*this), output_(std::move(peer_output)), exit_status_(exit_status),
              accepted_writes_(accepted_writes) {}

        void start(const std::string &command) override
        {
            record_->command = command;
        }

        OutputStream &input() override { return input_; }
        InputStream &output() override { return output_; }

        int wait() override
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [this]
                     { return input_closed_; });
            return exit_status_;
        }

        void close() override {}

    private:
        class Input : public OutputStream
        {
        public:
            explicit Input(FakeSession &owner) : owner_(owner) {}

            void write(std::span<const std::byte> data) override
            {
                std::lock_guard lock(owner_.mutex_);
                if (owner_.input_closed_)
                {
                    throw TransferError(ErrorCode::IoError, "write on closed stream");
                }
                if (owner_.accepted_writes_ == 0)
                {
                    ++owner_.record_->rejected_writes;
                    throw TransferError(ErrorCode::IoError, "write: Broken pipe");
                }
                --owner_.accepted_writes_;
                owner_.record_->written.append(reinterpret_cast<const char *>(data.data()), data.size());
            }

            void close() override
            {
                {
                    std::lock_guard lock(owner_.mutex_);
                    owner_.input_closed_ = true;
                    owner_.record_->input_closed = true;
                }
                owner_.cv_.notify_all();
            }

        private:
            FakeSession &owner_;
        };

        class Output : public InputStream
        {
        public:
            explicit Output(std::unique_ptr<InputStream> source) : source_(std::move(source)) {}

            std::size_t read_some(std::span<std::byte> buffer) override { return source_->read_some(buffer); }
            void close() override { source_->close(); }

        private:
            std::unique_ptr<InputStream> source_;
        };

        std::shared_ptr<SessionRecord> record_;
        Input input_;
        Output output_;
        int exit_status_;
        std::size_t accepted_writes_;
        std::mutex mutex_;
        std::condition_variable cv_;
        bool input_closed_{false};
    };

    // A pipe shared with the test that outlives the session owning its wrapper.
    class SharedPipeInput : public InputStream
    {
    public:
        explicit SharedPipeInput(std::shared_ptr<BlockingPipe> pipe) : pipe_(std::move(pipe)) {}

        std::size_t read_some(std::span<std::byte> buffer) override { return pipe_->read_some(buffer); }
        void close() override { pipe_->close(); }

    private:
        std::shared_ptr<BlockingPipe> pipe_;
    };

} // namespace scplink::test

#include <array>
#include <atomic>
#include <cassert>
#include <chrono>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <initializer_list>
#include <iostream>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include "scplink/cancellation.hpp"
#include "scplink/crypto.hpp"
#include "scplink/directory_stack.hpp"
#include "scplink/error_codes.hpp"
#include "scplink/message.hpp"
#include "scplink/stream.hpp"
#include "test_support.hpp"

using namespace scplink;
using namespace scplink::protocol;

void run_engine_component_tests();
void run_client_component_tests();

namespace
{

    void expect_violation(const std::string &line, const std::string &expected_message)
    {
        try
        {
            (void)decode(line);
            assert(false && "decode should have failed");
        }
        catch (const TransferError &error)
        {
            assert(error.code() == ErrorCode::ProtocolViolation);
            assert(std::string(error.what()) == expected_message);
        }
    }

    void test_parse_fields()
    {
        const auto file = parse_fields("C0644 1234 report.pdf", MessageShape::FileCopy);
        assert(file.at("mode") == "0644");
        assert(file.at("length") == "1234");
        assert(file.at("filename") == "report.pdf");

        const auto dir = parse_fields("D0755 0 my dir", MessageShape::DirCopy);
        assert(dir.at("dirname") == "my dir");

        const auto times = parse_fields("T1700000000 0 1700000100 0", MessageShape::Timestamp);
        assert(times.at("mtime") == "1700000000");
        assert(times.at("atime") == "1700000100");

        try
        {
            (void)parse_fields("Invalid msg", MessageShape::FileCopy);
            assert(false && "parse_fields should have failed");
        }
        catch (const TransferError &error)
        {
            assert(error.code() == ErrorCode::ProtocolViolation);
            assert(std::string(error.what()) == "Could not parse protocol message: Invalid msg");
        }
    }

    void test_decode_shapes()
    {
        const auto file = std::get<FileCopy>(decode("C0755 11 hello.txt\n"));
        assert(file.mode == 0755);
        assert(file.length == 11);
        assert(file.name == "hello.txt");

        const auto dir = std::get<DirCopy>(decode("D0700 0 mydir\n"));
        assert(dir.mode == 0700);
        assert(dir.name == "mydir");

        assert(std::holds_alternative<EndOfDirectory>(decode("E\n")));
        // Trailing NUL from the previous file's completion byte.
        assert(std::holds_alternative<EndOfDirectory>(decode(std::string("\0E\n", 3))));
        assert(std::holds_alternative<Ack>(decode(std::string(1, '\0'))));

        const auto times = std::get<Timestamp>(decode("T1700000000 0 1700000100 0\n"));
        assert(times.mtime == 1700000000);
        assert(times.atime == 1700000100);

        const auto warning = std::get<Warning>(decode("\x01scp: no such file\n"));
        assert(warning.text == "scp: no such file");
        const auto error = std::get<Error>(decode("\x02scp: permission denied\n"));
        assert(error.text == "scp: permission denied");
    }

    void test_decode_rejects_malformed()
    {
        expect_violation("Invalid msg", "Could not parse protocol message: Invalid msg");
        expect_violation("C0644 abc name\n", "Could not parse protocol message: C0644 abc name");
        expect_violation("C0944 1 name\n", "Could not parse protocol message: C0944 1 name");
        expect_violation("C0644 1\n", "Could not parse protocol message: C0644 1");
        expect_violation("Ex\n", "Could not parse protocol message: Ex");
        expect_violation("T1 0 2\n", "Could not parse protocol message: T1 0 2");
    }

    void test_encode_shapes()
    {
        assert(encode(FileCopy{.mode = kDefaultMode, .length = 5, .name = "a.txt"}) == "C0644 5 a.txt\n");
        assert(encode(FileCopy{.mode = 0100755, .length = 0, .name = "run.sh"}) == "C0755 0 run.sh\n");
        assert(encode(DirCopy{.mode = kDefaultMode, .length = 0, .name = "dir"}) == "D0644 0 dir\n");
        assert(encode(EndOfDirectory{}) == "E\n");
        assert(encode(Timestamp{.mtime = 10, .atime = 20}) == "T10 0 20 0\n");
        assert(encode(Ack{}) == std::string(1, '\0'));
        assert(encode(Warning{"careful"}) == "\x01"
                                             "careful\n");
        assert(encode(Error{"broken"}) == "\x02"
                                          "broken\n");
        assert(describe(Ack{}) == "<ack>");
        assert(describe(EndOfDirectory{}) == "E");
    }

    void test_encode_then_decode()
    {
        const std::vector<Message> messages{
            FileCopy{.mode = 0600, .length = 123456789012ULL, .name = "big file.bin"},
            DirCopy{.mode = 0755, .length = 0, .name = "photos"},
            EndOfDirectory{},
            Timestamp{.mtime = 1700000000, .atime = 1700000001},
            Warning{"disk almost full"},
            Error{"no space left"},
        };
        for (const auto &message : messages)
        {
            assert(decode(encode(message)) == message);
        }
    }

    void test_directory_stack()
    {
        DirectoryStack stack;
        stack.pop();
        assert(stack.depth() == 0);

        stack.push(".");
        stack.pop();
        assert(stack.empty());

        stack.push(".");
        stack.push("a");
        stack.push("b");
        assert(stack.current() == std::filesystem::path(".") / "a" / "b");
        stack.pop();
        stack.pop();
        stack.pop();
        stack.pop();
        assert(stack.depth() == 0);

        stack.replace({"root", "one"});
        assert(stack.depth() == 2);
        assert(stack.segments().back() == "one");
    }

    void test_line_reader()
    {
        test::MemoryInput input(std::string("D0755 0 dir\nC0644 5 a.txt\nhelloE\npartial"), 3);
        LineReader reader(input, 4);

        assert(reader.read_line() == std::optional<std::string>("D0755 0 dir\n"));
        assert(reader.read_line() == std::optional<std::string>("C0644 5 a.txt\n"));

        std::array<std::byte, 5> body{};
        std::size_t received = 0;
        while (received < body.size())
        {
            const auto count = reader.read_some(std::span(body).subspan(received));
            assert(count > 0);
            received += count;
        }
        assert(std::memcmp(body.data(), "hello", 5) == 0);

        assert(reader.read_line() == std::optional<std::string>("E\n"));
        assert(!reader.read_line());
        assert(!reader.read_line());
    }

    void test_line_reader_limit()
    {
        test::MemoryInput input(std::string(LineReader::kMaxLineLength + 10, 'x'));
        LineReader reader(input);
        try
        {
            (void)reader.read_line();
            assert(false && "overlong line should fail");
        }
        catch (const TransferError &error)
        {
            assert(error.code() == ErrorCode::ProtocolViolation);
        }
    }

    void test_cancellation_is_sticky()
    {
        CancellationToken token;
        assert(!token.cancelled());
        assert(token.cancel());
        assert(!token.cancel());
        assert(token.cancelled());

        test::MemoryInput input("data");
        CancellableReader reader(input, token);
        std::array<std::byte, 4> buffer{};
        for (int attempt = 0; attempt < 2; ++attempt)
        {
            try
            {
                (void)reader.read_some(buffer);
                assert(false && "cancelled read should fail");
            }
            catch (const TransferError &error)
            {
                assert(error.code() == ErrorCode::Cancelled);
            }
        }
        assert(input.reads() == 0);

        token.reset();
        assert(reader.read_some(buffer) == 4);
    }

    void test_cancellation_during_reads()
    {
        CancellationToken token;
        test::BlockingPipe pipe;
        CancellableReader reader(pipe, token);
        std::atomic<int> bytes_read{0};
        std::optional<ErrorCode> failure;

        std::thread consumer([&]()
                             {
            std::array<std::byte, 1> buffer{};
            try
            {
                for (;;)
                {
                    if (reader.read_some(buffer) == 0)
                    {
                        return;
                    }
                    ++bytes_read;
                }
            }
            catch (const TransferError &error)
            {
                failure = error.code();
            } });

        pipe.push("ab");
        pipe.wait_for_reader();
        assert(token.cancel());
        // Completes the read that was already blocked; the next one must observe the signal.
        pipe.push("c");
        consumer.join();

        assert(failure == ErrorCode::Cancelled);
        assert(bytes_read == 3);

        std::array<std::byte, 1> buffer{};
        pipe.push("d");
        try
        {
            (void)reader.read_some(buffer);
            assert(false && "cancellation should be sticky");
        }
        catch (const TransferError &error)
        {
            assert(error.code() == ErrorCode::Cancelled);
        }
    }

    void test_error_stack()
    {
        ErrorStack stack;
        assert(stack.empty());
        assert(!stack.last());

        stack.add(TransferError(ErrorCode::IoError, "first"));
        stack.add(TransferError(ErrorCode::SessionError, "second"));
        assert(stack.size() == 2);
        assert(stack.last()->code() == ErrorCode::SessionError);
        assert(std::string(stack.all().front().what()) == "first");

        assert(to_string(ErrorCode::RemoteWarning) == "remote_warning");
    }

    std::string digest_of(std::initializer_list<std::span<const std::byte>> pieces)
    {
        crypto::ContentHasher hasher;
        for (const auto piece : pieces)
        {
            hasher.update(piece);
        }
        return hasher.finish();
    }

    void test_crypto()
    {
        // BLAKE2b-256 of the empty input.
        assert(digest_of({}) == "0e5751c026e543b2e8ab2eb06099daa1d1e5df47778f7787faab45cdf12fe3a8");

        const std::vector<std::byte> chunk = {std::byte{0xDE}, std::byte{0xAD}, std::byte{0xBE}, std::byte{0xEF}};
        const auto whole = digest_of({chunk});
        assert(whole.size() == 64);
        assert(digest_of({std::span(chunk).first(1), std::span(chunk).subspan(1)}) == whole);
        assert(digest_of({std::span(chunk).first(3)}) != whole);

        crypto::ContentHasher finished;
        (void)finished.finish();
        try
        {
            finished.update(chunk);
            assert(false && "update after finish should fail");
        }
        catch (const std::logic_error &)
        {
        }
    }

} // namespace

int main()
{
    std::signal(SIGPIPE, SIG_IGN);
    try
    {
        test_parse_fields();
        test_decode_shapes();
        test_decode_rejects_malformed();
        test_encode_shapes();
        test_encode_then_decode();
        test_directory_stack();
        test_line_reader();
        test_line_reader_limit();
        test_cancellation_is_sticky();
        test_cancellation_during_reads();
        test_error_stack();
        test_crypto();
        run_engine_component_tests();
        run_client_component_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}

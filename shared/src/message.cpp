#include "scplink/message.hpp"

#include <charconv>
#include <iomanip>
#include <optional>
#include <sstream>
#include <type_traits>

#include "scplink/error_codes.hpp"

namespace scplink::protocol
{

    namespace
    {

        constexpr std::string_view kStripped{"\0 \t\r\n", 5};
        constexpr std::uint32_t kModeMask = 07777;

        // Cursor over one message line; every matcher consumes input only on success.
        class Cursor
        {
        public:
            explicit Cursor(std::string_view text) : text_(text) {}

            bool literal(char expected)
            {
                if (pos_ < text_.size() && text_[pos_] == expected)
                {
                    ++pos_;
                    return true;
                }
                return false;
            }

            bool literal(std::string_view expected)
            {
                if (text_.substr(pos_, expected.size()) == expected)
                {
                    pos_ += expected.size();
                    return true;
                }
                return false;
            }

            std::optional<std::string_view> digits(std::size_t min_count, std::size_t max_count, char highest = '9')
            {
                std::size_t end = pos_;
                while (end < text_.size() && end - pos_ < max_count && text_[end] >= '0' && text_[end] <= highest)
                {
                    ++end;
                }
                if (end - pos_ < min_count)
                {
                    return std::nullopt;
                }
                const auto matched = text_.substr(pos_, end - pos_);
                pos_ = end;
                return matched;
            }

            std::optional<std::string_view> rest()
            {
                if (pos_ >= text_.size())
                {
                    return std::nullopt;
                }
                const auto remaining = text_.substr(pos_);
                pos_ = text_.size();
                return remaining;
            }

            bool at_end() const noexcept { return pos_ == text_.size(); }

        private:
            std::string_view text_;
            std::size_t pos_{0};
        };

        [[noreturn]] void throw_unparsable(std::string_view line)
        {
            throw TransferError(ErrorCode::ProtocolViolation,
                                "Could not parse protocol message: " + std::string(line));
        }

        std::optional<MessageFields> match_copy(std::string_view line, char type, const char *name_field)
        {
            Cursor cursor(line);
            if (!cursor.literal(type))
            {
                return std::nullopt;
            }
            const auto mode = cursor.digits(4, 4, '7');
            if (!mode || !cursor.literal(' '))
            {
                return std::nullopt;
            }
            const auto length = cursor.digits(1, 20);
            if (!length || !cursor.literal(' '))
            {
                return std::nullopt;
            }
            const auto name = cursor.rest();
            if (!name)
            {
                return std::nullopt;
            }
            return MessageFields{
                {"mode", std::string(*mode)},
                {"length", std::string(*length)},
                {name_field, std::string(*name)},
            };
        }

        std::optional<MessageFields> match_timestamp(std::string_view line)
        {
            Cursor cursor(line);
            if (!cursor.literal('T'))
            {
                return std::nullopt;
            }
            const auto mtime = cursor.digits(1, 20);
            if (!mtime || !cursor.literal(" 0 "))
            {
                return std::nullopt;
            }
            const auto atime = cursor.digits(1, 20);
            if (!atime || !cursor.literal(" 0") || !cursor.at_end())
            {
                return std::nullopt;
            }
            return MessageFields{
                {"mtime", std::string(*mtime)},
                {"atime", std::string(*atime)},
            };
        }

        template <typename Integer>
        Integer to_integer(std::string_view text, int base, std::string_view line)
        {
            Integer value{};
            const auto *first = text.data();
            const auto *last = text.data() + text.size();
            const auto [ptr, ec] = std::from_chars(first, last, value, base);
            if (ec != std::errc{} || ptr != last)
            {
                throw_unparsable(line);
            }
            return value;
        }

        std::string octal_mode(std::uint32_t mode)
        {
            std::ostringstream oss;
            oss << std::oct << std::setw(4) << std::setfill('0') << (mode & kModeMask);
            return oss.str();
        }

        std::string trim_text(std::string_view text)
        {
            const auto begin = text.find_first_not_of(kStripped);
            if (begin == std::string_view::npos)
            {
                return "";
            }
            const auto end = text.find_last_not_of(kStripped);
            return std::string(text.substr(begin, end - begin + 1));
        }

        template <class... Ts>
        struct Overloaded : Ts...
        {
            using Ts::operator()...;
        };
        template <class... Ts>
        Overloaded(Ts...) -> Overloaded<Ts...>;

    } // namespace

    MessageFields parse_fields(std::string_view line, MessageShape shape)
    {
        std::optional<MessageFields> fields;
        switch (shape)
        {
        case MessageShape::FileCopy:
            fields = match_copy(line, 'C', "filename");
            break;
        case MessageShape::DirCopy:
            fields = match_copy(line, 'D', "dirname");
            break;
        case MessageShape::EndOfDirectory:
            if (line == "E")
            {
                fields = MessageFields{};
            }
            break;
        case MessageShape::Timestamp:
            fields = match_timestamp(line);
            break;
        }
        if (!fields)
        {
            throw_unparsable(line);
        }
        return *fields;
    }

    std::string strip_message(std::string_view line)
    {
        if (!line.empty() && line.back() == '\n')
        {
            line.remove_suffix(1);
        }
        return trim_text(line);
    }

    Message decode(std::string_view line)
    {
        const bool has_nul = line.find('\0') != std::string_view::npos;
        const auto message = strip_message(line);
        if (message.empty())
        {
            if (has_nul)
            {
                return Ack{};
            }
            throw_unparsable(message);
        }

        switch (message.front())
        {
        case static_cast<char>(ControlByte::Warning):
            return Warning{trim_text(std::string_view(message).substr(1))};
        case static_cast<char>(ControlByte::Error):
            return Error{trim_text(std::string_view(message).substr(1))};
        case 'C':
        {
            const auto fields = parse_fields(message, MessageShape::FileCopy);
            return FileCopy{
                .mode = to_integer<std::uint32_t>(fields.at("mode"), 8, message),
                .length = to_integer<std::uint64_t>(fields.at("length"), 10, message),
                .name = fields.at("filename"),
            };
        }
        case 'D':
        {
            const auto fields = parse_fields(message, MessageShape::DirCopy);
            return DirCopy{
                .mode = to_integer<std::uint32_t>(fields.at("mode"), 8, message),
                .length = to_integer<std::uint64_t>(fields.at("length"), 10, message),
                .name = fields.at("dirname"),
            };
        }
        case 'E':
            parse_fields(message, MessageShape::EndOfDirectory);
            return EndOfDirectory{};
        case 'T':
        {
            const auto fields = parse_fields(message, MessageShape::Timestamp);
            return Timestamp{
                .mtime = to_integer<std::uint64_t>(fields.at("mtime"), 10, message),
                .atime = to_integer<std::uint64_t>(fields.at("atime"), 10, message),
            };
        }
        default:
            throw_unparsable(message);
        }
    }

    std::string encode(const Message &message)
    {
        return std::visit(
            Overloaded{
                [](const FileCopy &file)
                {
                    return "C" + octal_mode(file.mode) + " " + std::to_string(file.length) + " " + file.name + "\n";
                },
                [](const DirCopy &dir)
                {
                    return "D" + octal_mode(dir.mode) + " " + std::to_string(dir.length) + " " + dir.name + "\n";
                },
                [](const EndOfDirectory &)
                { return std::string("E\n"); },
                [](const Timestamp &times)
                {
                    return "T" + std::to_string(times.mtime) + " 0 " + std::to_string(times.atime) + " 0\n";
                },
                [](const Ack &)
                { return std::string(1, static_cast<char>(ControlByte::Ack)); },
                [](const Warning &warning)
                { return static_cast<char>(ControlByte::Warning) + warning.text + "\n"; },
                [](const Error &error)
                { return static_cast<char>(ControlByte::Error) + error.text + "\n"; },
            },
            message);
    }

    std::string describe(const Message &message)
    {
        return std::visit(
            Overloaded{
                [](const Ack &)
                { return std::string("<ack>"); },
                [](const Warning &warning)
                { return "<warning> " + warning.text; },
                [](const Error &error)
                { return "<error> " + error.text; },
                [&message](const auto &)
                {
                    auto text = encode(message);
                    text.pop_back();
                    return text;
                },
            },
            message);
    }

} // namespace scplink::protocol

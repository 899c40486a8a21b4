#include "engine_common.hpp"

#include <filesystem>
#include <string>

#include <spdlog/spdlog.h>

#include "scplink/error_codes.hpp"

namespace scplink::engine_common
{

    void send_message(OutputStream &stream, const protocol::Message &message)
    {
        write_text(stream, protocol::encode(message));
    }

    void emit_event(const TransferOptions &options, std::string_view text)
    {
        if (options.verbose && options.on_event)
        {
            options.on_event(text);
        }
    }

    void report_failure(OutputStream &stream, const std::string &text) noexcept
    {
        try
        {
            send_message(stream, protocol::Error{text});
        }
        catch (const std::exception &ex)
        {
            spdlog::debug("Could not report failure to peer: {}", ex.what());
        }
    }

    std::string relative_path(const std::vector<std::string> &segments, std::size_t skip, const std::string &leaf)
    {
        std::filesystem::path path;
        for (std::size_t i = skip; i < segments.size(); ++i)
        {
            path /= segments[i];
        }
        path /= leaf;
        return path.generic_string();
    }

    ProgressScope::ProgressScope(const TransferOptions &options, const std::string &name, std::uint64_t total_bytes)
        : observer_(options.progress.get())
    {
        if (observer_)
        {
            observer_->begin(name, total_bytes);
        }
    }

    ProgressScope::~ProgressScope()
    {
        if (observer_)
        {
            observer_->finish();
        }
    }

    void ProgressScope::advance(std::uint64_t bytes)
    {
        if (observer_)
        {
            observer_->advance(bytes);
        }
    }

} // namespace scplink::engine_common

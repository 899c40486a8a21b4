#include "scplink/client/progress.hpp"

namespace scplink::client
{

    ConsoleProgress::ConsoleProgress(std::ostream &out) : out_(out) {}

    void ConsoleProgress::begin(const std::string &name, std::uint64_t total_bytes)
    {
        std::lock_guard lock(mutex_);
        name_ = name;
        total_ = total_bytes;
        done_ = 0;
        last_percent_ = -1;
        render();
    }

    void ConsoleProgress::advance(std::uint64_t bytes)
    {
        std::lock_guard lock(mutex_);
        done_ += bytes;
        render();
    }

    void ConsoleProgress::finish()
    {
        std::lock_guard lock(mutex_);
        out_ << std::endl;
    }

    void ConsoleProgress::render()
    {
        const int percent = total_ == 0 ? 100 : static_cast<int>(done_ * 100 / total_);
        if (percent == last_percent_)
        {
            return;
        }
        last_percent_ = percent;
        out_ << "\r" << name_ << " " << done_ << " / " << total_ << " bytes (" << percent << "%)" << std::flush;
    }

} // namespace scplink::client

#include "scplink/directory_stack.hpp"

#include <utility>

namespace scplink
{

    DirectoryStack::DirectoryStack(std::vector<std::string> segments) : segments_(std::move(segments)) {}

    void DirectoryStack::push(std::string segment)
    {
        segments_.push_back(std::move(segment));
    }

    void DirectoryStack::pop() noexcept
    {
        if (!segments_.empty())
        {
            segments_.pop_back();
        }
    }

    void DirectoryStack::replace(std::vector<std::string> segments)
    {
        segments_ = std::move(segments);
    }

    std::filesystem::path DirectoryStack::current() const
    {
        std::filesystem::path joined;
        for (const auto &segment : segments_)
        {
            joined /= segment;
        }
        return joined;
    }

} // namespace scplink

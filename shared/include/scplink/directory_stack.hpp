/**
 * scplink - Current location of a transfer as an ordered list of path segments.
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace scplink
{

    class DirectoryStack
    {
    public:
        DirectoryStack() = default;
        explicit DirectoryStack(std::vector<std::string> segments);

        void push(std::string segment);

        // Drops the innermost segment; a no-op on an empty stack.
        void pop() noexcept;

        void replace(std::vector<std::string> segments);

        std::filesystem::path current() const;

        std::size_t depth() const noexcept { return segments_.size(); }
        bool empty() const noexcept { return segments_.empty(); }
        const std::vector<std::string> &segments() const noexcept { return segments_; }

    private:
        std::vector<std::string> segments_;
    };

} // namespace scplink

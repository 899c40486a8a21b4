/**
 * scplink - Pre-order walk of a local tree feeding the source engine.
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "scplink/error_codes.hpp"

namespace scplink
{

    struct WalkEntry
    {
        std::filesystem::path path;
        // Path relative to the parent of the walk root; the root's own name comes first.
        std::vector<std::string> segments;
        bool is_directory{};
        std::uint64_t size{};
        std::uint32_t mode{};
        std::uint64_t modified_time{};
        std::uint64_t access_time{};
        std::optional<TransferError> error{};
    };

    // Returning false stops the walk.
    using WalkVisitor = std::function<bool(const WalkEntry &)>;

    /**
     * Visits `root` and everything below it, parents before children, siblings sorted by
     * name. Entries that cannot be read are still visited, with `error` set. Symbolic links
     * to files are followed; links to directories are reported as errors and not descended.
     * Returns false when the visitor stopped the walk.
     */
    bool walk_tree(const std::filesystem::path &root, const WalkVisitor &visit);

    // Absolute, normalized form without a trailing separator ("dir/" and "." become real names).
    std::filesystem::path normalize_walk_root(const std::filesystem::path &root);

} // namespace scplink

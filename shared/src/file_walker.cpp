#include "scplink/file_walker.hpp"

#include <algorithm>
#include <cerrno>
#include <system_error>

#include <sys/stat.h>

namespace scplink
{

    namespace
    {

        TransferError walk_error(const std::filesystem::path &path, const std::string &reason)
        {
            return TransferError(ErrorCode::WalkError, path.string() + ": " + reason);
        }

        std::string errno_message(int error)
        {
            return std::error_code(error, std::generic_category()).message();
        }

        void fill_metadata(WalkEntry &entry, const struct stat &info)
        {
            entry.is_directory = S_ISDIR(info.st_mode);
            entry.size = entry.is_directory ? 0 : static_cast<std::uint64_t>(info.st_size);
            entry.mode = static_cast<std::uint32_t>(info.st_mode & 07777);
            entry.modified_time = static_cast<std::uint64_t>(info.st_mtime);
            entry.access_time = static_cast<std::uint64_t>(info.st_atime);
        }

        bool visit_path(const std::filesystem::path &path, const std::vector<std::string> &segments,
                        const WalkVisitor &visit)
        {
            WalkEntry entry{.path = path, .segments = segments};

            struct stat info{};
            if (::lstat(path.c_str(), &info) != 0)
            {
                entry.error = walk_error(path, errno_message(errno));
                return visit(entry);
            }
            if (S_ISLNK(info.st_mode))
            {
                if (::stat(path.c_str(), &info) != 0)
                {
                    entry.error = walk_error(path, errno_message(errno));
                    return visit(entry);
                }
                if (S_ISDIR(info.st_mode))
                {
                    entry.error = walk_error(path, "not following symbolic link to directory");
                    return visit(entry);
                }
            }
            if (!S_ISDIR(info.st_mode) && !S_ISREG(info.st_mode))
            {
                entry.error = walk_error(path, "not a regular file or directory");
                return visit(entry);
            }

            fill_metadata(entry, info);
            if (!visit(entry))
            {
                return false;
            }
            if (!entry.is_directory)
            {
                return true;
            }

            std::vector<std::string> names;
            std::error_code ec;
            for (std::filesystem::directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec))
            {
                names.push_back(it->path().filename().string());
            }
            if (ec)
            {
                WalkEntry failed{.path = path, .segments = segments, .is_directory = true};
                failed.error = walk_error(path, ec.message());
                return visit(failed);
            }

            std::sort(names.begin(), names.end());
            for (const auto &name : names)
            {
                auto child_segments = segments;
                child_segments.push_back(name);
                if (!visit_path(path / name, child_segments, visit))
                {
                    return false;
                }
            }
            return true;
        }

    } // namespace

    std::filesystem::path normalize_walk_root(const std::filesystem::path &root)
    {
        auto normalized = std::filesystem::absolute(root).lexically_normal();
        while (normalized.has_relative_path() && normalized.filename().empty())
        {
            normalized = normalized.parent_path();
        }
        return normalized;
    }

    bool walk_tree(const std::filesystem::path &root, const WalkVisitor &visit)
    {
        const auto normalized = normalize_walk_root(root);
        return visit_path(normalized, {normalized.filename().string()}, visit);
    }

} // namespace scplink

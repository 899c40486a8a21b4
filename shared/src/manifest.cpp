#include "scplink/manifest.hpp"

#include <fstream>

#include "scplink/error_codes.hpp"

namespace scplink
{

    nlohmann::json to_json(const FileRecord &record)
    {
        return {{"path", record.path},
                {"size", record.size},
                {"blake2b", record.content_hash}};
    }

    nlohmann::json to_json(const TransferReport &report)
    {
        nlohmann::json files = nlohmann::json::array();
        for (const auto &record : report.files)
        {
            files.push_back(to_json(record));
        }

        nlohmann::json errors = nlohmann::json::array();
        for (const auto &error : report.errors)
        {
            errors.push_back({{"code", std::string(to_string(error.code()))},
                              {"message", error.what()}});
        }

        return {{"direction", std::string(to_string(report.direction))},
                {"source", report.source},
                {"destination", report.destination},
                {"ok", report.errors.empty()},
                {"files", std::move(files)},
                {"errors", std::move(errors)}};
    }

    void write_manifest(const std::filesystem::path &path, const TransferReport &report)
    {
        const auto dir = path.parent_path();
        if (!dir.empty())
        {
            std::error_code ec;
            std::filesystem::create_directories(dir, ec);
        }
        std::ofstream out(path, std::ios::trunc);
        if (!out.is_open())
        {
            throw TransferError(ErrorCode::IoError, "Failed to open manifest " + path.string());
        }
        out << to_json(report).dump(2) << '\n';
        if (!out)
        {
            throw TransferError(ErrorCode::IoError, "Failed to write manifest " + path.string());
        }
    }

} // namespace scplink

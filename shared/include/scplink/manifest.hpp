/**
 * scplink - JSON record of a finished transfer.
 */
#pragma once

#include <filesystem>

#include <nlohmann/json.hpp>

#include "scplink/transfer_state.hpp"

namespace scplink
{

    nlohmann::json to_json(const FileRecord &record);

    /**
     * {"direction", "source", "destination", "ok", "files": [{"path","size","blake2b"}],
     *  "errors": [{"code","message"}]}
     */
    nlohmann::json to_json(const TransferReport &report);

    // Writes the report with two-space indentation. Throws TransferError(IoError).
    void write_manifest(const std::filesystem::path &path, const TransferReport &report);

} // namespace scplink

#include "strata/orchestration/chunk_staging.hpp"

#include <fstream>

namespace strata::orchestration {
namespace fs = std::filesystem;

ChunkStaging::ChunkStaging(fs::path root) : root_(std::move(root)) {}

fs::path ChunkStaging::make_staging_path(const domain::UploadSessionId& session) const {
    return root_ / session.str() / "data.part";
}

Result<void> ChunkStaging::ensure_parent_exists(const fs::path& path) {
    const auto parent = path.parent_path();
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec && !fs::exists(parent)) {
        return Err<void>(ErrorKind::PersistenceFailure, "Failed to create directory: " + parent.string());
    }
    return Ok();
}

Result<void> ChunkStaging::create(const domain::UploadSessionId& session, std::uint64_t total_size) const {
    const auto staging_path = make_staging_path(session);
    if (auto res = ensure_parent_exists(staging_path); res.is_error()) {
        return res;
    }

    {
        std::ofstream create(staging_path, std::ios::binary | std::ios::trunc);
        if (!create) {
            return Err<void>(ErrorKind::PersistenceFailure,
                             "Failed to create staging file: " + staging_path.string());
        }
    }

    std::error_code ec;
    fs::resize_file(staging_path, total_size, ec);
    if (ec) {
        return Err<void>(ErrorKind::PersistenceFailure,
                         "Failed to size staging file " + staging_path.string() + ": " + ec.message());
    }
    return Ok();
}

Result<void> ChunkStaging::write_chunk(const domain::UploadSessionId& session,
                                       std::uint64_t offset,
                                       const std::vector<std::uint8_t>& data) const {
    const auto staging_path = make_staging_path(session);

    std::fstream file(staging_path, std::ios::in | std::ios::out | std::ios::binary);
    if (!file) {
        return Err<void>(ErrorKind::NotFound, "Staging file missing: " + staging_path.string());
    }

    file.seekp(static_cast<std::streamoff>(offset));
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!file) {
        return Err<void>(ErrorKind::PersistenceFailure,
                         "Failed to write chunk at offset " + std::to_string(offset) + " for session " + session.str());
    }

    file.flush();
    return Ok();
}

Result<std::unique_ptr<std::istream>> ChunkStaging::open(const domain::UploadSessionId& session) const {
    using StreamPtr = std::unique_ptr<std::istream>;
    const auto staging_path = make_staging_path(session);
    if (!fs::exists(staging_path)) {
        return Err<StreamPtr>(ErrorKind::NotFound, "Staging file missing: " + staging_path.string());
    }

    auto input = std::make_unique<std::ifstream>(staging_path, std::ios::binary);
    if (!*input) {
        return Err<StreamPtr>(ErrorKind::PersistenceFailure, "Failed to open staging file: " + staging_path.string());
    }
    return Ok<StreamPtr>(std::move(input));
}

Result<void> ChunkStaging::discard(const domain::UploadSessionId& session) const {
    std::error_code ec;
    fs::remove_all(root_ / session.str(), ec);
    if (ec) {
        return Err<void>(ErrorKind::PersistenceFailure,
                         "Failed to remove staging data for session " + session.str() + ": " + ec.message());
    }
    return Ok();
}

bool ChunkStaging::exists(const domain::UploadSessionId& session) const {
    std::error_code ec;
    return fs::exists(make_staging_path(session), ec);
}

} // namespace strata::orchestration

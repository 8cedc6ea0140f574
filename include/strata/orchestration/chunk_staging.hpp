#pragma once

#include "strata/core/result.hpp"
#include "strata/domain/ids.hpp"

#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <vector>

namespace strata::orchestration {

/**
 * @brief On-disk assembly area for chunked uploads
 *
 * Each session owns <root>/<session id>/data.part, created at full size
 * when the session opens. Chunks are written in place at their offset, so
 * they may arrive in any order, in parallel, or more than once.
 */
class ChunkStaging {
public:
    explicit ChunkStaging(std::filesystem::path root);

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

    Result<void> create(const domain::UploadSessionId& session, std::uint64_t total_size) const;

    Result<void> write_chunk(const domain::UploadSessionId& session,
                             std::uint64_t offset,
                             const std::vector<std::uint8_t>& data) const;

    Result<std::unique_ptr<std::istream>> open(const domain::UploadSessionId& session) const;

    /// Removes the session's directory; absent data is not an error
    Result<void> discard(const domain::UploadSessionId& session) const;

    [[nodiscard]] bool exists(const domain::UploadSessionId& session) const;

private:
    [[nodiscard]] std::filesystem::path make_staging_path(const domain::UploadSessionId& session) const;

    static Result<void> ensure_parent_exists(const std::filesystem::path& path);

    std::filesystem::path root_;
};

} // namespace strata::orchestration

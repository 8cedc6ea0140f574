#pragma once

#include "strata/core/clock.hpp"
#include "strata/core/result.hpp"
#include "strata/domain/ids.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>

namespace strata::domain {

/**
 * @brief Server-side state of a resumable chunked upload
 *
 * Uploaded chunks are tracked as a set of indices so that retried,
 * reordered or parallel submissions cannot inflate progress: re-sending
 * chunk 0 three times and never sending chunk 4 is still incomplete.
 *
 * The session accepts chunks while it is neither completed nor expired.
 * Once completed_at() is set it never changes again.
 */
class UploadSession {
public:
    static constexpr std::chrono::hours kDefaultTtl{24};

    /// InvalidArgument when total_size or chunk_size is zero
    static Result<UploadSession> create(FileId file_id,
                                        UserId owner,
                                        std::uint64_t total_size,
                                        std::uint64_t chunk_size,
                                        TimePoint now,
                                        std::chrono::seconds ttl = kDefaultTtl);

    [[nodiscard]] const UploadSessionId& id() const noexcept { return id_; }
    [[nodiscard]] const FileId& file_id() const noexcept { return file_id_; }
    [[nodiscard]] const UserId& owner() const noexcept { return owner_; }
    [[nodiscard]] std::uint64_t total_size() const noexcept { return total_size_; }
    [[nodiscard]] std::uint64_t chunk_size() const noexcept { return chunk_size_; }
    [[nodiscard]] std::uint64_t total_chunks() const noexcept { return total_chunks_; }
    [[nodiscard]] const std::set<std::uint64_t>& uploaded_chunks() const noexcept { return uploaded_chunks_; }
    [[nodiscard]] TimePoint created_at() const noexcept { return created_at_; }
    [[nodiscard]] TimePoint expires_at() const noexcept { return expires_at_; }
    [[nodiscard]] const std::optional<TimePoint>& completed_at() const noexcept { return completed_at_; }
    [[nodiscard]] std::uint64_t version() const noexcept { return version_; }
    [[nodiscard]] const std::optional<std::string>& preferred_provider() const noexcept { return preferred_provider_; }

    void set_preferred_provider(std::optional<std::string> provider) { preferred_provider_ = std::move(provider); }

    void set_version(std::uint64_t version) noexcept { version_ = version; }

    /// Expected byte count of chunk @p index; the last chunk carries the remainder
    [[nodiscard]] std::uint64_t chunk_length(std::uint64_t index) const noexcept;

    [[nodiscard]] std::uint64_t chunk_offset(std::uint64_t index) const noexcept { return index * chunk_size_; }

    /// floor(uploaded * 100 / total_chunks)
    [[nodiscard]] int progress() const noexcept;

    [[nodiscard]] bool is_complete() const noexcept;
    [[nodiscard]] bool is_completed() const noexcept { return completed_at_.has_value(); }
    [[nodiscard]] bool is_expired(TimePoint now) const noexcept;

    /// AlreadyCompleted, Expired or IndexOutOfRange; otherwise records the index
    Result<void> mark_chunk_uploaded(std::int64_t index, TimePoint now);

    /// AlreadyCompleted, Expired or IncompleteChunks; otherwise stamps completed_at
    Result<void> complete(TimePoint now);

private:
    UploadSession(UploadSessionId id, FileId file_id, UserId owner,
                  std::uint64_t total_size, std::uint64_t chunk_size, TimePoint now, std::chrono::seconds ttl);

    UploadSessionId id_;
    FileId file_id_;
    UserId owner_;
    std::uint64_t total_size_;
    std::uint64_t chunk_size_;
    std::uint64_t total_chunks_;
    std::set<std::uint64_t> uploaded_chunks_;
    TimePoint created_at_;
    TimePoint expires_at_;
    std::optional<TimePoint> completed_at_;
    std::optional<std::string> preferred_provider_;
    std::uint64_t version_ = 0;
};

} // namespace strata::domain

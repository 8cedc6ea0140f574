/**
 * @file chunked_upload_service.hpp
 * @brief Resumable multi-chunk uploads for files too large for one request
 *
 * WHY THIS FILE EXISTS:
 * A phone on a bad connection cannot push a 2 GB video in one go. The client
 * opens a session, sends fixed-size chunks in any order (and as often as it
 * likes), then asks for completion. Only at completion do the bytes travel
 * to a storage backend.
 *
 * LIFECYCLE:
 * open_session     -> Pending File with a provisional hash + UploadSession,
 *                     staging file pre-sized on local disk
 * upload_chunk     -> bytes written at index * chunk_size, index recorded
 * complete_session -> staging file hashed; duplicate or upload + Completed
 * expire_stale_sessions -> abandoned sessions cleaned up
 *
 * Chunk uploads for one session may race. Recording an index is idempotent,
 * so a writer that loses the version check re-reads the session and applies
 * its index again.
 */

#pragma once

#include "strata/core/cancellation.hpp"
#include "strata/core/config.hpp"
#include "strata/domain/file.hpp"
#include "strata/domain/ids.hpp"
#include "strata/domain/upload_session.hpp"
#include "strata/orchestration/chunk_staging.hpp"
#include "strata/orchestration/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace strata::orchestration {

struct OpenSessionRequest {
    domain::UserId owner;
    std::string file_name;
    std::string mime_type;
    std::uint64_t total_size = 0;
    TimePoint captured_at;
    std::optional<std::uint64_t> chunk_size;          ///< configured default when empty
    std::optional<std::string> preferred_provider;
};

struct OpenSessionResult {
    domain::UploadSessionId session_id;
    domain::FileId file_id;
    std::uint64_t chunk_size = 0;
    std::uint64_t total_chunks = 0;
    TimePoint expires_at;
};

struct ChunkReceipt {
    std::uint64_t chunk_index = 0;
    int progress = 0;
    bool complete = false;
};

struct SessionStatus {
    domain::UploadSessionId session_id;
    domain::FileId file_id;
    int progress = 0;
    std::uint64_t total_chunks = 0;
    std::vector<std::uint64_t> uploaded_chunks;   ///< ascending
    bool complete = false;
    bool completed = false;
    bool expired = false;
    TimePoint created_at;
    TimePoint expires_at;
};

class ChunkedUploadService {
public:
    static constexpr int kMaxConflictAttempts = 5;

    ChunkedUploadService(Collaborators collaborators, core::ChunkedConfig config = {});

    Result<OpenSessionResult> open_session(const OpenSessionRequest& request,
                                           const CancellationToken& token = {});

    /**
     * @brief Store one chunk
     *
     * ERRORS:
     * - NotFound: unknown session
     * - AlreadyCompleted / Expired / IndexOutOfRange: session rules
     * - InvalidArgument: byte count differs from the chunk's expected length
     * - Conflict: the session kept changing underneath for every attempt
     */
    Result<ChunkReceipt> upload_chunk(const domain::UploadSessionId& session_id,
                                      std::int64_t chunk_index,
                                      const std::vector<std::uint8_t>& bytes,
                                      const CancellationToken& token = {});

    Result<UploadOutcome> complete_session(const domain::UploadSessionId& session_id,
                                           const CancellationToken& token = {});

    Result<SessionStatus> session_status(const domain::UploadSessionId& session_id) const;

    /// Number of sessions cleaned up
    Result<std::size_t> expire_stale_sessions(const CancellationToken& token = {});

    [[nodiscard]] const ChunkStaging& staging() const noexcept { return staging_; }

private:
    Result<UploadOutcome> finish_as_duplicate(metadata::UnitOfWork& unit,
                                              domain::File placeholder,
                                              domain::UploadSession session,
                                              const domain::File& existing);

    void discard_staging(const domain::UploadSessionId& session_id) const;

    Collaborators collaborators_;
    core::ChunkedConfig config_;
    ChunkStaging staging_;
};

} // namespace strata::orchestration

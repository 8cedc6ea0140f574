#include "strata/domain/upload_session.hpp"

#include <string>

namespace strata::domain {

UploadSession::UploadSession(UploadSessionId id, FileId file_id, UserId owner,
                             std::uint64_t total_size, std::uint64_t chunk_size,
                             TimePoint now, std::chrono::seconds ttl)
    : id_(std::move(id)),
      file_id_(std::move(file_id)),
      owner_(std::move(owner)),
      total_size_(total_size),
      chunk_size_(chunk_size),
      total_chunks_(total_size / chunk_size + (total_size % chunk_size != 0 ? 1 : 0)),
      created_at_(now),
      expires_at_(now + ttl) {}

Result<UploadSession> UploadSession::create(FileId file_id,
                                            UserId owner,
                                            std::uint64_t total_size,
                                            std::uint64_t chunk_size,
                                            TimePoint now,
                                            std::chrono::seconds ttl) {
    if (total_size == 0) {
        return Err<UploadSession>(ErrorKind::InvalidArgument, "Total size must be positive");
    }
    if (chunk_size == 0) {
        return Err<UploadSession>(ErrorKind::InvalidArgument, "Chunk size must be positive");
    }
    if (ttl.count() <= 0) {
        return Err<UploadSession>(ErrorKind::InvalidArgument, "Session lifetime must be positive");
    }
    return Ok(UploadSession(UploadSessionId::generate(), std::move(file_id), std::move(owner),
                            total_size, chunk_size, now, ttl));
}

std::uint64_t UploadSession::chunk_length(std::uint64_t index) const noexcept {
    if (index >= total_chunks_) {
        return 0;
    }
    if (index + 1 < total_chunks_) {
        return chunk_size_;
    }
    return total_size_ - index * chunk_size_;
}

int UploadSession::progress() const noexcept {
    if (total_chunks_ == 0) {
        return 0;
    }
    return static_cast<int>((uploaded_chunks_.size() * 100) / total_chunks_);
}

bool UploadSession::is_complete() const noexcept {
    return uploaded_chunks_.size() == total_chunks_;
}

bool UploadSession::is_expired(TimePoint now) const noexcept {
    return now > expires_at_ && !completed_at_.has_value();
}

Result<void> UploadSession::mark_chunk_uploaded(std::int64_t index, TimePoint now) {
    if (completed_at_) {
        return Err<void>(ErrorKind::AlreadyCompleted, "Cannot modify completed session");
    }
    if (is_expired(now)) {
        return Err<void>(ErrorKind::Expired, "Session has expired");
    }
    if (index < 0 || static_cast<std::uint64_t>(index) >= total_chunks_) {
        return Err<void>(ErrorKind::IndexOutOfRange,
                         "Chunk index must be between 0 and " + std::to_string(total_chunks_ - 1));
    }
    uploaded_chunks_.insert(static_cast<std::uint64_t>(index));
    return Ok();
}

Result<void> UploadSession::complete(TimePoint now) {
    if (completed_at_) {
        return Err<void>(ErrorKind::AlreadyCompleted, "Session already completed");
    }
    if (is_expired(now)) {
        return Err<void>(ErrorKind::Expired, "Session has expired");
    }
    if (!is_complete()) {
        return Err<void>(ErrorKind::IncompleteChunks,
                         "Cannot complete session with missing chunks (" +
                         std::to_string(uploaded_chunks_.size()) + "/" +
                         std::to_string(total_chunks_) + " uploaded)");
    }
    completed_at_ = now;
    return Ok();
}

} // namespace strata::domain

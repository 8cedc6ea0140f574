#pragma once

#include "strata/core/clock.hpp"
#include "strata/core/result.hpp"
#include "strata/domain/domain_events.hpp"
#include "strata/domain/file_metadata.hpp"
#include "strata/domain/file_size.hpp"
#include "strata/domain/file_type.hpp"
#include "strata/domain/ids.hpp"
#include "strata/domain/storage_location.hpp"
#include "strata/domain/upload_status.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace strata::domain {

/**
 * @brief Aggregate root for a stored file
 *
 * INVARIANTS:
 * - location() is empty until the status has reached Completed
 * - once Archived the file rejects every mutation with InvalidTransition
 * - status changes only go through UploadStatus::transition_to
 *
 * Each mutating call returns the domain event it raised instead of
 * publishing it. version() is the optimistic-concurrency token owned by the
 * metadata store; the aggregate only carries it.
 */
class File {
public:
    struct Created;

    static Created create(UserId owner, FileMetadata metadata, FileSize size, FileType type, TimePoint now);

    [[nodiscard]] const FileId& id() const noexcept { return id_; }
    [[nodiscard]] const UserId& owner() const noexcept { return owner_; }
    [[nodiscard]] const FileMetadata& metadata() const noexcept { return metadata_; }
    [[nodiscard]] FileMetadata& metadata() noexcept { return metadata_; }
    [[nodiscard]] const FileSize& size() const noexcept { return size_; }
    [[nodiscard]] const FileType& type() const noexcept { return type_; }
    [[nodiscard]] const UploadStatus& status() const noexcept { return status_; }
    [[nodiscard]] const std::optional<StorageLocation>& location() const noexcept { return location_; }
    [[nodiscard]] const std::optional<StorageLocation>& thumbnail_location() const noexcept {
        return thumbnail_location_;
    }
    [[nodiscard]] int upload_progress() const noexcept { return upload_progress_; }
    /// Set while the status is Failed
    [[nodiscard]] const std::optional<std::string>& failure_reason() const noexcept { return failure_reason_; }
    [[nodiscard]] std::uint64_t version() const noexcept { return version_; }

    void set_version(std::uint64_t version) noexcept { version_ = version; }

    [[nodiscard]] bool is_archived() const noexcept { return status_.is(UploadState::Archived); }

    Result<DomainEvent> start_upload(TimePoint now);

    /// InvalidArgument unless 0 <= progress <= 100
    Result<void> update_progress(int progress);

    Result<DomainEvent> complete_upload(StorageLocation location, TimePoint now);

    Result<void> set_thumbnail(StorageLocation location);

    /// Requires a location; Completed -> Archived
    Result<DomainEvent> mark_archived(TimePoint now);

    Result<DomainEvent> mark_failed(std::string reason, TimePoint now);

    /// Failed -> Pending; progress, failure reason and both locations reset
    Result<void> retry(TimePoint now);

    /// Replaces a provisional hash; refused once the upload has completed
    Result<void> assign_content_hash(const std::string& content_hash, TimePoint now);

private:
    File(FileId id, UserId owner, FileMetadata metadata, FileSize size, FileType type, TimePoint now);

    Result<void> ensure_not_archived() const;
    Result<void> move_to(UploadState target, TimePoint now);

    FileId id_;
    UserId owner_;
    FileMetadata metadata_;
    FileSize size_;
    FileType type_;
    UploadStatus status_;
    std::optional<StorageLocation> location_;
    std::optional<StorageLocation> thumbnail_location_;
    std::optional<std::string> failure_reason_;
    int upload_progress_ = 0;
    std::uint64_t version_ = 0;
};

struct File::Created {
    File file;
    DomainEvent event;
};

} // namespace strata::domain

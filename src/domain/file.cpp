#include "strata/domain/file.hpp"

namespace strata::domain {

File::File(FileId id, UserId owner, FileMetadata metadata, FileSize size, FileType type, TimePoint now)
    : id_(std::move(id)),
      owner_(std::move(owner)),
      metadata_(std::move(metadata)),
      size_(size),
      type_(std::move(type)),
      status_(UploadStatus::pending(now)) {}

File::Created File::create(UserId owner, FileMetadata metadata, FileSize size, FileType type, TimePoint now) {
    File file(FileId::generate(), owner, std::move(metadata), size, std::move(type), now);
    DomainEvent event = FileCreated{file.id(), std::move(owner), now};
    return Created{std::move(file), std::move(event)};
}

Result<void> File::ensure_not_archived() const {
    if (is_archived()) {
        return Err<void>(ErrorKind::InvalidTransition, "Cannot modify archived file " + id_.str());
    }
    return Ok();
}

Result<void> File::move_to(UploadState target, TimePoint now) {
    auto next = status_.transition_to(target, now);
    if (next.is_error()) {
        return Err<void, Error>(next.error());
    }
    status_ = next.value();
    return Ok();
}

Result<DomainEvent> File::start_upload(TimePoint now) {
    if (auto guard = ensure_not_archived(); guard.is_error()) {
        return Err<DomainEvent, Error>(guard.error());
    }
    if (auto moved = move_to(UploadState::Uploading, now); moved.is_error()) {
        return Err<DomainEvent, Error>(moved.error());
    }
    return Ok(DomainEvent(FileUploadStarted{id_, now}));
}

Result<void> File::update_progress(int progress) {
    if (auto guard = ensure_not_archived(); guard.is_error()) {
        return guard;
    }
    if (progress < 0 || progress > 100) {
        return Err<void>(ErrorKind::InvalidArgument, "Progress must be between 0 and 100");
    }
    upload_progress_ = progress;
    return Ok();
}

Result<DomainEvent> File::complete_upload(StorageLocation location, TimePoint now) {
    if (auto guard = ensure_not_archived(); guard.is_error()) {
        return Err<DomainEvent, Error>(guard.error());
    }
    if (auto moved = move_to(UploadState::Completed, now); moved.is_error()) {
        return Err<DomainEvent, Error>(moved.error());
    }
    location_ = location;
    upload_progress_ = 100;
    return Ok(DomainEvent(FileUploadCompleted{id_, std::move(location), size_.bytes(), now}));
}

Result<void> File::set_thumbnail(StorageLocation location) {
    if (auto guard = ensure_not_archived(); guard.is_error()) {
        return guard;
    }
    thumbnail_location_ = std::move(location);
    return Ok();
}

Result<DomainEvent> File::mark_archived(TimePoint now) {
    if (!location_) {
        return Err<DomainEvent>(ErrorKind::InvalidTransition,
                                "Cannot archive file without a storage location");
    }
    if (auto moved = move_to(UploadState::Archived, now); moved.is_error()) {
        return Err<DomainEvent, Error>(moved.error());
    }
    return Ok(DomainEvent(FileArchived{id_, *location_, now}));
}

Result<DomainEvent> File::mark_failed(std::string reason, TimePoint now) {
    if (auto moved = move_to(UploadState::Failed, now); moved.is_error()) {
        return Err<DomainEvent, Error>(moved.error());
    }
    failure_reason_ = reason;
    return Ok(DomainEvent(FileUploadFailed{id_, std::move(reason), now}));
}

Result<void> File::retry(TimePoint now) {
    if (!status_.is(UploadState::Failed)) {
        return Err<void>(ErrorKind::InvalidTransition,
                         std::string("Only failed uploads can be retried, file is ") +
                         to_string(status_.state()));
    }
    if (auto moved = move_to(UploadState::Pending, now); moved.is_error()) {
        return moved;
    }
    upload_progress_ = 0;
    failure_reason_.reset();
    location_.reset();
    thumbnail_location_.reset();
    return Ok();
}

Result<void> File::assign_content_hash(const std::string& content_hash, TimePoint now) {
    if (auto guard = ensure_not_archived(); guard.is_error()) {
        return guard;
    }
    if (status_.is(UploadState::Completed)) {
        return Err<void>(ErrorKind::InvalidTransition, "Cannot change the content hash of a completed file");
    }
    return metadata_.replace_content_hash(content_hash, now);
}

} // namespace strata::domain

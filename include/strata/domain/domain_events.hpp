#pragma once

#include "strata/core/clock.hpp"
#include "strata/domain/ids.hpp"
#include "strata/domain/storage_location.hpp"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace strata::domain {

/**
 * @brief Facts raised by the File aggregate
 *
 * Mutating operations on File return the event they raised. The caller
 * collects them and hands them to the event bus after the unit of work has
 * committed, so listeners never observe state that was rolled back.
 */
struct FileCreated {
    FileId file_id;
    UserId owner;
    TimePoint occurred_at;
};

struct FileUploadStarted {
    FileId file_id;
    TimePoint occurred_at;
};

struct FileUploadCompleted {
    FileId file_id;
    StorageLocation location;
    std::uint64_t size_bytes;
    TimePoint occurred_at;
};

struct FileArchived {
    FileId file_id;
    StorageLocation location;
    TimePoint occurred_at;
};

struct FileUploadFailed {
    FileId file_id;
    std::string reason;
    TimePoint occurred_at;
};

using DomainEvent = std::variant<FileCreated, FileUploadStarted, FileUploadCompleted, FileArchived, FileUploadFailed>;

using DomainEvents = std::vector<DomainEvent>;

const char* event_name(const DomainEvent& event);

} // namespace strata::domain

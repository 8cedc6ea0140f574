/**
 * @file events.hpp
 * @brief Engine events published on the EventBus
 *
 * WHY THIS FILE EXISTS:
 * The File aggregate raises its own lifecycle events (see
 * strata/domain/domain_events.hpp); those are emitted on the bus as they are.
 * The events here describe what the orchestrators do around the aggregate:
 * duplicates short-circuited, chunk sessions, restores, downloads.
 *
 * NAMING CONVENTION:
 * Past tense, "Event" suffix. Every event carries the time it was created.
 */

#pragma once

#include "strata/core/clock.hpp"
#include "strata/domain/ids.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace strata::events {

// ════════════════════════════════════════════════════════
// Upload Events
// ════════════════════════════════════════════════════════

/**
 * @brief An upload matched stored content and was not written again
 *
 * WHO EMITS: FileUploadOrchestrator, ChunkedUploadService
 * WHO SUBSCRIBES: LoggerComponent, MetricsComponent
 */
struct DuplicateUploadDetectedEvent {
    domain::FileId existing_file;
    domain::UserId owner;
    std::string file_name;
    std::string content_hash;
    std::uint64_t bytes;
    TimePoint timestamp;

    DuplicateUploadDetectedEvent(domain::FileId existing, domain::UserId who, std::string name,
                                 std::string hash, std::uint64_t size)
        : existing_file(std::move(existing)),
          owner(std::move(who)),
          file_name(std::move(name)),
          content_hash(std::move(hash)),
          bytes(size),
          timestamp(Clock::now()) {}
};

/**
 * @brief A thumbnail could not be produced; the upload itself went ahead
 */
struct ThumbnailSkippedEvent {
    domain::FileId file_id;
    std::string reason;
    TimePoint timestamp;

    ThumbnailSkippedEvent(domain::FileId id, std::string why)
        : file_id(std::move(id)), reason(std::move(why)), timestamp(Clock::now()) {}
};

// ════════════════════════════════════════════════════════
// Chunked Session Events
// ════════════════════════════════════════════════════════

struct UploadSessionOpenedEvent {
    domain::UploadSessionId session_id;
    domain::FileId file_id;
    std::uint64_t total_bytes;
    std::uint64_t total_chunks;
    TimePoint timestamp;

    UploadSessionOpenedEvent(domain::UploadSessionId session, domain::FileId file,
                             std::uint64_t bytes, std::uint64_t chunks)
        : session_id(std::move(session)),
          file_id(std::move(file)),
          total_bytes(bytes),
          total_chunks(chunks),
          timestamp(Clock::now()) {}
};

struct ChunkReceivedEvent {
    domain::UploadSessionId session_id;
    std::uint64_t chunk_index;
    std::uint64_t total_chunks;
    std::uint64_t bytes;
    int progress;
    TimePoint timestamp;

    ChunkReceivedEvent(domain::UploadSessionId session, std::uint64_t index, std::uint64_t total,
                       std::uint64_t size, int percent)
        : session_id(std::move(session)),
          chunk_index(index),
          total_chunks(total),
          bytes(size),
          progress(percent),
          timestamp(Clock::now()) {}
};

struct UploadSessionCompletedEvent {
    domain::UploadSessionId session_id;
    domain::FileId file_id;
    bool duplicate;
    std::chrono::milliseconds duration;
    TimePoint timestamp;

    UploadSessionCompletedEvent(domain::UploadSessionId session, domain::FileId file, bool dup,
                                std::chrono::milliseconds dur)
        : session_id(std::move(session)),
          file_id(std::move(file)),
          duplicate(dup),
          duration(dur),
          timestamp(Clock::now()) {}
};

struct UploadSessionExpiredEvent {
    domain::UploadSessionId session_id;
    domain::FileId file_id;
    TimePoint timestamp;

    UploadSessionExpiredEvent(domain::UploadSessionId session, domain::FileId file)
        : session_id(std::move(session)), file_id(std::move(file)), timestamp(Clock::now()) {}
};

// ════════════════════════════════════════════════════════
// Retrieval Events
// ════════════════════════════════════════════════════════

struct RetrievalInitiatedEvent {
    domain::FileId file_id;
    std::string provider;
    std::string retrieval_id;
    std::string tier;
    TimePoint estimated_completion;
    TimePoint timestamp;

    RetrievalInitiatedEvent(domain::FileId file, std::string provider_name, std::string id,
                            std::string tier_name, TimePoint eta)
        : file_id(std::move(file)),
          provider(std::move(provider_name)),
          retrieval_id(std::move(id)),
          tier(std::move(tier_name)),
          estimated_completion(eta),
          timestamp(Clock::now()) {}
};

struct FileDownloadStartedEvent {
    domain::FileId file_id;
    std::string provider;
    std::uint64_t bytes;
    TimePoint timestamp;

    FileDownloadStartedEvent(domain::FileId file, std::string provider_name, std::uint64_t size)
        : file_id(std::move(file)), provider(std::move(provider_name)), bytes(size), timestamp(Clock::now()) {}
};

} // namespace strata::events

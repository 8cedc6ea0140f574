/**
 * @file components.hpp
 * @brief Event-driven observers of the engine
 *
 * WHY THIS FILE EXISTS:
 * Logging and counting are cross-cutting. Instead of sprinkling them through
 * the orchestrators, these components subscribe to the bus and react.
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // every published event is now logged and counted
 *
 * Both components unsubscribe when destroyed; the bus must outlive them.
 */

#pragma once

#include "strata/core/clock.hpp"
#include "strata/domain/domain_events.hpp"
#include "strata/events/event_bus.hpp"
#include "strata/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <vector>

namespace strata::events {

namespace detail {

/// Subscriptions that are dropped together
class SubscriptionSet {
public:
    explicit SubscriptionSet(EventBus& bus) : bus_(bus) {}

    SubscriptionSet(const SubscriptionSet&) = delete;
    SubscriptionSet& operator=(const SubscriptionSet&) = delete;

    ~SubscriptionSet() {
        for (auto& drop : drops_) {
            drop();
        }
    }

    template<typename EventType>
    void add(std::function<void(const EventType&)> handler) {
        const std::size_t id = bus_.subscribe<EventType>(std::move(handler));
        drops_.push_back([this, id] { bus_.unsubscribe<EventType>(id); });
    }

private:
    EventBus& bus_;
    std::vector<std::function<void()>> drops_;
};

} // namespace detail

/**
 * @brief Logs every engine event in "[Name] key=value" form
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : subscriptions_(bus) {
        subscriptions_.add<domain::FileCreated>([](const domain::FileCreated& e) {
            spdlog::info("[FileCreated] file={} owner={}", e.file_id.str(), e.owner.str());
        });
        subscriptions_.add<domain::FileUploadStarted>([](const domain::FileUploadStarted& e) {
            spdlog::debug("[UploadStarted] file={}", e.file_id.str());
        });
        subscriptions_.add<domain::FileUploadCompleted>([](const domain::FileUploadCompleted& e) {
            spdlog::info("[UploadCompleted] file={} location={} bytes={}",
                         e.file_id.str(), e.location.to_string(), e.size_bytes);
        });
        subscriptions_.add<domain::FileArchived>([](const domain::FileArchived& e) {
            spdlog::info("[FileArchived] file={} location={}", e.file_id.str(), e.location.to_string());
        });
        subscriptions_.add<domain::FileUploadFailed>([](const domain::FileUploadFailed& e) {
            spdlog::warn("[UploadFailed] file={} reason={}", e.file_id.str(), e.reason);
        });
        subscriptions_.add<DuplicateUploadDetectedEvent>([](const DuplicateUploadDetectedEvent& e) {
            spdlog::info("[DuplicateDetected] existing={} owner={} name={} hash={}",
                         e.existing_file.str(), e.owner.str(), e.file_name, e.content_hash);
        });
        subscriptions_.add<ThumbnailSkippedEvent>([](const ThumbnailSkippedEvent& e) {
            spdlog::warn("[ThumbnailSkipped] file={} reason={}", e.file_id.str(), e.reason);
        });
        subscriptions_.add<UploadSessionOpenedEvent>([](const UploadSessionOpenedEvent& e) {
            spdlog::info("[SessionOpened] session={} file={} bytes={} chunks={}",
                         e.session_id.str(), e.file_id.str(), e.total_bytes, e.total_chunks);
        });
        subscriptions_.add<ChunkReceivedEvent>([](const ChunkReceivedEvent& e) {
            spdlog::debug("[ChunkReceived] session={} chunk={}/{} bytes={} progress={}%",
                          e.session_id.str(), e.chunk_index + 1, e.total_chunks, e.bytes, e.progress);
        });
        subscriptions_.add<UploadSessionCompletedEvent>([](const UploadSessionCompletedEvent& e) {
            spdlog::info("[SessionCompleted] session={} file={} duplicate={} duration={}ms",
                         e.session_id.str(), e.file_id.str(), e.duplicate, e.duration.count());
        });
        subscriptions_.add<UploadSessionExpiredEvent>([](const UploadSessionExpiredEvent& e) {
            spdlog::info("[SessionExpired] session={} file={}", e.session_id.str(), e.file_id.str());
        });
        subscriptions_.add<RetrievalInitiatedEvent>([](const RetrievalInitiatedEvent& e) {
            spdlog::info("[RetrievalInitiated] file={} provider={} retrieval={} tier={} eta={}",
                         e.file_id.str(), e.provider, e.retrieval_id, e.tier, format_time(e.estimated_completion));
        });
        subscriptions_.add<FileDownloadStartedEvent>([](const FileDownloadStartedEvent& e) {
            spdlog::info("[DownloadStarted] file={} provider={} bytes={}", e.file_id.str(), e.provider, e.bytes);
        });
    }

private:
    detail::SubscriptionSet subscriptions_;
};

/**
 * @brief Counts engine activity for monitoring
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * const auto& stats = metrics.get_stats();
 * spdlog::info("uploads: {}", stats.files_uploaded.load());
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<std::uint64_t> files_created{0};
        std::atomic<std::uint64_t> files_uploaded{0};
        std::atomic<std::uint64_t> bytes_uploaded{0};
        std::atomic<std::uint64_t> uploads_failed{0};
        std::atomic<std::uint64_t> duplicates_detected{0};
        std::atomic<std::uint64_t> bytes_deduplicated{0};
        std::atomic<std::uint64_t> thumbnails_skipped{0};
        std::atomic<std::uint64_t> sessions_opened{0};
        std::atomic<std::uint64_t> sessions_completed{0};
        std::atomic<std::uint64_t> sessions_expired{0};
        std::atomic<std::uint64_t> chunks_received{0};
        std::atomic<std::uint64_t> files_archived{0};
        std::atomic<std::uint64_t> retrievals_initiated{0};
        std::atomic<std::uint64_t> downloads_started{0};
    };

    explicit MetricsComponent(EventBus& bus) : subscriptions_(bus) {
        subscriptions_.add<domain::FileCreated>([this](const domain::FileCreated&) { stats_.files_created++; });
        subscriptions_.add<domain::FileUploadCompleted>([this](const domain::FileUploadCompleted& e) {
            stats_.files_uploaded++;
            stats_.bytes_uploaded += e.size_bytes;
        });
        subscriptions_.add<domain::FileUploadFailed>([this](const domain::FileUploadFailed&) {
            stats_.uploads_failed++;
        });
        subscriptions_.add<domain::FileArchived>([this](const domain::FileArchived&) { stats_.files_archived++; });
        subscriptions_.add<DuplicateUploadDetectedEvent>([this](const DuplicateUploadDetectedEvent& e) {
            stats_.duplicates_detected++;
            stats_.bytes_deduplicated += e.bytes;
        });
        subscriptions_.add<ThumbnailSkippedEvent>([this](const ThumbnailSkippedEvent&) {
            stats_.thumbnails_skipped++;
        });
        subscriptions_.add<UploadSessionOpenedEvent>([this](const UploadSessionOpenedEvent&) {
            stats_.sessions_opened++;
        });
        subscriptions_.add<ChunkReceivedEvent>([this](const ChunkReceivedEvent&) { stats_.chunks_received++; });
        subscriptions_.add<UploadSessionCompletedEvent>([this](const UploadSessionCompletedEvent&) {
            stats_.sessions_completed++;
        });
        subscriptions_.add<UploadSessionExpiredEvent>([this](const UploadSessionExpiredEvent&) {
            stats_.sessions_expired++;
        });
        subscriptions_.add<RetrievalInitiatedEvent>([this](const RetrievalInitiatedEvent&) {
            stats_.retrievals_initiated++;
        });
        subscriptions_.add<FileDownloadStartedEvent>([this](const FileDownloadStartedEvent&) {
            stats_.downloads_started++;
        });
    }

    const Stats& get_stats() const { return stats_; }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Engine Statistics:");
        spdlog::info("  Files created:      {}", stats_.files_created.load());
        spdlog::info("  Files uploaded:     {}", stats_.files_uploaded.load());
        spdlog::info("  Bytes uploaded:     {}", stats_.bytes_uploaded.load());
        spdlog::info("  Uploads failed:     {}", stats_.uploads_failed.load());
        spdlog::info("  Duplicates:         {}", stats_.duplicates_detected.load());
        spdlog::info("  Bytes deduplicated: {}", stats_.bytes_deduplicated.load());
        spdlog::info("  Thumbnails skipped: {}", stats_.thumbnails_skipped.load());
        spdlog::info("  Sessions opened:    {}", stats_.sessions_opened.load());
        spdlog::info("  Sessions completed: {}", stats_.sessions_completed.load());
        spdlog::info("  Sessions expired:   {}", stats_.sessions_expired.load());
        spdlog::info("  Chunks received:    {}", stats_.chunks_received.load());
        spdlog::info("  Files archived:     {}", stats_.files_archived.load());
        spdlog::info("  Retrievals:         {}", stats_.retrievals_initiated.load());
        spdlog::info("  Downloads:          {}", stats_.downloads_started.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    Stats stats_;
    detail::SubscriptionSet subscriptions_;
};

} // namespace strata::events

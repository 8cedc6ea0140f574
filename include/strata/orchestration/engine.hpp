/**
 * @file engine.hpp
 * @brief Composition root: one object that owns the whole engine
 *
 * WHY THIS FILE EXISTS:
 * The orchestrators take their collaborators by injection. Something has to
 * build those collaborators from configuration, wire up logging and metrics,
 * and give callers one place to call. That is StorageEngine.
 *
 * WHAT IT OWNS:
 * - Provider registry built by ProviderFactory from config.providers
 * - ProviderSelector with the configured tier mapping
 * - Metadata store (InMemoryMetadataStore unless one is injected)
 * - Hash service (Sha256HashService unless one is injected)
 * - EventBus with LoggerComponent and MetricsComponent attached
 * - FileUploadOrchestrator, ChunkedUploadService, RetrievalOrchestrator
 * - A Boost.Asio thread_pool running the *_async variants
 *
 * EXAMPLE:
 * auto engine = StorageEngine::create(config);
 * if (engine.is_error()) { ... }
 * auto outcome = engine.value()->upload(request, stream);
 *
 * The destructor waits for queued async work to finish.
 */

#pragma once

#include "strata/core/config.hpp"
#include "strata/events/components.hpp"
#include "strata/events/event_bus.hpp"
#include "strata/orchestration/chunked_upload_service.hpp"
#include "strata/orchestration/retrieval_orchestrator.hpp"
#include "strata/orchestration/upload_orchestrator.hpp"
#include "strata/storage/provider_registry.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <functional>
#include <future>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

namespace strata::orchestration {

struct ProviderHealth {
    std::string provider;
    storage::HealthStatus status;
};

struct StorageEngineOptions {
    std::shared_ptr<services::ThumbnailService> thumbnails;
    std::shared_ptr<services::HashService> hasher;
    std::shared_ptr<metadata::MetadataStore> store;
    ClockFn clock = system_clock_fn();
    /// Extra provider kinds, registered before the registry is built
    std::function<void(storage::ProviderFactory&)> register_kinds;
};

class StorageEngine {
    struct ConstructionKey {
        explicit ConstructionKey() = default;
    };

public:
    using Options = StorageEngineOptions;

    static Result<std::unique_ptr<StorageEngine>> create(core::EngineConfig config, Options options = {});

    StorageEngine(ConstructionKey, core::EngineConfig config, Collaborators collaborators);

    ~StorageEngine();

    StorageEngine(const StorageEngine&) = delete;
    StorageEngine& operator=(const StorageEngine&) = delete;

    // ════════════════════════════════════════════════════════
    // Synchronous operations
    // ════════════════════════════════════════════════════════

    Result<UploadOutcome> upload(const UploadRequest& request, std::istream& data,
                                 const CancellationToken& token = {});

    Result<OpenSessionResult> open_session(const OpenSessionRequest& request, const CancellationToken& token = {});

    Result<ChunkReceipt> upload_chunk(const domain::UploadSessionId& session_id, std::int64_t chunk_index,
                                      const std::vector<std::uint8_t>& bytes, const CancellationToken& token = {});

    Result<UploadOutcome> complete_session(const domain::UploadSessionId& session_id,
                                           const CancellationToken& token = {});

    Result<SessionStatus> session_status(const domain::UploadSessionId& session_id) const;

    Result<std::size_t> expire_stale_sessions(const CancellationToken& token = {});

    Result<RetrievalRequestResult> initiate_retrieval(const domain::FileId& file_id, storage::RetrievalTier tier,
                                                      const CancellationToken& token = {});

    Result<storage::RetrievalStatusDetail> check_retrieval_status(const std::string& retrieval_id,
                                                                  const CancellationToken& token = {});

    Result<DownloadResult> download(const domain::FileId& file_id, const CancellationToken& token = {});

    Result<void> archive(const domain::FileId& file_id, const CancellationToken& token = {});

    // ════════════════════════════════════════════════════════
    // Asynchronous operations (run on the worker pool)
    // ════════════════════════════════════════════════════════

    std::future<Result<UploadOutcome>> upload_async(UploadRequest request, std::shared_ptr<std::istream> data,
                                                    CancellationToken token = {});

    std::future<Result<ChunkReceipt>> upload_chunk_async(domain::UploadSessionId session_id,
                                                         std::int64_t chunk_index,
                                                         std::vector<std::uint8_t> bytes,
                                                         CancellationToken token = {});

    std::future<Result<UploadOutcome>> complete_session_async(domain::UploadSessionId session_id,
                                                              CancellationToken token = {});

    std::future<Result<RetrievalRequestResult>> initiate_retrieval_async(domain::FileId file_id,
                                                                         storage::RetrievalTier tier,
                                                                         CancellationToken token = {});

    std::future<Result<DownloadResult>> download_async(domain::FileId file_id, CancellationToken token = {});

    std::future<Result<void>> archive_async(domain::FileId file_id, CancellationToken token = {});

    // ════════════════════════════════════════════════════════
    // Introspection
    // ════════════════════════════════════════════════════════

    std::vector<ProviderHealth> provider_health(const CancellationToken& token = {}) const;

    [[nodiscard]] const events::MetricsComponent::Stats& metrics() const { return metrics_->get_stats(); }
    void print_stats() const { metrics_->print_stats(); }

    [[nodiscard]] events::EventBus& bus() noexcept { return *bus_; }
    [[nodiscard]] const storage::ProviderRegistry& registry() const noexcept { return *registry_; }
    [[nodiscard]] std::shared_ptr<metadata::MetadataStore> store() const noexcept { return store_; }
    [[nodiscard]] const core::EngineConfig& config() const noexcept { return config_; }

private:
    template<typename Fn>
    auto submit(Fn fn) -> std::future<std::invoke_result_t<Fn&>> {
        using R = std::invoke_result_t<Fn&>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::move(fn));
        auto future = task->get_future();
        boost::asio::post(pool_, [task] { (*task)(); });
        return future;
    }

    core::EngineConfig config_;
    std::shared_ptr<events::EventBus> bus_;
    std::unique_ptr<events::LoggerComponent> logger_;
    std::unique_ptr<events::MetricsComponent> metrics_;
    std::shared_ptr<const storage::ProviderRegistry> registry_;
    std::shared_ptr<metadata::MetadataStore> store_;

    FileUploadOrchestrator uploads_;
    ChunkedUploadService chunked_;
    RetrievalOrchestrator retrievals_;

    boost::asio::thread_pool pool_;
};

} // namespace strata::orchestration

#include "strata/orchestration/engine.hpp"

#include "strata/core/logging.hpp"
#include "strata/metadata/in_memory_store.hpp"
#include "strata/storage/provider_selector.hpp"

#include <spdlog/spdlog.h>

namespace strata::orchestration {

Result<std::unique_ptr<StorageEngine>> StorageEngine::create(core::EngineConfig config, Options options) {
    using EnginePtr = std::unique_ptr<StorageEngine>;

    core::configure_logging(config.logging);

    if (config.worker_threads == 0) {
        return Err<EnginePtr>(ErrorKind::InvalidArgument, "engine.worker_threads must be at least 1");
    }
    if (!options.clock) {
        options.clock = system_clock_fn();
    }

    storage::ProviderFactory factory(options.clock);
    if (options.register_kinds) {
        options.register_kinds(factory);
    }

    auto built = factory.build_registry(config.providers);
    if (built.is_error()) {
        spdlog::error("Provider setup failed: {}", built.error().message);
        return Err<EnginePtr, Error>(built.error());
    }
    auto registry = std::make_shared<const storage::ProviderRegistry>(std::move(built.value()));

    auto selector = storage::ProviderSelector::create(registry, storage::TierMapping::from_config(config.tiers));
    if (selector.is_error()) {
        spdlog::error("Provider setup failed: {}", selector.error().message);
        return Err<EnginePtr, Error>(selector.error());
    }

    Collaborators collaborators;
    collaborators.store = options.store;
    if (!collaborators.store) {
        metadata::InMemoryMetadataStore::Options store_options;
        store_options.enforce_unique_hash = config.upload.enforce_unique_hash;
        collaborators.store = std::make_shared<metadata::InMemoryMetadataStore>(store_options);
    }
    collaborators.registry = registry;
    collaborators.selector = std::make_shared<const storage::ProviderSelector>(std::move(selector.value()));
    collaborators.hasher = options.hasher ? options.hasher : std::make_shared<services::Sha256HashService>();
    collaborators.thumbnails = options.thumbnails;
    collaborators.bus = std::make_shared<events::EventBus>();
    collaborators.clock = options.clock;

    spdlog::info("Storage engine ready: {} provider(s), {} worker thread(s)",
                 registry->size(), config.worker_threads);

    return Ok(std::make_unique<StorageEngine>(ConstructionKey{}, std::move(config), std::move(collaborators)));
}

StorageEngine::StorageEngine(ConstructionKey, core::EngineConfig config, Collaborators collaborators)
    : config_(std::move(config)),
      bus_(collaborators.bus),
      logger_(std::make_unique<events::LoggerComponent>(*bus_)),
      metrics_(std::make_unique<events::MetricsComponent>(*bus_)),
      registry_(collaborators.registry),
      store_(collaborators.store),
      uploads_(collaborators, config_.upload, config_.thumbnail),
      chunked_(collaborators, config_.chunked),
      retrievals_(collaborators),
      pool_(config_.worker_threads) {}

StorageEngine::~StorageEngine() {
    pool_.join();
}

Result<UploadOutcome> StorageEngine::upload(const UploadRequest& request, std::istream& data,
                                            const CancellationToken& token) {
    return uploads_.upload(request, data, token);
}

Result<OpenSessionResult> StorageEngine::open_session(const OpenSessionRequest& request,
                                                      const CancellationToken& token) {
    return chunked_.open_session(request, token);
}

Result<ChunkReceipt> StorageEngine::upload_chunk(const domain::UploadSessionId& session_id, std::int64_t chunk_index,
                                                 const std::vector<std::uint8_t>& bytes,
                                                 const CancellationToken& token) {
    return chunked_.upload_chunk(session_id, chunk_index, bytes, token);
}

Result<UploadOutcome> StorageEngine::complete_session(const domain::UploadSessionId& session_id,
                                                      const CancellationToken& token) {
    return chunked_.complete_session(session_id, token);
}

Result<SessionStatus> StorageEngine::session_status(const domain::UploadSessionId& session_id) const {
    return chunked_.session_status(session_id);
}

Result<std::size_t> StorageEngine::expire_stale_sessions(const CancellationToken& token) {
    return chunked_.expire_stale_sessions(token);
}

Result<RetrievalRequestResult> StorageEngine::initiate_retrieval(const domain::FileId& file_id,
                                                                 storage::RetrievalTier tier,
                                                                 const CancellationToken& token) {
    return retrievals_.initiate_retrieval(file_id, tier, token);
}

Result<storage::RetrievalStatusDetail> StorageEngine::check_retrieval_status(const std::string& retrieval_id,
                                                                             const CancellationToken& token) {
    return retrievals_.check_status(retrieval_id, token);
}

Result<DownloadResult> StorageEngine::download(const domain::FileId& file_id, const CancellationToken& token) {
    return retrievals_.download(file_id, token);
}

Result<void> StorageEngine::archive(const domain::FileId& file_id, const CancellationToken& token) {
    return retrievals_.archive(file_id, token);
}

std::future<Result<UploadOutcome>> StorageEngine::upload_async(UploadRequest request,
                                                               std::shared_ptr<std::istream> data,
                                                               CancellationToken token) {
    return submit([this, request = std::move(request), data = std::move(data), token = std::move(token)] {
        if (!data) {
            return Err<UploadOutcome>(ErrorKind::InvalidArgument, "Upload stream is required");
        }
        return uploads_.upload(request, *data, token);
    });
}

std::future<Result<ChunkReceipt>> StorageEngine::upload_chunk_async(domain::UploadSessionId session_id,
                                                                    std::int64_t chunk_index,
                                                                    std::vector<std::uint8_t> bytes,
                                                                    CancellationToken token) {
    return submit([this, session_id = std::move(session_id), chunk_index, bytes = std::move(bytes),
                   token = std::move(token)] {
        return chunked_.upload_chunk(session_id, chunk_index, bytes, token);
    });
}

std::future<Result<UploadOutcome>> StorageEngine::complete_session_async(domain::UploadSessionId session_id,
                                                                         CancellationToken token) {
    return submit([this, session_id = std::move(session_id), token = std::move(token)] {
        return chunked_.complete_session(session_id, token);
    });
}

std::future<Result<RetrievalRequestResult>> StorageEngine::initiate_retrieval_async(domain::FileId file_id,
                                                                                    storage::RetrievalTier tier,
                                                                                    CancellationToken token) {
    return submit([this, file_id = std::move(file_id), tier, token = std::move(token)] {
        return retrievals_.initiate_retrieval(file_id, tier, token);
    });
}

std::future<Result<DownloadResult>> StorageEngine::download_async(domain::FileId file_id, CancellationToken token) {
    return submit([this, file_id = std::move(file_id), token = std::move(token)] {
        return retrievals_.download(file_id, token);
    });
}

std::future<Result<void>> StorageEngine::archive_async(domain::FileId file_id, CancellationToken token) {
    return submit([this, file_id = std::move(file_id), token = std::move(token)] {
        return retrievals_.archive(file_id, token);
    });
}

std::vector<ProviderHealth> StorageEngine::provider_health(const CancellationToken& token) const {
    std::vector<ProviderHealth> report;
    for (const auto& provider : registry_->providers()) {
        auto status = provider->health_check(token);
        if (!status.healthy) {
            spdlog::warn("Provider {} unhealthy: {}", provider->name(), status.message);
        }
        report.push_back(ProviderHealth{provider->name(), std::move(status)});
    }
    return report;
}

} // namespace strata::orchestration

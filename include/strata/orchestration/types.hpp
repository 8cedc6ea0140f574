#pragma once

#include "strata/core/clock.hpp"
#include "strata/core/result.hpp"
#include "strata/domain/ids.hpp"
#include "strata/domain/storage_location.hpp"
#include "strata/events/event_bus.hpp"
#include "strata/metadata/repositories.hpp"
#include "strata/services/hash_service.hpp"
#include "strata/services/thumbnail_service.hpp"
#include "strata/storage/provider_registry.hpp"
#include "strata/storage/provider_selector.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace strata::orchestration {

/**
 * @brief Everything an orchestrator talks to
 *
 * store, registry, selector and hasher are required. thumbnails and bus may
 * be null, in which case thumbnailing and event publication are skipped.
 */
struct Collaborators {
    std::shared_ptr<metadata::MetadataStore> store;
    std::shared_ptr<const storage::ProviderRegistry> registry;
    std::shared_ptr<const storage::ProviderSelector> selector;
    std::shared_ptr<services::HashService> hasher;
    std::shared_ptr<services::ThumbnailService> thumbnails;
    std::shared_ptr<events::EventBus> bus;
    ClockFn clock = system_clock_fn();

    /// InvalidArgument naming the first missing required collaborator
    [[nodiscard]] Result<void> validate() const;
};

/**
 * @brief What a caller gets back from a finished upload
 *
 * On the duplicate path file_id is the existing file and nothing was
 * written to any backend.
 */
struct UploadOutcome {
    domain::FileId file_id;
    bool duplicate = false;
    std::optional<domain::StorageLocation> location;
    std::optional<domain::StorageLocation> thumbnail_location;
};

/**
 * @brief Maps a store failure onto the engine's error taxonomy
 *
 * Cancelled, Conflict and NotFound keep their kind; everything else becomes
 * PersistenceFailure with the store's message.
 */
Error persistence_error(const Error& store_error);

} // namespace strata::orchestration

#include "strata/storage/provider_selector.hpp"

#include <spdlog/spdlog.h>

namespace strata::storage {

TierMapping TierMapping::from_config(const core::TierConfig& config) {
    TierMapping mapping;
    mapping.deep_archive = config.deep_archive;
    mapping.flexible_retrieval = config.flexible_retrieval;
    mapping.standard = config.standard;
    return mapping;
}

const std::string& TierMapping::provider_for(domain::StorageTier tier) const noexcept {
    switch (tier) {
        case domain::StorageTier::DeepArchive: return deep_archive;
        case domain::StorageTier::FlexibleRetrieval: return flexible_retrieval;
        case domain::StorageTier::Standard: return standard;
    }
    return flexible_retrieval;
}

Result<ProviderSelector> ProviderSelector::create(std::shared_ptr<const ProviderRegistry> registry,
                                                  TierMapping mapping) {
    if (!registry || registry->empty()) {
        return Err<ProviderSelector>(ErrorKind::NoProvidersAvailable, "No storage providers available");
    }
    return Ok(ProviderSelector(std::move(registry), std::move(mapping)));
}

Result<ProviderPtr> ProviderSelector::select(domain::FileCategory category,
                                             const domain::FileSize& size,
                                             const std::optional<std::string>& preference) const {
    if (registry_->empty()) {
        return Err<ProviderPtr>(ErrorKind::NoProvidersAvailable, "No storage providers available");
    }

    if (preference && preference->find_first_not_of(" \t") != std::string::npos) {
        if (auto preferred = registry_->find(*preference)) {
            return Ok(std::move(preferred));
        }
        spdlog::debug("Preferred provider {} is not registered, selecting automatically", *preference);
    }

    const auto tier = domain::storage_tier_for(category);
    if (auto by_tier = registry_->find(mapping_.provider_for(tier))) {
        return Ok(std::move(by_tier));
    }

    spdlog::debug("No provider named {} for tier {} ({} bytes), using {}",
                  mapping_.provider_for(tier), domain::to_string(tier), size.bytes(),
                  registry_->providers().front()->name());
    return Ok(registry_->providers().front());
}

} // namespace strata::storage

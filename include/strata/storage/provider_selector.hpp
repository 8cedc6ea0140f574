#pragma once

#include "strata/core/config.hpp"
#include "strata/core/result.hpp"
#include "strata/domain/file_size.hpp"
#include "strata/domain/file_type.hpp"
#include "strata/storage/provider_registry.hpp"

#include <memory>
#include <optional>
#include <string>

namespace strata::storage {

/**
 * @brief Canonical provider name for each storage tier
 */
struct TierMapping {
    std::string deep_archive = "s3-glacier-deep";
    std::string flexible_retrieval = "s3-glacier-flexible";
    std::string standard = "s3-standard";

    static TierMapping from_config(const core::TierConfig& config);

    [[nodiscard]] const std::string& provider_for(domain::StorageTier tier) const noexcept;
};

/**
 * @brief Chooses the backend a new file is written to
 *
 * ORDER OF PRECEDENCE:
 * 1. a registered provider whose name equals the preference, ignoring case
 * 2. the first registered provider named after the category's tier
 * 3. the first registered provider
 *
 * Selection does no I/O and depends only on the registry and its inputs.
 */
class ProviderSelector {
public:
    /// NoProvidersAvailable when the registry is null or empty
    static Result<ProviderSelector> create(std::shared_ptr<const ProviderRegistry> registry,
                                           TierMapping mapping = {});

    Result<ProviderPtr> select(domain::FileCategory category,
                               const domain::FileSize& size,
                               const std::optional<std::string>& preference = std::nullopt) const;

    [[nodiscard]] const TierMapping& mapping() const noexcept { return mapping_; }

private:
    ProviderSelector(std::shared_ptr<const ProviderRegistry> registry, TierMapping mapping)
        : registry_(std::move(registry)), mapping_(std::move(mapping)) {}

    std::shared_ptr<const ProviderRegistry> registry_;
    TierMapping mapping_;
};

} // namespace strata::storage

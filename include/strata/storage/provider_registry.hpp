#pragma once

#include "strata/core/clock.hpp"
#include "strata/core/config.hpp"
#include "strata/core/result.hpp"
#include "strata/storage/provider.hpp"

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace strata::storage {

/**
 * @brief Ordered set of named backends
 *
 * Names are unique ignoring case. Iteration order is registration order,
 * which the selector relies on for its last-resort default.
 */
class ProviderRegistry {
public:
    /// InvalidArgument for a null provider, Conflict for a name already present
    Result<void> add(ProviderPtr provider);

    /// Case-insensitive lookup; nullptr when absent
    [[nodiscard]] ProviderPtr find(const std::string& name) const;

    [[nodiscard]] const std::vector<ProviderPtr>& providers() const noexcept { return providers_; }

    /// Providers whose capabilities include retrieval, in registration order
    [[nodiscard]] std::vector<ProviderPtr> retrieval_capable() const;

    [[nodiscard]] bool empty() const noexcept { return providers_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return providers_.size(); }

private:
    std::vector<ProviderPtr> providers_;
};

/**
 * @brief Builds providers from configuration by their "kind"
 *
 * "local" is available out of the box. Other kinds are plugged in with
 * register_kind() before build_registry() runs at startup.
 *
 * EXAMPLE:
 * ProviderFactory factory;
 * factory.register_kind("memory", [](const core::ProviderConfig& cfg) { ... });
 * auto registry = factory.build_registry(config.providers);
 */
class ProviderFactory {
public:
    using Builder = std::function<Result<ProviderPtr>(const core::ProviderConfig&)>;

    explicit ProviderFactory(ClockFn clock = system_clock_fn());

    void register_kind(const std::string& kind, Builder builder);

    [[nodiscard]] bool has_kind(const std::string& kind) const;

    Result<ProviderPtr> build(const core::ProviderConfig& config) const;

    /// Builds every entry in order; the first failure aborts
    Result<ProviderRegistry> build_registry(const std::vector<core::ProviderConfig>& configs) const;

private:
    std::unordered_map<std::string, Builder> builders_;
};

} // namespace strata::storage

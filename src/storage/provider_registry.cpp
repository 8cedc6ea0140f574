#include "strata/storage/provider_registry.hpp"

#include "strata/storage/local_provider.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

#include <spdlog/spdlog.h>

namespace strata::storage {
namespace {

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

} // namespace

Result<void> ProviderRegistry::add(ProviderPtr provider) {
    if (!provider) {
        return Err<void>(ErrorKind::InvalidArgument, "Cannot register a null storage provider");
    }
    if (find(provider->name())) {
        return Err<void>(ErrorKind::Conflict, "Storage provider already registered: " + provider->name());
    }
    providers_.push_back(std::move(provider));
    return Ok();
}

ProviderPtr ProviderRegistry::find(const std::string& name) const {
    const auto it = std::find_if(providers_.begin(), providers_.end(),
                                 [&](const ProviderPtr& p) { return iequals(p->name(), name); });
    return it != providers_.end() ? *it : nullptr;
}

std::vector<ProviderPtr> ProviderRegistry::retrieval_capable() const {
    std::vector<ProviderPtr> out;
    std::copy_if(providers_.begin(), providers_.end(), std::back_inserter(out),
                 [](const ProviderPtr& p) { return p->capabilities().retrieval; });
    return out;
}

ProviderFactory::ProviderFactory(ClockFn clock) {
    register_kind("local", [clock](const core::ProviderConfig& config) -> Result<ProviderPtr> {
        auto provider = LocalDirectoryProvider::create(config, clock);
        if (provider.is_error()) {
            return Err<ProviderPtr, Error>(provider.error());
        }
        return Ok<ProviderPtr>(std::move(provider.value()));
    });
}

void ProviderFactory::register_kind(const std::string& kind, Builder builder) {
    builders_[lower(kind)] = std::move(builder);
}

bool ProviderFactory::has_kind(const std::string& kind) const {
    return builders_.count(lower(kind)) > 0;
}

Result<ProviderPtr> ProviderFactory::build(const core::ProviderConfig& config) const {
    const auto it = builders_.find(lower(config.kind));
    if (it == builders_.end()) {
        return Err<ProviderPtr>(ErrorKind::InvalidArgument,
                                "Unknown storage provider kind '" + config.kind + "' for " + config.name);
    }
    return it->second(config);
}

Result<ProviderRegistry> ProviderFactory::build_registry(const std::vector<core::ProviderConfig>& configs) const {
    ProviderRegistry registry;
    for (const auto& config : configs) {
        auto provider = build(config);
        if (provider.is_error()) {
            return Err<ProviderRegistry, Error>(provider.error());
        }
        if (auto added = registry.add(provider.value()); added.is_error()) {
            return Err<ProviderRegistry, Error>(added.error());
        }
        spdlog::info("Registered storage provider {} (kind={}, instant_access={})",
                     config.name, config.kind, config.instant_access);
    }
    return Ok(std::move(registry));
}

} // namespace strata::storage

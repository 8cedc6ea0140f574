#include "strata/domain/storage_location.hpp"

namespace strata::domain {
namespace {

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

} // namespace

Result<StorageLocation> StorageLocation::create(const std::string& provider_name, const std::string& path) {
    std::string provider = trim(provider_name);
    if (provider.empty()) {
        return Err<StorageLocation>(ErrorKind::InvalidArgument, "Provider name cannot be null or empty");
    }
    std::string trimmed_path = trim(path);
    if (trimmed_path.empty()) {
        return Err<StorageLocation>(ErrorKind::InvalidArgument, "Storage path cannot be null or empty");
    }
    return Ok(StorageLocation(std::move(provider), std::move(trimmed_path)));
}

} // namespace strata::domain

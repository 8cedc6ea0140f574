#pragma once

#include "strata/core/result.hpp"

#include <string>

namespace strata::domain {

/**
 * @brief Where a file's bytes physically live; replaced, never mutated
 */
class StorageLocation {
public:
    static Result<StorageLocation> create(const std::string& provider_name, const std::string& path);

    [[nodiscard]] const std::string& provider_name() const noexcept { return provider_name_; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

    [[nodiscard]] std::string to_string() const { return provider_name_ + ":" + path_; }

    bool operator==(const StorageLocation& other) const {
        return provider_name_ == other.provider_name_ && path_ == other.path_;
    }
    bool operator!=(const StorageLocation& other) const { return !(*this == other); }

private:
    StorageLocation(std::string provider_name, std::string path)
        : provider_name_(std::move(provider_name)), path_(std::move(path)) {}

    std::string provider_name_;
    std::string path_;
};

} // namespace strata::domain

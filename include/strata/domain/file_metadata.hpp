#pragma once

#include "strata/core/clock.hpp"
#include "strata/core/result.hpp"

#include <optional>
#include <set>
#include <string>

namespace strata::domain {

/**
 * @brief Descriptive data about a stored file
 *
 * The sanitized name replaces <>:"/\|?* and control characters with '_',
 * trims surrounding spaces and dots, and collapses runs of '_'. A name that
 * sanitizes to nothing becomes "file".
 *
 * The content hash always carries the "sha256:" prefix and is stored in
 * lower case. Tags are trimmed and lower-cased; adding a tag that is already
 * present (or removing one that is absent) leaves modified_at untouched.
 */
class FileMetadata {
public:
    static Result<FileMetadata> create(const std::string& original_file_name,
                                       const std::string& content_hash,
                                       TimePoint captured_at,
                                       TimePoint now);

    [[nodiscard]] const std::string& original_file_name() const noexcept { return original_file_name_; }
    [[nodiscard]] const std::string& sanitized_file_name() const noexcept { return sanitized_file_name_; }
    [[nodiscard]] const std::string& content_hash() const noexcept { return content_hash_; }
    [[nodiscard]] TimePoint captured_at() const noexcept { return captured_at_; }
    [[nodiscard]] TimePoint created_at() const noexcept { return created_at_; }
    [[nodiscard]] TimePoint modified_at() const noexcept { return modified_at_; }
    [[nodiscard]] const std::set<std::string>& tags() const noexcept { return tags_; }
    [[nodiscard]] const std::optional<std::string>& description() const noexcept { return description_; }
    [[nodiscard]] const std::optional<double>& latitude() const noexcept { return latitude_; }
    [[nodiscard]] const std::optional<double>& longitude() const noexcept { return longitude_; }
    [[nodiscard]] const std::optional<std::string>& device_model() const noexcept { return device_model_; }

    [[nodiscard]] bool has_tag(const std::string& tag) const;

    void add_tag(const std::string& tag, TimePoint now);
    void remove_tag(const std::string& tag, TimePoint now);

    void set_description(std::optional<std::string> description, TimePoint now);
    void set_device_model(std::optional<std::string> device_model, TimePoint now);

    /// InvalidArgument when latitude is outside [-90,90] or longitude outside [-180,180]
    Result<void> set_gps_location(double latitude, double longitude, TimePoint now);

    Result<void> replace_content_hash(const std::string& content_hash, TimePoint now);

    static std::string sanitize_file_name(const std::string& file_name);

private:
    FileMetadata() = default;

    static Result<std::string> normalize_hash(const std::string& content_hash);

    std::string original_file_name_;
    std::string sanitized_file_name_;
    std::string content_hash_;
    TimePoint captured_at_{};
    TimePoint created_at_{};
    TimePoint modified_at_{};
    std::set<std::string> tags_;
    std::optional<std::string> description_;
    std::optional<double> latitude_;
    std::optional<double> longitude_;
    std::optional<std::string> device_model_;
};

} // namespace strata::domain

#pragma once

#include "strata/core/result.hpp"

#include <string>

namespace strata::domain {

enum class FileCategory {
    Photo,
    Video,
    Misc
};

/**
 * @brief Storage class a category should land in by default
 */
enum class StorageTier {
    DeepArchive,        ///< Cheapest, slowest restore
    FlexibleRetrieval,  ///< Cold, faster restore
    Standard            ///< Instant access
};

const char* to_string(FileCategory category);
const char* to_string(StorageTier tier);

/// Photo -> DeepArchive; Video and Misc -> FlexibleRetrieval
StorageTier storage_tier_for(FileCategory category) noexcept;

/**
 * @brief MIME type plus the category derived from its primary type
 */
class FileType {
public:
    /// Trims and lower-cases; rejects empty input or input without '/'
    static Result<FileType> from_mime_type(const std::string& mime_type);

    [[nodiscard]] const std::string& mime_type() const noexcept { return mime_type_; }
    [[nodiscard]] FileCategory category() const noexcept { return category_; }

    [[nodiscard]] bool is_photo() const noexcept { return category_ == FileCategory::Photo; }
    [[nodiscard]] bool is_video() const noexcept { return category_ == FileCategory::Video; }
    [[nodiscard]] bool is_misc() const noexcept { return category_ == FileCategory::Misc; }

    /// Extension with leading dot; falls back to "." + subtype
    [[nodiscard]] std::string file_extension() const;

    [[nodiscard]] StorageTier storage_tier() const noexcept { return storage_tier_for(category_); }

    [[nodiscard]] bool is_extension_valid(const std::string& extension) const;

    bool operator==(const FileType& other) const { return mime_type_ == other.mime_type_; }
    bool operator!=(const FileType& other) const { return mime_type_ != other.mime_type_; }

private:
    FileType(std::string mime_type, FileCategory category)
        : mime_type_(std::move(mime_type)), category_(category) {}

    std::string mime_type_;
    FileCategory category_;
};

} // namespace strata::domain

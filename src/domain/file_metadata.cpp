#include "strata/domain/file_metadata.hpp"

#include <algorithm>
#include <cctype>

namespace strata::domain {
namespace {

constexpr const char* kHashPrefix = "sha256:";

std::string trim(const std::string& text, const char* chars = " \t\r\n") {
    const auto first = text.find_first_not_of(chars);
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(chars);
    return text.substr(first, last - first + 1);
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool is_invalid_name_char(unsigned char c) {
    if (c < 0x20) {
        return true;
    }
    switch (c) {
        case '<': case '>': case ':': case '"': case '/':
        case '\\': case '|': case '?': case '*':
            return true;
        default:
            return false;
    }
}

std::optional<std::string> trimmed_optional(std::optional<std::string> value) {
    if (!value) {
        return std::nullopt;
    }
    return trim(*value);
}

} // namespace

std::string FileMetadata::sanitize_file_name(const std::string& file_name) {
    if (trim(file_name).empty()) {
        return "file";
    }

    std::string replaced;
    replaced.reserve(file_name.size());
    for (unsigned char c : file_name) {
        replaced.push_back(is_invalid_name_char(c) ? '_' : static_cast<char>(c));
    }

    // Trim whitespace, then dots, as two separate passes
    std::string sanitized = trim(trim(replaced), ".");

    std::string collapsed;
    collapsed.reserve(sanitized.size());
    for (char c : sanitized) {
        if (c == '_' && !collapsed.empty() && collapsed.back() == '_') {
            continue;
        }
        collapsed.push_back(c);
    }

    if (trim(collapsed).empty()) {
        return "file";
    }
    return collapsed;
}

Result<std::string> FileMetadata::normalize_hash(const std::string& content_hash) {
    std::string hash = to_lower(trim(content_hash));
    if (hash.empty()) {
        return Err<std::string>(ErrorKind::InvalidArgument, "Hash cannot be null or empty");
    }
    if (hash.rfind(kHashPrefix, 0) != 0) {
        return Err<std::string>(ErrorKind::InvalidArgument, "Hash must be in format 'sha256:...'");
    }
    return Ok(std::move(hash));
}

Result<FileMetadata> FileMetadata::create(const std::string& original_file_name,
                                          const std::string& content_hash,
                                          TimePoint captured_at,
                                          TimePoint now) {
    std::string name = trim(original_file_name);
    if (name.empty()) {
        return Err<FileMetadata>(ErrorKind::InvalidArgument, "Filename cannot be null or empty");
    }

    auto hash = normalize_hash(content_hash);
    if (hash.is_error()) {
        return Err<FileMetadata, Error>(hash.error());
    }

    FileMetadata metadata;
    metadata.sanitized_file_name_ = sanitize_file_name(original_file_name);
    metadata.original_file_name_ = std::move(name);
    metadata.content_hash_ = std::move(hash.value());
    metadata.captured_at_ = captured_at;
    metadata.created_at_ = now;
    metadata.modified_at_ = now;
    return Ok(std::move(metadata));
}

bool FileMetadata::has_tag(const std::string& tag) const {
    return tags_.count(to_lower(trim(tag))) > 0;
}

void FileMetadata::add_tag(const std::string& tag, TimePoint now) {
    std::string normalized = to_lower(trim(tag));
    if (normalized.empty()) {
        return;
    }
    if (tags_.insert(std::move(normalized)).second) {
        modified_at_ = now;
    }
}

void FileMetadata::remove_tag(const std::string& tag, TimePoint now) {
    std::string normalized = to_lower(trim(tag));
    if (normalized.empty()) {
        return;
    }
    if (tags_.erase(normalized) > 0) {
        modified_at_ = now;
    }
}

void FileMetadata::set_description(std::optional<std::string> description, TimePoint now) {
    description_ = trimmed_optional(std::move(description));
    modified_at_ = now;
}

void FileMetadata::set_device_model(std::optional<std::string> device_model, TimePoint now) {
    device_model_ = trimmed_optional(std::move(device_model));
    modified_at_ = now;
}

Result<void> FileMetadata::set_gps_location(double latitude, double longitude, TimePoint now) {
    if (latitude < -90.0 || latitude > 90.0) {
        return Err<void>(ErrorKind::InvalidArgument, "Latitude must be between -90 and 90");
    }
    if (longitude < -180.0 || longitude > 180.0) {
        return Err<void>(ErrorKind::InvalidArgument, "Longitude must be between -180 and 180");
    }
    latitude_ = latitude;
    longitude_ = longitude;
    modified_at_ = now;
    return Ok();
}

Result<void> FileMetadata::replace_content_hash(const std::string& content_hash, TimePoint now) {
    auto hash = normalize_hash(content_hash);
    if (hash.is_error()) {
        return Err<void, Error>(hash.error());
    }
    content_hash_ = std::move(hash.value());
    modified_at_ = now;
    return Ok();
}

} // namespace strata::domain

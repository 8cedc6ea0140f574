#include "strata/domain/file_type.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <vector>

namespace strata::domain {
namespace {

const std::unordered_map<std::string, std::string>& mime_to_extension() {
    static const std::unordered_map<std::string, std::string> table {
        {"image/jpeg", ".jpg"},
        {"image/jpg", ".jpg"},
        {"image/png", ".png"},
        {"image/gif", ".gif"},
        {"image/webp", ".webp"},
        {"image/heic", ".heic"},
        {"image/heif", ".heif"},
        {"image/bmp", ".bmp"},
        {"image/tiff", ".tiff"},
        {"image/svg+xml", ".svg"},
        {"video/mp4", ".mp4"},
        {"video/quicktime", ".mov"},
        {"video/x-msvideo", ".avi"},
        {"video/mpeg", ".mpeg"},
        {"video/webm", ".webm"},
        {"video/x-matroska", ".mkv"},
        {"application/pdf", ".pdf"},
        {"application/msword", ".doc"},
        {"application/vnd.openxmlformats-officedocument.wordprocessingml.document", ".docx"},
        {"application/vnd.ms-excel", ".xls"},
        {"application/vnd.openxmlformats-officedocument.spreadsheetml.sheet", ".xlsx"},
        {"application/zip", ".zip"},
        {"application/x-rar-compressed", ".rar"},
        {"application/x-7z-compressed", ".7z"},
        {"application/gzip", ".gz"},
        {"text/plain", ".txt"},
        {"text/html", ".html"},
        {"text/css", ".css"},
        {"text/javascript", ".js"},
        {"application/json", ".json"},
        {"application/xml", ".xml"},
        {"application/octet-stream", ".bin"},
    };
    return table;
}

const std::unordered_map<std::string, std::vector<std::string>>& extension_to_mimes() {
    static const std::unordered_map<std::string, std::vector<std::string>> table {
        {".jpg", {"image/jpeg", "image/jpg"}},
        {".jpeg", {"image/jpeg", "image/jpg"}},
        {".png", {"image/png"}},
        {".gif", {"image/gif"}},
        {".webp", {"image/webp"}},
        {".heic", {"image/heic"}},
        {".heif", {"image/heif"}},
        {".mp4", {"video/mp4"}},
        {".mov", {"video/quicktime"}},
        {".avi", {"video/x-msvideo"}},
        {".pdf", {"application/pdf"}},
        {".txt", {"text/plain"}},
    };
    return table;
}

std::string trim_lower(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    std::string out = text.substr(first, last - first + 1);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

const char* to_string(FileCategory category) {
    switch (category) {
        case FileCategory::Photo: return "Photo";
        case FileCategory::Video: return "Video";
        case FileCategory::Misc: return "Misc";
    }
    return "Misc";
}

const char* to_string(StorageTier tier) {
    switch (tier) {
        case StorageTier::DeepArchive: return "deep-archive";
        case StorageTier::FlexibleRetrieval: return "flexible-retrieval";
        case StorageTier::Standard: return "standard";
    }
    return "flexible-retrieval";
}

Result<FileType> FileType::from_mime_type(const std::string& mime_type) {
    std::string normalized = trim_lower(mime_type);
    if (normalized.empty()) {
        return Err<FileType>(ErrorKind::InvalidArgument, "MIME type cannot be null or empty");
    }
    const auto slash = normalized.find('/');
    if (slash == std::string::npos) {
        return Err<FileType>(ErrorKind::InvalidArgument, "Invalid MIME type format: " + normalized);
    }

    const std::string primary = normalized.substr(0, slash);
    FileCategory category = FileCategory::Misc;
    if (primary == "image") {
        category = FileCategory::Photo;
    } else if (primary == "video") {
        category = FileCategory::Video;
    }
    return Ok(FileType(std::move(normalized), category));
}

std::string FileType::file_extension() const {
    const auto& table = mime_to_extension();
    if (auto it = table.find(mime_type_); it != table.end()) {
        return it->second;
    }
    const auto slash = mime_type_.find('/');
    if (slash != std::string::npos && slash + 1 < mime_type_.size()) {
        return "." + mime_type_.substr(slash + 1);
    }
    return ".bin";
}

StorageTier storage_tier_for(FileCategory category) noexcept {
    switch (category) {
        case FileCategory::Photo: return StorageTier::DeepArchive;
        case FileCategory::Video: return StorageTier::FlexibleRetrieval;
        case FileCategory::Misc: return StorageTier::FlexibleRetrieval;
    }
    return StorageTier::FlexibleRetrieval;
}

bool FileType::is_extension_valid(const std::string& extension) const {
    std::string normalized = trim_lower(extension);
    if (normalized.empty()) {
        return false;
    }
    if (normalized.front() != '.') {
        normalized.insert(normalized.begin(), '.');
    }

    const auto& table = extension_to_mimes();
    if (auto it = table.find(normalized); it != table.end()) {
        return std::find(it->second.begin(), it->second.end(), mime_type_) != it->second.end();
    }
    return file_extension() == normalized;
}

} // namespace strata::domain

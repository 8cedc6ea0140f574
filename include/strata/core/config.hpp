#pragma once

/**
 * @file config.hpp
 * @brief Engine configuration loaded from JSON
 *
 * Every key is optional; a missing key keeps the default shown here. A key
 * with the wrong JSON type is reported as InvalidArgument naming its path,
 * e.g. "providers[1].root must be a string".
 *
 * EXAMPLE:
 * {
 *   "logging":  { "level": "debug" },
 *   "upload":   { "max_single_upload_bytes": 20971520, "enforce_unique_hash": true },
 *   "chunked":  { "default_chunk_size": 5242880, "session_ttl_hours": 24,
 *                 "staging_root": "/var/lib/strata/staging" },
 *   "providers": [
 *     { "name": "s3-standard", "kind": "local", "root": "/srv/hot", "instant_access": true },
 *     { "name": "s3-glacier-deep", "kind": "local", "root": "/srv/cold",
 *       "instant_access": false, "min_restore_minutes": 720, "max_restore_minutes": 2880 }
 *   ]
 * }
 */

#include "strata/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace strata::core {

struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "[%H:%M:%S] [%^%l%$] %v";
};

struct UploadConfig {
    static constexpr std::uint64_t kDefaultMaxSingleUpload = 20ULL * 1024 * 1024;

    std::uint64_t max_single_upload_bytes = kDefaultMaxSingleUpload;
    bool enforce_unique_hash = false;
};

struct ChunkedConfig {
    static constexpr std::uint64_t kDefaultChunkSize = 5ULL * 1024 * 1024;

    std::uint64_t default_chunk_size = kDefaultChunkSize;
    std::chrono::hours session_ttl{24};
    std::filesystem::path staging_root = std::filesystem::temp_directory_path() / "strata-staging";
};

struct ThumbnailConfig {
    bool enabled = true;
    int width = 300;
    int height = 300;
    int quality = 80;
    std::string provider = "s3-standard";
};

/**
 * @brief Canonical provider name for each storage tier
 */
struct TierConfig {
    std::string deep_archive = "s3-glacier-deep";
    std::string flexible_retrieval = "s3-glacier-flexible";
    std::string standard = "s3-standard";
};

struct ProviderConfig {
    std::string name;
    std::string kind = "local";
    std::filesystem::path root;
    bool instant_access = true;
    bool supports_retrieval = false;
    bool supports_deletion = true;
    std::chrono::minutes min_restore_time{0};
    std::chrono::minutes max_restore_time{0};
    std::chrono::hours restore_window{24};
};

struct EngineConfig {
    LoggingConfig logging;
    UploadConfig upload;
    ChunkedConfig chunked;
    ThumbnailConfig thumbnail;
    TierConfig tiers;
    std::vector<ProviderConfig> providers;
    std::size_t worker_threads = 4;
};

Result<EngineConfig> parse_config(const std::string& json_text);

Result<EngineConfig> load_config(const std::filesystem::path& path);

} // namespace strata::core

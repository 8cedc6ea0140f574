#include "strata/core/config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <limits>
#include <sstream>

namespace strata::core {
using json = nlohmann::json;

namespace {

Error type_error(const std::string& path, const char* expected) {
    return Error{ErrorKind::InvalidArgument, path + " must be " + expected};
}

// Each reader leaves `out` untouched when the key is absent.
Result<void> read_string(const json& obj, const char* key, const std::string& path, std::string& out) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        return Ok();
    }
    if (!it->is_string()) {
        return Err<void>(type_error(path + "." + key, "a string"));
    }
    out = it->get<std::string>();
    return Ok();
}

Result<void> read_bool(const json& obj, const char* key, const std::string& path, bool& out) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        return Ok();
    }
    if (!it->is_boolean()) {
        return Err<void>(type_error(path + "." + key, "a boolean"));
    }
    out = it->get<bool>();
    return Ok();
}

template<typename Int>
Result<void> read_unsigned(const json& obj, const char* key, const std::string& path, Int& out) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        return Ok();
    }
    if (!it->is_number_unsigned()) {
        return Err<void>(type_error(path + "." + key, "a non-negative integer"));
    }
    out = static_cast<Int>(it->get<std::uint64_t>());
    return Ok();
}

Result<void> read_positive_int(const json& obj, const char* key, const std::string& path, int& out) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        return Ok();
    }
    if (!it->is_number_integer() || it->get<std::int64_t>() <= 0 ||
        it->get<std::int64_t>() > std::numeric_limits<int>::max()) {
        return Err<void>(type_error(path + "." + key, "a positive integer"));
    }
    out = it->get<int>();
    return Ok();
}

Result<void> require_object(const json& obj, const char* key, const std::string& path) {
    auto it = obj.find(key);
    if (it != obj.end() && !it->is_object()) {
        return Err<void>(type_error(path.empty() ? key : path + "." + key, "an object"));
    }
    return Ok();
}

Result<ProviderConfig> parse_provider(const json& entry, const std::string& path) {
    if (!entry.is_object()) {
        return Err<ProviderConfig>(type_error(path, "an object"));
    }

    ProviderConfig provider;
    if (auto res = read_string(entry, "name", path, provider.name); res.is_error()) {
        return Err<ProviderConfig>(res.error());
    }
    if (auto res = read_string(entry, "kind", path, provider.kind); res.is_error()) {
        return Err<ProviderConfig>(res.error());
    }
    if (provider.name.empty()) {
        return Err<ProviderConfig>(ErrorKind::InvalidArgument, path + ".name is required");
    }

    std::string root;
    if (auto res = read_string(entry, "root", path, root); res.is_error()) {
        return Err<ProviderConfig>(res.error());
    }
    provider.root = root;

    if (auto res = read_bool(entry, "instant_access", path, provider.instant_access); res.is_error()) {
        return Err<ProviderConfig>(res.error());
    }
    provider.supports_retrieval = !provider.instant_access;
    if (auto res = read_bool(entry, "supports_retrieval", path, provider.supports_retrieval); res.is_error()) {
        return Err<ProviderConfig>(res.error());
    }
    if (auto res = read_bool(entry, "supports_deletion", path, provider.supports_deletion); res.is_error()) {
        return Err<ProviderConfig>(res.error());
    }

    std::uint64_t min_minutes = 0;
    std::uint64_t max_minutes = 0;
    std::uint64_t window_hours = static_cast<std::uint64_t>(provider.restore_window.count());
    if (auto res = read_unsigned(entry, "min_restore_minutes", path, min_minutes); res.is_error()) {
        return Err<ProviderConfig>(res.error());
    }
    if (auto res = read_unsigned(entry, "max_restore_minutes", path, max_minutes); res.is_error()) {
        return Err<ProviderConfig>(res.error());
    }
    if (auto res = read_unsigned(entry, "restore_window_hours", path, window_hours); res.is_error()) {
        return Err<ProviderConfig>(res.error());
    }
    if (max_minutes < min_minutes) {
        return Err<ProviderConfig>(ErrorKind::InvalidArgument,
                                   path + ".max_restore_minutes must not be below min_restore_minutes");
    }
    provider.min_restore_time = std::chrono::minutes(min_minutes);
    provider.max_restore_time = std::chrono::minutes(max_minutes);
    provider.restore_window = std::chrono::hours(window_hours);
    return Ok(provider);
}

Result<void> parse_logging(const json& section, LoggingConfig& logging) {
    if (auto res = read_string(section, "level", "logging", logging.level); res.is_error()) {
        return res;
    }
    return read_string(section, "pattern", "logging", logging.pattern);
}

Result<void> parse_upload(const json& section, UploadConfig& upload) {
    if (auto res = read_unsigned(section, "max_single_upload_bytes", "upload", upload.max_single_upload_bytes);
        res.is_error()) {
        return res;
    }
    return read_bool(section, "enforce_unique_hash", "upload", upload.enforce_unique_hash);
}

Result<void> parse_chunked(const json& section, ChunkedConfig& chunked) {
    if (auto res = read_unsigned(section, "default_chunk_size", "chunked", chunked.default_chunk_size);
        res.is_error()) {
        return res;
    }
    if (chunked.default_chunk_size == 0) {
        return Err<void>(ErrorKind::InvalidArgument, "chunked.default_chunk_size must be > 0");
    }

    std::uint64_t ttl_hours = static_cast<std::uint64_t>(chunked.session_ttl.count());
    if (auto res = read_unsigned(section, "session_ttl_hours", "chunked", ttl_hours); res.is_error()) {
        return res;
    }
    if (ttl_hours == 0) {
        return Err<void>(ErrorKind::InvalidArgument, "chunked.session_ttl_hours must be > 0");
    }
    chunked.session_ttl = std::chrono::hours(ttl_hours);

    std::string staging;
    if (auto res = read_string(section, "staging_root", "chunked", staging); res.is_error()) {
        return res;
    }
    if (!staging.empty()) {
        chunked.staging_root = staging;
    }
    return Ok();
}

Result<void> parse_thumbnail(const json& section, ThumbnailConfig& thumbnail) {
    if (auto res = read_bool(section, "enabled", "thumbnail", thumbnail.enabled); res.is_error()) {
        return res;
    }
    if (auto res = read_positive_int(section, "width", "thumbnail", thumbnail.width); res.is_error()) {
        return res;
    }
    if (auto res = read_positive_int(section, "height", "thumbnail", thumbnail.height); res.is_error()) {
        return res;
    }
    if (auto res = read_positive_int(section, "quality", "thumbnail", thumbnail.quality); res.is_error()) {
        return res;
    }
    if (thumbnail.quality > 100) {
        return Err<void>(ErrorKind::InvalidArgument, "thumbnail.quality must be between 1 and 100");
    }
    return read_string(section, "provider", "thumbnail", thumbnail.provider);
}

Result<void> parse_tiers(const json& section, TierConfig& tiers) {
    if (auto res = read_string(section, "deep_archive", "tiers", tiers.deep_archive); res.is_error()) {
        return res;
    }
    if (auto res = read_string(section, "flexible_retrieval", "tiers", tiers.flexible_retrieval); res.is_error()) {
        return res;
    }
    return read_string(section, "standard", "tiers", tiers.standard);
}

Result<void> parse_engine(const json& section, EngineConfig& config) {
    if (auto res = read_unsigned(section, "worker_threads", "engine", config.worker_threads); res.is_error()) {
        return res;
    }
    if (config.worker_threads == 0) {
        return Err<void>(ErrorKind::InvalidArgument, "engine.worker_threads must be > 0");
    }
    return Ok();
}

Result<EngineConfig> from_json(const json& root) {
    if (!root.is_object()) {
        return Err<EngineConfig>(ErrorKind::InvalidArgument, "configuration root must be an object");
    }

    EngineConfig config;
    for (const char* section : {"logging", "upload", "chunked", "thumbnail", "tiers", "engine"}) {
        if (auto res = require_object(root, section, ""); res.is_error()) {
            return Err<EngineConfig>(res.error());
        }
    }

    if (root.contains("logging")) {
        if (auto res = parse_logging(root["logging"], config.logging); res.is_error()) {
            return Err<EngineConfig>(res.error());
        }
    }
    if (root.contains("upload")) {
        if (auto res = parse_upload(root["upload"], config.upload); res.is_error()) {
            return Err<EngineConfig>(res.error());
        }
    }
    if (root.contains("chunked")) {
        if (auto res = parse_chunked(root["chunked"], config.chunked); res.is_error()) {
            return Err<EngineConfig>(res.error());
        }
    }
    if (root.contains("thumbnail")) {
        if (auto res = parse_thumbnail(root["thumbnail"], config.thumbnail); res.is_error()) {
            return Err<EngineConfig>(res.error());
        }
    }
    if (root.contains("tiers")) {
        if (auto res = parse_tiers(root["tiers"], config.tiers); res.is_error()) {
            return Err<EngineConfig>(res.error());
        }
    }
    if (root.contains("engine")) {
        if (auto res = parse_engine(root["engine"], config); res.is_error()) {
            return Err<EngineConfig>(res.error());
        }
    }

    if (root.contains("providers")) {
        const auto& providers = root["providers"];
        if (!providers.is_array()) {
            return Err<EngineConfig>(type_error("providers", "an array"));
        }
        for (std::size_t i = 0; i < providers.size(); ++i) {
            auto provider = parse_provider(providers[i], "providers[" + std::to_string(i) + "]");
            if (provider.is_error()) {
                return Err<EngineConfig>(provider.error());
            }
            config.providers.push_back(std::move(provider.value()));
        }
    }

    return Ok(config);
}

} // namespace

Result<EngineConfig> parse_config(const std::string& json_text) {
    json root;
    try {
        root = json::parse(json_text);
    } catch (const json::parse_error& e) {
        return Err<EngineConfig>(ErrorKind::InvalidArgument, std::string("Malformed configuration: ") + e.what());
    }
    return from_json(root);
}

Result<EngineConfig> load_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<EngineConfig>(ErrorKind::NotFound, "Failed to open configuration file: " + path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return parse_config(buffer.str());
}

} // namespace strata::core

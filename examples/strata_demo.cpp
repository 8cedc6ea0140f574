/**
 * @file strata_demo.cpp
 * @brief End-to-end walk through the storage engine on local directories
 *
 * WHAT IT SHOWS:
 * - Single-shot upload, then the same bytes again (deduplicated)
 * - A chunked upload session assembled from three chunks
 * - Archiving, requesting a restore, polling it and downloading
 * - Provider health and the metrics collected from the event bus
 *
 * USAGE:
 *   strata_demo                     # built-in config under the temp directory
 *   strata_demo --config strata.json
 */

#include "strata/core/config.hpp"
#include "strata/orchestration/engine.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>

using namespace strata;
using namespace strata::orchestration;

namespace fs = std::filesystem;

// ════════════════════════════════════════════════════════════
// Configuration
// ════════════════════════════════════════════════════════════

core::EngineConfig demo_config() {
    const fs::path base = fs::temp_directory_path() / "strata-demo";

    core::EngineConfig config;
    config.chunked.staging_root = base / "staging";
    config.chunked.default_chunk_size = 4;

    core::ProviderConfig standard;
    standard.name = "s3-standard";
    standard.root = base / "standard";

    core::ProviderConfig glacier;
    glacier.name = "s3-glacier-deep";
    glacier.root = base / "glacier";
    glacier.instant_access = false;
    glacier.supports_retrieval = true;
    glacier.supports_deletion = false;
    glacier.min_restore_time = std::chrono::minutes(0);
    glacier.max_restore_time = std::chrono::minutes(0);

    core::ProviderConfig flexible = glacier;
    flexible.name = "s3-glacier-flexible";
    flexible.root = base / "flexible";

    config.providers = {standard, glacier, flexible};
    return config;
}

Result<core::EngineConfig> resolve_config(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            return core::load_config(argv[i + 1]);
        }
        if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: " << argv[0] << " [--config <path>]\n";
            std::exit(0);
        }
    }
    return Ok(demo_config());
}

// ════════════════════════════════════════════════════════════
// Walkthrough
// ════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    auto config = resolve_config(argc, argv);
    if (config.is_error()) {
        spdlog::error("Configuration error: {}", config.error().message);
        return 1;
    }

    auto created = StorageEngine::create(config.value());
    if (created.is_error()) {
        spdlog::error("Engine startup failed: {} ({})", created.error().message, to_string(created.error().kind));
        return 1;
    }
    auto& engine = *created.value();

    auto owner = domain::UserId::generate();

    // 1. Single-shot upload and its duplicate
    spdlog::info("─── Single-shot upload ───");
    UploadRequest photo{owner, "IMG_0001.jpg", "image/jpeg", Clock::now(), std::nullopt, {"holiday"}};
    std::istringstream first("\xFF\xD8\xFF demo jpeg bytes");
    auto stored = engine.upload(photo, first);
    if (stored.is_error()) {
        spdlog::error("Upload failed: {}", stored.error().message);
        return 1;
    }
    spdlog::info("Stored as {} at {}", stored.value().file_id.str(), stored.value().location->to_string());

    std::istringstream again("\xFF\xD8\xFF demo jpeg bytes");
    auto duplicate = engine.upload(photo, again);
    if (duplicate.is_ok()) {
        spdlog::info("Second upload duplicate={} file={}", duplicate.value().duplicate,
                     duplicate.value().file_id.str());
    }

    // 2. Chunked session
    spdlog::info("─── Chunked upload ───");
    OpenSessionRequest open{owner, "clip.mp4", "video/mp4", 10, Clock::now(), std::nullopt, std::nullopt};
    auto session = engine.open_session(open);
    if (session.is_error()) {
        spdlog::error("Could not open session: {}", session.error().message);
        return 1;
    }
    const auto& session_id = session.value().session_id;
    const std::vector<std::vector<std::uint8_t>> chunks = {{'0', '1', '2', '3'}, {'4', '5', '6', '7'}, {'8', '9'}};
    for (std::size_t i = chunks.size(); i-- > 0;) {
        auto receipt = engine.upload_chunk(session_id, static_cast<std::int64_t>(i), chunks[i]);
        if (receipt.is_error()) {
            spdlog::error("Chunk {} rejected: {}", i, receipt.error().message);
            return 1;
        }
    }
    auto assembled = engine.complete_session(session_id);
    if (assembled.is_error()) {
        spdlog::error("Completion failed: {}", assembled.error().message);
        return 1;
    }
    const auto video_id = assembled.value().file_id;

    // 3. Archive, restore and download
    spdlog::info("─── Cold retrieval ───");
    if (auto archived = engine.archive(video_id); archived.is_error()) {
        spdlog::warn("Archive failed: {}", archived.error().message);
    }

    auto early = engine.download(video_id);
    if (early.is_error()) {
        spdlog::info("Download before restore refused: {} ({})", early.error().message, to_string(early.error().kind));
    }

    auto retrieval = engine.initiate_retrieval(video_id, storage::RetrievalTier::Expedited);
    if (retrieval.is_ok()) {
        auto status = engine.check_retrieval_status(retrieval.value().retrieval_id);
        if (status.is_ok()) {
            spdlog::info("Retrieval {} is {}", retrieval.value().retrieval_id, storage::to_string(status.value().state));
        }
    }

    auto restored = engine.download(video_id);
    if (restored.is_ok()) {
        std::ostringstream content;
        content << restored.value().stream->rdbuf();
        spdlog::info("Downloaded {} ({} bytes): {}", restored.value().file_name, restored.value().size_bytes,
                     content.str());
    }

    auto unknown = engine.check_retrieval_status("no-such-retrieval");
    if (unknown.is_ok()) {
        spdlog::info("Unknown retrieval reported as {}: {}", storage::to_string(unknown.value().state),
                     unknown.value().message);
    }

    // 4. Health and metrics
    for (const auto& health : engine.provider_health()) {
        spdlog::info("Provider {}: {} ({}ms)", health.provider, health.status.healthy ? "healthy" : "unhealthy",
                     health.status.response_time.count());
    }
    engine.print_stats();
    return 0;
}

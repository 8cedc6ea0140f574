#include "strata/orchestration/upload_orchestrator.hpp"

#include "strata/domain/file.hpp"
#include "strata/domain/file_metadata.hpp"
#include "strata/domain/file_size.hpp"
#include "strata/domain/file_type.hpp"
#include "strata/events/dispatch.hpp"
#include "strata/events/events.hpp"

#include <spdlog/spdlog.h>

namespace strata::orchestration {
namespace {

bool is_blank(const std::string& text) {
    return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

/// Total byte count of a rewindable stream; leaves it positioned at the start
Result<std::uint64_t> measure(std::istream& data) {
    data.clear();
    data.seekg(0, std::ios::end);
    const auto end = data.tellg();
    data.seekg(0, std::ios::beg);
    if (end < 0 || !data) {
        return Err<std::uint64_t>(ErrorKind::InvalidArgument, "Upload stream must be seekable");
    }
    return Ok(static_cast<std::uint64_t>(end));
}

Result<void> rewind(std::istream& data) {
    data.clear();
    data.seekg(0, std::ios::beg);
    if (!data) {
        return Err<void>(ErrorKind::InvalidArgument, "Upload stream could not be rewound");
    }
    return Ok();
}

} // namespace

FileUploadOrchestrator::FileUploadOrchestrator(Collaborators collaborators,
                                               core::UploadConfig upload_config,
                                               core::ThumbnailConfig thumbnail_config)
    : collaborators_(std::move(collaborators)),
      upload_config_(upload_config),
      thumbnail_config_(std::move(thumbnail_config)) {}

Result<UploadOutcome> FileUploadOrchestrator::upload(const UploadRequest& request,
                                                     std::istream& data,
                                                     const CancellationToken& token) {
    if (auto valid = collaborators_.validate(); valid.is_error()) {
        return Err<UploadOutcome, Error>(valid.error());
    }
    if (is_blank(request.file_name)) {
        return Err<UploadOutcome>(ErrorKind::InvalidArgument, "File name is required");
    }
    auto type = domain::FileType::from_mime_type(request.mime_type);
    if (type.is_error()) {
        return Err<UploadOutcome, Error>(type.error());
    }

    auto byte_count = measure(data);
    if (byte_count.is_error()) {
        return Err<UploadOutcome, Error>(byte_count.error());
    }
    if (byte_count.value() > upload_config_.max_single_upload_bytes) {
        return Err<UploadOutcome>(ErrorKind::InvalidArgument,
                                  "File of " + std::to_string(byte_count.value()) + " bytes exceeds the " +
                                  std::to_string(upload_config_.max_single_upload_bytes) +
                                  " byte single-upload limit; use a chunked upload session");
    }
    auto size = domain::FileSize::from_bytes(byte_count.value());
    if (size.is_error()) {
        return Err<UploadOutcome, Error>(size.error());
    }

    if (token.is_cancelled()) {
        return Err<UploadOutcome>(ErrorKind::Cancelled, "Upload cancelled");
    }

    // 1. Hash
    auto hash = collaborators_.hasher->compute(data, token);
    if (hash.is_error()) {
        spdlog::warn("Hashing {} failed: {}", request.file_name, hash.error().message);
        return Err<UploadOutcome, Error>(hash.error());
    }

    // 2. Duplicate check
    auto lookup_unit = collaborators_.store->begin();
    auto existing = lookup_unit->files().get_by_hash(hash.value());
    if (existing.is_error()) {
        return Err<UploadOutcome, Error>(persistence_error(existing.error()));
    }
    if (existing.value()) {
        return existing_as_duplicate(*existing.value(), request, size.value().bytes());
    }

    const auto now = collaborators_.clock();
    auto metadata = domain::FileMetadata::create(request.file_name, hash.value(), request.captured_at, now);
    if (metadata.is_error()) {
        return Err<UploadOutcome, Error>(metadata.error());
    }
    for (const auto& tag : request.tags) {
        metadata.value().add_tag(tag, now);
    }

    // 3. Placement
    auto provider = collaborators_.selector->select(type.value().category(), size.value(),
                                                    request.preferred_provider);
    if (provider.is_error()) {
        return Err<UploadOutcome, Error>(provider.error());
    }

    if (token.is_cancelled()) {
        return Err<UploadOutcome>(ErrorKind::Cancelled, "Upload cancelled");
    }
    if (auto rewound = rewind(data); rewound.is_error()) {
        return Err<UploadOutcome, Error>(rewound.error());
    }

    // 4. Backend write
    storage::UploadOptions options;
    options.file_name = request.file_name;
    options.content_type = type.value().mime_type();
    options.metadata["owner"] = request.owner.str();
    options.metadata["content-hash"] = hash.value();

    auto receipt = provider.value()->upload(data, options, token);
    if (receipt.is_error()) {
        spdlog::error("Upload of {} to {} failed: {}",
                      request.file_name, provider.value()->name(), receipt.error().message);
        return Err<UploadOutcome, Error>(receipt.error());
    }
    const auto& location = receipt.value().location;

    // 5. Aggregate
    auto created = domain::File::create(request.owner, std::move(metadata.value()), size.value(), type.value(), now);
    domain::File file = std::move(created.file);
    domain::DomainEvents events{std::move(created.event)};

    auto started = file.start_upload(now);
    if (started.is_error()) {
        return Err<UploadOutcome, Error>(started.error());
    }
    events.push_back(std::move(started.value()));

    auto completed = file.complete_upload(location, collaborators_.clock());
    if (completed.is_error()) {
        return Err<UploadOutcome, Error>(completed.error());
    }
    events.push_back(std::move(completed.value()));

    // 6. Thumbnail
    attach_thumbnail(file, data, token);

    // 7. Commit
    if (token.is_cancelled()) {
        spdlog::warn("Upload of {} cancelled before commit; orphaned bytes at {}",
                     request.file_name, location.to_string());
        return Err<UploadOutcome>(ErrorKind::Cancelled, "Upload cancelled");
    }

    auto unit = collaborators_.store->begin();
    if (auto added = unit->files().add(file); added.is_error()) {
        return Err<UploadOutcome, Error>(persistence_error(added.error()));
    }
    auto saved = unit->save_changes(token);
    if (saved.is_error()) {
        if (saved.error().kind == ErrorKind::Conflict) {
            auto winner = collaborators_.store->begin()->files().get_by_hash(hash.value());
            if (winner.is_ok() && winner.value()) {
                spdlog::warn("Concurrent upload of identical content won the commit; orphaned bytes at {}",
                             location.to_string());
                return existing_as_duplicate(*winner.value(), request, size.value().bytes());
            }
        }
        spdlog::warn("Commit for {} failed ({}); orphaned bytes at {}",
                     request.file_name, saved.error().message, location.to_string());
        return Err<UploadOutcome, Error>(persistence_error(saved.error()));
    }

    if (collaborators_.bus) {
        events::dispatch(*collaborators_.bus, events);
    }

    spdlog::info("Stored {} ({}) as {} on {}", request.file_name, size.value().to_human_readable(),
                 file.id().str(), location.to_string());

    UploadOutcome outcome{file.id()};
    outcome.duplicate = false;
    outcome.location = file.location();
    outcome.thumbnail_location = file.thumbnail_location();
    return Ok(std::move(outcome));
}

Result<UploadOutcome> FileUploadOrchestrator::existing_as_duplicate(const domain::File& existing,
                                                                    const UploadRequest& request,
                                                                    std::uint64_t bytes) {
    spdlog::info("{} matches stored file {}, skipping upload", request.file_name, existing.id().str());
    if (collaborators_.bus) {
        collaborators_.bus->emit(events::DuplicateUploadDetectedEvent(
            existing.id(), request.owner, request.file_name, existing.metadata().content_hash(), bytes));
    }

    UploadOutcome outcome{existing.id()};
    outcome.duplicate = true;
    outcome.location = existing.location();
    outcome.thumbnail_location = existing.thumbnail_location();
    return Ok(std::move(outcome));
}

void FileUploadOrchestrator::attach_thumbnail(domain::File& file, std::istream& data, const CancellationToken& token) {
    auto& thumbnails = collaborators_.thumbnails;
    if (!thumbnails || !thumbnail_config_.enabled || !thumbnails->supports(file.type().mime_type())) {
        return;
    }

    if (auto rewound = rewind(data); rewound.is_error()) {
        skip_thumbnail(file, rewound.error().message);
        return;
    }

    services::ThumbnailRequest request;
    request.width = thumbnail_config_.width;
    request.height = thumbnail_config_.height;
    request.quality = thumbnail_config_.quality;

    auto rendered = thumbnails->generate(data, request, token);
    if (rendered.is_error()) {
        skip_thumbnail(file, "generation failed: " + rendered.error().message);
        return;
    }

    auto target = collaborators_.registry->find(thumbnail_config_.provider);
    if (!target) {
        skip_thumbnail(file, "thumbnail provider " + thumbnail_config_.provider + " is not registered");
        return;
    }

    storage::UploadOptions options;
    options.file_name = "thumb_" + file.metadata().sanitized_file_name();
    options.content_type = "image/jpeg";
    options.metadata["thumbnail-of"] = file.id().str();

    auto stored = target->upload(*rendered.value(), options, token);
    if (stored.is_error()) {
        skip_thumbnail(file, "upload failed: " + stored.error().message);
        return;
    }

    if (auto set = file.set_thumbnail(stored.value().location); set.is_error()) {
        skip_thumbnail(file, set.error().message);
    }
}

void FileUploadOrchestrator::skip_thumbnail(const domain::File& file, const std::string& reason) {
    spdlog::warn("Thumbnail for {} skipped: {}", file.id().str(), reason);
    if (collaborators_.bus) {
        collaborators_.bus->emit(events::ThumbnailSkippedEvent(file.id(), reason));
    }
}

} // namespace strata::orchestration

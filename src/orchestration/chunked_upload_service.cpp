#include "strata/orchestration/chunked_upload_service.hpp"

#include "strata/domain/file_metadata.hpp"
#include "strata/domain/file_size.hpp"
#include "strata/domain/file_type.hpp"
#include "strata/events/dispatch.hpp"
#include "strata/events/events.hpp"

#include <spdlog/spdlog.h>

#include <chrono>

namespace strata::orchestration {
namespace {

constexpr const char* kPlaceholderHashPrefix = "sha256:pending_";

Error session_not_found(const domain::UploadSessionId& id) {
    return Error{ErrorKind::NotFound, "Upload session not found: " + id.str()};
}

std::chrono::milliseconds elapsed_ms(TimePoint from, TimePoint to) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(to - from);
}

} // namespace

ChunkedUploadService::ChunkedUploadService(Collaborators collaborators, core::ChunkedConfig config)
    : collaborators_(std::move(collaborators)),
      config_(std::move(config)),
      staging_(config_.staging_root) {}

Result<OpenSessionResult> ChunkedUploadService::open_session(const OpenSessionRequest& request,
                                                             const CancellationToken& token) {
    if (auto valid = collaborators_.validate(); valid.is_error()) {
        return Err<OpenSessionResult, Error>(valid.error());
    }
    if (request.file_name.find_first_not_of(" \t\r\n") == std::string::npos) {
        return Err<OpenSessionResult>(ErrorKind::InvalidArgument, "File name is required");
    }
    auto type = domain::FileType::from_mime_type(request.mime_type);
    if (type.is_error()) {
        return Err<OpenSessionResult, Error>(type.error());
    }
    auto size = domain::FileSize::from_bytes(request.total_size);
    if (size.is_error()) {
        return Err<OpenSessionResult, Error>(size.error());
    }
    const std::uint64_t chunk_size = request.chunk_size.value_or(config_.default_chunk_size);
    if (chunk_size == 0) {
        return Err<OpenSessionResult>(ErrorKind::InvalidArgument, "Chunk size must be greater than zero");
    }

    const auto now = collaborators_.clock();
    auto metadata = domain::FileMetadata::create(request.file_name,
                                                 kPlaceholderHashPrefix + domain::generate_uuid(),
                                                 request.captured_at, now);
    if (metadata.is_error()) {
        return Err<OpenSessionResult, Error>(metadata.error());
    }

    auto created = domain::File::create(request.owner, std::move(metadata.value()), size.value(), type.value(), now);
    auto session = domain::UploadSession::create(created.file.id(), request.owner, request.total_size,
                                                 chunk_size, now, config_.session_ttl);
    if (session.is_error()) {
        return Err<OpenSessionResult, Error>(session.error());
    }
    auto& opened = session.value();
    opened.set_preferred_provider(request.preferred_provider);

    if (auto staged = staging_.create(opened.id(), request.total_size); staged.is_error()) {
        return Err<OpenSessionResult, Error>(staged.error());
    }

    auto unit = collaborators_.store->begin();
    auto added = unit->files().add(created.file);
    if (added.is_ok()) {
        added = unit->sessions().add(opened);
    }
    if (added.is_error()) {
        discard_staging(opened.id());
        return Err<OpenSessionResult, Error>(persistence_error(added.error()));
    }
    if (auto saved = unit->save_changes(token); saved.is_error()) {
        discard_staging(opened.id());
        return Err<OpenSessionResult, Error>(persistence_error(saved.error()));
    }

    if (collaborators_.bus) {
        events::dispatch(*collaborators_.bus, {created.event});
        collaborators_.bus->emit(events::UploadSessionOpenedEvent(
            opened.id(), created.file.id(), opened.total_size(), opened.total_chunks()));
    }

    spdlog::info("Opened upload session {} for {} ({} in {} chunks)",
                 opened.id().str(), request.file_name, size.value().to_human_readable(), opened.total_chunks());

    return Ok(OpenSessionResult{opened.id(), created.file.id(), opened.chunk_size(),
                                opened.total_chunks(), opened.expires_at()});
}

Result<ChunkReceipt> ChunkedUploadService::upload_chunk(const domain::UploadSessionId& session_id,
                                                        std::int64_t chunk_index,
                                                        const std::vector<std::uint8_t>& bytes,
                                                        const CancellationToken& token) {
    bool bytes_written = false;

    for (int attempt = 1; attempt <= kMaxConflictAttempts; ++attempt) {
        if (token.is_cancelled()) {
            return Err<ChunkReceipt>(ErrorKind::Cancelled, "Chunk upload cancelled");
        }

        auto unit = collaborators_.store->begin();
        auto found = unit->sessions().get(session_id);
        if (found.is_error()) {
            return Err<ChunkReceipt, Error>(persistence_error(found.error()));
        }
        if (!found.value()) {
            return Err<ChunkReceipt, Error>(session_not_found(session_id));
        }

        domain::UploadSession session = std::move(*found.value());
        if (auto marked = session.mark_chunk_uploaded(chunk_index, collaborators_.clock()); marked.is_error()) {
            return Err<ChunkReceipt, Error>(marked.error());
        }

        const auto index = static_cast<std::uint64_t>(chunk_index);
        if (!bytes_written) {
            const std::uint64_t expected = session.chunk_length(index);
            if (bytes.size() != expected) {
                return Err<ChunkReceipt>(ErrorKind::InvalidArgument,
                                         "Chunk " + std::to_string(index) + " must be " + std::to_string(expected) +
                                         " bytes, got " + std::to_string(bytes.size()));
            }
            if (auto written = staging_.write_chunk(session_id, session.chunk_offset(index), bytes);
                written.is_error()) {
                return Err<ChunkReceipt, Error>(written.error());
            }
            bytes_written = true;
        }

        if (auto updated = unit->sessions().update(session); updated.is_error()) {
            return Err<ChunkReceipt, Error>(persistence_error(updated.error()));
        }
        auto saved = unit->save_changes(token);
        if (saved.is_error()) {
            if (saved.error().kind == ErrorKind::Conflict) {
                spdlog::debug("Session {} changed while recording chunk {} (attempt {}/{})",
                              session_id.str(), index, attempt, kMaxConflictAttempts);
                continue;
            }
            return Err<ChunkReceipt, Error>(persistence_error(saved.error()));
        }

        if (collaborators_.bus) {
            collaborators_.bus->emit(events::ChunkReceivedEvent(
                session_id, index, session.total_chunks(), bytes.size(), session.progress()));
        }
        spdlog::debug("Session {}: chunk {}/{} stored ({}%)",
                      session_id.str(), index + 1, session.total_chunks(), session.progress());

        return Ok(ChunkReceipt{index, session.progress(), session.is_complete()});
    }

    return Err<ChunkReceipt>(ErrorKind::Conflict,
                             "Upload session " + session_id.str() + " kept changing; chunk " +
                             std::to_string(chunk_index) + " was not recorded, re-send it");
}

Result<UploadOutcome> ChunkedUploadService::complete_session(const domain::UploadSessionId& session_id,
                                                             const CancellationToken& token) {
    if (auto valid = collaborators_.validate(); valid.is_error()) {
        return Err<UploadOutcome, Error>(valid.error());
    }

    auto unit = collaborators_.store->begin();
    auto found = unit->sessions().get(session_id);
    if (found.is_error()) {
        return Err<UploadOutcome, Error>(persistence_error(found.error()));
    }
    if (!found.value()) {
        return Err<UploadOutcome, Error>(session_not_found(session_id));
    }
    domain::UploadSession session = std::move(*found.value());

    auto file_found = unit->files().get(session.file_id());
    if (file_found.is_error()) {
        return Err<UploadOutcome, Error>(persistence_error(file_found.error()));
    }
    if (!file_found.value()) {
        return Err<UploadOutcome>(ErrorKind::NotFound, "File not found: " + session.file_id().str());
    }
    domain::File file = std::move(*file_found.value());

    auto now = collaborators_.clock();
    if (auto completed = session.complete(now); completed.is_error()) {
        return Err<UploadOutcome, Error>(completed.error());
    }

    if (file.status().is(domain::UploadState::Failed)) {
        if (auto retried = file.retry(now); retried.is_error()) {
            return Err<UploadOutcome, Error>(retried.error());
        }
    }

    if (token.is_cancelled()) {
        return Err<UploadOutcome>(ErrorKind::Cancelled, "Session completion cancelled");
    }

    auto assembled = staging_.open(session_id);
    if (assembled.is_error()) {
        return Err<UploadOutcome, Error>(assembled.error());
    }
    auto hash = collaborators_.hasher->compute(*assembled.value(), token);
    if (hash.is_error()) {
        return Err<UploadOutcome, Error>(hash.error());
    }
    assembled.value().reset();

    auto existing = unit->files().get_by_hash(hash.value());
    if (existing.is_error()) {
        return Err<UploadOutcome, Error>(persistence_error(existing.error()));
    }
    if (existing.value() && existing.value()->id() != file.id() &&
        (existing.value()->status().is(domain::UploadState::Completed) || existing.value()->is_archived())) {
        return finish_as_duplicate(*unit, std::move(file), std::move(session), *existing.value());
    }

    if (auto assigned = file.assign_content_hash(hash.value(), now); assigned.is_error()) {
        return Err<UploadOutcome, Error>(assigned.error());
    }

    auto provider = collaborators_.selector->select(file.type().category(), file.size(),
                                                    session.preferred_provider());
    if (provider.is_error()) {
        return Err<UploadOutcome, Error>(provider.error());
    }

    if (token.is_cancelled()) {
        return Err<UploadOutcome>(ErrorKind::Cancelled, "Session completion cancelled");
    }

    auto source = staging_.open(session_id);
    if (source.is_error()) {
        return Err<UploadOutcome, Error>(source.error());
    }

    storage::UploadOptions options;
    options.file_name = file.metadata().original_file_name();
    options.content_type = file.type().mime_type();
    options.metadata["owner"] = file.owner().str();
    options.metadata["content-hash"] = hash.value();
    options.metadata["upload-session"] = session_id.str();

    domain::DomainEvents events;
    auto receipt = provider.value()->upload(*source.value(), options, token);
    source.value().reset();
    if (receipt.is_error()) {
        spdlog::error("Session {}: upload to {} failed: {}",
                      session_id.str(), provider.value()->name(), receipt.error().message);
        auto failed = file.mark_failed(receipt.error().message, collaborators_.clock());
        if (failed.is_ok()) {
            events.push_back(std::move(failed.value()));
            auto failure_unit = collaborators_.store->begin();
            Result<void> recorded = failure_unit->files().update(file);
            if (recorded.is_ok()) {
                if (auto saved = failure_unit->save_changes(); saved.is_error()) {
                    recorded = Err<void, Error>(saved.error());
                }
            }
            if (recorded.is_error()) {
                spdlog::warn("Session {}: could not record failure of file {}: {}",
                             session_id.str(), file.id().str(), recorded.error().message);
            } else if (collaborators_.bus) {
                events::dispatch(*collaborators_.bus, events);
            }
        }
        return Err<UploadOutcome, Error>(receipt.error());
    }
    const auto location = receipt.value().location;

    now = collaborators_.clock();
    auto started = file.start_upload(now);
    if (started.is_error()) {
        return Err<UploadOutcome, Error>(started.error());
    }
    events.push_back(std::move(started.value()));

    auto finished = file.complete_upload(location, now);
    if (finished.is_error()) {
        return Err<UploadOutcome, Error>(finished.error());
    }
    events.push_back(std::move(finished.value()));

    if (token.is_cancelled()) {
        spdlog::warn("Session {} cancelled before commit; orphaned bytes at {}",
                     session_id.str(), location.to_string());
        return Err<UploadOutcome>(ErrorKind::Cancelled, "Session completion cancelled");
    }

    auto staged = unit->files().update(file);
    if (staged.is_ok()) {
        staged = unit->sessions().update(session);
    }
    if (staged.is_error()) {
        spdlog::warn("Session {}: commit failed ({}); orphaned bytes at {}",
                     session_id.str(), staged.error().message, location.to_string());
        return Err<UploadOutcome, Error>(persistence_error(staged.error()));
    }
    if (auto saved = unit->save_changes(token); saved.is_error()) {
        spdlog::warn("Session {}: commit failed ({}); orphaned bytes at {}",
                     session_id.str(), saved.error().message, location.to_string());
        return Err<UploadOutcome, Error>(persistence_error(saved.error()));
    }

    discard_staging(session_id);

    const auto duration = elapsed_ms(session.created_at(), now);
    if (collaborators_.bus) {
        events::dispatch(*collaborators_.bus, events);
        collaborators_.bus->emit(events::UploadSessionCompletedEvent(session_id, file.id(), false, duration));
    }

    spdlog::info("Session {} completed: {} ({}) stored at {}",
                 session_id.str(), file.metadata().original_file_name(),
                 file.size().to_human_readable(), location.to_string());

    UploadOutcome outcome{file.id()};
    outcome.location = file.location();
    return Ok(std::move(outcome));
}

Result<UploadOutcome> ChunkedUploadService::finish_as_duplicate(metadata::UnitOfWork& unit,
                                                                domain::File placeholder,
                                                                domain::UploadSession session,
                                                                const domain::File& existing) {
    const auto now = collaborators_.clock();
    auto failed = placeholder.mark_failed("Duplicate of " + existing.id().str(), now);
    if (failed.is_error()) {
        return Err<UploadOutcome, Error>(failed.error());
    }

    auto staged = unit.files().update(placeholder);
    if (staged.is_ok()) {
        staged = unit.sessions().update(session);
    }
    if (staged.is_error()) {
        return Err<UploadOutcome, Error>(persistence_error(staged.error()));
    }
    if (auto saved = unit.save_changes(); saved.is_error()) {
        return Err<UploadOutcome, Error>(persistence_error(saved.error()));
    }

    discard_staging(session.id());

    spdlog::info("Session {} matches stored file {}, nothing uploaded", session.id().str(), existing.id().str());
    if (collaborators_.bus) {
        collaborators_.bus->emit(events::DuplicateUploadDetectedEvent(
            existing.id(), session.owner(), placeholder.metadata().original_file_name(),
            existing.metadata().content_hash(), session.total_size()));
        collaborators_.bus->emit(events::UploadSessionCompletedEvent(
            session.id(), existing.id(), true, elapsed_ms(session.created_at(), now)));
    }

    UploadOutcome outcome{existing.id()};
    outcome.duplicate = true;
    outcome.location = existing.location();
    outcome.thumbnail_location = existing.thumbnail_location();
    return Ok(std::move(outcome));
}

Result<SessionStatus> ChunkedUploadService::session_status(const domain::UploadSessionId& session_id) const {
    auto found = collaborators_.store->begin()->sessions().get(session_id);
    if (found.is_error()) {
        return Err<SessionStatus, Error>(persistence_error(found.error()));
    }
    if (!found.value()) {
        return Err<SessionStatus, Error>(session_not_found(session_id));
    }

    const auto& session = *found.value();
    const auto& uploaded = session.uploaded_chunks();
    return Ok(SessionStatus{session.id(),
                            session.file_id(),
                            session.progress(),
                            session.total_chunks(),
                            std::vector<std::uint64_t>(uploaded.begin(), uploaded.end()),
                            session.is_complete(),
                            session.is_completed(),
                            session.is_expired(collaborators_.clock()),
                            session.created_at(),
                            session.expires_at()});
}

Result<std::size_t> ChunkedUploadService::expire_stale_sessions(const CancellationToken& token) {
    const auto now = collaborators_.clock();
    auto stale = collaborators_.store->begin()->sessions().expired(now);
    if (stale.is_error()) {
        return Err<std::size_t, Error>(persistence_error(stale.error()));
    }

    std::size_t cleaned = 0;
    for (const auto& session : stale.value()) {
        if (token.is_cancelled()) {
            return Err<std::size_t>(ErrorKind::Cancelled,
                                    "Session cleanup cancelled after " + std::to_string(cleaned) + " sessions");
        }

        auto unit = collaborators_.store->begin();
        domain::DomainEvents events;

        auto file = unit->files().get(session.file_id());
        if (file.is_error()) {
            spdlog::warn("Skipping expired session {}: {}", session.id().str(), file.error().message);
            continue;
        }
        if (file.value()) {
            auto& owned = *file.value();
            const auto state = owned.status().state();
            if (state == domain::UploadState::Pending || state == domain::UploadState::Uploading) {
                auto failed = owned.mark_failed("Upload session expired", now);
                if (failed.is_ok()) {
                    events.push_back(std::move(failed.value()));
                    if (auto updated = unit->files().update(owned); updated.is_error()) {
                        spdlog::warn("Skipping expired session {}: {}", session.id().str(), updated.error().message);
                        continue;
                    }
                }
            }
        }

        if (auto removed = unit->sessions().remove(session.id()); removed.is_error()) {
            spdlog::warn("Skipping expired session {}: {}", session.id().str(), removed.error().message);
            continue;
        }
        if (auto saved = unit->save_changes(token); saved.is_error()) {
            spdlog::warn("Skipping expired session {}: {}", session.id().str(), saved.error().message);
            continue;
        }

        discard_staging(session.id());
        if (collaborators_.bus) {
            events::dispatch(*collaborators_.bus, events);
            collaborators_.bus->emit(events::UploadSessionExpiredEvent(session.id(), session.file_id()));
        }
        ++cleaned;
    }

    if (cleaned > 0) {
        spdlog::info("Expired {} stale upload session(s)", cleaned);
    }
    return Ok(cleaned);
}

void ChunkedUploadService::discard_staging(const domain::UploadSessionId& session_id) const {
    if (auto discarded = staging_.discard(session_id); discarded.is_error()) {
        spdlog::warn("{}", discarded.error().message);
    }
}

} // namespace strata::orchestration

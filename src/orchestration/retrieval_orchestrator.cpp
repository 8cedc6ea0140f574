#include "strata/orchestration/retrieval_orchestrator.hpp"

#include "strata/events/dispatch.hpp"
#include "strata/events/events.hpp"

#include <spdlog/spdlog.h>

namespace strata::orchestration {

RetrievalOrchestrator::RetrievalOrchestrator(Collaborators collaborators)
    : collaborators_(std::move(collaborators)) {}

Result<RetrievalOrchestrator::Located> RetrievalOrchestrator::locate(const domain::FileId& file_id) const {
    if (!collaborators_.store || !collaborators_.registry) {
        return Err<Located>(ErrorKind::InvalidArgument, "A metadata store and a provider registry are required");
    }

    auto found = collaborators_.store->begin()->files().get(file_id);
    if (found.is_error()) {
        return Err<Located, Error>(persistence_error(found.error()));
    }
    if (!found.value()) {
        return Err<Located>(ErrorKind::NotFound, "File not found: " + file_id.str());
    }

    domain::File file = std::move(*found.value());
    if (!file.location()) {
        return Err<Located>(ErrorKind::NotFound, "File " + file_id.str() + " has no storage location");
    }
    const auto location = *file.location();

    auto provider = collaborators_.registry->find(location.provider_name());
    if (!provider) {
        return Err<Located>(ErrorKind::NotFound,
                            "Storage provider " + location.provider_name() + " is not registered");
    }
    return Ok(Located{std::move(file), location, std::move(provider)});
}

Result<RetrievalRequestResult> RetrievalOrchestrator::initiate_retrieval(const domain::FileId& file_id,
                                                                         storage::RetrievalTier tier,
                                                                         const CancellationToken& token) {
    auto located = locate(file_id);
    if (located.is_error()) {
        return Err<RetrievalRequestResult, Error>(located.error());
    }
    auto& target = located.value();

    if (token.is_cancelled()) {
        return Err<RetrievalRequestResult>(ErrorKind::Cancelled, "Retrieval cancelled");
    }

    auto ticket = target.provider->initiate_retrieval(target.location, tier, token);
    if (ticket.is_error()) {
        spdlog::error("Retrieval of {} from {} failed: {}",
                      file_id.str(), target.provider->name(), ticket.error().message);
        return Err<RetrievalRequestResult, Error>(ticket.error());
    }

    const TimePoint eta = collaborators_.clock() + ticket.value().estimated_duration;
    RetrievalRequestResult result{ticket.value().retrieval_id, eta, ticket.value().state, target.provider->name()};

    if (collaborators_.bus) {
        collaborators_.bus->emit(events::RetrievalInitiatedEvent(
            file_id, result.provider, result.retrieval_id, storage::to_string(tier), eta));
    }
    spdlog::info("Retrieval {} requested for {} on {} ({} tier, ready by {})",
                 result.retrieval_id, file_id.str(), result.provider, storage::to_string(tier), format_time(eta));
    return Ok(std::move(result));
}

Result<storage::RetrievalStatusDetail> RetrievalOrchestrator::check_status(const std::string& retrieval_id,
                                                                           const CancellationToken& token) {
    if (retrieval_id.find_first_not_of(" \t\r\n") == std::string::npos) {
        return Err<storage::RetrievalStatusDetail>(ErrorKind::InvalidArgument, "Retrieval id is required");
    }
    if (!collaborators_.registry) {
        return Err<storage::RetrievalStatusDetail>(ErrorKind::InvalidArgument, "A provider registry is required");
    }

    for (const auto& provider : collaborators_.registry->retrieval_capable()) {
        auto status = provider->retrieval_status(retrieval_id, token);
        if (status.is_ok()) {
            return status;
        }
        switch (status.error().kind) {
            case ErrorKind::Cancelled:
                return status;
            case ErrorKind::NotFound:
                break;
            default:
                spdlog::warn("Provider {} could not report retrieval {}: {}",
                             provider->name(), retrieval_id, status.error().message);
                break;
        }
    }

    spdlog::warn("Retrieval {} is unknown to every registered provider", retrieval_id);
    storage::RetrievalStatusDetail unknown;
    unknown.state = storage::RetrievalState::Failed;
    unknown.message = "Retrieval ID not found: " + retrieval_id;
    return Ok(std::move(unknown));
}

Result<DownloadResult> RetrievalOrchestrator::download(const domain::FileId& file_id, const CancellationToken& token) {
    auto located = locate(file_id);
    if (located.is_error()) {
        return Err<DownloadResult, Error>(located.error());
    }
    auto& source = located.value();

    auto stream = source.provider->download(source.location, token);
    if (stream.is_error()) {
        spdlog::warn("Download of {} from {} failed: {}",
                     file_id.str(), source.provider->name(), stream.error().message);
        return Err<DownloadResult, Error>(stream.error());
    }

    const auto& file = source.file;
    if (collaborators_.bus) {
        collaborators_.bus->emit(events::FileDownloadStartedEvent(file_id, source.provider->name(), file.size().bytes()));
    }
    spdlog::info("Streaming {} ({}) from {}", file_id.str(), file.size().to_human_readable(), source.location.to_string());

    return Ok(DownloadResult{std::move(stream.value()), file.metadata().original_file_name(),
                             file.type().mime_type(), file.size().bytes()});
}

Result<void> RetrievalOrchestrator::archive(const domain::FileId& file_id, const CancellationToken& token) {
    if (!collaborators_.store) {
        return Err<void>(ErrorKind::InvalidArgument, "A metadata store is required");
    }

    auto unit = collaborators_.store->begin();
    auto found = unit->files().get(file_id);
    if (found.is_error()) {
        return Err<void, Error>(persistence_error(found.error()));
    }
    if (!found.value()) {
        return Err<void>(ErrorKind::NotFound, "File not found: " + file_id.str());
    }
    domain::File file = std::move(*found.value());

    auto archived = file.mark_archived(collaborators_.clock());
    if (archived.is_error()) {
        return Err<void, Error>(archived.error());
    }

    if (auto updated = unit->files().update(file); updated.is_error()) {
        return Err<void, Error>(persistence_error(updated.error()));
    }
    if (auto saved = unit->save_changes(token); saved.is_error()) {
        return Err<void, Error>(persistence_error(saved.error()));
    }

    if (collaborators_.bus) {
        events::dispatch(*collaborators_.bus, {archived.value()});
    }
    spdlog::info("Archived {} at {}", file_id.str(), file.location()->to_string());
    return Ok();
}

} // namespace strata::orchestration

/**
 * @file retrieval_orchestrator.hpp
 * @brief Cold-storage restores, downloads and archiving
 *
 * Bytes on an archive tier cannot be read directly. The caller asks for a
 * restore, polls until it is Ready, then downloads. A download attempted too
 * early fails with the backend's RestoreRequired error; no restore is started
 * behind the caller's back.
 *
 * Retrieval ids are opaque backend tokens. check_status() asks every
 * retrieval-capable backend in registration order until one recognises the
 * id; an id nobody knows is reported as a Failed status, not an error.
 */

#pragma once

#include "strata/core/cancellation.hpp"
#include "strata/orchestration/types.hpp"
#include "strata/storage/provider.hpp"

#include <cstdint>
#include <istream>
#include <memory>
#include <string>

namespace strata::orchestration {

struct RetrievalRequestResult {
    std::string retrieval_id;
    TimePoint estimated_completion;
    storage::RetrievalState state = storage::RetrievalState::Requested;
    std::string provider;
};

struct DownloadResult {
    std::unique_ptr<std::istream> stream;
    std::string file_name;
    std::string mime_type;
    std::uint64_t size_bytes = 0;
};

class RetrievalOrchestrator {
public:
    explicit RetrievalOrchestrator(Collaborators collaborators);

    /// NotFound when the file, its location or its backend is missing
    Result<RetrievalRequestResult> initiate_retrieval(const domain::FileId& file_id,
                                                      storage::RetrievalTier tier,
                                                      const CancellationToken& token = {});

    Result<storage::RetrievalStatusDetail> check_status(const std::string& retrieval_id,
                                                        const CancellationToken& token = {});

    Result<DownloadResult> download(const domain::FileId& file_id, const CancellationToken& token = {});

    /// Completed -> Archived, persisted, FileArchived published
    Result<void> archive(const domain::FileId& file_id, const CancellationToken& token = {});

private:
    struct Located {
        domain::File file;
        domain::StorageLocation location;
        storage::ProviderPtr provider;
    };

    Result<Located> locate(const domain::FileId& file_id) const;

    Collaborators collaborators_;
};

} // namespace strata::orchestration

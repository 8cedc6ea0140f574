/**
 * @file upload_orchestrator.hpp
 * @brief Single-shot upload: hash, deduplicate, place, store, record
 *
 * WHY THIS FILE EXISTS:
 * One upload touches three slow, independent systems (a hash over the
 * whole stream, a storage backend, the metadata store). This class strings
 * them together so that the only visible outcomes are "stored and
 * recorded", "already stored" or "failed with nothing recorded".
 *
 * HOW IT WORKS:
 * 1. Validate name, MIME type and size; rewindable streams only
 * 2. Hash the stream
 * 3. Look the hash up; a hit returns the existing file with duplicate=true
 * 4. Select a backend and write the bytes
 * 5. Build the File (Pending -> Uploading -> Completed)
 * 6. Best-effort thumbnail onto the fast tier
 * 7. Commit once, then publish the aggregate's events
 *
 * FAILURE SEMANTICS:
 * - Hashing or backend failure: the error is returned as is, nothing stored
 * - Thumbnail failure: logged, the file is stored without a thumbnail
 * - Commit failure: returned as PersistenceFailure; the bytes already on
 *   the backend are left behind and logged as orphaned
 * - Cancellation is checked before hashing, before the backend write and
 *   before the commit
 *
 * The duplicate check is check-then-act. Two identical uploads racing each
 * other can both be stored unless the store enforces unique hashes, in
 * which case the loser is turned into a duplicate result.
 */

#pragma once

#include "strata/core/cancellation.hpp"
#include "strata/core/config.hpp"
#include "strata/orchestration/types.hpp"

#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace strata::orchestration {

struct UploadRequest {
    domain::UserId owner;
    std::string file_name;
    std::string mime_type;
    TimePoint captured_at;
    std::optional<std::string> preferred_provider;
    std::vector<std::string> tags;
};

class FileUploadOrchestrator {
public:
    FileUploadOrchestrator(Collaborators collaborators,
                           core::UploadConfig upload_config = {},
                           core::ThumbnailConfig thumbnail_config = {});

    Result<UploadOutcome> upload(const UploadRequest& request,
                                 std::istream& data,
                                 const CancellationToken& token = {});

private:
    void attach_thumbnail(domain::File& file, std::istream& data, const CancellationToken& token);
    void skip_thumbnail(const domain::File& file, const std::string& reason);

    Result<UploadOutcome> existing_as_duplicate(const domain::File& existing,
                                                const UploadRequest& request,
                                                std::uint64_t bytes);

    Collaborators collaborators_;
    core::UploadConfig upload_config_;
    core::ThumbnailConfig thumbnail_config_;
};

} // namespace strata::orchestration

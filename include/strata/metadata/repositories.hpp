/**
 * @file repositories.hpp
 * @brief Persistence contracts the orchestrators depend on
 *
 * WHY THIS FILE EXISTS:
 * The engine needs create/read/update/search semantics for files and upload
 * sessions plus an atomic commit, nothing more. Any store that honours these
 * contracts can back the engine.
 *
 * UNIT OF WORK:
 * Writes made through a unit of work's repositories are staged privately.
 * save_changes() applies everything staged so far in one atomic step, or
 * nothing. Inside begin_transaction()/commit_transaction() saved changes are
 * held back until commit; rollback_transaction() discards them.
 *
 * OPTIMISTIC CONCURRENCY:
 * Every stored record carries a version. An update staged from a copy whose
 * version is no longer current fails the whole save with ErrorKind::Conflict.
 *
 * VISIBILITY:
 * get() sees the unit's own staged writes. get_by_hash(), list_by_owner(),
 * search() and the session queries see committed data only.
 */

#pragma once

#include "strata/core/cancellation.hpp"
#include "strata/core/clock.hpp"
#include "strata/core/result.hpp"
#include "strata/domain/file.hpp"
#include "strata/domain/file_type.hpp"
#include "strata/domain/ids.hpp"
#include "strata/domain/upload_session.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace strata::metadata {

template<typename T>
struct Page {
    std::vector<T> items;
    std::size_t total_count = 0;
    int page = 1;
    int page_size = 50;

    [[nodiscard]] int total_pages() const noexcept {
        if (page_size <= 0) {
            return 0;
        }
        return static_cast<int>((total_count + static_cast<std::size_t>(page_size) - 1) /
                                static_cast<std::size_t>(page_size));
    }
};

/**
 * @brief Filters for FileRepository::search; unset fields do not filter
 */
struct FileSearchCriteria {
    std::optional<domain::UserId> owner;
    std::optional<std::string> file_name;        ///< case-insensitive substring of the original name
    std::optional<domain::FileCategory> category;
    std::optional<TimePoint> captured_from;      ///< inclusive
    std::optional<TimePoint> captured_to;        ///< inclusive
    std::vector<std::string> tags;               ///< file must carry every tag
    int page = 1;
    int page_size = 50;
};

class FileRepository {
public:
    virtual ~FileRepository() = default;

    virtual Result<void> add(const domain::File& file) = 0;
    virtual Result<void> update(const domain::File& file) = 0;

    virtual Result<std::optional<domain::File>> get(const domain::FileId& id) const = 0;

    /// A non-failed file with this content hash, if any
    virtual Result<std::optional<domain::File>> get_by_hash(const std::string& content_hash) const = 0;

    /// Newest first; InvalidArgument for page < 1 or page_size < 1
    virtual Result<Page<domain::File>> list_by_owner(const domain::UserId& owner, int page, int page_size) const = 0;

    virtual Result<Page<domain::File>> search(const FileSearchCriteria& criteria) const = 0;
};

class UploadSessionRepository {
public:
    virtual ~UploadSessionRepository() = default;

    virtual Result<void> add(const domain::UploadSession& session) = 0;
    virtual Result<void> update(const domain::UploadSession& session) = 0;
    virtual Result<void> remove(const domain::UploadSessionId& id) = 0;

    virtual Result<std::optional<domain::UploadSession>> get(const domain::UploadSessionId& id) const = 0;

    /// Sessions of @p owner that are neither completed nor expired at @p now
    virtual Result<std::vector<domain::UploadSession>> active_for(const domain::UserId& owner, TimePoint now) const = 0;

    /// Uncompleted sessions whose deadline has passed at @p now
    virtual Result<std::vector<domain::UploadSession>> expired(TimePoint now) const = 0;
};

class UnitOfWork {
public:
    virtual ~UnitOfWork() = default;

    virtual FileRepository& files() = 0;
    virtual UploadSessionRepository& sessions() = 0;

    /// Number of staged changes written (or queued, inside a transaction)
    virtual Result<std::size_t> save_changes(const CancellationToken& token = {}) = 0;

    virtual Result<void> begin_transaction() = 0;
    virtual Result<void> commit_transaction(const CancellationToken& token = {}) = 0;
    virtual Result<void> rollback_transaction() = 0;
};

class MetadataStore {
public:
    virtual ~MetadataStore() = default;

    virtual std::unique_ptr<UnitOfWork> begin() = 0;
};

} // namespace strata::metadata

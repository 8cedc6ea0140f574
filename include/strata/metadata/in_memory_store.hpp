#pragma once

/**
 * @file in_memory_store.hpp
 * @brief Thread-safe in-memory implementation of the metadata contracts
 *
 * WHY THIS FILE EXISTS:
 * The engine needs a store with real commit semantics to run end to end
 * and to be tested without a database. This one keeps files and upload
 * sessions in hash maps and honours everything repositories.hpp promises:
 * staged writes, atomic save, transactions, version checks.
 *
 * THREAD SAFETY PATTERN:
 * - Queries take a shared_lock on the store (many concurrent readers)
 * - save_changes()/commit_transaction() take a unique_lock and validate the
 *   whole batch before touching anything, so a batch lands completely or
 *   not at all
 * - A unit of work itself is not thread-safe; open one per operation
 *
 * UNIQUE CONTENT HASH:
 * With Options::enforce_unique_hash set, a save that would leave two
 * non-failed files with the same content hash fails with Conflict. Without
 * it, duplicates are allowed and deduplication is left to the caller's
 * check-then-act lookup.
 *
 * A failed save discards the changes it was given; open a new unit of work
 * to retry. Units must not outlive the store that created them.
 */

#include "strata/metadata/repositories.hpp"

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace strata::metadata {

class InMemoryMetadataStore : public MetadataStore {
public:
    struct Options {
        bool enforce_unique_hash = false;
    };

    InMemoryMetadataStore() = default;
    explicit InMemoryMetadataStore(Options options) : options_(options) {}

    InMemoryMetadataStore(const InMemoryMetadataStore&) = delete;
    InMemoryMetadataStore& operator=(const InMemoryMetadataStore&) = delete;

    std::unique_ptr<UnitOfWork> begin() override;

    [[nodiscard]] std::size_t file_count() const;
    [[nodiscard]] std::size_t session_count() const;
    [[nodiscard]] const Options& options() const noexcept { return options_; }

private:
    class Unit;
    struct Change;

    Result<void> apply(const std::vector<Change>& changes);

    Options options_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<domain::FileId, domain::File> files_;
    std::unordered_multimap<std::string, domain::FileId> by_hash_;
    std::unordered_map<domain::UploadSessionId, domain::UploadSession> sessions_;
};

} // namespace strata::metadata

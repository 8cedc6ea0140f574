#include "strata/metadata/in_memory_store.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <mutex>
#include <unordered_set>
#include <variant>

namespace strata::metadata {

using domain::File;
using domain::FileId;
using domain::UploadSession;
using domain::UploadSessionId;
using domain::UploadState;

namespace {

struct AddFile { File file; };
struct UpdateFile { File file; };
struct AddSession { UploadSession session; };
struct UpdateSession { UploadSession session; };
struct RemoveSession { UploadSessionId id; };

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

Result<void> validate_paging(int page, int page_size) {
    if (page < 1) {
        return Err<void>(ErrorKind::InvalidArgument, "Page must be at least 1");
    }
    if (page_size < 1) {
        return Err<void>(ErrorKind::InvalidArgument, "Page size must be at least 1");
    }
    return Ok();
}

Page<File> paginate(std::vector<File> matches, int page, int page_size) {
    std::sort(matches.begin(), matches.end(), [](const File& a, const File& b) {
        if (a.metadata().created_at() != b.metadata().created_at()) {
            return a.metadata().created_at() > b.metadata().created_at();
        }
        return a.id() < b.id();
    });

    Page<File> result;
    result.total_count = matches.size();
    result.page = page;
    result.page_size = page_size;

    const std::size_t offset = static_cast<std::size_t>(page - 1) * static_cast<std::size_t>(page_size);
    if (offset < matches.size()) {
        const std::size_t end = std::min(matches.size(), offset + static_cast<std::size_t>(page_size));
        for (std::size_t i = offset; i < end; ++i) {
            result.items.push_back(std::move(matches[i]));
        }
    }
    return result;
}

bool matches_criteria(const File& file, const FileSearchCriteria& criteria) {
    if (criteria.owner && file.owner() != *criteria.owner) {
        return false;
    }
    if (criteria.file_name && !criteria.file_name->empty()) {
        const auto haystack = lower(file.metadata().original_file_name());
        if (haystack.find(lower(*criteria.file_name)) == std::string::npos) {
            return false;
        }
    }
    if (criteria.category && file.type().category() != *criteria.category) {
        return false;
    }
    if (criteria.captured_from && file.metadata().captured_at() < *criteria.captured_from) {
        return false;
    }
    if (criteria.captured_to && file.metadata().captured_at() > *criteria.captured_to) {
        return false;
    }
    return std::all_of(criteria.tags.begin(), criteria.tags.end(),
                       [&](const std::string& tag) { return file.metadata().has_tag(tag); });
}

} // namespace

struct InMemoryMetadataStore::Change {
    std::variant<AddFile, UpdateFile, AddSession, UpdateSession, RemoveSession> op;
};

// ════════════════════════════════════════════════════════
// Unit of work
// ════════════════════════════════════════════════════════

class InMemoryMetadataStore::Unit : public UnitOfWork {
public:
    explicit Unit(InMemoryMetadataStore& store) : store_(store), files_(*this), sessions_(*this) {}

    FileRepository& files() override { return files_; }
    UploadSessionRepository& sessions() override { return sessions_; }

    Result<std::size_t> save_changes(const CancellationToken& token) override {
        if (token.is_cancelled()) {
            return Err<std::size_t>(ErrorKind::Cancelled, "Save cancelled");
        }
        std::vector<Change> batch;
        batch.swap(pending_);
        const std::size_t count = batch.size();
        if (count == 0) {
            return Ok(count);
        }
        if (in_transaction_) {
            std::move(batch.begin(), batch.end(), std::back_inserter(transaction_));
            return Ok(count);
        }
        if (auto applied = store_.apply(batch); applied.is_error()) {
            return Err<std::size_t, Error>(applied.error());
        }
        return Ok(count);
    }

    Result<void> begin_transaction() override {
        if (in_transaction_) {
            return Err<void>(ErrorKind::InvalidArgument, "A transaction is already active");
        }
        in_transaction_ = true;
        return Ok();
    }

    Result<void> commit_transaction(const CancellationToken& token) override {
        if (!in_transaction_) {
            return Err<void>(ErrorKind::InvalidArgument, "No active transaction to commit");
        }
        if (token.is_cancelled()) {
            return Err<void>(ErrorKind::Cancelled, "Commit cancelled");
        }
        std::vector<Change> batch;
        batch.swap(transaction_);
        in_transaction_ = false;
        if (batch.empty()) {
            return Ok();
        }
        return store_.apply(batch);
    }

    Result<void> rollback_transaction() override {
        if (!in_transaction_) {
            return Err<void>(ErrorKind::InvalidArgument, "No active transaction to roll back");
        }
        transaction_.clear();
        pending_.clear();
        in_transaction_ = false;
        return Ok();
    }

private:
    class FileRepo : public FileRepository {
    public:
        explicit FileRepo(Unit& unit) : unit_(unit) {}

        Result<void> add(const File& file) override {
            unit_.pending_.push_back(Change{AddFile{file}});
            return Ok();
        }

        Result<void> update(const File& file) override {
            for (auto& change : unit_.pending_) {
                if (auto* added = std::get_if<AddFile>(&change.op); added && added->file.id() == file.id()) {
                    added->file = file;
                    return Ok();
                }
                if (auto* updated = std::get_if<UpdateFile>(&change.op); updated && updated->file.id() == file.id()) {
                    updated->file = file;
                    return Ok();
                }
            }
            unit_.pending_.push_back(Change{UpdateFile{file}});
            return Ok();
        }

        Result<std::optional<File>> get(const FileId& id) const override {
            if (auto staged = unit_.staged_file(id)) {
                return Ok(std::move(staged));
            }
            std::shared_lock lock(unit_.store_.mutex_);
            const auto it = unit_.store_.files_.find(id);
            if (it == unit_.store_.files_.end()) {
                return Ok(std::optional<File>{});
            }
            return Ok(std::optional<File>(it->second));
        }

        Result<std::optional<File>> get_by_hash(const std::string& content_hash) const override {
            const std::string key = lower(content_hash);
            std::shared_lock lock(unit_.store_.mutex_);
            const File* best = nullptr;
            auto [first, last] = unit_.store_.by_hash_.equal_range(key);
            for (auto it = first; it != last; ++it) {
                const File& candidate = unit_.store_.files_.at(it->second);
                if (candidate.status().is(UploadState::Failed)) {
                    continue;
                }
                if (!best || candidate.metadata().created_at() < best->metadata().created_at()) {
                    best = &candidate;
                }
            }
            if (!best) {
                return Ok(std::optional<File>{});
            }
            return Ok(std::optional<File>(*best));
        }

        Result<Page<File>> list_by_owner(const domain::UserId& owner, int page, int page_size) const override {
            FileSearchCriteria criteria;
            criteria.owner = owner;
            criteria.page = page;
            criteria.page_size = page_size;
            return search(criteria);
        }

        Result<Page<File>> search(const FileSearchCriteria& criteria) const override {
            if (auto valid = validate_paging(criteria.page, criteria.page_size); valid.is_error()) {
                return Err<Page<File>, Error>(valid.error());
            }
            std::vector<File> matches;
            {
                std::shared_lock lock(unit_.store_.mutex_);
                for (const auto& [id, file] : unit_.store_.files_) {
                    if (matches_criteria(file, criteria)) {
                        matches.push_back(file);
                    }
                }
            }
            return Ok(paginate(std::move(matches), criteria.page, criteria.page_size));
        }

    private:
        Unit& unit_;
    };

    class SessionRepo : public UploadSessionRepository {
    public:
        explicit SessionRepo(Unit& unit) : unit_(unit) {}

        Result<void> add(const UploadSession& session) override {
            unit_.pending_.push_back(Change{AddSession{session}});
            return Ok();
        }

        Result<void> update(const UploadSession& session) override {
            for (auto& change : unit_.pending_) {
                if (auto* added = std::get_if<AddSession>(&change.op); added && added->session.id() == session.id()) {
                    added->session = session;
                    return Ok();
                }
                if (auto* updated = std::get_if<UpdateSession>(&change.op);
                    updated && updated->session.id() == session.id()) {
                    updated->session = session;
                    return Ok();
                }
            }
            unit_.pending_.push_back(Change{UpdateSession{session}});
            return Ok();
        }

        Result<void> remove(const UploadSessionId& id) override {
            unit_.pending_.push_back(Change{RemoveSession{id}});
            return Ok();
        }

        Result<std::optional<UploadSession>> get(const UploadSessionId& id) const override {
            bool removed = false;
            if (auto staged = unit_.staged_session(id, removed)) {
                return Ok(std::move(staged));
            }
            if (removed) {
                return Ok(std::optional<UploadSession>{});
            }
            std::shared_lock lock(unit_.store_.mutex_);
            const auto it = unit_.store_.sessions_.find(id);
            if (it == unit_.store_.sessions_.end()) {
                return Ok(std::optional<UploadSession>{});
            }
            return Ok(std::optional<UploadSession>(it->second));
        }

        Result<std::vector<UploadSession>> active_for(const domain::UserId& owner, TimePoint now) const override {
            std::vector<UploadSession> out;
            std::shared_lock lock(unit_.store_.mutex_);
            for (const auto& [id, session] : unit_.store_.sessions_) {
                if (session.owner() == owner && !session.is_completed() && !session.is_expired(now)) {
                    out.push_back(session);
                }
            }
            return Ok(std::move(out));
        }

        Result<std::vector<UploadSession>> expired(TimePoint now) const override {
            std::vector<UploadSession> out;
            std::shared_lock lock(unit_.store_.mutex_);
            for (const auto& [id, session] : unit_.store_.sessions_) {
                if (session.is_expired(now)) {
                    out.push_back(session);
                }
            }
            return Ok(std::move(out));
        }

    private:
        Unit& unit_;
    };

    /// Latest staged copy of a file, searching unsaved then saved-in-transaction changes
    std::optional<File> staged_file(const FileId& id) const {
        for (const auto* changes : {&pending_, &transaction_}) {
            for (auto it = changes->rbegin(); it != changes->rend(); ++it) {
                if (const auto* added = std::get_if<AddFile>(&it->op); added && added->file.id() == id) {
                    return added->file;
                }
                if (const auto* updated = std::get_if<UpdateFile>(&it->op); updated && updated->file.id() == id) {
                    return updated->file;
                }
            }
        }
        return std::nullopt;
    }

    std::optional<UploadSession> staged_session(const UploadSessionId& id, bool& removed) const {
        removed = false;
        for (const auto* changes : {&pending_, &transaction_}) {
            for (auto it = changes->rbegin(); it != changes->rend(); ++it) {
                if (const auto* gone = std::get_if<RemoveSession>(&it->op); gone && gone->id == id) {
                    removed = true;
                    return std::nullopt;
                }
                if (const auto* added = std::get_if<AddSession>(&it->op); added && added->session.id() == id) {
                    return added->session;
                }
                if (const auto* updated = std::get_if<UpdateSession>(&it->op);
                    updated && updated->session.id() == id) {
                    return updated->session;
                }
            }
        }
        return std::nullopt;
    }

    InMemoryMetadataStore& store_;
    FileRepo files_;
    SessionRepo sessions_;
    std::vector<Change> pending_;
    std::vector<Change> transaction_;
    bool in_transaction_ = false;
};

// ════════════════════════════════════════════════════════
// Store
// ════════════════════════════════════════════════════════

std::unique_ptr<UnitOfWork> InMemoryMetadataStore::begin() {
    return std::make_unique<Unit>(*this);
}

std::size_t InMemoryMetadataStore::file_count() const {
    std::shared_lock lock(mutex_);
    return files_.size();
}

std::size_t InMemoryMetadataStore::session_count() const {
    std::shared_lock lock(mutex_);
    return sessions_.size();
}

Result<void> InMemoryMetadataStore::apply(const std::vector<Change>& changes) {
    std::unique_lock lock(mutex_);

    // Validated results land here first; the maps are only touched once the
    // whole batch has passed.
    std::unordered_map<FileId, File> file_overlay;
    std::unordered_map<UploadSessionId, std::optional<UploadSession>> session_overlay;
    std::unordered_set<FileId> files_added;
    std::unordered_set<UploadSessionId> sessions_added;

    auto current_file = [&](const FileId& id) -> const File* {
        if (auto it = file_overlay.find(id); it != file_overlay.end()) {
            return &it->second;
        }
        if (auto it = files_.find(id); it != files_.end()) {
            return &it->second;
        }
        return nullptr;
    };

    auto current_session = [&](const UploadSessionId& id) -> const UploadSession* {
        if (auto it = session_overlay.find(id); it != session_overlay.end()) {
            return it->second ? &*it->second : nullptr;
        }
        if (auto it = sessions_.find(id); it != sessions_.end()) {
            return &it->second;
        }
        return nullptr;
    };

    auto hash_taken = [&](const File& file) {
        if (!options_.enforce_unique_hash || file.status().is(UploadState::Failed)) {
            return false;
        }
        const auto hash = lower(file.metadata().content_hash());
        for (const auto& [id, other] : file_overlay) {
            if (id != file.id() && lower(other.metadata().content_hash()) == hash &&
                !other.status().is(UploadState::Failed)) {
                return true;
            }
        }
        auto [first, last] = by_hash_.equal_range(hash);
        for (auto it = first; it != last; ++it) {
            if (it->second == file.id() || file_overlay.count(it->second) > 0) {
                continue;
            }
            if (!files_.at(it->second).status().is(UploadState::Failed)) {
                return true;
            }
        }
        return false;
    };

    auto version_conflict = [](const std::string& what, const std::string& id,
                               std::uint64_t expected, std::uint64_t found) {
        return Err<void>(ErrorKind::Conflict,
                         what + " " + id + " was modified concurrently (expected version " +
                         std::to_string(expected) + ", found " + std::to_string(found) + ")");
    };

    for (const auto& change : changes) {
        if (const auto* add = std::get_if<AddFile>(&change.op)) {
            if (current_file(add->file.id())) {
                return Err<void>(ErrorKind::Conflict, "File already exists: " + add->file.id().str());
            }
            if (hash_taken(add->file)) {
                return Err<void>(ErrorKind::Conflict,
                                 "A file with content hash " + add->file.metadata().content_hash() + " already exists");
            }
            File stored = add->file;
            stored.set_version(1);
            files_added.insert(stored.id());
            file_overlay.insert_or_assign(stored.id(), std::move(stored));
        } else if (const auto* update = std::get_if<UpdateFile>(&change.op)) {
            const File* existing = current_file(update->file.id());
            if (!existing) {
                return Err<void>(ErrorKind::NotFound, "File not found: " + update->file.id().str());
            }
            const bool fresh = files_added.count(update->file.id()) > 0;
            if (!fresh && existing->version() != update->file.version()) {
                return version_conflict("File", update->file.id().str(), update->file.version(), existing->version());
            }
            if (hash_taken(update->file)) {
                return Err<void>(ErrorKind::Conflict,
                                 "A file with content hash " + update->file.metadata().content_hash() +
                                 " already exists");
            }
            File stored = update->file;
            stored.set_version(fresh ? existing->version() : existing->version() + 1);
            file_overlay.insert_or_assign(stored.id(), std::move(stored));
        } else if (const auto* add_session = std::get_if<AddSession>(&change.op)) {
            if (current_session(add_session->session.id())) {
                return Err<void>(ErrorKind::Conflict, "Upload session already exists: " + add_session->session.id().str());
            }
            UploadSession stored = add_session->session;
            stored.set_version(1);
            sessions_added.insert(stored.id());
            session_overlay.insert_or_assign(stored.id(), std::move(stored));
        } else if (const auto* update_session = std::get_if<UpdateSession>(&change.op)) {
            const auto& incoming = update_session->session;
            const UploadSession* existing = current_session(incoming.id());
            if (!existing) {
                return Err<void>(ErrorKind::NotFound, "Upload session not found: " + incoming.id().str());
            }
            const bool fresh = sessions_added.count(incoming.id()) > 0;
            if (!fresh && existing->version() != incoming.version()) {
                return version_conflict("Upload session", incoming.id().str(), incoming.version(), existing->version());
            }
            UploadSession stored = incoming;
            stored.set_version(fresh ? existing->version() : existing->version() + 1);
            session_overlay.insert_or_assign(stored.id(), std::move(stored));
        } else if (const auto* remove = std::get_if<RemoveSession>(&change.op)) {
            if (!current_session(remove->id)) {
                return Err<void>(ErrorKind::NotFound, "Upload session not found: " + remove->id.str());
            }
            session_overlay.insert_or_assign(remove->id, std::nullopt);
        }
    }

    for (auto& [id, file] : file_overlay) {
        if (auto existing = files_.find(id); existing != files_.end()) {
            auto [first, last] = by_hash_.equal_range(lower(existing->second.metadata().content_hash()));
            for (auto it = first; it != last; ++it) {
                if (it->second == id) {
                    by_hash_.erase(it);
                    break;
                }
            }
        }
        by_hash_.emplace(lower(file.metadata().content_hash()), id);
        files_.insert_or_assign(id, std::move(file));
    }

    for (auto& [id, session] : session_overlay) {
        if (session) {
            sessions_.insert_or_assign(id, std::move(*session));
        } else {
            sessions_.erase(id);
        }
    }

    return Ok();
}

} // namespace strata::metadata

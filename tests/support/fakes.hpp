#pragma once

#include "strata/core/clock.hpp"
#include "strata/events/event_bus.hpp"
#include "strata/metadata/in_memory_store.hpp"
#include "strata/orchestration/types.hpp"
#include "strata/services/hash_service.hpp"
#include "strata/services/thumbnail_service.hpp"
#include "strata/storage/provider.hpp"
#include "strata/storage/provider_registry.hpp"
#include "strata/storage/provider_selector.hpp"

#include <atomic>
#include <filesystem>
#include <functional>
#include <iomanip>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace strata::test_support {

inline std::filesystem::path create_temp_dir(const std::string& prefix) {
    static std::atomic<std::uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    auto dir = std::filesystem::temp_directory_path() /
               (prefix + "_" + domain::generate_uuid().substr(0, 8) + "_" + std::to_string(id));
    std::filesystem::create_directories(dir);
    return dir;
}

inline std::string slurp(std::istream& in) {
    std::ostringstream out;
    out << in.rdbuf();
    return out.str();
}

inline std::vector<std::uint8_t> bytes_of(const std::string& text) {
    return std::vector<std::uint8_t>(text.begin(), text.end());
}

// ════════════════════════════════════════════════════════
// Clock
// ════════════════════════════════════════════════════════

class ManualClock {
public:
    explicit ManualClock(TimePoint start = TimePoint{} + std::chrono::hours(24 * 365 * 50))
        : now_(std::make_shared<TimePoint>(start)) {}

    [[nodiscard]] TimePoint now() const { return *now_; }

    void advance(Clock::duration by) { *now_ += by; }

    [[nodiscard]] ClockFn fn() const {
        auto now = now_;
        return [now] { return *now; };
    }

private:
    std::shared_ptr<TimePoint> now_;
};

// ════════════════════════════════════════════════════════
// Hashing
// ════════════════════════════════════════════════════════

/// Deterministic non-cryptographic "sha256:" hash; can be told to fail
class FakeHashService : public services::HashService {
public:
    Result<std::string> compute(std::istream& data, const CancellationToken& token = {}) override {
        ++calls;
        if (token.is_cancelled()) {
            return Err<std::string>(ErrorKind::Cancelled, "Hashing cancelled");
        }
        if (fail) {
            return Err<std::string>(ErrorKind::BackendFailure, "Hash service unavailable");
        }
        const std::string content = slurp(data);
        std::ostringstream hex;
        hex << "sha256:" << std::hex << std::setw(16) << std::setfill('0') << std::hash<std::string>{}(content);
        return Ok(hex.str());
    }

    std::atomic<int> calls{0};
    bool fail = false;
};

// ════════════════════════════════════════════════════════
// Storage provider
// ════════════════════════════════════════════════════════

class FakeStorageProvider : public storage::StorageProvider {
public:
    struct UploadCall {
        std::string file_name;
        std::string content_type;
        std::string bytes;
    };

    explicit FakeStorageProvider(std::string name, storage::ProviderCapabilities caps = {})
        : name_(std::move(name)), caps_(caps) {}

    static storage::ProviderCapabilities cold() {
        storage::ProviderCapabilities caps;
        caps.instant_access = false;
        caps.retrieval = true;
        caps.deletion = false;
        caps.min_restore_time = std::chrono::minutes(60);
        caps.max_restore_time = std::chrono::minutes(720);
        return caps;
    }

    const std::string& name() const noexcept override { return name_; }
    storage::ProviderCapabilities capabilities() const override { return caps_; }

    Result<storage::UploadReceipt> upload(std::istream& data,
                                          const storage::UploadOptions& options,
                                          const CancellationToken& token) override {
        std::lock_guard lock(mutex_);
        if (before_write) {
            before_write();
        }
        if (token.is_cancelled()) {
            return Err<storage::UploadReceipt>(ErrorKind::Cancelled, "Upload cancelled");
        }
        if (fail_uploads) {
            return Err<storage::UploadReceipt>(ErrorKind::BackendFailure, failure_message);
        }
        UploadCall call{options.file_name, options.content_type, slurp(data)};
        const std::string path = "objects/" + std::to_string(uploads_.size()) + "/" + options.file_name;
        objects_[path] = call.bytes;
        uploads_.push_back(std::move(call));
        if (after_write) {
            after_write();
        }
        return Ok(storage::UploadReceipt{domain::StorageLocation::create(name_, path).value(), Clock::now()});
    }

    Result<std::unique_ptr<std::istream>> download(const domain::StorageLocation& location,
                                                   const CancellationToken&) override {
        using StreamPtr = std::unique_ptr<std::istream>;
        std::lock_guard lock(mutex_);
        auto it = objects_.find(location.path());
        if (it == objects_.end()) {
            return Err<StreamPtr>(ErrorKind::NotFound, "No object at " + location.path());
        }
        if (!caps_.instant_access && restored_.count(location.path()) == 0) {
            return Err<StreamPtr>(ErrorKind::RestoreRequired, "Object is in cold storage: " + location.path());
        }
        return Ok<StreamPtr>(std::make_unique<std::istringstream>(it->second));
    }

    Result<storage::RetrievalTicket> initiate_retrieval(const domain::StorageLocation& location,
                                                        storage::RetrievalTier,
                                                        const CancellationToken&) override {
        std::lock_guard lock(mutex_);
        if (!caps_.retrieval) {
            return Err<storage::RetrievalTicket>(ErrorKind::InvalidArgument, name_ + " does not support retrieval");
        }
        if (objects_.count(location.path()) == 0) {
            return Err<storage::RetrievalTicket>(ErrorKind::NotFound, "No object at " + location.path());
        }
        const std::string id = name_ + "-restore-" + std::to_string(jobs_.size());
        jobs_[id] = location.path();
        storage::RetrievalTicket ticket;
        ticket.retrieval_id = id;
        ticket.estimated_duration = retrieval_estimate;
        return Ok(ticket);
    }

    Result<storage::RetrievalStatusDetail> retrieval_status(const std::string& retrieval_id,
                                                            const CancellationToken&) override {
        std::lock_guard lock(mutex_);
        ++status_queries;
        auto it = jobs_.find(retrieval_id);
        if (it == jobs_.end()) {
            return Err<storage::RetrievalStatusDetail>(ErrorKind::NotFound, "Unknown retrieval " + retrieval_id);
        }
        storage::RetrievalStatusDetail detail;
        detail.state = restored_.count(it->second) ? storage::RetrievalState::Ready
                                                   : storage::RetrievalState::InProgress;
        detail.progress = detail.state == storage::RetrievalState::Ready ? 100 : 50;
        return Ok(detail);
    }

    Result<bool> remove(const domain::StorageLocation& location, const CancellationToken&) override {
        std::lock_guard lock(mutex_);
        return Ok(objects_.erase(location.path()) > 0);
    }

    storage::HealthStatus health_check(const CancellationToken&) override {
        storage::HealthStatus status;
        status.healthy = healthy;
        status.message = healthy ? "ok" : "unreachable";
        return status;
    }

    /// Makes a cold object readable, as a finished restore would
    void finish_restores() {
        std::lock_guard lock(mutex_);
        for (const auto& job : jobs_) {
            restored_.insert(job.second);
        }
    }

    std::size_t upload_count() const {
        std::lock_guard lock(mutex_);
        return uploads_.size();
    }

    std::vector<UploadCall> uploads() const {
        std::lock_guard lock(mutex_);
        return uploads_;
    }

    bool fail_uploads = false;
    std::string failure_message = "Storage provider error";
    std::chrono::seconds retrieval_estimate{3600};
    bool healthy = true;
    std::atomic<int> status_queries{0};

    /// Run under the provider lock, before the token is checked / after the bytes are stored
    std::function<void()> before_write;
    std::function<void()> after_write;

private:
    std::string name_;
    storage::ProviderCapabilities caps_;
    mutable std::mutex mutex_;
    std::vector<UploadCall> uploads_;
    std::map<std::string, std::string> objects_;
    std::map<std::string, std::string> jobs_;
    std::set<std::string> restored_;
};

// ════════════════════════════════════════════════════════
// Thumbnails
// ════════════════════════════════════════════════════════

class FakeThumbnailService : public services::ThumbnailService {
public:
    bool supports(const std::string& mime_type) const override {
        return mime_type.rfind("image/", 0) == 0;
    }

    Result<std::unique_ptr<std::istream>> generate(std::istream& source,
                                                   const services::ThumbnailRequest& request,
                                                   const CancellationToken&) override {
        using StreamPtr = std::unique_ptr<std::istream>;
        ++generate_calls;
        last_request = request;
        if (on_generate) {
            on_generate();
        }
        if (fail) {
            return Err<StreamPtr>(ErrorKind::BackendFailure, "Thumbnail renderer crashed");
        }
        const std::string original = slurp(source);
        return Ok<StreamPtr>(std::make_unique<std::istringstream>("thumb:" + original));
    }

    std::atomic<int> generate_calls{0};
    services::ThumbnailRequest last_request;
    bool fail = false;
    std::function<void()> on_generate;
};

// ════════════════════════════════════════════════════════
// Metadata store that refuses to commit
// ════════════════════════════════════════════════════════

/**
 * Wraps a real store; the next `failures` saves (or every save, when
 * negative) fail with `error` instead of being applied.
 */
class FailingMetadataStore : public metadata::MetadataStore {
public:
    FailingMetadataStore(std::shared_ptr<metadata::MetadataStore> inner, Error error, int failures = -1)
        : inner_(std::move(inner)),
          error_(std::move(error)),
          remaining_(std::make_shared<std::atomic<int>>(failures)) {}

    std::unique_ptr<metadata::UnitOfWork> begin() override {
        return std::make_unique<Unit>(inner_->begin(), error_, remaining_);
    }

private:
    class Unit : public metadata::UnitOfWork {
    public:
        Unit(std::unique_ptr<metadata::UnitOfWork> inner, Error error, std::shared_ptr<std::atomic<int>> remaining)
            : inner_(std::move(inner)), error_(std::move(error)), remaining_(std::move(remaining)) {}

        metadata::FileRepository& files() override { return inner_->files(); }
        metadata::UploadSessionRepository& sessions() override { return inner_->sessions(); }

        Result<std::size_t> save_changes(const CancellationToken& token) override {
            if (should_fail()) {
                return Err<std::size_t, Error>(error_);
            }
            return inner_->save_changes(token);
        }

        Result<void> begin_transaction() override { return inner_->begin_transaction(); }

        Result<void> commit_transaction(const CancellationToken& token) override {
            if (should_fail()) {
                return Err<void, Error>(error_);
            }
            return inner_->commit_transaction(token);
        }

        Result<void> rollback_transaction() override { return inner_->rollback_transaction(); }

    private:
        bool should_fail() {
            int left = remaining_->load();
            while (left != 0) {
                if (left < 0 || remaining_->compare_exchange_weak(left, left - 1)) {
                    return true;
                }
            }
            return false;
        }

        std::unique_ptr<metadata::UnitOfWork> inner_;
        Error error_;
        std::shared_ptr<std::atomic<int>> remaining_;
    };

    std::shared_ptr<metadata::MetadataStore> inner_;
    Error error_;
    std::shared_ptr<std::atomic<int>> remaining_;
};

// ════════════════════════════════════════════════════════
// Wiring
// ════════════════════════════════════════════════════════

/**
 * Three fake backends under the canonical tier names, an in-memory store,
 * the fake hasher and thumbnailer, and an event bus.
 */
struct Rig {
    Rig() {
        registry->add(standard);
        registry->add(deep);
        registry->add(flexible);
    }

    [[nodiscard]] orchestration::Collaborators collaborators() const {
        orchestration::Collaborators c;
        c.store = store;
        c.registry = registry;
        c.selector = std::make_shared<const storage::ProviderSelector>(
            storage::ProviderSelector::create(registry).value());
        c.hasher = hasher;
        c.thumbnails = thumbnails;
        c.bus = bus;
        c.clock = clock.fn();
        return c;
    }

    ManualClock clock;
    std::shared_ptr<metadata::MetadataStore> store = std::make_shared<metadata::InMemoryMetadataStore>();
    std::shared_ptr<storage::ProviderRegistry> registry = std::make_shared<storage::ProviderRegistry>();
    std::shared_ptr<FakeStorageProvider> standard = std::make_shared<FakeStorageProvider>("s3-standard");
    std::shared_ptr<FakeStorageProvider> deep =
        std::make_shared<FakeStorageProvider>("s3-glacier-deep", FakeStorageProvider::cold());
    std::shared_ptr<FakeStorageProvider> flexible =
        std::make_shared<FakeStorageProvider>("s3-glacier-flexible", FakeStorageProvider::cold());
    std::shared_ptr<FakeHashService> hasher = std::make_shared<FakeHashService>();
    std::shared_ptr<FakeThumbnailService> thumbnails = std::make_shared<FakeThumbnailService>();
    std::shared_ptr<events::EventBus> bus = std::make_shared<events::EventBus>();
};

} // namespace strata::test_support

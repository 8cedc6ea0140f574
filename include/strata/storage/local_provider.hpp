/**
 * @file local_provider.hpp
 * @brief Storage backend rooted in a local directory
 *
 * WHY THIS FILE EXISTS:
 * Gives the engine a real backend to run against without a cloud account.
 * Configured with instant_access=false it behaves like an archive tier:
 * downloads are refused with RestoreRequired until a restore job has
 * finished, and a restored copy stays readable for restore_window.
 *
 * LAYOUT:
 * <root>/objects/<first two chars of id>/<id><extension>
 *
 * RESTORE TIMING:
 *   Expedited -> min_restore_time
 *   Standard  -> midpoint of min and max
 *   Bulk      -> max_restore_time
 * Restore jobs live in memory and are evaluated against the injected clock.
 * An expired job still reports Expired for one more restore_window, after
 * which it is dropped and its id becomes unknown.
 */

#pragma once

#include "strata/core/clock.hpp"
#include "strata/core/config.hpp"
#include "strata/storage/provider.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace strata::storage {

class LocalDirectoryProvider : public StorageProvider {
    struct ConstructionKey {
        explicit ConstructionKey() = default;
    };

public:
    /// InvalidArgument for a missing name or root, BackendFailure when the root cannot be created
    static Result<std::shared_ptr<LocalDirectoryProvider>> create(const core::ProviderConfig& config,
                                                                  ClockFn clock = system_clock_fn());

    LocalDirectoryProvider(ConstructionKey, core::ProviderConfig config, ClockFn clock);

    [[nodiscard]] const std::string& name() const noexcept override { return config_.name; }
    [[nodiscard]] ProviderCapabilities capabilities() const override;

    Result<UploadReceipt> upload(std::istream& data,
                                 const UploadOptions& options,
                                 const CancellationToken& token) override;

    Result<std::unique_ptr<std::istream>> download(const domain::StorageLocation& location,
                                                   const CancellationToken& token) override;

    Result<RetrievalTicket> initiate_retrieval(const domain::StorageLocation& location,
                                               RetrievalTier tier,
                                               const CancellationToken& token) override;

    Result<RetrievalStatusDetail> retrieval_status(const std::string& retrieval_id,
                                                   const CancellationToken& token) override;

    Result<bool> remove(const domain::StorageLocation& location, const CancellationToken& token) override;

    HealthStatus health_check(const CancellationToken& token) override;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return config_.root; }

private:
    struct RestoreJob {
        std::string object_path;
        RetrievalTier tier;
        TimePoint requested_at;
        TimePoint ready_at;
        TimePoint expires_at;
    };

    Result<std::filesystem::path> resolve(const domain::StorageLocation& location) const;
    [[nodiscard]] std::chrono::seconds restore_duration(RetrievalTier tier) const;
    [[nodiscard]] bool is_restored(const std::string& object_path, TimePoint now) const;
    [[nodiscard]] RetrievalStatusDetail describe(const RestoreJob& job, TimePoint now) const;

    /// Caller holds jobs_mutex_
    void prune_expired_jobs(TimePoint now);

    core::ProviderConfig config_;
    ClockFn clock_;

    mutable std::mutex jobs_mutex_;
    std::unordered_map<std::string, RestoreJob> jobs_;
    std::unordered_multimap<std::string, std::string> jobs_by_object_;   ///< object path -> retrieval id
};

} // namespace strata::storage

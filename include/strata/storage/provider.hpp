/**
 * @file provider.hpp
 * @brief Capability contract every storage backend implements
 *
 * WHY THIS FILE EXISTS:
 * The orchestrators never talk to S3, Backblaze or a local disk directly.
 * They talk to a StorageProvider, which may be fast or cold, cheap or
 * expensive, local or remote. Everything the engine needs to know about a
 * backend's behaviour is expressed through ProviderCapabilities.
 *
 * COLD BACKENDS:
 * A provider without instant access refuses download() with
 * ErrorKind::RestoreRequired until a restore job started through
 * initiate_retrieval() has reached Ready. The engine never starts a restore
 * on its own; the caller decides.
 *
 * THREAD SAFETY:
 * Implementations must tolerate concurrent calls from the engine's worker
 * pool.
 */

#pragma once

#include "strata/core/cancellation.hpp"
#include "strata/core/clock.hpp"
#include "strata/core/result.hpp"
#include "strata/domain/storage_location.hpp"

#include <chrono>
#include <istream>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace strata::storage {

struct ProviderCapabilities {
    bool instant_access = true;
    bool retrieval = false;
    bool deletion = true;
    std::chrono::minutes min_restore_time{0};
    std::chrono::minutes max_restore_time{0};
};

struct UploadOptions {
    std::string file_name;
    std::string content_type;
    std::map<std::string, std::string> metadata;
};

struct UploadReceipt {
    domain::StorageLocation location;
    TimePoint uploaded_at;
};

/**
 * @brief Speed/cost trade-off for a restore job; the backend defines the SLA
 */
enum class RetrievalTier {
    Bulk,
    Standard,
    Expedited
};

enum class RetrievalState {
    Requested,
    InProgress,
    Ready,
    Expired,
    Failed
};

const char* to_string(RetrievalTier tier);
const char* to_string(RetrievalState state);

struct RetrievalTicket {
    std::string retrieval_id;
    std::chrono::seconds estimated_duration{0};
    RetrievalState state = RetrievalState::Requested;
};

struct RetrievalStatusDetail {
    RetrievalState state = RetrievalState::Requested;
    int progress = 0;
    std::optional<TimePoint> completed_at;
    std::string message;
};

struct HealthStatus {
    bool healthy = false;
    std::chrono::milliseconds response_time{0};
    std::string message;
};

class StorageProvider {
public:
    virtual ~StorageProvider() = default;

    [[nodiscard]] virtual const std::string& name() const noexcept = 0;
    [[nodiscard]] virtual ProviderCapabilities capabilities() const = 0;

    /// Reads @p data to the end and stores it; the location is backend-specific
    virtual Result<UploadReceipt> upload(std::istream& data,
                                         const UploadOptions& options,
                                         const CancellationToken& token) = 0;

    virtual Result<std::unique_ptr<std::istream>> download(const domain::StorageLocation& location,
                                                           const CancellationToken& token) = 0;

    virtual Result<RetrievalTicket> initiate_retrieval(const domain::StorageLocation& location,
                                                       RetrievalTier tier,
                                                       const CancellationToken& token) = 0;

    /// NotFound when this backend does not recognise @p retrieval_id
    virtual Result<RetrievalStatusDetail> retrieval_status(const std::string& retrieval_id,
                                                           const CancellationToken& token) = 0;

    /// true when an object was removed, false when nothing was stored there
    virtual Result<bool> remove(const domain::StorageLocation& location,
                                const CancellationToken& token) = 0;

    virtual HealthStatus health_check(const CancellationToken& token) = 0;
};

using ProviderPtr = std::shared_ptr<StorageProvider>;

} // namespace strata::storage

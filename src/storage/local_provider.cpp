#include "strata/storage/local_provider.hpp"

#include "strata/domain/ids.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <vector>

#include <spdlog/spdlog.h>

namespace strata::storage {
namespace fs = std::filesystem;

namespace {

constexpr std::size_t kCopyBufferSize = 64 * 1024;

Result<void> ensure_parent_exists(const fs::path& path) {
    const auto parent = path.parent_path();
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec && !fs::exists(parent)) {
        return Err<void>(ErrorKind::BackendFailure, "Failed to create directory: " + parent.string());
    }
    return Ok();
}

std::string extension_of(const std::string& file_name) {
    std::string ext = fs::path(file_name).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    const bool safe = std::all_of(ext.begin(), ext.end(), [](unsigned char c) {
        return c == '.' || std::isalnum(c);
    });
    return safe ? ext : std::string{};
}

} // namespace

LocalDirectoryProvider::LocalDirectoryProvider(ConstructionKey, core::ProviderConfig config, ClockFn clock)
    : config_(std::move(config)), clock_(std::move(clock)) {}

Result<std::shared_ptr<LocalDirectoryProvider>> LocalDirectoryProvider::create(const core::ProviderConfig& config,
                                                                               ClockFn clock) {
    using Ptr = std::shared_ptr<LocalDirectoryProvider>;
    if (config.name.empty()) {
        return Err<Ptr>(ErrorKind::InvalidArgument, "Local provider requires a name");
    }
    if (config.root.empty()) {
        return Err<Ptr>(ErrorKind::InvalidArgument, "Local provider " + config.name + " requires a root directory");
    }
    if (config.max_restore_time < config.min_restore_time) {
        return Err<Ptr>(ErrorKind::InvalidArgument,
                        "Local provider " + config.name + " has max_restore_time below min_restore_time");
    }

    std::error_code ec;
    fs::create_directories(config.root, ec);
    if (ec && !fs::is_directory(config.root)) {
        return Err<Ptr>(ErrorKind::BackendFailure,
                        "Failed to create provider root " + config.root.string() + ": " + ec.message());
    }

    if (!clock) {
        clock = system_clock_fn();
    }
    return Ok(std::make_shared<LocalDirectoryProvider>(ConstructionKey{}, config, std::move(clock)));
}

ProviderCapabilities LocalDirectoryProvider::capabilities() const {
    ProviderCapabilities caps;
    caps.instant_access = config_.instant_access;
    caps.retrieval = config_.supports_retrieval;
    caps.deletion = config_.supports_deletion;
    caps.min_restore_time = config_.min_restore_time;
    caps.max_restore_time = config_.max_restore_time;
    return caps;
}

Result<fs::path> LocalDirectoryProvider::resolve(const domain::StorageLocation& location) const {
    if (location.provider_name() != config_.name) {
        return Err<fs::path>(ErrorKind::InvalidArgument,
                             "Location " + location.to_string() + " does not belong to provider " + config_.name);
    }
    const fs::path relative(location.path());
    if (relative.is_absolute()) {
        return Err<fs::path>(ErrorKind::InvalidArgument, "Storage path must be relative: " + location.path());
    }
    for (const auto& part : relative) {
        if (part == "..") {
            return Err<fs::path>(ErrorKind::InvalidArgument, "Storage path escapes provider root: " + location.path());
        }
    }
    return Ok(config_.root / relative);
}

Result<UploadReceipt> LocalDirectoryProvider::upload(std::istream& data,
                                                     const UploadOptions& options,
                                                     const CancellationToken& token) {
    if (token.is_cancelled()) {
        return Err<UploadReceipt>(ErrorKind::Cancelled, "Upload cancelled");
    }

    const std::string object_id = domain::generate_uuid();
    const std::string relative =
        "objects/" + object_id.substr(0, 2) + "/" + object_id + extension_of(options.file_name);
    const fs::path target = config_.root / relative;
    const fs::path partial = fs::path(target).concat(".partial");

    if (auto res = ensure_parent_exists(target); res.is_error()) {
        return Err<UploadReceipt, Error>(res.error());
    }

    {
        std::ofstream out(partial, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Err<UploadReceipt>(ErrorKind::BackendFailure, "Failed to open " + partial.string());
        }

        std::vector<char> buffer(kCopyBufferSize);
        while (data.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || data.gcount() > 0) {
            if (token.is_cancelled()) {
                out.close();
                std::error_code ec;
                fs::remove(partial, ec);
                return Err<UploadReceipt>(ErrorKind::Cancelled, "Upload cancelled");
            }
            out.write(buffer.data(), data.gcount());
            if (!out) {
                break;
            }
        }

        if (data.bad() || !out) {
            out.close();
            std::error_code ec;
            fs::remove(partial, ec);
            return Err<UploadReceipt>(ErrorKind::BackendFailure, "Failed to write object " + relative);
        }
    }

    std::error_code ec;
    fs::rename(partial, target, ec);
    if (ec) {
        fs::remove(partial, ec);
        return Err<UploadReceipt>(ErrorKind::BackendFailure, "Failed to store object " + target.string());
    }

    auto location = domain::StorageLocation::create(config_.name, relative);
    if (location.is_error()) {
        return Err<UploadReceipt, Error>(location.error());
    }
    spdlog::debug("[{}] stored {} as {}", config_.name, options.file_name, relative);
    return Ok(UploadReceipt{location.value(), clock_()});
}

Result<std::unique_ptr<std::istream>> LocalDirectoryProvider::download(const domain::StorageLocation& location,
                                                                       const CancellationToken& token) {
    using StreamPtr = std::unique_ptr<std::istream>;
    if (token.is_cancelled()) {
        return Err<StreamPtr>(ErrorKind::Cancelled, "Download cancelled");
    }

    auto path = resolve(location);
    if (path.is_error()) {
        return Err<StreamPtr, Error>(path.error());
    }
    if (!fs::is_regular_file(path.value())) {
        return Err<StreamPtr>(ErrorKind::NotFound, "Object not found: " + location.to_string());
    }
    if (!config_.instant_access && !is_restored(location.path(), clock_())) {
        return Err<StreamPtr>(ErrorKind::RestoreRequired,
                              "Object " + location.to_string() +
                              " is in cold storage and must be restored before download");
    }

    auto stream = std::make_unique<std::ifstream>(path.value(), std::ios::binary);
    if (!*stream) {
        return Err<StreamPtr>(ErrorKind::BackendFailure, "Failed to open object " + location.to_string());
    }
    return Ok<StreamPtr>(std::move(stream));
}

std::chrono::seconds LocalDirectoryProvider::restore_duration(RetrievalTier tier) const {
    if (config_.instant_access) {
        return std::chrono::seconds{0};
    }
    switch (tier) {
        case RetrievalTier::Expedited:
            return config_.min_restore_time;
        case RetrievalTier::Standard:
            return (config_.min_restore_time + config_.max_restore_time) / 2;
        case RetrievalTier::Bulk:
            return config_.max_restore_time;
    }
    return config_.max_restore_time;
}

Result<RetrievalTicket> LocalDirectoryProvider::initiate_retrieval(const domain::StorageLocation& location,
                                                                   RetrievalTier tier,
                                                                   const CancellationToken& token) {
    if (token.is_cancelled()) {
        return Err<RetrievalTicket>(ErrorKind::Cancelled, "Retrieval request cancelled");
    }
    if (!config_.supports_retrieval) {
        return Err<RetrievalTicket>(ErrorKind::BackendFailure,
                                    "Provider " + config_.name + " does not support retrieval");
    }

    auto path = resolve(location);
    if (path.is_error()) {
        return Err<RetrievalTicket, Error>(path.error());
    }
    if (!fs::is_regular_file(path.value())) {
        return Err<RetrievalTicket>(ErrorKind::NotFound, "Object not found: " + location.to_string());
    }

    const auto now = clock_();
    const auto duration = restore_duration(tier);
    RestoreJob job{location.path(), tier, now, now + duration, now + duration + config_.restore_window};

    RetrievalTicket ticket;
    ticket.retrieval_id = "restore-" + domain::generate_uuid();
    ticket.estimated_duration = duration;
    ticket.state = duration.count() == 0 ? RetrievalState::Ready : RetrievalState::Requested;

    {
        std::lock_guard lock(jobs_mutex_);
        prune_expired_jobs(now);
        jobs_by_object_.emplace(job.object_path, ticket.retrieval_id);
        jobs_.emplace(ticket.retrieval_id, std::move(job));
    }

    spdlog::info("[{}] restore {} requested for {} (tier={}, eta={}s)",
                 config_.name, ticket.retrieval_id, location.path(), to_string(tier), duration.count());
    return Ok(std::move(ticket));
}

RetrievalStatusDetail LocalDirectoryProvider::describe(const RestoreJob& job, TimePoint now) const {
    RetrievalStatusDetail detail;
    if (now >= job.expires_at) {
        detail.state = RetrievalState::Expired;
        detail.progress = 100;
        detail.completed_at = job.ready_at;
        detail.message = "Restored copy has expired";
        return detail;
    }
    if (now >= job.ready_at) {
        detail.state = RetrievalState::Ready;
        detail.progress = 100;
        detail.completed_at = job.ready_at;
        return detail;
    }

    const auto total = std::chrono::duration_cast<std::chrono::seconds>(job.ready_at - job.requested_at).count();
    const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - job.requested_at).count();
    if (elapsed <= 0) {
        detail.state = RetrievalState::Requested;
        detail.progress = 0;
        return detail;
    }
    detail.state = RetrievalState::InProgress;
    detail.progress = std::clamp(static_cast<int>(elapsed * 100 / total), 1, 99);
    return detail;
}

Result<RetrievalStatusDetail> LocalDirectoryProvider::retrieval_status(const std::string& retrieval_id,
                                                                       const CancellationToken& token) {
    if (token.is_cancelled()) {
        return Err<RetrievalStatusDetail>(ErrorKind::Cancelled, "Status query cancelled");
    }

    const auto now = clock_();
    std::lock_guard lock(jobs_mutex_);
    prune_expired_jobs(now);
    const auto it = jobs_.find(retrieval_id);
    if (it == jobs_.end()) {
        return Err<RetrievalStatusDetail>(ErrorKind::NotFound, "Unknown retrieval id: " + retrieval_id);
    }
    return Ok(describe(it->second, now));
}

bool LocalDirectoryProvider::is_restored(const std::string& object_path, TimePoint now) const {
    std::lock_guard lock(jobs_mutex_);
    const auto [first, last] = jobs_by_object_.equal_range(object_path);
    return std::any_of(first, last, [&](const auto& entry) {
        const auto job = jobs_.find(entry.second);
        return job != jobs_.end() && now >= job->second.ready_at && now < job->second.expires_at;
    });
}

void LocalDirectoryProvider::prune_expired_jobs(TimePoint now) {
    for (auto it = jobs_by_object_.begin(); it != jobs_by_object_.end();) {
        const auto job = jobs_.find(it->second);
        if (job != jobs_.end() && now >= job->second.expires_at + config_.restore_window) {
            spdlog::debug("[{}] dropping expired restore {}", config_.name, it->second);
            jobs_.erase(job);
            it = jobs_by_object_.erase(it);
        } else {
            ++it;
        }
    }
}

Result<bool> LocalDirectoryProvider::remove(const domain::StorageLocation& location, const CancellationToken& token) {
    if (token.is_cancelled()) {
        return Err<bool>(ErrorKind::Cancelled, "Delete cancelled");
    }
    if (!config_.supports_deletion) {
        return Err<bool>(ErrorKind::BackendFailure, "Provider " + config_.name + " does not support deletion");
    }

    auto path = resolve(location);
    if (path.is_error()) {
        return Err<bool, Error>(path.error());
    }

    std::error_code ec;
    const bool removed = fs::remove(path.value(), ec);
    if (ec) {
        return Err<bool>(ErrorKind::BackendFailure, "Failed to delete " + location.to_string() + ": " + ec.message());
    }
    return Ok(removed);
}

HealthStatus LocalDirectoryProvider::health_check(const CancellationToken& token) {
    HealthStatus status;
    if (token.is_cancelled()) {
        status.message = "Health check cancelled";
        return status;
    }

    const auto started = std::chrono::steady_clock::now();
    const fs::path probe = config_.root / (".health-" + domain::generate_uuid());
    {
        std::ofstream out(probe, std::ios::binary | std::ios::trunc);
        out << "ok";
        status.healthy = static_cast<bool>(out);
    }
    std::error_code ec;
    fs::remove(probe, ec);
    status.response_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    status.message = status.healthy ? "Root " + config_.root.string() + " is writable"
                                    : "Root " + config_.root.string() + " is not writable";
    return status;
}

} // namespace strata::storage

#pragma once

#include "strata/core/result.hpp"

#include <cstdint>
#include <string>

namespace strata::domain {

/**
 * @brief Positive byte count capped at kMaxBytes
 */
class FileSize {
public:
    static constexpr std::uint64_t kMaxBytes = 5ULL * 1024 * 1024 * 1024;

    static Result<FileSize> from_bytes(std::uint64_t bytes);

    [[nodiscard]] std::uint64_t bytes() const noexcept { return bytes_; }

    [[nodiscard]] double to_kilobytes() const noexcept { return static_cast<double>(bytes_) / 1024.0; }
    [[nodiscard]] double to_megabytes() const noexcept { return static_cast<double>(bytes_) / (1024.0 * 1024.0); }
    [[nodiscard]] double to_gigabytes() const noexcept {
        return static_cast<double>(bytes_) / (1024.0 * 1024.0 * 1024.0);
    }

    /// "512 B", "1.50 KB", "2.00 MB", "1.25 GB"
    [[nodiscard]] std::string to_human_readable() const;

    bool operator==(const FileSize& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const FileSize& other) const { return bytes_ != other.bytes_; }
    bool operator<(const FileSize& other) const { return bytes_ < other.bytes_; }
    bool operator>(const FileSize& other) const { return bytes_ > other.bytes_; }
    bool operator<=(const FileSize& other) const { return bytes_ <= other.bytes_; }
    bool operator>=(const FileSize& other) const { return bytes_ >= other.bytes_; }

private:
    explicit FileSize(std::uint64_t bytes) : bytes_(bytes) {}

    std::uint64_t bytes_;
};

} // namespace strata::domain

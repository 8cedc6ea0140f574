#include "strata/domain/file_size.hpp"

#include <iomanip>
#include <sstream>

namespace strata::domain {

Result<FileSize> FileSize::from_bytes(std::uint64_t bytes) {
    if (bytes == 0) {
        return Err<FileSize>(ErrorKind::InvalidArgument, "File size must be greater than zero");
    }
    if (bytes > kMaxBytes) {
        return Err<FileSize>(ErrorKind::InvalidArgument,
                             "File size cannot exceed " + std::to_string(kMaxBytes) + " bytes (5.00 GB)");
    }
    return Ok(FileSize(bytes));
}

std::string FileSize::to_human_readable() const {
    constexpr std::uint64_t kKb = 1024;
    constexpr std::uint64_t kMb = kKb * 1024;
    constexpr std::uint64_t kGb = kMb * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    if (bytes_ < kKb) {
        oss << bytes_ << " B";
    } else if (bytes_ < kMb) {
        oss << to_kilobytes() << " KB";
    } else if (bytes_ < kGb) {
        oss << to_megabytes() << " MB";
    } else {
        oss << to_gigabytes() << " GB";
    }
    return oss.str();
}

} // namespace strata::domain

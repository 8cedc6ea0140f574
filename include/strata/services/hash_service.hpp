#pragma once

#include "strata/core/cancellation.hpp"
#include "strata/core/result.hpp"

#include <istream>
#include <string>

namespace strata::services {

/**
 * @brief Content hashing used as the deduplication key
 *
 * Hashes are namespaced ("sha256:" + lower-case hex) so the algorithm can
 * change without colliding with stored values.
 */
class HashService {
public:
    virtual ~HashService() = default;

    /// Consumes @p data to the end; identical bytes always give identical hashes
    virtual Result<std::string> compute(std::istream& data, const CancellationToken& token = {}) = 0;

    /// Case-insensitive comparison of the computed hash with @p expected
    virtual Result<bool> verify(std::istream& data, const std::string& expected,
                                const CancellationToken& token = {});
};

class Sha256HashService : public HashService {
public:
    static constexpr const char* kPrefix = "sha256:";

    Result<std::string> compute(std::istream& data, const CancellationToken& token = {}) override;
};

} // namespace strata::services

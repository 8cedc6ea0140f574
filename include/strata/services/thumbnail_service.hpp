#pragma once

#include "strata/core/cancellation.hpp"
#include "strata/core/result.hpp"

#include <istream>
#include <memory>
#include <string>

namespace strata::services {

struct ThumbnailRequest {
    int width = 300;
    int height = 300;
    int quality = 80;
};

/**
 * @brief Renders a preview image from a file's bytes
 *
 * Rendering itself lives outside the engine. The engine only asks whether
 * a MIME type is supported and hands over the bytes.
 */
class ThumbnailService {
public:
    virtual ~ThumbnailService() = default;

    [[nodiscard]] virtual bool supports(const std::string& mime_type) const = 0;

    virtual Result<std::unique_ptr<std::istream>> generate(std::istream& source,
                                                           const ThumbnailRequest& request,
                                                           const CancellationToken& token = {}) = 0;
};

} // namespace strata::services

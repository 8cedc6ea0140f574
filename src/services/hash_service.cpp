#include "strata/services/hash_service.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <memory>
#include <vector>

namespace strata::services {
namespace {

constexpr std::size_t kReadBufferSize = 64 * 1024;

struct DigestContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

std::string to_hex(const unsigned char* data, unsigned int length) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        out.push_back(kDigits[data[i] >> 4]);
        out.push_back(kDigits[data[i] & 0x0F]);
    }
    return out;
}

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

Result<bool> HashService::verify(std::istream& data, const std::string& expected, const CancellationToken& token) {
    auto actual = compute(data, token);
    if (actual.is_error()) {
        return Err<bool, Error>(actual.error());
    }
    return Ok(lower(actual.value()) == lower(expected));
}

Result<std::string> Sha256HashService::compute(std::istream& data, const CancellationToken& token) {
    DigestContext ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return Err<std::string>(ErrorKind::BackendFailure, "Failed to initialise SHA-256 digest");
    }

    std::vector<char> buffer(kReadBufferSize);
    while (data.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || data.gcount() > 0) {
        if (token.is_cancelled()) {
            return Err<std::string>(ErrorKind::Cancelled, "Hash computation cancelled");
        }
        if (EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(data.gcount())) != 1) {
            return Err<std::string>(ErrorKind::BackendFailure, "SHA-256 update failed");
        }
    }
    if (data.bad()) {
        return Err<std::string>(ErrorKind::InvalidArgument, "Failed to read stream while hashing");
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1) {
        return Err<std::string>(ErrorKind::BackendFailure, "SHA-256 finalisation failed");
    }
    return Ok(std::string(kPrefix) + to_hex(digest.data(), length));
}

} // namespace strata::services

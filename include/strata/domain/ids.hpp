#pragma once

#include "strata/core/result.hpp"

#include <cstddef>
#include <functional>
#include <string>

namespace strata::domain {

std::string generate_uuid();

/**
 * @brief Opaque identifier distinguished at compile time by its tag
 */
template<typename Tag>
class Identifier {
public:
    static Identifier generate() { return Identifier(generate_uuid()); }

    static Result<Identifier> from_string(const std::string& text) {
        if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
            return Err<Identifier>(ErrorKind::InvalidArgument, std::string(Tag::kName) + " cannot be empty");
        }
        return Ok(Identifier(text));
    }

    [[nodiscard]] const std::string& value() const noexcept { return value_; }
    [[nodiscard]] const std::string& str() const noexcept { return value_; }

    bool operator==(const Identifier& other) const { return value_ == other.value_; }
    bool operator!=(const Identifier& other) const { return value_ != other.value_; }
    bool operator<(const Identifier& other) const { return value_ < other.value_; }

private:
    explicit Identifier(std::string value) : value_(std::move(value)) {}

    std::string value_;
};

struct FileIdTag { static constexpr const char* kName = "FileId"; };
struct UserIdTag { static constexpr const char* kName = "UserId"; };
struct UploadSessionIdTag { static constexpr const char* kName = "UploadSessionId"; };

using FileId = Identifier<FileIdTag>;
using UserId = Identifier<UserIdTag>;
using UploadSessionId = Identifier<UploadSessionIdTag>;

} // namespace strata::domain

namespace std {

template<typename Tag>
struct hash<strata::domain::Identifier<Tag>> {
    std::size_t operator()(const strata::domain::Identifier<Tag>& id) const noexcept {
        return std::hash<std::string>{}(id.value());
    }
};

} // namespace std

#include "strata/orchestration/types.hpp"

namespace strata::orchestration {

Result<void> Collaborators::validate() const {
    if (!store) {
        return Err<void>(ErrorKind::InvalidArgument, "A metadata store is required");
    }
    if (!registry) {
        return Err<void>(ErrorKind::InvalidArgument, "A provider registry is required");
    }
    if (!selector) {
        return Err<void>(ErrorKind::InvalidArgument, "A provider selector is required");
    }
    if (!hasher) {
        return Err<void>(ErrorKind::InvalidArgument, "A hash service is required");
    }
    if (!clock) {
        return Err<void>(ErrorKind::InvalidArgument, "A clock is required");
    }
    return Ok();
}

Error persistence_error(const Error& store_error) {
    switch (store_error.kind) {
        case ErrorKind::Cancelled:
        case ErrorKind::Conflict:
        case ErrorKind::NotFound:
            return store_error;
        default:
            return Error{ErrorKind::PersistenceFailure, store_error.message};
    }
}

} // namespace strata::orchestration

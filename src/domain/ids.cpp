#include "strata/domain/ids.hpp"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace strata::domain {

std::string generate_uuid() {
    // random_generator is not thread-safe; one per thread
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

} // namespace strata::domain

#include "strata/storage/provider.hpp"

namespace strata::storage {

const char* to_string(RetrievalTier tier) {
    switch (tier) {
        case RetrievalTier::Bulk: return "Bulk";
        case RetrievalTier::Standard: return "Standard";
        case RetrievalTier::Expedited: return "Expedited";
    }
    return "Standard";
}

const char* to_string(RetrievalState state) {
    switch (state) {
        case RetrievalState::Requested: return "Requested";
        case RetrievalState::InProgress: return "InProgress";
        case RetrievalState::Ready: return "Ready";
        case RetrievalState::Expired: return "Expired";
        case RetrievalState::Failed: return "Failed";
    }
    return "Failed";
}

} // namespace strata::storage

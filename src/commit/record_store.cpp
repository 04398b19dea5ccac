#include "chunkvault/commit/record_store.hpp"

namespace chunkvault::commit {

const char* to_string(FinalizeState state) {
    switch (state) {
        case FinalizeState::PENDING_FINALIZE: return "pending_finalize";
        case FinalizeState::FINALIZED: return "finalized";
    }
    return "unknown";
}

std::optional<FinalizeState> finalize_state_from_string(const std::string& name) {
    if (name == "pending_finalize") return FinalizeState::PENDING_FINALIZE;
    if (name == "finalized") return FinalizeState::FINALIZED;
    return std::nullopt;
}

std::string CommitMetadata::field(const std::string& key, const std::string& fallback) const {
    auto it = fields.find(key);
    if (it == fields.end() || it->second.empty()) {
        return fallback;
    }
    return it->second;
}

} // namespace chunkvault::commit

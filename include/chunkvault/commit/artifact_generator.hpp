#pragma once

#include <filesystem>
#include "record_store.hpp"

namespace chunkvault::commit {

// Produces derived files (thumbnails, previews) for a freshly committed
// record. Failures are reported by throwing; the caller only logs them.
class ArtifactGenerator {
public:
    virtual ~ArtifactGenerator() = default;
    
    virtual void generate(const PersistedRecord& record, const std::filesystem::path& file_path) = 0;
};

} // namespace chunkvault::commit

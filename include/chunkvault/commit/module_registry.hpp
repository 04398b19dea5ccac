#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <vector>
#include "record_store.hpp"

namespace chunkvault::commit {

// Final and staging locations, both relative to the file storage directory.
struct PlannedPaths {
    std::filesystem::path final_path;
    std::filesystem::path temp_path;
};

struct ModuleHandler {
    // (metadata, original file name, fresh uuid) -> final relative path.
    using PathBuilder = std::function<std::filesystem::path(const CommitMetadata&, const std::string&,
                                                            const std::string&)>;
    // Fills in the module-specific columns of a record.
    using RecordBuilder = std::function<void(PersistedRecord&, const CommitMetadata&)>;
    using AssociationHandler = std::function<Associations(const PersistedRecord&, const CommitMetadata&)>;
    
    std::string name;
    PathBuilder build_path;
    RecordBuilder build_record;
    AssociationHandler build_associations;
};

class ModuleRegistry {
public:
    ModuleRegistry() = default;
    
    // documents, notes, archive and diary.
    static ModuleRegistry with_default_modules();
    
    void register_module(ModuleHandler handler);
    
    bool contains(const std::string& name) const;
    
    // Throws ValidationError for unknown modules.
    const ModuleHandler& resolve(const std::string& name) const;
    
    PlannedPaths plan_paths(const std::string& module, const CommitMetadata& metadata,
                            const std::string& original_name, const std::string& uuid) const;
    
    std::vector<std::string> names() const;

private:
    std::map<std::string, ModuleHandler> handlers_;
};

} // namespace chunkvault::commit

#include "chunkvault/commit/module_registry.hpp"
#include "chunkvault/core/errors.hpp"
#include "chunkvault/core/utils.hpp"

namespace chunkvault::commit {

using core::utils::FileUtils;
using core::utils::IdUtils;
using core::utils::StringUtils;

namespace {

constexpr size_t MAX_READABLE_NAME = 100;

std::string extension_of(const std::string& name) {
    return StringUtils::to_lower(FileUtils::get_file_extension(name));
}

std::string stem_of(const std::string& name) {
    return std::filesystem::path(name).stem().string();
}

Associations tags_and_projects(const CommitMetadata& metadata) {
    Associations result;
    result.tags = metadata.tags;
    for (const auto& project_id : metadata.project_ids) {
        result.links.push_back({"project", project_id});
    }
    return result;
}

ModuleHandler documents_module() {
    ModuleHandler handler;
    handler.name = "documents";
    handler.build_path = [](const CommitMetadata&, const std::string& original_name, const std::string& uuid) {
        auto readable = StringUtils::sanitize_filename(stem_of(original_name), MAX_READABLE_NAME);
        return std::filesystem::path("assets") / "documents" / (readable + "_" + uuid + extension_of(original_name));
    };
    handler.build_record = [](PersistedRecord& record, const CommitMetadata&) {
        if (record.title.empty()) {
            record.title = stem_of(record.original_name);
        }
    };
    handler.build_associations = [](const PersistedRecord&, const CommitMetadata& metadata) {
        return tags_and_projects(metadata);
    };
    return handler;
}

ModuleHandler notes_module() {
    ModuleHandler handler;
    handler.name = "notes";
    handler.build_path = [](const CommitMetadata&, const std::string& original_name, const std::string& uuid) {
        return std::filesystem::path("assets") / "notes" / "files" / (uuid + extension_of(original_name));
    };
    handler.build_record = [](PersistedRecord& record, const CommitMetadata& metadata) {
        record.parent_id = metadata.field("note_uuid", metadata.parent_id);
    };
    handler.build_associations = [](const PersistedRecord& record, const CommitMetadata& metadata) {
        auto result = tags_and_projects(metadata);
        if (!record.parent_id.empty()) {
            result.links.push_back({"note", record.parent_id});
        }
        return result;
    };
    return handler;
}

ModuleHandler archive_module() {
    ModuleHandler handler;
    handler.name = "archive";
    handler.build_path = [](const CommitMetadata& metadata, const std::string& original_name,
                            const std::string& uuid) {
        auto folder = metadata.field("folder_uuid", metadata.parent_id);
        if (!folder.empty() && !IdUtils::is_safe_identifier(folder)) {
            throw core::ValidationError("Invalid archive folder id");
        }
        return std::filesystem::path("assets") / "archive" / (folder.empty() ? "root" : folder) /
               (uuid + extension_of(original_name));
    };
    handler.build_record = [](PersistedRecord& record, const CommitMetadata& metadata) {
        record.title = metadata.field("name", record.title.empty() ? stem_of(record.original_name) : record.title);
        record.parent_id = metadata.field("folder_uuid", metadata.parent_id);
    };
    handler.build_associations = [](const PersistedRecord& record, const CommitMetadata& metadata) {
        Associations result;
        result.tags = metadata.tags;
        if (!record.parent_id.empty()) {
            result.links.push_back({"folder", record.parent_id});
        }
        return result;
    };
    return handler;
}

ModuleHandler diary_module() {
    ModuleHandler handler;
    handler.name = "diary";
    handler.build_path = [](const CommitMetadata&, const std::string& original_name, const std::string& uuid) {
        return std::filesystem::path("secure") / "entries" / "media" / (uuid + extension_of(original_name));
    };
    handler.build_record = [](PersistedRecord& record, const CommitMetadata& metadata) {
        record.description = metadata.field("caption", record.description);
        record.parent_id = metadata.field("entry_id", metadata.parent_id);
    };
    // Diary media are private to their entry: no tags or projects.
    handler.build_associations = [](const PersistedRecord& record, const CommitMetadata&) {
        Associations result;
        if (!record.parent_id.empty()) {
            result.links.push_back({"diary_entry", record.parent_id});
        }
        return result;
    };
    return handler;
}

}

ModuleRegistry ModuleRegistry::with_default_modules() {
    ModuleRegistry registry;
    registry.register_module(documents_module());
    registry.register_module(notes_module());
    registry.register_module(archive_module());
    registry.register_module(diary_module());
    return registry;
}

void ModuleRegistry::register_module(ModuleHandler handler) {
    if (handler.name.empty() || !handler.build_path || !handler.build_record || !handler.build_associations) {
        throw core::ValidationError("Module handler is incomplete");
    }
    auto name = handler.name;
    handlers_[name] = std::move(handler);
}

bool ModuleRegistry::contains(const std::string& name) const {
    return handlers_.count(name) > 0;
}

const ModuleHandler& ModuleRegistry::resolve(const std::string& name) const {
    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        throw core::ValidationError("Unsupported module: " + name);
    }
    return it->second;
}

PlannedPaths ModuleRegistry::plan_paths(const std::string& module, const CommitMetadata& metadata,
                                        const std::string& original_name, const std::string& uuid) const {
    const auto& handler = resolve(module);
    
    PlannedPaths paths;
    paths.final_path = handler.build_path(metadata, original_name, uuid);
    paths.temp_path = paths.final_path.parent_path() / ("temp_" + paths.final_path.filename().string());
    return paths;
}

std::vector<std::string> ModuleRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(handlers_.size());
    for (const auto& [name, _] : handlers_) {
        result.push_back(name);
    }
    return result;
}

} // namespace chunkvault::commit

#include "chunkvault/core/command_handler.hpp"
#include "chunkvault/core/errors.hpp"
#include "chunkvault/core/logger.hpp"
#include "chunkvault/core/utils.hpp"
#include "chunkvault/upload/upload_service.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iomanip>
#include <stdexcept>

namespace chunkvault::core {

namespace {

void print_snapshot(const upload::ProgressSnapshot& snapshot) {
    std::cout << "  File ID: " << snapshot.file_id << "\n";
    std::cout << "  Filename: " << snapshot.filename << "\n";
    std::cout << "  Owner: " << snapshot.owner << "\n";
    std::cout << "  Status: " << upload::to_string(snapshot.status) << "\n";
    std::cout << "  Progress: " << std::fixed << std::setprecision(1) << snapshot.progress_percent << "% ("
              << snapshot.received_chunks << "/" << snapshot.total_chunks << " chunks, "
              << utils::StringUtils::format_bytes(snapshot.bytes_uploaded) << " of "
              << utils::StringUtils::format_bytes(snapshot.total_size) << ")\n";
    if (!snapshot.error_message.empty()) {
        std::cout << "  Error: " << snapshot.error_message << "\n";
    }
}

void print_record(const commit::PersistedRecord& record) {
    std::cout << "  Record ID: " << record.uuid << "\n";
    std::cout << "  Module: " << record.module << "\n";
    std::cout << "  Title: " << record.title << "\n";
    std::cout << "  Original name: " << record.original_name << "\n";
    std::cout << "  Path: " << record.file_path << "\n";
    std::cout << "  Size: " << utils::StringUtils::format_bytes(record.file_size) << "\n";
    std::cout << "  MIME type: " << record.mime_type << "\n";
    std::cout << "  Content hash: " << record.content_hash << "\n";
    std::cout << "  State: " << commit::to_string(record.finalize_state) << "\n";
    if (!record.tags.empty()) {
        std::cout << "  Tags: " << utils::StringUtils::join(record.tags, ", ") << "\n";
    }
    if (!record.parent_id.empty()) {
        std::cout << "  Parent: " << record.parent_id << "\n";
    }
}

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> result;
    for (const auto& part : utils::StringUtils::split(value, ',')) {
        auto trimmed = utils::StringUtils::trim(part);
        if (!trimmed.empty()) {
            result.push_back(trimmed);
        }
    }
    return result;
}

commit::CommitMetadata parse_metadata(const std::vector<std::string>& pairs) {
    commit::CommitMetadata metadata;
    
    for (const auto& pair : pairs) {
        auto eq_pos = pair.find('=');
        if (eq_pos == std::string::npos || eq_pos == 0) {
            throw ValidationError("Expected key=value, got '" + pair + "'");
        }
        
        auto key = pair.substr(0, eq_pos);
        auto value = pair.substr(eq_pos + 1);
        
        if (key == "title") {
            metadata.title = value;
        } else if (key == "description") {
            metadata.description = value;
        } else if (key == "original_name") {
            metadata.original_name = value;
        } else if (key == "tags") {
            metadata.tags = split_list(value);
        } else if (key == "projects" || key == "project_ids") {
            metadata.project_ids = split_list(value);
        } else if (key == "parent" || key == "parent_id") {
            metadata.parent_id = value;
        } else {
            metadata.fields[key] = value;
        }
    }
    
    return metadata;
}

bool is_number(const std::string& value) {
    return !value.empty() && std::all_of(value.begin(), value.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c));
    });
}

CommandResult failure(const std::string& action, const UploadError& e) {
    LOG_ERROR("{} failed ({}): {}", action, to_string(e.kind()), e.what());
    return CommandResult::error(action + " failed: " + user_message(e.kind(), e.what()));
}

}

ServiceContext::ServiceContext(const storage::StorageConfig& config) : config_(config) {
}

ServiceContext::~ServiceContext() = default;

upload::UploadService& ServiceContext::service() {
    if (!service_) {
        service_ = upload::UploadService::create(config_);
    }
    return *service_;
}

// IngestCommandHandler Implementation
CommandResult IngestCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 4) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    std::filesystem::path file_path = args[1];
    const auto& module = args[2];
    const auto& owner = args[3];
    
    auto size = utils::FileUtils::file_size(file_path);
    if (!size) {
        return CommandResult::error("File does not exist: " + file_path.string());
    }
    
    size_t next_arg = 4;
    uint64_t chunk_size = DEFAULT_CHUNK_SIZE;
    if (args.size() > next_arg && is_number(args[next_arg])) {
        try {
            chunk_size = std::stoull(args[next_arg]);
        } catch (const std::out_of_range&) {
            return CommandResult::error("Chunk size out of range: " + args[next_arg]);
        }
        ++next_arg;
    }
    
    if (chunk_size == 0 || chunk_size > context_->config().max_chunk_size) {
        return CommandResult::error("Chunk size must be between 1 and " +
                                    std::to_string(context_->config().max_chunk_size) + " bytes");
    }
    
    try {
        auto metadata = parse_metadata(std::vector<std::string>(args.begin() + static_cast<std::ptrdiff_t>(next_arg),
                                                                args.end()));
        auto& service = context_->service();
        
        storage::ChunkUpload upload;
        upload.file_id = utils::IdUtils::generate_uuid();
        upload.filename = file_path.filename().string();
        upload.owner = owner;
        upload.total_size = static_cast<std::int64_t>(*size);
        upload.total_chunks = *size == 0 ? 1 : static_cast<std::int64_t>((*size + chunk_size - 1) / chunk_size);
        
        std::ifstream file(file_path, std::ios::binary);
        if (!file.is_open()) {
            return CommandResult::error("Cannot open " + file_path.string());
        }
        
        std::cout << "Uploading " << upload.filename << " (" << utils::StringUtils::format_bytes(*size)
                  << ") as " << upload.total_chunks << " chunks\n";
        
        // Last chunk first, so assembly has to restore the order.
        std::vector<std::uint8_t> buffer(chunk_size);
        upload::ProgressSnapshot snapshot;
        for (auto index = upload.total_chunks - 1; index >= 0; --index) {
            auto offset = static_cast<uint64_t>(index) * chunk_size;
            auto length = std::min<uint64_t>(chunk_size, *size - std::min(*size, offset));
            
            file.clear();
            file.seekg(static_cast<std::streamoff>(offset));
            file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(length));
            if (static_cast<uint64_t>(file.gcount()) != length) {
                service.cleanup(upload.file_id);
                return CommandResult::error("Short read from " + file_path.string());
            }
            
            upload.chunk_index = index;
            snapshot = service.save_chunk(upload, std::span<const std::uint8_t>(buffer.data(), length));
        }
        
        std::cout << "Upload complete:\n";
        print_snapshot(snapshot);
        
        auto record = service.commit(upload.file_id, module, owner, metadata);
        
        std::cout << "\n✓ Committed\n";
        print_record(record);
        return CommandResult::ok("File ingested successfully");
        
    } catch (const UploadError& e) {
        return failure("Ingest", e);
    } catch (const std::exception& e) {
        return CommandResult::error("Exception: " + std::string(e.what()));
    }
}

// StatusCommandHandler Implementation
CommandResult StatusCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    try {
        auto snapshot = context_->service().get_status(args[1]);
        if (!snapshot) {
            std::cout << "Upload " << args[1] << ": unknown\n";
            return CommandResult::error("Upload not found", 2);
        }
        
        std::cout << "Upload status:\n";
        print_snapshot(*snapshot);
        return CommandResult::ok();
        
    } catch (const UploadError& e) {
        return failure("Status", e);
    } catch (const std::exception& e) {
        return CommandResult::error("Failed to get status: " + std::string(e.what()));
    }
}

// SessionsCommandHandler Implementation
CommandResult SessionsCommandHandler::execute(const std::vector<std::string>&) {
    try {
        auto sessions = context_->service().list_sessions();
        
        if (sessions.empty()) {
            std::cout << "No upload sessions.\n";
            return CommandResult::ok();
        }
        
        std::cout << "Upload sessions (" << sessions.size() << "):\n";
        for (const auto& snapshot : sessions) {
            std::cout << "  " << std::left << std::setw(38) << snapshot.file_id
                      << std::setw(12) << upload::to_string(snapshot.status)
                      << std::right << std::setw(6) << std::fixed << std::setprecision(1)
                      << snapshot.progress_percent << "%  " << snapshot.filename << "\n";
        }
        return CommandResult::ok();
        
    } catch (const UploadError& e) {
        return failure("Listing sessions", e);
    } catch (const std::exception& e) {
        return CommandResult::error("Failed to list sessions: " + std::string(e.what()));
    }
}

// CancelCommandHandler Implementation
CommandResult CancelCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    try {
        if (!context_->service().cleanup(args[1])) {
            return CommandResult::error("Upload not found: " + args[1], 2);
        }
        
        std::cout << "✓ Upload " << args[1] << " cancelled\n";
        return CommandResult::ok();
        
    } catch (const UploadError& e) {
        return failure("Cancel", e);
    }
}

// SweepCommandHandler Implementation
CommandResult SweepCommandHandler::execute(const std::vector<std::string>&) {
    try {
        auto report = context_->service().sweep();
        
        std::cout << "Removed " << report.sessions_removed << " expired sessions and "
                  << report.stray_files_removed << " stray files\n";
        return CommandResult::ok();
        
    } catch (const UploadError& e) {
        return failure("Sweep", e);
    }
}

// ReconcileCommandHandler Implementation
CommandResult ReconcileCommandHandler::execute(const std::vector<std::string>& args) {
    try {
        auto& service = context_->service();
        
        if (args.size() >= 2) {
            auto record = service.retry_finalize(args[1]);
            std::cout << "✓ Record finalized\n";
            print_record(record);
            return CommandResult::ok();
        }
        
        auto report = service.reconcile();
        std::cout << "Finalized " << report.finalized << " records";
        if (report.failed > 0) {
            std::cout << ", " << report.failed << " still pending";
        }
        std::cout << "\n";
        
        return report.failed == 0 ? CommandResult::ok() : CommandResult::error("Some records are still pending");
        
    } catch (const UploadError& e) {
        return failure("Reconcile", e);
    }
}

// RecordsCommandHandler Implementation
CommandResult RecordsCommandHandler::execute(const std::vector<std::string>& args) {
    try {
        auto records = context_->service().list_records(args.size() >= 2 ? args[1] : "");
        
        if (records.empty()) {
            std::cout << "No records.\n";
            return CommandResult::ok();
        }
        
        std::cout << "Records (" << records.size() << "):\n";
        for (const auto& record : records) {
            std::cout << "  " << std::left << std::setw(38) << record.uuid
                      << std::setw(11) << record.module
                      << std::setw(18) << commit::to_string(record.finalize_state)
                      << std::right << std::setw(10) << utils::StringUtils::format_bytes(record.file_size)
                      << "  " << record.original_name << "\n";
        }
        return CommandResult::ok();
        
    } catch (const UploadError& e) {
        return failure("Listing records", e);
    }
}

}

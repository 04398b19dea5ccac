#include "chunkvault/upload/session_store.hpp"

namespace chunkvault::upload {

std::optional<UploadSession> InMemorySessionStore::get(const std::string& file_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto it = sessions_.find(file_id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemorySessionStore::put(const UploadSession& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_[session.file_id] = session;
}

std::optional<UploadSession> InMemorySessionStore::update(const std::string& file_id, const Mutator& mutate) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto it = sessions_.find(file_id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    
    UploadSession working = it->second;
    mutate(working);
    it->second = working;
    return working;
}

UploadSession InMemorySessionStore::upsert(const UploadSession& initial, const Mutator& mutate) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto it = sessions_.find(initial.file_id);
    UploadSession working = it != sessions_.end() ? it->second : initial;
    mutate(working);
    sessions_[working.file_id] = working;
    return working;
}

bool InMemorySessionStore::remove(const std::string& file_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.erase(file_id) > 0;
}

std::vector<std::string> InMemorySessionStore::scan_expired(std::chrono::system_clock::time_point cutoff) const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    std::vector<std::string> expired;
    for (const auto& [file_id, session] : sessions_) {
        if (session.updated_at < cutoff) {
            expired.push_back(file_id);
        }
    }
    return expired;
}

std::vector<UploadSession> InMemorySessionStore::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    std::vector<UploadSession> result;
    result.reserve(sessions_.size());
    for (const auto& [file_id, session] : sessions_) {
        result.push_back(session);
    }
    return result;
}

size_t InMemorySessionStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

} // namespace chunkvault::upload

#pragma once

#include "upload_session.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace chunkvault::upload {

// Storage for upload sessions. Every mutation goes through update() or
// upsert(), which run the mutator under the store's lock on a copy of the
// session; if the mutator throws, the stored session is left untouched.
class SessionStore {
public:
    using Mutator = std::function<void(UploadSession&)>;
    
    virtual ~SessionStore() = default;
    
    virtual std::optional<UploadSession> get(const std::string& file_id) const = 0;
    
    virtual void put(const UploadSession& session) = 0;
    
    // Applies mutate to the stored session. Returns the new state, or
    // nullopt if no session exists for file_id.
    virtual std::optional<UploadSession> update(const std::string& file_id, const Mutator& mutate) = 0;
    
    // Like update(), but starts from `initial` when no session exists yet.
    virtual UploadSession upsert(const UploadSession& initial, const Mutator& mutate) = 0;
    
    virtual bool remove(const std::string& file_id) = 0;
    
    // file_ids whose last update is older than cutoff.
    virtual std::vector<std::string> scan_expired(std::chrono::system_clock::time_point cutoff) const = 0;
    
    virtual std::vector<UploadSession> list() const = 0;
    
    virtual size_t size() const = 0;
};

class InMemorySessionStore : public SessionStore {
public:
    InMemorySessionStore() = default;
    
    std::optional<UploadSession> get(const std::string& file_id) const override;
    void put(const UploadSession& session) override;
    std::optional<UploadSession> update(const std::string& file_id, const Mutator& mutate) override;
    UploadSession upsert(const UploadSession& initial, const Mutator& mutate) override;
    bool remove(const std::string& file_id) override;
    std::vector<std::string> scan_expired(std::chrono::system_clock::time_point cutoff) const override;
    std::vector<UploadSession> list() const override;
    size_t size() const override;

private:
    std::map<std::string, UploadSession> sessions_;
    mutable std::mutex mutex_;
};

} // namespace chunkvault::upload

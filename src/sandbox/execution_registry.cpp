#include "sandbox/execution_registry.hpp"

namespace codebox::sandbox {

bool ExecutionRegistry::Reserve(const std::string& job_id, const std::string& client_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.count(job_id) > 0) {
        return false;
    }
    return reserved_.emplace(job_id, Reservation{client_id, false}).second;
}

void ExecutionRegistry::Unreserve(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    reserved_.erase(job_id);
}

bool ExecutionRegistry::Cancel(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = reserved_.find(job_id);
    if (it == reserved_.end()) {
        return false;
    }
    it->second.cancelled = true;
    return true;
}

void ExecutionRegistry::CancelAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : reserved_) {
        entry.second.cancelled = true;
    }
}

bool ExecutionRegistry::IsCancelled(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = reserved_.find(job_id);
    return it != reserved_.end() && it->second.cancelled;
}

bool ExecutionRegistry::Register(const std::string& job_id, std::shared_ptr<SandboxHandle> handle) {
    if (!handle) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.emplace(job_id, std::move(handle)).second;
}

std::shared_ptr<SandboxHandle> ExecutionRegistry::PopIfPresent(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(job_id);
    if (it == entries_.end()) {
        return nullptr;
    }
    auto handle = std::move(it->second);
    entries_.erase(it);
    return handle;
}

std::shared_ptr<SandboxHandle> ExecutionRegistry::Find(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(job_id);
    return it == entries_.end() ? nullptr : it->second;
}

std::vector<std::string> ExecutionRegistry::FindByClient(const std::string& client_id) const {
    std::vector<std::string> ids;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [job_id, handle] : entries_) {
        if (handle->client_id == client_id) {
            ids.push_back(job_id);
        }
    }
    for (const auto& [job_id, reservation] : reserved_) {
        if (reservation.client_id == client_id && entries_.count(job_id) == 0) {
            ids.push_back(job_id);
        }
    }
    return ids;
}

std::vector<std::string> ExecutionRegistry::JobIds() const {
    std::vector<std::string> ids;
    std::lock_guard<std::mutex> lock(mutex_);
    ids.reserve(entries_.size());
    for (const auto& entry : entries_) {
        ids.push_back(entry.first);
    }
    return ids;
}

bool ExecutionRegistry::Contains(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(job_id) > 0;
}

std::size_t ExecutionRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

}  // namespace codebox::sandbox

#pragma once

#include "ports/output/IIdempotencyRepository.hpp"
#include <map>
#include <mutex>
#include <stdexcept>

namespace checkout::tests {

class InMemoryIdempotencyRepository : public ports::output::IIdempotencyRepository {
public:
    std::optional<domain::IdempotencyRecord> find(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (unavailable) {
            throw std::runtime_error("database unavailable");
        }
        auto it = records_.find(key);
        if (it == records_.end()) return std::nullopt;
        return it->second;
    }

    void save(const std::string& key, int status, const std::string& body) override {
        std::lock_guard<std::mutex> lock(mutex_);
        records_[key] = {key, status, body};
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_.size();
    }

    bool unavailable = false;

private:
    mutable std::mutex mutex_;
    std::map<std::string, domain::IdempotencyRecord> records_;
};

} // namespace checkout::tests

/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <passtrack/registry.hpp>
#include <spdlog/spdlog.h>

using spdlog::debug;

namespace passtrack {

std::shared_ptr<const Job> JobRegistry::insert(Job job) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = job.getID();
    if (jobs_.contains(id)) {
        throw JobValidationException(JobValidationError::DuplicateID,
            "Job " + std::to_string(id) + " is already registered");
    }
    auto stored = std::make_shared<const Job>(std::move(job));
    jobs_.emplace(id, stored);
    debug("Registered job {} ({} jobs)", id, jobs_.size());
    return stored;
}

std::shared_ptr<const Job> JobRegistry::find(uint64_t jobID) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(jobID);
    if (it == jobs_.end()) {
        return nullptr;
    }
    return it->second;
}

bool JobRegistry::contains(uint64_t jobID) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.contains(jobID);
}

bool JobRegistry::erase(uint64_t jobID) {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.erase(jobID) > 0;
}

std::size_t JobRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

std::vector<uint64_t> JobRegistry::ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<uint64_t> result;
    result.reserve(jobs_.size());
    for (const auto& [id, job] : jobs_) {
        result.push_back(id);
    }
    return result;
}

} // namespace passtrack

/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __PASSTRACK_REGISTRY_HPP
#define __PASSTRACK_REGISTRY_HPP

#include <passtrack/job.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace passtrack {

/**
 * Owns accepted jobs, keyed by id.
 *
 * Job ids are unique across the registry: inserting an id that is already
 * present fails. Thread-safe.
 */
class JobRegistry {
public:
    JobRegistry() = default;
    ~JobRegistry() = default;

    // Non-copyable, non-movable (due to mutex)
    JobRegistry(const JobRegistry&) = delete;
    JobRegistry& operator=(const JobRegistry&) = delete;
    JobRegistry(JobRegistry&&) = delete;
    JobRegistry& operator=(JobRegistry&&) = delete;

    /**
     * Insert a job if its id is not already registered.
     * @return The stored job
     * @throws JobValidationException with DuplicateID if the id is taken
     */
    std::shared_ptr<const Job> insert(Job job);

    /** @return The job, or nullptr if the id is unknown */
    std::shared_ptr<const Job> find(uint64_t jobID) const;

    bool contains(uint64_t jobID) const;

    /** @return true if a job was removed */
    bool erase(uint64_t jobID);

    std::size_t size() const;

    /** All registered ids in ascending order */
    std::vector<uint64_t> ids() const;

private:
    mutable std::mutex mutex_;
    std::map<uint64_t, std::shared_ptr<const Job>> jobs_;
};

} // namespace passtrack

#endif

/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __PASSTRACK_SCHEDULER_HPP
#define __PASSTRACK_SCHEDULER_HPP

#include <passtrack/job.hpp>
#include <passtrack/lifecycle.hpp>
#include <passtrack/registry.hpp>
#include <passtrack/telemetry.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace passtrack {

/**
 * Accepts jobs and drives them through their lifecycle.
 *
 * The scheduler enforces the invariants that span more than one job: job
 * ids are unique, and a ground station runs at most one Scheduled or
 * Started job for any instant. Time is always supplied by the caller.
 *
 * Usage:
 *   Scheduler scheduler;
 *   scheduler.setListener([](const StatusEvent &e) { ... });
 *   auto job = scheduler.submit(parseJob(json), now);
 *   scheduler.schedule(job->getID(), "station-1", now);
 *   scheduler.advance(now);
 */
class Scheduler {
public:
    Scheduler() = default;
    ~Scheduler() = default;

    // Non-copyable, non-movable (due to mutex)
    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;
    Scheduler(Scheduler&&) = delete;
    Scheduler& operator=(Scheduler&&) = delete;

    /**
     * The listener runs while a scheduling call is in progress. It may read
     * job state (getJob, getState, getStatus) but must not schedule or
     * transition jobs.
     */
    void setListener(StatusListener listener);

    /**
     * Register a validated job in the Received state.
     * @throws JobValidationException with DuplicateID if the id is in use
     */
    std::shared_ptr<const Job> submit(Job job, time_point now);

    /**
     * Reserve a station for the job's window.
     *
     * If the window overlaps a Scheduled or Started job on the same station
     * the job is moved to Error instead.
     *
     * @return The resulting status, Scheduled or Error
     * @throws std::out_of_range if the job is unknown
     * @throws TransitionException if the job is not Received
     */
    JobStatus schedule(uint64_t jobID, const std::string &stationID, time_point now);

    /** Scheduled -> Started */
    void start(uint64_t jobID, time_point now);

    /** Started -> Completed */
    void complete(uint64_t jobID, time_point now);

    /** Any non-terminal status -> Error */
    void fail(uint64_t jobID, const std::string &cause, time_point now);

    /**
     * Start every Scheduled job whose window has opened and complete every
     * Started job whose window has closed.
     * @return The number of transitions made
     */
    int advance(time_point now);

    /**
     * Find the job that was tracking on the message's station when it was
     * received. Started and Completed jobs are considered, as are jobs
     * that failed after starting, for frames received before the failure.
     */
    std::optional<uint64_t> correlate(const TelemetryMessage &message) const;

    /**
     * Forget a job that has reached a terminal state, freeing its id.
     * @throws TransitionException if the job is still active
     */
    void release(uint64_t jobID);

    std::shared_ptr<const Job> getJob(uint64_t jobID) const;
    JobState getState(uint64_t jobID) const;
    JobStatus getStatus(uint64_t jobID) const;

    const JobRegistry& getRegistry() const { return registry_; }

private:
    // Serializes scheduling decisions so conflict checks see a stable view
    mutable std::mutex mutex_;
    JobRegistry registry_;
    JobLifecycle lifecycle_;

    std::shared_ptr<const Job> requireJob(uint64_t jobID) const;
};

} // namespace passtrack

#endif

/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __PASSTRACK_LIFECYCLE_HPP
#define __PASSTRACK_LIFECYCLE_HPP

#include <passtrack/job.hpp>

#include <cstdint>
#include <functional>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace passtrack {

// The state of a job in the ground station pipeline
enum class JobStatus {
    Received,
    Scheduled,
    Started,
    Completed,
    Error
};

std::ostream& operator<<(std::ostream &os, const JobStatus &status);

std::string toString(JobStatus status);

/**
 * Parse a status name as printed by operator<<.
 * @throws std::invalid_argument if the name is unknown
 */
JobStatus parseJobStatus(std::string_view name);

/** Completed and Error are terminal */
bool isTerminal(JobStatus status);

/**
 * True if the state machine allows moving directly from one status to the other.
 *
 * Received -> Scheduled -> Started -> Completed, and any non-terminal
 * status -> Error. Nothing moves backwards and terminal states are final.
 */
bool isLegalTransition(JobStatus from, JobStatus to);

/**
 * Exception thrown when a transition is not allowed from the current state,
 * or its time precondition has not been met.
 */
class TransitionException : public std::logic_error {
public:
    TransitionException(uint64_t jobID, JobStatus from, JobStatus to, const std::string& reason);

    uint64_t jobID() const { return jobID_; }
    JobStatus from() const { return from_; }
    JobStatus to() const { return to_; }

private:
    uint64_t jobID_;
    JobStatus from_;
    JobStatus to_;
};

/**
 * Runtime state of a job, kept outside the immutable Job record.
 */
struct JobState {
    JobStatus status = JobStatus::Received;
    time_point updated;                     ///< Time of the last transition
    std::optional<std::string> stationID;   ///< Set once the job is scheduled
    std::optional<std::string> cause;       ///< Set when the job is in Error
    std::optional<time_point> startedAt;    ///< Set once the job has started, kept through Error
};

/**
 * Published on every status change, including the initial Received.
 */
struct StatusEvent {
    uint64_t jobID;
    JobStatus status;
    time_point timestamp;
    std::optional<std::string> cause;
};

using StatusListener = std::function<void(const StatusEvent&)>;

/**
 * Tracks the status of every known job and applies transitions.
 *
 * All transitions are serialized by a single mutex, so at most one
 * transition per job is in progress at any time. The listener is invoked
 * after that mutex is released, so it may query the lifecycle.
 *
 * The lifecycle never reads the clock. Callers pass the current time to
 * every operation.
 */
class JobLifecycle {
public:
    JobLifecycle() = default;
    ~JobLifecycle() = default;

    // Non-copyable, non-movable (due to mutex)
    JobLifecycle(const JobLifecycle&) = delete;
    JobLifecycle& operator=(const JobLifecycle&) = delete;
    JobLifecycle(JobLifecycle&&) = delete;
    JobLifecycle& operator=(JobLifecycle&&) = delete;

    void setListener(StatusListener listener);

    /**
     * Begin tracking a job in the Received state.
     * @throws std::invalid_argument if the job is already tracked
     */
    void add(uint64_t jobID, time_point now);

    /**
     * Received -> Scheduled, reserving the job on a station.
     * Conflict detection is the caller's responsibility.
     */
    void schedule(uint64_t jobID, const std::string &stationID, time_point now);

    /** Scheduled -> Started. Requires now >= job start. */
    void start(const Job &job, time_point now);

    /** Started -> Completed. Requires now >= job end. */
    void complete(const Job &job, time_point now);

    /** Any non-terminal status -> Error. */
    void fail(uint64_t jobID, const std::string &cause, time_point now);

    /** @throws std::out_of_range if the job is unknown */
    JobState getState(uint64_t jobID) const;

    /** @throws std::out_of_range if the job is unknown */
    JobStatus getStatus(uint64_t jobID) const;

    bool contains(uint64_t jobID) const;

    /** Snapshot of all tracked jobs */
    std::map<uint64_t, JobState> getStates() const;

    /**
     * Stop tracking a job that has reached a terminal state.
     * @throws TransitionException if the job is still active
     */
    void remove(uint64_t jobID);

private:
    mutable std::mutex mutex_;
    std::map<uint64_t, JobState> states_;
    StatusListener listener_;

    // Both helpers expect mutex_ to be held
    JobState& stateFor(uint64_t jobID);
    StatusEvent transition(uint64_t jobID, JobState &state, JobStatus to, time_point now,
                           std::optional<std::string> cause = std::nullopt);

    // Called without mutex_ held
    void publish(const StatusEvent &event);
};

} // namespace passtrack

#endif

/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <passtrack/lifecycle.hpp>
#include <spdlog/spdlog.h>

#include <sstream>

using spdlog::debug;
using spdlog::info;
using spdlog::warn;

namespace passtrack {

std::ostream& operator<<(std::ostream &os, const JobStatus &status) {
    switch (status) {
        case JobStatus::Received:
            os << "Received";
            break;
        case JobStatus::Scheduled:
            os << "Scheduled";
            break;
        case JobStatus::Started:
            os << "Started";
            break;
        case JobStatus::Completed:
            os << "Completed";
            break;
        case JobStatus::Error:
            os << "Error";
            break;
    }
    return os;
}

std::string toString(JobStatus status) {
    std::ostringstream s;
    s << status;
    return s.str();
}

JobStatus parseJobStatus(std::string_view name) {
    for (auto status : {JobStatus::Received, JobStatus::Scheduled, JobStatus::Started,
                        JobStatus::Completed, JobStatus::Error}) {
        if (toString(status) == name) {
            return status;
        }
    }
    throw std::invalid_argument("Unknown job status: " + std::string(name));
}

bool isTerminal(JobStatus status) {
    return status == JobStatus::Completed || status == JobStatus::Error;
}

bool isLegalTransition(JobStatus from, JobStatus to) {
    if (isTerminal(from)) {
        return false;
    }
    if (to == JobStatus::Error) {
        return true;
    }
    switch (from) {
        case JobStatus::Received:
            return to == JobStatus::Scheduled;
        case JobStatus::Scheduled:
            return to == JobStatus::Started;
        case JobStatus::Started:
            return to == JobStatus::Completed;
        default:
            return false;
    }
}

static std::string describeTransition(uint64_t jobID, JobStatus from, JobStatus to, const std::string &reason) {
    std::ostringstream s;
    s << "Job " << jobID << " cannot move from " << from << " to " << to << ": " << reason;
    return s.str();
}

TransitionException::TransitionException(uint64_t jobID, JobStatus from, JobStatus to, const std::string& reason)
    : std::logic_error(describeTransition(jobID, from, to, reason)),
      jobID_(jobID), from_(from), to_(to) {}

void JobLifecycle::setListener(StatusListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
}

void JobLifecycle::add(uint64_t jobID, time_point now) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto [it, inserted] = states_.try_emplace(jobID, JobState{.status = JobStatus::Received, .updated = now});
        if (!inserted) {
            throw std::invalid_argument("Job " + std::to_string(jobID) + " is already tracked");
        }
        info("Job {} received", jobID);
    }
    publish(StatusEvent{.jobID = jobID, .status = JobStatus::Received, .timestamp = now, .cause = std::nullopt});
}

void JobLifecycle::schedule(uint64_t jobID, const std::string &stationID, time_point now) {
    StatusEvent event;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto &state = stateFor(jobID);
        if (!isLegalTransition(state.status, JobStatus::Scheduled)) {
            throw TransitionException(jobID, state.status, JobStatus::Scheduled, "illegal transition");
        }
        state.stationID = stationID;
        event = transition(jobID, state, JobStatus::Scheduled, now);
    }
    publish(event);
}

void JobLifecycle::start(const Job &job, time_point now) {
    StatusEvent event;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto &state = stateFor(job.getID());
        if (!isLegalTransition(state.status, JobStatus::Started)) {
            throw TransitionException(job.getID(), state.status, JobStatus::Started, "illegal transition");
        }
        if (now < job.getStart()) {
            throw TransitionException(job.getID(), state.status, JobStatus::Started, "window has not opened");
        }
        state.startedAt = now;
        event = transition(job.getID(), state, JobStatus::Started, now);
    }
    publish(event);
}

void JobLifecycle::complete(const Job &job, time_point now) {
    StatusEvent event;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto &state = stateFor(job.getID());
        if (!isLegalTransition(state.status, JobStatus::Completed)) {
            throw TransitionException(job.getID(), state.status, JobStatus::Completed, "illegal transition");
        }
        if (now < job.getEnd()) {
            throw TransitionException(job.getID(), state.status, JobStatus::Completed, "window has not closed");
        }
        event = transition(job.getID(), state, JobStatus::Completed, now);
    }
    publish(event);
}

void JobLifecycle::fail(uint64_t jobID, const std::string &cause, time_point now) {
    StatusEvent event;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto &state = stateFor(jobID);
        if (!isLegalTransition(state.status, JobStatus::Error)) {
            throw TransitionException(jobID, state.status, JobStatus::Error, "job already finished");
        }
        event = transition(jobID, state, JobStatus::Error, now, cause);
    }
    publish(event);
}

JobState JobLifecycle::getState(uint64_t jobID) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(jobID);
    if (it == states_.end()) {
        throw std::out_of_range("Unknown job " + std::to_string(jobID));
    }
    return it->second;
}

JobStatus JobLifecycle::getStatus(uint64_t jobID) const {
    return getState(jobID).status;
}

bool JobLifecycle::contains(uint64_t jobID) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return states_.contains(jobID);
}

std::map<uint64_t, JobState> JobLifecycle::getStates() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return states_;
}

void JobLifecycle::remove(uint64_t jobID) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto &state = stateFor(jobID);
    if (!isTerminal(state.status)) {
        throw TransitionException(jobID, state.status, state.status, "job is still active");
    }
    states_.erase(jobID);
    debug("Job {} removed from lifecycle", jobID);
}

JobState& JobLifecycle::stateFor(uint64_t jobID) {
    auto it = states_.find(jobID);
    if (it == states_.end()) {
        throw std::out_of_range("Unknown job " + std::to_string(jobID));
    }
    return it->second;
}

StatusEvent JobLifecycle::transition(uint64_t jobID, JobState &state, JobStatus to, time_point now,
                                     std::optional<std::string> cause) {
    JobStatus from = state.status;
    state.status = to;
    state.updated = now;
    state.cause = cause;

    if (to == JobStatus::Error) {
        warn("Job {} {} -> {}: {}", jobID, toString(from), toString(to), cause.value_or(""));
    } else {
        info("Job {} {} -> {}", jobID, toString(from), toString(to));
    }

    return StatusEvent{.jobID = jobID, .status = to, .timestamp = now, .cause = std::move(cause)};
}

void JobLifecycle::publish(const StatusEvent &event) {
    StatusListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listener = listener_;
    }
    if (listener) {
        listener(event);
    }
}

} // namespace passtrack

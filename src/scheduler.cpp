/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <passtrack/scheduler.hpp>
#include <spdlog/spdlog.h>

using spdlog::debug;
using spdlog::info;
using spdlog::warn;

namespace passtrack {

// Scheduled and Started jobs hold their station
static bool holdsStation(JobStatus status) {
    return status == JobStatus::Scheduled || status == JobStatus::Started;
}

void Scheduler::setListener(StatusListener listener) {
    lifecycle_.setListener(std::move(listener));
}

std::shared_ptr<const Job> Scheduler::submit(Job job, time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stored = registry_.insert(std::move(job));
    lifecycle_.add(stored->getID(), now);
    return stored;
}

JobStatus Scheduler::schedule(uint64_t jobID, const std::string &stationID, time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto job = requireJob(jobID);

    auto current = lifecycle_.getStatus(jobID);
    if (!isLegalTransition(current, JobStatus::Scheduled)) {
        throw TransitionException(jobID, current, JobStatus::Scheduled, "illegal transition");
    }

    for (const auto& [otherID, state] : lifecycle_.getStates()) {
        if (otherID == jobID || !holdsStation(state.status) || state.stationID != stationID) {
            continue;
        }
        auto other = registry_.find(otherID);
        if (other && other->overlaps(*job)) {
            warn("Job {} overlaps job {} on station {}", jobID, otherID, stationID);
            lifecycle_.fail(jobID,
                "Conflicts with job " + std::to_string(otherID) + " on station " + stationID, now);
            return JobStatus::Error;
        }
    }

    lifecycle_.schedule(jobID, stationID, now);
    debug("Job {} reserved {} for {} s", jobID, stationID, job->getDuration().count());
    return JobStatus::Scheduled;
}

void Scheduler::start(uint64_t jobID, time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    lifecycle_.start(*requireJob(jobID), now);
}

void Scheduler::complete(uint64_t jobID, time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    lifecycle_.complete(*requireJob(jobID), now);
}

void Scheduler::fail(uint64_t jobID, const std::string &cause, time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    requireJob(jobID);
    lifecycle_.fail(jobID, cause, now);
}

int Scheduler::advance(time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    int transitions = 0;

    for (const auto& [jobID, state] : lifecycle_.getStates()) {
        auto job = registry_.find(jobID);
        if (!job) {
            continue;
        }

        JobStatus status = state.status;
        if (status == JobStatus::Scheduled && now >= job->getStart()) {
            lifecycle_.start(*job, now);
            status = JobStatus::Started;
            transitions++;
        }
        if (status == JobStatus::Started && now >= job->getEnd()) {
            lifecycle_.complete(*job, now);
            transitions++;
        }
    }

    if (transitions > 0) {
        debug("Advanced {} job transitions", transitions);
    }
    return transitions;
}

std::optional<uint64_t> Scheduler::correlate(const TelemetryMessage &message) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::optional<uint64_t> match;

    for (const auto& [jobID, state] : lifecycle_.getStates()) {
        if (!state.startedAt || state.stationID != message.getGroundStationID()) {
            continue;
        }
        // A job that failed mid-pass only owns frames received before the failure
        if (state.status == JobStatus::Error && message.getTimestamp() >= state.updated) {
            continue;
        }
        auto job = registry_.find(jobID);
        if (job && job->contains(message.getTimestamp())) {
            // A running job wins over one that has already finished
            if (state.status == JobStatus::Started) {
                return jobID;
            }
            if (!match) {
                match = jobID;
            }
        }
    }

    if (!match) {
        debug("No job for telemetry from {}", message.getGroundStationID());
    }
    return match;
}

void Scheduler::release(uint64_t jobID) {
    std::lock_guard<std::mutex> lock(mutex_);
    lifecycle_.remove(jobID);
    registry_.erase(jobID);
    info("Job {} released", jobID);
}

std::shared_ptr<const Job> Scheduler::getJob(uint64_t jobID) const {
    return registry_.find(jobID);
}

JobState Scheduler::getState(uint64_t jobID) const {
    return lifecycle_.getState(jobID);
}

JobStatus Scheduler::getStatus(uint64_t jobID) const {
    return lifecycle_.getStatus(jobID);
}

std::shared_ptr<const Job> Scheduler::requireJob(uint64_t jobID) const {
    auto job = registry_.find(jobID);
    if (!job) {
        throw std::out_of_range("Unknown job " + std::to_string(jobID));
    }
    return job;
}

} // namespace passtrack

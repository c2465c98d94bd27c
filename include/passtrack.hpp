/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __PASSTRACK_HPP
#define __PASSTRACK_HPP

#include <passtrack/config.hpp>
#include <passtrack/tle.hpp>
#include <passtrack/job.hpp>
#include <passtrack/lifecycle.hpp>
#include <passtrack/registry.hpp>
#include <passtrack/scheduler.hpp>
#include <passtrack/telemetry.hpp>
#include <passtrack/json.hpp>

#endif

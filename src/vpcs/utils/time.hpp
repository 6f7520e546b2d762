/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef AOS_VPCS_UTILS_TIME_HPP_
#define AOS_VPCS_UTILS_TIME_HPP_

#include <string>

#include <Poco/Timespan.h>

#include <core/common/tools/error.hpp>

namespace aos::vpcs::utils {

/**
 * Parses duration from string.
 *
 * Accepts a sequence of <number><unit> items where unit is one of ns, us, ms, s, m, h, d (e.g. "1m30s").
 * A bare number is treated as seconds.
 *
 * @param duration duration string.
 * @return RetWithError<Poco::Timespan>.
 */
RetWithError<Poco::Timespan> ParseDuration(const std::string& duration);

} // namespace aos::vpcs::utils

#endif

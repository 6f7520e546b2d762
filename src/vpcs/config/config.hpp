/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef AOS_VPCS_CONFIG_CONFIG_HPP_
#define AOS_VPCS_CONFIG_CONFIG_HPP_

#include <string>

#include <Poco/Timespan.h>

#include <core/common/tools/error.hpp>

#include <vpcs/logger/logger.hpp>

namespace aos::vpcs::config {

/***********************************************************************************************************************
 * Types
 **********************************************************************************************************************/

/*
 * Logging config.
 */
using Logging = logger::Config;

/*
 * Device manager config.
 */
struct Config {
    std::string    mVPCSPath;
    std::string    mWorkingDir;
    std::string    mHost;
    Poco::Timespan mConsoleTimeout {3, 0};
    Poco::Timespan mStopTimeout {5, 0};
    Logging        mLogging;
};

/*******************************************************************************
 * Functions
 ******************************************************************************/

/*
 * Parses config from file.
 *
 * @param filename config file name.
 * @param[out] config config instance.
 * @return Error.
 */
Error ParseConfig(const std::string& filename, Config& config);

} // namespace aos::vpcs::config

#endif

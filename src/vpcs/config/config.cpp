/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <fstream>

#include <Poco/JSON/Object.h>
#include <Poco/JSON/Parser.h>

#include <core/common/tools/string.hpp>

#include <vpcs/utils/exception.hpp>
#include <vpcs/utils/time.hpp>

#include "config.hpp"

/***********************************************************************************************************************
 * Constants
 **********************************************************************************************************************/

constexpr auto cDefaultVPCSPath       = "/usr/bin/vpcs";
constexpr auto cDefaultHost           = "127.0.0.1";
constexpr auto cDefaultConsoleTimeout = "3s";
constexpr auto cDefaultStopTimeout    = "5s";
constexpr auto cDefaultLogLevel       = "info";
constexpr auto cDefaultLogBackend     = "stdio";

namespace aos::vpcs::config {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

namespace {

Poco::Timespan GetDuration(const Poco::JSON::Object::Ptr& object, const std::string& key, const std::string& defaultValue)
{
    auto [duration, err] = utils::ParseDuration(object->optValue<std::string>(key, defaultValue));
    VPCS_ERROR_CHECK_AND_THROW(err, "error parsing " + key + " tag");

    return duration;
}

void ParseLoggingConfig(const Poco::JSON::Object::Ptr& object, Logging& config)
{
    const auto level = object->optValue<std::string>("level", cDefaultLogLevel);

    auto err = config.mLevel.FromString(String(level.c_str()));
    VPCS_ERROR_CHECK_AND_THROW(err, "unsupported log level: " + level);

    Tie(config.mBackend, err)
        = logger::Logger::BackendFromString(object->optValue<std::string>("backend", cDefaultLogBackend));
    VPCS_ERROR_CHECK_AND_THROW(err, "error parsing logging backend tag");
}

} // namespace

/***********************************************************************************************************************
 * Public functions
 **********************************************************************************************************************/

Error ParseConfig(const std::string& filename, Config& config)
{
    std::ifstream file(filename);

    if (!file.is_open()) {
        return ErrorEnum::eNotFound;
    }

    try {
        Poco::JSON::Parser parser;
        auto               object = parser.parse(file).extract<Poco::JSON::Object::Ptr>();

        if (!object->has("workingDir")) {
            VPCS_ERROR_THROW(ErrorEnum::eInvalidArgument, "workingDir tag is required");
        }

        config.mWorkingDir     = object->getValue<std::string>("workingDir");
        config.mVPCSPath       = object->optValue<std::string>("vpcsPath", cDefaultVPCSPath);
        config.mHost           = object->optValue<std::string>("host", cDefaultHost);
        config.mConsoleTimeout = GetDuration(object, "consoleTimeout", cDefaultConsoleTimeout);
        config.mStopTimeout    = GetDuration(object, "stopTimeout", cDefaultStopTimeout);

        auto logging = object->getObject("logging");
        if (logging.isNull()) {
            logging = new Poco::JSON::Object;
        }

        ParseLoggingConfig(logging, config.mLogging);
    } catch (const std::exception& e) {
        return utils::ToAosError(e);
    }

    return ErrorEnum::eNone;
}

} // namespace aos::vpcs::config

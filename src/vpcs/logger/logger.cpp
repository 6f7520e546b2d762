/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <iostream>
#include <syslog.h>

#include <Poco/DateTime.h>
#include <Poco/DateTimeFormat.h>
#include <Poco/DateTimeFormatter.h>
#include <systemd/sd-journal.h>

namespace {

// syslog.h LOG_ERR clashes with the Aos logger macro.
constexpr int cPriorityDebug   = LOG_DEBUG;
constexpr int cPriorityInfo    = LOG_INFO;
constexpr int cPriorityWarning = LOG_WARNING;
constexpr int cPriorityError   = LOG_ERR;

} // namespace

#undef LOG_ERR

#include "logger.hpp"

namespace aos::vpcs::logger {

/***********************************************************************************************************************
 * Statics
 **********************************************************************************************************************/

std::mutex Logger::sMutex;
LogLevel   Logger::sLogLevel = LogLevelEnum::eInfo;

namespace {

int LevelRank(LogLevel level)
{
    switch (level.GetValue()) {
    case LogLevelEnum::eDebug:
        return 0;

    case LogLevelEnum::eInfo:
        return 1;

    case LogLevelEnum::eWarning:
        return 2;

    default:
        return 3;
    }
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error Logger::Init()
{
    switch (mBackend) {
    case Backend::eStdIO:
        Log::SetCallback(StdIOCallback);
        break;

    case Backend::eJournald:
        Log::SetCallback(JournaldCallback);
        break;

    default:
        return AOS_ERROR_WRAP(Error(ErrorEnum::eInvalidArgument, "unsupported log backend"));
    }

    return ErrorEnum::eNone;
}

Error Logger::Init(const Config& config)
{
    SetLogLevel(config.mLevel);
    SetBackend(config.mBackend);

    return Init();
}

void Logger::SetLogLevel(LogLevel level)
{
    std::lock_guard lock {sMutex};

    sLogLevel = level;
}

RetWithError<Logger::Backend> Logger::BackendFromString(const std::string& name)
{
    if (name == "stdio") {
        return {Backend::eStdIO, ErrorEnum::eNone};
    }

    if (name == "journald") {
        return {Backend::eJournald, ErrorEnum::eNone};
    }

    return {Backend::eStdIO, AOS_ERROR_WRAP(Error(ErrorEnum::eNotSupported, "unsupported log backend"))};
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

bool Logger::IsEnabled(LogLevel level)
{
    std::lock_guard lock {sMutex};

    return LevelRank(level) >= LevelRank(sLogLevel);
}

int Logger::ToSyslogPriority(LogLevel level)
{
    switch (level.GetValue()) {
    case LogLevelEnum::eDebug:
        return cPriorityDebug;

    case LogLevelEnum::eInfo:
        return cPriorityInfo;

    case LogLevelEnum::eWarning:
        return cPriorityWarning;

    default:
        return cPriorityError;
    }
}

void Logger::StdIOCallback(const String& module, LogLevel level, const String& message)
{
    if (!IsEnabled(level)) {
        return;
    }

    const auto timestamp = Poco::DateTimeFormatter::format(Poco::DateTime(), Poco::DateTimeFormat::ISO8601_FRAC_FORMAT);
    auto&      stream    = LevelRank(level) >= LevelRank(LogLevelEnum::eWarning) ? std::cerr : std::cout;

    std::lock_guard lock {sMutex};

    stream << timestamp << " " << level.ToString().CStr() << " (" << module.CStr() << ") " << message.CStr()
           << std::endl;
}

void Logger::JournaldCallback(const String& module, LogLevel level, const String& message)
{
    if (!IsEnabled(level)) {
        return;
    }

    sd_journal_send("MESSAGE=%s", message.CStr(), "PRIORITY=%i", ToSyslogPriority(level), "SYSLOG_IDENTIFIER=%s",
        cSyslogIdentifier, "AOS_MODULE=%s", module.CStr(), nullptr);
}

} // namespace aos::vpcs::logger

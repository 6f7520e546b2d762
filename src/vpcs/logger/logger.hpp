/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef AOS_VPCS_LOGGER_LOGGER_HPP_
#define AOS_VPCS_LOGGER_LOGGER_HPP_

#include <mutex>
#include <string>

#include <core/common/tools/error.hpp>
#include <core/common/tools/logger.hpp>

namespace aos::vpcs::logger {

struct Config;

/**
 * Log sink for VPCS device manager.
 */
class Logger {
public:
    /**
     * Log backend.
     */
    enum class Backend {
        eStdIO,
        eJournald,
    };

    /**
     * Initializes logger: installs log callback for the selected backend.
     *
     * @return Error.
     */
    Error Init();

    /**
     * Applies logging config and installs log callback for the configured backend.
     *
     * @param config logging config.
     * @return Error.
     */
    Error Init(const Config& config);

    /**
     * Returns log backend.
     *
     * @return Backend.
     */
    Backend GetBackend() const { return mBackend; }

    /**
     * Sets log backend. Takes effect on next Init().
     *
     * @param backend log backend.
     */
    void SetBackend(Backend backend) { mBackend = backend; }

    /**
     * Sets log level.
     *
     * @param level log level.
     */
    static void SetLogLevel(LogLevel level);

    /**
     * Parses backend name.
     *
     * @param name backend name: stdio or journald.
     * @return RetWithError<Backend>.
     */
    static RetWithError<Backend> BackendFromString(const std::string& name);

private:
    static constexpr auto cSyslogIdentifier = "aos_vpcs";

    static bool IsEnabled(LogLevel level);
    static int  ToSyslogPriority(LogLevel level);
    static void StdIOCallback(const String& module, LogLevel level, const String& message);
    static void JournaldCallback(const String& module, LogLevel level, const String& message);

    static std::mutex sMutex;
    static LogLevel   sLogLevel;

    Backend mBackend = Backend::eStdIO;
};

/**
 * Logging config.
 */
struct Config {
    LogLevel        mLevel   = LogLevelEnum::eInfo;
    Logger::Backend mBackend = Logger::Backend::eStdIO;
};

} // namespace aos::vpcs::logger

#endif

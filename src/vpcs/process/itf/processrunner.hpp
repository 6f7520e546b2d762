/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef AOS_VPCS_PROCESS_ITF_PROCESSRUNNER_HPP_
#define AOS_VPCS_PROCESS_ITF_PROCESSRUNNER_HPP_

#include <string>
#include <vector>

#include <Poco/Process.h>
#include <Poco/Timespan.h>

#include <core/common/tools/error.hpp>

namespace aos::vpcs::process {

/**
 * Process runner interface.
 */
class ProcessRunnerItf {
public:
    /**
     * Destructor.
     */
    virtual ~ProcessRunnerItf() = default;

    /**
     * Spawns process with stdout and stderr redirected to log file.
     *
     * @param args argument vector, first item is executable path.
     * @param workingDir process working directory.
     * @param logFile log file path, truncated before spawn.
     * @return RetWithError<Poco::Process::PID>.
     */
    virtual RetWithError<Poco::Process::PID> Run(
        const std::vector<std::string>& args, const std::string& workingDir, const std::string& logFile)
        = 0;

    /**
     * Checks if process is alive. Reaps process if it has exited.
     *
     * @param pid process ID.
     * @return bool.
     */
    virtual bool IsRunning(Poco::Process::PID pid) = 0;

    /**
     * Waits for process exit.
     *
     * @param pid process ID.
     * @param timeout wait timeout.
     * @return Error eTimeout if process is still running.
     */
    virtual Error Wait(Poco::Process::PID pid, const Poco::Timespan& timeout) = 0;

    /**
     * Terminates process: sends SIGTERM, then SIGKILL if process doesn't exit within timeout.
     *
     * @param pid process ID.
     * @param timeout graceful termination timeout.
     * @return Error.
     */
    virtual Error Terminate(Poco::Process::PID pid, const Poco::Timespan& timeout) = 0;
};

} // namespace aos::vpcs::process

#endif

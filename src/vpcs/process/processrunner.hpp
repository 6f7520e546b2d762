/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef AOS_VPCS_PROCESS_PROCESSRUNNER_HPP_
#define AOS_VPCS_PROCESS_PROCESSRUNNER_HPP_

#include <chrono>

#include "itf/processrunner.hpp"

namespace aos::vpcs::process {

/**
 * Process runner based on fork/exec.
 */
class ProcessRunner : public ProcessRunnerItf {
public:
    /**
     * Spawns process with stdout and stderr redirected to log file.
     *
     * @param args argument vector, first item is executable path.
     * @param workingDir process working directory.
     * @param logFile log file path, truncated before spawn.
     * @return RetWithError<Poco::Process::PID>.
     */
    RetWithError<Poco::Process::PID> Run(
        const std::vector<std::string>& args, const std::string& workingDir, const std::string& logFile) override;

    /**
     * Checks if process is alive. Reaps process if it has exited.
     *
     * @param pid process ID.
     * @return bool.
     */
    bool IsRunning(Poco::Process::PID pid) override;

    /**
     * Waits for process exit.
     *
     * @param pid process ID.
     * @param timeout wait timeout.
     * @return Error.
     */
    Error Wait(Poco::Process::PID pid, const Poco::Timespan& timeout) override;

    /**
     * Terminates process.
     *
     * @param pid process ID.
     * @param timeout graceful termination timeout.
     * @return Error.
     */
    Error Terminate(Poco::Process::PID pid, const Poco::Timespan& timeout) override;

private:
    static constexpr auto cPollPeriod  = std::chrono::milliseconds(50);
    static constexpr auto cExecFailure = 127;
};

} // namespace aos::vpcs::process

#endif

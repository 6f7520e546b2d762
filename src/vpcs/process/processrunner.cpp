/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

#include <Poco/Exception.h>
#include <Poco/Timestamp.h>

#include <vpcs/logger/logmodule.hpp>

#include "processrunner.hpp"

namespace aos::vpcs::process {

namespace {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

class FileDescriptor {
public:
    explicit FileDescriptor(int fd = -1)
        : mFD(fd)
    {
    }

    ~FileDescriptor() { Close(); }

    FileDescriptor(const FileDescriptor&)            = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int Get() const { return mFD; }

    void Reset(int fd)
    {
        Close();

        mFD = fd;
    }

    void Close()
    {
        if (mFD >= 0) {
            close(mFD);
            mFD = -1;
        }
    }

private:
    int mFD;
};

Error ErrnoError(const std::string& message)
{
    const auto errnum = errno;

    return Error(errnum, (message + ": " + std::strerror(errnum)).c_str());
}

// Runs in forked child: only async-signal-safe calls are allowed.
[[noreturn]] void ExecChild(const char* workingDir, int logFD, int errFD, char* const argv[], int exitCode)
{
    int errnum = 0;

    if (chdir(workingDir) != 0 || dup2(logFD, STDOUT_FILENO) < 0 || dup2(logFD, STDERR_FILENO) < 0) {
        errnum = errno;
    } else {
        execv(argv[0], argv);
        errnum = errno;
    }

    [[maybe_unused]] auto written = write(errFD, &errnum, sizeof(errnum));

    _exit(exitCode);
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

RetWithError<Poco::Process::PID> ProcessRunner::Run(
    const std::vector<std::string>& args, const std::string& workingDir, const std::string& logFile)
{
    if (args.empty()) {
        return {-1, AOS_ERROR_WRAP(Error(ErrorEnum::eInvalidArgument, "empty command"))};
    }

    LOG_DBG() << "Run process" << Log::Field("path", args[0].c_str()) << Log::Field("workingDir", workingDir.c_str())
              << Log::Field("logFile", logFile.c_str());

    FileDescriptor logFD(open(logFile.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
    if (logFD.Get() < 0) {
        return {-1, AOS_ERROR_WRAP(ErrnoError("can't open log file " + logFile))};
    }

    int errPipe[2];

    if (pipe2(errPipe, O_CLOEXEC) != 0) {
        return {-1, AOS_ERROR_WRAP(ErrnoError("can't create pipe"))};
    }

    FileDescriptor errRead(errPipe[0]);
    FileDescriptor errWrite(errPipe[1]);

    std::vector<char*> argv;

    argv.reserve(args.size() + 1);

    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }

    argv.push_back(nullptr);

    const auto pid = fork();
    if (pid < 0) {
        return {-1, AOS_ERROR_WRAP(ErrnoError("can't fork process"))};
    }

    if (pid == 0) {
        ExecChild(workingDir.c_str(), logFD.Get(), errWrite.Get(), argv.data(), cExecFailure);
    }

    errWrite.Close();

    int     errnum = 0;
    ssize_t n      = 0;

    do {
        n = read(errRead.Get(), &errnum, sizeof(errnum));
    } while (n < 0 && errno == EINTR);

    if (n == sizeof(errnum)) {
        if (waitpid(pid, nullptr, 0) < 0) {
            LOG_WRN() << "Can't reap failed process" << Log::Field("pid", pid) << Log::Field(ErrnoError("waitpid"));
        }

        return {-1, AOS_ERROR_WRAP(Error(errnum, std::strerror(errnum)))};
    }

    LOG_DBG() << "Process started" << Log::Field("pid", pid);

    return {pid, ErrorEnum::eNone};
}

bool ProcessRunner::IsRunning(Poco::Process::PID pid)
{
    int status = 0;

    auto ret = waitpid(pid, &status, WNOHANG);
    if (ret == pid) {
        LOG_DBG() << "Process exited" << Log::Field("pid", pid) << Log::Field("status", status);

        return false;
    }

    if (ret == 0) {
        return true;
    }

    // Not our child: fall back to signal probe.
    return Poco::Process::isRunning(pid);
}

Error ProcessRunner::Wait(Poco::Process::PID pid, const Poco::Timespan& timeout)
{
    Poco::Timestamp start;

    while (IsRunning(pid)) {
        if (start.isElapsed(timeout.totalMicroseconds())) {
            return AOS_ERROR_WRAP(Error(ErrorEnum::eTimeout, "process is still running"));
        }

        std::this_thread::sleep_for(cPollPeriod);
    }

    return ErrorEnum::eNone;
}

Error ProcessRunner::Terminate(Poco::Process::PID pid, const Poco::Timespan& timeout)
{
    LOG_DBG() << "Terminate process" << Log::Field("pid", pid);

    if (kill(pid, SIGTERM) != 0) {
        if (errno == ESRCH) {
            return ErrorEnum::eNone;
        }

        return AOS_ERROR_WRAP(ErrnoError("can't send SIGTERM"));
    }

    auto err = Wait(pid, timeout);
    if (err.IsNone() || !err.Is(ErrorEnum::eTimeout)) {
        return err;
    }

    LOG_WRN() << "Process doesn't terminate, kill it" << Log::Field("pid", pid);

    try {
        Poco::Process::kill(pid);
    } catch (const Poco::NotFoundException&) {
        return ErrorEnum::eNone;
    } catch (const Poco::Exception& e) {
        return AOS_ERROR_WRAP(Error(ErrorEnum::eRuntime, e.displayText().c_str()));
    }

    if (waitpid(pid, nullptr, 0) < 0 && errno != ECHILD) {
        return AOS_ERROR_WRAP(ErrnoError("can't reap killed process"));
    }

    return ErrorEnum::eNone;
}

} // namespace aos::vpcs::process

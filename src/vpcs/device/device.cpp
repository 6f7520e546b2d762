/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstring>

#include <Poco/Format.h>

#include <vpcs/command/command.hpp>
#include <vpcs/logger/logmodule.hpp>
#include <vpcs/utils/filesystem.hpp>

#include "device.hpp"

namespace aos::vpcs::device {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Device::~Device()
{
    {
        std::lock_guard lock {mMutex};

        if (!mInitialized || mDeleted) {
            return;
        }
    }

    if (auto err = Delete(); !err.IsNone()) {
        LOG_ERR() << "Can't delete VPCS device" << Log::Field(err);
    }
}

Error Device::Init(const config::Config& config, instancepool::IdentifierPoolItf& idPool,
    console::ConsoleClientItf& consoleClient, process::ProcessRunnerItf& processRunner, const std::string& name)
{
    std::lock_guard lock {mMutex};

    if (mInitialized) {
        return AOS_ERROR_WRAP(Error(ErrorEnum::eWrongState, "device is already initialized"));
    }

    mIDPool        = &idPool;
    mConsoleClient = &consoleClient;
    mProcessRunner = &processRunner;

    auto [id, err] = mIDPool->GetFreeID();
    if (!err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    mID          = id;
    mName        = name.empty() ? cNamePrefix + std::to_string(mID) : name;
    mPath        = config.mVPCSPath;
    mHost        = config.mHost;
    mStopTimeout = config.mStopTimeout;
    mAdapters    = {adapter::EthernetAdapter(cDefaultAdapter)};

    if (err = SetWorkingDirLocked(config.mWorkingDir); !err.IsNone()) {
        if (auto releaseErr = mIDPool->ReleaseID(mID); !releaseErr.IsNone()) {
            LOG_ERR() << "Can't release instance identifier" << Log::Field("id", mID) << Log::Field(releaseErr);
        }

        return err;
    }

    mInitialized = true;

    LOG_INF() << "VPCS device created" << Log::Field("name", mName.c_str()) << Log::Field("id", mID);

    return ErrorEnum::eNone;
}

Defaults Device::GetDefaults() const
{
    std::lock_guard lock {mMutex};

    return Defaults {mName, mPath, mScriptFile, mConsole};
}

size_t Device::GetID() const
{
    std::lock_guard lock {mMutex};

    return mID;
}

std::string Device::GetName() const
{
    std::lock_guard lock {mMutex};

    return mName;
}

Error Device::SetName(const std::string& name)
{
    std::lock_guard lock {mMutex};

    if (name.empty()) {
        return AOS_ERROR_WRAP(Error(ErrorEnum::eInvalidArgument, "empty device name"));
    }

    LOG_INF() << "VPCS device renamed" << Log::Field("name", mName.c_str()) << Log::Field("id", mID)
              << Log::Field("newName", name.c_str());

    mName = name;

    return ErrorEnum::eNone;
}

std::string Device::GetPath() const
{
    std::lock_guard lock {mMutex};

    return mPath;
}

Error Device::SetPath(const std::string& path)
{
    std::lock_guard lock {mMutex};

    mPath = path;

    LOG_INF() << "VPCS path changed" << Log::Field("name", mName.c_str()) << Log::Field("id", mID)
              << Log::Field("path", mPath.c_str());

    return ErrorEnum::eNone;
}

std::string Device::GetHost() const
{
    std::lock_guard lock {mMutex};

    return mHost;
}

std::string Device::GetWorkingDir() const
{
    std::lock_guard lock {mMutex};

    return mWorkingDir;
}

Error Device::SetWorkingDir(const std::string& baseDir)
{
    std::lock_guard lock {mMutex};

    return SetWorkingDirLocked(baseDir);
}

std::optional<uint16_t> Device::GetConsole() const
{
    std::lock_guard lock {mMutex};

    return mConsole;
}

Error Device::SetConsole(uint16_t port)
{
    std::lock_guard lock {mMutex};

    if (port == 0) {
        return AOS_ERROR_WRAP(Error(ErrorEnum::eInvalidArgument, "invalid console port"));
    }

    mConsole = port;

    LOG_INF() << "VPCS console port set" << Log::Field("name", mName.c_str()) << Log::Field("id", mID)
              << Log::Field("port", port);

    return ErrorEnum::eNone;
}

std::string Device::GetScriptFile() const
{
    std::lock_guard lock {mMutex};

    return mScriptFile;
}

Error Device::SetScriptFile(const std::string& scriptFile)
{
    std::lock_guard lock {mMutex};

    mScriptFile = scriptFile;

    LOG_INF() << "VPCS script file set" << Log::Field("name", mName.c_str()) << Log::Field("id", mID)
              << Log::Field("scriptFile", mScriptFile.c_str());

    return ErrorEnum::eNone;
}

Error Device::AddPortBinding(size_t slotID, size_t portID, const nio::NIO& nio)
{
    std::lock_guard lock {mMutex};

    auto [adapter, err] = GetAdapterLocked(slotID);
    if (!err.IsNone()) {
        return err;
    }

    if (err = adapter->AddNIO(portID, nio); !err.IsNone()) {
        const auto message
            = FormatMessageLocked(Poco::format("port %z doesn't exist in %s", portID, adapter->ToString()));

        return AOS_ERROR_WRAP(Error(err, message.c_str()));
    }

    LOG_INF() << "NIO added" << Log::Field("name", mName.c_str()) << Log::Field("id", mID)
              << Log::Field("nio", nio::ToString(nio).c_str()) << Log::Field("slot", slotID)
              << Log::Field("port", portID);

    return ErrorEnum::eNone;
}

RetWithError<std::optional<nio::NIO>> Device::RemovePortBinding(size_t slotID, size_t portID)
{
    std::lock_guard lock {mMutex};

    auto [adapter, err] = GetAdapterLocked(slotID);
    if (!err.IsNone()) {
        return {std::nullopt, err};
    }

    auto [nio, removeErr] = adapter->RemoveNIO(portID);
    if (!removeErr.IsNone()) {
        const auto message
            = FormatMessageLocked(Poco::format("port %z doesn't exist in %s", portID, adapter->ToString()));

        return {std::nullopt, AOS_ERROR_WRAP(Error(removeErr, message.c_str()))};
    }

    LOG_INF() << "NIO removed" << Log::Field("name", mName.c_str()) << Log::Field("id", mID)
              << Log::Field("nio", nio.has_value() ? nio::ToString(*nio).c_str() : "none") << Log::Field("slot", slotID)
              << Log::Field("port", portID);

    return {nio, ErrorEnum::eNone};
}

RetWithError<std::optional<nio::NIO>> Device::GetPortBinding(size_t slotID, size_t portID) const
{
    std::lock_guard lock {mMutex};

    if (slotID >= mAdapters.size()) {
        const auto message = FormatMessageLocked(Poco::format("slot %z doesn't exist", slotID));

        return {std::nullopt, AOS_ERROR_WRAP(Error(ErrorEnum::eOutOfRange, message.c_str()))};
    }

    const auto& adapter = mAdapters[slotID];

    if (!adapter.PortExists(portID)) {
        const auto message
            = FormatMessageLocked(Poco::format("port %z doesn't exist in %s", portID, adapter.ToString()));

        return {std::nullopt, AOS_ERROR_WRAP(Error(ErrorEnum::eNotFound, message.c_str()))};
    }

    return {adapter.GetNIO(portID), ErrorEnum::eNone};
}

std::vector<std::string> Device::BuildCommand() const
{
    std::lock_guard lock {mMutex};

    return BuildCommandLocked();
}

std::string Device::GetCommand() const
{
    return command::JoinCommand(BuildCommand());
}

Error Device::Start()
{
    std::lock_guard lock {mMutex};

    if (!mInitialized || mDeleted) {
        return AOS_ERROR_WRAP(Error(ErrorEnum::eWrongState, "device is not initialized or deleted"));
    }

    if (mPID.has_value()) {
        if (IsRunningLocked() || IsProcessAliveLocked()) {
            LOG_DBG() << "VPCS is already running" << Log::Field("id", mID) << Log::Field("pid", *mPID);

            return ErrorEnum::eNone;
        }

        LOG_WRN() << "VPCS process has exited" << Log::Field("id", mID) << Log::Field("pid", *mPID);

        mPID.reset();
        mStarted = false;
    }

    if (!mConsole.has_value()) {
        return AOS_ERROR_WRAP(
            Error(ErrorEnum::eInvalidArgument, FormatMessageLocked("console port is not set").c_str()));
    }

    if (!utils::IsRegularFile(mPath)) {
        return AOS_ERROR_WRAP(
            Error(ErrorEnum::eNotFound, FormatMessageLocked("image '" + mPath + "' is not accessible").c_str()));
    }

    if (!utils::IsExecutable(mPath)) {
        return AOS_ERROR_WRAP(
            Error(ErrorEnum::eInvalidArgument, FormatMessageLocked("image '" + mPath + "' is not executable").c_str()));
    }

    const auto args = BuildCommandLocked();

    mLogFile = utils::JoinPath(mWorkingDir, cLogFileName);

    LOG_INF() << "Start VPCS" << Log::Field("id", mID) << Log::Field("command", command::JoinCommand(args).c_str())
              << Log::Field("logFile", mLogFile.c_str());

    auto [pid, err] = mProcessRunner->Run(args, mWorkingDir, mLogFile);
    if (!err.IsNone()) {
        const auto output  = ReadStdoutLocked();
        const auto message = LaunchErrorMessageLocked(err, output);

        LOG_ERR() << "Can't start VPCS" << Log::Field("id", mID) << Log::Field("path", mPath.c_str())
                  << Log::Field("output", output.c_str()) << Log::Field(err);

        return AOS_ERROR_WRAP(Error(err, message.c_str()));
    }

    mPID     = pid;
    mStarted = true;

    LOG_INF() << "VPCS instance started" << Log::Field("id", mID) << Log::Field("pid", pid);

    return ErrorEnum::eNone;
}

Error Device::Stop()
{
    std::lock_guard lock {mMutex};

    return StopLocked();
}

bool Device::IsRunning()
{
    std::lock_guard lock {mMutex};

    return IsRunningLocked();
}

bool Device::IsStarted() const
{
    std::lock_guard lock {mMutex};

    return mStarted;
}

std::string Device::ReadStdout() const
{
    std::lock_guard lock {mMutex};

    return ReadStdoutLocked();
}

Error Device::Delete()
{
    std::lock_guard lock {mMutex};

    if (!mInitialized || mDeleted) {
        return AOS_ERROR_WRAP(Error(ErrorEnum::eWrongState, "device is not initialized or already deleted"));
    }

    auto err = StopLocked();

    mDeleted = true;

    if (auto releaseErr = mIDPool->ReleaseID(mID); !releaseErr.IsNone() && err.IsNone()) {
        err = AOS_ERROR_WRAP(releaseErr);
    }

    LOG_INF() << "VPCS device deleted" << Log::Field("name", mName.c_str()) << Log::Field("id", mID);

    return err;
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

bool Device::IsRunningLocked()
{
    if (!mPID.has_value() || !mConsole.has_value()) {
        return false;
    }

    return mConsoleClient->IsReachable(mHost, *mConsole);
}

bool Device::IsProcessAliveLocked()
{
    return mPID.has_value() && mProcessRunner->IsRunning(*mPID);
}

Error Device::StopLocked()
{
    if (!mPID.has_value()) {
        mStarted = false;

        return ErrorEnum::eNone;
    }

    const auto pid       = *mPID;
    bool       quitSent  = false;
    Error      resultErr = ErrorEnum::eNone;

    if (IsRunningLocked()) {
        LOG_INF() << "Stop VPCS instance" << Log::Field("id", mID) << Log::Field("pid", pid);

        if (auto err = mConsoleClient->SendQuit(mHost, *mConsole); !err.IsNone()) {
            LOG_WRN() << "Can't send quit to VPCS console" << Log::Field("id", mID) << Log::Field("pid", pid)
                      << Log::Field(err);
        } else {
            quitSent = true;
        }
    }

    auto err = quitSent ? mProcessRunner->Wait(pid, mStopTimeout) : Error(ErrorEnum::eTimeout);
    if (err.Is(ErrorEnum::eTimeout)) {
        LOG_WRN() << "VPCS instance is still running, terminate it" << Log::Field("id", mID) << Log::Field("pid", pid);

        err = mProcessRunner->Terminate(pid, mStopTimeout);
    }

    if (!err.IsNone()) {
        LOG_ERR() << "Can't stop VPCS instance" << Log::Field("id", mID) << Log::Field("pid", pid) << Log::Field(err);

        resultErr = AOS_ERROR_WRAP(err);
    }

    mPID.reset();
    mStarted = false;

    return resultErr;
}

Error Device::SetWorkingDirLocked(const std::string& baseDir)
{
    const auto workingDir = utils::JoinPath(baseDir, cDeviceDirName, cDevicePrefix + std::to_string(mID));

    if (auto err = utils::CreateDir(workingDir); !err.IsNone()) {
        LOG_ERR() << "Can't create working directory" << Log::Field("path", workingDir.c_str()) << Log::Field(err);

        return err;
    }

    mWorkingDir = workingDir;

    LOG_INF() << "VPCS working directory changed" << Log::Field("name", mName.c_str()) << Log::Field("id", mID)
              << Log::Field("workingDir", mWorkingDir.c_str());

    return ErrorEnum::eNone;
}

std::vector<std::string> Device::BuildCommandLocked() const
{
    command::CommandParams params;

    params.mPath       = mPath;
    params.mConsole    = mConsole.value_or(0);
    params.mAdapters   = mAdapters;
    params.mInstanceID = mID;
    params.mScriptFile = mScriptFile;

    return command::BuildCommand(params);
}

std::string Device::ReadStdoutLocked() const
{
    if (mLogFile.empty()) {
        return "";
    }

    auto [output, err] = utils::ReadFile(mLogFile);
    if (!err.IsNone()) {
        LOG_WRN() << "Can't read VPCS output" << Log::Field("path", mLogFile.c_str()) << Log::Field(err);
    }

    return output;
}

std::string Device::FormatMessageLocked(const std::string& message) const
{
    return Poco::format("VPCS %s [id=%z]: %s", mName, mID, message);
}

std::string Device::LaunchErrorMessageLocked(const Error& err, const std::string& output) const
{
    auto message = FormatMessageLocked(Poco::format("could not start VPCS %s: %s", mPath, std::string(err.Message())));

    // Error message capacity is limited, keep output tail only. Full output is available with ReadStdout().
    const size_t maxLen = cErrorMessageLen - 1;

    if (output.empty() || message.size() + 1 + std::strlen(cTruncatedMark) >= maxLen) {
        return message;
    }

    const auto available = maxLen - message.size() - 1;

    message += "\n";

    if (output.size() <= available) {
        return message + output;
    }

    const auto tailLen = available - std::strlen(cTruncatedMark);

    return message + cTruncatedMark + output.substr(output.size() - tailLen);
}

RetWithError<adapter::EthernetAdapter*> Device::GetAdapterLocked(size_t slotID)
{
    if (slotID >= mAdapters.size()) {
        const auto message = FormatMessageLocked(Poco::format("slot %z doesn't exist", slotID));

        return {nullptr, AOS_ERROR_WRAP(Error(ErrorEnum::eOutOfRange, message.c_str()))};
    }

    return {&mAdapters[slotID], ErrorEnum::eNone};
}

} // namespace aos::vpcs::device

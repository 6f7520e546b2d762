/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef AOS_VPCS_DEVICE_DEVICE_HPP_
#define AOS_VPCS_DEVICE_DEVICE_HPP_

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <Poco/Process.h>

#include <vpcs/adapter/ethernetadapter.hpp>
#include <vpcs/config/config.hpp>
#include <vpcs/console/itf/consoleclient.hpp>
#include <vpcs/instancepool/itf/identifierpool.hpp>
#include <vpcs/nio/nio.hpp>
#include <vpcs/process/itf/processrunner.hpp>

namespace aos::vpcs::device {

/**
 * Device default settings.
 */
struct Defaults {
    std::string             mName;
    std::string             mPath;
    std::string             mScriptFile;
    std::optional<uint16_t> mConsole;
};

/**
 * VPCS device: manages one VPCS process.
 */
class Device {
public:
    static constexpr auto cLogFileName = "vpcs.log";

    /**
     * Constructor.
     */
    Device() = default;

    /**
     * Destructor. Deletes device if it is not deleted yet.
     */
    ~Device();

    Device(const Device&)            = delete;
    Device& operator=(const Device&) = delete;

    /**
     * Initializes device: allocates instance identifier and creates working directory.
     *
     * @param config device manager config.
     * @param idPool instance identifier pool.
     * @param consoleClient console client.
     * @param processRunner process runner.
     * @param name device name, vpcs<id> if empty.
     * @return Error.
     */
    Error Init(const config::Config& config, instancepool::IdentifierPoolItf& idPool,
        console::ConsoleClientItf& consoleClient, process::ProcessRunnerItf& processRunner,
        const std::string& name = "");

    /**
     * Returns device default settings.
     *
     * @return Defaults.
     */
    Defaults GetDefaults() const;

    /**
     * Returns instance identifier.
     *
     * @return size_t.
     */
    size_t GetID() const;

    /**
     * Returns device name.
     *
     * @return std::string.
     */
    std::string GetName() const;

    /**
     * Renames device.
     *
     * @param name new name.
     * @return Error.
     */
    Error SetName(const std::string& name);

    /**
     * Returns path to VPCS executable.
     *
     * @return std::string.
     */
    std::string GetPath() const;

    /**
     * Sets path to VPCS executable. The path is checked on start.
     *
     * @param path path to VPCS executable.
     * @return Error.
     */
    Error SetPath(const std::string& path);

    /**
     * Returns console host.
     *
     * @return std::string.
     */
    std::string GetHost() const;

    /**
     * Returns device working directory.
     *
     * @return std::string.
     */
    std::string GetWorkingDir() const;

    /**
     * Sets working directory to <baseDir>/vpcs/device-<id> and creates it.
     *
     * @param baseDir base directory.
     * @return Error.
     */
    Error SetWorkingDir(const std::string& baseDir);

    /**
     * Returns console port.
     *
     * @return std::optional<uint16_t>.
     */
    std::optional<uint16_t> GetConsole() const;

    /**
     * Sets console port.
     *
     * @param port TCP port.
     * @return Error.
     */
    Error SetConsole(uint16_t port);

    /**
     * Returns script file.
     *
     * @return std::string.
     */
    std::string GetScriptFile() const;

    /**
     * Sets script file passed to VPCS as last argument. Empty value disables it.
     *
     * @param scriptFile script file path.
     * @return Error.
     */
    Error SetScriptFile(const std::string& scriptFile);

    /**
     * Binds NIO to adapter port.
     *
     * @param slotID adapter slot.
     * @param portID adapter port.
     * @param nio NIO to bind.
     * @return Error.
     */
    Error AddPortBinding(size_t slotID, size_t portID, const nio::NIO& nio);

    /**
     * Removes NIO from adapter port.
     *
     * @param slotID adapter slot.
     * @param portID adapter port.
     * @return RetWithError<std::optional<nio::NIO>> removed binding.
     */
    RetWithError<std::optional<nio::NIO>> RemovePortBinding(size_t slotID, size_t portID);

    /**
     * Returns NIO bound to adapter port.
     *
     * @param slotID adapter slot.
     * @param portID adapter port.
     * @return RetWithError<std::optional<nio::NIO>>.
     */
    RetWithError<std::optional<nio::NIO>> GetPortBinding(size_t slotID, size_t portID) const;

    /**
     * Returns VPCS argument vector.
     *
     * @return std::vector<std::string>.
     */
    std::vector<std::string> BuildCommand() const;

    /**
     * Returns VPCS command line.
     *
     * @return std::string.
     */
    std::string GetCommand() const;

    /**
     * Starts VPCS process. Does nothing if the process is already running.
     *
     * @return Error.
     */
    Error Start();

    /**
     * Stops VPCS process.
     *
     * @return Error.
     */
    Error Stop();

    /**
     * Checks if VPCS is running by connecting to its console.
     *
     * @return bool.
     */
    bool IsRunning();

    /**
     * Returns whether the device has been started.
     *
     * @return bool.
     */
    bool IsStarted() const;

    /**
     * Returns captured VPCS output. Use when the process is stopped or crashed. Start error keeps only the output
     * tail, this method returns the whole output.
     *
     * @return std::string.
     */
    std::string ReadStdout() const;

    /**
     * Stops VPCS process and releases instance identifier. Device can't be started after deletion.
     *
     * @return Error.
     */
    Error Delete();

private:
    static constexpr auto cNamePrefix     = "vpcs";
    static constexpr auto cDeviceDirName  = "vpcs";
    static constexpr auto cDevicePrefix   = "device-";
    static constexpr auto cDefaultAdapter = 1;
    static constexpr auto cTruncatedMark  = "...";

    bool                                   IsRunningLocked();
    bool                                   IsProcessAliveLocked();
    Error                                  StopLocked();
    Error                                  SetWorkingDirLocked(const std::string& baseDir);
    std::vector<std::string>               BuildCommandLocked() const;
    std::string                            ReadStdoutLocked() const;
    std::string                            FormatMessageLocked(const std::string& message) const;
    std::string                            LaunchErrorMessageLocked(const Error& err, const std::string& output) const;
    RetWithError<adapter::EthernetAdapter*> GetAdapterLocked(size_t slotID);

    mutable std::mutex mMutex;

    instancepool::IdentifierPoolItf* mIDPool        = nullptr;
    console::ConsoleClientItf*       mConsoleClient = nullptr;
    process::ProcessRunnerItf*       mProcessRunner = nullptr;

    size_t                                mID = 0;
    std::string                           mName;
    std::string                           mPath;
    std::string                           mHost;
    std::string                           mWorkingDir;
    std::string                           mScriptFile;
    std::string                           mLogFile;
    std::optional<uint16_t>               mConsole;
    std::vector<adapter::EthernetAdapter> mAdapters;
    std::optional<Poco::Process::PID>     mPID;
    Poco::Timespan                        mStopTimeout;
    bool                                  mStarted     = false;
    bool                                  mInitialized = false;
    bool                                  mDeleted     = false;
};

} // namespace aos::vpcs::device

#endif

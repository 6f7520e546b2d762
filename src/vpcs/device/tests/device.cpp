/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <thread>
#include <unistd.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <core/common/tests/utils/log.hpp>

#include <vpcs/console/tests/mocks/consoleclientmock.hpp>
#include <vpcs/device/device.hpp>
#include <vpcs/instancepool/instancepool.hpp>
#include <vpcs/instancepool/tests/mocks/identifierpoolmock.hpp>
#include <vpcs/process/processrunner.hpp>
#include <vpcs/process/tests/mocks/processrunnermock.hpp>
#include <vpcs/utils/filesystem.hpp>

using namespace testing;

namespace aos::vpcs::device {

namespace {

/***********************************************************************************************************************
 * Consts
 **********************************************************************************************************************/

constexpr auto cFakeVPCSScript = R"(#!/bin/sh
echo "vpcs $@"
exec sleep 30
)";

constexpr Poco::Process::PID cPID = 4242;

} // namespace

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

class DeviceTest : public Test {
protected:
    void SetUp() override
    {
        aos::tests::utils::InitLog();

        mTestDir = std::filesystem::temp_directory_path() / ("vpcs_device_test_" + std::to_string(getpid()));

        std::filesystem::remove_all(mTestDir);
        std::filesystem::create_directories(mTestDir);

        mConfig.mVPCSPath    = CreateExecutable("vpcs", cFakeVPCSScript);
        mConfig.mWorkingDir  = utils::JoinPath(mTestDir, "work");
        mConfig.mHost        = "127.0.0.1";
        mConfig.mStopTimeout = Poco::Timespan(0, 200 * 1000);
    }

    void TearDown() override { std::filesystem::remove_all(mTestDir); }

    std::string CreateExecutable(const std::string& name, const char* content)
    {
        const auto path = utils::JoinPath(mTestDir, name);

        std::ofstream(path) << content;

        std::filesystem::permissions(path, std::filesystem::perms::owner_all);

        return path;
    }

    static bool MessageContains(const Error& err, const std::string& text)
    {
        return std::string(err.Message()).find(text) != std::string::npos;
    }

    std::unique_ptr<Device> CreateDevice(const std::string& name = "")
    {
        auto device = std::make_unique<Device>();

        EXPECT_TRUE(device->Init(mConfig, mIDPool, mConsoleClient, mProcessRunner, name).IsNone());

        return device;
    }

    std::filesystem::path                  mTestDir;
    config::Config                         mConfig;
    instancepool::InstanceIDPool           mIDPool;
    NiceMock<console::MockConsoleClient>   mConsoleClient;
    NiceMock<process::MockProcessRunner>   mProcessRunner;
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(DeviceTest, Init)
{
    auto device = CreateDevice();

    EXPECT_EQ(device->GetID(), 1);
    EXPECT_EQ(device->GetName(), "vpcs1");
    EXPECT_EQ(device->GetPath(), mConfig.mVPCSPath);
    EXPECT_EQ(device->GetHost(), "127.0.0.1");
    EXPECT_EQ(device->GetWorkingDir(), utils::JoinPath(mConfig.mWorkingDir, "vpcs", "device-1"));
    EXPECT_TRUE(std::filesystem::is_directory(device->GetWorkingDir()));
    EXPECT_FALSE(device->GetConsole().has_value());
    EXPECT_FALSE(device->IsStarted());

    auto named = CreateDevice("pc");

    EXPECT_EQ(named->GetID(), 2);
    EXPECT_EQ(named->GetName(), "pc");
}

TEST_F(DeviceTest, IdentifiersAreUniqueAndReused)
{
    auto first  = CreateDevice();
    auto second = CreateDevice();
    auto third  = CreateDevice();

    EXPECT_EQ(first->GetID(), 1);
    EXPECT_EQ(second->GetID(), 2);
    EXPECT_EQ(third->GetID(), 3);

    ASSERT_TRUE(second->Delete().IsNone());
    EXPECT_EQ(mIDPool.Size(), 2);

    auto fourth = CreateDevice();

    EXPECT_EQ(fourth->GetID(), 2);

    third.reset();

    EXPECT_EQ(mIDPool.Size(), 2);
}

TEST_F(DeviceTest, InitFailsWhenPoolIsExhausted)
{
    for (auto id = instancepool::InstanceIDPool::cMinInstanceID; id <= instancepool::InstanceIDPool::cMaxInstanceID;
         ++id) {
        ASSERT_TRUE(mIDPool.LockID(id).IsNone());
    }

    Device device;

    auto err = device.Init(mConfig, mIDPool, mConsoleClient, mProcessRunner);
    EXPECT_TRUE(err.Is(ErrorEnum::eNoMemory));

    EXPECT_TRUE(device.Start().Is(ErrorEnum::eWrongState));
}

TEST_F(DeviceTest, InitReleasesIdentifierOnWorkingDirError)
{
    const auto blocker = utils::JoinPath(mTestDir, "blocker");

    std::ofstream(blocker) << "file";

    mConfig.mWorkingDir = blocker;

    instancepool::MockIdentifierPool idPool;

    EXPECT_CALL(idPool, GetFreeID()).WillOnce(Return(RetWithError<size_t>(7, ErrorEnum::eNone)));
    EXPECT_CALL(idPool, ReleaseID(7)).WillOnce(Return(ErrorEnum::eNone));

    Device device;

    EXPECT_FALSE(device.Init(mConfig, idPool, mConsoleClient, mProcessRunner).IsNone());
}

TEST_F(DeviceTest, Defaults)
{
    auto device = CreateDevice();

    ASSERT_TRUE(device->SetConsole(2000).IsNone());
    ASSERT_TRUE(device->SetScriptFile("startup.vpc").IsNone());

    const auto defaults = device->GetDefaults();

    EXPECT_EQ(defaults.mName, "vpcs1");
    EXPECT_EQ(defaults.mPath, mConfig.mVPCSPath);
    EXPECT_EQ(defaults.mScriptFile, "startup.vpc");
    ASSERT_TRUE(defaults.mConsole.has_value());
    EXPECT_EQ(*defaults.mConsole, 2000);
}

TEST_F(DeviceTest, Setters)
{
    auto device = CreateDevice();

    EXPECT_TRUE(device->SetName("renamed").IsNone());
    EXPECT_EQ(device->GetName(), "renamed");
    EXPECT_TRUE(device->SetName("").Is(ErrorEnum::eInvalidArgument));
    EXPECT_EQ(device->GetName(), "renamed");

    EXPECT_TRUE(device->SetPath("/opt/vpcs").IsNone());
    EXPECT_EQ(device->GetPath(), "/opt/vpcs");

    EXPECT_TRUE(device->SetConsole(0).Is(ErrorEnum::eInvalidArgument));
    EXPECT_FALSE(device->GetConsole().has_value());
}

TEST_F(DeviceTest, SetWorkingDirIsIdempotent)
{
    auto device = CreateDevice();

    const auto baseDir = utils::JoinPath(mTestDir, "other");

    ASSERT_TRUE(device->SetWorkingDir(baseDir).IsNone());
    ASSERT_TRUE(device->SetWorkingDir(baseDir).IsNone());

    EXPECT_EQ(device->GetWorkingDir(), utils::JoinPath(baseDir, "vpcs", "device-1"));
    EXPECT_TRUE(std::filesystem::is_directory(device->GetWorkingDir()));
}

TEST_F(DeviceTest, PortBindings)
{
    auto device = CreateDevice();

    const nio::NIO udp = nio::NIOUDP {20000, 30000, "127.0.0.1"};

    ASSERT_TRUE(device->AddPortBinding(0, 0, udp).IsNone());

    auto [bound, err] = device->GetPortBinding(0, 0);
    ASSERT_TRUE(err.IsNone());
    ASSERT_TRUE(bound.has_value());
    EXPECT_EQ(*bound, udp);

    const nio::NIO tap = nio::NIOTAP {"tap0"};

    ASSERT_TRUE(device->AddPortBinding(0, 0, tap).IsNone());

    auto [removed, removeErr] = device->RemovePortBinding(0, 0);
    ASSERT_TRUE(removeErr.IsNone());
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(*removed, tap);

    Tie(bound, err) = device->GetPortBinding(0, 0);
    ASSERT_TRUE(err.IsNone());
    EXPECT_FALSE(bound.has_value());

    Tie(removed, removeErr) = device->RemovePortBinding(0, 0);
    ASSERT_TRUE(removeErr.IsNone());
    EXPECT_FALSE(removed.has_value());
}

TEST_F(DeviceTest, PortBindingErrors)
{
    auto device = CreateDevice("pc");

    const nio::NIO udp = nio::NIOUDP {20000, 30000, "127.0.0.1"};

    auto err = device->AddPortBinding(1, 0, udp);
    EXPECT_TRUE(err.Is(ErrorEnum::eOutOfRange));
    EXPECT_TRUE(MessageContains(err, "VPCS pc [id=1]: slot 1 doesn't exist"));

    err = device->AddPortBinding(0, 1, udp);
    EXPECT_TRUE(err.Is(ErrorEnum::eNotFound));
    EXPECT_TRUE(MessageContains(err, "VPCS pc [id=1]: port 1 doesn't exist"));

    err = device->RemovePortBinding(5, 0).mError;
    EXPECT_TRUE(err.Is(ErrorEnum::eOutOfRange));
    EXPECT_TRUE(MessageContains(err, "VPCS pc [id=1]: slot 5"));

    err = device->RemovePortBinding(0, 3).mError;
    EXPECT_TRUE(err.Is(ErrorEnum::eNotFound));
    EXPECT_TRUE(MessageContains(err, "VPCS pc [id=1]: port 3"));

    err = device->GetPortBinding(1, 0).mError;
    EXPECT_TRUE(err.Is(ErrorEnum::eOutOfRange));
    EXPECT_TRUE(MessageContains(err, "VPCS pc [id=1]"));

    err = device->GetPortBinding(0, 1).mError;
    EXPECT_TRUE(err.Is(ErrorEnum::eNotFound));
    EXPECT_TRUE(MessageContains(err, "VPCS pc [id=1]"));
}

TEST_F(DeviceTest, Command)
{
    mConfig.mVPCSPath = "/usr/bin/vpcs";

    for (size_t id = 1; id < 5; ++id) {
        ASSERT_TRUE(mIDPool.LockID(id).IsNone());
    }

    auto device = CreateDevice();

    ASSERT_EQ(device->GetID(), 5);
    ASSERT_TRUE(device->SetConsole(2000).IsNone());
    ASSERT_TRUE(device->AddPortBinding(0, 0, nio::NIOUDP {20000, 30000, "127.0.0.1"}).IsNone());

    const std::vector<std::string> expected {
        "/usr/bin/vpcs", "-p", "2000", "-s", "20000", "-c", "30000", "-t", "127.0.0.1", "-m", "5", "-i", "1"};

    EXPECT_EQ(device->BuildCommand(), expected);
    EXPECT_EQ(device->GetCommand(), "/usr/bin/vpcs -p 2000 -s 20000 -c 30000 -t 127.0.0.1 -m 5 -i 1");

    ASSERT_TRUE(device->SetScriptFile("startup.vpc").IsNone());

    EXPECT_EQ(device->BuildCommand().back(), "startup.vpc");
}

TEST_F(DeviceTest, Start)
{
    auto device = CreateDevice();

    ASSERT_TRUE(device->SetConsole(2000).IsNone());

    const auto workingDir = device->GetWorkingDir();
    const auto logFile    = utils::JoinPath(workingDir, Device::cLogFileName);

    EXPECT_CALL(mProcessRunner, Run(device->BuildCommand(), workingDir, logFile))
        .WillOnce(Return(RetWithError<Poco::Process::PID>(cPID, ErrorEnum::eNone)));

    ASSERT_TRUE(device->Start().IsNone());
    EXPECT_TRUE(device->IsStarted());

    EXPECT_CALL(mConsoleClient, IsReachable("127.0.0.1", 2000)).WillRepeatedly(Return(true));

    ASSERT_TRUE(device->Start().IsNone());
    EXPECT_TRUE(device->IsRunning());

    EXPECT_CALL(mConsoleClient, SendQuit("127.0.0.1", 2000)).WillOnce(Return(ErrorEnum::eNone));
    EXPECT_CALL(mProcessRunner, Wait(cPID, _)).WillOnce(Return(ErrorEnum::eNone));
}

TEST_F(DeviceTest, StartRestartsExitedProcess)
{
    auto device = CreateDevice();

    ASSERT_TRUE(device->SetConsole(2000).IsNone());

    EXPECT_CALL(mConsoleClient, IsReachable(_, _)).WillRepeatedly(Return(false));
    EXPECT_CALL(mProcessRunner, IsRunning(cPID)).WillOnce(Return(false));
    EXPECT_CALL(mProcessRunner, Run(_, _, _))
        .Times(2)
        .WillRepeatedly(Return(RetWithError<Poco::Process::PID>(cPID, ErrorEnum::eNone)));

    ASSERT_TRUE(device->Start().IsNone());
    ASSERT_TRUE(device->Start().IsNone());
    EXPECT_TRUE(device->IsStarted());
}

TEST_F(DeviceTest, StartFailsWithoutConsole)
{
    auto device = CreateDevice();

    EXPECT_CALL(mProcessRunner, Run(_, _, _)).Times(0);

    EXPECT_TRUE(device->Start().Is(ErrorEnum::eInvalidArgument));
    EXPECT_FALSE(device->IsStarted());
}

TEST_F(DeviceTest, StartFailsWhenPathIsNotAccessible)
{
    auto device = CreateDevice();

    ASSERT_TRUE(device->SetConsole(2000).IsNone());
    ASSERT_TRUE(device->SetPath(utils::JoinPath(mTestDir, "missing")).IsNone());

    EXPECT_CALL(mProcessRunner, Run(_, _, _)).Times(0);

    auto err = device->Start();

    EXPECT_TRUE(err.Is(ErrorEnum::eNotFound));
    EXPECT_TRUE(MessageContains(err, "VPCS vpcs1 [id=1]: image"));
    EXPECT_TRUE(MessageContains(err, "is not accessible"));
    EXPECT_FALSE(device->IsStarted());

    ASSERT_TRUE(device->SetPath(mTestDir).IsNone());

    EXPECT_TRUE(device->Start().Is(ErrorEnum::eNotFound));
}

TEST_F(DeviceTest, StartFailsWhenPathIsNotExecutable)
{
    auto device = CreateDevice();

    const auto path = utils::JoinPath(mTestDir, "vpcs.txt");

    std::ofstream(path) << "not executable";
    std::filesystem::permissions(path, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write);

    ASSERT_TRUE(device->SetConsole(2000).IsNone());
    ASSERT_TRUE(device->SetPath(path).IsNone());

    EXPECT_CALL(mProcessRunner, Run(_, _, _)).Times(0);

    auto err = device->Start();

    EXPECT_TRUE(err.Is(ErrorEnum::eInvalidArgument));
    EXPECT_TRUE(MessageContains(err, "VPCS vpcs1 [id=1]: image"));
    EXPECT_TRUE(MessageContains(err, "is not executable"));
}

TEST_F(DeviceTest, StartFailsWhenLaunchFails)
{
    auto device = CreateDevice();

    ASSERT_TRUE(device->SetConsole(2000).IsNone());

    const auto logFile = utils::JoinPath(device->GetWorkingDir(), Device::cLogFileName);

    EXPECT_CALL(mProcessRunner, Run(_, _, logFile)).WillOnce(Invoke([&logFile](auto&&...) {
        std::ofstream(logFile) << "bind failed";

        return RetWithError<Poco::Process::PID>(-1, ErrorEnum::eRuntime);
    }));

    auto err = device->Start();

    EXPECT_TRUE(err.Is(ErrorEnum::eRuntime));
    EXPECT_TRUE(MessageContains(err, "VPCS vpcs1 [id=1]: could not start VPCS"));
    EXPECT_TRUE(MessageContains(err, "bind failed"));
    EXPECT_FALSE(device->IsStarted());
    EXPECT_EQ(device->ReadStdout(), "bind failed");
}

TEST_F(DeviceTest, StartFailsWithLongOutput)
{
    auto device = CreateDevice();

    ASSERT_TRUE(device->SetConsole(2000).IsNone());

    const auto        logFile = utils::JoinPath(device->GetWorkingDir(), Device::cLogFileName);
    const std::string output  = std::string(cErrorMessageLen * 2, 'x') + "last line";

    EXPECT_CALL(mProcessRunner, Run(_, _, logFile)).WillOnce(Invoke([&logFile, &output](auto&&...) {
        std::ofstream(logFile) << output;

        return RetWithError<Poco::Process::PID>(-1, ErrorEnum::eRuntime);
    }));

    auto err = device->Start();

    const std::string message = err.Message();

    EXPECT_TRUE(err.Is(ErrorEnum::eRuntime));
    EXPECT_LT(message.size(), static_cast<size_t>(cErrorMessageLen));
    EXPECT_EQ(message.rfind("VPCS vpcs1 [id=1]: could not start VPCS", 0), 0);
    EXPECT_NE(message.find("...x"), std::string::npos);
    EXPECT_EQ(message.substr(message.size() - 9), "last line");
    EXPECT_EQ(device->ReadStdout(), output);
}
TEST_F(DeviceTest, ReadStdoutWithoutLogFile)
{
    auto device = CreateDevice();

    EXPECT_EQ(device->ReadStdout(), "");
}

TEST_F(DeviceTest, ReadStdoutWhenLogFileIsRemoved)
{
    auto device = CreateDevice();

    ASSERT_TRUE(device->SetConsole(2000).IsNone());

    const auto logFile = utils::JoinPath(device->GetWorkingDir(), Device::cLogFileName);

    EXPECT_CALL(mProcessRunner, Run(_, _, logFile)).WillOnce(Invoke([&logFile](auto&&...) {
        std::ofstream(logFile) << "vpcs output";

        return RetWithError<Poco::Process::PID>(cPID, ErrorEnum::eNone);
    }));

    ASSERT_TRUE(device->Start().IsNone());
    ASSERT_EQ(device->ReadStdout(), "vpcs output");

    ASSERT_TRUE(std::filesystem::remove(logFile));

    EXPECT_EQ(device->ReadStdout(), "");
    EXPECT_TRUE(device->IsStarted());
}

TEST_F(DeviceTest, StopSendsQuit)
{
    auto device = CreateDevice();

    ASSERT_TRUE(device->SetConsole(2000).IsNone());

    EXPECT_CALL(mProcessRunner, Run(_, _, _))
        .WillOnce(Return(RetWithError<Poco::Process::PID>(cPID, ErrorEnum::eNone)));

    ASSERT_TRUE(device->Start().IsNone());

    EXPECT_CALL(mConsoleClient, IsReachable("127.0.0.1", 2000)).WillOnce(Return(true));
    EXPECT_CALL(mConsoleClient, SendQuit("127.0.0.1", 2000)).WillOnce(Return(ErrorEnum::eNone));
    EXPECT_CALL(mProcessRunner, Wait(cPID, mConfig.mStopTimeout)).WillOnce(Return(ErrorEnum::eNone));
    EXPECT_CALL(mProcessRunner, Terminate(_, _)).Times(0);

    ASSERT_TRUE(device->Stop().IsNone());
    EXPECT_FALSE(device->IsStarted());
    EXPECT_FALSE(device->IsRunning());

    ASSERT_TRUE(device->Stop().IsNone());
}

TEST_F(DeviceTest, StopTerminatesWhenQuitIsIgnored)
{
    auto device = CreateDevice();

    ASSERT_TRUE(device->SetConsole(2000).IsNone());

    EXPECT_CALL(mProcessRunner, Run(_, _, _))
        .WillOnce(Return(RetWithError<Poco::Process::PID>(cPID, ErrorEnum::eNone)));

    ASSERT_TRUE(device->Start().IsNone());

    EXPECT_CALL(mConsoleClient, IsReachable(_, _)).WillOnce(Return(true));
    EXPECT_CALL(mConsoleClient, SendQuit(_, _)).WillOnce(Return(ErrorEnum::eNone));
    EXPECT_CALL(mProcessRunner, Wait(cPID, _)).WillOnce(Return(ErrorEnum::eTimeout));
    EXPECT_CALL(mProcessRunner, Terminate(cPID, _)).WillOnce(Return(ErrorEnum::eNone));

    ASSERT_TRUE(device->Stop().IsNone());
    EXPECT_FALSE(device->IsStarted());
}

TEST_F(DeviceTest, StopWhenQuitFails)
{
    auto device = CreateDevice();

    ASSERT_TRUE(device->SetConsole(2000).IsNone());

    EXPECT_CALL(mProcessRunner, Run(_, _, _))
        .WillOnce(Return(RetWithError<Poco::Process::PID>(cPID, ErrorEnum::eNone)));

    ASSERT_TRUE(device->Start().IsNone());

    EXPECT_CALL(mConsoleClient, IsReachable(_, _)).WillOnce(Return(true));
    EXPECT_CALL(mConsoleClient, SendQuit(_, _)).WillOnce(Return(ErrorEnum::eRuntime));
    EXPECT_CALL(mProcessRunner, Wait(_, _)).Times(0);
    EXPECT_CALL(mProcessRunner, Terminate(cPID, _)).WillOnce(Return(ErrorEnum::eNone));

    ASSERT_TRUE(device->Stop().IsNone());
    EXPECT_FALSE(device->IsStarted());
}

TEST_F(DeviceTest, StopNotStarted)
{
    auto device = CreateDevice();

    EXPECT_CALL(mConsoleClient, SendQuit(_, _)).Times(0);
    EXPECT_CALL(mProcessRunner, Terminate(_, _)).Times(0);

    EXPECT_TRUE(device->Stop().IsNone());
    EXPECT_FALSE(device->IsRunning());
}

TEST_F(DeviceTest, Delete)
{
    auto device = CreateDevice();

    ASSERT_TRUE(device->SetConsole(2000).IsNone());

    EXPECT_CALL(mProcessRunner, Run(_, _, _))
        .WillOnce(Return(RetWithError<Poco::Process::PID>(cPID, ErrorEnum::eNone)));

    ASSERT_TRUE(device->Start().IsNone());
    ASSERT_EQ(mIDPool.Size(), 1);

    EXPECT_CALL(mConsoleClient, IsReachable(_, _)).WillRepeatedly(Return(false));
    EXPECT_CALL(mProcessRunner, Terminate(cPID, _)).WillOnce(Return(ErrorEnum::eNone));

    ASSERT_TRUE(device->Delete().IsNone());
    EXPECT_EQ(mIDPool.Size(), 0);
    EXPECT_FALSE(device->IsStarted());

    EXPECT_TRUE(device->Start().Is(ErrorEnum::eWrongState));
    EXPECT_TRUE(device->Delete().Is(ErrorEnum::eWrongState));
}

TEST_F(DeviceTest, StartStopProcess)
{
    process::ProcessRunner processRunner;
    Device                 device;

    ASSERT_TRUE(device.Init(mConfig, mIDPool, mConsoleClient, processRunner).IsNone());
    ASSERT_TRUE(device.SetConsole(2000).IsNone());

    EXPECT_CALL(mConsoleClient, IsReachable(_, _)).WillRepeatedly(Return(false));

    ASSERT_TRUE(device.Start().IsNone());
    EXPECT_TRUE(device.IsStarted());

    const std::string expected = "vpcs -p 2000 -m 1 -i 1";
    std::string       output;

    for (int i = 0; i < 50 && output.find(expected) == std::string::npos; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));

        output = device.ReadStdout();
    }

    EXPECT_NE(output.find(expected), std::string::npos);

    ASSERT_TRUE(device.Stop().IsNone());
    EXPECT_FALSE(device.IsStarted());

    ASSERT_TRUE(device.Delete().IsNone());
}

} // namespace aos::vpcs::device

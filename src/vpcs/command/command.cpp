/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <Poco/String.h>

#include "command.hpp"

namespace aos::vpcs::command {

namespace {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

class NIOArgsAppender {
public:
    explicit NIOArgsAppender(std::vector<std::string>& args)
        : mArgs(args)
    {
    }

    void operator()(const nio::NIOUDP& udp) const
    {
        mArgs.insert(mArgs.end(),
            {"-s", std::to_string(udp.mLocalPort), "-c", std::to_string(udp.mRemotePort), "-t", udp.mRemoteHost});
    }

    // VPCS can't select a specific TAP device, the device name is not passed.
    void operator()(const nio::NIOTAP&) const { mArgs.push_back("-e"); }

private:
    std::vector<std::string>& mArgs;
};

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

std::vector<std::string> BuildCommand(const CommandParams& params)
{
    std::vector<std::string> args {params.mPath, "-p", std::to_string(params.mConsole)};

    for (const auto& adapter : params.mAdapters) {
        for (const auto& [portID, nio] : adapter.GetPorts()) {
            if (nio.has_value()) {
                std::visit(NIOArgsAppender(args), *nio);
            }
        }
    }

    args.insert(args.end(), {"-m", std::to_string(params.mInstanceID), "-i", "1"});

    if (!params.mScriptFile.empty()) {
        args.push_back(params.mScriptFile);
    }

    return args;
}

std::string JoinCommand(const std::vector<std::string>& args)
{
    return Poco::cat(std::string(" "), args.begin(), args.end());
}

} // namespace aos::vpcs::command

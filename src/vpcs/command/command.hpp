/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef AOS_VPCS_COMMAND_COMMAND_HPP_
#define AOS_VPCS_COMMAND_COMMAND_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include <vpcs/adapter/ethernetadapter.hpp>

namespace aos::vpcs::command {

/**
 * VPCS command line parameters.
 */
struct CommandParams {
    std::string                           mPath;
    uint16_t                              mConsole = 0;
    std::vector<adapter::EthernetAdapter> mAdapters;
    size_t                                mInstanceID = 0;
    std::string                           mScriptFile;
};

/**
 * Builds VPCS command line.
 *
 * vpcs [options] [scriptfile]
 *   -p port  run as a daemon listening on the tcp 'port'
 *   -m num   start byte of ether address
 *   -i num   number of vpc instances to start
 *   -e       tap mode, using /dev/tapx
 *   -s port  local udp base port
 *   -c port  remote udp base port
 *   -t ip    remote host IP
 *
 * The script file, if any, must be the last argument.
 *
 * @param params command parameters.
 * @return std::vector<std::string> argument vector, first item is executable path.
 */
std::vector<std::string> BuildCommand(const CommandParams& params);

/**
 * Joins argument vector into a single space separated string.
 *
 * @param args argument vector.
 * @return std::string.
 */
std::string JoinCommand(const std::vector<std::string>& args);

} // namespace aos::vpcs::command

#endif

/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef AOS_VPCS_CONSOLE_ITF_CONSOLECLIENT_HPP_
#define AOS_VPCS_CONSOLE_ITF_CONSOLECLIENT_HPP_

#include <cstdint>
#include <string>

#include <core/common/tools/error.hpp>

namespace aos::vpcs::console {

/**
 * VPCS console control channel interface.
 */
class ConsoleClientItf {
public:
    /**
     * Destructor.
     */
    virtual ~ConsoleClientItf() = default;

    /**
     * Checks if something listens on console port.
     *
     * Any listener on the port is reported as reachable, not only VPCS.
     *
     * @param host console host.
     * @param port console port.
     * @return bool.
     */
    virtual bool IsReachable(const std::string& host, uint16_t port) = 0;

    /**
     * Sends quit command to console.
     *
     * @param host console host.
     * @param port console port.
     * @return Error.
     */
    virtual Error SendQuit(const std::string& host, uint16_t port) = 0;
};

} // namespace aos::vpcs::console

#endif

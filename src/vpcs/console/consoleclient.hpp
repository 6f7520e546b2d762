/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef AOS_VPCS_CONSOLE_CONSOLECLIENT_HPP_
#define AOS_VPCS_CONSOLE_CONSOLECLIENT_HPP_

#include <Poco/Net/StreamSocket.h>
#include <Poco/Timespan.h>

#include <vpcs/config/config.hpp>

#include "itf/consoleclient.hpp"

namespace aos::vpcs::console {

/**
 * TCP console client.
 */
class ConsoleClient : public ConsoleClientItf {
public:
    static constexpr auto cQuitCommand = "quit\n";

    /**
     * Initializes console client.
     *
     * @param config config, console timeout bounds connect and send.
     */
    void Init(const config::Config& config);

    /**
     * Returns connect and send timeout.
     *
     * @return const Poco::Timespan&.
     */
    const Poco::Timespan& GetTimeout() const { return mTimeout; }

    /**
     * Checks if something listens on console port.
     *
     * @param host console host.
     * @param port console port.
     * @return bool.
     */
    bool IsReachable(const std::string& host, uint16_t port) override;

    /**
     * Sends quit command to console.
     *
     * @param host console host.
     * @param port console port.
     * @return Error.
     */
    Error SendQuit(const std::string& host, uint16_t port) override;

private:
    static constexpr auto cDefaultTimeout = 3;

    Poco::Net::StreamSocket Connect(const std::string& host, uint16_t port);

    Poco::Timespan mTimeout {cDefaultTimeout, 0};
};

} // namespace aos::vpcs::console

#endif

/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstring>

#include <Poco/Net/NetException.h>
#include <Poco/Net/SocketAddress.h>

#include <vpcs/logger/logmodule.hpp>
#include <vpcs/utils/exception.hpp>

#include "consoleclient.hpp"

namespace aos::vpcs::console {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

void ConsoleClient::Init(const config::Config& config)
{
    mTimeout = config.mConsoleTimeout;

    LOG_DBG() << "Init console client" << Log::Field("timeoutMs", config.mConsoleTimeout.totalMilliseconds());
}

bool ConsoleClient::IsReachable(const std::string& host, uint16_t port)
{
    try {
        auto socket = Connect(host, port);

        socket.close();
    } catch (const std::exception& e) {
        LOG_DBG() << "Console is not reachable" << Log::Field("host", host.c_str()) << Log::Field("port", port)
                  << Log::Field(utils::ToAosError(e));

        return false;
    }

    return true;
}

Error ConsoleClient::SendQuit(const std::string& host, uint16_t port)
{
    LOG_DBG() << "Send quit to console" << Log::Field("host", host.c_str()) << Log::Field("port", port);

    try {
        auto socket = Connect(host, port);

        socket.setSendTimeout(mTimeout);

        const auto len = static_cast<int>(std::strlen(cQuitCommand));

        if (socket.sendBytes(cQuitCommand, len) != len) {
            VPCS_ERROR_THROW(ErrorEnum::eRuntime, "quit command is not sent completely");
        }

        socket.shutdownSend();
        socket.close();
    } catch (const std::exception& e) {
        return utils::ToAosError(e, ErrorEnum::eRuntime);
    }

    return ErrorEnum::eNone;
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

Poco::Net::StreamSocket ConsoleClient::Connect(const std::string& host, uint16_t port)
{
    Poco::Net::StreamSocket socket;

    socket.connect(Poco::Net::SocketAddress(host, port), mTimeout);

    return socket;
}

} // namespace aos::vpcs::console

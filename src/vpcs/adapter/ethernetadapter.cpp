/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "ethernetadapter.hpp"

namespace aos::vpcs::adapter {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

EthernetAdapter::EthernetAdapter(size_t interfaces)
{
    for (size_t portID = 0; portID < interfaces; portID++) {
        mPorts.emplace(portID, std::nullopt);
    }
}

bool EthernetAdapter::PortExists(size_t portID) const
{
    return mPorts.find(portID) != mPorts.end();
}

Error EthernetAdapter::AddNIO(size_t portID, const nio::NIO& nio)
{
    auto it = mPorts.find(portID);
    if (it == mPorts.end()) {
        return AOS_ERROR_WRAP(Error(ErrorEnum::eNotFound, "port doesn't exist"));
    }

    it->second = nio;

    return ErrorEnum::eNone;
}

RetWithError<std::optional<nio::NIO>> EthernetAdapter::RemoveNIO(size_t portID)
{
    auto it = mPorts.find(portID);
    if (it == mPorts.end()) {
        return {std::nullopt, AOS_ERROR_WRAP(Error(ErrorEnum::eNotFound, "port doesn't exist"))};
    }

    auto previous = std::move(it->second);

    it->second.reset();

    return {previous, ErrorEnum::eNone};
}

std::optional<nio::NIO> EthernetAdapter::GetNIO(size_t portID) const
{
    auto it = mPorts.find(portID);
    if (it == mPorts.end()) {
        return std::nullopt;
    }

    return it->second;
}

} // namespace aos::vpcs::adapter

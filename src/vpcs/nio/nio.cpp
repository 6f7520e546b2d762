/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <Poco/Format.h>

#include "nio.hpp"

namespace aos::vpcs::nio {

namespace {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

struct NIOFormatter {
    std::string operator()(const NIOUDP& udp) const
    {
        return Poco::format("NIO UDP %u:%s:%u", static_cast<unsigned>(udp.mLocalPort), udp.mRemoteHost,
            static_cast<unsigned>(udp.mRemotePort));
    }

    std::string operator()(const NIOTAP& tap) const { return "NIO TAP " + tap.mTAPDevice; }
};

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

std::string ToString(const NIO& nio)
{
    return std::visit(NIOFormatter {}, nio);
}

} // namespace aos::vpcs::nio

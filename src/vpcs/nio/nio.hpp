/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef AOS_VPCS_NIO_NIO_HPP_
#define AOS_VPCS_NIO_NIO_HPP_

#include <cstdint>
#include <string>
#include <variant>

namespace aos::vpcs::nio {

/**
 * UDP tunnel NIO.
 */
struct NIOUDP {
    uint16_t    mLocalPort  = 0;
    uint16_t    mRemotePort = 0;
    std::string mRemoteHost;

    /**
     * Compares UDP NIOs.
     *
     * @param other NIO to compare.
     * @return bool.
     */
    bool operator==(const NIOUDP& other) const
    {
        return mLocalPort == other.mLocalPort && mRemotePort == other.mRemotePort && mRemoteHost == other.mRemoteHost;
    }

    /**
     * Compares UDP NIOs.
     *
     * @param other NIO to compare.
     * @return bool.
     */
    bool operator!=(const NIOUDP& other) const { return !(*this == other); }
};

/**
 * TAP device NIO.
 */
struct NIOTAP {
    std::string mTAPDevice;

    /**
     * Compares TAP NIOs.
     *
     * @param other NIO to compare.
     * @return bool.
     */
    bool operator==(const NIOTAP& other) const { return mTAPDevice == other.mTAPDevice; }

    /**
     * Compares TAP NIOs.
     *
     * @param other NIO to compare.
     * @return bool.
     */
    bool operator!=(const NIOTAP& other) const { return !(*this == other); }
};

/**
 * Network input/output binding attached to adapter port.
 */
using NIO = std::variant<NIOUDP, NIOTAP>;

/**
 * Returns human readable NIO description.
 *
 * @param nio NIO.
 * @return std::string.
 */
std::string ToString(const NIO& nio);

} // namespace aos::vpcs::nio

#endif

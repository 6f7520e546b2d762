/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef AOS_VPCS_ADAPTER_ETHERNETADAPTER_HPP_
#define AOS_VPCS_ADAPTER_ETHERNETADAPTER_HPP_

#include <map>
#include <optional>
#include <string>

#include <core/common/tools/error.hpp>

#include <vpcs/nio/nio.hpp>

namespace aos::vpcs::adapter {

/**
 * Port ID to optional NIO binding.
 */
using PortMap = std::map<size_t, std::optional<nio::NIO>>;

/**
 * Ethernet adapter: set of numbered ports, each may hold one NIO binding.
 */
class EthernetAdapter {
public:
    /**
     * Creates adapter with ports 0..interfaces-1.
     *
     * @param interfaces number of interfaces.
     */
    explicit EthernetAdapter(size_t interfaces = 1);

    /**
     * Checks if port exists.
     *
     * @param portID port ID.
     * @return bool.
     */
    bool PortExists(size_t portID) const;

    /**
     * Binds NIO to port, replacing previous binding.
     *
     * @param portID port ID.
     * @param nio NIO.
     * @return Error.
     */
    Error AddNIO(size_t portID, const nio::NIO& nio);

    /**
     * Removes NIO from port.
     *
     * @param portID port ID.
     * @return RetWithError<std::optional<nio::NIO>> previous binding.
     */
    RetWithError<std::optional<nio::NIO>> RemoveNIO(size_t portID);

    /**
     * Returns NIO bound to port.
     *
     * @param portID port ID.
     * @return std::optional<nio::NIO>.
     */
    std::optional<nio::NIO> GetNIO(size_t portID) const;

    /**
     * Returns adapter ports in port ID order.
     *
     * @return const PortMap&.
     */
    const PortMap& GetPorts() const { return mPorts; }

    /**
     * Returns number of interfaces.
     *
     * @return size_t.
     */
    size_t GetInterfaces() const { return mPorts.size(); }

    /**
     * Returns adapter description.
     *
     * @return std::string.
     */
    std::string ToString() const { return "Ethernet adapter"; }

private:
    PortMap mPorts;
};

} // namespace aos::vpcs::adapter

#endif

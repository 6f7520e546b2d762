/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef AOS_VPCS_INSTANCEPOOL_INSTANCEPOOL_HPP_
#define AOS_VPCS_INSTANCEPOOL_INSTANCEPOOL_HPP_

#include <mutex>
#include <set>

#include "itf/identifierpool.hpp"

namespace aos::vpcs::instancepool {

/**
 * VPCS instance identifier pool.
 *
 * Identifiers are limited to 1..255 as VPCS uses them as MAC address offset (-m option).
 */
class InstanceIDPool : public IdentifierPoolItf {
public:
    static constexpr size_t cMinInstanceID = 1;
    static constexpr size_t cMaxInstanceID = 255;

    /**
     * Returns process wide pool.
     *
     * @return InstanceIDPool&.
     */
    static InstanceIDPool& Instance();

    /**
     * Returns lowest free identifier and marks it as used.
     *
     * @return RetWithError<size_t>.
     */
    RetWithError<size_t> GetFreeID() override;

    /**
     * Marks identifier as used.
     *
     * @param id identifier to lock.
     * @return Error.
     */
    Error LockID(size_t id) override;

    /**
     * Returns identifier to the pool. Releasing free identifier is not an error.
     *
     * @param id identifier to release.
     * @return Error.
     */
    Error ReleaseID(size_t id) override;

    /**
     * Releases all identifiers.
     */
    void Reset() override;

    /**
     * Returns number of used identifiers.
     *
     * @return size_t.
     */
    size_t Size() const;

private:
    mutable std::mutex mMutex;
    std::set<size_t>   mLockedIDs;
};

} // namespace aos::vpcs::instancepool

#endif

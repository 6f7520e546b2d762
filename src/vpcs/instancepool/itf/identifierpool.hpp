/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef AOS_VPCS_INSTANCEPOOL_ITF_IDENTIFIERPOOL_HPP_
#define AOS_VPCS_INSTANCEPOOL_ITF_IDENTIFIERPOOL_HPP_

#include <cstddef>

#include <core/common/tools/error.hpp>

namespace aos::vpcs::instancepool {

/**
 * Identifier pool interface.
 */
class IdentifierPoolItf {
public:
    /**
     * Destructor.
     */
    virtual ~IdentifierPoolItf() = default;

    /**
     * Returns lowest free identifier and marks it as used.
     *
     * @return RetWithError<size_t>.
     */
    virtual RetWithError<size_t> GetFreeID() = 0;

    /**
     * Marks identifier as used.
     *
     * @param id identifier to lock.
     * @return Error.
     */
    virtual Error LockID(size_t id) = 0;

    /**
     * Returns identifier to the pool.
     *
     * @param id identifier to release.
     * @return Error.
     */
    virtual Error ReleaseID(size_t id) = 0;

    /**
     * Releases all identifiers.
     */
    virtual void Reset() = 0;
};

} // namespace aos::vpcs::instancepool

#endif

/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <vpcs/logger/logmodule.hpp>

#include "instancepool.hpp"

namespace aos::vpcs::instancepool {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

InstanceIDPool& InstanceIDPool::Instance()
{
    static InstanceIDPool sPool;

    return sPool;
}

RetWithError<size_t> InstanceIDPool::GetFreeID()
{
    std::lock_guard lock {mMutex};

    for (size_t id = cMinInstanceID; id <= cMaxInstanceID; id++) {
        if (mLockedIDs.find(id) != mLockedIDs.end()) {
            continue;
        }

        mLockedIDs.insert(id);

        LOG_DBG() << "Allocate instance identifier" << Log::Field("id", id);

        return {id, ErrorEnum::eNone};
    }

    return {0, AOS_ERROR_WRAP(Error(ErrorEnum::eNoMemory, "maximum number of VPCS instances reached"))};
}

Error InstanceIDPool::LockID(size_t id)
{
    std::lock_guard lock {mMutex};

    LOG_DBG() << "Lock instance identifier" << Log::Field("id", id);

    if (id < cMinInstanceID || id > cMaxInstanceID) {
        return AOS_ERROR_WRAP(ErrorEnum::eOutOfRange);
    }

    if (mLockedIDs.find(id) != mLockedIDs.end()) {
        return AOS_ERROR_WRAP(Error(ErrorEnum::eAlreadyExist, "instance identifier already in use"));
    }

    mLockedIDs.insert(id);

    return ErrorEnum::eNone;
}

Error InstanceIDPool::ReleaseID(size_t id)
{
    std::lock_guard lock {mMutex};

    LOG_DBG() << "Release instance identifier" << Log::Field("id", id);

    if (mLockedIDs.erase(id) == 0) {
        LOG_WRN() << "Instance identifier is not in use" << Log::Field("id", id);
    }

    return ErrorEnum::eNone;
}

void InstanceIDPool::Reset()
{
    std::lock_guard lock {mMutex};

    LOG_DBG() << "Reset instance identifiers" << Log::Field("count", mLockedIDs.size());

    mLockedIDs.clear();
}

size_t InstanceIDPool::Size() const
{
    std::lock_guard lock {mMutex};

    return mLockedIDs.size();
}

} // namespace aos::vpcs::instancepool

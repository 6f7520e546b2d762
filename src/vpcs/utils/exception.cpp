/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "exception.hpp"

namespace aos::vpcs::utils {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

VPCSException::VPCSException(const Error& err, const std::string& message)
    : Poco::Exception(message.empty() ? std::string(err.Message()) : message, err.Errno())
    , mError(err, message.empty() ? nullptr : message.c_str())
{
}

Error ToAosError(const std::exception& e, ErrorEnum err)
{
    if (const auto* vpcsExc = dynamic_cast<const VPCSException*>(&e)) {
        return vpcsExc->GetError();
    }

    if (const auto* pocoExc = dynamic_cast<const Poco::Exception*>(&e)) {
        return Error {err, pocoExc->displayText().c_str()};
    }

    return Error {err, e.what()};
}

} // namespace aos::vpcs::utils

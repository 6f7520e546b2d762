/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef AOS_VPCS_UTILS_EXCEPTION_HPP_
#define AOS_VPCS_UTILS_EXCEPTION_HPP_

#include <string>

#include <Poco/Exception.h>

#include <core/common/tools/error.hpp>

/**
 * Helper macros for argument counting
 */
#define VPCS_GET_NTH_ARG(_1, _2, NAME, ...) NAME

/**
 * Error throw with and without message
 */
#define VPCS_ERROR_THROW_1(err)          throw aos::vpcs::utils::VPCSException(AOS_ERROR_WRAP(err))
#define VPCS_ERROR_THROW_2(err, message) throw aos::vpcs::utils::VPCSException(AOS_ERROR_WRAP(err), message)
#define VPCS_ERROR_THROW(...)            VPCS_GET_NTH_ARG(__VA_ARGS__, VPCS_ERROR_THROW_2, VPCS_ERROR_THROW_1)(__VA_ARGS__)

/**
 * Error check and throw with and without message
 */
#define VPCS_ERROR_CHECK_AND_THROW_1(err)                                                                              \
    if (!aos::Error(err).IsNone()) {                                                                                   \
        VPCS_ERROR_THROW_1(err);                                                                                       \
    }
#define VPCS_ERROR_CHECK_AND_THROW_2(err, message)                                                                     \
    if (!aos::Error(err).IsNone()) {                                                                                   \
        VPCS_ERROR_THROW_2(err, message);                                                                              \
    }
#define VPCS_ERROR_CHECK_AND_THROW(...)                                                                                \
    VPCS_GET_NTH_ARG(__VA_ARGS__, VPCS_ERROR_CHECK_AND_THROW_2, VPCS_ERROR_CHECK_AND_THROW_1)(__VA_ARGS__)

namespace aos::vpcs::utils {

/**
 * VPCS exception.
 */
class VPCSException : public Poco::Exception {
public:
    /**
     * Creates VPCS exception instance.
     *
     * @param err Aos error.
     * @param message message.
     */
    explicit VPCSException(const Error& err, const std::string& message = "");

    /**
     * Returns Aos error.
     *
     * @return Error.
     */
    Error GetError() const { return mError; }

    /**
     * Returns a static string describing the exception.
     *
     * @return const char*
     */
    const char* name() const noexcept override { return "VPCS exception"; }

private:
    Error mError;
};

/**
 * Converts exception to Aos error.
 *
 * @param e exception.
 * @param err error used for non VPCS exceptions.
 * @return Error.
 */
Error ToAosError(const std::exception& e, ErrorEnum err = ErrorEnum::eFailed);

} // namespace aos::vpcs::utils

#endif

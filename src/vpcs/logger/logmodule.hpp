/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef AOS_VPCS_LOGGER_LOGMODULE_HPP_
#define AOS_VPCS_LOGGER_LOGMODULE_HPP_

#ifndef LOG_MODULE
#define LOG_MODULE "vpcs"
#endif

#include <core/common/tools/logger.hpp>

#endif

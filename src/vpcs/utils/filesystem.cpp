/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cerrno>
#include <fstream>
#include <sstream>
#include <unistd.h>

#include "filesystem.hpp"

namespace aos::vpcs::utils {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error CreateDir(const std::string& path)
{
    std::error_code code;

    std::filesystem::create_directories(path, code);
    if (code.value() != 0) {
        return AOS_ERROR_WRAP(Error(code.value(), code.message().c_str()));
    }

    if (!std::filesystem::is_directory(path, code)) {
        return AOS_ERROR_WRAP(Error(ErrorEnum::eAlreadyExist, "path exists and is not a directory"));
    }

    return ErrorEnum::eNone;
}

RetWithError<std::string> ReadFile(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        return {"", AOS_ERROR_WRAP(Error(ErrorEnum::eNotFound, "can't open file"))};
    }

    std::ostringstream content;

    content << file.rdbuf();

    if (file.bad()) {
        return {content.str(), AOS_ERROR_WRAP(Error(ErrorEnum::eRuntime, "can't read file"))};
    }

    return {content.str(), ErrorEnum::eNone};
}

bool IsRegularFile(const std::string& path)
{
    std::error_code code;

    return std::filesystem::is_regular_file(path, code);
}

bool IsExecutable(const std::string& path)
{
    return access(path.c_str(), X_OK) == 0;
}

} // namespace aos::vpcs::utils

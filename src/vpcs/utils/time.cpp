/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <limits>
#include <regex>
#include <unordered_map>

#include <Poco/NumberParser.h>
#include <Poco/String.h>

#include "exception.hpp"
#include "time.hpp"

namespace aos::vpcs::utils {

namespace {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

// Units in microseconds, nanoseconds are handled separately.
const std::unordered_map<std::string, Poco::Timespan::TimeDiff> cUnits = {
    {"us", 1},
    {"ms", Poco::Timespan::MILLISECONDS},
    {"s", Poco::Timespan::SECONDS},
    {"m", Poco::Timespan::MINUTES},
    {"h", Poco::Timespan::HOURS},
    {"d", Poco::Timespan::DAYS},
};

constexpr auto cMaxTimeDiff = std::numeric_limits<Poco::Timespan::TimeDiff>::max();

RetWithError<Poco::Timespan::TimeDiff> ToMicroseconds(Poco::UInt64 value, Poco::Timespan::TimeDiff multiplier)
{
    if (value > static_cast<Poco::UInt64>(cMaxTimeDiff / multiplier)) {
        return {0, AOS_ERROR_WRAP(Error(ErrorEnum::eInvalidArgument, "duration is out of range"))};
    }

    return {static_cast<Poco::Timespan::TimeDiff>(value) * multiplier, ErrorEnum::eNone};
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

RetWithError<Poco::Timespan> ParseDuration(const std::string& duration)
{
    try {
        const auto trimmed = Poco::trim(duration);

        if (trimmed.empty()) {
            return {{}, AOS_ERROR_WRAP(Error(ErrorEnum::eInvalidArgument, "empty duration"))};
        }

        Poco::UInt64 seconds = 0;

        if (Poco::NumberParser::tryParseUnsigned64(trimmed, seconds)) {
            auto [value, err] = ToMicroseconds(seconds, Poco::Timespan::SECONDS);
            if (!err.IsNone()) {
                return {{}, err};
            }

            return {Poco::Timespan(value), ErrorEnum::eNone};
        }

        static const std::regex cItemRegex(R"((\d+)(ns|us|ms|s|m|h|d))");

        Poco::Timespan::TimeDiff result = 0;
        size_t                   pos    = 0;

        for (auto it = std::sregex_iterator(trimmed.begin(), trimmed.end(), cItemRegex); it != std::sregex_iterator();
             ++it) {
            if (static_cast<size_t>(it->position()) != pos) {
                return {{}, AOS_ERROR_WRAP(Error(ErrorEnum::eInvalidArgument, "invalid duration format"))};
            }

            Poco::UInt64 number = 0;

            if (!Poco::NumberParser::tryParseUnsigned64((*it)[1].str(), number)) {
                return {{}, AOS_ERROR_WRAP(Error(ErrorEnum::eInvalidArgument, "duration is out of range"))};
            }

            const auto unit = (*it)[2].str();

            auto [value, err]
                = unit == "ns" ? ToMicroseconds(number / 1000, 1) : ToMicroseconds(number, cUnits.at(unit));
            if (!err.IsNone()) {
                return {{}, err};
            }

            if (value > cMaxTimeDiff - result) {
                return {{}, AOS_ERROR_WRAP(Error(ErrorEnum::eInvalidArgument, "duration is out of range"))};
            }

            result += value;
            pos += it->length();
        }

        if (pos != trimmed.length()) {
            return {{}, AOS_ERROR_WRAP(Error(ErrorEnum::eInvalidArgument, "invalid duration format"))};
        }

        return {Poco::Timespan(result), ErrorEnum::eNone};
    } catch (const std::exception& e) {
        return {{}, AOS_ERROR_WRAP(ToAosError(e, ErrorEnum::eInvalidArgument))};
    }
}

} // namespace aos::vpcs::utils

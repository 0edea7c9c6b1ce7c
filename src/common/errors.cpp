/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: errors.cpp
*******************************************************************************/

#include "common/errors.h"

#include <algorithm>
#include <cctype>

namespace fleetwatch {

void require_non_blank(const std::string& value, const std::string& what) {
    bool blank = std::all_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
    if (blank) {
        throw InvalidArgumentError(what + " cannot be empty");
    }
}

} // namespace fleetwatch

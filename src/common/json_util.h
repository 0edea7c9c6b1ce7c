/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: json_util.h

    Description:
        Thin helpers over jsoncpp for the structured payloads fleetwatch
        stores as text: worker records, crash signal snapshots, checkpoint
        sections, bus events and the supervisor state document.

        Compact output ("{"a":1}") is used for everything stored in the
        shared store or checkpoint files; the pretty form is only for the
        supervisor state file that operators read.
*******************************************************************************/

#ifndef JSON_UTIL_H
#define JSON_UTIL_H

#include <json/json.h>

#include <string>
#include <vector>

namespace fleetwatch {

std::string to_compact_json(const Json::Value& value);

std::string to_pretty_json(const Json::Value& value);

/**
 * @brief Parses text into out.
 * @return false (with a reason in error when non-null) on malformed input
 */
bool parse_json(const std::string& text, Json::Value& out, std::string* error = nullptr);

Json::Value string_list_to_json(const std::vector<std::string>& items);

std::vector<std::string> json_to_string_list(const Json::Value& value);

} // namespace fleetwatch

#endif // JSON_UTIL_H

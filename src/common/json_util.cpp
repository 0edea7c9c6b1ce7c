/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: json_util.cpp
*******************************************************************************/

#include "common/json_util.h"
#include <memory>

namespace fleetwatch {

std::string to_compact_json(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, value);
}

std::string to_pretty_json(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, value);
}

bool parse_json(const std::string& text, Json::Value& out, std::string* error) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    std::string errs;
    bool ok = reader->parse(text.data(), text.data() + text.size(), &out, &errs);
    if (!ok && error) {
        *error = errs;
    }
    return ok;
}

Json::Value string_list_to_json(const std::vector<std::string>& items) {
    Json::Value array(Json::arrayValue);
    for (const auto& item : items) {
        array.append(item);
    }
    return array;
}

std::vector<std::string> json_to_string_list(const Json::Value& value) {
    std::vector<std::string> items;
    if (!value.isArray()) return items;

    for (const auto& item : value) {
        if (item.isString()) {
            items.push_back(item.asString());
        }
    }
    return items;
}

} // namespace fleetwatch

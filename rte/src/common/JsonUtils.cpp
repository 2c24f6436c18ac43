// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RTE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of RTE (Reconciliation Task Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)
//
// Commercial License:
//   Individual: $100 cumulative
//   Enterprise: $500 cumulative
//   Contact: https://github.com/newmassrael
//
// Full terms: see LICENSE

#include "common/JsonUtils.h"
#include "common/Logger.h"

#include <fstream>
#include <sstream>

namespace RTE {

namespace {

void setError(std::string *errorOut, const std::string &message) {
    if (errorOut && errorOut->empty()) {
        *errorOut = message;
    }
}

}  // namespace

std::optional<json> JsonUtils::parseJson(const std::string &jsonString, std::string *errorOut) {
    if (jsonString.empty()) {
        setError(errorOut, "Empty JSON string");
        return std::nullopt;
    }

    try {
        return json::parse(jsonString);
    } catch (const json::parse_error &e) {
        setError(errorOut, e.what());
        LOG_DEBUG("JsonUtils: Failed to parse JSON: {}", e.what());
        return std::nullopt;
    }
}

std::optional<json> JsonUtils::parseFile(const std::string &path, std::string *errorOut) {
    std::ifstream file(path);
    if (!file) {
        setError(errorOut, "Cannot open '" + path + "'");
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parseJson(buffer.str(), errorOut);
}

std::optional<std::string> JsonUtils::getString(const json &object, const std::string &key, std::string *errorOut) {
    if (!hasKey(object, key)) {
        return std::nullopt;
    }
    const auto &value = object.at(key);
    if (!value.is_string()) {
        setError(errorOut, "'" + key + "' must be a string");
        return std::nullopt;
    }
    return value.get<std::string>();
}

std::optional<int64_t> JsonUtils::getInt(const json &object, const std::string &key, std::string *errorOut) {
    if (!hasKey(object, key)) {
        return std::nullopt;
    }
    const auto &value = object.at(key);
    if (!value.is_number_integer()) {
        setError(errorOut, "'" + key + "' must be an integer");
        return std::nullopt;
    }
    return value.get<int64_t>();
}

std::optional<double> JsonUtils::getNumber(const json &object, const std::string &key, std::string *errorOut) {
    if (!hasKey(object, key)) {
        return std::nullopt;
    }
    const auto &value = object.at(key);
    if (!value.is_number()) {
        setError(errorOut, "'" + key + "' must be a number");
        return std::nullopt;
    }
    return value.get<double>();
}

std::optional<bool> JsonUtils::getBool(const json &object, const std::string &key, std::string *errorOut) {
    if (!hasKey(object, key)) {
        return std::nullopt;
    }
    const auto &value = object.at(key);
    if (!value.is_boolean()) {
        setError(errorOut, "'" + key + "' must be a boolean");
        return std::nullopt;
    }
    return value.get<bool>();
}

bool JsonUtils::hasKey(const json &object, const std::string &key) {
    return object.is_object() && object.contains(key) && !object.at(key).is_null();
}

std::string JsonUtils::toPrettyString(const json &value) {
    return value.dump(2);
}

}  // namespace RTE

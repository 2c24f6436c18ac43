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

#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace RTE {

using json = nlohmann::json;

/**
 * @brief Typed, non-throwing accessors over nlohmann/json documents
 *
 * Getters return nullopt when the key is absent or null; a present value of
 * the wrong type is reported through `errorOut` so callers can reject it.
 */
class JsonUtils {
public:
    /**
     * @brief Parse JSON text
     * @param jsonString Input text
     * @param errorOut Optional parse error message
     * @return Parsed document or nullopt on failure
     */
    static std::optional<json> parseJson(const std::string &jsonString, std::string *errorOut = nullptr);

    /**
     * @brief Read and parse a JSON file
     * @return Parsed document or nullopt if unreadable or malformed
     */
    static std::optional<json> parseFile(const std::string &path, std::string *errorOut = nullptr);

    static std::optional<std::string> getString(const json &object, const std::string &key,
                                                std::string *errorOut = nullptr);
    static std::optional<int64_t> getInt(const json &object, const std::string &key, std::string *errorOut = nullptr);
    static std::optional<double> getNumber(const json &object, const std::string &key,
                                           std::string *errorOut = nullptr);
    static std::optional<bool> getBool(const json &object, const std::string &key, std::string *errorOut = nullptr);

    /**
     * @brief Check if JSON object has key and it's not null
     */
    static bool hasKey(const json &object, const std::string &key);

    static std::string toPrettyString(const json &value);
};

}  // namespace RTE

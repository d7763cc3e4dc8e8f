/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file json.cpp
 * @brief Implementation of the cJSON-backed document accessors.
 */

#include "keyforge/infra/json.hpp"

#include <cstdlib>

namespace keyforge::infra {

ScopedJson Json::parse(const std::string& document)
{
    return ScopedJson(cJSON_ParseWithLength(document.data(), document.size()));
}

/**
 * @brief Walks the path one object level at a time.
 *
 * Classification happens only on the final node. Intermediate levels must be objects,
 * arrays are never indexed into.
 */
LookupResult Json::lookup(const cJSON* root, const std::vector<std::string>& path)
{
    LookupResult result;
    if (!root || path.empty()) {
        return result;
    }

    const cJSON* current = root;
    for (const auto& segment : path) {
        if (!cJSON_IsObject(current)) {
            return result;
        }

        current = cJSON_GetObjectItemCaseSensitive(current, segment.c_str());
        if (!current) {
            return result;
        }
    }

    if (cJSON_IsNull(current)) {
        result.kind = JsonKind::NULL_VALUE;
    } else if (cJSON_IsArray(current)) {
        result.kind = JsonKind::ARRAY;
    } else if (cJSON_IsObject(current)) {
        result.kind = JsonKind::OBJECT;
    } else if (cJSON_IsString(current) || cJSON_IsNumber(current) || cJSON_IsBool(current)) {
        result.kind = JsonKind::SCALAR;
        result.scalar = to_scalar_string(current);
    }

    return result;
}

LookupResult Json::lookup(const std::string& document, const std::vector<std::string>& path)
{
    ScopedJson root = parse(document);
    return lookup(root.get(), path);
}

std::string Json::to_scalar_string(const cJSON* node)
{
    if (cJSON_IsString(node)) {
        return node->valuestring ? std::string(node->valuestring) : std::string();
    }

    if (cJSON_IsTrue(node)) {
        return "true";
    }

    if (cJSON_IsFalse(node)) {
        return "false";
    }

    if (cJSON_IsNumber(node)) {
        // Delegate to cJSON's printer so keys match what the decoder would emit.
        return serialize(node);
    }

    return "";
}

std::string Json::serialize(const cJSON* node)
{
    if (!node) {
        return "";
    }

    char* raw = cJSON_PrintUnformatted(node);
    if (!raw) {
        return "";
    }

    std::string out(raw);
    free(raw);
    return out;
}

} // namespace keyforge::infra

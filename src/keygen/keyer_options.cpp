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
 * @file keyer_options.cpp
 * @brief JSON loader for keyer configuration.
 */

#include "keyforge/keygen/keyer_options.hpp"

#include "keyforge/infra/json.hpp"
#include "keyforge/keygen/errors.hpp"

#include <cJSON.h>

namespace keyforge::keygen {

namespace {

char read_delimiter(const cJSON* root, const char* name, char fallback)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(root, name);
    if (!item) {
        return fallback;
    }

    if (!cJSON_IsString(item) || !item->valuestring || std::string(item->valuestring).size() != 1) {
        throw ConfigError("'" + std::string(name) + "' must be a single character string");
    }

    return item->valuestring[0];
}

} // namespace

KeyerOptions KeyerOptions::from_json(const std::string& raw)
{
    infra::ScopedJson root = infra::Json::parse(raw);
    if (!cJSON_IsObject(root.get())) {
        throw ConfigError("invalid configuration JSON");
    }

    KeyerOptions options;

    const cJSON* key = cJSON_GetObjectItemCaseSensitive(root.get(), "key");
    if (!cJSON_IsString(key) || !key->valuestring) {
        throw ConfigError("missing 'key'");
    }
    options.expression = key->valuestring;

    options.delimiters.field =
        read_delimiter(root.get(), "field_delimiter", options.delimiters.field);
    options.delimiters.generator =
        read_delimiter(root.get(), "generator_delimiter", options.delimiters.generator);

    const cJSON* ignore = cJSON_GetObjectItemCaseSensitive(root.get(), "ignore_fields");
    if (ignore) {
        if (!cJSON_IsArray(ignore)) {
            throw ConfigError("'ignore_fields' must be an array of strings");
        }

        const cJSON* field = nullptr;
        cJSON_ArrayForEach(field, ignore)
        {
            if (!cJSON_IsString(field) || !field->valuestring) {
                throw ConfigError("'ignore_fields' must be an array of strings");
            }
            options.ignore_fields.emplace_back(field->valuestring);
        }
    }

    return options;
}

} // namespace keyforge::keygen

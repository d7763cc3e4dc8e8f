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
 * @file keyer_options.hpp
 * @brief Configuration record of a `DocumentKeyer`.
 */

#pragma once

#include "keyforge/keygen/delimiters.hpp"

#include <string>
#include <vector>

namespace keyforge::keygen {

/**
 * @struct KeyerOptions
 * @brief Everything needed to turn raw documents into keyed import records.
 */
struct KeyerOptions {
    /// The key expression, e.g. `user::%id%`.
    std::string expression;

    Delimiters delimiters;

    /// Field paths stripped from each document body after its key was generated.
    std::vector<std::string> ignore_fields;

    /**
     * @brief Loads options from a JSON configuration object.
     *
     * **Recognized Members:**
     * - `key` (string, required): the key expression.
     * - `field_delimiter` (one-character string, default `%`).
     * - `generator_delimiter` (one-character string, default `#`).
     * - `ignore_fields` (array of strings, default empty).
     *
     * Unknown members are ignored. Delimiters are not validated here; that happens when
     * the expression is compiled.
     *
     * @code
     * auto opts = KeyerOptions::from_json(R"({"key": "%id%", "ignore_fields": ["id"]})");
     * @endcode
     *
     * @throws ConfigError If the text is not a JSON object or a member has the wrong type.
     */
    static KeyerOptions from_json(const std::string& raw);
};

} // namespace keyforge::keygen

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
 * @file delimiters.cpp
 * @brief Delimiter pair validation.
 */

#include "keyforge/keygen/delimiters.hpp"

#include "keyforge/keygen/errors.hpp"

namespace keyforge::keygen {

void validate_delimiters(char field, char generator)
{
    if (field == '\0') {
        throw DelimiterError("field delimiter can not be the empty string");
    }

    if (generator == '\0') {
        throw DelimiterError("generator delimiter can not be the empty string");
    }

    if (field == PERIOD || generator == PERIOD) {
        throw DelimiterError("cannot use . as a field or generator delimiter");
    }

    if (field == BACKTICK || generator == BACKTICK) {
        throw DelimiterError("cannot use ` as a field or generator delimiter");
    }

    if (field == generator) {
        throw DelimiterError("field delimiter and generator delimiter can not be the same");
    }
}

void validate_delimiters(const Delimiters& delimiters)
{
    validate_delimiters(delimiters.field, delimiters.generator);
}

} // namespace keyforge::keygen

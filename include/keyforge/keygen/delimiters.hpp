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
 * @file delimiters.hpp
 * @brief The delimiter pair that separates literal text from references in an expression.
 */

#pragma once

namespace keyforge::keygen {

/// Separates nested field names inside a field path.
constexpr char PERIOD = '.';

/// Quotes a field name inside a field path.
constexpr char BACKTICK = '`';

/**
 * @struct Delimiters
 * @brief The characters opening/closing field references and generator tokens.
 *
 * The defaults are the conventional import tooling delimiters, so that
 * `key::%name%::#MONO_INCR#` works out of the box.
 */
struct Delimiters {
    char field = '%';
    char generator = '#';
};

/**
 * @brief Rejects unusable delimiter pairs.
 *
 * Rules are checked in order, the first violation wins:
 * 1. Neither delimiter may be the NUL character.
 * 2. Neither may be `.` (it separates nested field names).
 * 3. Neither may be a backtick (it quotes field names).
 * 4. The two delimiters must differ.
 *
 * @throws DelimiterError Describing the violated rule.
 */
void validate_delimiters(char field, char generator);

/// @overload
void validate_delimiters(const Delimiters& delimiters);

} // namespace keyforge::keygen

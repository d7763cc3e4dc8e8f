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
 * @file scanner.hpp
 * @brief Character-level primitives shared by the expression compiler.
 *
 * @details
 * Key expressions escape a delimiter by doubling it (`%%` is a literal `%`). The helpers
 * declared here implement the single-character lookahead needed to tell an escaped
 * delimiter apart from the start of a field or generator reference.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace keyforge::keygen {

/**
 * @class Scanner
 * @brief A static container for the lookahead and escaping primitives.
 */
class Scanner {
  public:
    /**
     * @brief Returns the character following `idx`, if there is one.
     *
     * @param exp The expression being scanned.
     * @param idx The current (0-based) position.
     * @return std::optional<char> The character at `idx + 1`, or `std::nullopt` at the end.
     */
    static std::optional<char> peek_next(const std::string& exp, std::size_t idx);

    /**
     * @brief Decides whether a reference delimited by `del` starts at `idx`.
     *
     * A reference starts when the current character is `del` and the next character exists
     * and is not `del` (a doubled delimiter is an escape, not a reference).
     *
     * @code
     * Scanner::should_parse("%key%", 0, '%');  // true
     * Scanner::should_parse("%%key", 0, '%');  // false, escaped
     * Scanner::should_parse("key%", 3, '%');   // false, nothing follows
     * @endcode
     */
    static bool should_parse(const std::string& exp, std::size_t idx, char del);

    /**
     * @brief Collapses every doubled `del` into a single occurrence.
     */
    static std::string unescape(const std::string& exp, char del);

    /**
     * @brief Collapses doubled field delimiters, then doubled generator delimiters.
     */
    static std::string unescape(const std::string& exp, char field_del, char generator_del);

    /**
     * @brief Reason used when a reference is opened by the very last character.
     *
     * @param current The delimiter found at the end of the expression.
     * @param generator_del The generator delimiter in use.
     */
    static std::string start_at_end_message(char current, char generator_del);
};

} // namespace keyforge::keygen

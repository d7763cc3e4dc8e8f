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
 * @file key_generator.hpp
 * @brief Compiles key expressions and evaluates them against documents.
 *
 * @details
 * The examples below use the default delimiters (`%` for fields, `#` for generators)
 * and the following document:
 *
 * @code
 * { "key": "value1", "nested": { "key": "value2", "with.dot": "value3" } }
 * @endcode
 *
 * | Expression                    | Keys                                         |
 * |-------------------------------|----------------------------------------------|
 * | `example`                     | `example`, `example`, ...                    |
 * | `%key%`                       | `value1`                                     |
 * | `%nested.key%`                | `value2`                                     |
 * | `` %nested.`with.dot`% ``     | `value3`                                     |
 * | `#MONO_INCR#`                 | `1`, `2`, ...                                |
 * | `#MONO_INCR[100]#`            | `100`, `101`, ...                            |
 * | `user-#UUID#`                 | `user-e0837e46-0d48-45e3-92e7-28031170d23d`  |
 * | `key::#MONO_INCR[50]#::%key%` | `key::50::value1`, `key::51::value1`, ...    |
 * | `100%%::%key%`                | `100%::value1`                               |
 *
 * Doubling a delimiter in text or inside a field reference yields one literal delimiter.
 */

#pragma once

#include "keyforge/keygen/delimiters.hpp"
#include "keyforge/keygen/generator.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace keyforge::keygen {

/**
 * @class KeyGenerator
 * @brief A compiled key expression (pipeline of generators).
 *
 * Compile once, then call `next` for every document. Compilation is comparatively
 * expensive, evaluation is a handful of lookups and string appends.
 *
 * **Thread Safety:** `MONO_INCR` generators mutate their counter on every call, so a
 * single instance must not be evaluated concurrently. Use one instance per worker or
 * serialize calls to `next` externally.
 */
class KeyGenerator {
  public:
    /// Longest key, in bytes, the storage layer accepts.
    static constexpr std::size_t MAX_KEY_SIZE = 250;

    /**
     * @brief Compiles an expression.
     *
     * @param expression The key expression.
     * @param delimiters The field/generator delimiter pair.
     *
     * @throws DelimiterError If the delimiter pair is invalid (checked first).
     * @throws EmptyExpressionError If `expression` is empty.
     * @throws ExpressionError On a syntax error; `index()` locates the problem.
     * @throws FieldPathError If a field reference holds a malformed path.
     */
    explicit KeyGenerator(const std::string& expression, const Delimiters& delimiters = Delimiters{});

    /// @overload
    KeyGenerator(const std::string& expression, char field_delimiter, char generator_delimiter);

    /**
     * @brief Generates the key for one document.
     *
     * Runs every generator in order and concatenates the fragments. The first failing
     * generator aborts the evaluation; nothing partial is returned.
     *
     * @param document The raw JSON document.
     * @return std::string The key, between 1 and `MAX_KEY_SIZE` bytes.
     *
     * @throws ResultError If a field cannot be used, or the key is empty or too large.
     * Keys are never truncated.
     */
    std::string next(const std::string& document);

    /// The compiled generators, in expression order.
    const std::vector<Generator>& generators() const
    {
        return generators_;
    }

    const Delimiters& delimiters() const
    {
        return delimiters_;
    }

  private:
    void compile(const std::string& expression);

    Delimiters delimiters_;
    std::vector<Generator> generators_;

    /// Set when at least one generator reads the document, so it is parsed only then.
    bool reads_document_ = false;
};

} // namespace keyforge::keygen

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
 * @file generator.hpp
 * @brief The compiled units of a key expression.
 *
 * @details
 * A compiled expression is an ordered list of generators. Each one produces a single
 * fragment of the final key every time a document is processed:
 *
 * | Generator           | Source syntax        | Fragment                               |
 * |---------------------|----------------------|----------------------------------------|
 * | `TextGenerator`     | `key::`              | The literal text, unescaped.           |
 * | `FieldGenerator`    | `%nested.key%`       | The scalar value found in the document.|
 * | `MonoIncrGenerator` | `#MONO_INCR[100]#`   | `100`, `101`, ...                      |
 * | `UuidGenerator`     | `#UUID#`             | A fresh Version 4 UUID.                |
 *
 * The set is closed: `Generator` is a `std::variant`, and `next_fragment` visits it with
 * one overload per alternative, so adding a kind without handling it does not compile.
 */

#pragma once

#include "keyforge/keygen/field_path.hpp"

#include <cJSON.h>
#include <cstdint>
#include <string>
#include <variant>

namespace keyforge::keygen {

/// Static text; returns the same fragment forever.
struct TextGenerator {
    std::string text;
};

/// Extracts a scalar value from the document being keyed.
struct FieldGenerator {
    FieldPath path;
};

/**
 * @brief Monotonically increasing counter rendered in base 10.
 *
 * `next` holds the value the next evaluation returns. The counter lives as long as the
 * owning pipeline and is never reset between documents.
 *
 * @warning Mutated on every evaluation; concurrent use of the owning pipeline needs
 * external locking.
 */
struct MonoIncrGenerator {
    uint64_t next = 1;
};

/// Stateless Version 4 UUID source.
struct UuidGenerator {};

using Generator = std::variant<TextGenerator, FieldGenerator, MonoIncrGenerator, UuidGenerator>;

/**
 * @brief Produces the next fragment of a key.
 *
 * @param generator The node to evaluate; `MonoIncrGenerator` state advances.
 * @param document The parsed document, or `nullptr` when it is missing or malformed
 * (field lookups then report a missing field).
 *
 * @throws ResultError If a field is missing, `null`, an array or an object.
 */
std::string next_fragment(Generator& generator, const cJSON* document);

/// Returns true for generators which read the document.
bool reads_document(const Generator& generator);

} // namespace keyforge::keygen

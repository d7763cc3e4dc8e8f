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
 * @file field_path.hpp
 * @brief Parsed address of a (possibly nested) field inside a JSON document.
 *
 * @details
 * Field paths use a small grammar:
 * 1. Nested fields are separated by `.` (`parent.child`).
 * 2. A backtick-quoted run is taken literally, dots included (`` `not.nested`.key ``).
 * 3. A doubled backtick is a literal backtick, inside or outside quotes.
 *
 * | Input            | Segments               |
 * |------------------|------------------------|
 * | `key`            | `["key"]`              |
 * | `nested.key`     | `["nested", "key"]`    |
 * | `` `a.b`.key ``  | `["a.b", "key"]`       |
 * | `` ```.key` ``   | `` ["`.key"] ``        |
 * | `` ```.key``` `` | `` ["`.key`"] ``       |
 */

#pragma once

#include <cJSON.h>
#include <cstddef>
#include <string>
#include <vector>

namespace keyforge::keygen {

/**
 * @class FieldPath
 * @brief An immutable, ordered list of field names, outermost first.
 */
class FieldPath {
  public:
    /**
     * @brief Parses a field path expression.
     *
     * @param path The raw path, e.g. `nested.key`.
     * @return FieldPath The parsed path; never empty.
     *
     * @throws FieldPathError On a leading `.`, an empty segment (`a..b`), an empty path
     * or unbalanced backticks.
     */
    static FieldPath parse(const std::string& path);

    /// The field names, outermost first.
    const std::vector<std::string>& segments() const
    {
        return segments_;
    }

    std::size_t size() const
    {
        return segments_.size();
    }

    bool operator==(const FieldPath& other) const
    {
        return segments_ == other.segments_;
    }

    bool operator!=(const FieldPath& other) const
    {
        return !(*this == other);
    }

    /**
     * @brief Deletes the addressed field from a document, if present.
     *
     * Walks every intermediate level; if one of them is missing or is not an object the
     * call is a silent no-op. Removing an absent field is therefore idempotent.
     *
     * @param object The document root. A null or non-object root is left untouched.
     */
    void remove_from(cJSON* object) const;

  private:
    explicit FieldPath(std::vector<std::string> segments);

    std::vector<std::string> segments_;
};

} // namespace keyforge::keygen

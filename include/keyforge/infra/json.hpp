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
 * @file json.hpp
 * @brief Read-only JSON document access built on cJSON.
 *
 * @details
 * The key generator never decodes JSON itself. It asks this module to resolve a field
 * path inside a document and receives a small closed result (`LookupResult`) describing
 * what lives there. Ownership of parsed trees is handled by the `ScopedJson` RAII guard
 * so that no code path can leak a `cJSON` allocation.
 */

#pragma once

#include <cJSON.h>
#include <string>
#include <vector>

namespace keyforge::infra {

/**
 * @enum JsonKind
 * @brief The shape of the value found at the end of a lookup.
 */
enum class JsonKind {
    ABSENT,     ///< The path does not resolve (missing key, non-object level, bad document).
    NULL_VALUE, ///< The path resolves to JSON `null`.
    ARRAY,      ///< The path resolves to a JSON array.
    OBJECT,     ///< The path resolves to a JSON object.
    SCALAR      ///< String, number or boolean; see `LookupResult::scalar`.
};

/**
 * @struct LookupResult
 * @brief Outcome of `Json::lookup`.
 */
struct LookupResult {
    JsonKind kind = JsonKind::ABSENT;

    /// Canonical text of the value; only meaningful when `kind == JsonKind::SCALAR`.
    std::string scalar;
};

/**
 * @class ScopedJson
 * @brief RAII owner of a `cJSON` tree.
 *
 * Releases the tree with `cJSON_Delete` when the guard goes out of scope. The guard is
 * movable but not copyable, mirroring the single-owner semantics of the C allocation.
 */
class ScopedJson {
  public:
    /// Takes ownership of a tree returned by a cJSON constructor or parser.
    explicit ScopedJson(cJSON* raw = nullptr) : ptr_(raw) {}

    ScopedJson(const ScopedJson&) = delete;
    ScopedJson& operator=(const ScopedJson&) = delete;

    ScopedJson(ScopedJson&& other) : ptr_(other.release()) {}

    ScopedJson& operator=(ScopedJson&& other)
    {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    ~ScopedJson()
    {
        reset();
    }

    cJSON* get() const
    {
        return ptr_;
    }

    /// Gives up ownership without freeing; the caller becomes responsible for the tree.
    cJSON* release()
    {
        cJSON* raw = ptr_;
        ptr_ = nullptr;
        return raw;
    }

    void reset(cJSON* raw = nullptr)
    {
        if (ptr_) {
            cJSON_Delete(ptr_);
        }
        ptr_ = raw;
    }

    explicit operator bool() const
    {
        return ptr_ != nullptr;
    }

  private:
    cJSON* ptr_;
};

/**
 * @class Json
 * @brief Static helpers for parsing, querying and printing JSON documents.
 */
class Json {
  public:
    /**
     * @brief Parses a raw document.
     *
     * The buffer is parsed with its explicit length, so it does not have to be
     * NUL-terminated and may come straight from an input file.
     *
     * @param document The raw JSON bytes.
     * @return ScopedJson The parsed tree, or an empty guard if the document is malformed.
     */
    static ScopedJson parse(const std::string& document);

    /**
     * @brief Resolves a nested field inside an already parsed tree.
     *
     * Each path segment selects a member of the current object (case-sensitive). The walk
     * stops with `JsonKind::ABSENT` as soon as a segment is missing or the current level
     * is not an object. A null `root` or an empty `path` also yields `ABSENT`.
     *
     * @param root The parsed document (may be `nullptr`).
     * @param path The ordered field names, outermost first.
     */
    static LookupResult lookup(const cJSON* root, const std::vector<std::string>& path);

    /**
     * @brief Convenience overload which parses `document` first.
     *
     * @code
     * auto res = Json::lookup(R"({"a":{"b":3.1415}})", {"a", "b"});
     * // res.kind == JsonKind::SCALAR, res.scalar == "3.1415"
     * @endcode
     */
    static LookupResult lookup(const std::string& document, const std::vector<std::string>& path);

    /**
     * @brief Renders a scalar node as key text.
     *
     * **Formatting Rules:**
     * - Strings: the raw UTF-8 content, without quotes or escaping.
     * - Booleans: `true` / `false`.
     * - Numbers: cJSON's canonical printer. Integral values that fit a 32-bit `int` print
     *   as plain integers (`10`); everything else uses the shortest of `%1.15g` and
     *   `%1.17g` that round-trips (`3.1415`, `12345678901`, `1e+20`).
     *
     * @param node A string, number or boolean node.
     * @return std::string The rendered text; empty for non-scalar nodes.
     */
    static std::string to_scalar_string(const cJSON* node);

    /**
     * @brief Serializes a tree to compact JSON text.
     */
    static std::string serialize(const cJSON* node);
};

} // namespace keyforge::infra

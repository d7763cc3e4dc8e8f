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
 * @file document_keyer.hpp
 * @brief Turns raw JSON documents into keyed import records.
 *
 * @details
 * This is the piece an importer drives for every input document: it generates the key,
 * strips the configured fields from the body and keeps going when a single document
 * cannot be keyed.
 */

#pragma once

#include "keyforge/keygen/field_path.hpp"
#include "keyforge/keygen/key_generator.hpp"
#include "keyforge/keygen/keyer_options.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace keyforge::keygen {

/**
 * @struct KeyedDocument
 * @brief A document ready to be stored under `key`.
 */
struct KeyedDocument {
    std::string key;

    /// The document body with ignored fields removed (compact JSON when rewritten).
    std::string body;
};

/**
 * @class DocumentKeyer
 * @brief Stateful per-batch keyer.
 *
 * Shares the thread-safety contract of `KeyGenerator`: one instance per worker.
 */
class DocumentKeyer {
  public:
    /**
     * @brief Compiles the expression and every ignored field path.
     *
     * @throws ExpressionError, FieldPathError, DelimiterError On invalid options.
     */
    explicit DocumentKeyer(const KeyerOptions& options);

    /**
     * @brief Keys one document.
     *
     * The key is generated from the untouched document, so an ignored field may still
     * contribute to the key. Documents failing with a `ResultError` are logged at `WARN`,
     * counted as skipped and yield `std::nullopt`.
     *
     * @param document The raw JSON document.
     */
    std::optional<KeyedDocument> process(const std::string& document);

    /// Number of documents successfully keyed so far.
    std::size_t processed() const
    {
        return processed_;
    }

    /// Number of documents rejected so far.
    std::size_t skipped() const
    {
        return skipped_;
    }

  private:
    KeyedDocument key_document(const std::string& document);

    KeyGenerator generator_;
    std::vector<FieldPath> ignore_fields_;
    std::size_t processed_ = 0;
    std::size_t skipped_ = 0;
};

} // namespace keyforge::keygen
